#pragma once

// ============================================================================
// HighlighterSettings - Persistent user configuration
// ============================================================================
// Stored through QSettings("PdfHighlighter", "App"). Every value has a
// built-in default; out-of-range stored values are clamped on load.
// ============================================================================

#include "ToolType.h"

#include <QColor>
#include <QString>
#include <QVector>

class QSettings;

struct HighlighterSettings {
    // ===== Palette & Tool Defaults =====
    QVector<QColor> palette;                ///< Selectable highlighter colors
    QColor defaultColor = QColor(0xff, 0xeb, 0x3b);
    qreal defaultOpacity = 0.35;
    qreal defaultThickness = 14.0;          ///< Logical pixels
    qreal minThickness = 6.0;
    qreal maxThickness = 40.0;
    qreal minOpacity = 0.10;
    qreal maxOpacity = 0.35;                ///< Hard cap so underlying text stays legible

    // ===== View =====
    qreal baseScale = 1.25;                 ///< Logical pixels per PDF point at zoom 1.0
    qreal minZoom = 0.5;
    qreal maxZoom = 3.0;
    qreal zoomStep = 0.1;

    // ===== Stroke Engine =====
    AnnotationMode mode = AnnotationMode::Box;
    qreal minBoxSizePx = 3.0;               ///< Smaller box drags are discarded (logical pixels)

    // ===== Export =====
    QString exportFileName = QStringLiteral("annotated.pdf");
    bool exportFlatten = true;              ///< Raster composite; false = vector rectangles (box mode)
    bool exportJpeg = false;                ///< Flattened pages as JPEG instead of lossless PNG

    HighlighterSettings();

    /**
     * @brief The built-in highlighter palette.
     */
    static QVector<QColor> defaultPalette();

    /**
     * @brief Parse "#rgb" or "#rrggbb". Returns an invalid QColor otherwise.
     */
    static QColor colorFromHex(const QString& hex);

    /**
     * @brief Clamp every numeric value into its valid range.
     */
    void sanitize();

    /**
     * @brief Clamp a zoom factor to [minZoom, maxZoom].
     */
    qreal clampZoom(qreal zoom) const;

    /**
     * @brief Clamp a requested opacity to [minOpacity, maxOpacity].
     */
    qreal clampOpacity(qreal opacity) const;

    qreal clampThickness(qreal thickness) const;

    /**
     * @brief Tool state initialized from the defaults.
     */
    ToolState defaultToolState() const;

    static HighlighterSettings load(QSettings& settings);
    void save(QSettings& settings) const;

    /**
     * @brief Load from the application's default QSettings location.
     */
    static HighlighterSettings load();
    void save() const;
};
