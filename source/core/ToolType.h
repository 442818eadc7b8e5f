#pragma once

// ============================================================================
// ToolType - Annotation mode and per-event tool state
// ============================================================================

#include <QColor>
#include <QString>

/**
 * @brief How annotations are represented for the whole session.
 *
 * The two models are not interchangeable: they differ in what is persisted,
 * in erase semantics and in the export blend rule.
 */
enum class AnnotationMode {
    Box,        ///< Vector HighlightShapes; eraser removes shapes; export = alpha-over
    Freehand    ///< Raster overlay strokes; eraser clears pixels; export = multiply
};

/**
 * @brief Parse a mode name as stored in the settings ("box" / "freehand").
 */
inline AnnotationMode annotationModeFromString(const QString& name)
{
    return name.trimmed().compare(QStringLiteral("freehand"), Qt::CaseInsensitive) == 0
        ? AnnotationMode::Freehand
        : AnnotationMode::Box;
}

inline QString annotationModeToString(AnnotationMode mode)
{
    return mode == AnnotationMode::Freehand ? QStringLiteral("freehand") : QStringLiteral("box");
}

/**
 * @brief Snapshot of the active tool, passed into the StrokeEngine with every
 * pointer event.
 *
 * The engine never caches a ToolState across events, so a tool change in the
 * middle of a stroke applies to the next segment.
 */
struct ToolState {
    QColor color = QColor(0xff, 0xeb, 0x3b);   ///< Active highlighter color
    qreal opacity = 0.35;                       ///< Requested opacity (capped by the engine)
    qreal thickness = 14.0;                     ///< Brush thickness in logical pixels
    bool eraser = false;                        ///< Eraser instead of highlighter
};
