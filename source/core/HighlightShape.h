#pragma once

// ============================================================================
// HighlightShape - A persisted box highlight
// ============================================================================
// Coordinates are normalized to the page (0..1) so a shape stays valid across
// zoom and device pixel ratio changes. Conversion to pixels happens only when
// painting or exporting (see PageGeometry).
// ============================================================================

#include <QColor>
#include <QRectF>
#include <QString>
#include <QUuid>

/**
 * @brief A rectangular highlight on one page.
 *
 * Shapes are immutable once committed to the AnnotationStore. Changes are
 * expressed as remove + append.
 */
struct HighlightShape {
    QString id;                 ///< UUID (without braces)
    int pageIndex = 0;          ///< 0-based page index
    QRectF rect;                ///< Normalized x, y, w, h in [0,1]
    QColor color;               ///< Opaque RGB highlight color
    qreal opacity = 0.35;       ///< Fill opacity in (0,1)

    /**
     * @brief Create a shape with a fresh UUID.
     */
    static HighlightShape create(int pageIndex, const QRectF& normalizedRect,
                                 const QColor& color, qreal opacity)
    {
        HighlightShape shape;
        shape.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
        shape.pageIndex = pageIndex;
        shape.rect = normalizedRect;
        shape.color = QColor(color.red(), color.green(), color.blue());
        shape.opacity = opacity;
        return shape;
    }

    /**
     * @brief Inclusive containment test in normalized coordinates.
     */
    bool contains(const QPointF& normalizedPoint) const
    {
        return normalizedPoint.x() >= rect.left() && normalizedPoint.x() <= rect.right()
            && normalizedPoint.y() >= rect.top() && normalizedPoint.y() <= rect.bottom();
    }

    /**
     * @brief Fill color with the shape's opacity applied as alpha.
     */
    QColor fillColor() const
    {
        QColor fill = color;
        fill.setAlphaF(opacity);
        return fill;
    }
};
