// ============================================================================
// OverlayRenderer - Implementation
// ============================================================================

#include "OverlayRenderer.h"

#include <QPainter>
#include <QPen>

namespace OverlayRenderer {

void paintShapes(QImage& overlay, const QVector<HighlightShape>& shapes,
                 const PageGeometry& geometry)
{
    if (overlay.isNull()) {
        return;
    }

    overlay.fill(Qt::transparent);
    if (shapes.isEmpty() || !geometry.isValid()) {
        return;
    }

    QPainter painter(&overlay);
    painter.setRenderHint(QPainter::Antialiasing, false);
    painter.setCompositionMode(QPainter::CompositionMode_SourceOver);
    painter.setPen(Qt::NoPen);

    for (const HighlightShape& shape : shapes) {
        painter.fillRect(geometry.toDeviceRect(shape.rect), shape.fillColor());
    }
}

void drawSegment(QImage& overlay, const QPointF& from, const QPointF& to,
                 const QColor& color, qreal opacity, qreal widthDevice, bool erase)
{
    if (overlay.isNull() || widthDevice <= 0.0) {
        return;
    }

    QPainter painter(&overlay);
    painter.setRenderHint(QPainter::Antialiasing, true);

    QColor penColor = erase ? QColor(Qt::transparent) : QColor(color.red(), color.green(), color.blue());
    if (!erase) {
        penColor.setAlphaF(opacity);
    }

    QPen pen(penColor, widthDevice, Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin);
    painter.setPen(pen);

    // Source keeps overlapping segments of one stroke at the stroke opacity
    // instead of accumulating; Clear punches fully transparent pixels.
    painter.setCompositionMode(erase ? QPainter::CompositionMode_Clear
                                     : QPainter::CompositionMode_Source);
    painter.drawLine(from, to);
}

bool hasContent(const QImage& overlay)
{
    if (overlay.isNull()) {
        return false;
    }

    const QImage argb = overlay.format() == QImage::Format_ARGB32_Premultiplied
        ? overlay
        : overlay.convertToFormat(QImage::Format_ARGB32_Premultiplied);

    for (int y = 0; y < argb.height(); ++y) {
        const QRgb* line = reinterpret_cast<const QRgb*>(argb.constScanLine(y));
        for (int x = 0; x < argb.width(); ++x) {
            if (qAlpha(line[x]) != 0) {
                return true;
            }
        }
    }
    return false;
}

} // namespace OverlayRenderer
