// ============================================================================
// PageGeometry - Implementation
// ============================================================================

#include "PageGeometry.h"

#include <QtMath>

PageGeometry PageGeometry::fromPageSize(int pageIndex, const QSizeF& sizePts,
                                        qreal scale, qreal devicePixelRatio)
{
    PageGeometry geometry;
    geometry.pageIndex = pageIndex;
    geometry.scale = scale;
    geometry.devicePixelRatio = devicePixelRatio > 0.0 ? devicePixelRatio : 1.0;
    geometry.widthPx = sizePts.width() * scale;
    geometry.heightPx = sizePts.height() * scale;
    return geometry;
}

QSize PageGeometry::deviceSize() const
{
    if (!isValid()) {
        return QSize();
    }
    return QSize(qCeil(deviceWidth()), qCeil(deviceHeight()));
}

QPointF PageGeometry::toNormalized(const QPointF& devicePoint) const
{
    if (!isValid()) {
        return QPointF();
    }
    return QPointF(devicePoint.x() / deviceWidth(), devicePoint.y() / deviceHeight());
}

QPointF PageGeometry::toDevice(const QPointF& normalizedPoint) const
{
    return QPointF(normalizedPoint.x() * deviceWidth(), normalizedPoint.y() * deviceHeight());
}

QRectF PageGeometry::toNormalizedRect(const QRectF& deviceRect) const
{
    if (!isValid()) {
        return QRectF();
    }
    return QRectF(deviceRect.x() / deviceWidth(), deviceRect.y() / deviceHeight(),
                  deviceRect.width() / deviceWidth(), deviceRect.height() / deviceHeight());
}

QRectF PageGeometry::toDeviceRect(const QRectF& normalizedRect) const
{
    return QRectF(normalizedRect.x() * deviceWidth(), normalizedRect.y() * deviceHeight(),
                  normalizedRect.width() * deviceWidth(), normalizedRect.height() * deviceHeight());
}

QPointF PageGeometry::logicalToDevice(const QPointF& logicalPoint) const
{
    return logicalPoint * devicePixelRatio;
}
