#pragma once

// ============================================================================
// PageGeometry - Per-render-pass page dimensions and coordinate conversion
// ============================================================================
// Two coordinate spaces are used throughout PdfHighlighter:
//
// - Normalized: [0,1] x [0,1] relative to the page. Independent of zoom and
//   device pixel ratio. Persisted highlight shapes are stored in this space.
// - Device pixel: physical pixels of the page's surfaces. Used for drawing,
//   hit-testing and export compositing.
//
// Pointer input arrives in logical (widget) pixels, which are device pixels
// divided by the device pixel ratio.
// ============================================================================

#include <QPointF>
#include <QRectF>
#include <QSize>
#include <QSizeF>

/**
 * @brief Geometry of one page for one render pass.
 *
 * widthPx/heightPx are logical pixels: page size in points multiplied by
 * scale. scale is the product of the base scale and the current zoom.
 */
struct PageGeometry {
    int pageIndex = -1;             ///< 0-based page index
    qreal widthPx = 0.0;            ///< Page width in logical pixels
    qreal heightPx = 0.0;           ///< Page height in logical pixels
    qreal scale = 1.0;              ///< baseScale * zoom
    qreal devicePixelRatio = 1.0;   ///< Screen DPR the surfaces were sized for

    /**
     * @brief Build the geometry of a page from its size in PDF points.
     */
    static PageGeometry fromPageSize(int pageIndex, const QSizeF& sizePts,
                                     qreal scale, qreal devicePixelRatio);

    bool isValid() const { return pageIndex >= 0 && widthPx > 0.0 && heightPx > 0.0; }

    /**
     * @brief Page extent in device pixels (unrounded).
     */
    qreal deviceWidth() const { return widthPx * devicePixelRatio; }
    qreal deviceHeight() const { return heightPx * devicePixelRatio; }

    /**
     * @brief Pixel size of the base and overlay surfaces.
     * @return ceil(widthPx * dpr) x ceil(heightPx * dpr)
     */
    QSize deviceSize() const;

    // ===== Conversions =====

    QPointF toNormalized(const QPointF& devicePoint) const;
    QPointF toDevice(const QPointF& normalizedPoint) const;

    QRectF toNormalizedRect(const QRectF& deviceRect) const;
    QRectF toDeviceRect(const QRectF& normalizedRect) const;

    /**
     * @brief Convert a widget-relative pointer position to device pixels.
     */
    QPointF logicalToDevice(const QPointF& logicalPoint) const;

    /**
     * @brief Convert a length in logical pixels (e.g. brush thickness) to device pixels.
     */
    qreal logicalToDevice(qreal logicalLength) const { return logicalLength * devicePixelRatio; }

    /**
     * @brief Device pixels per PDF point, used to re-render at overlay resolution.
     */
    qreal deviceScale() const { return scale * devicePixelRatio; }
};
