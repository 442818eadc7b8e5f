#pragma once

// ============================================================================
// OverlayRenderer - Painting primitives for overlay surfaces
// ============================================================================
// Stateless helpers shared by the stroke engine, the session repaint path and
// the export compositor, so all three produce the same pixels.
// ============================================================================

#include "HighlightShape.h"
#include "PageGeometry.h"

#include <QColor>
#include <QImage>
#include <QPointF>
#include <QVector>

namespace OverlayRenderer {

/**
 * @brief Clear the overlay and replay shapes in insertion order.
 *
 * Each shape is filled with its color at its stored opacity, composed
 * source-over onto what was painted before it. Deterministic: painting the
 * same sequence twice yields identical pixels.
 */
void paintShapes(QImage& overlay, const QVector<HighlightShape>& shapes,
                 const PageGeometry& geometry);

/**
 * @brief Draw one freehand segment into the overlay.
 * @param from Segment start in device pixels.
 * @param to Segment end in device pixels.
 * @param color Stroke color (its alpha is ignored).
 * @param opacity Already-capped stroke opacity.
 * @param widthDevice Pen width in device pixels.
 * @param erase Clear pixels under the segment instead of painting.
 */
void drawSegment(QImage& overlay, const QPointF& from, const QPointF& to,
                 const QColor& color, qreal opacity, qreal widthDevice, bool erase);

/**
 * @brief True if any overlay pixel is not fully transparent.
 */
bool hasContent(const QImage& overlay);

} // namespace OverlayRenderer
