#pragma once

// ============================================================================
// StrokeEngine - Turns pointer input into highlight edits
// ============================================================================
// Two annotation models, fixed per session:
//
// Box:      down records a start point, move resizes a preview rectangle, up
//           (or leave) commits a HighlightShape to the AnnotationStore. With
//           the eraser active, down removes the topmost shape under the
//           pointer instead.
// Freehand: down starts a stroke, every move draws one round-capped segment
//           straight into the page overlay (or clears pixels when erasing),
//           up/leave ends the stroke.
//
// The ToolState is passed with every event and never cached, so a tool
// change in the middle of a stroke applies from the next segment on.
//
// Positions are logical (widget) pixels relative to the page. The engine
// converts them through the page's current PageGeometry on every event, so a
// re-render in the middle of a stroke does not misplace it.
//
// In box mode the engine also keeps overlays in sync with the store: a page
// is repainted from its shape sequence whenever the store changes it or a
// new surface is registered for it.
// ============================================================================

#include "ToolType.h"

#include <QColor>
#include <QObject>
#include <QPointF>
#include <QRectF>

class AnnotationStore;
class PageSurfaceManager;
struct PageGeometry;

class StrokeEngine : public QObject {
    Q_OBJECT

public:
    StrokeEngine(AnnotationStore* store, PageSurfaceManager* surfaces, QObject* parent = nullptr);

    // ===== Configuration =====

    void setMode(AnnotationMode mode);
    AnnotationMode mode() const { return m_mode; }

    /**
     * @brief Upper bound applied to every requested opacity.
     */
    void setMaxOpacity(qreal maxOpacity);
    qreal maxOpacity() const { return m_maxOpacity; }

    /**
     * @brief Box drags smaller than this (logical pixels) in either
     *        dimension are discarded.
     */
    void setMinBoxSize(qreal logicalPixels);
    qreal minBoxSize() const { return m_minBoxSize; }

    /**
     * @brief Opacity actually used for a tool state (capped).
     */
    qreal effectiveOpacity(const ToolState& tool) const;

    // ===== Pointer Input =====
    // Each returns true if the event was consumed.

    bool pointerDown(int pageIndex, const QPointF& logicalPos, const ToolState& tool);
    bool pointerMove(int pageIndex, const QPointF& logicalPos, const ToolState& tool);
    bool pointerUp(int pageIndex, const QPointF& logicalPos, const ToolState& tool);

    /**
     * @brief The pointer left the page. Ends the stroke like pointerUp at the
     *        last known position.
     */
    bool pointerLeave(int pageIndex, const ToolState& tool);

    /**
     * @brief Drop any in-progress stroke without committing it.
     */
    void cancel();

    bool isActive() const { return m_activePage >= 0; }
    int activePage() const { return m_activePage; }

    // ===== Box Preview =====

    /**
     * @brief Preview rectangle of the active box drag in device pixels, or
     *        an empty rect when no drag is in progress.
     */
    QRectF previewRect() const;
    QColor previewColor() const { return m_previewColor; }
    qreal previewOpacity() const { return m_previewOpacity; }

    /**
     * @brief Repaint a page's overlay from its shapes (box mode only).
     */
    void repaintPage(int pageIndex);

signals:
    /**
     * @brief The box preview of a page changed or disappeared.
     */
    void previewChanged(int pageIndex);

    /**
     * @brief Overlay pixels of a page changed.
     */
    void overlayChanged(int pageIndex);

    void shapeCommitted(int pageIndex, const QString& shapeId);
    void shapeErased(int pageIndex, const QString& shapeId);

private:
    /**
     * @brief Box rectangle spanned by two device points.
     *
     * A near-horizontal drag (height below the thickness and smaller than
     * the width) gets its height floored to the thickness.
     */
    static QRectF boxRect(const QPointF& start, const QPointF& end, qreal thicknessDevice);

    bool eraseShapeAt(int pageIndex, const QPointF& logicalPos);
    void commitBox(const ToolState& tool);
    void drawFreehandSegment(const QPointF& logicalPos, const ToolState& tool);
    void endStroke();

    /**
     * @brief Geometry of the page's active surface, or nullptr.
     */
    const PageGeometry* geometryOf(int pageIndex) const;

    AnnotationStore* m_store = nullptr;
    PageSurfaceManager* m_surfaces = nullptr;

    AnnotationMode m_mode = AnnotationMode::Box;
    qreal m_maxOpacity = 0.35;
    qreal m_minBoxSize = 3.0;

    // Active stroke (logical page coordinates)
    int m_activePage = -1;
    QPointF m_startLogical;
    QPointF m_lastLogical;
    qreal m_thicknessLogical = 0.0;     ///< From the latest event, for the preview
    QColor m_previewColor;
    qreal m_previewOpacity = 0.0;
};
