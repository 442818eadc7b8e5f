// ============================================================================
// StrokeEngine - Implementation
// ============================================================================

#include "StrokeEngine.h"

#include "AnnotationStore.h"
#include "OverlayRenderer.h"
#include "PageGeometry.h"
#include "PageSurfaceManager.h"

#include <QDebug>
#include <QtGlobal>

StrokeEngine::StrokeEngine(AnnotationStore* store, PageSurfaceManager* surfaces, QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_surfaces(surfaces)
{
    Q_ASSERT(m_store);
    Q_ASSERT(m_surfaces);

    connect(m_store, &AnnotationStore::pageChanged, this, &StrokeEngine::repaintPage);
    connect(m_store, &AnnotationStore::cleared, this, [this]() {
        const QVector<int> pages = m_surfaces->registeredPages();
        for (int page : pages) {
            repaintPage(page);
        }
    });
    connect(m_surfaces, &PageSurfaceManager::surfaceRegistered, this, &StrokeEngine::repaintPage);
    connect(m_surfaces, &PageSurfaceManager::documentOpened, this, [this]() { cancel(); });
}

// ===== Configuration =====

void StrokeEngine::setMode(AnnotationMode mode)
{
    if (m_mode == mode) {
        return;
    }
    cancel();
    m_mode = mode;
}

void StrokeEngine::setMaxOpacity(qreal maxOpacity)
{
    m_maxOpacity = qBound(0.01, maxOpacity, 1.0);
}

void StrokeEngine::setMinBoxSize(qreal logicalPixels)
{
    m_minBoxSize = qMax<qreal>(0.0, logicalPixels);
}

qreal StrokeEngine::effectiveOpacity(const ToolState& tool) const
{
    return qBound(0.01, tool.opacity, m_maxOpacity);
}

const PageGeometry* StrokeEngine::geometryOf(int pageIndex) const
{
    const PageSurface* surface = m_surfaces->surface(pageIndex);
    return surface ? &surface->geometry : nullptr;
}

// ===== Pointer Input =====

bool StrokeEngine::pointerDown(int pageIndex, const QPointF& logicalPos, const ToolState& tool)
{
    if (!geometryOf(pageIndex)) {
        return false;
    }

    // A new press ends whatever the previous stroke left behind
    if (isActive()) {
        cancel();
    }

    if (m_mode == AnnotationMode::Box && tool.eraser) {
        eraseShapeAt(pageIndex, logicalPos);
        return true;
    }

    m_activePage = pageIndex;
    m_startLogical = logicalPos;
    m_lastLogical = logicalPos;
    m_thicknessLogical = tool.thickness;
    m_previewColor = tool.color;
    m_previewOpacity = effectiveOpacity(tool);

    if (m_mode == AnnotationMode::Box) {
        emit previewChanged(pageIndex);
    }
    return true;
}

bool StrokeEngine::pointerMove(int pageIndex, const QPointF& logicalPos, const ToolState& tool)
{
    if (!isActive() || pageIndex != m_activePage) {
        return false;
    }
    if (!geometryOf(pageIndex)) {
        cancel();
        return false;
    }

    if (m_mode == AnnotationMode::Freehand) {
        drawFreehandSegment(logicalPos, tool);
        return true;
    }

    m_lastLogical = logicalPos;
    m_thicknessLogical = tool.thickness;
    m_previewColor = tool.color;
    m_previewOpacity = effectiveOpacity(tool);
    emit previewChanged(pageIndex);
    return true;
}

bool StrokeEngine::pointerUp(int pageIndex, const QPointF& logicalPos, const ToolState& tool)
{
    if (!isActive() || pageIndex != m_activePage) {
        return false;
    }
    if (!geometryOf(pageIndex)) {
        cancel();
        return false;
    }

    if (m_mode == AnnotationMode::Freehand) {
        if (logicalPos != m_lastLogical) {
            drawFreehandSegment(logicalPos, tool);
        }
        endStroke();
        return true;
    }

    m_lastLogical = logicalPos;
    commitBox(tool);
    return true;
}

bool StrokeEngine::pointerLeave(int pageIndex, const ToolState& tool)
{
    if (!isActive() || pageIndex != m_activePage) {
        return false;
    }
    return pointerUp(pageIndex, m_lastLogical, tool);
}

void StrokeEngine::cancel()
{
    if (!isActive()) {
        return;
    }
    const int page = m_activePage;
    const bool hadPreview = m_mode == AnnotationMode::Box;
    endStroke();
    if (hadPreview) {
        emit previewChanged(page);
    }
}

void StrokeEngine::endStroke()
{
    m_activePage = -1;
    m_startLogical = QPointF();
    m_lastLogical = QPointF();
}

// ===== Box Mode =====

QRectF StrokeEngine::boxRect(const QPointF& start, const QPointF& end, qreal thicknessDevice)
{
    const qreal left = qMin(start.x(), end.x());
    const qreal top = qMin(start.y(), end.y());
    const qreal width = qAbs(end.x() - start.x());
    qreal height = qAbs(end.y() - start.y());

    if (height < thicknessDevice && width > height) {
        height = thicknessDevice;
    }
    return QRectF(left, top, width, height);
}

QRectF StrokeEngine::previewRect() const
{
    if (!isActive() || m_mode != AnnotationMode::Box) {
        return QRectF();
    }
    const PageGeometry* geometry = geometryOf(m_activePage);
    if (!geometry) {
        return QRectF();
    }
    // Same page clamp as commitBox, so the preview shows what will be kept
    const QRectF pageRect(0.0, 0.0, geometry->deviceWidth(), geometry->deviceHeight());
    return boxRect(geometry->logicalToDevice(m_startLogical),
                   geometry->logicalToDevice(m_lastLogical),
                   geometry->logicalToDevice(m_thicknessLogical)).intersected(pageRect);
}

void StrokeEngine::commitBox(const ToolState& tool)
{
    const int page = m_activePage;
    const PageGeometry geometry = *geometryOf(page);

    // Drags may continue past the page edge while the pointer is grabbed
    const QRectF pageRect(0.0, 0.0, geometry.deviceWidth(), geometry.deviceHeight());
    const QRectF rect = boxRect(geometry.logicalToDevice(m_startLogical),
                                geometry.logicalToDevice(m_lastLogical),
                                geometry.logicalToDevice(tool.thickness)).intersected(pageRect);
    endStroke();
    emit previewChanged(page);

    const qreal minDevice = geometry.logicalToDevice(m_minBoxSize);
    if (rect.width() < minDevice || rect.height() < minDevice) {
        qDebug() << "[StrokeEngine] Discarding" << rect.size() << "drag on page" << page;
        return;
    }

    const HighlightShape shape = HighlightShape::create(page, geometry.toNormalizedRect(rect),
                                                        tool.color, effectiveOpacity(tool));
    m_store->append(page, shape);
    emit shapeCommitted(page, shape.id);
}

bool StrokeEngine::eraseShapeAt(int pageIndex, const QPointF& logicalPos)
{
    const PageGeometry* geometry = geometryOf(pageIndex);
    const QPointF normalized = geometry->toNormalized(geometry->logicalToDevice(logicalPos));

    const HighlightShape* hit = m_store->hitTest(pageIndex, normalized);
    if (!hit) {
        return false;
    }

    const QString id = hit->id;
    m_store->remove(pageIndex, id);
    emit shapeErased(pageIndex, id);
    return true;
}

void StrokeEngine::repaintPage(int pageIndex)
{
    if (m_mode != AnnotationMode::Box) {
        return;
    }
    PageSurface* surface = m_surfaces->surface(pageIndex);
    if (!surface) {
        return;
    }
    OverlayRenderer::paintShapes(surface->overlay, m_store->shapes(pageIndex), surface->geometry);
    emit overlayChanged(pageIndex);
}

// ===== Freehand Mode =====

void StrokeEngine::drawFreehandSegment(const QPointF& logicalPos, const ToolState& tool)
{
    PageSurface* surface = m_surfaces->surface(m_activePage);
    const PageGeometry& geometry = surface->geometry;

    OverlayRenderer::drawSegment(surface->overlay,
                                 geometry.logicalToDevice(m_lastLogical),
                                 geometry.logicalToDevice(logicalPos),
                                 tool.color,
                                 effectiveOpacity(tool),
                                 geometry.logicalToDevice(tool.thickness),
                                 tool.eraser);
    m_lastLogical = logicalPos;
    emit overlayChanged(m_activePage);
}
