// ============================================================================
// PageWidget - Implementation
// ============================================================================

#include "PageWidget.h"

#include "../core/HighlightSession.h"

#include <QMouseEvent>
#include <QPainter>
#include <QPaintEvent>
#include <QPen>
#include <QtMath>

PageWidget::PageWidget(HighlightSession* session, int pageIndex, QWidget* parent)
    : QWidget(parent)
    , m_session(session)
    , m_pageIndex(pageIndex)
{
    // Base surface is opaque; nothing behind the page needs repainting
    setAttribute(Qt::WA_OpaquePaintEvent, true);
    setMouseTracking(false);
    setCursor(Qt::CrossCursor);
    updatePageSize();
}

QSize PageWidget::logicalPageSize() const
{
    const PageSurface* surface = m_session->surfaces()->surface(m_pageIndex);
    if (surface) {
        return QSize(qCeil(surface->geometry.widthPx), qCeil(surface->geometry.heightPx));
    }

    const QSizeF points = m_session->surfaces()->pageSizePoints(m_pageIndex);
    return QSize(qCeil(points.width() * m_session->scale()),
                 qCeil(points.height() * m_session->scale()));
}

QSize PageWidget::sizeHint() const
{
    return logicalPageSize();
}

void PageWidget::updatePageSize()
{
    const QSize size = logicalPageSize();
    if (size != this->size()) {
        setFixedSize(size);
    }
    update();
}

void PageWidget::setEraserCursor(bool eraser)
{
    setCursor(eraser ? Qt::ForbiddenCursor : Qt::CrossCursor);
}

void PageWidget::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);

    QPainter painter(this);
    const QRect target = rect();

    const PageSurface* surface = m_session->surfaces()->surface(m_pageIndex);
    if (!surface) {
        painter.fillRect(target, Qt::white);
        painter.setPen(Qt::gray);
        painter.drawText(target, Qt::AlignCenter, tr("Rendering page %1...").arg(m_pageIndex + 1));
        return;
    }

    const qreal dpr = surface->geometry.devicePixelRatio;
    const QRectF pageRect(0.0, 0.0, surface->base.width() / dpr, surface->base.height() / dpr);

    painter.fillRect(target, Qt::white);
    painter.drawImage(pageRect, surface->base);

    painter.setCompositionMode(m_session->mode() == AnnotationMode::Freehand
                                   ? QPainter::CompositionMode_Multiply
                                   : QPainter::CompositionMode_SourceOver);
    painter.drawImage(pageRect, surface->overlay);
    painter.setCompositionMode(QPainter::CompositionMode_SourceOver);

    if (surface->renderFailed) {
        painter.setPen(Qt::darkRed);
        painter.drawText(target, Qt::AlignCenter,
                         tr("Page %1 could not be rendered").arg(m_pageIndex + 1));
    }

    // Box drag preview
    const StrokeEngine* engine = m_session->engine();
    if (engine->activePage() == m_pageIndex) {
        const QRectF device = engine->previewRect();
        if (!device.isEmpty()) {
            const QRectF logical(device.topLeft() / dpr, device.size() / dpr);
            QColor fill = engine->previewColor();
            fill.setAlphaF(engine->previewOpacity());

            QPen border(engine->previewColor(), 1.0, Qt::DashLine);
            border.setCosmetic(true);
            painter.setPen(border);
            painter.setBrush(fill);
            painter.drawRect(logical);
        }
    }
}

void PageWidget::mousePressEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton) {
        QWidget::mousePressEvent(event);
        return;
    }
    if (m_session->pointerDown(m_pageIndex, event->position())) {
        event->accept();
    }
}

void PageWidget::mouseMoveEvent(QMouseEvent* event)
{
    if (!(event->buttons() & Qt::LeftButton)) {
        QWidget::mouseMoveEvent(event);
        return;
    }
    if (m_session->pointerMove(m_pageIndex, event->position())) {
        event->accept();
    }
}

void PageWidget::mouseReleaseEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton) {
        QWidget::mouseReleaseEvent(event);
        return;
    }
    if (m_session->pointerUp(m_pageIndex, event->position())) {
        event->accept();
    }
}

void PageWidget::leaveEvent(QEvent* event)
{
    m_session->pointerLeave(m_pageIndex);
    QWidget::leaveEvent(event);
}
