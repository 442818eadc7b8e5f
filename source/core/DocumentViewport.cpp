// ============================================================================
// DocumentViewport - Implementation
// ============================================================================

#include "DocumentViewport.h"

#include "HighlightSession.h"
#include "../viewport/PageWidget.h"

#include <QDebug>
#include <QScrollBar>
#include <QShowEvent>
#include <QVBoxLayout>
#include <QWindow>

DocumentViewport::DocumentViewport(HighlightSession* session, QWidget* parent)
    : QScrollArea(parent)
    , m_session(session)
{
    Q_ASSERT(m_session);

    setWidgetResizable(true);
    setAlignment(Qt::AlignHCenter | Qt::AlignTop);
    setBackgroundRole(QPalette::Dark);

    m_container = new QWidget(this);
    m_layout = new QVBoxLayout(m_container);
    m_layout->setSpacing(PAGE_SPACING);
    m_layout->setContentsMargins(PAGE_MARGIN, PAGE_MARGIN, PAGE_MARGIN, PAGE_MARGIN);
    m_layout->setAlignment(Qt::AlignHCenter | Qt::AlignTop);
    setWidget(m_container);

    PageSurfaceManager* surfaces = m_session->surfaces();
    connect(surfaces, &PageSurfaceManager::documentOpened, this, &DocumentViewport::rebuildPages);
    connect(surfaces, &PageSurfaceManager::documentClosed, this, &DocumentViewport::clearPages);
    connect(surfaces, &PageSurfaceManager::surfaceRegistered, this, &DocumentViewport::onSurfaceRegistered);
    connect(surfaces, &PageSurfaceManager::cursorHintChanged, this, &DocumentViewport::applyCursorHint);

    StrokeEngine* engine = m_session->engine();
    connect(engine, &StrokeEngine::overlayChanged, this, &DocumentViewport::repaintPage);
    connect(engine, &StrokeEngine::previewChanged, this, &DocumentViewport::repaintPage);

    // Page sizes follow the zoom before the new pass lands
    connect(m_session, &HighlightSession::zoomChanged, this, [this]() {
        for (PageWidget* page : m_pages) {
            page->updatePageSize();
        }
    });

    if (m_session->hasDocument()) {
        rebuildPages();
    }
}

PageWidget* DocumentViewport::pageWidget(int pageIndex) const
{
    return (pageIndex >= 0 && pageIndex < m_pages.size()) ? m_pages[pageIndex] : nullptr;
}

void DocumentViewport::scrollToPage(int pageIndex)
{
    PageWidget* page = pageWidget(pageIndex);
    if (page) {
        verticalScrollBar()->setValue(page->y() - PAGE_MARGIN);
    }
}

// ===== Page Column =====

void DocumentViewport::clearPages()
{
    for (PageWidget* page : m_pages) {
        m_layout->removeWidget(page);
        page->deleteLater();
    }
    m_pages.clear();
}

void DocumentViewport::rebuildPages()
{
    clearPages();

    const int count = m_session->pageCount();
    const bool eraser = m_session->surfaces()->eraserCursorHint();
    m_pages.reserve(count);
    for (int i = 0; i < count; ++i) {
        auto* page = new PageWidget(m_session, i, m_container);
        page->setEraserCursor(eraser);
        m_layout->addWidget(page, 0, Qt::AlignHCenter);
        m_pages.append(page);
    }

    qDebug() << "[DocumentViewport] Built" << count << "page widgets";
    verticalScrollBar()->setValue(0);
}

void DocumentViewport::onSurfaceRegistered(int pageIndex)
{
    PageWidget* page = pageWidget(pageIndex);
    if (page) {
        page->updatePageSize();
    }
}

void DocumentViewport::repaintPage(int pageIndex)
{
    PageWidget* page = pageWidget(pageIndex);
    if (page) {
        page->update();
    }
}

void DocumentViewport::applyCursorHint(bool eraser)
{
    for (PageWidget* page : m_pages) {
        page->setEraserCursor(eraser);
    }
}

// ===== Device Pixel Ratio =====

void DocumentViewport::syncDevicePixelRatio()
{
    m_session->setDevicePixelRatio(devicePixelRatioF());
}

void DocumentViewport::showEvent(QShowEvent* event)
{
    QScrollArea::showEvent(event);
    syncDevicePixelRatio();

    // Follow the window across screens with different scaling
    QWindow* handle = window()->windowHandle();
    if (handle) {
        connect(handle, &QWindow::screenChanged, this, &DocumentViewport::syncDevicePixelRatio,
                Qt::UniqueConnection);
    }
}
