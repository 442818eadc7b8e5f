// ============================================================================
// PageSurfaceManager - Implementation
// ============================================================================

#include "PageSurfaceManager.h"

#include <QDebug>
#include <QFutureWatcher>
#include <QPainter>
#include <QtConcurrent>

#include <algorithm>

// Letter size, used when a page reports no usable geometry
static const QSizeF FALLBACK_PAGE_SIZE(612.0, 792.0);

PageSurfaceManager::PageSurfaceManager(PdfProviderFactory providerFactory, QObject* parent)
    : QObject(parent)
    , m_providerFactory(std::move(providerFactory))
{
    if (!m_providerFactory) {
        m_providerFactory = [](const QByteArray& data) { return PdfProvider::create(data); };
    }
}

PageSurfaceManager::~PageSurfaceManager()
{
    // Wait for and clean up any active async renders
    for (QFutureWatcher<QImage>* watcher : m_activeWatchers) {
        watcher->cancel();
        watcher->waitForFinished();
        delete watcher;
    }
    m_activeWatchers.clear();
}

// ===== Document =====

bool PageSurfaceManager::openDocument(const QByteArray& pdfData, QString* errorMessage)
{
    std::unique_ptr<PdfProvider> provider = pdfData.isEmpty() ? nullptr : m_providerFactory(pdfData);
    if (!provider || !provider->isValid() || provider->pageCount() <= 0) {
        const QString reason = pdfData.isEmpty()
            ? tr("The file is empty")
            : tr("The file is not a readable PDF document");
        qWarning() << "[PageSurfaceManager] Open failed:" << reason;
        if (errorMessage) {
            *errorMessage = reason;
        }
        emit documentOpenFailed(reason);
        return false;
    }

    invalidate();
    m_surfaces.clear();
    m_previous.clear();

    m_provider = std::move(provider);
    m_data = pdfData;

    const int count = m_provider->pageCount();
    m_pageSizes.clear();
    m_pageSizes.reserve(count);
    for (int i = 0; i < count; ++i) {
        QSizeF size = m_provider->pageSize(i);
        if (!size.isValid() || size.isEmpty()) {
            qWarning() << "[PageSurfaceManager] Page" << i << "has no usable size, assuming Letter";
            size = FALLBACK_PAGE_SIZE;
        }
        m_pageSizes.append(size);
    }

    qDebug() << "[PageSurfaceManager] Opened document with" << count << "pages";
    emit documentOpened(count);
    return true;
}

void PageSurfaceManager::closeDocument()
{
    if (!m_provider) {
        return;
    }

    invalidate();
    m_surfaces.clear();
    m_previous.clear();
    m_provider.reset();
    m_data.clear();
    m_pageSizes.clear();
    emit documentClosed();
}

QSizeF PageSurfaceManager::pageSizePoints(int pageIndex) const
{
    if (pageIndex < 0 || pageIndex >= m_pageSizes.size()) {
        return QSizeF();
    }
    return m_pageSizes.at(pageIndex);
}

// ===== Rendering =====

void PageSurfaceManager::invalidate()
{
    ++m_generation;
    m_rendering = false;
}

quint64 PageSurfaceManager::renderAll(qreal scale)
{
    invalidate();
    if (scale > 0.0) {
        m_scale = scale;
    }

    if (!hasDocument()) {
        return m_generation;
    }

    // Park the active surfaces so the new pass can carry their overlays
    // forward. A page the superseded pass never reached keeps its older entry.
    for (auto it = m_surfaces.constBegin(); it != m_surfaces.constEnd(); ++it) {
        m_previous.insert(it.key(), it.value());
    }
    m_surfaces.clear();

    qDebug() << "[PageSurfaceManager] Render pass" << m_generation
             << "scale" << m_scale << "dpr" << m_devicePixelRatio;

    m_rendering = true;
    renderPage(0, m_generation, false);
    return m_generation;
}

bool PageSurfaceManager::retryPage(int pageIndex)
{
    const PageSurface* existing = surface(pageIndex);
    if (!existing || !existing->renderFailed) {
        return false;
    }
    renderPage(pageIndex, m_generation, true);
    return true;
}

void PageSurfaceManager::renderPage(int pageIndex, quint64 generation, bool retry)
{
    if (generation != m_generation) {
        qDebug() << "[PageSurfaceManager] Pass" << generation << "superseded before page" << pageIndex;
        return;
    }

    PageGeometry geometry;
    if (retry) {
        geometry = m_surfaces.value(pageIndex)->geometry;
    } else {
        geometry = PageGeometry::fromPageSize(pageIndex, m_pageSizes.at(pageIndex),
                                              m_scale, m_devicePixelRatio);
    }
    const qreal dpi = 72.0 * geometry.deviceScale();

    QFutureWatcher<QImage>* watcher = new QFutureWatcher<QImage>(this);
    m_activeWatchers.append(watcher);

    connect(watcher, &QFutureWatcher<QImage>::finished, this,
            [this, watcher, pageIndex, generation, retry, geometry]() {
        m_activeWatchers.removeOne(watcher);
        const QImage rendered = watcher->isCanceled() ? QImage() : watcher->result();
        watcher->deleteLater();

        if (generation != m_generation) {
            qDebug() << "[PageSurfaceManager] Dropping page" << pageIndex
                     << "of superseded pass" << generation;
            return;
        }
        commitPage(pageIndex, generation, retry, geometry, rendered);
    });

    // Background thread: each task loads its own provider from the shared bytes
    const PdfProviderFactory factory = m_providerFactory;
    const QByteArray data = m_data;
    QFuture<QImage> future = QtConcurrent::run([factory, data, pageIndex, dpi]() -> QImage {
        std::unique_ptr<PdfProvider> provider = factory(data);
        if (!provider) {
            return QImage();
        }
        return provider->renderPageToImage(pageIndex, dpi);
    });
    watcher->setFuture(future);
}

void PageSurfaceManager::commitPage(int pageIndex, quint64 generation, bool retry,
                                    const PageGeometry& geometry, const QImage& rendered)
{
    const QSize size = geometry.deviceSize();

    if (retry) {
        std::shared_ptr<PageSurface> existing = m_surfaces.value(pageIndex);
        if (!existing) {
            return;
        }
        if (rendered.isNull()) {
            qWarning() << "[PageSurfaceManager] Retry of page" << pageIndex << "failed again";
            emit pageRenderFailed(pageIndex);
            return;
        }
        existing->base = makeBase(rendered, size);
        existing->renderFailed = false;
        qDebug() << "[PageSurfaceManager] Page" << pageIndex << "recovered";
        emit surfaceRegistered(pageIndex);
        return;
    }

    auto target = std::make_shared<PageSurface>();
    target->geometry = geometry;
    target->generation = generation;
    target->renderFailed = rendered.isNull();
    target->base = makeBase(rendered, size);
    target->eraserCursor = m_eraserHint;
    target->overlay = QImage(size, QImage::Format_ARGB32_Premultiplied);
    target->overlay.fill(Qt::transparent);

    std::shared_ptr<PageSurface> previous = m_previous.take(pageIndex);
    if (previous && !previous->overlay.isNull()) {
        QPainter painter(&target->overlay);
        painter.setRenderHint(QPainter::SmoothPixmapTransform, true);
        painter.setCompositionMode(QPainter::CompositionMode_Source);
        painter.drawImage(QRect(QPoint(0, 0), size), previous->overlay);
    }
    m_surfaces.insert(pageIndex, target);

    emit surfaceRegistered(pageIndex);

    if (target->renderFailed) {
        qWarning() << "[PageSurfaceManager] Page" << pageIndex << "failed to render";
        emit pageRenderFailed(pageIndex);
    }

    // A slot connected above may have started a newer pass
    if (generation != m_generation) {
        return;
    }

    if (pageIndex + 1 < m_pageSizes.size()) {
        renderPage(pageIndex + 1, generation, false);
    } else {
        m_rendering = false;
        qDebug() << "[PageSurfaceManager] Pass" << generation << "complete";
        emit renderFinished(generation);
    }
}

QImage PageSurfaceManager::makeBase(const QImage& rendered, const QSize& size)
{
    if (rendered.isNull()) {
        QImage blank(size, QImage::Format_ARGB32_Premultiplied);
        blank.fill(Qt::white);
        return blank;
    }

    QImage base = rendered.convertToFormat(QImage::Format_ARGB32_Premultiplied);
    if (base.size() != size) {
        // Renderers round the page box independently; fit to the overlay
        base = base.scaled(size, Qt::IgnoreAspectRatio, Qt::SmoothTransformation);
    }
    return base;
}

void PageSurfaceManager::setDevicePixelRatio(qreal dpr)
{
    if (dpr > 0.0) {
        m_devicePixelRatio = dpr;
    }
}

// ===== Surfaces =====

PageSurface* PageSurfaceManager::surface(int pageIndex)
{
    return m_surfaces.value(pageIndex).get();
}

const PageSurface* PageSurfaceManager::surface(int pageIndex) const
{
    return m_surfaces.value(pageIndex).get();
}

const PageSurface* PageSurfaceManager::latestSurface(int pageIndex) const
{
    if (const PageSurface* active = surface(pageIndex)) {
        return active;
    }
    return m_previous.value(pageIndex).get();
}

QVector<int> PageSurfaceManager::registeredPages() const
{
    QVector<int> pages;
    for (auto it = m_surfaces.constBegin(); it != m_surfaces.constEnd(); ++it) {
        pages.append(it.key());
    }
    std::sort(pages.begin(), pages.end());
    return pages;
}

void PageSurfaceManager::setEraserCursorHint(bool active)
{
    m_eraserHint = active;
    for (auto it = m_surfaces.begin(); it != m_surfaces.end(); ++it) {
        if (it.value()) {
            it.value()->eraserCursor = active;
        }
    }
    emit cursorHintChanged(active);
}
