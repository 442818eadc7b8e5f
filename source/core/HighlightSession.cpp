// ============================================================================
// HighlightSession - Implementation
// ============================================================================

#include "HighlightSession.h"

#include "OverlayRenderer.h"

#include <QDebug>
#include <QFile>

HighlightSession::HighlightSession(const HighlighterSettings& settings,
                                   PdfProviderFactory providerFactory, QObject* parent)
    : QObject(parent)
    , m_settings(settings)
{
    m_settings.sanitize();

    m_surfaces = new PageSurfaceManager(providerFactory, this);
    m_store = new AnnotationStore(this);
    m_engine = new StrokeEngine(m_store, m_surfaces, this);
    m_engine->setMode(m_settings.mode);
    m_engine->setMaxOpacity(m_settings.maxOpacity);
    m_engine->setMinBoxSize(m_settings.minBoxSizePx);

    m_exporter = new PdfExporter(PdfWriterFactory(), providerFactory, this);
    m_exporter->setAnnotationStore(m_store);
    m_exporter->setSurfaceManager(m_surfaces);

    m_tool = m_settings.defaultToolState();

    // A new document starts with no annotations
    connect(m_surfaces, &PageSurfaceManager::documentOpened, m_store, &AnnotationStore::clear);

    connect(m_surfaces, &PageSurfaceManager::pageRenderFailed, this, &HighlightSession::onPageRenderFailed);
    connect(m_surfaces, &PageSurfaceManager::renderFinished, this, &HighlightSession::reportRenderFailures);
}

// ===== Document =====

bool HighlightSession::openDocument(const QByteArray& pdfData, QString* errorMessage)
{
    if (!m_surfaces->openDocument(pdfData, errorMessage)) {
        return false;
    }
    m_surfaces->setEraserCursorHint(m_tool.eraser);
    rerender();
    return true;
}

bool HighlightSession::openFile(const QString& path, QString* errorMessage)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        const QString reason = tr("Cannot read %1: %2").arg(path, file.errorString());
        qWarning() << "[HighlightSession]" << reason;
        if (errorMessage) {
            *errorMessage = reason;
        }
        return false;
    }
    return openDocument(file.readAll(), errorMessage);
}

bool HighlightSession::hasAnnotations() const
{
    if (mode() == AnnotationMode::Box) {
        return !m_store->isEmpty();
    }
    // Mid-pass, strokes of pages not yet re-rendered live in the parked surface
    for (int page = 0; page < pageCount(); ++page) {
        const PageSurface* surface = m_surfaces->latestSurface(page);
        if (surface && OverlayRenderer::hasContent(surface->overlay)) {
            return true;
        }
    }
    return false;
}

// ===== Render Failures =====

void HighlightSession::onPageRenderFailed(int pageIndex)
{
    if (!m_failedPages.contains(pageIndex)) {
        m_failedPages.append(pageIndex);
    }
    // A failed retry outside a pass has no renderFinished to wait for
    if (!m_surfaces->isRendering()) {
        reportRenderFailures();
    }
}

void HighlightSession::reportRenderFailures()
{
    if (m_failedPages.isEmpty()) {
        return;
    }
    const QVector<int> pages = m_failedPages;
    m_failedPages.clear();
    qWarning() << "[HighlightSession]" << pages.size() << "page(s) failed to render:" << pages;
    emit pagesFailedToRender(pages);
}

int HighlightSession::retryPages(const QVector<int>& pages)
{
    int started = 0;
    for (int page : pages) {
        if (m_surfaces->retryPage(page)) {
            ++started;
        }
    }
    return started;
}

// ===== View =====

void HighlightSession::rerender()
{
    // Failures of a superseded pass are reported again by the new one
    m_failedPages.clear();
    if (hasDocument()) {
        m_surfaces->renderAll(scale());
    }
}

void HighlightSession::setZoom(qreal zoom)
{
    // Snap to the zoom step so repeated +/- never drifts
    const qreal stepped = qRound(zoom / m_settings.zoomStep) * m_settings.zoomStep;
    const qreal clamped = m_settings.clampZoom(stepped);
    if (qFuzzyCompare(clamped, m_zoom)) {
        return;
    }
    m_zoom = clamped;
    emit zoomChanged(m_zoom);
    rerender();
}

void HighlightSession::zoomIn()
{
    setZoom(m_zoom + m_settings.zoomStep);
}

void HighlightSession::zoomOut()
{
    setZoom(m_zoom - m_settings.zoomStep);
}

void HighlightSession::setDevicePixelRatio(qreal dpr)
{
    if (dpr <= 0.0 || qFuzzyCompare(dpr, m_surfaces->devicePixelRatio())) {
        return;
    }
    m_surfaces->setDevicePixelRatio(dpr);
    rerender();
}

// ===== Tool =====

void HighlightSession::setColor(const QColor& color)
{
    if (!color.isValid()) {
        return;
    }
    m_tool.color = QColor(color.red(), color.green(), color.blue());
    if (m_tool.eraser) {
        m_tool.eraser = false;
        m_surfaces->setEraserCursorHint(false);
    }
    emit toolChanged(m_tool);
}

void HighlightSession::setOpacity(qreal opacity)
{
    m_tool.opacity = m_settings.clampOpacity(opacity);
    emit toolChanged(m_tool);
}

void HighlightSession::setThickness(qreal thickness)
{
    m_tool.thickness = m_settings.clampThickness(thickness);
    emit toolChanged(m_tool);
}

void HighlightSession::setEraser(bool eraser)
{
    if (m_tool.eraser == eraser) {
        return;
    }
    m_tool.eraser = eraser;
    m_surfaces->setEraserCursorHint(eraser);
    emit toolChanged(m_tool);
}

// ===== Export =====

PdfExportOptions HighlightSession::exportOptions() const
{
    PdfExportOptions options;
    options.mode = mode();
    options.flatten = m_settings.exportFlatten;
    options.useJpeg = m_settings.exportJpeg;
    options.fallbackScale = scale();
    return options;
}

PdfExportResult HighlightSession::exportPdf()
{
    return exportPdf(exportOptions());
}

PdfExportResult HighlightSession::exportPdf(const PdfExportOptions& options)
{
    return m_exporter->exportPdf(m_surfaces->documentData(), options);
}
