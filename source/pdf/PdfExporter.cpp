// ============================================================================
// PdfExporter - Implementation
// ============================================================================

#include "PdfExporter.h"

#include "MuPdfWriter.h"
#include "../core/AnnotationStore.h"
#include "../core/OverlayRenderer.h"
#include "../core/PageGeometry.h"
#include "../core/PageSurfaceManager.h"

#include <QBuffer>
#include <QDebug>
#include <QPainter>

// ============================================================================
// Construction
// ============================================================================

PdfExporter::PdfExporter(PdfWriterFactory writerFactory, PdfProviderFactory providerFactory,
                         QObject* parent)
    : QObject(parent)
    , m_writerFactory(std::move(writerFactory))
    , m_providerFactory(std::move(providerFactory))
{
    if (!m_writerFactory) {
        m_writerFactory = []() -> std::unique_ptr<PdfWriter> { return std::make_unique<MuPdfWriter>(); };
    }
    if (!m_providerFactory) {
        m_providerFactory = [](const QByteArray& data) { return PdfProvider::create(data); };
    }
}

// ============================================================================
// Public API
// ============================================================================

PdfExportResult PdfExporter::exportPdf(const QByteArray& originalPdf, const PdfExportOptions& options)
{
    PdfExportResult result;

    if (originalPdf.isEmpty()) {
        return fail(result, tr("No document to export"));
    }
    if (!m_store || !m_surfaces) {
        return fail(result, tr("No annotation state set for export"));
    }

    std::unique_ptr<PdfWriter> writer = m_writerFactory();
    if (!writer) {
        return fail(result, tr("Failed to initialize PDF engine"));
    }
    if (!writer->load(originalPdf)) {
        return fail(result, tr("Failed to open the original PDF: %1").arg(writer->lastError()));
    }

    const bool vector = !options.flatten && options.mode == AnnotationMode::Box;
    if (!options.flatten && !vector) {
        qDebug() << "[PdfExporter] Freehand overlays are raster only, flattening";
    }

    // Renderer for page backgrounds, created lazily on the first modified page
    std::unique_ptr<PdfProvider> renderer;

    const int total = writer->pageCount();
    qDebug() << "[PdfExporter] Starting export:" << total << "pages,"
             << (vector ? "vector" : "flattened") << annotationModeToString(options.mode);

    for (int i = 0; i < total; ++i) {
        emit progressUpdated(i + 1, total);

        if (!isPageModified(i, options.mode)) {
            continue;
        }

        QString pageError;
        bool ok = false;
        if (vector) {
            ok = drawShapes(*writer, i, &pageError);
        } else {
            if (!renderer) {
                renderer = m_providerFactory(originalPdf);
                if (!renderer) {
                    return fail(result, tr("Failed to render the original PDF"));
                }
            }
            ok = flattenPage(*writer, renderer.get(), i, options, &pageError);
        }

        if (!ok) {
            return fail(result, tr("Failed to export page %1: %2").arg(i + 1).arg(pageError));
        }
        result.pagesModified++;
    }

    if (!options.producer.isEmpty() && !writer->setProducer(options.producer)) {
        qWarning() << "[PdfExporter] Failed to write metadata (non-fatal)";
    }

    result.pdfData = writer->save();
    if (result.pdfData.isEmpty()) {
        return fail(result, tr("Failed to save PDF: %1").arg(writer->lastError()));
    }

    result.pagesExported = total;
    result.success = true;

    qDebug() << "[PdfExporter] Export complete:" << result.pagesModified << "of"
             << total << "pages annotated," << (result.pdfData.size() / 1024) << "KB";

    emit exportComplete();
    return result;
}

PdfExportResult PdfExporter::fail(PdfExportResult result, const QString& message)
{
    result.success = false;
    result.pdfData.clear();
    result.errorMessage = message;
    qWarning() << "[PdfExporter]" << message;
    emit exportFailed(message);
    return result;
}

// ============================================================================
// Page Processing
// ============================================================================

bool PdfExporter::isPageModified(int pageIndex, AnnotationMode mode) const
{
    if (mode == AnnotationMode::Box) {
        return m_store->shapeCount(pageIndex) > 0;
    }

    const PageSurface* surface = m_surfaces->latestSurface(pageIndex);
    return surface && OverlayRenderer::hasContent(surface->overlay);
}

QImage PdfExporter::overlayForExport(int pageIndex, const PdfExportOptions& options,
                                     const QSizeF& pageSizePts) const
{
    const PageSurface* surface = m_surfaces->latestSurface(pageIndex);

    if (options.mode == AnnotationMode::Freehand) {
        return surface ? surface->overlay : QImage();
    }

    // Box shapes are replayed from the store so the export never depends on
    // whether the overlay was repainted yet
    const PageGeometry geometry = surface
        ? surface->geometry
        : PageGeometry::fromPageSize(pageIndex, pageSizePts, options.fallbackScale, 1.0);

    QImage overlay(geometry.deviceSize(), QImage::Format_ARGB32_Premultiplied);
    OverlayRenderer::paintShapes(overlay, m_store->shapes(pageIndex), geometry);
    return overlay;
}

bool PdfExporter::flattenPage(PdfWriter& writer, PdfProvider* renderer, int pageIndex,
                              const PdfExportOptions& options, QString* error)
{
    const QSizeF writerSize = writer.pageSize(pageIndex);
    const QSizeF renderSize = renderer->pageSize(pageIndex);
    if (!writerSize.isValid() || writerSize.isEmpty() || !renderSize.isValid() || renderSize.isEmpty()) {
        *error = tr("page has no usable size");
        return false;
    }

    const QImage overlay = overlayForExport(pageIndex, options, renderSize);
    if (overlay.isNull()) {
        *error = tr("no overlay");
        return false;
    }

    // Render at the overlay's resolution so every overlay pixel lands on
    // exactly one page pixel
    const qreal dpi = 72.0 * overlay.width() / renderSize.width();
    const QImage base = renderer->renderPageToImage(pageIndex, dpi);
    if (base.isNull()) {
        *error = tr("page could not be rendered");
        return false;
    }

    const QImage composite = compositePage(base, overlay, options.mode);
    const QByteArray encoded = compressImage(composite, options.useJpeg, options.jpegQuality);
    if (encoded.isEmpty()) {
        *error = tr("page image could not be encoded");
        return false;
    }

    PdfPlacement placement;
    placement.width = writerSize.width();
    placement.height = writerSize.height();
    if (!writer.drawImage(pageIndex, encoded, placement)) {
        *error = writer.lastError();
        return false;
    }

    qDebug() << "[PdfExporter] Flattened page" << pageIndex << "at" << composite.size()
             << "(" << qRound(dpi) << "dpi," << encoded.size() << "bytes)";
    return true;
}

bool PdfExporter::drawShapes(PdfWriter& writer, int pageIndex, QString* error)
{
    const QSizeF size = writer.pageSize(pageIndex);
    if (!size.isValid() || size.isEmpty()) {
        *error = tr("page has no usable size");
        return false;
    }

    const QVector<HighlightShape> shapes = m_store->shapes(pageIndex);
    for (const HighlightShape& shape : shapes) {
        const PdfPlacement placement = shapePlacement(shape, size);
        if (placement.isEmpty()) {
            continue;
        }
        if (!writer.drawRectangle(pageIndex, placement, shape.color)) {
            *error = writer.lastError();
            return false;
        }
    }
    return true;
}

// ============================================================================
// Static Helpers
// ============================================================================

QImage PdfExporter::compositePage(const QImage& base, const QImage& overlay, AnnotationMode mode)
{
    const QSize size = overlay.isNull() ? base.size() : overlay.size();

    QImage result;
    if (base.isNull()) {
        result = QImage(size, QImage::Format_ARGB32_Premultiplied);
        result.fill(Qt::white);
    } else {
        result = base.convertToFormat(QImage::Format_ARGB32_Premultiplied);
        if (result.size() != size) {
            result = result.scaled(size, Qt::IgnoreAspectRatio, Qt::SmoothTransformation);
        }
    }

    if (!overlay.isNull()) {
        QPainter painter(&result);
        painter.setCompositionMode(mode == AnnotationMode::Freehand
                                       ? QPainter::CompositionMode_Multiply
                                       : QPainter::CompositionMode_SourceOver);
        painter.drawImage(0, 0, overlay);
    }

    return result.convertToFormat(QImage::Format_RGB32);
}

QByteArray PdfExporter::compressImage(const QImage& image, bool useJpeg, int jpegQuality)
{
    if (image.isNull()) {
        return QByteArray();
    }

    QByteArray result;
    QBuffer buffer(&result);
    buffer.open(QIODevice::WriteOnly);

    if (useJpeg) {
        // JPEG has no alpha; flattened pages are opaque anyway
        const QImage opaque = image.convertToFormat(QImage::Format_RGB888);
        if (!opaque.save(&buffer, "JPEG", jpegQuality)) {
            qWarning() << "[PdfExporter] Failed to compress image as JPEG";
            return QByteArray();
        }
    } else {
        if (!image.save(&buffer, "PNG")) {
            qWarning() << "[PdfExporter] Failed to compress image as PNG";
            return QByteArray();
        }
    }

    buffer.close();
    return result;
}

PdfPlacement PdfExporter::shapePlacement(const HighlightShape& shape, const QSizeF& pageSizePts)
{
    const qreal pageWidth = pageSizePts.width();
    const qreal pageHeight = pageSizePts.height();

    PdfPlacement placement;
    placement.x = shape.rect.x() * pageWidth;
    placement.width = shape.rect.width() * pageWidth;
    placement.height = shape.rect.height() * pageHeight;
    placement.y = pageHeight - (shape.rect.y() * pageHeight + placement.height);
    placement.opacity = shape.opacity;
    return placement;
}
