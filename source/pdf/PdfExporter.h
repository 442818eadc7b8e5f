#pragma once

// ============================================================================
// PdfExporter - Writes the annotated result back into the original PDF
// ============================================================================
// For every page that carries annotations:
//
// - flatten (default): the page is re-rendered at the resolution of its
//   overlay, the overlay is composited with the same blend rule the viewport
//   uses (multiply for freehand, source-over for boxes), and the result is
//   drawn as an image over the full page.
// - vector (box mode, flatten = false): each shape becomes a filled PDF
//   rectangle at the shape's opacity.
//
// Pages without annotations are not touched, so their original content is
// preserved as-is. Annotation state is only read, never modified.
//
// Thread Safety: NOT thread-safe. Run from the GUI thread (it reads the
// surface registry); progress signals can drive a progress dialog.
// ============================================================================

#include "PdfProvider.h"
#include "PdfWriter.h"
#include "../core/HighlightShape.h"
#include "../core/ToolType.h"

#include <QByteArray>
#include <QImage>
#include <QObject>
#include <QString>

class AnnotationStore;
class PageSurfaceManager;
struct PageGeometry;

/**
 * @brief Export options for PDF generation.
 */
struct PdfExportOptions {
    AnnotationMode mode = AnnotationMode::Box;
    bool flatten = true;            ///< false = vector rectangles (box mode only)
    bool useJpeg = false;           ///< Flattened pages as JPEG instead of PNG
    int jpegQuality = 92;
    qreal fallbackScale = 1.25;     ///< Overlay scale for annotated pages that were never rendered
    QString producer = QStringLiteral("PdfHighlighter");
};

/**
 * @brief Result of a PDF export operation.
 */
struct PdfExportResult {
    bool success = false;
    QString errorMessage;
    QByteArray pdfData;             ///< The exported document on success
    int pagesExported = 0;          ///< Total pages in the output
    int pagesModified = 0;          ///< Pages that received annotations
};

class PdfExporter : public QObject {
    Q_OBJECT

public:
    /**
     * @brief Construct an exporter.
     * @param writerFactory Creates the PDF writer. Defaults to MuPdfWriter.
     * @param providerFactory Re-renders page backgrounds. Defaults to
     *        PdfProvider::create.
     */
    explicit PdfExporter(PdfWriterFactory writerFactory = PdfWriterFactory(),
                         PdfProviderFactory providerFactory = PdfProviderFactory(),
                         QObject* parent = nullptr);

    void setAnnotationStore(const AnnotationStore* store) { m_store = store; }
    void setSurfaceManager(const PageSurfaceManager* surfaces) { m_surfaces = surfaces; }

    /**
     * @brief Export the annotated document.
     * @param originalPdf Bytes of the document as it was opened.
     * @param options Export options.
     * @return Result with the new bytes, or an error message.
     *
     * This is a blocking operation. Connect to progressUpdated() for UI updates.
     */
    PdfExportResult exportPdf(const QByteArray& originalPdf, const PdfExportOptions& options);

    /**
     * @brief Composite an overlay onto a rendered page.
     *
     * Freehand uses multiply, so every channel becomes
     * page * (1 - a + a * color), darkening like a highlighter pen. Box mode
     * uses plain source-over. The base is fitted to the overlay size first.
     *
     * @return An opaque image the size of the overlay.
     */
    static QImage compositePage(const QImage& base, const QImage& overlay, AnnotationMode mode);

    /**
     * @brief Encode a flattened page for embedding.
     * @return PNG (lossless) or JPEG data, empty on failure.
     */
    static QByteArray compressImage(const QImage& image, bool useJpeg, int jpegQuality = 92);

    /**
     * @brief PDF placement of a box shape on a page of the given size.
     *
     * Normalized top-left coordinates become PDF bottom-left points:
     * x = nx * W, y = H - (ny * H + nh * H).
     */
    static PdfPlacement shapePlacement(const HighlightShape& shape, const QSizeF& pageSizePts);

signals:
    /**
     * @brief Emitted when export progress changes.
     * @param current Current page being processed (1-based)
     * @param total Total pages in the document
     */
    void progressUpdated(int current, int total);

    void exportComplete();
    void exportFailed(const QString& errorMessage);

private:
    PdfExportResult fail(PdfExportResult result, const QString& message);

    bool isPageModified(int pageIndex, AnnotationMode mode) const;

    /**
     * @brief Overlay to flatten for a page, sized like the on-screen one.
     */
    QImage overlayForExport(int pageIndex, const PdfExportOptions& options,
                            const QSizeF& pageSizePts) const;

    bool flattenPage(PdfWriter& writer, PdfProvider* renderer, int pageIndex,
                     const PdfExportOptions& options, QString* error);
    bool drawShapes(PdfWriter& writer, int pageIndex, QString* error);

    PdfWriterFactory m_writerFactory;
    PdfProviderFactory m_providerFactory;
    const AnnotationStore* m_store = nullptr;
    const PageSurfaceManager* m_surfaces = nullptr;
};
