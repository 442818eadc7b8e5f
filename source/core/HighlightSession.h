#pragma once

// ============================================================================
// HighlightSession - One open document and everything annotating it
// ============================================================================
// Owns the surface registry, the annotation store, the stroke engine and the
// active tool state. Views and the main window talk to the session only; the
// session passes the current ToolState into the engine with every event.
// ============================================================================

#include "AnnotationStore.h"
#include "HighlighterSettings.h"
#include "PageSurfaceManager.h"
#include "StrokeEngine.h"
#include "ToolType.h"
#include "../pdf/PdfExporter.h"

#include <QObject>

class HighlightSession : public QObject {
    Q_OBJECT

public:
    explicit HighlightSession(const HighlighterSettings& settings,
                              PdfProviderFactory providerFactory = PdfProviderFactory(),
                              QObject* parent = nullptr);

    // ===== Document =====

    /**
     * @brief Open a document from bytes and render it at the current zoom.
     *
     * Annotations of the previous document are dropped on success only.
     */
    bool openDocument(const QByteArray& pdfData, QString* errorMessage = nullptr);

    /**
     * @brief Read a PDF file and open it.
     */
    bool openFile(const QString& path, QString* errorMessage = nullptr);

    bool hasDocument() const { return m_surfaces->hasDocument(); }
    int pageCount() const { return m_surfaces->pageCount(); }

    /**
     * @brief True if any page carries annotations.
     */
    bool hasAnnotations() const;

    // ===== View =====

    qreal zoom() const { return m_zoom; }

    /**
     * @brief Set the zoom (clamped) and re-render if it changed.
     */
    void setZoom(qreal zoom);
    void zoomIn();
    void zoomOut();

    /**
     * @brief Logical pixels per PDF point: base scale * zoom.
     */
    qreal scale() const { return m_settings.baseScale * m_zoom; }

    /**
     * @brief Update the screen DPR and re-render if it changed.
     */
    void setDevicePixelRatio(qreal dpr);

    // ===== Tool =====

    const ToolState& tool() const { return m_tool; }

    /**
     * @brief Pick a highlighter color. Also turns the eraser off.
     */
    void setColor(const QColor& color);
    void setOpacity(qreal opacity);
    void setThickness(qreal thickness);
    void setEraser(bool eraser);

    AnnotationMode mode() const { return m_engine->mode(); }

    // ===== Render Failures =====

    /**
     * @brief Re-render the bases of pages that failed.
     * @return Number of retries started.
     */
    int retryPages(const QVector<int>& pages);

    // ===== Pointer Input (logical page coordinates) =====

    bool pointerDown(int pageIndex, const QPointF& pos) { return m_engine->pointerDown(pageIndex, pos, m_tool); }
    bool pointerMove(int pageIndex, const QPointF& pos) { return m_engine->pointerMove(pageIndex, pos, m_tool); }
    bool pointerUp(int pageIndex, const QPointF& pos) { return m_engine->pointerUp(pageIndex, pos, m_tool); }
    bool pointerLeave(int pageIndex) { return m_engine->pointerLeave(pageIndex, m_tool); }

    // ===== Export =====

    /**
     * @brief Export options derived from the settings and the session mode.
     */
    PdfExportOptions exportOptions() const;

    /**
     * @brief Export with the session's options.
     */
    PdfExportResult exportPdf();
    PdfExportResult exportPdf(const PdfExportOptions& options);

    PdfExporter* exporter() const { return m_exporter; }

    // ===== Components =====

    const HighlighterSettings& settings() const { return m_settings; }
    AnnotationStore* store() const { return m_store; }
    PageSurfaceManager* surfaces() const { return m_surfaces; }
    StrokeEngine* engine() const { return m_engine; }

signals:
    void toolChanged(const ToolState& tool);
    void zoomChanged(qreal zoom);

    /**
     * @brief Pages that failed to render, reported once per pass.
     *
     * Emitted after the pass has committed every page, or right away for a
     * failed retry. Failures never hold back the remaining pages.
     */
    void pagesFailedToRender(const QVector<int>& pages);

private:
    void rerender();
    void onPageRenderFailed(int pageIndex);
    void reportRenderFailures();

    HighlighterSettings m_settings;
    PageSurfaceManager* m_surfaces = nullptr;
    AnnotationStore* m_store = nullptr;
    StrokeEngine* m_engine = nullptr;
    PdfExporter* m_exporter = nullptr;

    ToolState m_tool;
    qreal m_zoom = 1.0;
    QVector<int> m_failedPages;     ///< Collected during the running pass
};
