#pragma once

// ============================================================================
// PageSurfaceManager - Registry of per-page base and overlay surfaces
// ============================================================================
// Owns the parsed document and, for every page, the surface pair produced by
// the latest render pass:
//
// - base:    the rasterized page (opaque)
// - overlay: transparent annotation pixels of the same size
//
// renderAll() renders pages one at a time on the global QThreadPool. Every
// call bumps a generation counter. A worker result whose generation is no
// longer current is dropped without touching the registry, so rapid zoom
// changes or a new document cancel older passes structurally.
//
// Surfaces of the previous pass are parked in m_previous until the new pass
// commits the same page; their overlay pixels are then resampled into the new
// overlay so annotations survive zoom and DPR changes.
//
// Threading: all registry mutation happens on the thread that owns this
// object (the GUI thread). Workers only produce QImages.
// ============================================================================

#include "PageGeometry.h"
#include "../pdf/PdfProvider.h"

#include <QByteArray>
#include <QHash>
#include <QImage>
#include <QList>
#include <QObject>
#include <QVector>

#include <memory>

template <typename T> class QFutureWatcher;

/**
 * @brief Surfaces of one page for one render generation.
 */
struct PageSurface {
    PageGeometry geometry;
    QImage base;                ///< Rendered page, ARGB32_Premultiplied, deviceSize()
    QImage overlay;             ///< Annotation pixels, ARGB32_Premultiplied, deviceSize()
    quint64 generation = 0;     ///< Render generation that registered this surface
    bool renderFailed = false;  ///< Base is a white placeholder; see retryPage()
    bool eraserCursor = false;  ///< Pointer affordance hint for views
};

class PageSurfaceManager : public QObject {
    Q_OBJECT

public:
    /**
     * @brief Construct a manager.
     * @param providerFactory Creates providers from document bytes. Called on
     *        the GUI thread when opening and on worker threads when rendering.
     *        Defaults to PdfProvider::create.
     */
    explicit PageSurfaceManager(PdfProviderFactory providerFactory = PdfProviderFactory(),
                                QObject* parent = nullptr);
    ~PageSurfaceManager() override;

    // ===== Document =====

    /**
     * @brief Parse and adopt a new document.
     *
     * On failure the current document and its surfaces are left untouched.
     * On success all surfaces are discarded and any in-flight render pass is
     * superseded.
     *
     * @param pdfData Document bytes.
     * @param errorMessage Receives the reason on failure (optional).
     * @return True on success.
     */
    bool openDocument(const QByteArray& pdfData, QString* errorMessage = nullptr);

    /**
     * @brief Drop the document and every surface.
     */
    void closeDocument();

    bool hasDocument() const { return m_provider != nullptr; }
    QByteArray documentData() const { return m_data; }
    int pageCount() const { return m_pageSizes.size(); }

    /**
     * @brief Size of a page in PDF points, cached at open time.
     */
    QSizeF pageSizePoints(int pageIndex) const;

    // ===== Rendering =====

    /**
     * @brief Re-render every page at the given scale.
     *
     * Pages are rendered in index order. Each page's surfaces become visible
     * through surfaceRegistered() as soon as that page is done.
     *
     * @param scale Logical pixels per PDF point (base scale * zoom).
     * @return The generation of this pass.
     */
    quint64 renderAll(qreal scale);

    /**
     * @brief Render a page again after a failure, in the current generation.
     * @return False if the page has no failed surface to retry.
     */
    bool retryPage(int pageIndex);

    /**
     * @brief DPR used to size surfaces of subsequent passes.
     */
    void setDevicePixelRatio(qreal dpr);
    qreal devicePixelRatio() const { return m_devicePixelRatio; }

    qreal currentScale() const { return m_scale; }
    quint64 generation() const { return m_generation; }

    /**
     * @brief True while the latest pass still has pages left.
     */
    bool isRendering() const { return m_rendering; }

    // ===== Surfaces =====

    /**
     * @brief Active surface of a page, or nullptr if not (yet) registered.
     */
    PageSurface* surface(int pageIndex);
    const PageSurface* surface(int pageIndex) const;

    /**
     * @brief Active surface, or the previous pass's surface for a page the
     *        current pass has not reached yet. Used by export.
     */
    const PageSurface* latestSurface(int pageIndex) const;

    /**
     * @brief Pages with an active surface, ascending.
     */
    QVector<int> registeredPages() const;

    /**
     * @brief Switch the pointer affordance of every surface.
     */
    void setEraserCursorHint(bool active);
    bool eraserCursorHint() const { return m_eraserHint; }

signals:
    void documentOpened(int pageCount);
    void documentOpenFailed(const QString& errorMessage);
    void documentClosed();

    /**
     * @brief A page's surfaces were (re)registered. Overlay content has
     *        already been carried forward from the previous pass.
     */
    void surfaceRegistered(int pageIndex);

    /**
     * @brief The pass with this generation committed its last page.
     */
    void renderFinished(quint64 generation);

    /**
     * @brief The renderer failed on a page. The page holds a white base.
     */
    void pageRenderFailed(int pageIndex);

    void cursorHintChanged(bool eraserActive);

private:
    /**
     * @brief Launch the worker for a page if the generation is still current.
     */
    void renderPage(int pageIndex, quint64 generation, bool retry);

    /**
     * @brief Worker finished: commit the result if the generation is current.
     */
    void commitPage(int pageIndex, quint64 generation, bool retry,
                    const PageGeometry& geometry, const QImage& rendered);

    /**
     * @brief Supersede all in-flight work without waiting for it.
     */
    void invalidate();

    /**
     * @brief Fit a rendered image to the surface size, or white on failure.
     */
    static QImage makeBase(const QImage& rendered, const QSize& size);

    PdfProviderFactory m_providerFactory;
    std::unique_ptr<PdfProvider> m_provider;    ///< GUI-thread provider (page sizes only)
    QByteArray m_data;
    QVector<QSizeF> m_pageSizes;                ///< Points, by page index

    QHash<int, std::shared_ptr<PageSurface>> m_surfaces;    ///< Active generation
    QHash<int, std::shared_ptr<PageSurface>> m_previous;    ///< Awaiting carry-forward

    quint64 m_generation = 0;
    qreal m_scale = 1.0;
    qreal m_devicePixelRatio = 1.0;
    bool m_rendering = false;
    bool m_eraserHint = false;

    QList<QFutureWatcher<QImage>*> m_activeWatchers;
};
