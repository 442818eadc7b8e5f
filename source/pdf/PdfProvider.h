#pragma once

// ============================================================================
// PdfProvider - Abstract interface for read-only PDF access
// ============================================================================
// Decouples the highlighter from a specific PDF library. The document is
// always loaded from an in-memory byte buffer so the exporter can later
// reopen the exact same bytes.
//
// A provider instance is NOT thread-safe. Render workers construct their own
// instance from the shared bytes and drop it when the page is done.
// ============================================================================

#include <QByteArray>
#include <QImage>
#include <QSizeF>
#include <QString>

#include <functional>
#include <memory>

class PdfProvider {
public:
    virtual ~PdfProvider() = default;

    // ===== Document Info =====

    /**
     * @brief True if the document parsed, is not password protected and has
     *        at least one page.
     */
    virtual bool isValid() const = 0;

    virtual int pageCount() const = 0;

    // ===== Page Info =====

    /**
     * @brief Page size in PDF points (1/72 inch).
     * @return Invalid size if the index is out of range or the page is broken.
     */
    virtual QSizeF pageSize(int pageIndex) const = 0;

    // ===== Rendering =====

    /**
     * @brief Render a page onto an opaque white background.
     * @param pageIndex 0-based page index.
     * @param dpi Resolution (72 = one pixel per point).
     * @return The rendered image, or a null QImage on failure.
     */
    virtual QImage renderPageToImage(int pageIndex, qreal dpi) const = 0;

    // ===== Factory =====

    /**
     * @brief Open a provider over the given PDF bytes with the platform
     *        default backend.
     * @return The provider, or nullptr if the bytes are not a usable PDF.
     */
    static std::unique_ptr<PdfProvider> create(const QByteArray& pdfData);
};

/**
 * @brief Creates providers from PDF bytes. Injected so tests can substitute
 *        a fake backend. Must be callable from worker threads.
 */
using PdfProviderFactory = std::function<std::unique_ptr<PdfProvider>(const QByteArray&)>;
