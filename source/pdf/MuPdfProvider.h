#pragma once

// ============================================================================
// MuPdfProvider - MuPDF implementation of PdfProvider
// ============================================================================
// Opens the document from an in-memory buffer. The QByteArray is kept alive
// for the lifetime of the fz_document because MuPDF reads from it lazily.
// ============================================================================

#include "PdfProvider.h"

// Forward declarations for MuPDF types (avoid including mupdf headers here)
typedef struct fz_context fz_context;
typedef struct fz_document fz_document;
typedef struct fz_stream fz_stream;

class MuPdfProvider : public PdfProvider {
public:
    /**
     * @brief Construct a provider over the given bytes.
     *
     * Check isValid() after construction.
     */
    explicit MuPdfProvider(const QByteArray& pdfData);
    ~MuPdfProvider() override;

    // Non-copyable (owns MuPDF resources)
    MuPdfProvider(const MuPdfProvider&) = delete;
    MuPdfProvider& operator=(const MuPdfProvider&) = delete;

    bool isValid() const override;
    int pageCount() const override;

    QSizeF pageSize(int pageIndex) const override;
    QImage renderPageToImage(int pageIndex, qreal dpi) const override;

private:
    bool open();

    QByteArray m_data;               ///< Backing bytes for m_stream
    fz_context* m_ctx = nullptr;
    fz_stream* m_stream = nullptr;
    fz_document* m_doc = nullptr;
    int m_pageCount = 0;
};
