#pragma once

// ============================================================================
// PopplerPdfProvider - Poppler-Qt6 implementation of PdfProvider
// ============================================================================
// Used on glibc desktop builds. Loads from memory through
// Poppler::Document::loadFromData, which copies what it needs.
// ============================================================================

#include "PdfProvider.h"
#include <poppler/qt6/poppler-qt6.h>
#include <memory>

class PopplerPdfProvider : public PdfProvider {
public:
    /**
     * @brief Construct a provider for the given PDF bytes.
     *
     * Check isValid() after construction to verify the PDF loaded successfully.
     */
    explicit PopplerPdfProvider(const QByteArray& pdfData);
    ~PopplerPdfProvider() override = default;

    bool isValid() const override;
    int pageCount() const override;

    QSizeF pageSize(int pageIndex) const override;
    QImage renderPageToImage(int pageIndex, qreal dpi) const override;

private:
    std::unique_ptr<Poppler::Page> loadPage(int pageIndex) const;

    std::unique_ptr<Poppler::Document> m_document;
};
