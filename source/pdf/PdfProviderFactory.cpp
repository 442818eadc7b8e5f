// ============================================================================
// PdfProviderFactory - Platform-specific PDF provider creation
// ============================================================================
//   - Alpine Linux (musl): MuPDF (avoids the Poppler/OpenJPEG symbol collision)
//   - Desktop (glibc): Poppler
// Export always goes through MuPDF (see MuPdfWriter).
// ============================================================================

#include "PdfProvider.h"

#include <memory>

// On musl both MuPDF and Poppler pull in OpenJPEG and MuPDF's allocators end
// up being called by Poppler's copy. musl does not define __GLIBC__.
#if defined(__linux__) && !defined(__GLIBC__)
    #define PDFHIGHLIGHTER_USE_MUPDF 1
#else
    #define PDFHIGHLIGHTER_USE_POPPLER 1
#endif

#ifdef PDFHIGHLIGHTER_USE_MUPDF
#include "MuPdfProvider.h"
using PdfProviderImpl = MuPdfProvider;
#else
#include "PopplerPdfProvider.h"
using PdfProviderImpl = PopplerPdfProvider;
#endif

std::unique_ptr<PdfProvider> PdfProvider::create(const QByteArray& pdfData)
{
    if (pdfData.isEmpty()) {
        return nullptr;
    }

    auto provider = std::make_unique<PdfProviderImpl>(pdfData);
    if (provider->isValid()) {
        return provider;
    }
    return nullptr;
}

