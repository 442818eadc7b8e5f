// ============================================================================
// PopplerPdfProvider - Implementation
// ============================================================================

#include "PopplerPdfProvider.h"

#include <QDebug>

PopplerPdfProvider::PopplerPdfProvider(const QByteArray& pdfData)
    : m_document(Poppler::Document::loadFromData(pdfData))
{
    if (!m_document) {
        qWarning() << "[PopplerPdfProvider] Not a PDF:" << pdfData.size() << "bytes";
        return;
    }
    if (m_document->isLocked()) {
        qWarning() << "[PopplerPdfProvider] Document is password protected";
        return;
    }

    // Match the MuPDF output: antialiased, on white paper
    m_document->setRenderHint(Poppler::Document::Antialiasing, true);
    m_document->setRenderHint(Poppler::Document::TextAntialiasing, true);
    m_document->setPaperColor(Qt::white);
}

bool PopplerPdfProvider::isValid() const
{
    return m_document && !m_document->isLocked() && m_document->numPages() > 0;
}

int PopplerPdfProvider::pageCount() const
{
    return isValid() ? m_document->numPages() : 0;
}

QSizeF PopplerPdfProvider::pageSize(int pageIndex) const
{
    const std::unique_ptr<Poppler::Page> page = loadPage(pageIndex);
    return page ? page->pageSizeF() : QSizeF();
}

QImage PopplerPdfProvider::renderPageToImage(int pageIndex, qreal dpi) const
{
    if (dpi <= 0.0) {
        return QImage();
    }
    const std::unique_ptr<Poppler::Page> page = loadPage(pageIndex);
    if (!page) {
        return QImage();
    }

    const QImage image = page->renderToImage(dpi, dpi);
    if (image.isNull()) {
        qWarning() << "[PopplerPdfProvider] Page" << pageIndex << "failed to render at" << dpi << "dpi";
        return QImage();
    }
    return image.convertToFormat(QImage::Format_ARGB32);
}

std::unique_ptr<Poppler::Page> PopplerPdfProvider::loadPage(int pageIndex) const
{
    if (!isValid() || pageIndex < 0 || pageIndex >= m_document->numPages()) {
        return nullptr;
    }
    return m_document->page(pageIndex);
}
