// ============================================================================
// MuPdfProvider - Implementation
// ============================================================================

#include "MuPdfProvider.h"

#include <mupdf/fitz.h>

#include <QDebug>

#include <cstring>

MuPdfProvider::MuPdfProvider(const QByteArray& pdfData)
    : m_data(pdfData)
{
    m_ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!m_ctx) {
        qWarning() << "[MuPdfProvider] Could not create a MuPDF context";
        return;
    }

    if (!open()) {
        // isValid() reports the failure to the caller
        m_pageCount = 0;
    }
}

bool MuPdfProvider::open()
{
    if (m_data.isEmpty()) {
        return false;
    }

    fz_try(m_ctx) {
        fz_register_document_handlers(m_ctx);
        m_stream = fz_open_memory(m_ctx,
                                  reinterpret_cast<const unsigned char*>(m_data.constData()),
                                  static_cast<size_t>(m_data.size()));
        m_doc = fz_open_document_with_stream(m_ctx, "application/pdf", m_stream);
        if (!fz_needs_password(m_ctx, m_doc)) {
            m_pageCount = fz_count_pages(m_ctx, m_doc);
        }
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfProvider] Not a readable PDF:" << fz_caught_message(m_ctx);
        return false;
    }

    if (fz_needs_password(m_ctx, m_doc)) {
        qWarning() << "[MuPdfProvider] Document is password protected";
        return false;
    }

    qDebug() << "[MuPdfProvider] Opened" << m_data.size() << "bytes," << m_pageCount << "pages";
    return m_pageCount > 0;
}

MuPdfProvider::~MuPdfProvider()
{
    if (!m_ctx) {
        return;
    }
    // Dropping a null document or stream is a no-op
    fz_drop_document(m_ctx, m_doc);
    fz_drop_stream(m_ctx, m_stream);
    fz_drop_context(m_ctx);
}

bool MuPdfProvider::isValid() const
{
    return m_doc != nullptr && m_pageCount > 0;
}

int MuPdfProvider::pageCount() const
{
    return m_pageCount;
}

QSizeF MuPdfProvider::pageSize(int pageIndex) const
{
    if (!isValid() || pageIndex < 0 || pageIndex >= m_pageCount) {
        return QSizeF();
    }

    fz_page* page = nullptr;
    fz_rect bounds = fz_empty_rect;
    fz_try(m_ctx) {
        page = fz_load_page(m_ctx, m_doc, pageIndex);
        bounds = fz_bound_page(m_ctx, page);
    }
    fz_always(m_ctx) {
        fz_drop_page(m_ctx, page);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfProvider] Page" << pageIndex << "has no bounds:" << fz_caught_message(m_ctx);
        return QSizeF();
    }

    return QSizeF(bounds.x1 - bounds.x0, bounds.y1 - bounds.y0);
}

QImage MuPdfProvider::renderPageToImage(int pageIndex, qreal dpi) const
{
    if (!isValid() || pageIndex < 0 || pageIndex >= m_pageCount || dpi <= 0.0) {
        return QImage();
    }

    const float zoom = static_cast<float>(dpi / 72.0);

    fz_page* page = nullptr;
    fz_pixmap* pixmap = nullptr;
    fz_device* device = nullptr;
    QImage image;

    fz_try(m_ctx) {
        page = fz_load_page(m_ctx, m_doc, pageIndex);

        const fz_matrix ctm = fz_scale(zoom, zoom);
        const fz_irect bbox = fz_round_rect(fz_transform_rect(fz_bound_page(m_ctx, page), ctm));

        // BGRA with alpha is QImage::Format_ARGB32 on little-endian hosts
        pixmap = fz_new_pixmap_with_bbox(m_ctx, fz_device_bgr(m_ctx), bbox, nullptr, 1);
        fz_clear_pixmap_with_value(m_ctx, pixmap, 0xff);

        device = fz_new_draw_device(m_ctx, ctm, pixmap);
        fz_run_page(m_ctx, page, device, fz_identity, nullptr);
        fz_close_device(m_ctx, device);

        const int width = fz_pixmap_width(m_ctx, pixmap);
        const int height = fz_pixmap_height(m_ctx, pixmap);
        const int stride = fz_pixmap_stride(m_ctx, pixmap);
        const unsigned char* samples = fz_pixmap_samples(m_ctx, pixmap);

        image = QImage(width, height, QImage::Format_ARGB32);
        const size_t rowBytes = static_cast<size_t>(width) * 4;
        for (int row = 0; row < height; ++row) {
            std::memcpy(image.scanLine(row), samples + static_cast<ptrdiff_t>(row) * stride, rowBytes);
        }
    }
    fz_always(m_ctx) {
        fz_drop_device(m_ctx, device);
        fz_drop_pixmap(m_ctx, pixmap);
        fz_drop_page(m_ctx, page);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfProvider] Page" << pageIndex << "failed to render:" << fz_caught_message(m_ctx);
        return QImage();
    }

    return image;
}
