// ============================================================================
// MuPdfWriter - Implementation
// ============================================================================

#include "MuPdfWriter.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QDebug>

// ============================================================================
// Helpers
// ============================================================================

static QByteArray formatMatrix(const fz_matrix& m)
{
    QByteArray op;
    op += QByteArray::number(m.a, 'f', 4) + ' ';
    op += QByteArray::number(m.b, 'f', 4) + ' ';
    op += QByteArray::number(m.c, 'f', 4) + ' ';
    op += QByteArray::number(m.d, 'f', 4) + ' ';
    op += QByteArray::number(m.e, 'f', 4) + ' ';
    op += QByteArray::number(m.f, 'f', 4) + " cm\n";
    return op;
}

// ============================================================================
// Construction / Destruction
// ============================================================================

MuPdfWriter::MuPdfWriter()
{
    m_ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!m_ctx) {
        m_lastError = QStringLiteral("Failed to create MuPDF context");
        qWarning() << "[MuPdfWriter]" << m_lastError;
    }
}

MuPdfWriter::~MuPdfWriter()
{
    closeDocument();
    if (m_ctx) {
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
    }
}

void MuPdfWriter::closeDocument()
{
    if (!m_ctx) return;

    if (m_doc) {
        pdf_drop_document(m_ctx, m_doc);
        m_doc = nullptr;
    }
    if (m_stream) {
        fz_drop_stream(m_ctx, m_stream);
        m_stream = nullptr;
    }
    m_pendingContent.clear();
    m_resourceCounter = 0;
}

// ============================================================================
// Document Access
// ============================================================================

bool MuPdfWriter::load(const QByteArray& pdfData)
{
    if (!m_ctx) {
        return false;
    }

    closeDocument();
    m_data = pdfData;

    if (m_data.isEmpty()) {
        m_lastError = QStringLiteral("No PDF data");
        return false;
    }

    fz_try(m_ctx) {
        m_stream = fz_open_memory(m_ctx,
                                  reinterpret_cast<const unsigned char*>(m_data.constData()),
                                  static_cast<size_t>(m_data.size()));
        m_doc = pdf_open_document_with_stream(m_ctx, m_stream);
    }
    fz_catch(m_ctx) {
        m_lastError = QStringLiteral("Failed to parse PDF: %1")
                          .arg(QString::fromUtf8(fz_caught_message(m_ctx)));
        qWarning() << "[MuPdfWriter]" << m_lastError;
        closeDocument();
        return false;
    }

    qDebug() << "[MuPdfWriter] Loaded" << m_data.size() << "bytes," << pageCount() << "pages";
    return true;
}

int MuPdfWriter::pageCount() const
{
    if (!m_doc) return 0;

    int count = 0;
    fz_try(m_ctx) {
        count = pdf_count_pages(m_ctx, m_doc);
    }
    fz_catch(m_ctx) {
        count = 0;
    }
    return count;
}

QSizeF MuPdfWriter::pageSize(int pageIndex) const
{
    if (!m_doc || pageIndex < 0 || pageIndex >= pageCount()) {
        return QSizeF();
    }

    pdf_page* page = nullptr;
    fz_rect visible = fz_empty_rect;
    fz_try(m_ctx) {
        page = pdf_load_page(m_ctx, m_doc, pageIndex);
        fz_rect mediabox;
        fz_matrix ctm;
        pdf_page_transform(m_ctx, page, &mediabox, &ctm);
        visible = fz_transform_rect(mediabox, ctm);
    }
    fz_always(m_ctx) {
        if (page) fz_drop_page(m_ctx, &page->super);
    }
    fz_catch(m_ctx) {
        return QSizeF();
    }

    return QSizeF(visible.x1 - visible.x0, visible.y1 - visible.y0);
}

// ============================================================================
// Drawing
// ============================================================================

pdf_obj* MuPdfWriter::ownPageResources(int pageIndex)
{
    pdf_obj* pageObj = pdf_lookup_page_obj(m_ctx, m_doc, pageIndex);
    pdf_obj* resources = pdf_dict_get(m_ctx, pageObj, PDF_NAME(Resources));
    if (!resources) {
        pdf_obj* inherited = pdf_dict_get_inheritable(m_ctx, pageObj, PDF_NAME(Resources));
        resources = inherited ? pdf_copy_dict(m_ctx, inherited) : pdf_new_dict(m_ctx, m_doc, 4);
        pdf_dict_put_drop(m_ctx, pageObj, PDF_NAME(Resources), resources);
    }
    return resources;
}

QByteArray MuPdfWriter::freeResourceName(pdf_obj* dict, const char* prefix)
{
    // A previously exported file already carries PHImg1, PHGs1, ...
    QByteArray name;
    do {
        name = prefix + QByteArray::number(++m_resourceCounter);
    } while (pdf_dict_gets(m_ctx, dict, name.constData()));
    return name;
}

QByteArray MuPdfWriter::addOpacityState(int pageIndex, qreal opacity)
{
    QByteArray name;
    const float alpha = static_cast<float>(qBound<qreal>(0.0, opacity, 1.0));

    fz_try(m_ctx) {
        pdf_obj* resources = ownPageResources(pageIndex);
        pdf_obj* extGStates = pdf_dict_get(m_ctx, resources, PDF_NAME(ExtGState));
        if (!extGStates) {
            extGStates = pdf_dict_put_dict(m_ctx, resources, PDF_NAME(ExtGState), 4);
        }
        name = freeResourceName(extGStates, "PHGs");

        pdf_obj* state = pdf_new_dict(m_ctx, m_doc, 3);
        pdf_dict_put(m_ctx, state, PDF_NAME(Type), PDF_NAME(ExtGState));
        pdf_dict_put_real(m_ctx, state, PDF_NAME(ca), alpha);
        pdf_dict_put_real(m_ctx, state, PDF_NAME(CA), alpha);
        pdf_dict_puts_drop(m_ctx, extGStates, name.constData(), state);
    }
    fz_catch(m_ctx) {
        m_lastError = QStringLiteral("Failed to add opacity state: %1")
                          .arg(QString::fromUtf8(fz_caught_message(m_ctx)));
        qWarning() << "[MuPdfWriter]" << m_lastError;
        return QByteArray();
    }
    return name;
}

QByteArray MuPdfWriter::visibleToUserMatrix(int pageIndex, const PdfPlacement& placement) const
{
    pdf_page* page = nullptr;
    fz_matrix result = fz_identity;
    bool ok = true;

    fz_try(m_ctx) {
        page = pdf_load_page(m_ctx, m_doc, pageIndex);
        fz_rect mediabox;
        fz_matrix ctm;
        pdf_page_transform(m_ctx, page, &mediabox, &ctm);

        // ctm maps user space to the visible page (top-left origin, y down).
        const fz_rect visible = fz_transform_rect(mediabox, ctm);
        const float visibleHeight = visible.y1 - visible.y0;

        const float w = static_cast<float>(placement.width);
        const float h = static_cast<float>(placement.height);
        const float left = static_cast<float>(placement.x);
        const float top = visibleHeight - static_cast<float>(placement.y) - h;

        // Unit square -> visible rectangle, row 0 of an image at the top
        const fz_matrix unitToVisible = fz_make_matrix(w, 0, 0, -h, left, top + h);
        result = fz_concat(unitToVisible, fz_invert_matrix(ctm));
    }
    fz_always(m_ctx) {
        if (page) fz_drop_page(m_ctx, &page->super);
    }
    fz_catch(m_ctx) {
        ok = false;
    }

    return ok ? formatMatrix(result) : QByteArray();
}

bool MuPdfWriter::drawImage(int pageIndex, const QByteArray& imageData,
                            const PdfPlacement& placement)
{
    if (!m_doc || pageIndex < 0 || pageIndex >= pageCount()) {
        m_lastError = QStringLiteral("Page %1 does not exist").arg(pageIndex + 1);
        return false;
    }
    if (imageData.isEmpty() || placement.isEmpty()) {
        m_lastError = QStringLiteral("Nothing to draw on page %1").arg(pageIndex + 1);
        return false;
    }

    const QByteArray matrix = visibleToUserMatrix(pageIndex, placement);
    if (matrix.isEmpty()) {
        m_lastError = QStringLiteral("Failed to read geometry of page %1").arg(pageIndex + 1);
        return false;
    }

    QByteArray stateName;
    if (placement.opacity < 1.0) {
        stateName = addOpacityState(pageIndex, placement.opacity);
        if (stateName.isEmpty()) {
            return false;
        }
    }

    QByteArray imageName;
    fz_buffer* buffer = nullptr;
    fz_image* image = nullptr;

    fz_try(m_ctx) {
        buffer = fz_new_buffer_from_copied_data(m_ctx,
            reinterpret_cast<const unsigned char*>(imageData.constData()),
            static_cast<size_t>(imageData.size()));
        image = fz_new_image_from_buffer(m_ctx, buffer);

        pdf_obj* imageObj = pdf_add_image(m_ctx, m_doc, image);

        pdf_obj* resources = ownPageResources(pageIndex);
        pdf_obj* xobjects = pdf_dict_get(m_ctx, resources, PDF_NAME(XObject));
        if (!xobjects) {
            xobjects = pdf_dict_put_dict(m_ctx, resources, PDF_NAME(XObject), 4);
        }
        imageName = freeResourceName(xobjects, "PHImg");
        pdf_dict_puts_drop(m_ctx, xobjects, imageName.constData(), imageObj);
    }
    fz_always(m_ctx) {
        if (image) fz_drop_image(m_ctx, image);
        if (buffer) fz_drop_buffer(m_ctx, buffer);
    }
    fz_catch(m_ctx) {
        m_lastError = QStringLiteral("Failed to embed image on page %1: %2")
                          .arg(pageIndex + 1)
                          .arg(QString::fromUtf8(fz_caught_message(m_ctx)));
        qWarning() << "[MuPdfWriter]" << m_lastError;
        return false;
    }

    QByteArray& ops = m_pendingContent[pageIndex];
    ops += "q\n";
    if (!stateName.isEmpty()) {
        ops += '/' + stateName + " gs\n";
    }
    ops += matrix;
    ops += '/' + imageName + " Do\nQ\n";
    return true;
}

bool MuPdfWriter::drawRectangle(int pageIndex, const PdfPlacement& placement,
                                const QColor& color)
{
    if (!m_doc || pageIndex < 0 || pageIndex >= pageCount()) {
        m_lastError = QStringLiteral("Page %1 does not exist").arg(pageIndex + 1);
        return false;
    }
    if (placement.isEmpty() || !color.isValid()) {
        m_lastError = QStringLiteral("Invalid rectangle on page %1").arg(pageIndex + 1);
        return false;
    }

    const QByteArray matrix = visibleToUserMatrix(pageIndex, placement);
    if (matrix.isEmpty()) {
        m_lastError = QStringLiteral("Failed to read geometry of page %1").arg(pageIndex + 1);
        return false;
    }

    QByteArray stateName;
    if (placement.opacity < 1.0) {
        stateName = addOpacityState(pageIndex, placement.opacity);
        if (stateName.isEmpty()) {
            return false;
        }
    }

    QByteArray& ops = m_pendingContent[pageIndex];
    ops += "q\n";
    if (!stateName.isEmpty()) {
        ops += '/' + stateName + " gs\n";
    }
    ops += QByteArray::number(color.redF(), 'f', 4) + ' '
         + QByteArray::number(color.greenF(), 'f', 4) + ' '
         + QByteArray::number(color.blueF(), 'f', 4) + " rg\n";
    ops += matrix;
    ops += "0 0 1 1 re f\nQ\n";
    return true;
}

// ============================================================================
// Metadata and Finalization
// ============================================================================

bool MuPdfWriter::setProducer(const QString& producer)
{
    if (!m_doc) return false;

    const QByteArray utf8 = producer.toUtf8();
    fz_try(m_ctx) {
        pdf_obj* trailer = pdf_trailer(m_ctx, m_doc);
        pdf_obj* info = pdf_dict_get(m_ctx, trailer, PDF_NAME(Info));
        if (!info) {
            info = pdf_add_new_dict(m_ctx, m_doc, 4);
            pdf_dict_put_drop(m_ctx, trailer, PDF_NAME(Info), info);
        }
        pdf_dict_put_text_string(m_ctx, info, PDF_NAME(Producer), utf8.constData());
    }
    fz_catch(m_ctx) {
        m_lastError = QStringLiteral("Failed to write metadata: %1")
                          .arg(QString::fromUtf8(fz_caught_message(m_ctx)));
        qWarning() << "[MuPdfWriter]" << m_lastError;
        return false;
    }
    return true;
}

bool MuPdfWriter::flushPendingContent()
{
    for (auto it = m_pendingContent.constBegin(); it != m_pendingContent.constEnd(); ++it) {
        const int pageIndex = it.key();
        const QByteArray tail = "Q\n" + it.value();

        fz_buffer* head = nullptr;
        fz_buffer* body = nullptr;

        fz_try(m_ctx) {
            pdf_obj* pageObj = pdf_lookup_page_obj(m_ctx, m_doc, pageIndex);
            pdf_obj* contents = pdf_dict_get(m_ctx, pageObj, PDF_NAME(Contents));

            head = fz_new_buffer_from_copied_data(m_ctx,
                reinterpret_cast<const unsigned char*>("q\n"), 2);
            body = fz_new_buffer_from_copied_data(m_ctx,
                reinterpret_cast<const unsigned char*>(tail.constData()),
                static_cast<size_t>(tail.size()));

            pdf_obj* wrapped = pdf_new_array(m_ctx, m_doc, 4);
            pdf_array_push_drop(m_ctx, wrapped, pdf_add_stream(m_ctx, m_doc, head, nullptr, 0));
            if (pdf_is_array(m_ctx, contents)) {
                const int n = pdf_array_len(m_ctx, contents);
                for (int i = 0; i < n; ++i) {
                    pdf_array_push(m_ctx, wrapped, pdf_array_get(m_ctx, contents, i));
                }
            } else if (contents) {
                pdf_array_push(m_ctx, wrapped, contents);
            }
            pdf_array_push_drop(m_ctx, wrapped, pdf_add_stream(m_ctx, m_doc, body, nullptr, 0));
            pdf_dict_put_drop(m_ctx, pageObj, PDF_NAME(Contents), wrapped);
        }
        fz_always(m_ctx) {
            if (head) fz_drop_buffer(m_ctx, head);
            if (body) fz_drop_buffer(m_ctx, body);
        }
        fz_catch(m_ctx) {
            m_lastError = QStringLiteral("Failed to update content of page %1: %2")
                              .arg(pageIndex + 1)
                              .arg(QString::fromUtf8(fz_caught_message(m_ctx)));
            qWarning() << "[MuPdfWriter]" << m_lastError;
            return false;
        }
    }

    m_pendingContent.clear();
    return true;
}

QByteArray MuPdfWriter::save()
{
    if (!m_doc) {
        m_lastError = QStringLiteral("No document loaded");
        return QByteArray();
    }

    if (!flushPendingContent()) {
        return QByteArray();
    }

    fz_buffer* buffer = nullptr;
    fz_output* output = nullptr;
    QByteArray result;

    fz_try(m_ctx) {
        buffer = fz_new_buffer(m_ctx, static_cast<size_t>(m_data.size()) + 4096);
        output = fz_new_output_with_buffer(m_ctx, buffer);

        pdf_write_options opts = pdf_default_write_options;
        opts.do_compress = 1;
        opts.do_compress_images = 1;
        opts.do_compress_fonts = 1;
        pdf_write_document(m_ctx, m_doc, output, &opts);
        fz_close_output(m_ctx, output);

        unsigned char* data = nullptr;
        const size_t length = fz_buffer_storage(m_ctx, buffer, &data);
        result = QByteArray(reinterpret_cast<const char*>(data), static_cast<int>(length));
    }
    fz_always(m_ctx) {
        if (output) fz_drop_output(m_ctx, output);
        if (buffer) fz_drop_buffer(m_ctx, buffer);
    }
    fz_catch(m_ctx) {
        m_lastError = QStringLiteral("Failed to serialize PDF: %1")
                          .arg(QString::fromUtf8(fz_caught_message(m_ctx)));
        qWarning() << "[MuPdfWriter]" << m_lastError;
        return QByteArray();
    }

    qDebug() << "[MuPdfWriter] Serialized" << result.size() << "bytes";
    return result;
}
