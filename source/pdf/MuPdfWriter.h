#pragma once

// ============================================================================
// MuPdfWriter - PdfWriter implementation using MuPDF
// ============================================================================
// Drawing operations are buffered per page and turned into content streams
// when save() runs. Each touched page gets its original content wrapped in a
// q/Q pair so the appended drawing starts from a clean graphics state.
//
// Thread Safety: NOT thread-safe. One instance per export.
// ============================================================================

#include "PdfWriter.h"

#include <QMap>

// Forward declarations for MuPDF types (avoid exposing mupdf headers)
typedef struct fz_context fz_context;
typedef struct fz_stream fz_stream;
typedef struct pdf_document pdf_document;
typedef struct pdf_obj pdf_obj;

class MuPdfWriter : public PdfWriter {
public:
    MuPdfWriter();
    ~MuPdfWriter() override;

    // Non-copyable (owns MuPDF resources)
    MuPdfWriter(const MuPdfWriter&) = delete;
    MuPdfWriter& operator=(const MuPdfWriter&) = delete;

    bool load(const QByteArray& pdfData) override;
    int pageCount() const override;
    QSizeF pageSize(int pageIndex) const override;

    bool drawImage(int pageIndex, const QByteArray& imageData,
                   const PdfPlacement& placement) override;
    bool drawRectangle(int pageIndex, const PdfPlacement& placement,
                       const QColor& color) override;

    bool setProducer(const QString& producer) override;
    QByteArray save() override;
    QString lastError() const override { return m_lastError; }

private:
    /**
     * @brief Drop the loaded document (the context stays alive).
     */
    void closeDocument();

    /**
     * @brief Page resources owned by the page itself.
     *
     * An inherited Resources dictionary is shallow-copied onto the page. Its
     * XObject and ExtGState sub-dictionaries, and any Resources dictionary
     * several pages reference directly, stay shared, so entries added here
     * can show up in other pages' resources. Names use the PHImg/PHGs
     * prefixes with a running counter and are only referenced from this
     * page's appended content.
     */
    pdf_obj* ownPageResources(int pageIndex);

    /**
     * @brief Next prefix+counter name not yet used as a key in dict.
     */
    QByteArray freeResourceName(pdf_obj* dict, const char* prefix);

    /**
     * @brief Register an ExtGState with the given fill/stroke alpha.
     * @return The resource name, or an empty string on failure.
     */
    QByteArray addOpacityState(int pageIndex, qreal opacity);

    /**
     * @brief "a b c d e f cm" operator mapping the unit square onto the
     *        placement, expressed in the page's user space.
     */
    QByteArray visibleToUserMatrix(int pageIndex, const PdfPlacement& placement) const;

    /**
     * @brief Wrap each touched page's content and append the pending operators.
     */
    bool flushPendingContent();

    QByteArray m_data;                      ///< Backing bytes for m_stream
    mutable fz_context* m_ctx = nullptr;
    fz_stream* m_stream = nullptr;
    pdf_document* m_doc = nullptr;
    int m_resourceCounter = 0;              ///< Unique suffix for added resources
    QMap<int, QByteArray> m_pendingContent; ///< pageIndex -> operators to append
    QString m_lastError;
};
