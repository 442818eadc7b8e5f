#pragma once

// ============================================================================
// PdfWriter - Abstract interface for mutating an existing PDF
// ============================================================================
// Loads the original document bytes, draws images or filled rectangles on
// top of existing pages, and serializes the result back to bytes. Page
// content that is not drawn on stays byte-for-byte as it was.
//
// Placements are in PDF points with a bottom-left origin, relative to the
// visible page box (rotation and crop offsets are handled by the backend).
// ============================================================================

#include <QByteArray>
#include <QColor>
#include <QSizeF>
#include <QString>

#include <functional>
#include <memory>

/**
 * @brief Target rectangle and constant opacity of a drawing operation.
 */
struct PdfPlacement {
    qreal x = 0.0;          ///< Left edge in points
    qreal y = 0.0;          ///< Bottom edge in points (PDF origin is bottom-left)
    qreal width = 0.0;
    qreal height = 0.0;
    qreal opacity = 1.0;    ///< 0..1, applied through an ExtGState

    bool isEmpty() const { return width <= 0.0 || height <= 0.0; }
};

class PdfWriter {
public:
    virtual ~PdfWriter() = default;

    /**
     * @brief Parse the document to be modified.
     * @return False if the bytes are not a PDF; lastError() has the reason.
     */
    virtual bool load(const QByteArray& pdfData) = 0;

    virtual int pageCount() const = 0;

    /**
     * @brief Visible page size in points (after rotation and cropping).
     */
    virtual QSizeF pageSize(int pageIndex) const = 0;

    /**
     * @brief Draw an encoded PNG or JPEG image over the page.
     */
    virtual bool drawImage(int pageIndex, const QByteArray& imageData,
                           const PdfPlacement& placement) = 0;

    /**
     * @brief Fill a rectangle with a solid color at placement.opacity.
     */
    virtual bool drawRectangle(int pageIndex, const PdfPlacement& placement,
                               const QColor& color) = 0;

    /**
     * @brief Set the Producer entry of the document info dictionary.
     */
    virtual bool setProducer(const QString& producer) = 0;

    /**
     * @brief Serialize the modified document.
     * @return The new PDF bytes, or an empty array on failure.
     */
    virtual QByteArray save() = 0;

    /**
     * @brief Message describing the most recent failure.
     */
    virtual QString lastError() const = 0;
};

using PdfWriterFactory = std::function<std::unique_ptr<PdfWriter>()>;
