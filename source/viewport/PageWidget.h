// ============================================================================
// PageWidget - Displays one page and routes pointer input for it
// ============================================================================
// Paints, in order:
// - the page's base surface (white while the page is still rendering)
// - the overlay surface, multiplied in freehand mode and alpha-composed in
//   box mode (the same rule the exporter uses)
// - the box preview of an active drag: translucent fill + 1px dashed border
//
// Mouse input is forwarded to the HighlightSession in logical page pixels.
// Qt grabs the mouse on press, so a drag keeps reporting moves (and its
// release) after the pointer leaves the widget. leaveEvent ends whatever
// stroke is still open.
// ============================================================================

#pragma once

#include <QSize>
#include <QWidget>

class HighlightSession;

class PageWidget : public QWidget {
    Q_OBJECT

public:
    PageWidget(HighlightSession* session, int pageIndex, QWidget* parent = nullptr);

    int pageIndex() const { return m_pageIndex; }

    /**
     * @brief Resize to the page's logical size at the current scale.
     */
    void updatePageSize();

    /**
     * @brief Pick the cursor from the eraser hint.
     */
    void setEraserCursor(bool eraser);

    QSize sizeHint() const override;

protected:
    void paintEvent(QPaintEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void leaveEvent(QEvent* event) override;

private:
    QSize logicalPageSize() const;

    HighlightSession* m_session = nullptr;
    int m_pageIndex = -1;
};
