#pragma once

// ============================================================================
// DocumentViewport - Scrollable column of pages for one HighlightSession
// ============================================================================
// Hosts one PageWidget per page, stacked vertically and centered. The
// viewport owns no page state: surfaces, shapes and the tool all live in the
// session, and the viewport only reacts to its signals:
//
// - documentOpened      -> rebuild the page column
// - surfaceRegistered   -> resize that page to the new render pass
// - overlayChanged      -> repaint that page
// - previewChanged      -> repaint that page
// - cursorHintChanged   -> switch every page's cursor
//
// The screen's device pixel ratio is pushed into the session whenever the
// viewport is shown or moves to another screen.
// ============================================================================

#include <QScrollArea>
#include <QVector>

class HighlightSession;
class PageWidget;
class QVBoxLayout;

class DocumentViewport : public QScrollArea {
    Q_OBJECT

public:
    explicit DocumentViewport(HighlightSession* session, QWidget* parent = nullptr);

    HighlightSession* session() const { return m_session; }

    int pageWidgetCount() const { return m_pages.size(); }
    PageWidget* pageWidget(int pageIndex) const;

    /**
     * @brief Scroll so the top of a page is visible.
     */
    void scrollToPage(int pageIndex);

protected:
    void showEvent(QShowEvent* event) override;

private slots:
    void rebuildPages();
    void onSurfaceRegistered(int pageIndex);
    void repaintPage(int pageIndex);
    void applyCursorHint(bool eraser);

private:
    void clearPages();
    void syncDevicePixelRatio();

    HighlightSession* m_session = nullptr;
    QWidget* m_container = nullptr;
    QVBoxLayout* m_layout = nullptr;
    QVector<PageWidget*> m_pages;

    static constexpr int PAGE_SPACING = 12;
    static constexpr int PAGE_MARGIN = 16;
};
