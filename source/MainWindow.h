#ifndef MAINWINDOW_H
#define MAINWINDOW_H

// ============================================================================
// MainWindow - Application window for PdfHighlighter
// ============================================================================
// A single toolbar (open, zoom, palette, opacity, thickness, eraser, export)
// above a DocumentViewport. All state lives in the HighlightSession; the
// window only translates widget input into session calls and reports errors.
// ============================================================================

#include <QMainWindow>
#include <QVector>

#include "core/HighlighterSettings.h"

class HighlightSession;
class DocumentViewport;
class QAction;
class QLabel;
class QSlider;
class QToolBar;
class QToolButton;
class QButtonGroup;

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(const HighlighterSettings& settings, QWidget* parent = nullptr);
    ~MainWindow() override;

    HighlightSession* session() const { return m_session; }

    /**
     * @brief Open a PDF file, reporting failures in a message box.
     */
    bool openFile(const QString& path);

public slots:
    void openFileDialog();
    void exportAnnotatedPdf();

private slots:
    void onToolChanged();
    void onZoomChanged(qreal zoom);
    void onPagesFailedToRender(const QVector<int>& pages);
    void onExportFailed(const QString& errorMessage);

private:
    void setupToolbar();
    void setupPalette(QToolBar* toolbar);
    void updateActions();
    void updateWindowTitle();

    /**
     * @brief Write bytes atomically to a path.
     */
    bool writeFile(const QString& path, const QByteArray& data, QString* errorMessage);

    static QIcon swatchIcon(const QColor& color);

    HighlightSession* m_session = nullptr;
    DocumentViewport* m_viewport = nullptr;
    QString m_currentPath;

    QAction* m_exportAction = nullptr;
    QAction* m_zoomInAction = nullptr;
    QAction* m_zoomOutAction = nullptr;
    QLabel* m_zoomLabel = nullptr;
    QSlider* m_opacitySlider = nullptr;
    QSlider* m_thicknessSlider = nullptr;
    QToolButton* m_eraserButton = nullptr;
    QButtonGroup* m_paletteGroup = nullptr;
    QVector<QToolButton*> m_swatches;

    bool m_reportingRenderFailure = false;
    bool m_exporting = false;
};

#endif // MAINWINDOW_H
