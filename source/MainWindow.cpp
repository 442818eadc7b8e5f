// ============================================================================
// MainWindow - Implementation
// ============================================================================

#include "MainWindow.h"

#include "core/DocumentViewport.h"
#include "core/HighlightSession.h"

#include <QAction>
#include <QApplication>
#include <QButtonGroup>
#include <QDebug>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QIcon>
#include <QLabel>
#include <QMessageBox>
#include <QPainter>
#include <QPixmap>
#include <QSaveFile>
#include <QSlider>
#include <QStatusBar>
#include <QStringList>
#include <QToolBar>
#include <QToolButton>
#include <QtMath>

namespace {
constexpr int SWATCH_SIZE = 20;
}

MainWindow::MainWindow(const HighlighterSettings& settings, QWidget* parent)
    : QMainWindow(parent)
{
    m_session = new HighlightSession(settings, PdfProviderFactory(), this);
    m_viewport = new DocumentViewport(m_session, this);
    setCentralWidget(m_viewport);

    setupToolbar();

    connect(m_session, &HighlightSession::toolChanged, this, &MainWindow::onToolChanged);
    connect(m_session, &HighlightSession::zoomChanged, this, &MainWindow::onZoomChanged);

    PageSurfaceManager* surfaces = m_session->surfaces();
    // Queued: the dialog must not run inside the surface manager's commit
    connect(m_session, &HighlightSession::pagesFailedToRender, this,
            &MainWindow::onPagesFailedToRender, Qt::QueuedConnection);
    connect(surfaces, &PageSurfaceManager::documentOpened, this, [this](int pageCount) {
        statusBar()->showMessage(tr("%n page(s)", "", pageCount), 3000);
        updateActions();
    });
    connect(surfaces, &PageSurfaceManager::renderFinished, this, [this]() {
        statusBar()->clearMessage();
    });

    connect(m_session->exporter(), &PdfExporter::exportFailed, this, &MainWindow::onExportFailed);
    connect(m_session->exporter(), &PdfExporter::progressUpdated, this, [this](int current, int total) {
        statusBar()->showMessage(tr("Exporting page %1 of %2...").arg(current).arg(total));
    });

    onToolChanged();
    onZoomChanged(m_session->zoom());
    updateActions();
    updateWindowTitle();
    resize(1000, 800);
}

MainWindow::~MainWindow() = default;

// ============================================================================
// Toolbar
// ============================================================================

void MainWindow::setupToolbar()
{
    QToolBar* toolbar = addToolBar(tr("Highlighter"));
    toolbar->setMovable(false);

    QAction* openAction = toolbar->addAction(tr("Open PDF..."), this, &MainWindow::openFileDialog);
    openAction->setShortcut(QKeySequence::Open);

    m_exportAction = toolbar->addAction(tr("Export..."), this, &MainWindow::exportAnnotatedPdf);
    m_exportAction->setShortcut(QKeySequence::Save);
    m_exportAction->setToolTip(tr("Export Annotated PDF"));

    toolbar->addSeparator();

    m_zoomOutAction = toolbar->addAction(tr("-"), m_session, &HighlightSession::zoomOut);
    m_zoomOutAction->setShortcut(QKeySequence::ZoomOut);
    m_zoomOutAction->setToolTip(tr("Zoom Out"));

    m_zoomLabel = new QLabel(toolbar);
    m_zoomLabel->setMinimumWidth(48);
    m_zoomLabel->setAlignment(Qt::AlignCenter);
    toolbar->addWidget(m_zoomLabel);

    m_zoomInAction = toolbar->addAction(tr("+"), m_session, &HighlightSession::zoomIn);
    m_zoomInAction->setShortcut(QKeySequence::ZoomIn);
    m_zoomInAction->setToolTip(tr("Zoom In"));

    toolbar->addSeparator();
    setupPalette(toolbar);
    toolbar->addSeparator();

    const HighlighterSettings& settings = m_session->settings();

    // Sliders work in percent / whole pixels
    toolbar->addWidget(new QLabel(tr("Opacity"), toolbar));
    m_opacitySlider = new QSlider(Qt::Horizontal, toolbar);
    m_opacitySlider->setRange(qRound(settings.minOpacity * 100), qRound(settings.maxOpacity * 100));
    m_opacitySlider->setFixedWidth(100);
    toolbar->addWidget(m_opacitySlider);
    connect(m_opacitySlider, &QSlider::valueChanged, this, [this](int value) {
        m_session->setOpacity(value / 100.0);
    });

    toolbar->addWidget(new QLabel(tr("Thickness"), toolbar));
    m_thicknessSlider = new QSlider(Qt::Horizontal, toolbar);
    m_thicknessSlider->setRange(qRound(settings.minThickness), qRound(settings.maxThickness));
    m_thicknessSlider->setFixedWidth(100);
    toolbar->addWidget(m_thicknessSlider);
    connect(m_thicknessSlider, &QSlider::valueChanged, this, [this](int value) {
        m_session->setThickness(value);
    });

    toolbar->addSeparator();

    m_eraserButton = new QToolButton(toolbar);
    m_eraserButton->setText(tr("Eraser"));
    m_eraserButton->setCheckable(true);
    m_eraserButton->setShortcut(QKeySequence(Qt::Key_E));
    toolbar->addWidget(m_eraserButton);
    connect(m_eraserButton, &QToolButton::toggled, m_session, &HighlightSession::setEraser);
}

void MainWindow::setupPalette(QToolBar* toolbar)
{
    m_paletteGroup = new QButtonGroup(this);
    m_paletteGroup->setExclusive(true);

    const QVector<QColor>& palette = m_session->settings().palette;
    for (int i = 0; i < palette.size(); ++i) {
        const QColor color = palette[i];
        auto* swatch = new QToolButton(toolbar);
        swatch->setCheckable(true);
        swatch->setIcon(swatchIcon(color));
        swatch->setIconSize(QSize(SWATCH_SIZE, SWATCH_SIZE));
        swatch->setToolTip(color.name());
        toolbar->addWidget(swatch);
        m_paletteGroup->addButton(swatch, i);
        m_swatches.append(swatch);

        connect(swatch, &QToolButton::clicked, this, [this, color]() {
            m_session->setColor(color);
        });
    }
}

QIcon MainWindow::swatchIcon(const QColor& color)
{
    QPixmap pixmap(SWATCH_SIZE, SWATCH_SIZE);
    pixmap.fill(Qt::transparent);

    QPainter painter(&pixmap);
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setPen(QPen(color.darker(130), 1.0));
    painter.setBrush(color);
    painter.drawEllipse(QRectF(1.5, 1.5, SWATCH_SIZE - 3, SWATCH_SIZE - 3));
    return QIcon(pixmap);
}

// ============================================================================
// Session State -> Widgets
// ============================================================================

void MainWindow::onToolChanged()
{
    const ToolState& tool = m_session->tool();

    // Reflect the state without feeding it back into the session
    const QSignalBlocker opacityBlocker(m_opacitySlider);
    const QSignalBlocker thicknessBlocker(m_thicknessSlider);
    const QSignalBlocker eraserBlocker(m_eraserButton);

    m_opacitySlider->setValue(qRound(tool.opacity * 100));
    m_thicknessSlider->setValue(qRound(tool.thickness));
    m_eraserButton->setChecked(tool.eraser);

    const QVector<QColor>& palette = m_session->settings().palette;
    const int index = palette.indexOf(tool.color);
    if (index >= 0 && !tool.eraser) {
        m_swatches[index]->setChecked(true);
    } else if (QAbstractButton* checked = m_paletteGroup->checkedButton()) {
        m_paletteGroup->setExclusive(false);
        checked->setChecked(false);
        m_paletteGroup->setExclusive(true);
    }
}

void MainWindow::onZoomChanged(qreal zoom)
{
    m_zoomLabel->setText(QStringLiteral("%1%").arg(qRound(zoom * 100)));
    updateActions();
}

void MainWindow::updateActions()
{
    const HighlighterSettings& settings = m_session->settings();
    const bool hasDocument = m_session->hasDocument();
    m_exportAction->setEnabled(hasDocument && !m_exporting);
    m_zoomInAction->setEnabled(hasDocument && m_session->zoom() < settings.maxZoom - 1e-6);
    m_zoomOutAction->setEnabled(hasDocument && m_session->zoom() > settings.minZoom + 1e-6);
}

void MainWindow::updateWindowTitle()
{
    if (m_currentPath.isEmpty()) {
        setWindowTitle(tr("PdfHighlighter"));
    } else {
        setWindowTitle(tr("%1 - PdfHighlighter").arg(QFileInfo(m_currentPath).fileName()));
    }
}

// ============================================================================
// Open
// ============================================================================

void MainWindow::openFileDialog()
{
    const QString startDir = m_currentPath.isEmpty()
        ? QDir::homePath()
        : QFileInfo(m_currentPath).absolutePath();

    const QString path = QFileDialog::getOpenFileName(this, tr("Open PDF"), startDir,
                                                      tr("PDF Files (*.pdf)"));
    if (path.isEmpty()) {
        return; // User cancelled
    }
    openFile(path);
}

bool MainWindow::openFile(const QString& path)
{
    if (m_session->hasAnnotations()) {
        const QMessageBox::StandardButton reply = QMessageBox::question(this,
            tr("Discard Highlights"),
            tr("Opening another document discards the current highlights unless they were exported. Continue?"),
            QMessageBox::Yes | QMessageBox::No);
        if (reply == QMessageBox::No) {
            return false;
        }
    }

    QString errorMessage;
    if (!m_session->openFile(path, &errorMessage)) {
        QMessageBox::warning(this, tr("Open Failed"),
                             tr("The file could not be opened as a PDF.\n\n%1").arg(errorMessage));
        return false;
    }

    m_currentPath = path;
    updateWindowTitle();
    updateActions();
    return true;
}

// ============================================================================
// Render Failures
// ============================================================================

void MainWindow::onPagesFailedToRender(const QVector<int>& pages)
{
    // One dialog at a time; later failures stay marked on their pages
    if (m_reportingRenderFailure || pages.isEmpty()) {
        return;
    }
    m_reportingRenderFailure = true;

    QStringList numbers;
    for (int page : pages) {
        numbers.append(QString::number(page + 1));
    }
    const QMessageBox::StandardButton reply = QMessageBox::warning(this,
        tr("Render Failed"),
        tr("%n page(s) could not be rendered (%1). Try again?", "", pages.size())
            .arg(numbers.join(QStringLiteral(", "))),
        QMessageBox::Retry | QMessageBox::Ignore, QMessageBox::Retry);

    m_reportingRenderFailure = false;
    if (reply == QMessageBox::Retry) {
        m_session->retryPages(pages);
    }
}

// ============================================================================
// Export
// ============================================================================

void MainWindow::exportAnnotatedPdf()
{
    if (!m_session->hasDocument() || m_exporting) {
        return;
    }

    QString defaultPath = m_session->settings().exportFileName;
    if (!m_currentPath.isEmpty()) {
        defaultPath = QFileInfo(m_currentPath).absolutePath() + QLatin1Char('/') + defaultPath;
    }

    QString exportPath = QFileDialog::getSaveFileName(this, tr("Export Annotated PDF"),
                                                      defaultPath, tr("PDF Files (*.pdf)"));
    if (exportPath.isEmpty()) {
        return; // User cancelled
    }
    if (!exportPath.endsWith(QLatin1String(".pdf"), Qt::CaseInsensitive)) {
        exportPath += QLatin1String(".pdf");
    }

    m_exporting = true;
    updateActions();
    QApplication::setOverrideCursor(Qt::WaitCursor);
    const PdfExportResult result = m_session->exportPdf();
    QApplication::restoreOverrideCursor();
    m_exporting = false;
    updateActions();
    statusBar()->clearMessage();

    // Failures were already reported through exportFailed
    if (!result.success) {
        return;
    }

    QString errorMessage;
    if (!writeFile(exportPath, result.pdfData, &errorMessage)) {
        onExportFailed(errorMessage);
        return;
    }

    qDebug() << "[MainWindow] Exported" << result.pagesModified << "of" << result.pagesExported
             << "pages to" << exportPath;
    statusBar()->showMessage(tr("Exported to %1").arg(QDir::toNativeSeparators(exportPath)), 5000);
}

bool MainWindow::writeFile(const QString& path, const QByteArray& data, QString* errorMessage)
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        *errorMessage = tr("Cannot write %1: %2").arg(path, file.errorString());
        return false;
    }
    if (file.write(data) != data.size() || !file.commit()) {
        *errorMessage = tr("Cannot write %1: %2").arg(path, file.errorString());
        return false;
    }
    return true;
}

void MainWindow::onExportFailed(const QString& errorMessage)
{
    qWarning() << "[MainWindow] Export failed:" << errorMessage;
    QMessageBox::critical(this, tr("Export Failed"),
                          tr("The annotated PDF could not be created. Your highlights are unchanged.\n\n%1")
                              .arg(errorMessage));
}
