// ============================================================================
// PdfHighlighter - Main Entry Point
// ============================================================================

#include <QApplication>
#include <QDebug>
#include <QStringList>

#include "MainWindow.h"
#include "core/HighlighterSettings.h"

// Platform-specific includes
#ifdef Q_OS_WIN
#include <windows.h>
#endif

// Test includes
#include "core/AnnotationStoreTests.h"
#include "core/HighlighterSettingsTests.h"
#include "core/HighlightSessionTests.h"
#include "core/PageGeometryTests.h"
#include "core/PageSurfaceManagerTests.h"
#include "core/StrokeEngineTests.h"
#include "pdf/PdfExporterTests.h"

// ============================================================================
// Platform Helpers
// ============================================================================

#ifdef Q_OS_WIN
static void enableDebugConsole()
{
    // Attach to the parent console so qDebug output is visible from cmd
    if (AttachConsole(ATTACH_PARENT_PROCESS)) {
        freopen("CONOUT$", "w", stdout);
        freopen("CONOUT$", "w", stderr);
    }
}
#endif

// ============================================================================
// Test Runners
// ============================================================================

static int runTests(const QString& testType)
{
    static const QStringList knownTests = {"geometry", "store", "settings", "stroke", "surfaces", "session", "export", "all"};
    if (!knownTests.contains(testType)) {
        qWarning() << "[Main] Unknown test" << testType << "- expected one of" << knownTests;
        return 2;
    }

    int failures = 0;
    const bool all = testType == QLatin1String("all");

    if (all || testType == QLatin1String("geometry")) {
        failures += runPageGeometryTests();
    }
    if (all || testType == QLatin1String("store")) {
        failures += runAnnotationStoreTests();
    }
    if (all || testType == QLatin1String("settings")) {
        failures += runHighlighterSettingsTests();
    }
    if (all || testType == QLatin1String("stroke")) {
        failures += runStrokeEngineTests();
    }
    if (all || testType == QLatin1String("surfaces")) {
        failures += runPageSurfaceManagerTests();
    }
    if (all || testType == QLatin1String("session")) {
        failures += runHighlightSessionTests();
    }
    if (all || testType == QLatin1String("export")) {
        failures += runPdfExporterTests();
    }

    qDebug() << "[Main] Tests" << testType << (failures == 0 ? "passed" : "FAILED");
    return failures == 0 ? 0 : 1;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[])
{
#ifdef Q_OS_WIN
    enableDebugConsole();
#endif

    QApplication app(argc, argv);
    app.setOrganizationName("PdfHighlighter");
    app.setApplicationName("App");

    // ========== Parse Command Line Arguments ==========
    QString inputFile;
    QString testToRun;

    for (int i = 1; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);

        if (arg.startsWith("--test-")) {
            testToRun = arg.mid(7);
            continue;
        }
        if (!arg.startsWith("--") && inputFile.isEmpty()) {
            inputFile = arg;
        }
    }

    // Handle test commands
    if (!testToRun.isEmpty()) {
        return runTests(testToRun);
    }

    // ========== Launch Application ==========
    MainWindow window(HighlighterSettings::load());
    window.show();
    if (!inputFile.isEmpty()) {
        window.openFile(inputFile);
    }
    return app.exec();
}
