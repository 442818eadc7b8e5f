#pragma once

// ============================================================================
// HighlighterSettingsTests - Defaults, color parsing and clamped loading
// ============================================================================
// Run with: pdfhighlighter --test-settings
// ============================================================================

#include "HighlighterSettings.h"

#include <QObject>
#include <QSettings>
#include <QTemporaryDir>
#include <QTest>

class HighlighterSettingsTests : public QObject {
    Q_OBJECT

private slots:
    void testDefaults()
    {
        const HighlighterSettings settings;
        QCOMPARE(settings.palette.size(), 15);
        QCOMPARE(settings.palette.first(), QColor(0xff, 0xeb, 0x3b));
        QCOMPARE(settings.defaultOpacity, 0.35);
        QCOMPARE(settings.defaultThickness, 14.0);
        QCOMPARE(settings.baseScale, 1.25);
        QVERIFY(settings.mode == AnnotationMode::Box);
        QCOMPARE(settings.exportFileName, QStringLiteral("annotated.pdf"));

        const ToolState tool = settings.defaultToolState();
        QCOMPARE(tool.color, settings.defaultColor);
        QVERIFY(!tool.eraser);
    }

    void testColorFromHex()
    {
        QCOMPARE(HighlighterSettings::colorFromHex("#ffeb3b"), QColor(0xff, 0xeb, 0x3b));
        QCOMPARE(HighlighterSettings::colorFromHex("#abc"), QColor(0xaa, 0xbb, 0xcc));
        QCOMPARE(HighlighterSettings::colorFromHex(" 90caf9 "), QColor(0x90, 0xca, 0xf9));
        QVERIFY(!HighlighterSettings::colorFromHex("#12345").isValid());
        QVERIFY(!HighlighterSettings::colorFromHex("#gggggg").isValid());
        QVERIFY(!HighlighterSettings::colorFromHex("").isValid());
    }

    void testClamping()
    {
        const HighlighterSettings settings;
        QCOMPARE(settings.clampOpacity(0.9), 0.35);
        QCOMPARE(settings.clampOpacity(0.0), 0.10);
        QCOMPARE(settings.clampThickness(100.0), 40.0);
        QCOMPARE(settings.clampThickness(1.0), 6.0);
        QCOMPARE(settings.clampZoom(10.0), 3.0);
        QCOMPARE(settings.clampZoom(0.1), 0.5);
    }

    void testSaveLoadAndSanitize()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath(QStringLiteral("settings.ini"));

        {
            HighlighterSettings settings;
            settings.mode = AnnotationMode::Freehand;
            settings.exportJpeg = true;
            settings.defaultColor = QColor(0x90, 0xca, 0xf9);
            QSettings store(path, QSettings::IniFormat);
            settings.save(store);
        }
        {
            QSettings store(path, QSettings::IniFormat);
            const HighlighterSettings loaded = HighlighterSettings::load(store);
            QVERIFY(loaded.mode == AnnotationMode::Freehand);
            QVERIFY(loaded.exportJpeg);
            QCOMPARE(loaded.defaultColor, QColor(0x90, 0xca, 0xf9));
            QCOMPARE(loaded.palette.size(), 15);
        }

        // Out-of-range stored values come back clamped
        {
            QSettings store(path, QSettings::IniFormat);
            store.setValue(QStringLiteral("highlighter/opacity"), 0.95);
            store.setValue(QStringLiteral("highlighter/maxOpacity"), 5.0);
            store.setValue(QStringLiteral("highlighter/thickness"), 500.0);
            store.setValue(QStringLiteral("view/zoomStep"), -1.0);
            store.setValue(QStringLiteral("export/fileName"), QString());
        }
        {
            QSettings store(path, QSettings::IniFormat);
            const HighlighterSettings loaded = HighlighterSettings::load(store);
            QVERIFY(loaded.maxOpacity < 1.0);
            QVERIFY(loaded.defaultOpacity <= loaded.maxOpacity);
            QCOMPARE(loaded.defaultThickness, loaded.maxThickness);
            QVERIFY(loaded.zoomStep > 0.0);
            QCOMPARE(loaded.exportFileName, QStringLiteral("annotated.pdf"));
        }
    }
};

inline int runHighlighterSettingsTests()
{
    HighlighterSettingsTests tests;
    return QTest::qExec(&tests);
}
