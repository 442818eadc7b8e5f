#pragma once

// ============================================================================
// PageSurfaceManagerTests - Render passes, generations and carry-forward
// ============================================================================
// Run with: pdfhighlighter --test-surfaces
//
// Uses FakePdfProvider so renders are deterministic and can be slowed down
// to force overlapping passes.
// ============================================================================

#include "FakePdfProvider.h"
#include "PageSurfaceManager.h"

#include <QObject>
#include <QPainter>
#include <QSignalSpy>
#include <QTest>

class PageSurfaceManagerTests : public QObject {
    Q_OBJECT

private:
    std::shared_ptr<FakeRenderControl> m_control;

    std::unique_ptr<PageSurfaceManager> createManager()
    {
        auto manager = std::make_unique<PageSurfaceManager>(FakePdfProvider::factory(m_control));
        if (!manager->openDocument(FakePdfProvider::documentBytes())) {
            return nullptr;
        }
        return manager;
    }

private slots:
    void init()
    {
        m_control = std::make_shared<FakeRenderControl>();
        m_control->pageSizes = { QSizeF(200, 100), QSizeF(160, 240), QSizeF(200, 100) };
    }

    void testOpenCachesPageSizes()
    {
        PageSurfaceManager manager(FakePdfProvider::factory(m_control));
        QSignalSpy opened(&manager, &PageSurfaceManager::documentOpened);

        QVERIFY(manager.openDocument(FakePdfProvider::documentBytes()));
        QVERIFY(manager.hasDocument());
        QCOMPARE(manager.pageCount(), 3);
        QCOMPARE(manager.pageSizePoints(1), QSizeF(160, 240));
        QVERIFY(!manager.pageSizePoints(7).isValid());
        QCOMPARE(opened.count(), 1);
        QCOMPARE(opened.at(0).at(0).toInt(), 3);

        // Nothing is registered until a pass runs
        QVERIFY(manager.registeredPages().isEmpty());
        QVERIFY(!manager.surface(0));
    }

    void testRenderAllRegistersEveryPage()
    {
        auto manager = createManager();
        QVERIFY(manager);
        manager->setDevicePixelRatio(2.0);

        QSignalSpy registered(manager.get(), &PageSurfaceManager::surfaceRegistered);
        QSignalSpy finished(manager.get(), &PageSurfaceManager::renderFinished);

        const quint64 generation = manager->renderAll(1.5);
        QVERIFY(manager->isRendering());
        QTRY_VERIFY(!manager->isRendering());

        QCOMPARE(registered.count(), 3);
        QCOMPARE(finished.count(), 1);
        QCOMPARE(finished.at(0).at(0).value<quint64>(), generation);
        QCOMPARE(manager->registeredPages(), QVector<int>({0, 1, 2}));

        // Pages commit in index order
        for (int i = 0; i < 3; ++i) {
            QCOMPARE(registered.at(i).at(0).toInt(), i);
        }

        const PageSurface* surface = manager->surface(1);
        QVERIFY(surface);
        QCOMPARE(surface->generation, generation);
        QCOMPARE(surface->geometry.scale, 1.5);
        QCOMPARE(surface->geometry.devicePixelRatio, 2.0);
        QCOMPARE(surface->base.size(), QSize(480, 720));
        QCOMPARE(surface->overlay.size(), surface->base.size());
        QCOMPARE(surface->overlay.format(), QImage::Format_ARGB32_Premultiplied);
        QCOMPARE(qAlpha(surface->overlay.pixel(10, 10)), 0);
        QCOMPARE(QColor(surface->base.pixel(10, 10)), QColor(Qt::white));
        QVERIFY(!surface->renderFailed);
    }

    void testSupersededPassNeverRegisters()
    {
        auto manager = createManager();
        QVERIFY(manager);
        m_control->delayMs = 60;

        QSignalSpy registered(manager.get(), &PageSurfaceManager::surfaceRegistered);
        QSignalSpy finished(manager.get(), &PageSurfaceManager::renderFinished);

        const quint64 first = manager->renderAll(1.0);
        const quint64 second = manager->renderAll(2.0);
        QVERIFY(second > first);
        QCOMPARE(manager->generation(), second);

        QTRY_VERIFY_WITH_TIMEOUT(!manager->isRendering(), 10000);

        // Only the second pass committed anything
        QCOMPARE(registered.count(), 3);
        QCOMPARE(finished.count(), 1);
        QCOMPARE(finished.at(0).at(0).value<quint64>(), second);
        for (int page : manager->registeredPages()) {
            const PageSurface* surface = manager->surface(page);
            QCOMPARE(surface->generation, second);
            QCOMPARE(surface->geometry.scale, 2.0);
        }
    }

    void testOverlayCarriedForwardAcrossZoom()
    {
        auto manager = createManager();
        QVERIFY(manager);

        manager->renderAll(1.0);
        QTRY_VERIFY(!manager->isRendering());

        // Mark the middle half of page 0
        PageSurface* surface = manager->surface(0);
        QVERIFY(surface);
        {
            QPainter painter(&surface->overlay);
            painter.fillRect(QRectF(50, 25, 100, 50), QColor(255, 0, 0, 128));
        }

        manager->renderAll(2.0);
        QVERIFY(!manager->surface(0));
        QVERIFY(manager->latestSurface(0));     // Parked until the new pass commits it
        QTRY_VERIFY(!manager->isRendering());

        surface = manager->surface(0);
        QVERIFY(surface);
        QCOMPARE(surface->overlay.size(), QSize(400, 200));

        const QColor center = QColor::fromRgba(surface->overlay.pixel(200, 100));
        QVERIFY(qAbs(center.alpha() - 128) <= 2);
        QVERIFY(center.red() > 100);
        QCOMPARE(qAlpha(surface->overlay.pixel(20, 20)), 0);
        QCOMPARE(qAlpha(surface->overlay.pixel(380, 180)), 0);
    }

    void testRenderFailureAndRetry()
    {
        auto manager = createManager();
        QVERIFY(manager);
        m_control->setFailing(1, true);

        QSignalSpy failed(manager.get(), &PageSurfaceManager::pageRenderFailed);
        manager->renderAll(1.0);
        QTRY_VERIFY(!manager->isRendering());

        // The failure does not stop later pages
        QCOMPARE(manager->registeredPages(), QVector<int>({0, 1, 2}));
        QCOMPARE(failed.count(), 1);
        QCOMPARE(failed.at(0).at(0).toInt(), 1);

        const PageSurface* surface = manager->surface(1);
        QVERIFY(surface->renderFailed);
        QCOMPARE(surface->base.size(), QSize(160, 240));
        QCOMPARE(QColor(surface->base.pixel(5, 5)), QColor(Qt::white));
        QVERIFY(!manager->retryPage(0));

        m_control->setFailing(1, false);
        m_control->paper = QColor(250, 250, 240);
        QSignalSpy registered(manager.get(), &PageSurfaceManager::surfaceRegistered);
        QVERIFY(manager->retryPage(1));
        QTRY_COMPARE(registered.count(), 1);

        surface = manager->surface(1);
        QVERIFY(!surface->renderFailed);
        QCOMPARE(QColor(surface->base.pixel(5, 5)), QColor(250, 250, 240));
    }

    void testOpenFailureKeepsCurrentDocument()
    {
        auto manager = createManager();
        QVERIFY(manager);
        manager->renderAll(1.0);
        QTRY_VERIFY(!manager->isRendering());
        const quint64 generation = manager->generation();

        QSignalSpy failed(manager.get(), &PageSurfaceManager::documentOpenFailed);
        QSignalSpy opened(manager.get(), &PageSurfaceManager::documentOpened);

        QString error;
        QVERIFY(!manager->openDocument(QByteArrayLiteral("not a pdf"), &error));
        QVERIFY(!error.isEmpty());
        QVERIFY(!manager->openDocument(QByteArray()));

        QCOMPARE(failed.count(), 2);
        QCOMPARE(opened.count(), 0);
        QVERIFY(manager->hasDocument());
        QCOMPARE(manager->pageCount(), 3);
        QCOMPARE(manager->generation(), generation);
        QCOMPARE(manager->registeredPages(), QVector<int>({0, 1, 2}));
        QCOMPARE(manager->documentData(), FakePdfProvider::documentBytes());
    }

    void testNewDocumentDropsInFlightPass()
    {
        auto manager = createManager();
        QVERIFY(manager);
        m_control->delayMs = 80;

        QSignalSpy registered(manager.get(), &PageSurfaceManager::surfaceRegistered);
        manager->renderAll(1.0);
        QVERIFY(manager->openDocument(FakePdfProvider::documentBytes()));
        QVERIFY(!manager->isRendering());

        // Let the superseded worker finish; its result must be dropped
        QTest::qWait(300);
        QCOMPARE(registered.count(), 0);
        QVERIFY(manager->registeredPages().isEmpty());
        QVERIFY(!manager->latestSurface(0));
    }

    void testCursorHint()
    {
        auto manager = createManager();
        QVERIFY(manager);
        manager->renderAll(1.0);
        QTRY_VERIFY(!manager->isRendering());

        QSignalSpy hint(manager.get(), &PageSurfaceManager::cursorHintChanged);
        manager->setEraserCursorHint(true);
        QCOMPARE(hint.count(), 1);
        QCOMPARE(hint.at(0).at(0).toBool(), true);
        QVERIFY(manager->eraserCursorHint());
        QVERIFY(manager->surface(2)->eraserCursor);

        // New surfaces pick the hint up
        manager->renderAll(1.25);
        QTRY_VERIFY(!manager->isRendering());
        QVERIFY(manager->surface(0)->eraserCursor);
    }

    void testCloseDocument()
    {
        auto manager = createManager();
        QVERIFY(manager);
        manager->renderAll(1.0);
        QTRY_VERIFY(!manager->isRendering());

        QSignalSpy closed(manager.get(), &PageSurfaceManager::documentClosed);
        manager->closeDocument();
        QCOMPARE(closed.count(), 1);
        QVERIFY(!manager->hasDocument());
        QCOMPARE(manager->pageCount(), 0);
        QVERIFY(manager->registeredPages().isEmpty());
    }
};

inline int runPageSurfaceManagerTests()
{
    PageSurfaceManagerTests tests;
    return QTest::qExec(&tests);
}
