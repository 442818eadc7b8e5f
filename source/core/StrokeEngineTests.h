#pragma once

// ============================================================================
// StrokeEngineTests - Box and freehand input against real surfaces
// ============================================================================
// Run with: pdfhighlighter --test-stroke
//
// Every test renders a 200x100pt page through FakePdfProvider, so at scale
// 1.0 and DPR 1 logical, device and point coordinates coincide.
// ============================================================================

#include "AnnotationStore.h"
#include "FakePdfProvider.h"
#include "PageSurfaceManager.h"
#include "StrokeEngine.h"

#include <QObject>
#include <QPainter>
#include <QSignalSpy>
#include <QTest>

/**
 * @brief Store + surfaces + engine wired the way HighlightSession wires them.
 */
struct StrokeFixture {
    std::shared_ptr<FakeRenderControl> control = std::make_shared<FakeRenderControl>();
    AnnotationStore store;
    PageSurfaceManager surfaces { FakePdfProvider::factory(control) };
    StrokeEngine engine { &store, &surfaces };

    StrokeFixture()
    {
        control->pageSizes = { QSizeF(200, 100), QSizeF(200, 100) };
        engine.setMaxOpacity(0.35);
        engine.setMinBoxSize(3.0);
    }

    /**
     * @brief Open the fake document and start a pass. Wait on isRendering().
     */
    bool start(qreal scale = 1.0, qreal dpr = 1.0)
    {
        if (!surfaces.openDocument(FakePdfProvider::documentBytes())) {
            return false;
        }
        surfaces.setDevicePixelRatio(dpr);
        surfaces.renderAll(scale);
        return true;
    }

    const QImage& overlay(int page = 0) { return surfaces.surface(page)->overlay; }
};

class StrokeEngineTests : public QObject {
    Q_OBJECT

private:
    static ToolState highlighter(const QColor& color = QColor(0xff, 0xeb, 0x3b))
    {
        ToolState tool;
        tool.color = color;
        tool.opacity = 0.35;
        tool.thickness = 14.0;
        return tool;
    }

    static ToolState eraser()
    {
        ToolState tool = highlighter();
        tool.eraser = true;
        return tool;
    }

private slots:
    // ===== Box Mode =====

    void testTinyDragIsDiscarded()
    {
        StrokeFixture f;
        QVERIFY(f.start());
        QTRY_VERIFY(!f.surfaces.isRendering());

        QSignalSpy committed(&f.engine, &StrokeEngine::shapeCommitted);
        const ToolState tool = highlighter();
        QVERIFY(f.engine.pointerDown(0, QPointF(10, 10), tool));
        QVERIFY(f.engine.pointerUp(0, QPointF(12, 12), tool));

        QCOMPARE(committed.count(), 0);
        QVERIFY(f.store.isEmpty());
        QVERIFY(!f.engine.isActive());
        QVERIFY(f.engine.previewRect().isEmpty());
    }

    void testDragCommitsOneShape()
    {
        StrokeFixture f;
        QVERIFY(f.start());
        QTRY_VERIFY(!f.surfaces.isRendering());

        QSignalSpy preview(&f.engine, &StrokeEngine::previewChanged);
        QSignalSpy overlay(&f.engine, &StrokeEngine::overlayChanged);
        const ToolState tool = highlighter();

        QVERIFY(f.engine.pointerDown(0, QPointF(20, 20), tool));
        QVERIFY(f.engine.pointerMove(0, QPointF(25, 25), tool));
        QCOMPARE(f.engine.previewRect(), QRectF(20, 20, 5, 5));
        QVERIFY(f.engine.pointerUp(0, QPointF(30, 30), tool));

        QCOMPARE(f.store.shapeCount(0), 1);
        const HighlightShape shape = f.store.shapes(0).first();
        QCOMPARE(shape.rect, QRectF(0.1, 0.2, 0.05, 0.1));
        QCOMPARE(shape.color, QColor(0xff, 0xeb, 0x3b));
        QCOMPARE(shape.opacity, 0.35);
        QVERIFY(preview.count() >= 3);
        QCOMPARE(overlay.count(), 1);

        // Painted with the stored opacity
        QVERIFY(qAbs(qAlpha(f.overlay().pixel(25, 25)) - 89) <= 1);
        QCOMPARE(qAlpha(f.overlay().pixel(35, 35)), 0);
    }

    void testNearHorizontalDragFloorsHeight()
    {
        StrokeFixture f;
        QVERIFY(f.start());
        QTRY_VERIFY(!f.surfaces.isRendering());

        const ToolState tool = highlighter();
        f.engine.pointerDown(0, QPointF(20, 50), tool);
        f.engine.pointerUp(0, QPointF(120, 52), tool);

        QCOMPARE(f.store.shapeCount(0), 1);
        QCOMPARE(f.store.shapes(0).first().rect, QRectF(0.1, 0.5, 0.5, 0.14));
    }

    void testCommitClampsToPage()
    {
        StrokeFixture f;
        QVERIFY(f.start());
        QTRY_VERIFY(!f.surfaces.isRendering());

        const ToolState tool = highlighter();
        f.engine.pointerDown(0, QPointF(150, 40), tool);
        f.engine.pointerMove(0, QPointF(260, 70), tool);

        // The preview is clamped the same way as the committed box
        QCOMPARE(f.engine.previewRect(), QRectF(150, 40, 50, 30));

        f.engine.pointerUp(0, QPointF(260, 70), tool);

        QCOMPARE(f.store.shapes(0).first().rect, QRectF(0.75, 0.4, 0.25, 0.3));
    }

    void testOpacityIsCapped()
    {
        StrokeFixture f;
        QVERIFY(f.start());
        QTRY_VERIFY(!f.surfaces.isRendering());

        ToolState tool = highlighter();
        tool.opacity = 0.9;
        QCOMPARE(f.engine.effectiveOpacity(tool), 0.35);

        f.engine.pointerDown(0, QPointF(10, 10), tool);
        f.engine.pointerUp(0, QPointF(60, 60), tool);
        QCOMPARE(f.store.shapes(0).first().opacity, 0.35);
    }

    void testPointerLeaveCommits()
    {
        StrokeFixture f;
        QVERIFY(f.start());
        QTRY_VERIFY(!f.surfaces.isRendering());

        const ToolState tool = highlighter();
        f.engine.pointerDown(0, QPointF(10, 10), tool);
        f.engine.pointerMove(0, QPointF(50, 40), tool);
        QVERIFY(f.engine.pointerLeave(0, tool));

        QCOMPARE(f.store.shapeCount(0), 1);
        QCOMPARE(f.store.shapes(0).first().rect, QRectF(0.05, 0.1, 0.2, 0.3));
        QVERIFY(!f.engine.pointerLeave(0, tool));
    }

    void testEventsForOtherPagesAreIgnored()
    {
        StrokeFixture f;
        QVERIFY(f.start());
        QTRY_VERIFY(!f.surfaces.isRendering());

        const ToolState tool = highlighter();
        QVERIFY(!f.engine.pointerDown(5, QPointF(10, 10), tool));   // No such surface
        QVERIFY(f.engine.pointerDown(0, QPointF(10, 10), tool));
        QVERIFY(!f.engine.pointerMove(1, QPointF(40, 40), tool));
        QVERIFY(!f.engine.pointerUp(1, QPointF(40, 40), tool));
        QVERIFY(f.engine.isActive());

        // A new press drops the dangling drag without committing it
        QVERIFY(f.engine.pointerDown(1, QPointF(10, 10), tool));
        QCOMPARE(f.engine.activePage(), 1);
        QVERIFY(f.store.isEmpty());
    }

    void testEraserRemovesHitShape()
    {
        StrokeFixture f;
        QVERIFY(f.start());
        QTRY_VERIFY(!f.surfaces.isRendering());

        const HighlightShape a = HighlightShape::create(0, QRectF(0.1, 0.1, 0.2, 0.05), Qt::yellow, 0.35);
        const HighlightShape b = HighlightShape::create(0, QRectF(0.5, 0.5, 0.1, 0.1), Qt::yellow, 0.35);
        f.store.append(0, a);
        f.store.append(0, b);
        QVERIFY(qAlpha(f.overlay().pixel(30, 12)) > 0);

        QSignalSpy erased(&f.engine, &StrokeEngine::shapeErased);

        // Normalized (0.15, 0.12) on a 200x100 page
        QVERIFY(f.engine.pointerDown(0, QPointF(30, 12), eraser()));
        QVERIFY(!f.engine.isActive());

        QCOMPARE(erased.count(), 1);
        QCOMPARE(erased.at(0).at(1).toString(), a.id);
        QCOMPARE(f.store.shapeCount(0), 1);
        QCOMPARE(f.store.shapes(0).first().id, b.id);
        QCOMPARE(qAlpha(f.overlay().pixel(30, 12)), 0);
        QVERIFY(qAlpha(f.overlay().pixel(110, 55)) > 0);

        // Empty spot: nothing happens
        f.engine.pointerDown(0, QPointF(190, 5), eraser());
        QCOMPARE(erased.count(), 1);
    }

    void testRepaintIsIdempotent()
    {
        StrokeFixture f;
        QVERIFY(f.start());
        QTRY_VERIFY(!f.surfaces.isRendering());

        f.store.append(0, HighlightShape::create(0, QRectF(0.1, 0.1, 0.5, 0.5), QColor("#90caf9"), 0.3));
        f.store.append(0, HighlightShape::create(0, QRectF(0.3, 0.3, 0.5, 0.5), QColor("#f48fb1"), 0.3));

        const QImage once = f.overlay().copy();
        f.engine.repaintPage(0);
        f.engine.repaintPage(0);
        QCOMPARE(f.overlay(), once);
    }

    void testLaterShapesPaintOver()
    {
        StrokeFixture f;
        QVERIFY(f.start());
        QTRY_VERIFY(!f.surfaces.isRendering());

        const QColor first(0x90, 0xca, 0xf9);
        const QColor second(0xf4, 0x8f, 0xb1);
        f.store.append(0, HighlightShape::create(0, QRectF(0.1, 0.1, 0.5, 0.5), first, 0.3));
        f.store.append(0, HighlightShape::create(0, QRectF(0.3, 0.3, 0.5, 0.5), second, 0.3));

        // Reference: the same two fills source-over in insertion order
        QImage expected(1, 1, QImage::Format_ARGB32_Premultiplied);
        expected.fill(Qt::transparent);
        {
            QPainter painter(&expected);
            QColor a = first;
            a.setAlphaF(0.3);
            QColor b = second;
            b.setAlphaF(0.3);
            painter.fillRect(0, 0, 1, 1, a);
            painter.fillRect(0, 0, 1, 1, b);
        }

        const QRgb overlap = f.overlay().pixel(80, 40);
        const QRgb reference = expected.pixel(0, 0);
        QVERIFY(qAbs(qRed(overlap) - qRed(reference)) <= 1);
        QVERIFY(qAbs(qGreen(overlap) - qGreen(reference)) <= 1);
        QVERIFY(qAbs(qBlue(overlap) - qBlue(reference)) <= 1);
        QVERIFY(qAbs(qAlpha(overlap) - qAlpha(reference)) <= 1);
    }

    void testShapesFollowZoom()
    {
        StrokeFixture f;
        QVERIFY(f.start(1.0));
        QTRY_VERIFY(!f.surfaces.isRendering());

        const ToolState tool = highlighter();
        f.engine.pointerDown(0, QPointF(40, 20), tool);
        f.engine.pointerUp(0, QPointF(80, 60), tool);
        const QRectF normalized = f.store.shapes(0).first().rect;

        f.surfaces.renderAll(2.0);
        QTRY_VERIFY(!f.surfaces.isRendering());

        QCOMPARE(f.store.shapes(0).first().rect, normalized);
        QCOMPARE(f.overlay().size(), QSize(400, 200));
        QVERIFY(qAlpha(f.overlay().pixel(82, 42)) > 0);
        QVERIFY(qAlpha(f.overlay().pixel(158, 118)) > 0);
        QCOMPARE(qAlpha(f.overlay().pixel(78, 38)), 0);
        QCOMPARE(qAlpha(f.overlay().pixel(162, 122)), 0);

        // Input after the zoom maps through the new geometry
        f.engine.pointerDown(0, QPointF(40, 20), tool);
        f.engine.pointerUp(0, QPointF(80, 60), tool);
        QCOMPARE(f.store.shapes(0).last().rect, QRectF(0.1, 0.1, 0.1, 0.2));
    }

    void testModeChangeCancelsStroke()
    {
        StrokeFixture f;
        QVERIFY(f.start());
        QTRY_VERIFY(!f.surfaces.isRendering());

        f.engine.pointerDown(0, QPointF(10, 10), highlighter());
        f.engine.setMode(AnnotationMode::Freehand);
        QVERIFY(!f.engine.isActive());
        QVERIFY(f.store.isEmpty());
    }

    // ===== Freehand Mode =====

    void testToolChangeMidStroke()
    {
        StrokeFixture f;
        f.engine.setMode(AnnotationMode::Freehand);
        QVERIFY(f.start());
        QTRY_VERIFY(!f.surfaces.isRendering());

        QSignalSpy overlay(&f.engine, &StrokeEngine::overlayChanged);
        ToolState tool = highlighter(Qt::red);
        tool.thickness = 10.0;

        f.engine.pointerDown(0, QPointF(10, 50), tool);
        f.engine.pointerMove(0, QPointF(50, 50), tool);
        tool.color = Qt::blue;
        f.engine.pointerMove(0, QPointF(90, 50), tool);
        f.engine.pointerUp(0, QPointF(90, 50), tool);
        QVERIFY(!f.engine.isActive());
        QCOMPARE(overlay.count(), 2);

        const QRgb early = f.overlay().pixel(30, 50);
        const QRgb late = f.overlay().pixel(70, 50);
        QVERIFY(qRed(early) > 0 && qBlue(early) == 0);
        QVERIFY(qBlue(late) > 0 && qRed(late) == 0);

        // Source compositing: the stroke alpha never exceeds its opacity
        QVERIFY(qAbs(qAlpha(early) - 89) <= 1);
        QVERIFY(qAbs(qAlpha(f.overlay().pixel(50, 50)) - 89) <= 1);

        // Freehand strokes never reach the store
        QVERIFY(f.store.isEmpty());
    }

    void testThicknessScalesWithRatio()
    {
        StrokeFixture f;
        f.engine.setMode(AnnotationMode::Freehand);
        QVERIFY(f.start(1.0, 2.0));
        QTRY_VERIFY(!f.surfaces.isRendering());
        QCOMPARE(f.overlay().size(), QSize(400, 200));

        ToolState tool = highlighter(Qt::red);
        tool.thickness = 10.0;
        f.engine.pointerDown(0, QPointF(20, 50), tool);
        f.engine.pointerUp(0, QPointF(180, 50), tool);

        // 10 logical px = 20 device px, centered on device y = 100
        QVERIFY(qAlpha(f.overlay().pixel(200, 100)) > 0);
        QVERIFY(qAlpha(f.overlay().pixel(200, 108)) > 0);
        QCOMPARE(qAlpha(f.overlay().pixel(200, 113)), 0);
        QCOMPARE(qAlpha(f.overlay().pixel(200, 87)), 0);
    }

    void testFreehandEraserClearsPixels()
    {
        StrokeFixture f;
        f.engine.setMode(AnnotationMode::Freehand);
        QVERIFY(f.start());
        QTRY_VERIFY(!f.surfaces.isRendering());

        ToolState tool = highlighter(Qt::red);
        f.engine.pointerDown(0, QPointF(20, 50), tool);
        f.engine.pointerUp(0, QPointF(180, 50), tool);
        QVERIFY(qAlpha(f.overlay().pixel(100, 50)) > 0);

        ToolState rubber = eraser();
        rubber.thickness = 30.0;
        f.engine.pointerDown(0, QPointF(60, 50), rubber);
        f.engine.pointerUp(0, QPointF(140, 50), rubber);

        QCOMPARE(qAlpha(f.overlay().pixel(100, 50)), 0);
        QCOMPARE(qAlpha(f.overlay().pixel(100, 45)), 0);
        QVERIFY(qAlpha(f.overlay().pixel(30, 50)) > 0);
        QVERIFY(qAlpha(f.overlay().pixel(170, 50)) > 0);
    }

    void testFreehandOverlaySurvivesZoom()
    {
        StrokeFixture f;
        f.engine.setMode(AnnotationMode::Freehand);
        QVERIFY(f.start(1.0));
        QTRY_VERIFY(!f.surfaces.isRendering());

        ToolState tool = highlighter(Qt::red);
        f.engine.pointerDown(0, QPointF(20, 50), tool);
        f.engine.pointerUp(0, QPointF(180, 50), tool);

        f.surfaces.renderAll(2.0);
        QTRY_VERIFY(!f.surfaces.isRendering());
        QVERIFY(qAlpha(f.overlay().pixel(200, 100)) > 0);
        QCOMPARE(qAlpha(f.overlay().pixel(200, 10)), 0);
    }
};

inline int runStrokeEngineTests()
{
    StrokeEngineTests tests;
    return QTest::qExec(&tests);
}
