#pragma once

// ============================================================================
// AnnotationStoreTests - Shape sequences, hit-testing and change signals
// ============================================================================
// Run with: pdfhighlighter --test-store
// ============================================================================

#include "AnnotationStore.h"

#include <QObject>
#include <QSignalSpy>
#include <QTest>

class AnnotationStoreTests : public QObject {
    Q_OBJECT

private:
    static HighlightShape shape(qreal x, qreal y, qreal w, qreal h, const QColor& color = QColor("#ffeb3b"))
    {
        return HighlightShape::create(0, QRectF(x, y, w, h), color, 0.35);
    }

private slots:
    void testCreateAssignsUniqueIds()
    {
        const HighlightShape a = shape(0.1, 0.1, 0.2, 0.2);
        const HighlightShape b = shape(0.1, 0.1, 0.2, 0.2);
        QVERIFY(!a.id.isEmpty());
        QVERIFY(!a.id.startsWith('{'));
        QVERIFY(a.id != b.id);
    }

    void testCreateDropsColorAlpha()
    {
        const HighlightShape s = HighlightShape::create(0, QRectF(0, 0, 1, 1), QColor(10, 20, 30, 40), 0.2);
        QCOMPARE(s.color.alpha(), 255);
        QVERIFY(qAbs(s.fillColor().alphaF() - s.opacity) < 0.01);
    }

    void testAppendKeepsInsertionOrder()
    {
        AnnotationStore store;
        QSignalSpy spy(&store, &AnnotationStore::pageChanged);

        const HighlightShape first = shape(0.1, 0.1, 0.2, 0.2);
        const HighlightShape second = shape(0.5, 0.5, 0.1, 0.1);
        store.append(2, first);
        store.append(2, second);

        const QVector<HighlightShape> shapes = store.shapes(2);
        QCOMPARE(shapes.size(), 2);
        QCOMPARE(shapes[0].id, first.id);
        QCOMPARE(shapes[1].id, second.id);
        QCOMPARE(shapes[0].pageIndex, 2);   // Overwritten from the create() value

        QCOMPARE(spy.count(), 2);
        QCOMPARE(spy.at(0).at(0).toInt(), 2);
        QVERIFY(store.shapes(0).isEmpty());
    }

    void testRemove()
    {
        AnnotationStore store;
        const HighlightShape a = shape(0.1, 0.1, 0.2, 0.2);
        const HighlightShape b = shape(0.3, 0.3, 0.2, 0.2);
        store.append(0, a);
        store.append(0, b);

        QSignalSpy spy(&store, &AnnotationStore::pageChanged);
        QVERIFY(!store.remove(0, QStringLiteral("missing")));
        QVERIFY(!store.remove(1, a.id));
        QCOMPARE(spy.count(), 0);

        QVERIFY(store.remove(0, a.id));
        QCOMPARE(spy.count(), 1);
        QCOMPARE(store.shapeCount(0), 1);
        QCOMPARE(store.shapes(0).first().id, b.id);

        QVERIFY(store.remove(0, b.id));
        QVERIFY(store.isEmpty());
        QVERIFY(store.pagesWithShapes().isEmpty());
    }

    void testHitTestTopmostAndInclusiveEdges()
    {
        AnnotationStore store;
        const HighlightShape below = shape(0.1, 0.1, 0.4, 0.4);
        const HighlightShape above = shape(0.2, 0.2, 0.1, 0.1);
        store.append(0, below);
        store.append(0, above);

        const HighlightShape* hit = store.hitTest(0, QPointF(0.25, 0.25));
        QVERIFY(hit);
        QCOMPARE(hit->id, above.id);

        hit = store.hitTest(0, QPointF(0.45, 0.45));
        QVERIFY(hit);
        QCOMPARE(hit->id, below.id);

        // Edges count as inside
        hit = store.hitTest(0, QPointF(0.5, 0.1));
        QVERIFY(hit);
        QCOMPARE(hit->id, below.id);

        QVERIFY(!store.hitTest(0, QPointF(0.9, 0.9)));
        QVERIFY(!store.hitTest(1, QPointF(0.25, 0.25)));
    }

    void testClear()
    {
        AnnotationStore store;
        store.append(0, shape(0.1, 0.1, 0.2, 0.2));
        store.append(4, shape(0.1, 0.1, 0.2, 0.2));
        store.append(1, shape(0.1, 0.1, 0.2, 0.2));
        QCOMPARE(store.totalShapeCount(), 3);
        QCOMPARE(store.pagesWithShapes(), QVector<int>({0, 1, 4}));

        QSignalSpy spy(&store, &AnnotationStore::cleared);
        store.clear();
        QCOMPARE(spy.count(), 1);
        QVERIFY(store.isEmpty());
        QCOMPARE(store.shapeCount(4), 0);
    }
};

inline int runAnnotationStoreTests()
{
    AnnotationStoreTests tests;
    return QTest::qExec(&tests);
}
