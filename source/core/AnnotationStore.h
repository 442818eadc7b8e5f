#pragma once

// ============================================================================
// AnnotationStore - Per-page ordered highlight shapes for the open document
// ============================================================================
// Pure state container for the box annotation model. Insertion order is paint
// order: later shapes draw over earlier ones. Shapes are never mutated in
// place - only appended or removed.
//
// Created empty when a document opens and cleared when it is replaced. All
// mutations happen on the GUI thread; listeners repaint only the page named
// in pageChanged().
// ============================================================================

#include "HighlightShape.h"

#include <QHash>
#include <QObject>
#include <QPointF>
#include <QVector>

class AnnotationStore : public QObject {
    Q_OBJECT

public:
    explicit AnnotationStore(QObject* parent = nullptr);

    /**
     * @brief Shapes of a page in paint order (empty if none).
     */
    QVector<HighlightShape> shapes(int pageIndex) const;

    /**
     * @brief Append a shape to its page (shape.pageIndex is overwritten).
     */
    void append(int pageIndex, const HighlightShape& shape);

    /**
     * @brief Remove a shape by id.
     * @return True if the shape existed.
     */
    bool remove(int pageIndex, const QString& shapeId);

    /**
     * @brief Drop every shape on every page.
     */
    void clear();

    /**
     * @brief Topmost (most recently inserted) shape containing the point.
     * @param normalizedPoint Point in normalized page coordinates.
     * @return Pointer into the store, or nullptr on miss. Invalidated by the
     *         next mutation.
     */
    const HighlightShape* hitTest(int pageIndex, const QPointF& normalizedPoint) const;

    int shapeCount(int pageIndex) const;
    int totalShapeCount() const;
    bool isEmpty() const { return totalShapeCount() == 0; }

    /**
     * @brief Pages that currently hold at least one shape, ascending.
     */
    QVector<int> pagesWithShapes() const;

signals:
    /**
     * @brief Emitted after a page's shape sequence changed.
     */
    void pageChanged(int pageIndex);

    /**
     * @brief Emitted after clear().
     */
    void cleared();

private:
    QHash<int, QVector<HighlightShape>> m_shapes;   ///< pageIndex -> shapes in paint order
};
