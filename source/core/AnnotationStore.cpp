// ============================================================================
// AnnotationStore - Implementation
// ============================================================================

#include "AnnotationStore.h"

#include <QDebug>

#include <algorithm>

AnnotationStore::AnnotationStore(QObject* parent)
    : QObject(parent)
{
}

QVector<HighlightShape> AnnotationStore::shapes(int pageIndex) const
{
    return m_shapes.value(pageIndex);
}

void AnnotationStore::append(int pageIndex, const HighlightShape& shape)
{
    HighlightShape stored = shape;
    stored.pageIndex = pageIndex;
    m_shapes[pageIndex].append(stored);
    emit pageChanged(pageIndex);
}

bool AnnotationStore::remove(int pageIndex, const QString& shapeId)
{
    auto it = m_shapes.find(pageIndex);
    if (it == m_shapes.end()) {
        return false;
    }

    QVector<HighlightShape>& list = it.value();
    for (int i = list.size() - 1; i >= 0; --i) {
        if (list[i].id == shapeId) {
            list.removeAt(i);
            if (list.isEmpty()) {
                m_shapes.erase(it);
            }
            emit pageChanged(pageIndex);
            return true;
        }
    }
    return false;
}

void AnnotationStore::clear()
{
    const bool hadShapes = !m_shapes.isEmpty();
    m_shapes.clear();
    if (hadShapes) {
        qDebug() << "[AnnotationStore] Cleared";
    }
    emit cleared();
}

const HighlightShape* AnnotationStore::hitTest(int pageIndex, const QPointF& normalizedPoint) const
{
    auto it = m_shapes.constFind(pageIndex);
    if (it == m_shapes.constEnd()) {
        return nullptr;
    }

    // Walk from the top of the paint order so the visible shape wins
    const QVector<HighlightShape>& list = it.value();
    for (int i = list.size() - 1; i >= 0; --i) {
        if (list[i].contains(normalizedPoint)) {
            return &list[i];
        }
    }
    return nullptr;
}

int AnnotationStore::shapeCount(int pageIndex) const
{
    return m_shapes.value(pageIndex).size();
}

int AnnotationStore::totalShapeCount() const
{
    int total = 0;
    for (auto it = m_shapes.constBegin(); it != m_shapes.constEnd(); ++it) {
        total += it.value().size();
    }
    return total;
}

QVector<int> AnnotationStore::pagesWithShapes() const
{
    QVector<int> pages;
    for (auto it = m_shapes.constBegin(); it != m_shapes.constEnd(); ++it) {
        if (!it.value().isEmpty()) {
            pages.append(it.key());
        }
    }
    std::sort(pages.begin(), pages.end());
    return pages;
}
