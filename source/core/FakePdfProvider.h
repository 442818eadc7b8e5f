#pragma once

// ============================================================================
// FakePdfProvider - In-memory PdfProvider for tests
// ============================================================================
// Accepts only the bytes FakePdfProvider::documentBytes() and renders every
// page as a plain paper-colored image of the requested resolution. A shared
// FakeRenderControl lets a test slow renders down, make pages fail and count
// renders, from the GUI thread while workers are running.
// ============================================================================

#include "../pdf/PdfProvider.h"

#include <QImage>
#include <QMutex>
#include <QMutexLocker>
#include <QSet>
#include <QThread>
#include <QVector>
#include <QtMath>

#include <atomic>
#include <memory>

struct FakeRenderControl {
    QVector<QSizeF> pageSizes { QSizeF(612.0, 792.0), QSizeF(612.0, 792.0) };
    QColor paper = Qt::white;
    std::atomic<int> delayMs { 0 };
    std::atomic<int> renderCount { 0 };

    void setFailing(int pageIndex, bool failing)
    {
        QMutexLocker locker(&mutex);
        if (failing) {
            failingPages.insert(pageIndex);
        } else {
            failingPages.remove(pageIndex);
        }
    }

    bool isFailing(int pageIndex) const
    {
        QMutexLocker locker(&mutex);
        return failingPages.contains(pageIndex);
    }

private:
    mutable QMutex mutex;
    QSet<int> failingPages;
};

class FakePdfProvider : public PdfProvider {
public:
    explicit FakePdfProvider(std::shared_ptr<FakeRenderControl> control)
        : m_control(std::move(control))
    {
    }

    static QByteArray documentBytes() { return QByteArrayLiteral("%PDF-FAKE\n"); }

    /**
     * @brief Factory accepting only documentBytes().
     */
    static PdfProviderFactory factory(std::shared_ptr<FakeRenderControl> control)
    {
        return [control](const QByteArray& data) -> std::unique_ptr<PdfProvider> {
            if (data != documentBytes()) {
                return nullptr;
            }
            return std::unique_ptr<PdfProvider>(new FakePdfProvider(control));
        };
    }

    bool isValid() const override { return true; }
    int pageCount() const override { return m_control->pageSizes.size(); }

    QSizeF pageSize(int pageIndex) const override
    {
        if (pageIndex < 0 || pageIndex >= m_control->pageSizes.size()) {
            return QSizeF();
        }
        return m_control->pageSizes.at(pageIndex);
    }

    QImage renderPageToImage(int pageIndex, qreal dpi) const override
    {
        const int delay = m_control->delayMs.load();
        if (delay > 0) {
            QThread::msleep(static_cast<unsigned long>(delay));
        }
        m_control->renderCount.fetch_add(1);

        if (m_control->isFailing(pageIndex)) {
            return QImage();
        }

        const QSizeF size = pageSize(pageIndex);
        QImage image(qCeil(size.width() * dpi / 72.0), qCeil(size.height() * dpi / 72.0),
                     QImage::Format_ARGB32);
        image.fill(m_control->paper);
        return image;
    }

private:
    std::shared_ptr<FakeRenderControl> m_control;
};
