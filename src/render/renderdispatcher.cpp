/*
 * renderdispatcher.cpp - Single point of contact with the rendering service
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "renderdispatcher.h"
#include "blockparser.h"

#include <QDeadlineTimer>
#include <QDebug>
#include <QMutexLocker>
#include <QThread>

#include <algorithm>

RenderDispatcher::RenderDispatcher(std::shared_ptr<Renderer> renderer, const Options &options)
    : m_renderer(std::move(renderer))
    , m_options(options)
{
    m_options.concurrency = std::max(m_options.concurrency, 1);
    m_options.labelCap = std::max(m_options.labelCap, 1);
    m_options.minIntervalMs = std::max(m_options.minIntervalMs, 0);

    for (int i = 0; i < m_options.concurrency; ++i) {
        std::unique_ptr<QThread> thread(QThread::create([this] { workerLoop(); }));
        thread->setObjectName(QStringLiteral("render-worker-%1").arg(i));
        thread->start();
        m_workers.push_back(std::move(thread));
    }
    qInfo() << "RenderDispatcher: started" << m_options.concurrency << "worker(s) for"
            << m_renderer->name() << "cap=" << m_options.labelCap
            << "minIntervalMs=" << m_options.minIntervalMs;
}

RenderDispatcher::~RenderDispatcher()
{
    std::map<QueueKey, QueueItem> abandoned;
    {
        QMutexLocker lock(&m_mutex);
        m_stopping = true;
        abandoned.swap(m_pending);
        m_wake.wakeAll();
    }

    RenderResult shutdown;
    shutdown.status = RenderResult::Shutdown;
    shutdown.errorMessage = QStringLiteral("Render dispatcher shut down");
    for (auto &entry : abandoned) {
        entry.second.promise.addResult(shutdown);
        entry.second.promise.finish();
    }
    if (!abandoned.empty())
        qWarning() << "RenderDispatcher: dropped" << abandoned.size() << "pending call(s) on shutdown";

    // In-flight calls complete before their worker exits
    for (auto &thread : m_workers)
        thread->wait();
}

QFuture<RenderResult> RenderDispatcher::resolved(const RenderResult &result)
{
    QPromise<RenderResult> promise;
    QFuture<RenderResult> future = promise.future();
    promise.start();
    promise.addResult(result);
    promise.finish();
    return future;
}

QFuture<RenderResult> RenderDispatcher::enqueue(const QString &jobId, const QString &userId,
                                                PlanTier tier, const QString &payload,
                                                LabelSize labelSize, int labelCount)
{
    // Second line of defence against a chunking bug: count what is
    // actually in the payload rather than trusting labelCount.
    const int blocks = BlockParser::countBlockStarts(payload);
    if (blocks > m_options.labelCap) {
        qCritical() << "RenderDispatcher: job" << jobId << "payload holds" << blocks
                    << "labels, cap is" << m_options.labelCap
                    << "size=" << LabelSizes::toString(labelSize);
        RenderResult rejected;
        rejected.status = RenderResult::PayloadTooLarge;
        rejected.errorMessage = QStringLiteral("%1 labels exceed the limit of %2 per request")
                                    .arg(blocks)
                                    .arg(m_options.labelCap);
        return resolved(rejected);
    }

    QueueItem item;
    item.jobId = jobId;
    item.userId = userId;
    item.tier = tier;
    item.payload = payload;
    item.labelSize = labelSize;
    item.labelCount = labelCount;
    item.promise.start();
    QFuture<RenderResult> future = item.promise.future();

    {
        QMutexLocker lock(&m_mutex);
        if (m_stopping) {
            lock.unlock();
            RenderResult shutdown;
            shutdown.status = RenderResult::Shutdown;
            shutdown.errorMessage = QStringLiteral("Render dispatcher shut down");
            item.promise.addResult(shutdown);
            item.promise.finish();
            return future;
        }
        QueueKey key{PlanTiers::priorityRank(tier), m_arrivalCounter++};
        m_pending.emplace(key, std::move(item));
        m_wake.wakeOne();
    }

    qDebug() << "RenderDispatcher: queued job" << jobId << "tier=" << PlanTiers::toString(tier)
             << "labels=" << labelCount;
    return future;
}

void RenderDispatcher::workerLoop()
{
    for (;;) {
        QueueItem item;
        {
            QMutexLocker lock(&m_mutex);
            for (;;) {
                if (m_stopping)
                    return;
                if (m_pending.empty()) {
                    m_wake.wait(&m_mutex);
                    continue;
                }
                if (m_lastAdmission.isValid()) {
                    const qint64 waitMs = m_options.minIntervalMs - m_lastAdmission.elapsed();
                    if (waitMs > 0) {
                        // Re-evaluate the head after waiting: a higher tier
                        // may have arrived in the meantime.
                        m_wake.wait(&m_mutex, QDeadlineTimer(waitMs));
                        continue;
                    }
                }
                break;
            }

            auto head = m_pending.begin();
            item = std::move(head->second);
            m_pending.erase(head);
            m_inFlight[item.jobId] += 1;
            m_inFlightTotal++;
            m_lastAdmission.start();
        }

        process(item);

        {
            QMutexLocker lock(&m_mutex);
            auto it = m_inFlight.find(item.jobId);
            if (it != m_inFlight.end() && --it.value() <= 0)
                m_inFlight.erase(it);
            m_inFlightTotal--;
        }
    }
}

void RenderDispatcher::process(QueueItem &item)
{
    RenderResult result = m_renderer->render(item.payload, item.labelSize);

    if (!result.ok()) {
        if (result.status == RenderResult::PayloadTooLarge) {
            qCritical() << "RenderDispatcher: renderer refused job" << item.jobId
                        << "as too large, labels=" << item.labelCount
                        << "size=" << LabelSizes::toString(item.labelSize)
                        << "status=" << result.httpStatus;
        } else {
            qWarning() << "RenderDispatcher: render failed for job" << item.jobId
                       << "size=" << LabelSizes::toString(item.labelSize)
                       << "status=" << result.httpStatus
                       << "error=" << result.errorMessage;
        }
    }

    m_stats.record(result, item.labelCount);

    item.promise.addResult(result);
    item.promise.finish();
}

RenderDispatcher::QueuePosition RenderDispatcher::queuePosition(const QString &jobId) const
{
    QMutexLocker lock(&m_mutex);

    QueuePosition pos;
    pos.jobId = jobId;
    int rank = 0;
    for (const auto &entry : m_pending) {
        ++rank;
        pos.queuedByTier[entry.second.tier] += 1;
        if (pos.position == 0 && entry.second.jobId == jobId)
            pos.position = rank;
    }

    if (pos.position > 0) {
        pos.state = QueuePosition::Queued;
        const int rounds = (pos.position + m_options.concurrency - 1) / m_options.concurrency;
        pos.estimatedWaitSeconds = rounds * m_options.estimatedSecondsPerCall;
    } else if (m_inFlight.contains(jobId)) {
        pos.state = QueuePosition::Processing;
    }
    return pos;
}

RenderDispatcher::QueueStats RenderDispatcher::queueStats() const
{
    QMutexLocker lock(&m_mutex);

    QueueStats stats;
    stats.totalQueued = static_cast<int>(m_pending.size());
    stats.inFlight = m_inFlightTotal;
    stats.concurrency = m_options.concurrency;
    for (const auto &entry : m_pending)
        stats.queuedByTier[entry.second.tier] += 1;
    return stats;
}
