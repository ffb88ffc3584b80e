/*
 * renderdispatcher.h - Single point of contact with the rendering service
 *
 * Every render call in the process goes through one dispatcher. Pending
 * calls are ordered by (plan tier rank, arrival sequence): a higher tier is
 * always admitted first, and within a tier calls are served in arrival
 * order. At most `concurrency` calls are in flight and consecutive
 * admissions are spaced by at least `minIntervalMs`.
 *
 * Failures are reported, never retried here. A caller that wants a retry
 * enqueues again and takes a new place in line.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef ZPLFORGE_RENDERDISPATCHER_H
#define ZPLFORGE_RENDERDISPATCHER_H

#include <QElapsedTimer>
#include <QFuture>
#include <QHash>
#include <QMap>
#include <QMutex>
#include <QPromise>
#include <QString>
#include <QWaitCondition>

#include <map>
#include <memory>
#include <vector>

#include "labelsize.h"
#include "plantier.h"
#include "renderer.h"
#include "rendererstats.h"

class QThread;

class RenderDispatcher
{
public:
    struct Options {
        int labelCap = 50;
        int concurrency = 1;
        int minIntervalMs = 1000;
        int estimatedSecondsPerCall = 2;
    };

    struct QueuePosition {
        enum State { Queued, Processing, NotFound };

        QString jobId;
        State state = NotFound;
        int position = 0;               // 1-based among all pending calls
        int estimatedWaitSeconds = 0;
        QMap<PlanTier, int> queuedByTier;
    };

    struct QueueStats {
        int totalQueued = 0;
        int inFlight = 0;
        int concurrency = 0;
        QMap<PlanTier, int> queuedByTier;
    };

    RenderDispatcher(std::shared_ptr<Renderer> renderer, const Options &options);
    ~RenderDispatcher();

    RenderDispatcher(const RenderDispatcher &) = delete;
    RenderDispatcher &operator=(const RenderDispatcher &) = delete;

    // The future resolves once the renderer has answered. A payload holding
    // more blocks than labelCap resolves immediately with PayloadTooLarge
    // and never reaches the renderer.
    QFuture<RenderResult> enqueue(const QString &jobId, const QString &userId,
                                  PlanTier tier, const QString &payload,
                                  LabelSize labelSize, int labelCount);

    // Read-only snapshot; the first pending call of the job decides its rank
    QueuePosition queuePosition(const QString &jobId) const;
    QueueStats queueStats() const;

    RendererStats::Summary stats() const { return m_stats.summary(); }
    const Options &options() const { return m_options; }

private:
    struct QueueKey {
        int rank = 0;
        quint64 arrival = 0;
        bool operator<(const QueueKey &o) const
        {
            return rank != o.rank ? rank < o.rank : arrival < o.arrival;
        }
    };

    struct QueueItem {
        QString jobId;
        QString userId;
        PlanTier tier = PlanTier::Free;
        QString payload;
        LabelSize labelSize = LabelSize::TwoByOne;
        int labelCount = 0;
        QPromise<RenderResult> promise;
    };

    void workerLoop();
    void process(QueueItem &item);
    static QFuture<RenderResult> resolved(const RenderResult &result);

    std::shared_ptr<Renderer> m_renderer;
    Options m_options;
    RendererStats m_stats;

    mutable QMutex m_mutex;
    QWaitCondition m_wake;
    std::map<QueueKey, QueueItem> m_pending;
    QHash<QString, int> m_inFlight;     // jobId -> calls in flight
    int m_inFlightTotal = 0;
    quint64 m_arrivalCounter = 0;
    QElapsedTimer m_lastAdmission;
    bool m_stopping = false;

    std::vector<std::unique_ptr<QThread>> m_workers;
};

#endif // ZPLFORGE_RENDERDISPATCHER_H
