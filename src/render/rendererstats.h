/*
 * rendererstats.h - Call statistics for the rendering service
 *
 * Aggregated per UTC hour. Thread-safe; recording never fails the caller.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef ZPLFORGE_RENDERERSTATS_H
#define ZPLFORGE_RENDERERSTATS_H

#include <QDateTime>
#include <QList>
#include <QMap>
#include <QMutex>
#include <QString>

#include "renderer.h"

class RendererStats
{
public:
    struct Bucket {
        QString hourKey;            // "2026-10-19T14" (UTC)
        int totalCalls = 0;
        int successCount = 0;
        int errorCount = 0;
        int payloadTooLargeHits = 0;
        int rateLimitHits = 0;      // HTTP 429
        qint64 totalResponseTimeMs = 0;
        int minResponseTimeMs = 0;
        int maxResponseTimeMs = 0;
        int labelCount = 0;         // labels in successful calls
    };

    struct Summary {
        int totalCalls = 0;
        double avgResponseTimeMs = 0.0;
        double errorRate = 0.0;     // percent
        double rateLimitRate = 0.0; // percent
        QString peakHour;
        int peakCallCount = 0;
        int totalLabelsRendered = 0;
    };

    // Drops buckets older than this many hours
    explicit RendererStats(int retentionHours = 24 * 7);

    void record(const RenderResult &result, int labelCount,
                const QDateTime &when = QDateTime::currentDateTimeUtc());

    QList<Bucket> buckets() const;
    Summary summary() const;

private:
    static QString hourKey(const QDateTime &when);

    int m_retentionHours;
    QMap<QString, Bucket> m_buckets;
    mutable QMutex m_mutex;
};

#endif // ZPLFORGE_RENDERERSTATS_H
