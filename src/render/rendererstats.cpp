/*
 * rendererstats.cpp - Call statistics for the rendering service
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "rendererstats.h"

#include <QMutexLocker>

#include <algorithm>

RendererStats::RendererStats(int retentionHours)
    : m_retentionHours(retentionHours)
{
}

QString RendererStats::hourKey(const QDateTime &when)
{
    return when.toUTC().toString(QStringLiteral("yyyy-MM-ddTHH"));
}

void RendererStats::record(const RenderResult &result, int labelCount, const QDateTime &when)
{
    QMutexLocker lock(&m_mutex);

    const QString key = hourKey(when);
    Bucket &b = m_buckets[key];
    const bool fresh = b.totalCalls == 0;
    b.hourKey = key;
    b.totalCalls++;
    if (result.ok()) {
        b.successCount++;
        b.labelCount += labelCount;
    } else {
        b.errorCount++;
        if (result.status == RenderResult::PayloadTooLarge)
            b.payloadTooLargeHits++;
        if (result.httpStatus == 429)
            b.rateLimitHits++;
    }
    b.totalResponseTimeMs += result.responseTimeMs;
    b.minResponseTimeMs = fresh ? result.responseTimeMs
                                : std::min(b.minResponseTimeMs, result.responseTimeMs);
    b.maxResponseTimeMs = std::max(b.maxResponseTimeMs, result.responseTimeMs);

    // Keys sort chronologically
    const QString oldest = hourKey(when.addSecs(-3600LL * m_retentionHours));
    while (!m_buckets.isEmpty() && m_buckets.firstKey() < oldest)
        m_buckets.erase(m_buckets.begin());
}

QList<RendererStats::Bucket> RendererStats::buckets() const
{
    QMutexLocker lock(&m_mutex);
    return m_buckets.values();
}

RendererStats::Summary RendererStats::summary() const
{
    QMutexLocker lock(&m_mutex);

    Summary s;
    qint64 totalTime = 0;
    int errors = 0;
    int rateLimits = 0;
    for (const Bucket &b : m_buckets) {
        s.totalCalls += b.totalCalls;
        s.totalLabelsRendered += b.labelCount;
        totalTime += b.totalResponseTimeMs;
        errors += b.errorCount;
        rateLimits += b.rateLimitHits;
        if (b.totalCalls > s.peakCallCount) {
            s.peakCallCount = b.totalCalls;
            s.peakHour = b.hourKey;
        }
    }
    if (s.totalCalls > 0) {
        s.avgResponseTimeMs = static_cast<double>(totalTime) / s.totalCalls;
        s.errorRate = 100.0 * errors / s.totalCalls;
        s.rateLimitRate = 100.0 * rateLimits / s.totalCalls;
    }
    return s;
}
