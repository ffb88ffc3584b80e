/*
 * jobstore.cpp - Keyed storage for job status records
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "jobstore.h"

#include <QReadLocker>
#include <QWriteLocker>

void InMemoryJobStore::putJob(const ConversionJob &job)
{
    QWriteLocker lock(&m_lock);
    m_jobs.insert(job.id, job);
}

std::optional<ConversionJob> InMemoryJobStore::job(const QString &id) const
{
    QReadLocker lock(&m_lock);
    auto it = m_jobs.constFind(id);
    if (it == m_jobs.constEnd())
        return std::nullopt;
    return it.value();
}

bool InMemoryJobStore::updateJob(const QString &id, const std::function<void(ConversionJob &)> &mutate)
{
    QWriteLocker lock(&m_lock);
    auto it = m_jobs.find(id);
    if (it == m_jobs.end())
        return false;
    mutate(it.value());
    it.value().updatedAt = QDateTime::currentDateTimeUtc();
    return true;
}

void InMemoryJobStore::putBatch(const BatchJob &batch)
{
    QWriteLocker lock(&m_lock);
    m_batches.insert(batch.id, batch);
}

std::optional<BatchJob> InMemoryJobStore::batch(const QString &id) const
{
    QReadLocker lock(&m_lock);
    auto it = m_batches.constFind(id);
    if (it == m_batches.constEnd())
        return std::nullopt;
    return it.value();
}

bool InMemoryJobStore::updateBatch(const QString &id, const std::function<void(BatchJob &)> &mutate)
{
    QWriteLocker lock(&m_lock);
    auto it = m_batches.find(id);
    if (it == m_batches.end())
        return false;
    mutate(it.value());
    it.value().updatedAt = QDateTime::currentDateTimeUtc();
    return true;
}
