/*
 * jobstore.h - Keyed storage for job status records
 *
 * Each record has one writer at a time (the task that owns the job);
 * readers poll by id. update() applies a mutation atomically so that a
 * poll never sees a half-written record.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef ZPLFORGE_JOBSTORE_H
#define ZPLFORGE_JOBSTORE_H

#include <QHash>
#include <QReadWriteLock>
#include <QString>

#include <functional>
#include <optional>

#include "batchjob.h"
#include "conversionjob.h"

class JobStore
{
public:
    virtual ~JobStore() = default;

    virtual void putJob(const ConversionJob &job) = 0;
    virtual std::optional<ConversionJob> job(const QString &id) const = 0;
    // False when no job with this id exists
    virtual bool updateJob(const QString &id, const std::function<void(ConversionJob &)> &mutate) = 0;

    virtual void putBatch(const BatchJob &batch) = 0;
    virtual std::optional<BatchJob> batch(const QString &id) const = 0;
    virtual bool updateBatch(const QString &id, const std::function<void(BatchJob &)> &mutate) = 0;
};

class InMemoryJobStore : public JobStore
{
public:
    void putJob(const ConversionJob &job) override;
    std::optional<ConversionJob> job(const QString &id) const override;
    bool updateJob(const QString &id, const std::function<void(ConversionJob &)> &mutate) override;

    void putBatch(const BatchJob &batch) override;
    std::optional<BatchJob> batch(const QString &id) const override;
    bool updateBatch(const QString &id, const std::function<void(BatchJob &)> &mutate) override;

private:
    mutable QReadWriteLock m_lock;
    QHash<QString, ConversionJob> m_jobs;
    QHash<QString, BatchJob> m_batches;
};

#endif // ZPLFORGE_JOBSTORE_H
