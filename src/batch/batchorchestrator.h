/*
 * batchorchestrator.h - Multi-file conversions with one aggregate archive
 *
 * Each file runs through the full conversion pipeline on its own; a file
 * that fails is recorded and the batch moves on. When every file is done
 * the successful outputs are zipped together and the per-file temporaries
 * are removed whatever the outcome.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef ZPLFORGE_BATCHORCHESTRATOR_H
#define ZPLFORGE_BATCHORCHESTRATOR_H

#include <QList>
#include <QMap>
#include <QString>
#include <QThreadPool>

#include <optional>

#include "batchjob.h"
#include "conversionerror.h"
#include "labelsize.h"
#include "outputformat.h"
#include "plantier.h"

class ConversionPipeline;
class JobStore;
class ObjectStore;
class UsageLimits;
struct ConversionRecord;

class BatchOrchestrator
{
public:
    struct TierLimits {
        int maxFiles = 0;
        qint64 maxFileBytes = 0;
    };

    struct Options {
        int maxConcurrentFiles = 1;
        QMap<PlanTier, TierLimits> limits;  // tiers without an entry may not batch

        Options();
    };

    struct InputFile {
        QString name;
        QString zpl;
    };

    struct SubmitResult {
        QString batchId;
        ConversionError error;
        bool ok() const { return !error.isError(); }
    };

    BatchOrchestrator(ConversionPipeline &pipeline, JobStore &jobs, ObjectStore &store,
                      UsageLimits &usage, const Options &options = Options());
    ~BatchOrchestrator();

    // Validates tier, file count and file sizes, records the batch and
    // starts it in the background.
    SubmitResult submit(const QString &userId, PlanTier tier, const QList<InputFile> &files,
                        LabelSize labelSize, OutputFormat format);

    std::optional<BatchJob> batch(const QString &batchId) const;

    // Waits for running batches and their usage records
    bool waitForDone(int msecs = -1);

    const Options &options() const { return m_options; }

private:
    void run(const QString &batchId, const QList<InputFile> &files);
    void processFile(const QString &batchId, const BatchJob &batch, int index, const InputFile &file);
    void aggregate(const QString &batchId);
    void recordAsync(const ConversionRecord &record);

    static QString archiveEntryName(const QString &fileName, OutputFormat format,
                                    QStringList &taken);

    ConversionPipeline &m_pipeline;
    JobStore &m_jobs;
    ObjectStore &m_store;
    UsageLimits &m_usage;
    Options m_options;
    QThreadPool m_batchPool;
    QThreadPool m_filePool;
    QThreadPool m_recordPool;   // usage bookkeeping, never awaited by a batch
};

#endif // ZPLFORGE_BATCHORCHESTRATOR_H
