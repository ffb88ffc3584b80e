/*
 * batchorchestrator.cpp - Multi-file conversions with one aggregate archive
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "batchorchestrator.h"
#include "conversionpipeline.h"
#include "jobstore.h"
#include "objectstore.h"
#include "outputnames.h"
#include "usagelimits.h"
#include "ziparchive.h"

#include <QDeadlineTimer>
#include <QDebug>
#include <QFileInfo>
#include <QUuid>
#include <QtConcurrent/QtConcurrentMap>

#include <functional>
#include <numeric>
#include <vector>

BatchOrchestrator::Options::Options()
{
    limits[PlanTier::Pro] = {10, 5 * 1024 * 1024};
    limits[PlanTier::ProMax] = {10, 5 * 1024 * 1024};
    limits[PlanTier::Enterprise] = {50, 10 * 1024 * 1024};
}

BatchOrchestrator::BatchOrchestrator(ConversionPipeline &pipeline, JobStore &jobs,
                                     ObjectStore &store, UsageLimits &usage,
                                     const Options &options)
    : m_pipeline(pipeline)
    , m_jobs(jobs)
    , m_store(store)
    , m_usage(usage)
    , m_options(options)
{
    m_options.maxConcurrentFiles = qMax(1, m_options.maxConcurrentFiles);
    m_filePool.setMaxThreadCount(m_options.maxConcurrentFiles);
}

BatchOrchestrator::~BatchOrchestrator()
{
    m_batchPool.waitForDone();
    m_filePool.waitForDone();
    m_recordPool.waitForDone();
}

BatchOrchestrator::SubmitResult BatchOrchestrator::submit(const QString &userId, PlanTier tier,
                                                          const QList<InputFile> &files,
                                                          LabelSize labelSize, OutputFormat format)
{
    SubmitResult result;

    if (!PlanTiers::canSubmitBatches(tier) || !m_options.limits.contains(tier)) {
        result.error = ConversionError::make(
            ConversionError::BatchNotAllowed,
            QStringLiteral("Batch conversion is not available on the %1 plan").arg(PlanTiers::toString(tier)));
        return result;
    }
    const TierLimits limits = m_options.limits.value(tier);

    if (files.isEmpty() || files.size() > limits.maxFiles) {
        result.error = ConversionError::make(
            ConversionError::TooManyFiles,
            QStringLiteral("A batch holds between 1 and %1 files").arg(limits.maxFiles),
            QJsonObject{{QStringLiteral("requested"), static_cast<int>(files.size())},
                        {QStringLiteral("allowed"), limits.maxFiles}});
        return result;
    }

    for (const InputFile &file : files) {
        const qint64 bytes = file.zpl.toUtf8().size();
        if (bytes > limits.maxFileBytes) {
            result.error = ConversionError::make(
                ConversionError::FileTooLarge,
                QStringLiteral("%1 exceeds the %2 byte limit").arg(file.name).arg(limits.maxFileBytes),
                QJsonObject{{QStringLiteral("fileName"), file.name},
                            {QStringLiteral("size"), bytes},
                            {QStringLiteral("allowed"), limits.maxFileBytes}});
            return result;
        }
    }

    if (OutputFormats::isImage(format) && !PlanTiers::canExportImages(tier)) {
        result.error = ConversionError::make(
            ConversionError::LimitDenied,
            QStringLiteral("Image export is not available on the %1 plan").arg(PlanTiers::toString(tier)),
            QJsonObject{{QStringLiteral("errorCode"), QStringLiteral("IMAGES_NOT_ALLOWED")}});
        return result;
    }

    BatchJob batch;
    batch.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    batch.userId = userId;
    batch.tier = tier;
    batch.labelSize = labelSize;
    batch.format = format;
    batch.createdAt = QDateTime::currentDateTimeUtc();
    batch.updatedAt = batch.createdAt;
    for (int i = 0; i < files.size(); ++i) {
        FileJob job;
        job.jobId = QUuid::createUuid().toString(QUuid::WithoutBraces);
        job.fileIndex = i;
        job.fileName = files[i].name;
        batch.files.append(job);
    }
    m_jobs.putBatch(batch);

    const QString batchId = batch.id;
    m_batchPool.start([this, batchId, files] { run(batchId, files); });

    qInfo() << "BatchOrchestrator: accepted batch" << batchId << "files=" << files.size()
            << "tier=" << PlanTiers::toString(tier) << "size=" << LabelSizes::toString(labelSize)
            << "format=" << OutputFormats::toString(format);
    result.batchId = batchId;
    return result;
}

void BatchOrchestrator::run(const QString &batchId, const QList<InputFile> &files)
{
    const std::optional<BatchJob> snapshot = m_jobs.batch(batchId);
    if (!snapshot)
        return;

    if (m_options.maxConcurrentFiles == 1) {
        for (int i = 0; i < files.size(); ++i)
            processFile(batchId, *snapshot, i, files[i]);
    } else {
        std::vector<int> indices(static_cast<size_t>(files.size()));
        std::iota(indices.begin(), indices.end(), 0);
        QtConcurrent::blockingMap(&m_filePool, indices, [&](int i) {
            processFile(batchId, *snapshot, i, files[i]);
        });
    }

    aggregate(batchId);
}

void BatchOrchestrator::processFile(const QString &batchId, const BatchJob &batch, int index,
                                    const InputFile &file)
{
    const QString jobId = batch.files[index].jobId;
    auto updateFile = [this, &batchId, index](const std::function<void(FileJob &)> &mutate) {
        m_jobs.updateBatch(batchId, [&](BatchJob &b) { mutate(b.files[index]); });
    };

    updateFile([](FileJob &f) { f.status = FileJob::Processing; });

    ConversionError error;
    QString tempKey;
    int labelCount = 0;

    const BlockParser::LabelCount count = BlockParser::countLabels(file.zpl);
    if (count.error.isError()) {
        error = count.error;
    } else {
        labelCount = count.totalLabels;
        const UsageDecision decision = m_usage.canConvert(batch.userId, batch.tier,
                                                          labelCount, batch.format);
        if (!decision.allowed)
            error = ConversionError::make(ConversionError::LimitDenied, decision.message,
                                          QJsonObject{{QStringLiteral("errorCode"), decision.errorCode},
                                                      {QStringLiteral("data"), decision.data}});
    }

    if (!error.isError()) {
        ConversionPipeline::Request request;
        request.jobId = jobId;
        request.userId = batch.userId;
        request.tier = batch.tier;
        request.zpl = file.zpl;
        request.labelSize = batch.labelSize;
        request.format = batch.format;

        const ConversionPipeline::Output output = m_pipeline.run(request, [&updateFile](int progress) {
            updateFile([progress](FileJob &f) { f.progress = progress; });
        });

        if (output.ok()) {
            const QString key = OutputNames::batchTempKey(batchId, jobId, batch.format);
            QString storeError;
            if (m_store.put(key, output.data, output.mimeType, &storeError))
                tempKey = key;
            else
                error = ConversionError::make(ConversionError::StorageFailed, storeError);
        } else {
            error = output.error;
        }
    }

    if (error.isError()) {
        qWarning() << "BatchOrchestrator: batch" << batchId << "file" << index << file.name
                   << "failed:" << ConversionError::codeName(error.code) << error.message
                   << "size=" << LabelSizes::toString(batch.labelSize)
                   << "format=" << OutputFormats::toString(batch.format);
        updateFile([&error, labelCount](FileJob &f) {
            f.status = FileJob::Failed;
            f.labelCount = labelCount;
            f.error = error;
        });
    } else {
        updateFile([&tempKey, labelCount](FileJob &f) {
            f.status = FileJob::Completed;
            f.progress = 100;
            f.labelCount = labelCount;
            f.tempKey = tempKey;
        });
    }

    ConversionRecord record;
    record.userId = batch.userId;
    record.jobId = jobId;
    record.labelCount = labelCount;
    record.labelSize = batch.labelSize;
    record.format = batch.format;
    record.completed = !error.isError();
    recordAsync(record);
}

void BatchOrchestrator::recordAsync(const ConversionRecord &record)
{
    m_recordPool.start([this, record] {
        QString errorMessage;
        if (!m_usage.recordConversion(record, &errorMessage))
            qWarning() << "BatchOrchestrator: recording" << record.jobId << "failed:" << errorMessage;
    });
}

QString BatchOrchestrator::archiveEntryName(const QString &fileName, OutputFormat format,
                                            QStringList &taken)
{
    QString base = QFileInfo(fileName).completeBaseName();
    if (base.isEmpty())
        base = QStringLiteral("labels");
    const QString ext = OutputNames::fileExtension(format);

    QString name = QStringLiteral("%1.%2").arg(base, ext);
    for (int n = 2; taken.contains(name); ++n)
        name = QStringLiteral("%1_%2.%3").arg(base).arg(n).arg(ext);
    taken.append(name);
    return name;
}

void BatchOrchestrator::aggregate(const QString &batchId)
{
    const std::optional<BatchJob> batch = m_jobs.batch(batchId);
    if (!batch)
        return;

    BatchJob::Status status = BatchJob::aggregate(batch->files);
    ConversionError error;
    QString archiveKey;
    QString archiveName;
    ObjectStore::SignedUrl signedUrl;

    if (status != BatchJob::Failed) {
        ZipArchive zip;
        QStringList taken;
        for (const FileJob &f : batch->files) {
            if (f.status != FileJob::Completed || f.tempKey.isEmpty())
                continue;
            bool ok = false;
            const QByteArray data = m_store.get(f.tempKey, &ok);
            if (!ok) {
                error = ConversionError::make(ConversionError::ArchiveFailed,
                                              QStringLiteral("Output of %1 is missing").arg(f.fileName));
                break;
            }
            zip.addFile(archiveEntryName(f.fileName, batch->format, taken), data);
        }

        if (!error.isError()) {
            const ZipArchive::Result built = zip.build();
            if (!built.valid) {
                error = ConversionError::make(ConversionError::ArchiveFailed, built.errorMessage);
            } else {
                archiveKey = OutputNames::batchArchiveKey(batchId);
                archiveName = OutputNames::batchArchiveName(batch->labelSize);
                QString storeError;
                if (!m_store.put(archiveKey, built.data, QStringLiteral("application/zip"), &storeError))
                    error = ConversionError::make(ConversionError::ArchiveFailed, storeError);
                else
                    signedUrl = m_store.sign(archiveKey, archiveName);
            }
        }

        if (error.isError()) {
            qCritical() << "BatchOrchestrator: archive for batch" << batchId << "failed:" << error.message;
            status = BatchJob::Failed;
        }
    }

    m_jobs.updateBatch(batchId, [&](BatchJob &b) {
        b.status = status;
        b.error = error;
        if (!error.isError() && status != BatchJob::Failed) {
            b.archiveKey = archiveKey;
            b.archiveFileName = archiveName;
            b.downloadUrl = signedUrl.url;
            b.urlExpiresAt = signedUrl.expiresAt;
        }
    });

    qInfo() << "BatchOrchestrator: batch" << batchId << BatchJob::statusName(status)
            << batch->completedCount() << "of" << batch->files.size() << "file(s) converted";

    // Temporaries go whatever happened above
    for (const FileJob &f : batch->files) {
        if (!f.tempKey.isEmpty() && !m_store.remove(f.tempKey))
            qWarning() << "BatchOrchestrator: could not remove" << f.tempKey;
    }
}

std::optional<BatchJob> BatchOrchestrator::batch(const QString &batchId) const
{
    return m_jobs.batch(batchId);
}

bool BatchOrchestrator::waitForDone(int msecs)
{
    const QDeadlineTimer deadline = msecs < 0 ? QDeadlineTimer(QDeadlineTimer::Forever)
                                              : QDeadlineTimer(msecs);
    if (!m_batchPool.waitForDone(msecs))
        return false;
    // Batches are done, so no new records arrive
    return m_recordPool.waitForDone(static_cast<int>(deadline.remainingTime()));
}
