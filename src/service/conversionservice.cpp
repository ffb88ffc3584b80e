/*
 * conversionservice.cpp - Interactive single-document conversions
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "conversionservice.h"
#include "jobstore.h"
#include "objectstore.h"
#include "outputnames.h"
#include "usagelimits.h"

#include <QDebug>
#include <QUuid>

ConversionService::ConversionService(ConversionPipeline &pipeline, RenderDispatcher &dispatcher,
                                     JobStore &jobs, ObjectStore &store, UsageLimits &usage,
                                     int workerThreads)
    : m_pipeline(pipeline)
    , m_dispatcher(dispatcher)
    , m_jobs(jobs)
    , m_store(store)
    , m_usage(usage)
{
    m_pool.setMaxThreadCount(qMax(1, workerThreads));
}

ConversionService::~ConversionService()
{
    m_pool.waitForDone();
}

BlockParser::LabelCount ConversionService::countLabels(const QString &zpl) const
{
    return BlockParser::countLabels(zpl);
}

ConversionService::StartResult ConversionService::start(const Request &request)
{
    StartResult result;

    if (request.zpl.trimmed().isEmpty()) {
        result.error = ConversionError::make(ConversionError::EmptyContent,
                                             QStringLiteral("ZPL content is empty"));
        return result;
    }

    const BlockParser::LabelCount count = BlockParser::countLabels(request.zpl);
    if (count.error.isError()) {
        result.error = count.error;
        return result;
    }
    result.labelCount = count.totalLabels;

    if (OutputFormats::isImage(request.format) && !PlanTiers::canExportImages(request.tier)) {
        result.error = ConversionError::make(
            ConversionError::LimitDenied,
            QStringLiteral("Image export is not available on the %1 plan").arg(PlanTiers::toString(request.tier)),
            QJsonObject{{QStringLiteral("errorCode"), QStringLiteral("IMAGES_NOT_ALLOWED")},
                        {QStringLiteral("data"), QJsonObject{{QStringLiteral("plan"), PlanTiers::toString(request.tier)}}}});
        return result;
    }

    const UsageDecision decision = m_usage.canConvert(request.userId, request.tier,
                                                      count.totalLabels, request.format);
    if (!decision.allowed) {
        qInfo() << "ConversionService: user" << request.userId << "denied:" << decision.errorCode;
        result.error = ConversionError::make(
            ConversionError::LimitDenied, decision.message,
            QJsonObject{{QStringLiteral("errorCode"), decision.errorCode},
                        {QStringLiteral("data"), decision.data}});
        return result;
    }

    ConversionJob job;
    job.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    job.userId = request.userId;
    job.tier = request.tier;
    job.labelSize = request.labelSize;
    job.format = request.format;
    job.labelCount = count.totalLabels;
    job.createdAt = QDateTime::currentDateTimeUtc();
    job.updatedAt = job.createdAt;
    m_jobs.putJob(job);

    result.jobId = job.id;
    const QString jobId = job.id;
    m_pool.start([this, jobId, request] { runJob(jobId, request); });

    qInfo() << "ConversionService: started job" << jobId << "labels=" << count.totalLabels
            << "size=" << LabelSizes::toString(request.labelSize)
            << "format=" << OutputFormats::toString(request.format);
    return result;
}

void ConversionService::runJob(const QString &jobId, const Request &request)
{
    m_jobs.updateJob(jobId, [](ConversionJob &j) { j.status = ConversionJob::Processing; });

    ConversionPipeline::Request pipelineRequest;
    pipelineRequest.jobId = jobId;
    pipelineRequest.userId = request.userId;
    pipelineRequest.tier = request.tier;
    pipelineRequest.zpl = request.zpl;
    pipelineRequest.labelSize = request.labelSize;
    pipelineRequest.format = request.format;

    ConversionPipeline::Output output = m_pipeline.run(pipelineRequest, [this, jobId](int progress) {
        m_jobs.updateJob(jobId, [progress](ConversionJob &j) { j.progress = progress; });
    });

    ConversionError error = output.error;
    QString key;
    ObjectStore::SignedUrl signedUrl;
    const QString fileName = OutputNames::downloadName(request.labelSize, request.format);

    if (!error.isError()) {
        key = OutputNames::storageKey(jobId, request.format);
        QString storeError;
        if (!m_store.put(key, output.data, output.mimeType, &storeError)) {
            error = ConversionError::make(ConversionError::StorageFailed,
                                          QStringLiteral("Failed to store result: %1").arg(storeError));
        } else {
            signedUrl = m_store.sign(key, fileName);
            if (!signedUrl.isValid())
                error = ConversionError::make(ConversionError::StorageFailed,
                                              QStringLiteral("Failed to create download link"));
        }
    }

    if (error.isError()) {
        qWarning() << "ConversionService: job" << jobId << "failed:"
                   << ConversionError::codeName(error.code) << error.message
                   << "size=" << LabelSizes::toString(request.labelSize)
                   << "format=" << OutputFormats::toString(request.format);
        m_jobs.updateJob(jobId, [&error](ConversionJob &j) {
            j.status = ConversionJob::Failed;
            j.error = error;
        });
    } else {
        m_jobs.updateJob(jobId, [&](ConversionJob &j) {
            j.status = ConversionJob::Completed;
            j.progress = 100;
            j.pageCount = output.pageCount;
            j.skippedLabels = output.skippedLabels;
            j.storageKey = key;
            j.downloadUrl = signedUrl.url;
            j.urlExpiresAt = signedUrl.expiresAt;
            j.fileName = fileName;
        });
        qInfo() << "ConversionService: job" << jobId << "completed," << output.pageCount << "page(s)";
    }

    ConversionRecord record;
    record.userId = request.userId;
    record.jobId = jobId;
    record.labelCount = output.labelCount;
    record.labelSize = request.labelSize;
    record.format = request.format;
    record.completed = !error.isError();
    record.resultUrl = signedUrl.url;
    recordAsync(record);
}

void ConversionService::recordAsync(const ConversionRecord &record)
{
    m_pool.start([this, record] {
        QString errorMessage;
        if (!m_usage.recordConversion(record, &errorMessage))
            qWarning() << "ConversionService: recording job" << record.jobId
                       << "failed:" << errorMessage;
    });
}

std::optional<ConversionJob> ConversionService::status(const QString &jobId) const
{
    return m_jobs.job(jobId);
}

ConversionService::DownloadInfo ConversionService::downloadInfo(const QString &jobId) const
{
    DownloadInfo info;
    const std::optional<ConversionJob> job = m_jobs.job(jobId);
    if (!job) {
        info.error = ConversionError::make(ConversionError::NotFound,
                                           QStringLiteral("Job %1 not found").arg(jobId));
        return info;
    }
    if (job->status != ConversionJob::Completed) {
        info.error = ConversionError::make(
            ConversionError::NotReady, QStringLiteral("Job %1 is not completed").arg(jobId),
            QJsonObject{{QStringLiteral("status"), ConversionJob::statusName(job->status)}});
        return info;
    }

    info.fileName = job->fileName;
    // Links are short lived; mint a fresh one once the stored one expires
    if (job->urlExpiresAt.isValid() && job->urlExpiresAt > QDateTime::currentDateTimeUtc()) {
        info.url = job->downloadUrl;
        info.expiresAt = job->urlExpiresAt;
        return info;
    }
    const ObjectStore::SignedUrl fresh = m_store.sign(job->storageKey, job->fileName);
    if (!fresh.isValid()) {
        info.error = ConversionError::make(ConversionError::StorageFailed,
                                           QStringLiteral("Stored result for job %1 is gone").arg(jobId));
        return info;
    }
    info.url = fresh.url;
    info.expiresAt = fresh.expiresAt;
    return info;
}

RenderDispatcher::QueuePosition ConversionService::queuePosition(const QString &jobId) const
{
    return m_dispatcher.queuePosition(jobId);
}

ConversionPipeline::PreviewOutput ConversionService::previews(const QString &userId, PlanTier tier,
                                                              const QString &zpl,
                                                              LabelSize labelSize) const
{
    ConversionPipeline::Request request;
    request.jobId = QStringLiteral("preview-") + QUuid::createUuid().toString(QUuid::WithoutBraces);
    request.userId = userId;
    request.tier = tier;
    request.zpl = zpl;
    request.labelSize = labelSize;
    request.format = OutputFormat::Png;
    return m_pipeline.previews(request);
}

bool ConversionService::waitForDone(int msecs)
{
    return m_pool.waitForDone(msecs);
}
