/*
 * conversionservice.h - Interactive single-document conversions
 *
 * start() validates the request, asks the usage collaborator for
 * permission and returns a job id straight away. The conversion itself
 * runs on the service's worker pool; callers poll status() until the job
 * is completed or failed, then fetch downloadInfo().
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef ZPLFORGE_CONVERSIONSERVICE_H
#define ZPLFORGE_CONVERSIONSERVICE_H

#include <QDateTime>
#include <QString>
#include <QThreadPool>

#include <optional>

#include "blockparser.h"
#include "conversionjob.h"
#include "conversionpipeline.h"
#include "renderdispatcher.h"

class JobStore;
class ObjectStore;
class UsageLimits;
struct ConversionRecord;

class ConversionService
{
public:
    struct Request {
        QString userId;
        PlanTier tier = PlanTier::Free;
        QString zpl;
        LabelSize labelSize = LabelSize::TwoByOne;
        OutputFormat format = OutputFormat::Pdf;
    };

    struct StartResult {
        QString jobId;
        int labelCount = 0;
        ConversionError error;
        bool ok() const { return !error.isError(); }
    };

    struct DownloadInfo {
        QString url;
        QString fileName;
        QDateTime expiresAt;
        ConversionError error;
        bool ok() const { return !error.isError(); }
    };

    ConversionService(ConversionPipeline &pipeline, RenderDispatcher &dispatcher,
                      JobStore &jobs, ObjectStore &store, UsageLimits &usage,
                      int workerThreads = 4);
    ~ConversionService();

    StartResult start(const Request &request);

    std::optional<ConversionJob> status(const QString &jobId) const;
    DownloadInfo downloadInfo(const QString &jobId) const;
    RenderDispatcher::QueuePosition queuePosition(const QString &jobId) const;

    BlockParser::LabelCount countLabels(const QString &zpl) const;

    // Rendered synchronously through the dispatcher
    ConversionPipeline::PreviewOutput previews(const QString &userId, PlanTier tier,
                                               const QString &zpl, LabelSize labelSize) const;

    // Blocks until every started job and pending bookkeeping task is done
    bool waitForDone(int msecs = -1);

private:
    void runJob(const QString &jobId, const Request &request);
    void recordAsync(const ConversionRecord &record);

    ConversionPipeline &m_pipeline;
    RenderDispatcher &m_dispatcher;
    JobStore &m_jobs;
    ObjectStore &m_store;
    UsageLimits &m_usage;
    QThreadPool m_pool;
};

#endif // ZPLFORGE_CONVERSIONSERVICE_H
