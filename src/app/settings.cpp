/*
 * settings.cpp - Start-up configuration read from zplforgerc
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "settings.h"

#include <KConfigGroup>

#include <QStandardPaths>

Settings Settings::load(const QString &path)
{
    if (path.isEmpty())
        return load(KSharedConfig::openConfig(QStringLiteral("zplforgerc")));
    return load(KSharedConfig::openConfig(path, KConfig::SimpleConfig));
}

Settings Settings::load(const KSharedConfigPtr &config)
{
    Settings s;

    KConfigGroup renderer(config, QStringLiteral("Renderer"));
    s.labelary.baseUrl   = renderer.readEntry("BaseUrl", s.labelary.baseUrl);
    s.labelary.dpmm      = renderer.readEntry("Dpmm", s.labelary.dpmm);
    s.labelary.timeoutMs = renderer.readEntry("TimeoutMs", s.labelary.timeoutMs);
    s.dispatcher.labelCap      = renderer.readEntry("LabelCap", s.dispatcher.labelCap);
    s.dispatcher.concurrency   = renderer.readEntry("Concurrency", s.dispatcher.concurrency);
    s.dispatcher.minIntervalMs = renderer.readEntry("MinIntervalMs", s.dispatcher.minIntervalMs);
    s.dispatcher.estimatedSecondsPerCall =
        renderer.readEntry("EstimatedSecondsPerCall", s.dispatcher.estimatedSecondsPerCall);
    s.offline = renderer.readEntry("Offline", false);

    KConfigGroup exportGroup(config, QStringLiteral("Export"));
    s.images.dpi         = exportGroup.readEntry("ImageDpi", s.images.dpi);
    s.images.jpegQuality = exportGroup.readEntry("JpegQuality", s.images.jpegQuality);

    KConfigGroup storage(config, QStringLiteral("Storage"));
    const QString defaultRoot =
        QStandardPaths::writableLocation(QStandardPaths::AppDataLocation) + QStringLiteral("/storage");
    s.storageRoot         = storage.readEntry("Root", defaultRoot);
    s.signedUrlTtlSeconds = storage.readEntry("SignedUrlTtlSeconds", s.signedUrlTtlSeconds);
    s.signingKey          = storage.readEntry("SigningKey", QString()).toUtf8();

    KConfigGroup batch(config, QStringLiteral("Batch"));
    s.batch.maxConcurrentFiles = batch.readEntry("MaxConcurrentFiles", s.batch.maxConcurrentFiles);
    s.workerThreads            = batch.readEntry("WorkerThreads", s.workerThreads);
    auto readBatchTier = [&batch, &s](PlanTier tier, const char *prefix) {
        BatchOrchestrator::TierLimits limits = s.batch.limits.value(tier);
        const QString p = QString::fromLatin1(prefix);
        limits.maxFiles     = batch.readEntry(p + QStringLiteral("MaxFiles"), limits.maxFiles);
        limits.maxFileBytes = batch.readEntry(p + QStringLiteral("MaxFileBytes"), limits.maxFileBytes);
        s.batch.limits[tier] = limits;
    };
    readBatchTier(PlanTier::Pro, "Pro");
    readBatchTier(PlanTier::ProMax, "ProMax");
    readBatchTier(PlanTier::Enterprise, "Enterprise");

    KConfigGroup limits(config, QStringLiteral("Limits"));
    const PlanUsageLimits defaults;
    for (PlanTier tier : PlanTiers::all()) {
        // FreeLabelsPerDocument, ProMaxDocumentsPerMonth, ...
        QString prefix = PlanTiers::toString(tier);
        if (tier == PlanTier::ProMax)
            prefix = QStringLiteral("ProMax");
        else
            prefix[0] = prefix[0].toUpper();

        PlanUsageLimits::Quota q = defaults.quota(tier);
        q.labelsPerDocument = limits.readEntry(prefix + QStringLiteral("LabelsPerDocument"), q.labelsPerDocument);
        q.documentsPerMonth = limits.readEntry(prefix + QStringLiteral("DocumentsPerMonth"), q.documentsPerMonth);
        s.quotas[tier] = q;
    }

    return s;
}
