/*
 * settings.h - Start-up configuration read from zplforgerc
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef ZPLFORGE_SETTINGS_H
#define ZPLFORGE_SETTINGS_H

#include <KSharedConfig>

#include <QString>

#include "batchorchestrator.h"
#include "imageexporter.h"
#include "labelaryrenderer.h"
#include "planusagelimits.h"
#include "renderdispatcher.h"

struct Settings {
    LabelaryRenderer::Options labelary;
    RenderDispatcher::Options dispatcher;
    bool offline = false;

    ImageExporter::Options images;

    QString storageRoot;
    int signedUrlTtlSeconds = 900;
    QByteArray signingKey;

    BatchOrchestrator::Options batch;
    QMap<PlanTier, PlanUsageLimits::Quota> quotas;

    int workerThreads = 4;

    // Missing keys keep their defaults
    static Settings load(const KSharedConfigPtr &config);

    // Empty path reads zplforgerc from the standard config location
    static Settings load(const QString &path = QString());
};

#endif // ZPLFORGE_SETTINGS_H
