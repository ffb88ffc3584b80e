/*
 * plantier.cpp - Subscription tiers and their queue priority
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "plantier.h"

namespace PlanTiers {

QList<PlanTier> all()
{
    return {PlanTier::Enterprise, PlanTier::ProMax, PlanTier::Pro, PlanTier::Free};
}

int priorityRank(PlanTier tier)
{
    switch (tier) {
    case PlanTier::Enterprise: return 0;
    case PlanTier::ProMax:     return 1;
    case PlanTier::Pro:        return 2;
    case PlanTier::Free:       return 3;
    }
    return 3;
}

PlanTier fromString(const QString &text)
{
    const QString t = text.trimmed().toLower();
    if (t == QLatin1String("enterprise"))
        return PlanTier::Enterprise;
    if (t == QLatin1String("promax"))
        return PlanTier::ProMax;
    if (t == QLatin1String("pro"))
        return PlanTier::Pro;
    return PlanTier::Free;
}

QString toString(PlanTier tier)
{
    switch (tier) {
    case PlanTier::Enterprise: return QStringLiteral("enterprise");
    case PlanTier::ProMax:     return QStringLiteral("promax");
    case PlanTier::Pro:        return QStringLiteral("pro");
    case PlanTier::Free:       return QStringLiteral("free");
    }
    return QStringLiteral("free");
}

bool canExportImages(PlanTier tier)
{
    return tier != PlanTier::Free;
}

bool canSubmitBatches(PlanTier tier)
{
    return tier != PlanTier::Free;
}

} // namespace PlanTiers
