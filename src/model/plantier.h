/*
 * plantier.h - Subscription tiers and their queue priority
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef ZPLFORGE_PLANTIER_H
#define ZPLFORGE_PLANTIER_H

#include <QList>
#include <QString>

// Declared lowest to highest.
enum class PlanTier {
    Free,
    Pro,
    ProMax,
    Enterprise,
};

namespace PlanTiers {

// Every tier, highest priority first
QList<PlanTier> all();

// 0 is served first. Strictly increasing from Enterprise down to Free.
int priorityRank(PlanTier tier);

// True when a is admitted ahead of b
inline bool outranks(PlanTier a, PlanTier b) { return priorityRank(a) < priorityRank(b); }

// "free", "pro", "promax", "enterprise" (case-insensitive); unknown -> Free
PlanTier fromString(const QString &text);
QString toString(PlanTier tier);

bool canExportImages(PlanTier tier);
bool canSubmitBatches(PlanTier tier);

} // namespace PlanTiers

#endif // ZPLFORGE_PLANTIER_H
