/*
 * planusagelimits.h - In-memory UsageLimits with fixed per-tier quotas
 *
 * Usage is counted per user and UTC calendar month. Only completed
 * conversions count against the monthly quota.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef ZPLFORGE_PLANUSAGELIMITS_H
#define ZPLFORGE_PLANUSAGELIMITS_H

#include <QDateTime>
#include <QHash>
#include <QList>
#include <QMap>
#include <QMutex>

#include "usagelimits.h"

class PlanUsageLimits : public UsageLimits
{
public:
    struct Quota {
        int labelsPerDocument = 100;
        int documentsPerMonth = 25;
    };

    struct Usage {
        int documents = 0;
        int labels = 0;
    };

    PlanUsageLimits();

    void setQuota(PlanTier tier, const Quota &quota);
    Quota quota(PlanTier tier) const;

    UsageDecision canConvert(const QString &userId, PlanTier tier,
                             int labelCount, OutputFormat format) override;
    bool recordConversion(const ConversionRecord &record, QString *errorMessage = nullptr) override;

    Usage usage(const QString &userId, const QDate &month = QDateTime::currentDateTimeUtc().date()) const;
    QList<ConversionRecord> history(const QString &userId) const;

private:
    static QString periodKey(const QString &userId, const QDate &month);

    mutable QMutex m_mutex;
    QMap<PlanTier, Quota> m_quotas;
    QHash<QString, Usage> m_usage;          // "user|yyyy-MM" -> usage
    QHash<QString, QList<ConversionRecord>> m_history;
};

#endif // ZPLFORGE_PLANUSAGELIMITS_H
