/*
 * planusagelimits.cpp - In-memory UsageLimits with fixed per-tier quotas
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "planusagelimits.h"

#include <QDebug>
#include <QMutexLocker>

PlanUsageLimits::PlanUsageLimits()
{
    m_quotas[PlanTier::Free] = {100, 25};
    m_quotas[PlanTier::Pro] = {500, 500};
    m_quotas[PlanTier::ProMax] = {1000, 1000};
    m_quotas[PlanTier::Enterprise] = {999999, 999999};
}

void PlanUsageLimits::setQuota(PlanTier tier, const Quota &quota)
{
    QMutexLocker lock(&m_mutex);
    m_quotas[tier] = quota;
}

PlanUsageLimits::Quota PlanUsageLimits::quota(PlanTier tier) const
{
    QMutexLocker lock(&m_mutex);
    return m_quotas.value(tier);
}

QString PlanUsageLimits::periodKey(const QString &userId, const QDate &month)
{
    return userId + QLatin1Char('|') + month.toString(QStringLiteral("yyyy-MM"));
}

UsageDecision PlanUsageLimits::canConvert(const QString &userId, PlanTier tier,
                                          int labelCount, OutputFormat format)
{
    Q_UNUSED(format);
    UsageDecision decision;

    QMutexLocker lock(&m_mutex);
    const Quota q = m_quotas.value(tier);

    if (labelCount > q.labelsPerDocument) {
        decision.allowed = false;
        decision.errorCode = QStringLiteral("LABEL_LIMIT_EXCEEDED");
        decision.message = QStringLiteral("Your plan allows %1 labels per PDF").arg(q.labelsPerDocument);
        decision.data[QStringLiteral("requested")] = labelCount;
        decision.data[QStringLiteral("allowed")] = q.labelsPerDocument;
        return decision;
    }

    const QDate today = QDateTime::currentDateTimeUtc().date();
    const Usage used = m_usage.value(periodKey(userId, today));
    if (used.documents >= q.documentsPerMonth) {
        const QDate resets(today.year(), today.month(), 1);
        decision.allowed = false;
        decision.errorCode = QStringLiteral("MONTHLY_LIMIT_EXCEEDED");
        decision.message = QStringLiteral("You've reached your monthly limit");
        decision.data[QStringLiteral("current")] = used.documents;
        decision.data[QStringLiteral("allowed")] = q.documentsPerMonth;
        decision.data[QStringLiteral("resetsAt")] = resets.addMonths(1).toString(Qt::ISODate);
        return decision;
    }

    return decision;
}

bool PlanUsageLimits::recordConversion(const ConversionRecord &record, QString *errorMessage)
{
    if (record.userId.isEmpty()) {
        if (errorMessage)
            *errorMessage = QStringLiteral("Conversion record without user");
        return false;
    }

    QMutexLocker lock(&m_mutex);
    m_history[record.userId].append(record);
    if (record.completed) {
        Usage &u = m_usage[periodKey(record.userId, QDateTime::currentDateTimeUtc().date())];
        u.documents += 1;
        u.labels += record.labelCount;
    }
    return true;
}

PlanUsageLimits::Usage PlanUsageLimits::usage(const QString &userId, const QDate &month) const
{
    QMutexLocker lock(&m_mutex);
    return m_usage.value(periodKey(userId, month));
}

QList<ConversionRecord> PlanUsageLimits::history(const QString &userId) const
{
    QMutexLocker lock(&m_mutex);
    return m_history.value(userId);
}
