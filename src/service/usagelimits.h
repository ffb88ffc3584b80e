/*
 * usagelimits.h - Plan and usage accounting seen from the conversion core
 *
 * canConvert() is consulted before any rendering work starts;
 * recordConversion() is called once a job reaches a terminal state and its
 * outcome never affects the job.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef ZPLFORGE_USAGELIMITS_H
#define ZPLFORGE_USAGELIMITS_H

#include <QJsonObject>
#include <QString>

#include "labelsize.h"
#include "outputformat.h"
#include "plantier.h"

struct UsageDecision {
    bool allowed = true;
    QString errorCode;      // LABEL_LIMIT_EXCEEDED, MONTHLY_LIMIT_EXCEEDED, ...
    QString message;
    QJsonObject data;       // requested/allowed, current/allowed/resetsAt
};

struct ConversionRecord {
    QString userId;
    QString jobId;
    int labelCount = 0;
    LabelSize labelSize = LabelSize::TwoByOne;
    OutputFormat format = OutputFormat::Pdf;
    bool completed = false;
    QString resultUrl;
};

class UsageLimits
{
public:
    virtual ~UsageLimits() = default;

    virtual UsageDecision canConvert(const QString &userId, PlanTier tier,
                                     int labelCount, OutputFormat format) = 0;

    // May fail; the caller logs and carries on
    virtual bool recordConversion(const ConversionRecord &record, QString *errorMessage = nullptr) = 0;
};

#endif // ZPLFORGE_USAGELIMITS_H
