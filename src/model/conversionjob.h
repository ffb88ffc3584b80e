/*
 * conversionjob.h - Status record of one interactive conversion
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef ZPLFORGE_CONVERSIONJOB_H
#define ZPLFORGE_CONVERSIONJOB_H

#include <QDateTime>
#include <QJsonObject>
#include <QString>

#include "conversionerror.h"
#include "labelsize.h"
#include "outputformat.h"
#include "plantier.h"

struct ConversionJob {
    enum Status {
        Pending,
        Processing,
        Completed,
        Failed,
    };

    QString id;
    QString userId;
    PlanTier tier = PlanTier::Free;
    LabelSize labelSize = LabelSize::TwoByOne;
    OutputFormat format = OutputFormat::Pdf;

    Status status = Pending;
    int progress = 0;               // 0-100
    int labelCount = 0;             // total labels including copies
    int pageCount = 0;              // pages or images actually produced
    int skippedLabels = 0;

    QString storageKey;
    QString downloadUrl;
    QDateTime urlExpiresAt;
    QString fileName;               // name offered to the user

    ConversionError error;
    QDateTime createdAt;
    QDateTime updatedAt;

    bool isTerminal() const { return status == Completed || status == Failed; }

    // "Queued", "Processing (40%)", "Completed", "Error: ..."
    QString statusMessage() const;

    static QString statusName(Status status);
    QJsonObject toJson() const;
};

#endif // ZPLFORGE_CONVERSIONJOB_H
