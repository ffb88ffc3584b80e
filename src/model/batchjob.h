/*
 * batchjob.h - Aggregate record of a multi-file conversion
 *
 * A batch is processing until every file has reached a terminal state.
 * It then becomes completed (all files succeeded), failed (none did) or
 * partial.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef ZPLFORGE_BATCHJOB_H
#define ZPLFORGE_BATCHJOB_H

#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QString>

#include "conversionerror.h"
#include "labelsize.h"
#include "outputformat.h"
#include "plantier.h"

struct FileJob {
    enum Status {
        Pending,
        Processing,
        Completed,
        Failed,
    };

    QString jobId;
    int fileIndex = 0;
    QString fileName;
    Status status = Pending;
    int progress = 0;
    int labelCount = 0;
    QString tempKey;                // set once the output is stored
    ConversionError error;

    static QString statusName(Status status);
};

struct BatchJob {
    enum Status {
        Processing,
        Completed,
        Partial,
        Failed,
    };

    QString id;
    QString userId;
    PlanTier tier = PlanTier::Pro;
    LabelSize labelSize = LabelSize::TwoByOne;
    OutputFormat format = OutputFormat::Pdf;

    Status status = Processing;
    QList<FileJob> files;

    QString archiveKey;
    QString archiveFileName;
    QString downloadUrl;
    QDateTime urlExpiresAt;
    ConversionError error;          // aggregation failure only

    QDateTime createdAt;
    QDateTime updatedAt;

    int completedCount() const;
    int failedCount() const;
    int progress() const;           // mean of the file progresses

    // Terminal status for a set of finished files
    static Status aggregate(const QList<FileJob> &files);

    static QString statusName(Status status);
    QJsonObject toJson() const;
};

#endif // ZPLFORGE_BATCHJOB_H
