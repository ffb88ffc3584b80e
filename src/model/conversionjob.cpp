/*
 * conversionjob.cpp - Status record of one interactive conversion
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "conversionjob.h"

QString ConversionJob::statusName(Status status)
{
    switch (status) {
    case Pending:    return QStringLiteral("pending");
    case Processing: return QStringLiteral("processing");
    case Completed:  return QStringLiteral("completed");
    case Failed:     return QStringLiteral("failed");
    }
    return QStringLiteral("pending");
}

QString ConversionJob::statusMessage() const
{
    switch (status) {
    case Pending:
        return QStringLiteral("Queued");
    case Processing:
        return QStringLiteral("Processing (%1%)").arg(progress);
    case Completed:
        return QStringLiteral("Completed");
    case Failed:
        return QStringLiteral("Error: %1").arg(error.message);
    }
    return QString();
}

QJsonObject ConversionJob::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("jobId")] = id;
    obj[QStringLiteral("status")] = statusName(status);
    obj[QStringLiteral("progress")] = progress;
    obj[QStringLiteral("message")] = statusMessage();
    obj[QStringLiteral("labelSize")] = LabelSizes::toString(labelSize);
    obj[QStringLiteral("format")] = OutputFormats::toString(format);
    obj[QStringLiteral("labelCount")] = labelCount;
    if (status == Completed) {
        obj[QStringLiteral("pageCount")] = pageCount;
        obj[QStringLiteral("resultUrl")] = downloadUrl;
        obj[QStringLiteral("filename")] = fileName;
        obj[QStringLiteral("expiresAt")] = urlExpiresAt.toString(Qt::ISODate);
        if (skippedLabels > 0)
            obj[QStringLiteral("skippedLabels")] = skippedLabels;
    }
    if (error.isError()) {
        QJsonObject err;
        err[QStringLiteral("code")] = ConversionError::codeName(error.code);
        err[QStringLiteral("message")] = error.message;
        if (!error.context.isEmpty())
            err[QStringLiteral("data")] = error.context;
        obj[QStringLiteral("error")] = err;
    }
    obj[QStringLiteral("createdAt")] = createdAt.toString(Qt::ISODate);
    obj[QStringLiteral("updatedAt")] = updatedAt.toString(Qt::ISODate);
    return obj;
}
