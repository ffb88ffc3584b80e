/*
 * batchjob.cpp - Aggregate record of a multi-file conversion
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "batchjob.h"

#include <QJsonArray>

QString FileJob::statusName(Status status)
{
    switch (status) {
    case Pending:    return QStringLiteral("pending");
    case Processing: return QStringLiteral("processing");
    case Completed:  return QStringLiteral("completed");
    case Failed:     return QStringLiteral("failed");
    }
    return QStringLiteral("pending");
}

int BatchJob::completedCount() const
{
    int n = 0;
    for (const FileJob &f : files)
        if (f.status == FileJob::Completed)
            ++n;
    return n;
}

int BatchJob::failedCount() const
{
    int n = 0;
    for (const FileJob &f : files)
        if (f.status == FileJob::Failed)
            ++n;
    return n;
}

int BatchJob::progress() const
{
    if (files.isEmpty())
        return 0;
    int sum = 0;
    for (const FileJob &f : files)
        sum += (f.status == FileJob::Completed || f.status == FileJob::Failed) ? 100 : f.progress;
    return sum / files.size();
}

BatchJob::Status BatchJob::aggregate(const QList<FileJob> &files)
{
    int completed = 0;
    for (const FileJob &f : files)
        if (f.status == FileJob::Completed)
            ++completed;

    if (completed == 0)
        return Failed;
    if (completed == files.size())
        return Completed;
    return Partial;
}

QString BatchJob::statusName(Status status)
{
    switch (status) {
    case Processing: return QStringLiteral("processing");
    case Completed:  return QStringLiteral("completed");
    case Partial:    return QStringLiteral("partial");
    case Failed:     return QStringLiteral("failed");
    }
    return QStringLiteral("processing");
}

QJsonObject BatchJob::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("batchId")] = id;
    obj[QStringLiteral("status")] = statusName(status);
    obj[QStringLiteral("progress")] = progress();
    obj[QStringLiteral("labelSize")] = LabelSizes::toString(labelSize);
    obj[QStringLiteral("format")] = OutputFormats::toString(format);
    obj[QStringLiteral("totalFiles")] = static_cast<int>(files.size());
    obj[QStringLiteral("completedFiles")] = completedCount();
    obj[QStringLiteral("failedFiles")] = failedCount();

    QJsonArray fileArray;
    for (const FileJob &f : files) {
        QJsonObject entry;
        entry[QStringLiteral("jobId")] = f.jobId;
        entry[QStringLiteral("fileIndex")] = f.fileIndex;
        entry[QStringLiteral("fileName")] = f.fileName;
        entry[QStringLiteral("status")] = FileJob::statusName(f.status);
        entry[QStringLiteral("progress")] = f.progress;
        entry[QStringLiteral("labelCount")] = f.labelCount;
        if (f.error.isError())
            entry[QStringLiteral("error")] = f.error.message;
        fileArray.append(entry);
    }
    obj[QStringLiteral("files")] = fileArray;

    if (!downloadUrl.isEmpty()) {
        obj[QStringLiteral("resultUrl")] = downloadUrl;
        obj[QStringLiteral("filename")] = archiveFileName;
        obj[QStringLiteral("expiresAt")] = urlExpiresAt.toString(Qt::ISODate);
    }
    if (error.isError())
        obj[QStringLiteral("error")] = error.message;
    obj[QStringLiteral("createdAt")] = createdAt.toString(Qt::ISODate);
    obj[QStringLiteral("updatedAt")] = updatedAt.toString(Qt::ISODate);
    return obj;
}
