/*
 * outputnames.h - File names and storage keys for conversion outputs
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef ZPLFORGE_OUTPUTNAMES_H
#define ZPLFORGE_OUTPUTNAMES_H

#include <QDateTime>
#include <QString>

#include "labelsize.h"
#include "outputformat.h"

namespace OutputNames {

// "pdf" for PDF output, "zip" for image archives
QString fileExtension(OutputFormat format);

// zplpdf_4x6_20261019143000.pdf
QString downloadName(LabelSize size, OutputFormat format,
                     const QDateTime &when = QDateTime::currentDateTime());

// labels/label-<jobId>.pdf
QString storageKey(const QString &jobId, OutputFormat format);

// batches/<batchId>/<jobId>.pdf
QString batchTempKey(const QString &batchId, const QString &jobId, OutputFormat format);

// zplpdf_batch_4x6_20261019143000.zip
QString batchArchiveName(LabelSize size, const QDateTime &when = QDateTime::currentDateTime());

// batches/<batchId>.zip
QString batchArchiveKey(const QString &batchId);

} // namespace OutputNames

#endif // ZPLFORGE_OUTPUTNAMES_H
