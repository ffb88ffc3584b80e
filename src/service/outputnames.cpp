#include "outputnames.h"

namespace OutputNames {

static QString timestamp(const QDateTime &when)
{
    return when.toString(QStringLiteral("yyyyMMddHHmmss"));
}

QString fileExtension(OutputFormat format)
{
    return OutputFormats::isImage(format) ? QStringLiteral("zip") : OutputFormats::extension(format);
}

QString downloadName(LabelSize size, OutputFormat format, const QDateTime &when)
{
    return QStringLiteral("zplpdf_%1_%2.%3")
        .arg(LabelSizes::toString(size), timestamp(when), fileExtension(format));
}

QString storageKey(const QString &jobId, OutputFormat format)
{
    return QStringLiteral("labels/label-%1.%2").arg(jobId, fileExtension(format));
}

QString batchTempKey(const QString &batchId, const QString &jobId, OutputFormat format)
{
    return QStringLiteral("batches/%1/%2.%3").arg(batchId, jobId, fileExtension(format));
}

QString batchArchiveName(LabelSize size, const QDateTime &when)
{
    return QStringLiteral("zplpdf_batch_%1_%2.zip").arg(LabelSizes::toString(size), timestamp(when));
}

QString batchArchiveKey(const QString &batchId)
{
    return QStringLiteral("batches/%1.zip").arg(batchId);
}

} // namespace OutputNames
