#include "outputformat.h"

namespace OutputFormats {

OutputFormat fromString(const QString &text)
{
    const QString t = text.trimmed().toLower();
    if (t == QLatin1String("png"))
        return OutputFormat::Png;
    if (t == QLatin1String("jpeg") || t == QLatin1String("jpg"))
        return OutputFormat::Jpeg;
    return OutputFormat::Pdf;
}

QString toString(OutputFormat format)
{
    switch (format) {
    case OutputFormat::Pdf:  return QStringLiteral("pdf");
    case OutputFormat::Png:  return QStringLiteral("png");
    case OutputFormat::Jpeg: return QStringLiteral("jpeg");
    }
    return QStringLiteral("pdf");
}

QString extension(OutputFormat format)
{
    switch (format) {
    case OutputFormat::Pdf:  return QStringLiteral("pdf");
    case OutputFormat::Png:  return QStringLiteral("png");
    case OutputFormat::Jpeg: return QStringLiteral("jpg");
    }
    return QStringLiteral("pdf");
}

QString mimeType(OutputFormat format)
{
    switch (format) {
    case OutputFormat::Pdf:  return QStringLiteral("application/pdf");
    case OutputFormat::Png:  return QStringLiteral("image/png");
    case OutputFormat::Jpeg: return QStringLiteral("image/jpeg");
    }
    return QStringLiteral("application/octet-stream");
}

} // namespace OutputFormats
