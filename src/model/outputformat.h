#ifndef ZPLFORGE_OUTPUTFORMAT_H
#define ZPLFORGE_OUTPUTFORMAT_H

#include <QString>

enum class OutputFormat {
    Pdf,
    Png,
    Jpeg,
};

namespace OutputFormats {

// "pdf", "png", "jpeg"/"jpg"; unknown -> Pdf
OutputFormat fromString(const QString &text);
QString toString(OutputFormat format);

QString extension(OutputFormat format);
QString mimeType(OutputFormat format);

// Image formats are delivered as a zip of one file per label
inline bool isImage(OutputFormat format) { return format != OutputFormat::Pdf; }

} // namespace OutputFormats

#endif // ZPLFORGE_OUTPUTFORMAT_H
