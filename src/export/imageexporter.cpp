/*
 * imageexporter.cpp - Raster output for PNG/JPEG conversions
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "imageexporter.h"
#include "ziparchive.h"

#include <QBuffer>
#include <QDebug>
#include <QHash>
#include <QPainter>
#include <QtConcurrent/QtConcurrentMap>

#include <poppler-qt6.h>

#include <algorithm>
#include <memory>

namespace {

struct ChunkImages {
    int index = 0;
    QByteArray pdf;
    ChunkPlanner::ChunkRange range;
    QList<QImage> images;
};

} // namespace

ImageExporter::ImageExporter(const Options &options)
    : m_options(options)
{
    m_options.dpi = std::max(m_options.dpi, 36);
    m_options.jpegQuality = std::clamp(m_options.jpegQuality, 1, 100);
}

QList<QImage> ImageExporter::rasterize(const QList<QByteArray> &chunkPdfs,
                                       const QList<ChunkPlanner::ChunkRange> &chunks,
                                       int uniqueCount) const
{
    QList<QImage> images(std::max(uniqueCount, 0));

    QList<ChunkImages> work;
    for (int i = 0; i < chunks.size() && i < chunkPdfs.size(); ++i)
        work.append({i, chunkPdfs[i], chunks[i], {}});

    const int dpi = m_options.dpi;
    QtConcurrent::blockingMap(work, [dpi](ChunkImages &chunk) {
        if (chunk.pdf.isEmpty())
            return;
        std::unique_ptr<Poppler::Document> doc = Poppler::Document::loadFromData(chunk.pdf);
        if (!doc || doc->isLocked()) {
            qWarning() << "ImageExporter: chunk" << chunk.index << "is not a readable PDF";
            return;
        }
        doc->setRenderHint(Poppler::Document::Antialiasing, true);
        doc->setRenderHint(Poppler::Document::TextAntialiasing, true);

        const int pages = std::min(doc->numPages(), chunk.range.size());
        for (int p = 0; p < pages; ++p) {
            std::unique_ptr<Poppler::Page> page(doc->page(p));
            chunk.images.append(page ? page->renderToImage(dpi, dpi) : QImage());
        }
    });

    for (const ChunkImages &chunk : work) {
        if (chunk.images.size() < chunk.range.size())
            qWarning() << "ImageExporter: chunk" << chunk.index << "yielded"
                       << chunk.images.size() << "of" << chunk.range.size() << "image(s)";
        for (int p = 0; p < chunk.images.size(); ++p) {
            const int unique = chunk.range.start + p;
            if (unique < images.size())
                images[unique] = chunk.images[p];
        }
    }
    return images;
}

QByteArray ImageExporter::encode(const QImage &image, OutputFormat format) const
{
    QByteArray bytes;
    if (image.isNull())
        return bytes;

    QBuffer buffer(&bytes);
    buffer.open(QIODevice::WriteOnly);

    bool written = false;
    if (format == OutputFormat::Jpeg) {
        // JPEG has no alpha channel; flatten onto white
        QImage flat(image.size(), QImage::Format_RGB32);
        flat.fill(Qt::white);
        QPainter painter(&flat);
        painter.drawImage(0, 0, image);
        painter.end();
        written = flat.save(&buffer, "JPEG", m_options.jpegQuality);
    } else {
        written = image.save(&buffer, "PNG");
    }

    if (!written)
        bytes.clear();
    return bytes;
}

ImageExporter::Result ImageExporter::package(const QList<QImage> &images,
                                             const BlockParser::ExpansionSequence &sequence,
                                             OutputFormat format) const
{
    Result result;
    if (!OutputFormats::isImage(format)) {
        result.error = ConversionError::make(ConversionError::ArchiveFailed,
                                             QStringLiteral("Image packaging needs PNG or JPEG"));
        return result;
    }

    QHash<int, QByteArray> encoded;     // unique index -> bytes, empty on failure
    ZipArchive zip;
    for (int pos = 0; pos < sequence.size(); ++pos) {
        const int unique = sequence[pos];
        auto it = encoded.constFind(unique);
        if (it == encoded.constEnd()) {
            QByteArray bytes;
            if (unique >= 0 && unique < images.size())
                bytes = encode(images[unique], format);
            if (bytes.isEmpty())
                qWarning() << "ImageExporter: no" << OutputFormats::toString(format)
                           << "image for label" << unique << ", skipping its positions";
            it = encoded.insert(unique, bytes);
        }
        if (it.value().isEmpty()) {
            result.skippedImages++;
            continue;
        }
        zip.addFile(entryName(pos, sequence.size(), format), it.value());
        result.imageCount++;
    }

    if (result.imageCount == 0) {
        result.error = ConversionError::make(
            ConversionError::EmptyDocument, QStringLiteral("No label image could be produced"),
            QJsonObject{{QStringLiteral("skippedImages"), result.skippedImages}});
        return result;
    }

    const ZipArchive::Result built = zip.build();
    if (!built.valid) {
        qWarning() << "ImageExporter: archive failed:" << built.errorMessage;
        result.error = ConversionError::make(ConversionError::ArchiveFailed, built.errorMessage);
        result.imageCount = 0;
        return result;
    }
    result.archive = built.data;
    return result;
}

QList<ImageExporter::Preview> ImageExporter::previews(
    const QList<QImage> &images, const QList<BlockParser::UniqueBlock> &uniqueBlocks) const
{
    QList<Preview> out;
    for (const BlockParser::UniqueBlock &block : uniqueBlocks) {
        Preview preview;
        preview.uniqueIndex = block.index;
        preview.quantity = block.totalCopies;
        if (block.index < images.size())
            preview.png = encode(images[block.index], OutputFormat::Png);
        if (preview.png.isEmpty())
            qWarning() << "ImageExporter: no preview for label" << block.index;
        out.append(preview);
    }
    return out;
}

QString ImageExporter::entryName(int position, int total, OutputFormat format)
{
    const int width = std::max(4, static_cast<int>(QString::number(total).size()));
    return QStringLiteral("label_%1.%2")
        .arg(position + 1, width, 10, QLatin1Char('0'))
        .arg(OutputFormats::extension(format));
}
