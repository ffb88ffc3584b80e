/*
 * imageexporter.h - Raster output for PNG/JPEG conversions
 *
 * Every unique label is rasterized exactly once from its chunk's rendered
 * PDF. Packaging then walks the expansion sequence and writes one archive
 * entry per output label, reusing the encoded image of its unique block.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef ZPLFORGE_IMAGEEXPORTER_H
#define ZPLFORGE_IMAGEEXPORTER_H

#include <QByteArray>
#include <QImage>
#include <QList>

#include "blockparser.h"
#include "chunkplanner.h"
#include "conversionerror.h"
#include "outputformat.h"

class ImageExporter
{
public:
    struct Options {
        int dpi = 203;
        int jpegQuality = 90;
    };

    struct Result {
        QByteArray archive;
        int imageCount = 0;
        int skippedImages = 0;
        ConversionError error;

        bool ok() const { return !error.isError(); }
    };

    struct Preview {
        int uniqueIndex = 0;
        QByteArray png;
        int quantity = 0;
    };

    explicit ImageExporter(const Options &options);

    // One image per unique block, indexed like the unique set. A null image
    // marks a block whose chunk could not be read.
    QList<QImage> rasterize(const QList<QByteArray> &chunkPdfs,
                            const QList<ChunkPlanner::ChunkRange> &chunks,
                            int uniqueCount) const;

    // format must be Png or Jpeg
    Result package(const QList<QImage> &images,
                   const BlockParser::ExpansionSequence &sequence,
                   OutputFormat format) const;

    QList<Preview> previews(const QList<QImage> &images,
                            const QList<BlockParser::UniqueBlock> &uniqueBlocks) const;

    // "label_0001.png"; the counter widens past 9999 labels
    static QString entryName(int position, int total, OutputFormat format);

private:
    QByteArray encode(const QImage &image, OutputFormat format) const;

    Options m_options;
};

#endif // ZPLFORGE_IMAGEEXPORTER_H
