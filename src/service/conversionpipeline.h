/*
 * conversionpipeline.h - parse, deduplicate, chunk, render, reassemble
 *
 * One run converts one ZPL document. All chunks are handed to the render
 * dispatcher at once and waited for together; the dispatcher decides when
 * each one actually reaches the renderer.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef ZPLFORGE_CONVERSIONPIPELINE_H
#define ZPLFORGE_CONVERSIONPIPELINE_H

#include <QByteArray>
#include <QList>
#include <QString>

#include <functional>

#include "blockparser.h"
#include "chunkplanner.h"
#include "conversionerror.h"
#include "imageexporter.h"
#include "labelsize.h"
#include "outputformat.h"
#include "plantier.h"

class RenderDispatcher;

class ConversionPipeline
{
public:
    struct Request {
        QString jobId;
        QString userId;
        PlanTier tier = PlanTier::Free;
        QString zpl;
        LabelSize labelSize = LabelSize::TwoByOne;
        OutputFormat format = OutputFormat::Pdf;
    };

    struct Output {
        QByteArray data;            // PDF, or zip of images
        QString mimeType;
        int labelCount = 0;         // labels requested, copies included
        int pageCount = 0;          // pages or images produced
        int skippedLabels = 0;
        ConversionError error;

        bool ok() const { return !error.isError(); }
    };

    struct PreviewOutput {
        QList<ImageExporter::Preview> previews;
        ConversionError error;
    };

    // Called with 10 when rendering starts, up to 80 as chunks complete,
    // and 90 once the output is assembled.
    using ProgressCallback = std::function<void(int)>;

    ConversionPipeline(RenderDispatcher &dispatcher, const ImageExporter::Options &imageOptions);

    Output run(const Request &request, const ProgressCallback &progress = ProgressCallback()) const;

    // One PNG per unique label together with its total quantity
    PreviewOutput previews(const Request &request) const;

    static QString mimeTypeFor(OutputFormat format);

private:
    struct Rendered {
        BlockParser::DedupResult dedup;
        QList<ChunkPlanner::ChunkRange> chunks;
        QList<QByteArray> chunkPdfs;
        ConversionError error;
    };

    Rendered render(const Request &request, const ProgressCallback &progress) const;

    RenderDispatcher &m_dispatcher;
    ImageExporter::Options m_imageOptions;
};

#endif // ZPLFORGE_CONVERSIONPIPELINE_H
