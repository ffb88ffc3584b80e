/*
 * conversionpipeline.cpp - parse, deduplicate, chunk, render, reassemble
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "conversionpipeline.h"
#include "documentreconstructor.h"
#include "renderdispatcher.h"

#include <QDebug>
#include <QFuture>

namespace {

ConversionError errorFromRender(const RenderResult &result, int chunkIndex)
{
    QJsonObject context{{QStringLiteral("chunk"), chunkIndex},
                        {QStringLiteral("httpStatus"), result.httpStatus}};
    switch (result.status) {
    case RenderResult::Ok:
        break;
    case RenderResult::PayloadTooLarge:
        return ConversionError::make(ConversionError::CapacityExceeded, result.errorMessage, context);
    case RenderResult::Shutdown:
        return ConversionError::make(ConversionError::RendererShutdown, result.errorMessage, context);
    case RenderResult::Transient:
        return ConversionError::make(ConversionError::RendererFailed, result.errorMessage, context);
    }
    return ConversionError();
}

} // namespace

ConversionPipeline::ConversionPipeline(RenderDispatcher &dispatcher,
                                       const ImageExporter::Options &imageOptions)
    : m_dispatcher(dispatcher)
    , m_imageOptions(imageOptions)
{
}

QString ConversionPipeline::mimeTypeFor(OutputFormat format)
{
    return OutputFormats::isImage(format) ? QStringLiteral("application/zip")
                                          : OutputFormats::mimeType(format);
}

ConversionPipeline::Rendered ConversionPipeline::render(const Request &request,
                                                        const ProgressCallback &progress) const
{
    Rendered rendered;

    if (request.zpl.trimmed().isEmpty()) {
        rendered.error = ConversionError::make(ConversionError::EmptyContent,
                                               QStringLiteral("ZPL content is empty"));
        return rendered;
    }

    const BlockParser::ParseResult parsed = BlockParser::parse(request.zpl);
    if (!parsed.valid()) {
        rendered.error = parsed.error;
        return rendered;
    }
    rendered.dedup = BlockParser::deduplicate(parsed.blocks);

    const int cap = m_dispatcher.options().labelCap;
    rendered.chunks = ChunkPlanner::plan(rendered.dedup.uniqueBlocks.size(), cap);

    qDebug() << "ConversionPipeline: job" << request.jobId << parsed.blocks.size() << "block(s),"
             << rendered.dedup.uniqueBlocks.size() << "unique," << rendered.dedup.sequence.size()
             << "label(s)," << rendered.chunks.size() << "chunk(s)";

    if (progress)
        progress(10);

    QList<QFuture<RenderResult>> futures;
    futures.reserve(rendered.chunks.size());
    for (const ChunkPlanner::ChunkRange &chunk : rendered.chunks) {
        const QString payload = BlockParser::joinPayload(rendered.dedup.uniqueBlocks,
                                                         chunk.start, chunk.end);
        futures.append(m_dispatcher.enqueue(request.jobId, request.userId, request.tier,
                                            payload, request.labelSize, chunk.size()));
    }

    // Every future is waited for, even after a failure: the dispatcher has
    // no way to withdraw a queued call.
    rendered.chunkPdfs.reserve(futures.size());
    for (int i = 0; i < futures.size(); ++i) {
        const RenderResult result = futures[i].result();
        if (result.ok()) {
            rendered.chunkPdfs.append(result.pdf);
        } else {
            rendered.chunkPdfs.append(QByteArray());
            if (!rendered.error.isError())
                rendered.error = errorFromRender(result, i);
        }
        if (progress)
            progress(10 + 70 * (i + 1) / futures.size());
    }

    if (rendered.error.isError())
        qWarning() << "ConversionPipeline: job" << request.jobId << "render failed:"
                   << ConversionError::codeName(rendered.error.code) << rendered.error.message
                   << "size=" << LabelSizes::toString(request.labelSize)
                   << "format=" << OutputFormats::toString(request.format);
    return rendered;
}

ConversionPipeline::Output ConversionPipeline::run(const Request &request,
                                                   const ProgressCallback &progress) const
{
    Output output;
    output.mimeType = mimeTypeFor(request.format);

    const Rendered rendered = render(request, progress);
    output.labelCount = rendered.dedup.sequence.size();
    if (rendered.error.isError()) {
        output.error = rendered.error;
        return output;
    }

    if (OutputFormats::isImage(request.format)) {
        ImageExporter exporter(m_imageOptions);
        const QList<QImage> images = exporter.rasterize(rendered.chunkPdfs, rendered.chunks,
                                                        rendered.dedup.uniqueBlocks.size());
        const ImageExporter::Result packaged = exporter.package(images, rendered.dedup.sequence,
                                                                request.format);
        if (!packaged.ok()) {
            output.error = packaged.error;
            return output;
        }
        output.data = packaged.archive;
        output.pageCount = packaged.imageCount;
        output.skippedLabels = packaged.skippedImages;
    } else {
        DocumentReconstructor reconstructor;
        const ReconstructResult rebuilt = reconstructor.reconstruct(rendered.chunkPdfs, rendered.chunks,
                                                                    rendered.dedup.sequence);
        if (!rebuilt.ok()) {
            output.error = rebuilt.error;
            return output;
        }
        output.data = rebuilt.pdf;
        output.pageCount = rebuilt.pageCount;
        output.skippedLabels = rebuilt.skippedPages;
    }

    if (progress)
        progress(90);
    return output;
}

ConversionPipeline::PreviewOutput ConversionPipeline::previews(const Request &request) const
{
    PreviewOutput output;
    const Rendered rendered = render(request, ProgressCallback());
    if (rendered.error.isError()) {
        output.error = rendered.error;
        return output;
    }

    ImageExporter exporter(m_imageOptions);
    const QList<QImage> images = exporter.rasterize(rendered.chunkPdfs, rendered.chunks,
                                                    rendered.dedup.uniqueBlocks.size());
    output.previews = exporter.previews(images, rendered.dedup.uniqueBlocks);
    return output;
}
