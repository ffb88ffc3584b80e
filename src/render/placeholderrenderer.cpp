/*
 * placeholderrenderer.cpp - Offline stand-in for the rendering service
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "placeholderrenderer.h"
#include "pdfwriter.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QRegularExpression>
#include <QStringList>

PlaceholderRenderer::PlaceholderRenderer(int labelCap)
    : m_labelCap(labelCap)
{
}

QByteArray PlaceholderRenderer::pageContent(const QString &block, int ordinal,
                                            const QSizeF &pageSize)
{
    static QRegularExpression fieldRe(QStringLiteral("\\^FD(.*?)\\^FS"));

    QStringList lines;
    lines << QStringLiteral("Label %1").arg(ordinal + 1);
    auto it = fieldRe.globalMatch(block);
    while (it.hasNext())
        lines << it.next().captured(1);

    const qreal fontSize = 10.0;
    const qreal margin = 8.0;

    QByteArray content;
    // Frame
    content += "0.5 w " + Pdf::toPdf(margin / 2) + " " + Pdf::toPdf(margin / 2) + " "
               + Pdf::toPdf(pageSize.width() - margin) + " "
               + Pdf::toPdf(pageSize.height() - margin) + " re S\n";
    content += "BT\n/F1 " + Pdf::toPdf(fontSize) + " Tf\n";
    content += Pdf::toPdf(margin) + " " + Pdf::toPdf(pageSize.height() - margin - fontSize)
               + " Td\n" + Pdf::toPdf(fontSize * 1.2) + " TL\n";
    for (const QString &line : lines)
        content += Pdf::toLiteralString(line.toLatin1()) + " '\n";
    content += "ET\n";
    return content;
}

RenderResult PlaceholderRenderer::render(const QString &payload, LabelSize size)
{
    static QRegularExpression blockRe(QStringLiteral("\\^XA.*?\\^XZ"),
                                      QRegularExpression::DotMatchesEverythingOption);

    RenderResult result;
    QElapsedTimer timer;
    timer.start();

    QStringList blocks;
    auto it = blockRe.globalMatch(payload);
    while (it.hasNext())
        blocks << it.next().captured(0);

    if (blocks.size() > m_labelCap) {
        result.status = RenderResult::PayloadTooLarge;
        result.httpStatus = 413;
        result.errorMessage = QStringLiteral("%1 labels exceed the limit of %2 per request")
                                  .arg(blocks.size())
                                  .arg(m_labelCap);
        return result;
    }
    if (blocks.isEmpty()) {
        result.status = RenderResult::Transient;
        result.httpStatus = 400;
        result.errorMessage = QStringLiteral("Payload holds no labels");
        return result;
    }

    const QSizeF pageSize = LabelSizes::points(size);
    QByteArray output;
    Pdf::Writer writer;
    if (!writer.openBuffer(&output)) {
        result.status = RenderResult::Transient;
        result.errorMessage = QStringLiteral("Cannot open output buffer");
        return result;
    }
    writer.writeHeader();

    const Pdf::ObjId font = writer.writeStandardFont("Helvetica");
    QList<Pdf::ObjId> pages;
    pages.reserve(blocks.size());
    for (int i = 0; i < blocks.size(); ++i)
        pages.append(writer.writePage(pageSize, pageContent(blocks[i], i, pageSize), "F1", font));

    writer.finish(pages, QStringLiteral("ZplForge offline renderer"));
    if (!writer.close()) {
        result.status = RenderResult::Transient;
        result.errorMessage = QStringLiteral("Cannot finish output document");
        return result;
    }

    result.pdf = output;
    result.httpStatus = 200;
    result.responseTimeMs = static_cast<int>(timer.elapsed());
    return result;
}
