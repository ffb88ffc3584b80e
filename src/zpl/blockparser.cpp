/*
 * blockparser.cpp - Split ZPL text into label blocks and deduplicate them
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "blockparser.h"

#include <QRegularExpression>
#include <QStringList>

namespace BlockParser {

static const QString kStart = QStringLiteral("^XA");
static const QString kEnd = QStringLiteral("^XZ");

QString normalizeBlock(const QString &block)
{
    static QRegularExpression lineBreaks(QStringLiteral("[\\r\\n]+"));
    static QRegularExpression spaces(QStringLiteral("\\s+"));

    QString normalized = block;
    normalized.remove(lineBreaks);
    normalized.replace(spaces, QStringLiteral(" "));
    normalized = normalized.trimmed();

    if (!normalized.startsWith(kStart))
        normalized.prepend(kStart);
    if (!normalized.endsWith(kEnd))
        normalized.append(kEnd);
    return normalized;
}

// Reads the first ^PQ quantity and removes every ^PQ command (up to the
// next caret). A missing, zero or non-numeric quantity counts as 1.
// Quantities above the ^PQ maximum are clamped to it.
static int extractCopies(QString &content)
{
    static QRegularExpression quantityRe(QStringLiteral("\\^PQ(\\d+)"),
                                         QRegularExpression::CaseInsensitiveOption);
    static QRegularExpression commandRe(QStringLiteral("\\^PQ[^\\^]*"),
                                        QRegularExpression::CaseInsensitiveOption);

    int copies = 1;
    auto m = quantityRe.match(content);
    if (m.hasMatch()) {
        bool ok = false;
        const qlonglong n = m.captured(1).toLongLong(&ok);
        if (!ok)
            copies = kMaxCopiesPerBlock; // digits beyond 64 bits
        else if (n > 0)
            copies = static_cast<int>(qMin<qlonglong>(n, kMaxCopiesPerBlock));
    }
    content.remove(commandRe);
    content = content.trimmed();
    return copies;
}

ParseResult parse(const QString &text)
{
    static QRegularExpression blockRe(QStringLiteral("\\^XA.*?\\^XZ"),
                                      QRegularExpression::DotMatchesEverythingOption);

    ParseResult result;
    int index = 0;
    qint64 total = 0;
    auto it = blockRe.globalMatch(text);
    while (it.hasNext()) {
        auto m = it.next();
        ParsedBlock block;
        block.content = normalizeBlock(m.captured(0));
        block.copies = extractCopies(block.content);
        block.originalIndex = index++;
        total += block.copies;
        result.blocks.append(block);
    }

    if (result.blocks.isEmpty()) {
        result.error = ConversionError::make(
            ConversionError::NoValidBlocks,
            QStringLiteral("No valid ZPL blocks found"));
    } else if (total > kMaxTotalLabels) {
        result.error = ConversionError::make(
            ConversionError::LimitDenied,
            QStringLiteral("Submission expands to more than %1 labels").arg(kMaxTotalLabels),
            QJsonObject{{QStringLiteral("errorCode"), QStringLiteral("LABEL_LIMIT_EXCEEDED")},
                        {QStringLiteral("data"), QJsonObject{{QStringLiteral("requested"), total},
                                                             {QStringLiteral("allowed"), kMaxTotalLabels}}}});
        result.blocks.clear();
    }
    return result;
}

DedupResult deduplicate(const QList<ParsedBlock> &blocks)
{
    DedupResult result;
    QHash<QString, int> indexByContent;

    qint64 total = 0;
    for (const ParsedBlock &block : blocks)
        total += block.copies;
    if (total > kMaxTotalLabels)
        return result;
    result.sequence.reserve(static_cast<int>(total));

    for (const ParsedBlock &block : blocks) {
        auto found = indexByContent.constFind(block.content);
        int idx;
        if (found == indexByContent.constEnd()) {
            idx = result.uniqueBlocks.size();
            indexByContent.insert(block.content, idx);
            UniqueBlock unique;
            unique.content = block.content;
            unique.index = idx;
            unique.firstOccurrence = block.originalIndex;
            result.uniqueBlocks.append(unique);
        } else {
            idx = found.value();
        }

        result.uniqueBlocks[idx].totalCopies += block.copies;
        for (int c = 0; c < block.copies; ++c)
            result.sequence.append(idx);
    }
    return result;
}

LabelCount countLabels(const QString &text)
{
    LabelCount count;
    ParseResult parsed = parse(text);
    if (!parsed.valid()) {
        count.error = parsed.error;
        return count;
    }
    count.totalUniqueLabels = parsed.blocks.size();
    for (const ParsedBlock &block : parsed.blocks)
        count.totalLabels += block.copies;
    return count;
}

int countBlockStarts(const QString &payload)
{
    return payload.count(kStart);
}

QString joinPayload(const QList<UniqueBlock> &blocks, int start, int end)
{
    QStringList lines;
    lines.reserve(end - start);
    for (int i = start; i < end && i < blocks.size(); ++i) {
        QString content = blocks[i].content;
        if (!content.startsWith(kStart))
            content.prepend(kStart);
        if (!content.endsWith(kEnd))
            content.append(kEnd);
        lines.append(content);
    }
    return lines.join(QLatin1Char('\n'));
}

} // namespace BlockParser
