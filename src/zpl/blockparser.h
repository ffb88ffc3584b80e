/*
 * blockparser.h - Split ZPL text into label blocks and deduplicate them
 *
 * A block is one ^XA ... ^XZ label. Blocks are normalized (line breaks
 * removed, whitespace runs collapsed, boundary markers enforced) and their
 * ^PQ repeat directive is lifted out into a copy count, so two labels that
 * differ only in quantity share one unique entry.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef ZPLFORGE_BLOCKPARSER_H
#define ZPLFORGE_BLOCKPARSER_H

#include <QHash>
#include <QList>
#include <QString>

#include "conversionerror.h"

namespace BlockParser {

// Largest quantity a ^PQ command accepts; larger values are clamped
constexpr int kMaxCopiesPerBlock = 99999999;

// Expanded labels one submission may produce
constexpr int kMaxTotalLabels = 10000000;

struct ParsedBlock {
    QString content;        // normalized, ^PQ stripped
    int copies = 1;
    int originalIndex = 0;  // position in the submission
};

struct UniqueBlock {
    QString content;
    int index = 0;          // position in the unique set
    int firstOccurrence = 0;
    int totalCopies = 0;    // summed over every occurrence
};

// One entry per output label; each value indexes the unique set.
using ExpansionSequence = QList<int>;

struct ParseResult {
    QList<ParsedBlock> blocks;
    ConversionError error;
    bool valid() const { return !error.isError(); }
};

struct DedupResult {
    QList<UniqueBlock> uniqueBlocks;
    ExpansionSequence sequence;
};

struct LabelCount {
    int totalUniqueLabels = 0;  // blocks found in the text
    int totalLabels = 0;        // sum of copies
    ConversionError error;
};

// Collapse whitespace and make sure the block starts with ^XA and ends with ^XZ
QString normalizeBlock(const QString &block);

// Extract every block. No blocks at all is a NoValidBlocks error; more than
// kMaxTotalLabels expanded labels is a LimitDenied error.
ParseResult parse(const QString &text);

// Single pass building the unique set and the expansion sequence together.
// Blocks expanding past kMaxTotalLabels give an empty result.
DedupResult deduplicate(const QList<ParsedBlock> &blocks);

LabelCount countLabels(const QString &text);

// Number of ^XA start markers in a renderer payload
int countBlockStarts(const QString &payload);

// Renderer payload for unique blocks [start, end), one block per line
QString joinPayload(const QList<UniqueBlock> &blocks, int start, int end);

} // namespace BlockParser

#endif // ZPLFORGE_BLOCKPARSER_H
