/*
 * documentreconstructor.h - Rebuild the output PDF from per-chunk renders
 *
 * The renderer only ever sees unique labels. This class replays the
 * expansion sequence against the chunk documents it returned, so that
 * output page k shows unique block sequence[k]. Each occurrence gets its
 * own page object and content stream; fonts and images are shared.
 *
 * A chunk document that cannot be loaded is skipped with a warning and its
 * pages are left out. Only when nothing at all can be assembled does
 * reconstruction fail.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef ZPLFORGE_DOCUMENTRECONSTRUCTOR_H
#define ZPLFORGE_DOCUMENTRECONSTRUCTOR_H

#include <QByteArray>
#include <QList>

#include "blockparser.h"
#include "chunkplanner.h"
#include "conversionerror.h"

struct ReconstructResult {
    QByteArray pdf;
    int pageCount = 0;
    int skippedPages = 0;
    QList<int> unavailableChunks;
    ConversionError error;

    bool ok() const { return !error.isError(); }
};

class DocumentReconstructor
{
public:
    // chunkPdfs[i] is the renderer output for chunks[i]; an empty entry
    // marks a chunk with no document.
    ReconstructResult reconstruct(const QList<QByteArray> &chunkPdfs,
                                  const QList<ChunkPlanner::ChunkRange> &chunks,
                                  const BlockParser::ExpansionSequence &sequence) const;
};

#endif // ZPLFORGE_DOCUMENTRECONSTRUCTOR_H
