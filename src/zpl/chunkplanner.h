/*
 * chunkplanner.h - Partition the unique block set into renderer-sized windows
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef ZPLFORGE_CHUNKPLANNER_H
#define ZPLFORGE_CHUNKPLANNER_H

#include <QList>

namespace ChunkPlanner {

// Half-open window [start, end) over the unique block array
struct ChunkRange {
    int start = 0;
    int end = 0;

    int size() const { return end - start; }
    bool contains(int index) const { return index >= start && index < end; }
    bool operator==(const ChunkRange &o) const { return start == o.start && end == o.end; }
};

// Contiguous, ascending, cap-respecting ranges covering [0, count).
// count <= 0 yields no chunks. cap < 1 is treated as 1.
QList<ChunkRange> plan(int count, int cap);

// Index of the chunk holding the given unique block, or -1
int chunkOf(const QList<ChunkRange> &chunks, int uniqueIndex);

} // namespace ChunkPlanner

#endif // ZPLFORGE_CHUNKPLANNER_H
