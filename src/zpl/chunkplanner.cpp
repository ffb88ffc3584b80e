/*
 * chunkplanner.cpp - Partition the unique block set into renderer-sized windows
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "chunkplanner.h"

#include <algorithm>

namespace ChunkPlanner {

QList<ChunkRange> plan(int count, int cap)
{
    QList<ChunkRange> ranges;
    if (count <= 0)
        return ranges;
    cap = std::max(cap, 1);

    ranges.reserve((count + cap - 1) / cap);
    for (int start = 0; start < count; start += cap)
        ranges.append({start, std::min(start + cap, count)});
    return ranges;
}

int chunkOf(const QList<ChunkRange> &chunks, int uniqueIndex)
{
    // Ranges are sorted and contiguous
    auto it = std::upper_bound(chunks.cbegin(), chunks.cend(), uniqueIndex,
                               [](int value, const ChunkRange &r) { return value < r.end; });
    if (it == chunks.cend() || !it->contains(uniqueIndex))
        return -1;
    return static_cast<int>(std::distance(chunks.cbegin(), it));
}

} // namespace ChunkPlanner
