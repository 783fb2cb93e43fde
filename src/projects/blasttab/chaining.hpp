#pragma once

#include "hit_record.hpp"
#include "ranges.hpp"
#include <vector>

namespace blasttab {

    // Absolute edge-to-edge distance between two hits along the query axis (or the subject axis).
    long long hitDistance(const HitRecord &a, const HitRecord &b, bool query_axis = true);

    // Folds a cluster of hits of one (query, subject, orientation) into a single hit: counts and score are summed,
    // coordinates span all members, identity is recomputed from mismatches and gaps.
    // Members with a different key are a logic error and abort the program.
    HitRecord mergeHits(const std::vector<HitRecord> &cluster);

    // Chains HSPs of the same query and subject pair. Two hits of equal orientation are linked when they are within
    // xdist on the query axis and within ydist on the subject axis, clusters are the connected components.
    // Every pair of hits in a partition is compared. Result is sorted by descending score, ties keep partition order.
    // Throws std::invalid_argument unless both distances are positive.
    std::vector<HitRecord> chainHits(std::vector<HitRecord> hits, long long xdist = 100, long long ydist = 100);
}
