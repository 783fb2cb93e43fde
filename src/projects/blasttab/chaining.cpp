#include "chaining.hpp"
#include <common/disjoint_sets.hpp>
#include <common/verify.hpp>
#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <tuple>

long long blasttab::hitDistance(const HitRecord &a, const HitRecord &b, bool query_axis) {
    // Both hits live on one dummy axis, only their relative placement matters.
    Range arange = query_axis ? Range{"0", a.qstart(), a.qstop(), a.orientation()}
                              : Range{"0", a.sstart(), a.sstop(), a.orientation()};
    Range brange = query_axis ? Range{"0", b.qstart(), b.qstop(), b.orientation()}
                              : Range{"0", b.sstart(), b.sstop(), b.orientation()};
    return std::llabs(rangeDistance(arange, brange, DistMode::EdgeToEdge).distance);
}

blasttab::HitRecord blasttab::mergeHits(const std::vector<HitRecord> &cluster) {
    VERIFY_MSG(!cluster.empty(), "Attempt to merge an empty cluster of hits");
    if(cluster.size() == 1)
        return cluster.front();
    HitRecord merged = cluster.front();
    for(size_t i = 1; i < cluster.size(); i++) {
        const HitRecord &hit = cluster[i];
        VERIFY_MSG(merged.query() == hit.query() && merged.subject() == hit.subject() &&
                   merged.orientation() == hit.orientation(),
                   "Cannot merge hits with different keys: " << merged.query() << " " << merged.subject() << " "
                   << merged.orientation() << " vs " << hit.query() << " " << hit.subject() << " " << hit.orientation());
        merged = merged.absorb(hit);
    }
    // hitlen 0 gives inf or nan
    double pctid = 100 - double(merged.nmismatch() + merged.ngaps()) * 100. / double(merged.hitlen());
    return merged.withPctid(pctid);
}

std::vector<blasttab::HitRecord> blasttab::chainHits(std::vector<HitRecord> hits, long long xdist, long long ydist) {
    if(xdist <= 0 || ydist <= 0)
        throw std::invalid_argument("chaining distances should be positive, got " + std::to_string(xdist) +
                                    " and " + std::to_string(ydist));
    std::stable_sort(hits.begin(), hits.end(), [](const HitRecord &a, const HitRecord &b) {
        return std::tie(a.query(), a.subject()) < std::tie(b.query(), b.subject());
    });
    std::vector<HitRecord> chained;
    size_t start = 0;
    while(start < hits.size()) {
        size_t end = start;
        while(end < hits.size() && hits[end].query() == hits[start].query() &&
              hits[end].subject() == hits[start].subject())
            end++;
        std::vector<HitRecord> points(hits.begin() + start, hits.begin() + end);
        std::stable_sort(points.begin(), points.end(), [](const HitRecord &a, const HitRecord &b) {
            return std::make_tuple(a.qstart(), a.qstop(), a.sstart(), a.sstop()) <
                   std::make_tuple(b.qstart(), b.qstop(), b.sstart(), b.sstop());
        });
        // handle i of the disjoint set is points[i], so lone hits survive as singleton clusters
        DisjointSet clusters(points.size());
        for(size_t i = 0; i < points.size(); i++) {
            const HitRecord &a = points[i];
            for(size_t j = i + 1; j < points.size(); j++) {
                const HitRecord &b = points[j];
                if(a.orientation() != b.orientation())
                    continue;
                if(hitDistance(a, b, true) > xdist)
                    continue;
                if(hitDistance(a, b, false) > ydist)
                    continue;
                clusters.link(i, j);
            }
        }
        for(const std::vector<size_t> &component : clusters.subsets()) {
            std::vector<HitRecord> members;
            for(size_t id : component)
                members.push_back(points[id]);
            chained.push_back(mergeHits(members));
        }
        start = end;
    }
    std::stable_sort(chained.begin(), chained.end(), [](const HitRecord &a, const HitRecord &b) {
        return a.score() > b.score();
    });
    return chained;
}
