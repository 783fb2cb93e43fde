#include "hit_reports.hpp"
#include <common/string_utils.hpp>
#include <common/verify.hpp>
#include <algorithm>
#include <cstdlib>
#include <functional>
#include <map>
#include <tuple>
#include <unordered_set>

std::vector<blasttab::HitRecord> blasttab::bestHits(std::vector<HitRecord> group, size_t n, bool hsps) {
    std::stable_sort(group.begin(), group.end(), [](const HitRecord &a, const HitRecord &b) {
        return a.score() > b.score();
    });
    std::vector<HitRecord> top(group.begin(), group.begin() + std::min(n, group.size()));
    if(!hsps)
        return top;
    std::unordered_set<std::string> selected;
    for(const HitRecord &hit : top)
        selected.insert(hit.subject());
    std::vector<HitRecord> res;
    for(const HitRecord &hit : group) {
        if(selected.find(hit.subject()) != selected.end())
            res.push_back(hit);
    }
    return res;
}

void blasttab::sortHits(std::vector<HitRecord> &hits, SortKey key) {
    switch(key) {
        case SortKey::QueryScore:
            std::stable_sort(hits.begin(), hits.end(), [](const HitRecord &a, const HitRecord &b) {
                return std::make_tuple(std::cref(a.query()), -a.score()) < std::make_tuple(std::cref(b.query()), -b.score());
            });
            break;
        case SortKey::QueryPosition:
            std::stable_sort(hits.begin(), hits.end(), [](const HitRecord &a, const HitRecord &b) {
                return std::make_tuple(std::cref(a.query()), a.qstart()) < std::make_tuple(std::cref(b.query()), b.qstart());
            });
            break;
        case SortKey::SubjectPosition:
            std::stable_sort(hits.begin(), hits.end(), [](const HitRecord &a, const HitRecord &b) {
                return std::make_tuple(std::cref(a.subject()), a.sstart()) < std::make_tuple(std::cref(b.subject()), b.sstart());
            });
            break;
    }
}

long long blasttab::rangeUnion(std::vector<Interval> intervals) {
    if(intervals.empty())
        return 0;
    std::sort(intervals.begin(), intervals.end(), [](const Interval &a, const Interval &b) {
        return std::tie(a.seqid, a.start, a.end) < std::tie(b.seqid, b.start, b.end);
    });
    long long total = 0;
    Interval cur = intervals.front();
    for(const Interval &interval : intervals) {
        if(interval.seqid != cur.seqid || interval.start > cur.end) {
            total += cur.end - cur.start + 1;
            cur = interval;
        } else {
            cur.end = std::max(cur.end, interval.end);
        }
    }
    total += cur.end - cur.start + 1;
    return total;
}

blasttab::CoverageSummary blasttab::summarize(const std::vector<HitRecord> &hits) {
    std::vector<Interval> query_intervals;
    std::vector<Interval> ref_intervals;
    double identicals = 0;
    long long alignlen = 0;
    for(const HitRecord &hit : hits) {
        query_intervals.push_back({hit.query(), std::min(hit.qstart(), hit.qstop()), std::max(hit.qstart(), hit.qstop())});
        ref_intervals.push_back({hit.subject(), hit.sstart(), hit.sstop()});
        long long alen = hit.sstop() - hit.sstart();
        alignlen += alen;
        identicals += hit.pctid() / 100. * double(alen);
    }
    CoverageSummary res;
    res.query_covered = rangeUnion(std::move(query_intervals));
    res.ref_covered = rangeUnion(std::move(ref_intervals));
    res.identity = identicals * 100. / double(alignlen);
    return res;
}

blasttab::Completeness blasttab::completeness(const std::vector<HitRecord> &group, const SizeIndex &sizes) {
    VERIFY(!group.empty());
    const HitRecord &first = group.front();
    long long rmin = first.sstart();
    long long rmax = first.sstop();
    for(const HitRecord &hit : group) {
        rmin = std::min(rmin, hit.sstart());
        rmax = std::max(rmax, hit.sstop());
    }
    long long subject_len = sizes.get(first.subject());
    return {first.query(), first.subject(), rmin - 1, subject_len - rmax + 1};
}

blasttab::QueryCoverage blasttab::queryCoverage(const std::vector<HitRecord> &group, const SizeIndex &sizes) {
    VERIFY(!group.empty());
    QueryCoverage res;
    res.query = group.front().query();
    for(const HitRecord &hit : group) {
        res.covered += std::llabs(hit.qstop() - hit.qstart()) + 1;
        res.alignlen += hit.hitlen();
        res.mismatches += hit.nmismatch();
        res.gaps += hit.ngaps();
    }
    res.identity = 100. - double(res.mismatches + res.gaps) * 100. / double(res.alignlen);
    res.coverage = double(res.covered) * 100. / double(sizes.get(res.query));
    return res;
}

std::vector<std::pair<std::string, size_t>> blasttab::topSubjects(const std::vector<HitRecord> &hits, size_t n) {
    std::map<std::string, size_t> counts;
    for(const HitRecord &hit : hits)
        counts[hit.subject()]++;
    std::vector<std::pair<std::string, size_t>> res(counts.begin(), counts.end());
    std::stable_sort(res.begin(), res.end(), [](const std::pair<std::string, size_t> &a,
                                                const std::pair<std::string, size_t> &b) {
        return a.second > b.second;
    });
    if(res.size() > n)
        res.resize(n);
    return res;
}

std::vector<std::string> blasttab::histogramLines(const std::vector<long long> &data, long long max_value) {
    std::vector<size_t> counts(size_t(max_value) + 1, 0);
    size_t max_count = 0;
    for(long long value : data) {
        if(value < 0 || value > max_value)
            continue;
        counts[value]++;
        max_count = std::max(max_count, counts[value]);
    }
    const size_t width = 50;
    std::vector<std::string> res;
    for(long long value = 0; value <= max_value; value++) {
        size_t count = counts[value];
        size_t bar = max_count == 0 ? 0 : (count * width + max_count - 1) / max_count;
        std::string label = std::to_string(value);
        label = std::string(label.size() < 3 ? 3 - label.size() : 0, ' ') + label;
        res.push_back(label + " | " + std::string(bar, '*') + (count > 0 ? " " + std::to_string(count) : ""));
    }
    return res;
}

std::string blasttab::percentage(size_t a, size_t b) {
    return std::to_string(a) + " of " + std::to_string(b) + " (" + formatFixed(double(a) * 100. / double(b), 1) + "%)";
}
