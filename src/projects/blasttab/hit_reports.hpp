#pragma once

#include "hit_record.hpp"
#include "lookup_tables.hpp"
#include <string>
#include <utility>
#include <vector>

namespace blasttab {

    // Top n hits of one query group by descending score (stable). With hsps every hit to a selected subject is kept.
    std::vector<HitRecord> bestHits(std::vector<HitRecord> group, size_t n = 1, bool hsps = false);

    struct HitFilter {
        double score = 0;
        double pctid = 95;
        long long hitlen = 100;
        double evalue = .01;

        bool pass(const HitRecord &hit) const {
            return hit.score() >= score && hit.pctid() >= pctid && hit.hitlen() >= hitlen && hit.evalue() <= evalue;
        }
    };

    enum class SortKey {
        QueryScore,       // query, then descending score
        QueryPosition,    // query, then query start
        SubjectPosition   // subject, then subject start
    };

    void sortHits(std::vector<HitRecord> &hits, SortKey key);

    struct Interval {
        std::string seqid;
        long long start;
        long long end;
    };

    // Number of positions covered by the union of inclusive intervals.
    long long rangeUnion(std::vector<Interval> intervals);

    struct CoverageSummary {
        long long query_covered = 0;
        long long ref_covered = 0;
        double identity = 0;
    };

    // Covered bases on both sides and the alignment identity weighted by subject span.
    CoverageSummary summarize(const std::vector<HitRecord> &hits);

    struct Completeness {
        std::string query;
        std::string subject;
        long long nterminal;
        long long cterminal;
    };

    // Distances of the aligned subject block to both ends of the subject of the first hit. Throws LookupError.
    Completeness completeness(const std::vector<HitRecord> &group, const SizeIndex &sizes);

    struct QueryCoverage {
        std::string query;
        long long covered = 0;
        long long alignlen = 0;
        long long mismatches = 0;
        long long gaps = 0;
        double identity = 0;
        double coverage = 0;
    };

    // Identity and coverage of one query group. Zero alignment length or query length is not guarded.
    QueryCoverage queryCoverage(const std::vector<HitRecord> &group, const SizeIndex &sizes);

    // Most frequent subjects, ties by id.
    std::vector<std::pair<std::string, size_t>> topSubjects(const std::vector<HitRecord> &hits, size_t n = 10);

    // Counts of values 0..max_value (larger values are not shown), as a vertical text histogram.
    std::vector<std::string> histogramLines(const std::vector<long long> &data, long long max_value = 20);

    std::string percentage(size_t a, size_t b);
}
