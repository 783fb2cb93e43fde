#pragma once

#include "errors.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace blasttab {

    // BED6 view of a hit on the subject axis: 0-based half-open interval.
    struct Projection {
        std::string seqid;
        long long start;
        long long end;
        std::string name;
        double score;
        char strand;

        std::string toText() const;
    };

    // One line of a 12-column tabular BLAST report (-m8 / -outfmt 6).
    // Subject coordinates are normalized so that sstart <= sstop, the original direction is kept in orientation.
    // Query coordinates are stored exactly as given.
    class HitRecord {
    private:
        std::string query_;
        std::string subject_;
        double pctid_;
        long long hitlen_;
        long long nmismatch_;
        long long ngaps_;
        long long qstart_;
        long long qstop_;
        long long sstart_;
        long long sstop_;
        double evalue_;
        double score_;
        char orientation_;

    public:
        static const size_t FIELD_NUMBER = 12;

        HitRecord(std::string query, std::string subject, double pctid, long long hitlen,
                  long long nmismatch, long long ngaps, long long qstart, long long qstop,
                  long long sstart, long long sstop, double evalue, double score);

        // Throws ParseError for fewer than 12 tab separated fields or a malformed numeric field.
        static HitRecord parse(const std::string &line);

        const std::string &query() const {return query_;}
        const std::string &subject() const {return subject_;}
        double pctid() const {return pctid_;}
        long long hitlen() const {return hitlen_;}
        long long nmismatch() const {return nmismatch_;}
        long long ngaps() const {return ngaps_;}
        long long qstart() const {return qstart_;}
        long long qstop() const {return qstop_;}
        long long sstart() const {return sstart_;}
        long long sstop() const {return sstop_;}
        double evalue() const {return evalue_;}
        double score() const {return score_;}
        char orientation() const {return orientation_;}
        bool reverse() const {return orientation_ == '-';}

        // Original column order, subject coordinates flipped back for '-' hits.
        std::vector<std::string> fields() const;
        std::string toText() const;
        HitRecord swapped() const;
        Projection projection() const;

        // Aggregate of this and other, used by HSP merging. Keys are checked by the caller.
        HitRecord absorb(const HitRecord &other) const;
        HitRecord withPctid(double pctid) const;

        bool operator==(const HitRecord &other) const;
        bool operator!=(const HitRecord &other) const {return !(*this == other);}
    };

    std::ostream &operator<<(std::ostream &os, const HitRecord &hit);
}
