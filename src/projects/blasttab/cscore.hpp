#pragma once

#include "hit_record.hpp"
#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace blasttab {

    // Best score of every sequence over all hits it takes part in, as query or as subject.
    // Built once from the complete hit set and only read afterwards.
    class BestScoreIndex {
    private:
        std::unordered_map<std::string, double> best;
    public:
        static BestScoreIndex Build(const std::vector<HitRecord> &hits);

        // 0 for a sequence without hits
        double get(const std::string &id) const;
        size_t size() const {return best.size();}
    };

    typedef std::map<std::pair<std::string, std::string>, double> CScoreTable;

    // C-score of a hit: score / max(best score of query, best score of subject); 1 marks a reciprocal best hit.
    // Keeps pairs with c-score strictly above cutoff, the maximum over repeated pairs, ordered by (query, subject).
    // The max of two different sequences' bests can be larger than the pair score even for the best pair of one of them.
    CScoreTable scorePairs(const std::vector<HitRecord> &hits, const BestScoreIndex &index,
                           double cutoff = 0.9999, size_t threads = 1);

    std::string CScoreLine(const std::string &query, const std::string &subject, double cscore);
}
