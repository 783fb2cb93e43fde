#include "cscore.hpp"
#include <common/string_utils.hpp>
#include <algorithm>
#include <omp.h>

blasttab::BestScoreIndex blasttab::BestScoreIndex::Build(const std::vector<HitRecord> &hits) {
    BestScoreIndex res;
    for(const HitRecord &hit : hits) {
        double &qbest = res.best[hit.query()];
        if(hit.score() > qbest)
            qbest = hit.score();
        double &sbest = res.best[hit.subject()];
        if(hit.score() > sbest)
            sbest = hit.score();
    }
    return res;
}

double blasttab::BestScoreIndex::get(const std::string &id) const {
    auto it = best.find(id);
    return it == best.end() ? 0 : it->second;
}

namespace {
    void keepMax(blasttab::CScoreTable &table, const std::pair<std::string, std::string> &pair, double value) {
        auto it = table.find(pair);
        if(it == table.end())
            table.emplace(pair, value);
        else if(value > it->second)
            it->second = value;
    }
}

blasttab::CScoreTable blasttab::scorePairs(const std::vector<HitRecord> &hits, const BestScoreIndex &index,
                                           double cutoff, size_t threads) {
    threads = std::max<size_t>(1, threads);
    std::vector<CScoreTable> partial(threads);
#pragma omp parallel for shared(hits, index, partial) num_threads(threads) schedule(static)
    for(size_t i = 0; i < hits.size(); i++) {
        const HitRecord &hit = hits[i];
        double c = hit.score() / std::max(index.get(hit.query()), index.get(hit.subject()));
        if(c > cutoff)
            keepMax(partial[omp_get_thread_num()], {hit.query(), hit.subject()}, c);
    }
    CScoreTable res;
    for(const CScoreTable &table : partial) {
        for(const auto &it : table)
            keepMax(res, it.first, it.second);
    }
    return res;
}

std::string blasttab::CScoreLine(const std::string &query, const std::string &subject, double cscore) {
    return query + "\t" + subject + "\t" + formatFixed(cscore, 2);
}
