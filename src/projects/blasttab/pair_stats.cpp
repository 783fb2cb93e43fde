#include "pair_stats.hpp"
#include <sequences/line_reader.hpp>
#include <common/string_utils.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

const std::vector<std::string> blasttab::MATE_ORIENTATIONS = {"++", "--", "+-", "-+"};

blasttab::LocatedFeature blasttab::LocatedFeature::FromBedLine(const std::string &line) {
    std::vector<std::string> fields = splitFields(line, '\t');
    if(fields.size() < 6)
        throw ParseError("expected 6 tab separated BED fields, found " + itos(fields.size()));
    long long start = 0;
    long long end = 0;
    if(!tryParseLong(fields[1], start) || !tryParseLong(fields[2], end))
        throw ParseError("BED coordinates are not integers: \"" + fields[1] + "\", \"" + fields[2] + "\"");
    if(fields[5] != "+" && fields[5] != "-")
        throw ParseError("BED strand should be + or -, got \"" + fields[5] + "\"");
    return {fields[3], fields[0], start + 1, end, fields[5][0]};
}

blasttab::LocatedFeature blasttab::LocatedFeature::FromProjection(const Projection &projection) {
    return {projection.name, projection.seqid, projection.start + 1, projection.end, projection.strand};
}

std::vector<blasttab::LocatedFeature> blasttab::ReadBedFeatures(const std::experimental::filesystem::path &file_name) {
    io::LineReader reader(file_name);
    std::vector<LocatedFeature> res;
    std::string line;
    while(reader.readLine(line)) {
        if(line.empty() || line[0] == '#' || startsWith(line, "track") || startsWith(line, "browser"))
            continue;
        try {
            res.push_back(LocatedFeature::FromBedLine(line));
        } catch (const ParseError &e) {
            throw ParseError(reader.position() + ": " + e.what());
        }
    }
    return res;
}

void blasttab::PairStatsParams::validate() const {
    if(!mate_orientation.empty() &&
       std::find(MATE_ORIENTATIONS.begin(), MATE_ORIENTATIONS.end(), mate_orientation) == MATE_ORIENTATIONS.end())
        throw std::invalid_argument("mate orientation should be one of ++, --, +-, -+, got \"" + mate_orientation + "\"");
    if(bins <= 0)
        throw std::invalid_argument("histogram bin size should be positive");
}

blasttab::PairStatsEngine::PairStatsEngine(PairStatsParams _params) : params(std::move(_params)) {
    params.validate();
}

std::string blasttab::PairStatsEngine::pairKey(const std::string &accn) const {
    if(params.rclip >= accn.size())
        return "";
    return accn.substr(0, accn.size() - params.rclip);
}

std::vector<blasttab::PairObservation> blasttab::PairStatsEngine::collectPairs(std::vector<LocatedFeature> features,
                                                                               size_t &fragments, size_t &pairs) const {
    std::vector<std::pair<std::string, LocatedFeature>> keyed;
    for(LocatedFeature &feature : features) {
        std::string key = pairKey(feature.accn);
        keyed.emplace_back(std::move(key), std::move(feature));
    }
    std::stable_sort(keyed.begin(), keyed.end(), [](const std::pair<std::string, LocatedFeature> &a,
                                                    const std::pair<std::string, LocatedFeature> &b) {
        return a.first < b.first;
    });
    fragments = 0;
    pairs = 0;
    std::vector<PairObservation> res;
    size_t start = 0;
    while(start < keyed.size()) {
        size_t end = start;
        while(end < keyed.size() && keyed[end].first == keyed[start].first)
            end++;
        if(end - start != 2) {
            fragments += end - start;
            start = end;
            continue;
        }
        pairs++;
        const LocatedFeature &a = keyed[start].second;
        const LocatedFeature &b = keyed[start + 1].second;
        RangeDistance dist = rangeDistance({a.seqid, a.start, a.end, a.strand},
                                           {b.seqid, b.start, b.end, b.strand}, params.mode);
        if(dist.distance >= 0 && (params.mate_orientation.empty() || dist.orientation == params.mate_orientation))
            res.push_back({a.accn, b.accn, dist.distance, dist.orientation});
        start = end;
    }
    return res;
}

double blasttab::PairStatsEngine::Median(const std::vector<long long> &sorted) {
    if(sorted.empty())
        throw std::runtime_error("median of an empty distance list");
    size_t n = sorted.size();
    if(n % 2 == 1)
        return double(sorted[n / 2]);
    return (double(sorted[n / 2 - 1]) + double(sorted[n / 2])) / 2;
}

long long blasttab::PairStatsEngine::EstimateCutoff(std::vector<long long> distances, long long bins) {
    if(distances.empty())
        throw std::runtime_error("no mate pairs to estimate the insert size cutoff from, use --cutoff");
    std::sort(distances.begin(), distances.end());
    auto cutoff = (long long)(2 * Median(distances));
    return (long long)(std::ceil(double(cutoff) / double(bins))) * bins;
}

blasttab::PairStats blasttab::PairStatsEngine::compute(std::vector<LocatedFeature> features) const {
    PairStats stats;
    std::vector<PairObservation> all = collectPairs(std::move(features), stats.fragments, stats.pairs);
    stats.cutoff = params.cutoff;
    if(stats.cutoff <= 0) {
        std::vector<long long> distances;
        for(const PairObservation &obs : all)
            distances.push_back(obs.distance);
        stats.cutoff = EstimateCutoff(std::move(distances), params.bins);
        stats.cutoff_estimated = true;
    }
    for(PairObservation &obs : all) {
        if(obs.distance > stats.cutoff)
            continue;
        stats.linked_distances.push_back(obs.distance);
        stats.orientations[obs.orientation]++;
        stats.linked.push_back(std::move(obs));
    }
    if(stats.linked.empty())
        throw std::runtime_error("no mate pairs are linked within cutoff " + std::to_string(stats.cutoff));
    std::vector<long long> &dist = stats.linked_distances;
    std::sort(dist.begin(), dist.end());
    size_t n = dist.size();
    double sum = 0;
    for(long long d : dist)
        sum += double(d);
    stats.mean = sum / double(n);
    double sq = 0;
    for(long long d : dist)
        sq += (double(d) - stats.mean) * (double(d) - stats.mean);
    stats.stdev = std::sqrt(sq / double(n));
    stats.median = Median(dist);
    stats.p025 = dist[size_t(double(n) * 0.025)];
    stats.p975 = dist[size_t(double(n) * 0.975)];
    return stats;
}

void blasttab::PairStats::report(logging::Logger &logger) const {
    size_t num_links = linked.size();
    logger.report() << fragments << " fragments, " << pairs << " pairs" << std::endl;
    if(cutoff_estimated)
        logger.trace() << "Insert size cutoff set to " << cutoff << ", use --cutoff to override" << std::endl;
    logger.report() << num_links << " pairs (" << formatFixed(double(num_links) * 100. / double(pairs), 1)
                    << "%) are linked (cutoff=" << cutoff << ")" << std::endl;
    logger.report() << "mean distance between mates: " << (long long)mean << " +/- " << (long long)stdev << std::endl;
    logger.report() << "median distance between mates: " << (long long)median << std::endl;
    logger.report() << "95% distance range: " << p025 << " - " << p975 << std::endl;
    logger.report() << "\nOrientations:" << std::endl;
    for(const auto &it : orientations) {
        logger.report() << it.first << ":" << it.second << " ("
                        << formatFixed(double(it.second) * 100. / double(num_links), 1) << "%)" << std::endl;
    }
}
