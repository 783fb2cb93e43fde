#pragma once

#include "hit_record.hpp"
#include "ranges.hpp"
#include <common/logging.hpp>
#include <experimental/filesystem>
#include <map>
#include <string>
#include <vector>

namespace blasttab {

    // A read placed on a sequence, 1-based inclusive coordinates.
    struct LocatedFeature {
        std::string accn;
        std::string seqid;
        long long start;
        long long end;
        char strand;

        // BED6 line: seqid, 0-based start, end, name, score, strand. Throws ParseError.
        static LocatedFeature FromBedLine(const std::string &line);
        static LocatedFeature FromProjection(const Projection &projection);
    };

    std::vector<LocatedFeature> ReadBedFeatures(const std::experimental::filesystem::path &file_name);

    struct PairObservation {
        std::string name;
        std::string mate;
        long long distance;
        std::string orientation;
    };

    struct PairStatsParams {
        size_t rclip = 1;
        // 0 or less: estimate from the data
        long long cutoff = 0;
        // empty: all orientations
        std::string mate_orientation;
        DistMode mode = DistMode::OuterSpan;
        long long bins = 20;

        // Throws std::invalid_argument on an unknown orientation or non-positive bin size.
        void validate() const;
    };

    struct PairStats {
        size_t fragments = 0;
        size_t pairs = 0;
        long long cutoff = 0;
        bool cutoff_estimated = false;
        std::vector<PairObservation> linked;
        // distances of linked pairs in ascending order
        std::vector<long long> linked_distances;
        double mean = 0;
        double stdev = 0;
        double median = 0;
        long long p025 = 0;
        long long p975 = 0;
        std::map<std::string, size_t> orientations;

        void report(logging::Logger &logger) const;
    };

    class PairStatsEngine {
    private:
        PairStatsParams params;
    public:
        explicit PairStatsEngine(PairStatsParams _params);

        std::string pairKey(const std::string &accn) const;
        // Mate pairs with a valid distance that pass the orientation filter.
        std::vector<PairObservation> collectPairs(std::vector<LocatedFeature> features, size_t &fragments, size_t &pairs) const;
        // Throws std::runtime_error if there is nothing to estimate the cutoff from or no pair is linked.
        PairStats compute(std::vector<LocatedFeature> features) const;

        // Median of a sorted sequence, middle values averaged for even size.
        static double Median(const std::vector<long long> &sorted);
        // Twice the median rounded up to a multiple of bins, one estimate without refinement.
        static long long EstimateCutoff(std::vector<long long> distances, long long bins);
    };

    extern const std::vector<std::string> MATE_ORIENTATIONS;
}
