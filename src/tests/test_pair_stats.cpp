#include "test_utils.hpp"
#include <blasttab/pair_stats.hpp>

using namespace blasttab;

namespace {
    std::vector<LocatedFeature> mateScenario(bool with_second_pair) {
        std::vector<LocatedFeature> features = {
                {"read1.f", "chr1", 1, 100, '+'},
                {"read1.r", "chr1", 201, 300, '-'}
        };
        if(with_second_pair) {
            features.push_back({"read2.r", "chr1", 1301, 1401, '+'});
            features.push_back({"read2.f", "chr1", 1001, 1100, '-'});
        }
        return features;
    }

    PairStatsParams orientationParams(const std::string &orientation) {
        PairStatsParams params;
        params.mate_orientation = orientation;
        return params;
    }
}

TEST(PairStatsTest, PairKey) {
    PairStatsEngine engine{PairStatsParams()};
    ASSERT_EQ(engine.pairKey("read1.f"), "read1.");
    PairStatsParams params;
    params.rclip = 2;
    ASSERT_EQ(PairStatsEngine(params).pairKey("read1.f"), "read1");
    ASSERT_EQ(PairStatsEngine(params).pairKey("ab"), "");
}

TEST(PairStatsTest, OrientationFilterExcludesPair) {
    size_t fragments = 0;
    size_t pairs = 0;
    std::vector<PairObservation> all = PairStatsEngine(PairStatsParams()).collectPairs(mateScenario(false), fragments, pairs);
    ASSERT_EQ(pairs, 1u);
    ASSERT_EQ(fragments, 0u);
    ASSERT_EQ(all.size(), 1u);
    ASSERT_EQ(all[0].distance, 300);
    ASSERT_EQ(all[0].orientation, "+-");
    std::vector<PairObservation> filtered = PairStatsEngine(orientationParams("-+")).collectPairs(mateScenario(false),
                                                                                                    fragments, pairs);
    ASSERT_EQ(pairs, 1u);
    ASSERT_TRUE(filtered.empty());
    ASSERT_THROW(PairStatsEngine(orientationParams("-+")).compute(mateScenario(false)), std::runtime_error);
}

TEST(PairStatsTest, EstimatedCutoffFromMatchingPairs) {
    PairStats stats = PairStatsEngine(orientationParams("-+")).compute(mateScenario(true));
    ASSERT_EQ(stats.pairs, 2u);
    ASSERT_TRUE(stats.cutoff_estimated);
    ASSERT_EQ(stats.cutoff, 820);
    ASSERT_EQ(stats.linked.size(), 1u);
    ASSERT_EQ(stats.linked[0].distance, 401);
    ASSERT_EQ(stats.linked[0].orientation, "-+");
    ASSERT_EQ(stats.orientations.size(), 1u);
    ASSERT_EQ(stats.orientations.at("-+"), 1u);
}

TEST(PairStatsTest, EdgeToEdgeMode) {
    PairStatsParams params;
    params.mode = DistMode::EdgeToEdge;
    params.cutoff = 1000;
    PairStats stats = PairStatsEngine(params).compute(mateScenario(true));
    ASSERT_FALSE(stats.cutoff_estimated);
    ASSERT_EQ(stats.linked_distances, std::vector<long long>({100, 200}));
}

TEST(PairStatsTest, Statistics) {
    std::vector<LocatedFeature> features;
    for(long long i = 1; i <= 100; i++) {
        std::string name = "pair" + std::to_string(i);
        features.push_back({name + "/1", "ctg", 1, 5, '+'});
        features.push_back({name + "/2", "ctg", 2, i * 10, '-'});
    }
    PairStatsParams params;
    params.cutoff = 2000;
    PairStats stats = PairStatsEngine(params).compute(features);
    ASSERT_EQ(stats.pairs, 100u);
    ASSERT_EQ(stats.linked.size(), 100u);
    ASSERT_EQ(stats.p025, 30);
    ASSERT_EQ(stats.p975, 980);
    ASSERT_DOUBLE_EQ(stats.median, 505);
    ASSERT_DOUBLE_EQ(stats.mean, 505);
    ASSERT_NEAR(stats.stdev, 288.6, 0.1);
    ASSERT_EQ(stats.orientations.at("+-"), 100u);

    params.cutoff = 500;
    PairStats capped = PairStatsEngine(params).compute(features);
    ASSERT_EQ(capped.linked.size(), 50u);
    ASSERT_EQ(capped.linked_distances.back(), 500);
}

TEST(PairStatsTest, FragmentsAndOtherSequences) {
    std::vector<LocatedFeature> features = {
            {"lone.f", "chr1", 1, 100, '+'},
            {"multi.f", "chr1", 1, 100, '+'},
            {"multi.r", "chr1", 201, 300, '-'},
            {"multi.x", "chr1", 401, 500, '-'},
            {"split.f", "chr1", 1, 100, '+'},
            {"split.r", "chr2", 201, 300, '-'},
            {"good.f", "chr1", 1, 100, '+'},
            {"good.r", "chr1", 201, 300, '-'}
    };
    size_t fragments = 0;
    size_t pairs = 0;
    std::vector<PairObservation> all = PairStatsEngine(PairStatsParams()).collectPairs(features, fragments, pairs);
    ASSERT_EQ(fragments, 4u);
    ASSERT_EQ(pairs, 2u);
    ASSERT_EQ(all.size(), 1u);
    ASSERT_EQ(all[0].name, "good.f");
    ASSERT_EQ(all[0].mate, "good.r");
}

TEST(PairStatsTest, Median) {
    ASSERT_DOUBLE_EQ(PairStatsEngine::Median({1, 2, 10}), 2);
    ASSERT_DOUBLE_EQ(PairStatsEngine::Median({1, 2, 10, 11}), 6);
    ASSERT_THROW(PairStatsEngine::Median({}), std::runtime_error);
}

TEST(PairStatsTest, EstimateCutoff) {
    ASSERT_EQ(PairStatsEngine::EstimateCutoff({60, 40, 50}, 20), 100);
    ASSERT_EQ(PairStatsEngine::EstimateCutoff({401}, 20), 820);
    ASSERT_EQ(PairStatsEngine::EstimateCutoff({401}, 1), 802);
    ASSERT_THROW(PairStatsEngine::EstimateCutoff({}, 20), std::runtime_error);
}

TEST(PairStatsTest, InvalidParameters) {
    ASSERT_THROW(PairStatsEngine(orientationParams("+x")), std::invalid_argument);
    PairStatsParams params;
    params.bins = 0;
    ASSERT_THROW(PairStatsEngine{params}, std::invalid_argument);
}

TEST(PairStatsTest, BedFeatures) {
    LocatedFeature feature = LocatedFeature::FromBedLine("chr1\t99\t200\tread1.f\t60\t-");
    ASSERT_EQ(feature.seqid, "chr1");
    ASSERT_EQ(feature.start, 100);
    ASSERT_EQ(feature.end, 200);
    ASSERT_EQ(feature.accn, "read1.f");
    ASSERT_EQ(feature.strand, '-');
    ASSERT_THROW(LocatedFeature::FromBedLine("chr1\t99\t200\tread1.f"), ParseError);
    ASSERT_THROW(LocatedFeature::FromBedLine("chr1\tx\t200\tread1.f\t60\t+"), ParseError);
    ASSERT_THROW(LocatedFeature::FromBedLine("chr1\t99\t200\tread1.f\t60\t."), ParseError);

    std::experimental::filesystem::path file = WriteTempFile("features.bed",
            "track name=reads\n# comment\nchr1\t0\t100\tread1.f\t0\t+\n\nchr1\t200\t300\tread1.r\t0\t-\n");
    std::vector<LocatedFeature> features = ReadBedFeatures(file);
    ASSERT_EQ(features.size(), 2u);
    ASSERT_EQ(features[1].accn, "read1.r");
    ASSERT_EQ(features[1].start, 201);
}

TEST(PairStatsTest, FeatureFromProjection) {
    HitRecord hit = HitRecord::parse("read1.f\tchr1\t100\t100\t0\t0\t1\t100\t300\t201\t1e-40\t200");
    LocatedFeature feature = LocatedFeature::FromProjection(hit.projection());
    ASSERT_EQ(feature.accn, "read1.f");
    ASSERT_EQ(feature.seqid, "chr1");
    ASSERT_EQ(feature.start, 201);
    ASSERT_EQ(feature.end, 300);
    ASSERT_EQ(feature.strand, '-');
}
