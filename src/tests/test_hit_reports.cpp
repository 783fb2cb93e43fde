#include "test_utils.hpp"
#include <blasttab/hit_reports.hpp>

using namespace blasttab;

namespace {
    HitRecord hit(const std::string &query, const std::string &subject, double score) {
        return {query, subject, 100, 100, 0, 0, 1, 100, 1, 100, 1e-20, score};
    }
}

TEST(HitReportsTest, BestHits) {
    std::vector<HitRecord> group = {hit("q", "a", 10), hit("q", "b", 30), hit("q", "c", 20), hit("q", "b", 5)};
    std::vector<HitRecord> best = bestHits(group);
    ASSERT_EQ(best.size(), 1u);
    ASSERT_EQ(best[0].subject(), "b");
    std::vector<HitRecord> top2 = bestHits(group, 2);
    ASSERT_EQ(top2.size(), 2u);
    ASSERT_EQ(top2[1].subject(), "c");
    std::vector<HitRecord> hsps = bestHits(group, 1, true);
    ASSERT_EQ(hsps.size(), 2u);
    ASSERT_DOUBLE_EQ(hsps[0].score(), 30);
    ASSERT_DOUBLE_EQ(hsps[1].score(), 5);
    ASSERT_EQ(bestHits(group, 10).size(), 4u);
}

TEST(HitReportsTest, Filter) {
    HitFilter filter;
    ASSERT_TRUE(filter.pass(HitRecord::parse("q\ts\t96\t150\t0\t0\t1\t150\t1\t150\t1e-5\t10")));
    ASSERT_FALSE(filter.pass(HitRecord::parse("q\ts\t94\t150\t0\t0\t1\t150\t1\t150\t1e-5\t10")));
    ASSERT_FALSE(filter.pass(HitRecord::parse("q\ts\t96\t99\t0\t0\t1\t99\t1\t99\t1e-5\t10")));
    ASSERT_FALSE(filter.pass(HitRecord::parse("q\ts\t96\t150\t0\t0\t1\t150\t1\t150\t0.1\t10")));
    filter.score = 20;
    ASSERT_FALSE(filter.pass(HitRecord::parse("q\ts\t96\t150\t0\t0\t1\t150\t1\t150\t1e-5\t10")));
}

TEST(HitReportsTest, SortHits) {
    std::vector<HitRecord> hits = {
            HitRecord::parse("q2\ts1\t100\t10\t0\t0\t5\t14\t30\t39\t1\t10"),
            HitRecord::parse("q1\ts2\t100\t10\t0\t0\t9\t18\t10\t19\t1\t10"),
            HitRecord::parse("q1\ts1\t100\t10\t0\t0\t1\t10\t20\t29\t1\t50")};
    sortHits(hits, SortKey::QueryScore);
    ASSERT_EQ(hits[0].subject(), "s1");
    ASSERT_EQ(hits[1].subject(), "s2");
    ASSERT_EQ(hits[2].query(), "q2");
    sortHits(hits, SortKey::QueryPosition);
    ASSERT_EQ(hits[0].qstart(), 1);
    ASSERT_EQ(hits[1].qstart(), 9);
    sortHits(hits, SortKey::SubjectPosition);
    ASSERT_EQ(hits[0].sstart(), 20);
    ASSERT_EQ(hits[1].sstart(), 30);
    ASSERT_EQ(hits[2].subject(), "s2");
}

TEST(HitReportsTest, RangeUnion) {
    ASSERT_EQ(rangeUnion({{"s", 1, 10}, {"s", 30, 45}, {"s", 5, 20}}), 36);
    ASSERT_EQ(rangeUnion({{"s", 1, 10}, {"t", 1, 10}}), 20);
    ASSERT_EQ(rangeUnion({{"s", 1, 10}, {"s", 11, 20}}), 20);
    ASSERT_EQ(rangeUnion({}), 0);
}

TEST(HitReportsTest, Summarize) {
    CoverageSummary summary = summarize({
            HitRecord::parse("q1\ts1\t100\t100\t0\t0\t1\t100\t1\t100\t1e-40\t200"),
            HitRecord::parse("q1\ts1\t50\t100\t50\t0\t51\t150\t300\t201\t1e-10\t50")});
    ASSERT_EQ(summary.query_covered, 150);
    ASSERT_EQ(summary.ref_covered, 200);
    ASSERT_DOUBLE_EQ(summary.identity, 75);
}

TEST(HitReportsTest, Completeness) {
    SizeIndex sizes;
    sizes.add("s1", 120);
    Completeness res = completeness({
            HitRecord::parse("q1\ts1\t100\t40\t0\t0\t1\t40\t11\t50\t1e-20\t80"),
            HitRecord::parse("q1\ts1\t100\t51\t0\t0\t41\t91\t110\t60\t1e-20\t100")}, sizes);
    ASSERT_EQ(res.query, "q1");
    ASSERT_EQ(res.subject, "s1");
    ASSERT_EQ(res.nterminal, 10);
    ASSERT_EQ(res.cterminal, 11);
    ASSERT_THROW(completeness({hit("q1", "s2", 10)}, sizes), LookupError);
}

TEST(HitReportsTest, QueryCoverage) {
    SizeIndex sizes;
    sizes.add("q1", 200);
    QueryCoverage res = queryCoverage({
            HitRecord::parse("q1\ts1\t99\t100\t1\t0\t1\t100\t1\t100\t1e-40\t190"),
            HitRecord::parse("q1\ts2\t96\t50\t1\t1\t150\t101\t1\t50\t1e-10\t60")}, sizes);
    ASSERT_EQ(res.covered, 150);
    ASSERT_EQ(res.alignlen, 150);
    ASSERT_EQ(res.mismatches, 2);
    ASSERT_EQ(res.gaps, 1);
    ASSERT_DOUBLE_EQ(res.identity, 98);
    ASSERT_DOUBLE_EQ(res.coverage, 75);
}

TEST(HitReportsTest, TopSubjects) {
    std::vector<HitRecord> hits = {hit("q", "b", 1), hit("q", "a", 1), hit("q", "b", 1),
                                   hit("q", "c", 1), hit("q", "a", 1), hit("q", "b", 1), hit("q", "d", 1)};
    std::vector<std::pair<std::string, size_t>> top = topSubjects(hits, 3);
    ASSERT_EQ(top.size(), 3u);
    ASSERT_EQ(top[0], std::make_pair(std::string("b"), size_t(3)));
    ASSERT_EQ(top[1], std::make_pair(std::string("a"), size_t(2)));
    ASSERT_EQ(top[2], std::make_pair(std::string("c"), size_t(1)));
}

TEST(HitReportsTest, Histogram) {
    std::vector<std::string> lines = histogramLines({1, 1, 2, 25, -3}, 3);
    ASSERT_EQ(lines.size(), 4u);
    ASSERT_EQ(lines[0], "  0 | ");
    ASSERT_EQ(lines[1], "  1 | " + std::string(50, '*') + " 2");
    ASSERT_EQ(lines[2], "  2 | " + std::string(25, '*') + " 1");
    ASSERT_EQ(lines[3], "  3 | ");
}

TEST(HitReportsTest, Percentage) {
    ASSERT_EQ(percentage(1, 3), "1 of 3 (33.3%)");
    ASSERT_EQ(percentage(2, 2), "2 of 2 (100.0%)");
}

TEST(LookupTablesTest, SizesFromFasta) {
    SizeIndex sizes = SizeIndex::Load(WriteTempFile("sizes.fasta", ">chr1 first\nACGT\nACG\n>chr2\nAC\n"));
    ASSERT_EQ(sizes.size(), 2u);
    ASSERT_EQ(sizes.get("chr1"), 7);
    ASSERT_EQ(sizes.get("chr2"), 2);
    ASSERT_THROW(sizes.get("chr3"), LookupError);
}

TEST(LookupTablesTest, SizesFromTable) {
    SizeIndex sizes = SizeIndex::Load(WriteTempFile("sizes.txt", "# id length\nchr1\t1000\nchr2\t20\n"));
    ASSERT_TRUE(sizes.contains("chr1"));
    ASSERT_EQ(sizes.get("chr1"), 1000);
    ASSERT_EQ(sizes.get("chr2"), 20);
    ASSERT_THROW(SizeIndex::Load(WriteTempFile("bad_sizes.txt", "chr1\tlong\n")), ParseError);
}

TEST(LookupTablesTest, IdTable) {
    IdTable table = IdTable::Load(WriteTempFile("ids.txt", "s1\tkinase domain\ns2\ttransporter\n"));
    ASSERT_EQ(table.size(), 2u);
    ASSERT_EQ(table.get("s1"), "kinase domain");
    ASSERT_EQ(table.getOr("s3", "unknown"), "unknown");
    ASSERT_THROW(table.get("s3"), LookupError);
    ASSERT_THROW(IdTable::Load(WriteTempFile("bad_ids.txt", "s1 only\n")), ParseError);
}
