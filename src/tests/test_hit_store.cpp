#include "test_utils.hpp"
#include <blasttab/hit_store.hpp>
#include <zlib.h>

using namespace blasttab;

namespace {
    const std::string UNSORTED =
            "# BLASTN 2.2.26\n"
            "q2\ts1\t99\t100\t1\t0\t1\t100\t1\t100\t1e-40\t200\n"
            "q1\ts1\t99\t100\t1\t0\t1\t100\t1\t100\t1e-40\t190\n"
            "\n"
            "q2\ts2\t99\t100\t1\t0\t1\t100\t1\t100\t1e-40\t180\n"
            "q1\ts3\t99\t100\t1\t0\t1\t100\t1\t100\t1e-40\t170\n";

    std::vector<std::vector<std::string>> groupQueries(HitSource &source) {
        std::vector<std::vector<std::string>> res;
        std::vector<HitRecord> group;
        while(source.nextGroup(group)) {
            res.emplace_back();
            for(const HitRecord &hit : group)
                res.back().push_back(hit.query() + "/" + hit.subject());
        }
        return res;
    }
}

TEST(HitStoreTest, ReadSkipsCommentsAndEmptyLines) {
    std::vector<HitRecord> hits = ReadHits(WriteTempFile("unsorted.blast", UNSORTED));
    ASSERT_EQ(hits.size(), 4u);
    ASSERT_EQ(hits[0].query(), "q2");
    ASSERT_EQ(hits[3].subject(), "s3");
}

TEST(HitStoreTest, TableGroupsUnsortedInput) {
    HitTable table = HitTable::Load(WriteTempFile("unsorted.blast", UNSORTED));
    ASSERT_EQ(table.size(), 4u);
    std::vector<std::vector<std::string>> groups = groupQueries(table);
    ASSERT_EQ(groups.size(), 2u);
    ASSERT_EQ(groups[0], std::vector<std::string>({"q1/s1", "q1/s3"}));
    ASSERT_EQ(groups[1], std::vector<std::string>({"q2/s1", "q2/s2"}));
    table.rewind();
    ASSERT_EQ(groupQueries(table), groups);
}

TEST(HitStoreTest, StreamSplitsUnsortedInput) {
    HitStream stream(WriteTempFile("unsorted.blast", UNSORTED));
    std::vector<std::vector<std::string>> groups = groupQueries(stream);
    ASSERT_EQ(groups.size(), 4u);
    ASSERT_EQ(groups[0], std::vector<std::string>({"q2/s1"}));
    ASSERT_EQ(groups[3], std::vector<std::string>({"q1/s3"}));
}

TEST(HitStoreTest, StreamAndTableAgreeOnSortedInput) {
    std::experimental::filesystem::path file = WriteTempFile("sorted.blast", UNSORTED);
    WriteHits(file, HitTable::Load(file).records());
    HitStream stream(file);
    HitTable table = HitTable::Load(file, true);
    ASSERT_EQ(groupQueries(stream), groupQueries(table));
}

TEST(HitStoreTest, ParseErrorCarriesPosition) {
    std::experimental::filesystem::path file = WriteTempFile("broken.blast",
            "q1\ts1\t99\t100\t1\t0\t1\t100\t1\t100\t1e-40\t190\nq1\ts1\t99\n");
    try {
        ReadHits(file);
        FAIL() << "ParseError expected";
    } catch (const ParseError &e) {
        ASSERT_NE(std::string(e.what()).find("broken.blast:2"), std::string::npos);
    }
}

TEST(HitStoreTest, MissingFile) {
    ASSERT_THROW(ReadHits(std::experimental::filesystem::path(testing::TempDir()) / "no_such_file.blast"),
                 std::runtime_error);
}

TEST(HitStoreTest, GzipInput) {
    std::experimental::filesystem::path file = std::experimental::filesystem::path(testing::TempDir()) / "hits.blast.gz";
    gzFile out = gzopen(file.c_str(), "wb");
    ASSERT_NE(out, nullptr);
    ASSERT_GT(gzputs(out, UNSORTED.c_str()), 0);
    gzclose(out);
    std::vector<HitRecord> hits = ReadHits(file);
    ASSERT_EQ(hits.size(), 4u);
    ASSERT_DOUBLE_EQ(hits[1].score(), 190);
}
