#pragma once

#include "hit_record.hpp"
#include <sequences/line_reader.hpp>
#include <experimental/filesystem>
#include <functional>
#include <string>
#include <vector>

namespace blasttab {

    // Data lines of a hit file: empty lines and '#' comments are skipped.
    class HitReader {
    private:
        io::LineReader reader;
    public:
        explicit HitReader(const std::experimental::filesystem::path &file_name) : reader(file_name) {}

        bool readLine(std::string &line);
        // Parses the line last returned by readLine, ParseError messages carry file:line.
        HitRecord parse(const std::string &line) const;
        bool next(std::vector<HitRecord> &out);
    };

    std::vector<HitRecord> ReadHits(const std::experimental::filesystem::path &file_name);
    void WriteHits(const std::experimental::filesystem::path &file_name, const std::vector<HitRecord> &hits);

    // Access to a hit collection as groups of records sharing a query.
    class HitSource {
    public:
        virtual ~HitSource() = default;
        // Replaces the content of group with the next query group, false when the source is exhausted.
        virtual bool nextGroup(std::vector<HitRecord> &group) = 0;
    };

    // Eager store: the whole input is in memory. Unless the input is declared sorted,
    // records are stable-sorted by query so every query forms exactly one group.
    class HitTable : public HitSource {
    private:
        std::vector<HitRecord> hits;
        size_t pos = 0;
    public:
        explicit HitTable(std::vector<HitRecord> _hits, bool sorted = false);
        static HitTable Load(const std::experimental::filesystem::path &file_name, bool sorted = false);

        const std::vector<HitRecord> &records() const {return hits;}
        size_t size() const {return hits.size();}
        void rewind() {pos = 0;}
        bool nextGroup(std::vector<HitRecord> &group) override;
    };

    // Streaming store: groups contiguous runs of the same query while reading.
    // The input has to be sorted (or at least grouped) by query. This is not checked:
    // a query split over several runs is reported as several groups.
    class HitStream : public HitSource {
    private:
        HitReader reader;
        std::vector<HitRecord> pending;
    public:
        explicit HitStream(const std::experimental::filesystem::path &file_name) : reader(file_name) {}
        bool nextGroup(std::vector<HitRecord> &group) override;
    };
}
