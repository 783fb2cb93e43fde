#pragma once

#include "errors.hpp"
#include <experimental/filesystem>
#include <string>
#include <unordered_map>
#include <vector>

namespace blasttab {

    // Sequence id -> sequence length, from a FASTA/FASTQ file or a two-column "id<TAB>length" table.
    class SizeIndex {
    private:
        std::unordered_map<std::string, long long> sizes;
    public:
        static SizeIndex Load(const std::experimental::filesystem::path &file_name);

        void add(const std::string &id, long long length);
        // Throws LookupError for an unknown id.
        long long get(const std::string &id) const;
        bool contains(const std::string &id) const {return sizes.find(id) != sizes.end();}
        size_t size() const {return sizes.size();}
    };

    // Two-column substitution table, e.g. id -> description or id -> species.
    class IdTable {
    private:
        std::unordered_map<std::string, std::string> mapping;
    public:
        static IdTable Load(const std::experimental::filesystem::path &file_name);

        void add(const std::string &key, const std::string &value) {mapping[key] = value;}
        // Throws LookupError for an unknown id.
        const std::string &get(const std::string &key) const;
        const std::string &getOr(const std::string &key, const std::string &fallback) const;
        size_t size() const {return mapping.size();}
    };
}
