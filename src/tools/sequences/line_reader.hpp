#pragma once

#include <zlib.h>
#include <experimental/filesystem>
#include <string>
#include <vector>

namespace io {
    // Line by line reading through zlib: gzip-compressed and plain files are handled alike.
    // "-" reads standard input.
    class LineReader {
    private:
        std::experimental::filesystem::path file_name;
        gzFile file = nullptr;
        size_t line_number = 0;
        std::vector<char> buffer;
    public:
        explicit LineReader(std::experimental::filesystem::path _file_name);
        LineReader(const LineReader &) = delete;
        LineReader &operator=(const LineReader &) = delete;
        ~LineReader();

        // Next line without the trailing newline; false at end of file.
        bool readLine(std::string &line);
        std::string position() const;
    };
}
