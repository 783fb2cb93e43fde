#include "line_reader.hpp"
#include <common/string_utils.hpp>
#include <cstdio>
#include <stdexcept>
#include <utility>
#include <unistd.h>

io::LineReader::LineReader(std::experimental::filesystem::path _file_name) :
        file_name(std::move(_file_name)), buffer(1 << 16) {
    if(file_name == "-") {
        file = gzdopen(dup(fileno(stdin)), "rb");
    } else {
        file = gzopen(file_name.c_str(), "rb");
    }
    if(file == nullptr)
        throw std::runtime_error("could not open file " + file_name.string());
}

io::LineReader::~LineReader() {
    if(file != nullptr) {
        gzclose(file);
        file = nullptr;
    }
}

bool io::LineReader::readLine(std::string &line) {
    line.clear();
    bool read_any = false;
    while(true) {
        char *res = gzgets(file, buffer.data(), int(buffer.size()));
        if(res == nullptr) {
            int errnum = 0;
            const char *message = gzerror(file, &errnum);
            if(errnum != Z_OK && errnum != Z_STREAM_END)
                throw std::runtime_error("error reading " + file_name.string() + ": " + message);
            break;
        }
        read_any = true;
        line += res;
        if(!line.empty() && line.back() == '\n')
            break;
    }
    if(!read_any)
        return false;
    chomp_inplace(line);
    line_number++;
    return true;
}

std::string io::LineReader::position() const {
    return file_name.string() + ":" + itos(line_number);
}
