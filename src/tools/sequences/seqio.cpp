#include "seqio.hpp"
#include <sstream>
#include <stdexcept>

namespace {
    std::string headerId(const std::string &header) {
        std::vector<std::string> tokens = split(header.substr(1));
        return tokens.empty() ? std::string() : tokens[0];
    }

    std::string stripGz(const std::string &name) {
        return endsWith(name, ".gz") ? name.substr(0, name.size() - 3) : name;
    }
}

void io::SeqIterator::operator++() {
    reader.inner_read();
    if (reader.eof()) {
        isend = true;
    }
}

io::SeqIterator::SeqIterator(io::ISeqReader &_reader, bool _isend) :
    reader(_reader), isend(_isend){
    if (reader.eof()) {
        isend = true;
    }
}

io::SeqRecord io::SeqIterator::operator*() {
    return reader.get();
}

bool io::SeqIterator::operator==(const SeqIterator &other) const {
    return isend == other.isend;
}

bool io::SeqIterator::operator!=(const SeqIterator &other) const {
    return isend != other.isend;
}

io::SeqIterator io::ISeqReader::begin() {
    return {*this, false};
}

io::SeqIterator io::ISeqReader::end() {
    return {*this, true};
}

io::FASTAReader::FASTAReader(const std::experimental::filesystem::path &_file_name) : reader(_file_name) {
    std::string line;
    while(reader.readLine(line)) {
        if(!line.empty() && line[0] == '>') {
            header = line;
            break;
        }
    }
    FASTAReader::inner_read();
}

void io::FASTAReader::inner_read() {
    if(header.empty()) {
        next = {};
        return;
    }
    std::stringstream ss;
    std::string line;
    std::string next_header;
    while(reader.readLine(line)) {
        if(!line.empty() && line[0] == '>') {
            next_header = line;
            break;
        }
        ss << trim(line);
    }
    next = {ss.str(), headerId(header)};
    header = next_header;
}

io::FASTQReader::FASTQReader(const std::experimental::filesystem::path &_file_name) : reader(_file_name) {
    FASTQReader::inner_read();
}

void io::FASTQReader::inner_read() {
    std::string id, seq, plus, qual;
    while(reader.readLine(id) && trim(id).empty()) {
    }
    if(id.empty()) {
        next = {};
        return;
    }
    if(id[0] != '@' || !reader.readLine(seq) || !reader.readLine(plus) || !reader.readLine(qual))
        throw std::invalid_argument("truncated FASTQ record at " + reader.position());
    next = {trim(seq), headerId(id)};
}

bool io::IsSequenceFile(const std::experimental::filesystem::path &file_name) {
    std::string name = stripGz(file_name.string());
    for(const std::string ext : {".fasta", ".fa", ".fna", ".fas", ".fastq", ".fq"}) {
        if(endsWith(name, ext))
            return true;
    }
    return false;
}

std::unique_ptr<io::ISeqReader> io::OpenSeqReader(const std::experimental::filesystem::path &file_name) {
    std::string name = stripGz(file_name.string());
    if (endsWith(name, ".fastq") || endsWith(name, ".fq")) {
        return std::unique_ptr<ISeqReader>(new FASTQReader(file_name));
    }
    if (endsWith(name, ".fasta") || endsWith(name, ".fa") || endsWith(name, ".fna") || endsWith(name, ".fas")) {
        return std::unique_ptr<ISeqReader>(new FASTAReader(file_name));
    }
    throw std::invalid_argument("unknown sequence file extension: " + file_name.string());
}
