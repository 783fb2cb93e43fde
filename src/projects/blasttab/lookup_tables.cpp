#include "lookup_tables.hpp"
#include <sequences/seqio.hpp>
#include <sequences/line_reader.hpp>
#include <common/string_utils.hpp>

blasttab::SizeIndex blasttab::SizeIndex::Load(const std::experimental::filesystem::path &file_name) {
    SizeIndex res;
    if(io::IsSequenceFile(file_name)) {
        std::unique_ptr<io::ISeqReader> reader = io::OpenSeqReader(file_name);
        for(const io::SeqRecord &record : *reader) {
            res.add(record.id, (long long)record.size());
        }
        return res;
    }
    io::LineReader reader(file_name);
    std::string line;
    while(reader.readLine(line)) {
        if(line.empty() || line[0] == '#')
            continue;
        std::vector<std::string> fields = split(line);
        long long length = 0;
        if(fields.size() < 2 || !tryParseLong(fields[1], length))
            throw ParseError(reader.position() + ": expected \"id<TAB>length\", got \"" + line + "\"");
        res.add(fields[0], length);
    }
    return res;
}

void blasttab::SizeIndex::add(const std::string &id, long long length) {
    sizes[id] = length;
}

long long blasttab::SizeIndex::get(const std::string &id) const {
    auto it = sizes.find(id);
    if(it == sizes.end())
        throw LookupError("unknown sequence id " + id);
    return it->second;
}

blasttab::IdTable blasttab::IdTable::Load(const std::experimental::filesystem::path &file_name) {
    IdTable res;
    io::LineReader reader(file_name);
    std::string line;
    while(reader.readLine(line)) {
        if(line.empty() || line[0] == '#')
            continue;
        std::vector<std::string> fields = splitFields(line, '\t');
        if(fields.size() < 2)
            throw ParseError(reader.position() + ": expected two tab separated columns, got \"" + line + "\"");
        res.add(fields[0], fields[1]);
    }
    return res;
}

const std::string &blasttab::IdTable::get(const std::string &key) const {
    auto it = mapping.find(key);
    if(it == mapping.end())
        throw LookupError("id " + key + " is missing from the substitution table");
    return it->second;
}

const std::string &blasttab::IdTable::getOr(const std::string &key, const std::string &fallback) const {
    auto it = mapping.find(key);
    return it == mapping.end() ? fallback : it->second;
}
