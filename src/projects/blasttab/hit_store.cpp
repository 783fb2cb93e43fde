#include "hit_store.hpp"
#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <utility>

bool blasttab::HitReader::readLine(std::string &line) {
    while(reader.readLine(line)) {
        if(line.empty() || line[0] == '#')
            continue;
        return true;
    }
    return false;
}

blasttab::HitRecord blasttab::HitReader::parse(const std::string &line) const {
    try {
        return HitRecord::parse(line);
    } catch (const ParseError &e) {
        throw ParseError(reader.position() + ": " + e.what());
    }
}

bool blasttab::HitReader::next(std::vector<HitRecord> &out) {
    std::string line;
    if(!readLine(line))
        return false;
    out.push_back(parse(line));
    return true;
}

std::vector<blasttab::HitRecord> blasttab::ReadHits(const std::experimental::filesystem::path &file_name) {
    HitReader reader(file_name);
    std::vector<HitRecord> res;
    while(reader.next(res)) {
    }
    return res;
}

void blasttab::WriteHits(const std::experimental::filesystem::path &file_name, const std::vector<HitRecord> &hits) {
    std::ofstream os;
    os.open(file_name);
    if(!os.is_open())
        throw std::runtime_error("could not open " + file_name.string() + " for writing");
    for(const HitRecord &hit : hits) {
        os << hit << "\n";
    }
    os.close();
}

blasttab::HitTable::HitTable(std::vector<HitRecord> _hits, bool sorted) : hits(std::move(_hits)) {
    if(!sorted) {
        std::stable_sort(hits.begin(), hits.end(), [](const HitRecord &a, const HitRecord &b) {
            return a.query() < b.query();
        });
    }
}

blasttab::HitTable blasttab::HitTable::Load(const std::experimental::filesystem::path &file_name, bool sorted) {
    return HitTable(ReadHits(file_name), sorted);
}

bool blasttab::HitTable::nextGroup(std::vector<HitRecord> &group) {
    group.clear();
    if(pos >= hits.size())
        return false;
    const std::string &query = hits[pos].query();
    size_t end = pos;
    while(end < hits.size() && hits[end].query() == query)
        end++;
    group.insert(group.end(), hits.begin() + pos, hits.begin() + end);
    pos = end;
    return true;
}

bool blasttab::HitStream::nextGroup(std::vector<HitRecord> &group) {
    group.clear();
    if(pending.empty() && !reader.next(pending))
        return false;
    group.push_back(std::move(pending.back()));
    pending.clear();
    while(reader.next(pending)) {
        if(pending.back().query() != group.front().query())
            break;
        group.push_back(std::move(pending.back()));
        pending.clear();
    }
    return true;
}
