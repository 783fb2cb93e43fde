#include "hit_record.hpp"
#include <common/string_utils.hpp>
#include <algorithm>
#include <utility>

namespace {
    const char *const FIELD_NAMES[] = {"query", "subject", "pctid", "hitlen", "nmismatch", "ngaps",
                                       "qstart", "qstop", "sstart", "sstop", "evalue", "score"};

    long long parseLongField(const std::vector<std::string> &fields, size_t i) {
        long long res = 0;
        if(!tryParseLong(fields[i], res))
            throw blasttab::ParseError(std::string("field ") + FIELD_NAMES[i] + " is not an integer: \"" + fields[i] + "\"");
        return res;
    }

    double parseDoubleField(const std::vector<std::string> &fields, size_t i) {
        double res = 0;
        if(!tryParseDouble(fields[i], res))
            throw blasttab::ParseError(std::string("field ") + FIELD_NAMES[i] + " is not a number: \"" + fields[i] + "\"");
        return res;
    }
}

blasttab::HitRecord::HitRecord(std::string query, std::string subject, double pctid, long long hitlen,
                               long long nmismatch, long long ngaps, long long qstart, long long qstop,
                               long long sstart, long long sstop, double evalue, double score) :
        query_(std::move(query)), subject_(std::move(subject)), pctid_(pctid), hitlen_(hitlen),
        nmismatch_(nmismatch), ngaps_(ngaps), qstart_(qstart), qstop_(qstop), sstart_(sstart), sstop_(sstop),
        evalue_(evalue), score_(score), orientation_('+') {
    if(sstart_ > sstop_) {
        std::swap(sstart_, sstop_);
        orientation_ = '-';
    }
}

blasttab::HitRecord blasttab::HitRecord::parse(const std::string &line) {
    std::string trimmed = line;
    chomp_inplace(trimmed);
    std::vector<std::string> fields = splitFields(trimmed, '\t');
    if(fields.size() < FIELD_NUMBER)
        throw ParseError("expected " + itos(FIELD_NUMBER) + " tab separated fields, found " + itos(fields.size()));
    return {fields[0], fields[1], parseDoubleField(fields, 2), parseLongField(fields, 3),
            parseLongField(fields, 4), parseLongField(fields, 5), parseLongField(fields, 6),
            parseLongField(fields, 7), parseLongField(fields, 8), parseLongField(fields, 9),
            parseDoubleField(fields, 10), parseDoubleField(fields, 11)};
}

std::vector<std::string> blasttab::HitRecord::fields() const {
    std::vector<std::string> res = {query_, subject_, formatDouble(pctid_), std::to_string(hitlen_),
                                    std::to_string(nmismatch_), std::to_string(ngaps_),
                                    std::to_string(qstart_), std::to_string(qstop_),
                                    std::to_string(sstart_), std::to_string(sstop_),
                                    formatDouble(evalue_), formatDouble(score_)};
    if(reverse())
        std::swap(res[8], res[9]);
    return res;
}

std::string blasttab::HitRecord::toText() const {
    return join("\t", fields());
}

blasttab::HitRecord blasttab::HitRecord::swapped() const {
    long long new_sstart = reverse() ? qstop_ : qstart_;
    long long new_sstop = reverse() ? qstart_ : qstop_;
    return {subject_, query_, pctid_, hitlen_, nmismatch_, ngaps_, sstart_, sstop_,
            new_sstart, new_sstop, evalue_, score_};
}

blasttab::Projection blasttab::HitRecord::projection() const {
    return {subject_, sstart_ - 1, sstop_, query_, score_, orientation_};
}

blasttab::HitRecord blasttab::HitRecord::absorb(const HitRecord &other) const {
    HitRecord res = *this;
    res.hitlen_ += other.hitlen_;
    res.nmismatch_ += other.nmismatch_;
    res.ngaps_ += other.ngaps_;
    res.qstart_ = std::min(qstart_, other.qstart_);
    res.qstop_ = std::max(qstop_, other.qstop_);
    res.sstart_ = std::min(sstart_, other.sstart_);
    res.sstop_ = std::max(sstop_, other.sstop_);
    res.score_ += other.score_;
    return res;
}

blasttab::HitRecord blasttab::HitRecord::withPctid(double pctid) const {
    HitRecord res = *this;
    res.pctid_ = pctid;
    return res;
}

bool blasttab::HitRecord::operator==(const HitRecord &other) const {
    return query_ == other.query_ && subject_ == other.subject_ && pctid_ == other.pctid_ &&
           hitlen_ == other.hitlen_ && nmismatch_ == other.nmismatch_ && ngaps_ == other.ngaps_ &&
           qstart_ == other.qstart_ && qstop_ == other.qstop_ && sstart_ == other.sstart_ &&
           sstop_ == other.sstop_ && evalue_ == other.evalue_ && score_ == other.score_ &&
           orientation_ == other.orientation_;
}

std::string blasttab::Projection::toText() const {
    return seqid + "\t" + std::to_string(start) + "\t" + std::to_string(end) + "\t" + name + "\t" +
           formatDouble(score) + "\t" + strand;
}

std::ostream &blasttab::operator<<(std::ostream &os, const blasttab::HitRecord &hit) {
    return os << hit.toText();
}
