#include "ranges.hpp"
#include <stdexcept>
#include <utility>

blasttab::DistMode blasttab::ParseDistMode(const std::string &s) {
    if(s == "ss")
        return DistMode::OuterSpan;
    if(s == "ee")
        return DistMode::EdgeToEdge;
    throw std::invalid_argument("distance mode should be ss or ee, got \"" + s + "\"");
}

std::string blasttab::DistModeName(DistMode mode) {
    return mode == DistMode::OuterSpan ? "ss" : "ee";
}

blasttab::RangeDistance blasttab::rangeDistance(Range a, Range b, DistMode mode) {
    long long dist = -1;
    if(a.seqid == b.seqid) {
        if(a.start > b.start)
            std::swap(a, b);
        if(mode == DistMode::OuterSpan)
            dist = b.end - a.start + 1;
        else
            dist = b.start - a.end - 1;
    }
    return {dist, std::string() + a.strand + b.strand};
}
