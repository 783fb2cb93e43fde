#pragma once

#include <string>
#include <utility>

namespace blasttab {

    struct Range {
        std::string seqid;
        long long start;
        long long end;
        char strand;
    };

    // ss measures the outer span of the two ranges, ee the gap between their facing edges.
    enum class DistMode {OuterSpan, EdgeToEdge};

    DistMode ParseDistMode(const std::string &s);
    std::string DistModeName(DistMode mode);

    struct RangeDistance {
        long long distance;
        std::string orientation;
    };

    // Ranges are taken in order of their start so the orientation reads left to right along the axis.
    // Ranges on different sequences are at distance -1. In ee mode a negative distance means overlap.
    //   (30,45,+) (45,55,+) ss -> 26 "++"
    //   (30,42,+) (45,55,-) ee -> 2 "+-"
    RangeDistance rangeDistance(Range a, Range b, DistMode mode);
}
