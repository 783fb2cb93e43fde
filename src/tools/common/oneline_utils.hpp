//
// Created by anton on 08.07.2020.
//

#pragma once
#include <vector>
#include <functional>
#include <algorithm>

namespace oneline {
    template<class V, class U, class I>
    std::vector<V> initialize(I begin, const I &end) {
        std::vector<V> result;
        std::for_each(begin, end, [&](const U & param){ result.emplace_back(param);});
        return result;
    }
}
