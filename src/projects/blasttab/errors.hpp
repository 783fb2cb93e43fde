#pragma once

#include <stdexcept>
#include <string>

namespace blasttab {
    // Malformed input record. Readers prefix the message with file:line.
    class ParseError : public std::invalid_argument {
    public:
        explicit ParseError(const std::string &message) : std::invalid_argument(message) {}
    };

    // Identifier missing from a lookup table.
    class LookupError : public std::out_of_range {
    public:
        explicit LookupError(const std::string &message) : std::out_of_range(message) {}
    };
}
