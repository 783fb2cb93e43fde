//
// Created by anton on 02.04.2020.
//

#pragma once
#include <sstream>
#include <string>
#include <algorithm>
#include <vector>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <cstdio>
#include <cstdlib>

inline std::string itos(size_t val, size_t min_size = 0) {
    std::stringstream ss;
    ss << val;
    std::string res = ss.str();
    while(res.size() < min_size) {
        res = "0" + res;
    }
    return res;
}

static inline bool endsWith(const std::string& str, const std::string& suffix)
{
    return str.size() >= suffix.size() && 0 == str.compare(str.size()-suffix.size(), suffix.size(), suffix);
}

static inline bool startsWith(const std::string& str, const std::string& prefix)
{
    return str.size() >= prefix.size() && 0 == str.compare(0, prefix.size(), prefix);
}

static inline void ltrim_inplace(std::string &s) {
    s.erase(s.begin(), std::find_if_not(s.begin(), s.end(),
                                    [](unsigned char c){return std::isspace(c);}));
}

static inline void rtrim_inplace(std::string &s) {
    s.erase(std::find_if_not(s.rbegin(), s.rend(),
                         [](unsigned char c){return std::isspace(c);}).base(), s.end());
}

static inline std::string trim(std::string s) {
    ltrim_inplace(s);
    rtrim_inplace(s);
    return s;
}

static inline void chomp_inplace(std::string &s) {
    while(!s.empty() && (s.back() == '\n' || s.back() == '\r'))
        s.pop_back();
}

inline std::string join(const std::string &s, const std::vector<std::string> &arr) {
    if(arr.empty())
        return "";
    std::stringstream ss;
    ss << arr[0];
    for(size_t i = 1; i < arr.size(); i++) {
        ss << s << arr[i];
    }
    return ss.str();
}

// Whitespace separated tokens, empty tokens are dropped.
inline std::vector<std::string> split(const std::string &s) {
    std::vector<std::string> res;
    size_t cur = 0;
    std::string bad = " \n\t\r";
    while(cur < s.size()) {
        size_t next = cur;
        while(next < s.size() && bad.find(s[next]) == size_t(-1)) {
            next += 1;
        }
        if (next > cur) {
            res.push_back(s.substr(cur, next - cur));
        }
        cur = next + 1;
    }
    return res;
}

// Fields of a delimited record. Unlike split, empty fields are kept so that column positions survive.
inline std::vector<std::string> splitFields(const std::string &s, char delim = '\t') {
    std::vector<std::string> res;
    size_t cur = 0;
    while(true) {
        size_t next = s.find(delim, cur);
        if(next == size_t(-1)) {
            res.push_back(s.substr(cur));
            break;
        }
        res.push_back(s.substr(cur, next - cur));
        cur = next + 1;
    }
    return res;
}

// Strict numeric parsing: surrounding whitespace is ignored, the rest of the token has to be consumed.
inline bool tryParseLong(const std::string &token, long long &result) {
    std::string s = trim(token);
    if(s.empty())
        return false;
    char *end = nullptr;
    errno = 0;
    long long val = std::strtoll(s.c_str(), &end, 10);
    if(errno != 0 || end != s.c_str() + s.size())
        return false;
    result = val;
    return true;
}

inline bool tryParseDouble(const std::string &token, double &result) {
    std::string s = trim(token);
    if(s.empty())
        return false;
    char *end = nullptr;
    errno = 0;
    double val = std::strtod(s.c_str(), &end);
    if(errno == ERANGE && val != 0)
        return false;
    if(end != s.c_str() + s.size())
        return false;
    result = val;
    return true;
}

// Shortest decimal text that reads back to exactly the same double: 98.5, 180, 0.001, 1e-50.
// Plain notation is used for decimal exponents in [-4, 16), scientific otherwise.
inline std::string formatDouble(double val) {
    char buf[64];
    if(!std::isfinite(val)) {
        std::snprintf(buf, sizeof(buf), "%g", val);
        return buf;
    }
    int precision = 1;
    for(; precision < 17; precision++) {
        std::snprintf(buf, sizeof(buf), "%.*e", precision - 1, val);
        if(std::strtod(buf, nullptr) == val)
            break;
    }
    std::snprintf(buf, sizeof(buf), "%.*e", precision - 1, val);
    int exponent = std::atoi(std::strchr(buf, 'e') + 1);
    if(exponent < -4 || exponent >= 16) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, val);
    } else {
        std::snprintf(buf, sizeof(buf), "%.*f", std::max(0, precision - 1 - exponent), val);
    }
    return buf;
}

inline std::string formatFixed(double val, int digits) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", digits, val);
    return buf;
}
