//
// Created by anton on 08.07.2020.
//
#include "cl_parser.hpp"
#include <cctype>
#include <stdexcept>
#include <utility>

AlgorithmParameterValues CLParser::parseCL(const std::vector <std::string> &args) {
    AlgorithmParameterValues result(parameters);
    start.clear();
    command_line = join(" ", args);
    std::string name;
    for(const std::string &s : args) {
        if (!name.empty()) {
            result.addValue(name, s);
            name = "";
        } else if(s.size() > 1 && s[0] == '-' && !std::isdigit(static_cast<unsigned char>(s[1]))) {
            if (s[1] == '-') {
                name = s.substr(2, s.size() - 2);
            } else {
                if(s.size() != 2)
                    throw std::invalid_argument("Long command line parameters should start with --: " + s);
                auto it = short_param_map.find(s[1]);
                if(it == short_param_map.end())
                    throw std::invalid_argument("Unknown command line parameter: " + s);
                name = it->second;
            }
            if(!result.hasCheck(name) && !result.hasValue(name))
                throw std::invalid_argument("Unknown command line parameter: " + s);
            if (result.hasCheck(name)) {
                result.addCheck(name);
                name = "";
            }
        } else {
            start.push_back(s);
        }
    }
    if(!name.empty())
        throw std::invalid_argument("Missing value for command line parameter --" + name);
    if(start.size() > max_start_size)
        throw std::invalid_argument("Incorrect command line: " + start[max_start_size] +
                                    " is neither a value nor a parameter. Did you forget \"--\" in front of an option name?");
    return result;
}

AlgorithmParameterValues CLParser::parseCL(int argc, char **argv) {
    return parseCL(oneline::initialize<std::string, char*>(argv + 1, argv + argc));
}

CLParser::CLParser(const AlgorithmParameters& parameters, const std::vector<std::string>& short_params,
                   size_t max_start_size) :
        parameters(parameters), max_start_size(max_start_size) {
    for(const std::string& s : short_params) {
        short_param_map[s[0]] = s.substr(2, s.size() - 2);
    }
}

AlgorithmParameters::AlgorithmParameters(const std::vector<std::string>& one_value_parameters,
                                         std::string help_message) : help_message(std::move(help_message)) {
    for(const std::string& s : one_value_parameters) {
        size_t pos = s.find('=');
        if (pos != size_t(-1)) {
            values[s.substr(0, pos)] = s.substr(pos + 1, s.size() - pos - 1);
        } else {
            checks[s] = false;
        }
    }
}

std::string AlgorithmParameters::checkMissingValues(const AlgorithmParameterValues &other) const {
    std::stringstream result;
    for(const auto & key : values) {
        if(!other.hasValue(key.first)) {
            result <<  "Missing parameter " << key.first << "\n";
        } else if(other.getValue(key.first).empty()) {
            result <<  "Missing parameter value " << key.first << "\n";
        }
    }
    for(const auto & key : checks) {
        if(!other.hasCheck(key.first)) {
            result <<  "Missing check " << key.first << "\n";
        }
    }
    return result.str();
}

void AlgorithmParameterValues::addValue(const std::string &name, const std::string &val) {
    if(!hasValue(name))
        throw std::invalid_argument("Unknown command line parameter: --" + name);
    values[name] = val;
}

void AlgorithmParameterValues::addCheck(const std::string &name) {
    if(!hasCheck(name))
        throw std::invalid_argument("Unknown command line flag: --" + name);
    checks[name] = true;
}

bool AlgorithmParameterValues::getCheck(const std::string &s) const {
    auto it = checks.find(s);
    if(it == checks.end())
        throw std::invalid_argument("Missing check " + s);
    return it->second;
}

const std::string &AlgorithmParameterValues::getValue(const std::string &s) const {
    auto it = values.find(s);
    if (it == values.end())
        throw std::invalid_argument("Missing parameter " + s);
    return it->second;
}

int AlgorithmParameterValues::getInt(const std::string &s) const {
    long long res = 0;
    if(!tryParseLong(getValue(s), res))
        throw std::invalid_argument("Parameter --" + s + " expects an integer, got \"" + getValue(s) + "\"");
    return int(res);
}

double AlgorithmParameterValues::getDouble(const std::string &s) const {
    double res = 0;
    if(!tryParseDouble(getValue(s), res))
        throw std::invalid_argument("Parameter --" + s + " expects a number, got \"" + getValue(s) + "\"");
    return res;
}

std::string AlgorithmParameterValues::checkMissingValues() const {
    return AlgorithmParameters::checkMissingValues(*this);
}
