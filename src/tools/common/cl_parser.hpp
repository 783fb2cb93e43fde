//
// Created by anton on 08.07.2020.
//

#pragma once
#include "oneline_utils.hpp"
#include "string_utils.hpp"
#include <vector>
#include <string>
#include <map>
#include <sstream>

class AlgorithmParameterValues;

// Parameter signature of a command: "name=default" entries are values, bare names are boolean checks.
class AlgorithmParameters {
protected:
    std::string help_message;
    std::map<std::string, std::string> values = {};
    std::map<std::string, bool> checks = {};
public:
    AlgorithmParameters() = default;
    AlgorithmParameters(const std::vector<std::string>& one_value_parameters, std::string help_message);

    const std::string &helpMessage() const {return help_message;}
    virtual ~AlgorithmParameters() = default;
    bool hasCheck(const std::string &s) const {return checks.find(s) != checks.end();}
    bool hasValue(const std::string &s) const {return values.find(s) != values.end();}
    std::string checkMissingValues(const AlgorithmParameterValues &other) const;
};

class AlgorithmParameterValues : public AlgorithmParameters {
public:
    explicit AlgorithmParameterValues(const AlgorithmParameters &default_values) : AlgorithmParameters(default_values) {
    }

    void addValue(const std::string &name, const std::string &val);
    void addCheck(const std::string &name);
    const std::string &getValue(const std::string &s) const;
    bool getCheck(const std::string &s) const;
    int getInt(const std::string &s) const;
    double getDouble(const std::string &s) const;
    std::string checkMissingValues() const;
    std::string str() const {
        std::stringstream ss;
        ss << "Values:\n";
        for(auto &it : values) {
            ss << it.first << " " << it.second << "\n";
        }
        ss << "Checks:\n";
        for(auto &it : checks) {
            ss << it.first << " " << it.second << "\n";
        }
        return ss.str();
    }
};

// Unknown options and stray words are configuration errors and throw std::invalid_argument.
class CLParser {
private:
    AlgorithmParameters parameters;
    size_t max_start_size = 0;
    std::map<char, std::string> short_param_map;
    std::vector<std::string> start;
    std::string command_line;
public:
    CLParser(const AlgorithmParameters& parameters, const std::vector<std::string>& short_params,
             size_t max_start_size = 1);
    CLParser(CLParser &&other) = default;
    CLParser &operator=(CLParser &&other) = default;

    AlgorithmParameterValues parseCL(const std::vector<std::string>& args);
    AlgorithmParameterValues parseCL(int argc, char **argv);
    const std::vector<std::string> &getStart() const {return start;}
    const std::string &getCL() const {return command_line;}
};
