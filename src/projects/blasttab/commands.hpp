#pragma once

#include <common/cl_parser.hpp>
#include <common/logging.hpp>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace blasttab {

    typedef std::function<void(logging::Logger &logger, const AlgorithmParameterValues &values,
                               const std::vector<std::string> &files, std::ostream &out)> CommandBody;

    // A subcommand of the blasttab program: its parameter signature, positional file arguments and body.
    struct Command {
        std::string name;
        std::string description;
        std::vector<std::string> files;
        AlgorithmParameters parameters;
        std::vector<std::string> short_params;
        CommandBody body;

        std::string usage() const;
    };

    const std::vector<Command> &Commands();
    std::string ProgramUsage();

    // Parses args (subcommand name first), sets up logging and runs the command. Returns the exit code.
    int RunCommand(const std::vector<std::string> &args, std::ostream &out);
}
