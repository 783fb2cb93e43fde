//
// Created by anton on 7/27/20.
//
#pragma once
#include "dir_utils.hpp"
#include "string_utils.hpp"
#include "sys/sysinfo.h"
#include <sys/resource.h>
#include <experimental/filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <sstream>
#include <utility>
#include <vector>
#include <iostream>
#include <ostream>
#include <fstream>
#include <chrono>

namespace logging {

    const std::string endl = "\n";

    class TimeSpace {
    private:
        std::chrono::time_point<std::chrono::system_clock> start;
    public:
        TimeSpace() : start(std::chrono::system_clock::now()) {
        }

        std::string get() const {
            std::chrono::time_point<std::chrono::system_clock> finish = std::chrono::system_clock::now();
            std::chrono::duration<double> seconds = finish - start;
            auto full_seconds = size_t(seconds.count());
            struct rusage usage{};
            getrusage(RUSAGE_SELF, &usage);
            double all = double(usage.ru_maxrss) / 1024;
            std::string t_all = "Mb";
            if (all > 700) {
                all = all / 1024;
                t_all = "Gb";
            }
            all = size_t(all * 100) * 0.01;
            std::stringstream ss;
            ss << itos(full_seconds / 60 / 60, 2) << ":" << itos(full_seconds / 60 % 60, 2) << ":"
                    << itos(full_seconds % 60, 2) << " "  << all << t_all << " ";
            return ss.str();
        }
    };

    // Keeps one log file per program in dir and moves the previous one to dir/old_logs/NN.log
    class LoggerStorage {
    private:
        const std::experimental::filesystem::path dir;
        const std::experimental::filesystem::path logFile;
        const std::experimental::filesystem::path backupDir;
    public:
        explicit LoggerStorage(std::experimental::filesystem::path _dir, const std::string &_programName):
                dir(std::move(_dir)), logFile(dir / (_programName + ".log")), backupDir(dir / "old_logs") {
        }

        std::experimental::filesystem::path backup() const {
            if(!std::experimental::filesystem::is_regular_file(logFile)) {
                return {};
            }
            ensure_dir_existance(backupDir);
            size_t max = 0;
            for (const std::experimental::filesystem::path & file : std::experimental::filesystem::directory_iterator(backupDir)) {
                std::string fname = file.filename().string();
                if (fname.size() < 5 || !endsWith(fname, ".log"))
                    continue;
                long long num = 0;
                if(tryParseLong(fname.substr(0, fname.size() - 4), num) && num > 0)
                    max = std::max<size_t>(max, size_t(num));
            }
            std::experimental::filesystem::path backup = backupDir / (itos(max + 1, 2) + ".log");
            std::experimental::filesystem::copy_file(logFile, backup);
            std::experimental::filesystem::remove(logFile);
            return backup;
        }

        std::experimental::filesystem::path newLoggerFile() const {
            ensure_dir_existance(dir);
            backup();
            return logFile;
        }
    };

    //info goes to console (stderr), trace goes to log file. Debug goes to log file if debug is enabled
    enum LogLevel {info, trace, debug};

    class Logger : public std::streambuf , public std::ostream {
    private:
        struct LogStream {
            std::unique_ptr<std::ofstream> os;
            LogLevel level;
            LogStream(const std::experimental::filesystem::path &fn, LogLevel level) :
                    os(new std::ofstream()), level(level) {
                os->open(fn);
            }
        };

        std::vector<LogStream> oss;
        TimeSpace time;
        LogLevel curlevel;
        bool add_console;
    public:
        explicit Logger(bool _add_console = true) :
                    std::ostream(this), curlevel(LogLevel::trace), add_console(_add_console) {
        }

        Logger(const Logger &) = delete;

        void addLogFile(const std::experimental::filesystem::path &fn, LogLevel level = LogLevel::trace) {
            oss.emplace_back(fn, level);
            if(!oss.back().os->is_open())
                throw std::runtime_error("could not open log file " + fn.string());
        }

        int overflow(int c) override {
            if(add_console && curlevel <= LogLevel::info)
                std::cerr << char(c);
            for(LogStream &os : oss) {
                if(curlevel <= os.level)
                    *os.os << char(c);
            }
            if(c == '\n') {
                forceFlush();
            }
            return 0;
        }

        void forceFlush() {
            if(add_console && curlevel <= LogLevel::info)
                std::cerr.flush();
            for(LogStream &os : oss) {
                if(curlevel <= os.level)
                    os.os->flush();
            }
        }

        Logger & info() {
            curlevel = LogLevel::info;
            *this << time.get() << " INFO: ";
            return *this;
        }

        Logger & trace() {
            curlevel = LogLevel::trace;
            *this << time.get() << " TRACE: ";
            return *this;
        }

        Logger & debug() {
            curlevel = LogLevel::debug;
            *this << time.get() << " DEBUG: ";
            return *this;
        }

        // Plain report lines at info level, without the time prefix.
        Logger & report() {
            curlevel = LogLevel::info;
            return *this;
        }
    };
}
