#include "commands.hpp"
#include "chaining.hpp"
#include "cscore.hpp"
#include "hit_reports.hpp"
#include "hit_store.hpp"
#include "lookup_tables.hpp"
#include "pair_stats.hpp"
#include <common/dir_utils.hpp>
#include <common/string_utils.hpp>
#include <experimental/filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace {
    using namespace blasttab;
    typedef std::experimental::filesystem::path path;

    const std::string NONE = "none";

    const std::string GENERAL_HELP =
            "General parameters:\n"
            "  --log-dir <dir>  Keep a log of the run in <dir>/<command>.log\n"
            "  --debug          Write debug messages to the log file\n"
            "  --help           Print this message\n";

    AlgorithmParameters commandParameters(std::vector<std::string> values, const std::string &help) {
        values.emplace_back("log-dir=" + NONE);
        values.emplace_back("debug");
        values.emplace_back("help");
        return {values, help + GENERAL_HELP};
    }

    bool isSet(const AlgorithmParameterValues &values, const std::string &name) {
        return values.getValue(name) != NONE;
    }

    std::ofstream openOutput(const path &file_name) {
        std::ofstream os;
        os.open(file_name);
        if(!os.is_open())
            throw std::runtime_error("could not open " + file_name.string() + " for writing");
        return os;
    }

    void chainCommand(logging::Logger &logger, const AlgorithmParameterValues &values,
                      const std::vector<std::string> &files, std::ostream &out) {
        long long dist = values.getInt("dist");
        std::vector<HitRecord> hits = ReadHits(files[0]);
        logger.info() << "Chaining " << hits.size() << " HSPs with maximal distance " << dist << std::endl;
        std::vector<HitRecord> chained = chainHits(std::move(hits), dist, dist);
        for(const HitRecord &hit : chained)
            out << hit << "\n";
        logger.info() << "Reported " << chained.size() << " chains" << std::endl;
    }

    void cscoreCommand(logging::Logger &logger, const AlgorithmParameterValues &values,
                       const std::vector<std::string> &files, std::ostream &out) {
        double cutoff = values.getDouble("cutoff");
        int threads = values.getInt("threads");
        if(threads <= 0)
            throw std::invalid_argument("number of threads should be positive");
        std::vector<HitRecord> hits = ReadHits(files[0]);
        logger.info() << "Register best scores of " << hits.size() << " hits" << std::endl;
        BestScoreIndex index = BestScoreIndex::Build(hits);
        logger.trace() << "Best scores registered for " << index.size() << " sequences" << std::endl;
        CScoreTable table = scorePairs(hits, index, cutoff, size_t(threads));
        for(const auto &it : table)
            out << CScoreLine(it.first.first, it.first.second, it.second) << "\n";
        logger.info() << table.size() << " pairs with c-score above " << cutoff << std::endl;
    }

    void pairsCommand(logging::Logger &logger, const AlgorithmParameterValues &values,
                      const std::vector<std::string> &files, std::ostream &) {
        PairStatsParams params;
        int rclip = values.getInt("rclip");
        if(rclip < 0)
            throw std::invalid_argument("rclip should not be negative");
        params.rclip = size_t(rclip);
        params.cutoff = values.getInt("cutoff");
        params.bins = values.getInt("bins");
        params.mode = ParseDistMode(values.getValue("distmode"));
        if(isSet(values, "mateorientation"))
            params.mate_orientation = values.getValue("mateorientation");
        PairStatsEngine engine(params);

        path input = files[0];
        std::vector<LocatedFeature> features;
        if(endsWith(input.string(), ".bed") || endsWith(input.string(), ".bed.gz")) {
            features = ReadBedFeatures(input);
        } else {
            HitReader reader(input);
            std::vector<HitRecord> hit;
            while(reader.next(hit)) {
                features.push_back(LocatedFeature::FromProjection(hit.back().projection()));
                hit.clear();
            }
        }
        logger.info() << "Collecting mate pairs from " << features.size() << " located reads" << std::endl;
        logger.trace() << "Distance mode " << DistModeName(params.mode) << ", read names clipped by " << params.rclip
                       << std::endl;
        PairStats stats = engine.compute(std::move(features));
        stats.report(logger);
        if(isSet(values, "pairsfile")) {
            path pairsfile = values.getValue("pairsfile");
            std::ofstream os = openOutput(pairsfile);
            for(const PairObservation &obs : stats.linked)
                os << obs.name << "\t" << obs.mate << "\t" << obs.distance << "\n";
            logger.info() << "Linked pairs written to " << pairsfile << std::endl;
        }
        if(isSet(values, "insertsfile")) {
            path insertsfile = values.getValue("insertsfile");
            std::ofstream os = openOutput(insertsfile);
            for(long long dist : stats.linked_distances)
                os << dist << "\n";
            logger.info() << "Insert sizes written to " << insertsfile << std::endl;
        }
    }

    void bestCommand(logging::Logger &logger, const AlgorithmParameterValues &values,
                     const std::vector<std::string> &files, std::ostream &out) {
        int n = values.getInt("n");
        if(n <= 0)
            throw std::invalid_argument("number of best hits should be positive");
        bool hsps = values.getCheck("hsps");
        std::unique_ptr<HitSource> source;
        if(values.getCheck("sorted")) {
            logger.trace() << "Streaming hits, input is expected to be sorted by query" << std::endl;
            source = std::make_unique<HitStream>(files[0]);
        } else {
            source = std::make_unique<HitTable>(HitTable::Load(files[0]));
        }
        std::vector<HitRecord> group;
        size_t queries = 0;
        while(source->nextGroup(group)) {
            queries++;
            for(const HitRecord &hit : bestHits(group, size_t(n), hsps))
                out << hit << "\n";
        }
        logger.info() << "Best hits reported for " << queries << " queries" << std::endl;
    }

    void filterCommand(logging::Logger &logger, const AlgorithmParameterValues &values,
                       const std::vector<std::string> &files, std::ostream &) {
        HitFilter filter;
        filter.score = values.getDouble("score");
        filter.pctid = values.getDouble("pctid");
        filter.hitlen = values.getInt("hitlen");
        filter.evalue = values.getDouble("evalue");
        path output = with_suffix(files[0], ".P" + values.getValue("pctid") + "L" + values.getValue("hitlen"));
        std::ofstream os = openOutput(output);
        HitReader reader(files[0]);
        std::string line;
        size_t total = 0;
        size_t kept = 0;
        while(reader.readLine(line)) {
            total++;
            if(!filter.pass(reader.parse(line)))
                continue;
            kept++;
            os << line << "\n";
        }
        logger.info() << "Kept " << percentage(kept, total) << " hits in " << output << std::endl;
    }

    SortKey sortKey(const AlgorithmParameterValues &values) {
        if(values.getCheck("query") && values.getCheck("ref"))
            throw std::invalid_argument("--query and --ref are mutually exclusive");
        if(values.getCheck("query"))
            return SortKey::QueryPosition;
        if(values.getCheck("ref"))
            return SortKey::SubjectPosition;
        return SortKey::QueryScore;
    }

    void sortCommand(logging::Logger &logger, const AlgorithmParameterValues &values,
                     const std::vector<std::string> &files, std::ostream &) {
        SortKey key = sortKey(values);
        std::vector<HitRecord> hits = ReadHits(files[0]);
        sortHits(hits, key);
        WriteHits(files[0], hits);
        logger.info() << "Sorted " << hits.size() << " hits in " << files[0] << std::endl;
    }

    void swapCommand(logging::Logger &logger, const AlgorithmParameterValues &,
                     const std::vector<std::string> &files, std::ostream &) {
        std::vector<HitRecord> swapped;
        for(const HitRecord &hit : ReadHits(files[0]))
            swapped.push_back(hit.swapped());
        sortHits(swapped, SortKey::QueryScore);
        path output = with_suffix(files[0], ".swapped");
        WriteHits(output, swapped);
        logger.info() << "Swapped hits written to " << output << std::endl;
    }

    void bedCommand(logging::Logger &logger, const AlgorithmParameterValues &,
                    const std::vector<std::string> &files, std::ostream &) {
        path input = files[0];
        path output = input;
        output.replace_extension(".bed");
        std::ofstream os = openOutput(output);
        HitReader reader(input);
        std::vector<HitRecord> hit;
        while(reader.next(hit)) {
            os << hit.back().projection().toText() << "\n";
            hit.clear();
        }
        logger.info() << "File written to " << output << std::endl;
    }

    void summaryCommand(logging::Logger &logger, const AlgorithmParameterValues &,
                        const std::vector<std::string> &files, std::ostream &out) {
        logger.trace() << "Report stats on " << files[0] << std::endl;
        CoverageSummary summary = summarize(ReadHits(files[0]));
        out << "Identity: " << formatFixed(summary.identity, 2) << "%\n";
        out << "Query coverage: " << summary.query_covered << " bp\n";
        out << "Reference coverage: " << summary.ref_covered << " bp\n";
    }

    void completenessCommand(logging::Logger &logger, const AlgorithmParameterValues &,
                             const std::vector<std::string> &files, std::ostream &out) {
        SizeIndex sizes = SizeIndex::Load(files[1]);
        logger.trace() << "Loaded lengths of " << sizes.size() << " sequences" << std::endl;
        HitTable table = HitTable::Load(files[0]);
        std::vector<HitRecord> group;
        while(table.nextGroup(group)) {
            Completeness res = completeness(group, sizes);
            out << res.query << "\t" << res.subject << "\t" << res.nterminal << "\t" << res.cterminal << "\n";
        }
    }

    void covfilterCommand(logging::Logger &logger, const AlgorithmParameterValues &values,
                          const std::vector<std::string> &files, std::ostream &out) {
        double min_pctid = values.getDouble("pctid");
        double min_pctcov = values.getDouble("pctcov");
        bool list = values.getCheck("list");
        SizeIndex sizes = SizeIndex::Load(files[1]);
        HitTable table = HitTable::Load(files[0]);
        std::vector<HitRecord> group;
        QueryCoverage total;
        size_t mapped = 0;
        long long queries_combined = 0;
        std::vector<std::string> valid;
        std::unordered_set<std::string> valid_set;
        while(table.nextGroup(group)) {
            QueryCoverage cov = queryCoverage(group, sizes);
            mapped++;
            queries_combined += sizes.get(cov.query);
            if(list)
                out << cov.query << "\t" << formatFixed(cov.identity, 1) << "\t" << formatFixed(cov.coverage, 1) << "\n";
            if(cov.identity >= min_pctid && cov.coverage >= min_pctcov) {
                valid.push_back(cov.query);
                valid_set.insert(cov.query);
            }
            total.covered += cov.covered;
            total.mismatches += cov.mismatches;
            total.gaps += cov.gaps;
            total.alignlen += cov.alignlen;
        }
        std::string cutoff_message = "(id=" + values.getValue("pctid") + "% cov=" + values.getValue("pctcov") + "%)";
        size_t all = sizes.size();
        logger.report() << "Identity: " << total.mismatches << " mismatches, " << total.gaps << " gaps, "
                        << total.alignlen << " alignlen" << std::endl;
        logger.report() << "Total mapped: " << percentage(mapped, all) << std::endl;
        logger.report() << "Total valid " << cutoff_message << ": " << percentage(valid.size(), all) << std::endl;
        logger.report() << "Average id = "
                        << formatFixed(100 - double(total.mismatches + total.gaps) * 100. / double(total.alignlen), 2)
                        << "%" << std::endl;
        logger.report() << "Coverage: " << total.covered << " covered, " << queries_combined << " total" << std::endl;
        logger.report() << "Average coverage = "
                        << formatFixed(double(total.covered) * 100. / double(queries_combined), 2) << "%" << std::endl;
        if(isSet(values, "ids")) {
            path ids = values.getValue("ids");
            std::ofstream os = openOutput(ids);
            for(const std::string &id : valid)
                os << id << "\n";
            logger.info() << "Queries beyond cutoffs " << cutoff_message << " written to " << ids << std::endl;
        }
        if(isSet(values, "out")) {
            path output = values.getValue("out");
            std::ofstream os = openOutput(output);
            for(const HitRecord &hit : table.records()) {
                if(valid_set.find(hit.query()) != valid_set.end())
                    os << hit << "\n";
            }
            logger.info() << "Hits of valid queries written to " << output << std::endl;
        }
    }

    void top10Command(logging::Logger &, const AlgorithmParameterValues &values,
                      const std::vector<std::string> &files, std::ostream &out) {
        IdTable ids;
        if(isSet(values, "ids"))
            ids = IdTable::Load(values.getValue("ids"));
        for(const auto &it : topSubjects(ReadHits(files[0]), 10))
            out << it.second << "\t" << ids.getOr(it.first, it.first) << "\n";
    }

    void mismatchesCommand(logging::Logger &, const AlgorithmParameterValues &,
                           const std::vector<std::string> &files, std::ostream &out) {
        HitTable table = HitTable::Load(files[0]);
        std::vector<HitRecord> group;
        std::vector<long long> data;
        size_t nonzeros = 0;
        while(table.nextGroup(group)) {
            const HitRecord best = bestHits(group, 1, false).front();
            long long mm = best.nmismatch() + best.ngaps();
            data.push_back(mm);
            if(mm != 0)
                nonzeros++;
        }
        out << "Polymorphic sites: " << percentage(nonzeros, data.size()) << "\n";
        for(const std::string &line : histogramLines(data, 20))
            out << line << "\n";
    }

    void annotationCommand(logging::Logger &, const AlgorithmParameterValues &values,
                           const std::vector<std::string> &files, std::ostream &out) {
        bool use_qids = isSet(values, "queryids");
        bool use_sids = isSet(values, "subjectids");
        IdTable qids = use_qids ? IdTable::Load(values.getValue("queryids")) : IdTable();
        IdTable sids = use_sids ? IdTable::Load(values.getValue("subjectids")) : IdTable();
        HitReader reader(files[0]);
        std::vector<HitRecord> hit;
        while(reader.next(hit)) {
            const HitRecord &b = hit.back();
            out << (use_qids ? qids.get(b.query()) : b.query()) << "\t"
                << (use_sids ? sids.get(b.subject()) : b.subject()) << "\n";
            hit.clear();
        }
    }

    std::vector<Command> createCommands() {
        std::vector<Command> res;
        res.push_back({"chain", "chain adjacent HSPs together", {"blastfile"},
                       commandParameters({"dist=100"},
                                         "Chain adjacent HSPs of the same orientation into larger HSPs.\n"
                                         "  --dist <int>  Extent of flanking regions to search (default 100)\n"),
                       {}, chainCommand});
        res.push_back({"cscore", "calculate C-score for BLAST pairs", {"blastfile"},
                       commandParameters({"cutoff=0.9999", "threads=1"},
                                         "C-score = score(A,B) / max(best score for A, best score for B).\n"
                                         "A C-score of one is the same as reciprocal best hit.\n"
                                         "  --cutoff <float>  Minimum C-score to report (default 0.9999)\n"
                                         "  --threads <int>   Threads for the scoring pass (default 1)\n"),
                       {"t=threads"}, cscoreCommand});
        res.push_back({"pairs", "report distances between paired reads", {"blastfile|bedfile"},
                       commandParameters({"cutoff=0", "mateorientation=" + NONE, "pairsfile=" + NONE,
                                          "insertsfile=" + NONE, "rclip=1", "bins=20", "distmode=ss"},
                                         "Report how many paired ends mapped, distance between mates etc.\n"
                                         "Mates share the read name up to the last rclip characters (/1 /2, .f .r).\n"
                                         "  --cutoff <int>           Distance to call valid links (default: estimate)\n"
                                         "  --mateorientation <o>    Use only one of ++, --, +-, -+\n"
                                         "  --pairsfile <file>       Write linked pairs to file\n"
                                         "  --insertsfile <file>     Write linked distances to file\n"
                                         "  --rclip <int>            Characters clipped off read names (default 1)\n"
                                         "  --bins <int>             Histogram bin size (default 20)\n"
                                         "  --distmode ss|ee         Outer span or inner distance (default ss)\n"),
                       {}, pairsCommand});
        res.push_back({"best", "get best BLAST hit per query", {"blastfile"},
                       commandParameters({"n=1", "hsps", "sorted"},
                                         "Print the best hits of every query.\n"
                                         "  -n <int>   Number of best hits (default 1)\n"
                                         "  --hsps     Report all HSPs of the selected pairs\n"
                                         "  --sorted   Input is sorted by query, stream it\n"),
                       {"n=n"}, bestCommand});
        res.push_back({"filter", "filter BLAST file (based on score, id%, alignlen)", {"blastfile"},
                       commandParameters({"score=0", "pctid=95", "hitlen=100", "evalue=0.01"},
                                         "Write hits passing all cutoffs to <blastfile>.P<pctid>L<hitlen>.\n"
                                         "  --score <float>   Minimal score (default 0)\n"
                                         "  --pctid <float>   Minimal percent identity (default 95)\n"
                                         "  --hitlen <int>    Minimal alignment length (default 100)\n"
                                         "  --evalue <float>  Maximal e-value (default 0.01)\n"),
                       {}, filterCommand});
        res.push_back({"swap", "swap query and subjects in BLAST tabular file", {"blastfile"},
                       commandParameters({}, "Write hits with query and subject swapped to <blastfile>.swapped\n"),
                       {}, swapCommand});
        res.push_back({"bed", "get bed file from BLAST tabular file", {"blastfile"},
                       commandParameters({}, "Write subject intervals of the hits as BED\n"),
                       {}, bedCommand});
        res.push_back({"sort", "sort lines so that query grouped together and scores desc", {"blastfile"},
                       commandParameters({"query", "ref"},
                                         "Sort the file in place.\n"
                                         "  --query  Sort by query position\n"
                                         "  --ref    Sort by reference position\n"),
                       {}, sortCommand});
        res.push_back({"summary", "provide summary on id% and cov%", {"blastfile"},
                       commandParameters({}, "Identity and covered bases for query and reference.\n"),
                       {}, summaryCommand});
        res.push_back({"completeness", "print completeness statistics for each query", {"blastfile", "sequences"},
                       commandParameters({}, "Distance of the aligned block to both ends of the best subject.\n"),
                       {}, completenessCommand});
        res.push_back({"covfilter", "filter BLAST file (based on id% and cov%)", {"blastfile", "sequences"},
                       commandParameters({"pctid=90", "pctcov=50", "ids=" + NONE, "list", "out=" + NONE},
                                         "Sequences give the sizes of the queries.\n"
                                         "  --pctid <float>   Percent identity cutoff (default 90)\n"
                                         "  --pctcov <float>  Percent coverage cutoff (default 50)\n"
                                         "  --ids <file>      Write ids of the queries passing both cutoffs\n"
                                         "  --list            List id% and cov% per query\n"
                                         "  --out <file>      Write hits of the queries passing both cutoffs\n"),
                       {}, covfilterCommand});
        res.push_back({"top10", "count the most frequent 10 hits", {"blastfile"},
                       commandParameters({"ids=" + NONE},
                                         "  --ids <file>  Two column table to rename subjects\n"),
                       {}, top10Command});
        res.push_back({"mismatches", "print out histogram of mismatches of HSPs", {"blastfile"},
                       commandParameters({}, "Histogram of mismatches and gaps of the best hit per query.\n"),
                       {}, mismatchesCommand});
        res.push_back({"annotation", "create tabular file with the annotations", {"blastfile"},
                       commandParameters({"queryids=" + NONE, "subjectids=" + NONE},
                                         "Query and subject columns, optionally renamed.\n"
                                         "  --queryids <file>    Two column table to rename queries\n"
                                         "  --subjectids <file>  Two column table to rename subjects\n"),
                       {}, annotationCommand});
        return res;
    }
}

std::string blasttab::Command::usage() const {
    std::stringstream ss;
    ss << "blasttab " << name;
    for(const std::string &file : files)
        ss << " <" << file << ">";
    ss << " [options]\n" << parameters.helpMessage();
    return ss.str();
}

const std::vector<blasttab::Command> &blasttab::Commands() {
    static const std::vector<Command> commands = createCommands();
    return commands;
}

std::string blasttab::ProgramUsage() {
    std::stringstream ss;
    ss << "Usage: blasttab <command> [arguments]\n\nCommands:\n";
    for(const Command &command : Commands()) {
        ss << "  " << command.name << std::string(command.name.size() < 14 ? 14 - command.name.size() : 1, ' ')
           << command.description << "\n";
    }
    return ss.str();
}

int blasttab::RunCommand(const std::vector<std::string> &args, std::ostream &out) {
    if(args.empty() || args[0] == "--help" || args[0] == "-h") {
        std::cerr << ProgramUsage();
        return args.empty() ? 1 : 0;
    }
    const Command *command = nullptr;
    for(const Command &candidate : Commands()) {
        if(candidate.name == args[0])
            command = &candidate;
    }
    if(command == nullptr) {
        std::cerr << "Unknown command " << args[0] << "\n\n" << ProgramUsage();
        return 1;
    }
    CLParser parser(command->parameters, command->short_params, command->files.size() + 1);
    logging::Logger logger;
    try {
        AlgorithmParameterValues values = parser.parseCL(args);
        if(values.getCheck("help")) {
            std::cerr << command->usage() << std::endl;
            return 0;
        }
        std::string missing = values.checkMissingValues();
        if(!missing.empty() || parser.getStart().size() != command->files.size() + 1) {
            std::cerr << "Failed to parse command line parameters." << std::endl;
            std::cerr << missing << "\n" << command->usage() << std::endl;
            return 1;
        }
        if(values.getValue("log-dir") != NONE) {
            logging::LoggerStorage storage(values.getValue("log-dir"), command->name);
            logger.addLogFile(storage.newLoggerFile(), values.getCheck("debug") ? logging::debug : logging::trace);
        }
        logger.trace() << "Command line: " << parser.getCL() << std::endl;
        logger.debug() << "Parameters:\n" << values.str();
        std::vector<std::string> files(parser.getStart().begin() + 1, parser.getStart().end());
        command->body(logger, values, files, out);
        out.flush();
        logger.trace() << "Finished " << command->name << std::endl;
    } catch (const std::exception &e) {
        logger.info() << "ERROR: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
