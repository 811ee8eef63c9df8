// cutlayout - pack cut-list parts onto stock sheets and print the layout as JSON.
//
// Usage: cutlayout [--config FILE] [--algorithm NAME] [--kerf MM] [--compare]
//                  [--out FILE] [--verbose] [--no-color] JOB.json|DIR [...]
//   - A directory argument stands for every *.json file directly inside it
//   - One job prints a report object (or a comparison with --compare)
//   - Several jobs run in parallel and print an array of {job, report|error}
//   - Exit code 1 if any job fails

#include <iostream>
#include <string>
#include <vector>

#include "core/config/config.h"
#include "core/optimizer/batch_runner.h"
#include "core/optimizer/cut_list_file.h"
#include "core/optimizer/cut_optimizer.h"
#include "core/utils/file_utils.h"
#include "core/utils/log.h"
#include "core/utils/string_utils.h"

using namespace cl;

namespace {

struct Options {
    Path configPath = "cutlayout.ini";
    std::string algorithm;
    bool hasKerf = false;
    f64 kerf = 0.0;
    bool compare = false;
    bool verbose = false;
    Path outPath;
    std::vector<Path> jobs;
};

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " [--config FILE] [--algorithm NAME] [--kerf MM] [--compare]"
                 " [--out FILE] [--verbose] [--no-color] JOB.json|DIR [...]\n"
              << "Algorithms: bottom_left_fill, best_fit_decreasing, guillotine_split\n";
}

bool parseArgs(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;

        if (arg == "--config" && hasValue) {
            opts.configPath = argv[++i];
        } else if (arg == "--algorithm" && hasValue) {
            opts.algorithm = argv[++i];
        } else if (arg == "--kerf" && hasValue) {
            if (!str::parseDouble(argv[++i], opts.kerf)) {
                std::cerr << "Error: --kerf expects a number, got '" << argv[i] << "'\n";
                return false;
            }
            opts.hasKerf = true;
        } else if (arg == "--out" && hasValue) {
            opts.outPath = argv[++i];
        } else if (arg == "--compare") {
            opts.compare = true;
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--no-color") {
            log::setColorEnabled(false);
        } else if (str::startsWith(arg, "--")) {
            std::cerr << "Error: unknown or incomplete option '" << arg << "'\n";
            return false;
        } else if (file::isDirectory(arg)) {
            auto found = file::listFiles(arg, "json");
            if (found.empty()) {
                log::warningf("Main", "No .json jobs in %s", arg.c_str());
            }
            opts.jobs.insert(opts.jobs.end(), found.begin(), found.end());
        } else {
            opts.jobs.emplace_back(arg);
        }
    }

    if (opts.jobs.empty()) {
        std::cerr << "Error: no job files given\n";
        return false;
    }
    return true;
}

bool emit(const Options& opts, const nlohmann::json& doc) {
    std::string text = doc.dump(2);
    if (opts.outPath.empty()) {
        std::cout << text << "\n";
        return true;
    }
    if (!file::ensureParentDirectory(opts.outPath) || !file::replaceText(opts.outPath, text)) {
        std::cerr << "Error: could not write " << opts.outPath << "\n";
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    Options opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage(argv[0]);
        return 1;
    }

    Config& config = Config::instance();
    if (!config.load(opts.configPath)) {
        std::cerr << "Error: could not read config " << opts.configPath << "\n";
        return 1;
    }

    log::setLevel(opts.verbose ? log::Level::Debug : log::levelFromInt(config.getLogLevel()));
    if (config.getLogToFile()) {
        Path logPath = config.getLogFilePath().empty() ? Path("cutlayout.log")
                                                        : config.getLogFilePath();
        if (!log::setLogFile(logPath)) {
            log::warning("Main", "Continuing without log file");
        }
    }

    optimizer::SheetTemplate defaults = config.getSheetTemplate();
    if (opts.hasKerf) {
        defaults.kerfWidth = opts.kerf;
    }
    std::string defaultAlgorithm =
        opts.algorithm.empty() ? optimizer::algorithmName(config.getAlgorithm()) : opts.algorithm;

    std::vector<CutJob> jobs;
    for (const auto& path : opts.jobs) {
        auto job = CutListFile::loadJob(path, defaults, defaultAlgorithm);
        if (!job) {
            std::cerr << "Error: could not load job " << path << "\n";
            return 1;
        }
        // Command-line overrides beat the job file
        if (!opts.algorithm.empty()) {
            job->algorithm = opts.algorithm;
        }
        if (opts.hasKerf) {
            job->sheet.kerfWidth = opts.kerf;
        }
        jobs.push_back(std::move(*job));
    }

    int exitCode = 0;

    if (jobs.size() == 1) {
        const CutJob& job = jobs.front();
        optimizer::CuttingOptimizer optimizer(job.sheet.kerfWidth);

        if (opts.compare) {
            auto comparison = optimizer.compareAlgorithms(job.parts, job.sheet);
            if (!comparison.success) {
                std::cerr << "Error: " << comparison.error.message << "\n";
                static_cast<void>(emit(opts, errorToJson(comparison.error)));
                exitCode = 1;
            } else if (!emit(opts, comparisonToJson(comparison))) {
                exitCode = 1;
            }
        } else {
            auto result = optimizer.optimize(job.parts, job.sheet, job.algorithm);
            if (!result.success) {
                std::cerr << "Error: " << result.error.message << "\n";
                static_cast<void>(emit(opts, errorToJson(result.error)));
                exitCode = 1;
            } else if (!emit(opts, reportToJson(result.report))) {
                exitCode = 1;
            }
        }
    } else {
        if (opts.compare) {
            log::warning("Main", "--compare applies to a single job, ignoring it");
        }

        BatchRunner runner(calculateThreadCount(config.getParallelismTier()));
        auto results = runner.run(jobs);

        nlohmann::json doc = nlohmann::json::array();
        for (const auto& entry : results) {
            nlohmann::json item = {{"job", entry.jobName}};
            if (entry.result.success) {
                item["report"] = reportToJson(entry.result.report);
            } else {
                item.update(errorToJson(entry.result.error));
                exitCode = 1;
            }
            doc.push_back(item);
        }
        if (!emit(opts, doc)) {
            exitCode = 1;
        }
    }

    log::closeLogFile();
    return exitCode;
}
