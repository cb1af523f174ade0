/*
 * StrideGraph - Architecture Threat Modeling Engine
 * Copyright (C) 2026 StrideGraph Security
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
/**
 * ============================================================================
 * StrideGraph - Command Line Tool
 * ============================================================================
 *
 * @file Main.cpp
 * @brief stridegraph: detector output in, STRIDE report out
 *
 * Exit codes:
 *   0  reports written
 *   1  usage error, unreadable input, write failure
 *   2  fatal configuration error (invalid config or rule table)
 * ============================================================================
 */

#include "pch.h"

#include "Config/AnalysisConfig.hpp"
#include "Pipeline/DetectionLoader.hpp"
#include "Pipeline/ThreatModelPipeline.hpp"
#include "Rules/RuleTable.hpp"
#include "Utils/JSONUtils.hpp"
#include "Utils/Logger.hpp"

#include <ctime>
#include <filesystem>

using namespace StrideGraph;

namespace {

    constexpr int EXIT_OK = 0;
    constexpr int EXIT_USAGE = 1;
    constexpr int EXIT_FATAL_CONFIG = 2;

    constexpr const char* DEFAULT_OUTPUT = "stride_report.md";

    struct CliOptions {
        std::vector<std::filesystem::path> detections;
        std::filesystem::path output = DEFAULT_OUTPUT;
        std::optional<std::filesystem::path> jsonOutput;
        std::optional<std::filesystem::path> configFile;
        std::optional<std::filesystem::path> rulesFile;
        std::optional<std::filesystem::path> dumpRules;
        std::optional<std::string> logDirectory;
        Utils::LogLevel logLevel = Utils::LogLevel::Info;
        bool timestamp = false;
        bool help = false;
    };

    void PrintUsage(std::ostream& os) {
        os << "Usage: stridegraph --detections FILE [--detections FILE ...] [options]\n"
              "\n"
              "Builds a STRIDE threat model from architecture-diagram detections.\n"
              "\n"
              "Options:\n"
              "  -d, --detections FILE   Detector output (JSON); repeat for several diagrams\n"
              "  -o, --output FILE       Markdown report path (default: stride_report.md)\n"
              "  -j, --json FILE         Also write the structured JSON record\n"
              "  -c, --config FILE       Analysis configuration (JSON)\n"
              "  -r, --rules FILE        Rule table to use instead of the built-in one\n"
              "      --dump-rules FILE   Write the active rule table as JSON\n"
              "      --timestamp         Stamp reports with the current UTC time\n"
              "      --log-level LEVEL   trace|debug|info|warn|error|fatal (default: info)\n"
              "      --log-file DIR      Also write rotating log files to DIR\n"
              "  -h, --help              Show this help\n"
              "\n"
              "With several --detections files each report name gets the input's stem\n"
              "as a suffix (stride_report_<stem>.md).\n";
    }

    [[nodiscard]] bool ParseArgs(int argc, char** argv, CliOptions& opts, std::string& error) {
        for (int i = 1; i < argc; ++i) {
            const std::string_view arg = argv[i];

            auto next = [&](std::string& out) -> bool {
                if (i + 1 >= argc) {
                    error = std::string("missing value for ") + std::string(arg);
                    return false;
                }
                out = argv[++i];
                return true;
            };

            std::string value;
            if (arg == "-h" || arg == "--help") {
                opts.help = true;
            }
            else if (arg == "-d" || arg == "--detections") {
                if (!next(value)) return false;
                opts.detections.emplace_back(value);
            }
            else if (arg == "-o" || arg == "--output") {
                if (!next(value)) return false;
                opts.output = value;
            }
            else if (arg == "-j" || arg == "--json") {
                if (!next(value)) return false;
                opts.jsonOutput = value;
            }
            else if (arg == "-c" || arg == "--config") {
                if (!next(value)) return false;
                opts.configFile = value;
            }
            else if (arg == "-r" || arg == "--rules") {
                if (!next(value)) return false;
                opts.rulesFile = value;
            }
            else if (arg == "--dump-rules") {
                if (!next(value)) return false;
                opts.dumpRules = value;
            }
            else if (arg == "--timestamp") {
                opts.timestamp = true;
            }
            else if (arg == "--log-level") {
                if (!next(value)) return false;
                if (!Utils::ParseLogLevel(value, opts.logLevel)) {
                    error = "unknown log level '" + value + "'";
                    return false;
                }
            }
            else if (arg == "--log-file") {
                if (!next(value)) return false;
                opts.logDirectory = value;
            }
            else {
                error = "unknown argument '" + std::string(arg) + "'";
                return false;
            }
        }

        if (!opts.help && opts.detections.empty() && !opts.dumpRules) {
            error = "at least one --detections file is required";
            return false;
        }
        return true;
    }

    [[nodiscard]] std::string UtcTimestamp() {
        const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm{};
        gmtime_r(&now, &tm);
        char buf[32] = {};
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S UTC", &tm);
        return buf;
    }

    /// report.md + "aws" -> report_aws.md
    [[nodiscard]] std::filesystem::path SuffixedPath(const std::filesystem::path& base, const std::string& suffix) {
        std::filesystem::path out = base;
        out.replace_filename(base.stem().string() + "_" + suffix + base.extension().string());
        return out;
    }

    void InitLogging(const CliOptions& opts) {
        Utils::LoggerConfig cfg;
        cfg.async = true;
        cfg.toConsole = true;
        cfg.includeSrcLocation = opts.logLevel <= Utils::LogLevel::Debug;
        cfg.minimalLevel = opts.logLevel;
        if (opts.logDirectory) {
            cfg.toFile = true;
            cfg.logDirectory = *opts.logDirectory;
            cfg.baseFileName = "stridegraph";
        }
        Utils::Logger::Instance().Initialize(cfg);
    }

    [[nodiscard]] int Run(const CliOptions& opts) {
        Config::AnalysisConfig config;
        if (opts.configFile) {
            Config::ConfigError err;
            if (!Config::LoadConfigFromFile(*opts.configFile, config, &err)) {
                std::cerr << "[ERROR] " << opts.configFile->string() << ": " << err.message << "\n";
                return EXIT_FATAL_CONFIG;
            }
        }

        std::optional<Rules::RuleTable> loadedRules;
        const Rules::RuleTable* rules = nullptr;
        if (opts.rulesFile) {
            Rules::RuleTableError err;
            loadedRules = Rules::RuleTable::LoadFromFile(*opts.rulesFile, &err);
            if (!loadedRules) {
                std::cerr << "[ERROR] refusing to run: " << err.ToString() << "\n";
                return EXIT_FATAL_CONFIG;
            }
            rules = &*loadedRules;
        }
        else {
            try {
                rules = &Rules::RuleTable::BuiltIn();
            }
            catch (const std::logic_error& e) {
                std::cerr << "[ERROR] refusing to run: " << e.what() << "\n";
                return EXIT_FATAL_CONFIG;
            }
        }

        if (opts.dumpRules) {
            Utils::JSON::SaveOptions so;
            so.pretty = true;
            Utils::JSON::Error err;
            if (!Utils::JSON::SaveToFile(*opts.dumpRules, rules->ToJson(), &err, so)) {
                std::cerr << "[ERROR] cannot write " << opts.dumpRules->string() << ": " << err.message << "\n";
                return EXIT_USAGE;
            }
            std::cout << "Rule table '" << rules->Version() << "' (" << rules->Size() << " rules) written to "
                      << opts.dumpRules->string() << "\n";
        }

        if (opts.detections.empty()) {
            return EXIT_OK;
        }

        std::vector<Pipeline::AnalysisRequest> requests;
        requests.reserve(opts.detections.size());
        const std::optional<std::string> generatedAt =
            opts.timestamp ? std::optional<std::string>(UtcTimestamp()) : std::nullopt;

        for (const auto& path : opts.detections) {
            Pipeline::DetectionInput input;
            Pipeline::DetectionLoadError err;
            if (!Pipeline::LoadDetectionsFromFile(path, input, &err)) {
                std::cerr << "[ERROR] " << err.ToString() << "\n";
                return EXIT_USAGE;
            }

            Pipeline::AnalysisRequest request;
            request.name = path.stem().string();
            request.image = input.image;
            request.detections = std::move(input.detections);
            request.reportOptions.sourceLabel = input.source;
            request.reportOptions.generatedAt = generatedAt;
            requests.push_back(std::move(request));
        }

        std::vector<Pipeline::AnalysisResult> results;
        try {
            const Pipeline::ThreatModelPipeline pipeline(config, *rules);
            results = pipeline.RunBatch(requests);
        }
        catch (const std::invalid_argument& e) {
            std::cerr << "[ERROR] " << e.what() << "\n";
            return EXIT_FATAL_CONFIG;
        }

        const bool several = results.size() > 1;
        for (const auto& result : results) {
            const std::filesystem::path mdPath = several ? SuffixedPath(opts.output, result.name) : opts.output;

            Utils::JSON::Error err;
            if (!Utils::JSON::SaveTextToFile(mdPath, result.report.document, &err)) {
                std::cerr << "[ERROR] cannot write " << mdPath.string() << ": " << err.message << "\n";
                return EXIT_USAGE;
            }

            std::optional<std::filesystem::path> jsonPath;
            if (opts.jsonOutput) {
                jsonPath = several ? SuffixedPath(*opts.jsonOutput, result.name) : *opts.jsonOutput;
                Utils::JSON::SaveOptions so;
                so.pretty = true;
                if (!Utils::JSON::SaveToFile(*jsonPath, result.report.record, &err, so)) {
                    std::cerr << "[ERROR] cannot write " << jsonPath->string() << ": " << err.message << "\n";
                    return EXIT_USAGE;
                }
            }

            std::cout << "Report saved to: " << mdPath.string() << "\n";
            if (jsonPath) {
                std::cout << "   Record saved to:     " << jsonPath->string() << "\n";
            }
            std::cout << "   Components analyzed: " << result.graph.components.size() << "\n"
                      << "   Threats identified:  " << result.findings.size() << "\n"
                      << "   Overall risk level:  " << Report::RiskLabel(result.overallRisk) << "\n";
            if (!result.graph.diagnostics.empty()) {
                std::cout << "   Detections skipped/merged: " << result.graph.diagnostics.size() << "\n";
            }
        }
        return EXIT_OK;
    }

}  // namespace

int main(int argc, char** argv) {
    CliOptions opts;
    std::string error;
    if (!ParseArgs(argc, argv, opts, error)) {
        std::cerr << "stridegraph: " << error << "\n\n";
        PrintUsage(std::cerr);
        return EXIT_USAGE;
    }
    if (opts.help) {
        PrintUsage(std::cout);
        return EXIT_OK;
    }

    try {
        InitLogging(opts);
    }
    catch (const std::exception& ex) {
        std::cerr << "[FATAL] Logger initialization failed: " << ex.what() << "\n";
        return EXIT_USAGE;
    }

    int rc = EXIT_USAGE;
    try {
        rc = Run(opts);
    }
    catch (const std::exception& ex) {
        SG_LOG_FATAL("Main", "Analysis aborted: %s", ex.what());
        std::cerr << "[FATAL] " << ex.what() << "\n";
        rc = EXIT_USAGE;
    }

    Utils::Logger::Instance().ShutDown();
    return rc;
}
