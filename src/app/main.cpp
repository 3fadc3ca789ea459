#include "../pipeline/BufferAnalyzer.hpp"
#include "../index/MemoryGeoIndex.hpp"
#include "../io/AnalysisIO.hpp"
#include <iostream>
#include <filesystem>
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

using namespace corridor;

// 命令行选项结构
struct CommandLineOptions {
    std::string indexFile;
    std::string legsFile;
    std::string outputFile;   // 为空时写到 stdout
    double bufferWidth{50.0};
    bool verbose{false};
    bool quiet{false};
    std::string logFile;
};

// 解析命令行参数
std::expected<CommandLineOptions, std::string> parseCommandLine(int argc, char* argv[]) {
    try {
        cxxopts::Options options("corridorq", "Linear buffer analysis over a radius-query point index");

        options.add_options()
            ("i,index", "Index entries JSON file", cxxopts::value<std::string>())
            ("l,legs", "Legs JSON file ([[[lat, lng], ...], ...])", cxxopts::value<std::string>())
            ("w,width", "Buffer width in meters", cxxopts::value<double>()->default_value("50"))
            ("o,output", "Output JSON file (stdout when omitted)", cxxopts::value<std::string>())
            ("v,verbose", "Verbose output", cxxopts::value<bool>()->default_value("false"))
            ("q,quiet", "Quiet mode", cxxopts::value<bool>()->default_value("false"))
            ("log-file", "Log file path", cxxopts::value<std::string>())
            ("h,help", "Show help");

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            std::exit(0);
        }

        CommandLineOptions opts;

        if (result.count("index")) {
            opts.indexFile = result["index"].as<std::string>();
        } else {
            return std::unexpected("Index file is required");
        }

        if (result.count("legs")) {
            opts.legsFile = result["legs"].as<std::string>();
        } else {
            return std::unexpected("Legs file is required");
        }

        if (result.count("output")) {
            opts.outputFile = result["output"].as<std::string>();
        }

        opts.bufferWidth = result["width"].as<double>();
        opts.verbose = result["verbose"].as<bool>();
        opts.quiet = result["quiet"].as<bool>();

        if (result.count("log-file")) {
            opts.logFile = result["log-file"].as<std::string>();
        }

        return opts;

    } catch (const std::exception& e) {
        return std::unexpected(std::string("Command line parsing error: ") + e.what());
    }
}

// 设置日志系统，日志一律走 stderr 以免混入 stdout 上的结果
void setupLogging(const CommandLineOptions& opts) {
    std::vector<spdlog::sink_ptr> sinks;

    if (!opts.quiet) {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(opts.verbose ? spdlog::level::debug : spdlog::level::info);
        sinks.push_back(console_sink);
    }

    if (!opts.logFile.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(opts.logFile, true);
        file_sink->set_level(spdlog::level::trace);
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("corridorq", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::trace);
    spdlog::set_default_logger(logger);

    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
}

// 显示结果摘要
void showResultSummary(const core::AnalysisResult& result) {
    spdlog::info("=== Buffer Analysis Complete ===");
    for (size_t i = 0; i < result.size(); ++i) {
        const auto& leg = result[i];
        spdlog::info("  Leg {}: {:.1f} m, {} sample points, {} matches",
                     i, leg.querySection.distance, leg.querySection.sampleCount(), leg.matches.size());
    }
    spdlog::info("Unique matches: {}", pipeline::countUniqueMatches(result));
}

int main(int argc, char* argv[]) {
    try {
        // 解析命令行
        auto optsResult = parseCommandLine(argc, argv);
        if (!optsResult) {
            std::cerr << "Error: " << optsResult.error() << std::endl;
            return 1;
        }
        const auto opts = *optsResult;

        // 设置日志
        setupLogging(opts);

        spdlog::info("Corridor Query v0.1.0");
        spdlog::info("Index: {}", opts.indexFile);
        spdlog::info("Legs: {}", opts.legsFile);
        spdlog::info("Buffer width: {} m", opts.bufferWidth);

        // 加载索引
        auto entries = io::loadIndexEntries(opts.indexFile);
        if (!entries) {
            spdlog::error("Failed to load index entries: {}", io::toString(entries.error()));
            return 1;
        }

        auto geoIndex = std::make_shared<index::MemoryGeoIndex>();
        geoIndex->set(*entries);
        spdlog::info("Indexed {} entries", geoIndex->size());

        // 加载折线
        auto legs = io::loadLegs(opts.legsFile);
        if (!legs) {
            spdlog::error("Failed to load legs: {}", io::toString(legs.error()));
            return 1;
        }

        auto analyzer = pipeline::createAnalyzer()
            .withIndex(geoIndex)
            .withLogging(true)
            .build();
        if (!analyzer) {
            spdlog::error("Analyzer construction failed: {}", pipeline::toString(analyzer.error()));
            return 1;
        }

        auto pending = analyzer->analyze(*legs, opts.bufferWidth);
        if (!pending) {
            spdlog::error("Analysis rejected: {}", pipeline::toString(pending.error()));
            return 1;
        }

        const auto result = pending->get();
        showResultSummary(result);

        // 输出结果
        if (opts.outputFile.empty()) {
            std::cout << io::toJson(result).dump(2) << std::endl;
        } else {
            auto written = io::writeAnalysisResult(result, opts.outputFile);
            if (!written) {
                spdlog::error("Failed to write {}: {}", opts.outputFile, io::toString(written.error()));
                return 1;
            }
            spdlog::info("Result written to {}", opts.outputFile);
        }

        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
