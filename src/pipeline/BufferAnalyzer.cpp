#include "BufferAnalyzer.hpp"
#include "../core/PolylineSegmenter.hpp"
#include "../geo/GeoMath.hpp"
#include <chrono>
#include <cmath>
#include <set>
#include <thread>
#include <spdlog/spdlog.h>

namespace corridor::pipeline {

namespace {

void logMessage(bool enabled, const std::string& level, const std::string& message) {
    if (!enabled) {
        return;
    }
    if (level == "error") {
        spdlog::error(message);
    } else if (level == "warn") {
        spdlog::warn(message);
    } else if (level == "info") {
        spdlog::info(message);
    } else if (level == "debug") {
        spdlog::debug(message);
    } else {
        spdlog::trace(message);
    }
}

template<typename T>
std::future<T> readyFuture(T value) {
    std::promise<T> promise;
    promise.set_value(std::move(value));
    return promise.get_future();
}

// 按输入顺序汇总各 Leg
core::AnalysisResult collectLegs(std::vector<PendingLeg>& pending, bool enableLogging) {
    const auto startTime = std::chrono::steady_clock::now();

    core::AnalysisResult result;
    result.reserve(pending.size());
    for (size_t i = 0; i < pending.size(); ++i) {
        result.push_back(pending[i].collect());
        logMessage(enableLogging, "debug",
                   fmt::format("Leg {}: {} 个采样点，长度 {:.1f} m，命中 {} 条",
                               i, result.back().querySection.sampleCount(),
                               result.back().querySection.distance,
                               result.back().matches.size()));
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);
    logMessage(enableLogging, "info",
               fmt::format("缓冲区分析完成，共 {} 条命中，耗时 {}ms",
                           countUniqueMatches(result), elapsed.count()));
    return result;
}

} // namespace

const char* toString(AnalysisError error) noexcept {
    switch (error) {
        case AnalysisError::InvalidIndex:
            return "geo index handle is not usable";
        case AnalysisError::InvalidBufferWidth:
            return "buffer width must be a number no smaller than 0.1 meters";
        case AnalysisError::InvalidLeg:
            return "every leg needs at least one point";
    }
    return "unknown analysis error";
}

std::expected<BufferAnalyzer, AnalysisError>
BufferAnalyzer::create(std::shared_ptr<index::IGeoIndex> index, AnalyzerConfig config) {
    if (!index) {
        logMessage(config.enableLogging, "error", "缓冲区分析器需要可用的地理索引");
        return std::unexpected(AnalysisError::InvalidIndex);
    }
    return BufferAnalyzer{std::move(index), config};
}

std::expected<void, AnalysisError>
BufferAnalyzer::validate(const std::vector<core::Leg>& legs, double bufferWidth) noexcept {
    if (!std::isfinite(bufferWidth) || bufferWidth < geo::BUFFER_RADIUS_MIN) {
        return std::unexpected(AnalysisError::InvalidBufferWidth);
    }
    for (const auto& leg : legs) {
        if (leg.empty()) {
            return std::unexpected(AnalysisError::InvalidLeg);
        }
    }
    return {};
}

std::expected<std::future<core::AnalysisResult>, AnalysisError>
BufferAnalyzer::analyze(const std::vector<core::Leg>& legs, double bufferWidth) const {
    auto validation = validate(legs, bufferWidth);
    if (!validation) {
        log("warn", std::string("参数校验失败: ") + toString(validation.error()));
        return std::unexpected(validation.error());
    }

    if (legs.empty()) {
        log("debug", "没有输入 Leg，直接返回空结果");
        return readyFuture(core::AnalysisResult{});
    }

    const double stepLength = core::bufferStepLength(bufferWidth);
    auto sections = core::buildQuerySections(legs, stepLength);

    log("info", fmt::format("开始缓冲区分析: {} 条 Leg，缓冲宽度 {:.2f} m，步长 {:.2f} m",
                            legs.size(), bufferWidth, stepLength));

    // 所有 Leg 的子查询同时在途，汇总按输入顺序进行
    QueryOrchestrator orchestrator{index_, stepLength, bufferWidth, config_.enableLogging};
    std::vector<PendingLeg> pending;
    pending.reserve(sections.size());
    try {
        for (auto& section : sections) {
            pending.push_back(orchestrator.dispatch(std::move(section)));
        }
    } catch (const std::exception& e) {
        log("error", std::string("派发查询失败: ") + e.what());
        std::promise<core::AnalysisResult> failed;
        failed.set_exception(std::current_exception());
        return failed.get_future();
    }

    // 汇总线程分离运行，丢弃 future 不阻塞调用方
    const bool enableLogging = config_.enableLogging;
    std::promise<core::AnalysisResult> promise;
    auto result = promise.get_future();
    std::thread([pending = std::move(pending), promise = std::move(promise), enableLogging]() mutable {
        try {
            promise.set_value(collectLegs(pending, enableLogging));
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
    }).detach();

    return result;
}

void BufferAnalyzer::log(const std::string& level, const std::string& message) const {
    logMessage(config_.enableLogging, level, message);
}

AnalyzerBuilder createAnalyzer() {
    return AnalyzerBuilder{};
}

size_t countUniqueMatches(const core::AnalysisResult& result) {
    std::set<std::string> keys;
    for (const auto& leg : result) {
        for (const auto& [key, match] : leg.matches) {
            keys.insert(key);
        }
    }
    return keys.size();
}

} // namespace corridor::pipeline
