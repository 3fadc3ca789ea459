#pragma once

#include "QueryOrchestrator.hpp"
#include "../core/Types.hpp"
#include "../index/GeoIndex.hpp"
#include <expected>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace corridor::pipeline {

// 分析错误类型
enum class AnalysisError {
    InvalidIndex,        // 索引句柄不可用
    InvalidBufferWidth,  // 缓冲宽度非有限值或小于 BUFFER_RADIUS_MIN
    InvalidLeg           // 存在空的 Leg
};

[[nodiscard]] const char* toString(AnalysisError error) noexcept;

// 分析器配置
struct AnalyzerConfig {
    bool enableLogging{true};
};

/**
 * 线状缓冲区分析。
 *
 * 在只支持圆形半径查询的索引上，沿折线布置一串相互重叠的圆形查询，
 * 再用点到线段的精确距离剔除圆内但不在走廊内的记录。
 * 参数校验同步完成；查询全部异步发起，结果通过 future 返回。
 */
class BufferAnalyzer {
public:
    [[nodiscard]] static std::expected<BufferAnalyzer, AnalysisError>
    create(std::shared_ptr<index::IGeoIndex> index, AnalyzerConfig config = {});

    // 校验失败时不发起任何查询。future 在全部 Leg 完成后兑现，
    // 结果顺序与 legs 一致；任一子查询失败则 future 抛出该异常。
    // 汇总在分离的线程上进行，future 可以直接丢弃；索引查询卡住时该线程一直等待
    [[nodiscard]] std::expected<std::future<core::AnalysisResult>, AnalysisError>
    analyze(const std::vector<core::Leg>& legs, double bufferWidth) const;

    [[nodiscard]] static std::expected<void, AnalysisError>
    validate(const std::vector<core::Leg>& legs, double bufferWidth) noexcept;

    // 配置访问
    const AnalyzerConfig& config() const noexcept { return config_; }
    const std::shared_ptr<index::IGeoIndex>& geoIndex() const noexcept { return index_; }

private:
    BufferAnalyzer(std::shared_ptr<index::IGeoIndex> index, AnalyzerConfig config)
        : index_(std::move(index)), config_(config) {}

    void log(const std::string& level, const std::string& message) const;

    std::shared_ptr<index::IGeoIndex> index_;
    AnalyzerConfig config_;
};

// 构建器
class AnalyzerBuilder {
public:
    AnalyzerBuilder() = default;

    AnalyzerBuilder& withIndex(std::shared_ptr<index::IGeoIndex> index) {
        index_ = std::move(index);
        return *this;
    }

    AnalyzerBuilder& withConfig(AnalyzerConfig config) {
        config_ = config;
        return *this;
    }

    AnalyzerBuilder& withLogging(bool enable) {
        config_.enableLogging = enable;
        return *this;
    }

    [[nodiscard]] std::expected<BufferAnalyzer, AnalysisError> build() {
        return BufferAnalyzer::create(std::move(index_), config_);
    }

private:
    std::shared_ptr<index::IGeoIndex> index_;
    AnalyzerConfig config_;
};

[[nodiscard]] AnalyzerBuilder createAnalyzer();

// 统计一次分析的命中总数（跨 Leg 按 key 去重）
[[nodiscard]] size_t countUniqueMatches(const core::AnalysisResult& result);

} // namespace corridor::pipeline
