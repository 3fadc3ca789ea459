#pragma once

#include "../core/Types.hpp"
#include <expected>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <vector>

namespace corridor::io {

// 读写错误类型
enum class IoError {
    FileNotFound,
    ReadError,
    JsonError,
    InvalidFormat,
    WriteError
};

[[nodiscard]] const char* toString(IoError error) noexcept;

// [lat, lng]
[[nodiscard]] std::expected<geo::LatLng, IoError> parseLatLng(const nlohmann::json& value);
[[nodiscard]] nlohmann::json toJson(const geo::LatLng& point);

// [[[lat, lng], ...], ...]
[[nodiscard]] std::expected<std::vector<core::Leg>, IoError> parseLegs(const nlohmann::json& document);

// 支持两种写法：
//   {"key": [lat, lng], ...}
//   [{"key": "...", "location": [lat, lng]}, ...]
[[nodiscard]] std::expected<std::vector<core::IndexMatch>, IoError>
parseIndexEntries(const nlohmann::json& document);

// [{"querySection": {start, end, distance, queryPolyline},
//   "queryResult": {key: {key, location}}}, ...]
[[nodiscard]] nlohmann::json toJson(const core::QuerySection& section);
[[nodiscard]] nlohmann::json toJson(const core::AnalysisResult& result);

// 文件读写
[[nodiscard]] std::expected<nlohmann::json, IoError> readJsonFile(const std::filesystem::path& filePath);
[[nodiscard]] std::expected<std::vector<core::Leg>, IoError> loadLegs(const std::filesystem::path& filePath);
[[nodiscard]] std::expected<std::vector<core::IndexMatch>, IoError>
loadIndexEntries(const std::filesystem::path& filePath);
[[nodiscard]] std::expected<void, IoError>
writeAnalysisResult(const core::AnalysisResult& result, const std::filesystem::path& outputFile);

} // namespace corridor::io
