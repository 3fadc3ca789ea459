#include "AnalysisIO.hpp"
#include <fstream>
#include <iomanip>
#include <spdlog/spdlog.h>

namespace corridor::io {

const char* toString(IoError error) noexcept {
    switch (error) {
        case IoError::FileNotFound:
            return "file not found";
        case IoError::ReadError:
            return "read error";
        case IoError::JsonError:
            return "malformed JSON";
        case IoError::InvalidFormat:
            return "unexpected document layout";
        case IoError::WriteError:
            return "write error";
    }
    return "unknown I/O error";
}

std::expected<geo::LatLng, IoError> parseLatLng(const nlohmann::json& value) {
    if (!value.is_array() || value.size() != 2 ||
        !value[0].is_number() || !value[1].is_number()) {
        return std::unexpected(IoError::InvalidFormat);
    }

    const double lat = value[0].get<double>();
    const double lng = value[1].get<double>();
    if (lat < -90.0 || lat > 90.0 || lng < -180.0 || lng > 180.0) {
        return std::unexpected(IoError::InvalidFormat);
    }

    return geo::LatLng{lat, lng};
}

nlohmann::json toJson(const geo::LatLng& point) {
    return nlohmann::json::array({point.latitude, point.longitude});
}

std::expected<std::vector<core::Leg>, IoError> parseLegs(const nlohmann::json& document) {
    if (!document.is_array()) {
        return std::unexpected(IoError::InvalidFormat);
    }

    std::vector<core::Leg> legs;
    legs.reserve(document.size());
    for (const auto& legJson : document) {
        if (!legJson.is_array()) {
            return std::unexpected(IoError::InvalidFormat);
        }

        core::Leg leg;
        leg.reserve(legJson.size());
        for (const auto& pointJson : legJson) {
            auto point = parseLatLng(pointJson);
            if (!point) {
                return std::unexpected(point.error());
            }
            leg.push_back(*point);
        }
        legs.push_back(std::move(leg));
    }

    return legs;
}

std::expected<std::vector<core::IndexMatch>, IoError>
parseIndexEntries(const nlohmann::json& document) {
    std::vector<core::IndexMatch> entries;

    if (document.is_object()) {
        entries.reserve(document.size());
        for (const auto& [key, value] : document.items()) {
            auto location = parseLatLng(value);
            if (!location) {
                return std::unexpected(location.error());
            }
            entries.push_back(core::IndexMatch{key, *location});
        }
        return entries;
    }

    if (document.is_array()) {
        entries.reserve(document.size());
        for (const auto& item : document) {
            if (!item.is_object() || !item.contains("key") || !item["key"].is_string() ||
                !item.contains("location")) {
                return std::unexpected(IoError::InvalidFormat);
            }
            auto location = parseLatLng(item["location"]);
            if (!location) {
                return std::unexpected(location.error());
            }
            entries.push_back(core::IndexMatch{item["key"].get<std::string>(), *location});
        }
        return entries;
    }

    return std::unexpected(IoError::InvalidFormat);
}

nlohmann::json toJson(const core::QuerySection& section) {
    nlohmann::json polyline = nlohmann::json::array();
    for (const auto& point : section.samplePoints) {
        polyline.push_back(toJson(point));
    }

    return nlohmann::json{
        {"start", toJson(section.start)},
        {"end", toJson(section.end)},
        {"distance", section.distance},
        {"queryPolyline", std::move(polyline)}
    };
}

nlohmann::json toJson(const core::AnalysisResult& result) {
    nlohmann::json legs = nlohmann::json::array();
    for (const auto& leg : result) {
        nlohmann::json matches = nlohmann::json::object();
        for (const auto& [key, match] : leg.matches) {
            matches[key] = nlohmann::json{{"key", match.key}, {"location", toJson(match.location)}};
        }

        legs.push_back(nlohmann::json{
            {"querySection", toJson(leg.querySection)},
            {"queryResult", std::move(matches)}
        });
    }
    return legs;
}

std::expected<nlohmann::json, IoError> readJsonFile(const std::filesystem::path& filePath) {
    if (!std::filesystem::exists(filePath)) {
        spdlog::error("文件不存在: {}", filePath.string());
        return std::unexpected(IoError::FileNotFound);
    }

    std::ifstream file(filePath);
    if (!file.is_open()) {
        return std::unexpected(IoError::ReadError);
    }

    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("JSON 解析失败 {}: {}", filePath.string(), e.what());
        return std::unexpected(IoError::JsonError);
    }
}

std::expected<std::vector<core::Leg>, IoError> loadLegs(const std::filesystem::path& filePath) {
    auto document = readJsonFile(filePath);
    if (!document) {
        return std::unexpected(document.error());
    }
    return parseLegs(*document);
}

std::expected<std::vector<core::IndexMatch>, IoError>
loadIndexEntries(const std::filesystem::path& filePath) {
    auto document = readJsonFile(filePath);
    if (!document) {
        return std::unexpected(document.error());
    }
    return parseIndexEntries(*document);
}

std::expected<void, IoError>
writeAnalysisResult(const core::AnalysisResult& result, const std::filesystem::path& outputFile) {
    std::ofstream file(outputFile);
    if (!file.is_open()) {
        return std::unexpected(IoError::WriteError);
    }

    try {
        file << std::setw(2) << toJson(result) << std::endl;
    } catch (const nlohmann::json::exception&) {
        return std::unexpected(IoError::JsonError);
    }

    if (!file.good()) {
        return std::unexpected(IoError::WriteError);
    }

    return {};
}

} // namespace corridor::io
