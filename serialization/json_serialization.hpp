#ifndef SPINLOGO_SERIALIZATION_JSON_SERIALIZATION_HPP
#define SPINLOGO_SERIALIZATION_JSON_SERIALIZATION_HPP

#include <common/errors.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>

namespace spinlogo::json {

// Bumped when the layout of a step's data section changes
constexpr const char* SERIALIZATION_VERSION = "1.0.0";

// Envelope around every JSON file the CLI writes: which step produced it,
// from what configuration, summary numbers and the payload itself
struct SerializedData {
    std::string version = SERIALIZATION_VERSION;
    std::string step;               // airfoil, emblem, overlay
    std::string timestamp;
    std::string source_file;        // Config file, empty for defaults
    nlohmann::json config;
    nlohmann::json stats;
    nlohmann::json data;
};

// UTC, ISO 8601
inline std::string get_timestamp() {
    auto time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&time), "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Local time as YYYYmmdd_HHMMSS, for default file names
inline std::string get_file_timestamp() {
    auto time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::ostringstream oss;
    oss << std::put_time(std::localtime(&time), "%Y%m%d_%H%M%S");
    return oss.str();
}

// Envelope for `step`, stamped now
inline SerializedData make_serialized(const std::string& step, const std::string& source_file) {
    SerializedData result;
    result.step = step;
    result.timestamp = get_timestamp();
    result.source_file = source_file;
    return result;
}

inline void to_json(nlohmann::json& j, const SerializedData& d) {
    j = {
        {"version", d.version},
        {"step", d.step},
        {"data", d.data}
    };
    if (!d.timestamp.empty()) j["timestamp"] = d.timestamp;
    if (!d.source_file.empty()) j["source_file"] = d.source_file;
    if (!d.config.is_null()) j["config"] = d.config;
    if (!d.stats.is_null()) j["stats"] = d.stats;
}

inline void from_json(const nlohmann::json& j, SerializedData& d) {
    if (!j.is_object() || !j.contains("data")) {
        throw std::runtime_error("Serialized file has no data section");
    }
    d.version = j.value("version", "unknown");
    d.step = j.value("step", "unknown");
    d.timestamp = j.value("timestamp", "");
    d.source_file = j.value("source_file", "");
    d.config = j.value("config", nlohmann::json());
    d.stats = j.value("stats", nlohmann::json());
    d.data = j.at("data");
}

// Pretty printed with a 2-space indent
inline void write_json_file(const std::string& path, const nlohmann::json& j) {
    std::ofstream file(path);
    if (!file) {
        throw IOFailure("Cannot write to file: " + path);
    }
    file << j.dump(2) << "\n";
    if (!file) {
        throw IOFailure("Write failed for file: " + path);
    }
}

inline nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw IOFailure("Cannot open file: " + path);
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path + ": " + e.what());
    }
}

inline void write_serialized(const std::string& path, const SerializedData& data) {
    write_json_file(path, nlohmann::json(data));
}

inline SerializedData read_serialized(const std::string& path) {
    return read_json_file(path).get<SerializedData>();
}

}  // namespace spinlogo::json

#endif // SPINLOGO_SERIALIZATION_JSON_SERIALIZATION_HPP
