#include "relaydrop/core/config.hpp"
#include "relaydrop/core/logger.hpp"
#include "relaydrop/core/utils.hpp"
#include <fstream>
#include <sstream>

namespace relaydrop::core {

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    std::size_t line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        auto entry = parse_line(line);
        if (!entry) {
            continue;
        }
        if (entry->first.empty()) {
            LOG_WARN("{}:{}: ignoring entry without a key", filename, line_number);
            continue;
        }
        values_[entry->first] = entry->second;
    }

    return !file.bad();
}

bool Config::save_to_file(const std::string& filename) const {
    std::ostringstream out;
    out << "# RelayDrop Configuration\n";

    // Group keys by their section prefix ("relay", "transfer", ...).
    std::string section;
    for (const auto& [key, value] : values_) {
        auto prefix = key.substr(0, key.find('.'));
        if (prefix != section) {
            out << "\n";
            section = prefix;
        }
        out << key << " = " << value << "\n";
    }

    return utils::FileUtils::write_file_atomic(filename, out.str());
}

std::optional<std::pair<std::string, std::string>> Config::parse_line(const std::string& line) {
    auto trimmed = utils::StringUtils::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
        return std::nullopt;
    }

    auto eq_pos = trimmed.find('=');
    if (eq_pos == std::string::npos) {
        return std::nullopt;
    }

    return std::make_pair(utils::StringUtils::trim(trimmed.substr(0, eq_pos)),
                          utils::StringUtils::trim(trimmed.substr(eq_pos + 1)));
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    auto lower = utils::StringUtils::to_lower(*value);
    return lower == "true" || lower == "1" || lower == "yes" || lower == "on";
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get_as<int>(key);
    return value ? *value : default_value;
}

std::uint64_t Config::get_uint64(const std::string& key, std::uint64_t default_value) const {
    auto value = get_as<std::uint64_t>(key);
    return value ? *value : default_value;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

void Config::set_defaults() {
    values_["relay.host"] = "0.0.0.0";
    values_["relay.port"] = "8000";
    values_["relay.upload_dir"] = "uploads";
    values_["relay.cleanup_after_hours"] = "24";
    values_["relay.sweep_interval_minutes"] = "60";
    values_["signaling.host"] = "0.0.0.0";
    values_["signaling.port"] = "3000";
    values_["signaling.code_length"] = "6";
    values_["signaling.code_ttl_seconds"] = "3600";
    values_["transfer.chunk_size.lan"] = "2097152";
    values_["transfer.chunk_size.webrtc"] = "524288";
    values_["transfer.chunk_size.relay"] = "1048576";
    values_["transfer.max_parallel"] = "5";
    values_["transfer.min_parallel"] = "1";
    values_["transfer.max_retry_attempts"] = "3";
    values_["transfer.retry_delay_ms"] = "2000";
    values_["transfer.mode"] = "relay";
    values_["relay.url"] = "http://127.0.0.1:8000";
    values_["signaling.url"] = "http://127.0.0.1:3000";
    values_["lan.port"] = "9000";
    values_["network.connection_timeout_seconds"] = "30";
    values_["network.chunk_timeout_seconds"] = "60";
    values_["log.level"] = "info";
    values_["log.file"] = "relaydrop.log";
}

}
