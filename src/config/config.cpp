#include "slotguard/config.hpp"
#include <charconv>
#include <fstream>

namespace slotguard {

slots::ControlLayout RuntimeConfig::control_layout() const {
    return slots::ControlLayout::from_namespaces(implementation_namespace, admin_namespace);
}

std::optional<LogLevel> RuntimeConfig::parse_log_level(const std::string& value) {
    if (value == "trace") return LogLevel::Trace;
    if (value == "debug") return LogLevel::Debug;
    if (value == "info") return LogLevel::Info;
    if (value == "warn") return LogLevel::Warn;
    if (value == "error") return LogLevel::Error;
    if (value == "off") return LogLevel::Off;
    return std::nullopt;
}

std::optional<LayoutPolicy> RuntimeConfig::parse_layout_policy(const std::string& value) {
    if (value == "off") return LayoutPolicy::Off;
    if (value == "warn") return LayoutPolicy::Warn;
    if (value == "enforce") return LayoutPolicy::Enforce;
    return std::nullopt;
}

std::optional<layout::GapPolicy> RuntimeConfig::parse_gap_policy(const std::string& value) {
    if (value == "convention") return layout::GapPolicy::Convention;
    if (value == "strict") return layout::GapPolicy::Strict;
    return std::nullopt;
}

RuntimeConfig RuntimeConfig::from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        log::warn("CONFIG", "Cannot open " + path + ", using defaults");
        return RuntimeConfig{};
    }
    return from_stream(file);
}

RuntimeConfig RuntimeConfig::from_stream(std::istream& in) {
    RuntimeConfig config;

    std::string line;
    std::string current_section;

    auto trim = [](const std::string& str) {
        auto first = str.find_first_not_of(" \t\r\n");
        if (std::string::npos == first) return std::string();
        auto last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, (last - first + 1));
    };

    auto to_uint64 = [](const std::string& s) -> std::optional<uint64_t> {
        uint64_t value = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
        if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
        return value;
    };

    auto invalid = [](const std::string& key, const std::string& value) {
        log::warn("CONFIG", "Ignoring invalid " + key + " = '" + value + "'");
    };

    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        if (line.front() == '[' && line.back() == ']') {
            current_section = line.substr(1, line.size() - 2);
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            invalid(current_section, line);
            continue;
        }

        std::string key = trim(line.substr(0, eq));
        std::string val_str = trim(line.substr(eq + 1));

        // Remove quotes if present
        if (val_str.size() >= 2 && val_str.front() == '"' && val_str.back() == '"') {
            val_str = val_str.substr(1, val_str.size() - 2);
        }

        if (current_section == "log") {
            if (key == "level") {
                if (auto level = parse_log_level(val_str)) config.log_level = *level;
                else invalid(key, val_str);
            }
        } else if (current_section == "layout") {
            if (key == "policy") {
                if (auto policy = parse_layout_policy(val_str)) config.layout_policy = *policy;
                else invalid(key, val_str);
            } else if (key == "gap_policy") {
                if (auto policy = parse_gap_policy(val_str)) config.gap_policy = *policy;
                else invalid(key, val_str);
            } else if (key == "max_sequential_fields") {
                auto n = to_uint64(val_str);
                if (n && *n > 0) config.max_sequential_fields = *n;
                else invalid(key, val_str);
            }
        } else if (current_section == "proxy") {
            if (key == "implementation_namespace" && !val_str.empty()) {
                config.implementation_namespace = val_str;
            } else if (key == "admin_namespace" && !val_str.empty()) {
                config.admin_namespace = val_str;
            }
        }
    }

    if (config.implementation_namespace == config.admin_namespace) {
        log::warn("CONFIG", "Implementation and admin namespaces are identical, using defaults");
        config.implementation_namespace = slots::IMPLEMENTATION_NAMESPACE;
        config.admin_namespace = slots::ADMIN_NAMESPACE;
    }

    return config;
}

} // namespace slotguard
