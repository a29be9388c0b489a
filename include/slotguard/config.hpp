#pragma once

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include "slotguard/layout.hpp"
#include "slotguard/log.hpp"
#include "slotguard/slots.hpp"

namespace slotguard {

/**
 * @brief How the runtime treats layout problems found before an upgrade
 */
enum class LayoutPolicy {
    Off,      // no checks
    Warn,     // log the report, proceed
    Enforce   // refuse with StorageCollision
};

/**
 * @brief Runtime configuration
 *
 * File format (sections optional):
 *   [log]
 *   level = "info"
 *   [layout]
 *   policy = "warn"
 *   gap_policy = "convention"
 *   max_sequential_fields = 4294967296
 *   [proxy]
 *   implementation_namespace = "eip1967.proxy.implementation"
 *   admin_namespace = "eip1967.proxy.admin"
 */
struct RuntimeConfig {
    // Logging
    LogLevel log_level{LogLevel::Info};

    // Layout validation
    LayoutPolicy layout_policy{LayoutPolicy::Warn};
    layout::GapPolicy gap_policy{layout::GapPolicy::Convention};
    uint64_t max_sequential_fields{1ULL << 32};

    // Transparent proxy control slots
    std::string implementation_namespace{slots::IMPLEMENTATION_NAMESPACE};
    std::string admin_namespace{slots::ADMIN_NAMESPACE};

    slots::ControlLayout control_layout() const;

    // Load from file; missing file or bad values keep defaults
    static RuntimeConfig from_file(const std::string& path);
    static RuntimeConfig from_stream(std::istream& in);

    static std::optional<LogLevel> parse_log_level(const std::string& value);
    static std::optional<LayoutPolicy> parse_layout_policy(const std::string& value);
    static std::optional<layout::GapPolicy> parse_gap_policy(const std::string& value);
};

} // namespace slotguard
