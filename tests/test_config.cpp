#include <gtest/gtest.h>
#include <sstream>
#include "slotguard/config.hpp"

using namespace slotguard;

TEST(config, defaults)
{
    RuntimeConfig config;
    EXPECT_EQ(config.log_level, LogLevel::Info);
    EXPECT_EQ(config.layout_policy, LayoutPolicy::Warn);
    EXPECT_EQ(config.gap_policy, layout::GapPolicy::Convention);
    EXPECT_EQ(config.control_layout().implementation, slots::implementation());
    EXPECT_EQ(config.control_layout().admin, slots::admin());
}

TEST(config, parse_stream)
{
    std::istringstream in(R"(
# slotguard runtime
[log]
level = debug

[layout]
policy = enforce
gap_policy = strict
max_sequential_fields = 1024

[proxy]
implementation_namespace = "acme.proxy.implementation"
admin_namespace = acme.proxy.admin
)");

    auto config = RuntimeConfig::from_stream(in);
    EXPECT_EQ(config.log_level, LogLevel::Debug);
    EXPECT_EQ(config.layout_policy, LayoutPolicy::Enforce);
    EXPECT_EQ(config.gap_policy, layout::GapPolicy::Strict);
    EXPECT_EQ(config.max_sequential_fields, 1024u);
    EXPECT_EQ(config.implementation_namespace, "acme.proxy.implementation");
    EXPECT_EQ(config.control_layout().admin, slots::reserved("acme.proxy.admin"));
}

TEST(config, invalid_values_keep_defaults)
{
    std::istringstream in(R"(
[log]
level = loud
[layout]
policy = sometimes
max_sequential_fields = -5
not a key value line
)");

    auto config = RuntimeConfig::from_stream(in);
    EXPECT_EQ(config.log_level, LogLevel::Info);
    EXPECT_EQ(config.layout_policy, LayoutPolicy::Warn);
    EXPECT_EQ(config.max_sequential_fields, 1ULL << 32);
}

TEST(config, identical_namespaces_fall_back)
{
    std::istringstream in(R"(
[proxy]
implementation_namespace = same
admin_namespace = same
)");

    auto config = RuntimeConfig::from_stream(in);
    EXPECT_EQ(config.implementation_namespace, slots::IMPLEMENTATION_NAMESPACE);
    EXPECT_EQ(config.admin_namespace, slots::ADMIN_NAMESPACE);
}

TEST(config, missing_file)
{
    auto config = RuntimeConfig::from_file("/nonexistent/slotguard.conf");
    EXPECT_EQ(config.layout_policy, LayoutPolicy::Warn);
}

TEST(config, parse_helpers)
{
    EXPECT_EQ(RuntimeConfig::parse_log_level("off"), LogLevel::Off);
    EXPECT_FALSE(RuntimeConfig::parse_log_level("OFF").has_value());
    EXPECT_EQ(RuntimeConfig::parse_layout_policy("off"), LayoutPolicy::Off);
    EXPECT_EQ(RuntimeConfig::parse_gap_policy("convention"), layout::GapPolicy::Convention);
    EXPECT_FALSE(RuntimeConfig::parse_gap_policy("loose").has_value());
}
