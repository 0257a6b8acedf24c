#include <gtest/gtest.h>
#include "exec/resource_limits.hpp"

using namespace runbox::exec;

TEST(ResourceLimitsTest, TiersWidenMonotonically) {
    const auto& free_limits = ResourceLimitPolicy::limits_for(Tier::FREE);
    const auto& pro = ResourceLimitPolicy::limits_for(Tier::PRO);
    const auto& enterprise = ResourceLimitPolicy::limits_for(Tier::ENTERPRISE);

    EXPECT_LT(free_limits.timeout_ms, pro.timeout_ms);
    EXPECT_LT(pro.timeout_ms, enterprise.timeout_ms);
    EXPECT_LT(free_limits.memory_mb, pro.memory_mb);
    EXPECT_LT(pro.memory_mb, enterprise.memory_mb);
    EXPECT_LT(free_limits.cpu_shares, pro.cpu_shares);
    EXPECT_LT(pro.cpu_shares, enterprise.cpu_shares);
    EXPECT_LT(free_limits.max_output_bytes, pro.max_output_bytes);
    EXPECT_LT(pro.max_output_bytes, enterprise.max_output_bytes);
}

TEST(ResourceLimitsTest, FreeTierValues) {
    const auto& limits = ResourceLimitPolicy::limits_for(Tier::FREE);
    EXPECT_EQ(limits.timeout_ms, 5000u);
    EXPECT_EQ(limits.memory_mb, 128u);
    EXPECT_EQ(limits.max_output_bytes, 64u * 1024);
}

TEST(ResourceLimitsTest, SmallerTimeoutWins) {
    auto limits = ResourceLimitPolicy::effective_limits(Tier::PRO, 1500);
    EXPECT_EQ(limits.timeout_ms, 1500u);
    EXPECT_EQ(limits.memory_mb, ResourceLimitPolicy::limits_for(Tier::PRO).memory_mb);
}

TEST(ResourceLimitsTest, LargerTimeoutIsIgnored) {
    auto limits = ResourceLimitPolicy::effective_limits(Tier::FREE, 60000);
    EXPECT_EQ(limits.timeout_ms, 5000u);
}

TEST(ResourceLimitsTest, NonPositiveTimeoutIsIgnored) {
    EXPECT_EQ(ResourceLimitPolicy::effective_limits(Tier::FREE, 0).timeout_ms, 5000u);
    EXPECT_EQ(ResourceLimitPolicy::effective_limits(Tier::FREE, -5).timeout_ms, 5000u);
    EXPECT_EQ(ResourceLimitPolicy::effective_limits(Tier::FREE, std::nullopt).timeout_ms, 5000u);
}

TEST(ResourceLimitsTest, TierNames) {
    EXPECT_EQ(tier_from_string("pro"), Tier::PRO);
    EXPECT_EQ(tier_from_string("enterprise"), Tier::ENTERPRISE);
    EXPECT_EQ(tier_from_string("platinum"), Tier::FREE);
    EXPECT_STREQ(tier_to_string(Tier::ENTERPRISE), "enterprise");
}
