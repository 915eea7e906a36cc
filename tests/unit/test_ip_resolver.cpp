/**
 * @file test_ip_resolver.cpp
 * @brief Unit tests for guest address discovery.
 */

#include "vm/ip_resolver.hpp"
#include "hypervisor/domain_descriptor.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <thread>

using namespace vm_sandbox;
using namespace std::chrono_literals;

class IpResolverTest : public ::testing::Test {
protected:
    MockHypervisor hv_;
    Logger logger_{std::make_unique<NullSink>()};
    IpResolver resolver_{hv_, logger_, "default", 10ms};

    void start_domain(const std::string& name, bool networked) {
        auto xml = render_domain_xml(DomainSpec{
            .name = name,
            .uuid = networked ? "00000000-0000-0000-0000-000000000002"
                              : "00000000-0000-0000-0000-000000000001",
            .kind = networked ? DomainKind::Workspace : DomainKind::Ephemeral,
            .disk_path = "/tmp/" + name + ".qcow2",
            .with_network = networked,
            .mac = networked ? "52:54:00:0a:0b:0c" : "",
        });
        ASSERT_TRUE(hv_.define_domain(xml).has_value());
        ASSERT_TRUE(hv_.create(name).has_value());
    }
};

TEST(IpResolverStaticTest, RoutableFilter) {
    EXPECT_TRUE(IpResolver::is_routable_ipv4("192.168.122.10"));
    EXPECT_TRUE(IpResolver::is_routable_ipv4("10.0.0.1"));
    EXPECT_FALSE(IpResolver::is_routable_ipv4("127.0.0.1"));
    EXPECT_FALSE(IpResolver::is_routable_ipv4("169.254.10.20"));
    EXPECT_FALSE(IpResolver::is_routable_ipv4("::1"));
    EXPECT_FALSE(IpResolver::is_routable_ipv4("not-an-ip"));
}

TEST_F(IpResolverTest, AgentAddressSkipsLoopbackAndLinkLocal) {
    start_domain("vm-a", false);
    auto ip = resolver_.resolve_ip("vm-a", 1s, false);
    ASSERT_TRUE(ip.has_value());
    EXPECT_EQ(*ip, "192.168.122.10");
}

TEST_F(IpResolverTest, NotRunningReturnsImmediately) {
    auto xml = render_domain_xml(DomainSpec{.name = "idle", .uuid = "00000000-0000-0000-0000-000000000003"});
    ASSERT_TRUE(hv_.define_domain(xml).has_value());

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(resolver_.resolve_ip("idle", 5s, true).has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
}

TEST_F(IpResolverTest, UnknownDomainReturnsNullopt) {
    EXPECT_FALSE(resolver_.resolve_ip("ghost", 1s, true).has_value());
}

TEST_F(IpResolverTest, TimesOutWithoutAddress) {
    hv_.set_assign_addresses(false);
    start_domain("vm-b", false);

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(resolver_.resolve_ip("vm-b", 100ms, false).has_value());
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_GE(elapsed, 100ms);
    EXPECT_LT(elapsed, 2s);
}

TEST_F(IpResolverTest, DhcpFallbackWhenAgentSilent) {
    hv_.set_agent_silent(true);
    start_domain("ws", true);

    auto ip = resolver_.resolve_ip("ws", 200ms, true);
    ASSERT_TRUE(ip.has_value());
    EXPECT_EQ(*ip, "192.168.122.10");
}

TEST_F(IpResolverTest, NoFallbackWhenDisallowed) {
    hv_.set_agent_silent(true);
    start_domain("ws", true);
    EXPECT_FALSE(resolver_.resolve_ip("ws", 100ms, false).has_value());
}

TEST_F(IpResolverTest, LeaseLookupMatchesMacCaseInsensitively) {
    start_domain("ws", true);
    auto ip = resolver_.lookup_dhcp_lease("ws");
    ASSERT_TRUE(ip.has_value());
    EXPECT_EQ(*ip, "192.168.122.10");
}

TEST_F(IpResolverTest, LeaseLookupWithoutMac) {
    start_domain("vm-c", false);
    EXPECT_FALSE(resolver_.lookup_dhcp_lease("vm-c").has_value());
}

TEST_F(IpResolverTest, StopTokenEndsPolling) {
    hv_.set_assign_addresses(false);
    start_domain("vm-d", false);

    std::stop_source source;
    std::jthread stopper([&source] {
        std::this_thread::sleep_for(50ms);
        source.request_stop();
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(resolver_.resolve_ip("vm-d", 30s, false, source.get_token()).has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}
