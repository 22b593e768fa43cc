#include <gtest/gtest.h>

#include "endpoint_resolver.hpp"
#include "pcdrop/errors.hpp"
#include "test_support.hpp"

using namespace pcdrop;
using pcdrop::test::FakeInterfaces;

namespace {

NetworkInterface iface(const std::string &name, const std::string &address, const bool &default_route = false) {
    return test::make_interface(name, address, default_route);
}

const std::vector<std::string> SUBNETS{"192.168.43.0/24", "192.168.49.0/24"};

EndpointResolver make_resolver(const InterfaceSource &source) {
    return EndpointResolver(source, EndpointResolver::hotspotMatchers(SUBNETS), EndpointResolver::lanMatchers());
}

}

TEST(EndpointResolverTest, HotspotPrefersTetheringSubnet) {
    FakeInterfaces source({iface("eth0", "10.0.0.5", true), iface("wlan1", "192.168.43.1")});
    EndpointResolver resolver = make_resolver(source);

    InterfaceSelection selected = resolver.select(TransferMode::Hotspot);
    EXPECT_EQ(selected.iface.address, "192.168.43.1");
    EXPECT_FALSE(selected.fallback);
    EXPECT_EQ(selected.matched_by, "subnet 192.168.43.0/24");
}

TEST(EndpointResolverTest, LanPrefersDefaultRoute) {
    FakeInterfaces source({iface("wlan1", "192.168.43.1"), iface("eth0", "10.0.0.5", true)});
    EndpointResolver resolver = make_resolver(source);

    InterfaceSelection selected = resolver.select(TransferMode::Lan);
    EXPECT_EQ(selected.iface.address, "10.0.0.5");
    EXPECT_FALSE(selected.fallback);
}

TEST(EndpointResolverTest, HotspotAdapterFlagBeatsSubnets) {
    NetworkInterface adapter = iface("ap0", "10.1.2.3");
    adapter.hotspot_adapter = true;
    FakeInterfaces source({iface("wlan1", "192.168.43.1"), adapter});
    EndpointResolver resolver = make_resolver(source);

    EXPECT_EQ(resolver.select(TransferMode::Hotspot).iface.name, "ap0");
}

TEST(EndpointResolverTest, FallsBackToFirstInterfaceWithWarning) {
    FakeInterfaces source({iface("lo", "127.0.0.1"), iface("eth0", "10.0.0.5"), iface("eth1", "10.0.1.5")});
    // loopback flag is what excludes an interface, not its name
    std::vector<NetworkInterface> list = source.interfaces();
    list[0].loopback = true;
    FakeInterfaces flagged(list);
    EndpointResolver resolver = make_resolver(flagged);

    InterfaceSelection hotspot = resolver.select(TransferMode::Hotspot);
    EXPECT_TRUE(hotspot.fallback);
    EXPECT_EQ(hotspot.iface.name, "eth0");

    InterfaceSelection lan = resolver.select(TransferMode::Lan);
    EXPECT_TRUE(lan.fallback);
    EXPECT_EQ(lan.iface.name, "eth0");
}

TEST(EndpointResolverTest, NoUsableInterfaceFails) {
    NetworkInterface lo = iface("lo", "127.0.0.1");
    lo.loopback = true;
    NetworkInterface down = iface("eth0", "10.0.0.5", true);
    down.up = false;
    FakeInterfaces source({lo, down});
    EndpointResolver resolver = make_resolver(source);

    try {
        resolver.select(TransferMode::Lan);
        FAIL() << "expected NoInterface";
    } catch (const TransferError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::NoInterface);
    }
}

TEST(EndpointResolverTest, BindBuildsUrlAndWarnsOnFallback) {
    FakeInterfaces source({iface("test0", "127.0.0.1")});
    EndpointResolver resolver = make_resolver(source);
    std::uint16_t port = test::free_port();

    BoundEndpoint bound = resolver.bind(EndpointConfig{TransferMode::Hotspot, port});
    EXPECT_EQ(bound.endpoint.address, "127.0.0.1");
    EXPECT_EQ(bound.endpoint.port, port);
    EXPECT_EQ(bound.endpoint.url, "http://127.0.0.1:" + std::to_string(port));
    EXPECT_TRUE(bound.socket.valid());
    EXPECT_EQ(bound.socket.port(), port);
    ASSERT_EQ(bound.warnings.size(), 1u);
}

TEST(EndpointResolverTest, PortInUseIsPortUnavailable) {
    FakeInterfaces source({iface("test0", "127.0.0.1", true)});
    EndpointResolver resolver = make_resolver(source);
    ListenSocket holder = ListenSocket::open("127.0.0.1", 0);

    try {
        resolver.bind(EndpointConfig{TransferMode::Lan, holder.port()});
        FAIL() << "expected PortUnavailable";
    } catch (const TransferError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::PortUnavailable);
    }
}

TEST(EndpointResolverTest, SubnetMatcherValidatesInput) {
    EXPECT_THROW(subnet_matcher("192.168.43.0/33"), TransferError);
    EXPECT_THROW(subnet_matcher("not-an-ip/24"), TransferError);
    EXPECT_THROW(subnet_matcher("10.0.0.0/x"), TransferError);

    InterfaceMatcher ios = subnet_matcher("172.20.10.0/28");
    EXPECT_TRUE(ios.matches(iface("x", "172.20.10.14")));
    EXPECT_FALSE(ios.matches(iface("x", "172.20.10.17")));
}

TEST(EndpointResolverTest, ParsesModeNames) {
    EXPECT_EQ(parse_mode("Hotspot"), TransferMode::Hotspot);
    EXPECT_EQ(parse_mode("wifi-direct"), TransferMode::Hotspot);
    EXPECT_EQ(parse_mode("LAN"), TransferMode::Lan);
    EXPECT_EQ(parse_mode("internet"), TransferMode::Lan);
    EXPECT_THROW(parse_mode("bluetooth"), TransferError);
}
