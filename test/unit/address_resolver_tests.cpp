// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license
// Unit tests for local address selection

#include <catch2/catch_test_macros.hpp>
#include "discovery/address_resolver.hpp"
#include "discovery/service_advertiser.hpp"

using namespace heartsock::discovery;
namespace ip = boost::asio::ip;

namespace {

class FixedInterfaces : public InterfaceEnumerator {
public:
    std::vector<InterfaceAddress> entries;

    FixedInterfaces& add(const std::string& name, const std::string& address,
                         bool up = true, bool loopback = false) {
        entries.push_back(InterfaceAddress{name, ip::make_address(address), up, loopback});
        return *this;
    }

    std::vector<InterfaceAddress> enumerate() override { return entries; }
};

AddressResolver MakeResolver(std::shared_ptr<FixedInterfaces> interfaces) {
    return AddressResolver(std::move(interfaces));
}

} // namespace

TEST_CASE("AddressResolver - filters unusable addresses", "[discovery][resolver]") {
    auto interfaces = std::make_shared<FixedInterfaces>();
    interfaces->add("lo", "127.0.0.1", true, true)
        .add("lo", "::1", true, true)
        .add("eth0", "10.0.0.5")
        .add("eth1", "192.168.1.20", false)   // down
        .add("dummy", "0.0.0.0")
        .add("mc", "224.0.0.251");

    auto addresses = MakeResolver(interfaces).resolve();
    REQUIRE(addresses.size() == 1);
    REQUIRE(addresses[0] == ip::make_address("10.0.0.5"));
}

TEST_CASE("AddressResolver - loopback address on a non-loopback interface", "[discovery][resolver]") {
    auto interfaces = std::make_shared<FixedInterfaces>();
    interfaces->add("weird0", "127.0.0.2").add("eth0", "10.0.0.5");

    auto addresses = MakeResolver(interfaces).resolve();
    REQUIRE(addresses.size() == 1);
    REQUIRE(addresses[0] == ip::make_address("10.0.0.5"));
}

TEST_CASE("AddressResolver - ordering", "[discovery][resolver]") {
    auto interfaces = std::make_shared<FixedInterfaces>();
    interfaces->add("eth0", "2001:db8::5")
        .add("eth0", "192.168.1.20")
        .add("wlan0", "10.0.0.5")
        .add("wlan0", "10.0.0.5");   // duplicate

    auto addresses = MakeResolver(interfaces).resolve();
    REQUIRE(addresses.size() == 3);
    REQUIRE(addresses[0] == ip::make_address("10.0.0.5"));
    REQUIRE(addresses[1] == ip::make_address("192.168.1.20"));
    REQUIRE(addresses[2] == ip::make_address("2001:db8::5"));
}

TEST_CASE("AddressResolver - link-local only as a last resort", "[discovery][resolver]") {
    auto interfaces = std::make_shared<FixedInterfaces>();
    interfaces->add("eth0", "169.254.10.1").add("eth0", "fe80::1");

    SECTION("Only link-local available") {
        auto addresses = MakeResolver(interfaces).resolve();
        REQUIRE(addresses.size() == 2);
        REQUIRE(addresses[0] == ip::make_address("169.254.10.1"));
        REQUIRE(addresses[1] == ip::make_address("fe80::1"));
    }

    SECTION("Routable address wins") {
        interfaces->add("eth1", "192.168.1.20");
        auto addresses = MakeResolver(interfaces).resolve();
        REQUIRE(addresses.size() == 1);
        REQUIRE(addresses[0] == ip::make_address("192.168.1.20"));
    }
}

TEST_CASE("AddressResolver - IPv4-mapped addresses fold to IPv4", "[discovery][resolver]") {
    auto interfaces = std::make_shared<FixedInterfaces>();
    interfaces->add("eth0", "::ffff:10.0.0.7");

    auto addresses = MakeResolver(interfaces).resolve();
    REQUIRE(addresses.size() == 1);
    REQUIRE(addresses[0].is_v4());
    REQUIRE(addresses[0].to_string() == "10.0.0.7");
}

TEST_CASE("AddressResolver - nothing usable", "[discovery][resolver]") {
    auto interfaces = std::make_shared<FixedInterfaces>();

    SECTION("No interfaces") {
        REQUIRE_THROWS_AS(MakeResolver(interfaces).resolve(), NoAddressError);
    }

    SECTION("Loopback only") {
        interfaces->add("lo", "127.0.0.1", true, true);
        REQUIRE_THROWS_AS(MakeResolver(interfaces).resolve(), NoAddressError);
    }
}

TEST_CASE("AddressResolver - link-local IPv6 keeps its scope", "[discovery][resolver]") {
    auto interfaces = std::make_shared<FixedInterfaces>();
    interfaces->entries.push_back(InterfaceAddress{
        "eth0", ip::address_v6(ip::make_address_v6("fe80::1").to_bytes(), 3), true, false});

    auto addresses = MakeResolver(interfaces).resolve();
    REQUIRE(addresses.size() == 1);
    REQUIRE(addresses[0].to_v6().scope_id() == 3);
    // The host name never carries the scope
    REQUIRE(HostNameFor(addresses[0]) == "heartsock-fe80--1.local.");
}

TEST_CASE("AddressResolver - system enumerator reports IPv6 link-local scopes", "[discovery][resolver]") {
    SystemInterfaceEnumerator system;
    for (const auto& entry : system.enumerate()) {
        if (entry.address.is_v6() && entry.address.to_v6().is_link_local()) {
            INFO(entry.interface_name);
            REQUIRE(entry.address.to_v6().scope_id() != 0);
        }
    }
}

TEST_CASE("AddressResolver - interfaces_for", "[discovery][resolver]") {
    auto interfaces = std::make_shared<FixedInterfaces>();
    interfaces->add("eth0", "10.0.0.5")
        .add("eth0", "2001:db8::5")
        .add("wlan0", "192.168.1.20")
        .add("usb0", "172.16.0.1", false)   // down
        .add("eth1", "::ffff:10.0.0.9");
    auto resolver = MakeResolver(interfaces);

    SECTION("Address order, no duplicates") {
        auto names = resolver.interfaces_for({ip::make_address("192.168.1.20"),
                                              ip::make_address("10.0.0.5"),
                                              ip::make_address("2001:db8::5")});
        REQUIRE(names == std::vector<std::string>{"wlan0", "eth0"});
    }

    SECTION("Unowned and down addresses are skipped") {
        REQUIRE(resolver.interfaces_for({ip::make_address("172.16.0.9")}).empty());
        REQUIRE(resolver.interfaces_for({ip::make_address("172.16.0.1")}).empty());
    }

    SECTION("IPv4-mapped entries match their IPv4 address") {
        REQUIRE(resolver.interfaces_for({ip::make_address("10.0.0.9")}) ==
                std::vector<std::string>{"eth1"});
    }

    SECTION("Scope is ignored when matching") {
        interfaces->add("eth2", "fe80::7");
        const ip::address scoped =
            ip::address_v6(ip::make_address_v6("fe80::7").to_bytes(), 5);
        REQUIRE(resolver.interfaces_for({scoped}) == std::vector<std::string>{"eth2"});
    }
}

TEST_CASE("AddressResolver - system enumerator does not throw", "[discovery][resolver]") {
    SystemInterfaceEnumerator system;
    REQUIRE_NOTHROW(system.enumerate());
}

TEST_CASE("FormatAddressSet", "[discovery][resolver]") {
    REQUIRE(FormatAddressSet({}) == "");
    REQUIRE(FormatAddressSet({ip::make_address("10.0.0.5"), ip::make_address("fe80::1")}) ==
            "10.0.0.5, fe80::1");
}

TEST_CASE("HostNameFor", "[discovery][resolver]") {
    REQUIRE(HostNameFor(ip::make_address("10.0.0.5")) == "heartsock-10-0-0-5.local.");
    REQUIRE(HostNameFor(ip::make_address("fe80::1")) == "heartsock-fe80--1.local.");
}

TEST_CASE("MakeServiceRecord", "[discovery][resolver]") {
    auto record = MakeServiceRecord({ip::make_address("10.0.0.5")}, 9001, 3);
    REQUIRE(record.service_type == SERVICE_TYPE);
    REQUIRE(record.instance_name == INSTANCE_NAME);
    REQUIRE(record.host_name == "heartsock-10-0-0-5.local.");
    REQUIRE(record.port == 9001);
    REQUIRE(record.generation == 3);
    REQUIRE(record.txt.size() == 1);
    REQUIRE(record.txt[0].rfind("version=", 0) == 0);
}
