// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license
// DNS-SD backend: registration inputs (no daemon needed)

#include <catch2/catch_test_macros.hpp>
#include "discovery/dnssd_advertiser.hpp"

using namespace heartsock::discovery;
namespace ip = boost::asio::ip;

TEST_CASE("dnssd - registration type", "[discovery][dnssd]") {
    REQUIRE(dnssd::RegistrationType(SERVICE_TYPE) == "_heartsock._tcp");
    REQUIRE(dnssd::RegistrationType("_heartsock._tcp.local") == "_heartsock._tcp");
    REQUIRE(dnssd::RegistrationType("_heartsock._tcp.") == "_heartsock._tcp");
    REQUIRE(dnssd::RegistrationType("_heartsock._tcp") == "_heartsock._tcp");
}

TEST_CASE("dnssd - TXT record", "[discovery][dnssd]") {
    SECTION("Length-prefixed key=value strings") {
        const std::string expected = std::string(1, '\x0D') + "version=0.3.0";
        REQUIRE(dnssd::BuildTxtRecord({"version=0.3.0"}) == expected);
    }

    SECTION("Entries keep their order; bare keys are booleans") {
        const std::string expected =
            std::string(1, '\x03') + "a=b" + std::string(1, '\x04') + "flag";
        REQUIRE(dnssd::BuildTxtRecord({"a=b", "flag"}) == expected);
    }

    SECTION("Empty value") {
        const std::string expected = std::string(1, '\x02') + "k=";
        REQUIRE(dnssd::BuildTxtRecord({"k="}) == expected);
    }

    SECTION("No entries") {
        REQUIRE(dnssd::BuildTxtRecord({}).empty());
    }
}

TEST_CASE("dnssd - interface indexes follow the record's interfaces", "[discovery][dnssd]") {
    SECTION("No interface known registers on all of them") {
        REQUIRE(dnssd::InterfaceIndexes({}) ==
                std::vector<uint32_t>{kDNSServiceInterfaceIndexAny});
        REQUIRE(dnssd::InterfaceIndexes({"heartsock-nonexistent0"}) ==
                std::vector<uint32_t>{kDNSServiceInterfaceIndexAny});
    }

    SECTION("Named interfaces are resolved and deduplicated") {
        auto indexes = dnssd::InterfaceIndexes({"lo", "heartsock-nonexistent0", "lo"});
        REQUIRE(indexes.size() == 1);
        REQUIRE(indexes[0] != kDNSServiceInterfaceIndexAny);
    }
}

TEST_CASE("dnssd - error names", "[discovery][dnssd]") {
    REQUIRE(std::string(dnssd::ErrorName(kDNSServiceErr_NoError)) == "no error");
    REQUIRE(std::string(dnssd::ErrorName(kDNSServiceErr_ServiceNotRunning)) ==
            "mDNS daemon not running");
    REQUIRE(std::string(dnssd::ErrorName(kDNSServiceErr_NameConflict)) == "name conflict");
    REQUIRE(std::string(dnssd::ErrorName(-1)) == "DNS-SD error");
}

TEST_CASE("DnsSdAdvertiser - rejects incomplete records", "[discovery][dnssd]") {
    DnsSdAdvertiser advertiser;
    REQUIRE(advertiser.backend_name() == "dnssd");

    auto input = MakeServiceRecord({ip::make_address("10.0.0.5")}, 9001, 1);

    SECTION("Port 0") {
        input.port = 0;
        REQUIRE_THROWS_AS(advertiser.publish(input), AdvertiseError);
    }

    SECTION("No address") {
        input.addresses.clear();
        REQUIRE_THROWS_AS(advertiser.publish(input), AdvertiseError);
    }
}

TEST_CASE("DnsSdAdvertiser - withdrawing an unknown record is a no-op", "[discovery][dnssd]") {
    DnsSdAdvertiser advertiser;
    AdvertisedRecord never_published;
    REQUIRE_NOTHROW(advertiser.withdraw(never_published));

    never_published.handle = 42;
    REQUIRE_NOTHROW(advertiser.withdraw(never_published));
}
