// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license
// Unit tests for the advertisement lifecycle (publish, republish, backoff)

#include <catch2/catch_test_macros.hpp>
#include "discovery/advertisement_manager.hpp"
#include <mutex>

using namespace heartsock::discovery;
namespace ip = boost::asio::ip;
using std::chrono::milliseconds;

namespace {

// Records every call; publish fails while fail_publish is set
struct AdvertiserLog {
    std::mutex mutex;
    std::vector<std::string> calls;
    std::vector<ServiceRecordInput> published;
    bool fail_publish{false};
    bool fail_withdraw{false};
    uint64_t next_handle{1};

    std::vector<std::string> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return calls;
    }
};

class FakeAdvertiser : public ServiceAdvertiser {
public:
    explicit FakeAdvertiser(std::shared_ptr<AdvertiserLog> log) : log_(std::move(log)) {}

    AdvertisedRecord publish(const ServiceRecordInput& input) override {
        std::lock_guard<std::mutex> lock(log_->mutex);
        log_->calls.push_back("publish " + std::to_string(input.generation));
        if (log_->fail_publish) {
            throw AdvertiseError("daemon unavailable");
        }
        log_->published.push_back(input);
        AdvertisedRecord record;
        record.handle = log_->next_handle++;
        record.service_type = input.service_type;
        record.instance_name = input.instance_name;
        record.host_name = input.host_name;
        record.addresses = input.addresses;
        record.interfaces = input.interfaces;
        record.port = input.port;
        record.txt = input.txt;
        record.generation = input.generation;
        return record;
    }

    void withdraw(const AdvertisedRecord& record) override {
        std::lock_guard<std::mutex> lock(log_->mutex);
        log_->calls.push_back("withdraw " + std::to_string(record.generation));
        if (log_->fail_withdraw) {
            throw AdvertiseError("withdraw failed");
        }
    }

    std::string backend_name() const override { return "fake"; }

private:
    std::shared_ptr<AdvertiserLog> log_;
};

class MutableInterfaces : public InterfaceEnumerator {
public:
    std::vector<InterfaceAddress> enumerate() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    void set(const std::vector<std::string>& addresses, const std::string& name = "eth0") {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        for (const auto& address : addresses) {
            entries_.push_back(InterfaceAddress{name, ip::make_address(address), true, false});
        }
    }

private:
    std::mutex mutex_;
    std::vector<InterfaceAddress> entries_;
};

struct Fixture {
    std::shared_ptr<AdvertiserLog> log = std::make_shared<AdvertiserLog>();
    std::shared_ptr<MutableInterfaces> interfaces = std::make_shared<MutableInterfaces>();
    AdvertisementManager::Config config;

    Fixture() {
        // Keep the monitor thread out of the way; tests drive poll_once()
        config.address_poll_interval = std::chrono::hours(1);
        config.retry_min = std::chrono::hours(1);
        config.retry_max = std::chrono::hours(8);
        interfaces->set({"10.0.0.5"});
    }

    std::unique_ptr<AdvertisementManager> make() {
        return std::make_unique<AdvertisementManager>(
            config, std::make_unique<FakeAdvertiser>(log),
            std::make_shared<AddressResolver>(interfaces));
    }
};

} // namespace

TEST_CASE("AdvertisementManager - start publishes once", "[discovery][advertisement]") {
    Fixture f;
    auto manager = f.make();

    REQUIRE(manager->start(9001));
    REQUIRE(manager->is_running());
    REQUIRE(manager->is_published());
    REQUIRE(manager->generation() == 1);
    REQUIRE(manager->backend_name() == "fake");

    auto record = manager->current_record();
    REQUIRE(record.has_value());
    REQUIRE(record->port == 9001);
    REQUIRE(record->addresses == NetworkAddressSet{ip::make_address("10.0.0.5")});
    REQUIRE(record->full_name() == std::string(INSTANCE_NAME) + "." + SERVICE_TYPE);

    SECTION("Second start is refused") {
        REQUIRE_FALSE(manager->start(9001));
        REQUIRE(f.log->snapshot().size() == 1);
    }

    SECTION("Stop withdraws") {
        manager->stop();
        REQUIRE_FALSE(manager->is_running());
        REQUIRE_FALSE(manager->is_published());
        REQUIRE(f.log->snapshot() == std::vector<std::string>{"publish 1", "withdraw 1"});
    }
}

TEST_CASE("AdvertisementManager - port 0 is rejected", "[discovery][advertisement]") {
    Fixture f;
    auto manager = f.make();
    REQUIRE_FALSE(manager->start(0));
    REQUIRE_FALSE(manager->is_running());
    REQUIRE(f.log->snapshot().empty());
}

TEST_CASE("AdvertisementManager - only the first address unless all_addresses", "[discovery][advertisement]") {
    Fixture f;
    f.interfaces->set({"192.168.1.20", "10.0.0.5", "2001:db8::5"});

    SECTION("Primary address") {
        auto manager = f.make();
        REQUIRE(manager->start(9001));
        REQUIRE(manager->current_record()->addresses ==
                NetworkAddressSet{ip::make_address("10.0.0.5")});
    }

    SECTION("All addresses") {
        f.config.all_addresses = true;
        auto manager = f.make();
        REQUIRE(manager->start(9001));
        REQUIRE(manager->current_record()->addresses.size() == 3);
    }

    SECTION("Fixed advertise address skips resolving") {
        f.config.advertise_ip = ip::make_address("172.16.0.9");
        f.interfaces->set({});
        auto manager = f.make();
        REQUIRE(manager->start(9001));
        REQUIRE(manager->current_record()->addresses ==
                NetworkAddressSet{ip::make_address("172.16.0.9")});
        REQUIRE(manager->current_record()->host_name == "heartsock-172-16-0-9.local.");
    }
}

TEST_CASE("AdvertisementManager - address change republishes", "[discovery][advertisement]") {
    Fixture f;
    auto manager = f.make();
    REQUIRE(manager->start(9001));

    SECTION("Unchanged address is a no-op") {
        REQUIRE(manager->poll_once());
        REQUIRE(manager->generation() == 1);
        REQUIRE(f.log->snapshot().size() == 1);
    }

    SECTION("Withdraw precedes publish, generation + 1") {
        f.interfaces->set({"10.0.0.6"});
        REQUIRE(manager->poll_once());
        REQUIRE(manager->generation() == 2);
        REQUIRE(f.log->snapshot() ==
                std::vector<std::string>{"publish 1", "withdraw 1", "publish 2"});
        REQUIRE(manager->current_record()->addresses ==
                NetworkAddressSet{ip::make_address("10.0.0.6")});
        REQUIRE(manager->current_record()->host_name == "heartsock-10-0-0-6.local.");
    }

    SECTION("Address disappears") {
        f.interfaces->set({});
        REQUIRE_FALSE(manager->poll_once());
        REQUIRE_FALSE(manager->is_published());
        REQUIRE(manager->consecutive_failures() == 1);
        REQUIRE_FALSE(manager->last_error().empty());

        f.interfaces->set({"10.0.0.7"});
        REQUIRE(manager->poll_once());
        REQUIRE(manager->generation() == 2);
        REQUIRE(manager->consecutive_failures() == 0);
        REQUIRE(manager->last_error().empty());
    }

    manager->stop(true);
}

TEST_CASE("AdvertisementManager - records carry the owning interface", "[discovery][advertisement]") {
    Fixture f;
    auto manager = f.make();
    REQUIRE(manager->start(9001));
    REQUIRE(f.log->published.back().interfaces == std::vector<std::string>{"eth0"});
    REQUIRE(manager->current_record()->interfaces == std::vector<std::string>{"eth0"});

    SECTION("Same address moving to another interface republishes there") {
        f.interfaces->set({"10.0.0.5"}, "wlan0");
        REQUIRE(manager->poll_once());
        REQUIRE(manager->generation() == 2);
        REQUIRE(f.log->snapshot() ==
                std::vector<std::string>{"publish 1", "withdraw 1", "publish 2"});
        REQUIRE(f.log->published.back().interfaces == std::vector<std::string>{"wlan0"});
    }

    SECTION("New address on a new interface") {
        f.interfaces->set({"192.168.7.2"}, "usb0");
        REQUIRE(manager->poll_once());
        REQUIRE(f.log->published.back().interfaces == std::vector<std::string>{"usb0"});
        REQUIRE(manager->status_json()["interfaces"][0] == "usb0");
    }

    manager->stop(true);
}

TEST_CASE("AdvertisementManager - fixed address no interface owns", "[discovery][advertisement]") {
    Fixture f;
    f.config.advertise_ip = ip::make_address("172.16.0.9");
    auto manager = f.make();
    REQUIRE(manager->start(9001));
    REQUIRE(f.log->published.back().interfaces.empty());
    REQUIRE(manager->poll_once());
    REQUIRE(manager->generation() == 1);
    manager->stop(true);
}

TEST_CASE("AdvertisementManager - republish_on_change", "[discovery][advertisement]") {
    Fixture f;
    auto manager = f.make();

    SECTION("Before start nothing happens") {
        REQUIRE_FALSE(manager->republish_on_change({ip::make_address("10.0.0.9")}));
        REQUIRE(f.log->snapshot().empty());
    }

    SECTION("Same set") {
        REQUIRE(manager->start(9001));
        REQUIRE_FALSE(manager->republish_on_change({ip::make_address("10.0.0.5")}));
        REQUIRE(manager->generation() == 1);
    }

    SECTION("Extra addresses are narrowed to the first") {
        REQUIRE(manager->start(9001));
        REQUIRE_FALSE(manager->republish_on_change(
            {ip::make_address("10.0.0.5"), ip::make_address("10.0.0.9")}));
    }

    SECTION("New set") {
        REQUIRE(manager->start(9001));
        REQUIRE(manager->republish_on_change({ip::make_address("10.0.0.9")}));
        REQUIRE(manager->generation() == 2);
        REQUIRE(f.log->snapshot() ==
                std::vector<std::string>{"publish 1", "withdraw 1", "publish 2"});
    }

    SECTION("Empty set") {
        REQUIRE(manager->start(9001));
        REQUIRE_FALSE(manager->republish_on_change({}));
        REQUIRE(manager->is_published());
    }
}

TEST_CASE("AdvertisementManager - publish failures back off", "[discovery][advertisement]") {
    Fixture f;
    f.config.retry_min = std::chrono::hours(1);
    f.config.retry_max = std::chrono::hours(5);
    f.log->fail_publish = true;
    auto manager = f.make();

    // The server keeps running without an advertisement
    REQUIRE_FALSE(manager->start(9001));
    REQUIRE(manager->is_running());
    REQUIRE_FALSE(manager->is_published());
    REQUIRE(manager->consecutive_failures() == 1);
    REQUIRE(manager->last_error() == "daemon unavailable");
    REQUIRE(manager->current_backoff() == std::chrono::hours(1));

    REQUIRE_FALSE(manager->poll_once());
    REQUIRE(manager->current_backoff() == std::chrono::hours(2));
    REQUIRE_FALSE(manager->poll_once());
    REQUIRE(manager->current_backoff() == std::chrono::hours(4));
    REQUIRE_FALSE(manager->poll_once());
    REQUIRE(manager->current_backoff() == std::chrono::hours(5));
    REQUIRE_FALSE(manager->poll_once());
    REQUIRE(manager->current_backoff() == std::chrono::hours(5));
    REQUIRE(manager->consecutive_failures() == 5);

    // Failed attempts do not consume generations
    REQUIRE(manager->generation() == 0);

    f.log->fail_publish = false;
    REQUIRE(manager->poll_once());
    REQUIRE(manager->generation() == 1);
    REQUIRE(manager->consecutive_failures() == 0);
    REQUIRE(manager->current_backoff() == std::chrono::hours(1));

    manager->stop(true);
}

TEST_CASE("AdvertisementManager - failed withdraw is not fatal", "[discovery][advertisement]") {
    Fixture f;
    auto manager = f.make();
    REQUIRE(manager->start(9001));

    f.log->fail_withdraw = true;
    f.interfaces->set({"10.0.0.6"});
    REQUIRE(manager->poll_once());
    REQUIRE(manager->generation() == 2);

    REQUIRE_NOTHROW(manager->stop());
    REQUIRE_FALSE(manager->is_published());
}

TEST_CASE("AdvertisementManager - monitor thread retries", "[discovery][advertisement]") {
    Fixture f;
    f.config.retry_min = milliseconds(5);
    f.config.retry_max = milliseconds(20);
    f.log->fail_publish = true;
    auto manager = f.make();

    REQUIRE_FALSE(manager->start(9001));
    {
        std::lock_guard<std::mutex> lock(f.log->mutex);
        f.log->fail_publish = false;
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!manager->is_published() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(milliseconds(5));
    }
    REQUIRE(manager->is_published());
    REQUIRE(manager->generation() == 1);
    manager->stop();
}

TEST_CASE("AdvertisementManager - status_json", "[discovery][advertisement]") {
    Fixture f;
    auto manager = f.make();

    auto idle = manager->status_json();
    REQUIRE(idle["backend"] == "fake");
    REQUIRE(idle["published"] == false);
    REQUIRE(idle["generation"] == 0);
    REQUIRE(idle["last_error"].is_null());
    REQUIRE_FALSE(idle.contains("port"));

    REQUIRE(manager->start(9001));
    auto published = manager->status_json();
    REQUIRE(published["published"] == true);
    REQUIRE(published["generation"] == 1);
    REQUIRE(published["port"] == 9001);
    REQUIRE(published["host"] == "heartsock-10-0-0-5.local.");
    REQUIRE(published["addresses"].size() == 1);
    REQUIRE(published["addresses"][0] == "10.0.0.5");
    REQUIRE(published["failures"] == 0);
}
