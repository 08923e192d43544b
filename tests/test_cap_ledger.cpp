#include "replicator/cap_ledger.hpp"

#include <catch2/catch.hpp>

#include <thread>
#include <vector>

using replicator::CapLedger;
using replicator::CapLimits;
using replicator::compute_topup_size;

TEST_CASE("compute_topup_size scales by multiplier minus one") {
    CHECK(compute_topup_size(2.0, 100, 1000000) == 100);
    CHECK(compute_topup_size(1.5, 10, 1000000) == 5);
    CHECK(compute_topup_size(3.0, 7, 1000000) == 14);
}

TEST_CASE("compute_topup_size rounds half to even") {
    CHECK(compute_topup_size(1.5, 1, 1000000) == 0);
    CHECK(compute_topup_size(1.5, 3, 1000000) == 2);
    CHECK(compute_topup_size(1.5, 5, 1000000) == 2);
    CHECK(compute_topup_size(1.25, 10, 1000000) == 2);
}

TEST_CASE("compute_topup_size is zero for multipliers at or below one") {
    CHECK(compute_topup_size(1.0, 100, 1000000) == 0);
    CHECK(compute_topup_size(0.5, 100, 1000000) == 0);
    CHECK(compute_topup_size(0.0, 100, 1000000) == 0);
}

TEST_CASE("compute_topup_size clamps to the per-trade maximum") {
    CHECK(compute_topup_size(2.0, 500, 100) == 100);
    CHECK(compute_topup_size(10.0, 1000000000, 1000000) == 1000000);
}

TEST_CASE("CapLedger admits up to and including the ceiling") {
    CapLedger ledger{CapLimits{1000, 100}};
    CHECK(ledger.admits(std::string("BTCUSD"), 100));
    CHECK_FALSE(ledger.admits(std::string("BTCUSD"), 101));

    ledger.record(std::string("BTCUSD"), 60);
    CHECK(ledger.used("BTCUSD") == 60);
    CHECK(ledger.admits(std::string("BTCUSD"), 40));
    CHECK_FALSE(ledger.admits(std::string("BTCUSD"), 41));
    CHECK(ledger.admits(std::string("ETHUSD"), 100));
}

TEST_CASE("CapLedger never decreases") {
    CapLedger ledger{CapLimits{1000, 1000}};
    ledger.record(std::string("BTCUSD"), 10);
    ledger.record(std::string("BTCUSD"), 0);
    ledger.record(std::string("BTCUSD"), -5);
    CHECK(ledger.used("BTCUSD") == 10);
    ledger.record(std::string("BTCUSD"), 5);
    CHECK(ledger.used("BTCUSD") == 15);
}

TEST_CASE("CapLedger leaves unknown symbols unconstrained") {
    CapLedger ledger{CapLimits{1000, 10}};
    CHECK(ledger.admits(std::nullopt, 1000000));
    ledger.record(std::nullopt, 50);
    CHECK(ledger.admits(std::nullopt, 1000000));
}

TEST_CASE("CapLedger clamps per-trade sizes") {
    CapLedger ledger{CapLimits{50, 1000}};
    CHECK(ledger.clamp_per_trade(80) == 50);
    CHECK(ledger.clamp_per_trade(20) == 20);
    CHECK(ledger.clamp_per_trade(-3) == 0);
}

TEST_CASE("CapLedger records concurrently without losing updates") {
    CapLedger ledger{CapLimits{1000, 1000000}};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&ledger] {
            for (int i = 0; i < 1000; ++i) {
                ledger.record(std::string("BTCUSD"), 1);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    CHECK(ledger.used("BTCUSD") == 4000);
}
