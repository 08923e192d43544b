#include "replicator/decision_engine.hpp"

#include "delta/util.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

using replicator::AccountEvent;
using replicator::EventKind;
using replicator::Side;

namespace {

struct EngineHarness {
    explicit EngineHarness(replicator::DecisionSettings settings = {},
                           replicator::CapLimits limits = {},
                           std::size_t queue_capacity = 16)
        : log(replicator::EventLogConfig{"", "topup_events_", true}),
          ledger(limits),
          queue(queue_capacity),
          engine(std::move(settings), dedup, tracker, ledger, queue, log) {
        log.set_observer([this](const nlohmann::json& record) { records.push_back(record); });
    }

    std::vector<std::string> skip_reasons() const {
        std::vector<std::string> reasons;
        for (const auto& record : records) {
            if (record["kind"] == "skip") {
                reasons.push_back(record["reason"].get<std::string>());
            }
        }
        return reasons;
    }

    replicator::EventLog log;
    replicator::DedupStore dedup;
    replicator::FillCumulativeTracker tracker;
    replicator::CapLedger ledger;
    replicator::OrderQueue queue;
    replicator::DecisionEngine engine;
    std::vector<nlohmann::json> records;
};

AccountEvent trade(const std::string& trade_id, long long qty, const std::string& symbol = "BTCUSD") {
    AccountEvent event;
    event.kind = EventKind::TradeFill;
    event.trade_id = trade_id;
    event.symbol = symbol;
    event.product_id = 27;
    event.side = Side::Buy;
    event.quantity = qty;
    event.price = "100";
    return event;
}

AccountEvent order_update(const std::string& order_id, long long cumulative, const std::string& state = "open") {
    AccountEvent event;
    event.kind = EventKind::OrderUpdate;
    event.order_id = order_id;
    event.symbol = "BTCUSD";
    event.side = Side::Sell;
    event.quantity = cumulative;
    event.state = state;
    return event;
}

} // namespace

TEST_CASE("a trade fill produces a job of (m - 1) x qty") {
    EngineHarness h;
    const auto decision = h.engine.decide(trade("t1", 100));
    REQUIRE(decision.admitted());
    CHECK(decision.job->audit_id == "t1");
    CHECK(decision.job->size == 100);
    CHECK(decision.job->side == Side::Buy);
    CHECK(decision.job->symbol == std::string("BTCUSD"));
    CHECK(decision.job->product_id == 27);
    CHECK(decision.job->price == std::string("100"));
}

TEST_CASE("a trade fill without ids gets a generated audit id") {
    EngineHarness h;
    auto event = trade("x", 10);
    event.trade_id.reset();
    const auto decision = h.engine.decide(event);
    REQUIRE(decision.admitted());
    CHECK(delta::starts_with(decision.job->audit_id, "ut_"));
    CHECK(decision.job->audit_id.size() == 11);
}

TEST_CASE("duplicate fill and trade ids are skipped") {
    EngineHarness h;

    auto first = trade("t1", 10);
    first.fill_id = "f1";
    CHECK(h.engine.handle(first));
    CHECK_FALSE(h.engine.handle(first));

    auto same_trade = trade("t1", 10);
    CHECK_FALSE(h.engine.handle(same_trade));

    CHECK(h.skip_reasons() == std::vector<std::string>{"dup_fill_id", "dup_trade_id"});
    CHECK(h.queue.size() == 1);
}

TEST_CASE("order updates share the fill id set") {
    EngineHarness h;
    auto fill = trade("t1", 10);
    fill.fill_id = "f9";
    h.engine.handle(fill);

    auto update = order_update("o1", 10);
    update.fill_id = "f9";
    const auto decision = h.engine.decide(update);
    CHECK(decision.reason == "dup_fill_id_order");
}

TEST_CASE("events tagged with the self prefix are never replicated") {
    EngineHarness h;

    auto own_fill = trade("t1", 10);
    own_fill.client_order_id = "BOTMULT_0123456789";
    CHECK(h.engine.decide(own_fill).reason == "own_fill");

    auto own_text = trade("t2", 10);
    own_text.text = "BOTMULT_abcdef0123";
    CHECK(h.engine.decide(own_text).reason == "own_fill");

    auto own_update = order_update("o1", 10);
    own_update.client_order_id = "BOTMULT_ffffffffff";
    CHECK(h.engine.decide(own_update).reason == "own_order_update");

    CHECK_FALSE(h.tracker.tracks("o1"));
}

TEST_CASE("order updates need an order id") {
    EngineHarness h;
    auto update = order_update("o1", 10);
    update.order_id.reset();
    CHECK(h.engine.decide(update).reason == "missing_order_id");
}

TEST_CASE("allow-list filters symbols unless it contains ALL") {
    replicator::DecisionSettings settings;
    settings.allow_symbols = {"btcusd", "ETHUSD"};
    EngineHarness h{settings};

    CHECK(h.engine.decide(trade("t1", 10, "BTCUSD")).admitted());
    CHECK(h.engine.decide(trade("t2", 10, "SOLUSD")).reason == "symbol_not_allowed");

    auto unknown = trade("t3", 10);
    unknown.symbol.reset();
    CHECK(h.engine.decide(unknown).reason == "symbol_not_allowed");

    EngineHarness all;
    auto anything = trade("t4", 10);
    anything.symbol.reset();
    CHECK(all.engine.decide(anything).admitted());
}

TEST_CASE("trade fills need a positive quantity") {
    EngineHarness h;
    auto missing = trade("t1", 10);
    missing.quantity.reset();
    CHECK(h.engine.decide(missing).reason == "missing_or_invalid_qty");
    CHECK(h.engine.decide(trade("t2", 0)).reason == "missing_or_invalid_qty");
}

TEST_CASE("multipliers at or below one never produce orders") {
    replicator::DecisionSettings settings;
    settings.multiplier = 1.0;
    EngineHarness h{settings};
    CHECK(h.engine.decide(trade("t1", 100)).reason == "zero_topup");
}

TEST_CASE("sizes are clamped to the per-trade maximum") {
    EngineHarness h{{}, replicator::CapLimits{25, 1000}};
    const auto decision = h.engine.decide(trade("t1", 100));
    REQUIRE(decision.admitted());
    CHECK(decision.job->size == 25);
}

TEST_CASE("jobs that would breach the symbol ceiling are skipped") {
    EngineHarness h{{}, replicator::CapLimits{1000, 100}};
    h.ledger.record(std::string("BTCUSD"), 60);

    CHECK(h.engine.decide(trade("t1", 40)).admitted());
    const auto over = h.engine.decide(trade("t2", 41));
    CHECK(over.reason == "symbol_cap_exceeded");
    CHECK(over.context["add"] == 41);
}

TEST_CASE("order updates replicate only the new fill delta") {
    EngineHarness h;

    CHECK(h.engine.decide(order_update("o1", 0)).reason == "no_new_fill_delta");

    const auto first = h.engine.decide(order_update("o1", 30));
    REQUIRE(first.admitted());
    CHECK(first.job->size == 30);
    CHECK(first.job->audit_id == "ord_o1");

    CHECK(h.engine.decide(order_update("o1", 30)).reason == "no_new_fill_delta");

    const auto second = h.engine.decide(order_update("o1", 50));
    REQUIRE(second.admitted());
    CHECK(second.job->size == 20);
    CHECK(h.tracker.previous("o1") == 50);

    const auto closed = h.engine.decide(order_update("o1", 50, "closed"));
    CHECK(closed.reason == "no_new_fill_delta");
    CHECK_FALSE(h.tracker.tracks("o1"));
}

TEST_CASE("a terminal update still replicates its final delta") {
    EngineHarness h;
    h.engine.decide(order_update("o2", 10));

    auto last = order_update("o2", 25);
    last.unfilled_size = 0;
    const auto decision = h.engine.decide(last);
    REQUIRE(decision.admitted());
    CHECK(decision.job->size == 15);
    CHECK_FALSE(h.tracker.tracks("o2"));
}

TEST_CASE("order updates without a cumulative size are skipped") {
    EngineHarness h;
    auto update = order_update("o1", 0);
    update.quantity.reset();
    CHECK(h.engine.decide(update).reason == "missing_or_invalid_cum");
}

TEST_CASE("handle logs and enqueues admitted jobs") {
    EngineHarness h;
    REQUIRE(h.engine.handle(trade("t1", 5)));

    REQUIRE(h.records.size() == 1);
    CHECK(h.records[0]["kind"] == "action");
    CHECK(h.records[0]["action"] == "enqueue_topup");
    CHECK(h.records[0]["context"]["size"] == 5);

    const auto job = h.queue.pop();
    REQUIRE(job);
    CHECK(job->audit_id == "t1");
}

TEST_CASE("handle drops jobs when the queue is full") {
    EngineHarness h{{}, {}, 1};
    CHECK(h.engine.handle(trade("t1", 5)));
    CHECK_FALSE(h.engine.handle(trade("t2", 5)));
    CHECK(h.skip_reasons() == std::vector<std::string>{"queue_full"});
    CHECK(h.queue.size() == 1);
}
