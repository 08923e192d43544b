#include "delta/order_client.hpp"
#include "delta/util.hpp"

#include "fakes.hpp"

#include <catch2/catch.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace {

delta::OrderSettings market_settings() {
    delta::OrderSettings settings;
    settings.client_order_prefix = "BOTMULT_";
    return settings;
}

delta::OrderSettings limit_ioc_settings() {
    auto settings = market_settings();
    settings.order_type = "limit_order";
    settings.time_in_force = "IOC";
    return settings;
}

delta::OrderRequest buy_request(long long size = 10) {
    delta::OrderRequest request;
    request.symbol = "BTCUSD";
    request.product_id = 27;
    request.side = "buy";
    request.size = size;
    request.price = "100";
    return request;
}

struct AuditRecorder {
    std::vector<delta::OrderAudit> records;

    void attach(delta::OrderClient& client) {
        client.set_audit_callback([this](const delta::OrderAudit& audit) { records.push_back(audit); });
    }

    std::vector<std::string> names() const {
        std::vector<std::string> out;
        for (const auto& record : records) {
            out.push_back(record.name);
        }
        return out;
    }
};

const char* kDepthCancelled =
    R"({"success":true,"result":{"state":"cancelled","cancellation_reason":"order_size_not_available_in_orderbook"}})";

} // namespace

TEST_CASE("place_topup sends a signed market order") {
    auto script = std::make_shared<fakes::TransportScript>();
    delta::OrderClient client{fakes::test_credentials(), market_settings(), fakes::fast_client_options(),
                              fakes::make_transport(script)};

    const auto result = client.place_topup(buy_request());
    CHECK(result.ok());
    CHECK_FALSE(result.fell_back_to_market);

    REQUIRE(script->requests.size() == 1);
    const auto& sent = script->requests.front();
    CHECK(sent.method == "POST");
    CHECK(sent.url == "https://api.test.local/v2/orders");
    CHECK(sent.header("api-key") == "key-123");
    CHECK(sent.header("Content-Type") == "application/json");
    CHECK(sent.header("User-Agent") == "delta-topup-replicator");
    CHECK(sent.header("signature") ==
          delta::ClientBase::sign("secret-456", "POST", sent.header("timestamp"), "/v2/orders", sent.body));

    const auto body = nlohmann::json::parse(sent.body);
    CHECK(body["side"] == "buy");
    CHECK(body["order_type"] == "market_order");
    CHECK(body["time_in_force"] == "ioc");
    CHECK(body["size"] == 10);
    CHECK(body["reduce_only"] == false);
    CHECK(body["product_id"] == 27);
    CHECK_FALSE(body.contains("limit_price"));

    const auto client_order_id = body["client_order_id"].get<std::string>();
    CHECK(delta::starts_with(client_order_id, "BOTMULT_"));
    CHECK(client_order_id.size() == std::string("BOTMULT_").size() + 10);
}

TEST_CASE("place_topup retries 429 and 5xx, then succeeds") {
    auto script = std::make_shared<fakes::TransportScript>();
    script->replies.push_back({429, R"({"error":"rate_limited"})"});
    script->replies.push_back({503, "unavailable"});
    script->replies.push_back({200, R"({"success":true})"});

    delta::OrderClient client{fakes::test_credentials(), market_settings(), fakes::fast_client_options(3),
                              fakes::make_transport(script)};
    std::vector<delta::RetryNotice> notices;
    client.set_retry_callback([&](const delta::RetryNotice& notice) { notices.push_back(notice); });

    const auto result = client.place_topup(buy_request());
    CHECK(result.status_code == 200);
    CHECK(script->requests.size() == 3);
    REQUIRE(notices.size() == 2);
    CHECK(notices[0].status_code == 429);
    CHECK(notices[0].attempt == 1);
    CHECK(notices[1].status_code == 503);
}

TEST_CASE("place_topup surfaces the last retryable status once attempts run out") {
    auto script = std::make_shared<fakes::TransportScript>();
    script->fallback = {502, "bad gateway"};

    delta::OrderClient client{fakes::test_credentials(), market_settings(), fakes::fast_client_options(2),
                              fakes::make_transport(script)};

    const auto result = client.place_topup(buy_request());
    CHECK(result.status_code == 502);
    CHECK_FALSE(result.ok());
    CHECK(result.body == "bad gateway");
    CHECK(script->requests.size() == 2);
}

TEST_CASE("place_topup does not retry client errors") {
    auto script = std::make_shared<fakes::TransportScript>();
    script->replies.push_back({400, R"({"error":{"code":"insufficient_margin"}})"});

    delta::OrderClient client{fakes::test_credentials(), market_settings(), fakes::fast_client_options(3),
                              fakes::make_transport(script)};

    const auto result = client.place_topup(buy_request());
    CHECK(result.status_code == 400);
    CHECK(result.body["error"]["code"] == "insufficient_margin");
    CHECK(script->requests.size() == 1);
}

TEST_CASE("place_topup retries transport failures and reports status 0 when exhausted") {
    auto script = std::make_shared<fakes::TransportScript>();
    script->fallback = {0, "connection reset", true};

    delta::OrderClient client{fakes::test_credentials(), market_settings(), fakes::fast_client_options(3),
                              fakes::make_transport(script)};

    const auto result = client.place_topup(buy_request());
    CHECK(result.status_code == 0);
    CHECK(result.body == "connection reset");
    CHECK(script->requests.size() == 3);
}

TEST_CASE("every attempt is signed with its own timestamp header") {
    auto script = std::make_shared<fakes::TransportScript>();
    script->replies.push_back({500, "oops"});
    script->replies.push_back({200, "{}"});

    delta::OrderClient client{fakes::test_credentials(), market_settings(), fakes::fast_client_options(2),
                              fakes::make_transport(script)};
    client.place_topup(buy_request());

    REQUIRE(script->requests.size() == 2);
    for (const auto& sent : script->requests) {
        CHECK(sent.header("signature") ==
              delta::ClientBase::sign("secret-456", "POST", sent.header("timestamp"), "/v2/orders", sent.body));
    }
}

TEST_CASE("dry run never touches the network") {
    auto script = std::make_shared<fakes::TransportScript>();
    auto settings = market_settings();
    settings.dry_run = true;
    delta::OrderClient client{fakes::test_credentials(), settings, fakes::fast_client_options(),
                              fakes::make_transport(script)};

    const auto result = client.place_topup(buy_request());
    CHECK(result.status_code == 200);
    CHECK(result.body == nlohmann::json{{"dry_run", true}});
    CHECK(script->requests.empty());
}

TEST_CASE("non-positive sizes are not submitted") {
    auto script = std::make_shared<fakes::TransportScript>();
    delta::OrderClient client{fakes::test_credentials(), market_settings(), fakes::fast_client_options(),
                              fakes::make_transport(script)};

    const auto result = client.place_topup(buy_request(0));
    CHECK(result.body["skipped"] == "non_positive_size");
    CHECK(script->requests.empty());
}

TEST_CASE("adjust_limit_price moves the price against the taker") {
    CHECK(delta::OrderClient::adjust_limit_price("buy", std::string("100"), 50.0) == "100.5");
    CHECK(delta::OrderClient::adjust_limit_price("sell", std::string("100"), 50.0) == "99.5");
    CHECK(delta::OrderClient::adjust_limit_price("buy", std::string("100.25"), 0.0) == "100.25");
    CHECK_FALSE(delta::OrderClient::adjust_limit_price("buy", std::nullopt, 10.0));
    CHECK_FALSE(delta::OrderClient::adjust_limit_price("buy", std::string("n/a"), 10.0));
}

TEST_CASE("limit orders carry the adjusted limit price") {
    auto script = std::make_shared<fakes::TransportScript>();
    auto settings = limit_ioc_settings();
    settings.limit_slippage_bps = 100.0;
    delta::OrderClient client{fakes::test_credentials(), settings, fakes::fast_client_options(),
                              fakes::make_transport(script)};

    auto request = buy_request();
    request.side = "sell";
    client.place_topup(request);

    REQUIRE(script->requests.size() == 1);
    const auto body = nlohmann::json::parse(script->requests.front().body);
    CHECK(body["order_type"] == "limit_order");
    CHECK(body["time_in_force"] == "ioc");
    CHECK(body["limit_price"] == "99");
}

TEST_CASE("limit orders without a usable price are rejected locally") {
    auto script = std::make_shared<fakes::TransportScript>();
    delta::OrderClient client{fakes::test_credentials(), limit_ioc_settings(), fakes::fast_client_options(),
                              fakes::make_transport(script)};

    auto request = buy_request();
    request.price.reset();
    const auto result = client.place_topup(request);
    CHECK(result.status_code == 400);
    CHECK(result.body == nlohmann::json{{"error", "missing_limit_price"}});
    CHECK(script->requests.empty());
}

TEST_CASE("an IOC limit cancelled for book depth falls back to market exactly once") {
    auto script = std::make_shared<fakes::TransportScript>();
    script->replies.push_back({200, kDepthCancelled});
    script->replies.push_back({200, R"({"success":true,"result":{"state":"closed"}})"});

    delta::OrderClient client{fakes::test_credentials(), limit_ioc_settings(), fakes::fast_client_options(),
                              fakes::make_transport(script)};

    const auto result = client.place_topup(buy_request());
    CHECK(result.ok());
    CHECK(result.fell_back_to_market);
    REQUIRE(script->requests.size() == 2);

    const auto first = nlohmann::json::parse(script->requests[0].body);
    const auto second = nlohmann::json::parse(script->requests[1].body);
    CHECK(first["order_type"] == "limit_order");
    CHECK(second["order_type"] == "market_order");
    CHECK_FALSE(second.contains("limit_price"));
    CHECK(second["size"] == first["size"]);
    CHECK(delta::starts_with(second["client_order_id"].get<std::string>(), "BOTMULT_"));
    CHECK(second["client_order_id"] != first["client_order_id"]);
}

TEST_CASE("the market fallback is not attempted twice even if it is cancelled too") {
    auto script = std::make_shared<fakes::TransportScript>();
    script->fallback = {200, kDepthCancelled};

    delta::OrderClient client{fakes::test_credentials(), limit_ioc_settings(), fakes::fast_client_options(),
                              fakes::make_transport(script)};

    const auto result = client.place_topup(buy_request());
    CHECK(result.fell_back_to_market);
    CHECK(script->requests.size() == 2);
}

TEST_CASE("no fallback when disabled or for other cancellation reasons") {
    SECTION("disabled") {
        auto script = std::make_shared<fakes::TransportScript>();
        script->fallback = {200, kDepthCancelled};
        auto settings = limit_ioc_settings();
        settings.ioc_fallback_to_market = false;
        delta::OrderClient client{fakes::test_credentials(), settings, fakes::fast_client_options(),
                                  fakes::make_transport(script)};
        CHECK_FALSE(client.place_topup(buy_request()).fell_back_to_market);
        CHECK(script->requests.size() == 1);
    }
    SECTION("other reason") {
        auto script = std::make_shared<fakes::TransportScript>();
        script->fallback = {200, R"({"result":{"state":"cancelled","cancellation_reason":"self_trade"}})"};
        delta::OrderClient client{fakes::test_credentials(), limit_ioc_settings(), fakes::fast_client_options(),
                                  fakes::make_transport(script)};
        CHECK_FALSE(client.place_topup(buy_request()).fell_back_to_market);
        CHECK(script->requests.size() == 1);
    }
    SECTION("gtc limit") {
        auto script = std::make_shared<fakes::TransportScript>();
        script->fallback = {200, kDepthCancelled};
        auto settings = limit_ioc_settings();
        settings.time_in_force = "gtc";
        delta::OrderClient client{fakes::test_credentials(), settings, fakes::fast_client_options(),
                                  fakes::make_transport(script)};
        CHECK_FALSE(client.place_topup(buy_request()).fell_back_to_market);
        CHECK(script->requests.size() == 1);
    }
}

TEST_CASE("signed requests require credentials") {
    auto script = std::make_shared<fakes::TransportScript>();
    delta::OrderClient client{delta::Credentials{}, market_settings(), fakes::fast_client_options(),
                              fakes::make_transport(script)};
    CHECK_THROWS_AS(client.place_topup(buy_request()), std::invalid_argument);
}

TEST_CASE("every submission is audited with its request, response and timings") {
    auto script = std::make_shared<fakes::TransportScript>();
    fakes::ScriptedReply reply;
    reply.timings.connect_ms = 4.0;
    reply.timings.total_ms = 12.5;
    script->replies.push_back(reply);

    delta::OrderClient client{fakes::test_credentials(), market_settings(), fakes::fast_client_options(),
                              fakes::make_transport(script)};
    AuditRecorder audits;
    audits.attach(client);

    const auto result = client.place_topup(buy_request());
    CHECK(result.timings.total_ms == 12.5);

    REQUIRE(audits.records.size() == 1);
    const auto& record = audits.records.front();
    CHECK(record.kind == delta::OrderAudit::Kind::Event);
    CHECK(record.name == "order_submit");
    CHECK(record.context["status"] == 200);
    CHECK(record.context["resp"]["result"]["state"] == "closed");
    CHECK(record.context["req"] == nlohmann::json::parse(script->requests.front().body));
    CHECK(record.context["latency"]["connect_ms"] == 4.0);
    CHECK(record.context["latency"]["total_ms"] == 12.5);
}

TEST_CASE("dry run is audited with the intended order") {
    auto script = std::make_shared<fakes::TransportScript>();
    auto settings = market_settings();
    settings.dry_run = true;
    delta::OrderClient client{fakes::test_credentials(), settings, fakes::fast_client_options(),
                              fakes::make_transport(script)};
    AuditRecorder audits;
    audits.attach(client);

    client.place_topup(buy_request(7));

    REQUIRE(audits.records.size() == 1);
    CHECK(audits.records[0].name == "dry_run_order");
    CHECK(audits.records[0].context["symbol"] == "BTCUSD");
    CHECK(audits.records[0].context["product_id"] == 27);
    CHECK(audits.records[0].context["size"] == 7);
    CHECK(audits.records[0].context["price"] == "100");
}

TEST_CASE("a market fallback audits both submissions and the fallback decision") {
    auto script = std::make_shared<fakes::TransportScript>();
    script->replies.push_back({200, kDepthCancelled});
    script->replies.push_back({200, R"({"success":true,"result":{"state":"closed"}})"});

    delta::OrderClient client{fakes::test_credentials(), limit_ioc_settings(), fakes::fast_client_options(),
                              fakes::make_transport(script)};
    AuditRecorder audits;
    audits.attach(client);

    client.place_topup(buy_request());

    CHECK(audits.names() ==
          std::vector<std::string>{"order_submit", "limit_ioc_cancel_fallback", "order_submit"});
    const auto& limit_submit = audits.records[0].context;
    const auto& fallback = audits.records[1];
    CHECK(limit_submit["req"]["order_type"] == "limit_order");
    CHECK(limit_submit["resp"]["result"]["state"] == "cancelled");
    CHECK(fallback.kind == delta::OrderAudit::Kind::Action);
    CHECK(fallback.context["limit_price"] == "100");
    CHECK(fallback.context["client_order_id"] == limit_submit["req"]["client_order_id"]);
    CHECK(audits.records[2].context["req"]["order_type"] == "market_order");
}

TEST_CASE("error bodies that are not valid UTF-8 are returned as text") {
    auto script = std::make_shared<fakes::TransportScript>();
    script->replies.push_back({400, "bad \xff\xfe request"});

    delta::OrderClient client{fakes::test_credentials(), market_settings(), fakes::fast_client_options(),
                              fakes::make_transport(script)};

    delta::SubmitResult result;
    CHECK_NOTHROW(result = client.place_topup(buy_request()));
    CHECK(result.status_code == 400);
    CHECK(result.body.is_string());
    CHECK(result.body.get<std::string>() == "bad \xff\xfe request");
}
