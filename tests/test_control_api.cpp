#include <gtest/gtest.h>
#include "control_api.hpp"
#include "metrics.hpp"
#include <boost/json.hpp>
#include <new>

using namespace auvctl;
namespace json = boost::json;

class ControlApiTest : public ::testing::Test {
protected:
    ControlApiTest()
        : limiter(policy_from(config))
        , validator()
        , gateway(config, limiter, validator)
        , conn_manager("test_salt")
        , api(config, gateway, vehicle, conn_manager)
    {}

    void SetUp() override {
        // Keep rejected-request audit lines out of the test output.
        SecurityLogger::set_sink([](const SecurityLogger::AuditEvent&) {});
    }

    void TearDown() override {
        SecurityLogger::set_sink(nullptr);
    }

    static RateLimiter::Policy policy_from(const ServerConfig& c) {
        RateLimiter::Policy p;
        p.capacity = c.rate_limit_capacity;
        p.window = std::chrono::seconds(c.rate_limit_window_sec);
        p.block = std::chrono::seconds(c.rate_limit_block_sec);
        return p;
    }

    http::response<http::string_body> get(const std::string& target, const std::string& ip = "198.51.100.7") {
        http::request<http::string_body> req{http::verb::get, target, 11};
        req.set(http::field::host, "auv.local");
        return api.handle(req, ip);
    }

    http::response<http::string_body> post(const std::string& target, const std::string& body,
                                           const std::string& ip = "198.51.100.7") {
        http::request<http::string_body> req{http::verb::post, target, 11};
        req.set(http::field::host, "auv.local");
        req.set(http::field::content_type, "application/json");
        req.body() = body;
        req.prepare_payload();
        return api.handle(req, ip);
    }

    static json::object body_of(const http::response<http::string_body>& res) {
        return json::parse(res.body()).as_object();
    }

    ServerConfig config;
    RateLimiter limiter;
    PatternValidator validator;
    SecurityGateway gateway;
    VehicleStateMachine vehicle;
    ConnectionManager conn_manager;
    ControlApi api;
};

TEST_F(ControlApiTest, StatusHasFullShape) {
    auto res = get("/status");
    ASSERT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::content_type], "application/json");

    auto body = body_of(res);
    for (const char* k : {"x", "y", "z"}) {
        EXPECT_TRUE(body.at("pos_m").as_object().contains(k));
        EXPECT_TRUE(body.at("vel_mps").as_object().contains(k));
    }
    for (const char* k : {"yaw", "pitch", "roll"}) {
        EXPECT_TRUE(body.at("att_deg").as_object().contains(k));
    }
    const auto& controls = body.at("controls").as_object();
    EXPECT_EQ(controls.at("pitch_fin").as_int64(), 0);
    EXPECT_EQ(controls.at("yaw_fin").as_int64(), 0);
    EXPECT_EQ(controls.at("prop").as_int64(), 0);
}

TEST_F(ControlApiTest, PropIsClampedAndDrivesVehicleForward) {
    auto res = post("/prop", "{\"value\": 500}");
    ASSERT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(body_of(res).at("prop").as_int64(), 100);

    for (int i = 0; i < 50; ++i) {
        vehicle.tick(0.02);
    }

    auto status = body_of(get("/status"));
    EXPECT_GT(status.at("pos_m").as_object().at("x").as_double(), 0.0);
    EXPECT_GT(status.at("vel_mps").as_object().at("x").as_double(), 0.0);
    EXPECT_EQ(status.at("controls").as_object().at("prop").as_int64(), 100);
}

TEST_F(ControlApiTest, ControlEndpointsEchoStoredValue) {
    EXPECT_EQ(body_of(post("/pitch", "{\"value\": 15}")).at("pitch_fin").as_int64(), 15);
    EXPECT_EQ(body_of(post("/yaw", "{\"value\": -45}")).at("yaw_fin").as_int64(), -30);
    EXPECT_EQ(body_of(post("/prop", "{\"value\": 12.7}")).at("prop").as_int64(), 12);
    EXPECT_EQ(body_of(post("/prop", "{\"value\": -1e300}")).at("prop").as_int64(), -30);

    auto controls = vehicle.get_status().controls;
    EXPECT_EQ(controls.pitch_fin, 15);
    EXPECT_EQ(controls.yaw_fin, -30);
    EXPECT_EQ(controls.prop, -30);
}

TEST_F(ControlApiTest, RateLimitTripsOnRequest301) {
    for (int i = 0; i < 300; ++i) {
        ASSERT_EQ(get("/status", "203.0.113.50").result(), http::status::ok) << "request " << i + 1;
    }
    auto res = get("/status", "203.0.113.50");
    EXPECT_EQ(res.result(), http::status::too_many_requests);
    EXPECT_EQ(res[http::field::retry_after], "300");

    EXPECT_EQ(get("/status", "203.0.113.51").result(), http::status::ok);
}

TEST_F(ControlApiTest, ScriptPayloadIsRejectedAndStateUnchanged) {
    post("/pitch", "{\"value\": 5}");

    auto res = post("/pitch", "{\"value\": \"<script>alert(1)</script>\"}");
    EXPECT_EQ(res.result(), http::status::bad_request);
    EXPECT_EQ(body_of(res).at("error").as_string(), "Request rejected");
    EXPECT_EQ(vehicle.get_status().controls.pitch_fin, 5);
}

TEST_F(ControlApiTest, NonNumericValueIsClientError) {
    auto res = post("/pitch", "{\"value\": \"ten\"}");
    EXPECT_EQ(res.result(), http::status::bad_request);
    EXPECT_EQ(body_of(res).at("error").as_string(), "value must be a number");

    res = post("/yaw", "{\"angle\": 10}");
    EXPECT_EQ(res.result(), http::status::bad_request);
    EXPECT_EQ(body_of(res).at("error").as_string(), "value must be a number");

    res = post("/prop", "[10]");
    EXPECT_EQ(res.result(), http::status::bad_request);
    EXPECT_EQ(body_of(res).at("error").as_string(), "value must be a number");

    res = post("/prop", "{\"value\": true}");
    EXPECT_EQ(res.result(), http::status::bad_request);

    res = post("/prop", "{\"value\": ");
    EXPECT_EQ(res.result(), http::status::bad_request);
    EXPECT_EQ(body_of(res).at("error").as_string(), "invalid JSON body");

    res = post("/prop", "");
    EXPECT_EQ(res.result(), http::status::bad_request);

    EXPECT_EQ(vehicle.get_status().controls.prop, 0);
}

TEST_F(ControlApiTest, UnknownPathIsNotFound) {
    auto res = get("/depth");
    EXPECT_EQ(res.result(), http::status::not_found);
    EXPECT_EQ(body_of(res).at("error").as_string(), "Not Found");
}

TEST_F(ControlApiTest, WrongMethodIsNotAllowed) {
    auto res = get("/pitch");
    EXPECT_EQ(res.result(), http::status::method_not_allowed);
    EXPECT_EQ(res[http::field::allow], "POST, OPTIONS");

    res = post("/status", "{}");
    EXPECT_EQ(res.result(), http::status::method_not_allowed);
    EXPECT_EQ(res[http::field::allow], "GET, OPTIONS");
}

TEST_F(ControlApiTest, QueryStringDoesNotChangeRoute) {
    EXPECT_EQ(get("/status?verbose=1").result(), http::status::ok);
}

TEST_F(ControlApiTest, PreflightAndCors) {
    http::request<http::string_body> req{http::verb::options, "/pitch", 11};
    req.set(http::field::origin, "http://localhost:5173");
    req.set(http::field::access_control_request_method, "POST");

    auto res = api.handle(req, "198.51.100.7");
    EXPECT_EQ(res.result(), http::status::no_content);
    EXPECT_EQ(res[http::field::access_control_allow_origin], "http://localhost:5173");
    EXPECT_NE(res[http::field::access_control_allow_methods].find("POST"), beast::string_view::npos);

    req.set(http::field::origin, "http://localhost.evil.example");
    res = api.handle(req, "198.51.100.7");
    EXPECT_EQ(res.count(http::field::access_control_allow_origin), 0u);
}

TEST_F(ControlApiTest, ConfiguredOriginIsEchoed) {
    config.allowed_origins = {"https://ops.example.org"};
    http::request<http::string_body> req{http::verb::get, "/status", 11};
    req.set(http::field::origin, "https://ops.example.org");

    auto res = api.handle(req, "198.51.100.7");
    EXPECT_EQ(res[http::field::access_control_allow_origin], "https://ops.example.org");
}

TEST_F(ControlApiTest, SuccessResponsesCarrySecurityHeaders) {
    auto res = get("/status");
    EXPECT_EQ(res["X-Content-Type-Options"], "nosniff");
    EXPECT_EQ(res["X-Frame-Options"], "DENY");
    EXPECT_EQ(res["Content-Security-Policy"], "default-src 'none'; frame-ancestors 'none'");
    EXPECT_EQ(res[http::field::cache_control], "no-store");
    EXPECT_EQ(res[http::field::server], "auvctl/1.0");
}

TEST_F(ControlApiTest, Health) {
    auto res = get("/health");
    ASSERT_EQ(res.result(), http::status::ok);
    auto body = body_of(res);
    EXPECT_EQ(body.at("status").as_string(), "healthy");
    EXPECT_DOUBLE_EQ(body.at("tick_hz").as_double(), 50.0);
    EXPECT_FALSE(body.at("tls").as_bool());
}

TEST_F(ControlApiTest, MetricsRequireLoopbackOrToken) {
    auto res = get("/metrics", "127.0.0.1");
    ASSERT_EQ(res.result(), http::status::ok);
    EXPECT_NE(res.body().find("http_requests_total"), std::string::npos);

    EXPECT_EQ(get("/metrics", "198.51.100.7").result(), http::status::not_found);

    config.admin_token = "s3cret-token";
    http::request<http::string_body> req{http::verb::get, "/metrics", 11};
    req.set("X-Admin-Token", "s3cret-token");
    EXPECT_EQ(api.handle(req, "198.51.100.7").result(), http::status::ok);

    req.set("X-Admin-Token", "wrong-token!");
    EXPECT_EQ(api.handle(req, "198.51.100.7").result(), http::status::not_found);
}

TEST_F(ControlApiTest, ControlUpdatesAreCounted) {
    const double before = MetricsRegistry::instance().get_counter("control_updates_total");
    post("/pitch", "{\"value\": 1}");
    post("/yaw", "{\"value\": 2}");
    post("/yaw", "{\"value\": \"x\"}");
    EXPECT_EQ(MetricsRegistry::instance().get_counter("control_updates_total") - before, 2.0);
}

TEST_F(ControlApiTest, TransportOversizeIsAnswered) {
    auto res = api.handle_oversize(11, "198.51.100.7", "body limit");
    EXPECT_EQ(res.result(), http::status::payload_too_large);
    EXPECT_FALSE(res.keep_alive());
    EXPECT_EQ(res["X-Frame-Options"], "DENY");
}

TEST_F(ControlApiTest, AuditFailureDuringScreeningIsInternalError) {
    int calls = 0;
    SecurityLogger::set_sink([&calls](const SecurityLogger::AuditEvent&) {
        if (calls++ == 0) throw std::bad_alloc();
    });

    auto res = post("/pitch", "{\"value\": \"<script>alert(1)</script>\"}");
    EXPECT_EQ(res.result(), http::status::internal_server_error);
    EXPECT_EQ(body_of(res).at("error").as_string(), "Internal server error");
    EXPECT_FALSE(res.keep_alive());
    EXPECT_EQ(res["X-Frame-Options"], "DENY");
    EXPECT_EQ(vehicle.get_status().controls.pitch_fin, 0);
}
