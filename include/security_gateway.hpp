#pragma once

#include <boost/beast/http.hpp>
#include <string>
#include <vector>

#include "server_config.hpp"
#include "rate_limiter.hpp"
#include "pattern_validator.hpp"
#include "security_logger.hpp"

namespace beast = boost::beast;
namespace http = beast::http;

namespace auvctl {

enum class GatewayVerdict {
    PASS,
    OVERSIZE,
    RATE_LIMITED,
    VIOLATION,
    INTERNAL_ERROR
};

struct GatewayDecision {
    GatewayVerdict verdict = GatewayVerdict::PASS;
    RateLimitResult limit{true, 0, 0, 0};
    std::vector<RuleMatch> matches;

    bool passed() const { return verdict == GatewayVerdict::PASS; }
};

// Request-filtering front door. Every request is screened in order:
// size ceiling, per-client rate limit, signature inspection. Rejections are
// audited and answered with category-free bodies. A failing inspector is
// turned into an INTERNAL_ERROR decision; only a failure to record the audit
// trail itself (e.g. allocation failure) propagates to the caller.
class SecurityGateway {
public:
    SecurityGateway(const ServerConfig& config, RateLimiter& rate_limiter,
                    const RequestInspector& inspector);

    GatewayDecision screen(const http::request<http::string_body>& req,
                           const std::string& remote_addr);

    // Rejection for requests the transport could not even finish reading
    // because they crossed the size ceiling.
    GatewayDecision reject_oversize(const std::string& remote_addr, const std::string& detail);

    http::response<http::string_body> rejection_response(const GatewayDecision& decision,
                                                         unsigned version) const;

    template<class Body>
    void add_security_headers(http::response<Body>& res) const {
        res.set(http::field::server, "auvctl/1.0");
        res.set("X-Content-Type-Options", "nosniff");
        res.set("X-Frame-Options", "DENY");
        res.set("X-XSS-Protection", "1; mode=block");
        res.set("Strict-Transport-Security", "max-age=31536000; includeSubDomains");
        res.set("Content-Security-Policy", "default-src 'none'; frame-ancestors 'none'");
        res.set("Referrer-Policy", "no-referrer");
        res.set("Permissions-Policy", "geolocation=(), microphone=(), camera=()");
        res.set(http::field::cache_control, "no-store");
    }

    static RequestFields extract_fields(const http::request<http::string_body>& req);

    // Bytes counted against the request ceiling: target, header lines, body.
    static size_t request_size(const http::request<http::string_body>& req);

    static SecurityLogger::EventType event_for(ThreatCategory category);

private:
    const ServerConfig& config_;
    RateLimiter& rate_limiter_;
    const RequestInspector& inspector_;

    static std::string summarize(const http::request<http::string_body>& req);
    static void count_rejection(const char* category);
};

}
