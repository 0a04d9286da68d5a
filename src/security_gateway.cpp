#include "security_gateway.hpp"
#include "metrics.hpp"

#include <boost/json.hpp>
#include <ctime>

namespace json = boost::json;

namespace auvctl {

namespace {

constexpr size_t kSummaryTargetChars = 128;

http::response<http::string_body> json_error(http::status status, unsigned version, json::object body) {
    http::response<http::string_body> res{status, version};
    res.set(http::field::content_type, "application/json");
    res.body() = json::serialize(body);
    return res;
}

} // namespace

SecurityGateway::SecurityGateway(const ServerConfig& config, RateLimiter& rate_limiter,
                                 const RequestInspector& inspector)
    : config_(config)
    , rate_limiter_(rate_limiter)
    , inspector_(inspector)
{}

GatewayDecision SecurityGateway::screen(const http::request<http::string_body>& req,
                                        const std::string& remote_addr) {
    GatewayDecision decision;
    try {
        // 1. Size ceiling, before the request costs anything else.
        const size_t size = request_size(req);
        if (size > config_.max_request_bytes) {
            return reject_oversize(remote_addr, summarize(req) + " size=" + std::to_string(size));
        }

        // 2. Per-client sliding window. Requests counted here include those
        // that later fail inspection.
        decision.limit = rate_limiter_.admit(remote_addr);
        if (!decision.limit.allowed) {
            decision.verdict = GatewayVerdict::RATE_LIMITED;
            count_rejection("rate_limit");
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::RATE_LIMIT,
                                remote_addr, summarize(req) + " retry_after=" +
                                std::to_string(decision.limit.reset_after_sec));
            return decision;
        }

        // 3. Signature inspection; one audit event per match.
        decision.matches = inspector_.inspect(extract_fields(req));
        if (!decision.matches.empty()) {
            decision.verdict = GatewayVerdict::VIOLATION;
            const std::string summary = summarize(req);
            for (const auto& match : decision.matches) {
                count_rejection(PatternValidator::category_name(match.category));
                SecurityLogger::log(SecurityLogger::Level::WARNING, event_for(match.category), remote_addr,
                                    summary + " field=" + match.field_name +
                                    " fragment=" + match.matched_fragment);
            }
            return decision;
        }

        return decision;
    } catch (const std::exception& e) {
        decision.verdict = GatewayVerdict::INTERNAL_ERROR;
        decision.matches.clear();
        count_rejection("internal_error");
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::INTERNAL_ERROR,
                            remote_addr, std::string("Inspection failed, request refused: ") + e.what());
        return decision;
    } catch (...) {
        decision.verdict = GatewayVerdict::INTERNAL_ERROR;
        decision.matches.clear();
        count_rejection("internal_error");
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::INTERNAL_ERROR,
                            remote_addr, "Inspection failed with a non-standard exception, request refused");
        return decision;
    }
}

GatewayDecision SecurityGateway::reject_oversize(const std::string& remote_addr, const std::string& detail) {
    GatewayDecision decision;
    decision.verdict = GatewayVerdict::OVERSIZE;
    decision.matches.push_back({ThreatCategory::OVERSIZE, "", "request"});
    count_rejection("oversize");
    SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::OVERSIZE,
                        remote_addr, detail);
    return decision;
}

// Rejection bodies never name the rule that fired.
http::response<http::string_body> SecurityGateway::rejection_response(const GatewayDecision& decision,
                                                                      unsigned version) const {
    http::response<http::string_body> res;
    json::object error;

    switch (decision.verdict) {
        case GatewayVerdict::OVERSIZE:
            error["error"] = "Payload too large";
            res = json_error(http::status::payload_too_large, version, std::move(error));
            res.keep_alive(false);
            break;

        case GatewayVerdict::RATE_LIMITED:
            error["error"] = "Rate limit exceeded";
            error["retry_after"] = decision.limit.reset_after_sec;
            res = json_error(http::status::too_many_requests, version, std::move(error));
            res.set(http::field::retry_after, std::to_string(decision.limit.reset_after_sec));
            res.set("X-RateLimit-Limit", std::to_string(decision.limit.limit));
            res.set("X-RateLimit-Remaining", "0");
            res.set("X-RateLimit-Reset", std::to_string(std::time(nullptr) + decision.limit.reset_after_sec));
            if (decision.limit.reset_after_sec >= 60) {
                res.keep_alive(false);
            }
            break;

        case GatewayVerdict::VIOLATION:
            error["error"] = "Request rejected";
            res = json_error(http::status::bad_request, version, std::move(error));
            res.keep_alive(false);
            break;

        case GatewayVerdict::INTERNAL_ERROR:
        case GatewayVerdict::PASS:
        default:
            error["error"] = "Internal server error";
            res = json_error(http::status::internal_server_error, version, std::move(error));
            res.keep_alive(false);
            break;
    }

    add_security_headers(res);
    res.prepare_payload();
    return res;
}

RequestFields SecurityGateway::extract_fields(const http::request<http::string_body>& req) {
    RequestFields fields;
    fields.body = req.body();

    const auto target = req.target();
    const auto qpos = target.find('?');
    fields.path = std::string(target.substr(0, qpos));

    if (qpos != beast::string_view::npos) {
        std::string query(target.substr(qpos + 1));
        size_t start = 0;
        while (start <= query.size()) {
            size_t end = query.find('&', start);
            if (end == std::string::npos) end = query.size();
            std::string pair = query.substr(start, end - start);
            if (!pair.empty()) {
                const size_t eq = pair.find('=');
                if (eq == std::string::npos) {
                    fields.query.emplace_back(pair, "");
                } else {
                    fields.query.emplace_back(pair.substr(0, eq), pair.substr(eq + 1));
                }
            }
            start = end + 1;
        }
    }

    for (const auto& field : req) {
        if (field.name() == http::field::user_agent) {
            fields.user_agent = std::string(field.value());
        } else {
            fields.headers.emplace_back(std::string(field.name_string()), std::string(field.value()));
        }
    }
    return fields;
}

size_t SecurityGateway::request_size(const http::request<http::string_body>& req) {
    size_t total = req.target().size() + req.body().size();
    for (const auto& field : req) {
        total += field.name_string().size() + field.value().size();
    }
    return total;
}

SecurityLogger::EventType SecurityGateway::event_for(ThreatCategory category) {
    switch (category) {
        case ThreatCategory::SQL_INJECTION: return SecurityLogger::EventType::SQL_INJECTION;
        case ThreatCategory::XSS: return SecurityLogger::EventType::XSS;
        case ThreatCategory::PATH_TRAVERSAL: return SecurityLogger::EventType::PATH_TRAVERSAL;
        case ThreatCategory::COMMAND_INJECTION: return SecurityLogger::EventType::COMMAND_INJECTION;
        case ThreatCategory::OVERSIZE: return SecurityLogger::EventType::OVERSIZE;
        case ThreatCategory::SUSPICIOUS_AGENT: return SecurityLogger::EventType::SUSPICIOUS_AGENT;
        case ThreatCategory::FORBIDDEN_HEADER: return SecurityLogger::EventType::FORBIDDEN_HEADER;
    }
    return SecurityLogger::EventType::INTERNAL_ERROR;
}

std::string SecurityGateway::summarize(const http::request<http::string_body>& req) {
    std::string target(req.target().substr(0, kSummaryTargetChars));
    return std::string(req.method_string()) + " " + target;
}

void SecurityGateway::count_rejection(const char* category) {
    MetricsRegistry::instance().increment_counter("gateway_rejected_total", {{"category", category}});
}

}
