#pragma once

#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace auvctl {

enum class ThreatCategory {
    SQL_INJECTION,
    XSS,
    PATH_TRAVERSAL,
    COMMAND_INJECTION,
    OVERSIZE,
    SUSPICIOUS_AGENT,
    FORBIDDEN_HEADER
};

struct RuleMatch {
    ThreatCategory category;
    std::string matched_fragment;
    std::string field_name;
};

// The parts of a request the validator looks at, each as an independent string.
struct RequestFields {
    using Pairs = std::vector<std::pair<std::string, std::string>>;

    std::string body;
    std::string path;
    Pairs query;
    Pairs headers;      // everything except User-Agent
    std::string user_agent;

    size_t total_size() const;
};

// Inspection seam used by the gateway. Implementations must be stateless
// and safe to call concurrently.
class RequestInspector {
public:
    virtual ~RequestInspector() = default;
    virtual std::vector<RuleMatch> inspect(const RequestFields& fields) const = 0;
};

// Stateless attack-signature classifier. Every rule family is an independent
// predicate; inspect() reports every match it finds so the caller can log the
// full picture, and an empty result means the request is clean.
class PatternValidator : public RequestInspector {
public:
    struct Limits {
        size_t max_field_bytes = 1024;
        size_t max_total_bytes = 10 * 1024;
    };

    PatternValidator() : PatternValidator(Limits{}) {}

    // trusted_headers names denylisted headers a fronting proxy is known to
    // add (e.g. X-Forwarded-Host); those are no longer reported. Matching is
    // case-insensitive.
    explicit PatternValidator(const Limits& limits, const std::vector<std::string>& trusted_headers = {});

    std::vector<RuleMatch> inspect(const RequestFields& fields) const override;

    const Limits& limits() const { return limits_; }

    static const char* category_name(ThreatCategory category);

    // Decodes %XX escapes once. Malformed escapes are kept verbatim.
    static std::string percent_decode(std::string_view input);

private:
    struct Signature {
        ThreatCategory category;
        std::regex pattern;
    };

    using Field = std::pair<std::string, std::string_view>;

    static const std::vector<Signature>& signatures();
    static const std::vector<std::string>& agent_denylist();
    static const std::vector<std::string>& header_denylist();

    static std::vector<Field> collect_fields(const RequestFields& fields);
    static bool search(const std::regex& pattern, std::string_view value, std::string& fragment);

    void check_sizes(const RequestFields& fields, const std::vector<Field>& all,
                     std::vector<RuleMatch>& matches) const;
    static void check_agent(const std::string& user_agent, std::vector<RuleMatch>& matches);
    void check_header_names(const RequestFields::Pairs& headers, std::vector<RuleMatch>& matches) const;

    Limits limits_;
    std::vector<std::string> trusted_headers_;
};

}
