#include "pattern_validator.hpp"

#include <algorithm>
#include <cctype>

namespace auvctl {

namespace {

constexpr size_t kMaxFragment = 64;

constexpr auto kFlags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

size_t RequestFields::total_size() const {
    size_t total = body.size() + path.size() + user_agent.size();
    for (const auto& [name, value] : query) total += name.size() + value.size();
    for (const auto& [name, value] : headers) total += name.size() + value.size();
    return total;
}

PatternValidator::PatternValidator(const Limits& limits, const std::vector<std::string>& trusted_headers)
    : limits_(limits)
{
    for (const auto& name : trusted_headers) {
        trusted_headers_.push_back(to_lower(name));
    }
}

// Signature table, grouped by family in reporting order.
const std::vector<PatternValidator::Signature>& PatternValidator::signatures() {
    static const std::vector<Signature> table = [] {
        std::vector<Signature> t;
        auto add = [&t](ThreatCategory c, const char* re) { t.push_back({c, std::regex(re, kFlags)}); };

        // SQL injection
        // Inline comments are matched up to their first "*/" only; a comment
        // that could span several would make the repetition ambiguous.
        add(ThreatCategory::SQL_INJECTION, R"(union(\s|\+|/\*[^*]*\*+(?:[^/*][^*]*\*+)*/)+(all(\s|\+|/\*[^*]*\*+(?:[^/*][^*]*\*+)*/)+)?select)");
        add(ThreatCategory::SQL_INJECTION, R"('\s*(or|and)\s+'?\w+'?\s*(=|<>|!=|like)\s*'?\w+)");
        add(ThreatCategory::SQL_INJECTION, R"(\b(or|and)\s+(\d+)\s*=\s*\2\b)");
        add(ThreatCategory::SQL_INJECTION, R"('\s*(--|#|/\*))");
        add(ThreatCategory::SQL_INJECTION, R"(;\s*--)");
        add(ThreatCategory::SQL_INJECTION, R"(/\*!?\d*\s*(select|union|insert|update|delete|drop|or|and|from|where)\b)");
        add(ThreatCategory::SQL_INJECTION, R"(;\s*(drop|delete|insert|update|select|alter|create|truncate|exec|execute|shutdown|declare)\b)");
        add(ThreatCategory::SQL_INJECTION, R"(\b(sleep|benchmark|pg_sleep)\s*\()");
        add(ThreatCategory::SQL_INJECTION, R"(waitfor\s+delay)");
        add(ThreatCategory::SQL_INJECTION, R"(information_schema|xp_cmdshell)");

        // Cross-site scripting
        add(ThreatCategory::XSS, R"(<\s*/?\s*script\b)");
        add(ThreatCategory::XSS, R"(\bon(error|load|click|dblclick|mouse\w*|focus\w*|blur|key\w*|submit|change|input|toggle|begin|end|animation\w*|pointer\w*|touch\w*|drag\w*|wheel|scroll|resize|unload|beforeunload|message|hashchange|popstate|select|copy|paste|cut|abort|play|pause|ended)\s*=)");
        add(ThreatCategory::XSS, R"((javascript|vbscript|livescript)\s*:)");
        add(ThreatCategory::XSS, R"(data\s*:\s*text/html)");
        add(ThreatCategory::XSS, R"(<\s*(iframe|object|embed|svg|img|body|link|meta|style|base)\b)");
        add(ThreatCategory::XSS, R"(document\.(cookie|location|write)|\balert\s*\()");

        // Path traversal
        add(ThreatCategory::PATH_TRAVERSAL, R"(\.\.[/\\])");
        add(ThreatCategory::PATH_TRAVERSAL, R"((%2e|\.)(%2e|\.)(%2f|%5c))");
        add(ThreatCategory::PATH_TRAVERSAL, R"(%2e%2e[/\\])");
        add(ThreatCategory::PATH_TRAVERSAL, R"(%252e|%c0%ae|%c1%9c|%c0%af)");
        add(ThreatCategory::PATH_TRAVERSAL, R"(/etc/(passwd|shadow|hosts|group)|/proc/self|\b[a-z]:\\+(windows|winnt)|file://)");

        // Command injection
        add(ThreatCategory::COMMAND_INJECTION, R"([;|&]\s*(ls|cat|rm|wget|curl|nc|ncat|netcat|bash|sh|zsh|id|whoami|uname|chmod|chown|ping|python\d*|perl|ruby|php|powershell|cmd|echo|kill|nslookup|telnet)(\s|$|[;|&<>]))");
        add(ThreatCategory::COMMAND_INJECTION, R"(&&|\|\|)");
        add(ThreatCategory::COMMAND_INJECTION, R"(`[^`]*`)");
        add(ThreatCategory::COMMAND_INJECTION, R"(\$\(|\$\{)");
        add(ThreatCategory::COMMAND_INJECTION, R"([<>]\()");
        return t;
    }();
    return table;
}

const std::vector<std::string>& PatternValidator::agent_denylist() {
    static const std::vector<std::string> agents = {
        "sqlmap", "nikto", "nmap", "masscan", "nessus", "openvas", "acunetix",
        "netsparker", "dirbuster", "gobuster", "wfuzz", "ffuf", "wpscan",
        "hydra", "havij", "w3af", "zgrab", "nuclei", "zmeu", "jorgee",
        "commix", "xsstrike", "burpsuite", "arachni", "skipfish"
    };
    return agents;
}

// Header names used to smuggle routing or method overrides past proxies.
const std::vector<std::string>& PatternValidator::header_denylist() {
    static const std::vector<std::string> names = {
        "x-original-url", "x-rewrite-url", "x-forwarded-host", "x-forwarded-server",
        "x-http-method-override", "x-http-method", "x-method-override",
        "x-host", "x-http-host-override", "x-custom-ip-authorization"
    };
    return names;
}

std::vector<RuleMatch> PatternValidator::inspect(const RequestFields& fields) const {
    std::vector<RuleMatch> matches;
    const auto all = collect_fields(fields);

    // Each (signature, field) pair reports at most once; the decoded form is
    // only consulted when the raw form did not match. Fields over the size
    // limit are reported as oversize and not pattern-scanned.
    std::vector<std::string> decoded;
    decoded.reserve(all.size());
    for (const auto& field : all) {
        decoded.push_back(percent_decode(field.second));
    }

    for (const auto& sig : signatures()) {
        for (size_t i = 0; i < all.size(); ++i) {
            if (all[i].second.size() > limits_.max_field_bytes) continue;
            std::string fragment;
            if (search(sig.pattern, all[i].second, fragment) ||
                (decoded[i] != all[i].second && search(sig.pattern, decoded[i], fragment))) {
                matches.push_back({sig.category, std::move(fragment), all[i].first});
            }
        }
    }

    check_sizes(fields, all, matches);
    check_agent(fields.user_agent, matches);
    check_header_names(fields.headers, matches);
    return matches;
}

std::vector<PatternValidator::Field> PatternValidator::collect_fields(const RequestFields& fields) {
    std::vector<Field> all;
    all.reserve(3 + fields.query.size() * 2 + fields.headers.size());
    all.emplace_back("body", fields.body);
    all.emplace_back("path", fields.path);
    for (const auto& [name, value] : fields.query) {
        all.emplace_back("query_key", name);
        all.emplace_back("query:" + name, value);
    }
    for (const auto& [name, value] : fields.headers) {
        all.emplace_back("header:" + to_lower(name), value);
    }
    all.emplace_back("user_agent", fields.user_agent);
    return all;
}

bool PatternValidator::search(const std::regex& pattern, std::string_view value, std::string& fragment) {
    if (value.empty()) return false;
    std::match_results<std::string_view::const_iterator> m;
    if (!std::regex_search(value.begin(), value.end(), m, pattern)) {
        return false;
    }
    fragment = m.str(0).substr(0, kMaxFragment);
    return true;
}

void PatternValidator::check_sizes(const RequestFields& fields, const std::vector<Field>& all,
                                   std::vector<RuleMatch>& matches) const {
    for (const auto& [name, value] : all) {
        if (value.size() > limits_.max_field_bytes) {
            matches.push_back({ThreatCategory::OVERSIZE, std::to_string(value.size()) + " bytes", name});
        }
    }
    const size_t total = fields.total_size();
    if (total > limits_.max_total_bytes) {
        matches.push_back({ThreatCategory::OVERSIZE, std::to_string(total) + " bytes", "request"});
    }
}

void PatternValidator::check_agent(const std::string& user_agent, std::vector<RuleMatch>& matches) {
    if (user_agent.empty()) return;
    const std::string ua = to_lower(user_agent);
    for (const auto& tool : agent_denylist()) {
        if (ua.find(tool) != std::string::npos) {
            matches.push_back({ThreatCategory::SUSPICIOUS_AGENT, tool, "user_agent"});
            return;
        }
    }
}

void PatternValidator::check_header_names(const RequestFields::Pairs& headers,
                                          std::vector<RuleMatch>& matches) const {
    const auto& denied = header_denylist();
    for (const auto& header : headers) {
        const std::string name = to_lower(header.first);
        if (std::find(trusted_headers_.begin(), trusted_headers_.end(), name) != trusted_headers_.end()) {
            continue;
        }
        if (std::find(denied.begin(), denied.end(), name) != denied.end()) {
            matches.push_back({ThreatCategory::FORBIDDEN_HEADER, name, "header:" + name});
        }
    }
}

const char* PatternValidator::category_name(ThreatCategory category) {
    switch (category) {
        case ThreatCategory::SQL_INJECTION: return "sql_injection";
        case ThreatCategory::XSS: return "xss";
        case ThreatCategory::PATH_TRAVERSAL: return "path_traversal";
        case ThreatCategory::COMMAND_INJECTION: return "command_injection";
        case ThreatCategory::OVERSIZE: return "oversize";
        case ThreatCategory::SUSPICIOUS_AGENT: return "suspicious_agent";
        case ThreatCategory::FORBIDDEN_HEADER: return "forbidden_header";
        default: return "unknown";
    }
}

std::string PatternValidator::percent_decode(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    for (size_t i = 0; i < input.size(); ++i) {
        if (input[i] == '%' && i + 2 < input.size()) {
            int hi = hex_value(input[i + 1]);
            int lo = hex_value(input[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += input[i];
    }
    return out;
}

}
