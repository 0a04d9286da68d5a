#pragma once

#include <string>
#include <iostream>
#include <cctype>
#include <chrono>
#include <ctime>
#include <functional>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <openssl/sha.h>
#include <openssl/rand.h>

namespace auvctl {

// Logs security events using blinded IP identifiers (salted hash).
// Every event is also handed to the audit sink as an AuditEvent.
class SecurityLogger {
public:
    enum class Level {
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    enum class EventType {
        RATE_LIMIT,
        SQL_INJECTION,
        XSS,
        PATH_TRAVERSAL,
        COMMAND_INJECTION,
        OVERSIZE,
        FORBIDDEN_HEADER,
        SUSPICIOUS_AGENT,
        INVALID_INPUT,
        INTERNAL_ERROR,
        CONNECTION_REJECTED,
        LIFECYCLE
    };

    struct AuditEvent {
        std::chrono::system_clock::time_point timestamp;
        Level level;
        EventType category;
        std::string client_address;  // blinded
        std::string request_summary; // sanitized
    };

    using Sink = std::function<void(const AuditEvent&)>;

    /**
     * Records a security-relevant event with blinded identifiers.
     * @param level Severity level of the event.
     * @param event The audit category.
     * @param remote_addr The source IP address (will be blinded before logging).
     * @param message Optional request summary (will be sanitized).
     */
    static void log(Level level, EventType event, const std::string& remote_addr,
                   const std::string& message = "") {
        AuditEvent audit{std::chrono::system_clock::now(), level, event, "", sanitize_log_message(message)};

        Sink sink;
        {
            std::lock_guard<std::mutex> lock(state().mutex);
            audit.client_address = blind_locked(remote_addr, audit.timestamp);
            sink = state().sink;
        }

        if (sink) {
            sink(audit);
        } else {
            write_line(audit);
        }
    }

    // Replaces the audit sink. An empty sink restores console output.
    static void set_sink(Sink sink) {
        std::lock_guard<std::mutex> lock(state().mutex);
        state().sink = std::move(sink);
    }

    // Formats an event the way the console sink prints it.
    static std::string format(const AuditEvent& audit) {
        auto time_t = std::chrono::system_clock::to_time_t(audit.timestamp);
        struct tm gmt;
        gmtime_r(&time_t, &gmt);

        std::stringstream ss;
        ss << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] "
           << "[" << level_to_string(audit.level) << "] "
           << "[" << event_to_string(audit.category) << "] "
           << "ip=" << audit.client_address;
        if (!audit.request_summary.empty()) {
            ss << " msg=\"" << audit.request_summary << "\"";
        }
        return ss.str();
    }

    // Lower-case category name used in audit records and metric names.
    static const char* category_name(EventType event) {
        switch (event) {
            case EventType::RATE_LIMIT: return "rate_limit";
            case EventType::SQL_INJECTION: return "sql_injection";
            case EventType::XSS: return "xss";
            case EventType::PATH_TRAVERSAL: return "path_traversal";
            case EventType::COMMAND_INJECTION: return "command_injection";
            case EventType::OVERSIZE: return "oversize";
            case EventType::FORBIDDEN_HEADER: return "forbidden_header";
            case EventType::SUSPICIOUS_AGENT: return "suspicious_agent";
            case EventType::INVALID_INPUT: return "invalid_input";
            case EventType::INTERNAL_ERROR: return "internal_error";
            case EventType::CONNECTION_REJECTED: return "connection_rejected";
            case EventType::LIFECYCLE: return "lifecycle";
            default: return "unknown";
        }
    }

    // Escapes non-printable characters and quotes to ensure log integrity
    static std::string sanitize_log_message(const std::string& msg) {
        std::string result;
        result.reserve(msg.size());
        for (char c : msg) {
            if (c == '"' || c == '\\' || c == '\n' || c == '\r') {
                result += ' ';
            } else if (std::isprint(static_cast<unsigned char>(c))) {
                result += c;
            }
        }
        return result;
    }

private:
    struct State {
        std::mutex mutex;
        std::string log_salt;
        std::chrono::steady_clock::time_point last_rotation;
        Sink sink;
    };

    static State& state() {
        static State instance;
        return instance;
    }

    // Salt Rotation Logic:
    // A random salt is generated and rotated every 6 hours, so past
    // IP-to-Hash mappings cannot be reversed once the salt is gone.
    static std::string blind_locked(const std::string& remote_addr,
                                    std::chrono::system_clock::time_point now) {
        State& s = state();
        auto now_steady = std::chrono::steady_clock::now();
        if (s.log_salt.empty() || std::chrono::duration_cast<std::chrono::hours>(now_steady - s.last_rotation).count() >= 6) {
            unsigned char b[32];
            if (RAND_bytes(b, 32) != 1) {
                std::cerr << "[CRITICAL] CSPRNG failure in SecurityLogger. Terminating instance for safety.\n";
                std::terminate();
            }
            std::stringstream salt_ss;
            for (int i = 0; i < 32; i++) salt_ss << std::hex << std::setw(2) << std::setfill('0') << (int)b[i];
            s.log_salt = salt_ss.str();
            s.last_rotation = now_steady;

            AuditEvent rotated{now, Level::INFO, EventType::LIFECYCLE, "internal",
                               "IP blinding salt rotated for log forward secrecy"};
            write_line(rotated);
        }

        if (remote_addr == "unknown" || remote_addr == "internal") {
            return remote_addr;
        }

        std::string data = remote_addr + s.log_salt;
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);

        std::stringstream hs;
        for (int i = 0; i < 6; i++) hs << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
        return "anon_" + hs.str();
    }

    // Log to appropriate destination based on severity
    static void write_line(const AuditEvent& audit) {
        if (audit.level == Level::ERROR || audit.level == Level::CRITICAL) {
            std::cerr << format(audit) << "\n";
        } else {
            std::cout << format(audit) << "\n";
        }
    }

    static std::string level_to_string(Level level) {
        switch (level) {
            case Level::INFO: return "INFO";
            case Level::WARNING: return "WARN";
            case Level::ERROR: return "ERROR";
            case Level::CRITICAL: return "CRIT";
            default: return "UNKNOWN";
        }
    }

    static std::string event_to_string(EventType event) {
        switch (event) {
            case EventType::RATE_LIMIT: return "RATE_LIMIT";
            case EventType::SQL_INJECTION: return "SQLI";
            case EventType::XSS: return "XSS";
            case EventType::PATH_TRAVERSAL: return "TRAVERSAL";
            case EventType::COMMAND_INJECTION: return "CMD_INJECTION";
            case EventType::OVERSIZE: return "OVERSIZE";
            case EventType::FORBIDDEN_HEADER: return "FORBIDDEN_HEADER";
            case EventType::SUSPICIOUS_AGENT: return "SUSPICIOUS_AGENT";
            case EventType::INVALID_INPUT: return "INVALID_INPUT";
            case EventType::INTERNAL_ERROR: return "INTERNAL_ERROR";
            case EventType::CONNECTION_REJECTED: return "CONN_REJECTED";
            case EventType::LIFECYCLE: return "SERVER";
            default: return "UNKNOWN_EVENT";
        }
    }
};

}
