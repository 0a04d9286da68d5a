#pragma once

#include <string>
#include <cmath>
#include <boost/json.hpp>

#include "errors.hpp"

namespace auvctl {

// Structural validation of client payloads (as opposed to the attack
// signatures handled by PatternValidator).
class InputValidator {
public:
    static bool is_within_size_limit(size_t size, size_t max_size) {
        return size <= max_size;
    }

    /**
     * JSON parsing with recursion depth limits to prevent stack-exhaustion (DoS).
     * Throws boost::system::system_error on malformed input.
     */
    static boost::json::value safe_parse_json(const std::string& input, size_t max_depth = 8) {
        boost::json::parse_options opt;
        opt.max_depth = max_depth;
        return boost::json::parse(input, {}, opt);
    }

    /**
     * Extracts the numeric "value" member of a control request body.
     * Anything other than a JSON object carrying a finite number raises
     * ValidationError with a message that is safe to return to the client.
     */
    static double parse_control_value(const std::string& body, size_t max_depth = 8) {
        boost::json::value parsed;
        try {
            parsed = safe_parse_json(body, max_depth);
        } catch (const std::exception&) {
            throw ValidationError("invalid JSON body");
        }

        if (!parsed.is_object()) {
            throw ValidationError("value must be a number");
        }
        const auto& obj = parsed.as_object();
        auto it = obj.find("value");
        if (it == obj.end()) {
            throw ValidationError("value must be a number");
        }

        const auto& v = it->value();
        double number = 0.0;
        if (v.is_int64()) {
            number = static_cast<double>(v.as_int64());
        } else if (v.is_uint64()) {
            number = static_cast<double>(v.as_uint64());
        } else if (v.is_double()) {
            number = v.as_double();
        } else {
            throw ValidationError("value must be a number");
        }

        if (!std::isfinite(number)) {
            throw ValidationError("value must be a finite number");
        }
        return number;
    }
};

}
