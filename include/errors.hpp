#pragma once

#include <stdexcept>
#include <string>

namespace auvctl {

// Malformed or out-of-domain client input. The message is safe to return
// to the caller verbatim.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& what) : std::runtime_error(what) {}
};

// Unexpected fault inside inspection or integration. Detail goes to the
// audit log only; clients see a generic server error.
class InternalFailure : public std::runtime_error {
public:
    explicit InternalFailure(const std::string& what) : std::runtime_error(what) {}
};

}
