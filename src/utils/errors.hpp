#pragma once

#include <stdexcept>
#include <string>

namespace codebox {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message)
        : std::runtime_error(message) {}
};

// Submitted code, dependencies, mounts or options were rejected by a static rule.
class ValidationRejected : public Error {
public:
    using Error::Error;
};

class SessionNotFound : public Error {
public:
    using Error::Error;
};

// The container never reached running, or the kernel channel never became ready.
class IsolationStartupFailure : public Error {
public:
    using Error::Error;
};

class DependencyInstallFailure : public Error {
public:
    using Error::Error;
};

}  // namespace codebox
