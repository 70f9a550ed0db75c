#pragma once

#include <stdexcept>
#include <string>

#include "Types.hpp"

namespace sos {
namespace core {

enum class ErrorKind : uint8_t {
    VALIDATION = 0,
    STATE_CONFLICT = 1,
    NOT_FOUND = 2,
    AUTHORIZATION = 3,
    DELIVERY = 4,
    TRANSIENT_STORE = 5
};

const char* to_string(ErrorKind kind);

class EngineError : public std::runtime_error {
public:
    EngineError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

class ValidationError : public EngineError {
public:
    explicit ValidationError(const std::string& message)
        : EngineError(ErrorKind::VALIDATION, message) {}
};

// Carries the status actually found so clients can resynchronize.
class StateConflict : public EngineError {
public:
    StateConflict(const std::string& message, EmergencyStatus current)
        : EngineError(ErrorKind::STATE_CONFLICT, message), m_current(current) {}

    EmergencyStatus current_status() const { return m_current; }

private:
    EmergencyStatus m_current;
};

class NotFound : public EngineError {
public:
    explicit NotFound(const std::string& message)
        : EngineError(ErrorKind::NOT_FOUND, message) {}
};

class AuthorizationError : public EngineError {
public:
    explicit AuthorizationError(const std::string& message)
        : EngineError(ErrorKind::AUTHORIZATION, message) {}
};

// Contained by the notification dispatcher; never reaches an API caller.
class DeliveryError : public EngineError {
public:
    DeliveryError(const std::string& code, const std::string& message)
        : EngineError(ErrorKind::DELIVERY, message), m_code(code) {}

    const std::string& code() const { return m_code; }

private:
    std::string m_code;
};

class TransientStoreError : public EngineError {
public:
    explicit TransientStoreError(const std::string& message)
        : EngineError(ErrorKind::TRANSIENT_STORE, message) {}
};

int http_status_for(ErrorKind kind);

} // namespace core
} // namespace sos
