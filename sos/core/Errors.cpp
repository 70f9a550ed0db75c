#include "Errors.hpp"

namespace sos {
namespace core {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION:      return "ValidationError";
        case ErrorKind::STATE_CONFLICT:  return "StateConflict";
        case ErrorKind::NOT_FOUND:       return "NotFound";
        case ErrorKind::AUTHORIZATION:   return "AuthorizationError";
        case ErrorKind::DELIVERY:        return "DeliveryError";
        case ErrorKind::TRANSIENT_STORE: return "TransientStoreError";
    }
    return "EngineError";
}

int http_status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION:      return 400;
        case ErrorKind::STATE_CONFLICT:  return 409;
        case ErrorKind::NOT_FOUND:       return 404;
        case ErrorKind::AUTHORIZATION:   return 403;
        case ErrorKind::TRANSIENT_STORE: return 503;
        case ErrorKind::DELIVERY:        return 500;
    }
    return 500;
}

} // namespace core
} // namespace sos
