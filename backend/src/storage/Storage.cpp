#include "Storage.hpp"

const char* toString(StoreStatus status) {
    switch (status) {
    case StoreStatus::Ok: return "ok";
    case StoreStatus::NotFound: return "not_found";
    case StoreStatus::Conflict: return "conflict";
    case StoreStatus::Timeout: return "timeout";
    case StoreStatus::Failure: return "failure";
    }
    return "unknown";
}

AuthStatus toAuthStatus(StoreStatus status) {
    switch (status) {
    case StoreStatus::Ok: return AuthStatus::Ok;
    case StoreStatus::Timeout: return AuthStatus::Timeout;
    default: return AuthStatus::StorageError;
    }
}
