#include "queue_error.hpp"
#include <format>

std::string errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Setup:
        return "SetupError";
    case ErrorKind::Configuration:
        return "ConfigurationError";
    case ErrorKind::Transfer:
        return "TransferError";
    case ErrorKind::Authentication:
        return "AuthenticationError";
    }
    return "UnknownError";
}

std::string QueueError::describe() const {
    if (path.empty()) {
        return std::format("{}: {}", errorKindName(kind), message);
    }
    return std::format("{}: {}: {}", errorKindName(kind), path, message);
}
