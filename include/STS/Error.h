// include/STS/Error.h
// Synopsis: Error enums and std::error_code categories for discovery, device access and sync.

#pragma once

#include <string>
#include <system_error>

namespace STS {

/**
 * @brief Coarse classification of a DiscoveryError
 *
 * Callers use this to tell "nothing answered" (Transport) apart from
 * "something answered with garbage" (Parse) or "not one of ours" (Validation).
 */
enum class ErrorKind {
    None,
    Transport,
    Parse,
    Validation
};

enum class DiscoveryError {
    Success = 0,
    SocketError,            // Socket could not be created or configured
    SendFailed,             // M-SEARCH datagram could not be sent
    ReceiveFailed,          // recvfrom/poll failed while collecting responses
    ConnectionFailed,       // HTTP connect/DNS/transfer failure
    Timeout,                // HTTP request timed out
    HttpStatus,             // Non-2xx HTTP status
    MalformedXml,           // Description document did not parse
    MissingElement,         // Required element absent or blank
    ManufacturerMismatch,   // Description belongs to another vendor
    IncompleteDescriptor,   // friendlyName or modelName missing
    InvalidLocation,        // LOCATION URL has no usable host
    SourceFailed            // A discovery source failed as a whole
};

enum class DeviceError {
    Success = 0,
    ConnectionFailed,
    Timeout,
    HttpStatus,
    MalformedResponse,
    MissingDeviceId,
    StorageFailed,
    NotFound
};

enum class SyncError {
    Success = 0,
    ConcurrentRun           // Another sync() is already in flight on this orchestrator
};

enum class ConfigError {
    Success = 0,
    FileNotFound,
    ParseFailed,
    InvalidValue
};

inline ErrorKind errorKind(DiscoveryError e) noexcept {
    switch (e) {
        case DiscoveryError::Success:
            return ErrorKind::None;
        case DiscoveryError::SocketError:
        case DiscoveryError::SendFailed:
        case DiscoveryError::ReceiveFailed:
        case DiscoveryError::ConnectionFailed:
        case DiscoveryError::Timeout:
        case DiscoveryError::HttpStatus:
        case DiscoveryError::SourceFailed:
            return ErrorKind::Transport;
        case DiscoveryError::MalformedXml:
        case DiscoveryError::MissingElement:
            return ErrorKind::Parse;
        case DiscoveryError::ManufacturerMismatch:
        case DiscoveryError::IncompleteDescriptor:
        case DiscoveryError::InvalidLocation:
            return ErrorKind::Validation;
    }
    return ErrorKind::Transport;
}

namespace detail {
    struct DiscoveryErrorCategory : std::error_category {
        const char* name() const noexcept override { return "discovery"; }
        std::string message(int ev) const override {
            switch (static_cast<DiscoveryError>(ev)) {
                case DiscoveryError::Success: return "Success";
                case DiscoveryError::SocketError: return "Socket setup failed";
                case DiscoveryError::SendFailed: return "Failed to send discovery request";
                case DiscoveryError::ReceiveFailed: return "Failed to receive discovery response";
                case DiscoveryError::ConnectionFailed: return "Connection failed";
                case DiscoveryError::Timeout: return "Request timed out";
                case DiscoveryError::HttpStatus: return "Unexpected HTTP status";
                case DiscoveryError::MalformedXml: return "Malformed XML document";
                case DiscoveryError::MissingElement: return "Required element missing";
                case DiscoveryError::ManufacturerMismatch: return "Manufacturer does not match vendor filter";
                case DiscoveryError::IncompleteDescriptor: return "Descriptor is missing friendlyName or modelName";
                case DiscoveryError::InvalidLocation: return "Location URL has no usable host";
                case DiscoveryError::SourceFailed: return "Discovery source failed";
                default: return "Unknown discovery error";
            }
        }
    };

    struct DeviceErrorCategory : std::error_category {
        const char* name() const noexcept override { return "device"; }
        std::string message(int ev) const override {
            switch (static_cast<DeviceError>(ev)) {
                case DeviceError::Success: return "Success";
                case DeviceError::ConnectionFailed: return "Device unreachable";
                case DeviceError::Timeout: return "Device request timed out";
                case DeviceError::HttpStatus: return "Device returned an error status";
                case DeviceError::MalformedResponse: return "Malformed device response";
                case DeviceError::MissingDeviceId: return "Device response has no device id";
                case DeviceError::StorageFailed: return "Device store failure";
                case DeviceError::NotFound: return "Device not found";
                default: return "Unknown device error";
            }
        }
    };

    struct SyncErrorCategory : std::error_category {
        const char* name() const noexcept override { return "sync"; }
        std::string message(int ev) const override {
            switch (static_cast<SyncError>(ev)) {
                case SyncError::Success: return "Success";
                case SyncError::ConcurrentRun: return "Sync already in progress";
                default: return "Unknown sync error";
            }
        }
    };

    struct ConfigErrorCategory : std::error_category {
        const char* name() const noexcept override { return "config"; }
        std::string message(int ev) const override {
            switch (static_cast<ConfigError>(ev)) {
                case ConfigError::Success: return "Success";
                case ConfigError::FileNotFound: return "Configuration file not found";
                case ConfigError::ParseFailed: return "Configuration file is not valid JSON";
                case ConfigError::InvalidValue: return "Invalid configuration value";
                default: return "Unknown configuration error";
            }
        }
    };
}

inline const std::error_category& discovery_error_category() noexcept {
    static detail::DiscoveryErrorCategory category;
    return category;
}

inline const std::error_category& device_error_category() noexcept {
    static detail::DeviceErrorCategory category;
    return category;
}

inline const std::error_category& sync_error_category() noexcept {
    static detail::SyncErrorCategory category;
    return category;
}

inline const std::error_category& config_error_category() noexcept {
    static detail::ConfigErrorCategory category;
    return category;
}

inline std::error_code make_error_code(DiscoveryError e) noexcept {
    return {static_cast<int>(e), discovery_error_category()};
}

inline std::error_code make_error_code(DeviceError e) noexcept {
    return {static_cast<int>(e), device_error_category()};
}

inline std::error_code make_error_code(SyncError e) noexcept {
    return {static_cast<int>(e), sync_error_category()};
}

inline std::error_code make_error_code(ConfigError e) noexcept {
    return {static_cast<int>(e), config_error_category()};
}

} // namespace STS

namespace std {
    template<>
    struct is_error_code_enum<STS::DiscoveryError> : true_type {};
    template<>
    struct is_error_code_enum<STS::DeviceError> : true_type {};
    template<>
    struct is_error_code_enum<STS::SyncError> : true_type {};
    template<>
    struct is_error_code_enum<STS::ConfigError> : true_type {};
}
