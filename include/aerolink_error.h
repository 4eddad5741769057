// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace aerolink {

/**
 * @brief Error types for device connectivity, discovery and cloud operations
 */
enum class AeroErrorType {
    None,                    // No error
    ConnectTimeout,          // Transport connect did not complete before its deadline
    AuthRejected,            // Device refused the local credential
    NotConnected,            // Command attempted while the connection is not up
    StaleConnection,         // Liveness window expired without inbound traffic
    CloudAuthRequired,       // Operation needs a cloud session and there is none
    ReauthRequired,          // Cloud session can no longer be refreshed
    RateLimited,             // Cloud asked us to back off
    MalformedPayload,        // Device sent something we cannot decode
    IdentifierNotRegistered, // Email/phone unknown to the cloud account service
    InvalidOtp,              // Wrong one-time code
    InvalidAuth,             // Wrong password / rejected cloud credentials
    NetworkError,            // Cloud HTTP request failed at the transport level
    Rejected,                // Transport refused the command
    InvalidState,            // Operation not valid in the current state
    Unknown                  // Unknown error
};

/**
 * @brief Comprehensive error information
 *
 * Returned by value from every fallible operation. A default-constructed
 * AeroError means success.
 */
struct AeroError {
    AeroErrorType type = AeroErrorType::None;
    std::string message;                     // Human-readable error message
    std::string context;                     // Serial, method or identifier involved
    std::chrono::seconds retry_after{0};     // Minimum wait (RateLimited only)
    int code = 0;                            // Transport/HTTP status code if applicable

    /**
     * @brief Check if there's an error
     */
    bool has_error() const {
        return type != AeroErrorType::None;
    }

    explicit operator bool() const {
        return has_error();
    }

    /**
     * @brief Get string representation of error type
     */
    std::string get_type_string() const {
        return type_name(type);
    }

    static std::string type_name(AeroErrorType t) {
        switch (t) {
        case AeroErrorType::None:
            return "None";
        case AeroErrorType::ConnectTimeout:
            return "ConnectTimeout";
        case AeroErrorType::AuthRejected:
            return "AuthRejected";
        case AeroErrorType::NotConnected:
            return "NotConnected";
        case AeroErrorType::StaleConnection:
            return "StaleConnection";
        case AeroErrorType::CloudAuthRequired:
            return "CloudAuthRequired";
        case AeroErrorType::ReauthRequired:
            return "ReauthRequired";
        case AeroErrorType::RateLimited:
            return "RateLimited";
        case AeroErrorType::MalformedPayload:
            return "MalformedPayload";
        case AeroErrorType::IdentifierNotRegistered:
            return "IdentifierNotRegistered";
        case AeroErrorType::InvalidOtp:
            return "InvalidOtp";
        case AeroErrorType::InvalidAuth:
            return "InvalidAuth";
        case AeroErrorType::NetworkError:
            return "NetworkError";
        case AeroErrorType::Rejected:
            return "Rejected";
        case AeroErrorType::InvalidState:
            return "InvalidState";
        case AeroErrorType::Unknown:
            return "Unknown";
        }
        return "Unknown";
    }

    /**
     * @brief Transient errors are recovered by retrying later
     *
     * Connection-layer errors are retried by the supervisor's own backoff loop,
     * NotConnected by the caller on its next attempt.
     */
    bool is_retryable() const {
        switch (type) {
        case AeroErrorType::ConnectTimeout:
        case AeroErrorType::StaleConnection:
        case AeroErrorType::NotConnected:
        case AeroErrorType::NetworkError:
        case AeroErrorType::RateLimited:
        case AeroErrorType::Rejected:
            return true;
        default:
            return false;
        }
    }

    /**
     * @brief Errors that can only be resolved by the user re-entering credentials
     */
    bool requires_user_action() const {
        return type == AeroErrorType::AuthRejected || type == AeroErrorType::ReauthRequired ||
               type == AeroErrorType::CloudAuthRequired || type == AeroErrorType::InvalidAuth;
    }

    /**
     * @brief Get a user-friendly error message
     */
    std::string user_message() const {
        switch (type) {
        case AeroErrorType::ConnectTimeout:
        case AeroErrorType::StaleConnection:
        case AeroErrorType::NotConnected:
            return "Device unavailable.";
        case AeroErrorType::AuthRejected:
            return "The device rejected its credentials. Please re-enter them.";
        case AeroErrorType::ReauthRequired:
        case AeroErrorType::CloudAuthRequired:
            return "Cloud account needs to be signed in again.";
        case AeroErrorType::RateLimited:
            return "Too many verification requests. Try again in " +
                   std::to_string(retry_after.count()) + " seconds.";
        case AeroErrorType::IdentifierNotRegistered:
            return "This email or phone number is not registered.";
        case AeroErrorType::InvalidOtp:
            return "The verification code is not correct.";
        case AeroErrorType::InvalidAuth:
            return "Invalid account credentials.";
        default:
            break;
        }
        if (!message.empty()) {
            return message;
        }
        return "An unknown error occurred.";
    }

    static AeroError make(AeroErrorType type, std::string message, std::string context = "") {
        AeroError err;
        err.type = type;
        err.message = std::move(message);
        err.context = std::move(context);
        return err;
    }

    static AeroError connect_timeout(const std::string& serial, uint32_t timeout_ms) {
        return make(AeroErrorType::ConnectTimeout,
                    "Connect timeout after " + std::to_string(timeout_ms) + "ms", serial);
    }

    static AeroError auth_rejected(const std::string& serial) {
        return make(AeroErrorType::AuthRejected, "Device rejected local credential", serial);
    }

    static AeroError not_connected(const std::string& serial) {
        return make(AeroErrorType::NotConnected, "Device is not connected", serial);
    }

    static AeroError stale_connection(const std::string& serial, uint32_t window_ms) {
        return make(AeroErrorType::StaleConnection,
                    "No message for " + std::to_string(window_ms) + "ms", serial);
    }

    static AeroError reauth_required(const std::string& what = "") {
        return make(AeroErrorType::ReauthRequired, "Cloud session refresh failed", what);
    }

    static AeroError rate_limited(std::chrono::seconds retry_after,
                                  const std::string& what = "") {
        AeroError err = make(AeroErrorType::RateLimited, "Rate limited by cloud service", what);
        err.retry_after = retry_after;
        return err;
    }

    static AeroError malformed_payload(const std::string& what, const std::string& serial = "") {
        return make(AeroErrorType::MalformedPayload, "Malformed payload: " + what, serial);
    }

    static AeroError invalid_state(const std::string& what) {
        return make(AeroErrorType::InvalidState, what);
    }
};

} // namespace aerolink
