// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "aerolink_error.h"
#include "cloud_api.h"
#include "cloud_types.h"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace aerolink {

/**
 * @brief Cloud account authentication states
 */
enum class AuthState {
    Anonymous,          // No session, login not started
    AwaitingIdentifier, // Waiting for email or phone number
    AwaitingOtp,        // Code sent; waiting for code (+ password for email)
    Authenticated,      // Session valid
    TokenExpiring,      // Session inside the refresh margin
    Refreshing,         // Refresh call in flight
    ReauthRequired      // Session lost; user must sign in again
};

const char* auth_state_name(AuthState state);

/**
 * @brief Inputs to the authentication state machine
 */
enum class AuthEvent {
    Begin,             // User starts (or restarts) the login flow
    OtpRequested,      // Code successfully requested
    OtpRequestFailed,  // Unknown identifier or rate limited
    OtpVerified,       // Code accepted, session created
    OtpRejected,       // Wrong code or password
    ExpiryApproaching, // Session entered the refresh margin
    RefreshStarted,    // Refresh call issued
    RefreshSucceeded,  // Session renewed
    RefreshDeferred,   // Transient refresh failure; try again later
    RefreshFailed,     // Session cannot be renewed
    SessionRejected,   // Service refused the session during normal use
    SessionRestored,   // Persisted session loaded at startup
    Logout             // Session destroyed on request
};

const char* auth_event_name(AuthEvent event);

/**
 * @brief Pure transition function of the authentication state machine
 *
 * @return Next state, or nullopt if the event is not valid in this state
 */
std::optional<AuthState> next_auth_state(AuthState state, AuthEvent event);

struct CloudAuthSettings {
    std::string region = "US";

    /// Refresh is attempted this long before the session expires
    std::chrono::seconds refresh_margin{300};

    /// Cool-down applied when the service rate-limits without saying how long
    std::chrono::seconds default_rate_limit{60};

    /// Wait between refresh attempts after a transient failure
    std::chrono::seconds refresh_retry{60};
};

/**
 * @brief Drives the OTP login flow and keeps the session fresh
 *
 * The branching between email and mobile flows is carried in the OtpChallenge;
 * states and transitions are the same for both.
 *
 * Thread safety: all public methods are thread-safe. Operations that call the
 * API are serialised; observers run on the calling thread after the state
 * lock is released and must not call back into the machine.
 */
class CloudAuthMachine {
  public:
    using StateCallback = std::function<void(AuthState old_state, AuthState new_state)>;
    using SessionCallback = std::function<void(const std::optional<CloudSession>&)>;
    using NowFn = std::function<WallTime()>;

    CloudAuthMachine(std::shared_ptr<ICloudApi> api, CloudAuthSettings settings,
                     NowFn now = WallClock::now);

    /**
     * @brief Start the login flow (Anonymous/ReauthRequired/AwaitingOtp -> AwaitingIdentifier)
     */
    AeroError begin();

    /**
     * @brief Request a one-time code for an email address or phone number
     *
     * Re-submission inside a rate-limit cool-down returns RateLimited with the
     * remaining wait, without calling the service.
     *
     * @return IdentifierNotRegistered, RateLimited, NetworkError, InvalidState
     */
    AeroError submit_identifier(const std::string& identifier);

    /**
     * @brief Verify the code (email flow also needs the account password)
     *
     * InvalidOtp and InvalidAuth leave the machine in AwaitingOtp.
     */
    AeroError submit_otp(const std::string& code, const std::string& password = "");

    /**
     * @brief Resume a persisted session (Anonymous/ReauthRequired -> Authenticated)
     *
     * An already expired session is accepted; the next tick refreshes it.
     */
    AeroError restore_session(const CloudSession& session);

    /**
     * @brief Refresh the session when it enters the refresh margin
     */
    void tick(WallTime now);

    /**
     * @brief The service refused the session during a normal call
     */
    void invalidate_session(const AeroError& cause);

    void logout();

    AuthState state() const;
    std::optional<CloudSession> session() const;

    /// Session usable for API calls (Authenticated, TokenExpiring or Refreshing)
    bool has_session() const;

    /// True while a login is waiting for a code and it needs a password
    bool otp_requires_password() const;

    /// Remaining rate-limit cool-down (zero when none)
    std::chrono::seconds cooldown_remaining() const;

    void on_state_changed(StateCallback cb);
    void on_session_changed(SessionCallback cb);

  private:
    // Applies a transition under state_mutex_; returns false if illegal
    bool apply_locked(AuthEvent event, AuthState& old_state, AuthState& new_state);
    void notify(AuthState old_state, AuthState new_state, bool session_changed);
    AeroError transition(AuthEvent event, bool session_changed = false);
    // transition() for side paths where the current state is already checked
    void advance(AuthEvent event, bool session_changed = false);

    std::shared_ptr<ICloudApi> api_;
    CloudAuthSettings settings_;
    NowFn now_;

    std::mutex op_mutex_; // Serialises API-calling operations

    mutable std::mutex state_mutex_;
    AuthState state_ = AuthState::Anonymous;
    std::optional<CloudSession> session_;
    std::optional<OtpChallenge> challenge_;
    WallTime cooldown_until_{};
    WallTime next_refresh_attempt_{};

    std::mutex callback_mutex_;
    StateCallback state_cb_;
    SessionCallback session_cb_;
};

} // namespace aerolink
