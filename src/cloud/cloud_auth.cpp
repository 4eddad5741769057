// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file cloud_auth.cpp
 * @brief OTP login and session refresh state machine
 *
 * @pattern Tagged state enum + pure transition function; side effects
 *          (API calls, session storage) live in CloudAuthMachine methods
 * @threading API calls are made on the caller's thread under op_mutex_
 */

#include "cloud_auth.h"

#include "error_reporting.h"

#include <spdlog/spdlog.h>

namespace aerolink {

const char* auth_state_name(AuthState state) {
    switch (state) {
    case AuthState::Anonymous:
        return "Anonymous";
    case AuthState::AwaitingIdentifier:
        return "AwaitingIdentifier";
    case AuthState::AwaitingOtp:
        return "AwaitingOtp";
    case AuthState::Authenticated:
        return "Authenticated";
    case AuthState::TokenExpiring:
        return "TokenExpiring";
    case AuthState::Refreshing:
        return "Refreshing";
    case AuthState::ReauthRequired:
        return "ReauthRequired";
    }
    return "Unknown";
}

const char* auth_event_name(AuthEvent event) {
    switch (event) {
    case AuthEvent::Begin:
        return "Begin";
    case AuthEvent::OtpRequested:
        return "OtpRequested";
    case AuthEvent::OtpRequestFailed:
        return "OtpRequestFailed";
    case AuthEvent::OtpVerified:
        return "OtpVerified";
    case AuthEvent::OtpRejected:
        return "OtpRejected";
    case AuthEvent::ExpiryApproaching:
        return "ExpiryApproaching";
    case AuthEvent::RefreshStarted:
        return "RefreshStarted";
    case AuthEvent::RefreshSucceeded:
        return "RefreshSucceeded";
    case AuthEvent::RefreshDeferred:
        return "RefreshDeferred";
    case AuthEvent::RefreshFailed:
        return "RefreshFailed";
    case AuthEvent::SessionRejected:
        return "SessionRejected";
    case AuthEvent::SessionRestored:
        return "SessionRestored";
    case AuthEvent::Logout:
        return "Logout";
    }
    return "Unknown";
}

std::optional<AuthState> next_auth_state(AuthState state, AuthEvent event) {
    if (event == AuthEvent::Logout) {
        return AuthState::Anonymous;
    }

    switch (state) {
    case AuthState::Anonymous:
    case AuthState::ReauthRequired:
        if (event == AuthEvent::Begin)
            return AuthState::AwaitingIdentifier;
        if (event == AuthEvent::SessionRestored)
            return AuthState::Authenticated;
        break;

    case AuthState::AwaitingIdentifier:
        if (event == AuthEvent::OtpRequested)
            return AuthState::AwaitingOtp;
        if (event == AuthEvent::OtpRequestFailed || event == AuthEvent::Begin)
            return AuthState::AwaitingIdentifier;
        break;

    case AuthState::AwaitingOtp:
        switch (event) {
        case AuthEvent::OtpRequested:
        case AuthEvent::OtpRequestFailed:
        case AuthEvent::OtpRejected:
            return AuthState::AwaitingOtp;
        case AuthEvent::OtpVerified:
            return AuthState::Authenticated;
        case AuthEvent::Begin:
            return AuthState::AwaitingIdentifier;
        default:
            break;
        }
        break;

    case AuthState::Authenticated:
        if (event == AuthEvent::ExpiryApproaching)
            return AuthState::TokenExpiring;
        if (event == AuthEvent::SessionRejected)
            return AuthState::ReauthRequired;
        break;

    case AuthState::TokenExpiring:
        if (event == AuthEvent::RefreshStarted)
            return AuthState::Refreshing;
        if (event == AuthEvent::SessionRejected)
            return AuthState::ReauthRequired;
        break;

    case AuthState::Refreshing:
        if (event == AuthEvent::RefreshSucceeded)
            return AuthState::Authenticated;
        if (event == AuthEvent::RefreshDeferred)
            return AuthState::TokenExpiring;
        if (event == AuthEvent::RefreshFailed || event == AuthEvent::SessionRejected)
            return AuthState::ReauthRequired;
        break;
    }
    return std::nullopt;
}

CloudAuthMachine::CloudAuthMachine(std::shared_ptr<ICloudApi> api, CloudAuthSettings settings,
                                   NowFn now)
    : api_(std::move(api)), settings_(std::move(settings)), now_(std::move(now)) {}

bool CloudAuthMachine::apply_locked(AuthEvent event, AuthState& old_state, AuthState& new_state) {
    old_state = state_;
    auto next = next_auth_state(state_, event);
    if (!next) {
        spdlog::debug("[CloudAuth] Ignoring {} in state {}", auth_event_name(event),
                      auth_state_name(state_));
        new_state = state_;
        return false;
    }
    state_ = *next;
    new_state = state_;
    return true;
}

AeroError CloudAuthMachine::transition(AuthEvent event, bool session_changed) {
    AuthState old_state;
    AuthState new_state;
    bool ok;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        ok = apply_locked(event, old_state, new_state);
    }
    if (!ok) {
        return AeroError::invalid_state(std::string(auth_event_name(event)) + " not valid in " +
                                        auth_state_name(old_state));
    }
    notify(old_state, new_state, session_changed);
    return {};
}

void CloudAuthMachine::advance(AuthEvent event, bool session_changed) {
    if (auto err = transition(event, session_changed)) {
        LOG_WARN_INTERNAL("[CloudAuth] {}", err.message);
    }
}

void CloudAuthMachine::notify(AuthState old_state, AuthState new_state, bool session_changed) {
    if (old_state != new_state) {
        spdlog::info("[CloudAuth] {} -> {}", auth_state_name(old_state),
                     auth_state_name(new_state));
    }

    StateCallback state_cb;
    SessionCallback session_cb;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        state_cb = state_cb_;
        session_cb = session_cb_;
    }

    try {
        if (state_cb && old_state != new_state) {
            state_cb(old_state, new_state);
        }
        if (session_cb && session_changed) {
            session_cb(session());
        }
    } catch (const std::exception& e) {
        LOG_ERROR_INTERNAL("[CloudAuth] Observer threw: {}", e.what());
    }
}

AeroError CloudAuthMachine::begin() {
    std::lock_guard<std::mutex> op(op_mutex_);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        challenge_.reset();
    }
    return transition(AuthEvent::Begin);
}

AeroError CloudAuthMachine::submit_identifier(const std::string& identifier) {
    std::lock_guard<std::mutex> op(op_mutex_);
    WallTime now = now_();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != AuthState::AwaitingIdentifier && state_ != AuthState::AwaitingOtp) {
            return AeroError::invalid_state(std::string("Cannot request a code in state ") +
                                            auth_state_name(state_));
        }
        if (now < cooldown_until_) {
            auto remaining =
                std::chrono::ceil<std::chrono::seconds>(cooldown_until_ - now);
            spdlog::debug("[CloudAuth] Code request refused locally, {}s cool-down left",
                          remaining.count());
            return AeroError::rate_limited(remaining, "otp request");
        }
    }

    auto normalized = normalize_identifier(identifier, settings_.region);
    if (!normalized) {
        advance(AuthEvent::OtpRequestFailed);
        return AeroError::make(AeroErrorType::IdentifierNotRegistered,
                               "Not a valid email address or phone number", identifier);
    }

    OtpChallenge challenge;
    challenge.kind = normalized->first;
    challenge.identifier = normalized->second;
    challenge.region = settings_.region;

    AeroError err = api_->request_otp(challenge);
    if (err) {
        if (err.type == AeroErrorType::RateLimited) {
            if (err.retry_after.count() <= 0) {
                err.retry_after = settings_.default_rate_limit;
            }
            std::lock_guard<std::mutex> lock(state_mutex_);
            cooldown_until_ = now + err.retry_after;
        }
        spdlog::warn("[CloudAuth] Code request for {} failed: {}", challenge.identifier,
                     err.get_type_string());
        advance(AuthEvent::OtpRequestFailed);
        return err;
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        challenge_ = challenge;
    }
    return transition(AuthEvent::OtpRequested);
}

AeroError CloudAuthMachine::submit_otp(const std::string& code, const std::string& password) {
    std::lock_guard<std::mutex> op(op_mutex_);
    WallTime now = now_();
    OtpChallenge challenge;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != AuthState::AwaitingOtp || !challenge_) {
            return AeroError::invalid_state(std::string("No code pending in state ") +
                                            auth_state_name(state_));
        }
        if (now < cooldown_until_) {
            auto remaining =
                std::chrono::ceil<std::chrono::seconds>(cooldown_until_ - now);
            spdlog::debug("[CloudAuth] Verification refused locally, {}s cool-down left",
                          remaining.count());
            return AeroError::rate_limited(remaining, "otp verify");
        }
        challenge = *challenge_;
    }

    if (challenge.requires_password() && password.empty()) {
        advance(AuthEvent::OtpRejected);
        return AeroError::make(AeroErrorType::InvalidAuth, "Password is required",
                               challenge.identifier);
    }

    CloudSession session;
    AeroError err = api_->verify_otp(challenge, code, password, session);
    if (err) {
        spdlog::warn("[CloudAuth] Verification for {} failed: {}", challenge.identifier,
                     err.get_type_string());
        if (err.type == AeroErrorType::RateLimited) {
            if (err.retry_after.count() <= 0) {
                err.retry_after = settings_.default_rate_limit;
            }
            std::lock_guard<std::mutex> lock(state_mutex_);
            cooldown_until_ = now + err.retry_after;
        }
        advance(AuthEvent::OtpRejected);
        return err;
    }

    if (session.region.empty()) {
        session.region = challenge.region;
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        session_ = session;
        challenge_.reset();
        next_refresh_attempt_ = WallTime{};
    }
    return transition(AuthEvent::OtpVerified, true);
}

AeroError CloudAuthMachine::restore_session(const CloudSession& session) {
    std::lock_guard<std::mutex> op(op_mutex_);
    if (!session.valid()) {
        return AeroError::make(AeroErrorType::CloudAuthRequired, "Stored session is empty");
    }

    AuthState old_state;
    AuthState new_state;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!apply_locked(AuthEvent::SessionRestored, old_state, new_state)) {
            return AeroError::invalid_state(std::string("Cannot restore session in state ") +
                                            auth_state_name(old_state));
        }
        session_ = session;
        challenge_.reset();
        next_refresh_attempt_ = WallTime{};
    }
    spdlog::info("[CloudAuth] Restored session for account {}",
                 session.account.empty() ? "(unknown)" : session.account);
    notify(old_state, new_state, false);
    return {};
}

void CloudAuthMachine::tick(WallTime now) {
    std::lock_guard<std::mutex> op(op_mutex_);

    std::optional<CloudSession> current;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == AuthState::Authenticated && session_ &&
            now + settings_.refresh_margin < session_->expires_at) {
            return;
        }
        if (state_ != AuthState::Authenticated && state_ != AuthState::TokenExpiring) {
            return;
        }
        current = session_;
    }
    if (!current) {
        return;
    }

    if (state() == AuthState::Authenticated) {
        spdlog::debug("[CloudAuth] Session expires in {}s, refreshing",
                      std::chrono::duration_cast<std::chrono::seconds>(current->expires_at - now)
                          .count());
        advance(AuthEvent::ExpiryApproaching);
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (now < next_refresh_attempt_) {
            return;
        }
    }

    advance(AuthEvent::RefreshStarted);

    CloudSession renewed;
    AeroError err = api_->refresh_token(*current, renewed);
    if (!err) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            session_ = renewed;
            next_refresh_attempt_ = WallTime{};
        }
        advance(AuthEvent::RefreshSucceeded, true);
        return;
    }

    bool permanent = err.type == AeroErrorType::ReauthRequired ||
                     err.type == AeroErrorType::InvalidAuth || current->expired_at(now);
    if (!permanent) {
        spdlog::warn("[CloudAuth] Session refresh failed ({}), retrying in {}s", err.message,
                     settings_.refresh_retry.count());
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            next_refresh_attempt_ = now + settings_.refresh_retry;
        }
        advance(AuthEvent::RefreshDeferred);
        return;
    }

    spdlog::error("[CloudAuth] Session refresh failed: {}; sign-in required", err.message);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        session_.reset();
    }
    advance(AuthEvent::RefreshFailed, true);
}

void CloudAuthMachine::invalidate_session(const AeroError& cause) {
    std::lock_guard<std::mutex> op(op_mutex_);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!session_) {
            return;
        }
        session_.reset();
    }
    spdlog::error("[CloudAuth] Session rejected by service: {}", cause.message);
    advance(AuthEvent::SessionRejected, true);
}

void CloudAuthMachine::logout() {
    std::lock_guard<std::mutex> op(op_mutex_);
    bool had_session;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        had_session = session_.has_value();
        session_.reset();
        challenge_.reset();
    }
    spdlog::info("[CloudAuth] Logged out");
    advance(AuthEvent::Logout, had_session);
}

AuthState CloudAuthMachine::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::optional<CloudSession> CloudAuthMachine::session() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return session_;
}

bool CloudAuthMachine::has_session() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return session_.has_value() &&
           (state_ == AuthState::Authenticated || state_ == AuthState::TokenExpiring ||
            state_ == AuthState::Refreshing);
}

bool CloudAuthMachine::otp_requires_password() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_ == AuthState::AwaitingOtp && challenge_ && challenge_->requires_password();
}

std::chrono::seconds CloudAuthMachine::cooldown_remaining() const {
    WallTime now = now_();
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (now >= cooldown_until_) {
        return std::chrono::seconds(0);
    }
    return std::chrono::ceil<std::chrono::seconds>(cooldown_until_ - now);
}

void CloudAuthMachine::on_state_changed(StateCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    state_cb_ = std::move(cb);
}

void CloudAuthMachine::on_session_changed(SessionCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    session_cb_ = std::move(cb);
}

} // namespace aerolink
