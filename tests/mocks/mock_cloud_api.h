// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef MOCK_CLOUD_API_H
#define MOCK_CLOUD_API_H

/**
 * @file mock_cloud_api.h
 * @brief In-memory account service for auth and cloud discovery tests
 *
 * Every call returns the configured error (if any) and counts itself.
 * Successful verification and refresh hand out sessions expiring
 * session_lifetime after the configured clock.
 */

#include "cloud_api.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

using namespace aerolink;

class MockCloudApi : public ICloudApi {
  public:
    AeroError request_otp(OtpChallenge& challenge) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++request_otp_calls;
        last_challenge = challenge;
        if (request_otp_error) {
            return request_otp_error;
        }
        challenge.challenge_id = "challenge-" + std::to_string(request_otp_calls);
        return {};
    }

    AeroError verify_otp(const OtpChallenge& challenge, const std::string& code,
                         const std::string& password, CloudSession& session_out) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++verify_otp_calls;
        last_code = code;
        last_password = password;
        if (verify_otp_error) {
            return verify_otp_error;
        }
        if (code != valid_code) {
            return AeroError::make(AeroErrorType::InvalidOtp, "Wrong code", challenge.identifier);
        }
        if (challenge.requires_password() && password != valid_password) {
            return AeroError::make(AeroErrorType::InvalidAuth, "Wrong password",
                                   challenge.identifier);
        }
        session_out = make_session("access-1", "refresh-1");
        return {};
    }

    AeroError list_devices(const CloudSession& session,
                           std::vector<DeviceCloudInfo>& devices_out) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++list_devices_calls;
        last_listed_token = session.access_token;
        if (list_devices_error) {
            return list_devices_error;
        }
        devices_out = devices;
        return {};
    }

    AeroError refresh_token(const CloudSession& session, CloudSession& session_out) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++refresh_calls;
        if (refresh_error) {
            return refresh_error;
        }
        session_out = make_session("access-" + std::to_string(refresh_calls + 1),
                                   session.refresh_token);
        return {};
    }

    CloudSession make_session(const std::string& access, const std::string& refresh) const {
        CloudSession s;
        s.access_token = access;
        s.refresh_token = refresh;
        s.expires_at = now() + session_lifetime;
        s.account = "account-1";
        return s;
    }

    std::function<WallTime()> now = WallClock::now;
    std::chrono::seconds session_lifetime{std::chrono::hours(24)};

    std::string valid_code = "123456";
    std::string valid_password = "hunter2";

    AeroError request_otp_error;
    AeroError verify_otp_error;
    AeroError list_devices_error;
    AeroError refresh_error;
    std::vector<DeviceCloudInfo> devices;

    std::atomic<int> request_otp_calls{0};
    std::atomic<int> verify_otp_calls{0};
    std::atomic<int> list_devices_calls{0};
    std::atomic<int> refresh_calls{0};
    OtpChallenge last_challenge;
    std::string last_code;
    std::string last_password;
    std::string last_listed_token;

  private:
    std::mutex mutex_;
};

#endif // MOCK_CLOUD_API_H
