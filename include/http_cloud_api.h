// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "cloud_api.h"

#include <chrono>
#include <string>
#include <vector>

namespace aerolink {

struct CloudApiSettings {
    std::string region = "US";

    /// Per-request deadline
    int timeout_sec = 10;

    /// Lifetime granted to a session after verification or a successful refresh
    std::chrono::hours token_lifetime{24};

    /// Replaces the regional host (e.g. "http://127.0.0.1:8080" for a local stub)
    std::string base_url_override;
};

/**
 * @brief ICloudApi over libhv's blocking HTTP client
 *
 * Status mapping: 401/403 -> InvalidAuth (ReauthRequired for refresh),
 * 429 -> RateLimited honouring Retry-After, transport failure or 5xx ->
 * NetworkError.
 *
 * Thread safety: stateless apart from settings; calls may run concurrently.
 */
class HttpCloudApi : public ICloudApi {
  public:
    explicit HttpCloudApi(CloudApiSettings settings = {});

    AeroError request_otp(OtpChallenge& challenge) override;
    AeroError verify_otp(const OtpChallenge& challenge, const std::string& code,
                         const std::string& password, CloudSession& session_out) override;
    AeroError list_devices(const CloudSession& session,
                           std::vector<DeviceCloudInfo>& devices_out) override;
    AeroError refresh_token(const CloudSession& session, CloudSession& session_out) override;

    /**
     * @brief Account service host for a region ("CN" uses the China host)
     */
    static std::string host_for_region(const std::string& region);

    /**
     * @brief Parse a device manifest response body
     *
     * @return MalformedPayload if the body is not a JSON array
     */
    static AeroError parse_manifest(const std::string& body,
                                    std::vector<DeviceCloudInfo>& devices_out);

  private:
    std::string base_url(const std::string& region) const;

    CloudApiSettings settings_;
};

} // namespace aerolink
