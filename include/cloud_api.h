// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "aerolink_error.h"
#include "cloud_types.h"

#include <string>
#include <vector>

namespace aerolink {

/**
 * @brief Abstract client for the appliance vendor's account service
 *
 * Calls block until the service answers or the request deadline passes.
 * Results are returned through out-parameters; the return value carries the
 * failure class.
 *
 * Allows dependency injection of mock implementations for testing.
 */
class ICloudApi {
  public:
    virtual ~ICloudApi() = default;

    /**
     * @brief Ask the service to send a one-time code
     *
     * @param challenge In: identifier, kind and region. Out: challenge_id set.
     * @return IdentifierNotRegistered, RateLimited (retry_after), NetworkError
     */
    virtual AeroError request_otp(OtpChallenge& challenge) = 0;

    /**
     * @param password Required for the email flow, ignored for mobile
     * @return InvalidOtp, InvalidAuth, RateLimited, NetworkError
     */
    virtual AeroError verify_otp(const OtpChallenge& challenge, const std::string& code,
                                 const std::string& password, CloudSession& session_out) = 0;

    /**
     * @return InvalidAuth when the session is no longer accepted
     */
    virtual AeroError list_devices(const CloudSession& session,
                                   std::vector<DeviceCloudInfo>& devices_out) = 0;

    /**
     * @return ReauthRequired when the session cannot be renewed
     */
    virtual AeroError refresh_token(const CloudSession& session, CloudSession& session_out) = 0;
};

} // namespace aerolink
