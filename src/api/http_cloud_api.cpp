// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file http_cloud_api.cpp
 * @brief Account service client (OTP login, device manifest)
 *
 * @threading Blocking; callers run it off their event loop
 * @gotchas The service issues bearer tokens without an explicit lifetime or a
 *          refresh grant. Refresh re-validates the token against the manifest
 *          endpoint and extends the local expiry.
 */

#include "http_cloud_api.h"

#include <spdlog/spdlog.h>

#include <cstdlib>

#include "hv/requests.h"

namespace aerolink {

namespace {

constexpr const char* GLOBAL_HOST = "appapi.cp.dyson.com";
constexpr const char* CHINA_HOST = "appapi.cp.dyson.cn";
constexpr const char* USER_AGENT = "android client";
constexpr const char* CULTURE = "en-US";

constexpr auto DEFAULT_RATE_LIMIT = std::chrono::seconds(60);

std::string json_string_or_empty(const json& j, const char* key) {
    auto it = j.find(key);
    if (it != j.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return "";
}

std::chrono::seconds retry_after_of(const HttpResponsePtr& resp) {
    std::string value = resp->GetHeader("Retry-After");
    if (!value.empty()) {
        char* endptr = nullptr;
        long secs = strtol(value.c_str(), &endptr, 10);
        if (*endptr == '\0' && secs > 0) {
            return std::chrono::seconds(secs);
        }
    }
    return DEFAULT_RATE_LIMIT;
}

/// Common failure classification; returns no error for 2xx
AeroError classify_response(const HttpResponsePtr& resp, const std::string& what) {
    if (!resp) {
        return AeroError::make(AeroErrorType::NetworkError, what + ": no response");
    }
    int status = resp->status_code;
    if (status >= 200 && status < 300) {
        return {};
    }

    AeroError err;
    if (status == 429) {
        err = AeroError::rate_limited(retry_after_of(resp), what);
    } else if (status == 401 || status == 403) {
        err = AeroError::make(AeroErrorType::InvalidAuth, what + ": unauthorized");
    } else {
        err = AeroError::make(AeroErrorType::NetworkError,
                              what + ": HTTP " + std::to_string(status));
    }
    err.code = status;
    return err;
}

HttpResponsePtr send_json(http_method method, const std::string& url, const json* body,
                          const std::string& bearer, int timeout_sec) {
    auto req = std::make_shared<HttpRequest>();
    req->method = method;
    req->url = url;
    req->timeout = timeout_sec;
    req->headers["User-Agent"] = USER_AGENT;
    req->headers["Accept"] = "application/json";
    if (body) {
        req->headers["Content-Type"] = "application/json";
        req->body = body->dump();
    }
    if (!bearer.empty()) {
        req->headers["Authorization"] = "Bearer " + bearer;
    }

    spdlog::trace("[HttpCloudApi] {} {}", method == HTTP_GET ? "GET" : "POST", url);
    return requests::request(req);
}

} // namespace

HttpCloudApi::HttpCloudApi(CloudApiSettings settings) : settings_(std::move(settings)) {}

std::string HttpCloudApi::host_for_region(const std::string& region) {
    return region == "CN" ? CHINA_HOST : GLOBAL_HOST;
}

std::string HttpCloudApi::base_url(const std::string& region) const {
    if (!settings_.base_url_override.empty()) {
        return settings_.base_url_override;
    }
    return std::string("https://") + host_for_region(region);
}

AeroError HttpCloudApi::request_otp(OtpChallenge& challenge) {
    const std::string base = base_url(challenge.region);
    const std::string country = "?country=" + challenge.region;

    if (challenge.kind == IdentifierKind::Email) {
        // Unknown accounts are only distinguishable through the status endpoint
        json status_body = {{"email", challenge.identifier}};
        auto resp = send_json(HTTP_POST, base + "/v3/userregistration/email/userstatus" + country,
                              &status_body, "", settings_.timeout_sec);
        if (auto err = classify_response(resp, "userstatus")) {
            return err;
        }
        json status = json::parse(resp->body, nullptr, false);
        if (status.is_discarded() || json_string_or_empty(status, "accountStatus") != "ACTIVE") {
            return AeroError::make(AeroErrorType::IdentifierNotRegistered,
                                   "Account is not registered", challenge.identifier);
        }
    }

    std::string path = challenge.kind == IdentifierKind::Email
                           ? "/v3/userregistration/email/auth"
                           : "/v3/userregistration/mobile/auth";
    json body = challenge.kind == IdentifierKind::Email
                    ? json{{"email", challenge.identifier}}
                    : json{{"mobile", challenge.identifier}};
    auto resp = send_json(HTTP_POST, base + path + country + "&culture=" + CULTURE, &body, "",
                          settings_.timeout_sec);

    if (resp && (resp->status_code == 400 || resp->status_code == 404) &&
        challenge.kind == IdentifierKind::Mobile) {
        return AeroError::make(AeroErrorType::IdentifierNotRegistered,
                               "Mobile number is not registered", challenge.identifier);
    }
    if (auto err = classify_response(resp, "otp request")) {
        err.context = challenge.identifier;
        return err;
    }

    json reply = json::parse(resp->body, nullptr, false);
    challenge.challenge_id = reply.is_discarded() ? "" : json_string_or_empty(reply, "challengeId");
    if (challenge.challenge_id.empty()) {
        return AeroError::malformed_payload("otp reply without challengeId");
    }
    spdlog::info("[HttpCloudApi] Verification code requested for {}", challenge.identifier);
    return {};
}

AeroError HttpCloudApi::verify_otp(const OtpChallenge& challenge, const std::string& code,
                                   const std::string& password, CloudSession& session_out) {
    json body = {{"challengeId", challenge.challenge_id}, {"otpCode", code}};
    std::string path;
    if (challenge.kind == IdentifierKind::Email) {
        body["email"] = challenge.identifier;
        body["password"] = password;
        path = "/v3/userregistration/email/verify";
    } else {
        body["mobile"] = challenge.identifier;
        path = "/v3/userregistration/mobile/verify";
    }

    auto resp = send_json(HTTP_POST, base_url(challenge.region) + path, &body, "",
                          settings_.timeout_sec);
    if (resp && resp->status_code == 400) {
        return AeroError::make(AeroErrorType::InvalidOtp, "Verification code rejected",
                               challenge.identifier);
    }
    if (auto err = classify_response(resp, "otp verify")) {
        err.context = challenge.identifier;
        return err;
    }

    json reply = json::parse(resp->body, nullptr, false);
    std::string token = reply.is_discarded() ? "" : json_string_or_empty(reply, "token");
    if (token.empty()) {
        return AeroError::malformed_payload("verify reply without token");
    }

    session_out = CloudSession{};
    session_out.access_token = token;
    session_out.account = json_string_or_empty(reply, "account");
    session_out.region = challenge.region;
    session_out.expires_at = WallClock::now() + settings_.token_lifetime;
    spdlog::info("[HttpCloudApi] Signed in as {}", challenge.identifier);
    return {};
}

AeroError HttpCloudApi::list_devices(const CloudSession& session,
                                     std::vector<DeviceCloudInfo>& devices_out) {
    auto resp = send_json(HTTP_GET, base_url(session.region) + "/v3/manifest", nullptr,
                          session.access_token, settings_.timeout_sec);
    if (auto err = classify_response(resp, "manifest")) {
        return err;
    }
    return parse_manifest(resp->body, devices_out);
}

AeroError HttpCloudApi::refresh_token(const CloudSession& session, CloudSession& session_out) {
    auto resp = send_json(HTTP_GET, base_url(session.region) + "/v3/manifest", nullptr,
                          session.access_token, settings_.timeout_sec);
    AeroError err = classify_response(resp, "token refresh");
    if (err.type == AeroErrorType::InvalidAuth) {
        AeroError reauth = AeroError::reauth_required(session.account);
        reauth.code = err.code;
        return reauth;
    }
    if (err) {
        return err;
    }

    session_out = session;
    session_out.expires_at = WallClock::now() + settings_.token_lifetime;
    spdlog::debug("[HttpCloudApi] Session for {} renewed", session.account);
    return {};
}

AeroError HttpCloudApi::parse_manifest(const std::string& body,
                                       std::vector<DeviceCloudInfo>& devices_out) {
    json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_array()) {
        return AeroError::malformed_payload("manifest is not a JSON array");
    }

    devices_out.clear();
    for (const auto& entry : doc) {
        if (!entry.is_object()) {
            continue;
        }
        DeviceCloudInfo info;
        info.serial = json_string_or_empty(entry, "serialNumber");
        if (info.serial.empty()) {
            spdlog::debug("[HttpCloudApi] Skipping manifest entry without serial");
            continue;
        }
        info.name = json_string_or_empty(entry, "name");
        info.product_type = json_string_or_empty(entry, "type");
        info.variant = json_string_or_empty(entry, "variant");

        auto cfg = entry.find("connectedConfiguration");
        if (cfg != entry.end() && cfg->is_object()) {
            auto firmware = cfg->find("firmware");
            if (firmware != cfg->end() && firmware->is_object()) {
                info.firmware_version = json_string_or_empty(*firmware, "version");
            }
            auto mqtt = cfg->find("mqtt");
            if (mqtt != cfg->end() && mqtt->is_object()) {
                info.credential = json_string_or_empty(*mqtt, "localBrokerCredentials");
                info.mqtt_root_topic = json_string_or_empty(*mqtt, "mqttRootTopicLevel");
                std::string host = json_string_or_empty(*mqtt, "localBrokerHost");
                if (!host.empty()) {
                    info.address_hint = parse_device_address(host);
                }
            }
        }
        devices_out.push_back(std::move(info));
    }

    spdlog::debug("[HttpCloudApi] Manifest lists {} devices", devices_out.size());
    return {};
}

} // namespace aerolink
