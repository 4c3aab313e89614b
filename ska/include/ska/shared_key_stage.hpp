/*
 * Part of the SharedKey Auth (SKA) project.
 *
 * SPDX-FileCopyrightText: 2025 SKA contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SharedKey Auth (SKA). See LICENSE for details.
 */

#pragma once
#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>

#include "ska/pipeline.hpp"
#include "ska/signature_validator.hpp"

namespace ska {

// Thrown by an IdentityTransformer that cannot produce an identity. The
// stage answers 500, not an authentication rejection.
class TransformError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// (resource, validated identity) -> final identity. Called concurrently.
using IdentityTransformer = std::function<Identity(const std::string& resource, const Identity&)>;

struct SharedKeyStageConfig {
    SecretResolver resolver;                     // required
    std::chrono::seconds max_age{300};
    std::chrono::seconds clock_skew{30};
    std::string scheme           = kDefaultScheme;
    std::string timestamp_header = kDefaultTimestampHeader;
    IdentityTransformer transformer;             // optional
    int  expired_status      = 403;              // 403 or 401
    bool log_unknown_account = false;            // logs only, never responses
    bool redact_errors       = false;            // drop reasons from 403/412 bodies
    Clock now;                                   // empty: system_clock::now
};

// Pipeline stage that authenticates SharedKey-signed requests and attaches
// the caller's Identity to the RequestContext.
//
// Status mapping:
//   MalformedCredential, UnknownAccount, SignatureMismatch -> 401 (generic)
//   Expired                                                -> expired_status
//   MissingRequiredField                                   -> 412
//   transformer / resolver failure                         -> 500
//   cancelled while processing                             -> 499
class SharedKeyStage final : public Stage {
public:
    // Throws std::invalid_argument on an empty resolver, a negative
    // max_age, or an expired_status other than 401/403.
    explicit SharedKeyStage(SharedKeyStageConfig cfg);

    HttpResponse handle(const HttpRequest& request,
                        RequestContext& ctx,
                        const Handler& next) const override;

    // Response sent for a given validation failure.
    HttpResponse rejection(const ValidationResult& vr) const;

private:
    SharedKeyStageConfig _cfg;
    SignatureValidator _validator;
};

} // namespace ska
