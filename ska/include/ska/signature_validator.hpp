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
#include <optional>
#include <string>

#include "ska/http_request.hpp"
#include "ska/identity.hpp"
#include "ska/wire.hpp"

namespace ska {

enum class ValidationError {
    None,
    MalformedCredential,
    UnknownAccount,
    SignatureMismatch,
    Expired,
    MissingRequiredField
};

const char* to_string(ValidationError e);

// Maps an account name to its secret bytes. Absence is std::nullopt, not an
// exception. Called concurrently; must be reentrant. May block.
using SecretResolver = std::function<std::optional<std::string>(const std::string& account)>;

using Clock = std::function<std::chrono::system_clock::time_point()>;

struct ValidatorOptions {
    std::chrono::seconds max_age{300};
    std::chrono::seconds clock_skew{30};   // tolerated future offset
    std::string scheme           = kDefaultScheme;
    std::string timestamp_header = kDefaultTimestampHeader;
    Clock now;                             // empty: system_clock::now
};

struct ValidationResult {
    bool ok = false;
    ValidationError error = ValidationError::None;
    std::string reason;   // short diagnostic; never secret material
    std::string field;    // header name for MissingRequiredField
    Identity identity;    // set when ok
};

// Verifies SharedKey v1 signatures. Immutable after construction; one
// instance can serve any number of threads.
class SignatureValidator {
public:
    // Throws std::invalid_argument on negative max_age/clock_skew or an
    // empty scheme/timestamp header, std::runtime_error if the RNG fails.
    explicit SignatureValidator(ValidatorOptions opt = {});

    // Throws std::invalid_argument if `resolve` is empty. Exceptions thrown
    // by `resolve` propagate.
    ValidationResult validate(const HttpRequest& R, const SecretResolver& resolve) const;

    const ValidatorOptions& options() const { return _opt; }

private:
    ValidatorOptions _opt;
    std::string _decoy_key; // stands in for unknown accounts
};

// One-shot form with default options apart from max_age.
ValidationResult validate(const HttpRequest& R,
                          const SecretResolver& resolve,
                          std::chrono::seconds max_age);

} // namespace ska
