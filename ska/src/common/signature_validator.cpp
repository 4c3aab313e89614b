/*
 * Part of the SharedKey Auth (SKA) project.
 *
 * SPDX-FileCopyrightText: 2025 SKA contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SharedKey Auth (SKA). See LICENSE for details.
 */

#include "ska/signature_validator.hpp"
#include "ska/internal/canonical.hpp"
#include "ska/internal/credential.hpp"
#include "ska/internal/hmac.hpp"
#include "ska/internal/http_parser.hpp"
#include "ska/internal/time.hpp"
#include "ska/internal/utils.hpp"

#include <stdexcept>
#include <utility>

namespace ska {

const char* to_string(ValidationError e) {
    switch (e) {
        case ValidationError::None:                 return "None";
        case ValidationError::MalformedCredential:  return "MalformedCredential";
        case ValidationError::UnknownAccount:       return "UnknownAccount";
        case ValidationError::SignatureMismatch:    return "SignatureMismatch";
        case ValidationError::Expired:              return "Expired";
        case ValidationError::MissingRequiredField: return "MissingRequiredField";
    }
    return "Unknown";
}

namespace {

ValidationResult fail(ValidationError e, const char* reason, const std::string& field = {}) {
    ValidationResult vr;
    vr.error  = e;
    vr.reason = reason;
    vr.field  = field;
    return vr;
}

} // namespace

SignatureValidator::SignatureValidator(ValidatorOptions opt)
    : _opt(std::move(opt))
{
    if (_opt.max_age.count() < 0) {
        throw std::invalid_argument("SignatureValidator: max_age must not be negative");
    }
    if (_opt.clock_skew.count() < 0) {
        throw std::invalid_argument("SignatureValidator: clock_skew must not be negative");
    }
    if (_opt.scheme.empty() || _opt.scheme.find(' ') != std::string::npos) {
        throw std::invalid_argument("SignatureValidator: scheme must be a single non-empty token");
    }
    if (_opt.timestamp_header.empty()) {
        throw std::invalid_argument("SignatureValidator: timestamp_header must not be empty");
    }
    _decoy_key = internal::random_bytes(internal::kMacSize);
    if (_decoy_key.size() != internal::kMacSize) {
        throw std::runtime_error("SignatureValidator: RAND_bytes failed");
    }
}

ValidationResult SignatureValidator::validate(const HttpRequest& R,
                                              const SecretResolver& resolve) const
{
    if (!resolve) {
        throw std::invalid_argument("SignatureValidator: secret resolver is empty");
    }

    // 0. every authenticated header appears at most once
    for (const std::string& name : {std::string(kAuthorizationHeader), _opt.timestamp_header,
                                    std::string(kContentTypeHeader),
                                    std::string(kContentHashHeader)}) {
        if (internal::hdr_ci_all(R.headers, name).size() > 1) {
            return fail(ValidationError::MalformedCredential, "DUPLICATE_HEADER", name);
        }
    }

    // 1. credential
    const std::string* auth_h = find_header(R, kAuthorizationHeader);
    if (!auth_h) {
        return fail(ValidationError::MissingRequiredField, "MISSING_FIELD", kAuthorizationHeader);
    }
    internal::Credential cred;
    std::string why;
    if (!internal::parse_authorization(*auth_h, _opt.scheme, cred, why)) {
        return fail(ValidationError::MalformedCredential, "MALFORMED_CREDENTIAL");
    }

    // 2. timestamp
    const std::string* ts_h = find_header(R, _opt.timestamp_header);
    if (!ts_h) {
        internal::secure_wipe(cred.signature);
        return fail(ValidationError::MissingRequiredField, "MISSING_FIELD", _opt.timestamp_header);
    }
    std::string ts_s = *ts_h;
    internal::trim_inplace(ts_s);
    std::chrono::system_clock::time_point ts;
    if (!internal::parse_http_date(ts_s, ts)) {
        internal::secure_wipe(cred.signature);
        return fail(ValidationError::MissingRequiredField, "BAD_TIMESTAMP", _opt.timestamp_header);
    }

    // 3. freshness (bounds the replay window)
    const auto now = _opt.now ? _opt.now() : std::chrono::system_clock::now();
    const auto age = now - ts;
    if (age < -_opt.clock_skew) {
        internal::secure_wipe(cred.signature);
        return fail(ValidationError::Expired, "TIMESTAMP_IN_FUTURE");
    }
    if (age > _opt.max_age) {
        internal::secure_wipe(cred.signature);
        return fail(ValidationError::Expired, "EXPIRED");
    }

    // 4. secret lookup. Unknown accounts continue with the decoy key so the
    //    work done below does not depend on whether the account exists.
    std::optional<std::string> secret = resolve(cred.account);
    const bool known = secret.has_value() && !secret->empty();
    std::string key = known ? *secret : _decoy_key;
    if (secret) internal::secure_wipe(*secret);

    // 5. canonical string
    const internal::CanonicalResult canon = internal::build_string_to_sign(R, _opt.timestamp_header);
    if (canon.error != internal::CanonError::None) {
        internal::secure_wipe(key);
        internal::secure_wipe(cred.signature);
        if (canon.error == internal::CanonError::MissingField) {
            return fail(ValidationError::MissingRequiredField, "MISSING_FIELD", canon.field);
        }
        return fail(ValidationError::MalformedCredential, "MALFORMED_FIELD", canon.field);
    }

    // 6. MAC + body digest, both compared in constant time
    std::string expected;
    const bool mac_done = internal::hmac_sha256_bin(key, canon.value, expected);
    internal::secure_wipe(key);
    const bool mac_ok = mac_done && internal::ct_equal(expected, cred.signature);
    internal::secure_wipe(expected);
    internal::secure_wipe(cred.signature);

    bool body_ok = true;
    if (const std::string* chash = find_header(R, kContentHashHeader)) {
        std::string claimed = internal::lower_copy(*chash);
        internal::trim_inplace(claimed);
        body_ok = internal::ct_equal(internal::sha256_hex(R.body), claimed);
    }

    if (!known) {
        return fail(ValidationError::UnknownAccount, "UNKNOWN_ACCOUNT");
    }
    if (!mac_ok) {
        return fail(ValidationError::SignatureMismatch, "BAD_SIGNATURE");
    }
    if (!body_ok) {
        return fail(ValidationError::SignatureMismatch, "BAD_BODY_HASH");
    }

    // 7. identity
    ValidationResult vr;
    vr.ok = true;
    vr.identity.account = cred.account;
    add_claim(vr.identity, kClaimName, cred.account);
    add_claim(vr.identity, kClaimAuthMethod, _opt.scheme);
    add_claim(vr.identity, kClaimAuthInstant, ts_s);
    return vr;
}

ValidationResult validate(const HttpRequest& R,
                          const SecretResolver& resolve,
                          std::chrono::seconds max_age)
{
    ValidatorOptions opt;
    opt.max_age = max_age;
    return SignatureValidator(std::move(opt)).validate(R, resolve);
}

} // namespace ska
