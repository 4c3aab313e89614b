/*
 * Part of the SharedKey Auth (SKA) project.
 *
 * SPDX-FileCopyrightText: 2025 SKA contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SharedKey Auth (SKA). See LICENSE for details.
 */

#include "ska/shared_key_stage.hpp"
#include "ska/log.hpp"

#include <utility>

namespace ska {

namespace {

ValidatorOptions validator_options(const SharedKeyStageConfig& cfg) {
    ValidatorOptions opt;
    opt.max_age          = cfg.max_age;
    opt.clock_skew       = cfg.clock_skew;
    opt.scheme           = cfg.scheme;
    opt.timestamp_header = cfg.timestamp_header;
    opt.now              = cfg.now;
    return opt;
}

std::string error_body(bool redact, const std::string& reason) {
    if (redact) return R"({"status":"ERROR"})";
    return std::string(R"({"status":"ERROR","reason":")") + reason + R"("})";
}

HttpResponse unauthorized(const std::string& scheme, const std::string& reason) {
    HttpResponse r = make_response(401, "Unauthorized", error_body(false, reason));
    r.headers.emplace_back("WWW-Authenticate", scheme);
    return r;
}

HttpResponse internal_error() {
    return make_response(500, "Internal Server Error", error_body(false, "INTERNAL_ERROR"));
}

HttpResponse abandoned() {
    return make_response(499, "Client Closed Request", error_body(false, "CANCELLED"));
}

} // namespace

SharedKeyStage::SharedKeyStage(SharedKeyStageConfig cfg)
    : _cfg(std::move(cfg)),
      _validator(validator_options(_cfg))
{
    if (!_cfg.resolver) {
        throw std::invalid_argument("SharedKeyStage: secret resolver is required");
    }
    if (_cfg.expired_status != 401 && _cfg.expired_status != 403) {
        throw std::invalid_argument("SharedKeyStage: expired_status must be 401 or 403");
    }
}

HttpResponse SharedKeyStage::rejection(const ValidationResult& vr) const {
    switch (vr.error) {
        case ValidationError::Expired:
            if (_cfg.expired_status == 401) {
                HttpResponse r = make_response(401, "Unauthorized",
                                               error_body(_cfg.redact_errors, "request expired"));
                r.headers.emplace_back("WWW-Authenticate", _cfg.scheme);
                return r;
            }
            return make_response(403, "Forbidden",
                                 error_body(_cfg.redact_errors, "request expired"));
        case ValidationError::MissingRequiredField:
            return make_response(412, "Precondition Failed",
                                 error_body(_cfg.redact_errors,
                                            "missing required field: " + vr.field));
        case ValidationError::MalformedCredential:
        case ValidationError::UnknownAccount:
        case ValidationError::SignatureMismatch:
        case ValidationError::None:
            break;
    }
    // Same bytes for every credential failure: no account enumeration.
    return unauthorized(_cfg.scheme, "UNAUTHORIZED");
}

HttpResponse SharedKeyStage::handle(const HttpRequest& request,
                                    RequestContext& ctx,
                                    const Handler& next) const
{
    if (!next) {
        throw std::invalid_argument("SharedKeyStage: next handler is empty");
    }

    ValidationResult vr;
    try {
        vr = _validator.validate(request, _cfg.resolver);
    } catch (const std::exception& e) {
        log_line(std::string("[AUTH][500] secret resolver failed: ") + e.what());
        return internal_error();
    }

    if (ctx.cancel.cancelled()) {
        log_line("[AUTH] request cancelled during validation");
        return abandoned();
    }

    if (!vr.ok) {
        const HttpResponse r = rejection(vr);
        std::string logged = vr.reason;
        if (vr.error == ValidationError::UnknownAccount && !_cfg.log_unknown_account) {
            logged = "BAD_SIGNATURE";
        }
        std::string line = "[AUTH][" + std::to_string(r.status_code) + "] reason=" + logged;
        if (!vr.field.empty()) line += " field=" + vr.field;
        line += " target=" + request.path;
        log_line(line);
        return r;
    }

    Identity identity = std::move(vr.identity);
    if (_cfg.transformer) {
        try {
            identity = _cfg.transformer(request_target(request), identity);
        } catch (const TransformError& e) {
            log_line(std::string("[AUTH][500] identity transform failed: ") + e.what());
            return internal_error();
        } catch (const std::exception& e) {
            log_line(std::string("[AUTH][500] identity transformer threw: ") + e.what());
            return internal_error();
        }
        if (ctx.cancel.cancelled()) {
            log_line("[AUTH] request cancelled during identity transform");
            return abandoned();
        }
    }

    ctx.identity = std::move(identity);
    return next(request, ctx);
}

} // namespace ska
