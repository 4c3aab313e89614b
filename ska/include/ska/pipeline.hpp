/*
 * Part of the SharedKey Auth (SKA) project.
 *
 * SPDX-FileCopyrightText: 2025 SKA contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SharedKey Auth (SKA). See LICENSE for details.
 */

#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "ska/http_request.hpp"
#include "ska/http_response.hpp"
#include "ska/identity.hpp"

namespace ska {

// Shared flag the host flips when the client goes away or a deadline
// passes. Copies observe the same flag.
class CancellationToken {
public:
    CancellationToken() : _flag(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { _flag->store(true, std::memory_order_relaxed); }
    bool cancelled() const { return _flag->load(std::memory_order_relaxed); }

private:
    std::shared_ptr<std::atomic<bool>> _flag;
};

// Per-request state threaded through the pipeline. One instance per
// request; never shared between requests.
struct RequestContext {
    std::optional<Identity> identity;
    CancellationToken cancel;
};

using Handler = std::function<HttpResponse(const HttpRequest&, RequestContext&)>;

// One step of request processing.
class Stage {
public:
    virtual ~Stage() = default;

    // Either returns a response itself or returns next(request, ctx).
    virtual HttpResponse handle(const HttpRequest& request,
                                RequestContext& ctx,
                                const Handler& next) const = 0;
};

// Ordered list of stages built once at startup, then run concurrently.
class Pipeline {
public:
    // Throws std::invalid_argument on a null stage.
    Pipeline& add(std::shared_ptr<const Stage> stage);

    // Runs the stages in insertion order, ending at `terminal`.
    // Throws std::invalid_argument if `terminal` is empty.
    HttpResponse run(const HttpRequest& request, RequestContext& ctx,
                     const Handler& terminal) const;

    std::size_t size() const { return _stages.size(); }

private:
    std::vector<std::shared_ptr<const Stage>> _stages;

    HttpResponse run_from(std::size_t i, const HttpRequest& request,
                          RequestContext& ctx, const Handler& terminal) const;
};

} // namespace ska
