/*
 * Part of the SharedKey Auth (SKA) project.
 *
 * SPDX-FileCopyrightText: 2025 SKA contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SharedKey Auth (SKA). See LICENSE for details.
 */

#include "ska/pipeline.hpp"
#include <stdexcept>
#include <utility>

namespace ska {

Pipeline& Pipeline::add(std::shared_ptr<const Stage> stage) {
    if (!stage) {
        throw std::invalid_argument("Pipeline: stage must not be null");
    }
    _stages.push_back(std::move(stage));
    return *this;
}

HttpResponse Pipeline::run(const HttpRequest& request, RequestContext& ctx,
                           const Handler& terminal) const
{
    if (!terminal) {
        throw std::invalid_argument("Pipeline: terminal handler is empty");
    }
    return run_from(0, request, ctx, terminal);
}

HttpResponse Pipeline::run_from(std::size_t i, const HttpRequest& request,
                                RequestContext& ctx, const Handler& terminal) const
{
    if (i == _stages.size()) {
        return terminal(request, ctx);
    }
    const Handler next = [this, i, &terminal](const HttpRequest& r, RequestContext& c) {
        return run_from(i + 1, r, c, terminal);
    };
    return _stages[i]->handle(request, ctx, next);
}

} // namespace ska
