/*
 * Part of the SharedKey Auth (SKA) project.
 *
 * SPDX-FileCopyrightText: 2025 SKA contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SharedKey Auth (SKA). See LICENSE for details.
 */

#pragma once
#include <string>
#include "ska/http_request.hpp"
#include "ska/http_response.hpp"
#include "ska/pipeline.hpp"
#include "ska/server_config.hpp"

namespace ska::internal {

// Routes one parsed request: /health directly, everything else through
// the pipeline to the application routes.
ska::HttpResponse route_request(const ska::ServerConfig& cfg,
                                const ska::Pipeline& pipeline,
                                const ska::HttpRequest& R);

// Application routes behind authentication.
ska::HttpResponse app_routes(const ska::HttpRequest& R, ska::RequestContext& ctx);

// Serialise status line, headers and body.
std::string serialize_response(const ska::ServerConfig& cfg,
                               const ska::HttpResponse& resp,
                               bool keep_alive);

// Handles a single plain HTTP connection (keep-alive is managed inside).
// The caller owns fd and closes it afterwards.
void handle_connection_plain(int fd,
                             const ska::ServerConfig& cfg,
                             const std::string& peer_ip,
                             const ska::Pipeline& pipeline);

} // namespace ska::internal
