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

namespace ska {

struct HttpResponse {
    int status_code = 0;
    std::string status_text;   // reason phrase
    HeaderList headers;        // Content-Length/Connection are added on write
    std::string body;
};

// Build a response with a JSON body ("Content-Type: application/json").
HttpResponse make_response(int status_code, const std::string& status_text,
                           const std::string& body);

} // namespace ska
