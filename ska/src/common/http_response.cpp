/*
 * Part of the SharedKey Auth (SKA) project.
 *
 * SPDX-FileCopyrightText: 2025 SKA contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SharedKey Auth (SKA). See LICENSE for details.
 */

#include "ska/http_response.hpp"

namespace ska {

HttpResponse make_response(int status_code, const std::string& status_text,
                           const std::string& body)
{
    HttpResponse r;
    r.status_code = status_code;
    r.status_text = status_text;
    r.headers.emplace_back("Content-Type", "application/json");
    r.body = body;
    return r;
}

} // namespace ska
