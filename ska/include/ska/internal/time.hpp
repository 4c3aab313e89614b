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
#include <string>

namespace ska::internal {

// IMF-fixdate, e.g. "Sun, 06 Nov 1994 08:49:37 GMT" (RFC 7231 7.1.1.1).
std::string format_http_date(std::chrono::system_clock::time_point tp);

// Strict IMF-fixdate parser. Rejects obsolete RFC 850 / asctime forms,
// out-of-range fields and a weekday that does not match the date.
bool parse_http_date(const std::string& s, std::chrono::system_clock::time_point& out);

} // namespace ska::internal
