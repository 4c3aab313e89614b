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

namespace ska {

// Thread-safe logging (stdout + optional append-mode file).
// An empty path closes the file sink.
void set_log_file(const std::string& path);
void set_log_stdout(bool enabled);
void log_line(const std::string& line);

} // namespace ska
