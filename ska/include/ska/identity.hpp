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
#include <utility>
#include <vector>

namespace ska {

// Claim names set by the validator.
constexpr const char* kClaimName        = "name";
constexpr const char* kClaimAuthMethod  = "authmethod";
constexpr const char* kClaimAuthInstant = "auth_instant";

// Authenticated caller. Lives in one RequestContext and dies with it.
struct Identity {
    std::string account;
    std::vector<std::pair<std::string, std::string>> claims; // repeats allowed
};

void add_claim(Identity& id, const std::string& name, const std::string& value);

// Every value of `name`, in insertion order.
std::vector<std::string> claim_values(const Identity& id, const std::string& name);

bool has_claim(const Identity& id, const std::string& name, const std::string& value);

} // namespace ska
