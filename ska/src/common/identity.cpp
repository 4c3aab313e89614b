/*
 * Part of the SharedKey Auth (SKA) project.
 *
 * SPDX-FileCopyrightText: 2025 SKA contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SharedKey Auth (SKA). See LICENSE for details.
 */

#include "ska/identity.hpp"

namespace ska {

void add_claim(Identity& id, const std::string& name, const std::string& value) {
    id.claims.emplace_back(name, value);
}

std::vector<std::string> claim_values(const Identity& id, const std::string& name) {
    std::vector<std::string> out;
    for (const auto& c : id.claims) {
        if (c.first == name) out.push_back(c.second);
    }
    return out;
}

bool has_claim(const Identity& id, const std::string& name, const std::string& value) {
    for (const auto& c : id.claims) {
        if (c.first == name && c.second == value) return true;
    }
    return false;
}

} // namespace ska
