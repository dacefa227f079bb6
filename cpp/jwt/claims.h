/*

Wascap-CPP - WebAssembly capability claims, signed and embedded in C++
Copyright (c) 2025 Albert Blasczykowski (Aless Microsystems)

This program is licensed under the Aless Microsystems Source-Available License (Non-Commercial, No Military) v1.0 Available in the Root
Directory of the project as LICENSE in Text Format.
You may use, copy, modify, and distribute this program for Non-Commercial purposes only, subject to the terms of that license.
Use by or for military, intelligence, or defense entities or purposes is strictly prohibited.

If you distribute this program in object form or make it available to others over a network, you must provide the complete
corresponding source code for the provided functionality under this same license.

This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty
of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the License for details.

You should have received a copy of the License along with this program; if not, see the LICENSE file included with this source.

*/

#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include <boost/json.hpp>
#include "../global.h"
#include "../time/clock.h"

namespace json = boost::json;

/**
 * Signed manifest embedded in a module.
 *
 * JSON layout (field names on the wire):
 *   exp, jti, iat, iss, sub, nbf at top level and
 *   wascap: { hash, tags, caps } for the module-specific metadata.
 * Optional fields are omitted when unset.
 */
struct Claims {
    std::optional<uint64_t> expires;
    std::string id;
    uint64_t issued_at = 0;
    std::string issuer;
    std::string subject;
    std::optional<uint64_t> not_before;
    std::optional<std::vector<std::string>> tags;
    std::optional<std::vector<std::string>> caps;
    std::string module_hash;

    static Claims create(const std::string& issuer,
                         const std::string& subject,
                         std::optional<std::vector<std::string>> caps,
                         std::optional<std::vector<std::string>> tags,
                         const Clock& clock = system_clock());

    static Claims with_dates(const std::string& issuer,
                             const std::string& subject,
                             std::optional<std::vector<std::string>> caps,
                             std::optional<std::vector<std::string>> tags,
                             std::optional<uint64_t> not_before,
                             std::optional<uint64_t> expires,
                             const Clock& clock = system_clock());

    bool operator==(const Claims& other) const = default;
};

// Function declarations
std::string generate_claims_id();
json::object claims_to_json(const Claims& claims);
std::string claims_to_json_string(const Claims& claims);
Claims claims_from_json(std::string_view text);
