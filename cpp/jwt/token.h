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
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include "../global.h"
#include "../crypto/ed25519.h"
#include "../time/clock.h"
#include "claims.h"

static constexpr std::string_view JWT_HEADER_TYPE = "jwt";
static constexpr std::string_view JWT_HEADER_ALGORITHM = "Ed25519";

// Raw JWT text paired with its decoded, verified claims
struct Token {
    std::string jwt;
    Claims claims;
};

struct TokenValidation {
    bool expired = false;
    std::string expires_human;
    std::string not_before_human;
    bool cannot_use_yet = false;
    bool signature_valid = false;
};

// Function declarations
std::string encode_claims(const Claims& claims, const KeyPair& kp, const Clock& clock = system_clock());
Claims decode_claims(std::string_view jwt);
TokenValidation validate_token(std::string_view jwt, const Clock& clock = system_clock());
