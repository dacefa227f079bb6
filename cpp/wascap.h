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
#include <span>
#include <string>
#include <vector>
#include <cstdint>
#include "global.h"
#include "crypto/ed25519.h"
#include "crypto/content-hash.h"
#include "jwt/claims.h"
#include "jwt/token.h"
#include "time/clock.h"
#include "wasm/module.h"

// Function declarations
std::string compute_hash_without_jwt(const WasmModule& module);
std::optional<Token> extract_claims(std::span<const uint8_t> contents);
std::vector<uint8_t> embed_claims(std::span<const uint8_t> orig_bytecode,
                                  const Claims& claims,
                                  const KeyPair& kp,
                                  const Clock& clock = system_clock());
std::vector<uint8_t> sign_buffer_with_claims(std::span<const uint8_t> buf,
                                             const KeyPair& mod_kp,
                                             const KeyPair& acct_kp,
                                             std::optional<uint64_t> expires_in_days,
                                             std::optional<uint64_t> not_before_days,
                                             std::vector<std::string> caps,
                                             std::vector<std::string> tags,
                                             const Clock& clock = system_clock());
