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
#include <vector>
#include <string>
#include <string_view>
#include <span>
#include <stdexcept>
#include <cstdint>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/err.h>
#include "../global.h"
#include "nkeys.h"

static constexpr size_t ED25519_SEED_SIZE = 32;
static constexpr size_t ED25519_PUBLIC_KEY_SIZE = 32;
static constexpr size_t ED25519_SIGNATURE_SIZE = 64;

/**
 * Ed25519 signing identity. Holds the 32-byte seed (absent for verify-only
 * pairs built from a public key) and the derived public key. Immutable after
 * construction; sign() and verify() build their own OpenSSL contexts per call.
 */
class KeyPair {
public:
    ~KeyPair();
    KeyPair(const KeyPair&) = default;
    KeyPair& operator=(const KeyPair&) = default;

    static KeyPair new_account();
    static KeyPair new_module();
    static KeyPair generate(KeyRole role);
    static KeyPair from_raw_seed(const std::vector<uint8_t>& seed, KeyRole role);
    static KeyPair from_seed(std::string_view encoded_seed);
    static KeyPair from_public_key(std::string_view encoded_public_key);

    std::string public_key() const;
    std::string seed() const;
    KeyRole role() const { return role_; }
    bool can_sign() const { return !seed_.empty(); }
    const std::vector<uint8_t>& raw_public_key() const { return public_key_; }

    std::vector<uint8_t> sign(std::span<const uint8_t> message) const;
    bool verify(std::span<const uint8_t> message, std::span<const uint8_t> signature) const;

private:
    KeyPair(std::vector<uint8_t> seed, std::vector<uint8_t> public_key, KeyRole role)
        : seed_(std::move(seed)), public_key_(std::move(public_key)), role_(role) {}

    std::vector<uint8_t> seed_;
    std::vector<uint8_t> public_key_;
    KeyRole role_;
};

// Function declarations
std::vector<uint8_t> generate_signing_key();
std::vector<uint8_t> get_verify_key(const std::vector<uint8_t>& signing_key);
bool verify_signature_fast(std::span<const uint8_t> message, std::span<const uint8_t> signature, std::span<const uint8_t> verify_key_bytes);
