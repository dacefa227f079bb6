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
#include <span>
#include <vector>
#include <cstdint>
#include "../global.h"

// Role prefix bytes; the top five bits select the leading base32 letter
enum class KeyRole : uint8_t {
    Account = 0 << 3,   // 'A'
    Module = 12 << 3,   // 'M'
    Server = 13 << 3,   // 'N'
    Operator = 14 << 3, // 'O'
    User = 20 << 3      // 'U'
};

static constexpr uint8_t PREFIX_BYTE_SEED = 18 << 3; // 'S'

struct DecodedSeed {
    KeyRole role;
    std::vector<uint8_t> seed;
};

// Function declarations
uint16_t crc16_xmodem(std::span<const uint8_t> data);
std::string base32_encode(std::span<const uint8_t> data);
std::vector<uint8_t> base32_decode(std::string_view text);

std::string encode_public_key(KeyRole role, std::span<const uint8_t> raw_key);
std::vector<uint8_t> decode_public_key(std::string_view text, KeyRole* role_out = nullptr);
std::string encode_seed(KeyRole role, std::span<const uint8_t> raw_seed);
DecodedSeed decode_seed(std::string_view text);
bool is_valid_role(uint8_t prefix);
