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

#include "nkeys.h"

#include <openssl/crypto.h>

static constexpr char base32_alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
static constexpr size_t ED25519_KEY_SIZE = 32;

/**
 * CRC-16/XMODEM (poly 0x1021, init 0) used as the key checksum
 */
uint16_t crc16_xmodem(std::span<const uint8_t> data) {
    uint16_t crc = 0;
    for (uint8_t byte : data) {
        crc ^= static_cast<uint16_t>(byte) << 8;
        for (int bit = 0; bit < 8; bit++) {
            if (crc & 0x8000) {
                crc = static_cast<uint16_t>((crc << 1) ^ 0x1021);
            } else {
                crc = static_cast<uint16_t>(crc << 1);
            }
        }
    }
    return crc;
}

// RFC 4648 base32 without padding
std::string base32_encode(std::span<const uint8_t> data) {
    std::string out;
    out.reserve((data.size() * 8 + 4) / 5);
    uint32_t buffer = 0;
    int bits = 0;
    for (uint8_t byte : data) {
        buffer = (buffer << 8) | byte;
        bits += 8;
        while (bits >= 5) {
            out.push_back(base32_alphabet[(buffer >> (bits - 5)) & 0x1F]);
            bits -= 5;
        }
    }
    if (bits > 0) {
        out.push_back(base32_alphabet[(buffer << (5 - bits)) & 0x1F]);
    }
    return out;
}

std::vector<uint8_t> base32_decode(std::string_view text) {
    std::vector<uint8_t> out;
    out.reserve(text.size() * 5 / 8);
    uint32_t buffer = 0;
    int bits = 0;
    for (char c : text) {
        uint32_t value;
        if (c >= 'A' && c <= 'Z') {
            value = static_cast<uint32_t>(c - 'A');
        } else if (c >= '2' && c <= '7') {
            value = static_cast<uint32_t>(c - '2' + 26);
        } else {
            throw std::runtime_error("Invalid base32 character");
        }
        buffer = (buffer << 5) | value;
        bits += 5;
        if (bits >= 8) {
            out.push_back(static_cast<uint8_t>((buffer >> (bits - 8)) & 0xFF));
            bits -= 8;
        }
    }
    return out;
}

bool is_valid_role(uint8_t prefix) {
    switch (static_cast<KeyRole>(prefix)) {
        case KeyRole::Account:
        case KeyRole::Module:
        case KeyRole::Server:
        case KeyRole::Operator:
        case KeyRole::User:
            return true;
    }
    return false;
}

static void append_crc(std::vector<uint8_t>& raw) {
    uint16_t crc = crc16_xmodem(raw);
    raw.push_back(static_cast<uint8_t>(crc & 0xFF));
    raw.push_back(static_cast<uint8_t>(crc >> 8));
}

// Decodes base32 text and strips a valid trailing little-endian CRC
static std::vector<uint8_t> decode_checked(std::string_view text) {
    std::vector<uint8_t> raw = base32_decode(text);
    if (raw.size() < 3) {
        throw std::runtime_error("Encoded key too short");
    }
    size_t body = raw.size() - 2;
    uint16_t expected = static_cast<uint16_t>(raw[body] | (raw[body + 1] << 8));
    if (crc16_xmodem(std::span<const uint8_t>(raw.data(), body)) != expected) {
        throw std::runtime_error("Encoded key checksum mismatch");
    }
    raw.resize(body);
    return raw;
}

/**
 * Encodes a raw Ed25519 public key as prefix || key || crc16, base32
 * @param role Role prefix (determines the first character)
 * @param raw_key 32-byte public key
 * @return 56-character public key string
 */
std::string encode_public_key(KeyRole role, std::span<const uint8_t> raw_key) {
    if (raw_key.size() != ED25519_KEY_SIZE) {
        throw std::runtime_error("Invalid public key length");
    }
    std::vector<uint8_t> raw;
    raw.reserve(1 + ED25519_KEY_SIZE + 2);
    raw.push_back(static_cast<uint8_t>(role));
    raw.insert(raw.end(), raw_key.begin(), raw_key.end());
    append_crc(raw);
    return base32_encode(raw);
}

std::vector<uint8_t> decode_public_key(std::string_view text, KeyRole* role_out) {
    std::vector<uint8_t> raw = decode_checked(text);
    if (raw.size() != 1 + ED25519_KEY_SIZE) {
        throw std::runtime_error("Invalid public key length");
    }
    if (!is_valid_role(raw[0])) {
        throw std::runtime_error("Invalid public key prefix");
    }
    if (role_out) {
        *role_out = static_cast<KeyRole>(raw[0]);
    }
    return std::vector<uint8_t>(raw.begin() + 1, raw.end());
}

/**
 * Encodes a 32-byte seed; the two prefix bytes spell 'S' followed by the role letter
 */
std::string encode_seed(KeyRole role, std::span<const uint8_t> raw_seed) {
    if (raw_seed.size() != ED25519_KEY_SIZE) {
        throw std::runtime_error("Invalid seed length");
    }
    uint8_t prefix = static_cast<uint8_t>(role);
    std::vector<uint8_t> raw;
    raw.reserve(2 + ED25519_KEY_SIZE + 2);
    raw.push_back(static_cast<uint8_t>(PREFIX_BYTE_SEED | (prefix >> 5)));
    raw.push_back(static_cast<uint8_t>((prefix & 31) << 3));
    raw.insert(raw.end(), raw_seed.begin(), raw_seed.end());
    append_crc(raw);
    std::string text = base32_encode(raw);
    OPENSSL_cleanse(raw.data(), raw.size());
    return text;
}

DecodedSeed decode_seed(std::string_view text) {
    std::vector<uint8_t> raw = decode_checked(text);
    if (raw.size() != 2 + ED25519_KEY_SIZE) {
        OPENSSL_cleanse(raw.data(), raw.size());
        throw std::runtime_error("Invalid seed length");
    }
    uint8_t b1 = raw[0] & 248;
    uint8_t role = static_cast<uint8_t>(((raw[0] & 7) << 5) | ((raw[1] & 248) >> 3));
    if (b1 != PREFIX_BYTE_SEED || !is_valid_role(role)) {
        OPENSSL_cleanse(raw.data(), raw.size());
        throw std::runtime_error("Invalid seed prefix");
    }
    DecodedSeed out{static_cast<KeyRole>(role), std::vector<uint8_t>(raw.begin() + 2, raw.end())};
    OPENSSL_cleanse(raw.data(), raw.size());
    return out;
}
