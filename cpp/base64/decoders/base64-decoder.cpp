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

#include "include/base64-decoder.h"

#include <stdexcept>
#include <openssl/evp.h>

thread_local std::vector<uint8_t> decode_buffer(1024);

static constexpr uint8_t base64_decode_table[256] = {
    255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,
    255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,
    255,255,255,255,255,255,255,255,255,255,255, 62,255,255,255, 63,
     52, 53, 54, 55, 56, 57, 58, 59, 60, 61,255,255,255,254,255,255,
    255,  0,  1,  2,  3,  4,  5,  6,  7,  8,  9, 10, 11, 12, 13, 14,
     15, 16, 17, 18, 19, 20, 21, 22, 23, 24, 25,255,255,255,255,255,
    255, 26, 27, 28, 29, 30, 31, 32, 33, 34, 35, 36, 37, 38, 39, 40,
     41, 42, 43, 44, 45, 46, 47, 48, 49, 50, 51,255,255,255,255,255,
    255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,
    255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,
    255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,
    255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,
    255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,
    255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,
    255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,
    255,255,255,255,255,255,255,255,255,255,255,255,255,255,255,255
};

/**
 * Unpadded Base64 decoder
 *
 * ALGORITHM:
 * 1. Validate every character against the standard alphabet (no padding,
 *    no whitespace)
 * 2. Restore padding and decode with OpenSSL EVP_DecodeBlock
 * 3. Drop the zero bytes produced by the restored padding
 *
 * @param encoded_string Unpadded base64 string to decode
 * @return Decoded binary data
 * @throws std::runtime_error on characters outside the alphabet or impossible lengths
 */
std::vector<uint8_t> base64_decode(std::string_view encoded_string) {
    if (encoded_string.empty()) return {};

    if (encoded_string.size() > MAX_TOKEN_SIZE) {
        throw std::runtime_error("Base64 input too large");
    }
    if (encoded_string.size() % 4 == 1) {
        throw std::runtime_error("Invalid base64 encoding: impossible length");
    }
    for (char c : encoded_string) {
        if (base64_decode_table[static_cast<uint8_t>(c)] >= 64) {
            throw std::runtime_error("Invalid base64 encoding: bad character");
        }
    }

    // Bits past the last whole byte must be zero
    uint8_t last = base64_decode_table[static_cast<uint8_t>(encoded_string.back())];
    size_t tail = encoded_string.size() % 4;
    if ((tail == 2 && (last & 0x0F) != 0) || (tail == 3 && (last & 0x03) != 0)) {
        throw std::runtime_error("Invalid base64 encoding: non-canonical trailing bits");
    }

    // Use thread-local buffer to avoid allocation
    thread_local std::string padded_buffer;
    padded_buffer.assign(encoded_string);

    // Add padding in-place
    size_t padding_needed = (4 - (encoded_string.size() % 4)) % 4;
    padded_buffer.append(padding_needed, '=');

    size_t expected_len = (padded_buffer.size() * 3) / 4;
    if (decode_buffer.size() < expected_len) {
        decode_buffer.resize(expected_len);
    }

    int result = EVP_DecodeBlock(decode_buffer.data(),
                                reinterpret_cast<const uint8_t*>(padded_buffer.data()),
                                static_cast<int>(padded_buffer.size()));
    if (result < 0) {
        throw std::runtime_error("Invalid base64 encoding: decode failed");
    }

    // Remove padding bytes
    if (static_cast<size_t>(result) < padding_needed) {
        throw std::runtime_error("Invalid base64 encoding: insufficient data");
    }

    return std::vector<uint8_t>(decode_buffer.begin(), decode_buffer.begin() + (result - padding_needed));
}

/**
 * URL-safe Base64 decoder for JWT segments; rejects the standard-alphabet
 * '+' and '/' so each token has exactly one textual form
 * @param encoded_string Unpadded base64url string
 * @return Decoded binary data
 */
std::vector<uint8_t> base64url_decode(std::string_view encoded_string) {
    thread_local std::string translated;
    translated.assign(encoded_string);
    for (char& c : translated) {
        if (c == '+' || c == '/') {
            throw std::runtime_error("Invalid base64url encoding: bad character");
        }
        if (c == '-') c = '+';
        else if (c == '_') c = '/';
    }
    return base64_decode(std::string_view(translated));
}
