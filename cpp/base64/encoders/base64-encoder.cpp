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

#include "include/base64-encoder.h"

#include <stdexcept>

// OpenSSL includes for base64 operations
#include <openssl/evp.h>

// Thread-local buffer definition
thread_local std::string encoder_base64_buffer;

/**
 * Unpadded standard-alphabet Base64 encoder
 *
 * Encodes through OpenSSL EVP_EncodeBlock into a thread-local buffer and
 * strips the trailing '=' padding.
 *
 * @param data Binary data to encode
 * @return Unpadded base64 encoded string
 */
std::string base64_encode(std::span<const uint8_t> data) {
    if (data.empty()) return "";

    if (data.size() > MAX_TOKEN_SIZE) {
        throw std::runtime_error("Base64 input too large");
    }

    size_t out_len = ((data.size() + 2) / 3) * 4;
    encoder_base64_buffer.resize(out_len + 1);
    int actual_len = EVP_EncodeBlock(reinterpret_cast<uint8_t*>(encoder_base64_buffer.data()),
                                     data.data(), static_cast<int>(data.size()));
    if (actual_len < 0) {
        throw std::runtime_error("Base64 encode failed");
    }
    while (actual_len > 0 && encoder_base64_buffer[actual_len - 1] == '=') {
        actual_len--;
    }
    encoder_base64_buffer.resize(actual_len);

    if (is_debug_enabled()) {
        DEBUG_LOG("base64_encode input (" + std::to_string(data.size()) + " bytes): " + debug_hex(data.data(), data.size()));
    }
    return encoder_base64_buffer;
}

/**
 * Unpadded URL-safe Base64 encoder (RFC 4648 section 5), as used by JWT segments
 * @param data Binary data to encode
 * @return Base64url string without padding
 */
std::string base64url_encode(std::span<const uint8_t> data) {
    std::string out = base64_encode(data);
    for (char& c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return out;
}

// String overload for JSON text segments
std::string base64url_encode(std::string_view data) {
    return base64url_encode(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(data.data()), data.size()));
}
