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
#include <iostream>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>


// Debug logging infrastructure - check environment variable at runtime
inline bool is_debug_enabled() {
    static bool cached_result = []() {
        const char* env = std::getenv("WASCAP_CPP_DEBUG");
        return env && std::string(env) == "1";
    }();
    return cached_result;
}

#define DEBUG_LOG(msg) do { \
    if (is_debug_enabled()) { \
        std::ofstream logfile("/tmp/wascap_cpp_debug.log", std::ios::app); \
        if (logfile.is_open()) { \
            logfile << "DEBUG wascap: " << msg << std::endl; \
            logfile.close(); \
        } \
        std::cout << "DEBUG wascap: " << msg << std::endl; \
    } \
} while(0)

// Hex lookup tables
static constexpr char hex_lut[] = "0123456789abcdef";
static constexpr char hex_lut_upper[] = "0123456789ABCDEF";

// Name of the custom section that carries the signed claims token
static constexpr std::string_view JWT_SECTION_NAME = "jwt";

// Limits to prevent DoS via oversized inputs
static constexpr size_t MAX_TOKEN_SIZE = 10 * 1024 * 1024; // 10 MB
static constexpr size_t MAX_MODULE_SIZE = 256 * 1024 * 1024; // 256 MB

// Read size used by the streaming content hasher
static constexpr size_t HASH_CHUNK_SIZE = 1024;

static constexpr uint64_t SECS_PER_DAY = 86400;

// Error kinds surfaced to callers
enum class ErrorKind {
    ParseError,
    SerializationError,
    EncodingError,
    TokenDecodeError,
    InvalidModuleHash,
    SigningError,
    IoError
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ParseError: return "ParseError";
        case ErrorKind::SerializationError: return "SerializationError";
        case ErrorKind::EncodingError: return "EncodingError";
        case ErrorKind::TokenDecodeError: return "TokenDecodeError";
        case ErrorKind::InvalidModuleHash: return "InvalidModuleHash";
        case ErrorKind::SigningError: return "SigningError";
        case ErrorKind::IoError: return "IoError";
    }
    return "Unknown";
}

// Shared exception class
class WascapException : public std::runtime_error {
public:
    WascapException(ErrorKind kind, const std::string& msg)
        : std::runtime_error(std::string(error_kind_name(kind)) + ": " + msg), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// Render bytes as lowercase hex for debug output
inline std::string debug_hex(const uint8_t* data, size_t size, size_t max_bytes = 16) {
    std::string out;
    size_t n = size < max_bytes ? size : max_bytes;
    out.reserve(n * 2);
    for (size_t i = 0; i < n; i++) {
        out.push_back(hex_lut[data[i] >> 4]);
        out.push_back(hex_lut[data[i] & 0x0F]);
    }
    return out;
}

// UTF-8 well-formedness check (rejects overlongs, surrogates and > U+10FFFF)
bool is_valid_utf8(std::string_view s);
