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
#include <array>
#include <istream>
#include <memory>
#include <span>
#include <streambuf>
#include <string>
#include <cstdint>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include "../global.h"

using Sha256Digest = std::array<uint8_t, SHA256_DIGEST_LENGTH>;

// Read-only streambuf over an in-memory byte range
class SpanStreamBuf : public std::streambuf {
public:
    explicit SpanStreamBuf(std::span<const uint8_t> data) {
        char* begin = const_cast<char*>(reinterpret_cast<const char*>(data.data()));
        setg(begin, begin, begin + data.size());
    }
};

// Incremental SHA-256 over an OpenSSL digest context
class Sha256Context {
public:
    Sha256Context();

    void update(std::span<const uint8_t> data);
    Sha256Digest finish();

private:
    struct CtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };
    std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
    bool finished_ = false;
};

// Function declarations
Sha256Digest sha256_digest(std::istream& reader);
Sha256Digest sha256_digest(std::span<const uint8_t> data);
std::string encode_hex_upper(std::span<const uint8_t> data);
