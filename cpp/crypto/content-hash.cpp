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

#include "content-hash.h"

Sha256Context::Sha256Context() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("Failed to create EVP_MD_CTX");
    }
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
}

void Sha256Context::update(std::span<const uint8_t> data) {
    if (finished_) {
        throw std::logic_error("SHA256 context already finished");
    }
    if (data.empty()) return;
    if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

Sha256Digest Sha256Context::finish() {
    if (finished_) {
        throw std::logic_error("SHA256 context already finished");
    }
    Sha256Digest digest{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), digest.data(), &len) != 1 || len != digest.size()) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    finished_ = true;
    return digest;
}

/**
 * Computes the SHA-256 digest of everything readable from a stream
 *
 * Reads in HASH_CHUNK_SIZE blocks and folds each block into the running
 * digest state until end of stream.
 *
 * @param reader Input stream positioned at the first byte to hash
 * @return 32-byte digest
 * @throws WascapException(IoError) if the stream reports a read failure
 */
Sha256Digest sha256_digest(std::istream& reader) {
    Sha256Context context;
    std::array<char, HASH_CHUNK_SIZE> buffer;
    size_t total = 0;

    while (true) {
        reader.read(buffer.data(), buffer.size());
        std::streamsize count = reader.gcount();
        if (reader.bad()) {
            throw WascapException(ErrorKind::IoError,
                                  "stream read failed after " + std::to_string(total) + " bytes");
        }
        if (count <= 0) {
            break;
        }
        context.update(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(buffer.data()),
                                                static_cast<size_t>(count)));
        total += static_cast<size_t>(count);
        if (reader.eof()) {
            break;
        }
    }

    DEBUG_LOG("sha256_digest hashed " + std::to_string(total) + " bytes");
    return context.finish();
}

// In-memory overload, hashed through the same chunked stream loop
Sha256Digest sha256_digest(std::span<const uint8_t> data) {
    SpanStreamBuf buf(data);
    std::istream reader(&buf);
    return sha256_digest(reader);
}

/**
 * Renders bytes as uppercase hexadecimal without separators
 * @param data Bytes to render
 * @return String of length 2 * data.size()
 */
std::string encode_hex_upper(std::span<const uint8_t> data) {
    std::string out;
    out.reserve(data.size() * 2);
    for (uint8_t b : data) {
        out.push_back(hex_lut_upper[b >> 4]);
        out.push_back(hex_lut_upper[b & 0x0F]);
    }
    return out;
}
