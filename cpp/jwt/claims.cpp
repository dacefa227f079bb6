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

#include "claims.h"

// Header-only Boost.JSON: compiled into this translation unit only
#include <boost/json/src.hpp>
#include <openssl/rand.h>

static constexpr char id_alphabet[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
static constexpr size_t ID_LENGTH = 22;

/**
 * Generates a random 22-character base62 token identifier (jti)
 */
std::string generate_claims_id() {
    uint8_t random[ID_LENGTH];
    if (RAND_bytes(random, sizeof(random)) != 1) {
        throw std::runtime_error("Failed to generate random bytes");
    }
    std::string id;
    id.reserve(ID_LENGTH);
    for (uint8_t r : random) {
        id.push_back(id_alphabet[r % 62]);
    }
    return id;
}

Claims Claims::create(const std::string& issuer,
                      const std::string& subject,
                      std::optional<std::vector<std::string>> caps,
                      std::optional<std::vector<std::string>> tags,
                      const Clock& clock) {
    return with_dates(issuer, subject, std::move(caps), std::move(tags), std::nullopt, std::nullopt, clock);
}

Claims Claims::with_dates(const std::string& issuer,
                          const std::string& subject,
                          std::optional<std::vector<std::string>> caps,
                          std::optional<std::vector<std::string>> tags,
                          std::optional<uint64_t> not_before,
                          std::optional<uint64_t> expires,
                          const Clock& clock) {
    Claims claims;
    claims.expires = expires;
    claims.id = generate_claims_id();
    claims.issued_at = clock.now_seconds();
    claims.issuer = issuer;
    claims.subject = subject;
    claims.not_before = not_before;
    claims.tags = std::move(tags);
    claims.caps = std::move(caps);
    return claims;
}

static json::array to_json_array(const std::vector<std::string>& items) {
    json::array arr;
    arr.reserve(items.size());
    for (const auto& item : items) {
        arr.emplace_back(item);
    }
    return arr;
}

json::object claims_to_json(const Claims& claims) {
    json::object obj;
    if (claims.expires) {
        obj["exp"] = *claims.expires;
    }
    obj["jti"] = claims.id;
    obj["iat"] = claims.issued_at;
    obj["iss"] = claims.issuer;
    obj["sub"] = claims.subject;
    if (claims.not_before) {
        obj["nbf"] = *claims.not_before;
    }

    json::object metadata;
    metadata["hash"] = claims.module_hash;
    if (claims.tags) {
        metadata["tags"] = to_json_array(*claims.tags);
    }
    if (claims.caps) {
        metadata["caps"] = to_json_array(*claims.caps);
    }
    obj["wascap"] = std::move(metadata);
    return obj;
}

std::string claims_to_json_string(const Claims& claims) {
    return json::serialize(claims_to_json(claims));
}

[[noreturn]] static void decode_fail(const std::string& what) {
    DEBUG_LOG("ERROR: claims decode failed: " + what);
    throw WascapException(ErrorKind::TokenDecodeError, what);
}

static std::string get_string(const json::object& obj, std::string_view key, bool required) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        if (required) decode_fail("missing claim '" + std::string(key) + "'");
        return {};
    }
    if (!it->value().is_string()) {
        decode_fail("claim '" + std::string(key) + "' is not a string");
    }
    const json::string& s = it->value().get_string();
    return std::string(s.data(), s.size());
}

static std::optional<uint64_t> get_u64(const json::object& obj, std::string_view key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->value().is_null()) {
        return std::nullopt;
    }
    const json::value& v = it->value();
    if (v.is_uint64()) {
        return v.get_uint64();
    }
    if (v.is_int64() && v.get_int64() >= 0) {
        return static_cast<uint64_t>(v.get_int64());
    }
    decode_fail("claim '" + std::string(key) + "' is not a non-negative integer");
}

static std::optional<std::vector<std::string>> get_string_list(const json::object& obj, std::string_view key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->value().is_null()) {
        return std::nullopt;
    }
    if (!it->value().is_array()) {
        decode_fail("claim '" + std::string(key) + "' is not an array");
    }
    std::vector<std::string> out;
    for (const auto& item : it->value().get_array()) {
        if (!item.is_string()) {
            decode_fail("claim '" + std::string(key) + "' contains a non-string entry");
        }
        out.emplace_back(item.get_string().data(), item.get_string().size());
    }
    return out;
}

/**
 * Parses the claims JSON segment of a token
 * @param text JSON text
 * @return Claims
 * @throws WascapException(TokenDecodeError) on malformed JSON or wrongly typed fields
 */
Claims claims_from_json(std::string_view text) {
    boost::system::error_code ec;
    json::value jv = json::parse(json::string_view(text.data(), text.size()), ec);
    if (ec) {
        decode_fail("claims are not valid JSON: " + ec.message());
    }
    if (!jv.is_object()) {
        decode_fail("claims are not a JSON object");
    }
    const json::object& obj = jv.get_object();

    Claims claims;
    claims.expires = get_u64(obj, "exp");
    claims.id = get_string(obj, "jti", false);
    claims.issued_at = get_u64(obj, "iat").value_or(0);
    claims.issuer = get_string(obj, "iss", true);
    claims.subject = get_string(obj, "sub", true);
    claims.not_before = get_u64(obj, "nbf");

    auto it = obj.find("wascap");
    if (it != obj.end()) {
        if (!it->value().is_object()) {
            decode_fail("claim 'wascap' is not an object");
        }
        const json::object& metadata = it->value().get_object();
        claims.module_hash = get_string(metadata, "hash", false);
        claims.tags = get_string_list(metadata, "tags");
        claims.caps = get_string_list(metadata, "caps");
    }
    return claims;
}
