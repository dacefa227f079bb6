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

#include "wascap.h"

/**
 * Computes the canonical hash of a module: the uppercase hex SHA-256 of its
 * serialization with every "jwt" custom section removed
 * @param module Module to hash; left unmodified
 * @return 64-character uppercase hex digest
 */
std::string compute_hash_without_jwt(const WasmModule& module) {
    std::vector<uint8_t> modbytes = module.without_custom_section(JWT_SECTION_NAME).serialize();
    Sha256Digest digest = sha256_digest(modbytes);
    std::string hash = encode_hex_upper(digest);
    DEBUG_LOG("Canonical module hash over " + std::to_string(modbytes.size()) + " bytes: " + hash);
    return hash;
}

/**
 * Extracts and verifies the claims embedded in a WebAssembly module
 *
 * PIPELINE:
 * 1. Parse the module
 * 2. Find the "jwt" custom section; none means the module is unsigned
 * 3. Require the section payload to be UTF-8
 * 4. Decode the token and verify its signature against the issuer
 * 5. Recompute the canonical hash and compare it with the declared hash
 *
 * @param contents Raw module bytes
 * @return Token, or nullopt if the module carries no token
 * @throws WascapException with ParseError, EncodingError, TokenDecodeError or InvalidModuleHash
 */
std::optional<Token> extract_claims(std::span<const uint8_t> contents) {
    WasmModule module = WasmModule::parse(contents);

    std::optional<std::vector<uint8_t>> section = module.custom_section(JWT_SECTION_NAME);
    if (!section) {
        DEBUG_LOG("No jwt custom section present");
        return std::nullopt;
    }

    std::string jwt(section->begin(), section->end());
    if (!is_valid_utf8(jwt)) {
        throw WascapException(ErrorKind::EncodingError, "jwt section payload is not valid UTF-8");
    }

    Claims claims = decode_claims(jwt);
    std::string hash = compute_hash_without_jwt(module);

    if (hash != claims.module_hash) {
        DEBUG_LOG("ERROR: module hash mismatch, computed " + hash + " declared " + claims.module_hash);
        throw WascapException(ErrorKind::InvalidModuleHash,
                              "computed " + hash + " does not match declared " + claims.module_hash);
    }

    return Token{std::move(jwt), std::move(claims)};
}

/**
 * Embeds a freshly signed claims token in a WebAssembly module
 *
 * The module is normalized through a serialize/parse round trip before
 * hashing, so the declared hash matches what extract_claims recomputes.
 * Any existing "jwt" section is replaced. Neither the input buffer nor the
 * caller's claims are modified.
 *
 * @param orig_bytecode Module bytes
 * @param claims Claims to sign; module_hash is overwritten in the signed copy
 * @param kp Issuer key pair used to sign the token
 * @param clock Source for the issued-at stamp
 * @return New module bytes carrying the token
 * @throws WascapException with ParseError, SerializationError or SigningError
 */
std::vector<uint8_t> embed_claims(std::span<const uint8_t> orig_bytecode,
                                  const Claims& claims,
                                  const KeyPair& kp,
                                  const Clock& clock) {
    WasmModule module = WasmModule::parse(orig_bytecode);
    WasmModule normalized = WasmModule::parse(module.serialize());

    Claims signed_claims = claims;
    signed_claims.module_hash = compute_hash_without_jwt(normalized);

    std::string jwt;
    try {
        jwt = encode_claims(signed_claims, kp, clock);
    } catch (const WascapException&) {
        throw;
    } catch (const std::runtime_error& e) {
        throw WascapException(ErrorKind::SigningError, e.what());
    }

    std::vector<uint8_t> token_bytes(jwt.begin(), jwt.end());
    std::vector<uint8_t> result = module.with_custom_section(JWT_SECTION_NAME, std::move(token_bytes)).serialize();

    DEBUG_LOG("Embedded " + std::to_string(jwt.size()) + " byte token; module grew from " +
              std::to_string(orig_bytecode.size()) + " to " + std::to_string(result.size()) + " bytes");
    return result;
}

/**
 * Builds claims for a module and embeds them, signed by the account key
 * @param buf Module bytes
 * @param mod_kp Module identity (claims subject)
 * @param acct_kp Account identity (claims issuer and signer)
 * @param expires_in_days Expiry as days from now, if any
 * @param not_before_days Not-before as days from now, if any
 * @param caps Capability identifiers
 * @param tags Free-form tags
 * @param clock Source of "now" for the day offsets
 * @return New module bytes carrying the token
 */
std::vector<uint8_t> sign_buffer_with_claims(std::span<const uint8_t> buf,
                                             const KeyPair& mod_kp,
                                             const KeyPair& acct_kp,
                                             std::optional<uint64_t> expires_in_days,
                                             std::optional<uint64_t> not_before_days,
                                             std::vector<std::string> caps,
                                             std::vector<std::string> tags,
                                             const Clock& clock) {
    std::optional<uint64_t> not_before;
    std::optional<uint64_t> expires;
    try {
        not_before = days_from_now_to_jwt_time(not_before_days, clock);
        expires = days_from_now_to_jwt_time(expires_in_days, clock);
    } catch (const std::overflow_error& e) {
        throw WascapException(ErrorKind::SigningError, e.what());
    }
    Claims claims = Claims::with_dates(acct_kp.public_key(),
                                       mod_kp.public_key(),
                                       std::move(caps),
                                       std::move(tags),
                                       not_before,
                                       expires,
                                       clock);
    return embed_claims(buf, claims, acct_kp, clock);
}
