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

#include "token.h"

#include <span>
#include "../base64/encoders/include/base64-encoder.h"
#include "../base64/decoders/include/base64-decoder.h"

namespace {

struct ParsedToken {
    Claims claims;
    std::string_view signing_input; // "<header>.<claims>"
    std::vector<uint8_t> signature;
};

[[noreturn]] void decode_fail(const std::string& what) {
    DEBUG_LOG("ERROR: token decode failed: " + what);
    throw WascapException(ErrorKind::TokenDecodeError, what);
}

std::string header_json() {
    json::object header;
    header["typ"] = json::string_view(JWT_HEADER_TYPE.data(), JWT_HEADER_TYPE.size());
    header["alg"] = json::string_view(JWT_HEADER_ALGORITHM.data(), JWT_HEADER_ALGORITHM.size());
    return json::serialize(header);
}

std::string decode_segment(std::string_view segment, const char* what) {
    try {
        std::vector<uint8_t> raw = base64url_decode(segment);
        return std::string(raw.begin(), raw.end());
    } catch (const std::runtime_error& e) {
        decode_fail(std::string(what) + " segment: " + e.what());
    }
}

void check_header(std::string_view text) {
    boost::system::error_code ec;
    json::value jv = json::parse(json::string_view(text.data(), text.size()), ec);
    if (ec || !jv.is_object()) {
        decode_fail("header is not a JSON object");
    }
    const json::object& header = jv.get_object();
    auto alg = header.find("alg");
    if (alg == header.end() || !alg->value().is_string() ||
        alg->value().get_string() != json::string_view(JWT_HEADER_ALGORITHM.data(), JWT_HEADER_ALGORITHM.size())) {
        decode_fail("unsupported token algorithm");
    }
}

// Splits and decodes a compact token without checking its signature
ParsedToken parse_token(std::string_view jwt) {
    if (jwt.size() > MAX_TOKEN_SIZE) {
        decode_fail("token exceeds maximum size");
    }

    size_t first = jwt.find('.');
    if (first == std::string_view::npos) {
        decode_fail("token has no header separator");
    }
    size_t second = jwt.find('.', first + 1);
    if (second == std::string_view::npos || jwt.find('.', second + 1) != std::string_view::npos) {
        decode_fail("token must have exactly three segments");
    }

    std::string_view header_b64 = jwt.substr(0, first);
    std::string_view claims_b64 = jwt.substr(first + 1, second - first - 1);
    std::string_view sig_b64 = jwt.substr(second + 1);
    if (header_b64.empty() || claims_b64.empty() || sig_b64.empty()) {
        decode_fail("token has an empty segment");
    }

    check_header(decode_segment(header_b64, "header"));

    ParsedToken parsed;
    parsed.claims = claims_from_json(decode_segment(claims_b64, "claims"));
    parsed.signing_input = jwt.substr(0, second);
    try {
        parsed.signature = base64url_decode(sig_b64);
    } catch (const std::runtime_error& e) {
        decode_fail(std::string("signature segment: ") + e.what());
    }
    return parsed;
}

bool signature_matches(const ParsedToken& parsed) {
    KeyPair issuer = [&]() {
        try {
            return KeyPair::from_public_key(parsed.claims.issuer);
        } catch (const std::runtime_error& e) {
            decode_fail(std::string("issuer is not a valid public key: ") + e.what());
        }
    }();
    std::span<const uint8_t> input(reinterpret_cast<const uint8_t*>(parsed.signing_input.data()),
                                   parsed.signing_input.size());
    return issuer.verify(input, parsed.signature);
}

} // namespace

/**
 * Encodes claims as a compact JWT signed by the given key pair
 *
 * FORMAT: base64url(header) "." base64url(claims) "." base64url(signature),
 * where the Ed25519 signature covers the first two segments joined by '.'.
 * Claims with issued_at == 0 are stamped with the clock's current time.
 *
 * @param claims Claims to sign
 * @param kp Signing key pair; must hold a seed
 * @param clock Source for the issued-at stamp
 * @return Compact token text
 * @throws WascapException(SigningError) if the key cannot sign
 */
std::string encode_claims(const Claims& claims, const KeyPair& kp, const Clock& clock) {
    Claims stamped = claims;
    if (stamped.issued_at == 0) {
        stamped.issued_at = clock.now_seconds();
    }

    std::string signing_input = base64url_encode(header_json()) + "." + base64url_encode(claims_to_json_string(stamped));
    std::vector<uint8_t> signature = kp.sign(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(signing_input.data()), signing_input.size()));

    DEBUG_LOG("Encoded claims token for subject " + stamped.subject + " (" + std::to_string(signing_input.size()) + " byte signing input)");
    return signing_input + "." + base64url_encode(signature);
}

/**
 * Decodes a compact JWT and verifies its signature against the issuer key
 * @param jwt Token text
 * @return Decoded claims
 * @throws WascapException(TokenDecodeError) if the token is malformed or the signature fails
 */
Claims decode_claims(std::string_view jwt) {
    ParsedToken parsed = parse_token(jwt);
    if (!signature_matches(parsed)) {
        decode_fail("signature verification failed");
    }
    return std::move(parsed.claims);
}

/**
 * Reports the time validity and signature state of a token
 * @param jwt Token text
 * @param clock Reference time for expiry and not-before
 * @return Validation report; a bad signature is reported, not thrown
 * @throws WascapException(TokenDecodeError) if the token cannot be parsed at all
 */
TokenValidation validate_token(std::string_view jwt, const Clock& clock) {
    ParsedToken parsed = parse_token(jwt);
    const Claims& claims = parsed.claims;
    uint64_t now = clock.now_seconds();

    TokenValidation result;
    result.signature_valid = signature_matches(parsed);
    result.expired = claims.expires && *claims.expires < now;
    result.expires_human = stamp_to_human(claims.expires, clock);
    result.cannot_use_yet = claims.not_before && *claims.not_before > now;
    result.not_before_human = stamp_to_human(claims.not_before, clock);
    return result;
}
