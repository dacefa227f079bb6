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

#include <gtest/gtest.h>

#include <algorithm>
#include <cctype>

#include "test_modules.h"
#include "wascap.h"

namespace {

constexpr uint64_t NOW = 1600000000;

class WascapTest : public ::testing::Test {
protected:
    WascapTest() : kp(KeyPair::new_account()), raw_module(normalized_sample_module()) {}

    Claims messaging_claims() const {
        Claims claims;
        claims.id = generate_claims_id();
        claims.issued_at = 0;
        claims.issuer = kp.public_key();
        claims.subject = "test.wasm";
        claims.caps = std::vector<std::string>{"wascc:messaging", "wascc:keyvalue"};
        return claims;
    }

    KeyPair kp;
    std::vector<uint8_t> raw_module;
};

bool is_upper_hex(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'F');
    });
}

} // namespace

TEST_F(WascapTest, ClaimsRoundtrip) {
    Claims claims = messaging_claims();
    std::vector<uint8_t> modified_bytecode = embed_claims(raw_module, claims, kp);
    EXPECT_GT(modified_bytecode.size(), raw_module.size());

    std::optional<Token> token = extract_claims(modified_bytecode);
    ASSERT_TRUE(token.has_value());
    EXPECT_EQ(claims.issuer, token->claims.issuer);
    EXPECT_EQ(claims.caps, token->claims.caps);
    EXPECT_NE(claims.module_hash, token->claims.module_hash);
}

TEST_F(WascapTest, DeclaredHashIsCanonicalHashOfUnsignedModule) {
    Claims claims = messaging_claims();
    std::optional<Token> token = extract_claims(embed_claims(raw_module, claims, kp));
    ASSERT_TRUE(token.has_value());

    const std::string& hash = token->claims.module_hash;
    EXPECT_EQ(hash.size(), 64u);
    EXPECT_TRUE(is_upper_hex(hash)) << hash;
    EXPECT_EQ(hash, compute_hash_without_jwt(WasmModule::parse(raw_module)));
    EXPECT_EQ(*token->claims.caps, (std::vector<std::string>{"wascc:messaging", "wascc:keyvalue"}));
}

TEST_F(WascapTest, EmbedLeavesCallerDataUntouched) {
    Claims claims = messaging_claims();
    Claims claims_before = claims;
    std::vector<uint8_t> bytes_before = raw_module;

    embed_claims(raw_module, claims, kp);
    EXPECT_TRUE(claims == claims_before);
    EXPECT_TRUE(claims.module_hash.empty());
    EXPECT_EQ(raw_module, bytes_before);
}

TEST_F(WascapTest, TokenTextMatchesSection) {
    std::vector<uint8_t> signed_module = embed_claims(raw_module, messaging_claims(), kp);
    std::optional<Token> token = extract_claims(signed_module);
    ASSERT_TRUE(token.has_value());

    auto section = WasmModule::parse(signed_module).custom_section("jwt");
    ASSERT_TRUE(section.has_value());
    EXPECT_EQ(token->jwt, std::string(section->begin(), section->end()));
    EXPECT_TRUE(decode_claims(token->jwt) == token->claims);
}

TEST_F(WascapTest, EmbedAcceptsUnnormalizedInput) {
    std::vector<uint8_t> padded = sample_module_bytes();
    std::optional<Token> token = extract_claims(embed_claims(padded, messaging_claims(), kp));
    ASSERT_TRUE(token.has_value());
    EXPECT_EQ(token->claims.module_hash, compute_hash_without_jwt(WasmModule::parse(padded)));
}

TEST_F(WascapTest, FlippingAnyCodeByteIsDetected) {
    std::vector<uint8_t> signed_module = embed_claims(raw_module, messaging_claims(), kp);

    // The token is appended after the unchanged module, whose last section is the code body
    ASSERT_TRUE(std::equal(raw_module.begin(), raw_module.end(), signed_module.begin()));
    size_t code_start = raw_module.size() - SAMPLE_CODE_SECTION_SIZE;

    for (size_t i = code_start; i < raw_module.size(); i++) {
        std::vector<uint8_t> tampered = signed_module;
        tampered[i] ^= 0x01;
        EXPECT_WASCAP_ERROR(extract_claims(tampered), ErrorKind::InvalidModuleHash);
    }
}

TEST_F(WascapTest, FlippingAnyModuleBitIsRejected) {
    std::vector<uint8_t> signed_module = embed_claims(raw_module, messaging_claims(), kp);
    ASSERT_TRUE(std::equal(raw_module.begin(), raw_module.end(), signed_module.begin()));

    // Structural damage is a parse error, anything else must fail the hash gate
    for (size_t i = 0; i < raw_module.size(); i++) {
        for (int bit = 0; bit < 8; bit++) {
            std::vector<uint8_t> tampered = signed_module;
            tampered[i] ^= static_cast<uint8_t>(1u << bit);
            try {
                extract_claims(tampered);
                ADD_FAILURE() << "undetected flip at byte " << i << " bit " << bit;
            } catch (const WascapException& e) {
                EXPECT_TRUE(e.kind() == ErrorKind::ParseError || e.kind() == ErrorKind::InvalidModuleHash)
                    << "byte " << i << " bit " << bit << ": " << e.what();
            }
        }
    }
}

TEST_F(WascapTest, AddingOrRemovingSectionsIsDetected) {
    std::vector<uint8_t> signed_module = embed_claims(raw_module, messaging_claims(), kp);
    WasmModule module = WasmModule::parse(signed_module);

    std::vector<uint8_t> extra = module.with_custom_section("producers", {1, 2, 3}).serialize();
    EXPECT_WASCAP_ERROR(extract_claims(extra), ErrorKind::InvalidModuleHash);

    std::vector<uint8_t> stripped = module.without_custom_section("dylink").serialize();
    EXPECT_WASCAP_ERROR(extract_claims(stripped), ErrorKind::InvalidModuleHash);
}

TEST_F(WascapTest, TokenPositionDoesNotAffectHash) {
    std::vector<uint8_t> signed_module = embed_claims(raw_module, messaging_claims(), kp);
    WasmModule module = WasmModule::parse(signed_module);
    std::vector<uint8_t> jwt = *module.custom_section("jwt");

    // Move the token section in front of every other section
    std::vector<uint8_t> moved = wasm_header();
    std::vector<uint8_t> jwt_section = raw_custom_section("jwt", jwt);
    moved.insert(moved.end(), jwt_section.begin(), jwt_section.end());
    std::vector<uint8_t> rest = module.without_custom_section("jwt").serialize();
    moved.insert(moved.end(), rest.begin() + 8, rest.end());

    EXPECT_TRUE(extract_claims(moved).has_value());
}

TEST_F(WascapTest, ForgedHashIsRejected) {
    Claims claims = messaging_claims();
    claims.module_hash = std::string(64, '0');
    std::string jwt = encode_claims(claims, kp);

    std::vector<uint8_t> forged = WasmModule::parse(raw_module).with_custom_section("jwt", to_bytes(jwt)).serialize();
    EXPECT_WASCAP_ERROR(extract_claims(forged), ErrorKind::InvalidModuleHash);
}

TEST_F(WascapTest, LowercaseHashIsRejected) {
    Claims claims = messaging_claims();
    claims.module_hash = compute_hash_without_jwt(WasmModule::parse(raw_module));
    std::transform(claims.module_hash.begin(), claims.module_hash.end(), claims.module_hash.begin(),
                   [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
    std::string jwt = encode_claims(claims, kp);

    std::vector<uint8_t> module = WasmModule::parse(raw_module).with_custom_section("jwt", to_bytes(jwt)).serialize();
    EXPECT_WASCAP_ERROR(extract_claims(module), ErrorKind::InvalidModuleHash);
}

TEST_F(WascapTest, AbsenceIsNotAnError) {
    EXPECT_FALSE(extract_claims(raw_module).has_value());
    EXPECT_FALSE(extract_claims(sample_module_bytes()).has_value());
    EXPECT_FALSE(extract_claims(wasm_header()).has_value());
}

TEST_F(WascapTest, NonUtf8TokenIsEncodingError) {
    std::vector<uint8_t> module = WasmModule::parse(raw_module).with_custom_section("jwt", {0xFF, 0xFE, 0x41}).serialize();
    EXPECT_WASCAP_ERROR(extract_claims(module), ErrorKind::EncodingError);
}

TEST_F(WascapTest, GarbageTokenIsDecodeError) {
    std::vector<uint8_t> module = WasmModule::parse(raw_module).with_custom_section("jwt", to_bytes("not.a.token")).serialize();
    EXPECT_WASCAP_ERROR(extract_claims(module), ErrorKind::TokenDecodeError);
}

TEST_F(WascapTest, TokenSignedByAnotherKeyIsDecodeError) {
    Claims claims = messaging_claims();
    claims.issuer = KeyPair::new_account().public_key();
    EXPECT_WASCAP_ERROR(extract_claims(embed_claims(raw_module, claims, kp)), ErrorKind::TokenDecodeError);
}

TEST_F(WascapTest, MalformedModulesAreParseErrors) {
    std::vector<uint8_t> garbage = to_bytes("definitely not wasm");
    EXPECT_WASCAP_ERROR(extract_claims(garbage), ErrorKind::ParseError);
    EXPECT_WASCAP_ERROR(embed_claims(garbage, messaging_claims(), kp), ErrorKind::ParseError);
}

TEST_F(WascapTest, VerifyOnlyKeyIsSigningError) {
    KeyPair verifier = KeyPair::from_public_key(kp.public_key());
    EXPECT_WASCAP_ERROR(embed_claims(raw_module, messaging_claims(), verifier), ErrorKind::SigningError);
}

TEST_F(WascapTest, ReEmbedIsIdempotent) {
    Claims claims = messaging_claims();
    std::vector<uint8_t> first = embed_claims(raw_module, claims, kp);
    std::vector<uint8_t> second = embed_claims(raw_module, claims, kp);

    std::optional<Token> first_token = extract_claims(first);
    std::optional<Token> second_token = extract_claims(second);
    ASSERT_TRUE(first_token.has_value());
    ASSERT_TRUE(second_token.has_value());
    EXPECT_EQ(first_token->claims.module_hash, second_token->claims.module_hash);

    // Signing an already signed module replaces the token instead of adding one
    std::vector<uint8_t> resigned = embed_claims(first, claims, kp);
    std::optional<Token> resigned_token = extract_claims(resigned);
    ASSERT_TRUE(resigned_token.has_value());
    EXPECT_EQ(resigned_token->claims.module_hash, first_token->claims.module_hash);

    const auto& sections = WasmModule::parse(resigned).sections();
    EXPECT_EQ(std::count_if(sections.begin(), sections.end(),
                            [](const WasmSection& s) { return s.is_custom() && s.name == "jwt"; }),
              1);
}

TEST_F(WascapTest, SignBufferWithClaimsBuildsDatedClaims) {
    FixedClock clock(NOW);
    KeyPair account = KeyPair::new_account();
    KeyPair module = KeyPair::new_module();

    std::vector<uint8_t> signed_module = sign_buffer_with_claims(
        raw_module, module, account, 3, 1,
        {"wascc:http_server", "wascc:logging"}, {"prod"}, clock);

    std::optional<Token> token = extract_claims(signed_module);
    ASSERT_TRUE(token.has_value());
    const Claims& claims = token->claims;
    EXPECT_EQ(claims.issuer, account.public_key());
    EXPECT_EQ(claims.subject, module.public_key());
    EXPECT_EQ(claims.issued_at, NOW);
    ASSERT_TRUE(claims.expires.has_value());
    EXPECT_EQ(*claims.expires, NOW + 3 * SECS_PER_DAY);
    ASSERT_TRUE(claims.not_before.has_value());
    EXPECT_EQ(*claims.not_before, NOW + SECS_PER_DAY);
    EXPECT_EQ(*claims.caps, (std::vector<std::string>{"wascc:http_server", "wascc:logging"}));
    EXPECT_EQ(*claims.tags, (std::vector<std::string>{"prod"}));

    TokenValidation validation = validate_token(token->jwt, clock);
    EXPECT_TRUE(validation.signature_valid);
    EXPECT_TRUE(validation.cannot_use_yet);
    EXPECT_FALSE(validation.expired);
}

TEST_F(WascapTest, SignBufferWithoutDatesLeavesThemUnset) {
    std::vector<uint8_t> signed_module = sign_buffer_with_claims(
        raw_module, KeyPair::new_module(), kp, std::nullopt, std::nullopt, {}, {});
    std::optional<Token> token = extract_claims(signed_module);
    ASSERT_TRUE(token.has_value());
    EXPECT_FALSE(token->claims.expires.has_value());
    EXPECT_FALSE(token->claims.not_before.has_value());
    ASSERT_TRUE(token->claims.caps.has_value());
    EXPECT_TRUE(token->claims.caps->empty());
}

TEST_F(WascapTest, SignBufferRejectsOverflowingDayOffsets) {
    FixedClock clock(NOW);
    EXPECT_WASCAP_ERROR(sign_buffer_with_claims(raw_module, KeyPair::new_module(), kp, UINT64_MAX, std::nullopt,
                                                {}, {}, clock),
                        ErrorKind::SigningError);
    EXPECT_WASCAP_ERROR(sign_buffer_with_claims(raw_module, KeyPair::new_module(), kp, std::nullopt,
                                                UINT64_MAX / SECS_PER_DAY, {}, {}, clock),
                        ErrorKind::SigningError);
}
