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

#include "base64/encoders/include/base64-encoder.h"
#include "base64/decoders/include/base64-decoder.h"

TEST(Base64Test, EncodesWithoutPadding) {
    EXPECT_EQ(base64_encode(std::vector<uint8_t>{'h', 'e', 'l', 'l', 'o'}), "aGVsbG8");
    EXPECT_EQ(base64_encode(std::vector<uint8_t>{}), "");
    EXPECT_EQ(base64url_encode(std::string_view("{\"typ\":\"jwt\"}")), "eyJ0eXAiOiJqd3QifQ");
}

TEST(Base64Test, UrlAlphabetReplacesPlusAndSlash) {
    std::vector<uint8_t> data{0xFB, 0xFF};
    EXPECT_EQ(base64_encode(data), "+/8");
    EXPECT_EQ(base64url_encode(data), "-_8");
    EXPECT_EQ(base64url_decode("-_8"), data);
}

TEST(Base64Test, DecodesEveryTailLength) {
    for (size_t len = 0; len < 8; len++) {
        std::vector<uint8_t> data(len);
        for (size_t i = 0; i < len; i++) {
            data[i] = static_cast<uint8_t>(0xF0 + i);
        }
        EXPECT_EQ(base64url_decode(base64url_encode(data)), data) << len;
    }
}

TEST(Base64Test, RejectsMalformedInput) {
    EXPECT_THROW(base64_decode(std::string_view("aGVsbG8=")), std::runtime_error);
    EXPECT_THROW(base64_decode(std::string_view("aGV sbG8")), std::runtime_error);
    EXPECT_THROW(base64_decode(std::string_view("aGVsb")), std::runtime_error);
    EXPECT_THROW(base64url_decode("+/8"), std::runtime_error);
}

TEST(Base64Test, RejectsNonZeroTrailingBits) {
    EXPECT_EQ(base64url_decode("QQ"), std::vector<uint8_t>{0x41});
    EXPECT_THROW(base64url_decode("QR"), std::runtime_error);
    EXPECT_THROW(base64url_decode("QX"), std::runtime_error);

    EXPECT_EQ(base64url_decode("QUI"), (std::vector<uint8_t>{0x41, 0x42}));
    EXPECT_THROW(base64url_decode("QUJ"), std::runtime_error);
    EXPECT_THROW(base64url_decode("QUL"), std::runtime_error);
}

TEST(Base64Test, SignatureSizedValueHasOneTextualForm) {
    std::vector<uint8_t> signature(64, 0x5A);
    std::string encoded = base64url_encode(signature);
    ASSERT_EQ(encoded.size() % 4, 2u);

    const std::string alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
    size_t matching = 0;
    for (char c : alphabet) {
        std::string variant = encoded;
        variant.back() = c;
        std::vector<uint8_t> decoded;
        try {
            decoded = base64url_decode(variant);
        } catch (const std::runtime_error&) {
            continue;
        }
        if (decoded == signature) {
            matching++;
        }
    }
    EXPECT_EQ(matching, 1u);
}
