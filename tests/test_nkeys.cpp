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

#include "crypto/ed25519.h"
#include "crypto/nkeys.h"
#include "test_modules.h"

TEST(NkeysTest, Crc16Xmodem) {
    EXPECT_EQ(crc16_xmodem(to_bytes("123456789")), 0x31C3);
    EXPECT_EQ(crc16_xmodem(std::vector<uint8_t>{}), 0);
}

TEST(NkeysTest, Base32MatchesRfc4648) {
    EXPECT_EQ(base32_encode(to_bytes("foobar")), "MZXW6YTBOI");
    EXPECT_EQ(base32_decode("MZXW6YTBOI"), to_bytes("foobar"));
    EXPECT_THROW(base32_decode("mzxw"), std::runtime_error);
}

TEST(NkeysTest, PublicKeysCarryRolePrefix) {
    KeyPair account = KeyPair::new_account();
    KeyPair module = KeyPair::new_module();

    std::string account_pk = account.public_key();
    std::string module_pk = module.public_key();
    ASSERT_EQ(account_pk.size(), 56u);
    ASSERT_EQ(module_pk.size(), 56u);
    EXPECT_EQ(account_pk[0], 'A');
    EXPECT_EQ(module_pk[0], 'M');

    KeyRole role = KeyRole::User;
    EXPECT_EQ(decode_public_key(module_pk, &role), module.raw_public_key());
    EXPECT_EQ(role, KeyRole::Module);
}

TEST(NkeysTest, CorruptedPublicKeyIsRejected) {
    std::string pk = KeyPair::new_account().public_key();
    pk[20] = pk[20] == 'Q' ? 'R' : 'Q';
    EXPECT_THROW(decode_public_key(pk), std::runtime_error);
    EXPECT_THROW(KeyPair::from_public_key(pk), std::runtime_error);
}

TEST(NkeysTest, SeedRoundTrip) {
    KeyPair account = KeyPair::new_account();
    std::string seed = account.seed();
    EXPECT_EQ(seed.substr(0, 2), "SA");
    EXPECT_EQ(KeyPair::new_module().seed().substr(0, 2), "SM");

    KeyPair restored = KeyPair::from_seed(seed);
    EXPECT_EQ(restored.public_key(), account.public_key());
    EXPECT_EQ(restored.role(), KeyRole::Account);
}

TEST(NkeysTest, SignAndVerify) {
    KeyPair kp = KeyPair::new_account();
    std::vector<uint8_t> message = to_bytes("module bytes");
    std::vector<uint8_t> signature = kp.sign(message);
    ASSERT_EQ(signature.size(), ED25519_SIGNATURE_SIZE);

    KeyPair verifier = KeyPair::from_public_key(kp.public_key());
    EXPECT_FALSE(verifier.can_sign());
    EXPECT_TRUE(verifier.verify(message, signature));

    std::vector<uint8_t> tampered = message;
    tampered[0] ^= 0x01;
    EXPECT_FALSE(verifier.verify(tampered, signature));
    EXPECT_FALSE(KeyPair::new_account().verify(message, signature));
}

TEST(NkeysTest, VerifyOnlyPairCannotSign) {
    KeyPair verifier = KeyPair::from_public_key(KeyPair::new_module().public_key());
    EXPECT_WASCAP_ERROR(verifier.sign(to_bytes("x")), ErrorKind::SigningError);
    EXPECT_WASCAP_ERROR(verifier.seed(), ErrorKind::SigningError);
}
