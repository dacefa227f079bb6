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

#include "ed25519.h"

#include <openssl/crypto.h>

/**
 * Generates a new Ed25519 signing key using cryptographically secure random bytes
 * @return 32-byte Ed25519 private key seed
 */
std::vector<uint8_t> generate_signing_key() {
    std::vector<uint8_t> seed(ED25519_SEED_SIZE);
    if (RAND_bytes(seed.data(), static_cast<int>(seed.size())) != 1) {
        throw std::runtime_error("Failed to generate random bytes");
    }
    return seed;
}

/**
 * Derives the public verification key from an Ed25519 signing key
 * @param signing_key 32-byte Ed25519 private key
 * @return 32-byte Ed25519 public key for signature verification
 */
std::vector<uint8_t> get_verify_key(const std::vector<uint8_t>& signing_key) {
    if (signing_key.size() != ED25519_SEED_SIZE) {
        throw std::runtime_error("Invalid signing key length");
    }

    std::vector<uint8_t> pk(ED25519_PUBLIC_KEY_SIZE);

    EVP_PKEY* pkey = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, signing_key.data(), signing_key.size());
    if (!pkey) {
        throw std::runtime_error("Failed to create Ed25519 key");
    }

    size_t pk_len = pk.size();
    if (EVP_PKEY_get_raw_public_key(pkey, pk.data(), &pk_len) != 1 || pk_len != ED25519_PUBLIC_KEY_SIZE) {
        EVP_PKEY_free(pkey);
        throw std::runtime_error("Failed to extract public key");
    }

    EVP_PKEY_free(pkey);
    return pk;
}

/**
 * Verifies an Ed25519 signature over a message
 * @param message Bytes that were signed
 * @param signature 64-byte raw signature
 * @param verify_key_bytes 32-byte Ed25519 public key
 * @return True if signature is valid, false otherwise
 */
bool verify_signature_fast(std::span<const uint8_t> message, std::span<const uint8_t> signature, std::span<const uint8_t> verify_key_bytes) {
    if (verify_key_bytes.size() != ED25519_PUBLIC_KEY_SIZE) {
        DEBUG_LOG("ERROR: Invalid verify key size: " + std::to_string(verify_key_bytes.size()));
        return false;
    }
    if (signature.size() != ED25519_SIGNATURE_SIZE) {
        DEBUG_LOG("ERROR: Invalid signature size: " + std::to_string(signature.size()));
        return false;
    }

    if (is_debug_enabled()) {
        DEBUG_LOG("Signature bytes (first 16): " + debug_hex(signature.data(), signature.size()));
        DEBUG_LOG("Message bytes to verify: " + std::to_string(message.size()) + " bytes");
    }

    EVP_PKEY* pkey = EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, verify_key_bytes.data(), verify_key_bytes.size());
    if (!pkey) {
        DEBUG_LOG("ERROR: Failed to create EVP_PKEY from verify key");
        return false;
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        DEBUG_LOG("ERROR: Failed to create EVP_MD_CTX");
        EVP_PKEY_free(pkey);
        return false;
    }

    if (EVP_DigestVerifyInit(ctx, nullptr, nullptr, nullptr, pkey) != 1) {
        DEBUG_LOG("ERROR: EVP_DigestVerifyInit failed");
        EVP_MD_CTX_free(ctx);
        EVP_PKEY_free(pkey);
        return false;
    }

    int verify_result = EVP_DigestVerify(ctx, signature.data(), signature.size(), message.data(), message.size());
    bool result = (verify_result == 1);
    if (verify_result != 1) {
        // Failed verification leaves an entry on the OpenSSL error queue
        ERR_clear_error();
    }

    DEBUG_LOG("Signature verification: " + std::string(result ? "SUCCESS" : "FAILED"));

    EVP_MD_CTX_free(ctx);
    EVP_PKEY_free(pkey);
    return result;
}

KeyPair::~KeyPair() {
    if (!seed_.empty()) {
        OPENSSL_cleanse(seed_.data(), seed_.size());
    }
}

KeyPair KeyPair::generate(KeyRole role) {
    std::vector<uint8_t> seed = generate_signing_key();
    std::vector<uint8_t> pk = get_verify_key(seed);
    return KeyPair(std::move(seed), std::move(pk), role);
}

KeyPair KeyPair::new_account() {
    return generate(KeyRole::Account);
}

KeyPair KeyPair::new_module() {
    return generate(KeyRole::Module);
}

KeyPair KeyPair::from_raw_seed(const std::vector<uint8_t>& seed, KeyRole role) {
    std::vector<uint8_t> pk = get_verify_key(seed);
    return KeyPair(seed, std::move(pk), role);
}

KeyPair KeyPair::from_seed(std::string_view encoded_seed) {
    DecodedSeed decoded = decode_seed(encoded_seed);
    KeyPair kp = from_raw_seed(decoded.seed, decoded.role);
    OPENSSL_cleanse(decoded.seed.data(), decoded.seed.size());
    return kp;
}

KeyPair KeyPair::from_public_key(std::string_view encoded_public_key) {
    KeyRole role = KeyRole::Account;
    std::vector<uint8_t> pk = decode_public_key(encoded_public_key, &role);
    return KeyPair({}, std::move(pk), role);
}

std::string KeyPair::public_key() const {
    return encode_public_key(role_, public_key_);
}

std::string KeyPair::seed() const {
    if (seed_.empty()) {
        throw WascapException(ErrorKind::SigningError, "key pair has no seed");
    }
    return encode_seed(role_, seed_);
}

/**
 * Signs a message with the pair's Ed25519 seed
 * @param message Bytes to sign
 * @return 64-byte raw signature
 * @throws WascapException(SigningError) for verify-only pairs or OpenSSL failures
 */
std::vector<uint8_t> KeyPair::sign(std::span<const uint8_t> message) const {
    if (seed_.empty()) {
        throw WascapException(ErrorKind::SigningError, "key pair has no seed");
    }

    EVP_PKEY* pkey = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed_.data(), seed_.size());
    if (!pkey) {
        throw WascapException(ErrorKind::SigningError, "Failed to create Ed25519 key");
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        EVP_PKEY_free(pkey);
        throw WascapException(ErrorKind::SigningError, "Failed to create signing context");
    }

    if (EVP_DigestSignInit(ctx, nullptr, nullptr, nullptr, pkey) != 1) {
        EVP_MD_CTX_free(ctx);
        EVP_PKEY_free(pkey);
        throw WascapException(ErrorKind::SigningError, "Failed to initialize signing");
    }

    std::vector<uint8_t> signature(ED25519_SIGNATURE_SIZE);
    size_t sig_len = signature.size();
    if (EVP_DigestSign(ctx, signature.data(), &sig_len, message.data(), message.size()) != 1 || sig_len != ED25519_SIGNATURE_SIZE) {
        EVP_MD_CTX_free(ctx);
        EVP_PKEY_free(pkey);
        throw WascapException(ErrorKind::SigningError, "Signing failed");
    }

    EVP_MD_CTX_free(ctx);
    EVP_PKEY_free(pkey);
    return signature;
}

bool KeyPair::verify(std::span<const uint8_t> message, std::span<const uint8_t> signature) const {
    return verify_signature_fast(message, signature, public_key_);
}
