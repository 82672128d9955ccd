#pragma once
#include "clipwire_common.hpp"

#include <string>

// -------- Crypto helpers --------
// Must be called once before any other function here
bool crypto_init();

// SHA-256 of the payload; total, including for empty input
Fingerprint fingerprint(const byte* data, size_t len);
Fingerprint fingerprint(const Bytes& data);

// Lowercase hex digest, for logs and diagnostics
std::string fingerprint_hex(const Fingerprint& fp);

// -------- Base64 (standard alphabet, padded) --------
std::string base64_encode(const Bytes& data);
bool base64_decode(const std::string& text, Bytes& out);

// -------- Passphrase encryption --------
// Argon2id; key must hold KEY_LEN bytes
bool derive_key_from_passphrase(const std::string& passphrase,
    const byte salt[SALT_LEN],
    byte key[KEY_LEN]);

// XChaCha20-Poly1305-IETF with a fresh random nonce
bool encrypt_blob(const byte key[KEY_LEN],
    const Bytes& plaintext,
    Bytes& out_ct,
    byte nonce[NONCE_LEN]);

// false on wrong key or tampered ciphertext
bool decrypt_blob(const byte key[KEY_LEN],
    const Bytes& ct,
    const byte nonce[NONCE_LEN],
    Bytes& out_plain);
