#include "crypto.hpp"
#include "logging.hpp"

// -------- Crypto helpers --------
bool crypto_init() {
    if (sodium_init() < 0) {
        audit_log_level(LogLevel::ERROR,
            "crypto_init: sodium_init failed",
            "crypto_module",
            "failure");
        return false;
    }
    return true;
}

Fingerprint fingerprint(const byte* data, size_t len) {
    Fingerprint fp{};
    // crypto_hash_sha256 accepts a null pointer only with zero length
    static const byte empty[1] = { 0 };
    crypto_hash_sha256(fp.data(),
        (data && len > 0) ? data : empty,
        static_cast<unsigned long long>(len));
    return fp;
}

Fingerprint fingerprint(const Bytes& data) {
    return fingerprint(data.data(), data.size());
}

std::string fingerprint_hex(const Fingerprint& fp) {
    std::string out;
    out.resize(fp.size() * 2 + 1);
    sodium_bin2hex(&out[0], out.size(), fp.data(), fp.size());
    out.resize(fp.size() * 2); // drop the terminator
    return out;
}


// -------- Base64 --------
std::string base64_encode(const Bytes& data) {
    const int variant = sodium_base64_VARIANT_ORIGINAL;
    std::string out;
    out.resize(sodium_base64_ENCODED_LEN(data.size(), variant));
    sodium_bin2base64(&out[0], out.size(), data.data(), data.size(), variant);
    out.resize(out.size() - 1); // drop the terminator
    return out;
}

bool base64_decode(const std::string& text, Bytes& out) {
    Bytes buf(text.size() / 4 * 3 + 3);
    size_t bin_len = 0;
    const char* end = nullptr;
    if (sodium_base642bin(buf.data(), buf.size(),
        text.data(), text.size(),
        "\n\r ", &bin_len, &end,
        sodium_base64_VARIANT_ORIGINAL) != 0 ||
        end != text.data() + text.size())
    {
        audit_log_level(LogLevel::WARN,
            "base64_decode: malformed input",
            "crypto_module",
            "failure");
        return false;
    }
    buf.resize(bin_len);
    out = std::move(buf);
    return true;
}


// -------- Passphrase encryption --------
bool derive_key_from_passphrase( // symmetric key derivation using Argon2id
    const std::string& passphrase,
    const byte salt[SALT_LEN],
    byte key[KEY_LEN]
)
{
    if (!salt || !key) {
        audit_log_level(LogLevel::ERROR,
            "derive_key_from_passphrase: null pointer",
            "crypto_module",
            "failure");
        return false;
    }

    if (passphrase.empty() || passphrase.size() > MAX_PASS_LEN) {
        audit_log_level(LogLevel::WARN,
            "derive_key_from_passphrase: invalid passphrase length",
            "crypto_module",
            "failure");
        return false;
    }

    if (crypto_pwhash(key,
        KEY_LEN,
        passphrase.data(),
        passphrase.size(),
        salt,
        OPSLIMIT,
        MEMLIMIT,
        crypto_pwhash_ALG_ARGON2ID13) != 0)
    {
        // out of memory
        audit_log_level(LogLevel::ERROR,
            "derive_key_from_passphrase: crypto_pwhash failed",
            "crypto_module",
            "failure");
        return false;
    }

    return true;
}

bool encrypt_blob(
    const byte key[KEY_LEN],
    const Bytes& plaintext,
    Bytes& out_ct,
    byte nonce[NONCE_LEN]
)
{
    if (!key || !nonce) {
        audit_log_level(LogLevel::ERROR,
            "encrypt_blob: null key or nonce",
            "crypto_module",
            "failure");
        return false;
    }

    if (plaintext.size() > MAX_CLIPBOARD_SIZE) {
        audit_log_level(LogLevel::WARN,
            "encrypt_blob: plaintext too large",
            "crypto_module",
            "failure");
        return false;
    }

    randombytes_buf(nonce, NONCE_LEN);

    Bytes ct(plaintext.size() + ABYTES);
    unsigned long long ct_len = 0;
    if (crypto_aead_xchacha20poly1305_ietf_encrypt(
        ct.data(),
        &ct_len,
        plaintext.data(),
        plaintext.size(),
        nullptr,          // additional data - none
        0,
        nullptr,          // nsec - not used
        nonce,
        key) != 0)
    {
        audit_log_level(LogLevel::ERROR,
            "encrypt_blob: crypto_aead_xchacha20poly1305_ietf_encrypt failed",
            "crypto_module",
            "failure");
        return false;
    }

    ct.resize(static_cast<size_t>(ct_len));
    out_ct = std::move(ct);
    return true;
}

bool decrypt_blob(
    const byte key[KEY_LEN],
    const Bytes& ct,
    const byte nonce[NONCE_LEN],
    Bytes& out_plain
)
{
    if (!key || !nonce) {
        audit_log_level(LogLevel::ERROR,
            "decrypt_blob: null key or nonce",
            "crypto_module",
            "failure");
        return false;
    }

    if (ct.size() < ABYTES) {
        audit_log_level(LogLevel::WARN,
            "decrypt_blob: ciphertext too small",
            "crypto_module",
            "failure");
        return false;
    }

    Bytes plain(ct.size() - ABYTES + 1); // never empty, so data() is non-null
    unsigned long long plain_len = 0;
    if (crypto_aead_xchacha20poly1305_ietf_decrypt(
        plain.data(),
        &plain_len,
        nullptr,      // nsec - not used
        ct.data(),
        ct.size(),
        nullptr,      // additional data - none
        0,
        nonce,
        key) != 0)
    {
        // wrong key, corrupted or tampered ciphertext
        audit_log_level(LogLevel::WARN,
            "decrypt_blob: authentication failed",
            "crypto_module",
            "failure");
        return false;
    }

    plain.resize(static_cast<size_t>(plain_len));
    out_plain = std::move(plain);
    return true;
}
