#include <gtest/gtest.h>

#include "crypto.hpp"
#include "util.hpp"

TEST(FingerprintTest, EmptyInputIsSha256OfNothing) {
    EXPECT_EQ(fingerprint_hex(fingerprint(Bytes{})),
        "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(fingerprint(nullptr, 0), fingerprint(Bytes{}));
}

TEST(FingerprintTest, KnownDigest) {
    EXPECT_EQ(fingerprint_hex(fingerprint(to_bytes("hello"))),
        "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");
}

TEST(FingerprintTest, DeterministicAndContentSensitive) {
    Bytes a = to_bytes("clipboard payload");
    Bytes b = to_bytes("clipboard payload.");

    EXPECT_EQ(fingerprint(a), fingerprint(a));
    EXPECT_NE(fingerprint(a), fingerprint(b));
    EXPECT_NE(fingerprint(a), Fingerprint{});
}

TEST(FingerprintTest, BinaryPayloadWithNulBytes) {
    Bytes with_nul = { 'a', 0x00, 'b' };
    Bytes without = { 'a', 'b' };
    EXPECT_NE(fingerprint(with_nul), fingerprint(without));
}

TEST(FingerprintTest, HexIsLowercase64Chars) {
    std::string hex = fingerprint_hex(fingerprint(to_bytes("x")));
    ASSERT_EQ(hex.size(), 64u);
    EXPECT_EQ(hex.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST(Base64Test, StandardPaddedAlphabet) {
    EXPECT_EQ(base64_encode(Bytes{}), "");
    EXPECT_EQ(base64_encode(to_bytes("f")), "Zg==");
    EXPECT_EQ(base64_encode(to_bytes("foobar")), "Zm9vYmFy");
    EXPECT_EQ(base64_encode(Bytes{ 0xfb, 0xff }), "+/8=");
}

TEST(Base64Test, DecodeIgnoresLineBreaksAndRejectsGarbage) {
    Bytes out;
    ASSERT_TRUE(base64_decode("Zm9v\nYmFy\n", out));
    EXPECT_EQ(to_string(out), "foobar");

    Bytes untouched = to_bytes("keep");
    EXPECT_FALSE(base64_decode("Zm9v*", untouched));
    EXPECT_EQ(to_string(untouched), "keep");
}

TEST(SealTest, EncryptDecryptWithDerivedKey) {
    byte salt[SALT_LEN] = { 0 };
    byte key[KEY_LEN];
    ASSERT_TRUE(derive_key_from_passphrase("correct horse", salt, key));

    Bytes plain = { 'a', 0x00, 'b', 0xff };
    Bytes ct;
    byte nonce[NONCE_LEN];
    ASSERT_TRUE(encrypt_blob(key, plain, ct, nonce));
    EXPECT_EQ(ct.size(), plain.size() + ABYTES);

    Bytes back;
    ASSERT_TRUE(decrypt_blob(key, ct, nonce, back));
    EXPECT_EQ(back, plain);
}

TEST(SealTest, WrongKeyAndTamperingAreRejected) {
    byte salt[SALT_LEN] = { 0 };
    byte key[KEY_LEN];
    byte other[KEY_LEN];
    ASSERT_TRUE(derive_key_from_passphrase("one", salt, key));
    ASSERT_TRUE(derive_key_from_passphrase("two", salt, other));

    Bytes ct;
    byte nonce[NONCE_LEN];
    ASSERT_TRUE(encrypt_blob(key, to_bytes("secret"), ct, nonce));

    Bytes out;
    EXPECT_FALSE(decrypt_blob(other, ct, nonce, out));

    ct[0] ^= 0x01;
    EXPECT_FALSE(decrypt_blob(key, ct, nonce, out));

    Bytes short_ct(ABYTES - 1, 0);
    EXPECT_FALSE(decrypt_blob(key, short_ct, nonce, out));
}

TEST(SealTest, EmptyPlaintext) {
    byte salt[SALT_LEN] = { 1 };
    byte key[KEY_LEN];
    ASSERT_TRUE(derive_key_from_passphrase("pw", salt, key));

    Bytes ct;
    byte nonce[NONCE_LEN];
    ASSERT_TRUE(encrypt_blob(key, Bytes{}, ct, nonce));
    Bytes out = to_bytes("stale");
    ASSERT_TRUE(decrypt_blob(key, ct, nonce, out));
    EXPECT_TRUE(out.empty());
}
