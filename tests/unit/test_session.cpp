/**
 * @file test_session.cpp
 * @brief Session context unit tests
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <stdexcept>

#include "tbrsa/core/errors.h"
#include "tbrsa/session.h"

using tbrsa::Session;
using tbrsa::ZZ;

class SessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        session_.generate_keys(ZZ(61), ZZ(53), ZZ(17));
    }

    Session session_;
};

TEST(SessionEmptyTest, NoKeysLoaded) {
    Session s;
    EXPECT_FALSE(s.has_keys());
    EXPECT_THROW(s.keys(), std::logic_error);
    EXPECT_THROW(s.public_key(), std::logic_error);
    EXPECT_THROW(s.encrypt("A"), std::logic_error);
    EXPECT_THROW(s.decrypt({ZZ(2790)}), std::logic_error);
    EXPECT_THROW(s.encrypt_text("A"), std::logic_error);
    EXPECT_THROW(s.decrypt_text("CuY="), std::logic_error);
    EXPECT_TRUE(s.last_ciphertext().empty());
}

TEST_F(SessionTest, GenerateKeys) {
    ASSERT_TRUE(session_.has_keys());
    EXPECT_EQ(session_.keys().n, 3233);
    EXPECT_EQ(session_.keys().d, 2753);
    EXPECT_EQ(session_.public_key().e, 17);
}

TEST_F(SessionTest, EncryptRecordsLastCiphertext) {
    tbrsa::rsa::Ciphertext ct = session_.encrypt("AB");
    ASSERT_EQ(ct.size(), 2u);
    EXPECT_EQ(ct[0], 2790);
    EXPECT_EQ(session_.last_ciphertext(), ct);
    EXPECT_EQ(session_.decrypt(session_.last_ciphertext()), "AB");
}

TEST_F(SessionTest, FailedEncryptKeepsLastCiphertext) {
    session_.encrypt("A");
    EXPECT_THROW(session_.encrypt("\xE2\x9C\x93"), tbrsa::EncodingRangeError);
    ASSERT_EQ(session_.last_ciphertext().size(), 1u);
    EXPECT_EQ(session_.last_ciphertext()[0], 2790);
}

TEST_F(SessionTest, BlockModeRecordsLastBlock) {
    std::string b64 = session_.encrypt_text("A");
    EXPECT_EQ(b64, "CuY=");
    EXPECT_EQ(session_.last_block_ciphertext(), b64);
    EXPECT_EQ(session_.decrypt_text(b64), "A");
}

TEST_F(SessionTest, FailedGenerationKeepsOldKey) {
    session_.encrypt("A");

    EXPECT_THROW(session_.generate_keys(ZZ(61), ZZ(61)), tbrsa::InvalidKeyError);
    EXPECT_THROW(session_.generate_keys(ZZ(61), ZZ(54)), tbrsa::InvalidKeyError);
    EXPECT_THROW(session_.generate_random_keys(4), tbrsa::InvalidKeyError);

    ASSERT_TRUE(session_.has_keys());
    EXPECT_EQ(session_.keys().n, 3233);
    EXPECT_EQ(session_.keys().d, 2753);
    EXPECT_EQ(session_.last_ciphertext().size(), 1u);
}

TEST_F(SessionTest, NewKeyDropsOldCiphertexts) {
    session_.encrypt("A");
    session_.encrypt_text("A");
    session_.generate_keys(ZZ(1009), ZZ(1013));

    EXPECT_EQ(session_.keys().n, 1022117);
    EXPECT_TRUE(session_.last_ciphertext().empty());
    EXPECT_TRUE(session_.last_block_ciphertext().empty());
}

TEST_F(SessionTest, RandomKeys) {
    const tbrsa::rsa::RSAKeyPair& kp = session_.generate_random_keys(64);
    EXPECT_EQ(kp.e, 65537);
    EXPECT_TRUE(kp.is_valid());
    EXPECT_EQ(session_.decrypt(session_.encrypt("round trip")), "round trip");
}

TEST_F(SessionTest, ClearWipesEverything) {
    session_.encrypt("A");
    session_.encrypt_text("A");
    session_.clear();

    EXPECT_FALSE(session_.has_keys());
    EXPECT_TRUE(session_.last_ciphertext().empty());
    EXPECT_TRUE(session_.last_block_ciphertext().empty());
    EXPECT_THROW(session_.encrypt("A"), std::logic_error);

    // Reusable after clear
    session_.generate_keys(ZZ(61), ZZ(53), ZZ(17));
    EXPECT_TRUE(session_.has_keys());
}

TEST_F(SessionTest, SetKeys) {
    tbrsa::rsa::RSAKeyPair kp(ZZ(3233), ZZ(17), ZZ(2753));
    Session other;
    other.set_keys(kp);
    EXPECT_EQ(other.decrypt(session_.encrypt("hi")), "hi");

    tbrsa::rsa::RSAKeyPair bad(ZZ(3233), ZZ(17), ZZ(0));
    EXPECT_THROW(other.set_keys(bad), tbrsa::InvalidKeyError);
    EXPECT_EQ(other.keys().d, 2753);
}

TEST_F(SessionTest, SessionsAreIndependent) {
    Session other;
    other.generate_keys(ZZ(1009), ZZ(1013));
    EXPECT_EQ(session_.keys().n, 3233);
    EXPECT_EQ(other.keys().n, 1022117);
}
