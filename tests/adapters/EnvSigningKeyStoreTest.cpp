#include <gtest/gtest.h>

#include "adapters/secondary/EnvSigningKeyStore.hpp"

#include <cstdlib>

using namespace identity;
using adapters::secondary::EnvSigningKeyStore;

class EnvSigningKeyStoreTest : public ::testing::Test {
protected:
    void SetUp() override { clearEnv(); }
    void TearDown() override { clearEnv(); }

    static void clearEnv() {
        unsetenv("IDENTITY_JWT_KEY_ID");
        unsetenv("IDENTITY_JWT_SECRET");
        unsetenv("IDENTITY_JWT_PREVIOUS_KEY_ID");
        unsetenv("IDENTITY_JWT_PREVIOUS_SECRET");
    }

    const std::string secret_ = "0123456789abcdef0123456789abcdef";
};

TEST_F(EnvSigningKeyStoreTest, LoadsCurrentKeyWithDefaultKid) {
    setenv("IDENTITY_JWT_SECRET", secret_.c_str(), 1);

    EnvSigningKeyStore store;

    EXPECT_EQ(store.currentKey().keyId, "k1");
    EXPECT_EQ(store.currentKey().secret, secret_);
    EXPECT_TRUE(store.findKey("k1").has_value());
    EXPECT_FALSE(store.findKey("k2").has_value());
}

TEST_F(EnvSigningKeyStoreTest, MissingSecret_Throws) {
    EXPECT_THROW(EnvSigningKeyStore{}, domain::SigningKeyUnavailableException);
}

TEST_F(EnvSigningKeyStoreTest, ShortSecret_Throws) {
    setenv("IDENTITY_JWT_SECRET", "too-short", 1);

    EXPECT_THROW(EnvSigningKeyStore{}, domain::SigningKeyUnavailableException);
}

TEST_F(EnvSigningKeyStoreTest, PreviousKey_UsableForValidationOnly) {
    setenv("IDENTITY_JWT_KEY_ID", "k2", 1);
    setenv("IDENTITY_JWT_SECRET", secret_.c_str(), 1);
    setenv("IDENTITY_JWT_PREVIOUS_KEY_ID", "k1", 1);
    setenv("IDENTITY_JWT_PREVIOUS_SECRET", "fedcba9876543210fedcba9876543210", 1);

    EnvSigningKeyStore store;

    EXPECT_EQ(store.currentKey().keyId, "k2");
    ASSERT_TRUE(store.findKey("k1").has_value());
    EXPECT_EQ(store.findKey("k1")->secret, "fedcba9876543210fedcba9876543210");
}

TEST_F(EnvSigningKeyStoreTest, PreviousKeyWithSameKid_Throws) {
    setenv("IDENTITY_JWT_SECRET", secret_.c_str(), 1);
    setenv("IDENTITY_JWT_PREVIOUS_KEY_ID", "k1", 1);
    setenv("IDENTITY_JWT_PREVIOUS_SECRET", "fedcba9876543210fedcba9876543210", 1);

    EXPECT_THROW(EnvSigningKeyStore{}, domain::SigningKeyUnavailableException);
}

TEST_F(EnvSigningKeyStoreTest, PreviousSecretWithoutKid_Throws) {
    setenv("IDENTITY_JWT_SECRET", secret_.c_str(), 1);
    setenv("IDENTITY_JWT_PREVIOUS_SECRET", "fedcba9876543210fedcba9876543210", 1);

    EXPECT_THROW(EnvSigningKeyStore{}, domain::SigningKeyUnavailableException);
}
