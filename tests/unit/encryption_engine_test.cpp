#include "qrpass/core/CiphertextEnvelope.hpp"
#include "qrpass/core/EncryptionEngine.hpp"
#include "qrpass/core/KeyStore.hpp"
#include "qrpass/core/PayloadCodec.hpp"
#include "qrpass/crypto/Base64.hpp"
#include "qrpass/crypto/providers/OpenSslProviderFactory.hpp"
#include "test_utils/FakeCrypto.hpp"
#include "test_utils/TestUtils.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>

using qrpass::core::CiphertextEnvelope;
using qrpass::core::EncryptionEngine;
using qrpass::core::KeyStore;

namespace
{

constexpr std::string_view kPlain{ "الاسم: أحمد علي\nالرقم الوظيفي: 12345\nالقسم: المالية" };

class EncryptionEngineTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.valid());
        m_keys = std::make_unique<KeyStore>(*m_crypto, m_dir.path() / "encryption_key.bin");
    }

    qrpass::test_utils::TempDir m_dir{ "engine_" }; // NOLINT
    std::unique_ptr<qrpass::crypto::ICryptoProvider> m_crypto{
        qrpass::crypto::providers::makeOpenSslCryptoProvider()
    };                                 // NOLINT
    std::unique_ptr<KeyStore> m_keys; // NOLINT
};

} // namespace

TEST_F(EncryptionEngineTest, DecryptRecoversPlaintext)
{
    EncryptionEngine engine{ *m_crypto };
    const auto& key{ m_keys->getOrCreateKey() };

    const auto envelope{ engine.encrypt(kPlain, key) };
    const auto decrypted{ engine.decrypt(envelope, key) };

    ASSERT_TRUE(decrypted.has_value());
    EXPECT_EQ(*decrypted, kPlain);
}

TEST_F(EncryptionEngineTest, RoundTripsThroughEnvelopeText)
{
    EncryptionEngine engine{ *m_crypto };
    const auto& key{ m_keys->getOrCreateKey() };

    const std::string text{ engine.encrypt(kPlain, key).toText() };
    const auto parsed{ CiphertextEnvelope::fromText(text) };
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->toText(), text);

    const auto decrypted{ engine.decrypt(*parsed, key) };
    ASSERT_TRUE(decrypted.has_value());
    const auto record{ qrpass::core::PayloadCodec::parse(*decrypted) };
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->employeeId, "12345");
}

TEST_F(EncryptionEngineTest, EnvelopeTextIsIvColonCiphertext)
{
    EncryptionEngine engine{ *m_crypto };
    const std::string text{ engine.encrypt(kPlain, m_keys->getOrCreateKey()).toText() };

    const auto colon{ text.find(':') };
    ASSERT_NE(colon, std::string::npos);
    EXPECT_EQ(text.find(':', colon + 1U), std::string::npos);

    const auto iv{ qrpass::crypto::base64Decode(std::string_view{ text }.substr(0, colon)) };
    const auto cipher{ qrpass::crypto::base64Decode(std::string_view{ text }.substr(colon + 1U)) };
    ASSERT_TRUE(iv.has_value());
    ASSERT_TRUE(cipher.has_value());
    EXPECT_EQ(iv->size(), 16U);
    EXPECT_EQ(cipher->size() % 16U, 0U);
    EXPECT_GT(cipher->size(), kPlain.size());
}

TEST_F(EncryptionEngineTest, KeyFileBytesDecryptEnvelope)
{
    EncryptionEngine engine{ *m_crypto };
    const auto envelope{ engine.encrypt(kPlain, m_keys->getOrCreateKey()) };

    // An independent consumer holding only the key file and the envelope text.
    const auto rawKey{ qrpass::test_utils::readFileBytes(m_keys->keyFile()) };
    const auto parsed{ CiphertextEnvelope::fromText(envelope.toText()) };
    ASSERT_TRUE(parsed.has_value());
    const auto plain{ m_crypto->aes256CbcDecrypt(rawKey, parsed->iv, parsed->cipherText) };
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(qrpass::security::asStringView(*plain), kPlain);
}

TEST_F(EncryptionEngineTest, RepeatedEncryptionsNeverRepeat)
{
    constexpr int kTrials{ 100 };
    EncryptionEngine engine{ *m_crypto };
    const auto& key{ m_keys->getOrCreateKey() };

    std::set<std::string> envelopes;
    std::set<std::string> ivs;
    for (int i{}; i < kTrials; ++i)
    {
        const auto envelope{ engine.encrypt(kPlain, key) };
        EXPECT_TRUE(envelopes.insert(envelope.toText()).second);
        EXPECT_TRUE(ivs.insert(qrpass::test_utils::toHex(envelope.iv)).second);
    }
}

TEST_F(EncryptionEngineTest, WrongKeyDoesNotDecrypt)
{
    EncryptionEngine engine{ *m_crypto };
    const auto envelope{ engine.encrypt(kPlain, m_keys->getOrCreateKey()) };

    KeyStore otherStore{ *m_crypto, m_dir.path() / "other_key.bin" };
    const auto decrypted{ engine.decrypt(envelope, otherStore.getOrCreateKey()) };
    if (decrypted.has_value())
    {
        EXPECT_NE(*decrypted, kPlain);
    }
}

TEST_F(EncryptionEngineTest, EmptyPlaintextIsOneBlock)
{
    EncryptionEngine engine{ *m_crypto };
    const auto envelope{ engine.encrypt("", m_keys->getOrCreateKey()) };
    EXPECT_EQ(envelope.cipherText.size(), 16U);
}

TEST_F(EncryptionEngineTest, RandomFailureThrows)
{
    const auto& key{ m_keys->getOrCreateKey() };
    qrpass::test_utils::FailingRandomCrypto failing{};
    EncryptionEngine engine{ failing };
    EXPECT_THROW(static_cast<void>(engine.encrypt(kPlain, key)), std::runtime_error);
}

TEST(CiphertextEnvelope, FromTextRejectsMalformedEnvelopes)
{
    const std::string iv{ "AAECAwQFBgcICQoLDA0ODw==" };
    const std::string block{ "AAAAAAAAAAAAAAAAAAAAAA==" };

    EXPECT_TRUE(CiphertextEnvelope::fromText(iv + ":" + block).has_value());

    EXPECT_FALSE(CiphertextEnvelope::fromText("").has_value());
    EXPECT_FALSE(CiphertextEnvelope::fromText(iv + block).has_value());
    EXPECT_FALSE(CiphertextEnvelope::fromText(iv + ":" + block + ":").has_value());
    EXPECT_FALSE(CiphertextEnvelope::fromText(iv + ":").has_value());
    EXPECT_FALSE(CiphertextEnvelope::fromText("AAEC:" + block).has_value());
    EXPECT_FALSE(CiphertextEnvelope::fromText(iv + ":AAECAw==").has_value());
    EXPECT_FALSE(CiphertextEnvelope::fromText(iv + ":" + block.substr(0, 20) + "*===").has_value());
}
