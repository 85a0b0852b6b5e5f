#include "credhash/core/PasswordHasher.hpp"
#include "credhash/crypto/providers/OpenSslProviderFactory.hpp"
#include "test_utils/TestUtils.hpp"
#include <gtest/gtest.h>
#include <array>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>

namespace
{

using credhash::core::HashErrc;
using credhash::core::HashError;
using credhash::core::PasswordHash;
using credhash::core::PasswordHasher;
using credhash::test_utils::asBytes;

constexpr std::string_view g_kSlowTestsEnv{ "CREDH_RUN_SLOW_TESTS" };

class PasswordHasherTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_inner = credhash::crypto::providers::makeOpenSslCryptoProvider();
        m_crypto = std::make_unique<credhash::test_utils::InstrumentedCrypto>(*m_inner);
        m_hasher = std::make_unique<PasswordHasher>(*m_crypto);
    }

    void TearDown() override
    {
        m_hasher.reset();
        m_crypto.reset();
        m_inner.reset();
    }

    [[nodiscard]] std::string generate(std::string_view password, std::uint32_t iterations)
    {
        auto result = m_hasher->generateFromPassword(asBytes(password), iterations);
        if (const auto* error = std::get_if<HashError>(&result))
        {
            ADD_FAILURE() << "generateFromPassword failed: " << credhash::core::describe(*error);
            return {};
        }
        return std::get<std::string>(result);
    }

    std::unique_ptr<credhash::crypto::ICryptoProvider> m_inner;           // NOLINT
    std::unique_ptr<credhash::test_utils::InstrumentedCrypto> m_crypto; // NOLINT
    std::unique_ptr<PasswordHasher> m_hasher;                            // NOLINT
};

} // namespace

TEST_F(PasswordHasherTest, ConstructionDerivesDecoyReferenceOnce)
{
    EXPECT_EQ(m_crypto->deriveCalls(), 1U);
    EXPECT_EQ(m_crypto->lastIterations(), credhash::core::g_kDefaultIterations);
}

TEST_F(PasswordHasherTest, HashUsesDefaultParameters)
{
    auto result = m_hasher->hashPassword(asBytes("correct horse"));
    ASSERT_TRUE(std::holds_alternative<PasswordHash>(result));

    const auto& hash = std::get<PasswordHash>(result);
    EXPECT_EQ(hash.version(), credhash::core::g_kFormatVersion);
    EXPECT_EQ(hash.prf(), credhash::crypto::Prf::HmacSha256);
    EXPECT_EQ(hash.iterations(), credhash::core::g_kDefaultIterations);
    EXPECT_EQ(hash.salt().size(), credhash::core::g_kDefaultSaltBytes);
    EXPECT_EQ(hash.subkey().size(), credhash::crypto::g_kSubkeyBytes);
}

TEST_F(PasswordHasherTest, SamePasswordHashesDifferButBothVerify)
{
    auto first = m_hasher->hashPassword(asBytes("repeat"), 10U);
    auto second = m_hasher->hashPassword(asBytes("repeat"), 10U);
    ASSERT_TRUE(std::holds_alternative<PasswordHash>(first));
    ASSERT_TRUE(std::holds_alternative<PasswordHash>(second));

    const auto& a = std::get<PasswordHash>(first);
    const auto& b = std::get<PasswordHash>(second);
    EXPECT_FALSE(a == b);
    EXPECT_TRUE(m_hasher->verifyPassword(a, asBytes("repeat")));
    EXPECT_TRUE(m_hasher->verifyPassword(b, asBytes("repeat")));
}

TEST_F(PasswordHasherTest, RejectsIterationsOutOfRange)
{
    const std::size_t before = m_crypto->deriveCalls();

    auto zero = m_hasher->hashPassword(asBytes("pw"), 0U);
    ASSERT_TRUE(std::holds_alternative<HashError>(zero));
    EXPECT_EQ(std::get<HashError>(zero), HashErrc::Parameter);

    auto tooMany = m_hasher->generateFromPassword(asBytes("pw"), credhash::core::g_kMaxIterations + 1U);
    ASSERT_TRUE(std::holds_alternative<HashError>(tooMany));
    EXPECT_EQ(std::get<HashError>(tooMany), HashErrc::Parameter);

    EXPECT_EQ(m_crypto->deriveCalls(), before);
}

TEST_F(PasswordHasherTest, RandomSourceFailureIsReported)
{
    m_crypto->setRandomFails(true);

    auto result = m_hasher->hashPassword(asBytes("pw"));
    ASSERT_TRUE(std::holds_alternative<HashError>(result));
    EXPECT_EQ(std::get<HashError>(result), HashErrc::RandomSourceFailure);

    auto text = m_hasher->generateFromPassword(asBytes("pw"));
    ASSERT_TRUE(std::holds_alternative<HashError>(text));
    EXPECT_EQ(std::get<HashError>(text), HashErrc::RandomSourceFailure);
}

TEST_F(PasswordHasherTest, VerifyRejectsUnvalidatedComponents)
{
    const std::array<std::uint8_t, 16> salt{ 1U };
    const std::array<std::uint8_t, 32> subkey{};

    const PasswordHash zeroIterations{ salt, 0U, subkey };
    EXPECT_THROW((void)m_hasher->verifyPassword(zeroIterations, asBytes("pw")), std::invalid_argument);

    const PasswordHash emptySalt{ std::span<const std::uint8_t>{}, 1U, subkey };
    EXPECT_THROW((void)m_hasher->verifyPassword(emptySalt, asBytes("pw")), std::invalid_argument);
}

TEST_F(PasswordHasherTest, VerifiesKnownUsers)
{
    for (const auto& user : credhash::test_utils::g_kKnownUsers)
    {
        const auto ok = m_hasher->verifyEncodedHash(user.encoded, asBytes(user.password));
        EXPECT_TRUE(ok.matched) << user.name;
        EXPECT_FALSE(ok.error.has_value()) << user.name;
    }
}

TEST_F(PasswordHasherTest, WrongPasswordsDoNotVerify)
{
    const auto& josephine = credhash::test_utils::g_kKnownUsers[0];

    const auto suffixed = m_hasher->verifyEncodedHash(josephine.encoded, asBytes("In2Egypt!?"));
    EXPECT_FALSE(suffixed.matched);
    EXPECT_FALSE(suffixed.error.has_value());

    const auto empty = m_hasher->verifyEncodedHash(josephine.encoded, asBytes(""));
    EXPECT_FALSE(empty.matched);
    EXPECT_FALSE(empty.error.has_value());

    const auto otherUser = m_hasher->verifyEncodedHash(josephine.encoded, asBytes("REdNuIlsAnyejH3"));
    EXPECT_FALSE(otherUser.matched);
}

TEST_F(PasswordHasherTest, EmptyPasswordCanBeHashedAndVerified)
{
    const std::string encoded = generate("", 5U);
    ASSERT_FALSE(encoded.empty());

    EXPECT_TRUE(m_hasher->verifyEncodedHash(encoded, asBytes("")).matched);
    EXPECT_FALSE(m_hasher->verifyEncodedHash(encoded, asBytes(" ")).matched);
}

TEST_F(PasswordHasherTest, MalformedValueStillCostsOneDerivation)
{
    const std::string malformed{ std::string{ credhash::test_utils::g_kKnownUsers[0].encoded } + "??" };
    const std::size_t before = m_crypto->deriveCalls();

    const auto result = m_hasher->verifyEncodedHash(malformed, asBytes("In2Egypt!"));

    EXPECT_FALSE(result.matched);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(*result.error, HashErrc::Corrupt);
    EXPECT_EQ(result.error->detail, "illegal base64 data at input byte 82");
    EXPECT_EQ(m_crypto->deriveCalls(), before + 1U);
    EXPECT_EQ(m_crypto->lastIterations(), credhash::core::g_kDefaultIterations);
}

TEST_F(PasswordHasherTest, StructurallyInvalidValueReportsItsKind)
{
    // Valid base64, version byte 0.
    const auto result = m_hasher->verifyEncodedHash("AAAAAAEAACcQAAAAEA==", asBytes("pw"));
    EXPECT_FALSE(result.matched);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(*result.error, HashErrc::Version);
}

TEST_F(PasswordHasherTest, VerifyHonoursStoredIterationCount)
{
    const std::string encoded = generate("iterations", 3U);
    ASSERT_FALSE(encoded.empty());

    EXPECT_TRUE(m_hasher->verifyEncodedHash(encoded, asBytes("iterations")).matched);
    EXPECT_EQ(m_crypto->lastIterations(), 3U);
}

TEST_F(PasswordHasherTest, CompareReportsMismatchAndSuccess)
{
    for (std::uint32_t iterations{ credhash::core::g_kDefaultIterations }; iterations > 0U; iterations /= 10U)
    {
        const std::string encoded = generate("s3cr3t", iterations);
        ASSERT_FALSE(encoded.empty()) << iterations;

        const auto good = m_hasher->compareHashAndPassword(encoded, asBytes("s3cr3t"));
        EXPECT_TRUE(std::holds_alternative<std::monostate>(good)) << iterations;

        const auto bad = m_hasher->compareHashAndPassword(encoded, asBytes("s3cr3T"));
        ASSERT_TRUE(std::holds_alternative<HashError>(bad)) << iterations;
        EXPECT_EQ(std::get<HashError>(bad), HashErrc::Mismatch) << iterations;
    }
}

TEST_F(PasswordHasherTest, ComparePassesDecodeErrorsThrough)
{
    const auto result = m_hasher->compareHashAndPassword("not base64!", asBytes("pw"));
    ASSERT_TRUE(std::holds_alternative<HashError>(result));
    EXPECT_EQ(std::get<HashError>(result), HashErrc::Corrupt);
}

TEST_F(PasswordHasherTest, MaximumIterationsRoundTrip)
{
    if (!credhash::test_utils::envFlagSet(g_kSlowTestsEnv))
    {
        GTEST_SKIP() << "set CREDH_RUN_SLOW_TESTS=1 to run";
    }

    const std::string encoded = generate("slow", credhash::core::g_kMaxIterations);
    ASSERT_FALSE(encoded.empty());
    EXPECT_TRUE(std::holds_alternative<std::monostate>(m_hasher->compareHashAndPassword(encoded, asBytes("slow"))));
}
