#include "devauth/security/DeviceKey.hpp"
#include "devauth/security/ScopeWipe.hpp"
#include "devauth/security/SecureBuffer.hpp"
#include "devauth/security/SecureRandom.hpp"
#include "test_utils/TestUtils.hpp"
#include <algorithm>
#include <array>
#include <cstddef>
#include <fstream>
#include <gtest/gtest.h>
#include <regex>
#include <set>
#include <vector>

namespace
{

using namespace devauth::security;

constexpr std::size_t g_bufferSize{ 32U };
constexpr std::uint8_t g_nonZeroByte{ 0xA5U };

TEST(SecureEqualsTest, MismatchedSizesReturnFalse)
{
    std::vector<std::byte> a(10);
    std::vector<std::byte> b(5);
    EXPECT_FALSE(secureEquals(std::span<const std::byte>{ a }, std::span<const std::byte>{ b }));
}

TEST(SecureEqualsTest, SameSizeDifferentContentReturnsFalse)
{
    std::vector<std::byte> a(10, std::byte{ 1 });
    std::vector<std::byte> b(10, std::byte{ 2 });
    EXPECT_FALSE(secureEquals(std::span<const std::byte>{ a }, std::span<const std::byte>{ b }));
}

TEST(SecureEqualsTest, StringOverloadComparesContent)
{
    EXPECT_TRUE(secureEquals(std::string_view{ "state-X" }, std::string_view{ "state-X" }));
    EXPECT_FALSE(secureEquals(std::string_view{ "state-X" }, std::string_view{ "state-Y" }));
    EXPECT_TRUE(secureEquals(std::string_view{}, std::string_view{}));
}

TEST(SecureRandomTest, FillEmptySpanSucceeds)
{
    std::span<std::uint8_t> s{};
    EXPECT_TRUE(secureRandomFill(s));
}

TEST(SecureRandomTest, FillProducesDifferentOutputs)
{
    std::array<std::uint8_t, g_bufferSize> a{};
    std::array<std::uint8_t, g_bufferSize> b{};
    ASSERT_TRUE(secureRandomFill(a));
    ASSERT_TRUE(secureRandomFill(b));
    EXPECT_NE(a, b);
}

TEST(SecureRandomTest, UuidIsVersion4)
{
    const std::regex uuidV4{ "^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$" };
    std::set<std::string> seen;
    constexpr int kTrials{ 32 };
    for (int i{}; i < kTrials; ++i)
    {
        const auto uuid{ secureRandomUuid() };
        ASSERT_TRUE(uuid.has_value());
        EXPECT_TRUE(std::regex_match(*uuid, uuidV4)) << *uuid;
        seen.insert(*uuid);
    }
    EXPECT_EQ(seen.size(), static_cast<std::size_t>(kTrials));
}

TEST(ScopeWipeTest, WipesOnDestruction)
{
    std::array<std::uint8_t, g_bufferSize> buffer{};
    buffer.fill(g_nonZeroByte);
    {
        const auto guard{ scopeWipe(std::span{ buffer }) };
        (void)guard;
        EXPECT_EQ(buffer[0], g_nonZeroByte);
    }
    EXPECT_TRUE(std::all_of(buffer.begin(), buffer.end(), [](std::uint8_t b) { return b == 0U; }));
}

TEST(ScopeWipeTest, ReleaseDisablesWipe)
{
    std::string body{ "client_assertion=abc" };
    {
        auto guard{ scopeWipe(body) };
        guard.release();
    }
    EXPECT_EQ(body, "client_assertion=abc");
}

TEST(ScopeWipeTest, WipesStringContentInPlace)
{
    std::string body{ "refresh_token=secret" };
    const auto size{ body.size() };
    {
        auto guard{ scopeWipe(body) };
    }
    ASSERT_EQ(body.size(), size);
    EXPECT_TRUE(std::all_of(body.begin(), body.end(), [](char c) { return c == '\0'; }));
}

TEST(SecureStringTest, SecureReleaseEmptiesString)
{
    auto token{ secureStringFrom("access-token-value") };
    secureRelease(token);
    EXPECT_TRUE(token.empty());
}

TEST(SecureBufferTest, ConversionsPreserveBytes)
{
    const auto buffer{ toSecureBuffer("iat") };
    ASSERT_EQ(buffer.size(), 3U);
    EXPECT_EQ(buffer[0], static_cast<std::uint8_t>('i'));
    const auto text{ toSecureString(std::span<const std::uint8_t>{ buffer.data(), buffer.size() }) };
    EXPECT_EQ(asStringView(text), "iat");
}

class DeviceKeyTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_dir = devauth::test_utils::makeSecureTempDir("device_key_");
        ASSERT_FALSE(m_dir.empty());
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(m_dir, ec);
    }

    std::filesystem::path m_dir; // NOLINT
};

TEST_F(DeviceKeyTest, CreatesOwnerOnlyKeyAndReloadsIt)
{
    const auto keyFile{ m_dir / "device.key" };
    const auto first{ loadOrCreateDeviceKey(keyFile) };
    ASSERT_EQ(first.size(), g_deviceKeyBytes);

    const auto perms{ std::filesystem::status(keyFile).permissions() };
    EXPECT_EQ(perms & (std::filesystem::perms::group_all | std::filesystem::perms::others_all),
              std::filesystem::perms::none);

    const auto second{ loadOrCreateDeviceKey(keyFile) };
    EXPECT_EQ(first, second);
}

TEST_F(DeviceKeyTest, RejectsKeyReadableByOthers)
{
    const auto keyFile{ m_dir / "device.key" };
    (void)loadOrCreateDeviceKey(keyFile);
    std::filesystem::permissions(keyFile, std::filesystem::perms::others_read, std::filesystem::perm_options::add);
    EXPECT_THROW((void)loadOrCreateDeviceKey(keyFile), std::runtime_error);
}

TEST_F(DeviceKeyTest, RejectsTruncatedKey)
{
    const auto keyFile{ m_dir / "device.key" };
    {
        std::ofstream out{ keyFile, std::ios::binary };
        out << "short";
    }
    std::filesystem::permissions(keyFile, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace);
    EXPECT_THROW((void)loadOrCreateDeviceKey(keyFile), std::runtime_error);
}

} // namespace
