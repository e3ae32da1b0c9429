#ifndef DEVAUTH_TESTS_TEST_UTILS_TESTUTILS_HPP
#define DEVAUTH_TESTS_TEST_UTILS_TESTUTILS_HPP

#include "devauth/core/Jwt.hpp"
#include "devauth/security/SecureRandom.hpp"
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

namespace devauth::test_utils
{

[[nodiscard]] inline std::optional<std::string> getEnv(std::string_view name)
{
    if (name.empty())
    {
        return std::nullopt;
    }
    const char* value{ std::getenv(std::string{ name }.c_str()) };
    if (value == nullptr)
    {
        return std::nullopt;
    }
    return std::string{ value };
}

namespace detail
{

[[nodiscard]] inline std::filesystem::path xdgRuntimeRoot() noexcept
{
    std::filesystem::path root{};
    if (const auto xdgRuntimeDir{ getEnv("XDG_RUNTIME_DIR") }; xdgRuntimeDir.has_value() && !xdgRuntimeDir->empty())
    {
        root = std::filesystem::path{ *xdgRuntimeDir };
    }
    return root;
}

[[nodiscard]] inline bool tryPrepareBaseDir(const std::filesystem::path& candidate) noexcept
{
    std::error_code ec{};
    const bool existed{ std::filesystem::exists(candidate, ec) };
    if (ec)
    {
        return false;
    }
    if (!existed)
    {
        ec.clear();
        if (!std::filesystem::create_directories(candidate, ec) || ec)
        {
            return false;
        }
    }

    ec.clear();
    if (!std::filesystem::is_directory(candidate, ec) || ec)
    {
        return false;
    }

    // The base dir is unusable if it cannot be made private.
    ec.clear();
    std::filesystem::permissions(candidate, std::filesystem::perms::owner_all, std::filesystem::perm_options::replace,
                                 ec);
    if (ec)
    {
        return false;
    }

    ec.clear();
    const auto perms{ std::filesystem::status(candidate, ec).permissions() };
    if (ec)
    {
        return false;
    }
    const auto publicBits{ std::filesystem::perms::group_all | std::filesystem::perms::others_all };
    return ((perms & publicBits) == std::filesystem::perms::none);
}

} // namespace detail

[[nodiscard]] inline std::string toHex(std::span<const std::uint8_t> bytes)
{
    constexpr char kHex[] = "0123456789abcdef";
    constexpr std::uint8_t kNibbleShift{ 4U };
    constexpr std::uint8_t kNibbleMask{ 0x0FU };

    std::string out;
    out.reserve(bytes.size() * 2U);
    for (const std::uint8_t b : bytes)
    {
        out.push_back(kHex[(b >> kNibbleShift) & kNibbleMask]);
        out.push_back(kHex[b & kNibbleMask]);
    }
    return out;
}

// Creates an owner-only directory with a CSPRNG name under $XDG_RUNTIME_DIR or the OS temp dir.
// Returns an empty path on failure.
[[nodiscard]] inline std::filesystem::path makeSecureTempDir(std::string_view prefix)
{
    constexpr std::size_t kTokenBytes{ 16U };
    constexpr std::size_t kMaxAttempts{ 16U };

    std::filesystem::path base{};
    {
        std::error_code tmpEc{};
        const std::filesystem::path tmpRoot{ std::filesystem::temp_directory_path(tmpEc) };
        const std::array<std::filesystem::path, 2> roots{ detail::xdgRuntimeRoot(), tmpRoot };
        for (const auto& root : roots)
        {
            if (root.empty())
            {
                continue;
            }

            const auto candidate{ root / std::filesystem::path{ "devauth_tests" } };
            if (!detail::tryPrepareBaseDir(candidate))
            {
                continue;
            }

            base = candidate;
            break;
        }
    }
    if (base.empty())
    {
        return {};
    }

    for (std::size_t attempt{}; attempt < kMaxAttempts; ++attempt)
    {
        std::array<std::uint8_t, kTokenBytes> rnd{};
        if (!devauth::security::secureRandomFill(std::span<std::uint8_t>{ rnd }))
        {
            break;
        }

        std::string name{ prefix };
        name += toHex(std::span<const std::uint8_t>{ rnd });
        const auto dir{ base / std::filesystem::path{ name } };

        std::error_code ec{};
        if (std::filesystem::create_directory(dir, ec) && !ec)
        {
            std::filesystem::permissions(dir, std::filesystem::perms::owner_all,
                                         std::filesystem::perm_options::replace, ec);
            if (ec)
            {
                ec.clear();
                std::filesystem::remove_all(dir, ec);
                continue;
            }
            return dir;
        }
    }

    return {};
}

// 32 bytes of 0x42: a fixed wrapping key for store and custody tests.
[[nodiscard]] inline devauth::security::SecureBuffer testDeviceKey()
{
    constexpr std::size_t kKeyBytes{ 32U };
    constexpr std::uint8_t kFill{ 0x42U };
    return devauth::security::SecureBuffer(kKeyBytes, kFill);
}

// Unsigned token in JWS compact form carrying `exp` (omitted when std::nullopt). Only the
// claims are inspected on the device, so the signature segment is a placeholder.
[[nodiscard]] inline std::string makeIat(std::optional<std::int64_t> expEpochSeconds)
{
    nlohmann::json claims{ { "sub", "enrollment" }, { "iss", "test-server" } };
    if (expEpochSeconds)
    {
        claims["exp"] = *expEpochSeconds;
    }
    const nlohmann::json header{ { "alg", "RS256" }, { "typ", "JWT" } };
    return devauth::core::jwt::encodeSegment(header) + "." + devauth::core::jwt::encodeSegment(claims) + ".c2ln";
}

// Settable clock shared between a test and the engines it drives.
class FakeClock final
{
public:
    static constexpr std::int64_t g_start{ 1'700'000'000'000 };

    [[nodiscard]] std::int64_t nowMs() const noexcept
    {
        return m_nowMs->load();
    }

    [[nodiscard]] std::int64_t nowSeconds() const noexcept
    {
        return nowMs() / 1000;
    }

    void advanceMs(std::int64_t deltaMs) noexcept
    {
        m_nowMs->fetch_add(deltaMs);
    }

    [[nodiscard]] std::function<std::int64_t()> provider() const
    {
        return [now = m_nowMs]() { return now->load(); };
    }

private:
    std::shared_ptr<std::atomic<std::int64_t>> m_nowMs{ std::make_shared<std::atomic<std::int64_t>>(g_start) };
};

} // namespace devauth::test_utils

#endif // DEVAUTH_TESTS_TEST_UTILS_TESTUTILS_HPP
