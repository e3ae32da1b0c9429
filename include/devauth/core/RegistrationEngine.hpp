#ifndef INCLUDE_DEVAUTH_CORE_REGISTRATIONENGINE_HPP
#define INCLUDE_DEVAUTH_CORE_REGISTRATIONENGINE_HPP

#include "devauth/core/ApiResult.hpp"
#include "devauth/core/EngineConfig.hpp"
#include "devauth/crypto/IKeyCustody.hpp"
#include "devauth/net/ITransportClient.hpp"
#include "devauth/security/SecureBuffer.hpp"
#include "devauth/storage/ICredentialStore.hpp"
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace devauth::core
{

// Dynamic client registration (RFC 7591) of this device, authorized by a one-time IAT and
// authenticated afterwards with private_key_jwt.
//
// Unregistered -> EnrollmentRequested -> AwaitingIat -> Registering -> Registered. Any failure
// after key generation deletes the new key, so a failed registration leaves no key behind.
class RegistrationEngine final
{
public:
    RegistrationEngine(devauth::crypto::IKeyCustody& custody, devauth::storage::ICredentialStore& store,
                       devauth::net::ITransportClient& transport, EngineConfig config,
                       NowProvider now = &systemNowMs);

    [[nodiscard]] const EngineConfig& config() const noexcept
    {
        return m_config;
    }

    // Pure: GET target for the user-agent, carrying deviceVersion, deviceType, deviceAttestation,
    // redirectUri and state.
    [[nodiscard]] std::string buildEnrollmentUrl(std::string_view serverUrl, std::string_view state) const;

    // Returns the issued client_id. An invalid or expired IAT fails before any network call.
    // Concurrent calls on one engine are serialized.
    [[nodiscard]] ApiResult<std::string> registerDevice(std::string_view serverUrl,
                                                        const devauth::security::SecureString& iat) noexcept;

    [[nodiscard]] std::future<ApiResult<std::string>> registerDeviceAsync(std::string serverUrl,
                                                                          devauth::security::SecureString iat);

    // True only if a registration is stored AND its key is still held by the custody.
    [[nodiscard]] bool isDeviceRegistered() const noexcept;

    [[nodiscard]] std::optional<devauth::storage::DeviceRegistration> registration() const noexcept;

    // Deletes the key, then the registration, tokens and pending flows. Idempotent.
    [[nodiscard]] ApiResult<Unit> resetRegistration() noexcept;

    [[nodiscard]] ApiResult<devauth::net::SystemInfo> probeServer(std::string_view serverUrl) noexcept;

    [[nodiscard]] std::future<ApiResult<devauth::net::SystemInfo>> probeServerAsync(std::string serverUrl);

    [[nodiscard]] std::string clientName() const;

private:
    devauth::crypto::IKeyCustody* m_custody{ nullptr };
    devauth::storage::ICredentialStore* m_store{ nullptr };
    devauth::net::ITransportClient* m_transport{ nullptr };
    EngineConfig m_config;
    NowProvider m_now;
    std::mutex m_registerMutex;

    [[nodiscard]] ApiResult<std::string> registerLocked(std::string_view serverUrl,
                                                        const devauth::security::SecureString& iat);

    // Returns false if the custody refused; the caller reports it alongside the primary error.
    [[nodiscard]] bool discardKey(std::string_view keyId) noexcept;
};

} // namespace devauth::core

#endif // INCLUDE_DEVAUTH_CORE_REGISTRATIONENGINE_HPP
