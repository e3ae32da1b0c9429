#ifndef INCLUDE_DEVAUTH_STORAGE_ICREDENTIALSTORE_HPP
#define INCLUDE_DEVAUTH_STORAGE_ICREDENTIALSTORE_HPP

#include "devauth/storage/CredentialRecords.hpp"
#include <optional>

namespace devauth::storage
{

// Durable, encrypted persistence for registration and token state, plus the separately
// cleared record set holding in-flight flow state.
//
// Every mutating call is atomic: either all fields of the record are written or none are.
// Failures throw StorageError.
class ICredentialStore
{
public:
    ICredentialStore() = default;
    ICredentialStore(const ICredentialStore&) = delete;
    ICredentialStore& operator=(const ICredentialStore&) = delete;
    ICredentialStore(ICredentialStore&&) = delete;
    ICredentialStore& operator=(ICredentialStore&&) = delete;
    virtual ~ICredentialStore() = default;

    [[nodiscard]] virtual std::optional<DeviceRegistration> loadRegistration() const = 0;
    virtual void saveRegistration(const DeviceRegistration& registration) = 0;
    virtual void clearRegistration() = 0;

    [[nodiscard]] virtual std::optional<TokenSet> loadTokens() const = 0;
    // Replaces the whole token set. An absent refreshToken removes any stored one.
    virtual void saveTokens(const TokenSet& tokens) = 0;
    virtual void clearTokens() = 0;

    [[nodiscard]] virtual std::optional<PendingFlowState> loadPendingFlow(FlowKind kind) const = 0;
    // Overwrites any pending entry of the same kind.
    virtual void savePendingFlow(FlowKind kind, const PendingFlowState& pending) = 0;
    virtual void clearPendingFlow(FlowKind kind) = 0;

    // Registration, tokens and flow state.
    virtual void clearAll() = 0;
};

} // namespace devauth::storage

#endif // INCLUDE_DEVAUTH_STORAGE_ICREDENTIALSTORE_HPP
