/**
 * Runbox Primary Provider
 *
 * Trusted remote sandbox with kernel-level isolation. Receives the
 * snippet unwrapped together with the caller's identity and tier.
 */
#pragma once
#include "providers/remote_provider.hpp"

namespace runbox::providers {

class PrimaryProvider : public RemoteProvider {
public:
    static constexpr const char* DEFAULT_ID = "ch-gva-2";

    PrimaryProvider(RemoteProviderConfig config, std::shared_ptr<HttpClient> client);

    bool needs_wrapping() const override { return false; }

    // Request body sent to the sandbox API
    static nlohmann::json build_body(const ExecutionTask& task);

protected:
    ProviderResponse run(const ExecutionTask& task) override;
};

} // namespace runbox::providers
