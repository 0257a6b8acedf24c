/**
 * Runbox E2B Provider
 *
 * Secondary sandbox. One attempt is three calls: create a sandbox from
 * a language template, run the wrapped snippet in it, delete it. The
 * delete is attempted whenever a sandbox was created.
 */
#pragma once
#include "providers/remote_provider.hpp"

namespace runbox::providers {

class E2bProvider : public RemoteProvider {
public:
    static constexpr const char* DEFAULT_ID = "e2b";
    static constexpr const char* DEFAULT_ENDPOINT = "https://api.e2b.dev";
    static constexpr uint64_t CLEANUP_TIMEOUT_MS = 5000;

    E2bProvider(RemoteProviderConfig config, std::shared_ptr<HttpClient> client);

    bool needs_wrapping() const override { return true; }

    static const char* template_for(exec::Language language);

protected:
    ProviderResponse run(const ExecutionTask& task) override;

private:
    std::string base_url() const;
    void destroy_sandbox(const std::string& sandbox_id);
};

} // namespace runbox::providers
