/**
 * Runbox Modal Provider
 *
 * Tertiary sandbox. Runs the wrapped snippet as the argument of a
 * language interpreter inside a stock container image.
 */
#pragma once
#include <vector>
#include "providers/remote_provider.hpp"

namespace runbox::providers {

class ModalProvider : public RemoteProvider {
public:
    static constexpr const char* DEFAULT_ID = "modal";
    static constexpr const char* DEFAULT_ENDPOINT =
        "https://api.modal.com/v1/apps/code-sandbox/functions/execute";

    ModalProvider(RemoteProviderConfig config, std::shared_ptr<HttpClient> client);

    bool needs_wrapping() const override { return true; }

    static const char* image_for(exec::Language language);
    static std::vector<std::string> command_for(exec::Language language, const std::string& code);
    static nlohmann::json build_body(const ExecutionTask& task);

protected:
    ProviderResponse run(const ExecutionTask& task) override;
};

} // namespace runbox::providers
