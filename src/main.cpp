#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include "service/server.hpp"
#include "util/config.hpp"
#include "util/logger.hpp"
#include <iostream>
#include <string>

// ANSI escape codes
namespace term {
    constexpr const char* RESET  = "\033[0m";
    constexpr const char* BOLD   = "\033[1m";
    constexpr const char* DIM    = "\033[2m";
    constexpr const char* RED    = "\033[31m";
    constexpr const char* CYAN   = "\033[36m";
    constexpr const char* GREEN  = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* WHITE  = "\033[37m";
}

void print_banner() {
    std::cout << term::CYAN << term::BOLD;
    std::cout << R"(
    ╔═══════════════════════════════════════════════════════════╗
    ║                                                           ║
    ║    ██████╗ ██╗   ██╗███╗   ██╗██████╗  ██████╗ ██╗  ██╗   ║
    ║    ██╔══██╗██║   ██║████╗  ██║██╔══██╗██╔═══██╗╚██╗██╔╝   ║
    ║    ██████╔╝██║   ██║██╔██╗ ██║██████╔╝██║   ██║ ╚███╔╝    ║
    ║    ██╔══██╗██║   ██║██║╚██╗██║██╔══██╗██║   ██║ ██╔██╗    ║
    ║    ██║  ██║╚██████╔╝██║ ╚████║██████╔╝╚██████╔╝██╔╝ ██╗   ║
    ║    ╚═╝  ╚═╝ ╚═════╝ ╚═╝  ╚═══╝╚═════╝  ╚═════╝ ╚═╝  ╚═╝   ║
    ║                                                           ║
    ╚═══════════════════════════════════════════════════════════╝
)" << term::RESET;
}

void print_status_line(const std::string& label, const std::string& value, const char* color) {
    std::cout << "    │" << term::RESET << "  " << label;
    for (size_t i = label.size(); i < 12; i++) std::cout << " ";
    std::cout << color << value << term::RESET;
    size_t used = 14 + value.size();
    for (size_t i = used; i < 57; i++) std::cout << " ";
    std::cout << term::WHITE << term::BOLD << "│\n";
}

void print_status_box(const runbox::util::ServiceConfig& config, uint16_t port) {
    auto provider_state = [](const runbox::util::ProviderSettings& p) {
        return p.id + (p.configured() ? "" : " (not configured)");
    };

    std::cout << term::WHITE << term::BOLD;
    std::cout << "\n    ┌─────────────────────────────────────────────────────────┐\n";
    std::cout << "    │" << term::RESET << term::CYAN << "  SERVICE STATUS" << term::RESET
              << term::WHITE << term::BOLD << "                                         │\n";
    std::cout << "    ├─────────────────────────────────────────────────────────┤\n";

    print_status_line("Version", "v0.1.0", term::GREEN);
    print_status_line("Listen", fmt::format("{}:{}", config.host, port), term::YELLOW);
    print_status_line("Primary", provider_state(config.primary),
                      config.primary.configured() ? term::GREEN : term::YELLOW);
    print_status_line("Secondary", provider_state(config.secondary),
                      config.secondary.configured() ? term::GREEN : term::YELLOW);
    print_status_line("Tertiary", provider_state(config.tertiary),
                      config.tertiary.configured() ? term::GREEN : term::YELLOW);
    print_status_line("Strict", config.strict_wrapping ? "enabled" : "disabled",
                      config.strict_wrapping ? term::GREEN : term::YELLOW);

    std::cout << "    └─────────────────────────────────────────────────────────┘\n" << term::RESET;
}

void print_ready_message() {
    std::cout << "\n" << term::GREEN << term::BOLD;
    std::cout << "    ══════════════════════════════════════════════════════════\n";
    std::cout << "      RUNBOX READY" << term::RESET << term::DIM << "  ·  Press Ctrl+C to shutdown\n";
    std::cout << term::GREEN << term::BOLD;
    std::cout << "    ══════════════════════════════════════════════════════════\n";
    std::cout << term::RESET << "\n";
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [config.json]\n\n"
              << "Settings are read from the optional JSON file, then .env, then\n"
              << "RUNBOX_* environment variables.\n";
}

int main(int argc, char** argv) {
    std::string config_path;
    if (argc > 1) {
        std::string arg = argv[1];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        config_path = arg;
    }

    std::string error;
    auto config = runbox::util::load_service_config(config_path, error);
    if (!config) {
        std::cerr << "    " << term::BOLD << term::RED << "✗" << term::RESET
                  << "  Invalid configuration: " << error << "\n";
        return 1;
    }

    print_banner();
    runbox::util::init_logger(config->log_level);
    spdlog::debug("Effective configuration: {}", config->summary());

    runbox::service::Server server(*config);
    if (!server.init()) {
        std::cout << "\n    " << term::BOLD << term::RED << "✗" << term::RESET
                  << "  Failed to initialize Runbox\n\n";
        return 1;
    }

    print_status_box(*config, server.port());
    print_ready_message();

    // Run (blocks until Ctrl+C)
    server.run();

    std::cout << "\n    " << term::YELLOW << "⟳" << term::RESET
              << "  Shut down gracefully\n\n";
    return 0;
}
