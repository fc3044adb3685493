#include "IdentityApp.hpp"
#include "settings/ConfigurationError.hpp"
#include <iostream>
#include <csignal>

// Global pointer for signal handler
identity::IdentityApp* g_app = nullptr;

void signalHandler(int signal) {
    std::cout << "\n[main] Received signal " << signal << ", shutting down..." << std::endl;
    if (g_app) {
        g_app->stop();
    }
}

int main(int argc, char* argv[]) {
    std::cout << "[main] Identity Service v1.0.0" << std::endl;

    try {
        identity::IdentityApp app;
        g_app = &app;

        // Kubernetes останавливает под через SIGTERM
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        app.run(argc, argv);

        g_app = nullptr;
        std::cout << "[main] Identity Service stopped" << std::endl;
        return 0;

    } catch (const identity::settings::ConfigurationError& e) {
        std::cerr << "[main] Refusing to start, invalid configuration: " << e.what() << std::endl;
        return identity::settings::EXIT_CONFIGURATION_ERROR;
    } catch (const identity::domain::SigningKeyUnavailableException& e) {
        std::cerr << "[main] Refusing to start, signing key not configured: " << e.what() << std::endl;
        return identity::settings::EXIT_CONFIGURATION_ERROR;
    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
