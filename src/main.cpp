#include <argparse/argparse.hpp>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>

#include "api_server.hpp"
#include "clan_lookup_service.hpp"
#include "config_manager.hpp"
#include "http_client.hpp"

using namespace clanlookup;

std::shared_ptr<APIServer> api_server;

void set_log_level(const std::string& log_level) {
    if (log_level == "debug") {
        crow::logger::setLogLevel(crow::LogLevel::Debug);
    } else if (log_level == "info") {
        crow::logger::setLogLevel(crow::LogLevel::Info);
    } else if (log_level == "warning") {
        crow::logger::setLogLevel(crow::LogLevel::Warning);
    } else if (log_level == "error") {
        crow::logger::setLogLevel(crow::LogLevel::Error);
    } else {
        std::cerr << "Invalid log level: " << log_level << ". Using default (info)." << std::endl;
        crow::logger::setLogLevel(crow::LogLevel::Info);
    }
}

std::shared_ptr<ConfigManager> initializeConfig(const std::string& config_file, bool required) {
    auto config_manager = std::make_shared<ConfigManager>(std::filesystem::path(config_file), required);
    try {
        config_manager->loadConfig();
    } catch (const std::exception& e) {
        throw std::runtime_error("Error while loading configuration, Details: " + std::string(e.what()));
    }
    return config_manager;
}

void terminateHandler() {
    CROW_LOG_ERROR << "Unhandled exception caught! clan-lookup is giving up";

    auto ex = std::current_exception();
    if (ex) {
        try {
            std::rethrow_exception(ex);
        } catch (const std::exception& e) {
            CROW_LOG_ERROR << "exception caught: " << e.what();
        } catch (...) {
            CROW_LOG_ERROR << "exception of unknown type caught";
        }
    }
    std::abort();
}

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        CROW_LOG_INFO << "Received signal " << signal << ", shutting down...";
        if (api_server) {
            api_server->stop();
        }
    }
}

int main(int argc, char* argv[])
{
    std::set_terminate(terminateHandler);

    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    argparse::ArgumentParser program("clanlookup");

    program.add_argument("-c", "--config")
        .help("Path to the clanlookup.yaml configuration file")
        .default_value(std::string("clanlookup.yaml"));

    program.add_argument("-p", "--port")
        .help("Port number for the web server")
        .default_value(-1)
        .scan<'i', int>();

    program.add_argument("--log-level")
        .help("Set the log level (debug, info, warning, error)")
        .default_value(std::string("info"));

    try {
        program.parse_args(argc, argv);
    } catch (const std::runtime_error& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    std::string config_file = program.get<std::string>("--config");
    int cmd_port = program.get<int>("--port");
    std::string log_level = program.get<std::string>("--log-level");

    set_log_level(log_level);

    std::shared_ptr<ConfigManager> config_manager;
    try {
        config_manager = initializeConfig(config_file, program.is_used("--config"));
    } catch (const std::exception& e) {
        CROW_LOG_ERROR << e.what();
        return 1;
    }

    if (cmd_port != -1) {
        try {
            config_manager->setHttpPort(cmd_port);
        } catch (const ConfigurationError& e) {
            CROW_LOG_ERROR << e.what();
            return 1;
        }
    }

    HTTPClient::globalInit();

    const auto& upstream = config_manager->getConfig().upstream;
    auto lookup_service = std::make_shared<ClanLookupService>(
        std::make_shared<HTTPClient>(upstream.verify_ssl),
        upstream.base_url,
        upstream.timeout_seconds);

    api_server = std::make_shared<APIServer>(config_manager, lookup_service);

    CROW_LOG_INFO << "clan-lookup server starting on port " << config_manager->getHttpPort();
    api_server->run();

    api_server.reset();
    HTTPClient::globalCleanup();

    return 0;
}
