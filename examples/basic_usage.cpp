// Basic RecordForge usage example
// Compile: g++ -std=c++23 -I../include basic_usage.cpp -lspdlog -lfmt -o basic_usage

#include <RecordForge/generator.hpp>
#include <RecordForge/overrides.hpp>
#include <RecordForge/rules.hpp>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace RecordForge;

struct Server {
    std::string host;
    int port;
};

struct Config {
    std::string app_name;
    int version;
    bool debug_mode;
    std::string admin_email;
    Server server;
    std::vector<std::string> plugins;
    std::optional<int> timeout;
};

int main() {
    GenerationContext ctx;

    auto config = Generate<Config>(ctx);
    if (!config) {
        std::cout << GenerateResultToString(config) << std::endl;
        return 1;
    }

    std::cout << "App: " << config->app_name << std::endl;
    std::cout << "Version: " << config->version << std::endl;
    std::cout << "Debug: " << (config->debug_mode ? "ON" : "OFF") << std::endl;
    std::cout << "Admin: " << config->admin_email << std::endl;
    std::cout << "Server: " << config->server.host << ":" << config->server.port << std::endl;
    std::cout << "Plugins: " << config->plugins.size() << std::endl;
    /* App: arbitrary-1, Version: 2, Debug: OFF, Admin: random-3@example.com,
       Server: arbitrary-4:5, Plugins: 0 */

    // Only what the test cares about, the rest stays generated
    auto staging = Generate<Config>({{"debug_mode", true}, {"server.port", 8080}}, ctx);
    if (staging) {
        std::cout << "Staging: " << staging->server.host << ":" << staging->server.port << std::endl;
    }

    // Custom rules run before the built-in ones
    ctx.registerRule<std::string>(rules::field_named("host"),
                                  [](const FieldInfo &, SequenceCounter & c) {
                                      return "node" + std::to_string(c.next()) + ".internal";
                                  });
    auto custom = Generate<Config>(ctx);
    if (custom) {
        std::cout << "Custom host: " << custom->server.host << std::endl;
    }

    // Key typos are reported, not ignored
    auto typo = Generate<Config>({{"server.prot", 8080}}, ctx);
    if (!typo) {
        std::cout << GenerateResultToString(typo) << std::endl;
        /* When generating Config.server.prot, error 'UNKNOWN_FIELD' */
    }

    return 0;
}
