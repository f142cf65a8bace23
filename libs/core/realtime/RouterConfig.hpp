#pragma once
#include <cstdlib>
#include <string>

namespace vantage {

// Push channel endpoint. Defaults match the indicator server's local setup.
struct RouterConfig {
    std::string host = "localhost";
    std::string port = "8080";
    std::string target = "/indicator-ws";

    static RouterConfig fromEnvironment() {
        RouterConfig cfg;
        if (const char* env = std::getenv("VANTAGE_WS_HOST"); env && *env) cfg.host = env;
        if (const char* env = std::getenv("VANTAGE_WS_PORT"); env && *env) cfg.port = env;
        if (const char* env = std::getenv("VANTAGE_WS_TARGET"); env && *env) cfg.target = env;
        return cfg;
    }

    std::string url() const { return "ws://" + host + ":" + port + target; }
};

} // namespace vantage
