#pragma once

#include <settings/IServerSettings.hpp>
#include <string>
#include <cstdlib>
#include <stdexcept>

namespace loans::settings {

/**
 * @brief Адрес, который слушает loan-service (SERVER_HOST, SERVER_PORT)
 * @throws std::invalid_argument если порт не число или вне 1..65535
 */
class ServerSettings : public IServerSettings {
public:
    ServerSettings() {
        if (const char* host = std::getenv("SERVER_HOST")) {
            host_ = host;
        }
        if (const char* port = std::getenv("SERVER_PORT")) {
            port_ = parsePort(port);
        }
    }

    std::string getHost() const override { return host_; }
    uint16_t getPort() const override { return port_; }

private:
    std::string host_ = "0.0.0.0";
    uint16_t port_ = 8080;

    static uint16_t parsePort(const std::string& value) {
        int port = 0;
        try {
            port = std::stoi(value);
        } catch (const std::exception&) {
            throw std::invalid_argument("SERVER_PORT is not a number: " + value);
        }
        if (port < 1 || port > 65535) {
            throw std::invalid_argument("SERVER_PORT out of range: " + value);
        }
        return static_cast<uint16_t>(port);
    }
};

} // namespace loans::settings
