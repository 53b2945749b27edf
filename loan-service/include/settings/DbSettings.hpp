#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace loans::settings {

/**
 * @brief Подключение к базе займов
 *
 * LOANS_DB_URL, если задана, используется как есть (libpq URI или key=value).
 * Иначе строка собирается из LOANS_DB_HOST / PORT / NAME / USER / PASSWORD.
 * LOANS_DB_CONNECT_TIMEOUT — секунды на установку соединения.
 */
class DbSettings {
public:
    DbSettings()
        : url_(readEnv("LOANS_DB_URL", ""))
        , host_(readEnv("LOANS_DB_HOST", "loans-postgres"))
        , name_(readEnv("LOANS_DB_NAME", "loans_db"))
        , user_(readEnv("LOANS_DB_USER", "loans_user"))
        , password_(readEnv("LOANS_DB_PASSWORD", "loans_password"))
    {
        port_ = readNumber("LOANS_DB_PORT", 5432);
        if (port_ < 1 || port_ > 65535) {
            throw std::invalid_argument("LOANS_DB_PORT out of range: " + std::to_string(port_));
        }
        connectTimeoutSeconds_ = readNumber("LOANS_DB_CONNECT_TIMEOUT", 5);
        if (connectTimeoutSeconds_ < 1) {
            throw std::invalid_argument("LOANS_DB_CONNECT_TIMEOUT must be positive");
        }
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getName() const { return name_; }
    std::string getUser() const { return user_; }
    std::string getPassword() const { return password_; }
    int getConnectTimeoutSeconds() const { return connectTimeoutSeconds_; }

    std::string getConnectionString() const {
        if (!url_.empty()) {
            return url_;
        }
        return "host=" + host_ + " port=" + std::to_string(port_)
             + " dbname=" + name_ + " user=" + user_ + " password=" + password_
             + " connect_timeout=" + std::to_string(connectTimeoutSeconds_);
    }

    /**
     * @brief Куда подключаемся, без пароля (для логов)
     */
    std::string describe() const {
        if (!url_.empty()) {
            return "LOANS_DB_URL";
        }
        return user_ + "@" + host_ + ":" + std::to_string(port_) + "/" + name_;
    }

private:
    std::string url_;
    std::string host_;
    int port_ = 5432;
    std::string name_;
    std::string user_;
    std::string password_;
    int connectTimeoutSeconds_ = 5;

    static std::string readEnv(const char* name, const char* fallback) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(fallback);
    }

    static int readNumber(const char* name, int fallback) {
        const char* value = std::getenv(name);
        if (!value) {
            return fallback;
        }
        try {
            return std::stoi(value);
        } catch (const std::exception&) {
            throw std::invalid_argument(std::string(name) + " is not a number: " + value);
        }
    }
};

} // namespace loans::settings
