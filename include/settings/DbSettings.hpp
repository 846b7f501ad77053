#pragma once

#include <string>
#include <cstdlib>

namespace inventory::settings {

/**
 * @brief PostgreSQL склада
 *
 * ENV: INVENTORY_DB_HOST, INVENTORY_DB_PORT, INVENTORY_DB_NAME,
 * INVENTORY_DB_USER, INVENTORY_DB_PASSWORD,
 * INVENTORY_DB_CONNECT_TIMEOUT_SECONDS (default 5).
 *
 * Каждая операция хранилища открывает своё соединение, поэтому
 * connect_timeout ограничивает ожидание при недоступной БД.
 */
class DbSettings {
public:
    DbSettings()
        : host_(env("INVENTORY_DB_HOST", "inventory-postgres"))
        , port_(std::stoi(env("INVENTORY_DB_PORT", "5432")))
        , name_(env("INVENTORY_DB_NAME", "inventory_db"))
        , user_(env("INVENTORY_DB_USER", "inventory_user"))
        , password_(env("INVENTORY_DB_PASSWORD", "inventory_secret_password"))
        , connectTimeoutSeconds_(std::stoi(env("INVENTORY_DB_CONNECT_TIMEOUT_SECONDS", "5")))
    {}

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getName() const { return name_; }

    std::string getConnectionString() const {
        return "host=" + host_ +
               " port=" + std::to_string(port_) +
               " dbname=" + name_ +
               " user=" + user_ +
               " password=" + password_ +
               " connect_timeout=" + std::to_string(connectTimeoutSeconds_) +
               " application_name=inventory-service";
    }

private:
    std::string host_;
    int port_;
    std::string name_;
    std::string user_;
    std::string password_;
    int connectTimeoutSeconds_;

    static std::string env(const char* name, const char* fallback) {
        const char* value = std::getenv(name);
        return value ? value : fallback;
    }
};

} // namespace inventory::settings
