// include/settings/DbSettings.hpp
#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>
#include <iostream>
#include <algorithm>
#include <cctype>

namespace bank::settings
{

    /**
     * @brief Настройки подключения к PostgreSQL
     *
     * Читает параметры из переменных окружения (K8s ENV).
     * lockTimeoutMs - сколько ждать строковую блокировку (SELECT ... FOR UPDATE)
     * до того, как считать это конфликтом.
     * rowLocking = false - режим только оптимистичных проверок по version.
     */
    class DbSettings
    {
    public:
        DbSettings()
        {
            host_ = getEnvOrDefault("BANK_DB_HOST", "bank-postgres");
            port_ = getIntOrDefault("BANK_DB_PORT", 5432);
            name_ = getEnvOrDefault("BANK_DB_NAME", "bank_db");
            user_ = getEnvOrDefault("BANK_DB_USER", "bank_user");
            password_ = getEnvOrDefault("BANK_DB_PASSWORD", "bank_secret_password");
            lockTimeoutMs_ = getIntOrDefault("BANK_DB_LOCK_TIMEOUT_MS", 2000);
            rowLocking_ = getBoolOrDefault("BANK_DB_ROW_LOCKING", true);
        }

        std::string getHost() const { return host_; }
        int getPort() const { return port_; }
        std::string getName() const { return name_; }
        std::string getUser() const { return user_; }
        std::string getPassword() const { return password_; }
        int getLockTimeoutMs() const { return lockTimeoutMs_; }
        bool isRowLockingEnabled() const { return rowLocking_; }

        std::string getConnectionString() const
        {
            return "host=" + host_ + " port=" + std::to_string(port_) +
                   " dbname=" + name_ + " user=" + user_ + " password=" + password_;
        }

    private:
        std::string host_;
        int port_;
        std::string name_;
        std::string user_;
        std::string password_;
        int lockTimeoutMs_;
        bool rowLocking_;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }

        static int getIntOrDefault(const char *name, int defaultValue)
        {
            const char *value = std::getenv(name);
            if (!value)
            {
                return defaultValue;
            }
            try
            {
                int parsed = std::stoi(value);
                if (parsed >= 0)
                {
                    return parsed;
                }
            }
            catch (const std::exception &)
            {
            }
            std::cerr << "[DbSettings] Invalid " << name << "='" << value
                      << "', using " << defaultValue << std::endl;
            return defaultValue;
        }

        static bool getBoolOrDefault(const char *name, bool defaultValue)
        {
            const char *value = std::getenv(name);
            if (!value)
            {
                return defaultValue;
            }
            std::string str(value);
            std::transform(str.begin(), str.end(), str.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (str == "true" || str == "1" || str == "yes") return true;
            if (str == "false" || str == "0" || str == "no") return false;

            std::cerr << "[DbSettings] Invalid " << name << "='" << value
                      << "', using " << (defaultValue ? "true" : "false") << std::endl;
            return defaultValue;
        }
    };

} // namespace bank::settings
