#pragma once

#include <string>
#include <cstdlib>
#include <iostream>

namespace bank::settings {

/**
 * @brief Выбор хранилища: BANK_STORAGE=postgres | memory
 *
 * memory - для локального запуска без БД, данные живут до остановки процесса.
 */
class StorageSettings {
public:
    enum class Backend {
        POSTGRES,
        MEMORY
    };

    StorageSettings() {
        const char* value = std::getenv("BANK_STORAGE");
        std::string str = value ? value : "postgres";
        if (str == "memory") {
            backend_ = Backend::MEMORY;
        } else {
            if (str != "postgres") {
                std::cerr << "[StorageSettings] Unknown BANK_STORAGE='" << str
                          << "', using postgres" << std::endl;
            }
            backend_ = Backend::POSTGRES;
        }
    }

    Backend getBackend() const { return backend_; }

private:
    Backend backend_ = Backend::POSTGRES;
};

} // namespace bank::settings
