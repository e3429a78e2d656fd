#pragma once

#include "settings/IRetrySettings.hpp"
#include <cstdlib>
#include <string>
#include <iostream>

namespace bank::settings {

class RetrySettings : public IRetrySettings {
public:
    static constexpr int DEFAULT_MAX_ATTEMPTS = 3;

    RetrySettings() {
        maxAttempts_ = readInt("BANK_RETRY_MAX_ATTEMPTS", DEFAULT_MAX_ATTEMPTS, 1);
        backoffMs_ = readInt("BANK_RETRY_BACKOFF_MS", 0, 0);
    }

    int getMaxAttempts() const override { return maxAttempts_; }

    std::chrono::milliseconds getBackoff() const override {
        return std::chrono::milliseconds(backoffMs_);
    }

private:
    int maxAttempts_;
    int backoffMs_;

    static int readInt(const char* name, int defaultValue, int minValue) {
        const char* value = std::getenv(name);
        if (!value) {
            return defaultValue;
        }
        try {
            int parsed = std::stoi(value);
            if (parsed >= minValue) {
                return parsed;
            }
        } catch (const std::exception&) {
        }
        std::cerr << "[RetrySettings] Invalid " << name << "='" << value
                  << "', using " << defaultValue << std::endl;
        return defaultValue;
    }
};

} // namespace bank::settings
