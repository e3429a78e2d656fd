#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <random>
#include <string>

namespace bank::utils {

/**
 * @brief Случайные идентификаторы UUID v4 (RFC 4122)
 *
 * Используются для id счетов, проводок и correlation id переводов.
 * Генератор thread_local, общего состояния между потоками нет.
 */
class UuidGenerator {
public:
    static constexpr std::size_t LENGTH = 36;

    /**
     * @brief xxxxxxxx-xxxx-4xxx-Nxxx-xxxxxxxxxxxx, N из {8, 9, a, b}
     */
    static std::string generate() {
        thread_local std::mt19937 engine = makeEngine();
        std::uniform_int_distribution<uint32_t> dist;

        std::array<uint8_t, 16> bytes{};
        for (std::size_t i = 0; i < bytes.size(); i += 4) {
            const uint32_t word = dist(engine);
            bytes[i] = static_cast<uint8_t>(word >> 24);
            bytes[i + 1] = static_cast<uint8_t>(word >> 16);
            bytes[i + 2] = static_cast<uint8_t>(word >> 8);
            bytes[i + 3] = static_cast<uint8_t>(word);
        }
        bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
        bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

        static constexpr char HEX[] = "0123456789abcdef";
        std::string out;
        out.reserve(LENGTH);
        for (std::size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                out.push_back('-');
            }
            out.push_back(HEX[bytes[i] >> 4]);
            out.push_back(HEX[bytes[i] & 0x0F]);
        }
        return out;
    }

    /// Строка в каноническом виде v4 (строчные hex-цифры)
    static bool isValid(const std::string& id) {
        if (id.size() != LENGTH) {
            return false;
        }
        for (std::size_t i = 0; i < LENGTH; ++i) {
            const char c = id[i];
            if (i == 8 || i == 13 || i == 18 || i == 23) {
                if (c != '-') return false;
            } else if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
                return false;
            }
        }
        const char variant = id[19];
        return id[14] == '4'
            && (variant == '8' || variant == '9' || variant == 'a' || variant == 'b');
    }

private:
    static std::mt19937 makeEngine() {
        std::random_device device;
        std::seed_seq seq{device(), device(), device(), device()};
        return std::mt19937(seq);
    }
};

} // namespace bank::utils
