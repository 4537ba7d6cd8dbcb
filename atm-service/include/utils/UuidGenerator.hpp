#pragma once

#include <string>
#include <random>
#include <sstream>
#include <iomanip>
#include <cstdint>
#include <cctype>

namespace atm::utils {

/**
 * @brief Генератор UUID v4 для идентификаторов сессий
 *
 * @note Thread-safe благодаря thread_local генератору
 */
class UuidGenerator {
public:
    /**
     * @brief Формат: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx, y из [8, 9, a, b]
     */
    static std::string generate() {
        thread_local std::random_device rd;
        thread_local std::mt19937_64 gen(seed(rd));
        std::uniform_int_distribution<std::uint64_t> dist;

        std::uint64_t part1 = dist(gen);
        std::uint64_t part2 = dist(gen);

        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        ss << std::setw(8) << ((part1 >> 32) & 0xFFFFFFFF) << "-";
        ss << std::setw(4) << ((part1 >> 16) & 0xFFFF) << "-";
        ss << std::setw(4) << ((part1 & 0x0FFF) | 0x4000) << "-";
        ss << std::setw(4) << (((part2 >> 48) & 0x3FFF) | 0x8000) << "-";
        ss << std::setw(12) << (part2 & 0xFFFFFFFFFFFF);

        return ss.str();
    }

    /**
     * @brief Проверить каноническую запись UUID (8-4-4-4-12, hex, любой регистр)
     */
    static bool isValid(const std::string& value) {
        if (value.size() != 36) {
            return false;
        }
        for (std::size_t i = 0; i < value.size(); ++i) {
            if (i == 8 || i == 13 || i == 18 || i == 23) {
                if (value[i] != '-') return false;
            } else if (!std::isxdigit(static_cast<unsigned char>(value[i]))) {
                return false;
            }
        }
        return true;
    }

private:
    // 64 бита seed на поток
    static std::uint64_t seed(std::random_device& rd) {
        return (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
    }
};

} // namespace atm::utils
