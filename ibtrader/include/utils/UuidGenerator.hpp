#pragma once

#include <atomic>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace ibtrader::utils {

/**
 * @brief Генератор идентификаторов
 *
 * @note Thread-safe благодаря thread_local генератору
 */
class UuidGenerator {
public:
    /**
     * @brief UUID v4: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
     */
    static std::string generate() {
        thread_local std::random_device rd;
        thread_local std::mt19937_64 gen(rd());
        std::uniform_int_distribution<uint64_t> dist;

        uint64_t part1 = dist(gen);
        uint64_t part2 = dist(gen);

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
     * @brief Короткий ID с префиксом и порядковым номером: "brk-000017-1a2b3c4d"
     *
     * Порядковый номер делает ID уникальными в пределах процесса
     * и сортируемыми по времени создания.
     */
    static std::string generateWithPrefix(const std::string& prefix) {
        static std::atomic<uint32_t> sequence{0};
        thread_local std::random_device rd;
        thread_local std::mt19937_64 gen(rd());
        std::uniform_int_distribution<uint32_t> dist;

        std::ostringstream ss;
        ss << prefix << "-" << std::setfill('0') << std::setw(6) << ++sequence
           << "-" << std::hex << std::setw(8) << dist(gen);
        return ss.str();
    }
};

} // namespace ibtrader::utils
