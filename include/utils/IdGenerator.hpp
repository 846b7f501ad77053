#pragma once

#include <string>
#include <random>
#include <sstream>
#include <iomanip>
#include <cstdint>

namespace inventory::utils {

/**
 * @brief Генератор идентификаторов резервов
 *
 * @note Thread-safe благодаря thread_local генератору
 */
class IdGenerator {
public:
    /**
     * @brief ID с префиксом и 64 случайными битами
     *
     * @param prefix Префикс (например, "rsv")
     * @return ID в формате "prefix-xxxxxxxxxxxxxxxx"
     */
    static std::string generateWithPrefix(const std::string& prefix) {
        thread_local std::random_device rd;
        thread_local std::mt19937_64 gen(rd());
        std::uniform_int_distribution<uint64_t> dist;

        std::ostringstream ss;
        ss << prefix << "-" << std::hex << std::setfill('0') << std::setw(16) << dist(gen);
        return ss.str();
    }
};

} // namespace inventory::utils
