#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <cctype>
#include <stdexcept>

namespace inventory::domain {

/**
 * @brief Временная метка с точностью до миллисекунд
 *
 * Сроки резервов сравниваются на уровне миллисекунд, поэтому
 * в БД и в JSON значение передаётся как epoch millis либо ISO 8601 с ".mmm".
 */
class Timestamp {
public:
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    static Timestamp fromMillis(int64_t millis) {
        return Timestamp(std::chrono::system_clock::time_point(std::chrono::milliseconds(millis)));
    }

    static Timestamp fromString(const std::string& str) {
        // ISO 8601 в UTC: 2026-01-31T12:00:00[.123]Z
        std::tm tm = {};
        std::istringstream ss(str);
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            throw std::invalid_argument("Invalid timestamp: " + str);
        }

        int millis = 0;
        if (ss.peek() == '.') {
            ss.get();
            std::string digits;
            while (std::isdigit(ss.peek()) && digits.size() < 3) {
                digits.push_back(static_cast<char>(ss.get()));
            }
            while (digits.size() < 3) {
                digits.push_back('0');
            }
            millis = std::stoi(digits);
        }

        auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));
        return Timestamp(tp + std::chrono::milliseconds(millis));
    }

    int64_t toMillis() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            value.time_since_epoch()).count();
    }

    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = *std::gmtime(&time_t_val);
        auto millis = toMillis() % 1000;
        if (millis < 0) {
            millis += 1000;
        }

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
           << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
        return ss.str();
    }

    Timestamp plus(std::chrono::milliseconds duration) const {
        return Timestamp(value + duration);
    }

    bool operator<(const Timestamp& other) const {
        return value < other.value;
    }

    bool operator>(const Timestamp& other) const {
        return value > other.value;
    }

    bool operator<=(const Timestamp& other) const {
        return value <= other.value;
    }

    bool operator==(const Timestamp& other) const {
        return value == other.value;
    }
};

} // namespace inventory::domain
