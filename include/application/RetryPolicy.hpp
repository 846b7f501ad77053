#pragma once

#include "domain/InventoryException.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

namespace inventory::application {

/**
 * @brief Повтор операции при ConcurrentModification
 *
 * Ограниченное число попыток с экспоненциальной паузой
 * (initialBackoff, 2x, 4x, ... не больше MAX_BACKOFF).
 * Остальные исключения пробрасываются сразу.
 */
class RetryPolicy {
public:
    static constexpr std::chrono::milliseconds MAX_BACKOFF{1000};

    RetryPolicy(int maxAttempts, std::chrono::milliseconds initialBackoff)
        : maxAttempts_(std::max(1, maxAttempts))
        , initialBackoff_(initialBackoff)
    {}

    template <typename Fn>
    auto execute(const std::string& operation, Fn&& fn) -> decltype(fn()) {
        for (int attempt = 1;; ++attempt) {
            try {
                return fn();
            } catch (const domain::ConcurrentModificationException& e) {
                if (attempt >= maxAttempts_) {
                    std::cerr << "[RetryPolicy] " << operation << " gave up after "
                              << attempt << " attempts: " << e.what() << std::endl;
                    throw;
                }
                auto pause = backoff(attempt);
                std::cout << "[RetryPolicy] " << operation << " attempt " << attempt
                          << " conflicted (" << e.what() << "), retry in "
                          << pause.count() << "ms" << std::endl;
                std::this_thread::sleep_for(pause);
            }
        }
    }

    int getMaxAttempts() const { return maxAttempts_; }

private:
    int maxAttempts_;
    std::chrono::milliseconds initialBackoff_;

    std::chrono::milliseconds backoff(int attempt) const {
        auto pause = initialBackoff_ * (1LL << std::min(attempt - 1, 10));
        return std::min<std::chrono::milliseconds>(pause, MAX_BACKOFF);
    }
};

} // namespace inventory::application
