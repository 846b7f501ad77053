#pragma once

#include "ports/output/IEventPublisher.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace inventory::tests {

/**
 * @brief Mock реализация IEventPublisher для тестов
 *
 * Потокобезопасна: события публикуются и из рабочих потоков тестов.
 */
class MockEventPublisher : public ports::output::IEventPublisher {
public:
    struct PublishedMessage {
        std::string routingKey;
        std::string message;
    };

    std::vector<PublishedMessage> getPublishedMessages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

    std::vector<PublishedMessage> getMessages(const std::string& routingKey) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<PublishedMessage> result;
        for (const auto& m : messages_) {
            if (m.routingKey == routingKey) {
                result.push_back(m);
            }
        }
        return result;
    }

    void clearMessages() {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.clear();
    }

    int publishCallCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(messages_.size());
    }

    void publish(const std::string& routingKey, const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.push_back({routingKey, message});
    }

private:
    mutable std::mutex mutex_;
    std::vector<PublishedMessage> messages_;
};

} // namespace inventory::tests
