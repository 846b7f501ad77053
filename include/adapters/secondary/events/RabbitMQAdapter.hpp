#pragma once

#include "ports/output/IEventPublisher.hpp"
#include "settings/RabbitMQSettings.hpp"
#include <amqpcpp.h>
#include <amqpcpp/libboostasio.h>
#include <boost/asio.hpp>
#include <atomic>
#include <deque>
#include <iostream>
#include <memory>
#include <thread>
#include <utility>
#include <cstdint>

namespace inventory::adapters::secondary {

/**
 * @brief Публикация событий склада в topic exchange RabbitMQ
 *
 * Routing keys: inventory.reserved, inventory.released, inventory.deducted,
 * inventory.adjusted, reservation.expired, stock.low.
 *
 * Канал AMQP-CPP живёт в одном потоке: publish() из потоков запросов
 * и sweeper'а только кладёт задачу в io_context. Пока exchange не объявлен
 * (или канал упал), события ждут в outbox_, не больше MAX_OUTBOX.
 * Сообщения persistent, content-type application/json.
 *
 * Ошибки доставки только логируются и считаются в getDropped().
 */
class RabbitMQAdapter : public ports::output::IEventPublisher {
public:
    static constexpr size_t MAX_OUTBOX = 10000;

    explicit RabbitMQAdapter(std::shared_ptr<settings::RabbitMQSettings> settings)
        : settings_(std::move(settings))
        , exchange_(settings_->getExchange())
        , ioContext_()
        , workGuard_(boost::asio::make_work_guard(ioContext_))
        , handler_(ioContext_)
    {
        std::cout << "[RabbitMQAdapter] Publishing to " << settings_->getHost() << ":"
                  << settings_->getPort() << ", exchange " << exchange_ << std::endl;
        start();
    }

    ~RabbitMQAdapter() override {
        stop();
    }

    RabbitMQAdapter(const RabbitMQAdapter&) = delete;
    RabbitMQAdapter& operator=(const RabbitMQAdapter&) = delete;

    void publish(const std::string& routingKey, const std::string& message) override {
        if (!running_) {
            ++dropped_;
            std::cerr << "[RabbitMQAdapter] Adapter stopped, event " << routingKey << " dropped" << std::endl;
            return;
        }
        boost::asio::post(ioContext_, [this, routingKey, message]() {
            enqueue(routingKey, message);
        });
    }

    void start() {
        if (running_.exchange(true)) {
            return;
        }
        ioThread_ = std::thread([this]() {
            try {
                openChannel();
                ioContext_.run();
            } catch (const std::exception& e) {
                std::cerr << "[RabbitMQAdapter] io thread failed: " << e.what() << std::endl;
            }
        });
    }

    void stop() {
        if (!running_.exchange(false)) {
            return;
        }
        workGuard_.reset();
        ioContext_.stop();
        if (ioThread_.joinable()) {
            ioThread_.join();
        }
        channel_.reset();
        connection_.reset();

        if (!outbox_.empty()) {
            std::cerr << "[RabbitMQAdapter] " << outbox_.size()
                      << " events left unsent at shutdown" << std::endl;
        }
        std::cout << "[RabbitMQAdapter] Stopped, published " << published_
                  << ", dropped " << dropped_ << std::endl;
    }

    bool isReady() const { return ready_; }
    uint64_t getPublished() const { return published_; }
    uint64_t getDropped() const { return dropped_; }

private:
    using Event = std::pair<std::string, std::string>;

    std::shared_ptr<settings::RabbitMQSettings> settings_;
    std::string exchange_;

    std::atomic<bool> running_{false};
    std::atomic<bool> ready_{false};
    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> dropped_{0};

    boost::asio::io_context ioContext_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> workGuard_;
    AMQP::LibBoostAsioHandler handler_;
    std::unique_ptr<AMQP::TcpConnection> connection_;
    std::unique_ptr<AMQP::TcpChannel> channel_;

    // Только поток io_context
    std::deque<Event> outbox_;
    std::thread ioThread_;

    void openChannel() {
        connection_ = std::make_unique<AMQP::TcpConnection>(
            &handler_, AMQP::Address(settings_->getAmqpUrl()));
        channel_ = std::make_unique<AMQP::TcpChannel>(connection_.get());

        channel_->onError([this](const char* reason) {
            ready_ = false;
            std::cerr << "[RabbitMQAdapter] Channel closed: " << reason
                      << ", events are buffered" << std::endl;
        });

        channel_->declareExchange(exchange_, AMQP::topic, AMQP::durable)
            .onSuccess([this]() {
                ready_ = true;
                std::cout << "[RabbitMQAdapter] Exchange " << exchange_ << " ready, flushing "
                          << outbox_.size() << " buffered events" << std::endl;
                while (!outbox_.empty()) {
                    Event event = std::move(outbox_.front());
                    outbox_.pop_front();
                    send(event.first, event.second);
                }
            })
            .onError([this](const char* reason) {
                std::cerr << "[RabbitMQAdapter] declareExchange " << exchange_
                          << " failed: " << reason << std::endl;
            });
    }

    void enqueue(const std::string& routingKey, const std::string& message) {
        if (ready_) {
            send(routingKey, message);
            return;
        }
        if (outbox_.size() >= MAX_OUTBOX) {
            ++dropped_;
            std::cerr << "[RabbitMQAdapter] Outbox full, oldest event "
                      << outbox_.front().first << " dropped" << std::endl;
            outbox_.pop_front();
        }
        outbox_.emplace_back(routingKey, message);
    }

    void send(const std::string& routingKey, const std::string& message) {
        try {
            AMQP::Envelope envelope(message.data(), message.size());
            envelope.setContentType("application/json");
            envelope.setPersistent(true);

            if (channel_->publish(exchange_, routingKey, envelope)) {
                ++published_;
            } else {
                ++dropped_;
                std::cerr << "[RabbitMQAdapter] Channel refused " << routingKey << std::endl;
            }
        } catch (const std::exception& e) {
            ++dropped_;
            std::cerr << "[RabbitMQAdapter] Publish " << routingKey << " failed: " << e.what() << std::endl;
        }
    }
};

} // namespace inventory::adapters::secondary
