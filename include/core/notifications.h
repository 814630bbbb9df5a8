#pragma once

#include "core/types.h"
#include <string>
#include <functional>
#include <memory>
#include <chrono>
#include <cstdint>

namespace paycore {
namespace core {

enum class NotificationType : uint8_t {
    TRANSFER_COMPLETED = 0,
    TRANSFER_FAILED = 1,
    DEPOSIT_COMPLETED = 2,
    ANY = 255
};

struct Notification {
    NotificationType type = NotificationType::TRANSFER_COMPLETED;
    std::string id;
    Transaction transaction;
    uint64_t timestamp = 0;
};

using NotificationHandler = std::function<void(const Notification&)>;

// Delivers committed-transaction events to subscribers on a worker thread.
// A handler that throws is logged and skipped; publishers never see it.
class NotificationDispatcher {
public:
    NotificationDispatcher();
    ~NotificationDispatcher();

    void start();
    // Delivers whatever is queued, then joins the worker.
    void stop();
    bool isRunning() const;

    std::string subscribe(NotificationHandler handler, int priority = 0);
    std::string subscribe(NotificationType type, NotificationHandler handler, int priority = 0);
    void unsubscribe(const std::string& id);

    // Queued when running, delivered inline otherwise.
    void publish(const Notification& notification);
    Notification create(NotificationType type, const Transaction& tx) const;

    // Blocks until the queue is drained or the timeout passes.
    bool waitIdle(std::chrono::milliseconds timeout);

    uint64_t getPublishedCount() const;
    uint64_t getDeliveredCount() const;
    uint64_t getFailedCount() const;
    size_t getQueueSize() const;
    size_t getSubscriptionCount() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

const char* toString(NotificationType type);

}
}
