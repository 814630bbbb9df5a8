#include "core/notifications.h"
#include "utils/utils.h"
#include "utils/logger.h"
#include <vector>
#include <queue>
#include <mutex>
#include <atomic>
#include <thread>
#include <algorithm>
#include <condition_variable>
#include <exception>

namespace paycore {
namespace core {

const char* toString(NotificationType type) {
    switch (type) {
        case NotificationType::TRANSFER_COMPLETED: return "transfer.completed";
        case NotificationType::TRANSFER_FAILED: return "transfer.failed";
        case NotificationType::DEPOSIT_COMPLETED: return "deposit.completed";
        case NotificationType::ANY: return "any";
    }
    return "unknown";
}

struct NotificationDispatcher::Impl {
    struct Subscription {
        std::string id;
        NotificationType type;
        NotificationHandler handler;
        int priority;
    };

    std::vector<Subscription> subscriptions;
    std::queue<Notification> queue;
    mutable std::mutex mtx;
    std::condition_variable cv;
    std::condition_variable idleCv;
    std::atomic<bool> running{false};
    bool dispatching = false;
    std::thread worker;
    std::atomic<uint64_t> subCounter{0};
    std::atomic<uint64_t> eventCounter{0};
    std::atomic<uint64_t> published{0};
    std::atomic<uint64_t> delivered{0};
    std::atomic<uint64_t> failed{0};

    std::vector<Subscription> matching(const Notification& n) {
        std::lock_guard<std::mutex> lock(mtx);
        std::vector<Subscription> out;
        for (const auto& sub : subscriptions) {
            if (sub.type == NotificationType::ANY || sub.type == n.type) out.push_back(sub);
        }
        return out;
    }

    void dispatch(const Notification& n) {
        for (const auto& sub : matching(n)) {
            try {
                sub.handler(n);
                delivered++;
            } catch (const std::exception& e) {
                failed++;
                LOG_WARN("notify", "Subscriber " + sub.id + " failed on " + toString(n.type) +
                         " for " + n.transaction.id + ": " + e.what());
            }
        }
    }

    void processLoop() {
        for (;;) {
            Notification n;
            {
                std::unique_lock<std::mutex> lock(mtx);
                cv.wait(lock, [this] { return !queue.empty() || !running; });
                if (queue.empty()) break;
                n = queue.front();
                queue.pop();
                dispatching = true;
            }

            dispatch(n);

            {
                std::lock_guard<std::mutex> lock(mtx);
                dispatching = false;
                if (queue.empty()) idleCv.notify_all();
            }
        }
        std::lock_guard<std::mutex> lock(mtx);
        idleCv.notify_all();
    }

    void sortSubscriptions() {
        std::stable_sort(subscriptions.begin(), subscriptions.end(),
            [](const Subscription& a, const Subscription& b) {
                return a.priority > b.priority;
            });
    }
};

NotificationDispatcher::NotificationDispatcher() : impl_(std::make_unique<Impl>()) {}

NotificationDispatcher::~NotificationDispatcher() {
    stop();
}

void NotificationDispatcher::start() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->running) return;
    impl_->running = true;
    impl_->worker = std::thread(&Impl::processLoop, impl_.get());
}

void NotificationDispatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->running = false;
    }
    impl_->cv.notify_all();
    if (impl_->worker.joinable()) {
        impl_->worker.join();
    }
}

bool NotificationDispatcher::isRunning() const {
    return impl_->running;
}

std::string NotificationDispatcher::subscribe(NotificationHandler handler, int priority) {
    return subscribe(NotificationType::ANY, std::move(handler), priority);
}

std::string NotificationDispatcher::subscribe(NotificationType type, NotificationHandler handler, int priority) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    Impl::Subscription sub;
    sub.id = "sub_" + std::to_string(impl_->subCounter++);
    sub.type = type;
    sub.handler = std::move(handler);
    sub.priority = priority;
    impl_->subscriptions.push_back(sub);
    impl_->sortSubscriptions();
    return sub.id;
}

void NotificationDispatcher::unsubscribe(const std::string& id) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->subscriptions.erase(
        std::remove_if(impl_->subscriptions.begin(), impl_->subscriptions.end(),
            [&id](const Impl::Subscription& s) { return s.id == id; }),
        impl_->subscriptions.end());
}

void NotificationDispatcher::publish(const Notification& notification) {
    impl_->published++;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        if (impl_->running) {
            impl_->queue.push(notification);
            impl_->cv.notify_one();
            return;
        }
    }
    impl_->dispatch(notification);
}

Notification NotificationDispatcher::create(NotificationType type, const Transaction& tx) const {
    Notification n;
    n.type = type;
    n.id = "evt_" + std::to_string(impl_->eventCounter++);
    n.transaction = tx;
    n.timestamp = utils::nowMillis();
    return n;
}

bool NotificationDispatcher::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(impl_->mtx);
    return impl_->idleCv.wait_for(lock, timeout, [this] {
        return impl_->queue.empty() && !impl_->dispatching;
    });
}

uint64_t NotificationDispatcher::getPublishedCount() const { return impl_->published; }
uint64_t NotificationDispatcher::getDeliveredCount() const { return impl_->delivered; }
uint64_t NotificationDispatcher::getFailedCount() const { return impl_->failed; }

size_t NotificationDispatcher::getQueueSize() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->queue.size();
}

size_t NotificationDispatcher::getSubscriptionCount() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->subscriptions.size();
}

}
}
