/**
 * @file event_bus.cpp
 * @brief Implementation of event_bus
 */

#include <kcenon/unified_fs/events/event_bus.h>
#include <kcenon/unified_fs/core/logging.h>

#include <condition_variable>
#include <deque>
#include <exception>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace kcenon::unified_fs {

struct event_bus::impl {
    mutable std::mutex subscribers_mutex;
    std::map<subscription_id, handler> subscribers;
    subscription_id next_id = 1;

    std::mutex queue_mutex;
    std::condition_variable queue_cv;
    std::condition_variable delivered_cv;
    std::deque<event> pending;
    uint64_t published = 0;
    uint64_t delivered = 0;
    bool stopping = false;

    std::thread dispatcher;

    auto run() -> void {
        while (true) {
            event next;
            {
                std::unique_lock<std::mutex> lock(queue_mutex);
                queue_cv.wait(lock, [this] { return stopping || !pending.empty(); });
                if (pending.empty()) {
                    return;
                }
                next = std::move(pending.front());
                pending.pop_front();
            }

            deliver(next);

            {
                std::lock_guard<std::mutex> lock(queue_mutex);
                ++delivered;
            }
            delivered_cv.notify_all();
        }
    }

    auto deliver(const event& e) -> void {
        std::vector<std::pair<subscription_id, handler>> targets;
        {
            std::lock_guard<std::mutex> lock(subscribers_mutex);
            targets.assign(subscribers.begin(), subscribers.end());
        }
        for (auto& [id, fn] : targets) {
            try {
                fn(e);
            } catch (const std::exception& ex) {
                UFS_LOG_ERROR(log_category::events,
                              "Subscriber " + std::to_string(id) + " threw: " + ex.what());
            }
        }
    }
};

event_bus::event_bus() : impl_(std::make_unique<impl>()) {
    impl_->dispatcher = std::thread([this] { impl_->run(); });
}

event_bus::~event_bus() {
    stop();
}

auto event_bus::subscribe(handler fn) -> subscription_id {
    std::lock_guard<std::mutex> lock(impl_->subscribers_mutex);
    auto id = impl_->next_id++;
    impl_->subscribers.emplace(id, std::move(fn));
    return id;
}

auto event_bus::unsubscribe(subscription_id id) -> bool {
    std::lock_guard<std::mutex> lock(impl_->subscribers_mutex);
    return impl_->subscribers.erase(id) > 0;
}

auto event_bus::publish(event e) -> void {
    {
        std::lock_guard<std::mutex> lock(impl_->queue_mutex);
        if (impl_->stopping) {
            return;
        }
        impl_->pending.push_back(std::move(e));
        ++impl_->published;
    }
    impl_->queue_cv.notify_one();
}

auto event_bus::subscriber_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(impl_->subscribers_mutex);
    return impl_->subscribers.size();
}

auto event_bus::flush(std::chrono::milliseconds timeout) -> bool {
    std::unique_lock<std::mutex> lock(impl_->queue_mutex);
    auto target = impl_->published;
    return impl_->delivered_cv.wait_for(lock, timeout,
                                        [this, target] { return impl_->delivered >= target; });
}

auto event_bus::stop() -> void {
    {
        std::lock_guard<std::mutex> lock(impl_->queue_mutex);
        if (impl_->stopping && !impl_->dispatcher.joinable()) {
            return;
        }
        impl_->stopping = true;
    }
    impl_->queue_cv.notify_all();
    if (impl_->dispatcher.joinable() && impl_->dispatcher.get_id() != std::this_thread::get_id()) {
        impl_->dispatcher.join();
    }
}

}  // namespace kcenon::unified_fs
