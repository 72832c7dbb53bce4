#include "bjsim/result_channel.h"
#include <algorithm> // Pour std::max
#include <stdexcept>
#include <utility>

namespace bj_sim {

ResultChannel::ResultChannel(int num_producers)
    : producers_left_(num_producers)
{
    if (num_producers < 0) throw std::invalid_argument("Number of producers must be >= 0");
}

void ResultChannel::push(UnitMessage message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (producers_left_ <= 0) throw std::logic_error("push on a closed ResultChannel");
        queue_.push_back(std::move(message));
        ++pushed_;
    }
    cv_.notify_one();
}

std::optional<UnitMessage> ResultChannel::pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !queue_.empty() || producers_left_ <= 0; });
    if (queue_.empty()) return std::nullopt;
    UnitMessage message = std::move(queue_.front());
    queue_.pop_front();
    return message;
}

void ResultChannel::producer_done() {
    release_producers(1);
}

void ResultChannel::release_producers(int count) {
    if (count < 0) throw std::invalid_argument("Cannot release a negative number of producers");
    bool closed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        producers_left_ = std::max(0, producers_left_ - count);
        closed = producers_left_ == 0;
    }
    if (closed) cv_.notify_all();
}

bool ResultChannel::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return producers_left_ <= 0;
}

size_t ResultChannel::pushed_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pushed_;
}

} // namespace bj_sim
