#include "ProgressChannel.h"
#include <algorithm>
#include <utility>

namespace decopy {

ProgressChannel::ProgressChannel(std::size_t capacity)
    : capacity_(std::max<std::size_t>(1, capacity))
{
}

bool ProgressChannel::publish(ProgressMessage progress)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }

        auto* pending = events_.empty() ? nullptr : std::get_if<ProgressMessage>(&events_.back());
        if (pending && (pending->destination == progress.destination ||
                        events_.size() >= capacity_)) {
            *pending = std::move(progress);
            ++coalesced_;
        } else {
            events_.emplace_back(std::move(progress));
        }
    }
    ready_.notify_one();
    return true;
}

bool ProgressChannel::send(CopyEvent event)
{
    if (auto* progress = std::get_if<ProgressMessage>(&event)) {
        return publish(std::move(*progress));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        events_.push_back(std::move(event));
    }
    ready_.notify_one();
    return true;
}

void ProgressChannel::close()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    ready_.notify_all();
}

std::optional<CopyEvent> ProgressChannel::receive()
{
    std::unique_lock<std::mutex> lock(mutex_);
    ready_.wait(lock, [this] { return !events_.empty() || closed_; });

    if (events_.empty()) {
        return std::nullopt;
    }

    CopyEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::optional<CopyEvent> ProgressChannel::tryReceive()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty()) {
        return std::nullopt;
    }

    CopyEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

bool ProgressChannel::closed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t ProgressChannel::coalesced() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return coalesced_;
}

} // namespace decopy
