#ifndef DECOPY_PROGRESSCHANNEL_H
#define DECOPY_PROGRESSCHANNEL_H

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include "CopyQueue.h"

namespace decopy {

struct ProgressMessage {
    int percentage = 0;
    std::uint64_t bytes_copied = 0;
    std::filesystem::path destination;
};

struct FailedMessage {
    std::filesystem::path destination;
    std::string error;
};

struct DoneMessage {
    CopyReport report;
};

// The copy could not start or the worker died
struct FatalMessage {
    std::string error;
    std::string path;
    bool source_unreadable = true;
};

using CopyEvent = std::variant<ProgressMessage, FailedMessage, DoneMessage, FatalMessage>;

/**
 * @brief Single-producer/single-consumer event stream from copy worker to renderer
 *
 * Bounded and lossy for progress only:
 * - A progress for the same destination as the last queued progress replaces it
 * - With capacity items queued, the last queued progress is replaced whatever
 *   its destination
 * Failed, Done and Fatal are never dropped, and event order is preserved.
 *
 * Redrawing is the bottleneck, not copying, so the consumer only ever needs
 * the latest percentage.
 */
class ProgressChannel {
public:
    explicit ProgressChannel(std::size_t capacity = 16);

    ProgressChannel(const ProgressChannel&) = delete;
    ProgressChannel& operator=(const ProgressChannel&) = delete;

    /**
     * @brief Queue a progress update, coalescing with a pending one
     * @return false if the channel is already closed
     */
    bool publish(ProgressMessage progress);

    /**
     * @brief Queue any event without coalescing
     * @return false if the channel is already closed
     */
    bool send(CopyEvent event);

    /**
     * @brief No further events; wakes a blocked receive()
     */
    void close();

    /**
     * @brief Block until an event is available
     * @return The next event, or std::nullopt once closed and drained
     */
    std::optional<CopyEvent> receive();

    /**
     * @brief Non-blocking variant of receive()
     */
    std::optional<CopyEvent> tryReceive();

    bool closed() const;
    std::size_t capacity() const { return capacity_; }

    // Number of progress updates overwritten before being received
    std::size_t coalesced() const;

private:
    const std::size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<CopyEvent> events_;
    bool closed_ = false;
    std::size_t coalesced_ = 0;
};

} // namespace decopy

#endif // DECOPY_PROGRESSCHANNEL_H
