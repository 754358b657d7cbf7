#ifndef DECOPY_COPYQUEUE_H
#define DECOPY_COPYQUEUE_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <stop_token>
#include <string>
#include <vector>
#include "ILogger.h"
#include "TreeCopier.h"

namespace decopy {

enum class DestinationStatus {
    Succeeded,
    Failed,     // DestinationCopyException
    Aborted,    // progress callback or stop request interrupted it
    Skipped     // never started because of a stop request
};

const char* toString(DestinationStatus status);

/**
 * @brief Outcome of one destination
 */
struct DestinationResult {
    std::filesystem::path destination;
    DestinationStatus status = DestinationStatus::Skipped;
    std::uint64_t bytes_copied = 0;
    std::string error;
};

/**
 * @brief Summary handed to on_complete once every destination was attempted
 */
struct CopyReport {
    std::uint64_t total_bytes = 0;          // measured size of the source tree
    std::vector<DestinationResult> results; // same order as the queue
    bool cancelled = false;

    std::size_t succeededCount() const;
    std::size_t failedCount() const;
    bool allSucceeded() const;
};

/**
 * @brief Progress tick for the destination currently being written
 * @return false to abort this destination (the next one still runs)
 */
using ProgressCallback = std::function<bool(int percentage,
                                            std::uint64_t bytes_copied,
                                            const std::filesystem::path& destination)>;

using FailureCallback = std::function<void(const std::filesystem::path& destination,
                                           const std::string& error)>;

using CompleteCallback = std::function<void(const CopyReport& report)>;

struct CopyCallbacks {
    ProgressCallback on_progress;
    FailureCallback on_failure;     // optional
    CompleteCallback on_complete;
};

/**
 * @brief First entries of the source directory, for the pre-copy summary
 */
struct SourcePreview {
    std::vector<std::string> names;     // sorted
    std::size_t hidden = 0;             // entries beyond the limit
};

/**
 * @brief percentage = min(100, floor(bytes * 100 / total)); 100 for an empty source
 */
int computePercentage(std::uint64_t bytes_copied, std::uint64_t total_bytes);

/**
 * @brief One source directory copied, in order, into every destination
 *
 * Immutable once constructed; a different destination list means a new queue.
 */
class CopyQueue {
public:
    CopyQueue(std::filesystem::path source, std::vector<std::filesystem::path> destinations);

    /**
     * @brief Build a queue from raw command-line arguments
     *
     * Relative paths are resolved against cwd.
     *
     * @throws ArgumentException if source is empty, no destination is given,
     *         or a destination equals or lies inside the source
     */
    static CopyQueue fromArguments(const std::filesystem::path& cwd,
                                   const std::string& source,
                                   const std::vector<std::string>& destinations);

    const std::filesystem::path& source() const { return source_; }
    const std::vector<std::filesystem::path>& destinations() const { return destinations_; }

    /**
     * @brief Display name of the source (its last path component)
     */
    std::string sourceName() const;

    /**
     * @brief List the first entries of the source directory
     * @throws SourceUnreadableException if the source cannot be listed
     */
    SourcePreview previewSource(std::size_t limit) const;

    /**
     * @brief Copy the source into every destination, in order
     *
     * Measures the source once, then copies destination by destination. A
     * failing destination is recorded and the next one still runs; on_complete
     * fires exactly once at the end. The stop token is checked between chunks
     * and between destinations.
     *
     * @throws SourceUnreadableException before any destination is touched if
     *         the source cannot be measured (on_complete is not called)
     */
    void startCopy(ITreeCopier& copier,
                   ILogger& logger,
                   const CopyCallbacks& callbacks,
                   std::stop_token stop = {}) const;

private:
    std::filesystem::path source_;
    std::vector<std::filesystem::path> destinations_;
};

} // namespace decopy

#endif // DECOPY_COPYQUEUE_H
