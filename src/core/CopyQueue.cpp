#include "CopyQueue.h"
#include "Exceptions.h"
#include "Utils.h"
#include <algorithm>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace decopy {

namespace {

// True when candidate is root itself or somewhere below it
bool isSameOrInside(const fs::path& candidate, const fs::path& root)
{
    std::error_code ec;
    fs::path c = fs::weakly_canonical(candidate, ec);
    if (ec) {
        c = candidate.lexically_normal();
    }
    fs::path r = fs::weakly_canonical(root, ec);
    if (ec) {
        r = root.lexically_normal();
    }

    fs::path rel = c.lexically_relative(r);
    return !rel.empty() && *rel.begin() != "..";
}

} // namespace

const char* toString(DestinationStatus status)
{
    switch (status) {
        case DestinationStatus::Succeeded: return "succeeded";
        case DestinationStatus::Failed:    return "failed";
        case DestinationStatus::Aborted:   return "aborted";
        case DestinationStatus::Skipped:   return "skipped";
    }
    return "unknown";
}

std::size_t CopyReport::succeededCount() const
{
    return static_cast<std::size_t>(std::count_if(results.begin(), results.end(),
        [](const DestinationResult& r) { return r.status == DestinationStatus::Succeeded; }));
}

std::size_t CopyReport::failedCount() const
{
    return static_cast<std::size_t>(std::count_if(results.begin(), results.end(),
        [](const DestinationResult& r) { return r.status == DestinationStatus::Failed; }));
}

bool CopyReport::allSucceeded() const
{
    return !cancelled && succeededCount() == results.size();
}

int computePercentage(std::uint64_t bytes_copied, std::uint64_t total_bytes)
{
    if (total_bytes == 0 || bytes_copied >= total_bytes) {
        return 100;
    }
    return static_cast<int>(bytes_copied * 100 / total_bytes);
}

CopyQueue::CopyQueue(fs::path source, std::vector<fs::path> destinations)
    : source_(std::move(source)), destinations_(std::move(destinations))
{
}

CopyQueue CopyQueue::fromArguments(const fs::path& cwd,
                                   const std::string& source,
                                   const std::vector<std::string>& destinations)
{
    if (trim(source).empty()) {
        throw ArgumentException("Missing source directory");
    }
    if (destinations.empty()) {
        throw ArgumentException("No destination directories given");
    }

    fs::path resolved_source = (cwd / source).lexically_normal();

    std::vector<fs::path> resolved;
    resolved.reserve(destinations.size());
    for (const auto& dest : destinations) {
        if (trim(dest).empty()) {
            throw ArgumentException("Empty destination path");
        }

        fs::path p = (cwd / dest).lexically_normal();
        if (isSameOrInside(p, resolved_source)) {
            throw ArgumentException("Destination `" + p.string() +
                                    "` is the source directory or inside it", p.string());
        }
        resolved.push_back(std::move(p));
    }

    return CopyQueue(std::move(resolved_source), std::move(resolved));
}

std::string CopyQueue::sourceName() const
{
    fs::path name = source_.filename();
    if (name.empty()) {
        name = source_.parent_path().filename();    // "dir/" has an empty filename
    }
    if (name.empty()) {
        return source_.string();
    }
    return name.string();
}

SourcePreview CopyQueue::previewSource(std::size_t limit) const
{
    std::error_code ec;
    fs::directory_iterator it(source_, ec);
    if (ec) {
        throw SourceUnreadableException("Could not open directory `" + source_.string() +
                                        "`: " + ec.message(), source_.string());
    }

    std::vector<std::string> names;
    const fs::directory_iterator end;
    while (it != end) {
        names.push_back(it->path().filename().string());
        it.increment(ec);
        if (ec) {
            throw SourceUnreadableException("Could not list directory `" + source_.string() +
                                            "`: " + ec.message(), source_.string());
        }
    }

    std::sort(names.begin(), names.end());

    SourcePreview preview;
    if (names.size() > limit) {
        preview.hidden = names.size() - limit;
        names.resize(limit);
    }
    preview.names = std::move(names);
    return preview;
}

void CopyQueue::startCopy(ITreeCopier& copier,
                          ILogger& logger,
                          const CopyCallbacks& callbacks,
                          std::stop_token stop) const
{
    CopyReport report;

    // Fatal on failure: percentages are meaningless without the total
    report.total_bytes = copier.totalSize(source_);
    logger.debug("Source `" + source_.string() + "` holds " + formatBytes(report.total_bytes));

    auto tick = [&](std::uint64_t copied, const fs::path& dest) {
        if (!callbacks.on_progress) {
            return true;
        }
        return callbacks.on_progress(computePercentage(copied, report.total_bytes), copied, dest);
    };

    for (const auto& dest : destinations_) {
        DestinationResult result;
        result.destination = dest;

        if (stop.stop_requested()) {
            result.status = DestinationStatus::Skipped;
            result.error = "cancelled";
            report.cancelled = true;
            report.results.push_back(std::move(result));
            continue;
        }

        logger.debug("Copying into `" + dest.string() + "`");

        std::uint64_t copied = 0;
        auto on_chunk = [&](std::uint64_t chunk_bytes) {
            copied += chunk_bytes;
            if (!tick(copied, dest)) {
                return false;
            }
            return !stop.stop_requested();
        };

        try {
            bool completed = tick(0, dest) && copier.copyContents(source_, dest, on_chunk);
            result.bytes_copied = copied;

            if (completed) {
                result.status = DestinationStatus::Succeeded;
            } else {
                result.status = DestinationStatus::Aborted;
                if (stop.stop_requested()) {
                    result.error = "cancelled";
                    report.cancelled = true;
                } else {
                    result.error = "aborted";
                }
                logger.debug("Copy to `" + dest.string() + "` " + result.error +
                            " after " + formatBytes(copied));
            }
        } catch (const DestinationCopyException& e) {
            result.status = DestinationStatus::Failed;
            result.bytes_copied = copied;
            result.error = e.what();
            logger.debug("Copy to `" + dest.string() + "` failed: " + result.error);

            if (callbacks.on_failure) {
                callbacks.on_failure(dest, result.error);
            }
        }

        report.results.push_back(std::move(result));
    }

    logger.debug(std::to_string(report.succeededCount()) + " of " +
                 std::to_string(report.results.size()) + " destinations succeeded");

    if (callbacks.on_complete) {
        callbacks.on_complete(report);
    }
}

} // namespace decopy
