#include "UserInterface.h"
#include "BoxLayout.h"
#include "Exceptions.h"
#include "ILogger.h"
#include "Utils.h"
#include <type_traits>
#include <utility>

namespace decopy {

namespace {

constexpr const char* kClearScreen = "\033[H\033[2J";
constexpr const char* kClearLine = "\033[2K";

// Rows are 1-based; a frame always starts at the top-left corner
constexpr std::size_t kStatusRow = 4;
constexpr std::size_t kHeaderRows = 5;

std::string moveTo(std::size_t row)
{
    return "\033[" + std::to_string(row) + ";1H";
}

const char* stateName(std::size_t index)
{
    static constexpr const char* names[] = {"PreCopy", "Copying", "Completed"};
    return index < 3 ? names[index] : "unknown";
}

} // namespace

UserInterface::UserInterface(std::ostream& out, bool color)
    : out_(out), color_(color)
{
}

UserInterface& UserInterface::withPreCopy(CopyQueue queue)
{
    transition(PreCopy{std::move(queue)});
    return *this;
}

UserInterface& UserInterface::withCopying(std::shared_ptr<ProgressChannel> channel, CopyQueue queue)
{
    transition(Copying{std::move(channel), std::move(queue)});
    return *this;
}

UserInterface& UserInterface::withCompleted(CopyQueue queue, CopyReport report)
{
    transition(Completed{std::move(queue), std::move(report)});
    return *this;
}

void UserInterface::transition(UIState next)
{
    if (state_ && next.index() < state_->index()) {
        throw InvalidStateException(std::string("Cannot go back from ") +
                                    stateName(state_->index()) + " to " +
                                    stateName(next.index()));
    }
    state_ = std::move(next);
}

void UserInterface::render()
{
    if (!state_) {
        return;
    }

    std::visit([this](const auto& state) {
        using T = std::decay_t<decltype(state)>;
        if constexpr (std::is_same_v<T, PreCopy>) {
            renderPreCopy(state);
        } else if constexpr (std::is_same_v<T, Copying>) {
            renderCopying(state);
        } else {
            static_assert(std::is_same_v<T, Completed>, "unhandled UIState");
            renderCompleted(state);
        }
    }, *state_);
}

void UserInterface::renderPreCopy(const PreCopy& state)
{
    std::string frame = kClearScreen;
    appendHeader(frame);
    appendLines(frame, {
        contentLine("Do you want to copy to these directories?"),
        contentLine("Press " + styled("[Y]", sgr::kDarkGreyBold, color_) + " or " +
                    styled("[N]", sgr::kDarkGreyBold, color_) + " on your keyboard"),
        bottomBorder(),
    });
    appendLines(frame, queueBox(state.queue, color_));
    write(frame);
}

void UserInterface::renderCopying(const Copying& state)
{
    if (!state.channel) {
        throw DecopyException("Copying state has no progress channel");
    }

    const std::vector<std::string> queue_lines = queueBox(state.queue, color_);
    const std::size_t end_row = kHeaderRows + queue_lines.size() + 1;

    std::string frame = kClearScreen;
    appendHeader(frame);
    appendLines(frame, {contentLine("Waiting for the copy to start..."), bottomBorder()});
    appendLines(frame, queue_lines);
    write(frame);

    std::optional<FatalMessage> fatal;

    while (auto event = state.channel->receive()) {
        if (auto* progress = std::get_if<ProgressMessage>(&*event)) {
            // Redraw in place, then park the cursor below the boxes again
            write(moveTo(kStatusRow) + kClearLine + contentLine(progressLine(*progress)) +
                  moveTo(end_row));
            ++redraws_;
        } else if (auto* failed = std::get_if<FailedMessage>(&*event)) {
            failures_.push_back(*failed);
        } else if (auto* done = std::get_if<DoneMessage>(&*event)) {
            report_ = done->report;
        } else if (auto* stopped = std::get_if<FatalMessage>(&*event)) {
            fatal = *stopped;
        }
    }

    if (fatal) {
        if (fatal->source_unreadable) {
            throw SourceUnreadableException(fatal->error, fatal->path);
        }
        throw DecopyException(fatal->error, fatal->path);
    }

    if (!report_) {
        throw DecopyException("Copy finished without reporting a result");
    }
}

void UserInterface::renderCompleted(const Completed& state)
{
    const CopyReport& report = state.report;

    std::string frame = kClearScreen;
    appendHeader(frame);
    appendLines(frame, {contentLine(formatBytes(report.total_bytes) + " copied (100%)")});
    appendLines(frame, summaryLines(report));
    appendLines(frame, {bottomBorder()});
    appendLines(frame, queueBox(state.queue, color_));

    std::string message;
    if (report.cancelled) {
        message = "Copy cancelled, " + std::to_string(report.succeededCount()) + " of " +
                  std::to_string(report.results.size()) + " destinations finished";
    } else if (report.failedCount() > 0) {
        message = "Finished with " + std::to_string(report.failedCount()) +
                  " failed destination" + (report.failedCount() == 1 ? "" : "s");
    } else {
        message = "Files finished copying";
    }
    frame += formatLogLine(message, color_) + "\n";

    write(frame);
}

void UserInterface::appendHeader(std::string& frame) const
{
    appendLines(frame, {
        topBorder(),
        contentLine(styled("Deployment Copy", sgr::kMagenta, color_)),
        divider(),
    });
}

void UserInterface::appendLines(std::string& frame, const std::vector<std::string>& lines) const
{
    for (const auto& line : lines) {
        frame += line;
        frame += "\n";
    }
}

std::string UserInterface::progressLine(const ProgressMessage& progress) const
{
    std::string prefix = "(" + std::to_string(progress.percentage) + "%) " +
                         formatBytes(progress.bytes_copied) + " copied --> ";
    std::size_t room = kBoxWidth - 1 - visibleLength(prefix);

    return prefix + styled(elideFront(progress.destination.string(), room),
                           sgr::kDarkGrey, color_);
}

std::vector<std::string> UserInterface::summaryLines(const CopyReport& report) const
{
    constexpr std::size_t kRoom = kBoxWidth - 3;    // after "x "

    std::vector<std::string> lines;
    for (const auto& result : report.results) {
        std::string destination = elideFront(result.destination.string(), kRoom);

        switch (result.status) {
            case DestinationStatus::Succeeded:
                lines.push_back(contentLine(styled("✓", sgr::kGreen, color_) + " " + destination));
                break;
            case DestinationStatus::Failed:
                lines.push_back(contentLine(styled("✗", sgr::kRed, color_) + " " + destination));
                lines.push_back(contentLine("  " + styled(truncate(result.error, kRoom - 1),
                                                          sgr::kRed, color_)));
                break;
            case DestinationStatus::Aborted:
            case DestinationStatus::Skipped:
                lines.push_back(contentLine(styled("-", sgr::kYellow, color_) + " " +
                                            elideFront(result.destination.string(),
                                                       kRoom - 10) +
                                            " (" + toString(result.status) + ")"));
                break;
        }
    }
    return lines;
}

void UserInterface::write(const std::string& frame)
{
    out_ << frame;
    out_.flush();
    if (!out_) {
        throw RenderIOException("Failed to write to the terminal");
    }
}

} // namespace decopy
