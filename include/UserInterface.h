#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>
#include "CopyQueue.h"
#include "ProgressChannel.h"

namespace decopy {

// Nothing copied yet, waiting for [Y]/[N]
struct PreCopy {
    CopyQueue queue;
};

// Streaming progress from the worker until the channel closes
struct Copying {
    std::shared_ptr<ProgressChannel> channel;
    CopyQueue queue;
};

struct Completed {
    CopyQueue queue;
    CopyReport report;
};

using UIState = std::variant<PreCopy, Copying, Completed>;

/**
 * @brief Deployment Copy render state machine
 *
 * Holds exactly one UIState and draws it as boxes on the given sink:
 *
 * @code
 * ╭───────────────────────────────────────────────────╮
 * │ Deployment Copy                                   │
 * ├───────────────────────────────────────────────────┤
 * │ (42%) 10mb copied --> /mnt/usb                    │
 * ╰───────────────────────────────────────────────────╯
 * @endcode
 *
 * followed by the queue box (see queueBox()). States only move forward
 * (PreCopy -> Copying -> Completed); the caller drives transitions, render()
 * draws whatever is current. Every frame is written in one piece, so a box is
 * never left half drawn.
 */
class UserInterface {
public:
    explicit UserInterface(std::ostream& out, bool color = true);

    /**
     * @throws InvalidStateException when moving backwards
     */
    UserInterface& withPreCopy(CopyQueue queue);
    UserInterface& withCopying(std::shared_ptr<ProgressChannel> channel, CopyQueue queue);
    UserInterface& withCompleted(CopyQueue queue, CopyReport report);

    /**
     * @brief Draw the current state
     *
     * In Copying this blocks, redrawing the status row for every event, until
     * the channel closes.
     *
     * @throws RenderIOException if the sink rejects a write
     * @throws SourceUnreadableException if the worker reported an unreadable source
     * @throws DecopyException if the worker died or closed without a report
     */
    void render();

    const std::optional<UIState>& state() const { return state_; }

    // Report delivered by the worker while in Copying
    const std::optional<CopyReport>& report() const { return report_; }

    // Destination failures seen while in Copying, in arrival order
    const std::vector<FailedMessage>& failures() const { return failures_; }

    // Status-row redraws performed in Copying
    std::size_t redrawCount() const { return redraws_; }

private:
    void transition(UIState next);

    void renderPreCopy(const PreCopy& state);
    void renderCopying(const Copying& state);
    void renderCompleted(const Completed& state);

    void appendHeader(std::string& frame) const;
    void appendLines(std::string& frame, const std::vector<std::string>& lines) const;
    std::string progressLine(const ProgressMessage& progress) const;
    std::vector<std::string> summaryLines(const CopyReport& report) const;

    void write(const std::string& frame);

    std::ostream& out_;
    bool color_;
    std::optional<UIState> state_;
    std::optional<CopyReport> report_;
    std::vector<FailedMessage> failures_;
    std::size_t redraws_ = 0;
};

} // namespace decopy
