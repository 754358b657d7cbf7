#include "CopyWorker.h"
#include "Exceptions.h"
#include <exception>

namespace decopy {

namespace {

// Closes the channel however the worker exits
class ChannelCloser {
public:
    explicit ChannelCloser(ProgressChannel& channel) : channel_(channel) {}
    ~ChannelCloser() { channel_.close(); }

    ChannelCloser(const ChannelCloser&) = delete;
    ChannelCloser& operator=(const ChannelCloser&) = delete;

private:
    ProgressChannel& channel_;
};

} // namespace

void runCopyWorker(const CopyQueue& queue,
                   ITreeCopier& copier,
                   ILogger& logger,
                   ProgressChannel& channel,
                   std::stop_token stop)
{
    ChannelCloser closer(channel);

    CopyCallbacks callbacks;
    callbacks.on_progress = [&](int percentage, std::uint64_t bytes,
                                const std::filesystem::path& destination) {
        // A closed channel means nobody is watching any more
        return channel.publish(ProgressMessage{percentage, bytes, destination});
    };
    callbacks.on_failure = [&](const std::filesystem::path& destination,
                               const std::string& error) {
        channel.send(FailedMessage{destination, error});
    };
    callbacks.on_complete = [&](const CopyReport& report) {
        channel.send(DoneMessage{report});
    };

    try {
        queue.startCopy(copier, logger, callbacks, stop);
    } catch (const SourceUnreadableException& e) {
        logger.debug(std::string("Copy worker stopped: ") + e.what());
        channel.send(FatalMessage{e.what(), e.path(), true});
    } catch (const std::exception& e) {
        logger.error(std::string("Copy worker failed: ") + e.what());
        channel.send(FatalMessage{e.what(), "", false});
    }
}

} // namespace decopy
