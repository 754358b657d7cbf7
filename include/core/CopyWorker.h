#ifndef DECOPY_COPYWORKER_H
#define DECOPY_COPYWORKER_H

#include <stop_token>
#include "CopyQueue.h"
#include "ILogger.h"
#include "ProgressChannel.h"
#include "TreeCopier.h"

namespace decopy {

/**
 * @brief Body of the copy thread
 *
 * Runs queue.startCopy() and translates every callback into a typed message:
 * progress -> ProgressMessage, destination failure -> FailedMessage,
 * completion -> DoneMessage, unreadable source -> FatalMessage.
 * The channel is closed on every path out of this function, so the renderer
 * never waits forever.
 *
 * Intended for std::jthread:
 * @code
 * std::jthread worker([&](std::stop_token st) {
 *     runCopyWorker(queue, copier, logger, channel, st);
 * });
 * @endcode
 */
void runCopyWorker(const CopyQueue& queue,
                   ITreeCopier& copier,
                   ILogger& logger,
                   ProgressChannel& channel,
                   std::stop_token stop = {});

} // namespace decopy

#endif // DECOPY_COPYWORKER_H
