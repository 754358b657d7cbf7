#ifndef DECOPY_TREECOPIER_H
#define DECOPY_TREECOPIER_H

#include <cstdint>
#include <cstddef>
#include <filesystem>
#include <functional>

namespace decopy {

/**
 * @brief Called after every chunk written
 * @param chunk_bytes Bytes written by this chunk
 * @return false to abort the current tree copy
 */
using ChunkCallback = std::function<bool(std::uint64_t chunk_bytes)>;

/**
 * @brief Recursive copy primitive used by CopyQueue
 *
 * Abstract so tests can inject failures without touching the filesystem.
 */
class ITreeCopier {
public:
    virtual ~ITreeCopier() = default;

    /**
     * @brief Total size in bytes of the regular files below source
     * @throws SourceUnreadableException if source is missing, not a directory
     *         or cannot be walked
     */
    virtual std::uint64_t totalSize(const std::filesystem::path& source) = 0;

    /**
     * @brief Copy the contents of source into destination
     *
     * Creates destination when needed and overwrites existing files. The
     * source directory itself is not recreated inside destination.
     *
     * @return true when everything was copied, false when on_chunk aborted
     * @throws DestinationCopyException on any I/O failure
     */
    virtual bool copyContents(const std::filesystem::path& source,
                              const std::filesystem::path& destination,
                              const ChunkCallback& on_chunk) = 0;
};

/**
 * @brief std::filesystem implementation with chunked file copies
 *
 * Regular files are streamed chunk_size bytes at a time so progress (and
 * cancellation) is fine-grained even for a single large file. Symlinks are
 * recreated as symlinks, other special files are skipped.
 */
class FilesystemCopier : public ITreeCopier {
public:
    explicit FilesystemCopier(std::size_t chunk_size = 64 * 1024);

    std::uint64_t totalSize(const std::filesystem::path& source) override;

    bool copyContents(const std::filesystem::path& source,
                      const std::filesystem::path& destination,
                      const ChunkCallback& on_chunk) override;

private:
    bool copyFile(const std::filesystem::path& from,
                  const std::filesystem::path& to,
                  const std::filesystem::path& destination_root,
                  const ChunkCallback& on_chunk);

    std::size_t chunk_size_;
};

} // namespace decopy

#endif // DECOPY_TREECOPIER_H
