#include "TreeCopier.h"
#include "Exceptions.h"
#include <cerrno>
#include <fstream>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace decopy {

namespace {

std::string lastErrorMessage()
{
    return std::generic_category().message(errno);
}

[[noreturn]] void throwUnreadable(const fs::path& source, const std::error_code& ec)
{
    throw SourceUnreadableException("Could not read source directory `" + source.string() +
                                    "`: " + ec.message(), source.string());
}

} // namespace

FilesystemCopier::FilesystemCopier(std::size_t chunk_size)
    : chunk_size_(chunk_size == 0 ? 64 * 1024 : chunk_size)
{
}

std::uint64_t FilesystemCopier::totalSize(const fs::path& source)
{
    std::error_code ec;
    if (!fs::is_directory(source, ec)) {
        if (ec) {
            throwUnreadable(source, ec);
        }
        throw SourceUnreadableException("Could not open directory `" + source.string() + "`",
                                        source.string());
    }

    std::uint64_t total = 0;

    fs::recursive_directory_iterator it(source, ec);
    if (ec) {
        throwUnreadable(source, ec);
    }

    const fs::recursive_directory_iterator end;
    while (it != end) {
        fs::file_status status = it->symlink_status(ec);
        if (ec) {
            throwUnreadable(source, ec);
        }

        // Symlinks are recreated, not followed, so they add nothing
        if (fs::is_regular_file(status)) {
            std::uintmax_t size = it->file_size(ec);
            if (ec) {
                throwUnreadable(source, ec);
            }
            total += size;
        }

        it.increment(ec);
        if (ec) {
            throwUnreadable(source, ec);
        }
    }

    return total;
}

bool FilesystemCopier::copyContents(const fs::path& source,
                                    const fs::path& destination,
                                    const ChunkCallback& on_chunk)
{
    try {
        fs::create_directories(destination);
        if (!fs::is_directory(destination)) {
            throw DestinationCopyException("Destination is not a directory",
                                           destination.string());
        }

        for (const auto& entry : fs::recursive_directory_iterator(source)) {
            fs::path target = destination / entry.path().lexically_relative(source);
            fs::file_status status = entry.symlink_status();

            if (fs::is_symlink(status)) {
                if (fs::exists(fs::symlink_status(target))) {
                    fs::remove(target);
                }
                fs::copy_symlink(entry.path(), target);
            } else if (fs::is_directory(status)) {
                fs::create_directories(target);
            } else if (fs::is_regular_file(status)) {
                if (!copyFile(entry.path(), target, destination, on_chunk)) {
                    return false;
                }
            }
            // sockets, fifos and devices are skipped
        }
    } catch (const fs::filesystem_error& e) {
        throw DestinationCopyException(e.code().message() + " (" + e.path1().string() + ")",
                                       destination.string());
    }

    return true;
}

bool FilesystemCopier::copyFile(const fs::path& from,
                                const fs::path& to,
                                const fs::path& destination_root,
                                const ChunkCallback& on_chunk)
{
    if (fs::is_symlink(fs::symlink_status(to))) {
        fs::remove(to);
    }

    std::ifstream in(from, std::ios::binary);
    if (!in) {
        throw DestinationCopyException("Failed to open `" + from.string() + "`: " +
                                       lastErrorMessage(), destination_root.string());
    }

    std::ofstream out(to, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw DestinationCopyException("Failed to create `" + to.string() + "`: " +
                                       lastErrorMessage(), destination_root.string());
    }

    std::vector<char> buffer(chunk_size_);

    while (in.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) ||
           in.gcount() > 0) {
        std::streamsize n = in.gcount();
        out.write(buffer.data(), n);
        if (!out) {
            throw DestinationCopyException("Failed to write `" + to.string() + "`: " +
                                           lastErrorMessage(), destination_root.string());
        }

        if (on_chunk && !on_chunk(static_cast<std::uint64_t>(n))) {
            return false;
        }
    }

    if (in.bad()) {
        throw DestinationCopyException("Error reading `" + from.string() + "`",
                                       destination_root.string());
    }

    out.close();
    if (!out) {
        throw DestinationCopyException("Failed to finish `" + to.string() + "`: " +
                                       lastErrorMessage(), destination_root.string());
    }

    fs::permissions(to, fs::status(from).permissions(), fs::perm_options::replace);
    return true;
}

} // namespace decopy
