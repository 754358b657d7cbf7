#include <catch2/catch.hpp>
#include "CopyQueue.h"
#include "CopyWorker.h"
#include "Exceptions.h"
#include "ILogger.h"
#include "ProgressChannel.h"
#include "TreeCopier.h"
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <stop_token>
#include <string>
#include <utility>
#include <variant>
#include <vector>

using namespace decopy;
namespace fs = std::filesystem;

namespace {

// Scratch directory removed when the test ends
class TempTree {
public:
    explicit TempTree(const std::string& name)
    {
        static std::atomic<int> counter{0};
        root_ = fs::temp_directory_path() /
                ("decopy_test_" + name + "_" + std::to_string(counter++));
        fs::remove_all(root_);
        fs::create_directories(root_);
    }

    ~TempTree()
    {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    TempTree(const TempTree&) = delete;
    TempTree& operator=(const TempTree&) = delete;

    const fs::path& root() const { return root_; }
    fs::path operator/(const std::string& rel) const { return root_ / rel; }

    void write(const std::string& rel, const std::string& content) const
    {
        fs::path p = root_ / rel;
        fs::create_directories(p.parent_path());
        std::ofstream f(p, std::ios::binary);
        f << content;
    }

private:
    fs::path root_;
};

std::vector<std::string> pathStrings(const std::vector<fs::path>& paths)
{
    std::vector<std::string> out;
    for (const auto& p : paths) {
        out.push_back(p.string());
    }
    return out;
}

std::string readFile(const fs::path& p)
{
    std::ifstream f(p, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

// Collects messages so tests can check what the queue reported
class RecordingLogger : public ILogger {
public:
    void debug(const std::string& msg) override { debugs.push_back(msg); }
    void info(const std::string&) override {}
    void warn(const std::string& msg) override { warnings.push_back(msg); }
    void error(const std::string& msg) override { errors.push_back(msg); }

    std::vector<std::string> debugs;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;
};

struct Tick {
    int percentage;
    std::uint64_t bytes;
    fs::path destination;
};

// Records every callback; on_progress answers with `keep_going`
struct Recorder {
    std::vector<Tick> ticks;
    std::vector<std::pair<fs::path, std::string>> failures;
    std::vector<CopyReport> reports;
    std::function<bool(const Tick&)> keep_going = [](const Tick&) { return true; };

    CopyCallbacks callbacks()
    {
        CopyCallbacks cb;
        cb.on_progress = [this](int pct, std::uint64_t bytes, const fs::path& dest) {
            ticks.push_back(Tick{pct, bytes, dest});
            return keep_going(ticks.back());
        };
        cb.on_failure = [this](const fs::path& dest, const std::string& error) {
            failures.emplace_back(dest, error);
        };
        cb.on_complete = [this](const CopyReport& report) { reports.push_back(report); };
        return cb;
    }
};

// Pretends to copy `size` bytes in `chunks` pieces; chosen destinations fail
class FakeCopier : public ITreeCopier {
public:
    FakeCopier(std::uint64_t size, int chunks) : size_(size), chunks_(chunks) {}

    std::uint64_t totalSize(const fs::path& source) override
    {
        if (unreadable) {
            throw SourceUnreadableException("cannot read", source.string());
        }
        return size_;
    }

    bool copyContents(const fs::path&, const fs::path& destination,
                      const ChunkCallback& on_chunk) override
    {
        copied_to.push_back(destination);
        for (int i = 0; i < chunks_; ++i) {
            if (fail_at.count(destination) && fail_at[destination] == i) {
                throw DestinationCopyException("No space left on device", destination.string());
            }
            if (!on_chunk(size_ / chunks_)) {
                return false;
            }
        }
        return true;
    }

    bool unreadable = false;
    std::map<fs::path, int> fail_at;
    std::vector<fs::path> copied_to;

private:
    std::uint64_t size_;
    int chunks_;
};

} // namespace

TEST_CASE("computePercentage", "[queue]") {
    REQUIRE(computePercentage(0, 200) == 0);
    REQUIRE(computePercentage(1, 200) == 0);
    REQUIRE(computePercentage(199, 200) == 99);
    REQUIRE(computePercentage(200, 200) == 100);
    REQUIRE(computePercentage(300, 200) == 100);
    REQUIRE(computePercentage(0, 0) == 100);
}

TEST_CASE("CopyQueue::fromArguments", "[queue]") {
    const fs::path cwd = "/work";

    SECTION("relative paths resolve against cwd") {
        CopyQueue queue = CopyQueue::fromArguments(cwd, "build", {"../out", "/mnt/usb"});
        REQUIRE(queue.source().string() == "/work/build");
        REQUIRE(pathStrings(queue.destinations()) == std::vector<std::string>{"/out", "/mnt/usb"});
        REQUIRE(queue.sourceName() == "build");
    }

    SECTION("order is preserved") {
        CopyQueue queue = CopyQueue::fromArguments(cwd, "build", {"/c", "/a", "/b"});
        REQUIRE(pathStrings(queue.destinations()) == std::vector<std::string>{"/c", "/a", "/b"});
    }

    SECTION("missing source or destinations") {
        REQUIRE_THROWS_AS(CopyQueue::fromArguments(cwd, "", {"/a"}), ArgumentException);
        REQUIRE_THROWS_AS(CopyQueue::fromArguments(cwd, "build", {}), ArgumentException);
        REQUIRE_THROWS_AS(CopyQueue::fromArguments(cwd, "build", {"/a", " "}), ArgumentException);
    }

    SECTION("destination may not be the source or inside it") {
        REQUIRE_THROWS_AS(CopyQueue::fromArguments(cwd, "build", {"build"}), ArgumentException);
        REQUIRE_THROWS_AS(CopyQueue::fromArguments(cwd, "build", {"build/sub"}),
                          ArgumentException);
        REQUIRE_THROWS_AS(CopyQueue::fromArguments(cwd, "build", {"./build/"}), ArgumentException);
        REQUIRE_NOTHROW(CopyQueue::fromArguments(cwd, "build", {"build-copy"}));
        REQUIRE_NOTHROW(CopyQueue::fromArguments(cwd, "build/sub", {"build"}));
    }
}

TEST_CASE("CopyQueue::sourceName", "[queue]") {
    REQUIRE(CopyQueue("/work/dist", {}).sourceName() == "dist");
    REQUIRE(CopyQueue("/work/dist/", {}).sourceName() == "dist");
    REQUIRE(CopyQueue("/", {}).sourceName() == "/");
}

TEST_CASE("CopyQueue::previewSource", "[queue]") {
    TempTree tree("preview");
    tree.write("c.txt", "c");
    tree.write("a.txt", "a");
    tree.write("b/inner.txt", "b");
    tree.write("d.txt", "d");

    CopyQueue queue(tree.root(), {"/unused"});

    SECTION("sorted names up to the limit") {
        SourcePreview preview = queue.previewSource(2);
        REQUIRE(preview.names == std::vector<std::string>{"a.txt", "b"});
        REQUIRE(preview.hidden == 2);
    }

    SECTION("limit larger than the directory") {
        SourcePreview preview = queue.previewSource(10);
        REQUIRE(preview.names.size() == 4);
        REQUIRE(preview.hidden == 0);
    }

    SECTION("missing source") {
        CopyQueue missing(tree / "nope", {"/unused"});
        REQUIRE_THROWS_AS(missing.previewSource(5), SourceUnreadableException);
    }
}

TEST_CASE("CopyQueue copies into every destination", "[queue]") {
    TempTree tree("copy");
    tree.write("src/index.html", std::string(5000, 'h'));
    tree.write("src/assets/app.js", std::string(3000, 'j'));
    tree.write("src/assets/empty.css", "");
    tree.write("dst2/index.html", "stale contents");

    CopyQueue queue(tree / "src", {tree / "dst1", tree / "dst2"});
    FilesystemCopier copier(1024);
    RecordingLogger logger;
    Recorder rec;

    queue.startCopy(copier, logger, rec.callbacks());

    SECTION("contents land in each destination, overwriting existing files") {
        for (const char* dest : {"dst1", "dst2"}) {
            REQUIRE(readFile(tree / dest / "index.html") == std::string(5000, 'h'));
            REQUIRE(readFile(tree / dest / "assets/app.js") == std::string(3000, 'j'));
            REQUIRE(fs::exists(tree / dest / "assets/empty.css"));
            REQUIRE_FALSE(fs::exists(tree / dest / "src"));
        }
    }

    SECTION("on_complete fires once with a successful report") {
        REQUIRE(rec.reports.size() == 1);
        const CopyReport& report = rec.reports.front();
        REQUIRE(report.total_bytes == 8000);
        REQUIRE(report.allSucceeded());
        REQUIRE(report.results.size() == 2);
        REQUIRE(report.results[0].destination.string() == (tree / "dst1").string());
        REQUIRE(report.results[0].bytes_copied == 8000);
        REQUIRE(rec.failures.empty());
        REQUIRE(logger.warnings.empty());
    }

    SECTION("progress is ordered and monotonic per destination") {
        REQUIRE_FALSE(rec.ticks.empty());
        REQUIRE(rec.ticks.front().destination.string() == (tree / "dst1").string());
        REQUIRE(rec.ticks.front().percentage == 0);

        std::size_t switch_at = 0;
        for (std::size_t i = 1; i < rec.ticks.size(); ++i) {
            if (rec.ticks[i].destination != rec.ticks[i - 1].destination) {
                REQUIRE(switch_at == 0);    // only one switch, dst1 -> dst2
                switch_at = i;
                continue;
            }
            REQUIRE(rec.ticks[i].percentage >= rec.ticks[i - 1].percentage);
            REQUIRE(rec.ticks[i].bytes >= rec.ticks[i - 1].bytes);
        }

        REQUIRE(switch_at > 0);
        REQUIRE(rec.ticks[switch_at - 1].percentage == 100);
        REQUIRE(rec.ticks[switch_at].destination.string() == (tree / "dst2").string());
        REQUIRE(rec.ticks[switch_at].percentage == 0);
        REQUIRE(rec.ticks.back().percentage == 100);
        REQUIRE(rec.ticks.back().bytes == 8000);
    }

    SECTION("running again overwrites in place") {
        tree.write("src/index.html", "new");
        Recorder again;
        queue.startCopy(copier, logger, again.callbacks());
        REQUIRE(readFile(tree / "dst1" / "index.html") == "new");
        REQUIRE(again.reports.front().allSucceeded());
    }
}

TEST_CASE("CopyQueue handles an empty source", "[queue]") {
    TempTree tree("empty");
    fs::create_directories(tree / "src");

    CopyQueue queue(tree / "src", {tree / "dst"});
    FilesystemCopier copier;
    NullLogger logger;
    Recorder rec;

    queue.startCopy(copier, logger, rec.callbacks());

    REQUIRE(fs::is_directory(tree / "dst"));
    REQUIRE(rec.ticks.size() == 1);
    REQUIRE(rec.ticks.front().percentage == 100);
    REQUIRE(rec.reports.front().allSucceeded());
}

TEST_CASE("A failing destination does not stop the others", "[queue]") {
    TempTree tree("fail");
    tree.write("src/file.txt", "payload");
    tree.write("blocker", "i am a file, not a directory");

    CopyQueue queue(tree / "src", {tree / "blocker", tree / "ok"});
    FilesystemCopier copier;
    RecordingLogger logger;
    Recorder rec;

    queue.startCopy(copier, logger, rec.callbacks());

    REQUIRE(readFile(tree / "ok" / "file.txt") == "payload");
    REQUIRE(rec.failures.size() == 1);
    REQUIRE(rec.failures.front().first.string() == (tree / "blocker").string());

    REQUIRE(rec.reports.size() == 1);
    const CopyReport& report = rec.reports.front();
    REQUIRE(report.results[0].status == DestinationStatus::Failed);
    REQUIRE_FALSE(report.results[0].error.empty());
    REQUIRE(report.results[1].status == DestinationStatus::Succeeded);
    REQUIRE(report.failedCount() == 1);
    REQUIRE_FALSE(report.allSucceeded());
    REQUIRE_FALSE(report.cancelled);

    // Reported once in the final summary, nothing on stderr mid-copy
    REQUIRE(logger.warnings.empty());
    REQUIRE(std::any_of(logger.debugs.begin(), logger.debugs.end(), [](const std::string& m) {
        return m.find("blocker` failed") != std::string::npos;
    }));
}

TEST_CASE("CopyQueue with an injected copier", "[queue]") {
    FakeCopier copier(400, 4);
    RecordingLogger logger;
    Recorder rec;
    CopyQueue queue("/src", {"/a", "/b", "/c"});

    SECTION("mid-copy failure is recorded and the queue moves on") {
        copier.fail_at["/b"] = 2;
        queue.startCopy(copier, logger, rec.callbacks());

        REQUIRE(pathStrings(copier.copied_to) == std::vector<std::string>{"/a", "/b", "/c"});
        const CopyReport& report = rec.reports.front();
        REQUIRE(report.results[1].status == DestinationStatus::Failed);
        REQUIRE(report.results[1].bytes_copied == 200);
        REQUIRE(report.results[1].error == "No space left on device");
        REQUIRE(report.succeededCount() == 2);
    }

    SECTION("on_progress returning false aborts only that destination") {
        rec.keep_going = [](const Tick& t) {
            return !(t.destination == "/a" && t.percentage >= 50);
        };
        queue.startCopy(copier, logger, rec.callbacks());

        const CopyReport& report = rec.reports.front();
        REQUIRE(report.results[0].status == DestinationStatus::Aborted);
        REQUIRE(report.results[0].error == "aborted");
        REQUIRE(report.results[1].status == DestinationStatus::Succeeded);
        REQUIRE(report.results[2].status == DestinationStatus::Succeeded);
        REQUIRE_FALSE(report.cancelled);
        REQUIRE(rec.failures.empty());
    }

    SECTION("stop request skips the remaining destinations") {
        std::stop_source stop;
        rec.keep_going = [&stop](const Tick& t) {
            if (t.destination == "/a" && t.percentage == 100) {
                stop.request_stop();
            }
            return true;
        };
        queue.startCopy(copier, logger, rec.callbacks(), stop.get_token());

        const CopyReport& report = rec.reports.front();
        REQUIRE(report.results[0].status == DestinationStatus::Aborted);
        REQUIRE(report.results[0].error == "cancelled");
        REQUIRE(report.results[1].status == DestinationStatus::Skipped);
        REQUIRE(report.results[2].status == DestinationStatus::Skipped);
        REQUIRE(report.cancelled);
        REQUIRE_FALSE(report.allSucceeded());
        REQUIRE(copier.copied_to.size() == 1);
    }

    SECTION("stop requested before the start skips everything") {
        std::stop_source stop;
        stop.request_stop();
        queue.startCopy(copier, logger, rec.callbacks(), stop.get_token());

        REQUIRE(rec.ticks.empty());
        REQUIRE(copier.copied_to.empty());
        REQUIRE(rec.reports.front().cancelled);
        REQUIRE(rec.reports.front().succeededCount() == 0);
    }

    SECTION("unreadable source is fatal before any destination") {
        copier.unreadable = true;
        REQUIRE_THROWS_AS(queue.startCopy(copier, logger, rec.callbacks()),
                          SourceUnreadableException);
        REQUIRE(rec.ticks.empty());
        REQUIRE(rec.reports.empty());
        REQUIRE(copier.copied_to.empty());
    }
}

TEST_CASE("Missing source directory is unreadable", "[queue]") {
    TempTree tree("missing");
    CopyQueue queue(tree / "does-not-exist", {tree / "dst"});
    FilesystemCopier copier;
    NullLogger logger;
    Recorder rec;

    REQUIRE_THROWS_AS(queue.startCopy(copier, logger, rec.callbacks()),
                      SourceUnreadableException);
    REQUIRE(rec.ticks.empty());
    REQUIRE(rec.reports.empty());
    REQUIRE_FALSE(fs::exists(tree / "dst"));
}

TEST_CASE("runCopyWorker turns callbacks into events", "[worker]") {
    FakeCopier copier(100, 2);
    NullLogger logger;
    ProgressChannel channel(64);
    CopyQueue queue("/src", {"/a", "/b"});

    SECTION("success ends with Done and a closed channel") {
        copier.fail_at["/a"] = 1;
        runCopyWorker(queue, copier, logger, channel);

        REQUIRE(channel.closed());
        std::vector<CopyEvent> events;
        while (auto event = channel.receive()) {
            events.push_back(std::move(*event));
        }

        REQUIRE(std::holds_alternative<DoneMessage>(events.back()));
        const CopyReport& report = std::get<DoneMessage>(events.back()).report;
        REQUIRE(report.failedCount() == 1);

        std::size_t failed = 0;
        for (const auto& event : events) {
            if (auto* f = std::get_if<FailedMessage>(&event)) {
                REQUIRE(f->destination.string() == "/a");
                ++failed;
            }
        }
        REQUIRE(failed == 1);
    }

    SECTION("unreadable source sends a single Fatal") {
        copier.unreadable = true;
        runCopyWorker(queue, copier, logger, channel);

        REQUIRE(channel.closed());
        auto event = channel.receive();
        REQUIRE(event);
        auto* fatal = std::get_if<FatalMessage>(&*event);
        REQUIRE(fatal != nullptr);
        REQUIRE(fatal->source_unreadable);
        REQUIRE(fatal->path == "/src");
        REQUIRE_FALSE(channel.receive().has_value());
    }
}
