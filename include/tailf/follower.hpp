#pragma once
#include <atomic>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <span>
#include <stdexcept>

#include "tailf/bytecursor.hpp"
#include "tailf/handoff_queue.hpp"
#include "tailf/options.hpp"
#include "tailf/watch_service.hpp"
#include "tailf/watcher.hpp"

namespace tailf {

struct InvalidTarget : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Sequential byte stream over the content appended to a file ("tail -f").
//
// The watcher is started lazily by the first read (or by start()), and only
// bytes written after it became ready are delivered. Reads block until data
// arrives; eof is returned once the stream has ended and on every read after.
// Not safe for concurrent reads; close() may be called from any thread.
class FollowingReader {
public:
    static constexpr int eof = -1;

    // Throws InvalidTarget if `path` is a directory.
    explicit FollowingReader(const std::filesystem::path& path, FollowOptions opt = {});
    FollowingReader(const std::filesystem::path& path, FollowOptions opt, WatchServiceFactory factory,
                    ThreadLauncher launch = {});
    ~FollowingReader();

    FollowingReader(const FollowingReader&) = delete;
    FollowingReader& operator=(const FollowingReader&) = delete;

    // Launches the watcher and waits until it is live. Idempotent. If the
    // watcher thread cannot be created the reader is closed and the error
    // rethrown; later reads return eof.
    void start();

    // Next byte in [0, 255], or eof.
    int read();

    // Blocks for the first byte only; then copies what is already buffered.
    // Returns the count, 0 for an empty span, or eof.
    std::ptrdiff_t read(std::span<std::byte> out);

    [[nodiscard]] std::size_t available() const noexcept;

    static constexpr bool mark_supported() noexcept { return false; }

    void close() noexcept;

    [[nodiscard]] bool closed() const noexcept { return closed_.load(); }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    bool fill();

    std::filesystem::path             path_;
    std::shared_ptr<HandoffQueue>     queue_;
    std::shared_ptr<DirectoryWatcher> watcher_;
    ByteCursor                        cursor_;
    bool                              started_ = false;
    std::atomic<bool>                 closed_{false};
};

} // namespace tailf
