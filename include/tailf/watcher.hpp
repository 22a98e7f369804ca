#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include <sys/types.h>

#include "tailf/handoff_queue.hpp"
#include "tailf/options.hpp"
#include "tailf/watch_service.hpp"

namespace tailf {

// Runs `body` on a new thread of execution. Throws std::system_error when no
// thread can be created. The default launcher detaches a std::thread.
using ThreadLauncher = std::function<void(std::function<void()>)>;

// Watches the parent directory of one file and forwards the bytes appended to
// that file, as Data chunks, into a HandoffQueue. Always finishes the stream
// with an End chunk when its loop exits.
class DirectoryWatcher : public std::enable_shared_from_this<DirectoryWatcher> {
public:
    DirectoryWatcher(std::filesystem::path file,
                     std::shared_ptr<HandoffQueue> queue,
                     FollowOptions opt,
                     WatchServiceFactory factory,
                     ThreadLauncher launch = {});

    DirectoryWatcher(const DirectoryWatcher&) = delete;
    DirectoryWatcher& operator=(const DirectoryWatcher&) = delete;

    // Runs the watch loop on a detached thread that co-owns this watcher.
    // Idempotent once it succeeds; a failed launch rethrows and may be
    // retried. The returned future becomes ready once the watch is
    // registered and the baseline captured, or once setup has failed.
    std::shared_future<void> start();

    // The watch loop itself; blocks until stopped or the watch fails.
    void run();

    void stop() noexcept { stop_requested_.store(true); }

    [[nodiscard]] std::shared_future<void> ready() const { return ready_future_; }
    [[nodiscard]] bool active() const noexcept { return active_.load(); }

    // Watcher-thread state; exposed for tests.
    [[nodiscard]] off_t baseline() const noexcept { return baseline_.load(); }

private:
    void process(const std::vector<WatchEvent>& batch);
    void forward_growth();
    void capture_baseline();
    void finish();
    void signal_ready();
    void log(const std::string& msg) const;

    const std::filesystem::path   file_;
    const std::filesystem::path   dir_;
    const std::string             filename_;
    std::shared_ptr<HandoffQueue> queue_;
    FollowOptions                 opt_;
    WatchServiceFactory           factory_;
    ThreadLauncher                launch_;

    std::atomic<bool>  started_{false};
    std::atomic<bool>  stop_requested_{false};
    std::atomic<bool>  active_{false};
    std::atomic<off_t> baseline_{0};
    ino_t              ino_ = 0;

    std::chrono::steady_clock::time_point last_activity_;

    std::promise<void>       ready_;
    std::shared_future<void> ready_future_;
    bool                     ready_signaled_ = false;
};

} // namespace tailf
