#include "tailf/watcher.hpp"

#include <algorithm>
#include <cerrno>
#include <functional>
#include <iostream>
#include <optional>
#include <span>
#include <system_error>
#include <thread>
#include <type_traits>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace tailf {
namespace {

FollowOptions normalized(FollowOptions opt)
{
    const FollowOptions defaults;
    if (opt.read_chunk == 0) opt.read_chunk = defaults.read_chunk;
    if (opt.wait_ms <= 0)    opt.wait_ms    = defaults.wait_ms;
    if (opt.poll_ms <= 0)    opt.poll_ms    = defaults.poll_ms;
    return opt;
}

WatchServiceFactory default_factory(const FollowOptions& opt, const std::string& filename)
{
    if (opt.backend == Backend::Poll) {
        const auto interval = std::chrono::milliseconds(opt.poll_ms);
        return [filename, interval] { return make_polling_watch_service(filename, interval); };
    }
    return [] { return make_inotify_watch_service(); };
}

void launch_detached(std::function<void()> body)
{
    std::thread(std::move(body)).detach();
}

struct FdCloser {
    explicit FdCloser(int f) noexcept : fd(f) {}
    ~FdCloser() { if (fd >= 0) ::close(fd); }

    FdCloser(const FdCloser&) = delete;
    FdCloser& operator=(const FdCloser&) = delete;

    int fd;
};
static_assert(!std::is_copy_constructible_v<FdCloser> && !std::is_copy_assignable_v<FdCloser>);

} // namespace

DirectoryWatcher::DirectoryWatcher(std::filesystem::path file,
                                   std::shared_ptr<HandoffQueue> queue,
                                   FollowOptions opt,
                                   WatchServiceFactory factory,
                                   ThreadLauncher launch)
    : file_(std::move(file))
    , dir_(file_.has_parent_path() ? file_.parent_path() : std::filesystem::path("."))
    , filename_(file_.filename().string())
    , queue_(std::move(queue))
    , opt_(normalized(opt))
    , factory_(factory ? std::move(factory) : default_factory(opt_, filename_))
    , launch_(launch ? std::move(launch) : ThreadLauncher(launch_detached))
    , ready_future_(ready_.get_future().share())
{
}

std::shared_future<void> DirectoryWatcher::start()
{
    if (!started_.exchange(true)) {
        try {
            launch_([self = shared_from_this()] { self->run(); });
        } catch (...) {
            started_.store(false);
            throw;
        }
    }
    return ready_future_;
}

void DirectoryWatcher::run()
{
    using namespace std::chrono;

    std::unique_ptr<WatchService> service;
    try {
        service = factory_();
        if (!service) throw WatchError("no watch service available");
        service->watch(dir_);
    } catch (const std::exception& e) {
        log(std::string("setup failed: ") + e.what());
        finish();
        return;
    }

    // baseline before readiness, so growth right after start() is not lost
    capture_baseline();
    active_.store(true);
    last_activity_ = steady_clock::now();
    signal_ready();

    const bool use_timeout = (opt_.inactivity_timeout_ms > 0);
    const auto timeout = milliseconds(opt_.inactivity_timeout_ms);
    const auto wait = use_timeout ? std::min(milliseconds(opt_.wait_ms), timeout)
                                  : milliseconds(opt_.wait_ms);

    while (!stop_requested_.load()) {
        std::optional<std::vector<WatchEvent>> batch;
        try {
            batch = service->poll(wait);
        } catch (const std::exception& e) {
            log(e.what());
            break;
        }
        if (stop_requested_.load()) break;

        if (batch) process(*batch);

        if (use_timeout && (steady_clock::now() - last_activity_ > timeout)) {
            log("no new data for " + std::to_string(opt_.inactivity_timeout_ms) + " ms");
            break;
        }
    }
    finish();
}

void DirectoryWatcher::process(const std::vector<WatchEvent>& batch)
{
    bool overflow = false;
    for (const auto& ev : batch) {
        if (ev.kind == EventKind::Overflow) {
            overflow = true;
            continue;
        }
        if (ev.name != filename_) continue;

        if (ev.kind == EventKind::Deleted) {
            baseline_.store(0);
            ino_ = 0;
            if (opt_.verbose) log("deleted");
            continue;
        }

        try {
            forward_growth();
        } catch (const std::exception& e) {
            if (opt_.verbose) log(std::string("event dropped: ") + e.what());
        }
    }

    // events were lost; compare the file against the baseline once more
    if (overflow) {
        if (opt_.verbose) log("event queue overflow, resyncing");
        try {
            forward_growth();
        } catch (const std::exception& e) {
            if (opt_.verbose) log(std::string("resync failed: ") + e.what());
        }
    }
}

void DirectoryWatcher::forward_growth()
{
    int fd = ::open(file_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT) return;
        throw std::system_error(errno, std::generic_category(), "open " + file_.string());
    }
    FdCloser guard{fd};

    struct stat st{};
    if (::fstat(fd, &st) != 0)
        throw std::system_error(errno, std::generic_category(), "fstat " + file_.string());

    const off_t size = st.st_size;
    off_t pos = baseline_.load();

    // 轮转或截断
    if (ino_ != 0 && st.st_ino != ino_) {
        if (opt_.verbose) log("replaced, reading from the start");
        pos = 0;
    } else if (size < pos) {
        if (opt_.verbose) log("truncated, reading from the start");
        pos = 0;
    }
    ino_ = st.st_ino;

    std::vector<std::byte> buf(opt_.read_chunk);
    try {
        for (;;) {
            ssize_t n = ::pread(fd, buf.data(), buf.size(), pos);
            if (n < 0) {
                if (errno == EINTR) continue;
                throw std::system_error(errno, std::generic_category(), "read " + file_.string());
            }
            if (n == 0) break;

            queue_->push(Chunk::data(std::span<const std::byte>(buf.data(), static_cast<std::size_t>(n))));
            pos += n;
            last_activity_ = std::chrono::steady_clock::now();
        }
    } catch (...) {
        baseline_.store(std::max(size, pos));
        throw;
    }
    // bytes appended after fstat were already forwarded; never replay them
    baseline_.store(std::max(size, pos));
}

void DirectoryWatcher::capture_baseline()
{
    struct stat st{};
    if (::stat(file_.c_str(), &st) == 0) {
        baseline_.store(st.st_size);
        ino_ = st.st_ino;
    } else {
        baseline_.store(0);
        ino_ = 0;
    }
}

void DirectoryWatcher::finish()
{
    active_.store(false);
    queue_->push(Chunk::end());
    signal_ready();
}

void DirectoryWatcher::signal_ready()
{
    if (ready_signaled_) return;
    ready_signaled_ = true;
    ready_.set_value();
}

void DirectoryWatcher::log(const std::string& msg) const
{
    std::cerr << ("[tailf watcher] " + file_.string() + ": " + msg + "\n");
}

} // namespace tailf
