#include "tailf/watch_service.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace tailf {
namespace {

constexpr uint32_t kWatchMask = IN_CREATE | IN_MODIFY | IN_DELETE
                              | IN_MOVED_TO | IN_MOVED_FROM
                              | IN_DELETE_SELF | IN_MOVE_SELF;

std::string errno_message(const std::string& what, int err)
{
    return what + ": " + std::strerror(err);
}

class InotifyWatchService final : public WatchService {
public:
    InotifyWatchService()
        : fd_(::inotify_init1(IN_NONBLOCK | IN_CLOEXEC))
    {
        if (fd_ < 0) throw WatchError(errno_message("inotify_init1 failed", errno));
    }

    ~InotifyWatchService() override
    {
        if (fd_ >= 0) ::close(fd_);
    }

    InotifyWatchService(const InotifyWatchService&) = delete;
    InotifyWatchService& operator=(const InotifyWatchService&) = delete;

    void watch(const std::filesystem::path& dir) override
    {
        wd_ = ::inotify_add_watch(fd_, dir.c_str(), kWatchMask | IN_ONLYDIR);
        if (wd_ < 0)
            throw WatchError(errno_message("cannot watch " + dir.string(), errno));
        dir_ = dir.string();
    }

    std::optional<std::vector<WatchEvent>> poll(std::chrono::milliseconds timeout) override
    {
        if (invalid_) throw WatchError("watch on " + dir_ + " is no longer valid");

        pollfd pfd{fd_, POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (rc < 0) {
            if (errno == EINTR) return std::nullopt;
            throw WatchError(errno_message("poll on inotify failed", errno));
        }
        if (rc == 0) return std::nullopt;

        std::vector<WatchEvent> batch;
        drain(batch);
        if (batch.empty()) {
            if (invalid_) throw WatchError("watch on " + dir_ + " is no longer valid");
            return std::nullopt;
        }
        return batch;
    }

private:
    void drain(std::vector<WatchEvent>& batch)
    {
        alignas(inotify_event) char buf[16 * 1024];
        for (;;) {
            ssize_t len = ::read(fd_, buf, sizeof(buf));
            if (len < 0) {
                if (errno == EINTR) continue;
                if (errno == EAGAIN) return;
                throw WatchError(errno_message("read on inotify failed", errno));
            }
            if (len == 0) return;

            for (char* p = buf; p < buf + len; ) {
                const auto* ev = reinterpret_cast<const inotify_event*>(p);
                translate(*ev, batch);
                p += sizeof(inotify_event) + ev->len;
            }
        }
    }

    void translate(const inotify_event& ev, std::vector<WatchEvent>& batch)
    {
        if (ev.mask & IN_Q_OVERFLOW) {
            batch.push_back({EventKind::Overflow, {}});
            return;
        }
        if (ev.mask & (IN_IGNORED | IN_DELETE_SELF | IN_MOVE_SELF)) {
            invalid_ = true;
            return;
        }

        std::string name = ev.len ? std::string(ev.name) : std::string();
        if (ev.mask & (IN_CREATE | IN_MOVED_TO))
            batch.push_back({EventKind::Created, std::move(name)});
        else if (ev.mask & IN_MODIFY)
            batch.push_back({EventKind::Modified, std::move(name)});
        else if (ev.mask & (IN_DELETE | IN_MOVED_FROM))
            batch.push_back({EventKind::Deleted, std::move(name)});
    }

    int         fd_ = -1;
    int         wd_ = -1;
    std::string dir_;
    bool        invalid_ = false;
};

} // namespace

std::unique_ptr<WatchService> make_inotify_watch_service()
{
    return std::make_unique<InotifyWatchService>();
}

} // namespace tailf
