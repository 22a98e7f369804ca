#include "tailf/watch_service.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <thread>
#include <utility>

#include <sys/stat.h>

namespace tailf {
namespace {

struct Snapshot {
    bool            exists = false;
    ino_t           ino    = 0;
    off_t           size   = 0;
    struct timespec mtime{};
};

bool same_time(const struct timespec& a, const struct timespec& b)
{
    return a.tv_sec == b.tv_sec && a.tv_nsec == b.tv_nsec;
}

// Stat-based stand-in for a notification facility: compares the target's
// inode, size and mtime every interval.
class PollingWatchService final : public WatchService {
public:
    PollingWatchService(std::string filename, std::chrono::milliseconds interval)
        : filename_(std::move(filename))
        , interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(50))
    {
    }

    void watch(const std::filesystem::path& dir) override
    {
        struct stat st{};
        if (::stat(dir.c_str(), &st) != 0 || !S_ISDIR(st.st_mode))
            throw WatchError("cannot watch " + dir.string() + ": not a directory");
        dir_  = dir;
        last_ = snapshot();
    }

    std::optional<std::vector<WatchEvent>> poll(std::chrono::milliseconds timeout) override
    {
        using namespace std::chrono;
        const auto deadline = steady_clock::now() + timeout;

        for (;;) {
            struct stat st{};
            if (::stat(dir_.c_str(), &st) != 0 || !S_ISDIR(st.st_mode))
                throw WatchError("watch on " + dir_.string() + " is no longer valid");

            Snapshot now = snapshot();
            std::vector<WatchEvent> batch = diff(last_, now);
            last_ = now;
            if (!batch.empty()) return batch;

            const auto left = deadline - steady_clock::now();
            if (left <= steady_clock::duration::zero()) return std::nullopt;
            std::this_thread::sleep_for(std::min<steady_clock::duration>(interval_, left));
        }
    }

private:
    Snapshot snapshot() const
    {
        Snapshot s;
        struct stat st{};
        if (::stat((dir_ / filename_).c_str(), &st) == 0) {
            s.exists = true;
            s.ino    = st.st_ino;
            s.size   = st.st_size;
            s.mtime  = st.st_mtim;
        }
        return s;
    }

    std::vector<WatchEvent> diff(const Snapshot& before, const Snapshot& after) const
    {
        std::vector<WatchEvent> out;
        if (!before.exists && after.exists) {
            out.push_back({EventKind::Created, filename_});
        } else if (before.exists && !after.exists) {
            out.push_back({EventKind::Deleted, filename_});
        } else if (before.exists && after.exists) {
            // 替换（轮转）
            if (before.ino != after.ino) {
                out.push_back({EventKind::Deleted, filename_});
                out.push_back({EventKind::Created, filename_});
            } else if (before.size != after.size || !same_time(before.mtime, after.mtime)) {
                out.push_back({EventKind::Modified, filename_});
            }
        }
        return out;
    }

    std::string               filename_;
    std::chrono::milliseconds interval_;
    std::filesystem::path     dir_;
    Snapshot                  last_;
};

} // namespace

std::unique_ptr<WatchService> make_polling_watch_service(std::string filename,
                                                         std::chrono::milliseconds interval)
{
    return std::make_unique<PollingWatchService>(std::move(filename), interval);
}

} // namespace tailf
