#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tailf {

struct WatchError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

enum class EventKind : uint8_t {
    Created,
    Modified,
    Deleted,
    Overflow
};

struct WatchEvent {
    EventKind   kind;
    std::string name;   // entry name relative to the watched directory; empty for Overflow
};

// Change notifications for one directory.
class WatchService {
public:
    virtual ~WatchService() = default;

    // Throws WatchError if the directory cannot be registered.
    virtual void watch(const std::filesystem::path& dir) = 0;

    // Waits at most `timeout`. Returns nullopt on timeout, otherwise a
    // non-empty batch. Throws WatchError once the watch is no longer valid;
    // any batch collected before that is handed out first.
    virtual std::optional<std::vector<WatchEvent>> poll(std::chrono::milliseconds timeout) = 0;
};

using WatchServiceFactory = std::function<std::unique_ptr<WatchService>()>;

// Linux inotify. Throws WatchError when the instance cannot be created.
std::unique_ptr<WatchService> make_inotify_watch_service();

// Portable fallback: stats `filename` inside the watched directory every
// `interval` and synthesizes events from what changed.
std::unique_ptr<WatchService> make_polling_watch_service(std::string filename,
                                                         std::chrono::milliseconds interval);

} // namespace tailf
