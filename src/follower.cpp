#include "tailf/follower.hpp"

#include <new>
#include <system_error>
#include <utility>

namespace tailf {

FollowingReader::FollowingReader(const std::filesystem::path& path, FollowOptions opt)
    : FollowingReader(path, opt, WatchServiceFactory{})
{
}

FollowingReader::FollowingReader(const std::filesystem::path& path, FollowOptions opt,
                                 WatchServiceFactory factory, ThreadLauncher launch)
    : path_(std::filesystem::absolute(path))
    , queue_(std::make_shared<HandoffQueue>())
{
    std::error_code ec;
    if (std::filesystem::is_directory(path_, ec))
        throw InvalidTarget(path_.string() + ": must be a file");

    watcher_ = std::make_shared<DirectoryWatcher>(path_, queue_, opt, std::move(factory),
                                                  std::move(launch));
}

FollowingReader::~FollowingReader()
{
    close();
}

void FollowingReader::start()
{
    if (started_ || closed_.load()) return;
    std::shared_future<void> ready;
    try {
        ready = watcher_->start();
    } catch (...) {
        close();
        throw;
    }
    started_ = true;
    ready.wait();
}

int FollowingReader::read()
{
    if (closed_.load()) return eof;
    if (cursor_.exhausted() && !fill()) return eof;
    return std::to_integer<int>(cursor_.next());
}

std::ptrdiff_t FollowingReader::read(std::span<std::byte> out)
{
    if (closed_.load()) return eof;
    if (out.empty()) return 0;
    if (cursor_.exhausted() && !fill()) return eof;
    return static_cast<std::ptrdiff_t>(cursor_.take_into(out));
}

std::size_t FollowingReader::available() const noexcept
{
    if (closed_.load() || !cursor_.loaded()) return 0;
    return cursor_.remaining();
}

void FollowingReader::close() noexcept
{
    if (closed_.exchange(true)) return;
    watcher_->stop();
    try {
        queue_->push(Chunk::end());
    } catch (const std::bad_alloc&) {
        queue_->cancel();
    }
}

// Pulls the next data chunk into the cursor. false means the stream is over.
bool FollowingReader::fill()
{
    start();
    for (;;) {
        std::optional<Chunk> chunk = queue_->pop();
        if (closed_.load()) return false;
        if (!chunk || chunk->is_end()) {
            closed_.store(true);
            watcher_->stop();
            cursor_.clear();
            return false;
        }
        if (chunk->bytes.empty()) continue;

        cursor_.reset(std::move(chunk->bytes));
        return true;
    }
}

} // namespace tailf
