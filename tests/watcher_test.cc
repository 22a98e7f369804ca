#include "tailf/watcher.hpp"
#include "fake_watch_service.hpp"
#include "test_support.hpp"

#include <cerrno>
#include <chrono>
#include <filesystem>
#include <functional>
#include <future>
#include <gtest/gtest.h>
#include <system_error>
#include <thread>

using namespace std::chrono_literals;
using tailf::EventKind;
using tailf::testing::append_file;
using tailf::testing::as_string;
using tailf::testing::next_chunk;
using tailf::testing::write_file;

class DirectoryWatcherTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        file_   = dir_ / "app.log";
        queue_  = std::make_shared<tailf::HandoffQueue>();
        script_ = std::make_shared<FakeWatchScript>();
        opt_.wait_ms = 50;
    }

    void TearDown() override
    {
        if (watcher_) watcher_->stop();
        if (runner_.joinable()) runner_.join();
    }

    // Runs the loop on a thread owned by the test so TearDown can join it.
    void launch()
    {
        watcher_ = std::make_shared<tailf::DirectoryWatcher>(file_, queue_, opt_, fake_factory(script_));
        auto w = watcher_;
        runner_ = std::thread([w] { w->run(); });
        ASSERT_EQ(watcher_->ready().wait_for(3s), std::future_status::ready) << "watcher never became ready";
    }

    std::string expect_data()
    {
        auto c = next_chunk(*queue_);
        if (!c) {
            ADD_FAILURE() << "no chunk arrived";
            return {};
        }
        EXPECT_FALSE(c->is_end());
        return as_string(c->bytes);
    }

    // the baseline is published right after the last chunk of an event
    bool baseline_reaches(off_t expected)
    {
        for (int i = 0; i < 200; ++i) {
            if (watcher_->baseline() == expected) return true;
            std::this_thread::sleep_for(10ms);
        }
        return false;
    }

    void expect_end()
    {
        auto c = next_chunk(*queue_);
        ASSERT_TRUE(c.has_value()) << "stream did not end";
        EXPECT_TRUE(c->is_end());
    }

    tailf::testing::TempDir dir_;
    std::filesystem::path file_;
    std::shared_ptr<tailf::HandoffQueue> queue_;
    std::shared_ptr<FakeWatchScript> script_;
    tailf::FollowOptions opt_;
    std::shared_ptr<tailf::DirectoryWatcher> watcher_;
    std::thread runner_;
};

TEST_F(DirectoryWatcherTest, CapturesBaselineBeforeReady)
{
    write_file(file_, "0123456789");
    launch();

    EXPECT_TRUE(watcher_->active());
    EXPECT_EQ(watcher_->baseline(), 10);
    EXPECT_EQ(script_->watched_dir().string(), dir_.path().string());
    EXPECT_EQ(queue_->size(), 0u);
}

TEST_F(DirectoryWatcherTest, MissingFileStartsAtZero)
{
    launch();
    EXPECT_EQ(watcher_->baseline(), 0);

    write_file(file_, "hello");
    script_->emit(EventKind::Created, "app.log");
    EXPECT_EQ(expect_data(), "hello");
}

TEST_F(DirectoryWatcherTest, ForwardsOnlyAppendedBytes)
{
    write_file(file_, "old content\n");
    launch();

    append_file(file_, "new\n");
    script_->emit(EventKind::Modified, "app.log");
    EXPECT_EQ(expect_data(), "new\n");

    append_file(file_, "more\n");
    script_->emit(EventKind::Modified, "app.log");
    EXPECT_EQ(expect_data(), "more\n");
    EXPECT_TRUE(baseline_reaches(21)) << "baseline is " << watcher_->baseline();
}

TEST_F(DirectoryWatcherTest, IgnoresOtherEntries)
{
    write_file(file_, "");
    launch();

    write_file(dir_ / "other.log", "noise");
    script_->emit(EventKind::Modified, "other.log");
    EXPECT_FALSE(next_chunk(*queue_, 200ms).has_value());

    append_file(file_, "abc");
    script_->emit(EventKind::Modified, "app.log");
    EXPECT_EQ(expect_data(), "abc");
}

TEST_F(DirectoryWatcherTest, TruncationRestartsFromZero)
{
    write_file(file_, "0123456789");
    launch();

    std::filesystem::resize_file(file_, 0);
    append_file(file_, "xy");
    script_->emit(EventKind::Modified, "app.log");

    EXPECT_EQ(expect_data(), "xy");
    EXPECT_TRUE(baseline_reaches(2)) << "baseline is " << watcher_->baseline();
}

TEST_F(DirectoryWatcherTest, SplitsGrowthIntoReadChunkBlocks)
{
    opt_.read_chunk = 4;
    write_file(file_, "");
    launch();

    append_file(file_, "abcdefghij");
    script_->emit(EventKind::Modified, "app.log");

    EXPECT_EQ(expect_data(), "abcd");
    EXPECT_EQ(expect_data(), "efgh");
    EXPECT_EQ(expect_data(), "ij");
}

TEST_F(DirectoryWatcherTest, RecreatedFileIsReadFromStart)
{
    write_file(file_, "0123456789");
    launch();

    std::filesystem::remove(file_);
    script_->emit(EventKind::Deleted, "app.log");

    write_file(file_, "a fresh file that is longer than the old one");
    script_->emit(EventKind::Created, "app.log");
    EXPECT_EQ(expect_data(), "a fresh file that is longer than the old one");
}

TEST_F(DirectoryWatcherTest, OverflowResyncsMissedGrowth)
{
    write_file(file_, "seen");
    launch();

    append_file(file_, "+missed");
    script_->emit(std::vector<tailf::WatchEvent>{{EventKind::Overflow, ""}});
    EXPECT_EQ(expect_data(), "+missed");
}

TEST_F(DirectoryWatcherTest, SurvivesFailingEvent)
{
    write_file(file_, "");
    launch();

    // reading a directory fails with EISDIR; the loop must keep going
    std::filesystem::remove(file_);
    std::filesystem::create_directory(file_);
    script_->emit(EventKind::Modified, "app.log");
    EXPECT_FALSE(next_chunk(*queue_, 200ms).has_value());
    EXPECT_TRUE(watcher_->active());

    std::filesystem::remove(file_);
    write_file(file_, "ok");
    script_->emit(EventKind::Created, "app.log");
    EXPECT_EQ(expect_data(), "ok");
}

TEST_F(DirectoryWatcherTest, WatchFailureEndsStreamAndSignalsReady)
{
    script_->fail_watch = true;
    launch();

    EXPECT_FALSE(watcher_->active());
    expect_end();
}

TEST_F(DirectoryWatcherTest, ServiceCreationFailureEndsStream)
{
    script_->fail_create = true;
    launch();

    EXPECT_FALSE(watcher_->active());
    expect_end();
}

TEST_F(DirectoryWatcherTest, InvalidatedWatchEndsStream)
{
    launch();
    script_->invalidate();
    expect_end();
    runner_.join();
    EXPECT_FALSE(watcher_->active());
}

TEST_F(DirectoryWatcherTest, StopIsObservedWithinWaitInterval)
{
    launch();
    auto t0 = std::chrono::steady_clock::now();
    watcher_->stop();
    runner_.join();

    EXPECT_LT(std::chrono::steady_clock::now() - t0, 1s);
    expect_end();
}

TEST_F(DirectoryWatcherTest, InactivityTimeoutEndsStream)
{
    opt_.inactivity_timeout_ms = 150;
    write_file(file_, "");
    launch();

    append_file(file_, "tick");
    script_->emit(EventKind::Modified, "app.log");
    EXPECT_EQ(expect_data(), "tick");
    expect_end();
}

TEST_F(DirectoryWatcherTest, StartRunsDetachedAndIsIdempotent)
{
    auto w = std::make_shared<tailf::DirectoryWatcher>(file_, queue_, opt_, fake_factory(script_));
    auto first  = w->start();
    auto second = w->start();
    ASSERT_EQ(first.wait_for(3s), std::future_status::ready);
    EXPECT_EQ(second.wait_for(0s), std::future_status::ready);
    EXPECT_TRUE(w->active());

    w->stop();
    expect_end();
    EXPECT_FALSE(next_chunk(*queue_, 200ms).has_value()) << "watcher loop ran twice";
}

TEST_F(DirectoryWatcherTest, FailedLaunchCanBeRetried)
{
    int attempts = 0;
    auto flaky = [&attempts](std::function<void()> body) {
        if (++attempts == 1) throw std::system_error(EAGAIN, std::generic_category(), "thread");
        std::thread(std::move(body)).detach();
    };
    auto w = std::make_shared<tailf::DirectoryWatcher>(file_, queue_, opt_, fake_factory(script_), flaky);

    EXPECT_THROW(w->start(), std::system_error);
    EXPECT_FALSE(w->active());

    auto ready = w->start();
    ASSERT_EQ(ready.wait_for(3s), std::future_status::ready);
    EXPECT_TRUE(w->active());
    EXPECT_EQ(attempts, 2);

    w->stop();
    expect_end();
}
