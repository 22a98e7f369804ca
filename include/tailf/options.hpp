#pragma once
#include <cstddef>
#include <cstdint>

namespace tailf {

enum class Backend : uint8_t {
    Inotify,
    Poll
};

struct FollowOptions {
    Backend     backend    = Backend::Inotify;
    std::size_t read_chunk = 64u << 10;

    // bounded wait of one watch call; also the worst-case stop latency
    int         wait_ms    = 2000;
    // stat interval of Backend::Poll
    int         poll_ms    = 50;

    int         inactivity_timeout_ms = 0;
    bool        verbose    = false;
};

} // namespace tailf
