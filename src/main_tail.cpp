#include "tailf/follower.hpp"
#include "tailf/options.hpp"
#include <array>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

namespace {

void usage()
{
    std::cerr << "Usage: tailf [--poll] [--wait-ms N] [--poll-ms N] [--idle-ms N] [--verbose] [--stats] <path>\n";
}

bool parse_int(const char* s, int& out)
{
    char* end = nullptr;
    long v = std::strtol(s, &end, 10);
    if (end == s || *end != '\0' || v < 0 || v > 24L * 3600 * 1000) return false;
    out = static_cast<int>(v);
    return true;
}

} // namespace

int main(int argc, char** argv) {
    tailf::FollowOptions opts;
    std::string path;
    bool stats = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        int* target = nullptr;
        if      (std::strcmp(arg, "--poll") == 0)    { opts.backend = tailf::Backend::Poll; continue; }
        else if (std::strcmp(arg, "--verbose") == 0) { opts.verbose = true; continue; }
        else if (std::strcmp(arg, "--stats") == 0)   { stats = true; continue; }
        else if (std::strcmp(arg, "--wait-ms") == 0) target = &opts.wait_ms;
        else if (std::strcmp(arg, "--poll-ms") == 0) target = &opts.poll_ms;
        else if (std::strcmp(arg, "--idle-ms") == 0) target = &opts.inactivity_timeout_ms;

        if (target) {
            if (i + 1 >= argc || !parse_int(argv[i + 1], *target)) {
                std::cerr << "tailf: " << arg << " needs a non-negative number\n";
                return 1;
            }
            ++i;
            continue;
        }
        if (arg[0] == '-' || !path.empty()) {
            usage();
            return 1;
        }
        path = arg;
    }

    if (path.empty()) {
        usage();
        return 1;
    }

    auto t_start = std::chrono::steady_clock::now();
    std::size_t total_bytes = 0;

    try {
        tailf::FollowingReader in(path, opts);
        std::array<std::byte, 1024> buf{};
        std::ptrdiff_t nread;
        while ((nread = in.read(buf)) > 0) {
            std::cout.write(reinterpret_cast<const char*>(buf.data()), nread);
            std::cout.flush();
            total_bytes += static_cast<std::size_t>(nread);
        }
    } catch (const std::exception& e) {
        std::cerr << "tailf: " << e.what() << "\n";
        return 1;
    }

    if (stats) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - t_start);
        std::cerr << "\n=== tailf summary ===\n"
                  << "Total bytes read : " << total_bytes << " bytes\n"
                  << "Elapsed time     : " << elapsed.count() << " ms\n";
    }
    return 0;
}
