#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace tailf {

// Unit of handoff between watcher and reader. End never carries bytes.
struct Chunk {
    enum class Kind : uint8_t { Data, End };

    Kind                   kind = Kind::End;
    std::vector<std::byte> bytes;

    static Chunk data(std::span<const std::byte> b) {
        return Chunk{Kind::Data, std::vector<std::byte>(b.begin(), b.end())};
    }
    static Chunk data(std::vector<std::byte> b) {
        return Chunk{Kind::Data, std::move(b)};
    }
    static Chunk end() { return Chunk{}; }

    [[nodiscard]] bool is_end() const noexcept { return kind == Kind::End; }
    [[nodiscard]] std::size_t size() const noexcept { return bytes.size(); }
};

} // namespace tailf
