#pragma once
#include <algorithm>
#include <cstddef>
#include <expected>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tailf {

struct CursorError : std::runtime_error {
    std::size_t offset{};
    std::size_t have{};
    explicit CursorError(std::string_view msg, std::size_t off=0, std::size_t have_=0)
        : std::runtime_error(std::string(msg)), offset(off), have(have_) {}
};

// Forward-only cursor over the chunk currently held by the reader.
// Position is -1 when no buffer is loaded or the buffer is used up,
// otherwise it indexes the next byte to hand out.
class ByteCursor {
public:
    ByteCursor() noexcept = default;

    void reset(std::vector<std::byte> buf) noexcept {
        buf_ = std::move(buf);
        pos_ = buf_.empty() ? -1 : 0;
    }

    void clear() noexcept {
        buf_.clear();
        pos_ = -1;
    }

    [[nodiscard]] bool        loaded()    const noexcept { return !buf_.empty(); }
    [[nodiscard]] bool        exhausted() const noexcept { return pos_ < 0; }
    [[nodiscard]] std::ptrdiff_t position() const noexcept { return pos_; }
    [[nodiscard]] std::size_t size()      const noexcept { return buf_.size(); }
    [[nodiscard]] std::size_t remaining() const noexcept {
        return pos_ < 0 ? 0 : buf_.size() - static_cast<std::size_t>(pos_);
    }

    std::byte next() {
        if (exhausted()) throw CursorError{"cursor exhausted", buf_.size(), 0};
        return advance();
    }

    [[nodiscard]] std::expected<std::byte, CursorError> try_next() noexcept {
        if (exhausted())
            return std::unexpected(CursorError{"cursor exhausted", buf_.size(), 0});
        return advance();
    }

    // Copies up to out.size() bytes; never reads past the loaded buffer.
    std::size_t take_into(std::span<std::byte> out) noexcept {
        const std::size_t n = std::min(out.size(), remaining());
        if (n == 0) return 0;
        auto first = buf_.begin() + pos_;
        std::copy(first, first + static_cast<std::ptrdiff_t>(n), out.begin());
        move_by(n);
        return n;
    }

private:
    std::byte advance() noexcept {
        std::byte b = buf_[static_cast<std::size_t>(pos_)];
        move_by(1);
        return b;
    }

    void move_by(std::size_t n) noexcept {
        pos_ += static_cast<std::ptrdiff_t>(n);
        if (static_cast<std::size_t>(pos_) >= buf_.size()) pos_ = -1;
    }

    std::vector<std::byte> buf_;
    std::ptrdiff_t pos_ = -1;
};

} // namespace tailf
