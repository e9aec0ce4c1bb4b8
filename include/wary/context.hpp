#pragma once

#include <iterator>
#include <string_view>
#include <type_traits>
#include <vector>

#include <cstddef>

#include "config.hpp"
#include "span.hpp"

namespace wary {

/**
 * @brief One named parse operation and the bytes it was attempted over
 *
 * operation and expected point at string literals (static storage). The span
 * is an offset range into the root input; the frame never references the
 * input bytes themselves, so it cannot outlive them.
 */
struct ContextFrame {
    const char* operation = "read";
    const char* expected = nullptr; ///< What the operation was looking for, if stated
    Span span{};

    constexpr bool operator==(const ContextFrame&) const noexcept = default;
};

namespace detail {

/**
 * Full context chain: every frame pushed while an error propagates.
 *
 * Frames are appended innermost first (the order they are pushed while the
 * error unwinds through nested Reader::context calls).
 */
class FrameStack {
public:
    void push(const ContextFrame& frame) { frames_.push_back(frame); }

    [[nodiscard]] std::size_t size() const noexcept { return frames_.size(); }

    [[nodiscard]] bool empty() const noexcept { return frames_.empty(); }

    /// i = 0 is the innermost frame
    [[nodiscard]] const ContextFrame& from_innermost(std::size_t i) const noexcept {
        return frames_[i];
    }

private:
    std::vector<ContextFrame> frames_;
};

/**
 * Minimal context: empty and allocation free. Pushed frames are dropped, so
 * FrameRange falls back to the single synthetic frame of the terminal
 * failure.
 */
class TerminalFrameOnly {
public:
    constexpr void push(const ContextFrame&) noexcept {}

    [[nodiscard]] constexpr std::size_t size() const noexcept { return 0; }

    [[nodiscard]] constexpr bool empty() const noexcept { return true; }

    [[nodiscard]] const ContextFrame& from_innermost(std::size_t) const noexcept {
        static constexpr ContextFrame none{};
        return none;
    }
};

} // namespace detail

/// Storage selected once for the whole program by WARY_ENABLE_FULL_CONTEXT
using ContextChain =
    std::conditional_t<config::full_context, detail::FrameStack, detail::TerminalFrameOnly>;

/**
 * @brief Outer-to-inner view over the frames attached to an error
 *
 * When no frame was recorded (always the case with the minimal chain) the
 * range holds exactly one synthetic frame describing the terminal failure, so
 * callers always see at least one entry.
 *
 * The range and its iterators borrow the error's chain, not the range object,
 * so an iterator stays valid after the FrameRange temporary is gone.
 */
class FrameRange {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = ContextFrame;
        using difference_type = std::ptrdiff_t;
        using pointer = const ContextFrame*;
        using reference = const ContextFrame&;

        iterator() noexcept = default;

        iterator(const ContextChain* chain, const ContextFrame& terminal, std::size_t index) noexcept
            : chain_(chain),
              terminal_(terminal),
              index_(index) {}

        reference operator*() const noexcept { return frame_at(*chain_, terminal_, index_); }
        pointer operator->() const noexcept { return &frame_at(*chain_, terminal_, index_); }

        iterator& operator++() noexcept {
            ++index_;
            return *this;
        }

        iterator operator++(int) noexcept {
            iterator tmp = *this;
            ++index_;
            return tmp;
        }

        bool operator==(const iterator& other) const noexcept { return index_ == other.index_; }

    private:
        const ContextChain* chain_ = nullptr;
        ContextFrame terminal_{};
        std::size_t index_ = 0;
    };

    FrameRange(const ContextChain& chain, const ContextFrame& terminal) noexcept
        : chain_(&chain),
          terminal_(terminal) {}

    [[nodiscard]] std::size_t size() const noexcept {
        return chain_->empty() ? 1 : chain_->size();
    }

    /// i = 0 is the outermost frame. Returned by value, so it outlives the range.
    [[nodiscard]] ContextFrame at(std::size_t i) const noexcept {
        return frame_at(*chain_, terminal_, i);
    }

    [[nodiscard]] ContextFrame outermost() const noexcept { return at(0); }

    [[nodiscard]] ContextFrame innermost() const noexcept { return at(size() - 1); }

    [[nodiscard]] iterator begin() const noexcept { return iterator{chain_, terminal_, 0}; }
    [[nodiscard]] iterator end() const noexcept { return iterator{chain_, terminal_, size()}; }

    /// Operation names, outermost first
    [[nodiscard]] std::vector<std::string_view> operation_names() const {
        std::vector<std::string_view> names;
        names.reserve(size());
        for (const auto& frame : *this) {
            names.emplace_back(frame.operation);
        }
        return names;
    }

private:
    static const ContextFrame& frame_at(const ContextChain& chain, const ContextFrame& terminal,
                                        std::size_t i) noexcept {
        if (chain.empty()) {
            return terminal;
        }
        return chain.from_innermost(chain.size() - 1 - i);
    }

    const ContextChain* chain_;
    ContextFrame terminal_;
};

} // namespace wary
