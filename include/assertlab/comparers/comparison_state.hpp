#pragma once

/// @file comparison_state.hpp
/// @brief Cycle-detection bookkeeping for one recursive equality check

#include <cstddef>
#include <memory>
#include <utility>

#include <assertlab/core/value.hpp>

namespace assertlab::comparers {

/// Immutable stack of identity pairs on the current comparison path
///
/// Pushing returns a new state sharing the parent's frames; the parent is never
/// modified. Only composite values have an identity, so scalars are never tracked.
class ComparisonState {
  public:
    explicit ComparisonState(bool top_level_comparison) : top_level_(top_level_comparison) {}

    /// Flag indicating whether this is the top level comparison
    bool top_level_comparison() const { return top_level_; }

    [[nodiscard]] ComparisonState push_comparison(const core::Value& x,
                                                  const core::Value& y) const {
        const void* x_identity = x.identity();
        const void* y_identity = y.identity();
        if (x_identity == nullptr || y_identity == nullptr) {
            return ComparisonState(false, head_, depth_);
        }
        auto frame = std::make_shared<const Frame>(Frame{x_identity, y_identity, head_});
        return ComparisonState(false, std::move(frame), depth_ + 1);
    }

    /// True iff this exact identity pair is already on the path
    bool did_compare(const core::Value& x, const core::Value& y) const {
        const void* x_identity = x.identity();
        const void* y_identity = y.identity();
        if (x_identity == nullptr || y_identity == nullptr) {
            return false;
        }
        for (const Frame* frame = head_.get(); frame != nullptr; frame = frame->parent.get()) {
            if (frame->x == x_identity && frame->y == y_identity) {
                return true;
            }
        }
        return false;
    }

    std::size_t depth() const { return depth_; }

  private:
    struct Frame {
        const void* x;
        const void* y;
        std::shared_ptr<const Frame> parent;
    };

    ComparisonState(bool top_level, std::shared_ptr<const Frame> head, std::size_t depth)
        : top_level_(top_level), head_(std::move(head)), depth_(depth) {}

    bool top_level_;
    std::shared_ptr<const Frame> head_;
    std::size_t depth_ = 0;
};

} // namespace assertlab::comparers
