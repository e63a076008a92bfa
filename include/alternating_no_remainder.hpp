#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>

#include "logger.hpp"
#include "size_hint.hpp"
#include "source.hpp"

namespace alternating {

/**
 * @brief Alternate between two sources, left first, until either one runs
 *        out. The remainder of the other side is discarded.
 *
 * The order of the sources matters: the side that is due when the shorter
 * one runs out decides whether one extra item comes through.
 *
 *   small = [1, 2], big = [3, 4, 5]
 *
 *   small, big:  1 2 <none>      big, small:  3 4 5
 *                |/|/                         |/|/|
 *                3 4                          1 2 <none>
 *
 *   -> 4 items                                -> 5 items
 *
 * Exhaustion is sticky: after the first empty result neither source is
 * pulled again, even if the other one still has items.
 */
template <typename T>
class AlternatingNoRemainder : public Source<T> {
public:
    AlternatingNoRemainder(std::unique_ptr<Source<T>> left, std::unique_ptr<Source<T>> right)
        : left_(std::move(left)), right_(std::move(right)) {
        if (!left_ || !right_) {
            throw std::invalid_argument("AlternatingNoRemainder requires two non-null sources");
        }
    }

    static std::unique_ptr<AlternatingNoRemainder> Create(std::unique_ptr<Source<T>> left,
                                                          std::unique_ptr<Source<T>> right) {
        return std::make_unique<AlternatingNoRemainder>(std::move(left), std::move(right));
    }

    std::optional<T> Next() override {
        if (state_ == State::kDone) {
            return std::nullopt;
        }

        const bool left_due = state_ == State::kDueLeft;
        auto item = left_due ? left_->Next() : right_->Next();
        if (!item) {
            ALT_LOG_DEBUG("%s source exhausted, stopping", left_due ? "left" : "right");
            state_ = State::kDone;
            return std::nullopt;
        }
        state_ = left_due ? State::kDueRight : State::kDueLeft;
        return item;
    }

    SizeHint GetSizeHint() const noexcept override {
        if (state_ == State::kDone) {
            return SizeHint::Exact(0);
        }
        return CombineAlternating(left_->GetSizeHint(), right_->GetSizeHint(), state_ == State::kDueRight);
    }

    bool IsDone() const noexcept {
        return state_ == State::kDone;
    }

    bool IsExhausted() const noexcept override {
        return IsDone();
    }

private:
    enum class State { kDueLeft, kDueRight, kDone };

    std::unique_ptr<Source<T>> left_;
    std::unique_ptr<Source<T>> right_;
    State state_{State::kDueLeft};
};

}  // namespace alternating
