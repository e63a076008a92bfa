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
 * @brief Alternate between two sources; when one runs out, drain the other
 *        in one uninterrupted run.
 *
 *   left  = [1, 2], right = [3, 4, 5, 6]
 *   Next(): 1 3 2 4 5 6 <none> <none> ...
 *
 * Exhaustion is sticky. After the surviving side reports an empty result
 * neither source is pulled again and every call returns std::nullopt.
 */
template <typename T>
class AlternatingAll : public Source<T> {
public:
    AlternatingAll(std::unique_ptr<Source<T>> left, std::unique_ptr<Source<T>> right)
        : left_(std::move(left)), right_(std::move(right)) {
        if (!left_ || !right_) {
            throw std::invalid_argument("AlternatingAll requires two non-null sources");
        }
    }

    static std::unique_ptr<AlternatingAll> Create(std::unique_ptr<Source<T>> left,
                                                  std::unique_ptr<Source<T>> right) {
        return std::make_unique<AlternatingAll>(std::move(left), std::move(right));
    }

    std::optional<T> Next() override {
        switch (state_) {
            case State::kDueLeft: {
                if (auto item = left_->Next()) {
                    state_ = State::kDueRight;
                    return item;
                }
                ALT_LOG_DEBUG("left source exhausted, draining right");
                state_ = State::kDrainRight;
                return Drain(*right_);
            }
            case State::kDueRight: {
                if (auto item = right_->Next()) {
                    state_ = State::kDueLeft;
                    return item;
                }
                ALT_LOG_DEBUG("right source exhausted, draining left");
                state_ = State::kDrainLeft;
                return Drain(*left_);
            }
            case State::kDrainRight:
                return Drain(*right_);
            case State::kDrainLeft:
                return Drain(*left_);
            case State::kDone:
                break;
        }
        return std::nullopt;
    }

    SizeHint GetSizeHint() const noexcept override {
        switch (state_) {
            case State::kDueLeft:
            case State::kDueRight: {
                SizeHint left = left_->GetSizeHint();
                SizeHint right = right_->GetSizeHint();
                SizeHint hint;
                hint.lower = SaturatingAdd(left.lower, right.lower);
                if (left.upper && right.upper) {
                    hint.upper = CheckedAdd(*left.upper, *right.upper);
                }
                return hint;
            }
            case State::kDrainRight:
                return right_->GetSizeHint();
            case State::kDrainLeft:
                return left_->GetSizeHint();
            case State::kDone:
                break;
        }
        return SizeHint::Exact(0);
    }

    bool IsExhausted() const noexcept override {
        return state_ == State::kDone;
    }

    /**
     * @return the remaining length when both sides know theirs exactly
     */
    std::optional<std::size_t> ExactLen() const noexcept {
        SizeHint hint = GetSizeHint();
        if (!hint.IsExact()) {
            return std::nullopt;
        }
        return hint.lower;
    }

private:
    enum class State {
        kDueLeft,
        kDueRight,
        kDrainRight,  // left exhausted
        kDrainLeft,   // right exhausted
        kDone
    };

    std::optional<T> Drain(Source<T>& survivor) {
        auto item = survivor.Next();
        if (!item) {
            ALT_LOG_DEBUG("both sources exhausted");
            state_ = State::kDone;
        }
        return item;
    }

    std::unique_ptr<Source<T>> left_;
    std::unique_ptr<Source<T>> right_;
    State state_{State::kDueLeft};
};

}  // namespace alternating
