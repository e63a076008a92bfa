#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>

#include "size_hint.hpp"
#include "source.hpp"

namespace alternating {

/**
 * @brief Alternate between the items of two sources, left first.
 *
 * Turns alternate forever. Once a side is exhausted its turns produce an
 * empty result, which is passed through rather than skipped, so the other
 * side's remainder comes out on every other call:
 *
 *   left  = [1, 2], right = [3, 4, 5, 6]
 *   Next(): 1 3 2 4 <none> 5 <none> 6 <none> <none> ...
 *
 * An empty result is therefore NOT permanent. Use `AlternatingAll` to drain
 * the remainder without gaps or wrap in `FusedSource` to stop at the first
 * gap.
 */
template <typename T>
class Alternating : public Source<T> {
public:
    Alternating(std::unique_ptr<Source<T>> left, std::unique_ptr<Source<T>> right)
        : left_(std::move(left)), right_(std::move(right)) {
        if (!left_ || !right_) {
            throw std::invalid_argument("Alternating requires two non-null sources");
        }
    }

    static std::unique_ptr<Alternating> Create(std::unique_ptr<Source<T>> left,
                                               std::unique_ptr<Source<T>> right) {
        return std::make_unique<Alternating>(std::move(left), std::move(right));
    }

    std::optional<T> Next() override {
        if (next_ == Turn::kLeft) {
            next_ = Turn::kRight;
            return left_->Next();
        }
        next_ = Turn::kLeft;
        return right_->Next();
    }

    // The longest run without an empty result or two consecutive items from
    // one side is twice the shorter side, plus one if the longer side is due.
    SizeHint GetSizeHint() const noexcept override {
        return CombineAlternating(left_->GetSizeHint(), right_->GetSizeHint(), next_ == Turn::kRight);
    }

    bool IsExhausted() const noexcept override {
        return left_->IsExhausted() && right_->IsExhausted();
    }

private:
    enum class Turn { kLeft, kRight };

    std::unique_ptr<Source<T>> left_;
    std::unique_ptr<Source<T>> right_;
    Turn next_{Turn::kLeft};
};

}  // namespace alternating
