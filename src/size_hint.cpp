#include "../include/size_hint.hpp"

#include <limits>

namespace alternating {

namespace {

constexpr std::size_t kMaxCount = std::numeric_limits<std::size_t>::max();

}  // namespace

DoubledBound PairFor(std::size_t left_len, std::size_t right_len, bool last_was_left) noexcept {
    if (left_len < right_len) {
        // Right is longer; it squeezes in one more item if it is due now.
        return DoubledBound{left_len, last_was_left};
    }
    if (right_len < left_len) {
        return DoubledBound{right_len, !last_was_left};
    }
    return DoubledBound{left_len, false};
}

std::size_t SaturatingDoublePlusBonus(DoubledBound bound) noexcept {
    if (bound.turns > kMaxCount / 2) {
        return kMaxCount;
    }
    return SaturatingAdd(bound.turns * 2, bound.bonus ? 1 : 0);
}

std::optional<std::size_t> CheckedDoublePlusBonus(DoubledBound bound) noexcept {
    if (bound.turns > kMaxCount / 2) {
        return std::nullopt;
    }
    return CheckedAdd(bound.turns * 2, bound.bonus ? 1 : 0);
}

std::size_t SaturatingAdd(std::size_t a, std::size_t b) noexcept {
    if (a > kMaxCount - b) {
        return kMaxCount;
    }
    return a + b;
}

std::optional<std::size_t> CheckedAdd(std::size_t a, std::size_t b) noexcept {
    if (a > kMaxCount - b) {
        return std::nullopt;
    }
    return a + b;
}

SizeHint CombineAlternating(const SizeHint& left, const SizeHint& right, bool last_was_left) noexcept {
    SizeHint hint;
    hint.lower = SaturatingDoublePlusBonus(PairFor(left.lower, right.lower, last_was_left));

    if (left.upper && right.upper) {
        hint.upper = CheckedDoublePlusBonus(PairFor(*left.upper, *right.upper, last_was_left));
    } else if (left.upper) {
        hint.upper = CheckedDoublePlusBonus(DoubledBound{*left.upper, last_was_left});
    } else if (right.upper) {
        hint.upper = CheckedDoublePlusBonus(DoubledBound{*right.upper, !last_was_left});
    }
    // Neither side bounded: they never run out as far as we can tell.
    return hint;
}

}  // namespace alternating
