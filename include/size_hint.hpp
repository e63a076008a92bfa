#pragma once

#include <cstddef>
#include <optional>

namespace alternating {

/**
 * @brief Bounds on the number of items a source will still produce.
 *
 * `lower` is always a valid lower bound. `upper` is empty when the source
 * cannot name an upper bound (infinite, unknown, or not representable in
 * `std::size_t`). Counts are taken up to the first empty result of `Next()`.
 */
struct SizeHint {
    std::size_t lower{0};
    std::optional<std::size_t> upper;

    static SizeHint Exact(std::size_t n) noexcept { return SizeHint{n, n}; }
    static SizeHint Unbounded(std::size_t lower) noexcept { return SizeHint{lower, std::nullopt}; }

    bool IsExact() const noexcept { return upper.has_value() && *upper == lower; }

    bool operator==(const SizeHint& other) const noexcept {
        return lower == other.lower && upper == other.upper;
    }
    bool operator!=(const SizeHint& other) const noexcept { return !(*this == other); }
};

/**
 * @brief Length of a strict alternation: `2 * turns`, plus one when the
 *        longer side gets a final extra turn.
 */
struct DoubledBound {
    std::size_t turns{0};
    bool bonus{false};
};

/**
 * @brief Pick the shorter of two lengths and decide whether the longer side
 *        gets one more turn before the shorter side runs out.
 *
 * @param left_len length of the left side
 * @param right_len length of the right side
 * @param last_was_left whether the most recent turn belonged to the left side
 *        (i.e. the right side is due next)
 * @return the alternation length as turns plus bonus
 */
DoubledBound PairFor(std::size_t left_len, std::size_t right_len, bool last_was_left) noexcept;

/**
 * @brief `2 * turns + bonus`, clamped to SIZE_MAX.
 */
std::size_t SaturatingDoublePlusBonus(DoubledBound bound) noexcept;

/**
 * @brief `2 * turns + bonus`, or std::nullopt if the result does not fit.
 */
std::optional<std::size_t> CheckedDoublePlusBonus(DoubledBound bound) noexcept;

std::size_t SaturatingAdd(std::size_t a, std::size_t b) noexcept;
std::optional<std::size_t> CheckedAdd(std::size_t a, std::size_t b) noexcept;

/**
 * @brief Size hint of a strict alternation between two sources.
 *
 * The result counts items until the first empty turn. When only one side is
 * bounded the unbounded side outlasts it, so the alternation ends on the
 * bounded side's first empty turn; the unbounded side gets the bonus turn
 * exactly when it is due next.
 */
SizeHint CombineAlternating(const SizeHint& left, const SizeHint& right, bool last_was_left) noexcept;

}  // namespace alternating
