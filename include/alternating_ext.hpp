#pragma once

#include <memory>
#include <type_traits>
#include <utility>

#include "alternating.hpp"
#include "alternating_all.hpp"
#include "alternating_no_remainder.hpp"

// Shorthand for building the adapters straight from factory results, e.g.
//
//   std::vector<int> a{1, 2};
//   std::vector<int> b{3, 4, 5};
//   auto iter = AlternateWith(FromRange(a), FromRange(b));
//
// Each function forwards to the adapter's Create().

namespace alternating {

template <typename L, typename R>
std::unique_ptr<Alternating<typename L::Item>> AlternateWith(std::unique_ptr<L> left,
                                                             std::unique_ptr<R> right) {
    static_assert(std::is_same<typename L::Item, typename R::Item>::value,
                  "Sources must have the same item type!");
    return Alternating<typename L::Item>::Create(std::move(left), std::move(right));
}

template <typename L, typename R>
std::unique_ptr<AlternatingAll<typename L::Item>> AlternateWithAll(std::unique_ptr<L> left,
                                                                   std::unique_ptr<R> right) {
    static_assert(std::is_same<typename L::Item, typename R::Item>::value,
                  "Sources must have the same item type!");
    return AlternatingAll<typename L::Item>::Create(std::move(left), std::move(right));
}

template <typename L, typename R>
std::unique_ptr<AlternatingNoRemainder<typename L::Item>> AlternateWithNoRemainder(std::unique_ptr<L> left,
                                                                                   std::unique_ptr<R> right) {
    static_assert(std::is_same<typename L::Item, typename R::Item>::value,
                  "Sources must have the same item type!");
    return AlternatingNoRemainder<typename L::Item>::Create(std::move(left), std::move(right));
}

}  // namespace alternating
