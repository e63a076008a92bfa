#pragma once

#include <cstddef>
#include <iterator>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

#include "size_hint.hpp"

namespace alternating {

/**
 * @brief Generic interface for pull-based producers of items.
 *
 * A source hands out one item per `Next()` call and returns std::nullopt
 * when it has nothing for that call. Whether an empty result is permanent is
 * up to the implementation; wrap a source in `FusedSource` to make it so.
 *
 * Sources are owned through `std::unique_ptr<Source<T>>` and are never
 * copied.
 */
template <typename T>
class Source {
public:
    using Item = T;

    Source() = default;
    Source(const Source&) = delete;
    Source& operator=(const Source&) = delete;
    Source(Source&&) noexcept = default;
    Source& operator=(Source&&) noexcept = default;
    virtual ~Source() = default;

    /**
     * @return the next item, or std::nullopt if none is available
     */
    virtual std::optional<T> Next() = 0;

    /**
     * @return bounds on the number of items left before the first empty
     *         result; by default nothing is known
     */
    virtual SizeHint GetSizeHint() const noexcept {
        return SizeHint::Unbounded(0);
    }

    /**
     * @return true only if every later `Next()` is guaranteed to return
     *         std::nullopt; false when that is unknown
     */
    virtual bool IsExhausted() const noexcept {
        return false;
    }
};

/**
 * @brief Walks a half-open range `[begin, end)` of forward iterators,
 *        yielding copies of the elements.
 *
 * The underlying storage is borrowed and must outlive the source.
 */
template <typename It>
class IteratorSource : public Source<std::remove_cv_t<typename std::iterator_traits<It>::value_type>> {
    static_assert(std::is_base_of<std::forward_iterator_tag,
                                  typename std::iterator_traits<It>::iterator_category>::value,
                  "IteratorSource requires forward iterators");

public:
    using Item = std::remove_cv_t<typename std::iterator_traits<It>::value_type>;

    IteratorSource(It begin, It end)
        : pos_(begin), end_(end),
          remaining_(static_cast<std::size_t>(std::distance(begin, end))) {}

    std::optional<Item> Next() override {
        if (pos_ == end_) {
            return std::nullopt;
        }
        std::optional<Item> item(*pos_);
        ++pos_;
        --remaining_;
        return item;
    }

    SizeHint GetSizeHint() const noexcept override {
        return SizeHint::Exact(remaining_);
    }

    bool IsExhausted() const noexcept override {
        return pos_ == end_;
    }

private:
    It pos_;
    It end_;
    std::size_t remaining_;
};

/**
 * @brief Owns a container and moves its elements out one at a time.
 */
template <typename C>
class ContainerSource : public Source<typename C::value_type> {
public:
    using Item = typename C::value_type;

    explicit ContainerSource(C container)
        : container_(std::move(container)),
          pos_(container_.begin()),
          remaining_(container_.size()) {}

    // pos_ points into container_, so the object must stay put.
    ContainerSource(ContainerSource&&) = delete;
    ContainerSource& operator=(ContainerSource&&) = delete;

    std::optional<Item> Next() override {
        if (pos_ == container_.end()) {
            return std::nullopt;
        }
        std::optional<Item> item(std::move(*pos_));
        ++pos_;
        --remaining_;
        return item;
    }

    SizeHint GetSizeHint() const noexcept override {
        return SizeHint::Exact(remaining_);
    }

    bool IsExhausted() const noexcept override {
        return remaining_ == 0;
    }

private:
    C container_;
    typename C::iterator pos_;
    std::size_t remaining_;
};

/**
 * @brief Counts through `[begin, end)` without storing anything.
 *
 * The hint is exact even for ranges as long as SIZE_MAX.
 */
template <typename N>
class IotaSource : public Source<N> {
    static_assert(std::is_integral<N>::value, "IotaSource counts integers");

public:
    IotaSource(N begin, N end) : current_(begin), end_(end) {}

    std::optional<N> Next() override {
        if (!(current_ < end_)) {
            return std::nullopt;
        }
        return current_++;
    }

    SizeHint GetSizeHint() const noexcept override {
        if (!(current_ < end_)) {
            return SizeHint::Exact(0);
        }
        using U = std::make_unsigned_t<N>;
        U span = static_cast<U>(static_cast<U>(end_) - static_cast<U>(current_));
        if (span > std::numeric_limits<std::size_t>::max()) {
            return SizeHint::Unbounded(std::numeric_limits<std::size_t>::max());
        }
        return SizeHint::Exact(static_cast<std::size_t>(span));
    }

    bool IsExhausted() const noexcept override {
        return !(current_ < end_);
    }

private:
    N current_;
    N end_;
};

/**
 * @brief Yields copies of one value forever.
 */
template <typename T>
class RepeatSource : public Source<T> {
public:
    explicit RepeatSource(T value) : value_(std::move(value)) {}

    std::optional<T> Next() override {
        return std::optional<T>(value_);
    }

    SizeHint GetSizeHint() const noexcept override {
        return SizeHint::Unbounded(std::numeric_limits<std::size_t>::max());
    }

private:
    T value_;
};

template <typename T>
class EmptySource : public Source<T> {
public:
    std::optional<T> Next() override {
        return std::nullopt;
    }

    SizeHint GetSizeHint() const noexcept override {
        return SizeHint::Exact(0);
    }

    bool IsExhausted() const noexcept override {
        return true;
    }
};

template <typename It>
std::unique_ptr<IteratorSource<It>> FromIterators(It begin, It end) {
    return std::make_unique<IteratorSource<It>>(begin, end);
}

/**
 * @brief Borrowing source over a container. Several sources may borrow the
 *        same container at once.
 *
 * The container must outlive the source, so temporaries are rejected; use
 * `FromContainer` to hand over ownership instead.
 */
template <typename Container>
auto FromRange(const Container& container) {
    return FromIterators(std::cbegin(container), std::cend(container));
}

template <typename Container>
void FromRange(const Container&&) = delete;

template <typename Container>
std::unique_ptr<ContainerSource<std::decay_t<Container>>> FromContainer(Container&& container) {
    return std::make_unique<ContainerSource<std::decay_t<Container>>>(std::forward<Container>(container));
}

template <typename N>
std::unique_ptr<IotaSource<N>> Iota(N begin, N end) {
    return std::make_unique<IotaSource<N>>(begin, end);
}

template <typename T>
std::unique_ptr<RepeatSource<std::decay_t<T>>> Repeat(T&& value) {
    return std::make_unique<RepeatSource<std::decay_t<T>>>(std::forward<T>(value));
}

template <typename T>
std::unique_ptr<EmptySource<T>> Empty() {
    return std::make_unique<EmptySource<T>>();
}

/**
 * @brief Pull items until the first empty result.
 */
template <typename T>
std::vector<T> Collect(Source<T>& source) {
    std::vector<T> items;
    while (auto item = source.Next()) {
        items.push_back(std::move(*item));
    }
    return items;
}

/**
 * @brief Number of items before the first empty result.
 */
template <typename T>
std::size_t Count(Source<T>& source) {
    std::size_t count = 0;
    while (source.Next()) {
        ++count;
    }
    return count;
}

/**
 * @brief Pull items, skipping over empty results, until `max_gaps`
 *        consecutive empty results have been seen.
 *
 * With `max_gaps == 1` this is `Collect`. Sources that recover after an
 * empty result (e.g. `Alternating` once one side is exhausted) need 2.
 * Stops early on an empty result from a source that reports `IsExhausted()`.
 */
template <typename T>
std::vector<T> CollectUntilGaps(Source<T>& source, std::size_t max_gaps) {
    if (max_gaps == 0) {
        throw std::invalid_argument("max_gaps must be at least 1");
    }
    std::vector<T> items;
    std::size_t gaps = 0;
    while (gaps < max_gaps) {
        auto item = source.Next();
        if (!item) {
            if (source.IsExhausted()) {
                break;
            }
            ++gaps;
            continue;
        }
        gaps = 0;
        items.push_back(std::move(*item));
    }
    return items;
}

}  // namespace alternating
