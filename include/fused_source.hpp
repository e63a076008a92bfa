#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>

#include "logger.hpp"
#include "size_hint.hpp"
#include "source.hpp"

namespace alternating {

/**
 * @brief FusedSource makes exhaustion of any source permanent.
 *
 * Once the wrapped source returns an empty result, the wrapper never pulls
 * it again. Key guarantees:
 * 1. Once empty, every later `Next()` returns std::nullopt
 * 2. The size hint drops to exactly zero
 * 3. The inner source is left untouched after fusing
 *
 * Useful on top of `Alternating`, whose empty results are otherwise only
 * transient.
 */
template <typename T>
class FusedSource : public Source<T> {
public:
    explicit FusedSource(std::unique_ptr<Source<T>> inner)
        : inner_(std::move(inner)) {
        if (!inner_) {
            throw std::invalid_argument("FusedSource requires a non-null source");
        }
    }

    std::optional<T> Next() override {
        if (is_fused_) {
            ++calls_after_fused_;
            return std::nullopt;
        }

        auto item = inner_->Next();
        if (!item) {
            ALT_LOG_DEBUG("source fused");
            is_fused_ = true;
        }
        return item;
    }

    SizeHint GetSizeHint() const noexcept override {
        if (is_fused_) {
            return SizeHint::Exact(0);
        }
        return inner_->GetSizeHint();
    }

    /**
     * @return true if the source is exhausted and will never yield again
     */
    bool IsFused() const noexcept {
        return is_fused_;
    }

    bool IsExhausted() const noexcept override {
        return is_fused_ || inner_->IsExhausted();
    }

    /**
     * @brief Number of `Next()` calls made after fusing.
     *
     * Handy for spotting callers that keep polling a finished source.
     */
    std::size_t GetCallsAfterFused() const noexcept {
        return calls_after_fused_;
    }

private:
    std::unique_ptr<Source<T>> inner_;
    bool is_fused_ = false;
    std::size_t calls_after_fused_ = 0;
};

/**
 * @brief Factory for fused wrappers.
 *
 * @param source Source to wrap
 * @return FusedSource over `source`
 */
template <typename S>
std::unique_ptr<FusedSource<typename S::Item>> Fuse(std::unique_ptr<S> source) {
    return std::make_unique<FusedSource<typename S::Item>>(std::move(source));
}

}  // namespace alternating
