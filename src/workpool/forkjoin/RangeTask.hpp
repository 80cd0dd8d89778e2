#pragma once
#include "core/Error.hpp"
#include "forkjoin/ForkJoinPool.hpp"
#include "forkjoin/ForkJoinTask.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <utility>

namespace WP {

/**
 * Divide-and-conquer reduction over the index range [lo, hi).
 *
 * Ranges no longer than the threshold are handed to the leaf function in one
 * piece. Longer ranges split at the midpoint: the right half is forked, the
 * left half computed on the current thread, and the two results combined as
 * combine(left, right), so a non-commutative combine still sees ranges in
 * order.
 */
template <typename T>
class RangeReduceTask final : public RecursiveTask<T> {
public:
    using Leaf    = std::function<T(std::int64_t, std::int64_t)>;
    using Combine = std::function<T(T, T)>;

    RangeReduceTask(std::int64_t lo, std::int64_t hi, std::int64_t threshold,
                    std::shared_ptr<Leaf const> leaf, std::shared_ptr<Combine const> combine)
        : lo_(lo), hi_(hi), threshold_(threshold), leaf_(std::move(leaf)), combine_(std::move(combine)) {}

protected:
    auto compute() -> T override {
        if (this->hi_ - this->lo_ <= this->threshold_)
            return (*this->leaf_)(this->lo_, this->hi_);

        auto const mid   = this->lo_ + (this->hi_ - this->lo_) / 2;
        auto       right = std::make_shared<RangeReduceTask>(mid, this->hi_, this->threshold_, this->leaf_, this->combine_);
        right->fork();
        RangeReduceTask left(this->lo_, mid, this->threshold_, this->leaf_, this->combine_);
        T leftValue = left.invoke();
        return (*this->combine_)(std::move(leftValue), right->join());
    }

private:
    std::int64_t                   lo_;
    std::int64_t                   hi_;
    std::int64_t                   threshold_;
    std::shared_ptr<Leaf const>    leaf_;
    std::shared_ptr<Combine const> combine_;
};

// Reduces [lo, hi) on the pool. An empty range yields leaf(lo, lo).
template <typename T, typename LeafFn, typename CombineFn>
auto parallelReduce(ForkJoinPool& pool, std::int64_t lo, std::int64_t hi, std::int64_t threshold, LeafFn&& leaf,
                    CombineFn&& combine) -> Expected<T> {
    if (hi < lo)
        return std::unexpected(Error{Error::Code::InvalidError, "range end precedes range start"});
    if (threshold < 1)
        threshold = 1;
    auto leafFn    = std::make_shared<typename RangeReduceTask<T>::Leaf const>(std::forward<LeafFn>(leaf));
    auto combineFn = std::make_shared<typename RangeReduceTask<T>::Combine const>(std::forward<CombineFn>(combine));
    auto task      = std::make_shared<RangeReduceTask<T>>(lo, hi, threshold, std::move(leafFn), std::move(combineFn));
    return pool.invoke<T>(std::move(task));
}

// Same, with the pool's configured split threshold.
template <typename T, typename LeafFn, typename CombineFn>
auto parallelReduce(ForkJoinPool& pool, std::int64_t lo, std::int64_t hi, LeafFn&& leaf, CombineFn&& combine) -> Expected<T> {
    return parallelReduce<T>(pool, lo, hi, pool.splitThreshold(), std::forward<LeafFn>(leaf), std::forward<CombineFn>(combine));
}

} // namespace WP
