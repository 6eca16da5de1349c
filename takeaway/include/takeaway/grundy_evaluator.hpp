#ifndef TAKEAWAY_GRUNDY_EVALUATOR_HPP
#define TAKEAWAY_GRUNDY_EVALUATOR_HPP

#include <takeaway/hypergraph_state.hpp>
#include <takeaway/mex.hpp>
#include <cstddef>
#include <unordered_map>

namespace takeaway {

struct CacheStats {
    std::size_t hits = 0;
    std::size_t misses = 0;
};

/**
 * Memoized Sprague-Grundy valuation of take-away positions.
 *
 * The only move is "delete one vertex together with every edge and face
 * incident to it". The value of a position is the mex of the values of all
 * positions reachable in one move; the empty position has value 0.
 *
 * A position is determined by its surviving vertex subset, so at most 2^n
 * positions are reachable from an n-vertex start. The cache collapses the n!
 * removal orders onto those subsets. It is owned by the evaluator, keyed by
 * structural identity, and only ever grows until clear_cache() is called.
 */
class GrundyEvaluator {
private:
    std::unordered_map<HypergraphState, GrundyValue, HypergraphStateHash> cache_;
    CacheStats stats_;

public:
    GrundyEvaluator() = default;

    // Non-copyable: a copied evaluator would silently fork the cache
    GrundyEvaluator(const GrundyEvaluator&) = delete;
    GrundyEvaluator& operator=(const GrundyEvaluator&) = delete;

    GrundyValue grundy(const HypergraphState& state);

    /**
     * Nim-sum of the values of state's connected components. Equal to
     * grundy(state) by the Sprague-Grundy theorem, but each component is
     * evaluated on its own, which keeps the reachable subsets small.
     */
    GrundyValue grundy_by_components(const HypergraphState& state);

    // Drop every memoized value and reset the hit/miss counters
    void clear_cache();

    std::size_t cache_size() const { return cache_.size(); }
    const CacheStats& cache_stats() const { return stats_; }
};

} // namespace takeaway

#endif // TAKEAWAY_GRUNDY_EVALUATOR_HPP
