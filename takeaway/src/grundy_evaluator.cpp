#include <takeaway/grundy_evaluator.hpp>
#include <takeaway/debug_log.hpp>
#include <set>

namespace takeaway {

GrundyValue GrundyEvaluator::grundy(const HypergraphState& state) {
    auto cached = cache_.find(state);
    if (cached != cache_.end()) {
        ++stats_.hits;
        return cached->second;
    }
    ++stats_.misses;

    GrundyValue value = 0;
    if (!state.is_empty()) {
        std::set<GrundyValue> reachable;
        for (const auto& vertex : state.vertices()) {
            HypergraphState successor = state.copy();
            successor.remove_vertex(vertex);
            reachable.insert(grundy(successor));
        }
        value = mex(reachable);
    }

    TAKEAWAY_DEBUG_LOG("grundy miss: %s -> %zu", state.to_string().c_str(), value);
    cache_.emplace(state, value);
    return value;
}

GrundyValue GrundyEvaluator::grundy_by_components(const HypergraphState& state) {
    GrundyValue nim_sum = 0;
    for (const auto& component : state.get_components()) {
        nim_sum ^= grundy(component);
    }
    return nim_sum;
}

void GrundyEvaluator::clear_cache() {
    TAKEAWAY_DEBUG_LOG("clearing grundy cache (%zu entries, %zu hits, %zu misses)",
                       cache_.size(), stats_.hits, stats_.misses);
    cache_.clear();
    stats_ = CacheStats{};
}

} // namespace takeaway
