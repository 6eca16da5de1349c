#ifndef TAKEAWAY_MEX_HPP
#define TAKEAWAY_MEX_HPP

#include <algorithm>
#include <cstddef>
#include <vector>

namespace takeaway {

using GrundyValue = std::size_t;

/**
 * Minimum excluded value: the smallest non-negative integer absent from values.
 *
 * The values are copied and sorted first, so the result does not depend on the
 * container's iteration order. Duplicates are allowed. mex({}) == 0.
 * Works with any container of GrundyValue (std::set, std::vector,
 * std::unordered_set, ...).
 */
template<typename Container>
GrundyValue mex(const Container& values) {
    std::vector<GrundyValue> sorted(values.begin(), values.end());
    std::sort(sorted.begin(), sorted.end());

    GrundyValue expected = 0;
    for (GrundyValue value : sorted) {
        if (value == expected) {
            ++expected;
        } else if (value > expected) {
            break;  // gap found
        }
    }
    return expected;
}

} // namespace takeaway

#endif // TAKEAWAY_MEX_HPP
