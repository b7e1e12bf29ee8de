#pragma once

/**
 * @file binary_diff.hpp
 * @brief BinaryDiffMatcher: symbol pairing between two builds
 *
 * SymbolMatcher is the seam for heavier matchers; callers and the bundle
 * schema only see BinaryDiffPair, so a replacement changes neither.
 */

#include "ossensor/evidence.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace ossensor::binary {

class SymbolMatcher
{
public:
    virtual ~SymbolMatcher() = default;

    /// Short identifier of the matching policy (e.g. "name")
    [[nodiscard]] virtual std::string_view name() const = 0;

    /**
     * Pair the symbols of two feature sets. Either set may be empty.
     * Unmatched symbols are reported as pairs with basis kNone.
     */
    [[nodiscard]] virtual std::vector<evidence::BinaryDiffPair>
    match(const evidence::BinaryFeatureSet& from, const evidence::BinaryFeatureSet& to) const = 0;
};

/**
 * Exact-name matching. The k-th symbol named N in `from` pairs with the
 * k-th symbol named N in `to`; surplus occurrences stay unmatched.
 *
 * Output order: from-side order (matched pairs and removed symbols), then
 * symbols only present in `to`, in to-side order.
 */
class NameMatcher final : public SymbolMatcher
{
public:
    [[nodiscard]] std::string_view name() const override { return "name"; }

    [[nodiscard]] std::vector<evidence::BinaryDiffPair>
    match(const evidence::BinaryFeatureSet& from, const evidence::BinaryFeatureSet& to) const override;
};

[[nodiscard]] std::unique_ptr<SymbolMatcher> make_default_matcher();

}  // namespace ossensor::binary
