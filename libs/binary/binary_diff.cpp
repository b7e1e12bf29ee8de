/**
 * @file binary_diff.cpp
 * @brief NameMatcher implementation
 */

#include "ossensor/binary_diff.hpp"

#include <deque>
#include <map>
#include <string>

namespace ossensor::binary {

std::vector<evidence::BinaryDiffPair> NameMatcher::match(const evidence::BinaryFeatureSet& from,
                                                         const evidence::BinaryFeatureSet& to) const
{
    // name -> indices into to.symbols, in to-side order
    std::map<std::string, std::deque<std::size_t>> to_by_name;
    for (std::size_t i = 0; i < to.symbols.size(); ++i) {
        to_by_name[to.symbols[i].name].push_back(i);
    }

    std::vector<bool> to_matched(to.symbols.size(), false);
    std::vector<evidence::BinaryDiffPair> pairs;
    pairs.reserve(from.symbols.size() + to.symbols.size());

    for (const auto& symbol : from.symbols) {
        evidence::BinaryDiffPair pair;
        pair.name = symbol.name;
        pair.from_symbol_id = symbol.symbol_id;
        pair.from_address = symbol.address;
        if (auto it = to_by_name.find(symbol.name); it != to_by_name.end() && !it->second.empty()) {
            const std::size_t index = it->second.front();
            it->second.pop_front();
            to_matched[index] = true;
            pair.basis = evidence::MatchBasis::kName;
            pair.to_symbol_id = to.symbols[index].symbol_id;
            pair.to_address = to.symbols[index].address;
        }
        pair.pair_id = evidence::make_pair_id(pair.from_symbol_id, pair.to_symbol_id);
        pairs.push_back(std::move(pair));
    }

    for (std::size_t i = 0; i < to.symbols.size(); ++i) {
        if (to_matched[i]) {
            continue;
        }
        const auto& symbol = to.symbols[i];
        evidence::BinaryDiffPair pair;
        pair.name = symbol.name;
        pair.to_symbol_id = symbol.symbol_id;
        pair.to_address = symbol.address;
        pair.pair_id = evidence::make_pair_id(pair.from_symbol_id, pair.to_symbol_id);
        pairs.push_back(std::move(pair));
    }
    return pairs;
}

std::unique_ptr<SymbolMatcher> make_default_matcher()
{
    return std::make_unique<NameMatcher>();
}

}  // namespace ossensor::binary
