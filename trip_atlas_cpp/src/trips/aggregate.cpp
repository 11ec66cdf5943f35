#include "trip_atlas/trips/aggregate.hpp"
#include "trip_atlas/core/utils.hpp"

#include <algorithm>
#include <map>

namespace trip_atlas::trips {

std::vector<KeyCount> rank_by_count(const std::vector<std::string>& keys) {
    std::map<std::string, int> counts;
    for (const auto& key : keys) {
        if (key.empty()) continue;
        ++counts[key];
    }

    std::vector<KeyCount> ranked;
    ranked.reserve(counts.size());
    for (const auto& [key, count] : counts) {
        ranked.push_back({key, count});
    }
    std::sort(ranked.begin(), ranked.end(), [](const KeyCount& a, const KeyCount& b) {
        if (a.count != b.count) return a.count > b.count;
        return core::less_ci(a.key, b.key);
    });
    return ranked;
}

std::optional<KeyCount> top_by_count(const std::vector<std::string>& keys) {
    auto ranked = rank_by_count(keys);
    if (ranked.empty()) return std::nullopt;
    return ranked.front();
}

} // namespace trip_atlas::trips
