#pragma once

#include <optional>
#include <string>
#include <vector>

namespace trip_atlas::trips {

struct KeyCount {
    std::string key;
    int count = 0;
};

// Groups equal keys and orders by count desc, then case-insensitive key asc.
// Empty keys are not counted.
std::vector<KeyCount> rank_by_count(const std::vector<std::string>& keys);

std::optional<KeyCount> top_by_count(const std::vector<std::string>& keys);

// Projects every item through key_fn before ranking
template <typename Range, typename KeyFn>
std::optional<KeyCount> top_by_count(const Range& items, KeyFn key_fn) {
    std::vector<std::string> keys;
    for (const auto& item : items) {
        keys.push_back(key_fn(item));
    }
    return top_by_count(keys);
}

} // namespace trip_atlas::trips
