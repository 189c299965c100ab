#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <type_traits>
#include <unordered_set>

namespace mc::util {

template <typename Container>
bool is_index_valid(const Container& items, std::ptrdiff_t index) {
    return index >= 0 && static_cast<std::size_t>(index) < std::size(items);
}

// True when no two elements compare equal. Empty ranges are unique.
template <typename Container>
bool is_unique(const Container& items) {
    using Value = typename Container::value_type;
    std::unordered_set<Value> seen;
    for (const auto& item : items) {
        if (!seen.insert(item).second) return false;
    }
    return true;
}

// Same as is_unique, on the keys produced by key_of.
template <typename Container, typename KeyOf>
bool is_unique_by(const Container& items, KeyOf key_of) {
    using Key = std::remove_cvref_t<std::invoke_result_t<KeyOf&, const typename Container::value_type&>>;
    std::unordered_set<Key> seen;
    for (const auto& item : items) {
        if (!seen.insert(std::invoke(key_of, item)).second) return false;
    }
    return true;
}

} // namespace mc::util
