#pragma once

#include "storage/string_hash.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tkv::storage {

// Member → score mapping kept in (score, member) order.
//
// Two indexes are maintained in lockstep: a hash map for O(1) member lookup
// and an ordered set for rank order. Ties on score are broken by
// byte-lexicographic member order. Scores must never be NaN.
class SortedSet {
public:
    using Item = std::pair<double, std::string>;
    using const_iterator = std::set<Item>::const_iterator;

    // Inserts `member` or moves it to `score`.
    // Returns true if the member was not present before.
    bool add(std::string_view member, double score);

    // Returns true if the member was present.
    bool remove(std::string_view member);

    [[nodiscard]] std::optional<double> score(std::string_view member) const;

    // Zero-based position in ascending order, or nullopt if absent.
    [[nodiscard]] std::optional<std::size_t> rank(std::string_view member) const;

    // Items with rank in [start, stop]; both bounds must be valid ranks.
    [[nodiscard]] std::vector<Item> range(std::size_t start, std::size_t stop) const;

    [[nodiscard]] std::size_t size() const noexcept { return by_member_.size(); }
    [[nodiscard]] bool empty() const noexcept { return by_member_.empty(); }

    [[nodiscard]] const_iterator begin() const noexcept { return ordered_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return ordered_.end(); }

private:
    std::unordered_map<std::string, double, StringHash, std::equal_to<>> by_member_;
    std::set<Item> ordered_;
};

} // namespace tkv::storage
