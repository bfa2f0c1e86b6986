#include "storage/sorted_set.hpp"

#include <iterator>

namespace tkv::storage {

bool SortedSet::add(std::string_view member, double score) {
    auto it = by_member_.find(member);
    if (it == by_member_.end()) {
        std::string key(member);
        ordered_.emplace(score, key);
        by_member_.emplace(std::move(key), score);
        return true;
    }
    if (it->second != score) {
        auto node = ordered_.extract(Item{it->second, it->first});
        node.value().first = score;
        ordered_.insert(std::move(node));
        it->second = score;
    }
    return false;
}

bool SortedSet::remove(std::string_view member) {
    auto it = by_member_.find(member);
    if (it == by_member_.end()) {
        return false;
    }
    ordered_.erase(Item{it->second, it->first});
    by_member_.erase(it);
    return true;
}

std::optional<double> SortedSet::score(std::string_view member) const {
    auto it = by_member_.find(member);
    if (it == by_member_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::size_t> SortedSet::rank(std::string_view member) const {
    auto it = by_member_.find(member);
    if (it == by_member_.end()) {
        return std::nullopt;
    }
    // Linear in the rank: std::set has no order statistics.
    auto pos = ordered_.find(Item{it->second, it->first});
    return static_cast<std::size_t>(std::distance(ordered_.begin(), pos));
}

std::vector<SortedSet::Item> SortedSet::range(std::size_t start, std::size_t stop) const {
    std::vector<Item> out;
    if (start > stop || start >= ordered_.size()) {
        return out;
    }
    out.reserve(stop - start + 1);
    auto it = std::next(ordered_.begin(), static_cast<std::ptrdiff_t>(start));
    for (std::size_t i = start; i <= stop && it != ordered_.end(); ++i, ++it) {
        out.push_back(*it);
    }
    return out;
}

} // namespace tkv::storage
