#include "storage/database.hpp"

namespace tkv::storage {

std::error_code Database::push(std::string_view key, End end,
                               std::span<const std::string_view> elements,
                               std::size_t& new_length) {
    ListValue* list = nullptr;
    if (auto ec = find_or_create(key, list)) return ec;
    for (auto element : elements) {
        if (end == End::Front) {
            list->emplace_front(element);
        } else {
            list->emplace_back(element);
        }
    }
    new_length = list->size();
    return {};
}

std::error_code Database::pop(std::string_view key, End end, std::size_t count,
                              std::vector<std::string>& out) {
    out.clear();
    ListValue* list = nullptr;
    if (auto ec = find_as(key, list); ec || !list) return ec;

    while (count-- > 0 && !list->empty()) {
        if (end == End::Front) {
            out.push_back(std::move(list->front()));
            list->pop_front();
        } else {
            out.push_back(std::move(list->back()));
            list->pop_back();
        }
    }
    erase_if_empty(key, *list);
    return {};
}

std::error_code Database::llen(std::string_view key, std::size_t& out) {
    ListValue* list = nullptr;
    if (auto ec = find_as(key, list)) return ec;
    out = list ? list->size() : 0;
    return {};
}

std::error_code Database::lrange(std::string_view key, int64_t start, int64_t stop,
                                 std::vector<std::string>& out) {
    out.clear();
    ListValue* list = nullptr;
    if (auto ec = find_as(key, list); ec || !list) return ec;

    if (auto range = normalize_range(start, stop, list->size())) {
        const auto [first, last] = *range;
        out.assign(list->begin() + static_cast<std::ptrdiff_t>(first),
                   list->begin() + static_cast<std::ptrdiff_t>(last) + 1);
    }
    return {};
}

std::error_code Database::lindex(std::string_view key, int64_t index,
                                 std::optional<std::string>& out) {
    out.reset();
    ListValue* list = nullptr;
    if (auto ec = find_as(key, list); ec || !list) return ec;

    const auto len = static_cast<int64_t>(list->size());
    if (index < 0) index += len;
    if (index >= 0 && index < len) {
        out = (*list)[static_cast<std::size_t>(index)];
    }
    return {};
}

} // namespace tkv::storage
