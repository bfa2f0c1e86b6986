#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace tkv::storage {

// Transparent hash so string-keyed containers can be probed with a
// std::string_view without materialising a std::string.
struct StringHash {
    using is_transparent = void;

    std::size_t operator()(std::string_view s) const noexcept {
        return std::hash<std::string_view>{}(s);
    }
    std::size_t operator()(const std::string& s) const noexcept {
        return std::hash<std::string_view>{}(s);
    }
};

} // namespace tkv::storage
