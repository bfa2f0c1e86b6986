#include "storage/errors.hpp"

namespace tkv::storage {

namespace {

class StorageCategory final : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "tkv.storage"; }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
        case errc::wrong_type:          return "wrong kind of value";
        case errc::not_integer:         return "value is not an integer or out of range";
        case errc::overflow:            return "increment or decrement would overflow";
        case errc::nan_score:           return "resulting score is not a number (NaN)";
        case errc::invalid_stream_id:   return "invalid stream ID";
        case errc::stream_id_zero:      return "stream ID must be greater than 0-0";
        case errc::stream_id_too_small: return "stream ID is equal or smaller than the top item";
        case errc::no_such_member:      return "no such member";
        }
        return "unknown storage error";
    }
};

} // anonymous namespace

const std::error_category& storage_category() noexcept {
    static const StorageCategory category;
    return category;
}

} // namespace tkv::storage
