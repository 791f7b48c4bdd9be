#include "core/types.hpp"

#include <format>

namespace sqlpager {

std::string value_to_string(const SqlValue& value) {
    struct Formatter {
        std::string operator()(std::monostate) const { return "null"; }
        std::string operator()(bool v) const { return v ? "true" : "false"; }
        std::string operator()(int64_t v) const { return std::format("{}", v); }
        std::string operator()(double v) const { return std::format("{}", v); }
        std::string operator()(const std::string& v) const { return std::format("'{}'", v); }
    };
    return std::visit(Formatter{}, value);
}

} // namespace sqlpager
