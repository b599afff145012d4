#include "strata/strata.hpp"

namespace strata {

// Single definition of the global log level (declared extern in log.hpp).
std::atomic<log_level> g_log_level{log_level::off};

const char* kind_name(value_kind k) {
    switch (k) {
        case value_kind::absent: return "absent";
        case value_kind::integer: return "integer";
        case value_kind::real: return "double";
        case value_kind::boolean: return "boolean";
        case value_kind::string: return "string";
        case value_kind::text: return "text";
        case value_kind::short_blob: return "short_blob";
        case value_kind::blob: return "blob";
        case value_kind::long_list: return "long_list";
        case value_kind::double_list: return "double_list";
        case value_kind::string_list: return "string_list";
    }
    return "unknown";
}

// ============================================================================
// entity
// ============================================================================

const entity_value_t& entity::get_property(const std::string& name) const {
    static const entity_value_t absent{};
    auto it = properties_.find(name);
    return it != properties_.end() ? it->second : absent;
}

void entity::set_property(const std::string& name, entity_value_t value) {
    properties_[name] = std::move(value);
}

bool entity::has_property(const std::string& name) const {
    return properties_.find(name) != properties_.end();
}

void entity::remove_property(const std::string& name) {
    properties_.erase(name);
}

} // namespace strata
