#pragma once

#ifdef __cplusplus

#include <cstdint>
#include <string>
#include <optional>
#include <vector>
#include <variant>
#include <map>
#include <type_traits>

namespace strata {

// Byte sequence type used for binary blobs on both sides of a conversion
using bytes_t = std::vector<uint8_t>;

// Long text (unindexed string, like the datastore's Text)
struct text {
    std::string value;

    text() = default;
    explicit text(std::string v) : value(std::move(v)) {}

    bool operator==(const text& other) const { return value == other.value; }
    bool operator!=(const text& other) const { return value != other.value; }
};

// Small binary blob (indexable, size-limited by the backend)
struct short_blob {
    bytes_t bytes;

    short_blob() = default;
    explicit short_blob(bytes_t b) : bytes(std::move(b)) {}

    bool operator==(const short_blob& other) const { return bytes == other.bytes; }
    bool operator!=(const short_blob& other) const { return bytes != other.bytes; }
};

// Large binary blob (unindexed)
struct blob {
    bytes_t bytes;

    blob() = default;
    explicit blob(bytes_t b) : bytes(std::move(b)) {}

    bool operator==(const blob& other) const { return bytes == other.bytes; }
    bool operator!=(const blob& other) const { return bytes != other.bytes; }
};

// Multi-valued storage types. Elements may be null.
using long_list = std::vector<std::optional<int64_t>>;
using double_list = std::vector<std::optional<double>>;
using string_list = std::vector<std::optional<std::string>>;

// Storage-native value of one entity field.
// std::monostate is the absent value.
using entity_value_t = std::variant<
    std::monostate,
    int64_t,
    double,
    bool,
    std::string,
    text,
    short_blob,
    blob,
    long_list,
    double_list,
    string_list
>;

// Kind enumeration, in variant order
enum class value_kind {
    absent,
    integer,
    real,
    boolean,
    string,
    text,
    short_blob,
    blob,
    long_list,
    double_list,
    string_list
};

inline value_kind kind_of(const entity_value_t& v) {
    return static_cast<value_kind>(v.index());
}

inline bool is_absent(const entity_value_t& v) {
    return std::holds_alternative<std::monostate>(v);
}

inline bool is_list_kind(value_kind k) {
    return k == value_kind::long_list || k == value_kind::double_list || k == value_kind::string_list;
}

const char* kind_name(value_kind k);

// ============================================================================
// Value construction helpers for filter parameters and hand-built entities
// ============================================================================

inline entity_value_t to_value(std::monostate) { return entity_value_t{}; }
inline entity_value_t to_value(bool v) { return entity_value_t{std::in_place_type<bool>, v}; }

template<typename T>
    requires std::is_integral_v<T> && (!std::is_same_v<T, bool>)
entity_value_t to_value(T v) {
    return entity_value_t{std::in_place_type<int64_t>, static_cast<int64_t>(v)};
}

template<typename T>
    requires std::is_floating_point_v<T>
entity_value_t to_value(T v) {
    return entity_value_t{std::in_place_type<double>, static_cast<double>(v)};
}

inline entity_value_t to_value(const char* v) {
    if (v == nullptr) return entity_value_t{};
    return entity_value_t{std::in_place_type<std::string>, v};
}
inline entity_value_t to_value(const std::string& v) { return entity_value_t{std::in_place_type<std::string>, v}; }
inline entity_value_t to_value(text v) { return entity_value_t{std::move(v)}; }
inline entity_value_t to_value(short_blob v) { return entity_value_t{std::move(v)}; }
inline entity_value_t to_value(blob v) { return entity_value_t{std::move(v)}; }
inline entity_value_t to_value(long_list v) { return entity_value_t{std::move(v)}; }
inline entity_value_t to_value(double_list v) { return entity_value_t{std::move(v)}; }
inline entity_value_t to_value(string_list v) { return entity_value_t{std::move(v)}; }
inline entity_value_t to_value(const entity_value_t& v) { return v; }

template<typename T>
entity_value_t to_value(const std::optional<T>& v) {
    if (!v.has_value()) return entity_value_t{};
    return to_value(*v);
}

// ============================================================================
// Entity (storage record)
// ============================================================================

// Entity identity. id 0 means "not yet assigned by the store".
struct key {
    std::string kind;
    int64_t id = 0;

    bool is_complete() const { return !kind.empty() && id != 0; }

    bool operator==(const key& other) const { return kind == other.kind && id == other.id; }
    bool operator!=(const key& other) const { return !(*this == other); }
};

class entity {
public:
    using property_map = std::map<std::string, entity_value_t>;

    entity() = default;
    explicit entity(std::string kind) : key_{std::move(kind), 0} {}
    explicit entity(strata::key k) : key_(std::move(k)) {}

    const strata::key& key() const { return key_; }
    const std::string& kind() const { return key_.kind; }
    void set_key(strata::key k) { key_ = std::move(k); }

    /// Returns the stored value, or the absent value when the field is missing.
    const entity_value_t& get_property(const std::string& name) const;

    void set_property(const std::string& name, entity_value_t value);
    bool has_property(const std::string& name) const;
    void remove_property(const std::string& name);

    const property_map& properties() const { return properties_; }

    bool operator==(const entity& other) const {
        return key_ == other.key_ && properties_ == other.properties_;
    }
    bool operator!=(const entity& other) const { return !(*this == other); }

private:
    strata::key key_;
    property_map properties_;
};

} // namespace strata

#endif // __cplusplus
