#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "serialization.hpp"
#include <cstddef>
#include <concepts>
#include <initializer_list>
#include <string>
#include <optional>
#include <vector>
#include <list>
#include <deque>
#include <set>
#include <unordered_set>
#include <type_traits>
#include <utility>

namespace strata {

// ============================================================================
// Type traits
// ============================================================================

namespace detail {
    template<typename T> struct is_optional : std::false_type {};
    template<typename T> struct is_optional<std::optional<T>> : std::true_type {};

    template<typename T>
    struct unwrap_optional { using type = T; };
    template<typename T>
    struct unwrap_optional<std::optional<T>> { using type = T; };

    template<typename T>
    using unwrap_optional_t = typename unwrap_optional<T>::type;

    // Host integer types that map to the storage 64-bit integer
    template<typename T>
    inline constexpr bool is_host_integer_v =
        std::is_same_v<T, int16_t> || std::is_same_v<T, int32_t> || std::is_same_v<T, int64_t>;

    template<typename T>
    inline constexpr bool is_host_real_v = std::is_same_v<T, float> || std::is_same_v<T, double>;
} // namespace detail

// ============================================================================
// linked_set - set that iterates in insertion order
// ============================================================================

template<typename T>
class linked_set {
public:
    using value_type = T;
    using const_iterator = typename std::vector<T>::const_iterator;
    using iterator = const_iterator;

    linked_set() = default;
    linked_set(std::initializer_list<T> init) {
        for (const auto& v : init) insert(v);
    }

    /// Inserts value if not already present. Returns true when inserted.
    bool insert(const T& value) {
        if (!index_.insert(value).second) return false;
        items_.push_back(value);
        return true;
    }

    bool contains(const T& value) const { return index_.find(value) != index_.end(); }

    void reserve(size_t n) {
        items_.reserve(n);
        index_.reserve(n);
    }

    void clear() {
        items_.clear();
        index_.clear();
    }

    size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }

    const_iterator begin() const { return items_.begin(); }
    const_iterator end() const { return items_.end(); }

    const T& front() const { return items_.front(); }
    const T& back() const { return items_.back(); }

    /// Set equality. Insertion order is ignored.
    bool operator==(const linked_set& other) const { return index_ == other.index_; }
    bool operator!=(const linked_set& other) const { return !(*this == other); }

private:
    std::vector<T> items_;
    std::unordered_set<T> index_;
};

// ============================================================================
// collection_builder - how a destination collection is assembled
//
// Specialize for custom collections. append() is called once per source
// element in source order; finalize() is called once at the end.
// ============================================================================

template<typename C>
struct collection_builder {
    C result;

    void reserve(size_t n) {
        if constexpr (requires { result.reserve(n); }) {
            result.reserve(n);
        }
    }

    template<typename E>
    void append(E&& element) {
        if constexpr (requires { result.push_back(std::forward<E>(element)); }) {
            result.push_back(std::forward<E>(element));
        } else {
            result.insert(std::forward<E>(element));
        }
    }

    C finalize() { return std::move(result); }
};

// Storage list kind for a host element type
template<typename E>
struct list_storage;

template<typename E>
    requires detail::is_host_integer_v<detail::unwrap_optional_t<E>>
struct list_storage<E> {
    using type = long_list;
    using element = int64_t;
};

template<typename E>
    requires detail::is_host_real_v<detail::unwrap_optional_t<E>>
struct list_storage<E> {
    using type = double_list;
    using element = double;
};

template<typename E>
    requires std::is_same_v<detail::unwrap_optional_t<E>, std::string>
struct list_storage<E> {
    using type = string_list;
    using element = std::string;
};

template<typename E>
using list_storage_t = typename list_storage<E>::type;

// A host collection the list converters can produce and consume
template<typename C>
concept host_collection = requires(const C& c) {
    typename C::value_type;
    typename list_storage<typename C::value_type>::type;
    { c.size() } -> std::convertible_to<size_t>;
    c.begin();
    c.end();
} && !std::is_same_v<C, std::string> && !std::is_same_v<C, bytes_t>;

namespace convert {

// ============================================================================
// Element conversions
// ============================================================================

/// Storage element -> host element. A null element becomes the zero value
/// of a primitive element type and stays null for an optional element type.
template<typename E, typename S>
E narrow_element(const std::optional<S>& v) {
    if constexpr (detail::is_optional<E>::value) {
        using U = typename E::value_type;
        if (!v.has_value()) return std::nullopt;
        return static_cast<U>(*v);
    } else {
        if (!v.has_value()) return E{};
        return static_cast<E>(*v);
    }
}

/// Host element -> storage element
template<typename S, typename E>
std::optional<S> widen_element(const E& v) {
    if constexpr (detail::is_optional<E>::value) {
        if (!v.has_value()) return std::nullopt;
        return static_cast<S>(*v);
    } else {
        return static_cast<S>(v);
    }
}

// ============================================================================
// List conversions
//
// from_list: absent (or a value of another kind) -> nullopt; a present list,
// even an empty one, -> a present collection.
// ============================================================================

template<host_collection C>
std::optional<C> from_list(const entity_value_t& v) {
    using E = typename C::value_type;
    using L = list_storage_t<E>;

    const L* src = std::get_if<L>(&v);
    if (src == nullptr) return std::nullopt;

    collection_builder<C> builder;
    builder.reserve(src->size());
    for (const auto& element : *src) {
        builder.append(narrow_element<E>(element));
    }
    return builder.finalize();
}

template<host_collection C>
entity_value_t to_list(const std::optional<C>& v) {
    using E = typename C::value_type;
    using L = list_storage_t<E>;
    using S = typename list_storage<E>::element;

    if (!v.has_value()) return entity_value_t{};

    L out;
    out.reserve(v->size());
    for (const auto& element : *v) {
        out.push_back(widen_element<S>(element));
    }
    return entity_value_t{std::move(out)};
}

} // namespace convert

// ============================================================================
// converter<Host, Storage>
//
// to_host(value): storage value -> host value. An absent value (or one of a
// different kind) yields the zero value for primitives, nullopt otherwise.
// to_storage(host): host value -> storage value. nullopt yields absent.
//
// Narrowing (int64 -> int16/int32, double -> float) truncates without checks.
// ============================================================================

template<typename Host, typename Storage>
struct converter;

// int64 <-> int16/int32/int64
template<typename H>
    requires detail::is_host_integer_v<H>
struct converter<H, int64_t> {
    static H to_host(const entity_value_t& v) {
        const int64_t* p = std::get_if<int64_t>(&v);
        return p != nullptr ? static_cast<H>(*p) : H{0};
    }
    static entity_value_t to_storage(const H& h) {
        return entity_value_t{std::in_place_type<int64_t>, static_cast<int64_t>(h)};
    }
};

template<typename H>
    requires detail::is_host_integer_v<H>
struct converter<std::optional<H>, int64_t> {
    static std::optional<H> to_host(const entity_value_t& v) {
        const int64_t* p = std::get_if<int64_t>(&v);
        if (p == nullptr) return std::nullopt;
        return static_cast<H>(*p);
    }
    static entity_value_t to_storage(const std::optional<H>& h) {
        if (!h.has_value()) return entity_value_t{};
        return entity_value_t{std::in_place_type<int64_t>, static_cast<int64_t>(*h)};
    }
};

// double <-> float/double
template<typename H>
    requires detail::is_host_real_v<H>
struct converter<H, double> {
    static H to_host(const entity_value_t& v) {
        const double* p = std::get_if<double>(&v);
        return p != nullptr ? static_cast<H>(*p) : H{0};
    }
    static entity_value_t to_storage(const H& h) {
        return entity_value_t{std::in_place_type<double>, static_cast<double>(h)};
    }
};

template<typename H>
    requires detail::is_host_real_v<H>
struct converter<std::optional<H>, double> {
    static std::optional<H> to_host(const entity_value_t& v) {
        const double* p = std::get_if<double>(&v);
        if (p == nullptr) return std::nullopt;
        return static_cast<H>(*p);
    }
    static entity_value_t to_storage(const std::optional<H>& h) {
        if (!h.has_value()) return entity_value_t{};
        return entity_value_t{std::in_place_type<double>, static_cast<double>(*h)};
    }
};

// bool <-> bool
template<>
struct converter<bool, bool> {
    static bool to_host(const entity_value_t& v) {
        const bool* p = std::get_if<bool>(&v);
        return p != nullptr ? *p : false;
    }
    static entity_value_t to_storage(const bool& h) {
        return entity_value_t{std::in_place_type<bool>, h};
    }
};

template<>
struct converter<std::optional<bool>, bool> {
    static std::optional<bool> to_host(const entity_value_t& v) {
        const bool* p = std::get_if<bool>(&v);
        if (p == nullptr) return std::nullopt;
        return *p;
    }
    static entity_value_t to_storage(const std::optional<bool>& h) {
        if (!h.has_value()) return entity_value_t{};
        return entity_value_t{std::in_place_type<bool>, *h};
    }
};

// string <-> string
template<>
struct converter<std::string, std::string> {
    static std::string to_host(const entity_value_t& v) {
        const std::string* p = std::get_if<std::string>(&v);
        return p != nullptr ? *p : std::string();
    }
    static entity_value_t to_storage(const std::string& h) {
        return entity_value_t{std::in_place_type<std::string>, h};
    }
};

template<>
struct converter<std::optional<std::string>, std::string> {
    static std::optional<std::string> to_host(const entity_value_t& v) {
        const std::string* p = std::get_if<std::string>(&v);
        if (p == nullptr) return std::nullopt;
        return *p;
    }
    static entity_value_t to_storage(const std::optional<std::string>& h) {
        if (!h.has_value()) return entity_value_t{};
        return entity_value_t{std::in_place_type<std::string>, *h};
    }
};

// text <-> string
template<>
struct converter<std::string, text> {
    static std::string to_host(const entity_value_t& v) {
        const text* p = std::get_if<text>(&v);
        return p != nullptr ? p->value : std::string();
    }
    static entity_value_t to_storage(const std::string& h) {
        return entity_value_t{text(h)};
    }
};

template<>
struct converter<std::optional<std::string>, text> {
    static std::optional<std::string> to_host(const entity_value_t& v) {
        const text* p = std::get_if<text>(&v);
        if (p == nullptr) return std::nullopt;
        return p->value;
    }
    static entity_value_t to_storage(const std::optional<std::string>& h) {
        if (!h.has_value()) return entity_value_t{};
        return entity_value_t{text(*h)};
    }
};

// short_blob / blob <-> bytes
template<typename B>
    requires std::is_same_v<B, short_blob> || std::is_same_v<B, blob>
struct converter<std::optional<bytes_t>, B> {
    static std::optional<bytes_t> to_host(const entity_value_t& v) {
        const B* p = std::get_if<B>(&v);
        if (p == nullptr) return std::nullopt;
        return p->bytes;
    }
    static entity_value_t to_storage(const std::optional<bytes_t>& h) {
        if (!h.has_value()) return entity_value_t{};
        return entity_value_t{B(*h)};
    }
};

template<typename B>
    requires std::is_same_v<B, short_blob> || std::is_same_v<B, blob>
struct converter<bytes_t, B> {
    static bytes_t to_host(const entity_value_t& v) {
        const B* p = std::get_if<B>(&v);
        return p != nullptr ? p->bytes : bytes_t();
    }
    static entity_value_t to_storage(const bytes_t& h) {
        return entity_value_t{B(h)};
    }
};

// short_blob / blob <-> serializable object
template<typename T, typename B>
    requires (std::is_same_v<B, short_blob> || std::is_same_v<B, blob>) &&
             (!std::is_same_v<T, bytes_t>)
struct converter<std::optional<T>, B> {
    static std::optional<T> to_host(const entity_value_t& v) {
        const B* p = std::get_if<B>(&v);
        if (p == nullptr) return std::nullopt;
        return serializer::from_bytes<T>(p->bytes);
    }
    static entity_value_t to_storage(const std::optional<T>& h) {
        if (!h.has_value()) return entity_value_t{};
        return entity_value_t{B(serializer::to_bytes(*h))};
    }
};

// list <-> collection
template<host_collection C, typename L>
    requires std::is_same_v<L, list_storage_t<typename C::value_type>>
struct converter<std::optional<C>, L> {
    static std::optional<C> to_host(const entity_value_t& v) {
        return convert::from_list<C>(v);
    }
    static entity_value_t to_storage(const std::optional<C>& h) {
        return convert::to_list<C>(h);
    }
};

// ============================================================================
// default_storage<Host> - storage kind used when an attribute does not name one
// ============================================================================

template<typename Host>
struct default_storage;

template<typename H>
    requires detail::is_host_integer_v<detail::unwrap_optional_t<H>>
struct default_storage<H> { using type = int64_t; };

template<typename H>
    requires detail::is_host_real_v<detail::unwrap_optional_t<H>>
struct default_storage<H> { using type = double; };

template<typename H>
    requires std::is_same_v<detail::unwrap_optional_t<H>, bool>
struct default_storage<H> { using type = bool; };

template<typename H>
    requires std::is_same_v<detail::unwrap_optional_t<H>, std::string>
struct default_storage<H> { using type = std::string; };

template<typename H>
    requires std::is_same_v<detail::unwrap_optional_t<H>, bytes_t>
struct default_storage<H> { using type = short_blob; };

template<host_collection C>
struct default_storage<std::optional<C>> { using type = list_storage_t<typename C::value_type>; };

template<typename Host>
using default_storage_t = typename default_storage<Host>::type;

// Storage kind tag -> value_kind
namespace detail {
    template<typename T, typename V>
    struct variant_index;

    template<typename T, typename... Ts>
    struct variant_index<T, std::variant<Ts...>> {
        static constexpr size_t value = [] {
            size_t i = 0;
            ((std::is_same_v<T, Ts> ? false : (++i, true)) && ...);
            return i;
        }();
    };
} // namespace detail

template<typename Storage>
inline constexpr value_kind storage_kind_v =
    static_cast<value_kind>(detail::variant_index<Storage, entity_value_t>::value);

namespace convert {

template<typename Host, typename Storage = default_storage_t<Host>>
Host to_host(const entity_value_t& v) {
    return converter<Host, Storage>::to_host(v);
}

template<typename Host, typename Storage = default_storage_t<Host>>
entity_value_t to_storage(const Host& h) {
    return converter<Host, Storage>::to_storage(h);
}

} // namespace convert

} // namespace strata

#endif // __cplusplus
