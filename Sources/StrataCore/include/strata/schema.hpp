#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "convert.hpp"
#include "log.hpp"
#include <concepts>
#include <deque>
#include <functional>
#include <string>
#include <vector>

namespace strata {

// ============================================================================
// attribute_meta - static description of one model field
// ============================================================================

class attribute_meta {
public:
    attribute_meta(std::string name, std::string field_name,
                   value_kind storage_kind, bool nullable);

    /// Storage record field key
    const std::string& name() const { return name_; }

    /// Host member identifier
    const std::string& field_name() const { return field_name_; }

    value_kind storage_kind() const { return storage_kind_; }
    bool nullable() const { return nullable_; }
    bool multi_valued() const { return is_list_kind(storage_kind_); }

private:
    std::string name_;
    std::string field_name_;
    value_kind storage_kind_;
    bool nullable_;
};

// ============================================================================
// model_meta_base - identity and attribute list of one model type
// ============================================================================

class model_meta_base {
public:
    /// Splits a qualified name ("app::Person") into package and simple name.
    /// Throws std::invalid_argument if model_class_name is empty.
    explicit model_meta_base(std::string model_class_name, bool top_level = true);

    model_meta_base(std::string package_name, std::string simple_name, bool top_level);

    virtual ~model_meta_base() = default;

    const std::string& package_name() const { return package_name_; }
    const std::string& simple_name() const { return simple_name_; }
    const std::string& model_class_name() const { return model_class_name_; }
    bool top_level() const { return top_level_; }

    /// Entity kind used for records of this model. Defaults to simple_name().
    const std::string& kind() const { return kind_; }

    /// Attributes in declaration order. Elements have stable addresses.
    const std::deque<attribute_meta>& attribute_desc_list() const { return attributes_; }

    const attribute_meta* find_attribute(const std::string& name) const;

    /// Throws std::out_of_range if no attribute has that storage name.
    const attribute_meta& attribute_desc(const std::string& name) const;

    bool sealed() const { return sealed_; }

    /// Finalizes the attribute list. Later additions throw std::logic_error.
    void seal() { sealed_ = true; }

protected:
    void set_kind(std::string kind);
    size_t add_attribute_desc(attribute_meta desc);

private:
    std::string package_name_;
    std::string simple_name_;
    std::string model_class_name_;
    std::string kind_;
    bool top_level_ = true;
    bool sealed_ = false;
    std::deque<attribute_meta> attributes_;
};

namespace detail {
    template<typename T>
    struct member_pointer_traits;

    template<typename C, typename T>
    struct member_pointer_traits<T C::*> {
        using class_type = C;
        using member_type = T;
    };
} // namespace detail

// ============================================================================
// model_meta<M> - maps entities to models of type M and back
//
// Built from a declarative field table: each attribute() call binds one
// member to a storage name and fixes its converter at compile time.
// ============================================================================

template<typename M>
class model_meta : public model_meta_base {
public:
    using model_type = M;

    using model_meta_base::model_meta_base;

    /// Appends an attribute bound to Member. Storage defaults to the host
    /// type's natural storage kind (std::string for strings, short_blob for
    /// bytes); pass text, blob or a blob kind for serialized objects explicitly.
    template<auto Member,
             typename Storage = default_storage_t<typename detail::member_pointer_traits<decltype(Member)>::member_type>>
    model_meta& attribute(std::string name, std::string field_name = {}) {
        using traits = detail::member_pointer_traits<decltype(Member)>;
        using host_t = typename traits::member_type;
        using conv = converter<host_t, Storage>;
        static_assert(std::is_same_v<typename traits::class_type, M>,
                      "attribute member must belong to the model type");

        if (field_name.empty()) field_name = name;
        LOG_DEBUG("model_meta", "%s: attribute %s (%s)", model_class_name().c_str(),
                  name.c_str(), kind_name(storage_kind_v<Storage>));

        size_t index = add_attribute_desc(attribute_meta(
            std::move(name), std::move(field_name), storage_kind_v<Storage>,
            detail::is_optional<host_t>::value));

        bindings_.push_back(binding{
            index,
            [](M& model, const entity_value_t& value) {
                model.*Member = conv::to_host(value);
            },
            [](const M& model) -> entity_value_t {
                return conv::to_storage(model.*Member);
            }
        });
        return *this;
    }

    /// Overrides the entity kind. Only valid before seal().
    model_meta& with_kind(std::string kind) {
        set_kind(std::move(kind));
        return *this;
    }

    /// Entity -> new model. Fields not described by an attribute are ignored.
    M entity_to_model(const entity& e) const {
        M model{};
        const auto& attrs = attribute_desc_list();
        for (const auto& b : bindings_) {
            b.read(model, e.get_property(attrs[b.index].name()));
        }
        return model;
    }

    /// Model -> new entity of kind(), without an id.
    entity model_to_entity(const M& model) const {
        return model_to_entity(model, strata::key{kind(), 0});
    }

    entity model_to_entity(const M& model, strata::key k) const {
        entity e(std::move(k));
        const auto& attrs = attribute_desc_list();
        for (const auto& b : bindings_) {
            e.set_property(attrs[b.index].name(), b.write(model));
        }
        return e;
    }

private:
    struct binding {
        size_t index;
        std::function<void(M&, const entity_value_t&)> read;
        std::function<entity_value_t(const M&)> write;
    };

    std::vector<binding> bindings_;
};

// ============================================================================
// model_traits<M> - specialized per model type (see STRATA_MODEL)
// ============================================================================

template<typename M>
struct model_traits;

template<typename T>
concept Model = requires {
    { model_traits<T>::meta() } -> std::same_as<const model_meta<T>&>;
};

template<Model M>
const model_meta<M>& meta() {
    return model_traits<M>::meta();
}

} // namespace strata

// ============================================================================
// STRATA_MODEL Macro
//
// Usage:
//   struct Trip {
//       std::string name;
//       int32_t days = 0;
//       std::optional<std::set<int32_t>> tags;
//   };
//   STRATA_MODEL(Trip, name, days, tags);
//
// Every member uses its default storage kind and its own name as the storage
// field key. For other mappings specialize strata::model_traits by hand.
// ============================================================================

// FOR_EACH variadic macro helpers (recursive concatenation)
#define SFE_0(WHAT, cls)
#define SFE_1(WHAT, cls, X) WHAT(cls, X)
#define SFE_2(WHAT, cls, X, ...) WHAT(cls, X) SFE_1(WHAT, cls, __VA_ARGS__)
#define SFE_3(WHAT, cls, X, ...) WHAT(cls, X) SFE_2(WHAT, cls, __VA_ARGS__)
#define SFE_4(WHAT, cls, X, ...) WHAT(cls, X) SFE_3(WHAT, cls, __VA_ARGS__)
#define SFE_5(WHAT, cls, X, ...) WHAT(cls, X) SFE_4(WHAT, cls, __VA_ARGS__)
#define SFE_6(WHAT, cls, X, ...) WHAT(cls, X) SFE_5(WHAT, cls, __VA_ARGS__)
#define SFE_7(WHAT, cls, X, ...) WHAT(cls, X) SFE_6(WHAT, cls, __VA_ARGS__)
#define SFE_8(WHAT, cls, X, ...) WHAT(cls, X) SFE_7(WHAT, cls, __VA_ARGS__)
#define SFE_9(WHAT, cls, X, ...) WHAT(cls, X) SFE_8(WHAT, cls, __VA_ARGS__)
#define SFE_10(WHAT, cls, X, ...) WHAT(cls, X) SFE_9(WHAT, cls, __VA_ARGS__)
#define SFE_11(WHAT, cls, X, ...) WHAT(cls, X) SFE_10(WHAT, cls, __VA_ARGS__)
#define SFE_12(WHAT, cls, X, ...) WHAT(cls, X) SFE_11(WHAT, cls, __VA_ARGS__)
#define SFE_13(WHAT, cls, X, ...) WHAT(cls, X) SFE_12(WHAT, cls, __VA_ARGS__)
#define SFE_14(WHAT, cls, X, ...) WHAT(cls, X) SFE_13(WHAT, cls, __VA_ARGS__)
#define SFE_15(WHAT, cls, X, ...) WHAT(cls, X) SFE_14(WHAT, cls, __VA_ARGS__)
#define SFE_16(WHAT, cls, X, ...) WHAT(cls, X) SFE_15(WHAT, cls, __VA_ARGS__)

#define S_GET_MACRO(_0, _1, _2, _3, _4, _5, _6, _7, _8, _9, _10, _11, _12, _13, _14, _15, _16, NAME, ...) NAME

#define S_FOR_EACH(action, cls, ...) \
    S_GET_MACRO(_0, __VA_ARGS__, \
        SFE_16, SFE_15, SFE_14, SFE_13, SFE_12, SFE_11, SFE_10, SFE_9, \
        SFE_8, SFE_7, SFE_6, SFE_5, SFE_4, SFE_3, SFE_2, SFE_1, SFE_0)(action, cls, __VA_ARGS__)

#define STRATA_ATTRIBUTE(cls, prop) \
    built.attribute<&cls::prop>(#prop);

#define STRATA_MODEL(cls, ...) \
    template<> \
    struct strata::model_traits<cls> { \
        static const ::strata::model_meta<cls>& meta() { \
            static const ::strata::model_meta<cls> m = []() { \
                ::strata::model_meta<cls> built(#cls); \
                S_FOR_EACH(STRATA_ATTRIBUTE, cls, __VA_ARGS__) \
                built.seal(); \
                return built; \
            }(); \
            return m; \
        } \
    }

#endif // __cplusplus
