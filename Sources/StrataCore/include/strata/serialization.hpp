#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <nlohmann/json.hpp>

namespace strata {

// ============================================================================
// serializer - byte codec for objects stored in binary blobs
//
// Any type with nlohmann::json to_json/from_json (ADL or adl_serializer)
// can be stored. Bytes are CBOR.
// ============================================================================

class serializer {
public:
    static bytes_t encode(const nlohmann::json& value);

    /// Throws nlohmann::json::parse_error on malformed input.
    static nlohmann::json decode(const bytes_t& bytes);

    template<typename T>
    static bytes_t to_bytes(const T& value) {
        return encode(nlohmann::json(value));
    }

    template<typename T>
    static T from_bytes(const bytes_t& bytes) {
        return decode(bytes).template get<T>();
    }
};

} // namespace strata

// ============================================================================
// nlohmann::json ADL serialization for strata storage types, so that blob and
// text values nested inside serialized objects keep their kind.
// ============================================================================

namespace strata {

inline void to_json(nlohmann::json& j, const text& t) {
    j = t.value;
}

inline void from_json(const nlohmann::json& j, text& t) {
    if (j.is_string()) {
        t.value = j.get<std::string>();
    }
}

inline void to_json(nlohmann::json& j, const short_blob& b) {
    j = nlohmann::json::binary(b.bytes);
}

inline void from_json(const nlohmann::json& j, short_blob& b) {
    if (j.is_binary()) {
        b.bytes = j.get_binary();
    }
}

inline void to_json(nlohmann::json& j, const blob& b) {
    j = nlohmann::json::binary(b.bytes);
}

inline void from_json(const nlohmann::json& j, blob& b) {
    if (j.is_binary()) {
        b.bytes = j.get_binary();
    }
}

} // namespace strata

#endif // __cplusplus
