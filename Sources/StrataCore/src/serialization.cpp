#include "strata/serialization.hpp"

namespace strata {

bytes_t serializer::encode(const nlohmann::json& value) {
    return nlohmann::json::to_cbor(value);
}

nlohmann::json serializer::decode(const bytes_t& bytes) {
    return nlohmann::json::from_cbor(bytes);
}

} // namespace strata
