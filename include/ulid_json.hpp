#pragma once
#include <nlohmann/json.hpp>
#include "ulid.hpp"
#include "verifier.hpp"

// nlohmann/json bindings, found by ADL.
namespace ulidkit {

inline void to_json(nlohmann::json& j, const ULID& id) {
    j = id.str();
}

// json::type_error for non-strings, UlidError for strings that do not decode.
inline void from_json(const nlohmann::json& j, ULID& id) {
    id = ULID::decode(j.get<std::string>());
}

inline void to_json(nlohmann::json& j, const ValidateReport& r) {
    j = nlohmann::json {
        {"valid",   r.valid},
        {"total",   r.total},
        {"skipped", r.skipped},
        {"passed",  r.passed()}
    };
}

} // namespace ulidkit
