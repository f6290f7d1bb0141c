#include <backtrack-cpp/json.hpp>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace backtrack_cpp {

void to_json(nlohmann::json& j, const Mark& m) {
    j = m.position;
}

void from_json(const nlohmann::json& j, Mark& m) {
    if (!j.is_number_integer() || (!j.is_number_unsigned() && j.get<std::int64_t>() < 0)) {
        throw std::runtime_error{"mark must be a non-negative integer"};
    }
    m.position = j.get<std::size_t>();
}

void to_json(nlohmann::json& j, ErrorKind kind) {
    j = std::string{to_string_view(kind)};
}

void from_json(const nlohmann::json& j, ErrorKind& kind) {
    const auto& name = j.get_ref<const std::string&>();
    for (auto candidate : {ErrorKind::out_of_range, ErrorKind::invalid_operation}) {
        if (name == to_string_view(candidate)) {
            kind = candidate;
            return;
        }
    }
    throw std::runtime_error{"unknown error kind: " + name};
}

void to_json(nlohmann::json& j, const Error& e) {
    j = nlohmann::json{{"kind", e.kind}, {"message", e.message}};
}

}  // namespace backtrack_cpp
