/// @file json.hpp
/// @brief nlohmann/json interoperability for backtrack-cpp.
///
/// Provides ADL serialization (to_json/from_json) for marks, errors and
/// cursors, and a snapshot export of a recorded history for inspection.

#pragma once

#include <backtrack-cpp/cursor.hpp>
#include <backtrack-cpp/error.hpp>
#include <backtrack-cpp/history.hpp>
#include <backtrack-cpp/mark.hpp>
#include <backtrack-cpp/recorder.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <utility>

namespace backtrack_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

// A Mark serializes as its bare position.
void to_json(nlohmann::json& j, const Mark& m);
void from_json(const nlohmann::json& j, Mark& m);

void to_json(nlohmann::json& j, ErrorKind kind);
void from_json(const nlohmann::json& j, ErrorKind& kind);

void to_json(nlohmann::json& j, const Error& e);

/// {"mode": "copying" | "referencing", "position": n, "attached": bool}
template <typename T, typename Mode>
void to_json(nlohmann::json& j, const BasicCursor<T, Mode>& cursor) {
    j = nlohmann::json{
        {"mode", std::string{Mode::name}},
        {"position", cursor.get_ref_point()},
        {"attached", cursor.history() != nullptr},
    };
}

// =============================================================================
// History export
// =============================================================================

/// Export a snapshot of a history as a nlohmann::json value.
///
/// @code
/// {"size": 3, "exhausted": true, "pulls": 4, "items": [10, 20, 30]}
/// @endcode
///
/// T must itself be convertible to nlohmann::json. Items recorded while
/// the export runs on another thread may or may not be included; the
/// export never calls the source.
template <typename T>
auto export_history(const History<T>& history) -> nlohmann::json {
    auto exhausted = history.exhausted();
    auto pulls = history.pulls();
    auto size = history.size();

    auto items = nlohmann::json::array();
    for (std::size_t i = 0; i < size; ++i) {
        items.push_back(history.at(i));
    }
    return nlohmann::json{
        {"size", size},
        {"exhausted", exhausted},
        {"pulls", pulls},
        {"items", std::move(items)},
    };
}

/// Export the history behind a recorder.
template <typename T>
auto export_history(const Recorder<T>& recorder) -> nlohmann::json {
    return export_history(*recorder.history());
}

}  // namespace backtrack_cpp
