/// @file backtrack.hpp
/// @brief Umbrella header for the backtrack-cpp library.
///
/// Include this single header for access to all public types:
/// Recorder, History, CopyingCursor, ReferencingCursor, Walkback,
/// SliceCursor, Mark, Source, and Error. The nlohmann/json bindings
/// live in json.hpp and are not included here.

#pragma once

#include <backtrack-cpp/cursor.hpp>
#include <backtrack-cpp/error.hpp>
#include <backtrack-cpp/history.hpp>
#include <backtrack-cpp/mark.hpp>
#include <backtrack-cpp/mode.hpp>
#include <backtrack-cpp/recorder.hpp>
#include <backtrack-cpp/slice_cursor.hpp>
#include <backtrack-cpp/source.hpp>
#include <backtrack-cpp/walkback.hpp>
