/// @file jsonpatch.hpp
/// @brief Umbrella header for the jsonpatch-cpp library.
///
/// Include this single header for access to all public types:
/// Value, Pointer, Operation, diff(), apply(), Error, and Result.
/// The nlohmann/json bridge lives in <jsonpatch-cpp/json.hpp>.

#pragma once

#include <jsonpatch-cpp/diff.hpp>
#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/operation.hpp>
#include <jsonpatch-cpp/patch.hpp>
#include <jsonpatch-cpp/pointer.hpp>
#include <jsonpatch-cpp/value.hpp>
