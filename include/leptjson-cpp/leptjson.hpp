/// @file leptjson.hpp
/// @brief Umbrella header for the leptjson-cpp library.
///
/// Include this single header for access to all public types:
/// Value, parse, stringify, Pointer, Operation, merge patch, and Error.
/// The nlohmann/json bridge lives separately in interop.hpp.

#pragma once

#include <leptjson-cpp/error.hpp>
#include <leptjson-cpp/merge_patch.hpp>
#include <leptjson-cpp/parse.hpp>
#include <leptjson-cpp/patch.hpp>
#include <leptjson-cpp/pointer.hpp>
#include <leptjson-cpp/serialize.hpp>
#include <leptjson-cpp/value.hpp>
