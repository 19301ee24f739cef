#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

#include "decode_error.hpp"
#include "decode_result.hpp"
#include "value.hpp"

// Required lookups. A missing key or index fails with MissingKey/MissingIndex
// at that segment; a parent of the wrong kind fails with WrongContainer at the
// parent. Errors along a path carry every segment walked before the failure.
auto at(const Value& parent, std::string_view key) -> Result<ValueRef>;
auto at(const Value& parent, std::size_t index) -> Result<ValueRef>;
auto at(const Value& parent, const Path& path) -> Result<ValueRef>;

// Optional lookups. Absence and null both come back as an empty optional, and
// so does a null met halfway along a path. A parent of the wrong kind is still
// a failure.
auto find(const Value& parent, std::string_view key) -> Result<std::optional<ValueRef>>;
auto find(const Value& parent, std::size_t index) -> Result<std::optional<ValueRef>>;
auto find(const Value& parent, const Path& path) -> Result<std::optional<ValueRef>>;

// "a.b.c" -> {"a", "b", "c"}
auto dotted(std::string_view keys) -> Path;

auto to_path(std::string_view key) -> Path;
auto to_path(std::size_t index) -> Path;
auto to_path(const Path& path) -> Path;
