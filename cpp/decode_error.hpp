#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// One step into a value tree: an object key or an array index.
using Segment = std::variant<std::string, std::size_t>;
using Path = std::vector<Segment>;

enum class ErrorKind
{
	TypeMismatch,
	MissingKey,
	MissingIndex,
	WrongContainer,
	Composite,
	Custom,
};

struct DecodeError
{
	ErrorKind kind;
	Path path;
	std::string expected;
	std::string actual;
	// Only filled for Composite; every cause carries its own path from the root.
	std::vector<DecodeError> causes;

	bool operator==(const DecodeError&) const = default;
};

auto type_mismatch(std::string expected, std::string actual) -> DecodeError;
auto missing_key(std::string key) -> DecodeError;
auto missing_index(std::size_t index) -> DecodeError;
auto wrong_container(std::string expected, std::string actual) -> DecodeError;
auto custom(std::string message) -> DecodeError;
auto composite(std::vector<DecodeError> causes) -> DecodeError;

auto prefixed(DecodeError error, const Segment& segment) -> DecodeError;
auto prefixed(DecodeError error, const Path& path) -> DecodeError;

// Composite of both errors. Causes of composite operands are spliced in, so
// merging never nests composites.
auto merge(DecodeError first, DecodeError second) -> DecodeError;

// "comments[1].text", or "<root>" for the empty path.
auto format_path(const Path& path) -> std::string;
auto to_string(const DecodeError& error) -> std::string;

std::ostream& operator<<(std::ostream& o, ErrorKind kind);
std::ostream& operator<<(std::ostream& o, const Segment& segment);
std::ostream& operator<<(std::ostream& o, const Path& path);
std::ostream& operator<<(std::ostream& o, const DecodeError& error);
