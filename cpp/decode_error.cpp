#include <sstream>
#include <stdexcept>
#include <utility>

#include "decode_error.hpp"
#include "matching.hpp"

auto type_mismatch(std::string expected, std::string actual) -> DecodeError
{
	return DecodeError{.kind=ErrorKind::TypeMismatch, .path={}, .expected=std::move(expected), .actual=std::move(actual), .causes={}};
}

auto missing_key(std::string key) -> DecodeError
{
	return DecodeError{.kind=ErrorKind::MissingKey, .path={Segment{std::move(key)}}, .expected="value", .actual="absent", .causes={}};
}

auto missing_index(std::size_t index) -> DecodeError
{
	return DecodeError{.kind=ErrorKind::MissingIndex, .path={Segment{index}}, .expected="value", .actual="absent", .causes={}};
}

auto wrong_container(std::string expected, std::string actual) -> DecodeError
{
	return DecodeError{.kind=ErrorKind::WrongContainer, .path={}, .expected=std::move(expected), .actual=std::move(actual), .causes={}};
}

auto custom(std::string message) -> DecodeError
{
	return DecodeError{.kind=ErrorKind::Custom, .path={}, .expected=std::move(message), .actual={}, .causes={}};
}

auto composite(std::vector<DecodeError> causes) -> DecodeError
{
	const auto count = causes.size();
	return DecodeError{
		.kind=ErrorKind::Composite,
		.path={},
		.expected="no errors",
		.actual=std::to_string(count) + " errors",
		.causes=std::move(causes)};
}

auto prefixed(DecodeError error, const Path& path) -> DecodeError
{
	if (path.empty()) return error;
	error.path.insert(std::begin(error.path), std::begin(path), std::end(path));
	for (auto& cause: error.causes)
	{
		cause = prefixed(std::move(cause), path);
	}
	return error;
}

auto prefixed(DecodeError error, const Segment& segment) -> DecodeError
{
	return prefixed(std::move(error), Path{segment});
}

auto merge(DecodeError first, DecodeError second) -> DecodeError
{
	std::vector<DecodeError> causes;
	for (auto* e: {&first, &second})
	{
		if (e->kind == ErrorKind::Composite)
		{
			for (auto& cause: e->causes) causes.push_back(std::move(cause));
		}
		else causes.push_back(std::move(*e));
	}
	return composite(std::move(causes));
}

auto format_path(const Path& path) -> std::string
{
	if (path.empty()) return "<root>";
	std::string buf;
	for (const auto& segment: path)
	{
		match(segment,
			[&](const std::string& key){
				if (not buf.empty()) buf += '.';
				buf += key;
			},
			[&](std::size_t index){
				buf += '[';
				buf += std::to_string(index);
				buf += ']';
			});
	}
	return buf;
}

auto to_string(const DecodeError& error) -> std::string
{
	std::ostringstream o;
	o << error;
	return o.str();
}

std::ostream& operator<<(std::ostream& o, ErrorKind kind)
{
	switch (kind)
	{
		case ErrorKind::TypeMismatch: return o << "TypeMismatch";
		case ErrorKind::MissingKey: return o << "MissingKey";
		case ErrorKind::MissingIndex: return o << "MissingIndex";
		case ErrorKind::WrongContainer: return o << "WrongContainer";
		case ErrorKind::Composite: return o << "Composite";
		case ErrorKind::Custom: return o << "Custom";
	}
	throw std::runtime_error("Invalid ErrorKind value");
}

std::ostream& operator<<(std::ostream& o, const Segment& segment)
{
	return match(segment,
		[&](const std::string& key) -> std::ostream& {
			return o << '"' << key << '"';
		},
		[&](std::size_t index) -> std::ostream& {
			return o << index;
		});
}

std::ostream& operator<<(std::ostream& o, const Path& path)
{
	return o << format_path(path);
}

void print_error(std::ostream& o, const DecodeError& error, std::size_t depth)
{
	o << std::string(depth * 2, ' ') << error.kind << " at " << error.path;
	switch (error.kind)
	{
		case ErrorKind::Custom:
			o << ": " << error.expected;
			break;
		case ErrorKind::Composite:
			o << ": " << error.actual;
			for (const auto& cause: error.causes)
			{
				o << '\n';
				print_error(o, cause, depth + 1);
			}
			break;
		default:
			o << ": expected " << error.expected << ", found " << error.actual;
	}
}

std::ostream& operator<<(std::ostream& o, const DecodeError& error)
{
	print_error(o, error, 0);
	return o;
}
