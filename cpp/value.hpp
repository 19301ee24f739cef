#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "decode_result.hpp"

struct Null
{
	bool operator==(const Null&) const = default;
};

// Whole numbers are held as long. Only values above the range of long use
// unsigned long, so every number has one representation.
struct Number
{
	using t = std::variant<long, unsigned long, double>;

	bool operator==(const Number&) const = default;

	t value;
};

struct Value;

using Array = std::vector<Value>;
using Object = std::unordered_map<std::string, Value>;

struct NonCopyable
{
	constexpr NonCopyable() noexcept = default;
	NonCopyable(const NonCopyable&) = delete;
	constexpr NonCopyable(NonCopyable&&) noexcept = default;

	NonCopyable& operator=(NonCopyable&&) = default;
	NonCopyable& operator=(const NonCopyable&) = delete;
};

// A parsed JSON document. Built once by whoever owns it, then only read.
struct Value
{
	using t = std::variant<Null, bool, Number, std::string, Array, Object>;

	bool operator==(const Value& other) const {return value == other.value;};

	t value;
	[[no_unique_address]] NonCopyable _n = {};
};

static_assert(std::is_nothrow_move_constructible_v<Value>);
static_assert(std::is_aggregate_v<Value>);
static_assert(not std::is_copy_constructible_v<Value>);

using ValueRef = std::reference_wrapper<const Value>;

enum class Kind
{
	Null,
	Bool,
	Number,
	String,
	Array,
	Object,
};

auto kind_of(const Value& value) -> Kind;
auto kind_name(Kind kind) -> std::string_view;

inline bool is_null(const Value& value)
{
	return std::holds_alternative<Null>(value.value);
}

inline Value null()
{
	return Value{Null{}};
}

inline Value True()
{
	return Value{true};
}

inline Value False()
{
	return Value{false};
}

template<typename T>
concept Integer = std::integral<T>
	and not std::same_as<T, bool>
	and not std::same_as<T, char>
	and not std::same_as<T, wchar_t>
	and not std::same_as<T, char8_t>
	and not std::same_as<T, char16_t>
	and not std::same_as<T, char32_t>;

template<Integer T>
Value number(T n)
{
	if constexpr (std::unsigned_integral<T>)
	{
		if (not std::in_range<long>(n)) return Value{Number{static_cast<unsigned long>(n)}};
	}
	return Value{Number{static_cast<long>(n)}};
}

inline Value number(double n)
{
	return Value{Number{n}};
}

inline Value string(std::string s)
{
	return Value{std::move(s)};
}

template <typename ...Values>
Value make_array(Values&&... values)
{
	Array arr;
	arr.reserve(sizeof...(values));
	(arr.push_back(std::forward<Values>(values)), ...);
	return Value{std::move(arr)};
}

inline std::pair<std::string, Value> field(std::string key, Value value)
{
	return {std::move(key), std::move(value)};
}

template <typename ...Fields>
Value make_object(Fields&&... fields)
{
	Object obj;
	obj.reserve(sizeof...(fields));
	(obj.insert_or_assign(std::forward<Fields>(fields).first, std::forward<Fields>(fields).second), ...);
	return Value{std::move(obj)};
}

// Views of a value as one concrete variant. A different variant yields a
// TypeMismatch with an empty path; callers prefix it with where they looked.
auto as_bool(const Value& value) -> Result<bool>;
auto as_number(const Value& value) -> Result<Number>;
auto as_string(const Value& value) -> Result<std::reference_wrapper<const std::string>>;
auto as_array(const Value& value) -> Result<std::reference_wrapper<const Array>>;
auto as_object(const Value& value) -> Result<std::reference_wrapper<const Object>>;

std::ostream& operator<<(std::ostream& o, const Number& num);
std::ostream& operator<<(std::ostream& o, const Value& value);
std::ostream& operator<<(std::ostream& o, Kind kind);
