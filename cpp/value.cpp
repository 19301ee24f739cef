#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "value.hpp"
#include "matching.hpp"

auto kind_of(const Value& value) -> Kind
{
	return match(value.value,
		[](const Null&){ return Kind::Null; },
		[](bool){ return Kind::Bool; },
		[](const Number&){ return Kind::Number; },
		[](const std::string&){ return Kind::String; },
		[](const Array&){ return Kind::Array; },
		[](const Object&){ return Kind::Object; });
}

auto kind_name(Kind kind) -> std::string_view
{
	switch (kind)
	{
		case Kind::Null: return "null";
		case Kind::Bool: return "bool";
		case Kind::Number: return "number";
		case Kind::String: return "string";
		case Kind::Array: return "array";
		case Kind::Object: return "object";
	}
	throw std::runtime_error("Invalid Kind value");
}

DecodeError mismatch(Kind expected, const Value& found)
{
	return type_mismatch(std::string(kind_name(expected)), std::string(kind_name(kind_of(found))));
}

auto as_bool(const Value& value) -> Result<bool>
{
	if (const auto* b = std::get_if<bool>(&value.value)) return ok(*b);
	return err<bool>(mismatch(Kind::Bool, value));
}

auto as_number(const Value& value) -> Result<Number>
{
	if (const auto* n = std::get_if<Number>(&value.value)) return ok(*n);
	return err<Number>(mismatch(Kind::Number, value));
}

auto as_string(const Value& value) -> Result<std::reference_wrapper<const std::string>>
{
	using R = std::reference_wrapper<const std::string>;
	if (const auto* s = std::get_if<std::string>(&value.value)) return ok(R{*s});
	return err<R>(mismatch(Kind::String, value));
}

auto as_array(const Value& value) -> Result<std::reference_wrapper<const Array>>
{
	using R = std::reference_wrapper<const Array>;
	if (const auto* arr = std::get_if<Array>(&value.value)) return ok(R{*arr});
	return err<R>(mismatch(Kind::Array, value));
}

auto as_object(const Value& value) -> Result<std::reference_wrapper<const Object>>
{
	using R = std::reference_wrapper<const Object>;
	if (const auto* obj = std::get_if<Object>(&value.value)) return ok(R{*obj});
	return err<R>(mismatch(Kind::Object, value));
}

// Short forms where JSON has one, \u00XX for the remaining control characters.
auto escape(std::string_view str) -> std::string
{
	constexpr std::string_view hex = "0123456789abcdef";
	std::string buf;
	buf.reserve(str.size());
	for (const unsigned char ch: str)
	{
		switch (ch)
		{
			case '"': buf += "\\\""; continue;
			case '\\': buf += "\\\\"; continue;
			case '\b': buf += "\\b"; continue;
			case '\f': buf += "\\f"; continue;
			case '\n': buf += "\\n"; continue;
			case '\r': buf += "\\r"; continue;
			case '\t': buf += "\\t"; continue;
		}
		if (ch < 0x20)
		{
			buf += "\\u00";
			buf += hex[ch >> 4];
			buf += hex[ch & 0xf];
		}
		else
		{
			buf += static_cast<char>(ch);
		}
	}
	return buf;
}

std::ostream& operator<<(std::ostream& o, Null)
{
	return o << "null";
}

std::ostream& operator<<(std::ostream& o, const Number& num)
{
	return match(num.value,
		[&](auto n) -> std::ostream& {
			return o << n;
		});
}

std::ostream& operator<<(std::ostream& o, const Array& arr)
{
	o << '[';
	for (auto it = std::begin(arr); it != std::end(arr); ++it)
	{
		if (it != std::begin(arr)) o << ", ";
		o << *it;
	}
	o << ']';
	return o;
}

std::ostream& operator<<(std::ostream& o, const Object& obj)
{
	o << '{';
	for (auto it = std::begin(obj); it != std::end(obj); ++it)
	{
		auto& [key, value] = *it;
		if (it != std::begin(obj)) o << ", ";
		o << '"' << escape(key) << "\": " << value;
	}
	o << '}';
	return o;
}

std::ostream& operator<<(std::ostream& o, const Value& value)
{
	return match(value.value,
		[&](const std::string& str) -> std::ostream& {
			return o << '"' << escape(str) << '"';
		},
		[&](bool b) -> std::ostream& {
			return o << (b ? "true" : "false");
		},
		[&](const auto& v) -> std::ostream& {
			return o << v;
		});
}

std::ostream& operator<<(std::ostream& o, Kind kind)
{
	return o << kind_name(kind);
}
