#pragma once

#include <algorithm>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "decode_error.hpp"
#include "decode_result.hpp"
#include "traversal.hpp"
#include "value.hpp"

// How a T is read out of a value. Types opt in with a static member
//
//     static auto decode(const Value& value) -> Result<T>;
//
// or by specialising Decoder<T> directly.
template<typename T>
struct Decoder
{
	static auto decode(const Value& value) -> Result<T>
		requires requires(const Value& v) { { T::decode(v) } -> std::same_as<Result<T>>; }
	{
		return T::decode(value);
	}
};

template<typename T>
concept Decodable = requires(const Value& value)
{
	{ Decoder<T>::decode(value) } -> std::same_as<Result<T>>;
};

// Whole numbers only: 2.0 is accepted, 2.5 is a TypeMismatch. A whole double
// comes back as long or unsigned long when one of them can hold it, and is
// left a double otherwise.
auto decode_integer(const Value& value) -> Result<Number>;
auto decode_real(const Value& value) -> Result<double>;
auto out_of_range(std::string expected, const Number& num) -> DecodeError;

template<Integer T>
std::string integer_name()
{
	return (std::is_signed_v<T> ? "int" : "uint") + std::to_string(sizeof(T) * 8);
}

template<std::floating_point T>
std::string floating_name()
{
	return "float" + std::to_string(sizeof(T) * 8);
}

template<>
struct Decoder<bool>
{
	static auto decode(const Value& value) -> Result<bool>;
};

template<>
struct Decoder<std::string>
{
	static auto decode(const Value& value) -> Result<std::string>;
};

template<Integer T>
struct Decoder<T>
{
	static auto decode(const Value& value) -> Result<T>
	{
		return flat_map(decode_integer(value), [](Number&& num){
			return match(num.value,
				[&]<Integer N>(N n){
					if (std::in_range<T>(n)) return ok(static_cast<T>(n));
					return err<T>(out_of_range(integer_name<T>(), num));
				},
				[&](double){
					return err<T>(out_of_range(integer_name<T>(), num));
				});
		});
	}
};

template<std::floating_point T>
struct Decoder<T>
{
	static auto decode(const Value& value) -> Result<T>
	{
		return flat_map(decode_real(value), [](double n){
			if (std::isfinite(n) and std::abs(n) > std::numeric_limits<T>::max())
			{
				return err<T>(out_of_range(floating_name<T>(), Number{n}));
			}
			return ok(static_cast<T>(n));
		});
	}
};

template<typename T>
struct Decoder<std::optional<T>>
{
	static auto decode(const Value& value) -> Result<std::optional<T>>
		requires Decodable<T>
	{
		if (is_null(value)) return ok(std::optional<T>{});
		return map_result(Decoder<T>::decode(value), [](T&& t){
			return std::optional<T>{std::move(t)};
		});
	}
};

// Elements are decoded in order; the first failure stops the decode and is
// reported under its index.
template<typename T>
struct Decoder<std::vector<T>>
{
	static auto decode(const Value& value) -> Result<std::vector<T>>
		requires Decodable<T>
	{
		return flat_map(as_array(value), [](const Array& arr){
			std::vector<T> buf;
			buf.reserve(arr.size());
			for (std::size_t i = 0; i < arr.size(); ++i)
			{
				auto r = Decoder<T>::decode(arr[i]);
				if (auto* e = std::get_if<Err>(&r))
				{
					return err<std::vector<T>>(prefixed(std::move(e->payload), Segment{i}));
				}
				buf.push_back(std::get<Ok<T>>(std::move(r)).payload);
			}
			return ok(std::move(buf));
		});
	}
};

// Entries in key order, so which failure gets reported does not depend on
// hashing. The first failure is reported under its key.
template<Decodable T>
auto decode_entries(const Value& value) -> Result<std::vector<std::pair<std::string, T>>>
{
	using Entries = std::vector<std::pair<std::string, T>>;
	return flat_map(as_object(value), [](const Object& obj){
		std::vector<const Object::value_type*> sorted;
		sorted.reserve(obj.size());
		for (const auto& entry: obj) sorted.push_back(&entry);
		std::sort(std::begin(sorted), std::end(sorted), [](auto* a, auto* b){ return a->first < b->first; });

		Entries buf;
		buf.reserve(sorted.size());
		for (const auto* entry: sorted)
		{
			auto r = Decoder<T>::decode(entry->second);
			if (auto* e = std::get_if<Err>(&r))
			{
				return err<Entries>(prefixed(std::move(e->payload), Segment{entry->first}));
			}
			buf.emplace_back(entry->first, std::get<Ok<T>>(std::move(r)).payload);
		}
		return ok(std::move(buf));
	});
}

template<typename T>
struct Decoder<std::map<std::string, T>>
{
	static auto decode(const Value& value) -> Result<std::map<std::string, T>>
		requires Decodable<T>
	{
		return map_result(decode_entries<T>(value), [](std::vector<std::pair<std::string, T>>&& entries){
			std::map<std::string, T> buf;
			for (auto& [key, t]: entries) buf.emplace(std::move(key), std::move(t));
			return buf;
		});
	}
};

template<typename T>
struct Decoder<std::unordered_map<std::string, T>>
{
	static auto decode(const Value& value) -> Result<std::unordered_map<std::string, T>>
		requires Decodable<T>
	{
		return map_result(decode_entries<T>(value), [](std::vector<std::pair<std::string, T>>&& entries){
			std::unordered_map<std::string, T> buf;
			buf.reserve(entries.size());
			for (auto& [key, t]: entries) buf.emplace(std::move(key), std::move(t));
			return buf;
		});
	}
};

template<Decodable T>
auto decode(const Value& value) -> Result<T>
{
	return Decoder<T>::decode(value);
}

template<Decodable T>
auto decode(const Value& value, const Path& path) -> Result<T>
{
	return flat_map(at(value, path), [&](const Value& v){
		return prefix_error(Decoder<T>::decode(v), path);
	});
}
