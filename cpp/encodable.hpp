#pragma once

#include <concepts>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "decodable.hpp"
#include "value.hpp"

// The way back from a typed value to a value tree. Types opt in with
//
//     static auto encode(const T& t) -> Value;
//
// and the containers below then encode them wherever they appear.
template<typename T>
struct Encoder
{
	static auto encode(const T& t) -> Value
		requires requires(const T& v) { { T::encode(v) } -> std::same_as<Value>; }
	{
		return T::encode(t);
	}
};

template<typename T>
concept Encodable = requires(const T& t)
{
	{ Encoder<T>::encode(t) } -> std::same_as<Value>;
};

template<>
struct Encoder<bool>
{
	static auto encode(bool b) -> Value
	{
		return b ? True() : False();
	}
};

template<>
struct Encoder<std::string>
{
	static auto encode(const std::string& s) -> Value
	{
		return string(s);
	}
};

template<Integer T>
struct Encoder<T>
{
	static auto encode(T n) -> Value
	{
		return number(n);
	}
};

template<std::floating_point T>
struct Encoder<T>
{
	static auto encode(T n) -> Value
	{
		return number(static_cast<double>(n));
	}
};

template<typename T>
struct Encoder<std::optional<T>>
{
	static auto encode(const std::optional<T>& t) -> Value
		requires Encodable<T>
	{
		if (not t) return null();
		return Encoder<T>::encode(*t);
	}
};

template<typename T>
struct Encoder<std::vector<T>>
{
	static auto encode(const std::vector<T>& ts) -> Value
		requires Encodable<T>
	{
		Array arr;
		arr.reserve(ts.size());
		for (const auto& t: ts) arr.push_back(Encoder<T>::encode(t));
		return Value{std::move(arr)};
	}
};

template<typename T>
struct Encoder<std::map<std::string, T>>
{
	static auto encode(const std::map<std::string, T>& ts) -> Value
		requires Encodable<T>
	{
		Object obj;
		obj.reserve(ts.size());
		for (const auto& [key, t]: ts) obj.emplace(key, Encoder<T>::encode(t));
		return Value{std::move(obj)};
	}
};

template<typename T>
struct Encoder<std::unordered_map<std::string, T>>
{
	static auto encode(const std::unordered_map<std::string, T>& ts) -> Value
		requires Encodable<T>
	{
		Object obj;
		obj.reserve(ts.size());
		for (const auto& [key, t]: ts) obj.emplace(key, Encoder<T>::encode(t));
		return Value{std::move(obj)};
	}
};

template<Encodable T>
auto to_value(const T& t) -> Value
{
	return Encoder<T>::encode(t);
}
