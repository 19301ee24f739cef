#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "decodable.hpp"
#include "decode_error.hpp"
#include "decode_result.hpp"
#include "traversal.hpp"
#include "value.hpp"

// combine and combine_all take between one and this many results.
inline constexpr std::size_t max_combine_arity = 10;

template<std::size_t N>
concept SupportedArity = N >= 1 and N <= max_combine_arity;

// Calls f with every decoded value, in order. Fail-fast: when several results
// failed, the error of the leftmost one is returned and the others are dropped.
template<typename F, typename ...Ts>
	requires SupportedArity<sizeof...(Ts)>
auto combine(F&& f, Result<Ts>... rs) -> Result<std::invoke_result_t<F, Ts...>>
{
	using U = std::invoke_result_t<F, Ts...>;
	std::optional<DecodeError> error;
	auto keep_first = [&](const auto& r){
		if (not error and failed(r)) error = error_of(r);
	};
	(keep_first(rs), ...);
	if (error) return err<U>(std::move(*error));
	return ok(std::invoke(std::forward<F>(f), std::move(std::get<Ok<Ts>>(rs).payload)...));
}

// Like combine, but every failure is kept. One failure comes back unchanged;
// more are merged into a Composite error, in argument order.
template<typename F, typename ...Ts>
	requires SupportedArity<sizeof...(Ts)>
auto combine_all(F&& f, Result<Ts>... rs) -> Result<std::invoke_result_t<F, Ts...>>
{
	using U = std::invoke_result_t<F, Ts...>;
	std::optional<DecodeError> error;
	auto collect = [&](const auto& r){
		if (not failed(r)) return;
		if (error) error = merge(std::move(*error), error_of(r));
		else error = error_of(r);
	};
	(collect(rs), ...);
	if (error) return err<U>(std::move(*error));
	return ok(std::invoke(std::forward<F>(f), std::move(std::get<Ok<Ts>>(rs).payload)...));
}

// lift(f)(r1, ..., rN) == combine(f, r1, ..., rN)
template<typename F>
auto lift(F f)
{
	return [f = std::move(f)]<typename ...Ts>(Result<Ts>... rs){
		return combine(f, std::move(rs)...);
	};
}

// Builds an aggregate T from its members in declaration order.
template<typename T>
inline constexpr auto construct = []<typename ...Args>(Args&&... args){
	return T{std::forward<Args>(args)...};
};

template<typename T>
Result<T> pure(T value)
{
	return ok(std::move(value));
}

template<typename T>
Result<T> fail(std::string message)
{
	return err<T>(custom(std::move(message)));
}

template<Decodable T>
auto decoder_for()
{
	return [](const Value& value){
		return Decoder<T>::decode(value);
	};
}

// key is a key name, an array index or a Path. Errors raised while decoding
// the target are reported under that key.
template<Decodable T, typename K>
auto required_field(const Value& object, const K& key) -> Result<T>
{
	return flat_map(at(object, key), [&](const Value& value){
		return prefix_error(Decoder<T>::decode(value), to_path(key));
	});
}

// A missing or null target is an empty optional. A target of the wrong type
// is still an error.
template<Decodable T, typename K>
auto optional_field(const Value& object, const K& key) -> Result<std::optional<T>>
{
	return flat_map(find(object, key), [&](std::optional<ValueRef>&& found){
		if (not found) return ok(std::optional<T>{});
		auto r = map_result(Decoder<T>::decode(found->get()), [](T&& t){
			return std::optional<T>{std::move(t)};
		});
		return prefix_error(std::move(r), to_path(key));
	});
}

template<Decodable T, typename K>
auto array_field(const Value& object, const K& key) -> Result<std::vector<T>>
{
	return required_field<std::vector<T>>(object, key);
}

template<Decodable T, typename K>
auto optional_array_field(const Value& object, const K& key) -> Result<std::optional<std::vector<T>>>
{
	return optional_field<std::vector<T>>(object, key);
}

template<Decodable T, typename K>
auto dictionary_field(const Value& object, const K& key) -> Result<std::map<std::string, T>>
{
	return required_field<std::map<std::string, T>>(object, key);
}

template<Decodable T, typename K>
auto optional_dictionary_field(const Value& object, const K& key) -> Result<std::optional<std::map<std::string, T>>>
{
	return optional_field<std::map<std::string, T>>(object, key);
}

// A decoder that tries first, then second. It fails only when both do, with
// the error of second.
template<typename First, typename Second>
auto fallback(First first, Second second)
{
	return [first = std::move(first), second = std::move(second)](const Value& value){
		return or_else(std::invoke(first, value), [&]{
			return std::invoke(second, value);
		});
	};
}
