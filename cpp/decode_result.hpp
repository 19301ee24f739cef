#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "decode_error.hpp"
#include "matching.hpp"

template<typename T>
struct Ok
{
	T payload;

	bool operator==(const Ok&) const = default;
};

struct Err
{
	DecodeError payload;

	bool operator==(const Err&) const = default;
};

// Outcome of every decoding step: the decoded value or the error that stopped it.
template<typename T>
using Result = std::variant<Ok<T>, Err>;

template<typename T>
Result<T> ok(T val)
{
	return Ok<T>{std::move(val)};
}
template<typename T>
Result<T> err(DecodeError e)
{
	return Err{std::move(e)};
}

template<typename T>
bool succeeded(const Result<T>& r)
{
	return std::holds_alternative<Ok<T>>(r);
}
template<typename T>
bool failed(const Result<T>& r)
{
	return std::holds_alternative<Err>(r);
}

// Precondition: failed(r).
template<typename T>
const DecodeError& error_of(const Result<T>& r)
{
	return std::get<Err>(r).payload;
}

// Precondition: succeeded(r).
template<typename T>
const T& value_of(const Result<T>& r)
{
	return std::get<Ok<T>>(r).payload;
}

// Qualifies a failure with the path it was found under; successes pass through.
template<typename T>
Result<T> prefix_error(Result<T> r, const Path& path)
{
	if (auto* e = std::get_if<Err>(&r)) e->payload = prefixed(std::move(e->payload), path);
	return r;
}

template<typename T, typename F>
auto map_result(Result<T> r, F&& f) -> Result<std::invoke_result_t<F, T>>
{
	using U = std::invoke_result_t<F, T>;
	return match(std::move(r),
		[&](T&& value){
			return Result<U>{Ok<U>{std::invoke(std::forward<F>(f), std::move(value))}};
		},
		[](DecodeError&& e){
			return err<U>(std::move(e));
		});
}

// Applies a decoded function to a decoded argument. When both sides failed the
// function side wins, so a chain of applications reports its leftmost failure.
template<typename F, typename T>
auto apply(Result<F> rf, Result<T> r) -> Result<std::invoke_result_t<F, T>>
{
	using U = std::invoke_result_t<F, T>;
	return match(std::move(rf),
		[&](F&& f){
			return map_result(std::move(r), std::move(f));
		},
		[](DecodeError&& e){
			return err<U>(std::move(e));
		});
}

template<typename T, typename F>
auto flat_map(Result<T> r, F&& f) -> std::invoke_result_t<F, T>
{
	using R = std::invoke_result_t<F, T>;
	return match(std::move(r),
		[&](T&& value){
			return R{std::invoke(std::forward<F>(f), std::move(value))};
		},
		[](DecodeError&& e){
			return R{Err{std::move(e)}};
		});
}

template<typename T>
T value_or(Result<T> r, T fallback)
{
	return match(std::move(r),
		[](T&& value){
			return std::move(value);
		},
		[&](DecodeError&&){
			return std::move(fallback);
		});
}

template<typename T>
std::optional<T> to_optional(Result<T> r)
{
	return match(std::move(r),
		[](T&& value){
			return std::optional<T>{std::move(value)};
		},
		[](DecodeError&&){
			return std::optional<T>{};
		});
}

// Keeps a success; otherwise the result of f(), error included.
template<typename T, typename F>
Result<T> or_else(Result<T> r, F&& f)
{
	if (succeeded(r)) return r;
	return std::invoke(std::forward<F>(f));
}

template<typename T>
Result<std::vector<T>> sequence(std::vector<Result<T>> rs)
{
	std::vector<T> buf;
	buf.reserve(rs.size());
	for (std::size_t i = 0; i < rs.size(); ++i)
	{
		if (failed(rs[i]))
		{
			return err<std::vector<T>>(prefixed(std::get<Err>(std::move(rs[i])).payload, Segment{i}));
		}
		buf.push_back(std::get<Ok<T>>(std::move(rs[i])).payload);
	}
	return ok(std::move(buf));
}
