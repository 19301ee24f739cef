#pragma once

#include <utility>
#include <variant>

template<typename ...Fs>
struct overloaded : Fs...
{
	using Fs::operator()...;
};
template<typename ...Fs> overloaded(Fs...) -> overloaded<Fs...>;

// Alternatives that only wrap a payload (Ok<T>, Err) are matched on the
// payload itself.
template<typename T>
concept Wrapper = requires(T w) { w.payload; };

template<typename ...Ts, typename ...Fs>
decltype(auto) match(std::variant<Ts...>&& v, Fs&&... f)
{
	auto overload = overloaded{std::forward<Fs>(f)...};
	auto unwrap = [&]<Wrapper W>(W&& w){return overload(std::move(w.payload));};
	return std::visit(overloaded{unwrap, std::move(overload)}, std::move(v));
}
template<typename ...Ts, typename ...Fs>
decltype(auto) match(const std::variant<Ts...>& v, Fs&&... f)
{
	auto overload = overloaded{std::forward<Fs>(f)...};
	auto unwrap = [&]<Wrapper W>(const W& w){return overload(w.payload);};
	return std::visit(overloaded{unwrap, std::move(overload)}, v);
}
