#include <string>
#include <utility>
#include <variant>

#include "traversal.hpp"
#include "matching.hpp"

using Found = std::optional<ValueRef>;

DecodeError not_a_container(Kind expected, const Value& found)
{
	return wrong_container(std::string(kind_name(expected)), std::string(kind_name(kind_of(found))));
}

auto at(const Value& parent, std::string_view key) -> Result<ValueRef>
{
	const auto* obj = std::get_if<Object>(&parent.value);
	if (not obj) return err<ValueRef>(not_a_container(Kind::Object, parent));
	const auto it = obj->find(std::string(key));
	if (it == obj->end()) return err<ValueRef>(missing_key(std::string(key)));
	return ok(ValueRef{it->second});
}

auto at(const Value& parent, std::size_t index) -> Result<ValueRef>
{
	const auto* arr = std::get_if<Array>(&parent.value);
	if (not arr) return err<ValueRef>(not_a_container(Kind::Array, parent));
	if (index >= arr->size()) return err<ValueRef>(missing_index(index));
	return ok(ValueRef{(*arr)[index]});
}

auto at(const Value& parent, const Segment& segment) -> Result<ValueRef>
{
	return match(segment,
		[&](const std::string& key){
			return at(parent, std::string_view{key});
		},
		[&](std::size_t index){
			return at(parent, index);
		});
}

auto at(const Value& parent, const Path& path) -> Result<ValueRef>
{
	ValueRef current{parent};
	for (std::size_t i = 0; i < path.size(); ++i)
	{
		auto r = at(current.get(), path[i]);
		if (failed(r)) return prefix_error(std::move(r), Path(std::begin(path), std::begin(path) + i));
		current = value_of(r);
	}
	return ok(current);
}

auto find(const Value& parent, std::string_view key) -> Result<Found>
{
	const auto* obj = std::get_if<Object>(&parent.value);
	if (not obj) return err<Found>(not_a_container(Kind::Object, parent));
	const auto it = obj->find(std::string(key));
	if (it == obj->end() or is_null(it->second)) return ok(Found{});
	return ok(Found{ValueRef{it->second}});
}

auto find(const Value& parent, std::size_t index) -> Result<Found>
{
	const auto* arr = std::get_if<Array>(&parent.value);
	if (not arr) return err<Found>(not_a_container(Kind::Array, parent));
	if (index >= arr->size() or is_null((*arr)[index])) return ok(Found{});
	return ok(Found{ValueRef{(*arr)[index]}});
}

auto find(const Value& parent, const Segment& segment) -> Result<Found>
{
	return match(segment,
		[&](const std::string& key){
			return find(parent, std::string_view{key});
		},
		[&](std::size_t index){
			return find(parent, index);
		});
}

auto find(const Value& parent, const Path& path) -> Result<Found>
{
	ValueRef current{parent};
	for (std::size_t i = 0; i < path.size(); ++i)
	{
		auto r = find(current.get(), path[i]);
		if (failed(r)) return prefix_error(std::move(r), Path(std::begin(path), std::begin(path) + i));
		const auto& found = value_of(r);
		if (not found) return ok(Found{});
		current = *found;
	}
	if (is_null(current.get())) return ok(Found{});
	return ok(Found{current});
}

auto dotted(std::string_view keys) -> Path
{
	Path path;
	std::size_t start = 0;
	while (true)
	{
		const auto dot = keys.find('.', start);
		path.emplace_back(std::string(keys.substr(start, dot - start)));
		if (dot == std::string_view::npos) break;
		start = dot + 1;
	}
	return path;
}

auto to_path(std::string_view key) -> Path
{
	return Path{Segment{std::string(key)}};
}

auto to_path(std::size_t index) -> Path
{
	return Path{Segment{index}};
}

auto to_path(const Path& path) -> Path
{
	return path;
}
