#include <optional>
#include <string>

#include "test_helpers.hpp"
#include "traversal.hpp"
#include "value.hpp"

using Found = std::optional<ValueRef>;

Value sample()
{
	return make_object(
		field("name", string("root")),
		field("nothing", null()),
		field("items", make_array(number(1l), make_object(field("deep", True())))),
		field("a", make_object(field("b", make_object(field("c", number(3l)))))));
}

void check_at(Result<ValueRef>&& r, const Value& expected)
{
	match(std::move(r),
		[&](ValueRef found){
			CHECK(found.get() == expected);
		},
		[](DecodeError&& error){
			CAPTURE(error);
			CHECK(false);
		});
}

void check_absent(Result<Found>&& r)
{
	match(std::move(r),
		[](Found&& found){
			CHECK(not found.has_value());
		},
		[](DecodeError&& error){
			CAPTURE(error);
			CHECK(false);
		});
}

TEST_CASE("lookup by key")
{
	const auto v = sample();
	check_at(at(v, "name"), string("root"));
	check_at(at(v, "nothing"), null());
	FAILS(ValueRef, at(v, "missing"), missing_key("missing"));
	FAILS(ValueRef, at(string("x"), "name"), wrong_container("object", "string"));
	FAILS(ValueRef, at(make_array(), "name"), wrong_container("object", "array"));
}

TEST_CASE("lookup by index")
{
	const auto arr = make_array(string("a"), string("b"));
	check_at(at(arr, 0uz), string("a"));
	check_at(at(arr, 1uz), string("b"));
	FAILS(ValueRef, at(arr, 2uz), missing_index(2));
	FAILS(ValueRef, at(make_object(), 0uz), wrong_container("array", "object"));
}

TEST_CASE("lookup by path")
{
	const auto v = sample();
	check_at(at(v, Path{"a", "b", "c"}), number(3l));
	check_at(at(v, Path{"items", 1uz, "deep"}), True());
	check_at(at(v, dotted("a.b.c")), number(3l));
	check_at(at(v, Path{}), v);

	FAILS(ValueRef, at(v, Path{"a", "x", "c"}), prefixed(missing_key("x"), Segment{"a"}));
	FAILS(ValueRef, at(v, Path{"items", 5uz}), prefixed(missing_index(5), Segment{"items"}));
	// The wrong container is reported where it sits, not where the lookup wanted to go.
	FAILS(ValueRef, at(v, Path{"name", "first"}), prefixed(wrong_container("object", "string"), Segment{"name"}));
	FAILS(ValueRef, at(v, Path{"items", 0uz, "deep"}), prefixed(wrong_container("object", "number"), Path{"items", 0uz}));
	FAILS(ValueRef, at(v, Path{"nothing", "x"}), prefixed(wrong_container("object", "null"), Segment{"nothing"}));
}

TEST_CASE("optional lookup")
{
	const auto v = sample();
	check_absent(find(v, "missing"));
	check_absent(find(v, "nothing"));
	check_absent(find(v, Path{"a", "x", "c"}));
	check_absent(find(v, Path{"nothing", "x"}));
	check_absent(find(make_array(), 0uz));
	check_absent(find(make_array(null()), 0uz));
	check_absent(find(null(), Path{}));
	check_absent(find(v, Path{"nothing"}));

	match(find(v, Path{"a", "b", "c"}),
		[](Found&& found){
			REQUIRE(found.has_value());
			CHECK(found->get() == number(3l));
		},
		[](DecodeError&& error){
			CAPTURE(error);
			CHECK(false);
		});

	// Optionality forgives absence, not a parent of the wrong kind.
	FAILS(Found, find(string("x"), "name"), wrong_container("object", "string"));
	FAILS(Found, find(v, Path{"name", "first"}), prefixed(wrong_container("object", "string"), Segment{"name"}));
	FAILS(Found, find(v, Path{"a", 0uz}), prefixed(wrong_container("array", "object"), Segment{"a"}));
}

TEST_CASE("dotted paths")
{
	CHECK(dotted("a") == Path{"a"});
	CHECK(dotted("a.b.c") == (Path{"a", "b", "c"}));
	CHECK(dotted("a..b") == (Path{"a", "", "b"}));
	CHECK(to_path("k") == Path{"k"});
	CHECK(to_path(2uz) == Path{2uz});
	CHECK(to_path(Path{"x", 1uz}) == (Path{"x", 1uz}));
}
