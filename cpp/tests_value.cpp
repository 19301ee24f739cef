#include <cstdint>
#include <functional>
#include <sstream>
#include <string>

#include "test_helpers.hpp"
#include "value.hpp"

template <typename T>
std::string render(const T& t)
{
	std::ostringstream o;
	o << t;
	return o.str();
}

TEST_CASE("kinds")
{
	CHECK(kind_of(null()) == Kind::Null);
	CHECK(kind_of(True()) == Kind::Bool);
	CHECK(kind_of(False()) == Kind::Bool);
	CHECK(kind_of(number(42l)) == Kind::Number);
	CHECK(kind_of(number(4.2)) == Kind::Number);
	CHECK(kind_of(string("abc")) == Kind::String);
	CHECK(kind_of(make_array()) == Kind::Array);
	CHECK(kind_of(make_object()) == Kind::Object);

	CHECK(kind_name(Kind::Null) == "null");
	CHECK(kind_name(Kind::Bool) == "bool");
	CHECK(kind_name(Kind::Number) == "number");
	CHECK(kind_name(Kind::String) == "string");
	CHECK(kind_name(Kind::Array) == "array");
	CHECK(kind_name(Kind::Object) == "object");

	CHECK(is_null(null()));
	CHECK(not is_null(False()));
}

TEST_CASE("builders")
{
	CHECK(make_array(True(), null()) == Value{make_array(Value{true}, Value{Null{}})});
	CHECK(number(1l) == Value{Number{1l}});
	CHECK(number(1l) != number(1.0));
	CHECK(string("a") == Value{std::string("a")});

	CHECK(number(5) == number(5l));
	CHECK(number(5u) == number(5l));
	CHECK(number(std::uint8_t{3}) == number(3));
	CHECK(number(10000000000000000000ull) == Value{Number{10000000000000000000ul}});

	const auto obj = make_object(field("a", number(1l)), field("b", make_array(string("x"))));
	const auto same = make_object(field("b", make_array(string("x"))), field("a", number(1l)));
	CHECK(obj == same);
	CHECK(obj != make_object(field("a", number(1l))));

	const auto dup = make_object(field("k", number(1l)), field("k", number(2l)));
	CHECK(dup == make_object(field("k", number(2l))));
}

TEST_CASE("accessors")
{
	OK(bool, as_bool(True()), true);
	OK(Number, as_number(number(7l)), Number{7l});
	OK(Number, as_number(number(0.5)), Number{0.5});

	const auto s = string("text");
	match(as_string(s),
		[&](std::reference_wrapper<const std::string> str){
			CHECK(str.get() == "text");
		},
		[](DecodeError&& error){
			CAPTURE(error);
			CHECK(false);
		});

	const auto arr = make_array(number(1l), number(2l));
	match(as_array(arr),
		[&](std::reference_wrapper<const Array> items){
			CHECK(items.get().size() == 2);
			CHECK(&items.get() == &std::get<Array>(arr.value));
		},
		[](DecodeError&& error){
			CAPTURE(error);
			CHECK(false);
		});

	FAILS(bool, as_bool(null()), type_mismatch("bool", "null"));
	FAILS(Number, as_number(string("1")), type_mismatch("number", "string"));
	FAILS(std::reference_wrapper<const std::string>, as_string(number(1l)), type_mismatch("string", "number"));
	FAILS(std::reference_wrapper<const Array>, as_array(make_object()), type_mismatch("array", "object"));
	FAILS(std::reference_wrapper<const Object>, as_object(make_array()), type_mismatch("object", "array"));
}

TEST_CASE("rendering")
{
	CHECK(render(null()) == "null");
	CHECK(render(True()) == "true");
	CHECK(render(False()) == "false");
	CHECK(render(number(42l)) == "42");
	CHECK(render(number(-1.5)) == "-1.5");
	CHECK(render(string("a\"b\n")) == R"("a\"b\n")");
	CHECK(render(string("\b\f\r\t")) == R"("\b\f\r\t")");
	CHECK(render(string("bell\a")) == R"("bell\u0007")");
	CHECK(render(string("\x1f")) == R"("\u001f")");
	CHECK(render(number(10000000000000000000ull)) == "10000000000000000000");
	CHECK(render(make_array()) == "[]");
	CHECK(render(make_array(number(1l), number(2l), number(3l))) == "[1, 2, 3]");
	CHECK(render(make_object()) == "{}");
	CHECK(render(make_object(field("k", make_array(null())))) == R"({"k": [null]})");
	CHECK(render(Kind::Object) == "object");
}
