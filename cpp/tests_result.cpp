#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "decode_error.hpp"
#include "decode_result.hpp"
#include "test_helpers.hpp"

using Strings = std::vector<std::string>;
using Ints = std::vector<int>;

TEST_CASE("map")
{
	OK(int, map_result(ok(20), [](int n){ return n + 1; }), 21);
	OK(std::string, map_result(ok(3), [](int n){ return std::string(n, 'x'); }), "xxx");

	const auto error = missing_key("n");
	FAILS(int, map_result(err<int>(error), [](int n){ return n + 1; }), error);
}

TEST_CASE("apply")
{
	using Increment = std::function<int(int)>;
	const Increment inc = [](int n){ return n + 1; };

	OK(int, apply(ok(inc), ok(1)), 2);

	const auto left = missing_key("left");
	const auto right = missing_key("right");
	FAILS(int, apply(err<Increment>(left), ok(1)), left);
	FAILS(int, apply(ok(inc), err<int>(right)), right);
	// Both sides failed: the function side is to the left and wins.
	FAILS(int, apply(err<Increment>(left), err<int>(right)), left);
}

TEST_CASE("flat map")
{
	auto halve = [](int n){
		if (n % 2 == 0) return ok(n / 2);
		return err<int>(custom("odd"));
	};
	OK(int, flat_map(ok(8), halve), 4);
	FAILS(int, flat_map(ok(7), halve), custom("odd"));

	bool called = false;
	FAILS(int, flat_map(err<int>(missing_key("n")), [&](int n){ called = true; return ok(n); }), missing_key("n"));
	CHECK(not called);
}

TEST_CASE("escape hatches")
{
	CHECK(value_or(ok(1), 5) == 1);
	CHECK(value_or(err<int>(missing_key("n")), 5) == 5);
	CHECK(to_optional(ok(std::string("a"))) == std::optional<std::string>("a"));
	CHECK(to_optional(err<std::string>(missing_key("n"))) == std::nullopt);

	OK(int, or_else(ok(1), []{ return ok(2); }), 1);
	OK(int, or_else(err<int>(missing_key("a")), []{ return ok(2); }), 2);
	FAILS(int, or_else(err<int>(missing_key("a")), []{ return err<int>(missing_key("b")); }), missing_key("b"));

	const auto r = ok(3);
	CHECK(succeeded(r));
	CHECK(not failed(r));
	CHECK(value_of(r) == 3);
	const auto e = err<int>(custom("no"));
	CHECK(failed(e));
	CHECK(error_of(e) == custom("no"));
}

TEST_CASE("sequence")
{
	std::vector<Result<int>> good;
	good.push_back(ok(1));
	good.push_back(ok(2));
	OK(Ints, sequence(std::move(good)), (Ints{1, 2}));

	std::vector<Result<int>> bad;
	bad.push_back(ok(1));
	bad.push_back(err<int>(type_mismatch("number", "string")));
	bad.push_back(err<int>(type_mismatch("number", "null")));
	FAILS(Ints, sequence(std::move(bad)), prefixed(type_mismatch("number", "string"), Segment{1uz}));

	OK(Strings, sequence(std::vector<Result<std::string>>{}), Strings{});
}

TEST_CASE("error paths")
{
	const auto e = missing_key("text");
	CHECK(e.kind == ErrorKind::MissingKey);
	CHECK(e.path == Path{"text"});
	CHECK(e.actual == "absent");

	const auto nested = prefixed(prefixed(e, Segment{1uz}), Segment{"comments"});
	CHECK(nested.path == (Path{"comments", 1uz, "text"}));
	CHECK(nested == prefixed(e, Path{"comments", 1uz}));
	CHECK(prefixed(e, Path{}) == e);

	CHECK(missing_index(3).path == Path{3uz});
	CHECK(missing_index(3).kind == ErrorKind::MissingIndex);
	CHECK(type_mismatch("number", "string").path.empty());
	CHECK(wrong_container("object", "string").kind == ErrorKind::WrongContainer);
	CHECK(custom("bad").kind == ErrorKind::Custom);
}

TEST_CASE("error equality is structural")
{
	CHECK(type_mismatch("number", "string") == type_mismatch("number", "string"));
	CHECK(type_mismatch("number", "string") != type_mismatch("number", "bool"));
	CHECK(type_mismatch("object", "string") != wrong_container("object", "string"));
	CHECK(missing_key("a") != missing_key("b"));
}

TEST_CASE("composite errors")
{
	const auto a = missing_key("a");
	const auto b = prefixed(type_mismatch("number", "string"), Path{"b", "c"});
	const auto c = missing_key("d");

	const auto ab = merge(a, b);
	CHECK(ab.kind == ErrorKind::Composite);
	CHECK(ab.causes == (std::vector<DecodeError>{a, b}));

	const auto abc = merge(ab, c);
	CHECK(abc.causes == (std::vector<DecodeError>{a, b, c}));
	CHECK(merge(c, ab).causes == (std::vector<DecodeError>{c, a, b}));

	const auto moved = prefixed(abc, Segment{"outer"});
	CHECK(moved.path == Path{"outer"});
	REQUIRE(moved.causes.size() == 3);
	CHECK(moved.causes[0].path == (Path{"outer", "a"}));
	CHECK(moved.causes[1].path == (Path{"outer", "b", "c"}));
	CHECK(moved.causes[2].path == (Path{"outer", "d"}));
}

TEST_CASE("error rendering")
{
	CHECK(format_path(Path{}) == "<root>");
	CHECK(format_path(Path{"a"}) == "a");
	CHECK(format_path(Path{"comments", 1uz, "text"}) == "comments[1].text");
	CHECK(format_path(Path{0uz, 2uz}) == "[0][2]");
	CHECK(Catch::Detail::stringify(Path{"comments", 1uz, "text"}) == "comments[1].text");
	CHECK(Catch::Detail::stringify(Segment{"key"}) == "\"key\"");
	CHECK(Catch::Detail::stringify(Segment{2uz}) == "2");

	CHECK(to_string(prefixed(missing_key("text"), Path{"comments", 1uz}))
		== "MissingKey at comments[1].text: expected value, found absent");
	CHECK(to_string(type_mismatch("number", "string")) == "TypeMismatch at <root>: expected number, found string");
	CHECK(to_string(prefixed(custom("unknown shape"), Segment{"type"})) == "Custom at type: unknown shape");
	CHECK(to_string(merge(missing_key("a"), missing_key("b")))
		== "Composite at <root>: 2 errors\n"
		   "  MissingKey at a: expected value, found absent\n"
		   "  MissingKey at b: expected value, found absent");
}
