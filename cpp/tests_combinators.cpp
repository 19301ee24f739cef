#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "combinators.hpp"
#include "test_helpers.hpp"
#include "value.hpp"

using Tags = std::vector<std::string>;
using MaybeTags = std::optional<std::vector<std::string>>;
using Limits = std::map<std::string, int>;
using MaybeLimits = std::optional<std::map<std::string, int>>;
using Strings = std::vector<std::string>;

struct Account
{
	std::string id;
	std::string owner;
	int balance;

	bool operator==(const Account&) const = default;

	static auto decode(const Value& v) -> Result<Account>
	{
		return combine(construct<Account>,
			required_field<std::string>(v, "id"),
			required_field<std::string>(v, "owner"),
			required_field<int>(v, "balance"));
	}

	static auto decode_all(const Value& v) -> Result<Account>
	{
		return combine_all(construct<Account>,
			required_field<std::string>(v, "id"),
			required_field<std::string>(v, "owner"),
			required_field<int>(v, "balance"));
	}
};

struct Transfer
{
	Account from;
	Account to;

	bool operator==(const Transfer&) const = default;

	static auto decode(const Value& v) -> Result<Transfer>
	{
		return combine_all(construct<Transfer>,
			flat_map(at(v, "from"), [](const Value& from){ return prefix_error(Account::decode_all(from), Path{"from"}); }),
			flat_map(at(v, "to"), [](const Value& to){ return prefix_error(Account::decode_all(to), Path{"to"}); }));
	}
};

struct Circle
{
	double radius;

	bool operator==(const Circle&) const = default;
};

struct Rect
{
	double width;
	double height;

	bool operator==(const Rect&) const = default;
};

struct Shape
{
	std::variant<Circle, Rect> geometry;

	bool operator==(const Shape&) const = default;

	static auto decode(const Value& v) -> Result<Shape>
	{
		return flat_map(required_field<std::string>(v, "type"), [&](std::string&& type){
			if (type == "circle")
			{
				return combine([](double r){ return Shape{Circle{r}}; }, required_field<double>(v, "radius"));
			}
			if (type == "rect")
			{
				return combine([](double w, double h){ return Shape{Rect{w, h}}; },
					required_field<double>(v, "width"),
					required_field<double>(v, "height"));
			}
			return prefix_error(fail<Shape>("unknown shape " + type), Path{"type"});
		});
	}
};

struct Settings
{
	std::string theme;
	int version;
	MaybeTags tags;
	Limits limits;

	bool operator==(const Settings&) const = default;

	static auto decode(const Value& v) -> Result<Settings>
	{
		return combine(construct<Settings>,
			map_result(optional_field<std::string>(v, "theme"), [](std::optional<std::string>&& t){
				return std::move(t).value_or("light");
			}),
			pure(2),
			optional_array_field<std::string>(v, "tags"),
			dictionary_field<int>(v, dotted("quota.limits")));
	}
};

Value account(const char* id, const char* owner, long balance)
{
	return make_object(field("id", string(id)), field("owner", string(owner)), field("balance", number(balance)));
}

TEST_CASE("combine")
{
	OK(Account, Account::decode(account("a1", "ann", 10)), (Account{"a1", "ann", 10}));
	OK(int, combine([](int a, int b, int c){ return a * 100 + b * 10 + c; }, ok(1), ok(2), ok(3)), 123);
	OK(int, combine([](int a){ return -a; }, ok(4)), -4);
	OK(std::string, combine([](std::string a, std::string b){ return a + b; }, pure(std::string("con")), pure(std::string("stant"))), "constant");
}

TEST_CASE("combine reports the first failure in declaration order")
{
	// id and owner are both missing, balance has the wrong type.
	const auto v = make_object(field("balance", string("lots")));
	FAILS(Account, Account::decode(v), missing_key("id"));

	const auto only_last = make_object(field("id", string("a")), field("owner", string("o")), field("balance", True()));
	FAILS(Account, Account::decode(only_last), prefixed(type_mismatch("number", "bool"), Segment{"balance"}));

	// Same failures passed in the opposite order: the other one wins.
	FAILS(int, combine([](int, int){ return 0; }, err<int>(missing_key("y")), err<int>(missing_key("x"))), missing_key("y"));
	FAILS(int, combine([](int, int){ return 0; }, err<int>(missing_key("x")), err<int>(missing_key("y"))), missing_key("x"));
}

TEST_CASE("combine_all keeps every failure")
{
	const auto v = make_object(field("balance", string("lots")));
	const auto expected = composite({
		missing_key("id"),
		missing_key("owner"),
		prefixed(type_mismatch("number", "string"), Segment{"balance"})});
	FAILS(Account, Account::decode_all(v), expected);

	// A single failure is not wrapped.
	const auto one = make_object(field("id", string("a")), field("balance", number(1l)));
	FAILS(Account, Account::decode_all(one), missing_key("owner"));

	OK(Account, Account::decode_all(account("a1", "ann", 10)), (Account{"a1", "ann", 10}));
}

TEST_CASE("nested accumulated failures keep their own paths")
{
	const auto v = make_object(
		field("from", make_object(field("id", string("a")))),
		field("to", make_object(field("id", number(2l)), field("owner", string("bob")), field("balance", number(1l)))));
	const auto expected = composite({
		prefixed(missing_key("owner"), Segment{"from"}),
		prefixed(missing_key("balance"), Segment{"from"}),
		prefixed(type_mismatch("string", "number"), Path{"to", "id"})});
	FAILS(Transfer, Transfer::decode(v), expected);

	const auto good = make_object(field("from", account("a", "ann", 5)), field("to", account("b", "bob", 0)));
	OK(Transfer, Transfer::decode(good), (Transfer{Account{"a", "ann", 5}, Account{"b", "bob", 0}}));
}

TEST_CASE("lift")
{
	auto add = lift([](int a, int b){ return a + b; });
	OK(int, add(ok(1), ok(2)), 3);
	FAILS(int, add(err<int>(missing_key("a")), err<int>(missing_key("b"))), missing_key("a"));

	auto make_account = lift(construct<Account>);
	OK(Account, make_account(ok(std::string("x")), ok(std::string("y")), ok(3)), (Account{"x", "y", 3}));
}

TEST_CASE("discriminated decoding")
{
	OK(Shape, Shape::decode(make_object(field("type", string("circle")), field("radius", number(2l)))), Shape{Circle{2.0}});
	OK(Shape, Shape::decode(make_object(field("type", string("rect")), field("width", number(1.5)), field("height", number(3l)))), (Shape{Rect{1.5, 3.0}}));
	FAILS(Shape, Shape::decode(make_object(field("type", string("rect")), field("width", number(1.5)))), missing_key("height"));
	FAILS(Shape, Shape::decode(make_object(field("type", string("hexagon")))), prefixed(custom("unknown shape hexagon"), Segment{"type"}));
	FAILS(Shape, Shape::decode(make_object(field("radius", number(1l)))), missing_key("type"));
}

TEST_CASE("constant and optional fields")
{
	const auto v = make_object(
		field("tags", make_array(string("a"), string("b"))),
		field("quota", make_object(field("limits", make_object(field("cpu", number(4l)), field("disk", number(100l)))))));
	OK(Settings, Settings::decode(v), (Settings{"light", 2, Tags{"a", "b"}, Limits{{"cpu", 4}, {"disk", 100}}}));

	const auto themed = make_object(
		field("theme", string("dark")),
		field("tags", null()),
		field("quota", make_object(field("limits", make_object()))));
	OK(Settings, Settings::decode(themed), (Settings{"dark", 2, std::nullopt, Limits{}}));

	const auto bad_limit = make_object(field("quota", make_object(field("limits", make_object(field("cpu", string("four")))))));
	FAILS(Settings, Settings::decode(bad_limit), prefixed(type_mismatch("number", "string"), Path{"quota", "limits", "cpu"}));

	const auto no_quota = make_object(field("theme", string("dark")));
	FAILS(Settings, Settings::decode(no_quota), missing_key("quota"));
}

TEST_CASE("field lookups")
{
	const auto v = make_object(
		field("tags", make_array(string("x"), number(1l))),
		field("limits", make_object(field("a", number(1l)))),
		field("rows", make_array(make_array(string("r0")), make_array(string("r1")))));

	FAILS(Tags, array_field<std::string>(v, "tags"), prefixed(type_mismatch("string", "number"), Path{"tags", 1uz}));
	FAILS(Tags, array_field<std::string>(v, "limits"), prefixed(type_mismatch("array", "object"), Segment{"limits"}));
	FAILS(MaybeTags, optional_array_field<std::string>(v, "tags"), prefixed(type_mismatch("string", "number"), Path{"tags", 1uz}));
	OK(MaybeTags, optional_array_field<std::string>(v, "absent"), std::nullopt);

	OK(Limits, dictionary_field<int>(v, "limits"), (Limits{{"a", 1}}));
	OK(MaybeLimits, optional_dictionary_field<int>(v, "absent"), std::nullopt);
	FAILS(Limits, dictionary_field<int>(v, "tags"), prefixed(type_mismatch("object", "array"), Segment{"tags"}));

	OK(std::string, required_field<std::string>(v, Path{"rows", 1uz, 0uz}), "r1");
	FAILS(std::string, required_field<std::string>(v, Path{"rows", 2uz, 0uz}), prefixed(missing_index(2), Segment{"rows"}));

	const auto row = make_array(string("first"), number(2l));
	OK(std::string, required_field<std::string>(row, 0uz), "first");
	FAILS(std::string, required_field<std::string>(row, 1uz), prefixed(type_mismatch("string", "number"), Segment{1uz}));
	OK(std::optional<int>, optional_field<int>(row, 5uz), std::nullopt);
	OK(std::optional<int>, optional_field<int>(null(), Path{}), std::nullopt);
	OK(std::optional<int>, optional_field<int>(number(4), Path{}), 4);
}

TEST_CASE("fallback")
{
	auto text = fallback(
		decoder_for<std::string>(),
		[](const Value& v){ return map_result(decode<int>(v), [](int n){ return std::to_string(n); }); });

	OK(std::string, text(string("abc")), "abc");
	OK(std::string, text(number(12l)), "12");
	// Both failed: the error of the second decoder is reported.
	FAILS(std::string, text(True()), type_mismatch("number", "bool"));

	auto tags = fallback(
		decoder_for<Strings>(),
		[](const Value& v){ return map_result(decode<std::string>(v), [](std::string&& s){ return Strings{std::move(s)}; }); });
	OK(Strings, tags(make_array(string("a"), string("b"))), (Strings{"a", "b"}));
	OK(Strings, tags(string("solo")), Strings{"solo"});
}

TEST_CASE("custom failures")
{
	FAILS(int, fail<int>("nope"), custom("nope"));

	auto positive = [](const Value& v){
		return flat_map(decode<int>(v), [](int n){
			if (n > 0) return ok(n);
			return fail<int>("expected a positive number");
		});
	};
	OK(int, positive(number(3l)), 3);
	FAILS(int, positive(number(-3l)), custom("expected a positive number"));
	FAILS(int, positive(null()), type_mismatch("number", "null"));
}
