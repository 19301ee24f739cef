#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "combinators.hpp"
#include "decodable.hpp"
#include "encodable.hpp"
#include "test_helpers.hpp"
#include "value.hpp"

using Names = std::vector<std::string>;
using Grid = std::vector<std::vector<int>>;
using Scores = std::map<std::string, int>;
using Lookup = std::unordered_map<std::string, bool>;
using MaybeInt = std::optional<int>;

struct Comment
{
	std::string author;
	std::string text;

	bool operator==(const Comment&) const = default;

	static auto decode(const Value& v) -> Result<Comment>
	{
		return combine(construct<Comment>,
			required_field<std::string>(v, "author"),
			required_field<std::string>(v, "text"));
	}

	static auto encode(const Comment& c) -> Value
	{
		return make_object(field("author", to_value(c.author)), field("text", to_value(c.text)));
	}
};

struct Post
{
	std::string title;
	std::vector<Comment> comments;

	bool operator==(const Post&) const = default;

	static auto decode(const Value& v) -> Result<Post>
	{
		return combine(construct<Post>,
			required_field<std::string>(v, "title"),
			array_field<Comment>(v, "comments"));
	}

	static auto encode(const Post& p) -> Value
	{
		return make_object(field("title", to_value(p.title)), field("comments", to_value(p.comments)));
	}
};

struct Thread
{
	std::string subject;
	std::vector<Post> posts;

	bool operator==(const Thread&) const = default;

	static auto decode(const Value& v) -> Result<Thread>
	{
		return combine(construct<Thread>,
			required_field<std::string>(v, "subject"),
			array_field<Post>(v, "posts"));
	}
};

struct Forum
{
	std::string name;
	std::vector<Thread> threads;
	std::map<std::string, Thread> pinned;

	bool operator==(const Forum&) const = default;

	static auto decode(const Value& v) -> Result<Forum>
	{
		return combine(construct<Forum>,
			required_field<std::string>(v, "name"),
			array_field<Thread>(v, "threads"),
			dictionary_field<Thread>(v, "pinned"));
	}
};

struct Profile
{
	std::optional<std::string> nickname;

	bool operator==(const Profile&) const = default;

	static auto decode(const Value& v) -> Result<Profile>
	{
		return combine(construct<Profile>, optional_field<std::string>(v, "nickname"));
	}
};

struct Inner
{
	double b;

	bool operator==(const Inner&) const = default;

	static auto decode(const Value& v) -> Result<Inner>
	{
		return combine(construct<Inner>, required_field<double>(v, "b"));
	}
};

struct Outer
{
	Inner a;

	bool operator==(const Outer&) const = default;

	static auto decode(const Value& v) -> Result<Outer>
	{
		return combine(construct<Outer>, required_field<Inner>(v, "a"));
	}
};

struct Category
{
	std::string name;
	std::vector<Category> children;

	bool operator==(const Category&) const = default;

	static auto decode(const Value& v) -> Result<Category>
	{
		return combine(construct<Category>,
			required_field<std::string>(v, "name"),
			map_result(optional_array_field<Category>(v, "children"), [](std::optional<std::vector<Category>>&& c){
				return std::move(c).value_or(std::vector<Category>{});
			}));
	}

	static auto encode(const Category& c) -> Value
	{
		return make_object(field("name", to_value(c.name)), field("children", to_value(c.children)));
	}
};

struct Folder;

struct Link
{
	std::string label;
	std::vector<Folder> targets;

	bool operator==(const Link&) const;

	static auto decode(const Value& v) -> Result<Link>;
};

struct Folder
{
	std::string path;
	std::vector<Link> links;

	bool operator==(const Folder&) const = default;

	static auto decode(const Value& v) -> Result<Folder>;
};

bool Link::operator==(const Link&) const = default;

auto Link::decode(const Value& v) -> Result<Link>
{
	return combine(construct<Link>,
		required_field<std::string>(v, "label"),
		array_field<Folder>(v, "targets"));
}

auto Folder::decode(const Value& v) -> Result<Folder>
{
	return combine(construct<Folder>,
		required_field<std::string>(v, "path"),
		array_field<Link>(v, "links"));
}

static_assert(Decodable<int>);
static_assert(Decodable<std::uint8_t>);
static_assert(Decodable<double>);
static_assert(Decodable<std::string>);
static_assert(Decodable<std::vector<std::vector<Comment>>>);
static_assert(Decodable<std::map<std::string, std::vector<Post>>>);
static_assert(Decodable<std::optional<Forum>>);
static_assert(not Decodable<char>);
static_assert(not Decodable<std::vector<Value*>>);
static_assert(Encodable<std::vector<Comment>>);
static_assert(not Encodable<Thread>);

Value comment(const char* author, const char* text)
{
	return make_object(field("author", string(author)), field("text", string(text)));
}

TEST_CASE("scalars")
{
	OK(bool, decode<bool>(True()), true);
	OK(bool, decode<bool>(False()), false);
	FAILS(bool, decode<bool>(number(1l)), type_mismatch("bool", "number"));

	OK(std::string, decode<std::string>(string("hi")), "hi");
	FAILS(std::string, decode<std::string>(null()), type_mismatch("string", "null"));

	OK(double, decode<double>(number(1.25)), 1.25);
	OK(double, decode<double>(number(3l)), 3.0);
	OK(float, decode<float>(number(0.5)), 0.5f);
	OK(double, decode<double>(number(1e300)), 1e300);
	FAILS(float, decode<float>(number(1e300)), type_mismatch("float32", "number 1e+300"));
	FAILS(float, decode<float>(number(-1e300)), type_mismatch("float32", "number -1e+300"));
	FAILS(double, decode<double>(string("1.0")), type_mismatch("number", "string"));
}

TEST_CASE("integers")
{
	OK(int, decode<int>(number(42l)), 42);
	OK(int, decode<int>(number(-7l)), -7);
	OK(int, decode<int>(number(2.0)), 2);
	OK(long, decode<long>(number(5000000000l)), 5000000000l);
	FAILS(int, decode<int>(number(2.5)), type_mismatch("integer", "number 2.5"));
	FAILS(int, decode<int>(number(5000000000l)), type_mismatch("int32", "number 5000000000"));
	FAILS(std::uint8_t, decode<std::uint8_t>(number(256l)), type_mismatch("uint8", "number 256"));
	FAILS(unsigned, decode<unsigned>(number(-1l)), type_mismatch("uint32", "number -1"));
	FAILS(int, decode<int>(True()), type_mismatch("number", "bool"));
}

TEST_CASE("integers beyond the range of long")
{
	const std::uint64_t big = 10000000000000000000ull;
	OK(std::uint64_t, decode<std::uint64_t>(number(big)), big);
	OK(std::uint64_t, decode<std::uint64_t>(number(1e19)), big);
	OK(std::uint64_t, decode<std::uint64_t>(number(std::numeric_limits<std::uint64_t>::max())), std::numeric_limits<std::uint64_t>::max());
	FAILS(std::int64_t, decode<std::int64_t>(number(big)), type_mismatch("int64", "number 10000000000000000000"));
	FAILS(std::uint64_t, decode<std::uint64_t>(number(1e30)), type_mismatch("uint64", "number 1e+30"));
	FAILS(int, decode<int>(number(-1e30)), type_mismatch("int32", "number -1e+30"));
}

TEST_CASE("containers")
{
	OK(Names, decode<Names>(make_array(string("a"), string("b"))), (Names{"a", "b"}));
	OK(Names, decode<Names>(make_array()), Names{});
	FAILS(Names, decode<Names>(make_array(string("a"), number(1l))), prefixed(type_mismatch("string", "number"), Segment{1uz}));
	FAILS(Names, decode<Names>(make_object()), type_mismatch("array", "object"));

	OK(Grid, decode<Grid>(make_array(make_array(number(1l)), make_array(), make_array(number(2l), number(3l)))), (Grid{{1}, {}, {2, 3}}));
	FAILS(Grid, decode<Grid>(make_array(make_array(number(1l)), make_array(number(2l), null()))), prefixed(type_mismatch("number", "null"), Path{1uz, 1uz}));

	OK(Scores, decode<Scores>(make_object(field("x", number(1l)), field("y", number(2l)))), (Scores{{"x", 1}, {"y", 2}}));
	// Several bad entries: the first key in sorted order is the one reported.
	FAILS(Scores, decode<Scores>(make_object(field("m", True()), field("c", string("x")), field("z", null()))), prefixed(type_mismatch("number", "string"), Segment{"c"}));
	FAILS(Scores, decode<Scores>(make_array()), type_mismatch("object", "array"));

	OK(Lookup, decode<Lookup>(make_object(field("on", True()))), (Lookup{{"on", true}}));

	OK(MaybeInt, decode<MaybeInt>(null()), std::nullopt);
	OK(MaybeInt, decode<MaybeInt>(number(4l)), 4);
	FAILS(MaybeInt, decode<MaybeInt>(string("4")), type_mismatch("number", "string"));
}

TEST_CASE("decoding at a path")
{
	const auto v = make_object(field("outer", make_object(field("values", make_array(number(1l), string("2"))))));
	OK(int, decode<int>(v, Path{"outer", "values", 0uz}), 1);
	FAILS(int, decode<int>(v, Path{"outer", "values", 1uz}), prefixed(type_mismatch("number", "string"), Path{"outer", "values", 1uz}));
	FAILS(int, decode<int>(v, Path{"outer", "count"}), prefixed(missing_key("count"), Segment{"outer"}));
}

TEST_CASE("path of a nested type mismatch")
{
	const auto v = make_object(field("a", make_object(field("b", string("not-a-number")))));
	FAILS(Outer, decode<Outer>(v), prefixed(type_mismatch("number", "string"), Path{"a", "b"}));
	OK(Outer, decode<Outer>(make_object(field("a", make_object(field("b", number(1.5)))))), Outer{Inner{1.5}});
}

TEST_CASE("missing required field")
{
	FAILS(Comment, decode<Comment>(make_object(field("text", string("x")))), missing_key("author"));
	const auto e = missing_key("name");
	FAILS(Forum, decode<Forum>(make_object()), e);
	CHECK(e.path == Path{"name"});
	CHECK(e.kind == ErrorKind::MissingKey);
}

TEST_CASE("optional field")
{
	OK(Profile, decode<Profile>(make_object()), Profile{std::nullopt});
	OK(Profile, decode<Profile>(make_object(field("nickname", null()))), Profile{std::nullopt});
	OK(Profile, decode<Profile>(make_object(field("nickname", string("bob")))), Profile{"bob"});
	FAILS(Profile, decode<Profile>(make_object(field("nickname", number(5l)))), prefixed(type_mismatch("string", "number"), Segment{"nickname"}));
	FAILS(Profile, decode<Profile>(string("profile")), wrong_container("object", "string"));
}

TEST_CASE("array element failures carry the index")
{
	const auto v = make_object(
		field("title", string("t")),
		field("comments", make_array(
			comment("A", "x"),
			make_object(field("author", string("B"))))));
	FAILS(Post, decode<Post>(v), prefixed(missing_key("text"), Path{"comments", 1uz}));

	const auto good = make_object(field("title", string("t")), field("comments", make_array(comment("A", "x"))));
	OK(Post, decode<Post>(good), (Post{"t", {Comment{"A", "x"}}}));
}

TEST_CASE("first declared field wins")
{
	// author and text are both absent; author is declared first.
	FAILS(Comment, decode<Comment>(make_object()), missing_key("author"));
	FAILS(Comment, decode<Comment>(make_object(field("author", number(1l)), field("text", number(2l)))),
		prefixed(type_mismatch("string", "number"), Segment{"author"}));
}

TEST_CASE("three levels of nested collections")
{
	auto post = [](const char* title, auto&&... comments){
		return make_object(field("title", string(title)), field("comments", make_array(std::move(comments)...)));
	};
	const auto v = make_object(
		field("name", string("general")),
		field("threads", make_array(
			make_object(
				field("subject", string("hello")),
				field("posts", make_array(post("p1", comment("A", "x"), comment("B", "y")), post("p2")))))),
		field("pinned", make_object(
			field("rules", make_object(
				field("subject", string("rules")),
				field("posts", make_array(post("r", comment("mod", "be nice")))))))));

	const auto expected = Forum{
		"general",
		{Thread{"hello", {Post{"p1", {Comment{"A", "x"}, Comment{"B", "y"}}}, Post{"p2", {}}}}},
		{{"rules", Thread{"rules", {Post{"r", {Comment{"mod", "be nice"}}}}}}}};
	OK(Forum, decode<Forum>(v), expected);

	const auto broken = make_object(
		field("name", string("general")),
		field("threads", make_array(
			make_object(
				field("subject", string("hello")),
				field("posts", make_array(post("p1", comment("A", "x"), make_object(field("author", string("B"))))))))),
		field("pinned", make_object()));
	FAILS(Forum, decode<Forum>(broken), prefixed(missing_key("text"), Path{"threads", 0uz, "posts", 0uz, "comments", 1uz}));
}

TEST_CASE("recursive types")
{
	const auto v = make_object(
		field("name", string("root")),
		field("children", make_array(
			make_object(field("name", string("leaf"))),
			make_object(
				field("name", string("branch")),
				field("children", make_array(make_object(field("name", string("twig")), field("children", null()))))))));
	OK(Category, decode<Category>(v), (Category{"root", {Category{"leaf", {}}, Category{"branch", {Category{"twig", {}}}}}}));

	const auto bad = make_object(
		field("name", string("root")),
		field("children", make_array(make_object(field("children", make_array())))));
	FAILS(Category, decode<Category>(bad), prefixed(missing_key("name"), Path{"children", 0uz}));
}

TEST_CASE("mutually recursive types")
{
	const auto v = make_object(
		field("path", string("/")),
		field("links", make_array(
			make_object(
				field("label", string("home")),
				field("targets", make_array(
					make_object(field("path", string("/home")), field("links", make_array()))))))));
	OK(Folder, decode<Folder>(v), (Folder{"/", {Link{"home", {Folder{"/home", {}}}}}}));

	const auto bad = make_object(
		field("path", string("/")),
		field("links", make_array(
			make_object(
				field("label", string("home")),
				field("targets", make_array(make_object(field("path", string("/home")))))))));
	FAILS(Folder, decode<Folder>(bad), prefixed(missing_key("links"), Path{"links", 0uz, "targets", 0uz}));
}

TEST_CASE("round trip")
{
	const auto post = Post{"news", {Comment{"A", "first"}, Comment{"B", "second"}}};
	OK(Post, decode<Post>(to_value(post)), post);

	const auto tree = Category{"root", {Category{"a", {}}, Category{"b", {Category{"c", {}}}}}};
	OK(Category, decode<Category>(to_value(tree)), tree);

	const auto scores = Scores{{"x", 1}, {"y", -2}};
	OK(Scores, decode<Scores>(to_value(scores)), scores);

	const auto maybe = std::vector<MaybeInt>{1, std::nullopt, 3};
	OK(std::vector<MaybeInt>, decode<std::vector<MaybeInt>>(to_value(maybe)), maybe);

	CHECK(to_value(true) == True());
	CHECK(to_value(std::string("s")) == string("s"));
	CHECK(to_value(7) == number(7));

	const std::uint64_t big = 10000000000000000000ull;
	CHECK(to_value(big) == number(big));
	OK(std::uint64_t, decode<std::uint64_t>(to_value(big)), big);
	const auto bigs = std::vector<std::uint64_t>{0, big, std::numeric_limits<std::uint64_t>::max()};
	OK(std::vector<std::uint64_t>, decode<std::vector<std::uint64_t>>(to_value(bigs)), bigs);
	CHECK(to_value(0.5) == number(0.5));
	CHECK(to_value(MaybeInt{}) == null());
}
