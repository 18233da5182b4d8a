#include <cstddef>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <vector>
#include <catch2/catch.hpp>
#include <moncmb/moncmb.hpp>

namespace pc = moncmb;

static_assert(pc::is_input_v<pc::string_input>);
static_assert(pc::is_input_v<pc::sequence_input<std::vector<int>>>);
static_assert(pc::is_input_v<pc::sequence_input<int[3]>>);
static_assert(pc::is_input_v<pc::list_input<int>>);
static_assert(pc::is_input_v<pc::stream_input>);
static_assert(!pc::is_input_v<std::string>);
static_assert(!pc::is_input_v<int>);

namespace {

// Has the shape of an input, but emptiness can't be tested
struct voided_input {
	void is_empty() const {}
	char first() const { return 'x'; }
	voided_input rest() const { return *this; }
};

struct counted_input {
	std::size_t n;

	std::size_t is_empty() const { return n == 0; }
	char first() const { return 'x'; }
	counted_input rest() const { return counted_input{ n - 1 }; }
};

} /* namespace */

static_assert(!pc::is_input_v<voided_input>);
static_assert(pc::is_input_v<counted_input>);

static_assert(std::is_same_v<pc::element_t<pc::string_input>, char>);
static_assert(std::is_same_v<pc::element_t<pc::sequence_input<std::vector<int>>>, int>);

TEST_CASE("a user-defined input works with the combinators", "[input:custom]") {
	auto res = pc::zero_or_more(pc::item).apply(counted_input{ 3 });

	REQUIRE(res.size() == 1);
	REQUIRE(res[0].value() == std::vector<char>{ 'x', 'x', 'x' });
	REQUIRE(res[0].remaining().n == 0);
}

TEST_CASE("'string_input' steps through a character sequence", "[input:string]") {
	auto in = pc::string_input("ab");

	REQUIRE(!in.is_empty());
	REQUIRE(in.first() == 'a');

	auto r1 = in.rest();
	REQUIRE(r1.first() == 'b');
	REQUIRE(r1.view() == "b");

	auto r2 = r1.rest();
	REQUIRE(r2.is_empty());
	REQUIRE(r2.size() == 0);

	SECTION("the original input is untouched") {
		REQUIRE(in.first() == 'a');
		REQUIRE(in.view() == "ab");
	}

	SECTION("rest is referentially stable") {
		REQUIRE(in.rest() == in.rest());
		REQUIRE(in.rest() == pc::string_input("b"));
	}

	SECTION("an empty input can't be taken apart") {
		REQUIRE_THROWS_AS(r2.first(), pc::empty_input_error);
		REQUIRE_THROWS_AS(r2.rest(), pc::empty_input_error);
	}
}

TEST_CASE("'sequence_input' views a random-access source", "[input:sequence]") {
	std::vector<int> src = { 1, 2, 3 };
	auto in = pc::sequence_input(src);

	REQUIRE(in.cursor() == 0);
	REQUIRE(in.first() == 1);
	REQUIRE(in.rest().first() == 2);
	REQUIRE(in.rest().cursor() == 1);
	REQUIRE(in.rest() == in.rest());
	REQUIRE(in.rest() != in);

	auto last = in.rest().rest().rest();
	REQUIRE(last.is_empty());
	REQUIRE_THROWS_AS(last.first(), pc::empty_input_error);
	REQUIRE_THROWS_AS(last.rest(), pc::empty_input_error);

	SECTION("views of different sources differ even with equal contents") {
		std::vector<int> other = { 1, 2, 3 };
		REQUIRE(pc::sequence_input(other) != in);
	}

	SECTION("a built-in array is a source too") {
		int const arr[] = { 4, 5 };
		auto arr_in = pc::sequence_input(arr);

		REQUIRE(arr_in.first() == 4);
		REQUIRE(arr_in.rest().first() == 5);
		REQUIRE(arr_in.rest().rest().is_empty());
	}
}

TEST_CASE("'list_input' is a persistent list", "[input:list]") {
	auto in = pc::list_input<int>{ 1, 2, 3 };

	REQUIRE(in.size() == 3);
	REQUIRE(in.first() == 1);
	REQUIRE(in.rest().first() == 2);
	REQUIRE(in.rest().rest().rest().is_empty());

	SECTION("consing shares the tail") {
		auto longer = in.cons(0);
		REQUIRE(longer.size() == 4);
		REQUIRE(longer.first() == 0);
		REQUIRE(longer.rest() == in);
		REQUIRE(in.size() == 3);
	}

	SECTION("equality is element-wise") {
		REQUIRE(in == pc::list_input<int>{ 1, 2, 3 });
		REQUIRE(in != pc::list_input<int>{ 1, 2 });
		REQUIRE(in != pc::list_input<int>{ 1, 2, 4 });
		REQUIRE(pc::list_input<int>() == pc::list_input<int>());
	}

	SECTION("can be built from an iterator range") {
		std::vector<std::string> words = { "x", "y" };
		auto l = pc::list_input(words.begin(), words.end());
		REQUIRE(l.first() == "x");
		REQUIRE(l.rest().first() == "y");
	}

	SECTION("an empty list can't be taken apart") {
		auto empty = pc::list_input<int>();
		REQUIRE(empty.is_empty());
		REQUIRE_THROWS_AS(empty.first(), pc::empty_input_error);
		REQUIRE_THROWS_AS(empty.rest(), pc::empty_input_error);
	}

	SECTION("long lists are released without blowing the stack") {
		std::vector<int> many(200000, 7);
		{
			auto l = pc::list_input(many.begin(), many.end());
			REQUIRE(l.size() == many.size());
		}
		SUCCEED();
	}

	SECTION("assigning over a long list releases it without blowing the stack") {
		std::vector<int> many(1000000, 7);
		auto l = pc::list_input(many.begin(), many.end());
		auto other = pc::list_input(many.begin(), many.end());

		l = pc::list_input<int>{ 1 };
		REQUIRE(l.size() == 1);

		other = l;
		REQUIRE(other == pc::list_input<int>{ 1 });
	}

	SECTION("assignment keeps shared tails alive") {
		auto tail = pc::list_input<int>{ 2, 3 };
		auto l = tail.cons(1);

		tail = pc::list_input<int>();
		REQUIRE(l == pc::list_input<int>{ 1, 2, 3 });

		auto const& same = l;
		l = same;
		REQUIRE(l.size() == 3);
	}
}

TEST_CASE("'stream_input' reads lazily but can be revisited", "[input:stream]") {
	std::istringstream is("abc");
	auto in = pc::stream_input(is);

	REQUIRE(in.first() == 'a');

	auto r1 = in.rest();
	auto r2 = r1.rest();
	REQUIRE(r2.first() == 'c');

	SECTION("earlier positions are still readable") {
		REQUIRE(in.first() == 'a');
		REQUIRE(r1.first() == 'b');
	}

	SECTION("rest is referentially stable") {
		REQUIRE(in.rest() == r1);
		REQUIRE(r1.rest() == r2);
		REQUIRE(r1 != r2);
	}

	SECTION("the end of the stream is the end of the input") {
		auto r3 = r2.rest();
		REQUIRE(r3.is_empty());
		REQUIRE_THROWS_AS(r3.first(), pc::empty_input_error);
		REQUIRE_THROWS_AS(r3.rest(), pc::empty_input_error);
	}
}

TEST_CASE("'stream_input' can be parsed from multiple threads", "[input:stream]") {
	std::string text(2000, 'a');
	std::istringstream is(text);
	auto in = pc::stream_input(is);
	auto p = pc::zero_or_more(pc::item);

	std::vector<char> left;
	std::vector<char> right;
	std::thread t1([&] { left = p.apply(in).front().value(); });
	std::thread t2([&] { right = p.apply(in).front().value(); });
	t1.join();
	t2.join();

	REQUIRE(left.size() == text.size());
	REQUIRE(left == right);
}

TEST_CASE("'make_input' picks the natural input for a source", "[input:make]") {
	std::string str = "xyz";
	std::string_view view = "xyz";
	std::vector<int> vec = { 1, 2 };
	std::istringstream is("xyz");
	auto lst = pc::list_input<int>{ 1 };

	REQUIRE((std::is_same_v<decltype(pc::make_input("xyz")), pc::string_input>));
	REQUIRE((std::is_same_v<decltype(pc::make_input(str)), pc::string_input>));
	REQUIRE((std::is_same_v<decltype(pc::make_input(view)), pc::string_input>));
	REQUIRE((std::is_same_v<decltype(pc::make_input(vec)), pc::sequence_input<std::vector<int>>>));
	REQUIRE((std::is_same_v<decltype(pc::make_input(is)), pc::stream_input>));
	REQUIRE((std::is_same_v<decltype(pc::make_input(lst)), pc::list_input<int>>));

	REQUIRE(pc::make_input(str).view() == "xyz");
	REQUIRE(pc::make_input(vec).first() == 1);
	REQUIRE(pc::make_input(is).first() == 'x');
	REQUIRE(pc::make_input(lst) == lst);
}
