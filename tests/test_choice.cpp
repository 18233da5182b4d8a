#include <algorithm>
#include <memory>
#include <vector>
#include <catch2/catch.hpp>
#include <moncmb/moncmb.hpp>

namespace pc = moncmb;

namespace {

/**
 * Wraps a parser so every invocation is counted.
 */
template <typename P>
auto counted(std::shared_ptr<int> counter, P p) {
	return pc::wrap([counter, p](auto const& in) {
		++*counter;
		return p.apply(in);
	});
}

auto const pair_of_items = pc::let(
	pc::item,
	pc::item,
	[](char a, char b) { return pc::result(std::vector<char>{ a, b }); }
);

auto const single_item = pc::item[([](char c) { return std::vector<char>{ c }; })];

} /* namespace */

TEST_CASE("'plus' keeps every interpretation, left first", "[plus]") {
	SECTION("two items as a pair, or a single item") {
		auto p = pc::plus(pair_of_items, single_item);
		auto res = p.apply(pc::string_input("asd"));

		REQUIRE(res.size() == 2);
		REQUIRE(res[0].value() == std::vector<char>{ 'a', 's' });
		REQUIRE(res[0].remaining() == pc::string_input("d"));
		REQUIRE(res[1].value() == std::vector<char>{ 'a' });
		REQUIRE(res[1].remaining() == pc::string_input("sd"));
	}

	SECTION("the operator form is the same") {
		auto in = pc::string_input("asd");
		REQUIRE((pair_of_items + single_item).apply(in) == pc::plus(pair_of_items, single_item).apply(in));
	}

	SECTION("only the successful side contributes") {
		auto res = pc::plus(pair_of_items, single_item).apply(pc::string_input("a"));

		REQUIRE(res.size() == 1);
		REQUIRE(res[0].value() == std::vector<char>{ 'a' });
	}
}

TEST_CASE("'fail' is the identity of 'plus'", "[plus][fail]") {
	for (auto in : { pc::string_input(""), pc::string_input("xy") }) {
		REQUIRE(pc::plus(pc::fail<char>, pc::item).apply(in) == pc::item.apply(in));
		REQUIRE(pc::plus(pc::item, pc::fail<char>).apply(in) == pc::item.apply(in));
	}
}

TEST_CASE("'plus' is associative, and commutative up to order", "[plus]") {
	auto a = pc::item;
	auto b = pc::result('-');
	auto c = pc::element('x');

	for (auto in : { pc::string_input(""), pc::string_input("xy"), pc::string_input("ab") }) {
		REQUIRE(pc::plus(pc::plus(a, b), c).apply(in) == pc::plus(a, pc::plus(b, c)).apply(in));
		REQUIRE(pc::plus(a, b, c).apply(in) == pc::plus(a, pc::plus(b, c)).apply(in));

		auto ab = pc::plus(a, b).apply(in);
		auto ba = pc::plus(b, a).apply(in);
		REQUIRE(ab.size() == ba.size());
		REQUIRE(std::is_permutation(ab.begin(), ab.end(), ba.begin()));
	}
}

TEST_CASE("'alt' commits to the first alternative that succeeds", "[alt]") {
	auto p1_calls = std::make_shared<int>(0);
	auto p2_calls = std::make_shared<int>(0);

	SECTION("the first fails, the second is used") {
		auto p = pc::alt(counted(p1_calls, pc::fail<int>), counted(p2_calls, pc::result(7)));

		for (int i = 1; i <= 3; ++i) {
			auto in = pc::string_input("input");
			auto res = p.apply(in);

			REQUIRE(res.size() == 1);
			REQUIRE(res[0].value() == 7);
			REQUIRE(res[0].remaining() == in);
			REQUIRE(*p1_calls == i);
			REQUIRE(*p2_calls == i);
		}
	}

	SECTION("the first succeeds, the second is never invoked") {
		auto p = pc::alt(counted(p1_calls, pc::result(1)), counted(p2_calls, pc::result(2)));

		auto res = p.apply(pc::string_input(""));
		REQUIRE(res.size() == 1);
		REQUIRE(res[0].value() == 1);
		REQUIRE(*p1_calls == 1);
		REQUIRE(*p2_calls == 0);
	}

	SECTION("an ambiguous first alternative is returned unchanged") {
		auto first = pc::plus(pc::result(1), pc::result(2));
		auto res = pc::alt(first, pc::result(3)).apply(pc::string_input("a"));

		REQUIRE(res == first.apply(pc::string_input("a")));
	}

	SECTION("everything fails") {
		auto p = pc::alt(pc::element('a'), pc::element('b'), pc::element('c'));
		REQUIRE(p.apply(pc::string_input("d")).empty());
		REQUIRE(p.apply(pc::string_input("")).empty());
	}

	SECTION("the alternatives are tried left-to-right") {
		auto p = pc::pass
			| pc::element('a')
			| pc::element('b')
			| pc::item
			;

		auto res = p.apply(pc::string_input("bc"));
		REQUIRE(res.size() == 1);
		REQUIRE(res[0].value() == 'b');
		REQUIRE(res[0].remaining() == pc::string_input("c"));

		REQUIRE(p.apply(pc::string_input("zc"))[0].value() == 'z');
	}
}

TEST_CASE("'not_p' succeeds exactly when its parser fails", "[not]") {
	auto p = pc::not_p(pc::element('x'));

	SECTION("the parser fails") {
		auto in = pc::string_input("abc");
		auto res = p.apply(in);

		REQUIRE(res.size() == 1);
		REQUIRE(res[0].value() == true);
		REQUIRE(res[0].remaining() == in);
	}

	SECTION("the parser succeeds") {
		REQUIRE(p.apply(pc::string_input("xyz")).empty());
	}

	SECTION("even an ambiguous parser only counts once") {
		auto res = (!pc::plus(pc::item, pc::item)).apply(pc::string_input("a"));
		REQUIRE(res.empty());
	}

	SECTION("never consumes") {
		for (auto in : { pc::string_input(""), pc::string_input("a"), pc::string_input("xa") }) {
			for (auto const& r : pc::not_p(pc::item).apply(in)) {
				REQUIRE(r.remaining() == in);
			}
			for (auto const& r : p.apply(in)) {
				REQUIRE(r.remaining() == in);
			}
		}
	}
}

TEST_CASE("'end' succeeds only where nothing is left", "[end]") {
	REQUIRE(pc::end.apply(pc::string_input("")).size() == 1);
	REQUIRE(pc::end.apply(pc::string_input("a")).empty());
}
