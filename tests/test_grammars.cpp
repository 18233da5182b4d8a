#include <cctype>
#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include <catch2/catch.hpp>
#include <moncmb/moncmb.hpp>

namespace pc = moncmb;

// S-expression reader ////////////////////////////////////////////////////////

namespace {

struct sexpr {
	bool is_list = false;
	std::string atom;
	std::vector<sexpr> items;

	static sexpr make_atom(std::string s) {
		sexpr e;
		e.atom = std::move(s);
		return e;
	}

	static sexpr make_list(std::vector<sexpr> xs) {
		sexpr e;
		e.is_list = true;
		e.items = std::move(xs);
		return e;
	}
};

bool operator==(sexpr const& l, sexpr const& r) {
	return l.is_list == r.is_list && l.atom == r.atom && l.items == r.items;
}

template <typename Input>
pc::parser<sexpr, Input> sexpr_parser() {
	auto space = pc::zero_or_more(pc::satisfies([](char c) {
		return std::isspace(static_cast<unsigned char>(c)) != 0;
	}));
	auto atom_char = pc::none_of('(', ')', ' ', '\t', '\n');

	auto atom = pc::one_or_more(atom_char)[([](std::vector<char> const& cs) {
		return sexpr::make_atom(std::string(cs.begin(), cs.end()));
	})];

	auto list = pc::let(
		pc::element('('),
		pc::zero_or_more(pc::and_p(space, pc::lazy(sexpr_parser<Input>))),
		space,
		pc::element(')'),
		[](char, std::vector<sexpr> xs, auto, char) {
			return pc::result(sexpr::make_list(std::move(xs)));
		}
	);

	return pc::and_p(space, atom | list);
}

} /* namespace */

TEST_CASE("an s-expression reader built from the combinators", "[grammar:sexpr]") {
	auto p = sexpr_parser<pc::string_input>();

	SECTION("an atom") {
		auto v = pc::parse(p, "hello");
		REQUIRE(v.has_value());
		REQUIRE(*v == sexpr::make_atom("hello"));
	}

	SECTION("nested lists") {
		auto v = pc::parse(p, "(define (sq x) (* x x))");
		REQUIRE(v.has_value());

		auto expected = sexpr::make_list({
			sexpr::make_atom("define"),
			sexpr::make_list({ sexpr::make_atom("sq"), sexpr::make_atom("x") }),
			sexpr::make_list({ sexpr::make_atom("*"), sexpr::make_atom("x"), sexpr::make_atom("x") }),
		});
		REQUIRE(*v == expected);
	}

	SECTION("an empty list") {
		auto v = pc::parse(p, "(  )");
		REQUIRE(v.has_value());
		REQUIRE(*v == sexpr::make_list({}));
	}

	SECTION("unbalanced parentheses") {
		REQUIRE(!pc::parse(p, "(a (b)").has_value());
		REQUIRE(!pc::parse(p, ")").has_value());
	}

	SECTION("reading from a stream") {
		std::istringstream is("(a (b c))");
		auto sp = sexpr_parser<pc::stream_input>();
		auto v = pc::parse(sp, is);

		REQUIRE(v.has_value());
		REQUIRE(v->is_list);
		REQUIRE(v->items.size() == 2);
		REQUIRE(v->items[1].items[1] == sexpr::make_atom("c"));
	}
}

// Ambiguous splits ///////////////////////////////////////////////////////////

namespace {

// Every prefix of the input, shortest first
pc::parser<std::string, pc::string_input> any_prefix() {
	static auto const p = pc::parser<std::string, pc::string_input>(
		pc::plus(
			pc::result(std::string()),
			pc::let(
				pc::item,
				[](char) { return pc::lazy(any_prefix); },
				[](char c, std::string const& tail) { return pc::result(c + tail); }
			)
		)
	);
	return p;
}

auto const splits = pc::let(
	pc::lazy(any_prefix),
	pc::zero_or_more(pc::item),
	[](std::string const& l, std::vector<char> const& r) {
		return pc::result(std::make_pair(l, std::string(r.begin(), r.end())));
	}
);

} /* namespace */

TEST_CASE("an ambiguous grammar yields one interpretation per split point", "[grammar:splits]") {
	auto values = pc::parse_all(splits, "abc");

	REQUIRE(values.size() == 4);
	REQUIRE(values[0] == std::make_pair(std::string(""), std::string("abc")));
	REQUIRE(values[1] == std::make_pair(std::string("a"), std::string("bc")));
	REQUIRE(values[2] == std::make_pair(std::string("ab"), std::string("c")));
	REQUIRE(values[3] == std::make_pair(std::string("abc"), std::string("")));

	REQUIRE(pc::parse_all(splits, "").size() == 1);
}

// Arithmetic over tokens /////////////////////////////////////////////////////

namespace {

struct token {
	enum type { num, add, sub, lparen, rparen };

	type ty;
	int val;
};

using token_input = pc::sequence_input<std::vector<token>>;

template <token::type Expected_Type>
auto const term = pc::satisfies([](token const& t) { return t.ty == Expected_Type; });

pc::parser<int, token_input> expr();

// atom ::= num | '(' expr ')'
pc::parser<int, token_input> atom() {
	static auto const p = pc::parser<int, token_input>(pc::pass
		| term<token::num>[([](token const& t) { return t.val; })]
		| pc::prog1(pc::and_p(term<token::lparen>, pc::lazy(expr)), term<token::rparen>)
	);
	return p;
}

// expr ::= atom (('+' | '-') atom)*
pc::parser<int, token_input> expr() {
	static auto const p = pc::parser<int, token_input>(pc::let(
		pc::lazy(atom),
		pc::zero_or_more(pc::let(
			term<token::add> | term<token::sub>,
			pc::lazy(atom),
			[](token const& op, int rhs) {
				return pc::result(op.ty == token::add ? rhs : -rhs);
			}
		)),
		[](int lhs, std::vector<int> const& rest) {
			for (int r : rest) {
				lhs += r;
			}
			return pc::result(lhs);
		}
	));
	return p;
}

} /* namespace */

TEST_CASE("a grammar over a token vector", "[grammar:tokens]") {
	// 1 + (5 - 2) - 3
	std::vector<token> tokens = {
		{ token::num, 1 }, { token::add, 0 },
		{ token::lparen, 0 }, { token::num, 5 }, { token::sub, 0 }, { token::num, 2 }, { token::rparen, 0 },
		{ token::sub, 0 }, { token::num, 3 },
	};

	auto res = pc::run(expr(), tokens);
	REQUIRE(res.size() == 1);
	REQUIRE(res[0].value() == 1);
	REQUIRE(res[0].remaining().is_empty());

	SECTION("an unclosed parenthesis stops the sum early") {
		std::vector<token> bad = { { token::num, 1 }, { token::add, 0 }, { token::lparen, 0 }, { token::num, 5 } };
		auto partial = pc::run(expr(), bad);

		REQUIRE(partial.size() == 1);
		REQUIRE(partial[0].value() == 1);
		REQUIRE(partial[0].remaining().cursor() == 1);
	}
}
