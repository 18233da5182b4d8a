/**
 * A simple calculator for integer expressions with the usual precedences.
 * Reads an expression per line and prints its value.
 */

#include <cctype>
#include <cmath>
#include <iostream>
#include <string>
#include <utility>
#include <vector>
#include <moncmb/moncmb.hpp>

namespace pc = moncmb;

using rule = pc::parser<int, pc::string_input>;

int do_op(int x, char ch, int y) {
    switch (ch) {
    case '+': return x + y;
    case '-': return x - y;
    case '*': return x * y;
    case '/': return y == 0 ? 0 : x / y;
    case '^': return (int)std::pow(x, y); // For simplicity
    default: return 0;
    }
}

int to_num(std::vector<char> const& chs) {
    int n = 0;
    for (auto c : chs) n = n * 10 + (c - '0');
    return n;
}

// Left-associative chain: operand (op operand)*
template <typename Operand, typename Op>
auto chain_left(Operand operand, Op op) {
    return pc::let(
        operand,
        pc::zero_or_more(pc::let(
            op,
            operand,
            [](char o, int y) { return pc::result(std::make_pair(o, y)); })),
        [](int x, std::vector<std::pair<char, int>> const& rest) {
            for (auto const& [o, y] : rest) x = do_op(x, o, y);
            return pc::result(x);
        });
}

rule expr();

auto const digit = pc::satisfies([](char c) { return std::isdigit((unsigned char)c) != 0; });

auto const num = pc::first(pc::one_or_more(digit))[to_num];

// atom ::= '(' expr ')' | num
rule atom() {
    static auto const p = rule(pc::pass
        | pc::prog1(pc::and_p(pc::element('('), pc::lazy(expr)), pc::element(')'))
        | num
    );
    return p;
}

// expon ::= atom '^' expon | atom
rule expon() {
    static auto const p = rule(pc::pass
        | pc::let(
            pc::lazy(atom),
            pc::element('^'),
            pc::lazy(expon),
            [](int x, char op, int y) { return pc::result(do_op(x, op, y)); })
        | pc::lazy(atom)
    );
    return p;
}

rule mul() {
    static auto const p = rule(chain_left(pc::lazy(expon), pc::one_of('*', '/')));
    return p;
}

rule expr() {
    static auto const p = rule(chain_left(pc::lazy(mul), pc::one_of('+', '-')));
    return p;
}

int main() {
    std::string line;

    while (std::getline(std::cin, line)) {
        auto res = pc::parse_all(expr(), line);
        if (!res.empty()) {
            std::cout << "Result = " << res.front() << std::endl;
        }
        else {
            std::cout << "Failed to parse expression!" << std::endl;
        }
    }

    return 0;
}
