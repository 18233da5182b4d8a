/**
 * A common example limitation for regular languages is the language a^n b^n.
 * Parses user-input, and tells if it's a^n b^n, n > 0.
 */

#include <iostream>
#include <string>
#include <moncmb/moncmb.hpp>

namespace pc = moncmb;

using rule = pc::parser<int, pc::string_input>;

// anbn ::= 'a' anbn 'b' | 'a' 'b'
// The value is n
rule anbn() {
    static auto const p = rule(pc::pass
        | pc::let(
            pc::element('a'),
            pc::lazy(anbn),
            pc::element('b'),
            [](char, int n, char) { return pc::result(n + 1); })
        | pc::and_p(pc::element('a'), pc::element('b'), pc::result(1))
    );
    return p;
}

int main() {
    std::string line;

    while (std::getline(std::cin, line)) {
        auto ns = pc::parse_all(anbn(), line);
        if (!ns.empty()) {
            std::cout << "Input matches a^n b^n with n = " << ns.front() << "!" << std::endl;
        }
        else {
            std::cout << "Input does not match a^n b^n!" << std::endl;
        }
    }

    return 0;
}
