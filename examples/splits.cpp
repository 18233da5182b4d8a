/**
 * Shows how an ambiguous grammar lists every interpretation.
 * Prints each way a line can be split into a nonempty head and the rest.
 */

#include <iostream>
#include <string>
#include <vector>
#include <moncmb/moncmb.hpp>

namespace pc = moncmb;

using rule = pc::parser<std::string, pc::string_input>;

// Every nonempty prefix, shortest first
rule head() {
    static auto const p = rule(pc::let(
        pc::item,
        [](char) {
            return pc::plus(pc::result(std::string()), pc::lazy(head));
        },
        [](char c, std::string const& tail) { return pc::result(c + tail); }
    ));
    return p;
}

int main() {
    auto split = pc::let(
        pc::lazy(head),
        pc::zero_or_more(pc::item),
        [](std::string const& l, std::vector<char> const& r) {
            return pc::result(l + " | " + std::string(r.begin(), r.end()));
        });

    std::string line;
    while (std::getline(std::cin, line)) {
        auto all = pc::parse_all(split, line);
        std::cout << all.size() << " interpretation(s):" << std::endl;
        for (auto const& s : all) {
            std::cout << "  " << s << std::endl;
        }
    }

    return 0;
}
