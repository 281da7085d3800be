#include <iostream>
#include <string_view>
#include <vector>

#include "FuzzyPatch/cli.hpp"

int main(int argc, char **argv) {
	std::vector<std::string_view> args(argv + 1, argv + argc);
	return FuzzyPatch::run_cli(args, std::cin, std::cout, std::cerr);
}
