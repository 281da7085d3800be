#pragma once

#include <iosfwd>
#include <string_view>
#include <vector>

namespace FuzzyPatch {

/// Exit statuses of the command line tool
enum struct ExitStatus: int {
	Applied = 0,
	NotApplied = 1,
	UsageError = 2,
};

/// Runs the tool on `args` (without the program name). The patch comes from `in` unless a file is named,
/// the JSON result goes to `out`, and usage, errors and traces go to `err`.
int run_cli(const std::vector<std::string_view> &args, std::istream &in, std::ostream &out, std::ostream &err);

};// namespace FuzzyPatch
