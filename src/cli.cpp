#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "FuzzyPatch/cli.hpp"
#include "FuzzyPatch/json.hpp"

namespace FuzzyPatch {

static void usage(std::ostream &s) {
	s << "Usage: fuzzypatch [options] <base-dir> <workspace> [patch-file|-]\n"
		 "\n"
		 "Applies a unified diff or a SEARCH/REPLACE block list to <base-dir>/<workspace>\n"
		 "and prints the result as JSON. The patch is read from stdin when no file is given.\n"
		 "\n"
		 "  --trace                   trace every step to stderr\n"
		 "  --exact                   only accept exact matches of search blocks\n"
		 "  --track-offsets           shift hunks by the line delta of earlier hunks\n"
		 "  --normalized-threshold=X  similarity needed by whitespace-normalized matches (0.8)\n"
		 "  --fuzzy-threshold=X       similarity needed by fuzzy matches (0.7)\n"
		 "\n"
		 "Exit status: 0 when the patch applied, 1 when it did not, 2 on usage or workspace errors.\n";
}

static bool parse_ratio(std::string_view arg, std::string_view prefix, double &out) {
	if(!arg.starts_with(prefix)) {
		return false;
	}
	std::istringstream in {std::string(arg.substr(prefix.size()))};
	double value;
	if(!(in >> value) || !in.eof() || value < 0.0 || value > 1.0) {
		throw std::invalid_argument("invalid value for " + std::string(prefix.substr(0, prefix.size() - 1)) + ": " + std::string(arg.substr(prefix.size())));
	}
	out = value;
	return true;
}

static int status(ExitStatus s) {
	return static_cast<int>(s);
}

int run_cli(const std::vector<std::string_view> &args, std::istream &in, std::ostream &out, std::ostream &err) {
	ApplyOptions options;
	std::vector<std::string> positional;

	try {
		for(auto arg: args) {
			if(arg == "--help" || arg == "-h") {
				usage(out);
				return status(ExitStatus::Applied);
			} else if(arg == "--trace") {
				options.tracing = &err;
			} else if(arg == "--exact") {
				options.matching.exact_only = true;
			} else if(arg == "--track-offsets") {
				options.track_line_offset = true;
			} else if(parse_ratio(arg, "--normalized-threshold=", options.matching.normalized_threshold)) {
			} else if(parse_ratio(arg, "--fuzzy-threshold=", options.matching.fuzzy_threshold)) {
			} else if(arg.starts_with("--")) {
				err << "Unknown option " << arg << std::endl;
				usage(err);
				return status(ExitStatus::UsageError);
			} else {
				positional.emplace_back(arg);
			}
		}
	} catch(const std::invalid_argument &e) {
		err << e.what() << std::endl;
		return status(ExitStatus::UsageError);
	}

	if(positional.size() < 2 || positional.size() > 3) {
		usage(err);
		return status(ExitStatus::UsageError);
	}

	std::string patch;
	if(positional.size() == 3 && positional[2] != "-") {
		std::ifstream file(positional[2], std::ios::binary);
		if(!file) {
			err << "Cannot open patch file " << positional[2] << std::endl;
			return status(ExitStatus::UsageError);
		}
		patch.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
	} else {
		patch.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
	}

	PatchEngine engine {positional[0], nullptr, options};
	auto some_result = engine.apply_patch(positional[1], patch);
	if(!some_result) {
		err << some_result.error() << std::endl;
		return status(ExitStatus::UsageError);
	}

	out << json(*some_result).dump(2) << std::endl;
	return status(some_result->patch_applied ? ExitStatus::Applied : ExitStatus::NotApplied);
}

}// namespace FuzzyPatch
