#pragma once
#include <cstdint>

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "common.hpp"

namespace FuzzyPatch {

namespace Markers {
constexpr std::string_view search = "<<<<<<< SEARCH";
constexpr std::string_view divider = "=======";
constexpr std::string_view replace = ">>>>>>> REPLACE";
};// namespace Markers

struct FUZZYPATCH_API SearchReplaceEdit {
	std::string file_path;
	std::string search;
	std::string replace;
	/// line of the file path in the patch
	size_t line = 0;
};

FUZZYPATCH_API bool operator==(const SearchReplaceEdit &lhs, const SearchReplaceEdit &rhs);

struct FUZZYPATCH_API SearchReplaceParse {
	std::vector<SearchReplaceEdit> edits;
	/// path lines of blocks that never reached their closing marker
	std::vector<size_t> dropped_blocks;
};

/// Reads `path / <<<<<<< SEARCH / ... / ======= / ... / >>>>>>> REPLACE` blocks
struct FUZZYPATCH_API SearchReplaceReader {
	enum struct State : uint8_t {
		Path,	/// waiting for a file path line
		Preamble,/// have a path, waiting for the SEARCH marker
		Search, /// collecting search lines
		Replace /// collecting replace lines
	};

	std::ostream *tracing = nullptr;

	SearchReplaceParse parse(std::string_view text);

	static bool is_marker(std::string_view line);
};

FUZZYPATCH_API std::ostream &operator<<(std::ostream &s, const SearchReplaceEdit &edit);

};// namespace FuzzyPatch
