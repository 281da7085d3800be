#pragma once
#include <cstdint>

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "common.hpp"

namespace FuzzyPatch {

namespace Similarity {
/// Total size of the matching blocks found by Ratcliff/Obershelp pattern matching
FUZZYPATCH_API size_t matching_characters(std::string_view a, std::string_view b);

/// 2*M/T in [0, 1], the same measure as difflib.SequenceMatcher.ratio() without junk heuristics
FUZZYPATCH_API double ratio(std::string_view a, std::string_view b);

/// Trims the line and collapses inner whitespace runs into one space
FUZZYPATCH_API std::string normalize_line(std::string_view line);

/// normalize_line() applied to every line, joined with '\n'
FUZZYPATCH_API std::string normalize_text(std::string_view text);
};// namespace Similarity

enum struct MatchTier : uint8_t {
	Exact,
	Normalized,/// whitespace-normalized text
	Fuzzy	   /// best similarity window over the whole file
};

FUZZYPATCH_API std::string_view tier_name(MatchTier tier);

/// Located region of a search block, a byte range of the searched content
struct FUZZYPATCH_API Match {
	size_t start = 0;
	size_t end = 0;
	MatchTier tier = MatchTier::Exact;
	double ratio = 1.0;
};

struct FUZZYPATCH_API MatchOptions {
	bool exact_only = false;
	double normalized_threshold = 0.8;
	double fuzzy_threshold = 0.7;
	/// lines around the normalized-text estimate that are tried as window starts
	size_t search_radius = 2;
	size_t message_prefix_limit = 100;
};

struct FUZZYPATCH_API ContentMatcher {
	MatchOptions options;
	std::ostream *tracing = nullptr;

	/// Tries exact, whitespace-normalized and fuzzy matching in that order
	Result<Match> find(std::string_view content, std::string_view search) const;

	std::optional<Match> find_exact(std::string_view content, std::string_view search) const;

	std::optional<Match> find_normalized(std::string_view content, std::string_view search) const;

	std::optional<Match> find_fuzzy(std::string_view content, std::string_view search) const;
};

/// Re-indents `replacement` line by line with the leading whitespace of `original`.
/// Extra replacement lines take the indentation of the last indented original line.
/// Lines are joined with `eol`, the line ending of the file the text goes into.
FUZZYPATCH_API std::string reconcile_indentation(std::string_view original, std::string_view replacement, std::string_view eol = "\n");

struct FUZZYPATCH_API FuzzyReplace {
	bool found = false;
	double ratio = 0.0;
	std::string content;
	std::optional<Match> match;
};

/// Finds `search` in `content` and substitutes the re-indented `replace` for it.
/// The content is returned unchanged when nothing matches; an empty search never matches.
FUZZYPATCH_API FuzzyReplace fuzzy_replace(std::string_view content, std::string_view search, std::string_view replace, const MatchOptions &options = {});

FUZZYPATCH_API std::ostream &operator<<(std::ostream &s, const Match &m);

};// namespace FuzzyPatch
