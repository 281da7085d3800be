#pragma once
#include <cstdint>

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "common.hpp"

namespace FuzzyPatch {

enum struct PatchFormat : uint8_t {
	UnifiedDiff,
	SearchReplace
};

/// Stable wire name: "unified_diff" or "search_replace"
FUZZYPATCH_API std::string_view format_name(PatchFormat format);

/// Classifies raw patch text. Any `--- `/`+++ ` line or a `@@ ... @@` line makes it a unified diff.
FUZZYPATCH_API PatchFormat detect_format(std::string_view text);

struct FUZZYPATCH_API HunkNumbers {
	uint32_t old_start = 0, old_count = 1, new_start = 0, new_count = 1;
};

FUZZYPATCH_API bool operator==(const HunkNumbers &lhs, const HunkNumbers &rhs);

struct FUZZYPATCH_API Hunk {
	HunkNumbers numbers;
	/// Raw body lines, prefix character included
	std::vector<std::string> body;
	size_t line = 0;
};

/// All hunks under one `---`/`+++` header pair
struct FUZZYPATCH_API FileHunkSet {
	std::string file_path;
	std::string old_path;
	std::string new_path;
	bool created = false;/// old side is /dev/null
	bool deleted = false;/// new side is /dev/null
	std::vector<Hunk> hunks;
	size_t line = 0;
};

struct FUZZYPATCH_API LineReader {
	std::string_view buf;
	size_t line;

	bool is_empty() const;

	bool is_triple_minus() const;

	bool is_triple_plus() const;

	bool is_hunk_header() const;

	bool is_diff() const;

	/// git extended header lines that may precede `---`
	bool is_git_preamble() const;

	/// ' ', '+', '-' or '\'
	bool has_body_prefix() const;

	Result<HunkNumbers> parse_numbers() const;

	/// Path of a `---`/`+++` header with its `a/`/`b/` prefix and timestamp removed; empty for /dev/null
	static std::string_view get_filename(std::string_view buf);
};

/// Pre-flight structural check of a unified diff
struct FUZZYPATCH_API DiffValidator {
	bool has_old_header = false;
	bool has_new_header = false;
	bool in_hunk = false;

	void reset();

	PatchError validate(std::string_view text);

	PatchError validate_line(const LineReader &line);
};

/// Splits a validated unified diff into per-file hunk sets
struct FUZZYPATCH_API DiffReader {
	std::ostream *tracing = nullptr;

	std::vector<FileHunkSet> parse(std::string_view text);
};

/// Applies one hunk to `content` by trusting its header offsets, shifted by `offset` lines.
FUZZYPATCH_API Result<std::string> apply_hunk(std::string_view content, const Hunk &hunk, int64_t offset = 0);

/// Net line-count change a hunk produces: kept and added body lines minus old_count
FUZZYPATCH_API int64_t hunk_line_delta(const Hunk &hunk);

FUZZYPATCH_API std::ostream &operator<<(std::ostream &s, const HunkNumbers &nums);

FUZZYPATCH_API std::ostream &operator<<(std::ostream &s, const LineReader &line);

};// namespace FuzzyPatch
