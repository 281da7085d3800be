#include <array>
#include <gtest/gtest.h>
#include <sstream>
#include <tuple>
#include <utility>

#include <FuzzyPatch/UnifiedDiff.hpp>

using namespace FuzzyPatch;

TEST(UnifiedDiff, numbers) {
	auto cases = std::to_array<std::pair<std::string, HunkNumbers>>({
		{"@@ -123,456 +789,101112 @@", {123, 456, 789, 101112}},
		{"@@ -123 +789,101112 @@", {123, 1, 789, 101112}},
		{"@@ -123,456 +789 @@", {123, 456, 789, 1}},
		{"@@ -123 +789 @@", {123, 1, 789, 1}},
		{"@@ -0,0 +1,3 @@", {0, 0, 1, 3}},
		{"@@ -12,7 +12,8 @@ object Main {", {12, 7, 12, 8}},
		{"@@ -4294967295 +1,4294967295 @@", {4294967295u, 1, 1, 4294967295u}},
	});
	for(auto &c: cases) {
		LineReader line {.buf = c.first, .line = 1};
		auto numbers_some = line.parse_numbers();
		ASSERT_TRUE(numbers_some.has_value()) << c.first;
		ASSERT_EQ(*numbers_some, c.second);
	}
}

TEST(UnifiedDiff, bad_numbers) {
	auto cases = std::to_array<std::string>({
		"@@ -1,2 +3,4",
		"@@ -a +1 @@",
		"@@ 1,2 +3,4 @@",
		"@@ -1, +3 @@",
		"@@ -1 3 @@",
		"@@ -1 +3@@",
		"@@@ -1 +1 @@@",
		"@@ -4294967297,1 +1,1 @@",
		"@@ -4294967296 +1 @@",
		"@@ -1 +1,99999999999 @@",
	});
	for(auto &c: cases) {
		LineReader line {.buf = c, .line = 7};
		auto numbers_some = line.parse_numbers();
		ASSERT_FALSE(numbers_some.has_value()) << c;
		ASSERT_EQ(numbers_some.error().code, PatchErrorCode::InvalidHunkHeader);
		ASSERT_EQ(numbers_some.error().line, 7u);
	}
}

TEST(UnifiedDiff, get_filename) {
	auto cases = std::to_array<std::pair<std::string, std::string>>({
		{" a/hello/world", "hello/world"},
		{" b/world/hello", "world/hello"},
		{"  a/hello/world", "hello/world"},
		{"   b/world/hello\t", "world/hello"},
		{" /dev/null\t", ""},
		{" src/Main.scala\t2024-01-01 10:00:00.000000000 +0000", "src/Main.scala"},
		{" /dev/null", ""},
	});
	for(auto &c: cases) {
		auto p = LineReader::get_filename(c.first);
		ASSERT_EQ(p, c.second);
	}
}

TEST(UnifiedDiff, detect_format) {
	auto cases = std::to_array<std::pair<std::string, PatchFormat>>({
		{"--- a/x\n+++ b/x\n@@ -1 +1 @@\n-a\n+b\n", PatchFormat::UnifiedDiff},
		{"+++ b/x\n", PatchFormat::UnifiedDiff},
		{"some text\n@@ -1 +1 @@\n", PatchFormat::UnifiedDiff},
		{"x.scala\n<<<<<<< SEARCH\na\n=======\nb\n>>>>>>> REPLACE", PatchFormat::SearchReplace},
		{"@@ not a hunk", PatchFormat::SearchReplace},
		{"---no space\n", PatchFormat::SearchReplace},
		{"", PatchFormat::SearchReplace},
	});
	for(auto &c: cases) {
		ASSERT_EQ(detect_format(c.first), c.second) << c.first;
	}
	ASSERT_EQ(format_name(PatchFormat::UnifiedDiff), "unified_diff");
	ASSERT_EQ(format_name(PatchFormat::SearchReplace), "search_replace");
}

TEST(UnifiedDiff, parse_files) {
	std::string s {
		"diff --git a/src/A.scala b/src/A.scala\n"
		"index 123abc..456def 100644\n"
		"--- a/src/A.scala\n"
		"+++ b/src/A.scala\n"
		"@@ -1,2 +1,2 @@\n"
		" object A {\n"
		"-  val x = 1\n"
		"+  val x = 2\n"
		"@@ -10 +10 @@\n"
		"-z\n"
		"+y\n"
		"--- /dev/null\n"
		"+++ b/New.scala\n"
		"@@ -0,0 +1 @@\n"
		"+object New\n"
		"--- a/Gone.scala\n"
		"+++ /dev/null\n"
		"@@ -1 +0,0 @@\n"
		"-object Gone\n"};

	std::ostringstream trace;
	DiffReader reader {.tracing = &trace};
	auto sets = reader.parse(s);
	ASSERT_EQ(sets.size(), 3u);

	ASSERT_EQ(sets[0].file_path, "src/A.scala");
	ASSERT_EQ(sets[0].line, 3u);
	ASSERT_FALSE(sets[0].created);
	ASSERT_FALSE(sets[0].deleted);
	ASSERT_EQ(sets[0].hunks.size(), 2u);
	ASSERT_EQ(sets[0].hunks[0].numbers, (HunkNumbers {1, 2, 1, 2}));
	ASSERT_EQ(sets[0].hunks[0].body, (std::vector<std::string> {" object A {", "-  val x = 1", "+  val x = 2"}));
	ASSERT_EQ(sets[0].hunks[1].numbers, (HunkNumbers {10, 1, 10, 1}));
	ASSERT_EQ(sets[0].hunks[1].line, 9u);

	ASSERT_EQ(sets[1].file_path, "New.scala");
	ASSERT_TRUE(sets[1].created);
	ASSERT_EQ(sets[1].hunks.size(), 1u);

	ASSERT_EQ(sets[2].file_path, "Gone.scala");
	ASSERT_TRUE(sets[2].deleted);

	ASSERT_NE(trace.str().find("Files: old: src/A.scala"), std::string::npos);
}

TEST(UnifiedDiff, apply_hunk) {
	Hunk h {.numbers = {2, 1, 2, 1}, .body = {"-b", "+B"}, .line = 3};

	auto some_res = apply_hunk("a\nb\nc\n", h);
	ASSERT_TRUE(some_res.has_value());
	ASSERT_EQ(*some_res, "a\nB\nc\n");

	// no newline at the end stays that way
	some_res = apply_hunk("a\nb", h);
	ASSERT_TRUE(some_res.has_value());
	ASSERT_EQ(*some_res, "a\nB");

	some_res = apply_hunk("a\r\nb\r\nc\r\n", h);
	ASSERT_TRUE(some_res.has_value());
	ASSERT_EQ(*some_res, "a\r\nB\r\nc\r\n");
}

TEST(UnifiedDiff, apply_hunk_keeps_crlf) {
	auto cases = std::to_array<std::pair<std::string, std::string>>({
		{"one\r\ntwo\r\nthree\r\nfour\r\n", "one\r\nTWO\r\nthree\r\nfour\r\n"},
		{"one\r\ntwo\r\nthree\r\nfour", "one\r\nTWO\r\nthree\r\nfour"},
		{"one\ntwo\nthree\nfour\n", "one\nTWO\nthree\nfour\n"},
	});
	Hunk h {.numbers = {2, 1, 2, 1}, .body = {"-two", "+TWO"}, .line = 3};
	for(auto &c: cases) {
		auto some_res = apply_hunk(c.first, h);
		ASSERT_TRUE(some_res.has_value()) << c.first;
		ASSERT_EQ(*some_res, c.second);
	}
}

TEST(UnifiedDiff, apply_hunk_to_new_file) {
	Hunk h {.numbers = {0, 0, 1, 2}, .body = {"+object New", "+// created"}, .line = 3};
	auto some_res = apply_hunk("", h);
	ASSERT_TRUE(some_res.has_value());
	ASSERT_EQ(*some_res, "object New\n// created\n");
}

TEST(UnifiedDiff, apply_hunk_trusts_header_offsets) {
	// the removed and context lines are not compared with the file
	Hunk h {.numbers = {1, 1, 1, 1}, .body = {"-something else", "+new"}, .line = 3};
	auto some_res = apply_hunk("old\nkept\n", h);
	ASSERT_TRUE(some_res.has_value());
	ASSERT_EQ(*some_res, "new\nkept\n");
}

TEST(UnifiedDiff, apply_hunk_ignores_markers_and_empty_lines) {
	Hunk h {.numbers = {1, 2, 1, 2}, .body = {" a", "", "-b", "+c", "\\ No newline at end of file"}, .line = 3};
	auto some_res = apply_hunk("a\nb", h);
	ASSERT_TRUE(some_res.has_value());
	ASSERT_EQ(*some_res, "a\nc");
}

TEST(UnifiedDiff, apply_hunk_with_offset) {
	Hunk h {.numbers = {3, 1, 3, 1}, .body = {"-c", "+C"}, .line = 3};
	auto some_res = apply_hunk("a\nb\nc\nd\n", h, 1);
	ASSERT_TRUE(some_res.has_value());
	ASSERT_EQ(*some_res, "a\nb\nc\nC\n");

	some_res = apply_hunk("a\nb\nc\nd\n", h, -10);
	ASSERT_TRUE(some_res.has_value());
	ASSERT_EQ(*some_res, "C\nb\nc\nd\n");
}

TEST(UnifiedDiff, apply_hunk_out_of_range) {
	Hunk h {.numbers = {10, 1, 10, 1}, .body = {"-x", "+y"}, .line = 5};
	auto some_res = apply_hunk("a\n", h);
	ASSERT_FALSE(some_res.has_value());
	ASSERT_EQ(some_res.error().code, PatchErrorCode::HunkOutOfRange);
	ASSERT_EQ(some_res.error().line, 5u);

	// appending right after the last line is fine
	Hunk append {.numbers = {2, 0, 2, 1}, .body = {"+b"}, .line = 5};
	some_res = apply_hunk("a\n", append);
	ASSERT_TRUE(some_res.has_value());
	ASSERT_EQ(*some_res, "a\nb\n");
}

TEST(UnifiedDiff, hunk_line_delta) {
	Hunk h {.numbers = {1, 2, 1, 3}, .body = {" a", "-b", "+B", "+C"}, .line = 1};
	ASSERT_EQ(hunk_line_delta(h), 1);

	Hunk removal {.numbers = {1, 2, 1, 0}, .body = {"-a", "-b"}, .line = 1};
	ASSERT_EQ(hunk_line_delta(removal), -2);
}
