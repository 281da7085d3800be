#include <array>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <tuple>

#include <FuzzyPatch/Matcher.hpp>

using namespace FuzzyPatch;

TEST(Similarity, ratio) {
	auto cases = std::to_array<std::tuple<std::string, std::string, double>>({
		{"", "", 1.0},
		{"abc", "abc", 1.0},
		{"abc", "xyz", 0.0},
		{"abcd", "bcde", 0.75},
		{"abcdefghij0123456789", "abcdefghij01234VWXYZ", 0.75},
		{"abcdefghij0123456789", "abcdefghij012VWXYZQR", 0.65},
		{"abc", "", 0.0},
	});
	for(auto &[a, b, expected]: cases) {
		ASSERT_DOUBLE_EQ(Similarity::ratio(a, b), expected) << a << " / " << b;
	}
}

TEST(Similarity, matching_characters) {
	// "ab" then "d" on the right of it
	ASSERT_EQ(Similarity::matching_characters("abxd", "abd"), 3u);
	ASSERT_EQ(Similarity::matching_characters("qabxcd", "abycdf"), 4u);
}

TEST(Similarity, normalize) {
	ASSERT_EQ(Similarity::normalize_line("   def   f( ) :  Int\t= 1  "), "def f( ) : Int = 1");
	ASSERT_EQ(Similarity::normalize_line("\t\t"), "");
	ASSERT_EQ(Similarity::normalize_text("  a   b\n\n\t c\r\n"), "a b\n\nc");
}

TEST(ContentMatcher, exact_first_occurrence) {
	ContentMatcher matcher;
	auto some_match = matcher.find("a\ndup\ndup\ndup", "dup");
	ASSERT_TRUE(some_match.has_value());
	ASSERT_EQ(some_match->tier, MatchTier::Exact);
	ASSERT_EQ(some_match->start, 2u);
	ASSERT_EQ(some_match->end, 5u);
	ASSERT_DOUBLE_EQ(some_match->ratio, 1.0);
}

TEST(ContentMatcher, normalized) {
	ContentMatcher matcher;
	std::string content = "object A {\n  def f() = {\n      1 +   2\n  }\n}\n";
	auto some_match = matcher.find(content, "def f() = {\n  1 + 2\n}");
	ASSERT_TRUE(some_match.has_value());
	ASSERT_EQ(some_match->tier, MatchTier::Normalized);
	ASSERT_EQ(content.substr(some_match->start, some_match->end - some_match->start), "  def f() = {\n      1 +   2\n  }");
	ASSERT_DOUBLE_EQ(some_match->ratio, 1.0);
}

TEST(ContentMatcher, normalized_ignores_crlf) {
	ContentMatcher matcher;
	std::string content = "a\r\n  val   x =  1\r\nb\r\n";
	auto some_match = matcher.find(content, "val x = 1");
	ASSERT_TRUE(some_match.has_value());
	ASSERT_EQ(some_match->tier, MatchTier::Normalized);
	ASSERT_EQ(content.substr(some_match->start, some_match->end - some_match->start), "  val   x =  1");
}

TEST(ContentMatcher, whitespace_tolerance) {
	ContentMatcher matcher;
	std::string content = "object A {\n  def f(): Int = 1\n}\n";
	auto some_match = matcher.find(content, "def  f( ):Int=1");
	ASSERT_TRUE(some_match.has_value());
	ASSERT_NE(some_match->tier, MatchTier::Exact);
	ASSERT_EQ(content.substr(some_match->start, some_match->end - some_match->start), "  def f(): Int = 1");
}

TEST(ContentMatcher, fuzzy_threshold_boundary) {
	ContentMatcher matcher;
	std::string content = "header\nabcdefghij0123456789\nfooter\n";

	auto some_match = matcher.find(content, "abcdefghij01234VWXYZ");
	ASSERT_TRUE(some_match.has_value());
	ASSERT_EQ(some_match->tier, MatchTier::Fuzzy);
	ASSERT_DOUBLE_EQ(some_match->ratio, 0.75);
	ASSERT_EQ(content.substr(some_match->start, some_match->end - some_match->start), "abcdefghij0123456789");

	some_match = matcher.find(content, "abcdefghij012VWXYZQR");
	ASSERT_FALSE(some_match.has_value());
	ASSERT_EQ(some_match.error().code, PatchErrorCode::NotFound);
	ASSERT_EQ(some_match.error().message, "Search text not found: abcdefghij012VWXYZQR");
}

TEST(ContentMatcher, thresholds_are_configurable) {
	ContentMatcher strict {.options = {.exact_only = true}, .tracing = nullptr};
	ASSERT_FALSE(strict.find("abcdefghij0123456789", "abcdefghij01234VWXYZ").has_value());
	ASSERT_FALSE(strict.find("  val   x =  1", "val x = 1").has_value());

	ContentMatcher lax {.options = {.fuzzy_threshold = 0.6}, .tracing = nullptr};
	ASSERT_TRUE(lax.find("abcdefghij0123456789", "abcdefghij012VWXYZQR").has_value());
}

TEST(ContentMatcher, multiline_fuzzy_window) {
	ContentMatcher matcher;
	std::string content =
		"object Calc {\n"
		"  def add(a: Int, b: Int): Int = a + b\n"
		"  def sub(a: Int, b: Int): Int = a - b\n"
		"}\n";
	auto some_match = matcher.find(content, "def add(a: Int, b: Int): Int = a+b\ndef sub(a: Int, b: Int): Int = a-b");
	ASSERT_TRUE(some_match.has_value());
	ASSERT_EQ(content.substr(some_match->start, some_match->end - some_match->start),
		"  def add(a: Int, b: Int): Int = a + b\n  def sub(a: Int, b: Int): Int = a - b");
}

TEST(ContentMatcher, not_found) {
	std::ostringstream trace;
	ContentMatcher matcher {.options = {}, .tracing = &trace};
	std::string search(150, 'q');
	auto some_match = matcher.find("object T { val x = 1 }", search);
	ASSERT_FALSE(some_match.has_value());
	ASSERT_EQ(some_match.error().message, "Search text not found: " + std::string(100, 'q') + "...");
	ASSERT_NE(trace.str().find("Fuzzy candidate rejected"), std::string::npos);

	some_match = matcher.find("anything", "");
	ASSERT_FALSE(some_match.has_value());
	ASSERT_EQ(some_match.error().code, PatchErrorCode::NotFound);

	// very low similarity
	ASSERT_FALSE(matcher.find("completely different content", "xyz123").has_value());
}

TEST(ContentMatcher, truncation_keeps_utf8_whole) {
	ContentMatcher matcher;
	// 99 ASCII bytes then a two-byte sequence straddling the limit
	std::string search = std::string(99, 'q') + "\xC3\xA9" + "zzz";
	auto some_match = matcher.find("x", search);
	ASSERT_FALSE(some_match.has_value());
	ASSERT_EQ(some_match.error().message, "Search text not found: " + std::string(99, 'q') + "...");
}

TEST(Indentation, reconcile) {
	auto cases = std::to_array<std::tuple<std::string, std::string, std::string>>({
		{"      a\n      b", "x\ny\nz", "      x\n      y\n      z"},
		{"  a\n    b", "x\ny\nz", "  x\n    y\n    z"},
		{"  a\n\n  b", "x\n\ny", "  x\n\n  y"},
		{"a", "  x\n    y", "x\ny"},
		{"\ta\n\t\tb\nc", "x\ny\nz\nw", "\tx\n\t\ty\nz\n\t\tw"},
		{"    a", "", ""},
	});
	for(auto &[original, replacement, expected]: cases) {
		ASSERT_EQ(reconcile_indentation(original, replacement), expected) << original << " / " << replacement;
	}

	ASSERT_EQ(reconcile_indentation("  a\r\n  b", "x\ny\nz", "\r\n"), "  x\r\n  y\r\n  z");
	ASSERT_EQ(reconcile_indentation("  a\r\n  b", "x\r\ny", "\r\n"), "  x\r\n  y");
}

TEST(FuzzyReplace, keeps_crlf) {
	auto res = fuzzy_replace("  a\r\n  b\r\n  c\r\n", "a\nb", "x\ny");
	ASSERT_TRUE(res.found);
	ASSERT_EQ(res.content, "  x\r\n  y\r\n  c\r\n");
}

TEST(FuzzyReplace, exact) {
	auto res = fuzzy_replace("object T{ val x=1 }", "val x=1", "val x=2");
	ASSERT_TRUE(res.found);
	ASSERT_DOUBLE_EQ(res.ratio, 1.0);
	ASSERT_EQ(res.content, "object T{ val x=2 }");
	ASSERT_TRUE(res.match.has_value());
	ASSERT_EQ(res.match->tier, MatchTier::Exact);
}

TEST(FuzzyReplace, high_similarity) {
	std::string content = "object Test {\n  def hello(): String = \"Hello World\"\n}\n";
	auto res = fuzzy_replace(content, "def hello(): String = \"Hello World!\"", "def hello(): String = \"Hi\"");
	ASSERT_TRUE(res.found);
	ASSERT_GT(res.ratio, 0.9);
	ASSERT_EQ(res.content, "object Test {\n  def hello(): String = \"Hi\"\n}\n");
}

TEST(FuzzyReplace, low_similarity) {
	std::string content = "object Test {\n  def hello(): String = \"Hello World\"\n}\n";
	auto res = fuzzy_replace(content, "completely unrelated text that is not here", "x");
	ASSERT_FALSE(res.found);
	ASSERT_EQ(res.content, content);
	ASSERT_FALSE(res.match.has_value());
}

TEST(FuzzyReplace, empty_search) {
	auto res = fuzzy_replace("content", "", "x");
	ASSERT_FALSE(res.found);
	ASSERT_EQ(res.content, "content");

	res = fuzzy_replace("content", "  \n ", "x");
	ASSERT_FALSE(res.found);
}

TEST(FuzzyReplace, repeated_patterns) {
	auto res = fuzzy_replace("val a = 1\nval a = 1\nval a = 1\n", "val a = 1", "val a = 2");
	ASSERT_TRUE(res.found);
	ASSERT_EQ(res.content, "val a = 2\nval a = 1\nval a = 1\n");
}

TEST(FuzzyReplace, multiline_reindents) {
	std::string content = "object A {\n  def f() = {\n      1 +   2\n  }\n}\n";
	auto res = fuzzy_replace(content, "def f() = {\n  1 + 2\n}", "def f() = {\n3\n}");
	ASSERT_TRUE(res.found);
	ASSERT_EQ(res.content, "object A {\n  def f() = {\n      3\n  }\n}\n");
}
