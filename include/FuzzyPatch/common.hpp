#pragma once
#include <cstdint>

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#if __has_include(<expected>)
	#include <expected>
#endif

#if !defined(__cpp_lib_expected)
	#if __has_include(<tl/expected.hpp>)
		#include <tl/expected.hpp>
	#else
		#if __has_include(<nonstd/expected.hpp>)
			#include <nonstd/expected.hpp>
		#else
			#error "Your compiler doesn't support std::expected and you have no polyfills (https://github.com/TartanLlama/expected, https://github.com/martinmoene/expected-lite) installed."
		#endif
	#endif
#endif

#ifdef _MSC_VER
	#define FUZZYPATCH_EXPORT_API __declspec(dllexport)
	#define FUZZYPATCH_IMPORT_API __declspec(dllimport)
#else
	#ifdef _WIN32
		#define FUZZYPATCH_EXPORT_API [[gnu::dllexport]]
		#define FUZZYPATCH_IMPORT_API [[gnu::dllimport]]
	#else
		#define FUZZYPATCH_EXPORT_API [[gnu::visibility("default")]]
		#define FUZZYPATCH_IMPORT_API
	#endif
#endif

#ifdef FUZZYPATCH_EXPORTS
	#define FUZZYPATCH_API FUZZYPATCH_EXPORT_API
#else
	#define FUZZYPATCH_API FUZZYPATCH_IMPORT_API
#endif

namespace FuzzyPatch {

#if defined(__cpp_lib_expected)
	template <typename T, typename E>
	using expected = std::expected<T, E>;

	template <typename E>
	using unexpected = std::unexpected<E>;
#else
	#if __has_include(<tl/expected.hpp>)
		template <typename T, typename E>
		using expected = tl::expected<T, E>;

		template <typename E>
		using unexpected = tl::unexpected<E>;
	#else
		template <typename T, typename E>
		using expected = nonstd::expected<T, E>;

		template <typename E>
		using unexpected = nonstd::unexpected<E>;
	#endif
#endif

enum struct PatchErrorCode : uint8_t {
	OK = 0,
	EmptyPatch,
	InvalidOldFileHeader,
	MissingOldFileHeader,
	MissingFileHeaders,
	InvalidHunkHeader,
	InvalidLinePrefix,
	UnifiedDiffError,
	SearchReplaceError,
	WorkspaceNotFound,
	UnsafePath,
	IoError,
	NotFound,
	HunkOutOfRange,
	IndexError
};

/// Stable wire name of an error code, e.g. "MISSING_OLD_FILE_HEADER"
FUZZYPATCH_API std::string_view error_code_name(PatchErrorCode code);

struct FUZZYPATCH_API PatchError {
	PatchErrorCode code = PatchErrorCode::OK;
	/// 1-based line in the patch text, 0 when the error is not tied to a line
	uint64_t line = 0;
	std::string message;

	constexpr operator bool() const {
		return code != PatchErrorCode::OK;
	}
};

template <typename T> using Result = expected<T, PatchError>;

FUZZYPATCH_API PatchError make_error(PatchErrorCode code, std::string message, uint64_t line = 0);

FUZZYPATCH_API std::ostream &operator<<(std::ostream &s, const PatchError &err);

namespace TextUtils {
/// Splits on '\n' and drops a trailing '\r' from every line. A trailing newline
/// does not produce an empty last line, so "a\nb\n" and "a\nb" both give {a, b}.
FUZZYPATCH_API std::vector<std::string_view> split_lines(std::string_view text);

/// Splits on '\n' keeping every piece, like Python's str.split('\n')
FUZZYPATCH_API std::vector<std::string_view> split_keep_empty(std::string_view text);

FUZZYPATCH_API std::string join_lines(const std::vector<std::string> &lines, std::string_view eol = "\n");

/// "\r\n" when the first line of `text` ends with it, "\n" otherwise
FUZZYPATCH_API std::string_view line_ending(std::string_view text);

FUZZYPATCH_API bool is_space(char c);

FUZZYPATCH_API std::string_view trim(std::string_view s);

FUZZYPATCH_API std::string_view leading_whitespace(std::string_view s);

FUZZYPATCH_API bool is_blank(std::string_view s);
};// namespace TextUtils

};// namespace FuzzyPatch
