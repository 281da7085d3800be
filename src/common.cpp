#include <iostream>

#include "FuzzyPatch/common.hpp"

namespace FuzzyPatch {

std::string_view error_code_name(PatchErrorCode code) {
	switch(code) {
		case PatchErrorCode::OK:
			return "OK";
		case PatchErrorCode::EmptyPatch:
			return "EMPTY_PATCH";
		case PatchErrorCode::InvalidOldFileHeader:
			return "INVALID_OLD_FILE_HEADER";
		case PatchErrorCode::MissingOldFileHeader:
			return "MISSING_OLD_FILE_HEADER";
		case PatchErrorCode::MissingFileHeaders:
			return "MISSING_FILE_HEADERS";
		case PatchErrorCode::InvalidHunkHeader:
			return "INVALID_HUNK_HEADER";
		case PatchErrorCode::InvalidLinePrefix:
			return "INVALID_LINE_PREFIX";
		case PatchErrorCode::UnifiedDiffError:
			return "UNIFIED_DIFF_ERROR";
		case PatchErrorCode::SearchReplaceError:
			return "SEARCH_REPLACE_ERROR";
		case PatchErrorCode::WorkspaceNotFound:
			return "WORKSPACE_NOT_FOUND";
		case PatchErrorCode::UnsafePath:
			return "UNSAFE_PATH";
		case PatchErrorCode::IoError:
			return "IO_ERROR";
		case PatchErrorCode::NotFound:
			return "NOT_FOUND";
		case PatchErrorCode::HunkOutOfRange:
			return "HUNK_OUT_OF_RANGE";
		case PatchErrorCode::IndexError:
			return "INDEX_ERROR";
	}
	return "UNKNOWN";
}

PatchError make_error(PatchErrorCode code, std::string message, uint64_t line) {
	return PatchError {
		.code = code,
		.line = line,
		.message = std::move(message),
	};
}

std::ostream &operator<<(std::ostream &s, const PatchError &err) {
	switch(err.code) {
		case PatchErrorCode::OK: {
			return s << "OK";
		} break;
		case PatchErrorCode::EmptyPatch:
		case PatchErrorCode::UnifiedDiffError:
		case PatchErrorCode::SearchReplaceError:
		case PatchErrorCode::WorkspaceNotFound:
		case PatchErrorCode::IndexError: {
			return s << error_code_name(err.code) << ": " << err.message;
		} break;
		case PatchErrorCode::InvalidOldFileHeader:
		case PatchErrorCode::MissingOldFileHeader:
		case PatchErrorCode::MissingFileHeaders:
		case PatchErrorCode::InvalidHunkHeader:
		case PatchErrorCode::InvalidLinePrefix: {
			return s << error_code_name(err.code) << " at line " << err.line << ": " << err.message;
		} break;
		case PatchErrorCode::UnsafePath:
		case PatchErrorCode::IoError:
		case PatchErrorCode::NotFound:
		case PatchErrorCode::HunkOutOfRange: {
			return s << err.message;
		} break;
	}
	return s;
}

namespace TextUtils {

static std::string_view strip_cr(std::string_view line) {
	if(!line.empty() && line.back() == '\r') {
		line.remove_suffix(1);
	}
	return line;
}

std::vector<std::string_view> split_lines(std::string_view text) {
	std::vector<std::string_view> lines;
	size_t start = 0;
	while(start < text.size()) {
		auto end = text.find('\n', start);
		if(end == std::string_view::npos) {
			lines.emplace_back(strip_cr(text.substr(start)));
			break;
		}
		lines.emplace_back(strip_cr(text.substr(start, end - start)));
		start = end + 1;
	}
	return lines;
}

std::vector<std::string_view> split_keep_empty(std::string_view text) {
	std::vector<std::string_view> pieces;
	for(size_t start = 0, end = text.find('\n');; start = end + 1, end = text.find('\n', start)) {
		if(end == std::string_view::npos) {
			pieces.emplace_back(text.substr(start));
			break;
		}
		pieces.emplace_back(text.substr(start, end - start));
	}
	return pieces;
}

std::string join_lines(const std::vector<std::string> &lines, std::string_view eol) {
	std::string res;
	for(size_t i = 0; i < lines.size(); ++i) {
		if(i) {
			res += eol;
		}
		res += lines[i];
	}
	return res;
}

std::string_view line_ending(std::string_view text) {
	auto nl = text.find('\n');
	if(nl != std::string_view::npos && nl > 0 && text[nl - 1] == '\r') {
		return "\r\n";
	}
	return "\n";
}

bool is_space(char c) {
	return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string_view trim(std::string_view s) {
	while(!s.empty() && is_space(s.front())) {
		s.remove_prefix(1);
	}
	while(!s.empty() && is_space(s.back())) {
		s.remove_suffix(1);
	}
	return s;
}

std::string_view leading_whitespace(std::string_view s) {
	size_t n = 0;
	while(n < s.size() && is_space(s[n])) {
		++n;
	}
	return s.substr(0, n);
}

bool is_blank(std::string_view s) {
	return trim(s).empty();
}

};// namespace TextUtils

}// namespace FuzzyPatch
