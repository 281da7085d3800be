#include <algorithm>
#include <cstdint>
#include <iostream>
#include <sstream>

#include "FuzzyPatch/UnifiedDiff.hpp"

namespace FuzzyPatch {

using namespace TextUtils;

std::string_view format_name(PatchFormat format) {
	switch(format) {
		case PatchFormat::UnifiedDiff:
			return "unified_diff";
		case PatchFormat::SearchReplace:
			return "search_replace";
	}
	return "unknown";
}

PatchFormat detect_format(std::string_view text) {
	for(auto line: split_lines(text)) {
		if(line.starts_with("--- ") || line.starts_with("+++ ")) {
			return PatchFormat::UnifiedDiff;
		}
		if(line.starts_with("@@ ") && line.ends_with(" @@")) {
			return PatchFormat::UnifiedDiff;
		}
	}
	return PatchFormat::SearchReplace;
}

bool operator==(const HunkNumbers &lhs, const HunkNumbers &rhs) {
	return lhs.old_start == rhs.old_start && lhs.old_count == rhs.old_count && lhs.new_start == rhs.new_start && lhs.new_count == rhs.new_count;
}

std::ostream &operator<<(std::ostream &s, const HunkNumbers &nums) {
	return s << "@@ -" << nums.old_start << "," << nums.old_count << " +" << nums.new_start << "," << nums.new_count << " @@";
}

std::ostream &operator<<(std::ostream &s, const LineReader &line) {
	return s << "line " << line.line << ": " << line.buf;
}

/// false when the next digit would carry the value past `uint32_t`
constexpr bool decimal_reducer(uint32_t &r, char c) {
	auto d = static_cast<uint32_t>(c - '0');
	if(r > (UINT32_MAX - d) / 10) {
		return false;
	}
	r = r * 10 + d;
	return true;
}

constexpr bool is_digit(char c) {
	return c >= '0' && c <= '9';
}

/// Reads `\d+(,\d+)?`; the count defaults to 1 when the comma group is absent
static bool parse_range(const char *&iter, const char *bound, uint32_t &start, uint32_t &count) {
	if(iter == bound || !is_digit(*iter)) {
		return false;
	}
	start = 0;
	for(; iter != bound && is_digit(*iter); ++iter) {
		if(!decimal_reducer(start, *iter)) {
			return false;
		}
	}
	count = 1;
	if(iter != bound && *iter == ',') {
		++iter;
		if(iter == bound || !is_digit(*iter)) {
			return false;
		}
		count = 0;
		for(; iter != bound && is_digit(*iter); ++iter) {
			if(!decimal_reducer(count, *iter)) {
				return false;
			}
		}
	}
	return true;
}

bool LineReader::is_empty() const {
	return this->buf.empty();
}

bool LineReader::is_triple_minus() const {
	return this->buf.starts_with("--- ");
}

bool LineReader::is_triple_plus() const {
	return this->buf.starts_with("+++ ");
}

bool LineReader::is_hunk_header() const {
	return this->buf.starts_with("@@");
}

bool LineReader::is_diff() const {
	return this->buf.starts_with("diff ");
}

bool LineReader::is_git_preamble() const {
	static constexpr std::string_view starters[] = {
		"diff ",
		"index ",
		"new file mode",
		"deleted file mode",
		"old mode",
		"new mode",
		"similarity index",
		"dissimilarity index",
		"rename from",
		"rename to",
		"copy from",
		"copy to",
	};
	return std::any_of(std::begin(starters), std::end(starters), [&](std::string_view s) {
		return this->buf.starts_with(s);
	});
}

bool LineReader::has_body_prefix() const {
	if(this->buf.empty()) {
		return false;
	}
	auto c = this->buf[0];
	return c == ' ' || c == '+' || c == '-' || c == '\\';
}

Result<HunkNumbers> LineReader::parse_numbers() const {
	// ^@@ -(\d+)(,(\d+))? \+(\d+)(,(\d+))? @@
	auto invalid = [&]() {
		std::ostringstream msg;
		msg << "Invalid hunk header '" << this->buf << "', expected '@@ -a,b +c,d @@'";
		return unexpected<PatchError>(make_error(PatchErrorCode::InvalidHunkHeader, msg.str(), this->line));
	};
	if(!this->buf.starts_with("@@ -")) {
		return invalid();
	}
	const char *iter = this->buf.data() + 4;
	const char *bound = this->buf.data() + this->buf.size();

	HunkNumbers res;
	if(!parse_range(iter, bound, res.old_start, res.old_count)) {
		return invalid();
	}
	if(bound - iter < 2 || iter[0] != ' ' || iter[1] != '+') {
		return invalid();
	}
	iter += 2;
	if(!parse_range(iter, bound, res.new_start, res.new_count)) {
		return invalid();
	}
	if(!std::string_view(iter, bound).starts_with(" @@")) {
		return invalid();
	}
	return res;
}

std::string_view LineReader::get_filename(std::string_view buf) {
	auto pos1It = std::find_if(begin(buf), end(buf), [&](char c) {
		return c != ' ';
	});
	auto pos2It = std::find(pos1It, end(buf), '\t');
	buf = trim(std::string_view(pos1It, pos2It));

	if(buf.starts_with("a/") || buf.starts_with("b/")) {
		buf.remove_prefix(2);
	}

	if(buf == "/dev/null") {
		return "";
	}
	return buf;
}

void DiffValidator::reset() {
	this->has_old_header = false;
	this->has_new_header = false;
	this->in_hunk = false;
}

PatchError DiffValidator::validate(std::string_view text) {
	reset();
	if(is_blank(text)) {
		return {};
	}
	auto lines = split_lines(text);
	for(size_t i = 0; i < lines.size(); ++i) {
		auto err = this->validate_line(LineReader {.buf = lines[i], .line = i + 1});
		if(err) {
			return err;
		}
	}
	return {};
}

PatchError DiffValidator::validate_line(const LineReader &line) {
	if(line.is_empty()) {
		return {};
	}

	if(line.is_triple_minus()) {
		if(trim(line.buf.substr(4)).empty()) {
			return make_error(PatchErrorCode::InvalidOldFileHeader, "'---' header has an empty file path", line.line);
		}
		this->has_old_header = true;
		this->has_new_header = false;
		this->in_hunk = false;
		return {};
	}

	// inside a hunk "+++ x" is an added line "++ x"
	if(line.is_triple_plus() && !this->in_hunk) {
		if(!this->has_old_header || this->has_new_header) {
			return make_error(PatchErrorCode::MissingOldFileHeader, "'+++' header is not preceded by a '---' header", line.line);
		}
		this->has_new_header = true;
		return {};
	}

	if(line.is_hunk_header()) {
		if(!this->has_old_header || !this->has_new_header) {
			return make_error(PatchErrorCode::MissingFileHeaders, "hunk header appears before the '---' and '+++' file headers", line.line);
		}
		auto some_nums = line.parse_numbers();
		if(!some_nums) {
			return some_nums.error();
		}
		this->in_hunk = true;
		return {};
	}

	if(line.is_git_preamble()) {
		if(line.is_diff()) {
			reset();
		} else {
			this->in_hunk = false;
		}
		return {};
	}

	if(!line.has_body_prefix()) {
		std::ostringstream msg;
		msg << "line starts with '" << line.buf[0] << "', expected one of ' ', '+', '-', '\\'";
		return make_error(PatchErrorCode::InvalidLinePrefix, msg.str(), line.line);
	}
	if(!this->has_old_header) {
		return make_error(PatchErrorCode::MissingOldFileHeader, "content line appears before any '---' header", line.line);
	}
	if(!this->has_new_header) {
		return make_error(PatchErrorCode::MissingFileHeaders, "content line appears before the '+++' header", line.line);
	}
	return {};
}

std::vector<FileHunkSet> DiffReader::parse(std::string_view text) {
	std::vector<FileHunkSet> sets;
	auto lines = split_lines(text);
	auto reader = [&](size_t i) {
		return LineReader {.buf = lines[i], .line = i + 1};
	};
	auto ends_section = [&](size_t i) {
		auto l = reader(i);
		return l.is_triple_minus() || l.is_diff();
	};

	size_t i = 0;
	while(i < lines.size()) {
		auto minus = reader(i);
		if(!minus.is_triple_minus() || i + 1 >= lines.size() || !reader(i + 1).is_triple_plus()) {
			++i;
			continue;
		}
		auto plus = reader(i + 1);

		auto &set = sets.emplace_back(FileHunkSet {});
		set.line = minus.line;
		set.old_path = LineReader::get_filename(minus.buf.substr(3));
		set.new_path = LineReader::get_filename(plus.buf.substr(3));
		set.created = set.old_path.empty();
		set.deleted = set.new_path.empty();
		set.file_path = set.deleted ? set.old_path : set.new_path;
		if(tracing) {
			*tracing << "Files: old: " << set.old_path << " -- new: " << set.new_path << std::endl;
		}
		i += 2;

		while(i < lines.size() && !ends_section(i)) {
			auto header = reader(i);
			if(!header.is_hunk_header()) {
				++i;
				continue;
			}
			auto some_nums = header.parse_numbers();
			if(!some_nums) {
				// the validator rejects this before we get here, so just stop
				if(tracing) {
					*tracing << "Stop parsing: " << some_nums.error() << std::endl;
				}
				return sets;
			}
			auto &hunk = set.hunks.emplace_back(Hunk {.numbers = *some_nums, .body = {}, .line = header.line});
			for(++i; i < lines.size() && !ends_section(i) && !reader(i).is_hunk_header(); ++i) {
				hunk.body.emplace_back(lines[i]);
			}
			if(tracing) {
				*tracing << "Hunk " << hunk.numbers << " with " << hunk.body.size() << " body lines" << std::endl;
			}
		}
	}
	return sets;
}

int64_t hunk_line_delta(const Hunk &hunk) {
	int64_t kept = 0;
	for(auto &body_line: hunk.body) {
		if(!body_line.empty() && (body_line[0] == ' ' || body_line[0] == '+')) {
			++kept;
		}
	}
	return kept - static_cast<int64_t>(hunk.numbers.old_count);
}

Result<std::string> apply_hunk(std::string_view content, const Hunk &hunk, int64_t offset) {
	auto lines = split_lines(content);
	auto eol = line_ending(content);
	bool trailing_newline = content.empty() || content.back() == '\n';

	int64_t start = (hunk.numbers.old_start > 0 ? static_cast<int64_t>(hunk.numbers.old_start) - 1 : 0) + offset;
	if(start < 0) {
		start = 0;
	}
	if(static_cast<size_t>(start) > lines.size()) {
		std::ostringstream msg;
		msg << "Hunk " << hunk.numbers << " starts past the end of the file (" << lines.size() << " lines)";
		return unexpected<PatchError>(make_error(PatchErrorCode::HunkOutOfRange, msg.str(), hunk.line));
	}

	std::vector<std::string> result(lines.begin(), lines.begin() + start);
	for(auto &body_line: hunk.body) {
		if(body_line.empty()) {
			continue;
		}
		switch(body_line[0]) {
			case ' ':
			case '+': {
				result.emplace_back(body_line.substr(1));
			} break;
			default: {
			} break;
		}
	}
	auto tail = std::min(lines.size(), static_cast<size_t>(start) + hunk.numbers.old_count);
	result.insert(result.end(), lines.begin() + tail, lines.end());

	auto res = join_lines(result, eol);
	if(!result.empty() && trailing_newline) {
		res += eol;
	}
	return res;
}

}// namespace FuzzyPatch
