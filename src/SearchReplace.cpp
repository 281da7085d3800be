#include <iostream>

#include "FuzzyPatch/SearchReplace.hpp"

#if __has_include(<magic_enum.hpp>)
#include <magic_enum.hpp>
#endif

namespace FuzzyPatch {

using namespace TextUtils;

bool operator==(const SearchReplaceEdit &lhs, const SearchReplaceEdit &rhs) {
	return lhs.file_path == rhs.file_path && lhs.search == rhs.search && lhs.replace == rhs.replace;
}

std::ostream &operator<<(std::ostream &s, const SearchReplaceEdit &edit) {
	return s << "edit of " << edit.file_path << " (line " << edit.line << "): " << edit.search.size() << " bytes -> " << edit.replace.size() << " bytes";
}

bool SearchReplaceReader::is_marker(std::string_view line) {
	auto t = trim(line);
	return t == Markers::search || t == Markers::divider || t == Markers::replace;
}

SearchReplaceParse SearchReplaceReader::parse(std::string_view text) {
	SearchReplaceParse res;
	State state = State::Path;
	SearchReplaceEdit current;
	std::vector<std::string_view> search_lines, replace_lines;

	auto join = [](const std::vector<std::string_view> &lines) {
		std::string s;
		for(size_t i = 0; i < lines.size(); ++i) {
			if(i) {
				s += '\n';
			}
			s += lines[i];
		}
		return s;
	};

	auto lines = split_lines(text);
	for(size_t i = 0; i < lines.size(); ++i) {
		auto line = lines[i];
		auto t = trim(line);
		switch(state) {
			case State::Path: {
				if(t.empty() || is_marker(line)) {
					continue;
				}
				current = SearchReplaceEdit {.file_path = std::string(t), .search = {}, .replace = {}, .line = i + 1};
				state = State::Preamble;
			} break;
			case State::Preamble: {
				if(t == Markers::search) {
					search_lines.clear();
					state = State::Search;
				}
			} break;
			case State::Search: {
				if(t == Markers::divider) {
					replace_lines.clear();
					state = State::Replace;
				} else {
					search_lines.emplace_back(line);
				}
			} break;
			case State::Replace: {
				if(t == Markers::replace) {
					current.search = join(search_lines);
					current.replace = join(replace_lines);
					if(tracing) {
						*tracing << "Parsed " << current << std::endl;
					}
					res.edits.emplace_back(std::move(current));
					current = {};
					state = State::Path;
				} else {
					replace_lines.emplace_back(line);
				}
			} break;
		}
	}

	if(state != State::Path) {
		res.dropped_blocks.emplace_back(current.line);
		if(tracing) {
			*tracing << "Dropping unterminated block for " << current.file_path << " at line " << current.line << " (state: " <<
#if defined(NEARGYE_MAGIC_ENUM_HPP)
			magic_enum::enum_name(state)
#else
			static_cast<uint16_t>(state)
#endif
			<< ")" << std::endl;
		}
	}
	return res;
}

}// namespace FuzzyPatch
