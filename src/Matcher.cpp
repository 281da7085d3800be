#include <algorithm>
#include <array>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <tuple>
#include <unordered_map>

#include "FuzzyPatch/Matcher.hpp"

#if __has_include(<magic_enum.hpp>)
#include <magic_enum.hpp>
#endif

namespace FuzzyPatch {

using namespace TextUtils;

namespace Similarity {

namespace {

struct LongestMatch {
	size_t i, j, size;
};

/// Index of every position of each byte value in `b`
using B2J = std::array<std::vector<size_t>, 256>;

LongestMatch find_longest_match(std::string_view a, const B2J &b2j, size_t alo, size_t ahi, size_t blo, size_t bhi) {
	LongestMatch best {alo, blo, 0};
	// j2len[j] is the length of the longest match ending with a[i-1] and b[j]
	std::unordered_map<size_t, size_t> j2len, newj2len;
	for(size_t i = alo; i < ahi; ++i) {
		newj2len.clear();
		for(auto j: b2j[static_cast<unsigned char>(a[i])]) {
			if(j < blo) {
				continue;
			}
			if(j >= bhi) {
				break;
			}
			size_t k = 1;
			if(j > 0) {
				auto prev = j2len.find(j - 1);
				if(prev != j2len.end()) {
					k = prev->second + 1;
				}
			}
			newj2len[j] = k;
			if(k > best.size) {
				best = {i + 1 - k, j + 1 - k, k};
			}
		}
		std::swap(j2len, newj2len);
	}
	return best;
}

}// namespace

size_t matching_characters(std::string_view a, std::string_view b) {
	B2J b2j;
	for(size_t j = 0; j < b.size(); ++j) {
		b2j[static_cast<unsigned char>(b[j])].emplace_back(j);
	}

	size_t total = 0;
	std::vector<std::tuple<size_t, size_t, size_t, size_t>> queue {{0, a.size(), 0, b.size()}};
	while(!queue.empty()) {
		auto [alo, ahi, blo, bhi] = queue.back();
		queue.pop_back();
		auto m = find_longest_match(a, b2j, alo, ahi, blo, bhi);
		if(!m.size) {
			continue;
		}
		total += m.size;
		if(alo < m.i && blo < m.j) {
			queue.emplace_back(alo, m.i, blo, m.j);
		}
		if(m.i + m.size < ahi && m.j + m.size < bhi) {
			queue.emplace_back(m.i + m.size, ahi, m.j + m.size, bhi);
		}
	}
	return total;
}

double ratio(std::string_view a, std::string_view b) {
	auto length = a.size() + b.size();
	if(!length) {
		return 1.0;
	}
	return 2.0 * static_cast<double>(matching_characters(a, b)) / static_cast<double>(length);
}

std::string normalize_line(std::string_view line) {
	std::string res;
	bool pending_space = false;
	for(auto c: trim(line)) {
		if(is_space(c)) {
			pending_space = true;
			continue;
		}
		if(pending_space) {
			res += ' ';
			pending_space = false;
		}
		res += c;
	}
	return res;
}

std::string normalize_text(std::string_view text) {
	std::vector<std::string> lines;
	for(auto line: split_lines(text)) {
		lines.emplace_back(normalize_line(line));
	}
	return join_lines(lines);
}

};// namespace Similarity

std::string_view tier_name(MatchTier tier) {
	switch(tier) {
		case MatchTier::Exact:
			return "exact";
		case MatchTier::Normalized:
			return "normalized";
		case MatchTier::Fuzzy:
			return "fuzzy";
	}
	return "unknown";
}

std::ostream &operator<<(std::ostream &s, const Match &m) {
	return s << tier_name(m.tier) << " match [" << m.start << ", " << m.end << ") ratio " << std::fixed << std::setprecision(3) << m.ratio;
}

namespace {

struct LineSpan {
	size_t start, end;
};

/// One span per '\n'-separated piece of `content`, a trailing '\r' excluded
std::vector<LineSpan> line_spans(std::string_view content) {
	std::vector<LineSpan> spans;
	size_t start = 0;
	while(true) {
		auto nl = content.find('\n', start);
		auto end = nl == std::string_view::npos ? content.size() : nl;
		auto stop = end;
		if(stop > start && content[stop - 1] == '\r') {
			--stop;
		}
		spans.emplace_back(LineSpan {start, stop});
		if(nl == std::string_view::npos) {
			break;
		}
		start = nl + 1;
	}
	return spans;
}

std::string truncated(std::string_view s, size_t limit) {
	if(s.size() <= limit) {
		return std::string(s);
	}
	// do not cut a UTF-8 sequence in half
	auto cut = limit;
	while(cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) {
		--cut;
	}
	return std::string(s.substr(0, cut)) + "...";
}

}// namespace

std::optional<Match> ContentMatcher::find_exact(std::string_view content, std::string_view search) const {
	auto pos = content.find(search);
	if(pos == std::string_view::npos) {
		return {};
	}
	return Match {.start = pos, .end = pos + search.size(), .tier = MatchTier::Exact, .ratio = 1.0};
}

std::optional<Match> ContentMatcher::find_normalized(std::string_view content, std::string_view search) const {
	auto search_lines = split_lines(search);
	auto norm_search = Similarity::normalize_text(search);
	if(search_lines.empty() || is_blank(norm_search)) {
		return {};
	}

	auto spans = line_spans(content);
	std::vector<std::string> norm_lines;
	norm_lines.reserve(spans.size());
	for(auto &span: spans) {
		norm_lines.emplace_back(Similarity::normalize_line(content.substr(span.start, span.end - span.start)));
	}
	auto norm_content = join_lines(norm_lines);

	auto pos = norm_content.find(norm_search);
	if(pos == std::string::npos) {
		return {};
	}

	// line of the normalized text that holds `pos`
	size_t estimate = 0;
	for(size_t offset = 0; estimate < norm_lines.size(); ++estimate) {
		auto next = offset + norm_lines[estimate].size() + 1;
		if(next > pos) {
			break;
		}
		offset = next;
	}

	auto n = search_lines.size();
	if(n > spans.size()) {
		return {};
	}
	auto first = estimate > this->options.search_radius ? estimate - this->options.search_radius : 0;
	auto last = std::min(estimate + this->options.search_radius, spans.size() - n);

	std::optional<Match> best;
	for(auto start = first; start <= last; ++start) {
		std::string candidate;
		for(size_t k = start; k < start + n; ++k) {
			if(k != start) {
				candidate += '\n';
			}
			candidate += norm_lines[k];
		}
		auto r = Similarity::ratio(candidate, norm_search);
		if(!best || r > best->ratio) {
			best = Match {.start = spans[start].start, .end = spans[start + n - 1].end, .tier = MatchTier::Normalized, .ratio = r};
		}
	}

	if(best && best->ratio > this->options.normalized_threshold) {
		return best;
	}
	if(tracing && best) {
		*tracing << "Normalized candidate rejected: " << *best << std::endl;
	}
	return {};
}

std::optional<Match> ContentMatcher::find_fuzzy(std::string_view content, std::string_view search) const {
	auto n = split_lines(search).size();
	auto trimmed_search = trim(search);
	if(!n || trimmed_search.empty()) {
		return {};
	}
	auto norm_search = Similarity::normalize_text(search);

	auto spans = line_spans(content);
	if(n > spans.size()) {
		return {};
	}

	std::optional<Match> best;
	for(size_t start = 0; start + n <= spans.size(); ++start) {
		auto window = content.substr(spans[start].start, spans[start + n - 1].end - spans[start].start);
		auto literal = Similarity::ratio(trim(window), trimmed_search);
		auto normalized = Similarity::ratio(Similarity::normalize_text(window), norm_search);
		auto r = std::max(literal, normalized);
		if(!best || r > best->ratio) {
			best = Match {.start = spans[start].start, .end = spans[start + n - 1].end, .tier = MatchTier::Fuzzy, .ratio = r};
		}
	}

	if(best && best->ratio > this->options.fuzzy_threshold) {
		return best;
	}
	if(tracing && best) {
		*tracing << "Fuzzy candidate rejected: " << *best << std::endl;
	}
	return {};
}

Result<Match> ContentMatcher::find(std::string_view content, std::string_view search) const {
	if(search.empty()) {
		return unexpected<PatchError>(make_error(PatchErrorCode::NotFound, "Search text is empty"));
	}

	auto some_match = this->find_exact(content, search);
	if(!some_match && !this->options.exact_only) {
		some_match = this->find_normalized(content, search);
		if(!some_match) {
			some_match = this->find_fuzzy(content, search);
		}
	}

	if(some_match) {
		if(tracing) {
			*tracing << "Matched: " << *some_match << " (tier " <<
#if defined(NEARGYE_MAGIC_ENUM_HPP)
			magic_enum::enum_name(some_match->tier)
#else
			static_cast<uint16_t>(some_match->tier)
#endif
			<< ")" << std::endl;
		}
		return *some_match;
	}

	return unexpected<PatchError>(make_error(PatchErrorCode::NotFound, "Search text not found: " + truncated(search, this->options.message_prefix_limit)));
}

std::string reconcile_indentation(std::string_view original, std::string_view replacement, std::string_view eol) {
	std::vector<std::string_view> prefixes;
	std::string_view fallback;
	for(auto line: split_keep_empty(original)) {
		auto prefix = is_blank(line) ? std::string_view {} : leading_whitespace(line);
		prefixes.emplace_back(prefix);
		if(!prefix.empty()) {
			fallback = prefix;
		}
	}

	std::vector<std::string> lines;
	auto repl_lines = split_keep_empty(replacement);
	for(size_t i = 0; i < repl_lines.size(); ++i) {
		auto stripped = trim(repl_lines[i]);
		if(stripped.empty()) {
			lines.emplace_back();
			continue;
		}
		auto prefix = i < prefixes.size() ? prefixes[i] : fallback;
		lines.emplace_back(std::string(prefix) + std::string(stripped));
	}
	return join_lines(lines, eol);
}

FuzzyReplace fuzzy_replace(std::string_view content, std::string_view search, std::string_view replace, const MatchOptions &options) {
	FuzzyReplace res {.found = false, .ratio = 0.0, .content = std::string(content), .match = {}};
	if(is_blank(search)) {
		return res;
	}

	ContentMatcher matcher {.options = options, .tracing = nullptr};
	auto some_match = matcher.find(content, search);
	if(!some_match) {
		return res;
	}
	auto &m = *some_match;
	auto original = content.substr(m.start, m.end - m.start);

	res.found = true;
	res.ratio = m.ratio;
	res.match = m;
	res.content = std::string(content.substr(0, m.start)) + reconcile_indentation(original, replace, line_ending(content)) + std::string(content.substr(m.end));
	return res;
}

}// namespace FuzzyPatch
