#include <stdexcept>

#include "FuzzyPatch/json.hpp"

#include <nlohmann/json.hpp>

namespace FuzzyPatch {

static PatchErrorCode error_code_from_name(std::string_view name) {
	for(auto i = static_cast<uint8_t>(PatchErrorCode::OK); i <= static_cast<uint8_t>(PatchErrorCode::IndexError); ++i) {
		auto code = static_cast<PatchErrorCode>(i);
		if(error_code_name(code) == name) {
			return code;
		}
	}
	throw std::invalid_argument("unknown error_code " + std::string(name));
}

void to_json(json &j, const FileEditOutcome &o) {
	j = json {
		{"file_path", o.file_path},
		{"status", std::string(status_name(o.status))},
	};
	if(auto hunks = std::get_if<HunkTally>(&o.detail)) {
		j["hunks_applied"] = hunks->applied;
		j["total_hunks"] = hunks->total;
	} else if(auto edits = std::get_if<EditTally>(&o.detail)) {
		j["changes_applied"] = edits->applied;
		j["total_changes"] = edits->total;
	}
	if(o.error) {
		j["error"] = *o.error;
	}
}

void from_json(const json &j, FileEditOutcome &o) {
	j.at("file_path").get_to(o.file_path);
	o.status = j.at("status").get<std::string>() == status_name(FileStatus::Success) ? FileStatus::Success : FileStatus::Failed;
	if(j.contains("hunks_applied")) {
		HunkTally t;
		j.at("hunks_applied").get_to(t.applied);
		j.at("total_hunks").get_to(t.total);
		o.detail = t;
	} else {
		EditTally t;
		j.at("changes_applied").get_to(t.applied);
		t.total = j.value("total_changes", t.applied);
		o.detail = t;
	}
	if(j.contains("error")) {
		o.error = j.at("error").get<std::string>();
	} else {
		o.error = {};
	}
}

void to_json(json &j, const PatchResult &r) {
	j = json {
		{"format", std::string(format_name(r.format))},
		{"patch_applied", r.patch_applied},
		{"results", {
						{"modified_files", r.outcomes},
						{"total_files", r.total_files},
						{"successful_files", r.successful_files},
					}},
	};
	if(r.error) {
		j["error_code"] = std::string(error_code_name(r.error->code));
		j["error_message"] = r.error->message;
	}
}

void from_json(const json &j, PatchResult &r) {
	r.format = j.at("format").get<std::string>() == format_name(PatchFormat::UnifiedDiff) ? PatchFormat::UnifiedDiff : PatchFormat::SearchReplace;
	j.at("patch_applied").get_to(r.patch_applied);
	if(j.contains("error_code")) {
		r.error = make_error(error_code_from_name(j.at("error_code").get<std::string>()), j.value("error_message", std::string {}));
	} else {
		r.error = {};
	}
	auto &results = j.at("results");
	r.outcomes = results.value("modified_files", std::vector<FileEditOutcome> {});
	results.at("total_files").get_to(r.total_files);
	results.at("successful_files").get_to(r.successful_files);
}

void to_json(json &j, const SearchReplaceEdit &e) {
	j = json {
		{"file_path", e.file_path},
		{"search", e.search},
		{"replace", e.replace},
		{"line", e.line},
	};
}

void to_json(json &j, const Match &m) {
	j = json {
		{"start", m.start},
		{"end", m.end},
		{"tier", std::string(tier_name(m.tier))},
		{"ratio", m.ratio},
	};
}

}// namespace FuzzyPatch
