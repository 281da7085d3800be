#include <algorithm>
#include <iostream>
#include <map>
#include <sstream>

#include "FuzzyPatch/PatchEngine.hpp"

namespace FuzzyPatch {

using namespace TextUtils;

Indexer::~Indexer() = default;

std::string_view status_name(FileStatus status) {
	switch(status) {
		case FileStatus::Success:
			return "success";
		case FileStatus::Failed:
			return "failed";
	}
	return "unknown";
}

std::ostream &operator<<(std::ostream &s, const FileEditOutcome &outcome) {
	s << outcome.file_path << ": " << status_name(outcome.status);
	if(auto hunks = std::get_if<HunkTally>(&outcome.detail)) {
		s << " (" << hunks->applied << "/" << hunks->total << " hunks)";
	} else if(auto edits = std::get_if<EditTally>(&outcome.detail)) {
		s << " (" << edits->applied << "/" << edits->total << " changes)";
	}
	if(outcome.error) {
		s << " - " << *outcome.error;
	}
	return s;
}

std::ostream &operator<<(std::ostream &s, const PatchResult &result) {
	s << format_name(result.format) << ": " << (result.patch_applied ? "applied" : "not applied") << ", " << result.successful_files << "/" << result.total_files << " files";
	if(result.error) {
		s << ", " << *result.error;
	}
	return s;
}

static void append_error(FileEditOutcome &outcome, const PatchError &err) {
	std::ostringstream msg;
	msg << err;
	if(outcome.error) {
		*outcome.error += "; " + msg.str();
	} else {
		outcome.error = msg.str();
	}
}

PatchEngine::PatchEngine(std::filesystem::path base_dir, Indexer *indexer, ApplyOptions options): base_dir(std::move(base_dir)), indexer(indexer), options(options) {
}

PathLockTable::Guard PatchEngine::lock_file(std::string_view workspace, std::string_view relative_path) {
	std::string key {workspace};
	key += '\0';
	key += relative_path;
	return this->locks.lock(key);
}

Result<PatchResult> PatchEngine::apply_patch(std::string_view workspace, std::string_view patch) {
	std::error_code ec;
	auto root = this->base_dir / std::string(workspace);
	if(!is_valid_workspace_name(workspace) || !std::filesystem::is_directory(root, ec)) {
		std::ostringstream msg;
		msg << "Workspace '" << workspace << "' not found";
		return unexpected<PatchError>(make_error(PatchErrorCode::WorkspaceNotFound, msg.str()));
	}
	DiskFileStore store {root};
	return this->apply_patch_to(store, workspace, patch);
}

PatchResult PatchEngine::apply_patch_to(FileStore &store, std::string_view workspace, std::string_view patch) {
	auto tracing = this->options.tracing;
	auto format = detect_format(patch);

	if(is_blank(patch)) {
		PatchResult result;
		result.format = format;
		result.error = make_error(PatchErrorCode::EmptyPatch, "Empty patch content is not allowed");
		if(tracing) {
			*tracing << "Rejected: " << *result.error << std::endl;
		}
		return result;
	}

	PatchResult result;
	try {
		if(tracing) {
			*tracing << "Applying " << format_name(format) << " patch to workspace " << workspace << std::endl;
		}
		if(format == PatchFormat::UnifiedDiff) {
			result = this->apply_unified_diff(store, workspace, patch);
		} else {
			result = this->apply_search_replace(store, workspace, patch);
		}
		if(tracing) {
			*tracing << "Result: " << result << std::endl;
		}
	} catch(const std::exception &e) {
		result = PatchResult {};
		result.format = format;
		auto code = format == PatchFormat::UnifiedDiff ? PatchErrorCode::UnifiedDiffError : PatchErrorCode::SearchReplaceError;
		result.error = make_error(code, std::string("Error applying patch: ") + e.what());
		// the trace stream itself may be what threw
		if(tracing && tracing->good()) {
			*tracing << "Failed: " << *result.error << std::endl;
		}
		return result;
	}

	if(result.patch_applied) {
		this->reindex(store, workspace, result);
	}
	return result;
}

PatchResult PatchEngine::apply_unified_diff(FileStore &store, std::string_view workspace, std::string_view patch) {
	PatchResult result;
	result.format = PatchFormat::UnifiedDiff;

	DiffValidator validator;
	auto err = validator.validate(patch);
	if(err) {
		if(this->options.tracing) {
			*this->options.tracing << "Invalid diff: " << err << std::endl;
		}
		result.error = err;
		return result;
	}

	DiffReader reader {.tracing = this->options.tracing};
	for(auto &set: reader.parse(patch)) {
		auto &outcome = result.outcomes.emplace_back(this->apply_file_hunks(store, workspace, set));
		if(outcome.status == FileStatus::Success) {
			++result.successful_files;
		}
	}
	result.total_files = static_cast<uint32_t>(result.outcomes.size());
	result.patch_applied = result.successful_files > 0 || result.total_files == 0;
	return result;
}

FileEditOutcome PatchEngine::apply_file_hunks(FileStore &store, std::string_view workspace, const FileHunkSet &set) {
	auto tracing = this->options.tracing;
	FileEditOutcome outcome {
		.file_path = set.file_path,
		.status = FileStatus::Failed,
		.detail = HunkTally {.applied = 0, .total = static_cast<uint32_t>(set.hunks.size())},
		.error = {},
	};
	auto &tally = std::get<HunkTally>(outcome.detail);

	if(set.file_path.empty()) {
		append_error(outcome, make_error(PatchErrorCode::UnsafePath, "Both file headers are /dev/null", set.line));
		return outcome;
	}

	try {
		auto guard = this->lock_file(workspace, set.file_path);
		int64_t offset = 0;
		for(auto &hunk: set.hunks) {
			auto some_content = store.read(set.file_path);
			if(!some_content) {
				append_error(outcome, some_content.error());
				continue;
			}
			auto content = some_content->value_or(std::string {});

			auto some_patched = apply_hunk(content, hunk, this->options.track_line_offset ? offset : 0);
			if(!some_patched) {
				if(tracing) {
					*tracing << "Hunk " << hunk.numbers << " of " << set.file_path << " failed: " << some_patched.error() << std::endl;
				}
				append_error(outcome, some_patched.error());
				continue;
			}
			auto err = store.write(set.file_path, *some_patched);
			if(err) {
				append_error(outcome, err);
				continue;
			}
			++tally.applied;
			offset += hunk_line_delta(hunk);
			if(tracing) {
				*tracing << "Applied hunk " << hunk.numbers << " to " << set.file_path << std::endl;
			}
		}

		// deletions keep the file, emptied
		if(set.deleted && tally.applied) {
			auto err = store.write(set.file_path, "");
			if(err) {
				append_error(outcome, err);
			}
		}
	} catch(const std::exception &e) {
		append_error(outcome, make_error(PatchErrorCode::IoError, e.what(), set.line));
	}

	outcome.status = tally.applied ? FileStatus::Success : FileStatus::Failed;
	return outcome;
}

PatchResult PatchEngine::apply_search_replace(FileStore &store, std::string_view workspace, std::string_view patch) {
	auto tracing = this->options.tracing;
	PatchResult result;
	result.format = PatchFormat::SearchReplace;

	SearchReplaceReader reader {.tracing = tracing};
	auto parsed = reader.parse(patch);
	if(tracing && !parsed.dropped_blocks.empty()) {
		*tracing << parsed.dropped_blocks.size() << " unterminated block(s) ignored" << std::endl;
	}

	std::map<std::string, size_t> outcome_index;
	for(auto &edit: parsed.edits) {
		auto [it, inserted] = outcome_index.try_emplace(edit.file_path, result.outcomes.size());
		if(inserted) {
			result.outcomes.emplace_back(FileEditOutcome {
				.file_path = edit.file_path,
				.status = FileStatus::Failed,
				.detail = EditTally {},
				.error = {},
			});
		}
		auto &outcome = result.outcomes[it->second];
		auto &tally = std::get<EditTally>(outcome.detail);
		++tally.total;

		PatchError err;
		try {
			err = this->apply_edit(store, workspace, edit);
		} catch(const std::exception &e) {
			err = make_error(PatchErrorCode::IoError, e.what(), edit.line);
		}
		if(err) {
			if(tracing) {
				*tracing << "Edit of " << edit.file_path << " failed: " << err << std::endl;
			}
			append_error(outcome, err);
		} else {
			++tally.applied;
		}
	}

	for(auto &outcome: result.outcomes) {
		if(std::get<EditTally>(outcome.detail).applied) {
			outcome.status = FileStatus::Success;
			++result.successful_files;
		}
	}
	result.total_files = static_cast<uint32_t>(result.outcomes.size());
	result.patch_applied = result.successful_files > 0;
	return result;
}

PatchError PatchEngine::apply_edit(FileStore &store, std::string_view workspace, const SearchReplaceEdit &edit) {
	auto guard = this->lock_file(workspace, edit.file_path);

	auto some_content = store.read(edit.file_path);
	if(!some_content) {
		return some_content.error();
	}
	auto content = some_content->value_or(std::string {});

	auto eol = line_ending(content);
	std::string updated;
	if(is_blank(edit.search)) {
		updated = content;
		if(!updated.empty() && updated.back() != '\n') {
			updated += eol;
		}
		std::vector<std::string> lines;
		for(auto line: split_keep_empty(edit.replace)) {
			if(!line.empty() && line.back() == '\r') {
				line.remove_suffix(1);
			}
			lines.emplace_back(line);
		}
		updated += join_lines(lines, eol);
	} else {
		ContentMatcher matcher {.options = this->options.matching, .tracing = this->options.tracing};
		auto some_match = matcher.find(content, edit.search);
		if(!some_match) {
			auto err = some_match.error();
			err.line = edit.line;
			return err;
		}
		auto &m = *some_match;
		auto original = std::string_view(content).substr(m.start, m.end - m.start);
		updated = content.substr(0, m.start) + reconcile_indentation(original, edit.replace, eol) + content.substr(m.end);
	}

	return store.write(edit.file_path, updated);
}

void PatchEngine::reindex(FileStore &store, std::string_view workspace, const PatchResult &result) {
	if(!this->indexer) {
		return;
	}
	auto tracing = this->options.tracing;
	for(auto &outcome: result.outcomes) {
		if(outcome.status != FileStatus::Success) {
			continue;
		}
		auto some_content = store.read(outcome.file_path);
		if(!some_content) {
			if(tracing) {
				*tracing << "Not indexing " << outcome.file_path << ": " << some_content.error() << std::endl;
			}
			continue;
		}
		PatchError err;
		try {
			err = this->indexer->index(workspace, outcome.file_path, some_content->value_or(std::string {}));
		} catch(const std::exception &e) {
			err = make_error(PatchErrorCode::IndexError, e.what());
		}
		if(err && tracing) {
			*tracing << "Indexing " << outcome.file_path << " failed: " << err << std::endl;
		}
	}
}

}// namespace FuzzyPatch
