#pragma once
#include <cstdint>

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "FileStore.hpp"
#include "Matcher.hpp"
#include "SearchReplace.hpp"
#include "UnifiedDiff.hpp"
#include "common.hpp"

namespace FuzzyPatch {

enum struct FileStatus : uint8_t {
	Success,
	Failed
};

/// "success" or "failed"
FUZZYPATCH_API std::string_view status_name(FileStatus status);

/// Unified-diff detail of a file outcome
struct FUZZYPATCH_API HunkTally {
	uint32_t applied = 0;
	uint32_t total = 0;
};

/// Search-replace detail of a file outcome
struct FUZZYPATCH_API EditTally {
	uint32_t applied = 0;
	uint32_t total = 0;
};

struct FUZZYPATCH_API FileEditOutcome {
	std::string file_path;
	FileStatus status = FileStatus::Failed;
	std::variant<HunkTally, EditTally> detail;
	/// failure messages of the hunks/edits that did not apply, joined with "; "
	std::optional<std::string> error;
};

struct FUZZYPATCH_API PatchResult {
	PatchFormat format = PatchFormat::SearchReplace;
	bool patch_applied = false;
	/// set only when the whole patch was rejected
	std::optional<PatchError> error;
	std::vector<FileEditOutcome> outcomes;
	uint32_t total_files = 0;
	uint32_t successful_files = 0;
};

/// Full-text index collaborator, fed with the new content of every successfully patched file
struct FUZZYPATCH_API Indexer {
	virtual ~Indexer();

	virtual PatchError index(std::string_view workspace, std::string_view relative_path, std::string_view content) = 0;
};

struct FUZZYPATCH_API ApplyOptions {
	MatchOptions matching;
	/// shift every hunk by the line delta of the hunks applied before it in the same file
	bool track_line_offset = false;
	std::ostream *tracing = nullptr;
};

/// Applies unified diffs and search/replace block lists to the workspaces under `base_dir`
struct FUZZYPATCH_API PatchEngine {
	std::filesystem::path base_dir;
	Indexer *indexer = nullptr;
	ApplyOptions options;

	explicit PatchEngine(std::filesystem::path base_dir, Indexer *indexer = nullptr, ApplyOptions options = {});

	/// Fails with WorkspaceNotFound when `base_dir / workspace` is not a directory
	Result<PatchResult> apply_patch(std::string_view workspace, std::string_view patch);

	/// Applies `patch` through an explicit store; `workspace` names it for locks and the indexer
	PatchResult apply_patch_to(FileStore &store, std::string_view workspace, std::string_view patch);

	PatchResult apply_unified_diff(FileStore &store, std::string_view workspace, std::string_view patch);

	PatchResult apply_search_replace(FileStore &store, std::string_view workspace, std::string_view patch);

	FileEditOutcome apply_file_hunks(FileStore &store, std::string_view workspace, const FileHunkSet &set);

	/// Matches, re-indents and writes one edit against the current file content
	PatchError apply_edit(FileStore &store, std::string_view workspace, const SearchReplaceEdit &edit);

	void reindex(FileStore &store, std::string_view workspace, const PatchResult &result);

  private:
	PathLockTable locks;

	PathLockTable::Guard lock_file(std::string_view workspace, std::string_view relative_path);
};

FUZZYPATCH_API std::ostream &operator<<(std::ostream &s, const FileEditOutcome &outcome);

FUZZYPATCH_API std::ostream &operator<<(std::ostream &s, const PatchResult &result);

};// namespace FuzzyPatch
