#pragma once

#include <nlohmann/json_fwd.hpp>

#include "PatchEngine.hpp"

namespace FuzzyPatch {

using json = nlohmann::json;

/// {"file_path", "status", "hunks_applied", "total_hunks"} or {"file_path", "status", "changes_applied", "total_changes", "error"?}
void to_json(json &j, const FileEditOutcome &o);

void from_json(const json &j, FileEditOutcome &o);

/// {"format", "patch_applied", "error_code"?, "error_message"?, "results": {"modified_files", "total_files", "successful_files"}}
void to_json(json &j, const PatchResult &r);

void from_json(const json &j, PatchResult &r);

void to_json(json &j, const SearchReplaceEdit &e);

void to_json(json &j, const Match &m);

};// namespace FuzzyPatch
