#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "common.hpp"

namespace FuzzyPatch {

/// Workspace-relative file access used by the patch engine
struct FUZZYPATCH_API FileStore {
	virtual ~FileStore();

	/// The file content, or std::nullopt when the file does not exist
	virtual Result<std::optional<std::string>> read(std::string_view relative_path) = 0;

	/// Replaces the file content, creating parent directories as needed
	virtual PatchError write(std::string_view relative_path, std::string_view content) = 0;
};

/// Relative, non-empty, at most 500 bytes, no NUL and no `..` component
FUZZYPATCH_API bool is_safe_relative_path(std::string_view relative_path);

/// Workspace names are `[A-Za-z0-9_-]{1,50}`
FUZZYPATCH_API bool is_valid_workspace_name(std::string_view name);

/// FileStore over a directory. Writes go to a temporary sibling renamed over the target.
struct FUZZYPATCH_API DiskFileStore: public FileStore {
	std::filesystem::path root;

	explicit DiskFileStore(std::filesystem::path root);

	Result<std::filesystem::path> resolve(std::string_view relative_path) const;

	virtual Result<std::optional<std::string>> read(std::string_view relative_path) override;

	virtual PatchError write(std::string_view relative_path, std::string_view content) override;
};

/// One mutex per key, for serializing read-modify-write cycles on the same file.
/// An entry lives only while some thread holds or waits for its key.
class FUZZYPATCH_API PathLockTable {
	struct Slot {
		std::mutex mutex;
		size_t holders = 0;
	};

  public:
	/// Owns the key's mutex until destruction
	class FUZZYPATCH_API Guard {
	  public:
		Guard(PathLockTable &table, std::string key, Slot &slot);
		~Guard();

		Guard(const Guard &) = delete;
		Guard &operator=(const Guard &) = delete;

	  private:
		PathLockTable &table;
		std::string key;
		Slot &slot;
	};

	Guard lock(const std::string &key);

	/// Number of keys currently held or waited for
	size_t size();

  private:
	void release(const std::string &key);

	std::mutex table_mutex;
	std::map<std::string, std::unique_ptr<Slot>> slots;
};

};// namespace FuzzyPatch
