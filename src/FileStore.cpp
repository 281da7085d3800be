#include <algorithm>
#include <fstream>
#include <iterator>
#include <random>
#include <sstream>
#include <utility>

#include "FuzzyPatch/FileStore.hpp"

namespace FuzzyPatch {

namespace fs = std::filesystem;

FileStore::~FileStore() = default;

bool is_safe_relative_path(std::string_view relative_path) {
	if(relative_path.empty() || relative_path.size() > 500) {
		return false;
	}
	if(relative_path.find('\0') != std::string_view::npos) {
		return false;
	}
	fs::path p {std::string(relative_path)};
	if(p.is_absolute() || p.has_root_path()) {
		return false;
	}
	bool has_name = false;
	for(auto &part: p) {
		if(part == "..") {
			return false;
		}
		if(!part.empty() && part != ".") {
			has_name = true;
		}
	}
	return has_name;
}

bool is_valid_workspace_name(std::string_view name) {
	if(name.empty() || name.size() > 50) {
		return false;
	}
	return std::all_of(begin(name), end(name), [](char c) {
		return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
	});
}

static PatchError io_error(const std::string &what, std::string_view relative_path, const std::error_code &ec) {
	std::ostringstream msg;
	msg << what << " '" << relative_path << "'";
	if(ec) {
		msg << ": " << ec.message();
	}
	return make_error(PatchErrorCode::IoError, msg.str());
}

DiskFileStore::DiskFileStore(fs::path root): root(std::move(root)) {
}

Result<fs::path> DiskFileStore::resolve(std::string_view relative_path) const {
	if(!is_safe_relative_path(relative_path)) {
		std::ostringstream msg;
		msg << "Unsafe file path '" << relative_path << "'";
		return unexpected<PatchError>(make_error(PatchErrorCode::UnsafePath, msg.str()));
	}
	return (this->root / fs::path {std::string(relative_path)}).lexically_normal();
}

Result<std::optional<std::string>> DiskFileStore::read(std::string_view relative_path) {
	auto some_path = this->resolve(relative_path);
	if(!some_path) {
		return unexpected<PatchError>(some_path.error());
	}
	auto &path = *some_path;

	std::error_code ec;
	auto st = fs::status(path, ec);
	if(st.type() == fs::file_type::not_found) {
		return std::optional<std::string> {};
	}
	if(ec) {
		return unexpected<PatchError>(io_error("Cannot stat", relative_path, ec));
	}
	if(fs::is_directory(st)) {
		return unexpected<PatchError>(io_error("Target is a directory:", relative_path, {}));
	}

	std::ifstream in(path, std::ios::binary);
	if(!in) {
		return unexpected<PatchError>(io_error("Cannot open", relative_path, std::make_error_code(std::errc::permission_denied)));
	}
	std::string content {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
	if(in.bad()) {
		return unexpected<PatchError>(io_error("Cannot read", relative_path, std::make_error_code(std::errc::io_error)));
	}
	return std::optional<std::string> {std::move(content)};
}

/// 32 hex digits, so that concurrent writers of one file never share a temporary
static std::string temp_token() {
	thread_local std::mt19937_64 gen {std::random_device {}()};
	static constexpr char hex[] = "0123456789abcdef";
	std::string token;
	token.reserve(32);
	for(int i = 0; i < 2; ++i) {
		auto bits = gen();
		for(int j = 0; j < 16; ++j, bits >>= 4) {
			token.push_back(hex[bits & 0x0F]);
		}
	}
	return token;
}

PatchError DiskFileStore::write(std::string_view relative_path, std::string_view content) {
	auto some_path = this->resolve(relative_path);
	if(!some_path) {
		return some_path.error();
	}
	auto &path = *some_path;

	std::error_code ec;
	if(fs::is_directory(path, ec)) {
		return io_error("Target is a directory:", relative_path, {});
	}
	fs::create_directories(path.parent_path(), ec);
	if(ec) {
		return io_error("Cannot create parent directories of", relative_path, ec);
	}

	auto tmp = path.parent_path() / ("." + path.filename().string() + ".fuzzypatch-tmp." + temp_token());
	{
		std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
		if(!out) {
			return io_error("Cannot open temporary file for", relative_path, std::make_error_code(std::errc::permission_denied));
		}
		out.write(content.data(), static_cast<std::streamsize>(content.size()));
		out.close();
		if(!out) {
			fs::remove(tmp, ec);
			return io_error("Cannot write", relative_path, std::make_error_code(std::errc::io_error));
		}
	}

	auto st = fs::status(path, ec);
	if(!ec && fs::exists(st)) {
		fs::permissions(tmp, st.permissions(), ec);
	}

	fs::rename(tmp, path, ec);
	if(ec) {
		auto rename_ec = ec;
		fs::remove(tmp, ec);
		return io_error("Cannot replace", relative_path, rename_ec);
	}
	return {};
}

PathLockTable::Guard::Guard(PathLockTable &table, std::string key, Slot &slot): table(table), key(std::move(key)), slot(slot) {
	this->slot.mutex.lock();
}

PathLockTable::Guard::~Guard() {
	this->slot.mutex.unlock();
	this->table.release(this->key);
}

PathLockTable::Guard PathLockTable::lock(const std::string &key) {
	Slot *slot;
	{
		std::lock_guard<std::mutex> guard(this->table_mutex);
		auto &entry = this->slots[key];
		if(!entry) {
			entry = std::make_unique<Slot>();
		}
		++entry->holders;
		slot = entry.get();
	}
	return Guard(*this, key, *slot);
}

void PathLockTable::release(const std::string &key) {
	std::lock_guard<std::mutex> guard(this->table_mutex);
	auto it = this->slots.find(key);
	if(it != this->slots.end() && --it->second->holders == 0) {
		this->slots.erase(it);
	}
}

size_t PathLockTable::size() {
	std::lock_guard<std::mutex> guard(this->table_mutex);
	return this->slots.size();
}

}// namespace FuzzyPatch
