#include "branch_engine/store.hpp"
#include "branch_engine/error.hpp"
#include "branch_engine/json_codec.hpp"
#include "branch_engine/log.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace branch {

FileDocumentStore::FileDocumentStore(fs::path root) : root_(fs::absolute(std::move(root))) {}

fs::path FileDocumentStore::resolve(const std::string& id) const {
    if (id.empty()) raise(ErrorKind::AccessDenied, "Empty document id");
    std::error_code ec;
    fs::path base = fs::weakly_canonical(root_, ec);
    if (ec) raise(ErrorKind::AccessDenied, "Storage root unusable: {}: {}", root_.string(), ec.message());
    fs::path target = fs::weakly_canonical(base / fs::path(id), ec);
    if (ec) raise(ErrorKind::AccessDenied, "Cannot resolve {}: {}", id, ec.message());

    fs::path rel = target.lexically_relative(base);
    if (rel.empty() || rel == "." || *rel.begin() == "..") {
        log_warning("rejected document id outside storage root: {}", id);
        raise(ErrorKind::AccessDenied, "File must be within storage root: {}", id);
    }
    return target;
}

Json::Value FileDocumentStore::load(const std::string& id) {
    fs::path p = resolve(id);
    std::error_code ec;
    if (!fs::is_regular_file(p, ec)) raise(ErrorKind::NotFound, "Document not found: {}", id);

    std::ifstream in(p, std::ios::binary);
    if (!in) raise(ErrorKind::NotFound, "Failed to open {}: {}", id, std::strerror(errno));
    std::ostringstream buf;
    buf << in.rdbuf();

    Json::Value doc = parse_json_text(buf.str(), id);
    if (!doc.isObject()) raise(ErrorKind::InvalidDocument, "File content must be a JSON object: {}", id);
    log_debug("loaded {} ({} bytes)", id, buf.str().size());
    return doc;
}

void FileDocumentStore::save(const std::string& id, const Json::Value& doc) {
    fs::path p = resolve(id);
    atomic_write_file(p, write_json_text(doc) + "\n");
    log_debug("saved {}", id);
}

bool FileDocumentStore::exists(const std::string& id) {
    std::error_code ec;
    return fs::exists(resolve(id), ec);
}

Json::Value MemoryDocumentStore::load(const std::string& id) {
    auto it = docs_.find(id);
    if (it == docs_.end()) raise(ErrorKind::NotFound, "Document not found: {}", id);
    return it->second;
}

void MemoryDocumentStore::save(const std::string& id, const Json::Value& doc) {
    docs_[id] = doc;
    ++saves_;
}

bool MemoryDocumentStore::exists(const std::string& id) {
    if (docs_.count(id) != 0) return true;
    const std::string folder = id + "/";
    auto it = docs_.lower_bound(folder);
    return it != docs_.end() && it->first.compare(0, folder.size(), folder) == 0;
}

[[noreturn]] static void write_failed(const fs::path& target, const char* step, int err) {
    log_error("{} failed for {}: {}", step, target.string(), std::strerror(err));
    raise(ErrorKind::WriteError, "Failed to write {}: {}: {}", target.string(), step, std::strerror(err));
}

void atomic_write_file(const fs::path& target, const std::string& contents) {
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) write_failed(target, "mkdir", ec.value());

    struct stat original {};
    const bool hadOriginal = ::stat(target.c_str(), &original) == 0;

    std::string pattern = (target.parent_path() / (target.filename().string() + ".XXXXXX.tmp")).string();
    std::vector<char> tmpName(pattern.begin(), pattern.end());
    tmpName.push_back('\0');
    int fd = ::mkstemps(tmpName.data(), 4);
    if (fd < 0) write_failed(target, "mkstemps", errno);

    auto abandon = [&](const char* step) {
        int err = errno;
        ::close(fd);
        ::unlink(tmpName.data());
        write_failed(target, step, err);
    };

    const char* data = contents.data();
    size_t remaining = contents.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            abandon("write");
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }
    if (::fsync(fd) != 0) abandon("fsync");
    if (hadOriginal && ::fchmod(fd, original.st_mode & 07777) != 0) abandon("fchmod");
    if (::close(fd) != 0) {
        int err = errno;
        ::unlink(tmpName.data());
        write_failed(target, "close", err);
    }
    if (::rename(tmpName.data(), target.c_str()) != 0) {
        int err = errno;
        ::unlink(tmpName.data());
        write_failed(target, "rename", err);
    }
}

} // namespace branch
