#pragma once

#include <json/value.h>
#include <filesystem>
#include <map>
#include <string>

namespace branch {

// Whole-document persistence. Implementations replace documents atomically.
class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    // Throws NotFound when absent, InvalidDocument when unreadable as a JSON object.
    virtual Json::Value load(const std::string& id) = 0;
    // Throws WriteError on failure; a failed save leaves the previous version in place.
    virtual void save(const std::string& id, const Json::Value& doc) = 0;
    // True for a stored document, and for a folder id that holds anything.
    virtual bool exists(const std::string& id) = 0;
};

// Documents stored as JSON files below a storage root. Ids are paths relative
// to the root; any id resolving outside it is rejected with AccessDenied
// before touching the filesystem.
class FileDocumentStore : public DocumentStore {
public:
    explicit FileDocumentStore(std::filesystem::path root);

    Json::Value load(const std::string& id) override;
    void save(const std::string& id, const Json::Value& doc) override;
    bool exists(const std::string& id) override;

    std::filesystem::path resolve(const std::string& id) const;
    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

class MemoryDocumentStore : public DocumentStore {
public:
    Json::Value load(const std::string& id) override;
    void save(const std::string& id, const Json::Value& doc) override;
    bool exists(const std::string& id) override;

    size_t save_count() const { return saves_; }

private:
    std::map<std::string, Json::Value> docs_;
    size_t saves_ = 0;
};

// Temp file in the target directory, fsync, then rename over the target.
// Keeps the existing file's permissions. Throws WriteError.
void atomic_write_file(const std::filesystem::path& target, const std::string& contents);

} // namespace branch
