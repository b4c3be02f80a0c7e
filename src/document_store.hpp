#pragma once
#include "file_lock.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace teamfs {

using Document = nlohmann::json;

// A mutation expressed as a pure function of the current document.
// The argument is nullopt when the document does not exist. Return the new
// document, nullopt to remove it, or throw StoreError to abort with no write.
using Transform = std::function<std::optional<Document>(const std::optional<Document>&)>;

// ── DocumentStore ───────────────────────────────────────────────────
//
// Storage primitives for single JSON documents plus the read/modify/write
// primitive built on them. Paths are plain strings; lock paths name a marker
// that guards one or more documents.
//
// Only modify()/modify_held() are allowed to mutate a document that other
// processes may be touching. Nothing is atomic across two documents.
class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    virtual std::optional<Document> read(const std::string& path) const = 0;
    virtual void write_atomic(const std::string& path, const Document& doc) = 0;
    virtual void remove(const std::string& path) = 0;
    virtual bool exists(const std::string& path) const = 0;

    // Names (without ".json") of the documents directly inside `dir`, sorted.
    // Dot-files such as lock markers and counters are skipped.
    virtual std::vector<std::string> list(const std::string& dir) const = 0;

    // Names of the subdirectories directly inside `dir`, sorted.
    virtual std::vector<std::string> list_dirs(const std::string& dir) const = 0;

    virtual void ensure_dir(const std::string& dir) = 0;
    virtual void remove_tree(const std::string& dir) = 0;

    virtual std::unique_ptr<LockHandle> lock(const std::string& lock_path,
                                             std::chrono::milliseconds timeout) = 0;

    // lock -> read -> transform -> write_atomic -> unlock.
    // Returns the committed document (nullopt if it was removed).
    std::optional<Document> modify(const std::string& path, const std::string& lock_path,
                                   const Transform& fn, std::chrono::milliseconds timeout);

    // Same phasing for a caller already holding the lock that guards `path`.
    std::optional<Document> modify_held(const std::string& path, const Transform& fn);
};

// ── FileDocumentStore ───────────────────────────────────────────────
//
// The real store. Writes go to a unique temp file in the target directory,
// are fsync'ed and then renamed over the target, so a reader sees either the
// old or the new file and never a torn one.
class FileDocumentStore : public DocumentStore {
public:
    std::optional<Document> read(const std::string& path) const override;
    void write_atomic(const std::string& path, const Document& doc) override;
    void remove(const std::string& path) override;
    bool exists(const std::string& path) const override;
    std::vector<std::string> list(const std::string& dir) const override;
    std::vector<std::string> list_dirs(const std::string& dir) const override;
    void ensure_dir(const std::string& dir) override;
    void remove_tree(const std::string& dir) override;
    std::unique_ptr<LockHandle> lock(const std::string& lock_path,
                                     std::chrono::milliseconds timeout) override;
};

// ── MemoryDocumentStore ─────────────────────────────────────────────
//
// In-process stand-in used to exercise validation logic without a
// filesystem. Locks are timed mutexes keyed by lock path.
class MemoryDocumentStore : public DocumentStore {
public:
    std::optional<Document> read(const std::string& path) const override;
    void write_atomic(const std::string& path, const Document& doc) override;
    void remove(const std::string& path) override;
    bool exists(const std::string& path) const override;
    std::vector<std::string> list(const std::string& dir) const override;
    std::vector<std::string> list_dirs(const std::string& dir) const override;
    void ensure_dir(const std::string& dir) override;
    void remove_tree(const std::string& dir) override;
    std::unique_ptr<LockHandle> lock(const std::string& lock_path,
                                     std::chrono::milliseconds timeout) override;

    size_t write_count() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Document> docs_;
    std::map<std::string, std::unique_ptr<std::timed_mutex>> locks_;
    size_t writes_ = 0;
};

} // namespace teamfs
