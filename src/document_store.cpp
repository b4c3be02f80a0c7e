#include "document_store.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <fstream>
#include <iterator>

#ifdef _WIN32
#include <process.h>
#else
#include <unistd.h>
#include <fcntl.h>
#endif

namespace teamfs {

// ── DocumentStore ───────────────────────────────────────────────────

std::optional<Document> DocumentStore::modify(const std::string& path,
                                              const std::string& lock_path,
                                              const Transform& fn,
                                              std::chrono::milliseconds timeout) {
    auto held = lock(lock_path, timeout);
    return modify_held(path, fn);
}

std::optional<Document> DocumentStore::modify_held(const std::string& path,
                                                   const Transform& fn) {
    std::optional<Document> current = read(path);
    // Validation happens inside fn; a throw here leaves the file untouched.
    std::optional<Document> next = fn(current);

    if (!next) {
        if (current) remove(path);
        return std::nullopt;
    }
    if (!current || *current != *next) write_atomic(path, *next);
    return next;
}

// ── FileDocumentStore ───────────────────────────────────────────────

namespace {

std::string temp_path_for(const fs::path& target) {
    static std::atomic<uint64_t> counter{0};
#ifdef _WIN32
    long pid = static_cast<long>(_getpid());
#else
    long pid = static_cast<long>(::getpid());
#endif
    std::string name = "." + target.filename().string() + "." + std::to_string(pid) +
                       "." + std::to_string(counter.fetch_add(1)) + ".tmp";
    return (target.parent_path() / name).string();
}

#ifndef _WIN32
void write_all(int fd, const std::string& data, const std::string& tmp) {
    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw io_error_errno("write " + tmp, errno);
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
}

void sync_dir(const fs::path& dir) {
    std::string d = dir.empty() ? "." : dir.string();
    int fd = ::open(d.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) throw io_error_errno("open dir " + d, errno);
    int rc = ::fsync(fd);
    int err = errno;
    ::close(fd);
    // Some filesystems cannot fsync a directory; the rename itself is still atomic.
    if (rc != 0 && err != EINVAL && err != ENOTSUP) throw io_error_errno("fsync " + d, err);
}
#endif

} // namespace

std::optional<Document> FileDocumentStore::read(const std::string& path) const {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        int err = errno;
        std::error_code ec;
        if (!fs::exists(path, ec)) return std::nullopt;
        throw io_error_errno("open " + path, err);
    }
    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    try {
        return Document::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw StoreError(ErrorCode::IOError, "malformed document " + path + ": " + e.what());
    }
}

void FileDocumentStore::write_atomic(const std::string& path, const Document& doc) {
    fs::path target(path);
    fs::path dir = target.parent_path();
    if (!dir.empty()) ensure_dir(dir.string());

    std::string data = doc.dump(2);
    data += "\n";
    std::string tmp = temp_path_for(target);

#ifdef _WIN32
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f) throw StoreError(ErrorCode::IOError, "create " + tmp);
        f << data;
        f.flush();
        if (!f) {
            f.close();
            std::error_code ec;
            fs::remove(tmp, ec);
            throw StoreError(ErrorCode::IOError, "write " + tmp);
        }
    }
    if (!MoveFileExA(tmp.c_str(), path.c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        DWORD err = GetLastError();
        std::error_code ec;
        fs::remove(tmp, ec);
        throw StoreError(ErrorCode::IOError,
                         "rename " + tmp + " -> " + path + ": error " + std::to_string(err));
    }
#else
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) throw io_error_errno("create " + tmp, errno);
    try {
        write_all(fd, data, tmp);
        if (::fsync(fd) != 0) throw io_error_errno("fsync " + tmp, errno);
    } catch (...) {
        ::close(fd);
        ::unlink(tmp.c_str());
        throw;
    }
    if (::close(fd) != 0) {
        int err = errno;
        ::unlink(tmp.c_str());
        throw io_error_errno("close " + tmp, err);
    }
    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        int err = errno;
        ::unlink(tmp.c_str());
        throw io_error_errno("rename " + tmp + " -> " + path, err);
    }
    sync_dir(dir);
#endif
}

void FileDocumentStore::remove(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) throw io_error("remove " + path, ec);
}

bool FileDocumentStore::exists(const std::string& path) const {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

std::vector<std::string> FileDocumentStore::list(const std::string& dir) const {
    std::vector<std::string> names;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return names;

    fs::directory_iterator it(dir, ec);
    if (ec) throw io_error("list " + dir, ec);
    for (const auto& e : it) {
        std::string name = e.path().filename().string();
        if (name.empty() || name[0] == '.') continue;
        if (e.path().extension() != ".json") continue;
        std::error_code fec;
        if (!e.is_regular_file(fec)) continue;
        names.push_back(e.path().stem().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> FileDocumentStore::list_dirs(const std::string& dir) const {
    std::vector<std::string> names;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return names;

    fs::directory_iterator it(dir, ec);
    if (ec) throw io_error("list " + dir, ec);
    for (const auto& e : it) {
        std::error_code dec;
        if (e.is_directory(dec)) names.push_back(e.path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

void FileDocumentStore::ensure_dir(const std::string& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw io_error("create " + dir, ec);
}

void FileDocumentStore::remove_tree(const std::string& dir) {
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) throw io_error("remove " + dir, ec);
}

std::unique_ptr<LockHandle> FileDocumentStore::lock(const std::string& lock_path,
                                                    std::chrono::milliseconds timeout) {
    fs::path dir = fs::path(lock_path).parent_path();
    if (!dir.empty()) ensure_dir(dir.string());
    return std::make_unique<FileLock>(lock_path, timeout);
}

// ── MemoryDocumentStore ─────────────────────────────────────────────

namespace {

class MemoryLock final : public LockHandle {
public:
    explicit MemoryLock(std::timed_mutex& m) : m_(m) {}
    ~MemoryLock() override { m_.unlock(); }
private:
    std::timed_mutex& m_;
};

bool directly_inside(const std::string& key, const std::string& dir) {
    std::string prefix = dir + "/";
    if (key.compare(0, prefix.size(), prefix) != 0) return false;
    return key.find('/', prefix.size()) == std::string::npos;
}

} // namespace

std::optional<Document> MemoryDocumentStore::read(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = docs_.find(path);
    if (it == docs_.end()) return std::nullopt;
    return it->second;
}

void MemoryDocumentStore::write_atomic(const std::string& path, const Document& doc) {
    std::lock_guard<std::mutex> lock(mutex_);
    docs_[path] = doc;
    ++writes_;
}

void MemoryDocumentStore::remove(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    docs_.erase(path);
}

bool MemoryDocumentStore::exists(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return docs_.count(path) > 0;
}

std::vector<std::string> MemoryDocumentStore::list(const std::string& dir) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (auto& [key, _] : docs_) {
        if (!directly_inside(key, dir)) continue;
        fs::path p(key);
        std::string name = p.filename().string();
        if (name.empty() || name[0] == '.' || p.extension() != ".json") continue;
        names.push_back(p.stem().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> MemoryDocumentStore::list_dirs(const std::string& dir) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string prefix = dir + "/";
    std::vector<std::string> names;
    for (auto& [key, _] : docs_) {
        if (key.compare(0, prefix.size(), prefix) != 0) continue;
        auto slash = key.find('/', prefix.size());
        if (slash == std::string::npos) continue;
        names.push_back(key.substr(prefix.size(), slash - prefix.size()));
    }
    std::sort(names.begin(), names.end());
    names.erase(std::unique(names.begin(), names.end()), names.end());
    return names;
}

void MemoryDocumentStore::ensure_dir(const std::string&) {}

void MemoryDocumentStore::remove_tree(const std::string& dir) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string prefix = dir + "/";
    for (auto it = docs_.begin(); it != docs_.end();) {
        if (it->first.compare(0, prefix.size(), prefix) == 0) it = docs_.erase(it);
        else ++it;
    }
}

std::unique_ptr<LockHandle> MemoryDocumentStore::lock(const std::string& lock_path,
                                                      std::chrono::milliseconds timeout) {
    std::timed_mutex* m = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = locks_[lock_path];
        if (!slot) slot = std::make_unique<std::timed_mutex>();
        m = slot.get();
    }
    if (!m->try_lock_for(timeout)) {
        throw StoreError(ErrorCode::LockTimeout,
                         "timed out after " + std::to_string(timeout.count()) +
                         "ms waiting for lock " + lock_path);
    }
    return std::make_unique<MemoryLock>(*m);
}

size_t MemoryDocumentStore::write_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return writes_;
}

} // namespace teamfs
