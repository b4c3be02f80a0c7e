// Atomic document store tests: file and in-memory stores.
#include "test_helpers.hpp"
#include "document_store.hpp"
#include <atomic>
#include <fstream>
#include <thread>
#include <vector>

using namespace teamfs;
using namespace teamfs_test;

static const auto kTimeout = std::chrono::milliseconds(10000);

static Transform increment() {
    return [](const std::optional<Document>& cur) -> std::optional<Document> {
        int64_t n = cur ? (*cur)["n"].get<int64_t>() : 0;
        return Document{{"n", n + 1}};
    };
}

static size_t temp_files_in(const std::string& dir) {
    size_t n = 0;
    for (auto& e : fs::directory_iterator(dir)) {
        if (e.path().extension() == ".tmp") n++;
    }
    return n;
}

void test_read_write(const std::string& root) {
    test_header("read / write_atomic / remove");
    FileDocumentStore store;
    std::string path = root + "/rw/doc.json";

    check(!store.read(path), "missing document reads as nullopt");
    store.write_atomic(path, Document{{"a", 1}});
    auto doc = store.read(path);
    check(doc && (*doc)["a"] == 1, "written document reads back");
    check(store.exists(path), "exists after write");
    check(temp_files_in(root + "/rw") == 0, "no temp file left behind");

    store.write_atomic(path, Document{{"a", 2}});
    check((*store.read(path))["a"] == 2, "overwrite replaces content");

    store.remove(path);
    check(!store.exists(path), "removed");
}

void test_malformed(const std::string& root) {
    test_header("Malformed document");
    FileDocumentStore store;
    std::string path = root + "/bad.json";
    {
        std::ofstream f(path);
        f << "{\"a\": ";
    }
    expect_error(ErrorCode::IOError, [&] { store.read(path); }, "truncated JSON");
}

void test_transform_failure(const std::string& root) {
    test_header("Failed transform writes nothing");
    FileDocumentStore store;
    std::string path = root + "/tx/doc.json";
    std::string lock = root + "/tx/.lock";
    store.write_atomic(path, Document{{"v", "before"}});
    auto before = fs::last_write_time(path);

    expect_error(ErrorCode::InvalidArgument, [&] {
        store.modify(path, lock, [](const std::optional<Document>&) -> std::optional<Document> {
            throw StoreError(ErrorCode::InvalidArgument, "rejected");
        }, kTimeout);
    }, "transform error propagates");
    check((*store.read(path))["v"] == "before", "content unchanged");
    check(fs::last_write_time(path) == before, "file not rewritten");

    // The lock was released on the error path.
    auto held = store.lock(lock, std::chrono::milliseconds(100));
    test_pass("lock released after failure");
}

void test_remove_and_noop() {
    test_header("nullopt removes, identical result skips the write");
    MemoryDocumentStore store;
    std::string path = "/mem/doc.json";
    std::string lock = "/mem/.lock";

    store.modify(path, lock, increment(), kTimeout);
    check(store.write_count() == 1, "first modify writes");

    store.modify(path, lock, [](const std::optional<Document>& cur) { return cur; }, kTimeout);
    check(store.write_count() == 1, "unchanged document not rewritten");

    auto out = store.modify(path, lock,
        [](const std::optional<Document>&) -> std::optional<Document> { return std::nullopt; }, kTimeout);
    check(!out && !store.exists(path), "nullopt removes the document");

    out = store.modify(path, lock,
        [](const std::optional<Document>& cur) -> std::optional<Document> {
            if (cur) throw StoreError(ErrorCode::AlreadyExists, "exists");
            return Document{{"fresh", true}};
        }, kTimeout);
    check(out && (*out)["fresh"] == true, "absent document passed as nullopt");
}

void test_list(const std::string& root) {
    test_header("list / list_dirs");
    FileDocumentStore store;
    std::string dir = root + "/listing";
    store.write_atomic(dir + "/b.json", Document::object());
    store.write_atomic(dir + "/a.json", Document::object());
    store.write_atomic(dir + "/.counter.json", Document::object());
    { std::ofstream f(dir + "/notes.txt"); f << "x"; }
    { std::ofstream f(dir + "/.lock"); }
    store.ensure_dir(dir + "/sub");

    auto names = store.list(dir);
    check(names == std::vector<std::string>({"a", "b"}), "dot-files and non-json skipped, sorted");
    check(store.list_dirs(dir) == std::vector<std::string>({"sub"}), "subdirectories listed");
    check(store.list(root + "/nowhere").empty(), "missing directory lists empty");

    store.remove_tree(dir);
    check(!fs::exists(dir), "remove_tree");
}

void test_memory_lock_timeout() {
    test_header("MemoryDocumentStore lock timeout");
    MemoryDocumentStore store;
    auto held = store.lock("/m/.lock", kTimeout);
    std::atomic<bool> timed_out{false};
    std::thread t([&] {
        try {
            store.lock("/m/.lock", std::chrono::milliseconds(50));
        } catch (const StoreError& e) {
            timed_out = e.code() == ErrorCode::LockTimeout;
        }
    });
    t.join();
    check(timed_out, "second holder -> LockTimeout");
}

void test_concurrent_processes(const std::string& root) {
    test_header("Linearizable modify across 5 processes");
    std::string path = root + "/procs/counter.json";
    std::string lock = root + "/procs/.lock";
    FileDocumentStore().ensure_dir(root + "/procs");

    pid_t reader = fork();
    if (reader == 0) {
        // Keeps reading while writers run; any torn file fails the parse.
        int rc = 0;
        FileDocumentStore store;
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
        while (std::chrono::steady_clock::now() < deadline) {
            try {
                auto doc = store.read(path);
                if (doc && !(*doc)["n"].is_number_integer()) rc = 1;
            } catch (const StoreError&) {
                rc = 1;
            }
        }
        _exit(rc);
    }

    bool ok = run_children(5, [&](int) {
        FileDocumentStore store;
        for (int i = 0; i < 40; i++) store.modify(path, lock, increment(), kTimeout);
    });
    check(ok, "writers finished");
    check((*FileDocumentStore().read(path))["n"] == 200, "final count is 200");

    int status = 0;
    waitpid(reader, &status, 0);
    check(WIFEXITED(status) && WEXITSTATUS(status) == 0, "reader never saw a partial document");
}

void test_concurrent_threads(const std::string& root) {
    test_header("Linearizable modify across 8 threads");
    FileDocumentStore store;
    std::string path = root + "/threads/counter.json";
    std::string lock = root + "/threads/.lock";

    std::vector<std::thread> threads;
    std::atomic<int> failures{0};
    for (int t = 0; t < 8; t++) {
        threads.emplace_back([&] {
            for (int i = 0; i < 25; i++) {
                try {
                    store.modify(path, lock, increment(), kTimeout);
                } catch (const StoreError&) {
                    failures++;
                }
            }
        });
    }
    for (auto& t : threads) t.join();
    check(failures == 0, "no modify failed");
    check((*store.read(path))["n"] == 200, "final count is 200");
}

int main() {
    std::cout << "DocumentStore Tests" << std::endl;
    TempRoot root("docs");

    test_read_write(root.path());
    test_malformed(root.path());
    test_transform_failure(root.path());
    test_remove_and_noop();
    test_list(root.path());
    // Forking tests run before any thread is started.
    test_concurrent_processes(root.path());
    test_memory_lock_timeout();
    test_concurrent_threads(root.path());

    std::cout << "\nAll DocumentStore tests passed." << std::endl;
    return 0;
}
