#include <gtest/gtest.h>
#include <transfer/remote_backend.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <set>

namespace fs = std::filesystem;

namespace {

// In-memory stand-in for an SSH session.
class FakeTransport : public RemoteTransport {
public:
    SSHResult create_remote_directory(const std::string& path) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (path == fail_mkdir) return SSHResult{1, "", "mkdir: Permission denied"};
        directories.insert(path);
        return SSHResult{0, "", ""};
    }

    SSHResult send_file(std::istream& input, const std::string& remote_path,
                        uint64_t size, const ByteProgress& progress) override {
        std::string data(static_cast<size_t>(size), '\0');
        input.read(&data[0], static_cast<std::streamsize>(size));
        if (static_cast<uint64_t>(input.gcount()) != size) {
            return SSHResult{-1, "", "short source"};
        }
        if (progress) progress(size);
        std::lock_guard<std::mutex> lock(mutex_);
        files[remote_path] = data;
        return SSHResult{0, "", ""};
    }

    std::mutex mutex_;
    std::string fail_mkdir;
    std::set<std::string> directories;
    std::map<std::string, std::string> files;
};

class RecordingSink : public NullProgressSink {
public:
    void on_file_progress(const ManifestEntry&, uint64_t bytes) override { last = bytes; }
    uint64_t last = 0;
};

} // namespace

class RemoteBackendTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
            (std::string("parcp_remote_test_") +
             ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    TransferTask make_task(const std::string& rel_path, const std::string& content,
                           const std::string& root) {
        auto full = test_dir / rel_path;
        fs::create_directories(full.parent_path());
        std::ofstream(full, std::ios::binary) << content;

        TransferTask task;
        task.entry.relative_path = rel_path;
        task.entry.size = content.size();
        task.entry.source_root = test_dir;
        task.source_root = test_dir;
        task.destination_root = root;
        return task;
    }
};

TEST_F(RemoteBackendTest, SendsRawBytes) {
    auto transport = std::make_shared<FakeTransport>();
    RemoteShellBackend backend(transport);
    RecordingSink sink;

    auto result = backend.transfer(make_task("src/b/c.bin", "0123456789", "/srv/data"), sink);

    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value, 10u);
    EXPECT_EQ(transport->files["/srv/data/src/b/c.bin"], "0123456789");
    EXPECT_EQ(transport->directories.count("/srv/data/src/b"), 1u);
    EXPECT_EQ(sink.last, 10u);
}

TEST_F(RemoteBackendTest, MkdirFailureFailsTask) {
    auto transport = std::make_shared<FakeTransport>();
    transport->fail_mkdir = "/srv/data/src";
    RemoteShellBackend backend(transport);
    NullProgressSink sink;

    auto result = backend.transfer(make_task("src/a.txt", "a", "/srv/data"), sink);

    EXPECT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("Permission denied"), std::string::npos);
    EXPECT_TRUE(transport->files.empty());
}

TEST_F(RemoteBackendTest, MissingSourceFailsTask) {
    auto transport = std::make_shared<FakeTransport>();
    RemoteShellBackend backend(transport);
    NullProgressSink sink;

    TransferTask task = make_task("src/a.txt", "a", "/srv/data");
    fs::remove(test_dir / "src" / "a.txt");

    auto result = backend.transfer(task, sink);
    EXPECT_TRUE(result.is_err());
    EXPECT_TRUE(transport->files.empty());
}

TEST_F(RemoteBackendTest, RemotePathJoin) {
    EXPECT_EQ(RemoteShellBackend::remote_path_for("/srv/data", "a/b.txt"), "/srv/data/a/b.txt");
    EXPECT_EQ(RemoteShellBackend::remote_path_for("/srv/data/", "a/b.txt"), "/srv/data/a/b.txt");
    EXPECT_EQ(RemoteShellBackend::remote_path_for("backup", "b.txt"), "backup/b.txt");
    EXPECT_EQ(RemoteShellBackend::remote_path_for("/", "b.txt"), "/b.txt");
}
