#include <gtest/gtest.h>
#include <transfer/scanner.hpp>
#include <transfer/checksum.hpp>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

class ScannerTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
            (std::string("parcp_scanner_test_") +
             ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path write_file(const std::string& rel_path, const std::string& content) {
        auto full = test_dir / rel_path;
        fs::create_directories(full.parent_path());
        std::ofstream(full, std::ios::binary) << content;
        return full;
    }

    static std::string pattern(size_t size) {
        std::string data(size, '\0');
        for (size_t i = 0; i < size; i++) data[i] = static_cast<char>('a' + i % 26);
        return data;
    }

    Digest256 fingerprint_of(const std::string& content) {
        auto path = write_file("fp.bin", content);
        auto fp = FingerprintScanner::fingerprint_file(path, content.size());
        EXPECT_TRUE(fp.is_ok()) << fp.error;
        return fp.value;
    }
};

TEST_F(ScannerTest, RelativePathsAreUniqueAndOrdered) {
    write_file("src/sub/c.txt", "c");
    write_file("src/a.txt", "a");
    write_file("src/sub/b.bin", "b");

    FingerprintScanner scanner;
    Manifest manifest = scanner.scan({test_dir / "src"});

    ASSERT_EQ(manifest.entries.size(), 3u);
    EXPECT_EQ(manifest.entries[0].relative_path, "src/a.txt");
    EXPECT_EQ(manifest.entries[1].relative_path, "src/sub/b.bin");
    EXPECT_EQ(manifest.entries[2].relative_path, "src/sub/c.txt");
    EXPECT_TRUE(manifest.warnings.empty());

    std::set<std::string> paths;
    for (const auto& e : manifest.entries) paths.insert(e.relative_path);
    EXPECT_EQ(paths.size(), manifest.entries.size());
}

TEST_F(ScannerTest, EntryFields) {
    write_file("src/notes.md", "hello");

    FingerprintScanner scanner;
    Manifest manifest = scanner.scan({test_dir / "src"});

    ASSERT_EQ(manifest.entries.size(), 1u);
    const auto& e = manifest.entries[0];
    EXPECT_EQ(e.size, 5u);
    EXPECT_GT(e.modified_at, 0u);
    EXPECT_TRUE(e.compressible);
    EXPECT_EQ(e.source_root, test_dir);
    EXPECT_TRUE(fs::exists(e.source_path()));
    EXPECT_EQ(manifest.total_bytes(), 5u);
}

TEST_F(ScannerTest, FileRootUsesFileName) {
    auto file = write_file("deep/dir/single.csv", "1,2,3\n");

    FingerprintScanner scanner;
    Manifest manifest = scanner.scan({file});

    ASSERT_EQ(manifest.entries.size(), 1u);
    EXPECT_EQ(manifest.entries[0].relative_path, "single.csv");
}

TEST_F(ScannerTest, DuplicateRelativePathSkipped) {
    auto first = write_file("one/x.txt", "first");
    auto second = write_file("two/x.txt", "second");

    FingerprintScanner scanner;
    Manifest manifest = scanner.scan({first, second});

    ASSERT_EQ(manifest.entries.size(), 1u);
    EXPECT_EQ(manifest.entries[0].size, 5u);
    ASSERT_EQ(manifest.warnings.size(), 1u);
    EXPECT_NE(manifest.warnings[0].reason.find("duplicate"), std::string::npos);
}

TEST_F(ScannerTest, MissingRootIsWarning) {
    write_file("src/a.txt", "a");

    std::vector<std::string> reported;
    FingerprintScanner scanner([&](const std::string& msg) { reported.push_back(msg); });
    Manifest manifest = scanner.scan({test_dir / "nope", test_dir / "src"});

    EXPECT_EQ(manifest.entries.size(), 1u);
    ASSERT_EQ(manifest.warnings.size(), 1u);
    EXPECT_EQ(reported.size(), 1u);
}

TEST_F(ScannerTest, SymlinkSkippedWithWarning) {
    auto target = write_file("src/real.txt", "data");
    fs::create_symlink(target, test_dir / "src" / "link.txt");

    FingerprintScanner scanner;
    Manifest manifest = scanner.scan({test_dir / "src"});

    ASSERT_EQ(manifest.entries.size(), 1u);
    EXPECT_EQ(manifest.entries[0].relative_path, "src/real.txt");
    ASSERT_EQ(manifest.warnings.size(), 1u);
    EXPECT_NE(manifest.warnings[0].reason.find("symlink"), std::string::npos);
}

TEST_F(ScannerTest, EmptyDirectoryYieldsNothing) {
    fs::create_directories(test_dir / "empty");

    FingerprintScanner scanner;
    Manifest manifest = scanner.scan({test_dir / "empty"});

    EXPECT_TRUE(manifest.entries.empty());
    EXPECT_TRUE(manifest.warnings.empty());
}

TEST_F(ScannerTest, FingerprintDeterministic) {
    write_file("src/a.bin", pattern(20000));

    FingerprintScanner scanner;
    Manifest first = scanner.scan({test_dir / "src"});
    Manifest second = scanner.scan({test_dir / "src"});

    ASSERT_EQ(first.entries.size(), 1u);
    ASSERT_EQ(second.entries.size(), 1u);
    EXPECT_EQ(first.entries[0].fingerprint, second.entries[0].fingerprint);
}

TEST_F(ScannerTest, SmallFileFingerprintIsWholeContentHash) {
    std::string content = "short file";
    Sha256Accumulator sha;
    sha.update(content.data(), content.size());
    EXPECT_EQ(fingerprint_of(content), sha.finish());
}

TEST_F(ScannerTest, EmptyFileFingerprint) {
    Sha256Accumulator sha;
    EXPECT_EQ(fingerprint_of(""), sha.finish());
}

TEST_F(ScannerTest, HeadByteChangesFingerprint) {
    std::string base = pattern(10000);
    std::string changed = base;
    changed[0] = '#';
    EXPECT_NE(fingerprint_of(base), fingerprint_of(changed));
}

TEST_F(ScannerTest, TailByteChangesFingerprint) {
    std::string base = pattern(10000);
    std::string changed = base;
    changed[9999] = '#';
    EXPECT_NE(fingerprint_of(base), fingerprint_of(changed));
}

TEST_F(ScannerTest, InteriorChangeCollides) {
    // Bytes outside the first and last 4096 are not sampled
    std::string base = pattern(10000);
    std::string changed = base;
    changed[5000] = '#';
    EXPECT_EQ(fingerprint_of(base), fingerprint_of(changed));
}

TEST_F(ScannerTest, TailWindowOverlapsHeadBetweenOneAndTwoWindows) {
    // 5000 bytes: head is [0, 4096), tail is [904, 5000)
    std::string base = pattern(5000);
    std::string changed = base;
    changed[4500] = '#';
    EXPECT_NE(fingerprint_of(base), fingerprint_of(changed));
}

TEST_F(ScannerTest, ShortStreamThrows) {
    std::istringstream in("only ten b");
    EXPECT_THROW(FingerprintScanner::fingerprint(in, 100), std::runtime_error);
}

TEST_F(ScannerTest, CompressibleExtensions) {
    EXPECT_TRUE(FingerprintScanner::is_compressible("a.txt"));
    EXPECT_TRUE(FingerprintScanner::is_compressible("dir/data.JSON"));
    EXPECT_TRUE(FingerprintScanner::is_compressible("cfg.yaml"));
    EXPECT_FALSE(FingerprintScanner::is_compressible("photo.jpg"));
    EXPECT_FALSE(FingerprintScanner::is_compressible("c.bin"));
    EXPECT_FALSE(FingerprintScanner::is_compressible("Makefile"));
}
