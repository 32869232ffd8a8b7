#include <gtest/gtest.h>
#include <core/config.hpp>
#include <platform/platform.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

TEST(Config, EmptyTextGivesDefaults) {
    auto config = Config::parse("");
    ASSERT_TRUE(config.is_ok()) << config.error;
    EXPECT_EQ(config.value.transfer().concurrency, 8);
    EXPECT_EQ(config.value.transfer().chunk_size, 8192);
    EXPECT_TRUE(config.value.transfer().compress);
    EXPECT_EQ(config.value.transfer().compression_level, 6);
    EXPECT_EQ(config.value.ssh().port, 22);
    EXPECT_EQ(config.value.ssh().password_env, "SSH_PASSWORD");
    EXPECT_TRUE(config.value.ssh().use_agent);
    EXPECT_FALSE(config.value.ssh().identity.has_value());
    EXPECT_TRUE(config.value.log().file.empty());
}

TEST(Config, ParsesAllSections) {
    auto config = Config::parse(
        "transfer:\n"
        "  concurrency: 3\n"
        "  chunk_size: 4096\n"
        "  compress: false\n"
        "  compression_level: 9\n"
        "ssh:\n"
        "  port: 2222\n"
        "  identity: /keys/id_ed25519\n"
        "  password_env: DEPLOY_PW\n"
        "  use_agent: false\n"
        "log:\n"
        "  file: /var/log/parcp.log\n");
    ASSERT_TRUE(config.is_ok()) << config.error;
    EXPECT_EQ(config.value.transfer().concurrency, 3);
    EXPECT_EQ(config.value.transfer().chunk_size, 4096);
    EXPECT_FALSE(config.value.transfer().compress);
    EXPECT_EQ(config.value.transfer().compression_level, 9);
    EXPECT_EQ(config.value.ssh().port, 2222);
    EXPECT_EQ(config.value.identity_path(), fs::path("/keys/id_ed25519"));
    EXPECT_EQ(config.value.ssh().password_env, "DEPLOY_PW");
    EXPECT_FALSE(config.value.ssh().use_agent);
    EXPECT_EQ(config.value.log().file, "/var/log/parcp.log");
}

TEST(Config, PartialSectionKeepsDefaults) {
    auto config = Config::parse("transfer:\n  concurrency: 2\n");
    ASSERT_TRUE(config.is_ok());
    EXPECT_EQ(config.value.transfer().concurrency, 2);
    EXPECT_EQ(config.value.transfer().chunk_size, 8192);
    EXPECT_EQ(config.value.ssh().port, 22);
}

TEST(Config, RejectsInvalidValues) {
    EXPECT_TRUE(Config::parse("transfer:\n  concurrency: 0\n").is_err());
    EXPECT_TRUE(Config::parse("transfer:\n  chunk_size: 100\n").is_err());
    EXPECT_TRUE(Config::parse("transfer:\n  compression_level: 10\n").is_err());
    EXPECT_TRUE(Config::parse("ssh:\n  port: 70000\n").is_err());
    EXPECT_TRUE(Config::parse("transfer:\n  concurrency: lots\n").is_err());
    EXPECT_TRUE(Config::parse("- just\n- a list\n").is_err());
    EXPECT_TRUE(Config::parse("transfer: [unclosed\n").is_err());
}

TEST(Config, DefaultIdentityUnderHome) {
    Config config;
    EXPECT_EQ(config.identity_path(), platform::home_dir() / ".ssh" / "id_rsa");
}

TEST(Config, ExpandHome) {
    EXPECT_EQ(expand_home("~/keys/id"), platform::home_dir() / "keys/id");
    EXPECT_EQ(expand_home("~"), platform::home_dir());
    EXPECT_EQ(expand_home("/abs/path"), fs::path("/abs/path"));
}

TEST(Config, CommandLineOverrides) {
    Config config;
    config.set_concurrency(16);
    config.set_compress(false);
    EXPECT_EQ(config.transfer().concurrency, 16);
    EXPECT_FALSE(config.transfer().compress);
}

TEST(Config, LoadFile) {
    fs::path dir = fs::temp_directory_path() / "parcp_config_test";
    fs::create_directories(dir);
    std::ofstream(dir / "config.yaml") << "transfer:\n  concurrency: 5\n";

    auto config = Config::load_file(dir / "config.yaml");
    ASSERT_TRUE(config.is_ok()) << config.error;
    EXPECT_EQ(config.value.transfer().concurrency, 5);

    EXPECT_TRUE(Config::load_file(dir / "missing.yaml").is_err());
    fs::remove_all(dir);
}
