#include <gtest/gtest.h>
#include <ssh/destination.hpp>
#include <platform/platform.hpp>

TEST(Destination, RemoteWithUser) {
    auto dest = parse_destination("alice@example.org:/srv/data");
    ASSERT_TRUE(dest.is_ok()) << dest.error;
    EXPECT_TRUE(dest.value.remote);
    EXPECT_EQ(dest.value.target.user, "alice");
    EXPECT_EQ(dest.value.target.host, "example.org");
    EXPECT_EQ(dest.value.target.path, "/srv/data");
    EXPECT_EQ(dest.value.target.display(), "alice@example.org:/srv/data");
}

TEST(Destination, RelativeRemotePath) {
    auto dest = parse_destination("bob@10.0.0.5:backups/today");
    ASSERT_TRUE(dest.is_ok());
    EXPECT_TRUE(dest.value.remote);
    EXPECT_EQ(dest.value.target.path, "backups/today");
}

TEST(Destination, PlainPathIsLocal) {
    auto dest = parse_destination("/tmp/out");
    ASSERT_TRUE(dest.is_ok());
    EXPECT_FALSE(dest.value.remote);
    EXPECT_EQ(dest.value.local_path, "/tmp/out");
}

TEST(Destination, ColonWithoutAtIsLocal) {
    auto dest = parse_destination("out:2024");
    ASSERT_TRUE(dest.is_ok());
    EXPECT_FALSE(dest.value.remote);
    EXPECT_EQ(dest.value.local_path, "out:2024");
}

TEST(Destination, AtAfterColonIsLocal) {
    auto dest = parse_destination("dir:name@x");
    ASSERT_TRUE(dest.is_ok());
    EXPECT_FALSE(dest.value.remote);
}

TEST(Destination, InvalidForms) {
    EXPECT_TRUE(parse_destination("").is_err());
    EXPECT_TRUE(parse_destination("@host:/p").is_err());
    EXPECT_TRUE(parse_destination("user@:/p").is_err());
    EXPECT_TRUE(parse_destination("user@host:").is_err());
}

TEST(RemoteTarget, MissingUserDefaultsToCurrentUser) {
    auto target = parse_remote_target("example.org:/srv");
    ASSERT_TRUE(target.is_ok());
    EXPECT_EQ(target.value.user, platform::current_username());
    EXPECT_EQ(target.value.host, "example.org");
    EXPECT_EQ(target.value.path, "/srv");
}

TEST(RemoteTarget, NeedsColon) {
    EXPECT_TRUE(parse_remote_target("user@host").is_err());
}
