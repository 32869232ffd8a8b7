#include <gtest/gtest.h>
#include <ssh/auth.hpp>
#include <core/config.hpp>
#include <core/errors.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>

namespace fs = std::filesystem;

namespace {

// Scripted strategy; records the order in which strategies were tried.
class FakeStrategy : public AuthStrategy {
public:
    FakeStrategy(std::string name, bool available, bool accepts, std::vector<std::string>& log)
        : name_(std::move(name)), available_(available), accepts_(accepts), log_(log) {}

    std::string name() const override { return name_; }
    bool available() const override { return available_; }
    SSHResult attempt(LIBSSH2_SESSION*, const AuthContext&) override {
        log_.push_back(name_);
        return accepts_ ? SSHResult{0, "", ""} : SSHResult{-1, "", "rejected"};
    }

private:
    std::string name_;
    bool available_;
    bool accepts_;
    std::vector<std::string>& log_;
};

AuthContext context() {
    AuthContext ctx;
    ctx.user = "alice";
    ctx.host = "example.org";
    ctx.methods = "publickey,password";
    return ctx;
}

} // namespace

TEST(AuthChain, StopsAtFirstSuccess) {
    std::vector<std::string> tried;
    AuthChain chain;
    chain.add(std::make_unique<FakeStrategy>("agent", true, false, tried));
    chain.add(std::make_unique<FakeStrategy>("key", true, true, tried));
    chain.add(std::make_unique<FakeStrategy>("password", true, true, tried));

    EXPECT_EQ(chain.authenticate(nullptr, context()), "key");
    EXPECT_EQ(tried, (std::vector<std::string>{"agent", "key"}));
}

TEST(AuthChain, SkipsUnavailable) {
    std::vector<std::string> tried;
    AuthChain chain;
    chain.add(std::make_unique<FakeStrategy>("agent", false, true, tried));
    chain.add(std::make_unique<FakeStrategy>("password", true, true, tried));

    EXPECT_EQ(chain.authenticate(nullptr, context()), "password");
    EXPECT_EQ(tried, (std::vector<std::string>{"password"}));
}

TEST(AuthChain, ExhaustionThrowsAuthError) {
    std::vector<std::string> tried;
    AuthChain chain;
    chain.add(std::make_unique<FakeStrategy>("agent", true, false, tried));
    chain.add(std::make_unique<FakeStrategy>("key", true, false, tried));

    EXPECT_THROW(chain.authenticate(nullptr, context()), AuthError);
    EXPECT_EQ(tried.size(), 2u);
}

TEST(AuthChain, NothingAvailableThrowsAuthError) {
    std::vector<std::string> tried;
    AuthChain chain;
    chain.add(std::make_unique<FakeStrategy>("agent", false, true, tried));

    EXPECT_THROW(chain.authenticate(nullptr, context()), AuthError);
    EXPECT_TRUE(tried.empty());

    AuthChain empty;
    EXPECT_THROW(empty.authenticate(nullptr, context()), AuthError);
}

TEST(AuthChain, StatusCallbackNamesStrategies) {
    std::vector<std::string> tried;
    std::vector<std::string> messages;
    AuthChain chain;
    chain.add(std::make_unique<FakeStrategy>("key", true, true, tried));

    chain.authenticate(nullptr, context(), [&](const std::string& m) { messages.push_back(m); });
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_NE(messages[0].find("key"), std::string::npos);
}

TEST(AuthChain, DefaultOrder) {
    auto config = Config::parse("ssh:\n  use_agent: true\n");
    ASSERT_TRUE(config.is_ok());

    AuthChain with_prompt = default_auth_chain(config.value,
        [](const std::string&) { return std::optional<std::string>("pw"); });
    EXPECT_EQ(with_prompt.size(), 4u);

    AuthChain without_prompt = default_auth_chain(config.value, nullptr);
    EXPECT_EQ(without_prompt.size(), 3u);

    auto no_agent = Config::parse("ssh:\n  use_agent: false\n");
    ASSERT_TRUE(no_agent.is_ok());
    EXPECT_EQ(default_auth_chain(no_agent.value, nullptr).size(), 2u);
}

TEST(AuthStrategies, KeyFileNeedsBothHalves) {
    fs::path dir = fs::temp_directory_path() / "parcp_auth_key_test";
    fs::create_directories(dir);
    std::ofstream(dir / "id_test") << "private";

    KeyFileAuth key(dir / "id_test");
    EXPECT_FALSE(key.available());

    std::ofstream(dir / "id_test.pub") << "public";
    EXPECT_TRUE(key.available());

    EXPECT_FALSE(KeyFileAuth(dir / "absent").available());
    fs::remove_all(dir);
}

TEST(AuthStrategies, EnvPasswordAvailability) {
    EnvPasswordAuth auth("PARCP_TEST_PASSWORD_VAR");
    unsetenv("PARCP_TEST_PASSWORD_VAR");
    EXPECT_FALSE(auth.available());

    setenv("PARCP_TEST_PASSWORD_VAR", "secret", 1);
    EXPECT_TRUE(auth.available());

    setenv("PARCP_TEST_PASSWORD_VAR", "", 1);
    EXPECT_FALSE(auth.available());
    unsetenv("PARCP_TEST_PASSWORD_VAR");
}

TEST(AuthStrategies, PromptNeedsProvider) {
    EXPECT_FALSE(PromptPasswordAuth(nullptr).available());
    EXPECT_TRUE(PromptPasswordAuth([](const std::string&) {
        return std::optional<std::string>();
    }).available());
}

TEST(AuthStrategies, AgentNeedsSocket) {
    const char* saved = std::getenv("SSH_AUTH_SOCK");
    std::string restore = saved ? saved : "";

    unsetenv("SSH_AUTH_SOCK");
    EXPECT_FALSE(AgentAuth().available());

    setenv("SSH_AUTH_SOCK", "/tmp/agent.sock", 1);
    EXPECT_TRUE(AgentAuth().available());

    if (saved) setenv("SSH_AUTH_SOCK", restore.c_str(), 1);
    else unsetenv("SSH_AUTH_SOCK");
}
