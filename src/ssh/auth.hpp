#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>

// libssh2 forward declaration
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

class Config;

// What the server told us before authentication started.
struct AuthContext {
    std::string user;
    std::string host;
    std::string methods;   // comma-separated list from the server, may be empty
};

// Asks the operator for a password. Returns nullopt if none was given.
using PasswordProvider = std::function<std::optional<std::string>(const std::string& prompt)>;

// One way of proving identity to the server.
class AuthStrategy {
public:
    virtual ~AuthStrategy() = default;

    virtual std::string name() const = 0;

    // False when the strategy has nothing to offer (no agent socket, no key
    // files, variable unset...). Unavailable strategies are skipped.
    virtual bool available() const = 0;

    // Try to authenticate; success() on acceptance.
    virtual SSHResult attempt(LIBSSH2_SESSION* session, const AuthContext& ctx) = 0;
};

// Running ssh-agent (SSH_AUTH_SOCK), every identity it holds
class AgentAuth : public AuthStrategy {
public:
    std::string name() const override { return "agent"; }
    bool available() const override;
    SSHResult attempt(LIBSSH2_SESSION* session, const AuthContext& ctx) override;
};

// Private key file plus its ".pub" sibling; both must exist
class KeyFileAuth : public AuthStrategy {
public:
    explicit KeyFileAuth(std::filesystem::path private_key);

    std::string name() const override { return "publickey"; }
    bool available() const override;
    SSHResult attempt(LIBSSH2_SESSION* session, const AuthContext& ctx) override;

private:
    std::filesystem::path private_key_;
    std::filesystem::path public_key_;
};

// Password read from an environment variable
class EnvPasswordAuth : public AuthStrategy {
public:
    explicit EnvPasswordAuth(std::string variable);

    std::string name() const override { return "password (" + variable_ + ")"; }
    bool available() const override;
    SSHResult attempt(LIBSSH2_SESSION* session, const AuthContext& ctx) override;

private:
    std::string variable_;
};

// Password asked from the operator, once per session
class PromptPasswordAuth : public AuthStrategy {
public:
    explicit PromptPasswordAuth(PasswordProvider provider);

    std::string name() const override { return "password (prompt)"; }
    bool available() const override { return static_cast<bool>(provider_); }
    SSHResult attempt(LIBSSH2_SESSION* session, const AuthContext& ctx) override;

private:
    PasswordProvider provider_;
};

// Password login: "password" method when offered, else keyboard-interactive
// answering every prompt with the password.
SSHResult password_login(LIBSSH2_SESSION* session, const AuthContext& ctx,
                         const std::string& password);

// Ordered list of strategies, tried until one succeeds.
class AuthChain {
public:
    AuthChain() = default;
    AuthChain(AuthChain&&) = default;
    AuthChain& operator=(AuthChain&&) = default;

    void add(std::unique_ptr<AuthStrategy> strategy);
    size_t size() const { return strategies_.size(); }

    // Returns the name of the strategy that was accepted.
    // Throws AuthError when every strategy is unavailable or rejected.
    std::string authenticate(LIBSSH2_SESSION* session, const AuthContext& ctx,
                             StatusCallback callback = nullptr) const;

private:
    std::vector<std::unique_ptr<AuthStrategy>> strategies_;
};

// agent → key pair → environment password → prompt, as configured.
AuthChain default_auth_chain(const Config& config, PasswordProvider prompt);
