#include "auth.hpp"
#include "ssh_util.hpp"
#include <core/config.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <cstdlib>
#include <cstring>

// Data passed to the keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round;
};

// Every prompt is answered with the password. libssh2 frees the responses.
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

static bool offers(const AuthContext& ctx, const std::string& method) {
    return ctx.methods.empty() || ctx.methods.find(method) != std::string::npos;
}

SSHResult password_login(LIBSSH2_SESSION* session, const AuthContext& ctx,
                         const std::string& password) {
    int ret = -1;

    if (ctx.methods.find("password") != std::string::npos || ctx.methods.empty()) {
        ret = ssh_retry([&] {
            return libssh2_userauth_password(session, ctx.user.c_str(), password.c_str());
        });
        if (ret == 0) return SSHResult{0, "", ""};
    }

    if (ctx.methods.find("keyboard-interactive") != std::string::npos) {
        KbdAuthData kbd_data{password, 0};
        *libssh2_session_abstract(session) = &kbd_data;
        ret = ssh_retry([&] {
            return libssh2_userauth_keyboard_interactive(session, ctx.user.c_str(), kbd_callback);
        });
        *libssh2_session_abstract(session) = nullptr;
        if (ret == 0) return SSHResult{0, "", ""};
    }

    return SSHResult{-1, "", "password rejected"};
}

// ── AgentAuth ──────────────────────────────────────────────

bool AgentAuth::available() const {
    const char* sock = std::getenv("SSH_AUTH_SOCK");
    return sock && *sock;
}

SSHResult AgentAuth::attempt(LIBSSH2_SESSION* session, const AuthContext& ctx) {
    if (!offers(ctx, "publickey")) {
        return SSHResult{-1, "", "server does not accept public keys"};
    }

    LIBSSH2_AGENT* agent = libssh2_agent_init(session);
    if (!agent) {
        return SSHResult{-1, "", "failed to initialize agent: " + ssh_last_error(session)};
    }

    SSHResult result{-1, "", "no agent identity accepted"};
    if (libssh2_agent_connect(agent) != 0) {
        result.stderr_data = "failed to connect to agent";
    } else if (libssh2_agent_list_identities(agent) != 0) {
        result.stderr_data = "failed to list agent identities";
        libssh2_agent_disconnect(agent);
    } else {
        struct libssh2_agent_publickey* identity = nullptr;
        struct libssh2_agent_publickey* prev = nullptr;
        while (true) {
            int rc = libssh2_agent_get_identity(agent, &identity, prev);
            if (rc != 0) break;   // 1 = end of list, <0 = error
            rc = ssh_retry([&] {
                return libssh2_agent_userauth(agent, ctx.user.c_str(), identity);
            });
            if (rc == 0) {
                result = SSHResult{0, "", ""};
                break;
            }
            prev = identity;
        }
        libssh2_agent_disconnect(agent);
    }

    libssh2_agent_free(agent);
    return result;
}

// ── KeyFileAuth ────────────────────────────────────────────

KeyFileAuth::KeyFileAuth(std::filesystem::path private_key)
    : private_key_(std::move(private_key)),
      public_key_(private_key_.string() + ".pub") {
}

bool KeyFileAuth::available() const {
    std::error_code ec;
    return std::filesystem::exists(private_key_, ec) && std::filesystem::exists(public_key_, ec);
}

SSHResult KeyFileAuth::attempt(LIBSSH2_SESSION* session, const AuthContext& ctx) {
    if (!offers(ctx, "publickey")) {
        return SSHResult{-1, "", "server does not accept public keys"};
    }

    int rc = ssh_retry([&] {
        return libssh2_userauth_publickey_fromfile(session, ctx.user.c_str(),
                                                   public_key_.c_str(),
                                                   private_key_.c_str(), nullptr);
    });
    if (rc == 0) return SSHResult{0, "", ""};
    return SSHResult{-1, "", private_key_.string() + ": " + ssh_last_error(session)};
}

// ── EnvPasswordAuth ────────────────────────────────────────

EnvPasswordAuth::EnvPasswordAuth(std::string variable)
    : variable_(std::move(variable)) {
}

bool EnvPasswordAuth::available() const {
    if (variable_.empty()) return false;
    const char* value = std::getenv(variable_.c_str());
    return value && *value;
}

SSHResult EnvPasswordAuth::attempt(LIBSSH2_SESSION* session, const AuthContext& ctx) {
    const char* value = std::getenv(variable_.c_str());
    if (!value) return SSHResult{-1, "", variable_ + " is not set"};
    return password_login(session, ctx, value);
}

// ── PromptPasswordAuth ─────────────────────────────────────

PromptPasswordAuth::PromptPasswordAuth(PasswordProvider provider)
    : provider_(std::move(provider)) {
}

SSHResult PromptPasswordAuth::attempt(LIBSSH2_SESSION* session, const AuthContext& ctx) {
    auto password = provider_(ctx.user + "@" + ctx.host + "'s password: ");
    if (!password) {
        return SSHResult{-1, "", "no password entered"};
    }
    return password_login(session, ctx, *password);
}

// ── AuthChain ──────────────────────────────────────────────

void AuthChain::add(std::unique_ptr<AuthStrategy> strategy) {
    strategies_.push_back(std::move(strategy));
}

std::string AuthChain::authenticate(LIBSSH2_SESSION* session, const AuthContext& ctx,
                                    StatusCallback callback) const {
    std::string tried;
    for (const auto& strategy : strategies_) {
        if (!strategy->available()) {
            parcp_log("auth: skipping " + strategy->name() + " (unavailable)");
            continue;
        }

        if (callback) callback("Trying " + strategy->name() + " auth...");
        auto result = strategy->attempt(session, ctx);
        if (result.success()) {
            parcp_log("auth: " + strategy->name() + " accepted for " + ctx.user + "@" + ctx.host);
            return strategy->name();
        }

        parcp_log("auth: " + strategy->name() + " failed: " + result.stderr_data);
        if (!tried.empty()) tried += ", ";
        tried += strategy->name();
    }

    if (tried.empty()) {
        throw AuthError("no authentication method available for " + ctx.user + "@" + ctx.host);
    }
    throw AuthError("authentication failed for " + ctx.user + "@" + ctx.host + " (tried " + tried + ")");
}

AuthChain default_auth_chain(const Config& config, PasswordProvider prompt) {
    AuthChain chain;
    if (config.ssh().use_agent) {
        chain.add(std::make_unique<AgentAuth>());
    }
    chain.add(std::make_unique<KeyFileAuth>(config.identity_path()));
    chain.add(std::make_unique<EnvPasswordAuth>(config.ssh().password_env));
    if (prompt) {
        chain.add(std::make_unique<PromptPasswordAuth>(std::move(prompt)));
    }
    return chain;
}
