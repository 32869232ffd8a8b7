#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".parcp";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

fs::path expand_home(const std::string& path) {
    if (path == "~") return platform::home_dir();
    if (path.rfind("~/", 0) == 0) {
        return platform::home_dir() / path.substr(2);
    }
    return fs::path(path);
}

fs::path Config::identity_path() const {
    if (ssh_.identity && !ssh_.identity->empty()) {
        return expand_home(*ssh_.identity);
    }
    return platform::home_dir() / DEFAULT_IDENTITY;
}

// Present keys must convert; absent keys take the default.
template <typename T>
static T read_or(const YAML::Node& node, const char* key, const T& fallback) {
    if (!node[key]) return fallback;
    try {
        return node[key].as<T>();
    } catch (const YAML::BadConversion&) {
        throw std::runtime_error(fmt::format("invalid value for '{}'", key));
    }
}

static TransferSettings parse_transfer_config(const YAML::Node& node) {
    TransferSettings transfer;
    transfer.concurrency = read_or(node, "concurrency", DEFAULT_CONCURRENCY);
    transfer.chunk_size = read_or(node, "chunk_size", DEFAULT_CHUNK_SIZE);
    transfer.compress = read_or(node, "compress", true);
    transfer.compression_level = read_or(node, "compression_level", DEFAULT_COMPRESSION_LEVEL);

    if (transfer.concurrency < 1) {
        throw std::runtime_error(fmt::format(
            "transfer.concurrency must be at least 1 (got {})", transfer.concurrency));
    }
    if (transfer.chunk_size < MIN_CHUNK_SIZE) {
        throw std::runtime_error(fmt::format(
            "transfer.chunk_size must be at least {} (got {})", MIN_CHUNK_SIZE, transfer.chunk_size));
    }
    if (transfer.compression_level < 0 || transfer.compression_level > 9) {
        throw std::runtime_error(fmt::format(
            "transfer.compression_level must be 0..9 (got {})", transfer.compression_level));
    }

    return transfer;
}

static SshSettings parse_ssh_config(const YAML::Node& node) {
    SshSettings ssh;
    ssh.port = read_or(node, "port", SSH_DEFAULT_PORT);
    ssh.password_env = read_or<std::string>(node, "password_env", DEFAULT_PASSWORD_ENV);
    ssh.use_agent = read_or(node, "use_agent", true);

    if (node["identity"]) {
        ssh.identity = read_or<std::string>(node, "identity", "");
    }

    if (ssh.port < 1 || ssh.port > 65535) {
        throw std::runtime_error(fmt::format("ssh.port out of range (got {})", ssh.port));
    }

    return ssh;
}

static LogSettings parse_log_config(const YAML::Node& node) {
    LogSettings log;
    log.file = read_or<std::string>(node, "file", "");
    return log;
}

class ConfigBuilder {
public:
    static Config from_yaml(const YAML::Node& root) {
        Config config;
        config.transfer_ = parse_transfer_config(root["transfer"] ? root["transfer"] : YAML::Node());
        config.ssh_ = parse_ssh_config(root["ssh"] ? root["ssh"] : YAML::Node());
        config.log_ = parse_log_config(root["log"] ? root["log"] : YAML::Node());
        return config;
    }
};

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (root && !root.IsNull() && !root.IsMap()) {
            return Result<Config>::Err("Config root must be a mapping");
        }
        return Result<Config>::Ok(ConfigBuilder::from_yaml(root));
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Cannot read config at " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());

    auto result = parse(text);
    if (result.is_err()) {
        return Result<Config>::Err(path.string() + ": " + result.error);
    }
    return result;
}

Result<Config> Config::load_global() {
    // No global config is fine: everything has a default
    if (!global_config_exists()) {
        return Result<Config>::Ok(Config{});
    }
    return load_file(get_global_config_path());
}
