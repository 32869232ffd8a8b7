#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load global config from ~/.parcp/config.yaml (defaults if absent)
    static Result<Config> load_global();

    // Load config from an explicit file (must exist)
    static Result<Config> load_file(const fs::path& path);

    // Parse config from YAML text
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const TransferSettings& transfer() const { return transfer_; }
    const SshSettings& ssh() const { return ssh_; }
    const LogSettings& log() const { return log_; }

    // Command-line overrides
    void set_concurrency(int jobs) { transfer_.concurrency = jobs; }
    void set_compress(bool compress) { transfer_.compress = compress; }

    // Private key path, with the $HOME default applied
    fs::path identity_path() const;

public:
    Config() = default;

private:
    TransferSettings transfer_;
    SshSettings ssh_;
    LogSettings log_;

    friend class ConfigBuilder;
};

// Helper to check if the global config exists
bool global_config_exists();

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();

// Expand a leading "~/" against the home directory
fs::path expand_home(const std::string& path);
