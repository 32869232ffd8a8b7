#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>
#include <transfer/scheduler.hpp>

// Parsed `parcp [options] <source>... <destination>`
struct CopyOptions {
    std::vector<std::string> sources;
    std::string destination;
    std::optional<int> jobs;
    std::optional<std::string> config_path;
    bool no_compress = false;
    bool quiet = false;
};

// Rejects unknown flags, a bad --jobs value and fewer than two positionals.
Result<CopyOptions> parse_copy_args(const std::vector<std::string>& args);

class ParcpCLI {
public:
    explicit ParcpCLI(std::ostream& out = std::cout);

    // Each returns the process exit code.
    int run_copy(const CopyOptions& options);
    int run_unpack(const std::string& frame_path, const std::string& output_path);
    int run_inspect(const std::string& frame_path);

    void print_usage() const;
    void print_version() const;

private:
    std::ostream& out_;

    Result<Config> load_config(const CopyOptions& options) const;
    void print_summary(const RunReport& report, const std::string& backend,
                       const std::string& destination) const;

    static std::optional<std::string> read_password(const std::string& prompt);
};
