#include "destination.hpp"
#include <platform/platform.hpp>

Result<RemoteTarget> parse_remote_target(const std::string& spec) {
    auto colon = spec.find(':');
    if (colon == std::string::npos) {
        return Result<RemoteTarget>::Err("remote destination needs host:path: " + spec);
    }

    std::string authority = spec.substr(0, colon);
    RemoteTarget target;
    target.path = spec.substr(colon + 1);

    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        target.user = authority.substr(0, at);
        target.host = authority.substr(at + 1);
        if (target.user.empty()) {
            return Result<RemoteTarget>::Err("empty user in destination: " + spec);
        }
    } else {
        target.user = platform::current_username();
        target.host = authority;
    }

    if (target.host.empty()) {
        return Result<RemoteTarget>::Err("empty host in destination: " + spec);
    }
    if (target.path.empty()) {
        return Result<RemoteTarget>::Err("empty remote path in destination: " + spec);
    }

    return Result<RemoteTarget>::Ok(target);
}

Result<Destination> parse_destination(const std::string& arg) {
    if (arg.empty()) {
        return Result<Destination>::Err("empty destination");
    }

    Destination dest;
    auto colon = arg.find(':');
    auto at = arg.find('@');
    if (colon != std::string::npos && at != std::string::npos && at < colon) {
        auto target = parse_remote_target(arg);
        if (target.is_err()) {
            return Result<Destination>::Err(target.error);
        }
        dest.remote = true;
        dest.target = target.value;
    } else {
        dest.local_path = arg;
    }

    return Result<Destination>::Ok(dest);
}
