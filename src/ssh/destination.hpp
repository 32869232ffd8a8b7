#pragma once

#include <string>
#include <core/types.hpp>

// Where a remote run writes to: [user@]host:path
struct RemoteTarget {
    std::string user;
    std::string host;
    std::string path;

    std::string display() const { return user + "@" + host + ":" + path; }
};

// Parsed destination argument. Exactly one of the two forms is active.
struct Destination {
    bool remote = false;
    std::string local_path;     // when !remote
    RemoteTarget target;        // when remote
};

// "[user@]host:path". A missing user defaults to the invoking OS user.
Result<RemoteTarget> parse_remote_target(const std::string& spec);

// Backend selection: an '@' before a ':' selects the remote backend;
// anything else is a local path.
Result<Destination> parse_destination(const std::string& arg);
