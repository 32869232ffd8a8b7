#include "platform.hpp"
#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

static const struct passwd* own_passwd_entry() {
    return getpwuid(geteuid());
}

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (home && *home) return fs::path(home);

    const struct passwd* pw = own_passwd_entry();
    if (pw && pw->pw_dir) return fs::path(pw->pw_dir);
    return temp_dir();
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

std::string current_username() {
    for (const char* var : {"USER", "LOGNAME"}) {
        const char* value = std::getenv(var);
        if (value && *value) return value;
    }

    const struct passwd* pw = own_passwd_entry();
    if (pw && pw->pw_name) return pw->pw_name;
    return "unknown";
}

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

} // namespace platform
