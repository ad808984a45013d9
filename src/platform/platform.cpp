// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================

#include "piiguard/platform.hpp"

#include <cstdio>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace piiguard::platform {

namespace {

bool is_tty(std::FILE* stream) {
#ifdef _WIN32
    return _isatty(_fileno(stream)) != 0;
#else
    return isatty(fileno(stream)) != 0;
#endif
}

}  // namespace

// UTF-8 <-> native берёт на себя std::filesystem (u8path / u8string)

std::filesystem::path path_from_utf8(std::string_view u8str) {
    return std::filesystem::u8path(u8str.begin(), u8str.end());
}

std::string path_to_utf8(const std::filesystem::path& p) {
    return p.u8string();
}

bool is_tty_stdout() {
    return is_tty(stdout);
}

bool is_tty_stderr() {
    return is_tty(stderr);
}

}  // namespace piiguard::platform
