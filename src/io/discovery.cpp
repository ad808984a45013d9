// ==============================================================================
// discovery.cpp - Поиск входных файлов
// ==============================================================================

#include "piiguard/discovery.hpp"

#include "piiguard/platform.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <system_error>

namespace piiguard::io {

namespace {

std::string lowercase(std::string s) {
    for (auto& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

/// Ошибка: предупреждение при skip_errors, иначе исключение
void fail(const DiscoveryOptions& opt, const std::string& message) {
    if (!opt.skip_errors) {
        throw std::runtime_error(message);
    }
    if (opt.on_warning) {
        opt.on_warning(message);
    }
}

void collect_directory(const std::filesystem::path& dir, const DiscoveryOptions& opt,
                       std::vector<std::filesystem::path>& result) {
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(
        dir, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        fail(opt, "failed to read directory - " + ec.message());
        return;
    }

    for (auto end = std::filesystem::recursive_directory_iterator(); it != end;) {
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec) && !entry_ec &&
            matches_extensions(it->path(), opt.extensions)) {
            result.push_back(it->path());
        }

        it.increment(ec);
        if (ec) {
            fail(opt, "failed to enter directory - " + ec.message());
            return;
        }
    }
}

}  // namespace

const std::unordered_set<std::string>& default_extensions() {
    static const std::unordered_set<std::string> exts = {"txt", "text", "md",  "csv",
                                                         "log", "xml",  "json"};
    return exts;
}

bool matches_extensions(const std::filesystem::path& file_path,
                        const std::optional<std::unordered_set<std::string>>& extensions) {
    if (!extensions.has_value()) {
        return true;
    }
    if (!file_path.has_extension()) {
        return false;
    }

    // extension() возвращает ".txt"
    std::string ext = file_path.extension().string();
    if (!ext.empty() && ext[0] == '.') {
        ext = ext.substr(1);
    }
    return extensions->count(lowercase(ext)) > 0;
}

std::vector<std::filesystem::path> discover_files(const std::vector<std::filesystem::path>& inputs,
                                                  const DiscoveryOptions& opt) {
    std::vector<std::filesystem::path> result;

    for (const auto& input : inputs) {
        std::error_code ec;
        auto status = std::filesystem::status(input, ec);
        if (ec && ec != std::errc::no_such_file_or_directory) {
            fail(opt, "failed to get metadata for file - " + ec.message());
            continue;
        }
        if (!std::filesystem::exists(status)) {
            fail(opt, "Specified path does not exist - " + platform::path_to_utf8(input));
            continue;
        }

        if (std::filesystem::is_directory(status)) {
            collect_directory(input, opt, result);
        } else if (std::filesystem::is_regular_file(status)) {
            // Явно указанный файл не фильтруется по расширению
            result.push_back(input);
        }
    }

    // Порядок обхода зависит от ОС, сортировка делает его воспроизводимым
    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());

    return result;
}

}  // namespace piiguard::io
