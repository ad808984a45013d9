// ==============================================================================
// config.cpp - Профиль редактирования (YAML)
// ==============================================================================

#include "piiguard/config.hpp"

#include "piiguard/platform.hpp"

#include <cctype>
#include <fstream>
#include <yaml-cpp/yaml.h>

namespace piiguard::config {

namespace {

std::string lowercase(std::string s) {
    for (auto& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

/// Заполнить профиль из корневого узла. false + error при ошибке.
bool apply_root(const YAML::Node& root, Profile& profile, std::string& error) {
    // Пустой документ - профиль по умолчанию
    if (!root || root.IsNull()) {
        return true;
    }
    if (!root.IsMap()) {
        error = "profile must be a YAML mapping";
        return false;
    }

    if (root["banner"]) {
        if (!root["banner"].IsScalar() && !root["banner"].IsNull()) {
            error = "'banner' must be a string";
            return false;
        }
        profile.banner = root["banner"].IsNull() ? "" : root["banner"].as<std::string>();
    }

    if (root["markers"]) {
        const YAML::Node& markers = root["markers"];
        if (!markers.IsMap()) {
            error = "'markers' must be a mapping of type name to marker";
            return false;
        }
        for (const auto& entry : markers) {
            auto name = entry.first.as<std::string>();
            auto type = parse_type(name);
            if (!type) {
                error = "unknown type in 'markers': " + name;
                return false;
            }
            if (!entry.second.IsScalar()) {
                error = "marker for '" + name + "' must be a string";
                return false;
            }
            profile.markers.set(*type, entry.second.as<std::string>());
        }
    }

    if (root["extensions"]) {
        const YAML::Node& exts = root["extensions"];
        if (!exts.IsSequence()) {
            error = "'extensions' must be a sequence";
            return false;
        }
        std::unordered_set<std::string> set;
        for (const auto& e : exts) {
            std::string ext = lowercase(e.as<std::string>());
            if (!ext.empty() && ext[0] == '.') {
                ext = ext.substr(1);
            }
            if (!ext.empty()) {
                set.insert(std::move(ext));
            }
        }
        profile.extensions = std::move(set);
    }

    return true;
}

}  // namespace

redact::Options Profile::redact_options(bool add_header) const {
    redact::Options opt;
    opt.markers = markers;
    opt.banner = banner;
    opt.add_header = add_header && !banner.empty();
    return opt;
}

LoadResult parse_profile(std::string_view yaml) {
    LoadResult result;
    try {
        YAML::Node root = YAML::Load(std::string(yaml));
        result.ok = apply_root(root, result.profile, result.error);
    } catch (const YAML::Exception& e) {
        result.error = std::string("YAML parse error: ") + e.what();
    }
    return result;
}

LoadResult load_profile(const std::filesystem::path& path) {
    LoadResult result;

    std::ifstream file(path);
    if (!file.is_open()) {
        result.error = "cannot open profile: " + platform::path_to_utf8(path);
        return result;
    }

    try {
        YAML::Node root = YAML::Load(file);
        result.ok = apply_root(root, result.profile, result.error);
    } catch (const YAML::Exception& e) {
        result.error = std::string("YAML parse error: ") + e.what();
    }
    return result;
}

}  // namespace piiguard::config
