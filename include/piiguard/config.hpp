// ==============================================================================
// piiguard/config.hpp - Профиль редактирования (YAML)
// ==============================================================================
//
// Назначение:
// - Загрузка YAML-профиля через yaml-cpp
// - Маркеры замены по типам, текст баннера, расширения для обхода директорий
//
// На обнаружение профиль не влияет: набор семейств и правила фиксированы.
//
// Формат:
// @code
//   banner: "CONFIDENTIAL DOCUMENT"   # "" отключает баннер
//   markers:
//     email: "[EMAIL]"
//     medicalRecordNumber: "MRN-XXXX"
//   extensions: [txt, md, xml]
// @endcode
//
// ==============================================================================

#ifndef PIIGUARD_CONFIG_HPP
#define PIIGUARD_CONFIG_HPP

#include <piiguard/redact.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>

namespace piiguard::config {

struct Profile {
    redact::Markers markers = redact::Markers::defaults();
    std::string banner = redact::DEFAULT_BANNER;

    /// nullopt - расширения по умолчанию
    std::optional<std::unordered_set<std::string>> extensions;

    /// Опции редактирования из профиля
    redact::Options redact_options(bool add_header) const;
};

struct LoadResult {
    bool ok = false;
    Profile profile;
    std::string error;
};

/// Загрузить профиль из файла
LoadResult load_profile(const std::filesystem::path& path);

/// Разобрать профиль из строки YAML
LoadResult parse_profile(std::string_view yaml);

}  // namespace piiguard::config

#endif  // PIIGUARD_CONFIG_HPP
