// ==============================================================================
// piiguard/discovery.hpp - Поиск входных файлов
// ==============================================================================
//
// Назначение:
// - Рекурсивный обход директорий
// - Фильтрация по расширениям (без точки, без учёта регистра)
// - Детерминированный порядок результатов (сортировка)
// - Режим skip_errors: предупреждение вместо исключения
//
// ==============================================================================

#ifndef PIIGUARD_DISCOVERY_HPP
#define PIIGUARD_DISCOVERY_HPP

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace piiguard::io {

/// Расширения документов по умолчанию
const std::unordered_set<std::string>& default_extensions();

struct DiscoveryOptions {
    /// Допустимые расширения в нижнем регистре, без точки ("txt", не ".txt").
    /// nullopt - все файлы.
    std::optional<std::unordered_set<std::string>> extensions;

    /// true - ошибки файловой системы становятся предупреждениями
    bool skip_errors = false;

    /// Получатель предупреждений при skip_errors (может быть пустым)
    std::function<void(const std::string&)> on_warning;
};

/// Найти файлы по путям.
///
/// - Файл, указанный явно, берётся независимо от расширения
/// - Директории обходятся рекурсивно, файлы фильтруются по extensions
/// - Результат отсортирован; пустой результат - не ошибка
///
/// @throws std::runtime_error при ошибке (если skip_errors=false)
std::vector<std::filesystem::path> discover_files(const std::vector<std::filesystem::path>& inputs,
                                                  const DiscoveryOptions& opt);

/// Совпадает ли расширение файла с набором (без учёта регистра)
bool matches_extensions(const std::filesystem::path& file_path,
                        const std::optional<std::unordered_set<std::string>>& extensions);

}  // namespace piiguard::io

#endif  // PIIGUARD_DISCOVERY_HPP
