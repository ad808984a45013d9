// ==============================================================================
// piiguard/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
//
// ==============================================================================

#ifndef PIIGUARD_CLI_HPP
#define PIIGUARD_CLI_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace piiguard::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    bool no_banner = false;  // --no-banner
    int verbose = 0;         // -v (repeatable)
    bool quiet = false;      // -q
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// scan - найти чувствительные данные в документах
struct ScanCommand {
    std::vector<std::filesystem::path> paths;
    bool json = false;                                // -j, --json
    bool jsonl = false;                               // --jsonl
    std::optional<std::filesystem::path> output;      // -o, --output
    std::vector<std::string> extensions;              // --extension (repeatable)
    std::optional<std::filesystem::path> config;      // -c, --config
    bool skip_errors = false;                         // --skip-errors
};

/// redact - заменить найденные данные маркерами
struct RedactCommand {
    std::filesystem::path path;
    std::optional<std::filesystem::path> output;  // -o, --output
    std::optional<std::filesystem::path> config;  // -c, --config
    bool no_header = false;                       // --no-header
};

/// help - показать справку
struct HelpCommand {
    std::optional<std::string> command;
};

/// version - показать версию
struct VersionCommand {};

using Command = std::variant<ScanCommand, RedactCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 1;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help (общий или для подкоманды)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Текст --version
std::string render_version();

constexpr const char* VERSION = "0.3.0";

constexpr const char* ABOUT = "Detect and redact sensitive data in documents";

}  // namespace piiguard::cli

#endif  // PIIGUARD_CLI_HPP
