// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================

#include "piiguard/cli.hpp"

#include "piiguard/platform.hpp"

#include <cstring>

namespace piiguard::cli {

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

/// Ошибка использования в стиле clap
CliDiagnostic usage_error(const std::string& error_msg, const char* usage) {
    CliDiagnostic d;
    d.exit_code = 2;
    d.stderr_message = "error: " + error_msg + "\n\nUsage: " + usage +
                       "\n\nFor more information, try '--help'.\n";
    return d;
}

constexpr const char* MAIN_USAGE = "piiguard [OPTIONS] <COMMAND>";
constexpr const char* SCAN_USAGE = "piiguard scan [OPTIONS] <PATH>...";
constexpr const char* REDACT_USAGE = "piiguard redact [OPTIONS] <PATH>";

/// Взять значение опции. nullptr, если значения нет.
const char* take_value(int argc, char** argv, int& i) {
    if (i + 1 >= argc) {
        return nullptr;
    }
    ++i;
    return argv[i];
}

std::string missing_value(const char* option, const char* name) {
    return std::string("a value is required for '") + option + " <" + name +
           ">' but none was supplied";
}

}  // namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("piiguard ") + VERSION + "\n";
}

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: piiguard [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  scan    Find sensitive data in documents\n"
               "  redact  Replace sensitive data in a document with redaction markers\n"
               "  help    Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Options:\n"
               "      --no-banner  Hide the banner\n"
               "  -v...            Print verbose output\n"
               "  -q               Suppress informational output\n"
               "  -h, --help       Print help\n"
               "  -V, --version    Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    Scan a folder of exported documents:\n"
               "        ./piiguard scan exports/\n"
               "\n"
               "    Scan and output JSON lines:\n"
               "        ./piiguard scan --jsonl notes.txt\n"
               "\n"
               "    Redact a document into a new file:\n"
               "        ./piiguard redact intake.txt -o intake.redacted.txt\n";
    } else if (*command == "scan") {
        return "Find sensitive data in documents\n"
               "\n"
               "Usage: piiguard scan [OPTIONS] <PATH>...\n"
               "\n"
               "Arguments:\n"
               "  <PATH>...  Files or directories to scan\n"
               "\n"
               "Options:\n"
               "  -j, --json                   Output as JSON\n"
               "      --jsonl                  Output as JSON lines\n"
               "  -o, --output <OUTPUT>        Save output to a file\n"
               "      --extension <EXTENSION>  Only load files with this extension (repeatable)\n"
               "  -c, --config <CONFIG>        A YAML profile\n"
               "      --skip-errors            Skip errors and continue processing\n"
               "  -h, --help                   Print help\n";
    } else if (*command == "redact") {
        return "Replace sensitive data in a document with redaction markers\n"
               "\n"
               "Usage: piiguard redact [OPTIONS] <PATH>\n"
               "\n"
               "Arguments:\n"
               "  <PATH>  The document to redact\n"
               "\n"
               "Options:\n"
               "  -o, --output <OUTPUT>  Save the redacted document to a file\n"
               "  -c, --config <CONFIG>  A YAML profile with markers and banner\n"
               "      --no-header        Do not add the confidentiality banner\n"
               "  -h, --help             Print help\n";
    }
    return "error: unrecognized subcommand '" + *command + "'\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.command = HelpCommand{};

    if (argc < 2) {
        // Без аргументов: справка в stderr, exit code 2
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    // Глобальные опции до подкоманды
    int cmd_idx = argc;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (str_eq(arg, "--no-banner")) {
            result.global.no_banner = true;
        } else if (str_eq(arg, "-v")) {
            result.global.verbose++;
        } else if (str_eq(arg, "-vv")) {
            result.global.verbose += 2;
        } else if (str_eq(arg, "-q")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (arg[0] == '-') {
            result.diagnostic =
                usage_error(std::string("unexpected argument '") + arg + "' found", MAIN_USAGE);
            return result;
        } else {
            cmd_idx = i;
            break;
        }
    }

    if (cmd_idx >= argc) {
        result.ok = true;
        result.command = HelpCommand{};
        return result;
    }

    const char* cmd = argv[cmd_idx];

    if (str_eq(cmd, "scan")) {
        ScanCommand scan_cmd;
        for (int i = cmd_idx + 1; i < argc; ++i) {
            const char* arg = argv[i];
            if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
                result.ok = true;
                result.command = HelpCommand{"scan"};
                return result;
            } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
                scan_cmd.json = true;
            } else if (str_eq(arg, "--jsonl")) {
                scan_cmd.jsonl = true;
            } else if (str_eq(arg, "--skip-errors")) {
                scan_cmd.skip_errors = true;
            } else if (str_eq(arg, "-q")) {
                result.global.quiet = true;
            } else if (str_eq(arg, "-v")) {
                result.global.verbose++;
            } else if (str_eq(arg, "-o") || str_eq(arg, "--output")) {
                const char* v = take_value(argc, argv, i);
                if (v == nullptr) {
                    result.diagnostic = usage_error(missing_value("--output", "OUTPUT"), SCAN_USAGE);
                    return result;
                }
                scan_cmd.output = platform::path_from_utf8(v);
            } else if (str_eq(arg, "-c") || str_eq(arg, "--config")) {
                const char* v = take_value(argc, argv, i);
                if (v == nullptr) {
                    result.diagnostic = usage_error(missing_value("--config", "CONFIG"), SCAN_USAGE);
                    return result;
                }
                scan_cmd.config = platform::path_from_utf8(v);
            } else if (str_eq(arg, "--extension")) {
                const char* v = take_value(argc, argv, i);
                if (v == nullptr) {
                    result.diagnostic =
                        usage_error(missing_value("--extension", "EXTENSION"), SCAN_USAGE);
                    return result;
                }
                scan_cmd.extensions.emplace_back(v);
            } else if (arg[0] == '-' && arg[1] != '\0') {
                result.diagnostic =
                    usage_error(std::string("unexpected argument '") + arg + "' found", SCAN_USAGE);
                return result;
            } else {
                scan_cmd.paths.push_back(platform::path_from_utf8(arg));
            }
        }

        if (scan_cmd.json && scan_cmd.jsonl) {
            result.diagnostic = usage_error(
                "the argument '--json' cannot be used with '--jsonl'", SCAN_USAGE);
            return result;
        }
        if (scan_cmd.paths.empty()) {
            result.diagnostic = usage_error(
                "the following required arguments were not provided:\n  <PATH>...", SCAN_USAGE);
            return result;
        }

        result.ok = true;
        result.command = std::move(scan_cmd);
    } else if (str_eq(cmd, "redact")) {
        RedactCommand redact_cmd;
        bool has_path = false;
        for (int i = cmd_idx + 1; i < argc; ++i) {
            const char* arg = argv[i];
            if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
                result.ok = true;
                result.command = HelpCommand{"redact"};
                return result;
            } else if (str_eq(arg, "--no-header")) {
                redact_cmd.no_header = true;
            } else if (str_eq(arg, "-q")) {
                result.global.quiet = true;
            } else if (str_eq(arg, "-v")) {
                result.global.verbose++;
            } else if (str_eq(arg, "-o") || str_eq(arg, "--output")) {
                const char* v = take_value(argc, argv, i);
                if (v == nullptr) {
                    result.diagnostic =
                        usage_error(missing_value("--output", "OUTPUT"), REDACT_USAGE);
                    return result;
                }
                redact_cmd.output = platform::path_from_utf8(v);
            } else if (str_eq(arg, "-c") || str_eq(arg, "--config")) {
                const char* v = take_value(argc, argv, i);
                if (v == nullptr) {
                    result.diagnostic =
                        usage_error(missing_value("--config", "CONFIG"), REDACT_USAGE);
                    return result;
                }
                redact_cmd.config = platform::path_from_utf8(v);
            } else if (arg[0] == '-' && arg[1] != '\0') {
                result.diagnostic = usage_error(
                    std::string("unexpected argument '") + arg + "' found", REDACT_USAGE);
                return result;
            } else if (!has_path) {
                redact_cmd.path = platform::path_from_utf8(arg);
                has_path = true;
            } else {
                result.diagnostic = usage_error(
                    std::string("unexpected argument '") + arg + "' found", REDACT_USAGE);
                return result;
            }
        }

        if (!has_path) {
            result.diagnostic = usage_error(
                "the following required arguments were not provided:\n  <PATH>", REDACT_USAGE);
            return result;
        }

        result.ok = true;
        result.command = std::move(redact_cmd);
    } else if (str_eq(cmd, "help")) {
        result.ok = true;
        if (cmd_idx + 1 < argc) {
            result.command = HelpCommand{std::string(argv[cmd_idx + 1])};
        } else {
            result.command = HelpCommand{};
        }
    } else {
        result.diagnostic =
            usage_error(std::string("unrecognized subcommand '") + cmd + "'", MAIN_USAGE);
    }

    return result;
}

}  // namespace piiguard::cli
