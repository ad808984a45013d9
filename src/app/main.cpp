// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Dispatch команды
// 4. Возврат exit code
//
// ==============================================================================

#include "piiguard/cli.hpp"
#include "piiguard/config.hpp"
#include "piiguard/detector.hpp"
#include "piiguard/discovery.hpp"
#include "piiguard/output.hpp"
#include "piiguard/platform.hpp"
#include "piiguard/reader.hpp"
#include "piiguard/redact.hpp"

#include <cctype>
#include <exception>
#include <iostream>
#include <memory>
#include <rapidjson/document.h>
#include <type_traits>
#include <unordered_set>
#include <variant>

namespace {

// ----------------------------------------------------------------------------
// Баннер (--no-banner)
// ----------------------------------------------------------------------------

constexpr const char* BANNER = R"(
   ___  ___ ___  ___ _   _  _   ___ ___
  | _ \|_ _|_ _|/ __| | | |/_\ | _ \   \
  |  _/ | | | || (_ | |_| / _ \|   / |) |
  |_|  |___|___|\___|\___/_/ \_\_|_\___/
)";

void print_banner(piiguard::output::Writer& writer, bool no_banner, bool quiet) {
    if (no_banner || quiet) {
        return;
    }
    writer.write(piiguard::output::Stream::Stderr, BANNER);
    writer.write_line(piiguard::output::Stream::Stderr, "");
}

/// Профиль из --config или профиль по умолчанию
bool load_profile_or_default(const std::optional<std::filesystem::path>& path,
                             piiguard::config::Profile& profile,
                             piiguard::output::Writer& writer) {
    using namespace piiguard;

    if (!path.has_value()) {
        return true;
    }
    auto loaded = config::load_profile(*path);
    if (!loaded.ok) {
        writer.error(loaded.error);
        return false;
    }
    writer.debug("Loaded profile from " + platform::path_to_utf8(*path));
    profile = std::move(loaded.profile);
    return true;
}

std::string join_paths(const std::vector<std::filesystem::path>& paths) {
    std::string result;
    for (std::size_t i = 0; i < paths.size(); ++i) {
        if (i > 0) {
            result += ", ";
        }
        result += piiguard::platform::path_to_utf8(paths[i]);
    }
    return result;
}

// ----------------------------------------------------------------------------
// scan
// ----------------------------------------------------------------------------

struct Finding {
    std::string source;
    piiguard::Match match;
};

void append_finding(rapidjson::Value& array, const Finding& f,
                    rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value obj(rapidjson::kObjectType);
    obj.AddMember("source",
                  rapidjson::Value(f.source.c_str(),
                                   static_cast<rapidjson::SizeType>(f.source.size()), alloc),
                  alloc);
    obj.AddMember("type", rapidjson::StringRef(piiguard::type_name(f.match.type)), alloc);
    obj.AddMember("value",
                  rapidjson::Value(f.match.value.c_str(),
                                   static_cast<rapidjson::SizeType>(f.match.value.size()), alloc),
                  alloc);
    array.PushBack(obj, alloc);
}

int run_scan(const piiguard::cli::ScanCommand& cmd, piiguard::output::Writer& writer) {
    using namespace piiguard;

    config::Profile profile;
    if (!load_profile_or_default(cmd.config, profile, writer)) {
        return 1;
    }

    // Если указан файл вывода, находки идут в отдельный Writer
    std::unique_ptr<output::Writer> file_writer;
    output::Writer* out = &writer;
    if (cmd.output.has_value()) {
        output::OutputConfig out_cfg = writer.config();
        out_cfg.output_path = cmd.output;
        file_writer = std::make_unique<output::Writer>(out_cfg);
        if (!file_writer->has_output_file()) {
            writer.error("Unable to write to specified output file - " +
                         platform::path_to_utf8(*cmd.output));
            return 1;
        }
        out = file_writer.get();
    }

    // --extension важнее профиля, профиль важнее расширений по умолчанию
    io::DiscoveryOptions disc_opt;
    disc_opt.skip_errors = cmd.skip_errors;
    disc_opt.on_warning = [&writer](const std::string& msg) { writer.warn(msg); };
    if (!cmd.extensions.empty()) {
        std::unordered_set<std::string> exts;
        for (const auto& ext : cmd.extensions) {
            std::string e = ext;
            if (!e.empty() && e[0] == '.') {
                e.erase(0, 1);
            }
            for (auto& c : e) {
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }
            exts.insert(std::move(e));
        }
        disc_opt.extensions = std::move(exts);
    } else if (profile.extensions.has_value()) {
        disc_opt.extensions = profile.extensions;
    } else {
        disc_opt.extensions = io::default_extensions();
    }

    writer.info("Scanning for sensitive data in: " + join_paths(cmd.paths));

    auto files = io::discover_files(cmd.paths, disc_opt);
    if (files.empty()) {
        writer.error("No compatible files were found in the provided paths");
        return 1;
    }
    writer.info("Loaded " + std::to_string(files.size()) + " documents");

    std::vector<Finding> findings;
    std::size_t scanned = 0;
    for (const auto& file : files) {
        auto result = io::read_document(file);
        if (!result) {
            if (cmd.skip_errors) {
                writer.warn(result.error.format());
                continue;
            }
            writer.error(result.error.format());
            return 1;
        }

        auto matches = detect::detect(result.document.text);
        writer.debug(result.document.source + " (" +
                     io::document_kind_to_string(result.document.kind) + "): " +
                     std::to_string(matches.size()) + " matches");
        for (auto& m : matches) {
            writer.trace(std::string(type_name(m.type)) + ": " + m.value);
            findings.push_back(Finding{result.document.source, std::move(m)});
        }
        ++scanned;
    }

    if (cmd.json || cmd.jsonl) {
        rapidjson::Document doc;
        doc.SetArray();
        auto& alloc = doc.GetAllocator();
        for (const auto& f : findings) {
            append_finding(doc, f, alloc);
        }
        if (cmd.json) {
            out->write_json_pretty(doc);
        } else {
            for (const auto& item : doc.GetArray()) {
                out->write_json_line(item);
            }
        }
    } else if (!findings.empty()) {
        output::Table table;
        table.set_headers({"File", "Type", "Value"});
        for (const auto& f : findings) {
            table.add_row({f.source, type_name(f.match.type), output::flatten_field(f.match.value)});
        }
        table.print(*out);
    }

    if (findings.empty()) {
        writer.info("No sensitive data found in " + std::to_string(scanned) + " documents");
    } else {
        writer.info("Found " + std::to_string(findings.size()) + " sensitive values across " +
                    std::to_string(scanned) + " documents");
    }
    return 0;
}

// ----------------------------------------------------------------------------
// redact
// ----------------------------------------------------------------------------

int run_redact(const piiguard::cli::RedactCommand& cmd, piiguard::output::Writer& writer) {
    using namespace piiguard;

    config::Profile profile;
    if (!load_profile_or_default(cmd.config, profile, writer)) {
        return 1;
    }

    // Документ редактируется как есть, без извлечения текста из XML/JSON
    auto loaded = io::read_file_bytes(cmd.path);
    if (!loaded) {
        writer.error(loaded.error.format());
        return 1;
    }

    std::unique_ptr<output::Writer> file_writer;
    output::Writer* out = &writer;
    if (cmd.output.has_value()) {
        output::OutputConfig out_cfg = writer.config();
        out_cfg.output_path = cmd.output;
        file_writer = std::make_unique<output::Writer>(out_cfg);
        if (!file_writer->has_output_file()) {
            writer.error("Unable to write to specified output file - " +
                         platform::path_to_utf8(*cmd.output));
            return 1;
        }
        out = file_writer.get();
    }

    writer.info("Redacting: " + loaded.document.source);

    auto result = redact::redact_text(loaded.document.text, profile.redact_options(!cmd.no_header));

    if (result.summary.header_updated) {
        writer.info("Added header: " + profile.banner);
    } else {
        writer.debug("Header left unchanged");
    }
    writer.info(result.summary.found_line());
    for (const auto& r : result.summary.values) {
        writer.info(redact::format_value_line(r));
    }

    out->write(output::Stream::Stdout, result.text);

    if (cmd.output.has_value()) {
        writer.info("Redacted document saved to " + platform::path_to_utf8(*cmd.output));
    }
    writer.info("Total redactions: " + std::to_string(result.summary.redactions_total));
    return 0;
}

// ----------------------------------------------------------------------------
// run
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    using namespace piiguard;

    cli::ParseResult parse_result = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    out_cfg.no_banner = parse_result.global.no_banner;
    output::Writer writer(out_cfg);

    // Диагностика парсинга идёт в stderr без префикса [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help(cmd.command));
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::ScanCommand>) {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return run_scan(cmd, writer);
            } else if constexpr (std::is_same_v<T, cli::RedactCommand>) {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return run_redact(cmd, writer);
            } else {
                return 1;
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << piiguard::output::level_prefix(piiguard::output::Level::Error) << e.what()
                  << "\n";
        return 1;
    } catch (...) {
        std::cerr << piiguard::output::level_prefix(piiguard::output::Level::Error)
                  << "Unknown error occurred\n";
        return 1;
    }
}
