// ==============================================================================
// output.cpp - Пользовательский вывод
// ==============================================================================
//
// Только этот модуль пишет в stdout/stderr.
// Байты первичны: std::endl не используется.
//
// ==============================================================================

#include "piiguard/output.hpp"

#include "piiguard/platform.hpp"

#include <algorithm>
#include <cstdio>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace piiguard::output {

namespace {

constexpr const char* ANSI_RESET = "\x1b[0m";

struct LevelStyle {
    const char* prefix;
    Color color;
};

LevelStyle level_style(Level level) {
    switch (level) {
    case Level::Error:
        return {"[x] ", Color::Red};
    case Level::Warn:
        return {"[!] ", Color::Yellow};
    case Level::Info:
        return {"[+] ", Color::Green};
    case Level::Debug:
        return {"[*] ", Color::Cyan};
    case Level::Trace:
        return {"[~] ", Color::Magenta};
    }
    return {"", Color::Default};
}

// Рамка таблицы (UTF-8): левый угол, пересечение, правый угол
struct BorderChars {
    const char* left;
    const char* middle;
    const char* right;
};

constexpr const char* BOX_V = "\xe2\x94\x82";  // │
constexpr const char* BOX_H = "\xe2\x94\x80";  // ─

constexpr BorderChars TOP_BORDER = {"\xe2\x94\x8c", "\xe2\x94\xac", "\xe2\x94\x90"};     // ┌┬┐
constexpr BorderChars MIDDLE_BORDER = {"\xe2\x94\x9c", "\xe2\x94\xbc", "\xe2\x94\xa4"};  // ├┼┤
constexpr BorderChars BOTTOM_BORDER = {"\xe2\x94\x94", "\xe2\x94\xb4", "\xe2\x94\x98"};  // └┴┘

void append_json(const rapidjson::Value& value, std::string& out, bool pretty) {
    rapidjson::StringBuffer buffer;
    if (pretty) {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        writer.SetIndent(' ', 2);
        value.Accept(writer);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        value.Accept(writer);
    }
    out.append(buffer.GetString(), buffer.GetSize());
}

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {
    if (config_.output_path.has_value()) {
        open_output_file();
    }
}

Writer::~Writer() {
    close_output_file();
    flush();
}

FILE* Writer::get_file(Stream s) const {
    if (s == Stream::Stdout) {
        return output_file_ != nullptr ? output_file_ : stdout;
    }
    return stderr;
}

void Writer::write(Stream s, std::string_view bytes) {
    if (bytes.empty()) {
        return;
    }
    std::fwrite(bytes.data(), 1, bytes.size(), get_file(s));
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

bool Writer::enabled(Level level) const {
    switch (level) {
    case Level::Error:
        return true;
    case Level::Warn:
    case Level::Info:
        return !config_.quiet;
    case Level::Debug:
        return config_.verbose >= 1;
    case Level::Trace:
        return config_.verbose >= 2;
    }
    return false;
}

void Writer::log(Level level, std::string_view message) {
    if (!enabled(level)) {
        return;
    }
    LevelStyle style = level_style(level);
    write_colored(Stream::Stderr, style.prefix, style.color);
    write_line(Stream::Stderr, message);
}

void Writer::info(std::string_view message) {
    log(Level::Info, message);
}

void Writer::warn(std::string_view message) {
    log(Level::Warn, message);
}

void Writer::error(std::string_view message) {
    log(Level::Error, message);
}

void Writer::debug(std::string_view message) {
    log(Level::Debug, message);
}

void Writer::trace(std::string_view message) {
    log(Level::Trace, message);
}

void Writer::write_colored(Stream s, std::string_view message, Color color) {
    // Файл вывода получает текст без ANSI
    bool to_file = s == Stream::Stdout && output_file_ != nullptr;
    if (color == Color::Default || to_file || !supports_color(s)) {
        write(s, message);
        return;
    }
    write(s, ansi_color_code(color));
    write(s, message);
    write(s, ANSI_RESET);
}

void Writer::write_json(const rapidjson::Value& value) {
    std::string out;
    append_json(value, out, false);
    write(Stream::Stdout, out);
}

void Writer::write_json_line(const rapidjson::Value& value) {
    std::string out;
    append_json(value, out, false);
    out += '\n';
    write(Stream::Stdout, out);
}

void Writer::write_json_pretty(const rapidjson::Value& value) {
    std::string out;
    append_json(value, out, true);
    out += '\n';
    write(Stream::Stdout, out);
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
    }
}

bool Writer::open_output_file() {
    close_output_file();
    if (!config_.output_path.has_value()) {
        return false;
    }
#ifdef _WIN32
    output_file_ = _wfopen(config_.output_path->c_str(), L"wb");
#else
    output_file_ = std::fopen(platform::path_to_utf8(*config_.output_path).c_str(), "wb");
#endif
    return output_file_ != nullptr;
}

void Writer::close_output_file() {
    if (output_file_ == nullptr) {
        return;
    }
    std::fclose(output_file_);
    output_file_ = nullptr;
}

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

void Table::set_headers(const std::vector<std::string>& headers) {
    headers_ = headers;
}

void Table::add_row(const std::vector<std::string>& cells) {
    rows_.push_back(cells);
}

std::vector<std::size_t> Table::column_widths() const {
    std::vector<std::size_t> widths;
    auto fit = [&widths](const std::vector<std::string>& cells) {
        if (widths.size() < cells.size()) {
            widths.resize(cells.size(), 0);
        }
        for (std::size_t i = 0; i < cells.size(); ++i) {
            widths[i] = std::max(widths[i], display_width(cells[i]));
        }
    };
    fit(headers_);
    for (const auto& row : rows_) {
        fit(row);
    }
    return widths;
}

std::string Table::format_border(const std::vector<std::size_t>& widths, Border border) {
    const BorderChars& chars = border == Border::Top      ? TOP_BORDER
                               : border == Border::Bottom ? BOTTOM_BORDER
                                                          : MIDDLE_BORDER;
    std::string line = chars.left;
    for (std::size_t i = 0; i < widths.size(); ++i) {
        if (i > 0) {
            line += chars.middle;
        }
        // Ячейка: пробел + содержимое + пробел
        for (std::size_t j = 0; j < widths[i] + 2; ++j) {
            line += BOX_H;
        }
    }
    line += chars.right;
    return line;
}

std::string Table::format_row(const std::vector<std::size_t>& widths,
                              const std::vector<std::string>& cells) {
    std::string line = BOX_V;
    for (std::size_t i = 0; i < widths.size(); ++i) {
        std::string_view cell = i < cells.size() ? std::string_view(cells[i]) : std::string_view();
        line += ' ';
        line += cell;
        line.append(widths[i] - std::min(widths[i], display_width(cell)) + 1, ' ');
        line += BOX_V;
    }
    return line;
}

std::string Table::to_string() const {
    auto widths = column_widths();
    if (widths.empty()) {
        return {};
    }

    std::string result = format_border(widths, Border::Top) + "\n";
    if (!headers_.empty()) {
        result += format_row(widths, headers_) + "\n";
        result += format_border(widths, Border::Middle) + "\n";
    }
    for (const auto& row : rows_) {
        result += format_row(widths, row) + "\n";
    }
    result += format_border(widths, Border::Bottom) + "\n";
    return result;
}

void Table::print(Writer& w) const {
    w.write(Stream::Stdout, to_string());
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

const char* level_prefix(Level level) {
    return level_style(level).prefix;
}

std::string flatten_field(std::string_view field) {
    std::string result;
    result.reserve(field.size());

    bool prev_space = false;
    for (char c : field) {
        bool space = c == ' ' || c == '\n' || c == '\r' || c == '\t';
        if (space) {
            if (!prev_space) {
                result += ' ';
            }
            prev_space = true;
            continue;
        }
        result += c;
        prev_space = false;
    }
    return result;
}

std::size_t display_width(std::string_view s) {
    // Байты продолжения UTF-8 (10xxxxxx) не считаются
    return static_cast<std::size_t>(std::count_if(s.begin(), s.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return "\x1b[32m";
    case Color::Yellow:
        return "\x1b[33m";
    case Color::Red:
        return "\x1b[31m";
    case Color::Cyan:
        return "\x1b[36m";
    case Color::Magenta:
        return "\x1b[35m";
    case Color::Default:
        break;
    }
    return "";
}

bool supports_color(Stream s) {
    return s == Stream::Stdout ? platform::is_tty_stdout() : platform::is_tty_stderr();
}

}  // namespace piiguard::output
