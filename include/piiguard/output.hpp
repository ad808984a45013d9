// ==============================================================================
// piiguard/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Журнал: [+] info, [!] warn, [x] error, [*] debug, [~] trace
// - Находки: таблица, JSON массив, JSON Lines (RapidJSON)
// - Вывод в файл (--output)
//
// Движок обнаружения сюда не пишет; журналирует только приложение.
//
// ==============================================================================

#ifndef PIIGUARD_OUTPUT_HPP
#define PIIGUARD_OUTPUT_HPP

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations для RapidJSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace piiguard::output {

enum class Stream { Stdout, Stderr };

enum class Color { Default, Green, Yellow, Red, Cyan, Magenta };

/// Уровни журнала в порядке убывания важности
enum class Level { Error, Warn, Info, Debug, Trace };

// ----------------------------------------------------------------------------
// OutputConfig
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;             // -q: подавить [+] и [!]
    int verbose = 0;                // -v: [*] при 1, [~] при 2+
    bool no_banner = false;         // --no-banner

    std::optional<std::filesystem::path> output_path;  // --output
};

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    /// Записать байты. Stdout уходит в файл, если он открыт.
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    // Журнал
    // -------------------------------------------------------------------------

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr, всегда
    void error(std::string_view message);

    /// "[*] <message>" в stderr при verbose > 0
    void debug(std::string_view message);

    /// "[~] <message>" в stderr при verbose > 1
    void trace(std::string_view message);

    /// Строка журнала с префиксом уровня, если уровень включён
    void log(Level level, std::string_view message);

    /// Печатается ли уровень при текущих -q / -v
    bool enabled(Level level) const;

    // JSON
    // -------------------------------------------------------------------------

    /// Компактный JSON в stdout
    void write_json(const rapidjson::Value& value);

    /// Компактный JSON + "\n" (JSONL)
    void write_json_line(const rapidjson::Value& value);

    /// JSON с отступом в 2 пробела + "\n"
    void write_json_pretty(const rapidjson::Value& value);

    // Управление
    // -------------------------------------------------------------------------

    void flush();

    const OutputConfig& config() const { return config_; }

    /// Открыть файл вывода (если задан output_path). false при ошибке.
    bool open_output_file();

    void close_output_file();

    bool has_output_file() const { return output_file_ != nullptr; }

private:
    void write_colored(Stream s, std::string_view message, Color color);
    FILE* get_file(Stream s) const;

    OutputConfig config_;
    FILE* output_file_ = nullptr;
};

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

/// Таблица с рамкой из box-drawing символов
class Table {
public:
    void set_headers(const std::vector<std::string>& headers);
    void add_row(const std::vector<std::string>& cells);

    std::string to_string() const;
    void print(Writer& w) const;

    std::size_t row_count() const { return rows_.size(); }

private:
    enum class Border { Top, Middle, Bottom };

    std::vector<std::size_t> column_widths() const;
    static std::string format_border(const std::vector<std::size_t>& widths, Border border);
    static std::string format_row(const std::vector<std::size_t>& widths,
                                  const std::vector<std::string>& cells);

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Префикс уровня: "[+] ", "[!] ", "[x] ", "[*] ", "[~] "
const char* level_prefix(Level level);

/// Однострочное представление значения для таблицы:
/// \n, \r, \t -> пробел, повторные пробелы схлопываются
std::string flatten_field(std::string_view field);

/// Количество кодовых точек UTF-8 (ширина ячейки)
std::size_t display_width(std::string_view s);

std::string ansi_color_code(Color color);

/// Поддерживает ли поток цвета (TTY)
bool supports_color(Stream s);

}  // namespace piiguard::output

#endif  // PIIGUARD_OUTPUT_HPP
