// ==============================================================================
// piiguard/reader.hpp - Чтение текста документов
// ==============================================================================
//
// Назначение:
// - DocumentKind: тип входного файла по расширению
// - Извлечение текста: plain text как есть, XML (pugixml), JSON (RapidJSON)
// - ReaderError: ошибки чтения/парсинга для журнала
//
// Использование:
// @code
//   auto result = io::read_document(path);
//   if (!result) {
//       writer.warn(result.error.format());
//       return;
//   }
//   auto matches = detect::detect(result.document.text);
// @endcode
//
// ==============================================================================

#ifndef PIIGUARD_READER_HPP
#define PIIGUARD_READER_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace piiguard::io {

// ----------------------------------------------------------------------------
// DocumentKind
// ----------------------------------------------------------------------------

enum class DocumentKind {
    Text,  // .txt, .md, .csv, .log и всё неизвестное
    Xml,   // .xml
    Json   // .json
};

const char* document_kind_to_string(DocumentKind kind);

/// Тип по расширению без точки, без учёта регистра
DocumentKind document_kind_from_extension(std::string_view ext);

/// Тип по пути файла
DocumentKind document_kind_from_path(const std::filesystem::path& path);

// ----------------------------------------------------------------------------
// ReaderError
// ----------------------------------------------------------------------------

enum class ReaderErrorKind {
    FileNotFound,  // файл не открывается
    ParseError,    // XML/JSON не разобран
    IoError        // ошибка чтения
};

struct ReaderError {
    ReaderErrorKind kind = ReaderErrorKind::IoError;
    std::string message;
    std::string path;

    /// "failed to load file '<path>' - <message>"
    std::string format() const;
};

// ----------------------------------------------------------------------------
// Document
// ----------------------------------------------------------------------------

/// Извлечённый текст документа
struct TextDocument {
    DocumentKind kind = DocumentKind::Text;
    std::string source;  // путь (UTF-8)
    std::string text;
};

struct ReadResult {
    bool ok = false;
    TextDocument document;
    ReaderError error;

    explicit operator bool() const { return ok; }
};

/// Результат извлечения текста из содержимого в памяти
struct ExtractResult {
    bool ok = false;
    std::string text;
    std::string error;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Прочитать файл и извлечь текст в зависимости от типа
ReadResult read_document(const std::filesystem::path& file);

/// Прочитать файл целиком как байты
ReadResult read_file_bytes(const std::filesystem::path& file);

/// Текст XML: символьные данные всех элементов. "\n" ставится после самого
/// внешнего элемента с собственным текстом, вложенная разметка его не рвёт.
ExtractResult extract_xml_text(std::string_view content);

/// Текст JSON: все строки и целые числа в порядке документа, через "\n"
ExtractResult extract_json_text(std::string_view content);

}  // namespace piiguard::io

#endif  // PIIGUARD_READER_HPP
