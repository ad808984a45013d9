// ==============================================================================
// reader.cpp - Чтение текста документов
// ==============================================================================

#include "piiguard/reader.hpp"

#include "piiguard/platform.hpp"

#include <cctype>
#include <fstream>
#include <pugixml.hpp>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <sstream>

namespace piiguard::io {

namespace {

// ----------------------------------------------------------------------------
// XML
// ----------------------------------------------------------------------------

bool has_own_text(const pugi::xml_node& node) {
    for (const auto& child : node.children()) {
        if (child.type() == pugi::node_pcdata || child.type() == pugi::node_cdata) {
            return true;
        }
    }
    return false;
}

// Блок - самый внешний элемент с собственным текстом. Вложенная разметка
// (<b>, <span>) остаётся внутри строки блока, "\n" ставится после блока.
void collect_xml_text(const pugi::xml_node& node, std::string& out, bool in_block) {
    bool opens_block = !in_block && has_own_text(node);
    for (const auto& child : node.children()) {
        if (child.type() == pugi::node_pcdata || child.type() == pugi::node_cdata) {
            out += child.value();
        } else if (child.type() == pugi::node_element) {
            collect_xml_text(child, out, in_block || opens_block);
        }
    }
    if (opens_block) {
        out += '\n';
    }
}

// ----------------------------------------------------------------------------
// JSON
// ----------------------------------------------------------------------------

void collect_json_text(const rapidjson::Value& value, std::string& out) {
    if (value.IsString()) {
        out.append(value.GetString(), value.GetStringLength());
        out += '\n';
    } else if (value.IsUint64()) {
        out += std::to_string(value.GetUint64());
        out += '\n';
    } else if (value.IsInt64()) {
        out += std::to_string(value.GetInt64());
        out += '\n';
    } else if (value.IsArray()) {
        for (const auto& item : value.GetArray()) {
            collect_json_text(item, out);
        }
    } else if (value.IsObject()) {
        // Порядок членов объекта - как в документе
        for (const auto& member : value.GetObject()) {
            collect_json_text(member.value, out);
        }
    }
}

}  // namespace

// ============================================================================
// DocumentKind
// ============================================================================

const char* document_kind_to_string(DocumentKind kind) {
    switch (kind) {
    case DocumentKind::Text:
        return "text";
    case DocumentKind::Xml:
        return "xml";
    case DocumentKind::Json:
        return "json";
    }
    return "text";
}

DocumentKind document_kind_from_extension(std::string_view ext) {
    std::string lower_ext;
    lower_ext.reserve(ext.size());
    for (char c : ext) {
        lower_ext.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower_ext == "xml") {
        return DocumentKind::Xml;
    }
    if (lower_ext == "json") {
        return DocumentKind::Json;
    }
    return DocumentKind::Text;
}

DocumentKind document_kind_from_path(const std::filesystem::path& path) {
    if (!path.has_extension()) {
        return DocumentKind::Text;
    }
    std::string ext = path.extension().string();
    if (!ext.empty() && ext[0] == '.') {
        ext = ext.substr(1);
    }
    return document_kind_from_extension(ext);
}

// ============================================================================
// ReaderError
// ============================================================================

std::string ReaderError::format() const {
    return "failed to load file '" + path + "' - " + message;
}

// ============================================================================
// Извлечение текста
// ============================================================================

ExtractResult extract_xml_text(std::string_view content) {
    ExtractResult result;

    pugi::xml_document doc;
    pugi::xml_parse_result parsed = doc.load_buffer(content.data(), content.size());
    if (!parsed) {
        result.error = std::string("XML parse error: ") + parsed.description() + " at offset " +
                       std::to_string(parsed.offset);
        return result;
    }

    collect_xml_text(doc, result.text, false);
    result.ok = true;
    return result;
}

ExtractResult extract_json_text(std::string_view content) {
    ExtractResult result;

    rapidjson::Document doc;
    doc.Parse(content.data(), content.size());
    if (doc.HasParseError()) {
        result.error = std::string("JSON parse error: ") +
                       rapidjson::GetParseError_En(doc.GetParseError()) + " at offset " +
                       std::to_string(doc.GetErrorOffset());
        return result;
    }

    collect_json_text(doc, result.text);
    result.ok = true;
    return result;
}

// ============================================================================
// Чтение файлов
// ============================================================================

ReadResult read_file_bytes(const std::filesystem::path& file) {
    ReadResult result;
    result.document.source = platform::path_to_utf8(file);
    result.document.kind = DocumentKind::Text;

    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        result.error =
            ReaderError{ReaderErrorKind::FileNotFound, "could not open file", result.document.source};
        return result;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        result.error =
            ReaderError{ReaderErrorKind::IoError, "could not read file", result.document.source};
        return result;
    }

    result.document.text = buffer.str();
    result.ok = true;
    return result;
}

ReadResult read_document(const std::filesystem::path& file) {
    ReadResult result = read_file_bytes(file);
    if (!result.ok) {
        return result;
    }

    result.document.kind = document_kind_from_path(file);
    if (result.document.kind == DocumentKind::Text) {
        return result;
    }

    ExtractResult extracted = result.document.kind == DocumentKind::Xml
                                  ? extract_xml_text(result.document.text)
                                  : extract_json_text(result.document.text);
    if (!extracted.ok) {
        result.ok = false;
        result.error =
            ReaderError{ReaderErrorKind::ParseError, extracted.error, result.document.source};
        result.document.text.clear();
        return result;
    }

    result.document.text = std::move(extracted.text);
    return result;
}

}  // namespace piiguard::io
