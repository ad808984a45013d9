// ==============================================================================
// test_reader_gtest.cpp - Тесты чтения документов (GoogleTest)
// ==============================================================================
//
// Plain text, извлечение текста из XML (pugixml) и JSON (RapidJSON),
// ошибки чтения и разбора.
//
// ==============================================================================

#include "piiguard/detector.hpp"
#include "piiguard/reader.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace piiguard::io::test {

class ReaderTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    (std::string("piiguard_reader_") + test_info->name() + "_" +
                     std::to_string(
#ifdef _WIN32
                         GetCurrentProcessId()
#else
                         getpid()
#endif
                             ));
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    std::filesystem::path write_file(const std::string& name, const std::string& content) {
        auto path = test_dir_ / name;
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }
};

// ==============================================================================
// DocumentKind
// ==============================================================================

TEST(DocumentKindTest, FromExtension) {
    EXPECT_EQ(document_kind_from_extension("xml"), DocumentKind::Xml);
    EXPECT_EQ(document_kind_from_extension("JSON"), DocumentKind::Json);
    EXPECT_EQ(document_kind_from_extension("txt"), DocumentKind::Text);
    EXPECT_EQ(document_kind_from_extension(""), DocumentKind::Text);
}

TEST(DocumentKindTest, FromPath) {
    EXPECT_EQ(document_kind_from_path("a/b.xml"), DocumentKind::Xml);
    EXPECT_EQ(document_kind_from_path("a/b.json"), DocumentKind::Json);
    EXPECT_EQ(document_kind_from_path("a/b"), DocumentKind::Text);
    EXPECT_STREQ(document_kind_to_string(DocumentKind::Json), "json");
}

// ==============================================================================
// Извлечение текста
// ==============================================================================

TEST(ExtractTest, Xml_TextPerElement) {
    auto result = extract_xml_text(
        "<patient><email>jane@example.com</email><note>MRN-123456 <b>x</b></note></patient>");
    ASSERT_TRUE(result.ok) << result.error;
    // <b> внутри <note> остаётся в строке <note>
    EXPECT_EQ(result.text, "jane@example.com\nMRN-123456 x\n");
}

TEST(ExtractTest, Xml_InlineMarkup_KeepsValueOnOneLine) {
    auto result = extract_xml_text("<doc><p>Call <b>212</b>-555-1212 today</p><p>next</p></doc>");
    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.text, "Call 212-555-1212 today\nnext\n");

    std::vector<Match> expected = {{SensitiveType::Phone, "212-555-1212"}};
    EXPECT_EQ(detect::detect(result.text), expected);
}

TEST(ExtractTest, Xml_NestedBlocksWithoutOwnText) {
    auto result = extract_xml_text("<a><b><c>one</c></b><d>two</d></a>");
    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.text, "one\ntwo\n");
}

TEST(ExtractTest, Xml_CData) {
    auto result = extract_xml_text("<r><![CDATA[ssn 123-45-6789]]></r>");
    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.text, "ssn 123-45-6789\n");
}

TEST(ExtractTest, Xml_Malformed) {
    auto result = extract_xml_text("<a><b></a>");
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.rfind("XML parse error: ", 0), 0u);
}

TEST(ExtractTest, Json_StringsAndIntegers) {
    auto result = extract_json_text(
        R"({"email":"jane@example.com","phone":2125551212,"flag":true,"nested":[{"mrn":"MRN-1234"},1.5,null]})");
    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.text, "jane@example.com\n2125551212\nMRN-1234\n");
}

TEST(ExtractTest, Json_NegativeInteger) {
    auto result = extract_json_text("[-42]");
    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.text, "-42\n");
}

TEST(ExtractTest, Json_Malformed) {
    auto result = extract_json_text(R"({"a": )");
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.rfind("JSON parse error: ", 0), 0u);
}

// ==============================================================================
// Чтение файлов
// ==============================================================================

TEST_F(ReaderTest, PlainText_AsIs) {
    auto path = write_file("notes.txt", "call 212-555-1212\r\n");
    auto result = read_document(path);
    ASSERT_TRUE(result) << result.error.format();
    EXPECT_EQ(result.document.kind, DocumentKind::Text);
    EXPECT_EQ(result.document.text, "call 212-555-1212\r\n");
}

TEST_F(ReaderTest, UnknownExtension_ReadAsText) {
    auto path = write_file("export.dat", "<not xml");
    auto result = read_document(path);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.document.text, "<not xml");
}

TEST_F(ReaderTest, Json_DetectableAfterExtraction) {
    auto path = write_file("record.json", R"({"contact":{"email":"a.b@x.io"},"mrn":"MRN-998877"})");
    auto result = read_document(path);
    ASSERT_TRUE(result) << result.error.format();
    EXPECT_EQ(result.document.kind, DocumentKind::Json);

    auto matches = detect::detect(result.document.text);
    std::vector<Match> expected = {{SensitiveType::Email, "a.b@x.io"},
                                   {SensitiveType::MedicalRecordNumber, "MRN-998877"}};
    EXPECT_EQ(matches, expected);
}

TEST_F(ReaderTest, Xml_ParseError) {
    auto path = write_file("broken.xml", "<a>");
    auto result = read_document(path);
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error.kind, ReaderErrorKind::ParseError);
    EXPECT_TRUE(result.document.text.empty());
    EXPECT_EQ(result.error.format().rfind("failed to load file '", 0), 0u);
}

TEST_F(ReaderTest, MissingFile) {
    auto result = read_document(test_dir_ / "missing.txt");
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error.kind, ReaderErrorKind::FileNotFound);
}

TEST_F(ReaderTest, ReadFileBytes_KeepsMarkup) {
    auto path = write_file("doc.xml", "<a>x@y.org</a>");
    auto result = read_file_bytes(path);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.document.text, "<a>x@y.org</a>");
}

}  // namespace piiguard::io::test
