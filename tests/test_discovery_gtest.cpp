// ==============================================================================
// test_discovery_gtest.cpp - Тесты поиска входных файлов (GoogleTest)
// ==============================================================================
//
// Рекурсивный обход, фильтр расширений, skip_errors, порядок результатов.
//
// ==============================================================================

#include "piiguard/discovery.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

// PID для уникальных temp директорий при параллельных тестах
#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace piiguard::io::test {

// ==============================================================================
// Test Fixture: временная структура директорий
// ==============================================================================

class DiscoveryTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("piiguard_discovery_") + test_info->name() + "_" +
                                  std::to_string(
#ifdef _WIN32
                                      GetCurrentProcessId()
#else
                                      getpid()
#endif
                                  );

        test_dir_ = std::filesystem::temp_directory_path() / unique_name;

        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    void create_file(const std::filesystem::path& path) {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path);
        file << "test content";
    }
};

// ==============================================================================
// Явные файлы
// ==============================================================================

TEST_F(DiscoveryTest, ExplicitFile_MatchingExtension) {
    auto file = test_dir_ / "notes.txt";
    create_file(file);

    DiscoveryOptions opt;
    opt.extensions = std::unordered_set<std::string>{"txt"};

    auto result = discover_files({file}, opt);
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0], file);
}

TEST_F(DiscoveryTest, ExplicitFile_TakenRegardlessOfExtension) {
    auto file = test_dir_ / "export.dat";
    create_file(file);

    DiscoveryOptions opt;
    opt.extensions = default_extensions();

    auto result = discover_files({file}, opt);
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0], file);
}

// ==============================================================================
// Директории
// ==============================================================================

TEST_F(DiscoveryTest, EmptyDirectory) {
    DiscoveryOptions opt;
    opt.extensions = default_extensions();
    EXPECT_TRUE(discover_files({test_dir_}, opt).empty());
}

TEST_F(DiscoveryTest, Directory_DefaultExtensions) {
    create_file(test_dir_ / "a.txt");
    create_file(test_dir_ / "b.md");
    create_file(test_dir_ / "c.json");
    create_file(test_dir_ / "d.xml");
    create_file(test_dir_ / "e.png");
    create_file(test_dir_ / "f.docx");

    DiscoveryOptions opt;
    opt.extensions = default_extensions();

    auto result = discover_files({test_dir_}, opt);
    ASSERT_EQ(result.size(), 4u);
    EXPECT_EQ(result[0].filename().string(), "a.txt");
    EXPECT_EQ(result[3].filename().string(), "d.xml");
}

TEST_F(DiscoveryTest, Directory_Recursive) {
    create_file(test_dir_ / "top.txt");
    create_file(test_dir_ / "sub" / "mid.txt");
    create_file(test_dir_ / "sub" / "deep" / "bottom.txt");

    DiscoveryOptions opt;
    opt.extensions = std::unordered_set<std::string>{"txt"};

    EXPECT_EQ(discover_files({test_dir_}, opt).size(), 3u);
}

TEST_F(DiscoveryTest, Directory_NoExtensionFilter) {
    create_file(test_dir_ / "a.txt");
    create_file(test_dir_ / "b.bin");
    create_file(test_dir_ / "README");

    DiscoveryOptions opt;
    EXPECT_EQ(discover_files({test_dir_}, opt).size(), 3u);
}

TEST_F(DiscoveryTest, Directory_FileWithoutExtensionSkipped) {
    create_file(test_dir_ / "README");

    DiscoveryOptions opt;
    opt.extensions = default_extensions();
    EXPECT_TRUE(discover_files({test_dir_}, opt).empty());
}

TEST_F(DiscoveryTest, Directory_ExtensionCaseInsensitive) {
    create_file(test_dir_ / "upper.TXT");
    create_file(test_dir_ / "mixed.Json");

    DiscoveryOptions opt;
    opt.extensions = default_extensions();
    EXPECT_EQ(discover_files({test_dir_}, opt).size(), 2u);
}

// ==============================================================================
// Ошибки
// ==============================================================================

TEST_F(DiscoveryTest, NonExistentPath_Throws) {
    DiscoveryOptions opt;
    try {
        discover_files({test_dir_ / "missing"}, opt);
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string(e.what()).rfind("Specified path does not exist - ", 0), 0u);
    }
}

TEST_F(DiscoveryTest, NonExistentPath_SkipErrors_Warns) {
    create_file(test_dir_ / "a.txt");

    std::vector<std::string> warnings;
    DiscoveryOptions opt;
    opt.skip_errors = true;
    opt.on_warning = [&warnings](const std::string& msg) { warnings.push_back(msg); };

    auto result = discover_files({test_dir_ / "missing", test_dir_ / "a.txt"}, opt);
    ASSERT_EQ(result.size(), 1u);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("missing"), std::string::npos);
}

// ==============================================================================
// Порядок
// ==============================================================================

TEST_F(DiscoveryTest, SortedAndDeduplicated) {
    create_file(test_dir_ / "z.txt");
    create_file(test_dir_ / "a.txt");
    create_file(test_dir_ / "m" / "b.txt");

    DiscoveryOptions opt;
    opt.extensions = default_extensions();

    auto result = discover_files({test_dir_, test_dir_ / "a.txt"}, opt);
    ASSERT_EQ(result.size(), 3u);
    EXPECT_TRUE(std::is_sorted(result.begin(), result.end()));
}

TEST_F(DiscoveryTest, PathWithSpaces) {
    auto file = test_dir_ / "dir with spaces" / "patient notes.txt";
    create_file(file);

    DiscoveryOptions opt;
    opt.extensions = default_extensions();

    auto result = discover_files({test_dir_ / "dir with spaces"}, opt);
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0], file);
}

TEST_F(DiscoveryTest, EmptyInputVector) {
    DiscoveryOptions opt;
    EXPECT_TRUE(discover_files({}, opt).empty());
}

// ==============================================================================
// matches_extensions
// ==============================================================================

TEST(MatchesExtensionsTest, Basic) {
    std::optional<std::unordered_set<std::string>> exts = std::unordered_set<std::string>{"log"};
    EXPECT_TRUE(matches_extensions("a/b/server.log", exts));
    EXPECT_TRUE(matches_extensions("a/b/server.LOG", exts));
    EXPECT_FALSE(matches_extensions("a/b/server.log.gz", exts));
    EXPECT_FALSE(matches_extensions("a/b/server", exts));
    EXPECT_TRUE(matches_extensions("a/b/server", std::nullopt));
}

TEST(MatchesExtensionsTest, DefaultSet) {
    const auto& exts = default_extensions();
    for (const char* e : {"txt", "text", "md", "csv", "log", "xml", "json"}) {
        EXPECT_EQ(exts.count(e), 1u) << e;
    }
    EXPECT_EQ(exts.size(), 7u);
}

}  // namespace piiguard::io::test
