// ==============================================================================
// test_discovery_gtest.cpp - Тесты поиска entry.json (GoogleTest)
// ==============================================================================

#include "bilicache/discovery.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <set>
#include <string>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace bilicache::io::test {

// ==============================================================================
// Test Fixture: создаёт временную структуру директорий для тестов
// ==============================================================================

class DiscoveryTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        // Имя теста + PID: уникальные директории при параллельном запуске (ctest -j)
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("bilicache_discovery_") + test_info->name() + "_" +
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
        // Возвращаем права, иначе remove_all не сможет удалить содержимое
        for (const auto& locked : locked_) {
            std::filesystem::permissions(locked, std::filesystem::perms::owner_all,
                                         std::filesystem::perm_options::replace, ec);
        }
        std::filesystem::remove_all(test_dir_, ec);
    }

    void create_file(const std::filesystem::path& path, const std::string& content = "{}") {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file << content;
    }

    void lock_directory(const std::filesystem::path& dir) {
        std::filesystem::permissions(dir, std::filesystem::perms::none,
                                     std::filesystem::perm_options::replace);
        locked_.push_back(dir);
    }

    static std::set<std::string> relative_set(const DiscoveryResult& result) {
        std::set<std::string> out;
        for (const auto& e : result.entries) {
            out.insert(e.relative_path.generic_string());
        }
        return out;
    }

    std::vector<std::filesystem::path> locked_;
};

// ==============================================================================
// Базовые случаи
// ==============================================================================

TEST_F(DiscoveryTest, EmptyDirectory_ReturnsNothing) {
    // Act
    auto result = discover_entries(test_dir_);

    // Assert: пустой результат не ошибка
    EXPECT_TRUE(result.entries.empty());
    EXPECT_TRUE(result.complete());
}

TEST_F(DiscoveryTest, Scenario_TwoNestedEntries) {
    // Arrange
    create_file(test_dir_ / "a" / "entry.json", "{}");
    create_file(test_dir_ / "b" / "c" / "entry.json", "{\"x\":1}");

    // Act
    auto result = discover_entries(test_dir_);

    // Assert
    ASSERT_EQ(result.entries.size(), 2u);
    EXPECT_EQ(relative_set(result), (std::set<std::string>{"a/entry.json", "b/c/entry.json"}));
    EXPECT_TRUE(result.complete());
}

TEST_F(DiscoveryTest, EntryInRoot_RelativePathIsFileName) {
    create_file(test_dir_ / "entry.json");

    auto result = discover_entries(test_dir_);

    ASSERT_EQ(result.entries.size(), 1u);
    EXPECT_EQ(result.entries[0].relative_path, std::filesystem::path("entry.json"));
    EXPECT_EQ(result.entries[0].absolute_path, test_dir_ / "entry.json");
}

TEST_F(DiscoveryTest, AbsolutePath_ResolvesUnderRoot) {
    create_file(test_dir_ / "s_1" / "80" / "entry.json");

    auto result = discover_entries(test_dir_);

    ASSERT_EQ(result.entries.size(), 1u);
    const auto& e = result.entries[0];
    EXPECT_EQ(e.absolute_path, test_dir_ / e.relative_path);
}

// ==============================================================================
// Фильтрация по имени
// ==============================================================================

TEST_F(DiscoveryTest, OnlyExactFileNameMatches) {
    // Arrange
    create_file(test_dir_ / "1" / "entry.json");
    create_file(test_dir_ / "1" / "index.json");
    create_file(test_dir_ / "1" / "entry.json.bak");
    create_file(test_dir_ / "1" / "my_entry.json");
    create_file(test_dir_ / "1" / "ENTRY.JSON");
    create_file(test_dir_ / "1" / "80" / "video.m4s", "binary");

    // Act
    auto result = discover_entries(test_dir_);

    // Assert
    EXPECT_EQ(relative_set(result), (std::set<std::string>{"1/entry.json"}));
}

TEST_F(DiscoveryTest, DirectoryNamedEntryJson_IsTraversedNotMatched) {
    // Arrange: директория с именем entry.json содержит настоящий файл
    create_file(test_dir_ / "entry.json" / "entry.json");

    // Act
    auto result = discover_entries(test_dir_);

    // Assert
    EXPECT_EQ(relative_set(result), (std::set<std::string>{"entry.json/entry.json"}));
}

TEST_F(DiscoveryTest, CustomFileName) {
    create_file(test_dir_ / "a" / "entry.json");
    create_file(test_dir_ / "a" / "danmaku.xml", "<i/>");

    DiscoveryOptions opt;
    opt.file_name = "danmaku.xml";
    auto result = discover_entries(test_dir_, opt);

    EXPECT_EQ(relative_set(result), (std::set<std::string>{"a/danmaku.xml"}));
}

// ==============================================================================
// Полнота и детерминизм
// ==============================================================================

TEST_F(DiscoveryTest, Completeness_ArbitraryDepths) {
    for (std::size_t k = 0; k <= 6; ++k) {
        // Arrange: k файлов на глубинах 0..k-1 в отдельном поддереве
        auto root = test_dir_ / ("tree" + std::to_string(k));
        std::filesystem::create_directories(root);
        for (std::size_t i = 0; i < k; ++i) {
            auto dir = root;
            for (std::size_t d = 0; d < i; ++d) {
                dir /= "d" + std::to_string(i) + "_" + std::to_string(d);
            }
            create_file(dir / "entry.json");
        }

        // Act
        auto result = discover_entries(root);

        // Assert
        EXPECT_EQ(result.entries.size(), k) << "k=" << k;
    }
}

TEST_F(DiscoveryTest, ResultIsSortedAndStable) {
    // Arrange
    create_file(test_dir_ / "c" / "entry.json");
    create_file(test_dir_ / "a" / "entry.json");
    create_file(test_dir_ / "b" / "x" / "entry.json");

    // Act
    auto first = discover_entries(test_dir_);
    auto second = discover_entries(test_dir_);

    // Assert
    ASSERT_EQ(first.entries.size(), 3u);
    EXPECT_TRUE(std::is_sorted(first.entries.begin(), first.entries.end(),
                               [](const DiscoveredEntry& a, const DiscoveredEntry& b) {
                                   return a.absolute_path < b.absolute_path;
                               }));
    ASSERT_EQ(first.entries.size(), second.entries.size());
    for (std::size_t i = 0; i < first.entries.size(); ++i) {
        EXPECT_EQ(first.entries[i].relative_path, second.entries[i].relative_path);
    }
}

TEST_F(DiscoveryTest, RelativePathsAreUnique) {
    create_file(test_dir_ / "1" / "c_1" / "entry.json");
    create_file(test_dir_ / "1" / "c_2" / "entry.json");
    create_file(test_dir_ / "2" / "c_1" / "entry.json");

    auto result = discover_entries(test_dir_);

    EXPECT_EQ(relative_set(result).size(), result.entries.size());
}

// ==============================================================================
// Ошибки обхода
// ==============================================================================

TEST_F(DiscoveryTest, RootIsFile_ReportsSkip) {
    create_file(test_dir_ / "entry.json");

    auto result = discover_entries(test_dir_ / "entry.json");

    EXPECT_TRUE(result.entries.empty());
    EXPECT_FALSE(result.complete());
}

TEST_F(DiscoveryTest, MissingRoot_ReportsSkipWithoutThrowing) {
    DiscoveryResult result;
    EXPECT_NO_THROW({ result = discover_entries(test_dir_ / "does_not_exist"); });

    EXPECT_TRUE(result.entries.empty());
    ASSERT_EQ(result.skipped.size(), 1u);
    EXPECT_EQ(result.skipped[0].path, test_dir_ / "does_not_exist");
}

TEST_F(DiscoveryTest, DanglingSymlink_IsIgnoredNotSkipped) {
#ifdef _WIN32
    GTEST_SKIP() << "symlink creation needs privileges on Windows";
#else
    // Arrange
    create_file(test_dir_ / "a" / "entry.json");
    std::filesystem::create_symlink(test_dir_ / "gone", test_dir_ / "dangling");
    std::filesystem::create_symlink(test_dir_ / "gone" / "entry.json",
                                    test_dir_ / "a" / "b_entry_link");

    // Act
    auto result = discover_entries(test_dir_);

    // Assert: ничего не потеряно, обход полный
    EXPECT_EQ(relative_set(result), (std::set<std::string>{"a/entry.json"}));
    EXPECT_TRUE(result.skipped.empty());
    EXPECT_TRUE(result.complete());
#endif
}

TEST_F(DiscoveryTest, SymlinkToEntry_IsFollowed) {
#ifdef _WIN32
    GTEST_SKIP() << "symlink creation needs privileges on Windows";
#else
    create_file(test_dir_ / "real" / "entry.json");
    std::filesystem::create_directories(test_dir_ / "linked");
    std::filesystem::create_symlink(test_dir_ / "real" / "entry.json",
                                    test_dir_ / "linked" / "entry.json");

    auto result = discover_entries(test_dir_);

    EXPECT_EQ(relative_set(result),
              (std::set<std::string>{"linked/entry.json", "real/entry.json"}));
    EXPECT_TRUE(result.complete());
#endif
}

TEST_F(DiscoveryTest, UnreadableSubdirectory_KeepsPartialResults) {
#ifdef _WIN32
    GTEST_SKIP() << "POSIX permissions required";
#else
    if (geteuid() == 0) {
        GTEST_SKIP() << "root ignores directory permissions";
    }

    // Arrange
    create_file(test_dir_ / "a" / "entry.json");
    create_file(test_dir_ / "locked" / "entry.json");
    create_file(test_dir_ / "z" / "entry.json");
    lock_directory(test_dir_ / "locked");

    // Act
    auto result = discover_entries(test_dir_);

    // Assert: соседние поддеревья найдены, недоступное отмечено
    EXPECT_EQ(relative_set(result), (std::set<std::string>{"a/entry.json", "z/entry.json"}));
    ASSERT_EQ(result.skipped.size(), 1u);
    EXPECT_EQ(result.skipped[0].path, test_dir_ / "locked");
    EXPECT_NE(result.skipped[0].message.find("failed to read directory"), std::string::npos);
    EXPECT_FALSE(result.complete());
#endif
}

}  // namespace bilicache::io::test
