// ==============================================================================
// test_app_gtest.cpp - Тесты выполнения командной строки (GoogleTest)
// ==============================================================================

#include "bilicache/app.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <sstream>
#include <string>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace bilicache::app::test {

// ==============================================================================
// Test Fixture: дерево кэша + перехват stdout/stderr во временные файлы
// ==============================================================================

class RunCliTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;
    std::filesystem::path input_;
    std::filesystem::path output_;
    FILE* out_ = nullptr;
    FILE* err_ = nullptr;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("bilicache_app_") + test_info->name() + "_" +
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
        std::filesystem::create_directories(test_dir_ / "download");
        input_ = test_dir_ / "download";
        output_ = test_dir_ / "out";

        out_ = std::tmpfile();
        err_ = std::tmpfile();
        ASSERT_NE(out_, nullptr);
        ASSERT_NE(err_, nullptr);
    }

    void TearDown() override {
        std::fclose(out_);
        std::fclose(err_);
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    void create_file(const std::filesystem::path& path, const std::string& content) {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file << content;
    }

    static std::string read_file(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        std::ostringstream ss;
        ss << file.rdbuf();
        return ss.str();
    }

    static std::string drain(FILE* f) {
        std::fflush(f);
        std::rewind(f);
        std::string text;
        char buf[512];
        std::size_t n = 0;
        while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
            text.append(buf, n);
        }
        return text;
    }

    /// Запустить run_cli с "bilicache" + args
    int run(std::vector<std::string> args) {
        args.insert(args.begin(), "bilicache");
        std::vector<char*> argv;
        for (auto& a : args) {
            argv.push_back(a.data());
        }
        argv.push_back(nullptr);
        return run_cli(static_cast<int>(args.size()), argv.data(), output::Sinks{out_, err_});
    }

    std::vector<std::string> io_args() const {
        return {"--no-banner", "-i", input_.string(), "-o", output_.string()};
    }
};

// ==============================================================================
// Exit codes
// ==============================================================================

TEST_F(RunCliTest, AllSucceed_ExitZero) {
    // Arrange
    create_file(input_ / "a" / "entry.json", "{}");
    create_file(input_ / "b" / "c" / "entry.json", "{\"x\":1}");

    // Act
    int code = run(io_args());

    // Assert
    EXPECT_EQ(code, 0);
    std::string out = drain(out_);
    EXPECT_NE(out.find("[1/2] Processing: a/entry.json"), std::string::npos);
    EXPECT_NE(out.find("Processed 2 files: 2 succeeded, 0 failed"), std::string::npos);
}

TEST_F(RunCliTest, ItemFailures_StillExitZero) {
    create_file(input_ / "a" / "entry.json", "{}");
    create_file(input_ / "b" / "entry.json", "");

    int code = run(io_args());

    EXPECT_EQ(code, 0);
    EXPECT_NE(drain(out_).find("Processed 2 files: 1 succeeded, 1 failed"), std::string::npos);
}

TEST_F(RunCliTest, EmptyTree_ExitZero) {
    int code = run(io_args());

    EXPECT_EQ(code, 0);
    EXPECT_NE(drain(out_).find("Processed 0 files: 0 succeeded, 0 failed"), std::string::npos);
}

TEST_F(RunCliTest, MissingInput_ExitOne) {
    // Arrange
    input_ = test_dir_ / "nope";

    // Act
    int code = run(io_args());

    // Assert
    EXPECT_EQ(code, 1);
    EXPECT_NE(drain(err_).find("[x] missing input path"), std::string::npos);
    EXPECT_EQ(drain(out_).find("Processed"), std::string::npos);
}

TEST_F(RunCliTest, ArgumentError_ExitOne) {
    int code = run({"-i", input_.string()});

    EXPECT_EQ(code, 1);
    EXPECT_EQ(drain(err_).rfind("error: ", 0), 0u);
}

TEST_F(RunCliTest, Version_ExitZeroOnStdout) {
    int code = run({"--version"});

    EXPECT_EQ(code, 0);
    EXPECT_EQ(drain(out_).rfind("bilicache ", 0), 0u);
}

// ==============================================================================
// Маршрутизация JSON отчёта
// ==============================================================================

TEST_F(RunCliTest, Json_StdoutHoldsOnlyReport) {
    // Arrange
    create_file(input_ / "a" / "entry.json", "{}");
    create_file(input_ / "b" / "entry.json", "{bad");
    auto args = io_args();
    args.push_back("--json");

    // Act
    int code = run(args);

    // Assert: stdout целиком разбирается как JSON, прогресс в stderr
    EXPECT_EQ(code, 0);
    std::string out = drain(out_);
    rapidjson::Document doc;
    doc.Parse(out.c_str());
    ASSERT_FALSE(doc.HasParseError()) << out;
    EXPECT_EQ(doc["discovered"].GetUint64(), 2u);
    EXPECT_EQ(doc["failed"].GetUint64(), 1u);
    EXPECT_NE(drain(err_).find("Processing: a/entry.json"), std::string::npos);
}

TEST_F(RunCliTest, Report_WritesFileAndKeepsProgressOnStdout) {
    create_file(input_ / "a" / "entry.json", "{}");
    auto report = test_dir_ / "run.json";
    auto args = io_args();
    args.push_back("--report");
    args.push_back(report.string());

    int code = run(args);

    EXPECT_EQ(code, 0);
    rapidjson::Document doc;
    doc.Parse(read_file(report).c_str());
    ASSERT_FALSE(doc.HasParseError());
    EXPECT_EQ(doc["succeeded"].GetUint64(), 1u);
    std::string out = drain(out_);
    EXPECT_NE(out.find("Processing: a/entry.json"), std::string::npos);
    EXPECT_EQ(out.find("\"outcomes\""), std::string::npos);
}

TEST_F(RunCliTest, Report_MissingInput_LeavesExistingFileUntouched) {
    // Arrange: отчёт прошлого прогона
    auto report = test_dir_ / "run.json";
    create_file(report, "{\"previous\":true}");
    input_ = test_dir_ / "nope";
    auto args = io_args();
    args.push_back("--report");
    args.push_back(report.string());

    // Act
    int code = run(args);

    // Assert
    EXPECT_EQ(code, 1);
    EXPECT_EQ(read_file(report), "{\"previous\":true}");
}

TEST_F(RunCliTest, Report_UnwritablePath_ExitOne) {
    create_file(input_ / "a" / "entry.json", "{}");
    auto args = io_args();
    args.push_back("--report");
    args.push_back(test_dir_.string());

    int code = run(args);

    EXPECT_EQ(code, 1);
    EXPECT_NE(drain(err_).find("failed to open report file"), std::string::npos);
}

}  // namespace bilicache::app::test
