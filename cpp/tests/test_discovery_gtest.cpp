// ==============================================================================
// test_discovery_gtest.cpp - Тесты модуля File Discovery (GoogleTest)
// ==============================================================================
//
// Обход дерева, фильтр по расширениям, .gitignore/.ignore, исключения
// пользователя и детерминированный порядок результата.
//
// ==============================================================================

#include "epcheck/discovery.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

// Platform-specific includes для PID (уникальные temp директории при параллельных тестах)
#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace epcheck::io::test {

// ==============================================================================
// Test Fixture: создаёт временную структуру директорий для тестов
// ==============================================================================

class DiscoveryTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        // Имя теста + PID: ctest -j запускает тесты параллельно
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("epcheck_discovery_") + test_info->test_case_name() +
                                  "_" + test_info->name() + "_" +
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

    void create_file(const std::filesystem::path& rel, const std::string& content = "x") {
        std::filesystem::path path = test_dir_ / rel;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file << content;
    }

    /// Опции без глобального ignore пользователя
    DiscoveryOptions hermetic_options() const {
        DiscoveryOptions opt;
        opt.use_global_ignore = false;
        return opt;
    }

    /// Результат в виде относительных generic путей
    std::vector<std::string> discover_rel(const DiscoveryOptions& opt) {
        std::vector<std::string> rel;
        for (const auto& path : discover_files(test_dir_, opt)) {
            rel.push_back(path.lexically_relative(test_dir_).generic_string());
        }
        return rel;
    }

    static bool contains(const std::vector<std::string>& v, const std::string& s) {
        return std::find(v.begin(), v.end(), s) != v.end();
    }
};

// ==============================================================================
// Ошибки корня
// ==============================================================================

TEST_F(DiscoveryTest, MissingRootThrows) {
    EXPECT_THROW(discover_files(test_dir_ / "absent", hermetic_options()), std::runtime_error);
}

TEST_F(DiscoveryTest, FileAsRootThrows) {
    create_file("a.ts");
    EXPECT_THROW(discover_files(test_dir_ / "a.ts", hermetic_options()), std::runtime_error);
}

TEST_F(DiscoveryTest, EmptyDirectoryYieldsNothing) {
    EXPECT_TRUE(discover_files(test_dir_, hermetic_options()).empty());
}

// ==============================================================================
// Фильтр по расширению
// ==============================================================================

TEST_F(DiscoveryTest, ExtensionFilter) {
    create_file("app.ts");
    create_file("lib.py");
    create_file("image.png");
    create_file("archive.tar.gz");
    create_file("Makefile");
    create_file(".bashrc");

    auto files = discover_rel(hermetic_options());
    EXPECT_TRUE(contains(files, "app.ts"));
    EXPECT_TRUE(contains(files, "lib.py"));
    EXPECT_TRUE(contains(files, "Makefile"));
    EXPECT_FALSE(contains(files, "image.png"));
    EXPECT_FALSE(contains(files, "archive.tar.gz"));
    EXPECT_FALSE(contains(files, ".bashrc"));
}

TEST_F(DiscoveryTest, HiddenFilesAndDirectoriesIncluded) {
    create_file(".github/api.ts");
    create_file(".eslintrc.json");
    create_file(".config/deep/client.js");

    auto files = discover_rel(hermetic_options());
    EXPECT_TRUE(contains(files, ".github/api.ts"));
    EXPECT_TRUE(contains(files, ".eslintrc.json"));
    EXPECT_TRUE(contains(files, ".config/deep/client.js"));
}

TEST_F(DiscoveryTest, ExtensionIsCaseSensitive) {
    DiscoveryOptions opt = hermetic_options();
    EXPECT_TRUE(is_candidate_file("a.ts", opt));
    EXPECT_FALSE(is_candidate_file("a.TS", opt));
}

TEST_F(DiscoveryTest, ExtensionlessCanBeDisabled) {
    DiscoveryOptions opt = hermetic_options();
    opt.include_extensionless = false;
    EXPECT_FALSE(is_candidate_file("Dockerfile", opt));
}

TEST_F(DiscoveryTest, DefaultExtensionsCoverCommonLanguages) {
    const auto& ext = default_source_extensions();
    for (const char* e : {"js", "ts", "tsx", "py", "go", "rs", "java", "cpp", "vue", "yaml"}) {
        EXPECT_EQ(ext.count(e), 1u) << e;
    }
}

// ==============================================================================
// Порядок и вложенность
// ==============================================================================

TEST_F(DiscoveryTest, RecursiveAndSorted) {
    create_file("z.ts");
    create_file("b/inner.ts");
    create_file("a/deep/nested.ts");

    auto files = discover_files(test_dir_, hermetic_options());
    ASSERT_EQ(files.size(), 3u);
    EXPECT_TRUE(std::is_sorted(files.begin(), files.end()));
}

TEST_F(DiscoveryTest, GitDirectoryAlwaysSkipped) {
    create_file(".git/config.json");
    create_file("src/a.ts");

    DiscoveryOptions opt = hermetic_options();
    opt.use_vcs_ignore = false;
    auto files = discover_rel(opt);
    EXPECT_EQ(files, std::vector<std::string>{"src/a.ts"});
}

// ==============================================================================
// Игнор-файлы
// ==============================================================================

TEST_F(DiscoveryTest, GitignoreHonored) {
    create_file(".gitignore", "dist/\n*.gen.ts\n");
    create_file("dist/bundle.js");
    create_file("src/api.gen.ts");
    create_file("src/api.ts");

    auto files = discover_rel(hermetic_options());
    EXPECT_EQ(files, std::vector<std::string>{"src/api.ts"});
}

TEST_F(DiscoveryTest, DotIgnoreHonored) {
    create_file(".ignore", "fixtures\n");
    create_file("fixtures/a.ts");
    create_file("b.ts");

    auto files = discover_rel(hermetic_options());
    EXPECT_EQ(files, std::vector<std::string>{"b.ts"});
}

TEST_F(DiscoveryTest, NestedGitignoreOverridesParent) {
    create_file(".gitignore", "*.js\n");
    create_file("keep/.gitignore", "!*.js\n");
    create_file("drop.js");
    create_file("keep/kept.js");

    auto files = discover_rel(hermetic_options());
    EXPECT_EQ(files, std::vector<std::string>{"keep/kept.js"});
}

TEST_F(DiscoveryTest, NestedGitignoreScopedToItsDirectory) {
    create_file("pkg/.gitignore", "/local.ts\n");
    create_file("pkg/local.ts");
    create_file("local.ts");

    auto files = discover_rel(hermetic_options());
    EXPECT_EQ(files, std::vector<std::string>{"local.ts"});
}

TEST_F(DiscoveryTest, GitInfoExcludeHonored) {
    create_file(".git/info/exclude", "secret.ts\n");
    create_file("secret.ts");
    create_file("open.ts");

    auto files = discover_rel(hermetic_options());
    EXPECT_EQ(files, std::vector<std::string>{"open.ts"});
}

TEST_F(DiscoveryTest, NoIgnoreDisablesIgnoreFiles) {
    create_file(".gitignore", "dist/\n");
    create_file("dist/bundle.js");

    DiscoveryOptions opt = hermetic_options();
    opt.use_vcs_ignore = false;
    auto files = discover_rel(opt);
    EXPECT_TRUE(contains(files, "dist/bundle.js"));
}

// ==============================================================================
// Исключения пользователя
// ==============================================================================

TEST_F(DiscoveryTest, UserExcludesUseGitignoreSyntax) {
    create_file("node_modules/lib/index.js");
    create_file("src/app.min.js");
    create_file("src/app.js");

    DiscoveryOptions opt = hermetic_options();
    opt.excludes = {"node_modules", "*.min.js"};
    auto files = discover_rel(opt);
    EXPECT_EQ(files, std::vector<std::string>{"src/app.js"});
}

TEST_F(DiscoveryTest, UserExcludesBeatGitignoreWhitelist) {
    create_file(".gitignore", "!special.ts\n");
    create_file("special.ts");

    DiscoveryOptions opt = hermetic_options();
    opt.excludes = {"special.ts"};
    EXPECT_TRUE(discover_rel(opt).empty());
}

TEST_F(DiscoveryTest, ExcludedFileSkipped) {
    create_file("openapi.yaml", "paths: {}\n");
    create_file("client.ts");

    DiscoveryOptions opt = hermetic_options();
    opt.excluded_files = {test_dir_ / "openapi.yaml"};
    auto files = discover_rel(opt);
    EXPECT_EQ(files, std::vector<std::string>{"client.ts"});
}

}  // namespace epcheck::io::test
