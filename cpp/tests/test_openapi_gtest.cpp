// ==============================================================================
// test_openapi_gtest.cpp - Тесты загрузки OpenAPI документов (GoogleTest)
// ==============================================================================
//
// JSON разбирается RapidJSON, YAML - yaml-cpp.
//
// ==============================================================================

#include "epcheck/openapi.hpp"

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

namespace epcheck::spec::test {

namespace {

constexpr const char* PETSTORE_JSON = R"({
  "openapi": "3.0.0",
  "info": {"title": "Petstore", "version": "1.2.3"},
  "paths": {
    "/pets": {"get": {}, "post": {}, "parameters": []},
    "/pets/{petId}": {"get": {}, "delete": {}}
  }
})";

constexpr const char* PETSTORE_YAML = R"(openapi: 3.0.0
info:
  title: Petstore
  version: 1.2.3
paths:
  /pets:
    get:
      summary: List pets
    post:
      summary: Create pet
  /pets/{petId}:
    get:
      summary: Show pet
)";

}  // namespace

// ==============================================================================
// parse_spec
// ==============================================================================

TEST(OpenApiTest, ParseJson_ReadsPathsAndInfo) {
    auto result = parse_spec(PETSTORE_JSON, SpecFormat::Json);
    ASSERT_TRUE(result.ok) << result.error.format();

    EXPECT_EQ(result.spec.openapi, "3.0.0");
    EXPECT_EQ(result.spec.title, "Petstore");
    EXPECT_EQ(result.spec.version, "1.2.3");
    ASSERT_EQ(result.spec.paths.size(), 2u);

    const auto& pets = result.spec.paths.at("/pets");
    ASSERT_EQ(pets.size(), 3u);
    EXPECT_EQ(pets[0], "get");
    EXPECT_EQ(pets[1], "post");
    EXPECT_EQ(pets[2], "parameters");
}

TEST(OpenApiTest, ParseYaml_ReadsPathsAndInfo) {
    auto result = parse_spec(PETSTORE_YAML, SpecFormat::Yaml);
    ASSERT_TRUE(result.ok) << result.error.format();

    EXPECT_EQ(result.spec.title, "Petstore");
    EXPECT_EQ(result.spec.version, "1.2.3");
    ASSERT_EQ(result.spec.paths.size(), 2u);
    EXPECT_EQ(result.spec.paths.at("/pets/{petId}").size(), 1u);
}

TEST(OpenApiTest, ParseAuto_FallsBackToYaml) {
    auto json = parse_spec(PETSTORE_JSON, SpecFormat::Auto);
    auto yaml = parse_spec(PETSTORE_YAML, SpecFormat::Auto);
    ASSERT_TRUE(json.ok);
    ASSERT_TRUE(yaml.ok);
    EXPECT_EQ(json.spec.paths.size(), yaml.spec.paths.size());
}

TEST(OpenApiTest, ParseSwagger2_VersionFromSwaggerKey) {
    auto result = parse_spec(R"({"swagger": "2.0", "paths": {"/a": {"get": {}}}})",
                             SpecFormat::Json);
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.spec.openapi, "2.0");
    EXPECT_FALSE(result.spec.title.has_value());
}

TEST(OpenApiTest, ParseJson_NonObjectPathItemDeclaresNothing) {
    auto result = parse_spec(R"({"paths": {"/a": null, "/b": {"get": {}}}})", SpecFormat::Json);
    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(result.spec.paths.at("/a").empty());
    EXPECT_EQ(result.spec.paths.at("/b").size(), 1u);
}

TEST(OpenApiTest, ParseJson_SyntaxErrorReportsOffset) {
    auto result = parse_spec("{\"paths\": {", SpecFormat::Json, "api.json");
    ASSERT_FALSE(result.ok);
    EXPECT_NE(result.error.message.find("JSON parse error"), std::string::npos);
    EXPECT_NE(result.error.message.find("at offset"), std::string::npos);
    EXPECT_EQ(result.error.format().rfind("failed to load specification 'api.json' - ", 0), 0u);
}

TEST(OpenApiTest, ParseJson_MissingPathsIsError) {
    auto result = parse_spec(R"({"openapi": "3.0.0"})", SpecFormat::Json);
    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error.message, "document has no 'paths' object");
}

TEST(OpenApiTest, ParseJson_ArrayRootIsError) {
    auto result = parse_spec("[1, 2]", SpecFormat::Json);
    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error.message, "document root is not an object");
}

TEST(OpenApiTest, ParseYaml_NonScalarKeysSkipped) {
    constexpr const char* yaml = R"(paths:
  ? [a, b]
  : {get: {}}
  /ok:
    ? [x]
    : {}
    post: {}
  /also:
    get: {}
)";
    auto result = parse_spec(yaml, SpecFormat::Yaml);
    ASSERT_TRUE(result.ok) << result.error.format();
    ASSERT_EQ(result.spec.paths.size(), 2u);
    EXPECT_EQ(result.spec.paths.at("/ok"), (std::vector<std::string>{"post"}));
    EXPECT_EQ(result.spec.paths.at("/also"), (std::vector<std::string>{"get"}));
}

TEST(OpenApiTest, ParseYaml_ScalarRootIsError) {
    auto result = parse_spec("just text", SpecFormat::Yaml);
    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error.message, "document root is not a mapping");
}

TEST(OpenApiTest, ParseYaml_SyntaxErrorIsReported) {
    auto result = parse_spec("paths: [unclosed", SpecFormat::Yaml);
    ASSERT_FALSE(result.ok);
    EXPECT_NE(result.error.message.find("YAML parse error"), std::string::npos);
}

TEST(OpenApiTest, SpecFormatFromExtension) {
    EXPECT_EQ(spec_format_from_path("api.json"), SpecFormat::Json);
    EXPECT_EQ(spec_format_from_path("api.yaml"), SpecFormat::Yaml);
    EXPECT_EQ(spec_format_from_path("api.yml"), SpecFormat::Yaml);
    EXPECT_EQ(spec_format_from_path("api.txt"), SpecFormat::Auto);
}

// ==============================================================================
// URL
// ==============================================================================

TEST(OpenApiTest, IsSpecUrl) {
    EXPECT_TRUE(is_spec_url("http://example.com/openapi.json"));
    EXPECT_TRUE(is_spec_url("https://example.com/openapi.yaml"));
    EXPECT_FALSE(is_spec_url("openapi.json"));
    EXPECT_FALSE(is_spec_url("./http://x"));
    EXPECT_FALSE(is_spec_url("ftp://example.com/openapi.json"));
    EXPECT_FALSE(is_spec_url("HTTPS://example.com/openapi.json"));
}

TEST(OpenApiTest, SpecFormatFromUrl) {
    EXPECT_EQ(spec_format_from_url("https://example.com/api.json"), SpecFormat::Json);
    EXPECT_EQ(spec_format_from_url("https://example.com/v1/api.yaml?ref=main"), SpecFormat::Yaml);
    EXPECT_EQ(spec_format_from_url("https://example.com/api.yml#paths"), SpecFormat::Yaml);
    EXPECT_EQ(spec_format_from_url("https://example.com/v1.2/spec"), SpecFormat::Auto);
    EXPECT_EQ(spec_format_from_url("https://example.com"), SpecFormat::Auto);
    EXPECT_EQ(spec_format_from_url("https://example.com/"), SpecFormat::Auto);
}

TEST(OpenApiTest, LoadSpecUrl_ConnectionRefusedIsError) {
    // Порт 1 на loopback закрыт: ошибка соединения без обращения к сети
    const std::string url = "http://127.0.0.1:1/openapi.json";
    auto result = load_spec_url(url);
    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error.path, url);
    EXPECT_EQ(result.error.message.rfind("failed to fetch URL: ", 0), 0u);
    EXPECT_EQ(result.error.format().rfind("failed to load specification '" + url + "'", 0), 0u);
}

// ==============================================================================
// load_spec / find_spec
// ==============================================================================

class OpenApiFileTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("epcheck_openapi_") + test_info->name() + "_" +
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

    void write_file(const std::filesystem::path& path, const std::string& content) {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file << content;
    }
};

TEST_F(OpenApiFileTest, LoadSpec_JsonFile) {
    write_file(test_dir_ / "api.json", PETSTORE_JSON);
    auto result = load_spec(test_dir_ / "api.json");
    ASSERT_TRUE(result.ok) << result.error.format();
    EXPECT_EQ(result.spec.paths.size(), 2u);
}

TEST_F(OpenApiFileTest, LoadSpec_YamlFile) {
    write_file(test_dir_ / "api.yml", PETSTORE_YAML);
    auto result = load_spec(test_dir_ / "api.yml");
    ASSERT_TRUE(result.ok) << result.error.format();
    EXPECT_EQ(result.spec.title, "Petstore");
}

TEST_F(OpenApiFileTest, LoadSpec_MissingFileIsError) {
    auto result = load_spec(test_dir_ / "nope.json");
    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error.message, "file not found or not a regular file");
    EXPECT_NE(result.error.format().find("nope.json"), std::string::npos);
}

TEST_F(OpenApiFileTest, LoadSpec_DirectoryIsError) {
    EXPECT_FALSE(load_spec(test_dir_).ok);
}

TEST_F(OpenApiFileTest, FindSpec_InStartDirectory) {
    write_file(test_dir_ / "openapi.yaml", PETSTORE_YAML);
    auto found = find_spec(test_dir_);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->filename(), "openapi.yaml");
}

TEST_F(OpenApiFileTest, FindSpec_InParentDirectory) {
    write_file(test_dir_ / "swagger.json", PETSTORE_JSON);
    std::filesystem::create_directories(test_dir_ / "a" / "b");

    auto found = find_spec(test_dir_ / "a" / "b");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->filename(), "swagger.json");
}

TEST_F(OpenApiFileTest, FindSpec_PriorityOrder) {
    write_file(test_dir_ / "swagger.json", PETSTORE_JSON);
    write_file(test_dir_ / "openapi.yml", PETSTORE_YAML);

    auto found = find_spec(test_dir_);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->filename(), "openapi.yml");
}

TEST_F(OpenApiFileTest, FindSpec_NearestDirectoryWins) {
    write_file(test_dir_ / "openapi.json", PETSTORE_JSON);
    write_file(test_dir_ / "sub" / "swagger.yaml", PETSTORE_YAML);

    auto found = find_spec(test_dir_ / "sub");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->filename(), "swagger.yaml");
}

}  // namespace epcheck::spec::test
