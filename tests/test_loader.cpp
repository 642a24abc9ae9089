/**
 * @file test_loader.cpp
 * @brief Tests for source file loading (GoogleTest)
 *
 * Validates RULES F1-F4 from Loader.hpp
 */

#include <gtest/gtest.h>
#include "datamerge/Errors.hpp"
#include "datamerge/Loader.hpp"
#include "datamerge/Util.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace datamerge;

// ============================================================================
// Test helpers
// ============================================================================

/**
 * @brief RAII wrapper for temporary files
 */
class TempFile {
public:
    explicit TempFile(const std::string& filename, const std::string& content)
        : path_(fs::temp_directory_path() / filename) {
        std::ofstream f(path_);
        f << content;
        f.close();
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

// ============================================================================
// get_file_extension
// ============================================================================

TEST(FileExtension, Lowercased) {
    EXPECT_EQ(get_file_extension("a/b/base.JSON"), ".json");
    EXPECT_EQ(get_file_extension("layer.toml"), ".toml");
    EXPECT_EQ(get_file_extension("noext"), "");
}

// ============================================================================
// JSON (RULES F1, F2)
// ============================================================================

TEST(LoadJson, ParsesDocument) {
    TempFile file("datamerge_load.json", R"({"b": 1, "a": {"list": [1, 2]}})");
    Value data = load_json_file(file.path());
    EXPECT_EQ(data["b"], 1);
    EXPECT_EQ(data["a"]["list"].size(), 2u);
}

TEST(LoadJson, KeepsKeyOrder) {
    TempFile file("datamerge_order.json", R"({"z": 1, "a": 2, "m": 3})");
    Value data = load_json_file(file.path());
    std::vector<std::string> keys;
    for (auto it = data.begin(); it != data.end(); ++it) keys.push_back(it.key());
    std::vector<std::string> expected = {"z", "a", "m"};
    EXPECT_EQ(keys, expected);
}

TEST(LoadJson, ScalarAndArrayRoots) {
    TempFile file("datamerge_root.json", "[1, 2, 3]");
    EXPECT_TRUE(load_json_file(file.path()).is_array());
}

TEST(LoadJson, SyntaxErrorThrows) {
    TempFile file("datamerge_bad.json", R"({"a": )");
    try {
        load_json_file(file.path());
        FAIL() << "Expected SourceParseError";
    } catch (const SourceParseError& e) {
        EXPECT_EQ(e.file(), file.path());
        EXPECT_FALSE(e.details().empty());
    }
}

TEST(LoadJson, SyntaxErrorReportsPosition) {
    TempFile file("datamerge_bad_pos.json", "{\n  \"a\": 1,\n  \"b\": ]\n}\n");
    try {
        load_json_file(file.path());
        FAIL() << "Expected SourceParseError";
    } catch (const SourceParseError& e) {
        EXPECT_EQ(e.format(), "JSON");
        EXPECT_EQ(e.line(), 3);
        EXPECT_EQ(e.column(), 8);
        EXPECT_NE(std::string(e.what()).find("line 3"), std::string::npos);
    }
}

TEST(LoadJson, MissingFileThrows) {
    EXPECT_THROW(load_json_file("/nonexistent/datamerge.json"), FileNotFoundError);
}

// ============================================================================
// TOML (RULE F2)
// ============================================================================

TEST(LoadToml, ParsesTables) {
    TempFile file("datamerge_load.toml",
                  "[database]\n"
                  "host = \"localhost\"\n"
                  "port = 5432\n"
                  "ratio = 0.5\n"
                  "tags = [\"a\", \"b\"]\n"
                  "[features]\n"
                  "enabled = true\n");
    Value data = load_toml_file(file.path());
    EXPECT_EQ(data["database"]["host"], "localhost");
    EXPECT_EQ(data["database"]["port"], 5432);
    EXPECT_DOUBLE_EQ(data["database"]["ratio"].get<double>(), 0.5);
    EXPECT_EQ(data["database"]["tags"].size(), 2u);
    EXPECT_EQ(data["features"]["enabled"], true);
}

TEST(LoadToml, DatesBecomeText) {
    TempFile file("datamerge_date.toml", "released = 2024-05-01\n");
    Value data = load_toml_file(file.path());
    ASSERT_TRUE(data["released"].is_string());
    EXPECT_EQ(data["released"], "2024-05-01");
}

TEST(LoadToml, KeysKeepDocumentOrder) {
    TempFile file("datamerge_order.toml",
                  "zeta = 1\n"
                  "alpha = 2\n"
                  "[server]\n"
                  "port = 80\n"
                  "host = \"h\"\n");
    Value data = load_toml_file(file.path());

    std::vector<std::string> keys;
    for (auto it = data.begin(); it != data.end(); ++it) keys.push_back(it.key());
    std::vector<std::string> expected = {"zeta", "alpha", "server"};
    EXPECT_EQ(keys, expected);

    std::vector<std::string> server_keys;
    for (auto it = data["server"].begin(); it != data["server"].end(); ++it) {
        server_keys.push_back(it.key());
    }
    std::vector<std::string> expected_server = {"port", "host"};
    EXPECT_EQ(server_keys, expected_server);
}

TEST(LoadToml, SyntaxErrorReportsLine) {
    TempFile file("datamerge_bad.toml", "a = 1\nb = = 2\n");
    try {
        load_toml_file(file.path());
        FAIL() << "Expected SourceParseError";
    } catch (const SourceParseError& e) {
        EXPECT_EQ(e.file(), file.path());
        EXPECT_EQ(e.format(), "TOML");
        EXPECT_EQ(e.line(), 2);
    }
}

// ============================================================================
// Auto-detection (RULE F3)
// ============================================================================

TEST(LoadSource, DetectsByExtension) {
    TempFile json("datamerge_detect.json", R"({"from": "json"})");
    TempFile toml("datamerge_detect.toml", "from = \"toml\"\n");
    EXPECT_EQ(load_source_file(json.path())["from"], "json");
    EXPECT_EQ(load_source_file(toml.path())["from"], "toml");
}

TEST(LoadSource, UnsupportedExtensionThrows) {
    TempFile file("datamerge_detect.yaml", "a: 1\n");
    EXPECT_THROW(load_source_file(file.path()), MergeError);
}

TEST(LoadSource, MissingFileWinsOverExtension) {
    EXPECT_THROW(load_source_file("/nonexistent/datamerge.yaml"), FileNotFoundError);
}

TEST(LoadSource, LoadsListInOrder) {
    TempFile first("datamerge_list_1.json", R"({"n": 1})");
    TempFile second("datamerge_list_2.toml", "n = 2\n");
    auto sources = load_source_files({first.path(), second.path()});
    ASSERT_EQ(sources.size(), 2u);
    EXPECT_EQ(sources[0]["n"], 1);
    EXPECT_EQ(sources[1]["n"], 2);
}

// ============================================================================
// Text positions
// ============================================================================

TEST(PositionAt, LinesAndColumns) {
    const std::string text = "ab\ncd\n";
    EXPECT_EQ(position_at(text, 0).line, 1);
    EXPECT_EQ(position_at(text, 0).column, 1);
    EXPECT_EQ(position_at(text, 4).line, 2);
    EXPECT_EQ(position_at(text, 4).column, 2);
}

TEST(PositionAt, PastEndClamps) {
    const TextPosition pos = position_at("ab\nc", 100);
    EXPECT_EQ(pos.line, 2);
    EXPECT_EQ(pos.column, 2);
}
