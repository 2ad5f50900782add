#include <catch2/catch_all.hpp>
#include "lexiconLoader.hpp"
#include "lexiconValidator.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

using namespace nlohmann;
namespace fs = std::filesystem;

static std::string writeTempFile(const std::string& relPath, const std::string& contents) {
    fs::path p = fs::path("build/tests_tmp") / relPath;
    fs::create_directories(p.parent_path());
    std::ofstream out(p);
    REQUIRE(out.good());
    out << contents;
    out.close();
    return p.string();
}

static std::string writeTempFile(const std::string& relPath, const nlohmann::json& j) {
    return writeTempFile(relPath, j.dump(2));
}

static json profileLexicon() {
    return {
        {"lexicon", 1},
        {"id", "com.example.actor.profile"},
        {"defs", {
            {"main", {
                {"type", "record"},
                {"key", "literal:self"},
                {"record", {
                    {"type", "object"},
                    {"properties", {
                        {"displayName", {{"type", "string"}, {"maxGraphemes", 64}, {"maxLength", 640}}},
                        {"avatar", {{"type", "blob"}, {"accept", {"image/png", "image/jpeg"}}, {"maxSize", 1000000}}},
                        {"pinned", {{"type", "ref"}, {"ref", "com.example.repo.strongRef"}}}
                    }}
                }}
            }}
        }}
    };
}

static json strongRefLexicon() {
    return {
        {"lexicon", 1},
        {"id", "com.example.repo.strongRef"},
        {"defs", {
            {"main", {
                {"type", "object"},
                {"required", {"uri", "cid"}},
                {"properties", {
                    {"uri", {{"type", "string"}, {"format", "at-uri"}}},
                    {"cid", {{"type", "string"}, {"format", "cid"}}}
                }}
            }}
        }}
    };
}

TEST_CASE("Loader lists lexicon files recursively and in order", "[integration][loader]") {
    fs::remove_all("build/tests_tmp/lexicons_tree");
    writeTempFile("lexicons_tree/com/example/repo/strongRef.json", strongRefLexicon());
    writeTempFile("lexicons_tree/com/example/actor/profile.json", profileLexicon());
    writeTempFile("lexicons_tree/README.md", std::string("not a lexicon"));

    auto files = LexiconLoader::listLexiconFiles("build/tests_tmp/lexicons_tree");
    REQUIRE(files.size() == 2);
    REQUIRE(files[0].ends_with("actor/profile.json"));
    REQUIRE(files[1].ends_with("repo/strongRef.json"));

    auto single = LexiconLoader::listLexiconFiles(files[0]);
    REQUIRE(single == std::vector<std::string>{files[0]});

    REQUIRE_THROWS_AS(LexiconLoader::listLexiconFiles("build/tests_tmp/does_not_exist"), std::runtime_error);
    REQUIRE_THROWS_AS(LexiconLoader::loadJsonFile("build/tests_tmp/does_not_exist.json"), std::runtime_error);
}

TEST_CASE("Lexicons in a directory resolve against each other", "[integration][check]") {
    fs::remove_all("build/tests_tmp/lexicons_cross");
    writeTempFile("lexicons_cross/profile.json", profileLexicon());

    SECTION("A lone lexicon cannot resolve its reference") {
        auto files = LexiconLoader::loadLexicons("build/tests_tmp/lexicons_cross");
        auto result = LexiconValidator::validate(LexiconLoader::documentsOf(files));
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().contains("com.example.actor.profile"));
    }

    SECTION("Loaded together they validate, and records check against them") {
        writeTempFile("lexicons_cross/strongRef.json", strongRefLexicon());

        auto files = LexiconLoader::loadLexicons("build/tests_tmp/lexicons_cross");
        REQUIRE(files.size() == 2);
        auto documents = LexiconLoader::documentsOf(files);
        REQUIRE(LexiconValidator::validate(documents).has_value());

        json record = {
            {"$type", "com.example.actor.profile"},
            {"displayName", "Alice"},
            {"pinned", {
                {"uri", "at://did:plc:z72i7hdynmk6r22z27h6tvur/com.example.feed.post/3jui7kd54zh2y"},
                {"cid", "bafyreigh2akiscaildcqabsyg3dfr6chu3fgpregiymsck7e7aqa4s52zy"}
            }}
        };
        std::string recordPath = writeTempFile("records/profile.json", record);

        json loaded = LexiconLoader::loadJsonFile(recordPath);
        REQUIRE(LexiconValidator::validateRecord(documents, "com.example.actor.profile", loaded).has_value());

        loaded["pinned"].erase("cid");
        auto result = LexiconValidator::validateRecord(documents, "com.example.actor.profile", loaded);
        REQUIRE(result.error().isDataValidation());
        REQUIRE(result.error().getMessage() == "pinned: required field 'cid' is missing");
    }
}

TEST_CASE("Unreadable files are reported per file", "[integration][check]") {
    fs::remove_all("build/tests_tmp/lexicons_broken");
    writeTempFile("lexicons_broken/good.json", strongRefLexicon());
    writeTempFile("lexicons_broken/truncated.json", std::string("{\"lexicon\": 1, \"id\": "));

    auto files = LexiconLoader::loadLexicons("build/tests_tmp/lexicons_broken");
    REQUIRE(files.size() == 2);

    REQUIRE(files[0].document.has_value());
    REQUIRE(files[0].error.empty());

    REQUIRE_FALSE(files[1].document.has_value());
    REQUIRE(files[1].error.find("Failed to parse JSON in") != std::string::npos);

    auto documents = LexiconLoader::documentsOf(files);
    REQUIRE(documents.size() == 1);
    REQUIRE(LexiconValidator::validate(documents).has_value());
}

TEST_CASE("Files sharing a lexicon id are reported on the right file", "[integration][check]") {
    fs::remove_all("build/tests_tmp/lexicons_dup");
    writeTempFile("lexicons_dup/a.json", strongRefLexicon());

    SECTION("The later file carries the duplicate error") {
        writeTempFile("lexicons_dup/b.json", strongRefLexicon());

        auto files = LexiconLoader::loadLexicons("build/tests_tmp/lexicons_dup");
        REQUIRE(files.size() == 2);

        auto errors = LexiconLoader::checkFiles(files);
        REQUIRE(errors[1] == std::vector<std::string>{"duplicate lexicon id 'com.example.repo.strongRef'"});
        REQUIRE(errors[0] == std::vector<std::string>{
            "lexicon id 'com.example.repo.strongRef' is also defined in " + files[1].path});
    }

    SECTION("Definition errors follow the document that replaced the others") {
        json broken = strongRefLexicon();
        broken["defs"]["extra"] = {{"type", "string"}, {"maxLength", -1}};
        writeTempFile("lexicons_dup/b.json", broken);

        auto files = LexiconLoader::loadLexicons("build/tests_tmp/lexicons_dup");
        REQUIRE(files.size() == 2);

        ValidationOptions options;
        options.rejectDuplicateIds = false;
        auto errors = LexiconLoader::checkFiles(files, options);

        REQUIRE(errors[1].size() == 1);
        REQUIRE(errors[1][0].starts_with("com.example.repo.strongRef#extra: "));
        REQUIRE(errors[0] == std::vector<std::string>{
            "lexicon id 'com.example.repo.strongRef' is also defined in " + files[1].path});
    }

    SECTION("Unrelated files keep passing") {
        writeTempFile("lexicons_dup/b.json", strongRefLexicon());
        writeTempFile("lexicons_dup/c.json", profileLexicon());

        auto files = LexiconLoader::loadLexicons("build/tests_tmp/lexicons_dup");
        REQUIRE(files.size() == 3);

        auto errors = LexiconLoader::checkFiles(files);
        REQUIRE_FALSE(errors[0].empty());
        REQUIRE_FALSE(errors[1].empty());
        REQUIRE(errors[2].empty());
    }
}
