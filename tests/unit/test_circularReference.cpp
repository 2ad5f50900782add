#include <catch2/catch_all.hpp>
#include "lexiconValidator.hpp"
#include "Validation/typeDispatcher.hpp"
#include <nlohmann/json.hpp>
#include <string>

using namespace nlohmann;

static json refObject(const std::string& id, const std::string& property, const std::string& target) {
    return {
        {"lexicon", 1},
        {"id", id},
        {"defs", {
            {"main", {
                {"type", "object"},
                {"properties", {
                    {property, {{"type", "ref"}, {"ref", target}}}
                }}
            }}
        }}
    };
}

TEST_CASE("Circular reference detection during data validation", "[circular]") {

    SECTION("Detects direct A -> B -> A cycle") {
        json a = refObject("com.example.a", "b", "com.example.b");
        json b = refObject("com.example.b", "a", "com.example.a");

        // Schemas resolve fine; the cycle only shows when data follows it
        REQUIRE(LexiconValidator::validate({a, b}).has_value());

        auto result = LexiconValidator::validateRecord({a, b}, "com.example.a", {{"b", {{"a", json::object()}}}});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().isDataValidation());
        REQUIRE(result.error().getMessage() == "b.a: circular reference detected: com.example.a#main");
    }

    SECTION("Data that stops before the cycle closes is accepted") {
        json a = refObject("com.example.a", "b", "com.example.b");
        json b = refObject("com.example.b", "a", "com.example.a");

        REQUIRE(LexiconValidator::validateRecord({a, b}, "com.example.a", {{"b", json::object()}}).has_value());
    }

    SECTION("Detects a self-referencing local definition") {
        json tree = {
            {"lexicon", 1},
            {"id", "com.example.tree"},
            {"defs", {
                {"main", {
                    {"type", "object"},
                    {"properties", {{"root", {{"type", "ref"}, {"ref", "#node"}}}}}
                }},
                {"node", {
                    {"type", "object"},
                    {"properties", {
                        {"children", {{"type", "array"}, {"items", {{"type", "ref"}, {"ref", "#node"}}}}}
                    }}
                }}
            }}
        };

        REQUIRE(LexiconValidator::validateRecord({tree}, "com.example.tree", {{"root", {{"children", json::array()}}}}).has_value());

        json data = {{"root", {{"children", {{{"children", json::array()}}}}}}};
        auto result = LexiconValidator::validateRecord({tree}, "com.example.tree", data);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().getMessage() == "root.children[0]: circular reference detected: com.example.tree#node");
    }

    SECTION("Detects cycles through unions") {
        json thread = {
            {"lexicon", 1},
            {"id", "com.example.thread"},
            {"defs", {
                {"main", {
                    {"type", "object"},
                    {"properties", {{"post", {{"type", "union"}, {"refs", {"#post"}}}}}}
                }},
                {"post", {
                    {"type", "object"},
                    {"properties", {{"parent", {{"type", "union"}, {"refs", {"#post"}}}}}}
                }}
            }}
        };

        json data = {{"post", {{"$type", "com.example.thread#post"}, {"parent", {{"$type", "post"}}}}}};
        auto result = LexiconValidator::validateRecord({thread}, "com.example.thread", data);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().getMessage() == "post.parent: circular reference detected: com.example.thread#post");
    }

    SECTION("Detects a cycle closing after a long chain") {
        const int chainLength = 20;
        std::vector<json> documents;
        for (int i = 0; i < chainLength; ++i) {
            std::string id = "com.example.n" + std::to_string(i);
            std::string next = "com.example.n" + std::to_string((i + 1) % chainLength);
            documents.push_back(refObject(id, "next", next));
        }

        json data = json::object();
        for (int i = 0; i <= chainLength; ++i) {
            data = json{{"next", data}};
        }

        auto result = LexiconValidator::validateRecord(documents, "com.example.n0", data);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().isDataValidation());
        REQUIRE(result.error().getMessage().find("circular reference detected: com.example.n0#main") != std::string::npos);
    }
}

TEST_CASE("Nesting depth ceiling", "[circular][depth]") {
    json schema = {{"type", "unknown"}};
    json data = json::object();
    for (int i = 0; i < 10; ++i) {
        schema = {{"type", "array"}, {"items", schema}};
        data = json::array({data});
    }

    SECTION("Within the ceiling") {
        REQUIRE(TypeDispatcher::validateSchema(schema, TypeDispatcher::createContext()).has_value());
        REQUIRE(TypeDispatcher::validateData(data, schema, TypeDispatcher::createContext()).has_value());
    }

    SECTION("Beyond the ceiling") {
        auto schemaResult = TypeDispatcher::validateSchema(schema, TypeDispatcher::createContext(nullptr, 5));
        REQUIRE(schemaResult.error().isInvalidSchema());
        REQUIRE(schemaResult.error().getMessage().ends_with("maximum nesting depth (5) exceeded"));

        auto dataResult = TypeDispatcher::validateData(data, schema, TypeDispatcher::createContext(nullptr, 5));
        REQUIRE(dataResult.error().isDataValidation());
        REQUIRE(dataResult.error().getMessage() == "[0][0][0][0][0][0]: maximum nesting depth (5) exceeded");
    }

    SECTION("Through top-level options") {
        json lexicon = {{"lexicon", 1}, {"id", "com.example.deep"}, {"defs", {{"main", schema}}}};
        ValidationOptions options;
        options.maxDepth = 5;
        REQUIRE_FALSE(LexiconValidator::validate({lexicon}, options).has_value());
        REQUIRE(LexiconValidator::validate({lexicon}).has_value());
    }
}
