#include <catch2/catch_all.hpp>
#include "Lexicon/lexiconDocument.hpp"
#include "Lexicon/schemaType.hpp"
#include <nlohmann/json.hpp>

using namespace nlohmann;

static json minimalLexicon(const std::string& id) {
    return {
        {"lexicon", 1},
        {"id", id},
        {"defs", {{"main", {{"type", "token"}}}}}
    };
}

TEST_CASE("Schema type tags", "[lexicon][schemaType]") {
    REQUIRE(schema_type_from_string("cid-link") == SchemaType::CidLink);
    REQUIRE(schema_type_from_string("subscription") == SchemaType::Subscription);
    REQUIRE_FALSE(schema_type_from_string("number").has_value());
    REQUIRE(schema_type_to_string(SchemaType::Params) == "params");

    REQUIRE(isPrimarySchemaType(SchemaType::Record));
    REQUIRE(isPrimarySchemaType(SchemaType::Query));
    REQUIRE(isPrimarySchemaType(SchemaType::Procedure));
    REQUIRE(isPrimarySchemaType(SchemaType::Subscription));
    REQUIRE_FALSE(isPrimarySchemaType(SchemaType::Params));
    REQUIRE_FALSE(isPrimarySchemaType(SchemaType::Object));
}

TEST_CASE("LexiconDocument parsing", "[lexicon][document]") {

    SECTION("Minimal document") {
        json source = minimalLexicon("com.example.token");
        source["description"] = "A token";
        source["revision"] = 3;

        auto document = LexiconDocument::parse(source);
        REQUIRE(document.has_value());
        REQUIRE(document->getId() == "com.example.token");
        REQUIRE((*document->findDefinition("main"))["type"] == "token");
        REQUIRE(document->findDefinition("other") == nullptr);

        source["description"] = 7;
        REQUIRE(LexiconDocument::parse(source).error().getMessage() ==
                "com.example.token: 'description' must be a string");
    }

    SECTION("lexicon version is optional but must be 1") {
        json source = minimalLexicon("com.example.token");
        source.erase("lexicon");
        REQUIRE(LexiconDocument::parse(source).has_value());

        source["lexicon"] = 2;
        auto result = LexiconDocument::parse(source);
        REQUIRE(result.error().isInvalidSchema());
        REQUIRE(result.error().getMessage() == "com.example.token: unsupported lexicon version 2");
    }

    SECTION("id is required and must be an NSID") {
        json source = minimalLexicon("com.example.token");
        source.erase("id");
        REQUIRE(LexiconDocument::parse(source).error().getMessage() == "Lexicon missing required 'id' field");

        source["id"] = 5;
        REQUIRE_FALSE(LexiconDocument::parse(source).has_value());

        REQUIRE(LexiconDocument::parse(minimalLexicon("not-an-nsid")).error().getMessage() ==
                "Lexicon id 'not-an-nsid' is not a valid NSID");
    }

    SECTION("defs is required and must be an object") {
        json source = minimalLexicon("com.example.token");
        source.erase("defs");
        REQUIRE(LexiconDocument::parse(source).error().getMessage() ==
                "com.example.token: Lexicon missing required 'defs' field");

        source["defs"] = json::array();
        REQUIRE(LexiconDocument::parse(source).error().getMessage() == "com.example.token: 'defs' must be an object");
    }

    SECTION("Unknown top-level fields are rejected") {
        json source = minimalLexicon("com.example.token");
        source["schema"] = "x";
        REQUIRE(LexiconDocument::parse(source).error().getMessage() ==
                "com.example.token: unknown top-level field 'schema'");
    }

    SECTION("Non-object documents") {
        REQUIRE_FALSE(LexiconDocument::parse(json::array()).has_value());
        REQUIRE_FALSE(LexiconDocument::parse(json("com.example.token")).has_value());
    }
}

TEST_CASE("LexiconCatalog", "[lexicon][catalog]") {
    LexiconCatalog catalog;
    REQUIRE(catalog.getDocuments().empty());

    auto first = LexiconDocument::parse(minimalLexicon("com.example.a"));
    auto second = LexiconDocument::parse(minimalLexicon("com.example.b"));
    REQUIRE(catalog.addDocument(*first).has_value());
    REQUIRE(catalog.addDocument(*second).has_value());
    REQUIRE(catalog.getDocuments().size() == 2);
    REQUIRE(catalog.findDocument("com.example.a") != nullptr);
    REQUIRE(catalog.findDocument("com.example.b") != nullptr);
    REQUIRE(catalog.findDocument("com.example.c") == nullptr);

    SECTION("Duplicate ids are rejected by default") {
        auto result = catalog.addDocument(*first);
        REQUIRE(result.error().isInvalidSchema());
        REQUIRE(result.error().getMessage() == "duplicate lexicon id 'com.example.a'");
    }

    SECTION("Later documents replace earlier ones when duplicates are allowed") {
        json replacement = minimalLexicon("com.example.a");
        replacement["defs"]["extra"] = {{"type", "string"}};

        REQUIRE(catalog.addDocument(*LexiconDocument::parse(replacement), false).has_value());
        REQUIRE(catalog.getDocuments().size() == 2);
        REQUIRE(catalog.findDocument("com.example.a")->findDefinition("extra") != nullptr);
    }
}
