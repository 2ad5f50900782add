#include <catch2/catch_all.hpp>
#include "Validation/SchemaResolver.hpp"
#include "Lexicon/lexiconDocument.hpp"
#include <nlohmann/json.hpp>

using namespace nlohmann;

static LexiconCatalog makeCatalog(const std::vector<json>& documents) {
    LexiconCatalog catalog;
    for (const auto& document : documents) {
        auto parsed = LexiconDocument::parse(document);
        REQUIRE(parsed.has_value());
        REQUIRE(catalog.addDocument(std::move(*parsed)).has_value());
    }
    return catalog;
}

TEST_CASE("SchemaResolver parses reference syntax", "[schemaResolver][parse]") {

    SECTION("Local reference") {
        auto parsed = SchemaResolver::parseReference("#reply");
        REQUIRE(parsed.has_value());
        REQUIRE(parsed->isLocal());
        REQUIRE(parsed->definitionName == "reply");
    }

    SECTION("Global fragment reference") {
        auto parsed = SchemaResolver::parseReference("com.example.post#reply");
        REQUIRE(parsed.has_value());
        REQUIRE_FALSE(parsed->isLocal());
        REQUIRE(*parsed->documentId == "com.example.post");
        REQUIRE(parsed->definitionName == "reply");
    }

    SECTION("Global reference defaults to main") {
        auto parsed = SchemaResolver::parseReference("com.example.post");
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed->documentId == "com.example.post");
        REQUIRE(parsed->definitionName == "main");
    }

    SECTION("Malformed references are schema errors") {
        for (const std::string ref : {"", "#", "com.example.post#", "#a#b", "com.example.post#a#b", "#reply#", "not-an-nsid"}) {
            auto parsed = SchemaResolver::parseReference(ref);
            INFO("reference: " << ref);
            REQUIRE_FALSE(parsed.has_value());
            REQUIRE(parsed.error().isInvalidSchema());
        }

        auto missingNsid = SchemaResolver::parseReference("#");
        REQUIRE(missingNsid.error().getMessage() == "invalid reference '#': definition name cannot be empty");
    }
}

TEST_CASE("SchemaResolver resolves against a catalog", "[schemaResolver][resolve]") {

    json post = {
        {"lexicon", 1},
        {"id", "com.example.post"},
        {"defs", {
            {"main", {{"type", "object"}, {"properties", json::object()}}},
            {"reply", {{"type", "string"}}}
        }}
    };
    json profile = {
        {"lexicon", 1},
        {"id", "com.example.profile"},
        {"defs", {
            {"main", {{"type", "integer"}}}
        }}
    };

    LexiconCatalog catalog = makeCatalog({post, profile});

    SECTION("Local reference uses the current document") {
        auto resolved = SchemaResolver::resolveReference("#reply", catalog, std::string("com.example.post"));
        REQUIRE(resolved.has_value());
        REQUIRE(resolved->documentId == "com.example.post");
        REQUIRE(resolved->definitionName == "reply");
        REQUIRE(*resolved->schema == json{{"type", "string"}});
        REQUIRE(resolved->canonical() == "com.example.post#reply");
    }

    SECTION("Global reference resolves across documents") {
        auto resolved = SchemaResolver::resolveReference("com.example.profile", catalog, std::string("com.example.post"));
        REQUIRE(resolved.has_value());
        REQUIRE(resolved->canonical() == "com.example.profile#main");
        REQUIRE((*resolved->schema)["type"] == "integer");
    }

    SECTION("Local reference without a current document fails") {
        auto resolved = SchemaResolver::resolveReference("#reply", catalog, std::nullopt);
        REQUIRE_FALSE(resolved.has_value());
        REQUIRE(resolved.error().isInvalidSchema());
    }

    SECTION("Missing document is LexiconNotFound") {
        auto resolved = SchemaResolver::resolveReference("com.example.missing#main", catalog, std::nullopt);
        REQUIRE_FALSE(resolved.has_value());
        REQUIRE(resolved.error().isLexiconNotFound());
        REQUIRE(resolved.error().getMessage() == "com.example.missing");
    }

    SECTION("Missing definition is InvalidSchema") {
        auto resolved = SchemaResolver::resolveReference("com.example.post#nope", catalog, std::nullopt);
        REQUIRE_FALSE(resolved.has_value());
        REQUIRE(resolved.error().isInvalidSchema());
        REQUIRE(resolved.error().getMessage() == "definition 'nope' not found in lexicon 'com.example.post'");
    }
}

TEST_CASE("SchemaResolver canonical references", "[schemaResolver][canonical]") {
    std::optional<std::string> current = "com.example.post";

    REQUIRE(SchemaResolver::canonicalReference("#reply", current) == "com.example.post#reply");
    REQUIRE(SchemaResolver::canonicalReference("com.example.other", current) == "com.example.other#main");
    REQUIRE(SchemaResolver::canonicalReference("com.example.other#x", current) == "com.example.other#x");
    REQUIRE(SchemaResolver::canonicalReference("#reply", std::nullopt) == "#reply");
    REQUIRE(SchemaResolver::canonicalReference("bad#ref#", current) == "bad#ref#");
}
