#include "lexiconValidator.hpp"
#include "Validation/typeDispatcher.hpp"
#include "Lexicon/schemaType.hpp"

using namespace std;

namespace {

string documentKey(const nlohmann::json& document) {
    if (document.is_object() && document.contains("id") && document["id"].is_string()) {
        return document["id"].get<string>();
    }
    return "unknown";
}

} // namespace

/* ================== Top-level schema validation ================== */

expected<void, SchemaErrors> LexiconValidator::validate(
    const vector<nlohmann::json>& documents, const ValidationOptions& options) {

    DocumentErrors perDocument = validateDocuments(documents, options);

    SchemaErrors errors;
    for (size_t i = 0; i < documents.size(); ++i) {
        if (perDocument[i].empty()) continue;
        auto& grouped = errors[documentKey(documents[i])];
        grouped.insert(grouped.end(), perDocument[i].begin(), perDocument[i].end());
    }

    if (!errors.empty()) return unexpected(errors);
    return {};
}

DocumentErrors LexiconValidator::validateDocuments(
    const vector<nlohmann::json>& documents, const ValidationOptions& options) {

    DocumentErrors errors(documents.size());
    auto catalog = make_shared<LexiconCatalog>();

    // Index of the input document each catalog entry came from
    map<string, size_t> sourceOf;

    for (size_t i = 0; i < documents.size(); ++i) {
        auto document = LexiconDocument::parse(documents[i]);
        if (!document) {
            errors[i].push_back(document.error().getMessage());
            continue;
        }

        string id = document->getId();
        if (auto added = catalog->addDocument(std::move(*document), options.rejectDuplicateIds); !added) {
            errors[i].push_back(added.error().getMessage());
            continue;
        }
        sourceOf[id] = i;
    }

    ValidationContext base = TypeDispatcher::createContext(catalog, options.maxDepth);

    for (const auto& [id, document] : catalog->getDocuments()) {
        ValidationContext ctx = base.withCurrentDocument(id);
        auto& documentErrors = errors[sourceOf.at(id)];

        for (const auto& [name, definition] : document.getDefs().items()) {
            auto result = validateDefinition(name, definition, ctx);
            if (!result) {
                documentErrors.push_back(id + "#" + name + ": " + result.error().getMessage());
            }
        }
    }

    return errors;
}

ValidationResult LexiconValidator::validateDefinition(
    const string& name, const nlohmann::json& definition, const ValidationContext& ctx) {

    auto type = TypeDispatcher::schemaTypeOf(definition, ctx);
    if (!type) return unexpected(type.error());

    if (isPrimarySchemaType(*type) && name != "main") {
        return unexpected(ctx.schemaError(
            schema_type_to_string(*type) + " definitions are only allowed as 'main'"));
    }

    return TypeDispatcher::validateSchema(definition, ctx);
}

/* ================== Record validation ================== */

expected<shared_ptr<const LexiconCatalog>, ValidationError> LexiconValidator::buildCatalog(
    const vector<nlohmann::json>& documents, const ValidationOptions& options) {

    auto catalog = make_shared<LexiconCatalog>();

    for (const auto& json : documents) {
        auto document = LexiconDocument::parse(json);
        if (!document) return unexpected(document.error());

        if (auto added = catalog->addDocument(std::move(*document), options.rejectDuplicateIds); !added) {
            return unexpected(added.error());
        }
    }

    return shared_ptr<const LexiconCatalog>(std::move(catalog));
}

ValidationResult LexiconValidator::validateRecord(
    const vector<nlohmann::json>& documents,
    const string& typeId,
    const nlohmann::json& record,
    const ValidationOptions& options) {

    auto catalog = buildCatalog(documents, options);
    if (!catalog) return unexpected(catalog.error());

    const LexiconDocument* document = (*catalog)->findDocument(typeId);
    if (document == nullptr) {
        return unexpected(ValidationError::lexiconNotFound(typeId));
    }

    const nlohmann::json* main = document->findDefinition("main");
    if (main == nullptr) {
        return unexpected(ValidationError::invalidSchema(typeId + ": Lexicon has no main definition"));
    }

    ValidationContext ctx = TypeDispatcher::createContext(*catalog, options.maxDepth).withCurrentDocument(typeId);

    // The definition is checked first so data errors are never reported against a broken schema
    if (auto checked = TypeDispatcher::validateSchema(*main, ctx); !checked) {
        return unexpected(ValidationError::invalidSchema(typeId + "#main: " + checked.error().getMessage()));
    }

    return TypeDispatcher::validateData(record, *main, ctx.withReference(typeId + "#main"));
}

/* ================== Format helpers ================== */

bool LexiconValidator::isValidNsid(const string& value) {
    return ::isValidNsid(value);
}

expected<void, string> LexiconValidator::validateStringFormat(const string& value, FormatTag format) {
    return ::validateStringFormat(value, format);
}
