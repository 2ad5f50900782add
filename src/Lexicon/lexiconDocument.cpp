#include "lexiconDocument.hpp"
#include "../Utility/formats.hpp"

#include <array>
#include <algorithm>

using namespace std;

static const array<string, 5> DOCUMENT_FIELDS = {"lexicon", "id", "revision", "description", "defs"};

expected<LexiconDocument, ValidationError> LexiconDocument::parse(const nlohmann::json& json) {

    if (!json.is_object()) {
        return unexpected(ValidationError::invalidSchema("Lexicon document must be a JSON object"));
    }

    if (!json.contains("id")) {
        return unexpected(ValidationError::invalidSchema("Lexicon missing required 'id' field"));
    }
    if (!json["id"].is_string()) {
        return unexpected(ValidationError::invalidSchema("Lexicon 'id' must be a string"));
    }

    string id = json["id"].get<string>();
    if (!isValidNsid(id)) {
        return unexpected(ValidationError::invalidSchema("Lexicon id '" + id + "' is not a valid NSID"));
    }

    if (json.contains("lexicon")) {
        const auto& version = json["lexicon"];
        if (!version.is_number_integer() || version.get<int64_t>() != 1) {
            return unexpected(ValidationError::invalidSchema(id + ": unsupported lexicon version " + version.dump()));
        }
    }

    for (const auto& [key, value] : json.items()) {
        if (find(DOCUMENT_FIELDS.begin(), DOCUMENT_FIELDS.end(), key) == DOCUMENT_FIELDS.end()) {
            return unexpected(ValidationError::invalidSchema(id + ": unknown top-level field '" + key + "'"));
        }
    }

    if (!json.contains("defs")) {
        return unexpected(ValidationError::invalidSchema(id + ": Lexicon missing required 'defs' field"));
    }
    if (!json["defs"].is_object()) {
        return unexpected(ValidationError::invalidSchema(id + ": 'defs' must be an object"));
    }

    if (json.contains("description") && !json["description"].is_string()) {
        return unexpected(ValidationError::invalidSchema(id + ": 'description' must be a string"));
    }

    return LexiconDocument(id, json["defs"]);
}

const nlohmann::json* LexiconDocument::findDefinition(const string& name) const {
    auto it = defs.find(name);
    if (it == defs.end()) return nullptr;
    return &(*it);
}

ValidationResult LexiconCatalog::addDocument(LexiconDocument document, bool rejectDuplicates) {
    string id = document.getId();

    auto it = documents.find(id);
    if (it != documents.end()) {
        if (rejectDuplicates) {
            return unexpected(ValidationError::invalidSchema("duplicate lexicon id '" + id + "'"));
        }
        it->second = std::move(document);
        return {};
    }

    documents.emplace(id, std::move(document));
    return {};
}

const LexiconDocument* LexiconCatalog::findDocument(const string& id) const {
    auto it = documents.find(id);
    if (it == documents.end()) return nullptr;
    return &it->second;
}
