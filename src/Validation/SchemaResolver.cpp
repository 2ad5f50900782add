#include "SchemaResolver.hpp"
#include "../Utility/formats.hpp"

#include <algorithm>

using namespace std;

expected<ParsedReference, ValidationError> SchemaResolver::parseReference(const string& ref) {

    if (ref.empty()) {
        return unexpected(ValidationError::invalidSchema("reference cannot be empty"));
    }

    size_t hashCount = count(ref.begin(), ref.end(), '#');
    if (hashCount > 1) {
        return unexpected(ValidationError::invalidSchema(
            "invalid reference '" + ref + "': more than one '#'"));
    }

    // Local reference: "#name"
    if (ref[0] == '#') {
        string name = ref.substr(1);
        if (name.empty()) {
            return unexpected(ValidationError::invalidSchema(
                "invalid reference '" + ref + "': definition name cannot be empty"));
        }
        return ParsedReference{nullopt, name};
    }

    // Global fragment: "nsid#name"
    if (hashCount == 1) {
        size_t hashPos = ref.find('#');
        string nsid = ref.substr(0, hashPos);
        string name = ref.substr(hashPos + 1);

        if (nsid.empty() || name.empty()) {
            return unexpected(ValidationError::invalidSchema(
                "invalid reference '" + ref + "': both lexicon id and definition name are required"));
        }
        return ParsedReference{nsid, name};
    }

    // Global main: "nsid"
    if (!isValidNsid(ref)) {
        return unexpected(ValidationError::invalidSchema(
            "invalid reference '" + ref + "': not a valid NSID"));
    }
    return ParsedReference{ref, "main"};
}

expected<ResolvedReference, ValidationError> SchemaResolver::resolveReference(
    const string& ref,
    const LexiconCatalog& catalog,
    const optional<string>& currentDocumentId) {

    auto parsed = parseReference(ref);
    if (!parsed) return unexpected(parsed.error());

    string documentId;
    if (parsed->isLocal()) {
        if (!currentDocumentId) {
            return unexpected(ValidationError::invalidSchema(
                "cannot resolve local reference '" + ref + "' without a current lexicon"));
        }
        documentId = *currentDocumentId;
    } else {
        documentId = *parsed->documentId;
    }

    const LexiconDocument* document = catalog.findDocument(documentId);
    if (document == nullptr) {
        return unexpected(ValidationError::lexiconNotFound(documentId));
    }

    const nlohmann::json* schema = document->findDefinition(parsed->definitionName);
    if (schema == nullptr) {
        return unexpected(ValidationError::invalidSchema(
            "definition '" + parsed->definitionName + "' not found in lexicon '" + documentId + "'"));
    }

    return ResolvedReference{documentId, parsed->definitionName, schema};
}

string SchemaResolver::canonicalReference(const string& ref, const optional<string>& currentDocumentId) {
    auto parsed = parseReference(ref);
    if (!parsed) return ref;

    if (parsed->isLocal()) {
        if (!currentDocumentId) return ref;
        return *currentDocumentId + "#" + parsed->definitionName;
    }
    return *parsed->documentId + "#" + parsed->definitionName;
}
