#ifndef SCHEMA_RESOLVER_HPP
#define SCHEMA_RESOLVER_HPP

#include "validationError.hpp"
#include "../Lexicon/lexiconDocument.hpp"

#include <string>
#include <optional>
#include <expected>
#include <nlohmann/json.hpp>

/**
 * @brief A reference string split into its parts.
 *
 * "#name"      -> local, documentId unset
 * "nsid#name"  -> global fragment
 * "nsid"       -> global main, definitionName "main"
 */
struct ParsedReference {
    std::optional<std::string> documentId;
    std::string definitionName;

    bool isLocal() const { return !documentId.has_value(); }
};

struct ResolvedReference {
    std::string documentId;
    std::string definitionName;
    const nlohmann::json* schema;

    // "nsid#name", the key used for cycle detection
    std::string canonical() const { return documentId + "#" + definitionName; }
};

class SchemaResolver {
public:
    // Syntax only; no catalog lookup. Malformed references are InvalidSchema.
    static std::expected<ParsedReference, ValidationError> parseReference(const std::string& ref);

    // Local references resolve against currentDocumentId. A missing document is
    // LexiconNotFound, a missing definition is InvalidSchema.
    static std::expected<ResolvedReference, ValidationError> resolveReference(
        const std::string& ref,
        const LexiconCatalog& catalog,
        const std::optional<std::string>& currentDocumentId);

    // Fully qualified "nsid#name" form of ref, or ref unchanged when it cannot be qualified
    static std::string canonicalReference(
        const std::string& ref, const std::optional<std::string>& currentDocumentId);
};

#endif // SCHEMA_RESOLVER_HPP
