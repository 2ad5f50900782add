#ifndef LEXICON_DOCUMENT_HPP
#define LEXICON_DOCUMENT_HPP

#include "../Validation/validationError.hpp"

#include <string>
#include <map>
#include <expected>
#include <nlohmann/json.hpp>

/**
 * @brief A parsed lexicon document: its NSID and its named definitions.
 *
 * Only the document envelope is checked here (id, defs, lexicon version and the set of
 * top-level keys). Definitions are validated separately by the schema pass.
 */
class LexiconDocument {
private:
    std::string id;
    nlohmann::json defs;

    LexiconDocument(std::string id, nlohmann::json defs)
    : id(std::move(id)), defs(std::move(defs)) {}

public:
    static std::expected<LexiconDocument, ValidationError> parse(const nlohmann::json& json);

    const std::string& getId() const { return id; }
    const nlohmann::json& getDefs() const { return defs; }

    // nullptr when the document has no definition with this name
    const nlohmann::json* findDefinition(const std::string& name) const;
};

/**
 * @brief Lexicon documents keyed by their id. Read-only once built.
 */
class LexiconCatalog {
private:
    std::map<std::string, LexiconDocument> documents;

public:
    // Fails with InvalidSchema on a repeated id when rejectDuplicates is set, otherwise the
    // later document replaces the earlier one.
    ValidationResult addDocument(LexiconDocument document, bool rejectDuplicates = true);

    const LexiconDocument* findDocument(const std::string& id) const;

    const std::map<std::string, LexiconDocument>& getDocuments() const { return documents; }
};

#endif
