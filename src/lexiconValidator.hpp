#ifndef LEXICON_VALIDATOR_HPP
#define LEXICON_VALIDATOR_HPP

#include "Validation/validationError.hpp"
#include "Validation/validationContext.hpp"
#include "Lexicon/lexiconDocument.hpp"
#include "Utility/formats.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <expected>
#include <nlohmann/json.hpp>

struct ValidationOptions {
    size_t maxDepth = DEFAULT_MAX_DEPTH;
    bool rejectDuplicateIds = true;
};

// Error messages grouped by lexicon id ("unknown" for documents without a usable id)
using SchemaErrors = std::map<std::string, std::vector<std::string>>;

// Error messages per input document, in input order (empty when the document passed)
using DocumentErrors = std::vector<std::vector<std::string>>;

/**
 * @brief Entry points for checking lexicon documents and the records written against them.
 */
class LexiconValidator {
public:
    /**
     * @brief Validates every definition of every document.
     *
     * Each failing definition contributes one message "<id>#<def>: <detail>". Documents
     * that cannot be parsed contribute their parse error instead.
     */
    static std::expected<void, SchemaErrors> validate(
        const std::vector<nlohmann::json>& documents,
        const ValidationOptions& options = {});

    /**
     * @brief Same checks as validate(), attributed to the document that caused each error.
     *
     * A rejected duplicate id is reported on the later document. When duplicates are allowed,
     * definition errors belong to the document that replaced the others in the catalog and the
     * replaced documents report nothing.
     */
    static DocumentErrors validateDocuments(
        const std::vector<nlohmann::json>& documents,
        const ValidationOptions& options = {});

    /**
     * @brief Validates a data value against the main definition of typeId.
     *
     * LexiconNotFound when typeId is not among the documents, InvalidSchema when it has no
     * main definition or that definition is malformed, DataValidation when the data does
     * not conform.
     */
    static ValidationResult validateRecord(
        const std::vector<nlohmann::json>& documents,
        const std::string& typeId,
        const nlohmann::json& record,
        const ValidationOptions& options = {});

    // Parses the documents into a catalog, stopping at the first failure
    static std::expected<std::shared_ptr<const LexiconCatalog>, ValidationError> buildCatalog(
        const std::vector<nlohmann::json>& documents,
        const ValidationOptions& options = {});

    static bool isValidNsid(const std::string& value);
    static std::expected<void, std::string> validateStringFormat(const std::string& value, FormatTag format);

private:
    static ValidationResult validateDefinition(
        const std::string& name, const nlohmann::json& definition, const ValidationContext& ctx);
};

#endif
