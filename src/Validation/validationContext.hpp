#ifndef VALIDATION_CONTEXT_HPP
#define VALIDATION_CONTEXT_HPP

#include "validationError.hpp"
#include "SchemaResolver.hpp"
#include "../Lexicon/lexiconDocument.hpp"

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <functional>
#include <nlohmann/json.hpp>

class ValidationContext;

// Re-entry point for data validation, injected so that ref and union validators can
// recurse without depending on the dispatcher.
using DataValidatorFn = std::function<ValidationResult(
    const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx)>;

constexpr size_t DEFAULT_MAX_DEPTH = 128;

/**
 * @brief Immutable state threaded through a validation pass.
 *
 * Every with*() method returns a new context; the receiver is never modified, so sibling
 * branches of the traversal cannot observe each other's path or reference stack.
 */
class ValidationContext {
private:
    std::shared_ptr<const LexiconCatalog> catalog;
    std::shared_ptr<const DataValidatorFn> dataValidator;
    std::shared_ptr<const std::vector<std::string>> references;

    std::string path;
    std::optional<std::string> currentDocumentId;
    size_t depth = 0;
    size_t maxDepth = DEFAULT_MAX_DEPTH;

public:
    ValidationContext(
        std::shared_ptr<const LexiconCatalog> catalog,
        DataValidatorFn dataValidator,
        size_t maxDepth = DEFAULT_MAX_DEPTH);

    // Path extension: "a" + "b" -> "a.b"
    ValidationContext withPath(const std::string& segment) const;
    // Array element: "a" + 3 -> "a[3]"
    ValidationContext withIndex(size_t index) const;
    ValidationContext withCurrentDocument(const std::string& documentId) const;
    ValidationContext withReference(const std::string& ref) const;

    bool hasReference(const std::string& ref) const;

    std::expected<ResolvedReference, ValidationError> resolve(const std::string& ref) const;

    // Calls the injected data validator with this context
    ValidationResult validateData(const nlohmann::json& value, const nlohmann::json& schema) const;

    // "path: detail", or just detail at the root
    std::string formatMessage(const std::string& detail) const;

    ValidationError schemaError(const std::string& detail) const;
    ValidationError dataError(const std::string& detail) const;

    bool hasCatalog() const { return catalog != nullptr; }
    const std::string& getPath() const { return path; }
    const std::optional<std::string>& getCurrentDocumentId() const { return currentDocumentId; }
    const std::vector<std::string>& getReferences() const { return *references; }
    size_t getDepth() const { return depth; }
    size_t getMaxDepth() const { return maxDepth; }
    bool depthExceeded() const { return depth > maxDepth; }
};

#endif
