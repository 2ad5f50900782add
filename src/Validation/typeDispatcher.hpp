#ifndef TYPE_DISPATCHER_HPP
#define TYPE_DISPATCHER_HPP

#include "validationError.hpp"
#include "validationContext.hpp"
#include "../Lexicon/schemaType.hpp"
#include "../Lexicon/lexiconDocument.hpp"
#include "../Types/typeValidator.hpp"

#include <memory>
#include <expected>
#include <nlohmann/json.hpp>

/**
 * @brief Routes a schema node to the validator for its "type" tag.
 *
 * Both passes check the context's depth ceiling before dispatching.
 */
class TypeDispatcher {
public:
    static const TypeValidator& validatorFor(SchemaType type);

    // Missing, non-string or unrecognised "type" is InvalidSchema
    static std::expected<SchemaType, ValidationError> schemaTypeOf(
        const nlohmann::json& schema, const ValidationContext& ctx);

    static ValidationResult validateSchema(const nlohmann::json& schema, const ValidationContext& ctx);

    static ValidationResult validateData(
        const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx);

    // Context whose injected data validator is TypeDispatcher::validateData
    static ValidationContext createContext(
        std::shared_ptr<const LexiconCatalog> catalog = nullptr,
        size_t maxDepth = DEFAULT_MAX_DEPTH);
};

#endif
