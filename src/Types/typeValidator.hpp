#ifndef TYPE_VALIDATOR_HPP
#define TYPE_VALIDATOR_HPP

#include "../Validation/validationError.hpp"
#include "../Validation/validationContext.hpp"

#include <string>
#include <nlohmann/json.hpp>

/* =============== TypeValidator =============== */

/**
 * @brief Schema-shape and data checks for one lexicon type.
 *
 * validateSchema() enforces the type's allow-list of fields and the consistency of its
 * constraints. validateData() checks a value against a schema that has already passed
 * validateSchema(), though it still reads constraint fields defensively.
 */
class TypeValidator {
public:
    virtual ~TypeValidator() = default;

    virtual std::string getTypeName() const = 0;

    virtual ValidationResult validateSchema(
        const nlohmann::json& schema, const ValidationContext& ctx) const = 0;

    virtual ValidationResult validateData(
        const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx) const = 0;
};

#endif
