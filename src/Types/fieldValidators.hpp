#ifndef FIELD_VALIDATORS_HPP
#define FIELD_VALIDATORS_HPP

#include "typeValidator.hpp"

#include <string>
#include <nlohmann/json.hpp>

/* =============== ObjectValidator =============== */

/**
 * @brief Object schemas: properties, required and nullable.
 *
 * Data keys that are not declared in properties are accepted.
 */
class ObjectValidator : public TypeValidator {
public:
    std::string getTypeName() const override { return "object"; }

    ValidationResult validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const override;
    ValidationResult validateData(
        const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx) const override;
};

/* =============== ArrayValidator =============== */

class ArrayValidator : public TypeValidator {
public:
    std::string getTypeName() const override { return "array"; }

    ValidationResult validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const override;
    ValidationResult validateData(
        const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx) const override;
};

/* =============== UnionValidator =============== */

class UnionValidator : public TypeValidator {
public:
    std::string getTypeName() const override { return "union"; }

    ValidationResult validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const override;
    ValidationResult validateData(
        const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx) const override;

    /**
     * @brief Whether a union ref accepts a data "$type".
     *
     * "#post" matches "post" and any "<nsid>#post"; a ref without a fragment matches
     * "<ref>#main", and a ref ending in "#main" matches the bare NSID.
     */
    static bool refMatchesType(const std::string& ref, const std::string& dataType);
};

/* =============== RefValidator =============== */

class RefValidator : public TypeValidator {
public:
    std::string getTypeName() const override { return "ref"; }

    ValidationResult validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const override;
    ValidationResult validateData(
        const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx) const override;
};

// Follows ref through the catalog and validates value against its target. A ref already on
// the context's reference stack fails with "circular reference detected".
ValidationResult validateReferencedData(
    const nlohmann::json& value, const std::string& ref, const ValidationContext& ctx);

// Schema-time check of one reference: syntax always, resolution when a current document is set
ValidationResult validateReferenceSchema(const std::string& ref, const ValidationContext& ctx);

#endif
