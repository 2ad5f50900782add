#ifndef PRIMARY_VALIDATORS_HPP
#define PRIMARY_VALIDATORS_HPP

#include "typeValidator.hpp"

#include <string>
#include <nlohmann/json.hpp>

/* =============== RecordValidator =============== */

// Record data is validated against the wrapped "record" object schema
class RecordValidator : public TypeValidator {
public:
    std::string getTypeName() const override { return "record"; }

    ValidationResult validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const override;
    ValidationResult validateData(
        const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx) const override;

    // "tid", "any", "nsid" or "literal:<value>"
    static bool isValidRecordKeyType(const std::string& key);
};

/* =============== ParamsValidator =============== */

/**
 * @brief HTTP query parameters.
 *
 * Properties are limited to boolean, integer, string and unknown, or arrays of those.
 */
class ParamsValidator : public TypeValidator {
public:
    std::string getTypeName() const override { return "params"; }

    ValidationResult validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const override;
    ValidationResult validateData(
        const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx) const override;
};

/* =============== QueryValidator =============== */

class QueryValidator : public TypeValidator {
public:
    std::string getTypeName() const override { return "query"; }

    ValidationResult validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const override;
    // value holds the query parameters
    ValidationResult validateData(
        const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx) const override;
};

/* =============== ProcedureValidator =============== */

class ProcedureValidator : public TypeValidator {
public:
    std::string getTypeName() const override { return "procedure"; }

    ValidationResult validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const override;
    // value holds the input body
    ValidationResult validateData(
        const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx) const override;
};

/* =============== SubscriptionValidator =============== */

class SubscriptionValidator : public TypeValidator {
public:
    std::string getTypeName() const override { return "subscription"; }

    ValidationResult validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const override;
    // value holds the connection parameters
    ValidationResult validateData(
        const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx) const override;
};

#endif
