#ifndef CONSTRAINTS_HPP
#define CONSTRAINTS_HPP

#include "validationError.hpp"
#include "validationContext.hpp"

#include <string>
#include <vector>
#include <optional>
#include <expected>
#include <cstdint>
#include <nlohmann/json.hpp>

// Every schema key not in allowedFields is an InvalidSchema error
ValidationResult validateAllowedFields(
    const nlohmann::json& schema,
    const std::vector<std::string>& allowedFields,
    const std::string& typeName,
    const ValidationContext& ctx);

// Typed accessors for optional schema fields. A present field of the wrong JSON type is InvalidSchema.
std::expected<std::optional<int64_t>, ValidationError> getOptionalInteger(
    const nlohmann::json& schema, const std::string& field, const ValidationContext& ctx);

std::expected<std::optional<std::string>, ValidationError> getOptionalString(
    const nlohmann::json& schema, const std::string& field, const ValidationContext& ctx);

std::expected<std::optional<bool>, ValidationError> getOptionalBool(
    const nlohmann::json& schema, const std::string& field, const ValidationContext& ctx);

// Empty when the field is absent
std::expected<std::vector<std::string>, ValidationError> getStringList(
    const nlohmann::json& schema, const std::string& field, const ValidationContext& ctx);

// Both bounds non-negative integers and min <= max when both are set
ValidationResult validateLengthRange(
    const nlohmann::json& schema,
    const std::string& minField,
    const std::string& maxField,
    const ValidationContext& ctx);

// Both bounds integers and min <= max when both are set
ValidationResult validateIntegerRange(
    const nlohmann::json& schema,
    const std::string& minField,
    const std::string& maxField,
    const ValidationContext& ctx);

ValidationResult validateConstDefaultExclusive(const nlohmann::json& schema, const ValidationContext& ctx);

// Data-time bound check: "<subject> <actual> is less than <minField> <min>" and the like
ValidationResult checkLengthBounds(
    size_t actual,
    const nlohmann::json& schema,
    const std::string& minField,
    const std::string& maxField,
    const std::string& subject,
    const ValidationContext& ctx);

bool isEnumMember(const nlohmann::json& value, const nlohmann::json& enumValues);

std::string jsonTypeName(const nlohmann::json& value);

#endif
