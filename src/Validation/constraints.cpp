#include "constraints.hpp"

#include <algorithm>
#include <limits>

using namespace std;

ValidationResult validateAllowedFields(
    const nlohmann::json& schema,
    const vector<string>& allowedFields,
    const string& typeName,
    const ValidationContext& ctx) {

    for (const auto& [key, value] : schema.items()) {
        if (find(allowedFields.begin(), allowedFields.end(), key) == allowedFields.end()) {
            return unexpected(ctx.schemaError(typeName + " has unsupported field '" + key + "'"));
        }
    }
    return {};
}

expected<optional<int64_t>, ValidationError> getOptionalInteger(
    const nlohmann::json& schema, const string& field, const ValidationContext& ctx) {

    if (!schema.contains(field)) return optional<int64_t>{};

    const auto& value = schema[field];
    if (!value.is_number_integer()) {
        return unexpected(ctx.schemaError(field + " must be an integer"));
    }
    if (value.is_number_unsigned() && value.get<uint64_t>() > static_cast<uint64_t>(numeric_limits<int64_t>::max())) {
        return unexpected(ctx.schemaError(field + " is out of range"));
    }
    return optional<int64_t>{value.get<int64_t>()};
}

expected<optional<string>, ValidationError> getOptionalString(
    const nlohmann::json& schema, const string& field, const ValidationContext& ctx) {

    if (!schema.contains(field)) return optional<string>{};

    const auto& value = schema[field];
    if (!value.is_string()) {
        return unexpected(ctx.schemaError(field + " must be a string"));
    }
    return optional<string>{value.get<string>()};
}

expected<optional<bool>, ValidationError> getOptionalBool(
    const nlohmann::json& schema, const string& field, const ValidationContext& ctx) {

    if (!schema.contains(field)) return optional<bool>{};

    const auto& value = schema[field];
    if (!value.is_boolean()) {
        return unexpected(ctx.schemaError(field + " must be a boolean"));
    }
    return optional<bool>{value.get<bool>()};
}

expected<vector<string>, ValidationError> getStringList(
    const nlohmann::json& schema, const string& field, const ValidationContext& ctx) {

    vector<string> result;
    if (!schema.contains(field)) return result;

    const auto& value = schema[field];
    if (!value.is_array()) {
        return unexpected(ctx.schemaError(field + " must be an array"));
    }

    for (const auto& item : value) {
        if (!item.is_string()) {
            return unexpected(ctx.schemaError(field + " must only contain strings"));
        }
        result.push_back(item.get<string>());
    }
    return result;
}

ValidationResult validateLengthRange(
    const nlohmann::json& schema,
    const string& minField,
    const string& maxField,
    const ValidationContext& ctx) {

    auto minValue = getOptionalInteger(schema, minField, ctx);
    if (!minValue) return unexpected(minValue.error());
    auto maxValue = getOptionalInteger(schema, maxField, ctx);
    if (!maxValue) return unexpected(maxValue.error());

    if (*minValue && **minValue < 0) {
        return unexpected(ctx.schemaError(minField + " must be non-negative, got " + to_string(**minValue)));
    }
    if (*maxValue && **maxValue < 0) {
        return unexpected(ctx.schemaError(maxField + " must be non-negative, got " + to_string(**maxValue)));
    }
    if (*minValue && *maxValue && **minValue > **maxValue) {
        return unexpected(ctx.schemaError(
            minField + " (" + to_string(**minValue) + ") cannot be greater than " +
            maxField + " (" + to_string(**maxValue) + ")"));
    }
    return {};
}

ValidationResult validateIntegerRange(
    const nlohmann::json& schema,
    const string& minField,
    const string& maxField,
    const ValidationContext& ctx) {

    auto minValue = getOptionalInteger(schema, minField, ctx);
    if (!minValue) return unexpected(minValue.error());
    auto maxValue = getOptionalInteger(schema, maxField, ctx);
    if (!maxValue) return unexpected(maxValue.error());

    if (*minValue && *maxValue && **minValue > **maxValue) {
        return unexpected(ctx.schemaError(
            minField + " (" + to_string(**minValue) + ") cannot be greater than " +
            maxField + " (" + to_string(**maxValue) + ")"));
    }
    return {};
}

ValidationResult validateConstDefaultExclusive(const nlohmann::json& schema, const ValidationContext& ctx) {
    if (schema.contains("const") && schema.contains("default")) {
        return unexpected(ctx.schemaError("cannot have both 'const' and 'default'"));
    }
    return {};
}

ValidationResult checkLengthBounds(
    size_t actual,
    const nlohmann::json& schema,
    const string& minField,
    const string& maxField,
    const string& subject,
    const ValidationContext& ctx) {

    auto minValue = getOptionalInteger(schema, minField, ctx);
    if (!minValue) return unexpected(minValue.error());
    auto maxValue = getOptionalInteger(schema, maxField, ctx);
    if (!maxValue) return unexpected(maxValue.error());

    if (*minValue && static_cast<int64_t>(actual) < **minValue) {
        return unexpected(ctx.dataError(
            subject + " " + to_string(actual) + " is less than " + minField + " " + to_string(**minValue)));
    }
    if (*maxValue && static_cast<int64_t>(actual) > **maxValue) {
        return unexpected(ctx.dataError(
            subject + " " + to_string(actual) + " exceeds " + maxField + " " + to_string(**maxValue)));
    }
    return {};
}

bool isEnumMember(const nlohmann::json& value, const nlohmann::json& enumValues) {
    if (!enumValues.is_array()) return false;
    return find(enumValues.begin(), enumValues.end(), value) != enumValues.end();
}

string jsonTypeName(const nlohmann::json& value) {
    if (value.is_number_integer()) return "integer";
    return value.type_name();
}
