#include "primitiveValidators.hpp"
#include "../Validation/constraints.hpp"
#include "../Utility/formats.hpp"
#include "../Utility/utils.hpp"
#include "../Utility/cid.hpp"

#include <algorithm>
#include <limits>

using namespace std;

/* ================== StringValidator ================== */

ValidationResult StringValidator::validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const {

    static const vector<string> allowed = {
        "type", "description", "format", "maxLength", "minLength",
        "maxGraphemes", "minGraphemes", "knownValues", "enum", "const", "default"
    };

    if (auto r = validateAllowedFields(schema, allowed, getTypeName(), ctx); !r) return r;
    if (auto r = validateLengthRange(schema, "minLength", "maxLength", ctx); !r) return r;
    if (auto r = validateLengthRange(schema, "minGraphemes", "maxGraphemes", ctx); !r) return r;

    auto format = getOptionalString(schema, "format", ctx);
    if (!format) return unexpected(format.error());
    if (*format && !format_tag_from_string(**format)) {
        return unexpected(ctx.schemaError("unknown string format '" + **format + "'"));
    }

    if (auto values = getStringList(schema, "enum", ctx); !values) return unexpected(values.error());
    if (auto values = getStringList(schema, "knownValues", ctx); !values) return unexpected(values.error());

    if (auto constValue = getOptionalString(schema, "const", ctx); !constValue) return unexpected(constValue.error());
    if (auto defaultValue = getOptionalString(schema, "default", ctx); !defaultValue) return unexpected(defaultValue.error());

    return validateConstDefaultExclusive(schema, ctx);
}

ValidationResult StringValidator::validateData(
    const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx) const {

    if (!value.is_string()) {
        return unexpected(ctx.dataError("expected string, got " + jsonTypeName(value)));
    }

    const string str = value.get<string>();

    auto constValue = getOptionalString(schema, "const", ctx);
    if (!constValue) return unexpected(constValue.error());
    if (*constValue && str != **constValue) {
        return unexpected(ctx.dataError("value '" + str + "' does not match const '" + **constValue + "'"));
    }

    if (auto r = checkLengthBounds(str.size(), schema, "minLength", "maxLength", "string length", ctx); !r) return r;

    if (schema.contains("minGraphemes") || schema.contains("maxGraphemes")) {
        size_t graphemes = countGraphemes(str);
        if (auto r = checkLengthBounds(graphemes, schema, "minGraphemes", "maxGraphemes", "grapheme count", ctx); !r) {
            return r;
        }
    }

    auto format = getOptionalString(schema, "format", ctx);
    if (!format) return unexpected(format.error());
    if (*format) {
        auto tag = format_tag_from_string(**format);
        if (!tag) {
            return unexpected(ctx.schemaError("unknown string format '" + **format + "'"));
        }
        auto formatResult = validateStringFormat(str, *tag);
        if (!formatResult) {
            return unexpected(ctx.dataError(formatResult.error()));
        }
    }

    if (schema.contains("enum") && !isEnumMember(value, schema["enum"])) {
        return unexpected(ctx.dataError("value '" + str + "' is not one of the allowed values " + schema["enum"].dump()));
    }

    return {};
}

/* ================== IntegerValidator ================== */

ValidationResult IntegerValidator::validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const {

    static const vector<string> allowed = {
        "type", "description", "minimum", "maximum", "enum", "const", "default"
    };

    if (auto r = validateAllowedFields(schema, allowed, getTypeName(), ctx); !r) return r;
    if (auto r = validateIntegerRange(schema, "minimum", "maximum", ctx); !r) return r;

    if (schema.contains("enum")) {
        const auto& values = schema["enum"];
        if (!values.is_array()) {
            return unexpected(ctx.schemaError("enum must be an array"));
        }
        for (const auto& item : values) {
            if (!item.is_number_integer()) {
                return unexpected(ctx.schemaError("enum must only contain integers"));
            }
        }
    }

    if (auto constValue = getOptionalInteger(schema, "const", ctx); !constValue) return unexpected(constValue.error());
    if (auto defaultValue = getOptionalInteger(schema, "default", ctx); !defaultValue) return unexpected(defaultValue.error());

    return validateConstDefaultExclusive(schema, ctx);
}

ValidationResult IntegerValidator::validateData(
    const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx) const {

    if (!value.is_number_integer()) {
        return unexpected(ctx.dataError("expected integer, got " + jsonTypeName(value)));
    }
    if (value.is_number_unsigned() && value.get<uint64_t>() > static_cast<uint64_t>(numeric_limits<int64_t>::max())) {
        return unexpected(ctx.dataError("integer " + value.dump() + " is out of range"));
    }

    const int64_t number = value.get<int64_t>();

    // const is reported ahead of range and enum problems
    auto constValue = getOptionalInteger(schema, "const", ctx);
    if (!constValue) return unexpected(constValue.error());
    if (*constValue && number != **constValue) {
        return unexpected(ctx.dataError(
            "value " + to_string(number) + " does not match const " + to_string(**constValue)));
    }

    auto minimum = getOptionalInteger(schema, "minimum", ctx);
    if (!minimum) return unexpected(minimum.error());
    if (*minimum && number < **minimum) {
        return unexpected(ctx.dataError(
            "value " + to_string(number) + " is less than minimum " + to_string(**minimum)));
    }

    auto maximum = getOptionalInteger(schema, "maximum", ctx);
    if (!maximum) return unexpected(maximum.error());
    if (*maximum && number > **maximum) {
        return unexpected(ctx.dataError(
            "value " + to_string(number) + " exceeds maximum " + to_string(**maximum)));
    }

    if (schema.contains("enum") && !isEnumMember(value, schema["enum"])) {
        return unexpected(ctx.dataError(
            "value " + to_string(number) + " is not one of the allowed values " + schema["enum"].dump()));
    }

    return {};
}

/* ================== BooleanValidator ================== */

ValidationResult BooleanValidator::validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const {

    static const vector<string> allowed = {"type", "description", "const", "default"};

    if (auto r = validateAllowedFields(schema, allowed, getTypeName(), ctx); !r) return r;

    if (auto constValue = getOptionalBool(schema, "const", ctx); !constValue) return unexpected(constValue.error());
    if (auto defaultValue = getOptionalBool(schema, "default", ctx); !defaultValue) return unexpected(defaultValue.error());

    return validateConstDefaultExclusive(schema, ctx);
}

ValidationResult BooleanValidator::validateData(
    const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx) const {

    if (!value.is_boolean()) {
        return unexpected(ctx.dataError("expected boolean, got " + jsonTypeName(value)));
    }

    auto constValue = getOptionalBool(schema, "const", ctx);
    if (!constValue) return unexpected(constValue.error());
    if (*constValue && value.get<bool>() != **constValue) {
        return unexpected(ctx.dataError(
            "value " + value.dump() + " does not match const " + string(**constValue ? "true" : "false")));
    }

    return {};
}

/* ================== NullValidator ================== */

ValidationResult NullValidator::validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const {
    return validateAllowedFields(schema, {"type", "description"}, getTypeName(), ctx);
}

ValidationResult NullValidator::validateData(
    const nlohmann::json& value, const nlohmann::json&, const ValidationContext& ctx) const {

    if (!value.is_null()) {
        return unexpected(ctx.dataError("expected null, got " + jsonTypeName(value)));
    }
    return {};
}

/* ================== BytesValidator ================== */

ValidationResult BytesValidator::validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const {

    static const vector<string> allowed = {"type", "description", "minLength", "maxLength"};

    if (auto r = validateAllowedFields(schema, allowed, getTypeName(), ctx); !r) return r;
    return validateLengthRange(schema, "minLength", "maxLength", ctx);
}

ValidationResult BytesValidator::validateData(
    const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx) const {

    if (!value.is_object() || value.size() != 1 || !value.contains("$bytes")) {
        return unexpected(ctx.dataError("bytes must be an object with a single '$bytes' field"));
    }

    const auto& encoded = value["$bytes"];
    if (!encoded.is_string()) {
        return unexpected(ctx.dataError("'$bytes' must be a base64 string"));
    }

    auto decoded = decodeBase64(encoded.get<string>());
    if (!decoded) {
        return unexpected(ctx.dataError("'$bytes' is not valid base64"));
    }

    return checkLengthBounds(decoded->size(), schema, "minLength", "maxLength", "byte length", ctx);
}

/* ================== BlobValidator ================== */

bool BlobValidator::isValidAcceptPattern(const string& pattern) {
    if (pattern == "*/*") return true;

    size_t slash = pattern.find('/');
    if (slash == string::npos || slash == 0 || slash + 1 >= pattern.size()) return false;
    if (pattern.find('/', slash + 1) != string::npos) return false;

    string type = pattern.substr(0, slash);
    string subtype = pattern.substr(slash + 1);

    // A wildcard must be a whole segment, and only the subtype may be one
    if (type.find('*') != string::npos) return false;
    if (subtype.find('*') != string::npos && subtype != "*") return false;

    return true;
}

bool BlobValidator::mimeTypeMatches(const string& mimeType, const string& pattern) {
    if (pattern == "*/*") return true;

    if (pattern.ends_with("/*")) {
        string prefix = pattern.substr(0, pattern.size() - 1);
        return mimeType.starts_with(prefix) && mimeType.size() > prefix.size();
    }

    return mimeType == pattern;
}

ValidationResult BlobValidator::validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const {

    static const vector<string> allowed = {"type", "description", "accept", "maxSize"};

    if (auto r = validateAllowedFields(schema, allowed, getTypeName(), ctx); !r) return r;

    auto accept = getStringList(schema, "accept", ctx);
    if (!accept) return unexpected(accept.error());
    for (const auto& pattern : *accept) {
        if (!isValidAcceptPattern(pattern)) {
            return unexpected(ctx.schemaError("invalid accept pattern '" + pattern + "'"));
        }
    }

    auto maxSize = getOptionalInteger(schema, "maxSize", ctx);
    if (!maxSize) return unexpected(maxSize.error());
    if (*maxSize && **maxSize <= 0) {
        return unexpected(ctx.schemaError("maxSize must be greater than 0, got " + to_string(**maxSize)));
    }

    return {};
}

ValidationResult BlobValidator::validateData(
    const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx) const {

    static const vector<string> blobFields = {"$type", "ref", "mimeType", "size"};

    if (!value.is_object()) {
        return unexpected(ctx.dataError("expected blob object, got " + jsonTypeName(value)));
    }

    for (const auto& [key, field] : value.items()) {
        if (find(blobFields.begin(), blobFields.end(), key) == blobFields.end()) {
            return unexpected(ctx.dataError("blob has unexpected field '" + key + "'"));
        }
    }

    if (!value.contains("$type") || value["$type"] != "blob") {
        return unexpected(ctx.dataError("blob must have '$type' set to 'blob'"));
    }

    if (!value.contains("ref") || !value["ref"].is_object() || value["ref"].size() != 1 ||
        !value["ref"].contains("$link") || !value["ref"]["$link"].is_string()) {
        return unexpected(ctx.dataError("blob 'ref' must be an object with a single '$link' string"));
    }
    const string link = value["ref"]["$link"].get<string>();
    if (!isValidRawCid(link)) {
        return unexpected(ctx.dataError("blob ref '" + link + "' is not a valid raw CID"));
    }

    if (!value.contains("mimeType") || !value["mimeType"].is_string() || value["mimeType"].get<string>().empty()) {
        return unexpected(ctx.dataError("blob 'mimeType' must be a non-empty string"));
    }
    const string mimeType = value["mimeType"].get<string>();

    if (!value.contains("size") || !value["size"].is_number_integer() ||
        (!value["size"].is_number_unsigned() && value["size"].get<int64_t>() < 0)) {
        return unexpected(ctx.dataError("blob 'size' must be a non-negative integer"));
    }
    const uint64_t size = value["size"].get<uint64_t>();

    auto accept = getStringList(schema, "accept", ctx);
    if (!accept) return unexpected(accept.error());
    if (!accept->empty()) {
        bool accepted = any_of(accept->begin(), accept->end(), [&](const string& pattern) {
            return mimeTypeMatches(mimeType, pattern);
        });
        if (!accepted) {
            return unexpected(ctx.dataError(
                "mime type '" + mimeType + "' is not accepted (allowed: " + joinStrings(*accept, ", ") + ")"));
        }
    }

    auto maxSize = getOptionalInteger(schema, "maxSize", ctx);
    if (!maxSize) return unexpected(maxSize.error());
    if (*maxSize && size > static_cast<uint64_t>(**maxSize)) {
        return unexpected(ctx.dataError(
            "blob size " + to_string(size) + " exceeds maxSize " + to_string(**maxSize)));
    }

    return {};
}

/* ================== CidLinkValidator ================== */

ValidationResult CidLinkValidator::validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const {
    return validateAllowedFields(schema, {"type", "description"}, getTypeName(), ctx);
}

ValidationResult CidLinkValidator::validateData(
    const nlohmann::json& value, const nlohmann::json&, const ValidationContext& ctx) const {

    if (!value.is_object() || value.size() != 1 || !value.contains("$link") || !value["$link"].is_string()) {
        return unexpected(ctx.dataError("cid-link must be an object with a single '$link' string"));
    }

    const string link = value["$link"].get<string>();
    if (!isValidCid(link)) {
        return unexpected(ctx.dataError("'" + link + "' is not a valid CID"));
    }
    return {};
}

/* ================== TokenValidator ================== */

ValidationResult TokenValidator::validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const {
    return validateAllowedFields(schema, {"type", "description"}, getTypeName(), ctx);
}

ValidationResult TokenValidator::validateData(
    const nlohmann::json& value, const nlohmann::json&, const ValidationContext& ctx) const {

    if (!value.is_string()) {
        return unexpected(ctx.dataError("expected token string, got " + jsonTypeName(value)));
    }
    if (value.get<string>().empty()) {
        return unexpected(ctx.dataError("token cannot be empty"));
    }
    return {};
}

/* ================== UnknownValidator ================== */

ValidationResult UnknownValidator::validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const {
    return validateAllowedFields(schema, {"type", "description"}, getTypeName(), ctx);
}

ValidationResult UnknownValidator::validateData(
    const nlohmann::json& value, const nlohmann::json&, const ValidationContext& ctx) const {

    if (!value.is_object()) {
        return unexpected(ctx.dataError("unknown type data must be an object, got " + jsonTypeName(value)));
    }
    if (value.contains("$bytes")) {
        return unexpected(ctx.dataError("unknown type data cannot be a bytes object"));
    }
    if (value.contains("$type") && value["$type"] == "blob") {
        return unexpected(ctx.dataError("unknown type data cannot be a blob"));
    }
    return {};
}
