#include "fieldValidators.hpp"
#include "../Validation/constraints.hpp"
#include "../Validation/typeDispatcher.hpp"
#include "../Validation/SchemaResolver.hpp"
#include "../Utility/utils.hpp"

#include <algorithm>

using namespace std;

/* ================== Reference helpers ================== */

static string unresolvedMessage(const string& ref, const ValidationError& error) {
    string detail = error.isLexiconNotFound()
        ? "lexicon '" + error.getMessage() + "' not found"
        : error.getMessage();
    return "unresolved reference '" + ref + "': " + detail;
}

ValidationResult validateReferenceSchema(const string& ref, const ValidationContext& ctx) {

    auto parsed = SchemaResolver::parseReference(ref);
    if (!parsed) {
        return unexpected(ctx.schemaError(parsed.error().getMessage()));
    }

    // Isolated schemas (no current lexicon) are only checked for syntax
    if (!ctx.getCurrentDocumentId() || !ctx.hasCatalog()) return {};

    auto resolved = ctx.resolve(ref);
    if (!resolved) {
        return unexpected(ctx.schemaError(unresolvedMessage(ref, resolved.error())));
    }
    return {};
}

ValidationResult validateReferencedData(const nlohmann::json& value, const string& ref, const ValidationContext& ctx) {

    string key = SchemaResolver::canonicalReference(ref, ctx.getCurrentDocumentId());
    if (ctx.hasReference(key)) {
        return unexpected(ctx.dataError("circular reference detected: " + key));
    }

    // Same kind as the resolver reported, located at the referring field
    auto resolved = ctx.resolve(ref);
    if (!resolved) {
        const ValidationError& error = resolved.error();
        return unexpected(error.withMessage(ctx.formatMessage(unresolvedMessage(ref, error))));
    }

    ValidationContext target = ctx
        .withReference(resolved->canonical())
        .withCurrentDocument(resolved->documentId);

    return target.validateData(value, *resolved->schema);
}

/* ================== ObjectValidator ================== */

ValidationResult ObjectValidator::validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const {

    static const vector<string> allowed = {"type", "description", "properties", "required", "nullable"};

    if (auto r = validateAllowedFields(schema, allowed, getTypeName(), ctx); !r) return r;

    nlohmann::json properties = nlohmann::json::object();
    if (schema.contains("properties")) {
        if (!schema["properties"].is_object()) {
            return unexpected(ctx.schemaError("properties must be an object"));
        }
        properties = schema["properties"];
    }

    auto required = getStringList(schema, "required", ctx);
    if (!required) return unexpected(required.error());
    for (const auto& name : *required) {
        if (!properties.contains(name)) {
            return unexpected(ctx.schemaError("required field '" + name + "' is not defined in properties"));
        }
    }

    auto nullable = getStringList(schema, "nullable", ctx);
    if (!nullable) return unexpected(nullable.error());
    for (const auto& name : *nullable) {
        if (!properties.contains(name)) {
            return unexpected(ctx.schemaError("nullable field '" + name + "' is not defined in properties"));
        }
    }

    for (const auto& [name, propertySchema] : properties.items()) {
        auto r = TypeDispatcher::validateSchema(propertySchema, ctx.withPath("properties." + name));
        if (!r) return r;
    }

    return {};
}

ValidationResult ObjectValidator::validateData(
    const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx) const {

    if (!value.is_object()) {
        return unexpected(ctx.dataError("expected object, got " + jsonTypeName(value)));
    }

    auto required = getStringList(schema, "required", ctx);
    if (!required) return unexpected(required.error());
    for (const auto& name : *required) {
        if (!value.contains(name)) {
            return unexpected(ctx.dataError("required field '" + name + "' is missing"));
        }
    }

    if (!schema.contains("properties") || !schema["properties"].is_object()) return {};

    auto nullable = getStringList(schema, "nullable", ctx);
    if (!nullable) return unexpected(nullable.error());

    for (const auto& [name, propertySchema] : schema["properties"].items()) {
        if (!value.contains(name)) continue;

        const auto& field = value[name];
        ValidationContext fieldCtx = ctx.withPath(name);

        if (field.is_null()) {
            if (find(nullable->begin(), nullable->end(), name) != nullable->end()) continue;
            return unexpected(fieldCtx.dataError("cannot be null"));
        }

        if (auto r = fieldCtx.validateData(field, propertySchema); !r) return r;
    }

    return {};
}

/* ================== ArrayValidator ================== */

ValidationResult ArrayValidator::validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const {

    static const vector<string> allowed = {"type", "description", "items", "minLength", "maxLength"};

    if (auto r = validateAllowedFields(schema, allowed, getTypeName(), ctx); !r) return r;

    if (!schema.contains("items")) {
        return unexpected(ctx.schemaError("array is missing required field 'items'"));
    }
    if (auto r = validateLengthRange(schema, "minLength", "maxLength", ctx); !r) return r;

    return TypeDispatcher::validateSchema(schema["items"], ctx.withPath("items"));
}

ValidationResult ArrayValidator::validateData(
    const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx) const {

    if (!value.is_array()) {
        return unexpected(ctx.dataError("expected array, got " + jsonTypeName(value)));
    }

    if (auto r = checkLengthBounds(value.size(), schema, "minLength", "maxLength", "array length", ctx); !r) {
        return r;
    }

    if (!schema.contains("items")) {
        return unexpected(ctx.schemaError("array is missing required field 'items'"));
    }
    const auto& items = schema["items"];

    for (size_t i = 0; i < value.size(); ++i) {
        if (auto r = ctx.withIndex(i).validateData(value[i], items); !r) return r;
    }

    return {};
}

/* ================== UnionValidator ================== */

bool UnionValidator::refMatchesType(const string& ref, const string& dataType) {
    if (ref == dataType) return true;

    if (ref.starts_with("#")) {
        const string name = ref.substr(1);
        return dataType == name || dataType.ends_with(ref);
    }

    // "nsid" and "nsid#main" name the same definition
    if (ref.find('#') == string::npos) {
        return dataType == ref + "#main";
    }
    if (ref.ends_with("#main")) {
        return dataType == ref.substr(0, ref.size() - 5);
    }

    return false;
}

ValidationResult UnionValidator::validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const {

    static const vector<string> allowed = {"type", "description", "refs", "closed"};

    if (auto r = validateAllowedFields(schema, allowed, getTypeName(), ctx); !r) return r;

    if (!schema.contains("refs")) {
        return unexpected(ctx.schemaError("union is missing required field 'refs'"));
    }

    auto refs = getStringList(schema, "refs", ctx);
    if (!refs) return unexpected(refs.error());

    auto closed = getOptionalBool(schema, "closed", ctx);
    if (!closed) return unexpected(closed.error());
    if (closed->value_or(false) && refs->empty()) {
        return unexpected(ctx.schemaError("closed union must have at least one ref"));
    }

    for (const auto& ref : *refs) {
        if (auto r = validateReferenceSchema(ref, ctx); !r) return r;
    }

    return {};
}

ValidationResult UnionValidator::validateData(
    const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx) const {

    if (!value.is_object()) {
        return unexpected(ctx.dataError("expected object for union, got " + jsonTypeName(value)));
    }
    if (!value.contains("$type") || !value["$type"].is_string()) {
        return unexpected(ctx.dataError("union data must have a '$type' string field"));
    }
    const string dataType = value["$type"].get<string>();

    auto refs = getStringList(schema, "refs", ctx);
    if (!refs) return unexpected(refs.error());

    auto closed = getOptionalBool(schema, "closed", ctx);
    if (!closed) return unexpected(closed.error());

    auto match = find_if(refs->begin(), refs->end(), [&](const string& ref) {
        return refMatchesType(ref, dataType);
    });

    if (match == refs->end()) {
        if (refs->empty()) {
            return unexpected(ctx.dataError("union has no refs, '$type' '" + dataType + "' cannot match"));
        }
        if (closed->value_or(false)) {
            return unexpected(ctx.dataError(
                "'$type' '" + dataType + "' is not one of the allowed refs: " + joinStrings(*refs, ", ")));
        }
        return {};
    }

    // Without a catalog only the "$type" match is checked
    if (!ctx.hasCatalog()) return {};

    return validateReferencedData(value, *match, ctx);
}

/* ================== RefValidator ================== */

ValidationResult RefValidator::validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const {

    if (auto r = validateAllowedFields(schema, {"type", "description", "ref"}, getTypeName(), ctx); !r) return r;

    if (!schema.contains("ref")) {
        return unexpected(ctx.schemaError("ref is missing required field 'ref'"));
    }
    if (!schema["ref"].is_string()) {
        return unexpected(ctx.schemaError("ref must be a string"));
    }

    return validateReferenceSchema(schema["ref"].get<string>(), ctx);
}

ValidationResult RefValidator::validateData(
    const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx) const {

    if (!schema.contains("ref") || !schema["ref"].is_string()) {
        return unexpected(ctx.schemaError("ref must be a string"));
    }

    return validateReferencedData(value, schema["ref"].get<string>(), ctx);
}
