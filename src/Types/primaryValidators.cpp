#include "primaryValidators.hpp"
#include "fieldValidators.hpp"
#include "../Validation/constraints.hpp"
#include "../Validation/typeDispatcher.hpp"

#include <algorithm>

using namespace std;

namespace {

const vector<string> PARAM_LEAF_TYPES = {"boolean", "integer", "string", "unknown"};

bool isParamLeafType(const string& type) {
    return find(PARAM_LEAF_TYPES.begin(), PARAM_LEAF_TYPES.end(), type) != PARAM_LEAF_TYPES.end();
}

string typeOf(const nlohmann::json& schema) {
    if (!schema.is_object() || !schema.contains("type") || !schema["type"].is_string()) return "";
    return schema["type"].get<string>();
}

ValidationResult validateParameters(const nlohmann::json& schema, const ValidationContext& ctx) {
    if (!schema.contains("parameters")) return {};

    const auto& parameters = schema["parameters"];
    ValidationContext paramsCtx = ctx.withPath("parameters");
    if (typeOf(parameters) != "params") {
        return unexpected(paramsCtx.schemaError("parameters must be a params schema"));
    }
    return TypeDispatcher::validateSchema(parameters, paramsCtx);
}

ValidationResult validateErrors(const nlohmann::json& schema, const ValidationContext& ctx) {
    if (schema.contains("errors") && !schema["errors"].is_array()) {
        return unexpected(ctx.schemaError("errors must be an array"));
    }
    return {};
}

// input and output bodies: { encoding, schema?, description? }
ValidationResult validateBody(const nlohmann::json& schema, const string& field, const ValidationContext& ctx) {
    if (!schema.contains(field)) return {};

    const auto& body = schema[field];
    ValidationContext bodyCtx = ctx.withPath(field);

    if (!body.is_object()) {
        return unexpected(bodyCtx.schemaError(field + " must be an object"));
    }
    if (auto r = validateAllowedFields(body, {"description", "encoding", "schema"}, field, bodyCtx); !r) return r;

    if (!body.contains("encoding")) {
        return unexpected(bodyCtx.schemaError(field + " is missing required field 'encoding'"));
    }
    if (!body["encoding"].is_string() || body["encoding"].get<string>().empty()) {
        return unexpected(bodyCtx.schemaError("encoding must be a non-empty string"));
    }

    if (!body.contains("schema")) return {};

    const auto& bodySchema = body["schema"];
    string type = typeOf(bodySchema);
    if (type != "object" && type != "ref" && type != "union") {
        return unexpected(bodyCtx.schemaError(field + " schema must be an object, ref or union"));
    }
    return TypeDispatcher::validateSchema(bodySchema, bodyCtx.withPath("schema"));
}

ValidationResult validateMessage(const nlohmann::json& schema, const ValidationContext& ctx) {
    if (!schema.contains("message")) return {};

    const auto& message = schema["message"];
    ValidationContext messageCtx = ctx.withPath("message");

    if (!message.is_object()) {
        return unexpected(messageCtx.schemaError("message must be an object"));
    }
    if (auto r = validateAllowedFields(message, {"description", "schema"}, "message", messageCtx); !r) return r;

    if (!message.contains("schema")) {
        return unexpected(messageCtx.schemaError("message is missing required field 'schema'"));
    }
    if (typeOf(message["schema"]) != "union") {
        return unexpected(messageCtx.schemaError("message schema must be a union"));
    }
    return TypeDispatcher::validateSchema(message["schema"], messageCtx.withPath("schema"));
}

} // namespace

/* ================== RecordValidator ================== */

bool RecordValidator::isValidRecordKeyType(const string& key) {
    if (key == "tid" || key == "any" || key == "nsid") return true;
    return key.starts_with("literal:") && key.size() > 8;
}

ValidationResult RecordValidator::validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const {

    if (auto r = validateAllowedFields(schema, {"type", "description", "key", "record"}, getTypeName(), ctx); !r) return r;

    if (!schema.contains("key")) {
        return unexpected(ctx.schemaError("record is missing required field 'key'"));
    }
    if (!schema["key"].is_string() || !isValidRecordKeyType(schema["key"].get<string>())) {
        return unexpected(ctx.schemaError(
            "invalid record key type " + schema["key"].dump() + " (expected tid, any, nsid or literal:<value>)"));
    }

    if (!schema.contains("record")) {
        return unexpected(ctx.schemaError("record is missing required field 'record'"));
    }

    ValidationContext recordCtx = ctx.withPath("record");
    if (typeOf(schema["record"]) != "object") {
        return unexpected(recordCtx.schemaError("record must be an object schema"));
    }
    return TypeDispatcher::validateSchema(schema["record"], recordCtx);
}

ValidationResult RecordValidator::validateData(
    const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx) const {

    if (!schema.contains("record") || typeOf(schema["record"]) != "object") {
        return unexpected(ctx.schemaError("record must be an object schema"));
    }
    return ObjectValidator().validateData(value, schema["record"], ctx);
}

/* ================== ParamsValidator ================== */

ValidationResult ParamsValidator::validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const {

    if (auto r = validateAllowedFields(schema, {"type", "description", "properties", "required"}, getTypeName(), ctx); !r) {
        return r;
    }

    nlohmann::json properties = nlohmann::json::object();
    if (schema.contains("properties")) {
        if (!schema["properties"].is_object()) {
            return unexpected(ctx.schemaError("properties must be an object"));
        }
        properties = schema["properties"];
    }

    for (const auto& [name, property] : properties.items()) {
        if (name.empty()) {
            return unexpected(ctx.schemaError("params property names cannot be empty"));
        }

        ValidationContext propertyCtx = ctx.withPath("properties." + name);
        string type = typeOf(property);

        if (type == "array") {
            if (!property.contains("items") || !isParamLeafType(typeOf(property["items"]))) {
                return unexpected(propertyCtx.schemaError(
                    "params array items must be boolean, integer, string or unknown"));
            }
        } else if (!isParamLeafType(type)) {
            return unexpected(propertyCtx.schemaError(
                "params property has unsupported type '" + type + "'"));
        }

        if (auto r = TypeDispatcher::validateSchema(property, propertyCtx); !r) return r;
    }

    auto required = getStringList(schema, "required", ctx);
    if (!required) return unexpected(required.error());
    for (const auto& name : *required) {
        if (!properties.contains(name)) {
            return unexpected(ctx.schemaError("required field '" + name + "' is not defined in properties"));
        }
    }

    return {};
}

ValidationResult ParamsValidator::validateData(
    const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx) const {
    // Same rules as an object without nullable fields
    return ObjectValidator().validateData(value, schema, ctx);
}

/* ================== QueryValidator ================== */

ValidationResult QueryValidator::validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const {

    static const vector<string> allowed = {"type", "description", "parameters", "output", "errors"};

    if (auto r = validateAllowedFields(schema, allowed, getTypeName(), ctx); !r) return r;
    if (auto r = validateParameters(schema, ctx); !r) return r;
    if (auto r = validateBody(schema, "output", ctx); !r) return r;
    return validateErrors(schema, ctx);
}

ValidationResult QueryValidator::validateData(
    const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx) const {

    if (!schema.contains("parameters")) return {};
    return ctx.validateData(value, schema["parameters"]);
}

/* ================== ProcedureValidator ================== */

ValidationResult ProcedureValidator::validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const {

    static const vector<string> allowed = {"type", "description", "parameters", "input", "output", "errors"};

    if (auto r = validateAllowedFields(schema, allowed, getTypeName(), ctx); !r) return r;
    if (auto r = validateParameters(schema, ctx); !r) return r;
    if (auto r = validateBody(schema, "input", ctx); !r) return r;
    if (auto r = validateBody(schema, "output", ctx); !r) return r;
    return validateErrors(schema, ctx);
}

ValidationResult ProcedureValidator::validateData(
    const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx) const {

    if (!schema.contains("input") || !schema["input"].is_object() || !schema["input"].contains("schema")) {
        return {};
    }
    return ctx.validateData(value, schema["input"]["schema"]);
}

/* ================== SubscriptionValidator ================== */

ValidationResult SubscriptionValidator::validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const {

    static const vector<string> allowed = {"type", "description", "parameters", "message", "errors"};

    if (auto r = validateAllowedFields(schema, allowed, getTypeName(), ctx); !r) return r;
    if (auto r = validateParameters(schema, ctx); !r) return r;
    if (auto r = validateMessage(schema, ctx); !r) return r;
    return validateErrors(schema, ctx);
}

ValidationResult SubscriptionValidator::validateData(
    const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx) const {

    if (!schema.contains("parameters")) return {};
    return ctx.validateData(value, schema["parameters"]);
}
