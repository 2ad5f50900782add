#include "typeDispatcher.hpp"
#include "../Types/primitiveValidators.hpp"
#include "../Types/fieldValidators.hpp"
#include "../Types/primaryValidators.hpp"

#include <stdexcept>

using namespace std;

const TypeValidator& TypeDispatcher::validatorFor(SchemaType type) {
    static const StringValidator stringValidator;
    static const IntegerValidator integerValidator;
    static const BooleanValidator booleanValidator;
    static const BytesValidator bytesValidator;
    static const BlobValidator blobValidator;
    static const CidLinkValidator cidLinkValidator;
    static const NullValidator nullValidator;
    static const TokenValidator tokenValidator;
    static const UnknownValidator unknownValidator;
    static const ObjectValidator objectValidator;
    static const ArrayValidator arrayValidator;
    static const UnionValidator unionValidator;
    static const RefValidator refValidator;
    static const RecordValidator recordValidator;
    static const QueryValidator queryValidator;
    static const ProcedureValidator procedureValidator;
    static const SubscriptionValidator subscriptionValidator;
    static const ParamsValidator paramsValidator;

    switch (type) {
        case SchemaType::String:       return stringValidator;
        case SchemaType::Integer:      return integerValidator;
        case SchemaType::Boolean:      return booleanValidator;
        case SchemaType::Bytes:        return bytesValidator;
        case SchemaType::Blob:         return blobValidator;
        case SchemaType::CidLink:      return cidLinkValidator;
        case SchemaType::Null:         return nullValidator;
        case SchemaType::Token:        return tokenValidator;
        case SchemaType::Unknown:      return unknownValidator;
        case SchemaType::Object:       return objectValidator;
        case SchemaType::Array:        return arrayValidator;
        case SchemaType::Union:        return unionValidator;
        case SchemaType::Ref:          return refValidator;
        case SchemaType::Record:       return recordValidator;
        case SchemaType::Query:        return queryValidator;
        case SchemaType::Procedure:    return procedureValidator;
        case SchemaType::Subscription: return subscriptionValidator;
        case SchemaType::Params:       return paramsValidator;
    }
    throw runtime_error("Unhandled SchemaType in TypeDispatcher::validatorFor");
}

expected<SchemaType, ValidationError> TypeDispatcher::schemaTypeOf(
    const nlohmann::json& schema, const ValidationContext& ctx) {

    if (!schema.is_object()) {
        return unexpected(ctx.schemaError("schema must be an object, got " + string(schema.type_name())));
    }
    if (!schema.contains("type")) {
        return unexpected(ctx.schemaError("schema is missing required field 'type'"));
    }
    if (!schema["type"].is_string()) {
        return unexpected(ctx.schemaError("schema 'type' must be a string"));
    }

    const string tag = schema["type"].get<string>();
    auto type = schema_type_from_string(tag);
    if (!type) {
        return unexpected(ctx.schemaError("unknown schema type '" + tag + "'"));
    }
    return *type;
}

ValidationResult TypeDispatcher::validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) {
    if (ctx.depthExceeded()) {
        return unexpected(ctx.schemaError(
            "maximum nesting depth (" + to_string(ctx.getMaxDepth()) + ") exceeded"));
    }

    auto type = schemaTypeOf(schema, ctx);
    if (!type) return unexpected(type.error());

    return validatorFor(*type).validateSchema(schema, ctx);
}

ValidationResult TypeDispatcher::validateData(
    const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx) {

    if (ctx.depthExceeded()) {
        return unexpected(ctx.dataError(
            "maximum nesting depth (" + to_string(ctx.getMaxDepth()) + ") exceeded"));
    }

    auto type = schemaTypeOf(schema, ctx);
    if (!type) return unexpected(type.error());

    return validatorFor(*type).validateData(value, schema, ctx);
}

ValidationContext TypeDispatcher::createContext(shared_ptr<const LexiconCatalog> catalog, size_t maxDepth) {
    return ValidationContext(std::move(catalog), &TypeDispatcher::validateData, maxDepth);
}
