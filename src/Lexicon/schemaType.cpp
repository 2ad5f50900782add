#include "schemaType.hpp"

using namespace std;

string schema_type_to_string(SchemaType type) {
    switch (type) {
        case SchemaType::String:       return "string";
        case SchemaType::Integer:      return "integer";
        case SchemaType::Boolean:      return "boolean";
        case SchemaType::Bytes:        return "bytes";
        case SchemaType::Blob:         return "blob";
        case SchemaType::CidLink:      return "cid-link";
        case SchemaType::Null:         return "null";
        case SchemaType::Token:        return "token";
        case SchemaType::Unknown:      return "unknown";
        case SchemaType::Object:       return "object";
        case SchemaType::Array:        return "array";
        case SchemaType::Union:        return "union";
        case SchemaType::Ref:          return "ref";
        case SchemaType::Record:       return "record";
        case SchemaType::Query:        return "query";
        case SchemaType::Procedure:    return "procedure";
        case SchemaType::Subscription: return "subscription";
        case SchemaType::Params:       return "params";
    }
    return "unknown";
}

optional<SchemaType> schema_type_from_string(const string& str) {
    if (str == "string")       return SchemaType::String;
    if (str == "integer")      return SchemaType::Integer;
    if (str == "boolean")      return SchemaType::Boolean;
    if (str == "bytes")        return SchemaType::Bytes;
    if (str == "blob")         return SchemaType::Blob;
    if (str == "cid-link")     return SchemaType::CidLink;
    if (str == "null")         return SchemaType::Null;
    if (str == "token")        return SchemaType::Token;
    if (str == "unknown")      return SchemaType::Unknown;
    if (str == "object")       return SchemaType::Object;
    if (str == "array")        return SchemaType::Array;
    if (str == "union")        return SchemaType::Union;
    if (str == "ref")          return SchemaType::Ref;
    if (str == "record")       return SchemaType::Record;
    if (str == "query")        return SchemaType::Query;
    if (str == "procedure")    return SchemaType::Procedure;
    if (str == "subscription") return SchemaType::Subscription;
    if (str == "params")       return SchemaType::Params;
    return nullopt;
}

bool isPrimarySchemaType(SchemaType type) {
    return type == SchemaType::Record
        || type == SchemaType::Query
        || type == SchemaType::Procedure
        || type == SchemaType::Subscription;
}
