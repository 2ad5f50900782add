#ifndef SCHEMATYPE_HPP
#define SCHEMATYPE_HPP

#include <string>
#include <optional>
#include <cstdint>

enum class SchemaType : uint8_t {
    // Primitives
    String,
    Integer,
    Boolean,
    Bytes,
    Blob,
    CidLink,
    Null,
    Token,
    Unknown,
    // Containers and links
    Object,
    Array,
    Union,
    Ref,
    // Primary (top-level only)
    Record,
    Query,
    Procedure,
    Subscription,
    Params
};

// Converts SchemaType to its lexicon "type" spelling
std::string schema_type_to_string(SchemaType type);

// std::nullopt for unrecognised type tags
std::optional<SchemaType> schema_type_from_string(const std::string& str);

// record, query, procedure and subscription may only be a lexicon's main definition
bool isPrimarySchemaType(SchemaType type);

#endif
