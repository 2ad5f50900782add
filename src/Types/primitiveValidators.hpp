#ifndef PRIMITIVE_VALIDATORS_HPP
#define PRIMITIVE_VALIDATORS_HPP

#include "typeValidator.hpp"

#include <string>
#include <nlohmann/json.hpp>

/* =============== StringValidator =============== */

class StringValidator : public TypeValidator {
public:
    std::string getTypeName() const override { return "string"; }

    ValidationResult validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const override;
    ValidationResult validateData(
        const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx) const override;
};

/* =============== IntegerValidator =============== */

class IntegerValidator : public TypeValidator {
public:
    std::string getTypeName() const override { return "integer"; }

    ValidationResult validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const override;
    ValidationResult validateData(
        const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx) const override;
};

/* =============== BooleanValidator =============== */

class BooleanValidator : public TypeValidator {
public:
    std::string getTypeName() const override { return "boolean"; }

    ValidationResult validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const override;
    ValidationResult validateData(
        const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx) const override;
};

/* =============== NullValidator =============== */

class NullValidator : public TypeValidator {
public:
    std::string getTypeName() const override { return "null"; }

    ValidationResult validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const override;
    ValidationResult validateData(
        const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx) const override;
};

/* =============== BytesValidator =============== */

// Data shape: { "$bytes": "<base64>" } and nothing else
class BytesValidator : public TypeValidator {
public:
    std::string getTypeName() const override { return "bytes"; }

    ValidationResult validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const override;
    ValidationResult validateData(
        const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx) const override;
};

/* =============== BlobValidator =============== */

// Data shape: { "$type": "blob", "ref": { "$link": <raw cid> }, "mimeType": ..., "size": ... }
class BlobValidator : public TypeValidator {
public:
    std::string getTypeName() const override { return "blob"; }

    ValidationResult validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const override;
    ValidationResult validateData(
        const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx) const override;

    // Accept pattern syntax: "type/subtype", "type/*" or "*/*"
    static bool isValidAcceptPattern(const std::string& pattern);
    static bool mimeTypeMatches(const std::string& mimeType, const std::string& pattern);
};

/* =============== CidLinkValidator =============== */

class CidLinkValidator : public TypeValidator {
public:
    std::string getTypeName() const override { return "cid-link"; }

    ValidationResult validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const override;
    ValidationResult validateData(
        const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx) const override;
};

/* =============== TokenValidator =============== */

// Which token is expected is decided by the caller, usually a union
class TokenValidator : public TypeValidator {
public:
    std::string getTypeName() const override { return "token"; }

    ValidationResult validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const override;
    ValidationResult validateData(
        const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx) const override;
};

/* =============== UnknownValidator =============== */

class UnknownValidator : public TypeValidator {
public:
    std::string getTypeName() const override { return "unknown"; }

    ValidationResult validateSchema(const nlohmann::json& schema, const ValidationContext& ctx) const override;
    ValidationResult validateData(
        const nlohmann::json& value, const nlohmann::json& schema, const ValidationContext& ctx) const override;
};

#endif
