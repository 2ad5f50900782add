#ifndef VALIDATION_ERROR_HPP
#define VALIDATION_ERROR_HPP

#include <string>
#include <expected>
#include <ostream>

/**
 * @brief Failure reported by every validator.
 *
 * The message already carries the location of the failure (document, definition and
 * dotted path), so callers only need toString() to present it.
 */
class ValidationError {
public:
    enum class Kind {
        InvalidSchema,
        DataValidation,
        LexiconNotFound
    };

private:
    Kind kind;
    std::string message;

    ValidationError(Kind kind, std::string message)
    : kind(kind), message(std::move(message)) {}

public:
    static ValidationError invalidSchema(const std::string& message);
    static ValidationError dataValidation(const std::string& message);
    static ValidationError lexiconNotFound(const std::string& documentId);

    const std::string& getMessage() const { return message; }

    bool isInvalidSchema() const { return kind == Kind::InvalidSchema; }
    bool isDataValidation() const { return kind == Kind::DataValidation; }
    bool isLexiconNotFound() const { return kind == Kind::LexiconNotFound; }

    // Same kind, message replaced
    ValidationError withMessage(const std::string& newMessage) const;

    std::string toString() const;

    friend std::ostream& operator<<(std::ostream& os, const ValidationError& error);
};

using ValidationResult = std::expected<void, ValidationError>;

#endif
