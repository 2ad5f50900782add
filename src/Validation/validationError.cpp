#include "validationError.hpp"

using namespace std;

ValidationError ValidationError::invalidSchema(const string& message) {
    return ValidationError(Kind::InvalidSchema, message);
}

ValidationError ValidationError::dataValidation(const string& message) {
    return ValidationError(Kind::DataValidation, message);
}

ValidationError ValidationError::lexiconNotFound(const string& documentId) {
    return ValidationError(Kind::LexiconNotFound, documentId);
}

ValidationError ValidationError::withMessage(const string& newMessage) const {
    return ValidationError(kind, newMessage);
}

string ValidationError::toString() const {
    switch (kind) {
        case Kind::InvalidSchema:   return "Invalid lexicon schema: " + message;
        case Kind::DataValidation:  return "Data validation failed: " + message;
        case Kind::LexiconNotFound: return "Lexicon not found for collection: " + message;
    }
    return message;
}

ostream& operator<<(ostream& os, const ValidationError& error) {
    return os << error.toString();
}
