#include "validationContext.hpp"

#include <algorithm>

using namespace std;

ValidationContext::ValidationContext(
    shared_ptr<const LexiconCatalog> catalog, DataValidatorFn dataValidator, size_t maxDepth)
    : catalog(std::move(catalog)),
      dataValidator(make_shared<const DataValidatorFn>(std::move(dataValidator))),
      references(make_shared<const vector<string>>()),
      maxDepth(maxDepth) {}

ValidationContext ValidationContext::withPath(const string& segment) const {
    ValidationContext next = *this;
    next.path = path.empty() ? segment : path + "." + segment;
    next.depth = depth + 1;
    return next;
}

ValidationContext ValidationContext::withIndex(size_t index) const {
    ValidationContext next = *this;
    next.path = path + "[" + to_string(index) + "]";
    next.depth = depth + 1;
    return next;
}

ValidationContext ValidationContext::withCurrentDocument(const string& documentId) const {
    ValidationContext next = *this;
    next.currentDocumentId = documentId;
    return next;
}

ValidationContext ValidationContext::withReference(const string& ref) const {
    auto extended = make_shared<vector<string>>(*references);
    extended->push_back(ref);

    ValidationContext next = *this;
    next.references = std::move(extended);
    return next;
}

bool ValidationContext::hasReference(const string& ref) const {
    return find(references->begin(), references->end(), ref) != references->end();
}

expected<ResolvedReference, ValidationError> ValidationContext::resolve(const string& ref) const {
    if (!catalog) {
        return unexpected(ValidationError::invalidSchema(
            "cannot resolve reference '" + ref + "' without a lexicon catalog"));
    }
    return SchemaResolver::resolveReference(ref, *catalog, currentDocumentId);
}

ValidationResult ValidationContext::validateData(const nlohmann::json& value, const nlohmann::json& schema) const {
    return (*dataValidator)(value, schema, *this);
}

string ValidationContext::formatMessage(const string& detail) const {
    if (path.empty()) return detail;
    return path + ": " + detail;
}

ValidationError ValidationContext::schemaError(const string& detail) const {
    return ValidationError::invalidSchema(formatMessage(detail));
}

ValidationError ValidationContext::dataError(const string& detail) const {
    return ValidationError::dataValidation(formatMessage(detail));
}
