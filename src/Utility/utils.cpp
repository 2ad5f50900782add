#include "utils.hpp"

#include <memory>
#include <mutex>
#include <stdexcept>
#include <sodium.h>
#include <unicode/brkiter.h>
#include <unicode/locid.h>
#include <unicode/unistr.h>
#include <unicode/utypes.h>

using namespace std;

static once_flag sodiumInitFlag;

static void ensureSodiumInitialized() {
    call_once(sodiumInitFlag, []() {
        if (sodium_init() < 0) {
            throw runtime_error("Failed to initialize libsodium");
        }
    });
}

size_t countGraphemes(const string& text) {
    if (text.empty()) return 0;

    UErrorCode status = U_ZERO_ERROR;
    unique_ptr<icu::BreakIterator> iterator(
        icu::BreakIterator::createCharacterInstance(icu::Locale::getRoot(), status));

    if (U_FAILURE(status) || !iterator) {
        throw runtime_error("Failed to create grapheme break iterator: " + string(u_errorName(status)));
    }

    icu::UnicodeString unicodeText = icu::UnicodeString::fromUTF8(icu::StringPiece(text));
    iterator->setText(unicodeText);

    size_t count = 0;
    for (int32_t pos = iterator->next(); pos != icu::BreakIterator::DONE; pos = iterator->next()) {
        ++count;
    }
    return count;
}

optional<vector<uint8_t>> decodeBase64(const string& encoded) {
    ensureSodiumInitialized();

    vector<uint8_t> decoded(encoded.size() / 4 * 3 + 3);

    for (int variant : {sodium_base64_VARIANT_ORIGINAL, sodium_base64_VARIANT_ORIGINAL_NO_PADDING}) {
        size_t decodedLength = 0;
        // A null end pointer makes libsodium reject any trailing unparsed input
        int rc = sodium_base642bin(
            decoded.data(), decoded.size(),
            encoded.data(), encoded.size(),
            nullptr, &decodedLength, nullptr, variant);

        if (rc == 0) {
            decoded.resize(decodedLength);
            return decoded;
        }
    }
    return nullopt;
}

optional<vector<uint8_t>> decodeBase32Lower(const string& encoded) {
    static const string alphabet = "abcdefghijklmnopqrstuvwxyz234567";

    vector<uint8_t> decoded;
    decoded.reserve(encoded.size() * 5 / 8);

    uint32_t buffer = 0;
    int bits = 0;
    for (char c : encoded) {
        size_t value = alphabet.find(c);
        if (value == string::npos) return nullopt;

        buffer = (buffer << 5) | static_cast<uint32_t>(value);
        bits += 5;
        if (bits >= 8) {
            bits -= 8;
            decoded.push_back(static_cast<uint8_t>((buffer >> bits) & 0xFF));
        }
    }

    // Leftover bits must be zero padding
    if (bits > 0 && (buffer & ((1u << bits) - 1)) != 0) return nullopt;

    return decoded;
}

string joinStrings(const vector<string>& parts, const string& separator) {
    string joined;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) joined += separator;
        joined += parts[i];
    }
    return joined;
}
