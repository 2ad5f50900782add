#ifndef UTILS_HPP
#define UTILS_HPP

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

// Number of extended grapheme clusters (user-perceived characters) in a UTF-8 string
size_t countGraphemes(const std::string& text);

// Standard-alphabet base64, padded or unpadded. std::nullopt if the text is not valid base64.
std::optional<std::vector<uint8_t>> decodeBase64(const std::string& encoded);

// RFC 4648 lowercase base32 without padding (the multibase 'b' alphabet)
std::optional<std::vector<uint8_t>> decodeBase32Lower(const std::string& encoded);

std::string joinStrings(const std::vector<std::string>& parts, const std::string& separator);

#endif
