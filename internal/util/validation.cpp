#include "validation.hpp"

#include <cctype>

#include "errors.hpp"

namespace timekeeper::util {

namespace {

bool IsHex(char c) {
  return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

// UTF-8 code points; continuation bytes (10xxxxxx) are not counted.
std::size_t CountCharacters(std::string_view text) {
  std::size_t n = 0;
  for (char c : text) {
    if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) ++n;
  }
  return n;
}

} // namespace

std::string_view Trim(std::string_view text) {
  const auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };

  while (!text.empty() && is_space(text.front())) text.remove_prefix(1);
  while (!text.empty() && is_space(text.back())) text.remove_suffix(1);
  return text;
}

bool IsValidMatchId(std::string_view text) {
  if (text.size() != 36) {
    return false;
  }

  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (c != '-') return false;
      continue;
    }
    if (!IsHex(c)) return false;
  }

  // version nibble
  if (text[14] != '4') {
    return false;
  }

  // variant nibble
  switch (std::tolower(static_cast<unsigned char>(text[19]))) {
    case '8':
    case '9':
    case 'a':
    case 'b':
      return true;
    default:
      return false;
  }
}

std::optional<std::string> ExtractMatchIdFromScan(std::string_view raw) {
  const auto cleaned = Trim(raw);
  if (!IsValidMatchId(cleaned)) {
    return std::nullopt;
  }
  return std::string(cleaned);
}

std::string ValidateDescription(std::string_view description) {
  const auto trimmed = Trim(description);
  if (trimmed.empty()) {
    throw ValidationFailure("match description cannot be empty");
  }
  const auto length = CountCharacters(trimmed);
  if (length > kMaxDescriptionLength) {
    throw ValidationFailure("match description must be " + std::to_string(kMaxDescriptionLength) + " characters or less (got " +
                            std::to_string(length) + ")");
  }
  return std::string(trimmed);
}

void ValidateUserId(std::string_view user_id) {
  if (Trim(user_id).empty()) {
    throw ValidationFailure("user id cannot be empty");
  }
}

} // namespace timekeeper::util
