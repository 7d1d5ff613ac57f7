#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace timekeeper::util {

inline constexpr std::size_t kMaxDescriptionLength = 200;

// Canonical UUID v4 text: xxxxxxxx-xxxx-4xxx-{8,9,a,b}xxx-xxxxxxxxxxxx,
// hex digits in either case.
bool IsValidMatchId(std::string_view text);

// Trims text handed back by a QR decoder or typed by hand. Empty when the
// result is not a valid match id.
std::optional<std::string> ExtractMatchIdFromScan(std::string_view raw);

// Returns the trimmed description; throws ValidationFailure when it is empty
// or longer than kMaxDescriptionLength.
std::string ValidateDescription(std::string_view description);

// Throws ValidationFailure for an empty or whitespace-only caller id.
void ValidateUserId(std::string_view user_id);

std::string_view Trim(std::string_view text);

} // namespace timekeeper::util
