#pragma once

#include <string>
#include <string_view>

namespace doclint {

inline constexpr std::string_view kCommentOpen = "<!--";
inline constexpr std::string_view kCommentClose = "-->";

// Remove every <!-- ... --> span, including spans crossing line breaks.
// Each opener pairs with the nearest following closer. An opener with no
// closer leaves the remainder of the text as is. A removed span rejoins
// the text around it, and an opener formed at that seam is honored, so the
// result holds no complete span and is stable under a second call.
// Runs in linear time.
std::string strip_comments(std::string_view text);

} // namespace doclint
