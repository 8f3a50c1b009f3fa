#include "comment_stripper.hpp"

namespace doclint {

std::string strip_comments(std::string_view text) {
    constexpr size_t npos = std::string::npos;
    std::string out;
    out.reserve(text.size());
    // Position in out of the earliest opener still waiting for a closer.
    // Nothing before it contains an opener.
    size_t open = npos;
    for (char c : text) {
        out += c;
        if (open == npos) {
            if (out.ends_with(kCommentOpen)) open = out.size() - kCommentOpen.size();
        } else if (out.size() >= open + kCommentOpen.size() + kCommentClose.size()
                   && out.ends_with(kCommentClose)) {
            // Drop the span; the text before it may now end in a partial opener
            out.resize(open);
            open = npos;
        }
    }
    return out;
}

} // namespace doclint
