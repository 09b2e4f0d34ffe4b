/**
 * @file truncator.hpp
 * @brief Truncator: hard prefix cut that bounds every message before splitting.
 *
 * The first stage of the pipeline. It exists so that a pathological input
 * (a pasted log, a runaway LLM reply) cannot turn into hundreds of radio
 * packets: whatever arrives, at most `total_limit` characters go on.
 *
 * The cut is not word-aware and never fails. The result is a view into the
 * caller's buffer; nothing is copied, so the source must outlive the view.
 */
#ifndef MESHSPLIT_TRUNCATOR_HPP
#define MESHSPLIT_TRUNCATOR_HPP

#include <stddef.h>

namespace meshsplit {

/**
 * @brief Non-owning view of the retained prefix of a message.
 */
struct TruncatedText {
    const char* data = "";   ///< First retained character (never nullptr)
    size_t      length = 0;  ///< Retained characters, <= total_limit
    bool        clipped = false; ///< true if trailing characters were dropped
};

/**
 * @brief Length of a null-terminated string; nullptr counts as empty.
 */
size_t text_length(const char* text);

/**
 * @brief Keep at most `total_limit` characters of `text`.
 * @param text        Source characters (nullptr is treated as empty).
 * @param length      Number of characters at `text`.
 * @param total_limit Truncation ceiling.
 * @return View of the first min(length, total_limit) characters.
 */
TruncatedText truncate(const char* text, size_t length, size_t total_limit);

} // namespace meshsplit

#endif // MESHSPLIT_TRUNCATOR_HPP
