/**
 * @file IntroductionCode.h
 * @brief Short human-transcribable codes: "<nameplate>-<word>-<word>"
 *
 * Security notes:
 * - The word suffix is the shared secret fed into the key exchange. It is
 *   drawn from the OpenSSL CSPRNG and must never be logged.
 * - The nameplate only routes the two peers to the same mailbox entry.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace Stork {

class IntroductionCode {
public:
    IntroductionCode() = default;

    /**
     * @brief Parse user input into a code
     * @param text e.g. " 7-Acorn-Banjo "
     * @param out Parsed code
     * @param errorMsg Reason on failure
     * @return true if @p text has exactly the expected shape
     *
     * Surrounding whitespace is trimmed and words are case-insensitive.
     * Rejects: empty input, non-numeric or zero nameplate, missing suffix,
     * empty words, unknown words, too many words.
     */
    static bool parse(const std::string& text, IntroductionCode& out, std::string& errorMsg);

    /**
     * @brief Draw a fresh word suffix for an allocated nameplate
     * @param nameplate Nameplate allocated by the mailbox service (> 0)
     * @param wordCount Number of words (1..MAX_CODE_WORDS)
     */
    static bool generate(uint32_t nameplate,
                         unsigned wordCount,
                         IntroductionCode& out,
                         std::string& errorMsg);

    uint32_t nameplate() const { return m_nameplate; }
    const std::vector<std::string>& words() const { return m_words; }

    bool isValid() const { return m_nameplate != 0 && !m_words.empty(); }

    /**
     * @brief Canonical text form, e.g. "7-acorn-banjo"
     */
    std::string toString() const;

    /**
     * @brief Word list size (always 256)
     */
    static size_t wordListSize();

    /**
     * @brief Word for a byte value
     */
    static const char* wordAt(uint8_t index);

    /**
     * @brief Whether @p word (lowercase) is in the word list
     */
    static bool isKnownWord(const std::string& word);

    bool operator==(const IntroductionCode& other) const {
        return m_nameplate == other.m_nameplate && m_words == other.m_words;
    }
    bool operator!=(const IntroductionCode& other) const { return !(*this == other); }

private:
    uint32_t m_nameplate = 0;
    std::vector<std::string> m_words;
};

}  // namespace Stork
