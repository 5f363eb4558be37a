/**
 * @file IntroductionCode.cpp
 * @brief IntroductionCode implementation.
 */

#include "stork/IntroductionCode.h"
#include "stork/CryptoUtils.h"
#include "stork/config.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>

namespace Stork {

namespace {

constexpr const char* kWords[] = {
#include "CodeWords.inc"
};

static_assert(sizeof(kWords) / sizeof(kWords[0]) == 256, "code word list must have 256 entries");

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(begin, end - begin);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

std::vector<std::string> splitDash(const std::string& s) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        const size_t pos = s.find('-', start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

}  // namespace

size_t IntroductionCode::wordListSize() {
    return sizeof(kWords) / sizeof(kWords[0]);
}

const char* IntroductionCode::wordAt(uint8_t index) {
    return kWords[index];
}

bool IntroductionCode::isKnownWord(const std::string& word) {
    const auto* begin = std::begin(kWords);
    const auto* end = std::end(kWords);
    const auto* it = std::lower_bound(begin, end, word, [](const char* a, const std::string& b) {
        return std::strcmp(a, b.c_str()) < 0;
    });
    return it != end && word == *it;
}

bool IntroductionCode::parse(const std::string& text, IntroductionCode& out, std::string& errorMsg) {
    const std::string input = trim(text);
    if (input.empty()) {
        errorMsg = "Code is empty";
        return false;
    }

    const std::vector<std::string> parts = splitDash(input);
    const std::string& head = parts.front();

    if (head.empty() || head.size() > 6 ||
        !std::all_of(head.begin(), head.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        errorMsg = "Code must start with a number";
        return false;
    }

    const unsigned long nameplate = std::stoul(head);
    if (nameplate == 0 || nameplate > MAX_NAMEPLATE) {
        errorMsg = "Code number is out of range";
        return false;
    }

    if (parts.size() < 2) {
        errorMsg = "Code is missing its secret words";
        return false;
    }
    if (parts.size() - 1 > MAX_CODE_WORDS) {
        errorMsg = "Code has too many words";
        return false;
    }

    IntroductionCode parsed;
    parsed.m_nameplate = static_cast<uint32_t>(nameplate);
    for (size_t i = 1; i < parts.size(); ++i) {
        const std::string word = toLower(parts[i]);
        if (word.empty()) {
            errorMsg = "Code contains an empty word";
            return false;
        }
        if (!isKnownWord(word)) {
            errorMsg = "Code contains an unknown word";
            return false;
        }
        parsed.m_words.push_back(word);
    }

    out = std::move(parsed);
    return true;
}

bool IntroductionCode::generate(uint32_t nameplate,
                                unsigned wordCount,
                                IntroductionCode& out,
                                std::string& errorMsg) {
    if (nameplate == 0 || nameplate > MAX_NAMEPLATE) {
        errorMsg = "Nameplate out of range";
        return false;
    }
    if (wordCount == 0 || wordCount > MAX_CODE_WORDS) {
        errorMsg = "Word count must be between 1 and " + std::to_string(MAX_CODE_WORDS);
        return false;
    }

    std::array<uint8_t, MAX_CODE_WORDS> entropy{};
    if (!CryptoUtils::randomBytes(entropy.data(), wordCount, errorMsg)) {
        return false;
    }

    IntroductionCode generated;
    generated.m_nameplate = nameplate;
    for (unsigned i = 0; i < wordCount; ++i) {
        generated.m_words.emplace_back(wordAt(entropy[i]));
    }
    CryptoUtils::secureZero(entropy.data(), entropy.size());

    out = std::move(generated);
    return true;
}

std::string IntroductionCode::toString() const {
    std::string out = std::to_string(m_nameplate);
    for (const auto& word : m_words) {
        out += '-';
        out += word;
    }
    return out;
}

}  // namespace Stork
