#include "utils/text_utils.hpp"

#include <algorithm>
#include <cctype>

namespace text_utils {

namespace {

const char kReplacementUtf8[] = "\xEF\xBF\xBD"; // U+FFFD

bool is_space(unsigned char character) {
    return std::isspace(character) != 0;
}

// Expected sequence length for a lead byte (1-4), or 0 if it cannot start one.
size_t utf8_sequence_length(unsigned char lead) {
    if (lead < 0x80u) {
        return 1;
    }
    if (lead >= 0xC2u && lead <= 0xDFu) {
        return 2;
    }
    if (lead >= 0xE0u && lead <= 0xEFu) {
        return 3;
    }
    if (lead >= 0xF0u && lead <= 0xF4u) {
        return 4;
    }
    return 0;
}

} // namespace

std::string trim(const std::string &text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && is_space(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && is_space(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::string to_lower(const std::string &text) {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

std::string to_upper(const std::string &text) {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::toupper(character)); });
    return result;
}

std::string join(const std::vector<std::string> &parts, const std::string &separator) {
    std::string result;
    for (size_t index = 0; index < parts.size(); ++index) {
        if (index > 0) {
            result += separator;
        }
        result += parts[index];
    }
    return result;
}

bool starts_with(const std::string &text, const std::string &prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

std::string sanitize_utf8(const std::string &text) {
    std::string result;
    result.reserve(text.size());

    size_t position = 0;
    while (position < text.size()) {
        unsigned char lead = static_cast<unsigned char>(text[position]);
        size_t length = utf8_sequence_length(lead);

        bool valid = length > 0 && position + length <= text.size();
        for (size_t offset = 1; valid && offset < length; ++offset) {
            unsigned char next = static_cast<unsigned char>(text[position + offset]);
            valid = (next & 0xC0u) == 0x80u;
        }

        if (!valid) {
            result += kReplacementUtf8;
            ++position;
            continue;
        }

        result.append(text, position, length);
        position += length;
    }
    return result;
}

} // namespace text_utils
