#include "graph/LabelSanitizer.hpp"
#include "graph/GraphErrors.hpp"
#include <cstdint>

namespace graph {

namespace {

bool isAsciiSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string describeByte(unsigned char c) {
    static const char* hex = "0123456789ABCDEF";
    return std::string("0x") + hex[c >> 4] + hex[c & 0x0F];
}

/**
 * Décode un code point UTF-8 à partir de pos
 * @return nombre d'octets consommés, 0 si la séquence est invalide
 */
size_t decodeUtf8(const std::string& s, size_t pos, uint32_t& codePoint) {
    auto byte = [&](size_t i) { return static_cast<unsigned char>(s[i]); };
    unsigned char lead = byte(pos);

    size_t length;
    uint32_t minValue;
    if (lead < 0x80) {
        codePoint = lead;
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        length = 2;
        minValue = 0x80;
        codePoint = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        minValue = 0x800;
        codePoint = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        minValue = 0x10000;
        codePoint = lead & 0x07;
    } else {
        return 0;
    }

    if (pos + length > s.size()) {
        return 0;
    }
    for (size_t i = 1; i < length; ++i) {
        unsigned char c = byte(pos + i);
        if ((c & 0xC0) != 0x80) {
            return 0;
        }
        codePoint = (codePoint << 6) | (c & 0x3F);
    }

    // Overlong forms, surrogates, out of range
    if (codePoint < minValue || codePoint > 0x10FFFF ||
        (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
        return 0;
    }
    return length;
}

} // anonymous namespace

SafeLabel LabelSanitizer::sanitize(const std::string& raw) {
    if (raw.empty()) {
        throw InvalidLabelError("Label must not be empty");
    }

    size_t pos = 0;
    while (pos < raw.size()) {
        uint32_t cp = 0;
        size_t length = decodeUtf8(raw, pos, cp);
        if (length == 0) {
            throw InvalidLabelError("Label is not valid UTF-8 (byte " +
                                    describeByte(static_cast<unsigned char>(raw[pos])) +
                                    " at offset " + std::to_string(pos) + ")");
        }
        if (cp == '`') {
            throw InvalidLabelError("Label must not contain a backtick");
        }
        if (cp == '\\') {
            throw InvalidLabelError("Label must not contain a backslash");
        }
        if (cp < 0x20 || cp == 0x7F || (cp >= 0x80 && cp <= 0x9F) ||
            cp == 0x2028 || cp == 0x2029) {
            throw InvalidLabelError("Label must not contain control or line separator characters");
        }
        pos += length;
    }

    return SafeLabel(raw);
}

std::string LabelSanitizer::normalizeRelationshipType(const std::string& raw) {
    size_t begin = 0;
    size_t end = raw.size();
    while (begin < end && isAsciiSpace(raw[begin])) ++begin;
    while (end > begin && isAsciiSpace(raw[end - 1])) --end;

    std::string result;
    result.reserve(end - begin);
    bool inSpace = false;
    for (size_t i = begin; i < end; ++i) {
        char c = raw[i];
        if (isAsciiSpace(c)) {
            if (!inSpace) {
                result += '_';
                inSpace = true;
            }
            continue;
        }
        inSpace = false;
        if (c >= 'a' && c <= 'z') {
            c = static_cast<char>(c - 'a' + 'A');
        }
        result += c;
    }
    return result;
}

SafeLabel LabelSanitizer::sanitizeRelationshipType(const std::string& raw) {
    return sanitize(normalizeRelationshipType(raw));
}

SafeLabel LabelSanitizer::sanitizeNodeType(const std::string& raw) {
    SafeLabel label = sanitize(raw);
    if (label.str() == kEntityLabel) {
        throw InvalidLabelError(std::string("Node type must not be the reserved label '") +
                                kEntityLabel + "'");
    }
    return label;
}

} // namespace graph
