#include "core/xml_text.h"

#include <cctype>

namespace xml_text {
namespace {

struct ElementSpan {
    size_t innerBegin = 0;
    size_t innerEnd = 0;
    size_t next = 0;
};

std::string trim(std::string_view text) {
    size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
        start++;
    }
    size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        end--;
    }
    return std::string(text.substr(start, end - start));
}

std::string_view localPart(std::string_view qualified) {
    auto colon = qualified.find(':');
    return colon == std::string_view::npos ? qualified : qualified.substr(colon + 1);
}

// Locate the next element named localName at or after pos.
std::optional<ElementSpan> nextElement(std::string_view xml, std::string_view localName,
                                       size_t pos) {
    while (pos < xml.size()) {
        size_t open = xml.find('<', pos);
        if (open == std::string_view::npos || open + 1 >= xml.size()) {
            return std::nullopt;
        }
        char lead = xml[open + 1];
        if (lead == '/' || lead == '?' || lead == '!') {
            pos = open + 1;
            continue;
        }

        size_t nameEnd = open + 1;
        while (nameEnd < xml.size() && !std::isspace(static_cast<unsigned char>(xml[nameEnd])) &&
               xml[nameEnd] != '>' && xml[nameEnd] != '/') {
            nameEnd++;
        }
        std::string_view qualified = xml.substr(open + 1, nameEnd - open - 1);
        size_t tagClose = xml.find('>', nameEnd);
        if (tagClose == std::string_view::npos) {
            return std::nullopt;
        }

        if (localPart(qualified) != localName) {
            pos = tagClose + 1;
            continue;
        }

        ElementSpan span;
        if (xml[tagClose - 1] == '/') {
            span.innerBegin = tagClose + 1;
            span.innerEnd = tagClose + 1;
            span.next = tagClose + 1;
            return span;
        }

        std::string closing = "</" + std::string(qualified);
        size_t closePos = xml.find(closing, tagClose + 1);
        if (closePos == std::string_view::npos) {
            return std::nullopt;
        }
        span.innerBegin = tagClose + 1;
        span.innerEnd = closePos;
        size_t afterClose = xml.find('>', closePos);
        span.next = afterClose == std::string_view::npos ? xml.size() : afterClose + 1;
        return span;
    }
    return std::nullopt;
}

}  // namespace

std::string escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '&':
            out += "&amp;";
            break;
        case '<':
            out += "&lt;";
            break;
        case '>':
            out += "&gt;";
            break;
        case '"':
            out += "&quot;";
            break;
        case '\'':
            out += "&apos;";
            break;
        default:
            out.push_back(c);
        }
    }
    return out;
}

std::string unescape(std::string_view text) {
    static constexpr std::pair<std::string_view, char> kEntities[] = {
        {"&lt;", '<'}, {"&gt;", '>'}, {"&quot;", '"'}, {"&apos;", '\''}, {"&amp;", '&'}};

    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '&') {
            bool matched = false;
            for (const auto& [entity, ch] : kEntities) {
                if (text.substr(i, entity.size()) == entity) {
                    out.push_back(ch);
                    i += entity.size();
                    matched = true;
                    break;
                }
            }
            if (matched) {
                continue;
            }
        }
        out.push_back(text[i]);
        i++;
    }
    return out;
}

std::optional<std::string> findElementText(std::string_view xml, std::string_view localName) {
    auto span = nextElement(xml, localName, 0);
    if (!span) {
        return std::nullopt;
    }
    return unescape(trim(xml.substr(span->innerBegin, span->innerEnd - span->innerBegin)));
}

std::vector<std::string> findElementBlocks(std::string_view xml, std::string_view localName) {
    std::vector<std::string> blocks;
    size_t pos = 0;
    while (auto span = nextElement(xml, localName, pos)) {
        blocks.emplace_back(xml.substr(span->innerBegin, span->innerEnd - span->innerBegin));
        pos = span->next;
    }
    return blocks;
}

}  // namespace xml_text
