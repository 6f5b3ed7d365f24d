#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Minimal XML text helpers for UPnP device descriptions and SOAP bodies.
// Elements are matched by local name, so "<u:CurrentTransportState>" matches "CurrentTransportState".
namespace xml_text {

std::string escape(std::string_view text);
std::string unescape(std::string_view text);

// Inner text of the first matching element, unescaped and trimmed.
// A self-closing element yields an empty string.
std::optional<std::string> findElementText(std::string_view xml, std::string_view localName);

// Raw (still escaped) inner content of every matching element, in document order.
std::vector<std::string> findElementBlocks(std::string_view xml, std::string_view localName);

}  // namespace xml_text
