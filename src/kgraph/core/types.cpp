#include "kgraph/core/types.h"

#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace kgraph {
namespace core {

std::string BlockKey(TokenId token_id, uint32_t part) {
    return std::to_string(token_id) + ":" + std::to_string(part);
}

std::optional<std::pair<TokenId, uint32_t>> ParseBlockKey(const std::string& key) {
    auto colon = key.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= key.size()) {
        return std::nullopt;
    }
    for (size_t i = 0; i < key.size(); ++i) {
        if (i != colon && !std::isdigit(static_cast<unsigned char>(key[i]))) {
            return std::nullopt;
        }
    }
    unsigned long token = std::strtoul(key.substr(0, colon).c_str(), nullptr, 10);
    unsigned long part = std::strtoul(key.substr(colon + 1).c_str(), nullptr, 10);
    return std::make_pair(static_cast<TokenId>(token), static_cast<uint32_t>(part));
}

std::string HashPrefix(uint32_t id, int nibbles) {
    char buf[9];
    std::snprintf(buf, sizeof(buf), "%08x", id);
    if (nibbles < 0) nibbles = 0;
    if (nibbles > 8) nibbles = 8;
    return std::string(buf, static_cast<size_t>(nibbles));
}

std::string TrimToken(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

} // namespace core
} // namespace kgraph
