#pragma once
#include <string>
#include <unordered_set>
#include <vector>

namespace textutil {

// lowercase, keep letters/digits/+/#, turn everything else into spaces, collapse spaces
std::string normalize(const std::string& s);

// split normalized text on spaces, keep tokens with at least min_len chars ("c++" always kept)
std::vector<std::string> tokenize(const std::string& normalized, size_t min_len = 2);

// trim + lowercase, inner whitespace collapsed; used for skill names and ids from files
std::string canonical_key(const std::string& s);

// distinct tokens longer than 2 chars with a small stop-word list removed
std::unordered_set<std::string> content_tokens(const std::string& text);

}
