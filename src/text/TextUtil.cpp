#include "text/TextUtil.hpp"
#include <cctype>

namespace textutil {

std::string normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool prev_space = true;

    for (unsigned char ch : s) {
        unsigned char c = static_cast<unsigned char>(std::tolower(ch));

        bool keep =
            (c >= 'a' && c <= 'z') ||
            (c >= '0' && c <= '9') ||
            (c == '+') || (c == '#'); // keeps "c++" and "c#"

        if (keep) {
            out.push_back(static_cast<char>(c));
            prev_space = false;
        } else {
            if (!prev_space) {
                out.push_back(' ');
                prev_space = true;
            }
        }
    }

    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

std::vector<std::string> tokenize(const std::string& normalized, size_t min_len) {
    std::vector<std::string> tokens;
    std::string cur;

    auto flush = [&]() {
        if (cur.empty()) return;
        if (cur.size() >= min_len || cur == "c++") tokens.push_back(cur);
        cur.clear();
    };

    for (char c : normalized) {
        if (c == ' ') {
            flush();
        } else {
            cur.push_back(c);
        }
    }
    flush();
    return tokens;
}

std::string canonical_key(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool pending_space = false;

    for (unsigned char ch : s) {
        if (std::isspace(ch)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(static_cast<char>(std::tolower(ch)));
    }
    return out;
}

std::unordered_set<std::string> content_tokens(const std::string& text) {
    static const std::unordered_set<std::string> stop = {
        "the", "and", "for", "with", "from", "that", "this", "are", "was", "you", "our"
    };

    std::unordered_set<std::string> out;
    if (text.empty()) return out;

    for (auto& t : tokenize(normalize(text), 3)) {
        if (stop.find(t) != stop.end()) continue;
        out.insert(std::move(t));
    }
    return out;
}

}
