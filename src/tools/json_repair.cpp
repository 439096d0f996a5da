#include "tools/json_repair.hpp"

#include <cctype>
#include <string>
#include <vector>

namespace chatflow::tools {

using core::errors::ErrorCategory;
using core::errors::FlowError;
using nlohmann::json;

namespace {

struct Frame {
    char open;
    bool expecting_key;
};

bool is_blank(const std::string_view text) {
    for (const char c : text) {
        if (std::isspace(static_cast<unsigned char>(c)) == 0) {
            return false;
        }
    }
    return true;
}

void trim_right(std::string& text) {
    while (!text.empty() &&
           std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.pop_back();
    }
}

// Drops an escape sequence cut in half ("\" or "\u12").
void drop_partial_escape(std::string& text) {
    const auto slash = text.rfind('\\');
    if (slash == std::string::npos) {
        return;
    }
    std::size_t preceding = 0;
    for (std::size_t i = slash; i > 0 && text[i - 1] == '\\'; --i) {
        ++preceding;
    }
    if (preceding % 2 != 0) {
        return;  // the last backslash is itself escaped
    }
    const std::size_t tail = text.size() - slash;
    if (tail == 1 || (text[slash + 1] == 'u' && tail < 6)) {
        text.erase(slash);
    }
}

bool is_number_char(const char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0 || c == '-' || c == '+' ||
           c == '.' || c == 'e' || c == 'E';
}

// "12e", "-", "3." lose the characters that cannot end a number.
void trim_partial_number(std::string& text) {
    std::size_t start = text.size();
    while (start > 0 && is_number_char(text[start - 1])) {
        --start;
    }
    if (start == text.size()) {
        return;
    }
    const char first = text[start];
    if (first != '-' && std::isdigit(static_cast<unsigned char>(first)) == 0) {
        return;
    }
    while (text.size() > start) {
        const char c = text.back();
        if (c != '-' && c != '+' && c != '.' && c != 'e' && c != 'E') {
            break;
        }
        text.pop_back();
    }
}

void complete_literal(std::string& text) {
    static const char* const kLiterals[] = {"true", "false", "null"};
    std::size_t start = text.size();
    while (start > 0 && std::isalpha(static_cast<unsigned char>(text[start - 1])) != 0) {
        --start;
    }
    if (start == text.size()) {
        return;
    }
    const std::string word = text.substr(start);
    for (const char* literal : kLiterals) {
        const std::string candidate(literal);
        if (candidate.compare(0, word.size(), word) == 0) {
            text.append(candidate.substr(word.size()));
            return;
        }
    }
}

}  // namespace

core::errors::Result<json> repair_json(const std::string_view input) {
    if (is_blank(input)) {
        return json::object();
    }

    json parsed = json::parse(input.begin(), input.end(), nullptr, false);
    if (!parsed.is_discarded()) {
        return parsed;
    }

    std::string out;
    out.reserve(input.size() + 8);
    std::vector<Frame> stack;
    bool in_string = false;
    bool escaped = false;
    bool string_is_key = false;
    bool last_token_was_key = false;

    for (const char c : input) {
        out.push_back(c);
        if (in_string) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
                if (string_is_key) {
                    stack.back().expecting_key = false;
                    last_token_was_key = true;
                }
            }
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            continue;
        }
        last_token_was_key = false;
        switch (c) {
            case '"':
                in_string = true;
                string_is_key = !stack.empty() && stack.back().open == '{' &&
                                stack.back().expecting_key;
                break;
            case '{':
                stack.push_back({'{', true});
                break;
            case '[':
                stack.push_back({'[', false});
                break;
            case '}':
            case ']':
                if (!stack.empty() && stack.back().open == (c == '}' ? '{' : '[')) {
                    stack.pop_back();
                }
                break;
            case ',':
                if (!stack.empty() && stack.back().open == '{') {
                    stack.back().expecting_key = true;
                }
                break;
            default:
                break;
        }
    }

    if (in_string) {
        drop_partial_escape(out);
        out.push_back('"');
        if (string_is_key) {
            last_token_was_key = true;
        }
    }

    trim_right(out);
    trim_partial_number(out);
    trim_right(out);
    while (!out.empty() && out.back() == ',') {
        out.pop_back();
        trim_right(out);
    }

    if (!out.empty() && std::isalpha(static_cast<unsigned char>(out.back())) != 0) {
        complete_literal(out);
    }
    if (last_token_was_key) {
        out.append(":null");
    } else if (!out.empty() && out.back() == ':') {
        out.append("null");
    }

    for (auto it = stack.rbegin(); it != stack.rend(); ++it) {
        out.push_back(it->open == '{' ? '}' : ']');
    }

    json repaired = json::parse(out, nullptr, false);
    if (repaired.is_discarded()) {
        return FlowError{ErrorCategory::Extraction,
                         "Unable to repair tool arguments: " + std::string(input),
                         "unrepairable_json"};
    }
    return repaired;
}

}  // namespace chatflow::tools
