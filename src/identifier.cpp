#include "sqlxfer/identifier.h"
#include "sqlxfer/error.h"

#include <vector>

namespace sqlxfer {

namespace {

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

// Split on dots outside brackets, unquoting bracketed parts
std::vector<std::string> split_parts(const std::string& text) {
    std::vector<std::string> parts;
    std::string cur;
    bool in_bracket = false;

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (in_bracket) {
            if (c == ']') {
                if (i + 1 < text.size() && text[i + 1] == ']') {
                    cur += ']';
                    ++i;
                } else {
                    in_bracket = false;
                }
            } else {
                cur += c;
            }
        } else if (c == '[') {
            in_bracket = true;
        } else if (c == '.') {
            parts.push_back(trim(cur));
            cur.clear();
        } else {
            cur += c;
        }
    }
    if (in_bracket) {
        throw ConfigError("Unterminated '[' in object name: " + text);
    }
    parts.push_back(trim(cur));
    return parts;
}

}  // namespace

std::string QualifiedName::quoted() const {
    return quote_identifier(schema_name) + "." + quote_identifier(name);
}

QualifiedName parse_qualified_name(const std::string& text) {
    auto parts = split_parts(trim(text));

    QualifiedName qn;
    if (parts.size() == 1) {
        qn.name = parts[0];
    } else if (parts.size() == 2) {
        if (!parts[0].empty()) qn.schema_name = parts[0];
        qn.name = parts[1];
    } else {
        throw ConfigError("Object name must be 'table' or 'schema.table' "
                          "(the database is given separately): " + text);
    }

    if (qn.name.empty()) {
        throw ConfigError("Empty table name");
    }
    return qn;
}

std::string quote_identifier(const std::string& identifier) {
    std::string result;
    result.reserve(identifier.size() + 2);
    result += '[';
    for (char c : identifier) {
        result += c;
        if (c == ']') result += ']';
    }
    result += ']';
    return result;
}

std::string quote_nliteral(const std::string& value) {
    std::string result = "N'";
    result.reserve(value.size() + 3);
    for (char c : value) {
        result += c;
        if (c == '\'') result += '\'';
    }
    result += '\'';
    return result;
}

std::string trim_query(const std::string& query) {
    std::string q = trim(query);
    while (!q.empty() && q.back() == ';') {
        q.pop_back();
        q = trim(q);
    }
    return q;
}

}  // namespace sqlxfer
