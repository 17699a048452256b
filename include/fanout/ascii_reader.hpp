#pragma once

#include <cctype>
#include <istream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace fanout {

// =============================================================================
// ASCII Reader - key-based lookup, missing fields return false
// =============================================================================
//
// Grammar:
//
//   name = 42
//   name = "text"
//   name = true
//   name = [1, 2, 3]
//   name { ... }          group, or list of anonymous items
//   # comment to end of line

class ascii_reader {
public:
    explicit ascii_reader(std::istream& is) : is_(is) {}

    // --- Name context ---

    void begin_named(const char* name) {
        pending_name_ = name;
    }

    // --- Scalars ---

    template<typename T>
        requires std::is_arithmetic_v<T>
    auto read(T& value) -> bool {
        if (!claim_pending_field()) return false;
        value = read_number<T>();
        return true;
    }

    auto read(bool& value) -> bool {
        if (!claim_pending_field()) return false;
        skip_ws();
        auto word = read_identifier();
        if (word == "true") {
            value = true;
        } else if (word == "false") {
            value = false;
        } else {
            throw std::runtime_error("expected true or false, got '" + word + "'");
        }
        return true;
    }

    auto read(std::string& value) -> bool {
        if (pending_name_) {
            if (!claim_pending_field()) return false;
        } else {
            skip_ws();
            if (peek() != '"') return false;
        }
        value = read_quoted_string();
        return true;
    }

    // --- Arrays ---

    template<typename T>
        requires std::is_arithmetic_v<T>
    auto read(std::vector<T>& value) -> bool {
        if (!claim_pending_field()) return false;
        expect('[');
        value.clear();
        skip_ws();
        if (peek() != ']') {
            while (true) {
                skip_ws();
                value.push_back(read_number<T>());
                skip_ws();
                if (peek() == ',') { get(); continue; }
                if (peek() == ']') break;
                throw std::runtime_error("expected ',' or ']'");
            }
        }
        expect(']');
        return true;
    }

    // --- Groups ---

    auto begin_group() -> bool {
        if (pending_name_) {
            if (!seek_field(pending_name_)) {
                pending_name_ = nullptr;
                return false;
            }
            pending_name_ = nullptr;
        } else {
            skip_ws();
            if (peek() != '{') return false;
        }
        expect('{');
        group_stack_.push_back(is_.tellg());
        return true;
    }

    void end_group() {
        skip_to_group_end();
        expect('}');
        if (!group_stack_.empty()) {
            group_stack_.pop_back();
        }
    }

    auto begin_list() -> bool { return begin_group(); }
    void end_list() { end_group(); }

    // --- Query ---

    auto has_field(const char* name) -> bool {
        auto pos = is_.tellg();
        bool found = seek_field(name);
        is_.clear();
        is_.seekg(pos);
        return found;
    }

private:
    std::istream& is_;
    std::vector<std::streampos> group_stack_;
    const char* pending_name_ = nullptr;

    auto peek() -> char { return static_cast<char>(is_.peek()); }
    auto get() -> char { return static_cast<char>(is_.get()); }
    auto at_eof() -> bool { return is_.peek() == std::char_traits<char>::eof(); }

    // Position after "name =" of the pending field; false if it is absent
    auto claim_pending_field() -> bool {
        if (!pending_name_) return true;
        auto name = pending_name_;
        pending_name_ = nullptr;
        if (!seek_field(name)) return false;
        expect('=');
        return true;
    }

    void skip_ws() {
        while (is_) {
            while (is_ && std::isspace(static_cast<unsigned char>(peek()))) get();
            if (peek() == '#') {
                while (is_ && get() != '\n') {}
            } else {
                break;
            }
        }
    }

    void expect(char c) {
        skip_ws();
        if (get() != c) {
            throw std::runtime_error(std::string("expected '") + c + "'");
        }
    }

    auto read_identifier() -> std::string {
        std::string s;
        while (is_ && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_')) {
            s += get();
        }
        return s;
    }

    template<typename T>
    auto read_number() -> T {
        skip_ws();
        std::string token;
        while (is_) {
            char c = peek();
            if (std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == '-' || c == '+' || c == 'e' || c == 'E') {
                token += get();
            } else {
                break;
            }
        }
        T value;
        std::istringstream iss(token);
        iss >> value;
        if (iss.fail() || token.empty()) {
            throw std::runtime_error("failed to parse number: '" + token + "'");
        }
        return value;
    }

    auto read_quoted_string() -> std::string {
        skip_ws();
        expect('"');
        std::string result;
        while (true) {
            if (at_eof()) {
                throw std::runtime_error("unterminated string");
            }
            char c = get();
            if (c == '"') break;
            if (c == '\\') {
                char next = get();
                switch (next) {
                    case '\\': result += '\\'; break;
                    case '"':  result += '"'; break;
                    case 'n':  result += '\n'; break;
                    case 't':  result += '\t'; break;
                    default:   result += next; break;
                }
            } else {
                result += c;
            }
        }
        return result;
    }

    // Seek to a field by name within the current group
    auto seek_field(const char* name) -> bool {
        auto start = group_stack_.empty() ? std::streampos(0) : group_stack_.back();
        is_.clear();
        is_.seekg(start);

        int depth = 0;
        while (is_) {
            skip_ws();
            char c = peek();

            if (at_eof()) {
                return false;
            } else if (c == '}') {
                if (depth == 0) return false;  // end of current group
                get();
                depth--;
            } else if (c == '{') {
                get();
                depth++;
            } else if (c == '"') {
                read_quoted_string();
            } else if (depth == 0 && (std::isalpha(static_cast<unsigned char>(c)) || c == '_')) {
                auto id = read_identifier();
                if (id == name) {
                    skip_ws();
                    return true;
                }
                skip_field_value();
            } else {
                get();
            }
        }
        return false;
    }

    void skip_field_value() {
        skip_ws();
        char c = peek();
        if (c == '=') {
            get();
            skip_ws();
            c = peek();
            if (c == '"') {
                read_quoted_string();
            } else if (c == '[') {
                skip_bracketed();
            } else {
                while (is_ && !at_eof() && !std::isspace(static_cast<unsigned char>(peek())) && peek() != '}' && peek() != '{') {
                    get();
                }
            }
        } else if (c == '{') {
            skip_braced();
        }
    }

    void skip_bracketed() {
        expect('[');
        int depth = 1;
        while (is_ && depth > 0) {
            char c = get();
            if (c == '[') depth++;
            else if (c == ']') depth--;
        }
    }

    void skip_braced() {
        expect('{');
        int depth = 1;
        while (is_ && depth > 0 && !at_eof()) {
            skip_ws();
            char c = peek();
            if (c == '"') {
                read_quoted_string();
                continue;
            }
            get();
            if (c == '{') depth++;
            else if (c == '}') depth--;
        }
    }

    void skip_to_group_end() {
        int depth = 0;
        while (is_) {
            skip_ws();
            char c = peek();
            if (at_eof()) {
                return;
            } else if (c == '"') {
                read_quoted_string();
            } else if (c == '{') {
                get();
                depth++;
            } else if (c == '}') {
                if (depth == 0) return;
                get();
                depth--;
            } else {
                get();
            }
        }
    }
};

} // namespace fanout
