#include <memguard/core/json.hpp>
#include <cstdio>
#include <cstdlib>
#include <cctype>
#include <cmath>

namespace memguard {

namespace {

const int MAX_DEPTH = 64;

const Json& null_json() {
    static const Json null_value;
    return null_value;
}

} // namespace

bool Json::as_bool(bool def) const { 
    return type_ == BOOL ? bool_ : def; 
}

double Json::as_number(double def) const { 
    return type_ == NUMBER ? number_ : def; 
}

int64_t Json::as_int(int64_t def) const { 
    return type_ == NUMBER ? static_cast<int64_t>(number_) : def; 
}

std::string Json::as_string(const std::string& def) const { 
    return type_ == STRING ? string_ : def; 
}

const std::vector<Json>& Json::as_array() const {
    static const std::vector<Json> empty;
    return type_ == ARRAY ? array_ : empty;
}

const std::map<std::string, Json>& Json::as_object() const {
    static const std::map<std::string, Json> empty;
    return type_ == OBJECT ? object_ : empty;
}

const Json& Json::operator[](const std::string& key) const {
    if (type_ != OBJECT) return null_json();
    std::map<std::string, Json>::const_iterator it = object_.find(key);
    return it != object_.end() ? it->second : null_json();
}

const Json& Json::operator[](size_t idx) const {
    if (type_ != ARRAY || idx >= array_.size()) return null_json();
    return array_[idx];
}

bool Json::has(const std::string& key) const {
    return type_ == OBJECT && object_.find(key) != object_.end();
}

size_t Json::size() const {
    if (type_ == ARRAY) return array_.size();
    if (type_ == OBJECT) return object_.size();
    return 0;
}

std::vector<std::string> Json::keys() const {
    std::vector<std::string> out;
    for (std::map<std::string, Json>::const_iterator it = object_.begin();
         it != object_.end(); ++it) {
        out.push_back(it->first);
    }
    return out;
}

void Json::set(const std::string& key, const Json& value) {
    if (type_ != OBJECT) {
        type_ = OBJECT;
        object_.clear();
    }
    object_[key] = value;
}

void Json::erase(const std::string& key) {
    if (type_ == OBJECT) object_.erase(key);
}

void Json::push(const Json& value) {
    if (type_ != ARRAY) {
        type_ = ARRAY;
        array_.clear();
    }
    array_.push_back(value);
}

std::string Json::get_string(const std::string& key, const std::string& def) const {
    const Json& v = (*this)[key];
    return v.is_string() ? v.string_ : def;
}

int Json::get_int(const std::string& key, int def) const {
    const Json& v = (*this)[key];
    return v.is_number() ? static_cast<int>(v.number_) : def;
}

int64_t Json::get_int64(const std::string& key, int64_t def) const {
    const Json& v = (*this)[key];
    return v.is_number() ? static_cast<int64_t>(v.number_) : def;
}

bool Json::get_bool(const std::string& key, bool def) const {
    const Json& v = (*this)[key];
    return v.is_bool() ? v.bool_ : def;
}

std::vector<std::string> Json::get_string_array(const std::string& key) const {
    std::vector<std::string> out;
    const std::vector<Json>& arr = (*this)[key].as_array();
    for (size_t i = 0; i < arr.size(); ++i) {
        if (arr[i].is_string()) out.push_back(arr[i].string_);
    }
    return out;
}

Json Json::object() {
    Json j;
    j.type_ = OBJECT;
    return j;
}

Json Json::array() {
    Json j;
    j.type_ = ARRAY;
    return j;
}

bool Json::operator==(const Json& other) const {
    if (type_ != other.type_) return false;
    switch (type_) {
        case NUL: return true;
        case BOOL: return bool_ == other.bool_;
        case NUMBER: return number_ == other.number_;
        case STRING: return string_ == other.string_;
        case ARRAY: return array_ == other.array_;
        case OBJECT: return object_ == other.object_;
    }
    return false;
}

std::string Json::dump() const {
    std::ostringstream ss;
    dump_impl(ss);
    return ss.str();
}

Json Json::parse(const std::string& str) {
    size_t pos = 0;
    Json value = parse_value(str, pos, 0);
    skip_ws(str, pos);
    if (pos != str.size()) {
        throw JsonError("Unexpected trailing characters at position " + std::to_string(pos));
    }
    return value;
}

void Json::dump_impl(std::ostringstream& ss) const {
    switch (type_) {
        case NUL:
            ss << "null";
            break;
        case BOOL:
            ss << (bool_ ? "true" : "false");
            break;
        case NUMBER: {
            if (!std::isfinite(number_)) {
                ss << "null";
                break;
            }
            int64_t i = static_cast<int64_t>(number_);
            if (number_ == static_cast<double>(i)) {
                ss << i;
            } else {
                char buf[32];
                snprintf(buf, sizeof(buf), "%.17g", number_);
                ss << buf;
            }
            break;
        }
        case STRING:
            ss << '"';
            escape_string(ss, string_);
            ss << '"';
            break;
        case ARRAY:
            ss << '[';
            for (size_t i = 0; i < array_.size(); ++i) {
                if (i > 0) ss << ',';
                array_[i].dump_impl(ss);
            }
            ss << ']';
            break;
        case OBJECT: {
            ss << '{';
            bool first = true;
            for (std::map<std::string, Json>::const_iterator it = object_.begin();
                 it != object_.end(); ++it) {
                if (!first) ss << ',';
                first = false;
                ss << '"';
                escape_string(ss, it->first);
                ss << "\":";
                it->second.dump_impl(ss);
            }
            ss << '}';
            break;
        }
    }
}

void Json::escape_string(std::ostringstream& ss, const std::string& s) {
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        switch (c) {
            case '"': ss << "\\\""; break;
            case '\\': ss << "\\\\"; break;
            case '\b': ss << "\\b"; break;
            case '\f': ss << "\\f"; break;
            case '\n': ss << "\\n"; break;
            case '\r': ss << "\\r"; break;
            case '\t': ss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    ss << buf;
                } else {
                    ss << c;
                }
        }
    }
}

void Json::skip_ws(const std::string& s, size_t& pos) {
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) pos++;
}

Json Json::parse_value(const std::string& s, size_t& pos, int depth) {
    if (depth > MAX_DEPTH) {
        throw JsonError("JSON nesting too deep");
    }
    skip_ws(s, pos);
    if (pos >= s.size()) {
        throw JsonError("Unexpected end of JSON input");
    }
    
    char c = s[pos];
    if (c == 'n' || c == 't' || c == 'f') return parse_literal(s, pos);
    if (c == '"') return Json(parse_string(s, pos));
    if (c == '[') return parse_array(s, pos, depth);
    if (c == '{') return parse_object(s, pos, depth);
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number(s, pos);
    
    throw JsonError("Invalid JSON at position " + std::to_string(pos));
}

Json Json::parse_literal(const std::string& s, size_t& pos) {
    if (s.compare(pos, 4, "null") == 0) {
        pos += 4;
        return Json();
    }
    if (s.compare(pos, 4, "true") == 0) {
        pos += 4;
        return Json(true);
    }
    if (s.compare(pos, 5, "false") == 0) {
        pos += 5;
        return Json(false);
    }
    throw JsonError("Invalid literal at position " + std::to_string(pos));
}

Json Json::parse_number(const std::string& s, size_t& pos) {
    size_t start = pos;
    if (s[pos] == '-') pos++;
    size_t digits = pos;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) pos++;
    if (pos == digits) {
        throw JsonError("Expected digit at position " + std::to_string(pos));
    }
    if (pos < s.size() && s[pos] == '.') {
        pos++;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) pos++;
    }
    if (pos < s.size() && (s[pos] == 'e' || s[pos] == 'E')) {
        pos++;
        if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) pos++;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) pos++;
    }
    return Json(std::strtod(s.substr(start, pos - start).c_str(), NULL));
}

void Json::append_utf8(std::string& out, unsigned int cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::string Json::parse_string(const std::string& s, size_t& pos) {
    pos++; // skip opening quote
    std::string result;
    while (pos < s.size() && s[pos] != '"') {
        if (s[pos] == '\\') {
            if (pos + 1 >= s.size()) break;
            pos++;
            switch (s[pos]) {
                case '"': result += '"'; break;
                case '\\': result += '\\'; break;
                case '/': result += '/'; break;
                case 'b': result += '\b'; break;
                case 'f': result += '\f'; break;
                case 'n': result += '\n'; break;
                case 'r': result += '\r'; break;
                case 't': result += '\t'; break;
                case 'u': {
                    if (pos + 4 >= s.size()) {
                        throw JsonError("Truncated \\u escape");
                    }
                    unsigned int cp = static_cast<unsigned int>(
                        std::strtoul(s.substr(pos + 1, 4).c_str(), NULL, 16));
                    pos += 4;
                    // Surrogate pair
                    if (cp >= 0xD800 && cp <= 0xDBFF && pos + 6 < s.size() &&
                        s[pos + 1] == '\\' && s[pos + 2] == 'u') {
                        unsigned int lo = static_cast<unsigned int>(
                            std::strtoul(s.substr(pos + 3, 4).c_str(), NULL, 16));
                        if (lo >= 0xDC00 && lo <= 0xDFFF) {
                            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                            pos += 6;
                        }
                    }
                    append_utf8(result, cp);
                    break;
                }
                default:
                    throw JsonError("Invalid escape at position " + std::to_string(pos));
            }
        } else {
            result += s[pos];
        }
        pos++;
    }
    if (pos >= s.size()) {
        throw JsonError("Unterminated string");
    }
    pos++; // skip closing quote
    return result;
}

Json Json::parse_array(const std::string& s, size_t& pos, int depth) {
    pos++; // skip [
    Json arr = Json::array();
    skip_ws(s, pos);
    if (pos < s.size() && s[pos] == ']') {
        pos++;
        return arr;
    }
    while (true) {
        arr.push(parse_value(s, pos, depth + 1));
        skip_ws(s, pos);
        if (pos >= s.size()) {
            throw JsonError("Unterminated array");
        }
        if (s[pos] == ']') {
            pos++;
            return arr;
        }
        if (s[pos] != ',') {
            throw JsonError("Expected ',' or ']' at position " + std::to_string(pos));
        }
        pos++;
    }
}

Json Json::parse_object(const std::string& s, size_t& pos, int depth) {
    pos++; // skip {
    Json obj = Json::object();
    skip_ws(s, pos);
    if (pos < s.size() && s[pos] == '}') {
        pos++;
        return obj;
    }
    while (true) {
        skip_ws(s, pos);
        if (pos >= s.size() || s[pos] != '"') {
            throw JsonError("Expected object key at position " + std::to_string(pos));
        }
        std::string key = parse_string(s, pos);
        skip_ws(s, pos);
        if (pos >= s.size() || s[pos] != ':') {
            throw JsonError("Expected ':' at position " + std::to_string(pos));
        }
        pos++; // skip :
        obj.set(key, parse_value(s, pos, depth + 1));
        skip_ws(s, pos);
        if (pos >= s.size()) {
            throw JsonError("Unterminated object");
        }
        if (s[pos] == '}') {
            pos++;
            return obj;
        }
        if (s[pos] != ',') {
            throw JsonError("Expected ',' or '}' at position " + std::to_string(pos));
        }
        pos++;
    }
}

} // namespace memguard
