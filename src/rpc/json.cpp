// DIRGATE - JSON Values Implementation
// Copyright (c) 2024 DIRGATE Developers
// MIT License

#include "dirgate/rpc/json.h"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace dirgate {
namespace rpc {

const JSONValue JSONValue::nullValue_;
const JSONValue::Array JSONValue::emptyArray_;
const JSONValue::Object JSONValue::emptyObject_;
const std::string JSONValue::emptyString_;

// ============================================================================
// Accessors
// ============================================================================

bool JSONValue::GetBool(bool defaultValue) const {
    return type_ == Type::Bool ? boolValue_ : defaultValue;
}

int64_t JSONValue::GetInt(int64_t defaultValue) const {
    if (type_ == Type::Int) return intValue_;
    if (type_ == Type::Double && std::isfinite(doubleValue_)) {
        return static_cast<int64_t>(doubleValue_);
    }
    return defaultValue;
}

double JSONValue::GetDouble(double defaultValue) const {
    if (type_ == Type::Double) return doubleValue_;
    if (type_ == Type::Int) return static_cast<double>(intValue_);
    return defaultValue;
}

const std::string& JSONValue::GetString() const {
    return type_ == Type::String ? stringValue_ : emptyString_;
}

const JSONValue::Array& JSONValue::GetArray() const {
    return type_ == Type::Array ? arrayValue_ : emptyArray_;
}

const JSONValue::Object& JSONValue::GetObject() const {
    return type_ == Type::Object ? objectValue_ : emptyObject_;
}

bool JSONValue::HasKey(const std::string& key) const {
    return type_ == Type::Object && objectValue_.count(key) > 0;
}

const JSONValue& JSONValue::operator[](const std::string& key) const {
    if (type_ != Type::Object) return nullValue_;
    auto it = objectValue_.find(key);
    return it == objectValue_.end() ? nullValue_ : it->second;
}

JSONValue& JSONValue::operator[](const std::string& key) {
    if (type_ != Type::Object) {
        *this = JSONValue(Object{});
    }
    return objectValue_[key];
}

size_t JSONValue::Size() const {
    if (type_ == Type::Array) return arrayValue_.size();
    if (type_ == Type::Object) return objectValue_.size();
    return 0;
}

const JSONValue& JSONValue::operator[](size_t index) const {
    if (type_ != Type::Array || index >= arrayValue_.size()) return nullValue_;
    return arrayValue_[index];
}

void JSONValue::Push(JSONValue value) {
    if (type_ != Type::Array) {
        *this = JSONValue(Array{});
    }
    arrayValue_.push_back(std::move(value));
}

// ============================================================================
// Serialization
// ============================================================================

std::string JSONQuote(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    out += '"';
    for (char c : value) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
    return out;
}

std::string JSONValue::ToJSON(bool pretty) const {
    std::string out;
    Write(out, pretty, 0);
    return out;
}

void JSONValue::Write(std::string& out, bool pretty, int indent) const {
    const std::string pad = pretty ? std::string((indent + 1) * 2, ' ') : "";
    const std::string closePad = pretty ? std::string(indent * 2, ' ') : "";
    const char* newline = pretty ? "\n" : "";

    switch (type_) {
        case Type::Null:
            out += "null";
            break;
        case Type::Bool:
            out += boolValue_ ? "true" : "false";
            break;
        case Type::Int:
            out += std::to_string(intValue_);
            break;
        case Type::Double: {
            if (!std::isfinite(doubleValue_)) {
                out += "null";
                break;
            }
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.15g", doubleValue_);
            out += buf;
            break;
        }
        case Type::String:
            out += JSONQuote(stringValue_);
            break;
        case Type::Array:
            if (arrayValue_.empty()) {
                out += "[]";
                break;
            }
            out += '[';
            out += newline;
            for (size_t i = 0; i < arrayValue_.size(); ++i) {
                if (i > 0) {
                    out += ',';
                    out += newline;
                }
                out += pad;
                arrayValue_[i].Write(out, pretty, indent + 1);
            }
            out += newline;
            out += closePad;
            out += ']';
            break;
        case Type::Object: {
            if (objectValue_.empty()) {
                out += "{}";
                break;
            }
            out += '{';
            out += newline;
            bool first = true;
            for (const auto& [key, value] : objectValue_) {
                if (!first) {
                    out += ',';
                    out += newline;
                }
                first = false;
                out += pad;
                out += JSONQuote(key);
                out += pretty ? ": " : ":";
                value.Write(out, pretty, indent + 1);
            }
            out += newline;
            out += closePad;
            out += '}';
            break;
        }
    }
}

// ============================================================================
// Parser
// ============================================================================

namespace {

class JSONParser {
public:
    explicit JSONParser(const std::string& text) : text_(text) {}

    std::optional<JSONValue> ParseDocument() {
        auto value = ParseValue(0);
        if (!value) return std::nullopt;
        SkipWhitespace();
        if (pos_ != text_.size()) return std::nullopt;
        return value;
    }

private:
    void SkipWhitespace() {
        while (pos_ < text_.size()) {
            char c = text_[pos_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
            ++pos_;
        }
    }

    bool Consume(const char* literal) {
        size_t i = 0;
        for (; literal[i] != '\0'; ++i) {
            if (pos_ + i >= text_.size() || text_[pos_ + i] != literal[i]) return false;
        }
        pos_ += i;
        return true;
    }

    std::optional<JSONValue> ParseValue(size_t depth) {
        if (depth > MAX_JSON_DEPTH) return std::nullopt;
        SkipWhitespace();
        if (pos_ >= text_.size()) return std::nullopt;

        char c = text_[pos_];
        if (c == '{') return ParseObject(depth);
        if (c == '[') return ParseArray(depth);
        if (c == '"') {
            auto str = ParseString();
            if (!str) return std::nullopt;
            return JSONValue(std::move(*str));
        }
        if (c == '-' || (c >= '0' && c <= '9')) return ParseNumber();
        if (Consume("null")) return JSONValue();
        if (Consume("true")) return JSONValue(true);
        if (Consume("false")) return JSONValue(false);
        return std::nullopt;
    }

    std::optional<JSONValue> ParseObject(size_t depth) {
        ++pos_;  // '{'
        JSONValue::Object object;
        SkipWhitespace();
        if (pos_ < text_.size() && text_[pos_] == '}') {
            ++pos_;
            return JSONValue(std::move(object));
        }
        while (true) {
            SkipWhitespace();
            auto key = ParseString();
            if (!key) return std::nullopt;
            SkipWhitespace();
            if (pos_ >= text_.size() || text_[pos_] != ':') return std::nullopt;
            ++pos_;
            auto value = ParseValue(depth + 1);
            if (!value) return std::nullopt;
            object[*key] = std::move(*value);

            SkipWhitespace();
            if (pos_ >= text_.size()) return std::nullopt;
            if (text_[pos_] == '}') {
                ++pos_;
                return JSONValue(std::move(object));
            }
            if (text_[pos_] != ',') return std::nullopt;
            ++pos_;
        }
    }

    std::optional<JSONValue> ParseArray(size_t depth) {
        ++pos_;  // '['
        JSONValue::Array array;
        SkipWhitespace();
        if (pos_ < text_.size() && text_[pos_] == ']') {
            ++pos_;
            return JSONValue(std::move(array));
        }
        while (true) {
            auto value = ParseValue(depth + 1);
            if (!value) return std::nullopt;
            array.push_back(std::move(*value));

            SkipWhitespace();
            if (pos_ >= text_.size()) return std::nullopt;
            if (text_[pos_] == ']') {
                ++pos_;
                return JSONValue(std::move(array));
            }
            if (text_[pos_] != ',') return std::nullopt;
            ++pos_;
        }
    }

    std::optional<uint32_t> ParseHex4() {
        if (pos_ + 4 > text_.size()) return std::nullopt;
        uint32_t value = 0;
        for (size_t i = 0; i < 4; ++i) {
            char c = text_[pos_ + i];
            value <<= 4;
            if (c >= '0' && c <= '9') value |= static_cast<uint32_t>(c - '0');
            else if (c >= 'a' && c <= 'f') value |= static_cast<uint32_t>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') value |= static_cast<uint32_t>(c - 'A' + 10);
            else return std::nullopt;
        }
        pos_ += 4;
        return value;
    }

    static void AppendUtf8(std::string& out, uint32_t cp) {
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

    /// \uXXXX, combining surrogate pairs
    bool ParseUnicodeEscape(std::string& out) {
        auto high = ParseHex4();
        if (!high) return false;
        uint32_t cp = *high;
        if (cp >= 0xD800 && cp <= 0xDBFF) {
            if (!Consume("\\u")) return false;
            auto low = ParseHex4();
            if (!low || *low < 0xDC00 || *low > 0xDFFF) return false;
            cp = 0x10000 + ((cp - 0xD800) << 10) + (*low - 0xDC00);
        } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
            return false;
        }
        AppendUtf8(out, cp);
        return true;
    }

    std::optional<std::string> ParseString() {
        if (pos_ >= text_.size() || text_[pos_] != '"') return std::nullopt;
        ++pos_;

        std::string out;
        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (c == '"') return out;
            if (static_cast<unsigned char>(c) < 0x20) return std::nullopt;
            if (c != '\\') {
                out += c;
                continue;
            }
            if (pos_ >= text_.size()) return std::nullopt;
            char esc = text_[pos_++];
            switch (esc) {
                case '"':  out += '"'; break;
                case '\\': out += '\\'; break;
                case '/':  out += '/'; break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'u':
                    if (!ParseUnicodeEscape(out)) return std::nullopt;
                    break;
                default:
                    return std::nullopt;
            }
        }
        return std::nullopt;  // Unterminated
    }

    std::optional<JSONValue> ParseNumber() {
        size_t start = pos_;
        bool isFloat = false;

        if (text_[pos_] == '-') ++pos_;
        size_t digitsStart = pos_;
        while (pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9') ++pos_;
        if (pos_ == digitsStart) return std::nullopt;

        if (pos_ < text_.size() && text_[pos_] == '.') {
            isFloat = true;
            ++pos_;
            size_t fracStart = pos_;
            while (pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9') ++pos_;
            if (pos_ == fracStart) return std::nullopt;
        }
        if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
            isFloat = true;
            ++pos_;
            if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) ++pos_;
            size_t expStart = pos_;
            while (pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9') ++pos_;
            if (pos_ == expStart) return std::nullopt;
        }

        const std::string number = text_.substr(start, pos_ - start);
        errno = 0;
        char* end = nullptr;
        if (!isFloat) {
            long long value = std::strtoll(number.c_str(), &end, 10);
            if (errno == 0 && end && *end == '\0') {
                return JSONValue(static_cast<int64_t>(value));
            }
            // Out of int64 range: fall through to double
            errno = 0;
        }
        double value = std::strtod(number.c_str(), &end);
        if (errno == ERANGE || !end || *end != '\0') return std::nullopt;
        return JSONValue(value);
    }

    const std::string& text_;
    size_t pos_{0};
};

} // namespace

JSONValue JSONValue::Parse(const std::string& json) {
    auto result = TryParse(json);
    if (!result) {
        throw std::runtime_error("JSON parse error");
    }
    return std::move(*result);
}

std::optional<JSONValue> JSONValue::TryParse(const std::string& json) {
    return JSONParser(json).ParseDocument();
}

} // namespace rpc
} // namespace dirgate
