// core/json.hpp
// Minimal JSON support for control-server request/response bodies
//
// Writing: JsonWriter builds compact JSON with proper string escaping.
// Reading: flat field extraction (find_string/find_int/find_double) from a
// response object, the same strstr-style scan used on hot paths elsewhere.
// Only top-level scalar fields of the control-server responses are read, so
// no DOM is built.
#pragma once

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cmath>
#include <optional>
#include <string>
#include <vector>

namespace coverage {
namespace json {

// ═══════════════════════════════════════════════════════════════════════════
// Writer
// ═══════════════════════════════════════════════════════════════════════════

inline void append_escaped(std::string& out, const std::string& s) {
    out.push_back('"');
    for (unsigned char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    out.push_back('"');
}

/**
 * JsonWriter - streaming compact JSON builder
 *
 * Tracks comma placement with a nesting stack; keys are only valid inside
 * objects. Optional fields are skipped entirely when empty.
 */
class JsonWriter {
public:
    JsonWriter& begin_object() {
        value_prefix();
        out_.push_back('{');
        first_.push_back(true);
        return *this;
    }

    JsonWriter& end_object() {
        out_.push_back('}');
        first_.pop_back();
        return *this;
    }

    JsonWriter& begin_array() {
        value_prefix();
        out_.push_back('[');
        first_.push_back(true);
        return *this;
    }

    JsonWriter& end_array() {
        out_.push_back(']');
        first_.pop_back();
        return *this;
    }

    JsonWriter& key(const char* k) {
        if (!first_.empty()) {
            if (!first_.back()) out_.push_back(',');
            first_.back() = false;
        }
        append_escaped(out_, k);
        out_.push_back(':');
        after_key_ = true;
        return *this;
    }

    JsonWriter& value(const std::string& s) {
        value_prefix();
        append_escaped(out_, s);
        return *this;
    }

    JsonWriter& value(const char* s) {
        return value(std::string(s));
    }

    JsonWriter& value(int64_t v) {
        value_prefix();
        out_ += std::to_string(v);
        return *this;
    }

    JsonWriter& value(int v) {
        return value(static_cast<int64_t>(v));
    }

    JsonWriter& value(uint64_t v) {
        value_prefix();
        out_ += std::to_string(v);
        return *this;
    }

    JsonWriter& value(double v) {
        value_prefix();
        if (!std::isfinite(v)) {
            out_ += "null";
            return *this;
        }
        char buf[32];
        snprintf(buf, sizeof(buf), "%.17g", v);
        out_ += buf;
        return *this;
    }

    JsonWriter& value(bool v) {
        value_prefix();
        out_ += v ? "true" : "false";
        return *this;
    }

    JsonWriter& null() {
        value_prefix();
        out_ += "null";
        return *this;
    }

    template<typename T>
    JsonWriter& field(const char* k, const T& v) {
        key(k);
        return value(v);
    }

    template<typename T>
    JsonWriter& optional_field(const char* k, const std::optional<T>& v) {
        if (v) {
            key(k);
            value(*v);
        }
        return *this;
    }

    const std::string& str() const { return out_; }

private:
    void value_prefix() {
        if (after_key_) {
            after_key_ = false;
            return;
        }
        if (!first_.empty()) {
            if (!first_.back()) out_.push_back(',');
            first_.back() = false;
        }
    }

    std::string out_;
    std::vector<bool> first_;
    bool after_key_ = false;
};

// ═══════════════════════════════════════════════════════════════════════════
// Reader
// ═══════════════════════════════════════════════════════════════════════════

/**
 * Locate the value of "key" in a JSON text
 *
 * @return Pointer to the first non-space character of the value, nullptr if
 *         the key is absent
 */
inline const char* find_value(const std::string& body, const char* key) {
    std::string needle = "\"";
    needle += key;
    needle += "\"";

    size_t pos = 0;
    while ((pos = body.find(needle, pos)) != std::string::npos) {
        size_t p = pos + needle.size();
        while (p < body.size() && (body[p] == ' ' || body[p] == '\t' || body[p] == '\r' || body[p] == '\n')) {
            ++p;
        }
        if (p < body.size() && body[p] == ':') {
            ++p;
            while (p < body.size() && (body[p] == ' ' || body[p] == '\t' || body[p] == '\r' || body[p] == '\n')) {
                ++p;
            }
            if (p < body.size()) {
                return body.c_str() + p;
            }
            return nullptr;
        }
        pos += needle.size();  // matched a string value, not a key
    }
    return nullptr;
}

/**
 * Read a string field. Numeric values are returned as their literal text.
 *
 * @return Unescaped value, std::nullopt if absent or null
 */
inline std::optional<std::string> find_string(const std::string& body, const char* key) {
    const char* v = find_value(body, key);
    if (!v) return std::nullopt;

    if (*v == '"') {
        std::string out;
        for (const char* p = v + 1; *p; ++p) {
            if (*p == '"') {
                return out;
            }
            if (*p == '\\' && p[1]) {
                ++p;
                switch (*p) {
                    case 'n': out.push_back('\n'); break;
                    case 't': out.push_back('\t'); break;
                    case 'r': out.push_back('\r'); break;
                    case 'b': out.push_back('\b'); break;
                    case 'f': out.push_back('\f'); break;
                    case 'u': {
                        // Control-server fields are ASCII; keep BMP code points < 0x80 only
                        if (strlen(p) < 5) return std::nullopt;
                        unsigned cp = static_cast<unsigned>(strtoul(std::string(p + 1, 4).c_str(), nullptr, 16));
                        if (cp < 0x80) out.push_back(static_cast<char>(cp));
                        p += 4;
                        break;
                    }
                    default: out.push_back(*p);
                }
            } else {
                out.push_back(*p);
            }
        }
        return std::nullopt;  // unterminated
    }

    if (*v == '-' || (*v >= '0' && *v <= '9')) {
        const char* end = v;
        while (*end && (*end == '-' || *end == '+' || *end == '.' || *end == 'e' || *end == 'E' ||
                        (*end >= '0' && *end <= '9'))) {
            ++end;
        }
        return std::string(v, end);
    }

    return std::nullopt;
}

/**
 * Read an integer field. Quoted integers ("5000") are accepted.
 */
inline std::optional<int64_t> find_int(const std::string& body, const char* key) {
    auto text = find_string(body, key);
    if (!text || text->empty()) return std::nullopt;

    char* end = nullptr;
    long long v = strtoll(text->c_str(), &end, 10);
    if (end == text->c_str()) return std::nullopt;
    return static_cast<int64_t>(v);
}

inline std::optional<double> find_double(const std::string& body, const char* key) {
    auto text = find_string(body, key);
    if (!text || text->empty()) return std::nullopt;

    char* end = nullptr;
    double v = strtod(text->c_str(), &end);
    if (end == text->c_str()) return std::nullopt;
    return v;
}

} // namespace json
} // namespace coverage
