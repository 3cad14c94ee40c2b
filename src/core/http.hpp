// src/core/http.hpp
// Transport-agnostic HTTP/1.1 utilities for the control-server API
//
// This module provides request building and response parsing that can be
// reused over any stream transport (plain TCP or TLS):
//   - POST request building with CRLF-injection checks on headers
//   - Incremental response parsing (status line, headers, body)
//   - Content-Length and chunked transfer encoding
//
// No socket/SSL dependencies.

#pragma once

#include <cctype>
#include <cstdint>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>
#include <vector>
#include <stdexcept>

namespace coverage {
namespace http {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

/**
 * Validate HTTP header key/value for CRLF injection attacks
 *
 * @return true if safe, false if contains CRLF or invalid
 */
inline bool is_valid_header(const std::string& key, const std::string& value) {
    if (key.find("\r\n") != std::string::npos || key.find('\n') != std::string::npos) {
        return false;
    }
    if (value.find("\r\n") != std::string::npos || value.find('\n') != std::string::npos) {
        return false;
    }
    if (key.empty()) {
        return false;
    }
    return true;
}

/**
 * Success iff 200 <= status < 300
 */
inline bool is_success(int status) {
    return status >= 200 && status < 300;
}

/**
 * Build HTTP/1.1 POST request with a JSON body
 *
 * @param host Host header value
 * @param path Request target (e.g., "/RMBTControlServer/coverageRequest")
 * @param custom_headers Additional headers, invalid ones are skipped
 * @param body Request body
 * @return Complete request bytes
 */
inline std::string build_post_request(
    const std::string& host,
    const std::string& path,
    const HeaderList& custom_headers,
    const std::string& body)
{
    std::string request;
    request.reserve(512 + body.size());

    request += "POST ";
    request += path;
    request += " HTTP/1.1\r\n";
    request += "Host: ";
    request += host;
    request += "\r\n";
    request += "Content-Type: application/json\r\n";
    request += "Accept: application/json\r\n";
    request += "Content-Length: ";
    request += std::to_string(body.size());
    request += "\r\n";
    request += "Connection: close\r\n";

    for (const auto& [key, value] : custom_headers) {
        if (!is_valid_header(key, value)) {
            continue;  // Skip invalid headers
        }
        request += key;
        request += ": ";
        request += value;
        request += "\r\n";
    }

    request += "\r\n";
    request += body;
    return request;
}

inline bool iequals(const std::string& a, const char* b) {
    size_t n = strlen(b);
    if (a.size() != n) return false;
    for (size_t i = 0; i < n; ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

/**
 * Parsed HTTP response
 */
struct Response {
    int status = 0;
    HeaderList headers;
    std::string body;

    const std::string* header(const char* name) const {
        for (const auto& h : headers) {
            if (iequals(h.first, name)) return &h.second;
        }
        return nullptr;
    }
};

enum class ParseResult : uint8_t {
    Incomplete = 0,  // need more bytes
    Complete,
    Invalid,
};

/**
 * Decode a chunked body
 *
 * @return Complete when the terminating chunk was seen
 */
inline ParseResult decode_chunked(const char* data, size_t len, std::string& out) {
    size_t pos = 0;
    out.clear();
    for (;;) {
        const char* line_end = static_cast<const char*>(memmem(data + pos, len - pos, "\r\n", 2));
        if (!line_end) return ParseResult::Incomplete;

        char* end = nullptr;
        unsigned long chunk = strtoul(data + pos, &end, 16);
        if (end == data + pos) return ParseResult::Invalid;

        pos = static_cast<size_t>(line_end - data) + 2;
        if (chunk == 0) {
            return ParseResult::Complete;  // trailers are ignored
        }
        if (len - pos < chunk + 2) return ParseResult::Incomplete;

        out.append(data + pos, chunk);
        pos += chunk + 2;
    }
}

/**
 * Parse a buffered HTTP response
 *
 * @param data Bytes received so far
 * @param len Number of bytes
 * @param eof True when the peer closed the connection
 * @param out Parsed response (valid when Complete)
 */
inline ParseResult parse_response(const char* data, size_t len, bool eof, Response& out) {
    const char* header_end = static_cast<const char*>(memmem(data, len, "\r\n\r\n", 4));
    if (!header_end) {
        return eof ? ParseResult::Invalid : ParseResult::Incomplete;
    }

    // Status line: HTTP/1.x SSS Reason
    if (len < 12 || strncmp(data, "HTTP/1.", 7) != 0) {
        return ParseResult::Invalid;
    }
    const char* sp = static_cast<const char*>(memchr(data, ' ', header_end - data));
    if (!sp) return ParseResult::Invalid;
    out.status = atoi(sp + 1);
    if (out.status < 100 || out.status > 599) {
        return ParseResult::Invalid;
    }

    out.headers.clear();
    const char* line = static_cast<const char*>(memmem(data, header_end - data + 2, "\r\n", 2)) + 2;
    while (line < header_end) {
        const char* eol = static_cast<const char*>(memmem(line, header_end - line + 2, "\r\n", 2));
        if (!eol) break;
        const char* colon = static_cast<const char*>(memchr(line, ':', eol - line));
        if (colon) {
            std::string key(line, colon - line);
            const char* v = colon + 1;
            while (v < eol && (*v == ' ' || *v == '\t')) ++v;
            out.headers.emplace_back(std::move(key), std::string(v, eol - v));
        }
        line = eol + 2;
    }

    const char* body = header_end + 4;
    size_t body_len = len - static_cast<size_t>(body - data);

    const std::string* te = out.header("Transfer-Encoding");
    if (te && te->find("chunked") != std::string::npos) {
        return decode_chunked(body, body_len, out.body);
    }

    const std::string* cl = out.header("Content-Length");
    if (cl) {
        size_t expected = static_cast<size_t>(strtoull(cl->c_str(), nullptr, 10));
        if (body_len < expected) {
            return eof ? ParseResult::Invalid : ParseResult::Incomplete;
        }
        out.body.assign(body, expected);
        return ParseResult::Complete;
    }

    // No framing: body runs until connection close
    if (!eof) return ParseResult::Incomplete;
    out.body.assign(body, body_len);
    return ParseResult::Complete;
}

} // namespace http
} // namespace coverage
