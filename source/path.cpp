// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// path.cpp - Wire path operations and canonical string parsing

#include <ydelta/path.h>
#include <ydelta/errors.h>
#include <ydelta/log.h>

namespace ydelta {

// ============================================================
// Path operations
// ============================================================

Path Path::from_schema_path(const SchemaPath& schema_path)
{
    Path result;
    result.elems_.reserve(schema_path.size());
    for (const auto& segment : schema_path) {
        result.elems_.emplace_back(segment);
    }
    return result;
}

void Path::pop_back()
{
    if (elems_.empty()) {
        throw DiffError(DiffErrorCode::InvalidPath, "cannot remove last element of an empty path");
    }
    elems_.pop_back();
}

Path Path::parent() const
{
    Path copy = *this;
    copy.pop_back();
    return copy;
}

Path Path::join(const Path& suffix) const
{
    Path result = *this;
    result.elems_.insert(result.elems_.end(), suffix.elems_.begin(), suffix.elems_.end());
    return result;
}

bool Path::has_prefix(const Path& prefix) const
{
    if (prefix.size() > size()) {
        return false;
    }
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (!(elems_[i] == prefix.elems_[i])) {
            return false;
        }
    }
    return true;
}

Path Path::strip_prefix(const Path& prefix) const
{
    if (!has_prefix(prefix)) {
        throw DiffError(DiffErrorCode::InvalidPath,
                        path_to_string(prefix) + " is not a prefix of " + path_to_string(*this));
    }
    return Path{container_type(elems_.begin() + static_cast<std::ptrdiff_t>(prefix.size()), elems_.end())};
}

std::string Path::to_string() const
{
    return path_to_string(*this);
}

// ============================================================
// Rendering
// ============================================================

namespace {

void append_escaped(std::string& out, std::string_view text, std::string_view specials)
{
    for (char c : text) {
        if (specials.find(c) != std::string_view::npos) {
            out += '\\';
        }
        out += c;
    }
}

constexpr std::string_view kNameSpecials     = "/[]=\\";
constexpr std::string_view kKeyNameSpecials  = "=]\\";
constexpr std::string_view kKeyValueSpecials = "]\\";

} // anonymous namespace

std::string key_predicate_string(const std::map<std::string, std::string>& keys)
{
    std::string result;
    for (const auto& [k, v] : keys) {
        result += '[';
        append_escaped(result, k, kKeyNameSpecials);
        result += '=';
        append_escaped(result, v, kKeyValueSpecials);
        result += ']';
    }
    return result;
}

std::string path_elem_to_string(const PathElem& elem)
{
    std::string result;
    append_escaped(result, elem.name, kNameSpecials);
    result += key_predicate_string(elem.keys);
    return result;
}

std::string path_to_string(const Path& path)
{
    if (path.empty()) {
        return "/";
    }
    std::string result;
    for (const auto& elem : path) {
        result += '/';
        result += path_elem_to_string(elem);
    }
    return result;
}

// ============================================================
// Parsing
// ============================================================

namespace {

class PathParser {
public:
    explicit PathParser(std::string_view text) : text_(text) {}

    Path parse()
    {
        Path result;
        if (peek() == '/') {
            ++pos_;
        }
        while (pos_ < text_.size()) {
            result.push_back(parse_elem());
            if (pos_ < text_.size()) {
                if (text_[pos_] != '/') {
                    fail("expected '/' after path element");
                }
                ++pos_;
                if (pos_ == text_.size()) {
                    fail("trailing '/'");
                }
            }
        }
        return result;
    }

private:
    char peek() const { return pos_ < text_.size() ? text_[pos_] : '\0'; }

    [[noreturn]] void fail(std::string_view reason) const
    {
        std::string context = "path '" + std::string(text_) + "' at offset " + std::to_string(pos_);
        detail::log_error("string_to_path", context, reason);
        throw DiffError(DiffErrorCode::InvalidPath, "invalid " + context + ": " + std::string(reason));
    }

    /// Read up to (not including) the first unescaped char of stops.
    std::string read_until(std::string_view stops, bool stop_required)
    {
        std::string out;
        while (pos_ < text_.size()) {
            char c = text_[pos_];
            if (c == '\\') {
                if (pos_ + 1 >= text_.size()) {
                    fail("dangling escape");
                }
                out += text_[pos_ + 1];
                pos_ += 2;
                continue;
            }
            if (stops.find(c) != std::string_view::npos) {
                return out;
            }
            out += c;
            ++pos_;
        }
        if (stop_required) {
            fail("unterminated key predicate");
        }
        return out;
    }

    PathElem parse_elem()
    {
        PathElem elem;
        elem.name = read_until("/[", false);
        if (elem.name.empty()) {
            fail("empty element name");
        }
        while (peek() == '[') {
            ++pos_;
            std::string key = read_until("=]", true);
            if (peek() != '=') {
                fail("missing '=' in key predicate");
            }
            if (key.empty()) {
                fail("empty key name");
            }
            ++pos_;
            std::string value = read_until("]", true);
            ++pos_;
            if (!elem.keys.emplace(std::move(key), std::move(value)).second) {
                fail("duplicate key in predicate");
            }
        }
        return elem;
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

} // anonymous namespace

Path string_to_path(std::string_view text)
{
    return PathParser{text}.parse();
}

} // namespace ydelta
