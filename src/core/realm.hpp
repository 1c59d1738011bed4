#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace atrium {

/**
 * ChildOrder - How the children of a realm are ordered.
 */
enum class ChildOrder {
    AlphabeticAsc,
    AlphabeticDesc,
    ByIndex
};

[[nodiscard]] constexpr std::string_view child_order_name(ChildOrder order) {
    switch (order) {
        case ChildOrder::AlphabeticAsc: return "alphabetic:asc";
        case ChildOrder::AlphabeticDesc: return "alphabetic:desc";
        case ChildOrder::ByIndex: return "by_index";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<ChildOrder> parse_child_order(std::string_view name) {
    if (name == "alphabetic:asc") return ChildOrder::AlphabeticAsc;
    if (name == "alphabetic:desc") return ChildOrder::AlphabeticDesc;
    if (name == "by_index") return ChildOrder::ByIndex;
    return std::nullopt;
}

/**
 * Realm - A node of the page tree.
 *
 * Parent links are plain keys; children are found by query, never stored.
 * `full_path` is derived: parent's full path + "/" + path_segment. The root
 * has key 0, no parent, an empty segment and the empty full path.
 */
struct Realm {
    Key id{0};
    std::optional<Key> parent_id;
    std::string name;
    std::string path_segment;
    std::string full_path;
    ChildOrder child_order{ChildOrder::AlphabeticAsc};
    int index{0};  // position among siblings in manual order

    [[nodiscard]] bool is_root() const noexcept { return !parent_id.has_value(); }

    bool operator==(const Realm&) const = default;
};

inline constexpr Key ROOT_REALM_ID = 0;

namespace realm_path {

/**
 * Characters that may not appear anywhere in a path segment.
 */
inline constexpr std::string_view ILLEGAL_CHARS = "<>\"[\\]^`{|}#%/?";

/**
 * Characters a path segment may not start with. They are kept free for
 * special routes (e.g. "@" user realms, "~" internal pages).
 */
inline constexpr std::string_view RESERVED_CHARS = "-+~@_!$&;:.,=*'()";

inline constexpr char USER_REALM_PREFIX = '@';

[[nodiscard]] inline bool is_control(char32_t c) {
    return c < 0x20 || (c >= 0x7F && c <= 0x9F);
}

[[nodiscard]] inline bool is_whitespace(char32_t c) {
    switch (c) {
        case 0x20: case 0x09: case 0x0A: case 0x0B: case 0x0C: case 0x0D:
        case 0x85: case 0xA0: case 0x1680: case 0x2028: case 0x2029:
        case 0x202F: case 0x205F: case 0x3000:
            return true;
        default:
            return c >= 0x2000 && c <= 0x200A;
    }
}

/**
 * Decode UTF-8 into code points. Returns nullopt for malformed input,
 * including overlong forms, surrogates and code points above U+10FFFF.
 */
[[nodiscard]] inline std::optional<std::vector<char32_t>> decode_utf8(std::string_view s) {
    std::vector<char32_t> out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        auto b = static_cast<unsigned char>(s[i]);
        int extra = 0;
        char32_t cp = 0;
        char32_t min = 0;
        if (b < 0x80) { cp = b; }
        else if ((b & 0xE0) == 0xC0) { cp = b & 0x1F; extra = 1; min = 0x80; }
        else if ((b & 0xF0) == 0xE0) { cp = b & 0x0F; extra = 2; min = 0x800; }
        else if ((b & 0xF8) == 0xF0) { cp = b & 0x07; extra = 3; min = 0x10000; }
        else { return std::nullopt; }

        if (s.size() - i <= static_cast<size_t>(extra)) return std::nullopt;
        for (int k = 1; k <= extra; ++k) {
            auto cont = static_cast<unsigned char>(s[i + k]);
            if ((cont & 0xC0) != 0x80) return std::nullopt;
            cp = (cp << 6) | (cont & 0x3F);
        }
        if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return std::nullopt;
        }
        out.push_back(cp);
        i += static_cast<size_t>(extra) + 1;
    }
    return out;
}

[[nodiscard]] inline Result<void> invalid_utf8(std::string_view what) {
    return Result<void>::err(Error::validation(
        ValidationRule::InvalidValue, std::string(what) + " is not valid UTF-8"));
}

/**
 * Validate a path segment. Rules are checked in a fixed order and the first
 * violated one is reported. Only user realms may start with a reserved
 * character, see user_realm_segment().
 */
[[nodiscard]] inline Result<void> validate_segment(std::string_view segment,
                                                   bool allow_reserved_start = false) {
    if (segment.empty()) {
        return Result<void>::err(Error::validation(
            ValidationRule::PathEmpty, "Path segment must not be empty"));
    }

    const auto decoded = decode_utf8(segment);
    if (!decoded) return invalid_utf8("Path segment");
    const auto& chars = *decoded;
    if (chars.size() < 2) {
        return Result<void>::err(Error::validation(
            ValidationRule::PathTooShort, "Path segment must be at least two characters long"));
    }

    for (char32_t c : chars) {
        if (is_control(c)) {
            return Result<void>::err(Error::validation(
                ValidationRule::ControlChar, "Path segment may not include control characters"));
        }
    }
    for (char32_t c : chars) {
        if (is_whitespace(c)) {
            return Result<void>::err(Error::validation(
                ValidationRule::Whitespace, "Path segment may not include whitespace characters"));
        }
    }
    for (char32_t c : chars) {
        if (c < 0x80 && ILLEGAL_CHARS.find(static_cast<char>(c)) != std::string_view::npos) {
            return Result<void>::err(Error::validation(
                ValidationRule::IllegalChar,
                "Path segment may not include the following characters: " + std::string(ILLEGAL_CHARS)));
        }
    }
    if (!allow_reserved_start && chars.front() < 0x80 &&
        RESERVED_CHARS.find(static_cast<char>(chars.front())) != std::string_view::npos) {
        return Result<void>::err(Error::validation(
            ValidationRule::ReservedLeadingChar,
            "Path segment may not start with the following characters: " + std::string(RESERVED_CHARS)));
    }

    return Result<void>::ok();
}

[[nodiscard]] inline Result<void> validate_name(std::string_view name) {
    const auto decoded = decode_utf8(name);
    if (!decoded) return invalid_utf8("Name");
    const auto& chars = *decoded;
    if (std::all_of(chars.begin(), chars.end(), [](char32_t c) { return is_whitespace(c); })) {
        return Result<void>::err(Error::validation(
            ValidationRule::NameEmpty, "Name must not be empty"));
    }
    return Result<void>::ok();
}

/**
 * Materialized path of a child below a parent with the given full path.
 */
[[nodiscard]] inline std::string join(std::string_view parent_path, std::string_view segment) {
    std::string out(parent_path);
    out += '/';
    out += segment;
    return out;
}

/**
 * Path segment of a user's personal realm ("@" + username).
 */
[[nodiscard]] inline std::string user_realm_segment(std::string_view username) {
    std::string out(1, USER_REALM_PREFIX);
    out += username;
    return out;
}

/**
 * If `path` lies inside a user realm, return that realm's owner.
 */
[[nodiscard]] inline std::optional<std::string> user_realm_owner(std::string_view path) {
    if (path.size() < 3 || path[0] != '/' || path[1] != USER_REALM_PREFIX) {
        return std::nullopt;
    }
    auto end = path.find('/', 1);
    auto owner = path.substr(2, end == std::string_view::npos ? std::string_view::npos : end - 2);
    if (owner.empty()) return std::nullopt;
    return std::string(owner);
}

} // namespace realm_path

/**
 * Sort siblings for presentation according to the parent's ordering mode.
 */
inline void sort_children(std::vector<Realm>& children, ChildOrder order) {
    switch (order) {
        case ChildOrder::AlphabeticAsc:
            std::stable_sort(children.begin(), children.end(),
                [](const Realm& a, const Realm& b) { return a.name < b.name; });
            break;
        case ChildOrder::AlphabeticDesc:
            std::stable_sort(children.begin(), children.end(),
                [](const Realm& a, const Realm& b) { return a.name > b.name; });
            break;
        case ChildOrder::ByIndex:
            std::stable_sort(children.begin(), children.end(),
                [](const Realm& a, const Realm& b) { return a.index < b.index; });
            break;
    }
}

} // namespace atrium
