#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <cstddef>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace atrium::blocks {

/**
 * Order in which a series block lists its videos.
 */
enum class VideoListOrder {
    NewToOld,
    OldToNew
};

[[nodiscard]] constexpr std::string_view order_name(VideoListOrder order) {
    switch (order) {
        case VideoListOrder::NewToOld: return "new_to_old";
        case VideoListOrder::OldToNew: return "old_to_new";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<VideoListOrder> parse_order(std::string_view name) {
    if (name == "new_to_old") return VideoListOrder::NewToOld;
    if (name == "old_to_new") return VideoListOrder::OldToNew;
    return std::nullopt;
}

/**
 * Block content types. Series and video blocks reference mirrored entities by
 * local key; a null reference means the entity is gone and the block renders
 * as a "deleted" placeholder.
 */

struct Title {
    std::string text;

    bool operator==(const Title&) const = default;
};

struct Text {
    std::string text;

    bool operator==(const Text&) const = default;
};

struct SeriesRef {
    std::optional<Key> series;
    bool show_title{true};
    bool show_metadata{false};
    VideoListOrder order{VideoListOrder::NewToOld};

    bool operator==(const SeriesRef&) const = default;
};

struct VideoRef {
    std::optional<Key> event;
    bool show_title{true};

    bool operator==(const VideoRef&) const = default;
};

/**
 * BlockContent - Closed sum type over all block kinds.
 */
using BlockContent = std::variant<
    Title,
    Text,
    SeriesRef,
    VideoRef
>;

enum class BlockType {
    Title,
    Text,
    Series,
    Video
};

[[nodiscard]] constexpr BlockType get_type(const BlockContent& content) {
    return std::visit([](const auto& c) -> BlockType {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, Title>) return BlockType::Title;
        else if constexpr (std::is_same_v<T, Text>) return BlockType::Text;
        else if constexpr (std::is_same_v<T, SeriesRef>) return BlockType::Series;
        else if constexpr (std::is_same_v<T, VideoRef>) return BlockType::Video;
    }, content);
}

[[nodiscard]] constexpr std::string_view type_name(BlockType type) {
    switch (type) {
        case BlockType::Title: return "title";
        case BlockType::Text: return "text";
        case BlockType::Series: return "series";
        case BlockType::Video: return "video";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<BlockType> parse_type(std::string_view name) {
    if (name == "title") return BlockType::Title;
    if (name == "text") return BlockType::Text;
    if (name == "series") return BlockType::Series;
    if (name == "video") return BlockType::Video;
    return std::nullopt;
}

/**
 * Block - One unit of content on a realm.
 *
 * `index` is the dense, zero based position within the owning realm.
 */
struct Block {
    Key id{0};
    Key realm_id{0};
    int index{0};
    BlockContent content;

    bool operator==(const Block&) const = default;
};

// ============================================================================
// Pure list operations
//
// These operate on a realm's block list ordered by index and keep the indices
// dense. The repository performs the same moves in SQL; these are the model.
// ============================================================================

/**
 * Renumber indices to 0..n-1 in list order.
 */
inline void renumber(std::vector<Block>& list) {
    for (size_t i = 0; i < list.size(); ++i) {
        list[i].index = static_cast<int>(i);
    }
}

/**
 * True if indices are exactly 0..n-1 in list order.
 */
[[nodiscard]] inline bool is_dense(const std::vector<Block>& list) {
    for (size_t i = 0; i < list.size(); ++i) {
        if (list[i].index != static_cast<int>(i)) return false;
    }
    return true;
}

/**
 * Insert at `index` (0..n), shifting subsequent blocks.
 */
[[nodiscard]] inline bool insert_at(std::vector<Block>& list, size_t index, Block block) {
    if (index > list.size()) return false;
    list.insert(list.begin() + static_cast<std::ptrdiff_t>(index), std::move(block));
    renumber(list);
    return true;
}

/**
 * Remove the block at `index`, closing the gap.
 */
[[nodiscard]] inline bool remove_at(std::vector<Block>& list, size_t index) {
    if (index >= list.size()) return false;
    list.erase(list.begin() + static_cast<std::ptrdiff_t>(index));
    renumber(list);
    return true;
}

/**
 * Exchange the blocks at positions `a` and `b`.
 */
[[nodiscard]] inline bool swap_at(std::vector<Block>& list, size_t a, size_t b) {
    if (a >= list.size() || b >= list.size()) return false;
    std::swap(list[a], list[b]);
    renumber(list);
    return true;
}

} // namespace atrium::blocks
