#pragma once

#include "storage/database.hpp"
#include "core/block_types.hpp"
#include "core/result.hpp"
#include <optional>
#include <vector>

namespace atrium::storage {

/**
 * BlockRepository - Data access layer for blocks.
 *
 * Positions are kept dense (0..n-1) and unique per realm. Shifts move the
 * affected rows through negative indices first so the UNIQUE (realm_id, idx)
 * constraint holds after every single statement. Callers run the position
 * operations inside a write transaction.
 */
class BlockRepository {
public:
    explicit BlockRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<std::optional<blocks::Block>, Error> get(Key id);

    /**
     * All blocks of a realm ordered by position.
     */
    [[nodiscard]] Result<std::vector<blocks::Block>, Error> get_by_realm(Key realm_id);

    [[nodiscard]] Result<int, Error> count_by_realm(Key realm_id);

    /**
     * Insert at `index`, shifting the blocks at and after it down by one.
     */
    [[nodiscard]] Result<blocks::Block, Error> insert_at(Key realm_id, int index,
                                                         const blocks::BlockContent& content);

    /**
     * Remove the block at `index`, closing the gap.
     */
    [[nodiscard]] Result<void, Error> remove_at(Key realm_id, int index);

    /**
     * Exchange the blocks at positions `a` and `b`.
     */
    [[nodiscard]] Result<void, Error> swap(Key realm_id, int a, int b);

    /**
     * Replace the content of a block. The block type stays as stored.
     */
    [[nodiscard]] Result<void, Error> update_content(Key id, const blocks::BlockContent& content);

private:
    Database& db_;

    [[nodiscard]] blocks::Block row_to_block(Statement& stmt);
    void bind_content(Statement& stmt, int first, const blocks::BlockContent& content);
    [[nodiscard]] Result<void, Error> run(const std::string& sql, Key realm_id, int index);
};

} // namespace atrium::storage
