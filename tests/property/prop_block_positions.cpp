#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "core/block_types.hpp"
#include "tree/tree_service.hpp"

#include "support/test_data.hpp"

using namespace atrium;
using namespace atrium::blocks;

namespace {

struct BlockOp {
    int type = 0;  // 0 insert, 1 remove, 2 move up, 3 move down
    int position = 0;
};

std::vector<std::string> labels(const std::vector<Block>& list) {
    std::vector<std::string> out;
    for (const auto& block : list) out.push_back(std::get<Title>(block.content).text);
    return out;
}

} // namespace

TEST_CASE("Property: block positions stay dense", "[property][blocks]") {
    rc::check("the stored list matches the list model after every operation", [] {
        const auto ops = *rc::gen::container<std::vector<BlockOp>>(rc::gen::build<BlockOp>(
            rc::gen::set(&BlockOp::type, rc::gen::inRange(0, 4)),
            rc::gen::set(&BlockOp::position, rc::gen::inRange(-1, 8))));

        auto db = test::migrated_memory_db();
        tree::TreeService tree(db, acl::Resolver{});
        const auto user = test::admin();
        const auto realm = tree.add_child(user, ROOT_REALM_ID, "Page", "page").unwrap();

        std::vector<Block> model;
        int next_label = 0;
        for (const auto& op : ops) {
            const auto n = static_cast<int>(model.size());
            const bool valid_index = op.position >= 0 && op.position < n;
            Result<tree::RealmBlocks> result = Result<tree::RealmBlocks>::err(Error{});
            bool expect_ok = false;

            switch (op.type) {
                case 0: {
                    const Title title{"b" + std::to_string(next_label++)};
                    result = tree.insert_block(user, realm.id, op.position, title);
                    expect_ok = op.position >= 0 && op.position <= n;
                    if (expect_ok) {
                        RC_ASSERT(insert_at(model, static_cast<size_t>(op.position),
                                            Block{0, realm.id, 0, title}));
                    }
                    break;
                }
                case 1:
                    result = tree.remove_block(user, realm.id, op.position);
                    expect_ok = valid_index;
                    if (expect_ok) RC_ASSERT(remove_at(model, static_cast<size_t>(op.position)));
                    break;
                case 2:
                    result = tree.move_block_up(user, realm.id, op.position);
                    expect_ok = valid_index && op.position > 0;
                    if (expect_ok) {
                        RC_ASSERT(swap_at(model, static_cast<size_t>(op.position),
                                          static_cast<size_t>(op.position - 1)));
                    }
                    break;
                default:
                    result = tree.move_block_down(user, realm.id, op.position);
                    expect_ok = valid_index && op.position + 1 < n;
                    if (expect_ok) {
                        RC_ASSERT(swap_at(model, static_cast<size_t>(op.position),
                                          static_cast<size_t>(op.position + 1)));
                    }
                    break;
            }

            RC_ASSERT(result.is_ok() == expect_ok);
            if (!expect_ok) {
                RC_ASSERT(result.unwrap_err().rule == ValidationRule::IndexOutOfRange);
                continue;
            }
            const auto& stored = result.unwrap().blocks;
            RC_ASSERT(is_dense(stored));
            RC_ASSERT(labels(stored) == labels(model));
        }
    });
}
