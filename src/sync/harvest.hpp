#pragma once

#include "core/mirror.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

namespace atrium::sync {

/**
 * HarvestSource - Pull based change feed of the external video system.
 *
 * fetch() returns the change records after `cursor`, the cursor to continue
 * from and whether more records are immediately available. The feed is
 * at-least-once: a batch may repeat records and may be fetched again from
 * the same cursor after a failure.
 *
 * Errors: TransientHarvest for network trouble and timeouts, Protocol for
 * payloads that cannot be understood.
 */
class HarvestSource {
public:
    virtual ~HarvestSource() = default;

    [[nodiscard]] virtual Result<HarvestBatch> fetch(const HarvestCursor& cursor) = 0;
};

} // namespace atrium::sync
