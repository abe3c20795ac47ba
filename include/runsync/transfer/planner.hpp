#pragma once

#include "runsync/core/result.hpp"
#include "runsync/model/coordinate.hpp"
#include "runsync/model/types.hpp"
#include "runsync/paths/path_translator.hpp"
#include "runsync/transfer/types.hpp"

#include <functional>
#include <string>
#include <vector>

namespace runsync::transfer {

/// Fills an item's local path, bucket and key from its units.
using ItemLocator = std::function<void(TransferItem&)>;

/**
 * @brief Classify every selected source unit against the target
 *
 * Each source name is translated to the target convention and looked up
 * there: same size is already synchronized, different size is a conflict
 * (also planned with overwrite=true under ConflictPolicy::Overwrite), absent
 * is a transfer item. Raw statuses are compared per bag, ML statuses per
 * file inside each bag.
 *
 * A selected source name outside its side's convention fails the whole plan
 * with InvalidNameFormat.
 */
Result<TransferPlan> build_plan(TransferOperation operation,
                                const model::RunCoordinate& coord,
                                const model::StorageStatus& source,
                                const model::StorageStatus& target,
                                const TransferOptions& options,
                                const paths::PathTranslator& translator,
                                const ItemLocator& locate);

/// Source unit names picked by `selection`, in source order.
std::vector<std::string> select_units(const model::StorageStatus& source, const Selection& selection);

} // namespace runsync::transfer
