#include "runsync/transfer/planner.hpp"

#include <spdlog/spdlog.h>

#include <set>

namespace runsync::transfer {

using model::DataKind;
using model::MlFileType;
using model::StorageStatus;

namespace {

struct Candidate {
    std::string source_unit;
    std::string target_unit;
    std::optional<MlFileType> file_type;
    std::string filename;
    std::uint64_t size = 0;
    std::optional<std::uint64_t> target_size;
};

void classify(const Candidate& candidate,
              TransferOperation operation,
              ConflictPolicy policy,
              const ItemLocator& locate,
              TransferPlan& plan) {
    TransferItem item;
    item.from = source_side(operation);
    item.source_unit = candidate.source_unit;
    item.target_unit = candidate.target_unit;
    item.file_type = candidate.file_type;
    item.filename = candidate.filename;
    item.size = candidate.size;

    if (candidate.target_size) {
        if (*candidate.target_size == candidate.size) {
            plan.already_synced.push_back(item.label());
            return;
        }

        plan.conflicts.push_back(Conflict{candidate.source_unit, candidate.target_unit, candidate.file_type,
                                          candidate.filename, candidate.size, *candidate.target_size});
        if (policy != ConflictPolicy::Overwrite) {
            return;
        }
        item.overwrite = true;
    }

    locate(item);
    plan.items.push_back(std::move(item));
}

std::optional<std::uint64_t> find_size(const model::FileSizes& files, const std::string& name) {
    auto it = files.find(name);
    if (it == files.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace

std::vector<std::string> select_units(const StorageStatus& source, const Selection& selection) {
    auto names = source.unit_names();
    if (selection.selects_all_units()) {
        return names;
    }

    std::set<std::string> chosen;
    for (auto index : selection.unit_indices) {
        if (index >= names.size()) {
            spdlog::warn("Ignoring unit index {} (source has {} units)", index, names.size());
            continue;
        }
        chosen.insert(names[index]);
    }
    for (const auto& name : selection.unit_names) {
        if (!source.has_unit(name)) {
            spdlog::warn("Ignoring unknown unit '{}'", name);
            continue;
        }
        chosen.insert(name);
    }

    std::vector<std::string> selected;
    for (const auto& name : names) {
        if (chosen.count(name) > 0) {
            selected.push_back(name);
        }
    }
    return selected;
}

Result<TransferPlan> build_plan(TransferOperation operation,
                                const model::RunCoordinate& coord,
                                const StorageStatus& source,
                                const StorageStatus& target,
                                const TransferOptions& options,
                                const paths::PathTranslator& translator,
                                const ItemLocator& locate) {
    TransferPlan plan(operation, coord);
    const auto kind = kind_of(operation);
    const auto from = source_side(operation);

    for (const auto& source_unit : select_units(source, options.selection)) {
        auto translated = translator.translate_unit_name(source_unit, from, kind);
        if (translated.is_error()) {
            return Err<TransferPlan>(translated.error());
        }
        const auto& target_unit = translated.value();

        if (kind == DataKind::Raw) {
            Candidate candidate{source_unit, target_unit, std::nullopt, {},
                                source.unit_size(source_unit).value_or(0), target.unit_size(target_unit)};
            classify(candidate, operation, options.policy, locate, plan);
            continue;
        }

        auto source_bag = source.bag_files.find(source_unit);
        if (source_bag == source.bag_files.end()) {
            continue;
        }
        auto target_bag = target.bag_files.find(target_unit);

        for (auto type : {MlFileType::Frames, MlFileType::Labels}) {
            if (!options.selection.selects_type(type)) {
                continue;
            }
            for (const auto& [filename, size] : source_bag->second.files(type)) {
                std::optional<std::uint64_t> target_size;
                if (target_bag != target.bag_files.end()) {
                    target_size = find_size(target_bag->second.files(type), filename);
                }
                classify(Candidate{source_unit, target_unit, type, filename, size, target_size},
                         operation, options.policy, locate, plan);
            }
        }
    }

    spdlog::debug("Planned {} at {}: {} items ({} bytes), {} conflicts, {} already synchronized",
                  to_string(operation), coord.to_string(), plan.items.size(), plan.total_bytes(),
                  plan.conflicts.size(), plan.already_synced.size());
    return Ok(std::move(plan));
}

} // namespace runsync::transfer
