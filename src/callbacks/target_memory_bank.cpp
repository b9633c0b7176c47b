/// @file src/callbacks/target_memory_bank.cpp
/// @brief TargetMemoryBank — blends each batch's target features and
///        sharpened predictions into the persistent memory bank.

#include "daloop/callbacks.hpp"
#include "daloop/errors.hpp"
#include "daloop/normalizer.hpp"
#include "daloop/pseudo_labels.hpp"

#include <fmt/core.h>

#include <utility>

namespace daloop {

// ─── Constructor ──────────────────────────────────────────────────────────────

TargetMemoryBank::TargetMemoryBank(AdaptationState& state,
                                   TargetMemoryBankConfig config)
    : state_(state), config_(std::move(config)) {
    if (!(config_.momentum >= 0.0 && config_.momentum < 1.0)) {
        throw InvalidArgument(fmt::format(
            "TargetMemoryBank: momentum {} outside [0, 1)", config_.momentum));
    }
}

// ─── on_batch_end ─────────────────────────────────────────────────────────────

void TargetMemoryBank::on_batch_end(Model& net, const Batch& batch) {
    const std::vector<std::size_t> rows = batch.target_rows();
    if (rows.empty()) {
        return;  // source-only batch: nothing to remember
    }

    MemoryBank& memory = state_.memory;
    if (!(net.device() == memory.device())) {
        throw InvalidArgument(fmt::format(
            "TargetMemoryBank: model on '{}' but memory bank on '{}'",
            net.device().name, memory.device().name));
    }

    const DomainDataset target = batch.select(rows);

    ForwardResult out;
    {
        EvalModeGuard eval(net);
        out = net.forward(target.X);
    }

    const Matrix features = FeatureNormalizer::normalize(out.features);
    const Matrix outputs  = PseudoLabels::sharpened_softmax(out.logits);

    memory.update(target.sample_idx, features, outputs,
                  config_.momentum, config_.rule);
    ++batches_applied_;

    if (config_.verbose) {
        fmt::print(stderr,
            "[memory-bank] batch {}: {} target rows updated (momentum={}, rule={})\n",
            batches_applied_, rows.size(), config_.momentum, to_string(config_.rule));
    }
}

} // namespace daloop
