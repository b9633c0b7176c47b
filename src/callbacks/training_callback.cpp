/// @file src/callbacks/training_callback.cpp
/// @brief Default no-op hooks.

#include "daloop/callbacks.hpp"

namespace daloop {

void TrainingCallback::on_epoch_begin(Model& /*net*/, const DomainDataset& /*train*/) {}

void TrainingCallback::on_batch_end(Model& /*net*/, const Batch& /*batch*/) {}

} // namespace daloop
