/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for DataLoader::parse_csv_string
 *
 * Build:
 *   cmake -DDALOOP_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. The returned dataset always passes validate().
 *   3. Every feature value is finite.
 *   4. Target rows never carry a label.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string>

#include "daloop/data_loader.hpp"

using namespace daloop;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input(reinterpret_cast<const char*>(data), size);
    const DomainDataset ds = DataLoader::parse_csv_string(input);

    // Invariant 2: consistent lengths, unique sample indices
    ds.validate();

    // Invariant 3: finite features
    assert(ds.X.allFinite());

    for (std::size_t i = 0; i < ds.size(); ++i) {
        assert(ds.sample_idx[i] >= 0);
        // Invariant 4: target labels are dropped at load time
        if (is_target(ds.domain[i])) {
            assert(!ds.label[i].has_value());
        }
    }
    return 0;
}
