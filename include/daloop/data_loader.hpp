#pragma once

/// @file include/daloop/data_loader.hpp
/// @brief CSV loader for domain-tagged datasets.
///
/// # Module: DataLoader
///
/// ## Expected CSV Format
/// ```
/// sample_idx,domain,label,f0,f1
/// 0,1,0,0.12,-1.40
/// 1,1,1,0.88,0.31
/// 2,-2,,0.45,0.02
/// ```
/// The first non-comment line is the header; its column count fixes the
/// feature dimension (columns − 3). An empty label or `-` means unlabelled.
///
/// ## Row Policy
/// - Wrong field count, unparsable or non-finite number: row skipped
/// - sample_idx, domain and label must be plain decimal integers ("1.0",
///   "1e3" and out-of-range values are rejected)
/// - Negative or repeated sample_idx: row skipped
/// - Target row with a label: loaded, label dropped (target labels never
///   reach the training components)
///
/// ## Guarantees
/// - Never throws; returns `nullopt` when the file cannot be opened
/// - The returned dataset always passes DomainDataset::validate()

#include "daloop/dataset.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace daloop {

class DataLoader {
public:
    /// Load a dataset from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Empty dataset if there is no header or no valid row
    [[nodiscard]] static std::optional<DomainDataset>
    load_csv(const std::string& filepath) noexcept;

    /// Parse a dataset from CSV text (same format as load_csv).
    [[nodiscard]] static DomainDataset
    parse_csv_string(const std::string& csv_content) noexcept;

private:
    struct ParsedRow {
        SampleIndex         sample_idx;
        int                 domain;
        std::optional<int>  label;
        std::vector<double> features;
    };

    /// Parse one data row with exactly `n_features` feature columns.
    [[nodiscard]] static std::optional<ParsedRow>
    parse_row(const std::string& line, std::size_t n_features) noexcept;

    /// Parse a finite double occupying the whole token.
    [[nodiscard]] static std::optional<double>
    parse_number(std::string_view token) noexcept;
};

} // namespace daloop
