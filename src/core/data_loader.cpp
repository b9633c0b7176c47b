/// @file src/core/data_loader.cpp
/// @brief CSV DataLoader for domain-tagged datasets.

#include "daloop/data_loader.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unordered_set>
#include <utility>

namespace daloop {

namespace {

/// Trim leading/trailing whitespace.
std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

/// Split on ',' keeping empty fields.
std::vector<std::string_view> split(std::string_view line) {
    std::vector<std::string_view> out;
    std::size_t start = 0;
    while (true) {
        const auto comma = line.find(',', start);
        if (comma == std::string_view::npos) {
            out.push_back(trim(line.substr(start)));
            break;
        }
        out.push_back(trim(line.substr(start, comma - start)));
        start = comma + 1;
    }
    return out;
}

/// Parse a decimal integer occupying the whole token; nullopt on overflow.
template <typename T>
std::optional<T> parse_integer(std::string_view token) noexcept {
    T value{};
    const char* first = token.data();
    const char* last  = token.data() + token.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (token.empty() || ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

}  // anonymous namespace

// ─── DataLoader::parse_number ─────────────────────────────────────────────────

std::optional<double> DataLoader::parse_number(std::string_view token) noexcept {
    if (token.empty()) {
        return std::nullopt;
    }
    const std::string buf(token);
    char* end = nullptr;
    const double val = std::strtod(buf.c_str(), &end);
    if (end != buf.c_str() + buf.size()) {
        return std::nullopt;  // trailing garbage
    }
    if (!std::isfinite(val)) {
        return std::nullopt;
    }
    return val;
}

// ─── DataLoader::parse_row ────────────────────────────────────────────────────

std::optional<DataLoader::ParsedRow>
DataLoader::parse_row(const std::string& line, std::size_t n_features) noexcept {
    // Skip blank lines and comment lines.
    if (line.empty() || line[0] == '#') {
        return std::nullopt;
    }

    const auto fields = split(line);
    if (fields.size() != n_features + 3) {
        return std::nullopt;
    }

    const auto idx = parse_integer<SampleIndex>(fields[0]);
    const auto dom = parse_integer<int>(fields[1]);
    if (!idx || !dom || *idx < 0) {
        return std::nullopt;
    }

    ParsedRow row{
        .sample_idx = *idx,
        .domain     = *dom,
        .label      = std::nullopt,
        .features   = {},
    };

    if (!fields[2].empty() && fields[2] != "-") {
        const auto y = parse_integer<int>(fields[2]);
        if (!y || *y < 0) {
            return std::nullopt;
        }
        // Target labels are dropped at load time.
        if (is_source(row.domain)) {
            row.label = *y;
        }
    }

    row.features.reserve(n_features);
    for (std::size_t j = 0; j < n_features; ++j) {
        const auto v = parse_number(fields[3 + j]);
        if (!v) {
            return std::nullopt;
        }
        row.features.push_back(*v);
    }
    return row;
}

// ─── DataLoader::parse_csv_string ────────────────────────────────────────────

DomainDataset DataLoader::parse_csv_string(const std::string& csv_content) noexcept {
    std::istringstream stream(csv_content);
    std::string line;
    std::size_t n_features = 0;
    bool header_seen = false;

    std::vector<ParsedRow> rows;
    std::unordered_set<SampleIndex> seen;

    while (std::getline(stream, line)) {
        // Trim carriage return.
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (!header_seen) {
            // First non-empty, non-comment line is the header.
            if (!line.empty() && line[0] != '#') {
                const auto columns = split(line);
                if (columns.size() < 4) {
                    return DomainDataset{};  // no feature column
                }
                n_features = columns.size() - 3;
                header_seen = true;
            }
            continue;
        }

        auto row = parse_row(line, n_features);
        if (row && seen.insert(row->sample_idx).second) {
            rows.push_back(std::move(*row));
        }
    }

    DomainDataset ds;
    ds.X.resize(static_cast<Eigen::Index>(rows.size()),
                static_cast<Eigen::Index>(n_features));
    ds.domain.reserve(rows.size());
    ds.sample_idx.reserve(rows.size());
    ds.label.reserve(rows.size());
    for (std::size_t i = 0; i < rows.size(); ++i) {
        for (std::size_t j = 0; j < n_features; ++j) {
            ds.X(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) =
                rows[i].features[j];
        }
        ds.domain.push_back(rows[i].domain);
        ds.sample_idx.push_back(rows[i].sample_idx);
        ds.label.push_back(rows[i].label);
    }
    return ds;
}

// ─── DataLoader::load_csv ────────────────────────────────────────────────────

std::optional<DomainDataset> DataLoader::load_csv(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str());
}

} // namespace daloop
