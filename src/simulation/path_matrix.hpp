// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <span>
#include <vector>

namespace mcopt {

/// Row-major storage of simulated price paths
///
/// Shape is n_paths × (n_steps + 1). Column 0 holds the spot, the last
/// column holds S_T.
class PathMatrix {
public:
    PathMatrix() = default;

    PathMatrix(size_t n_paths, size_t n_steps)
        : n_paths_(n_paths)
        , n_columns_(n_steps + 1)
        , data_(n_paths * (n_steps + 1), 0.0)
    {}

    size_t n_paths() const { return n_paths_; }
    size_t n_steps() const { return n_columns_ > 0 ? n_columns_ - 1 : 0; }
    size_t n_columns() const { return n_columns_; }
    bool empty() const { return n_paths_ == 0; }

    std::span<double> row(size_t path) {
        return std::span<double>(data_).subspan(path * n_columns_, n_columns_);
    }

    std::span<const double> row(size_t path) const {
        return std::span<const double>(data_).subspan(path * n_columns_, n_columns_);
    }

    double operator()(size_t path, size_t step) const {
        return data_[path * n_columns_ + step];
    }

    /// Prices of every path at one time step
    std::vector<double> column(size_t step) const {
        std::vector<double> out(n_paths_);
        for (size_t i = 0; i < n_paths_; ++i) {
            out[i] = data_[i * n_columns_ + step];
        }
        return out;
    }

    /// S_T of every path
    std::vector<double> terminal_prices() const {
        return column(n_steps());
    }

    std::span<const double> data() const { return data_; }

    /// Keep only the first n_paths rows
    void truncate(size_t n_paths) {
        if (n_paths >= n_paths_) return;
        n_paths_ = n_paths;
        data_.resize(n_paths * n_columns_);
    }

private:
    size_t n_paths_ = 0;
    size_t n_columns_ = 0;
    std::vector<double> data_;
};

}  // namespace mcopt
