#pragma once

#include "pslearn/core/data.hpp"

namespace pslearn::core {

    // Produces the train/test splits of a dataset. Must be deterministic.
    using FoldSplitter = std::function<std::vector<TFold>(const TDataset&)>;

    /**
     * Method: KFoldSplit
     * Description: k contiguous folds without shuffling; the first n % k folds get one extra row
     */
    std::vector<TFold> KFoldSplit(size_t nSamples, int k);

    /**
     * Method: StratifiedKFoldSplit
     * Description: rows of each class (classes in increasing order) dealt round-robin
     * over the k folds, continuing the deal from one class to the next
     */
    std::vector<TFold> StratifiedKFoldSplit(const Targets& y, int k);

    // "kfold" | "stratified"; throws ConfigurationError otherwise
    FoldSplitter ResolveSplitter(const std::string& strategy, int k);

    // -----------------------------------------------------------------------------
    // Row / column subsets
    // -----------------------------------------------------------------------------
    Matrix SelectRows(const Matrix& X, const std::vector<size_t>& rows);
    Targets SelectRows(const Targets& y, const std::vector<size_t>& rows);
    Matrix SelectColumns(const Matrix& X, const std::vector<size_t>& cols);

} // namespace pslearn::core
