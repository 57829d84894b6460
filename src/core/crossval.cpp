#include "pslearn/core/crossval.hpp"
#include "pslearn/core/errors.hpp"

namespace pslearn::core {

    static void CheckFolds(size_t nSamples, int k)
    {
        if (k < 2)
            throw ConfigurationError(std::format("cv must be at least 2, got {}", k));
        if (static_cast<size_t>(k) > nSamples)
            throw ConfigurationError(std::format("cv ({}) cannot exceed the number of samples ({})", k, nSamples));
    }

    // builds the folds from a fold id per row
    static std::vector<TFold> FoldsFromAssignment(const std::vector<int>& foldOf, int k)
    {
        std::vector<TFold> folds(k);
        for (size_t i = 0; i < foldOf.size(); i++){
            for (int f = 0; f < k; f++){
                if (foldOf[i] == f) folds[f].test.push_back(i);
                else folds[f].train.push_back(i);
            }
        }
        return folds;
    }

    std::vector<TFold> KFoldSplit(size_t nSamples, int k)
    {
        CheckFolds(nSamples, k);

        std::vector<int> foldOf(nSamples);
        size_t base = nSamples / k;
        size_t extra = nSamples % k;

        size_t row = 0;
        for (int f = 0; f < k; f++){
            size_t size = base + (static_cast<size_t>(f) < extra ? 1 : 0);
            for (size_t r = 0; r < size; r++)
                foldOf[row++] = f;
        }
        return FoldsFromAssignment(foldOf, k);
    }

    std::vector<TFold> StratifiedKFoldSplit(const Targets& y, int k)
    {
        CheckFolds(y.size(), k);

        std::vector<double> classes(y.begin(), y.end());
        std::sort(classes.begin(), classes.end());
        classes.erase(std::unique(classes.begin(), classes.end()), classes.end());

        std::vector<int> foldOf(y.size());
        int next = 0;
        for (double c : classes){
            for (size_t i = 0; i < y.size(); i++){
                if (y[i] != c) continue;
                foldOf[i] = next;
                next = (next + 1) % k;
            }
        }
        return FoldsFromAssignment(foldOf, k);
    }

    FoldSplitter ResolveSplitter(const std::string& strategy, int k)
    {
        if (strategy == "kfold")
            return [k](const TDataset& data) { return KFoldSplit(data.numSamples(), k); };
        if (strategy == "stratified")
            return [k](const TDataset& data) { return StratifiedKFoldSplit(data.y, k); };
        throw ConfigurationError(std::format("unknown cv strategy '{}' (expected kfold or stratified)", strategy));
    }

    // -----------------------------------------------------------------------------
    // Row / column subsets
    // -----------------------------------------------------------------------------

    Matrix SelectRows(const Matrix& X, const std::vector<size_t>& rows)
    {
        Matrix out;
        out.reserve(rows.size());
        for (size_t r : rows) out.push_back(X[r]);
        return out;
    }

    Targets SelectRows(const Targets& y, const std::vector<size_t>& rows)
    {
        Targets out;
        out.reserve(rows.size());
        for (size_t r : rows) out.push_back(y[r]);
        return out;
    }

    Matrix SelectColumns(const Matrix& X, const std::vector<size_t>& cols)
    {
        Matrix out(X.size(), std::vector<double>(cols.size()));
        for (size_t i = 0; i < X.size(); i++){
            for (size_t j = 0; j < cols.size(); j++)
                out[i][j] = X[i][cols[j]];
        }
        return out;
    }

} // namespace pslearn::core
