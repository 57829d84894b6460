#include "pslearn/utils/io.hpp"
#include "pslearn/core/errors.hpp"
#include "pslearn/core/space.hpp"

namespace pslearn::utils {

    std::string SystemDatetime()
    {
        std::time_t now = std::time(nullptr);
        std::tm local{};
        #if defined(_WIN32) || defined(_WIN64)
            localtime_s(&local, &now);
        #else
            localtime_r(&now, &local);
        #endif

        char buffer[32];
        std::strftime(buffer, sizeof(buffer), "[%Y-%m-%d | %H:%M:%S]", &local);
        return buffer;
    }

    void LogMessage(int verbosity, int level, const std::string& message)
    {
        if (verbosity < level) return;

        #pragma omp critical(pslearn_log)
        {
            std::cout << SystemDatetime() << " " << message << std::endl;
        }
    }

    void LogError(const std::string& message)
    {
        #pragma omp critical(pslearn_log)
        {
            std::cerr << SystemDatetime() << " ERROR: " << message << std::endl;
        }
    }

    // -----------------------------------------------------------------------------
    // Dataset
    // -----------------------------------------------------------------------------

    static std::vector<std::string> SplitCsvLine(const std::string& line)
    {
        std::vector<std::string> cells;
        std::stringstream ss(line);
        std::string cell;
        while (std::getline(ss, cell, ',')){
            // trim spaces and a trailing carriage return
            auto first = cell.find_first_not_of(" \t\r");
            auto last = cell.find_last_not_of(" \t\r");
            cells.push_back(first == std::string::npos ? "" : cell.substr(first, last - first + 1));
        }
        return cells;
    }

    core::TDataset ReadDataset(const std::string& path)
    {
        std::ifstream file(path);
        if (!file.is_open())
            throw core::ConfigurationError(std::format("dataset file {} not found", path));

        core::TDataset data;
        std::string line;

        if (!std::getline(file, line))
            throw core::ConfigurationError(std::format("dataset file {} is empty", path));

        std::vector<std::string> header = SplitCsvLine(line);
        if (header.size() < 2)
            throw core::ConfigurationError(std::format("dataset {} needs at least one feature and a target column", path));

        data.featureNames.assign(header.begin(), header.end() - 1);

        int lineNumber = 1;
        while (std::getline(file, line))
        {
            lineNumber++;
            if (line.empty() || line == "\r") continue;

            std::vector<std::string> cells = SplitCsvLine(line);
            if (cells.size() != header.size())
                throw core::ConfigurationError(std::format("{}:{}: expected {} cells, found {}", path, lineNumber, header.size(), cells.size()));

            std::vector<double> row(cells.size());
            for (size_t j = 0; j < cells.size(); j++){
                try {
                    size_t used = 0;
                    row[j] = std::stod(cells[j], &used);
                    if (used != cells[j].size()) throw std::invalid_argument(cells[j]);
                } catch (const std::exception&) {
                    throw core::ConfigurationError(std::format("{}:{}: '{}' is not a number", path, lineNumber, cells[j]));
                }
            }

            data.y.push_back(row.back());
            row.pop_back();
            data.X.push_back(std::move(row));
        }

        if (data.X.empty())
            throw core::ConfigurationError(std::format("dataset {} has no rows", path));

        return data;
    }

    // -----------------------------------------------------------------------------
    // Results
    // -----------------------------------------------------------------------------

    static std::string DescribeSolution(const core::TSearchResult& result)
    {
        std::string text;
        if (!result.bestParams.empty()){
            for (const auto& [name, value] : result.bestParams)
                text += std::format("{}={} ", name, core::ToString(value));
        }
        else {
            for (size_t k = 0; k < result.bestFeatures.size(); k++){
                const std::string& name = (k < result.bestFeatureNames.size())
                    ? result.bestFeatureNames[k] : std::to_string(result.bestFeatures[k]);
                text += name + " ";
            }
        }
        return text;
    }

    void WriteResultScreen(const std::string& mode, const std::string& dataPath,
                           const core::TSearchResult& result, double totalTime)
    {
        std::cout << "\n\n=== FINAL RESULT ===\n";
        std::cout << std::format("Mode: {}\nData: {}\n", mode, dataPath);
        std::cout << std::format("Best score: {:.6f}\n", result.bestScore);
        std::cout << std::format("Best {}: {}\n", result.bestParams.empty() ? "features" : "params", DescribeSolution(result));
        std::cout << std::format("Generations: {}\n", result.numGenerations);
        std::cout << std::format("Total time: {:.3f}\n", totalTime);
    }

    void WriteResults(const std::string& path, const std::string& mode, const std::string& dataPath,
                      const core::TSearchResult& result, double totalTime)
    {
        std::ofstream file(path, std::ios::app);
        if (!file.is_open())
            throw core::ConfigurationError(std::format("cannot open results file {}", path));

        file << std::format("{}\t{}\t{:.6f}\t{}\t{}\t{:.3f}\n",
                            dataPath, mode, result.bestScore, DescribeSolution(result),
                            result.numGenerations, totalTime);
    }

} // namespace pslearn::utils
