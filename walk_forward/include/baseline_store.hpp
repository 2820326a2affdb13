#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "decimal.hpp"

namespace walk_forward {

    using json = nlohmann::json;

    // Stored reference for one symbol. `metrics` holds only the averaged validate
    // metrics present in the file; a missing metric is skipped at comparison time.
    struct BaselineRecord {
        std::string symbol;
        std::string asset_class;
        std::string baseline_version;
        std::string suite_id;
        int window_count = 0;
        std::map<std::string, core::Decimal> metrics;
        core::Decimal stability_score;
        int degradation_count = 0;
        std::string created_at;

        json toJson() const;
        // Throws core::BaselineException on a malformed record
        static BaselineRecord fromJson(const json& record);
    };

    // One `<SYMBOL>_wf_baseline.json` per symbol under a directory. Records are only
    // written through save(); loading never creates or modifies files.
    class BaselineStore {
    public:
        explicit BaselineStore(std::filesystem::path directory);

        // Slashes are stripped so "EUR/USD" maps to EURUSD_wf_baseline.json
        static std::string fileNameFor(const std::string& symbol);
        std::filesystem::path pathFor(const std::string& symbol) const;

        // nullopt when the file is missing (info log) or unreadable (error log)
        std::optional<BaselineRecord> load(const std::string& symbol) const;

        // Creates the directory when needed. Throws core::BaselineException on I/O failure.
        std::filesystem::path save(const BaselineRecord& record) const;

        const std::filesystem::path& getDirectory() const { return directory_; }

    private:
        std::filesystem::path directory_;
    };

} // namespace walk_forward
