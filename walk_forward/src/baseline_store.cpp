#include "baseline_store.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "walk_forward_suite.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

namespace walk_forward {

    namespace {

        const char* const kNotes = "Walk-forward validation baseline. Written by WalkForwardSuite::saveBaselines.";

        template <typename T>
        T readField(const json& record, const char* key, T fallback) {
            if (!record.contains(key) || record.at(key).is_null()) {
                return fallback;
            }
            try {
                return record.at(key).get<T>();
            } catch (const json::exception& e) {
                throw core::BaselineException(std::string("Baseline field '") + key + "' has the wrong type: " + e.what());
            }
        }

        core::Decimal readDecimal(const json& record, const std::string& key) {
            try {
                return record.at(key).get<core::Decimal>();
            } catch (const std::exception& e) {
                throw core::BaselineException("Baseline field '" + key + "' is not a valid decimal: " + e.what());
            }
        }

    } // end anonymous namespace

    // --- BaselineRecord ---

    json BaselineRecord::toJson() const {
        json j = {
            {"symbol", symbol},
            {"asset_class", asset_class},
            {"baseline_version", baseline_version},
            {"suite_id", suite_id},
            {"window_count", window_count},
            {"stability_score", stability_score},
            {"degradation_count", degradation_count},
            {"created_at", created_at},
            {"notes", kNotes}
        };
        for (const auto& pair : metrics) {
            j[pair.first] = pair.second;
        }
        return j;
    }

    BaselineRecord BaselineRecord::fromJson(const json& record) {
        if (!record.is_object()) {
            throw core::BaselineException("Baseline record must be a JSON object.");
        }
        BaselineRecord result;
        result.symbol = readField<std::string>(record, "symbol", "");
        result.asset_class = readField<std::string>(record, "asset_class", "");
        result.baseline_version = readField<std::string>(record, "baseline_version", "");
        result.suite_id = readField<std::string>(record, "suite_id", "");
        result.window_count = readField<int>(record, "window_count", 0);
        result.degradation_count = readField<int>(record, "degradation_count", 0);
        result.created_at = readField<std::string>(record, "created_at", "");
        if (record.contains("stability_score") && !record.at("stability_score").is_null()) {
            result.stability_score = readDecimal(record, "stability_score");
        }
        for (const auto& name : comparedMetricNames()) {
            if (record.contains(name) && !record.at(name).is_null()) {
                result.metrics[name] = readDecimal(record, name);
            }
        }
        return result;
    }

    // --- BaselineStore ---

    BaselineStore::BaselineStore(std::filesystem::path directory)
        : directory_(std::move(directory)) {}

    std::string BaselineStore::fileNameFor(const std::string& symbol) {
        std::string cleaned = symbol;
        cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), '/'), cleaned.end());
        return cleaned + "_wf_baseline.json";
    }

    std::filesystem::path BaselineStore::pathFor(const std::string& symbol) const {
        return directory_ / fileNameFor(symbol);
    }

    std::optional<BaselineRecord> BaselineStore::load(const std::string& symbol) const {
        auto logger = core::logging::getLogger();
        const std::filesystem::path path = pathFor(symbol);

        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            logger->info("No walk-forward baseline for {} at {}", symbol, path.string());
            return std::nullopt;
        }

        std::ifstream file(path);
        if (!file.is_open()) {
            logger->error("Walk-forward baseline for {} could not be opened: {}", symbol, path.string());
            return std::nullopt;
        }
        try {
            json record;
            file >> record;
            return BaselineRecord::fromJson(record);
        } catch (const json::parse_error& e) {
            logger->error("Walk-forward baseline for {} is not valid JSON ({}): {}", symbol, path.string(), e.what());
        } catch (const core::BaselineException& e) {
            logger->error("Walk-forward baseline for {} is malformed ({}): {}", symbol, path.string(), e.what());
        }
        return std::nullopt;
    }

    std::filesystem::path BaselineStore::save(const BaselineRecord& record) const {
        std::error_code ec;
        std::filesystem::create_directories(directory_, ec);
        if (ec) {
            throw core::BaselineException("Cannot create baseline directory " + directory_.string() + ": " + ec.message());
        }

        const std::filesystem::path path = pathFor(record.symbol);
        std::ofstream file(path, std::ios::trunc);
        if (!file.is_open()) {
            throw core::BaselineException("Cannot open baseline file for writing: " + path.string());
        }
        file << record.toJson().dump(2) << '\n';
        if (!file) {
            throw core::BaselineException("Failed writing baseline file: " + path.string());
        }

        core::logging::getLogger()->info("Saved walk-forward baseline for {} to {}", record.symbol, path.string());
        return path;
    }

} // namespace walk_forward
