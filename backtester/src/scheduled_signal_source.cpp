#include "scheduled_signal_source.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

namespace backtester {

    namespace {

        std::string requireString(const json& entry, const char* key, size_t index) {
            if (!entry.contains(key) || !entry.at(key).is_string()) {
                throw core::ConfigException("Signal #" + std::to_string(index) + " requires '" + key + "' (string).");
            }
            return entry.at(key).get<std::string>();
        }

        core::Decimal requireDecimal(const json& entry, const char* key, size_t index) {
            if (!entry.contains(key) || !(entry.at(key).is_string() || entry.at(key).is_number())) {
                throw core::ConfigException("Signal #" + std::to_string(index) + " requires '" + key + "' (decimal).");
            }
            return entry.at(key).get<core::Decimal>();
        }

    } // end anonymous namespace

    ScheduledSignalSource::ScheduledSignalSource(std::vector<std::pair<core::Timestamp, CandidateSignal>> signals) {
        for (auto& entry : signals) {
            add(entry.first, std::move(entry.second));
        }
    }

    ScheduledSignalSource ScheduledSignalSource::fromJson(const json& signals) {
        if (!signals.is_array()) {
            throw core::ConfigException("Signals document must be a JSON array.");
        }

        ScheduledSignalSource source;
        for (size_t i = 0; i < signals.size(); ++i) {
            const json& entry = signals[i];
            if (!entry.is_object()) {
                throw core::ConfigException("Signal #" + std::to_string(i) + " must be an object.");
            }
            try {
                CandidateSignal signal;
                signal.symbol = requireString(entry, "symbol", i);
                signal.side = core::positionSideFromString(requireString(entry, "side", i));
                signal.initial_stop = requireDecimal(entry, "initial_stop", i);
                if (entry.contains("size_hint") && !entry.at("size_hint").is_null()) {
                    signal.size_hint = entry.at("size_hint").get<long long>();
                }
                if (entry.contains("limit_price") && !entry.at("limit_price").is_null()) {
                    signal.limit_price = requireDecimal(entry, "limit_price", i);
                }
                signal.pattern = entry.value("pattern", std::string());
                core::Timestamp ts = core::utils::stringToTimestamp(requireString(entry, "timestamp", i));
                source.add(ts, std::move(signal));
            } catch (const core::ConfigException&) {
                throw;
            } catch (const std::exception& e) {
                throw core::ConfigException("Signal #" + std::to_string(i) + " is invalid: " + e.what());
            }
        }
        core::logging::getLogger()->info("Loaded {} scheduled signals", source.size());
        return source;
    }

    void ScheduledSignalSource::add(const core::Timestamp& timestamp, CandidateSignal signal) {
        schedule_[{signal.symbol, timestamp}].push_back(std::move(signal));
        ++count_;
    }

    std::vector<CandidateSignal> ScheduledSignalSource::generate(size_t /*bar_index*/,
                                                                 const std::vector<core::Bar>& history) {
        if (history.empty()) {
            return {};
        }
        const core::Bar& current = history.back();
        auto it = schedule_.find({current.symbol, current.timestamp});
        if (it == schedule_.end()) {
            return {};
        }
        return it->second;
    }

} // namespace backtester
