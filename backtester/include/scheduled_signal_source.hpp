#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

#include "interfaces.hpp"

namespace backtester {

    using json = nlohmann::json;

    // Replays signals produced offline by a detector, keyed by (symbol, bar timestamp).
    //
    // JSON layout:
    //   [{"symbol": "AAPL", "timestamp": "2024-03-04T00:00:00Z", "side": "LONG",
    //     "initial_stop": "148.20", "size_hint": 500, "limit_price": "150.10",
    //     "pattern": "SPRING"}, ...]
    class ScheduledSignalSource : public ISignalSource {
    public:
        ScheduledSignalSource() = default;
        explicit ScheduledSignalSource(std::vector<std::pair<core::Timestamp, CandidateSignal>> signals);

        // Throws core::ConfigException on malformed entries
        static ScheduledSignalSource fromJson(const json& signals);

        void add(const core::Timestamp& timestamp, CandidateSignal signal);
        size_t size() const { return count_; }

        std::vector<CandidateSignal> generate(size_t bar_index, const std::vector<core::Bar>& history) override;
        std::string getName() const override { return "ScheduledSignalSource"; }

    private:
        std::map<std::pair<std::string, core::Timestamp>, std::vector<CandidateSignal>> schedule_;
        size_t count_ = 0;
    };

} // namespace backtester
