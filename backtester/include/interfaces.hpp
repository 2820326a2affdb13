#pragma once

#include <optional>
#include <string>
#include <vector>

#include "datatypes.hpp"

namespace backtester {

    // A candidate entry produced by a pattern detector
    struct CandidateSignal {
        std::string symbol;
        core::PositionSide side = core::PositionSide::Long;
        core::Decimal initial_stop;
        std::optional<long long> size_hint;          // Upper bound on quantity
        std::optional<core::Decimal> limit_price;    // Entry as LIMIT when set
        std::string pattern;                         // Label only, e.g. "SPRING"
    };

    struct ProgressUpdate {
        size_t bars_processed = 0;
        size_t total_bars = 0;
        double percent_complete = 0.0;
    };

    // --- Signal Source Interface ---
    // Called once per accepted bar. `history` holds every bar accepted so far,
    // the last element being the current bar; nothing later is visible.
    class ISignalSource {
    public:
        virtual ~ISignalSource() = default;
        virtual std::vector<CandidateSignal> generate(size_t bar_index, const std::vector<core::Bar>& history) = 0;
        virtual std::string getName() const = 0;
    };

    // --- Position Sizer Interface ---
    class IPositionSizer {
    public:
        virtual ~IPositionSizer() = default;
        // risk_per_trade_pct is a percentage (1.0 == 1% of equity)
        virtual long long calculateQuantity(const core::Decimal& equity,
                                            const core::Decimal& risk_per_trade_pct,
                                            const core::Decimal& stop_distance) const = 0;
    };

    // --- Progress Notifier Interface ---
    // Runs on the simulation thread; implementations hand work off if they need to.
    class IProgressNotifier {
    public:
        virtual ~IProgressNotifier() = default;
        virtual void onProgress(const ProgressUpdate& update) = 0;
    };

    class NullProgressNotifier : public IProgressNotifier {
    public:
        void onProgress(const ProgressUpdate&) override {}
    };

} // namespace backtester
