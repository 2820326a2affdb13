#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "datatypes.hpp"
#include "backtest_config.hpp"
#include "bar_processor.hpp"
#include "interfaces.hpp"
#include "metrics_calculator.hpp"
#include "order_simulator.hpp"
#include "portfolio.hpp"

namespace backtester {

    using json = nlohmann::json;

    struct BacktestResult {
        std::string run_id;
        BacktestConfig config;
        std::vector<core::Trade> trades;
        std::vector<core::EquityCurvePoint> equity_curve;
        std::vector<core::Order> orders; // Terminal states only (FILLED or REJECTED)
        std::vector<core::Position> open_positions;
        BacktestMetrics metrics;
        std::optional<CostSummary> cost_summary; // Present when costs were applied
        size_t bars_processed = 0;
        size_t skipped_bars = 0;
        bool cancelled = false;

        json toJson() const;
    };

    // Cash and committed risk set aside for an entry order until it fills or is cancelled
    struct EntryReservation {
        core::Decimal cash;
        core::Decimal risk;
    };

    // Bar-by-bar replay. Per accepted bar:
    //   (a) ask the signal source for candidates, (b) size and submit entries,
    //   (c) mark to market and submit exits, (d) fill pending orders created on
    //   earlier bars, (e) append the equity point, (f) report progress.
    // Single-threaded; cancel() may be called from any thread and is honoured
    // before the next bar starts.
    class Backtester {
    public:
        // Validates config (core::ConfigException) before anything runs.
        // The notifier is optional; the sizer and signal source must outlive the backtester.
        Backtester(BacktestConfig config, ISignalSource& signal_source, const IPositionSizer& position_sizer,
                   IProgressNotifier* progress_notifier = nullptr);

        // Bars must be in ascending timestamp order per symbol; out-of-order or
        // invalid bars are skipped with a logged reason.
        BacktestResult run(const std::vector<core::Bar>& bars);

        void cancel();
        bool isCancelled() const;

        const BacktestConfig& getConfig() const { return config_; }

    private:
        void resetState();
        std::optional<std::string> rejectReason(const core::Bar& bar) const;
        void recordVolume(const core::Bar& bar);
        core::Decimal averageVolume(const std::string& symbol) const;
        size_t pendingEntryCount() const;
        EntryReservation pendingEntryReservation() const;

        void submitEntries(const std::vector<CandidateSignal>& signals, const core::Bar& bar);
        void submitExits(const std::vector<ExitSignal>& exits, const core::Bar& bar);
        void applyFills(const core::Bar& bar);
        void notifyProgress(size_t processed, size_t total, bool force);

        BacktestConfig config_;
        ISignalSource& signal_source_;
        const IPositionSizer& position_sizer_;
        NullProgressNotifier null_notifier_;
        IProgressNotifier* progress_notifier_;
        BarProcessor bar_processor_;
        std::atomic<bool> cancelled_{false};

        // --- Per-run state ---
        std::unique_ptr<Portfolio> portfolio_;
        std::unique_ptr<OrderSimulator> order_simulator_;
        std::vector<core::Bar> history_;
        std::vector<core::EquityCurvePoint> equity_curve_;
        std::vector<core::Order> orders_;
        struct VolumeSample {
            long long volume = 0;
            core::Decimal close;
        };
        std::map<std::string, std::deque<VolumeSample>> volume_window_;
        std::map<std::string, EntryReservation> entry_reservations_; // Keyed by order id
        std::map<std::string, core::Timestamp> last_timestamp_;
        size_t progress_every_bars_ = 1;
        size_t last_progress_bar_ = 0;
        std::chrono::steady_clock::time_point last_progress_time_;
    };

} // namespace backtester
