#include <cmath>
#include <iomanip>
#include <iostream>
#include <unordered_map>
#include "tempo_ngin/backtest/walkforward_orchestrator.hpp"
#include "tempo_ngin/core/logger.hpp"
#include "tempo_ngin/core/time_utils.hpp"
#include "tempo_ngin/strategy/passthrough_strategy.hpp"

using namespace tempo_ngin;

namespace {

constexpr size_t NUM_DAYS = 500;

// Weekdays from 2021-01-04
std::vector<Timestamp> trading_days(size_t count) {
    std::vector<Timestamp> days;
    long day = core::days_from_civil(2021, 1, 4);
    while (days.size() < count) {
        Timestamp ts(std::chrono::seconds(day * 86400L));
        if (core::to_calendar_date(ts).weekday <= 5) {
            days.push_back(ts);
        }
        ++day;
    }
    return days;
}

// Deterministic price paths: drift plus two cycles of asset-specific period
std::vector<Bar> synthetic_bars(const std::string& symbol, size_t asset,
                                const std::vector<Timestamp>& days) {
    std::vector<Bar> bars;
    bars.reserve(days.size());
    double close = 100.0 + 10.0 * static_cast<double>(asset);
    const double drift = 0.0002 * static_cast<double>(asset + 1);
    const double amplitude = 0.004 + 0.003 * static_cast<double>(asset % 3);
    for (size_t t = 0; t < days.size(); ++t) {
        double x = static_cast<double>(t);
        double r = drift + amplitude * std::sin(x / (5.0 + asset)) +
                   0.5 * amplitude * std::cos(x / (17.0 + 2.0 * asset));
        double open = close * (1.0 + 0.25 * r);
        close = close * (1.0 + r);
        double high = std::max(open, close) * 1.002;
        double low = std::min(open, close) * 0.998;
        bars.emplace_back(days[t], open, high, low, close, 1e6, symbol);
    }
    return bars;
}

}  // namespace

int main() {
    try {
        auto& logger = Logger::instance();
        LoggerConfig logger_config;
        logger_config.min_level = LogLevel::INFO;
        logger_config.destination = LogDestination::CONSOLE;
        logger_config.filename_prefix = "bt_walkforward";
        logger.initialize(logger_config);

        if (!logger.is_initialized()) {
            std::cerr << "ERROR: Logger initialization failed" << std::endl;
            return 1;
        }

        const std::vector<std::string> symbols{"ES", "NQ", "ZN", "ZB", "GC", "CL"};
        const std::vector<std::string> sectors{"Equity", "Equity", "Rates",
                                               "Rates",  "Metals", "Energy"};

        auto days = trading_days(NUM_DAYS);
        auto index = TimeIndex::create(days);
        if (index.is_error()) {
            std::cerr << "Failed to build index: " << index.error()->what() << std::endl;
            return 1;
        }

        std::unordered_map<std::string, std::vector<Bar>> bars;
        for (size_t i = 0; i < symbols.size(); ++i) {
            bars[symbols[i]] = synthetic_bars(symbols[i], i, days);
        }
        auto data = MarketData::create(index.value(), std::move(bars));
        if (data.is_error()) {
            std::cerr << "Failed to build market data: " << data.error()->what() << std::endl;
            return 1;
        }

        INFO("Loading configuration...");
        WalkforwardConfig config;
        config.execution.execution_time = ExecutionTime::NEXT_OPEN;
        config.execution.price_used = PriceField::OPEN;
        config.execution.execution_delay_days = 1;

        config.exposure.method = ExposureMethod::PASSTHROUGH;

        config.allocator.type = AllocatorType::INVERSE_VOLATILITY;
        config.allocator.lookback = 60;
        config.allocator.per_asset_cap = 0.4;
        config.allocator.gross_exposure_cap = 1.0;

        config.meta.method = MetaMethod::INVERSE_VOLATILITY;
        config.meta.vol_lookback = 20;
        config.meta.min_weight = 0.1;

        config.costs.spread_bps = 2.0;
        config.costs.slippage_bps = 1.0;
        config.costs.impact_k_bps = 5.0;

        RiskCapsConfig caps;
        caps.max_weight_per_asset = 0.3;
        caps.max_sector_weight = 0.45;
        caps.min_assets_held = 2;
        for (size_t i = 0; i < symbols.size(); ++i) {
            caps.sector_map[symbols[i]] = sectors[i];
        }
        config.risk_caps = caps;

        VolTargetingConfig vol;
        vol.target_vol = 0.10;
        vol.vol_lookback = 40;
        vol.max_leverage = 2.0;
        config.vol_targeting = vol;

        config.allocation_schedule = ScheduleConfig(Frequency::WEEKLY,
                                                    ScheduleAnchor::ON_OR_AFTER_DAY, 1);
        config.meta_schedule = ScheduleConfig(Frequency::MONTHLY);

        std::vector<std::unique_ptr<StrategyInterface>> strategies;
        strategies.push_back(std::make_unique<PassthroughStrategy>("all_long"));
        strategies.push_back(std::make_unique<PassthroughStrategy>(
            "rates_short", std::map<std::string, double>{{"ZN", -1.0}, {"ZB", -1.0}}, 1.0));

        WalkforwardOrchestrator orchestrator(config, data.value(), std::move(strategies));
        auto init = orchestrator.initialize();
        if (init.is_error()) {
            std::cerr << "Failed to initialize run: " << init.error()->to_string() << std::endl;
            return 1;
        }

        auto result = orchestrator.run();
        if (result.is_error()) {
            std::cerr << "Run failed: " << result.error()->to_string() << std::endl;
            return 1;
        }

        const auto& run = *result.value();
        const auto& metrics = run.metrics();
        std::cerr << std::fixed << std::setprecision(4);
        std::cerr << "\n======= Walk-forward Results =======" << std::endl;
        std::cerr << "Warmup:         " << run.warmup_plan().description << std::endl;
        std::cerr << "Trading days:   " << metrics.trading_days << std::endl;
        std::cerr << "Total Return:   " << metrics.total_return * 100.0 << "%" << std::endl;
        std::cerr << "CAGR:           " << metrics.cagr * 100.0 << "%" << std::endl;
        std::cerr << "Volatility:     " << metrics.volatility * 100.0 << "%" << std::endl;
        std::cerr << "Sharpe Ratio:   " << metrics.sharpe_ratio << std::endl;
        std::cerr << "Sortino Ratio:  " << metrics.sortino_ratio << std::endl;
        std::cerr << "Max Drawdown:   " << metrics.max_drawdown * 100.0 << "%" << std::endl;
        std::cerr << "Calmar Ratio:   " << metrics.calmar_ratio << std::endl;
        std::cerr << "Avg Turnover:   " << metrics.average_turnover << std::endl;
        std::cerr << "Avg Leverage:   " << metrics.average_leverage << std::endl;
        std::cerr << "Warnings:       " << run.warnings().size() << std::endl;

        std::cout << run.to_json().dump(2) << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
