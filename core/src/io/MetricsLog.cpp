#include "io/MetricsLog.h"
#include "kernel/SimulationEngine.h"

#include <iomanip>
#include <ostream>

std::vector<std::string> metricColumns(SelectionPolicy policy) {
    std::vector<std::string> cols = {
        "avg_dominant_complexity",
        "std_dominant_complexity",
        "min_dominant_complexity",
        "max_dominant_complexity",
        "avg_dominant_entropy",
        "avg_pool_complexity",
        "avg_pool_utility",
        "avg_meme_age",
        "unique_patterns",
        "total_patterns",
        "pattern_diversity",
    };
    if (policy == SelectionPolicy::Utility) {
        cols.insert(cols.begin() + 4, {
            "avg_dominant_utility",
            "std_dominant_utility",
            "avg_dominant_score",
            "std_dominant_score",
        });
    }
    return cols;
}

void writeMetricsHeader(SelectionPolicy policy, std::ostream& out) {
    out << "gen";
    for (const auto& col : metricColumns(policy)) {
        out << "," << col;
    }
    out << "\n";
}

void logMetrics(const SimulationEngine& engine, std::ostream& out) {
    const auto values = engine.statisticsMap();
    out << engine.generation();
    out << std::setprecision(6);
    for (const auto& col : metricColumns(engine.config().policy)) {
        out << "," << values.at(col);
    }
    out << "\n";
}
