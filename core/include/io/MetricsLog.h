#ifndef METRICS_LOG_H
#define METRICS_LOG_H

#include <iosfwd>
#include <string>
#include <vector>
#include "kernel/SimConfig.h"

class SimulationEngine;

// Statistic names written as CSV columns, in order, for the given policy
std::vector<std::string> metricColumns(SelectionPolicy policy);

// CSV header: "gen," followed by metricColumns()
void writeMetricsHeader(SelectionPolicy policy, std::ostream& out);

// CSV row for the engine's current generation
void logMetrics(const SimulationEngine& engine, std::ostream& out);

#endif
