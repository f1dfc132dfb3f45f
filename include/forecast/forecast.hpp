#ifndef FORECAST_FORECAST_HPP
#define FORECAST_FORECAST_HPP

#include "forecast/calendar.hpp"
#include "forecast/date.hpp"
#include "forecast/dependency_graph.hpp"
#include "forecast/distributions.hpp"
#include "forecast/errors.hpp"
#include "forecast/estimate.hpp"
#include "forecast/project.hpp"
#include "forecast/project_simulation.hpp"
#include "forecast/random.hpp"
#include "forecast/report.hpp"
#include "forecast/sampler.hpp"
#include "forecast/statistics.hpp"
#include "forecast/throughput_simulation.hpp"
#include "forecast/velocity.hpp"

#endif // FORECAST_FORECAST_HPP
