#include "forecast/project_simulation.hpp"
#include "forecast/dependency_graph.hpp"
#include "forecast/errors.hpp"
#include "forecast/statistics.hpp"
#include "forecast/velocity.hpp"
#include <algorithm>
#include <chrono>
#include <future>
#include <thread>
#include <unordered_map>

namespace forecast {

namespace {

// Per-run state of one work item; nodes live in a vector in visiting order and
// refer to their dependencies by position.
struct SimulationNode {
    std::string id;
    ThreePointEstimate triplet;
    bool scaledByVelocity = false;
    std::vector<size_t> dependencies;
};

struct TrialBatch {
    std::vector<double> totals;
    std::vector<std::vector<double>> samples;  // per node, one finish time per trial
};

std::vector<SimulationNode> build_simulation_nodes(const Project& project,
                                                   const std::vector<std::string>& order,
                                                   double velocity) {
    std::unordered_map<std::string, size_t> position;
    for (size_t i = 0; i < order.size(); ++i) {
        if (!project.contains(order[i])) {
            throw StructuralError("unknown issue id " + order[i] + " in simulation order");
        }
        if (!position.emplace(order[i], i).second) {
            throw StructuralError("issue " + order[i] + " appears twice in simulation order");
        }
    }

    std::vector<SimulationNode> nodes;
    nodes.reserve(order.size());
    for (size_t i = 0; i < order.size(); ++i) {
        const WorkItem& item = project.find(order[i]);
        SimulationNode node;
        node.id = item.id;

        if (!item.estimate.isSet()) {
            throw EstimationError("missing estimate for issue " + item.id);
        }
        try {
            node.triplet = item.estimate.samplingTriplet();
        } catch (const EstimationError& e) {
            throw EstimationError("invalid estimate for issue " + item.id + ": " + e.what());
        }
        if (!node.triplet.isConsistent() || node.triplet.optimistic < 0.0) {
            throw EstimationError("invalid estimate values for issue " + item.id);
        }

        node.scaledByVelocity = item.estimate.isStoryPoints();
        if (node.scaledByVelocity && velocity <= 0.0) {
            throw VelocityError("missing velocity for story point estimates of issue " + item.id);
        }

        for (const auto& dependency : item.dependencies) {
            auto it = position.find(dependency);
            if (it == position.end()) {
                if (!project.contains(dependency)) {
                    throw UnknownDependencyError(item.id, dependency);
                }
                throw StructuralError("simulation order is missing issue " + dependency);
            }
            if (it->second >= i) {
                throw StructuralError("simulation order visits " + item.id +
                                      " before its dependency " + dependency);
            }
            node.dependencies.push_back(it->second);
        }
        nodes.push_back(std::move(node));
    }

    if (nodes.size() != project.size()) {
        throw StructuralError("simulation order does not cover every issue of the project");
    }
    return nodes;
}

TrialBatch run_trials(const std::vector<SimulationNode>& nodes,
                      size_t iterations,
                      double velocity,
                      ThreePointSampler& sampler,
                      CapacityTimeline& timeline,
                      size_t batch_size,
                      std::atomic<size_t>* completed_iterations) {
    TrialBatch batch;
    batch.totals.reserve(iterations);
    batch.samples.assign(nodes.size(), std::vector<double>());
    for (auto& samples : batch.samples) {
        samples.reserve(iterations);
    }

    std::vector<double> earliest_finish(nodes.size(), 0.0);
    for (size_t trial = 0; trial < iterations; ++trial) {
        double total = 0.0;
        for (size_t i = 0; i < nodes.size(); ++i) {
            const SimulationNode& node = nodes[i];
            double ready = 0.0;
            for (size_t dependency : node.dependencies) {
                ready = std::max(ready, earliest_finish[dependency]);
            }

            double duration = sampler.sample(node.triplet.optimistic,
                                             node.triplet.mostLikely,
                                             node.triplet.pessimistic);

            // story points become capacity days and are laid out on the calendar;
            // three-point and reference durations are already elapsed days
            double finish = node.scaledByVelocity
                ? timeline.finishOffset(ready, duration / velocity)
                : ready + duration;
            earliest_finish[i] = finish;
            batch.samples[i].push_back(finish);
            total = std::max(total, finish);
        }
        batch.totals.push_back(total);

        if (completed_iterations && (trial + 1) % batch_size == 0) {
            *completed_iterations += batch_size;
        }
    }
    if (completed_iterations) {
        *completed_iterations += iterations % batch_size;
    }
    return batch;
}

SimulationOutput build_output(const Project& project,
                              const std::vector<SimulationNode>& nodes,
                              const std::vector<TrialBatch>& batches,
                              double velocity,
                              size_t iterations,
                              const Date& start_date) {
    SimulationOutput output;
    output.results.reserve(iterations);
    for (const auto& batch : batches) {
        output.results.insert(output.results.end(), batch.totals.begin(), batch.totals.end());
    }
    if (output.results.size() != iterations) {
        throw std::runtime_error("Simulation thread count mismatch");
    }
    std::sort(output.results.begin(), output.results.end());

    output.report.velocity = project.hasStoryPoints() ? velocity : 0.0;
    output.report.iterations = iterations;
    output.report.simulatedItems = project.size();
    fillPercentiles(output.report, output.results, start_date);
    output.mean = StatisticalAnalysis<double>::mean(output.results);
    output.standardDeviation = StatisticalAnalysis<double>::standardDeviation(output.results);

    std::unordered_map<std::string, size_t> node_index;
    for (size_t i = 0; i < nodes.size(); ++i) {
        node_index[nodes[i].id] = i;
    }

    output.hasWorkPackages = true;
    output.workPackages.reserve(project.size());
    for (const auto& item : project.workItems()) {
        size_t index = node_index.at(item.id);
        std::vector<double> samples;
        samples.reserve(iterations);
        for (const auto& batch : batches) {
            samples.insert(samples.end(), batch.samples[index].begin(), batch.samples[index].end());
        }

        WorkPackageSimulation package;
        package.id = item.id;
        package.percentiles = StatisticalAnalysis<double>::summarize(samples);
        output.workPackages.push_back(package);
    }
    return output;
}

void check_run_inputs(const Project& project, size_t iterations, const Date& start_date) {
    if (iterations == 0) {
        throw ConfigurationError("iterations must be greater than zero");
    }
    if (project.empty()) {
        throw ConfigurationError("project has no work packages");
    }
    if (!start_date.isValid()) {
        throw InputError("invalid start date");
    }
}

} // namespace

SimulationOutput simulateCriticalPath(const Project& project,
                                      const std::vector<std::string>& order,
                                      double velocity,
                                      size_t iterations,
                                      const Date& start_date,
                                      ThreePointSampler& sampler,
                                      const TeamCalendar& calendar) {
    auto start_time = std::chrono::steady_clock::now();
    check_run_inputs(project, iterations, start_date);

    std::vector<SimulationNode> nodes = build_simulation_nodes(project, order, velocity);
    CapacityTimeline timeline(calendar, start_date);

    std::vector<TrialBatch> batches;
    batches.push_back(run_trials(nodes, iterations, velocity, sampler, timeline,
                                 iterations, nullptr));

    SimulationOutput output = build_output(project, nodes, batches, velocity, iterations, start_date);
    output.startTime = start_time;
    output.endTime = std::chrono::steady_clock::now();
    return output;
}

ProjectSimulator::ProjectSimulator(Parameters params)
    : params_(std::move(params)) {
    validate_parameters();
}

SimulationOutput ProjectSimulator::run(const Project& project,
                                       const TeamCalendar& calendar,
                                       const Date& start_date) const {
    validate_parameters();
    auto start_time = std::chrono::steady_clock::now();
    check_run_inputs(project, params_.iterations, start_date);

    double velocity = 0.0;
    if (project.hasStoryPoints()) {
        velocity = VelocityCalculator::calculate(project, calendar);
    }

    DependencyGraph graph(project);
    std::vector<std::string> order = graph.topologicalOrder();
    std::vector<SimulationNode> nodes = build_simulation_nodes(project, order, velocity);

    size_t num_threads = worker_count();
    size_t iterations_per_thread = params_.iterations / num_threads;
    size_t remaining = params_.iterations % num_threads;

    std::atomic<size_t> completed_iterations{0};
    std::atomic<bool> simulation_running{true};

    std::thread progress_thread;
    if (params_.progress_callback) {
        progress_thread = std::thread([&]() {
            monitor_progress(completed_iterations, simulation_running);
        });
    }

    std::vector<TrialBatch> batches;
    try {
        std::vector<std::future<TrialBatch>> futures;
        futures.reserve(num_threads);

        for (size_t i = 0; i < num_threads; ++i) {
            size_t thread_iters = iterations_per_thread + (i == num_threads - 1 ? remaining : 0);
            std::shared_ptr<ThreePointSampler> sampler = make_sampler(i);

            futures.push_back(std::async(std::launch::async,
                [this, &nodes, &calendar, &start_date, &completed_iterations,
                 sampler, thread_iters, velocity]() {
                    CapacityTimeline timeline(calendar, start_date);
                    return run_trials(nodes, thread_iters, velocity, *sampler, timeline,
                                      params_.batch_size, &completed_iterations);
                }));
        }

        batches.reserve(num_threads);
        for (auto& future : futures) {
            batches.push_back(future.get());
        }
    } catch (...) {
        simulation_running = false;
        if (progress_thread.joinable()) {
            progress_thread.join();
        }
        throw;
    }

    simulation_running = false;
    if (progress_thread.joinable()) {
        progress_thread.join();
    }

    SimulationOutput output = build_output(project, nodes, batches, velocity,
                                           params_.iterations, start_date);
    output.startTime = start_time;
    output.endTime = std::chrono::steady_clock::now();
    return output;
}

void ProjectSimulator::validate_parameters() const {
    if (params_.iterations == 0) {
        throw ConfigurationError("iterations must be greater than zero");
    }
    if (params_.num_threads == 0) {
        throw ConfigurationError("Number of threads must be positive");
    }
    if (params_.batch_size == 0) {
        throw ConfigurationError("Batch size must be positive");
    }
    if (params_.progress_update_interval <= 0) {
        throw ConfigurationError("Progress update interval must be positive");
    }
}

size_t ProjectSimulator::worker_count() const {
    // worker i owns stream seed + i, so the split must not depend on the machine
    return std::min(params_.num_threads, params_.iterations);
}

std::unique_ptr<ThreePointSampler> ProjectSimulator::make_sampler(size_t worker) const {
    if (params_.sampler_factory) {
        std::unique_ptr<ThreePointSampler> sampler = params_.sampler_factory(worker);
        if (!sampler) {
            throw std::invalid_argument("Sampler factory returned null");
        }
        return sampler;
    }
    std::unique_ptr<RandomGenerator> generator = params_.seeded
        ? RandomGenerator::create(params_.generator_type, params_.seed + worker)
        : RandomGenerator::create(params_.generator_type);
    return std::make_unique<BetaPertSampler>(std::move(generator));
}

void ProjectSimulator::monitor_progress(const std::atomic<size_t>& completed_iterations,
                                        const std::atomic<bool>& simulation_running) const {
    const auto start_time = std::chrono::steady_clock::now();
    SimulationProgress progress;

    while (simulation_running) {
        auto current = completed_iterations.load();
        auto elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start_time).count();

        progress.completedIterations = current;
        progress.completionPercentage = (100.0 * current) / params_.iterations;
        if (current > 0 && elapsed > 0) {
            double rate = current / elapsed;
            progress.estimatedTimeRemaining = (params_.iterations - current) / rate;
        }
        params_.progress_callback(progress);

        if (current >= params_.iterations) {
            break;
        }

        // sleep less as the run approaches completion
        double remaining_percentage = 100.0 - progress.completionPercentage;
        double sleep_interval = std::max(0.001,
            params_.progress_update_interval * remaining_percentage / 100.0);
        std::this_thread::sleep_for(std::chrono::duration<double>(sleep_interval));
    }

    // final update once every trial has been counted
    progress.completedIterations = completed_iterations.load();
    progress.completionPercentage = (100.0 * progress.completedIterations) / params_.iterations;
    progress.estimatedTimeRemaining = 0.0;
    params_.progress_callback(progress);
}

} // namespace forecast
