/**
 * @file pipeline.cpp
 * @brief DiffRunner implementation
 */

#include "ossensor/pipeline.hpp"

#include "ossensor/binary_diff.hpp"
#include "ossensor/binary_features.hpp"
#include "ossensor/log_correlation.hpp"
#include "ossensor/log_templates.hpp"
#include "ossensor/source_diff.hpp"

#include <algorithm>
#include <functional>
#include <future>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace ossensor::pipeline {

namespace {

/// Run tasks in waves of at most `jobs`; sequentially when jobs <= 1
void run_tasks(std::vector<std::function<void()>>& tasks, std::size_t jobs)
{
    if (jobs <= 1) {
        for (auto& task : tasks) {
            task();
        }
        return;
    }
    for (std::size_t begin = 0; begin < tasks.size(); begin += jobs) {
        const std::size_t end = std::min(tasks.size(), begin + jobs);
        std::vector<std::future<void>> futures;
        futures.reserve(end - begin);
        for (std::size_t i = begin; i < end; ++i) {
            futures.push_back(std::async(std::launch::async, tasks[i]));
        }
        for (auto& future : futures) {
            future.get();
        }
    }
}

}  // namespace

DiffRunner::DiffRunner(config::AnalysisConfig config, std::size_t jobs)
    : m_config(std::move(config))
    , m_jobs(jobs)
{}

ossensor::Result<bundle::EvidenceBundle> DiffRunner::run(const DiffRequest& request) const
{
    if (request.build_from.empty() || request.build_to.empty() || request.component.empty()) {
        return std::unexpected(
            Error::make("InvalidArgument", "build_from, build_to and component are required"));
    }
    spdlog::info("diff {}: {} -> {}", request.component, request.build_from, request.build_to);

    // Phase 1: independent extraction, one result slot per task
    std::optional<ossensor::Result<source::SourceDiffResult>> source_result;
    std::optional<evidence::BinaryFeatureSet> binary_from;
    std::optional<evidence::BinaryFeatureSet> binary_to;
    std::optional<ossensor::Result<std::vector<evidence::LogTemplate>>> log_result;

    std::vector<std::function<void()>> tasks;
    if (request.source_from || request.source_to) {
        tasks.emplace_back([&] {
            const source::SourceDiffAnalyzer analyzer(m_config.source);
            source_result = analyzer.analyze_trees(request.source_from, request.source_to);
        });
    }
    const binary::BinaryFeatureExtractor extractor(m_config.binary);
    if (request.binary_from) {
        tasks.emplace_back([&] {
            binary_from = extractor.extract_file(
                *request.binary_from, {.build_id = request.build_from, .component = request.component});
        });
    }
    if (request.binary_to) {
        tasks.emplace_back([&] {
            binary_to = extractor.extract_file(*request.binary_to,
                                               {.build_id = request.build_to, .component = request.component});
        });
    }
    if (request.log_to) {
        tasks.emplace_back([&] {
            const logs::LogTemplateExtractor log_extractor(m_config.logs);
            log_result = log_extractor.extract_path(*request.log_to);
        });
    }
    run_tasks(tasks, m_jobs);

    bundle::BundleInputs inputs;
    inputs.build_from = request.build_from;
    inputs.build_to = request.build_to;
    inputs.component = request.component;

    if (source_result) {
        if (!*source_result) {
            return std::unexpected(source_result->error());
        }
        inputs.diff_hunks = std::move((*source_result)->hunks);
        inputs.source_features = std::move((*source_result)->features);
        inputs.source_skips = std::move((*source_result)->skips);
    }
    if (log_result) {
        if (*log_result) {
            inputs.log_templates = std::move(**log_result);
        } else {
            spdlog::warn("logs degraded: {}", log_result->error().message);
            inputs.log_notices.push_back(log_result->error().message);
        }
    }

    // Phase 2: cross-artifact correlation
    if (binary_from || binary_to) {
        const auto matcher = binary::make_default_matcher();
        const evidence::BinaryFeatureSet empty;
        inputs.binary_diff_pairs = matcher->match(binary_from ? *binary_from : empty, binary_to ? *binary_to : empty);
        spdlog::debug("binary diff ({} matcher): {} pairs", matcher->name(), inputs.binary_diff_pairs.size());
    }
    if (binary_to && !inputs.log_templates.empty()) {
        const logs::LogBinaryCorrelator correlator(m_config.correlation);
        inputs.log_to_binary_matches = correlator.correlate(inputs.log_templates, *binary_to);
    }
    inputs.binary_features_from = std::move(binary_from);
    inputs.binary_features_to = std::move(binary_to);

    auto assembled = bundle::EvidenceBundleAssembler{}.assemble(std::move(inputs));
    if (assembled) {
        spdlog::info("bundle {} assembled", assembled->diff_id());
    }
    return assembled;
}

}  // namespace ossensor::pipeline
