#pragma once

/**
 * @file pipeline.hpp
 * @brief DiffRunner: the two-phase evidence pipeline for one diff
 *
 * Phase 1 runs the independent extractors (source diff, binary features of
 * both builds, log templates). Phase 2 runs the cross-artifact steps
 * (symbol matching, log correlation) and assembles the bundle.
 */

#include "ossensor/bundle.hpp"
#include "ossensor/common.hpp"
#include "ossensor/config.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace ossensor::pipeline {

/// Resolved artifacts of one (build_from, build_to, component) diff
struct DiffRequest
{
    std::string build_from;
    std::string build_to;
    std::string component;
    std::optional<std::filesystem::path> source_from;
    std::optional<std::filesystem::path> source_to;
    std::optional<std::filesystem::path> binary_from;
    std::optional<std::filesystem::path> binary_to;
    std::optional<std::filesystem::path> log_to;  ///< File or directory of the `to` build's logs
};

class DiffRunner
{
public:
    /**
     * @param jobs Phase-1 tasks run concurrently when greater than 1;
     *             results are identical for every value
     */
    explicit DiffRunner(config::AnalysisConfig config, std::size_t jobs = 1);

    /**
     * Run both phases and assemble the bundle.
     *
     * Degraded artifacts (undecodable source files, bad binaries,
     * unreadable logs) are recorded inside the bundle.
     *
     * @return InvalidArgument for missing labels, IOError when a source
     *         root is not a directory, or the assembler's structural error
     */
    [[nodiscard]] ossensor::Result<bundle::EvidenceBundle> run(const DiffRequest& request) const;

private:
    config::AnalysisConfig m_config;
    std::size_t m_jobs;
};

}  // namespace ossensor::pipeline
