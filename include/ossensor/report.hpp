#pragma once

/**
 * @file report.hpp
 * @brief Citation policy for documents built on top of a bundle
 */

#include "ossensor/bundle.hpp"
#include "ossensor/common.hpp"

#include <nlohmann/json.hpp>

namespace ossensor::report {

/**
 * Walk a report document (triage report, enrichment output, ...) and check
 * that every entry of every "evidence_refs" or "citations" array resolves
 * in the bundle. Other fields are not inspected.
 *
 * @return ParseError for a malformed ref, DanglingReference for an
 *         unresolved one
 */
[[nodiscard]] ossensor::VoidResult enforce_citation_policy(const bundle::EvidenceBundle& bundle,
                                                           const nlohmann::json& document);

}  // namespace ossensor::report
