/**
 * @file report.cpp
 * @brief Citation policy enforcement
 */

#include "ossensor/report.hpp"

#include <string>
#include <string_view>

namespace ossensor::report {

namespace {

constexpr std::string_view kCitationKeys[] = {"evidence_refs", "citations"};

[[nodiscard]] bool is_citation_key(std::string_view key)
{
    for (const auto candidate : kCitationKeys) {
        if (candidate == key) {
            return true;
        }
    }
    return false;
}

[[nodiscard]] ossensor::VoidResult check_citations(const bundle::EvidenceBundle& bundle,
                                                   const nlohmann::json& refs,
                                                   const std::string& location)
{
    if (!refs.is_array()) {
        return std::unexpected(Error::make("ParseError", location + " must be an array of evidence refs"));
    }
    for (std::size_t i = 0; i < refs.size(); ++i) {
        auto ref = evidence::ref_from_json(refs[i]);
        if (!ref) {
            return std::unexpected(
                Error::make("ParseError", location + "[" + std::to_string(i) + "]: " + ref.error().message));
        }
        if (!bundle.resolves(*ref)) {
            return std::unexpected(Error::make("DanglingReference",
                                               location + "[" + std::to_string(i) + "] cites "
                                                   + std::string(to_string(ref->type)) + " " + ref->stable_id
                                                   + " which is not in bundle " + bundle.diff_id()));
        }
    }
    return {};
}

[[nodiscard]] ossensor::VoidResult walk(const bundle::EvidenceBundle& bundle,
                                        const nlohmann::json& node,
                                        const std::string& location)
{
    if (node.is_object()) {
        for (const auto& [key, value] : node.items()) {
            const std::string child = location + "/" + key;
            if (is_citation_key(key)) {
                if (auto r = check_citations(bundle, value, child); !r) {
                    return r;
                }
                continue;
            }
            if (auto r = walk(bundle, value, child); !r) {
                return r;
            }
        }
    } else if (node.is_array()) {
        for (std::size_t i = 0; i < node.size(); ++i) {
            if (auto r = walk(bundle, node[i], location + "/" + std::to_string(i)); !r) {
                return r;
            }
        }
    }
    return {};
}

}  // namespace

ossensor::VoidResult enforce_citation_policy(const bundle::EvidenceBundle& bundle, const nlohmann::json& document)
{
    return walk(bundle, document, "");
}

}  // namespace ossensor::report
