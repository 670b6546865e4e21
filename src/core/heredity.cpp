// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "heredity.hpp"

#include <chrono>
#include <sstream>
#include <iterator>
#include <algorithm>
#include <utility>
#include <cstddef>
#include <vector>
#include <string>

#include "config/common.hpp"
#include "core/models/genotype/pedigree_model.hpp"
#include "core/tools/hypothesis_enumerator.hpp"
#include "exceptions/impossible_evidence_error.hpp"
#include "logging/logging.hpp"
#include "utils/timing.hpp"

namespace heredity {

namespace {

constexpr std::size_t hypothesis_warning_threshold {100'000'000};

void log_startup_info(const InferenceComponents& components, const HypothesisEnumerator& enumerator)
{
    logging::InfoLogger log {};
    const auto& pedigree = components.pedigree();
    const auto members = pedigree.members();
    {
        std::ostringstream ss {};
        if (members.size() == 1) {
            ss << "Detected 1 person: ";
        } else {
            ss << "Detected " << members.size() << " people: ";
        }
        std::transform(std::cbegin(members), std::cend(members), std::ostream_iterator<std::string> {ss, " "},
                       [] (const auto& person) -> std::string {
                           return "\"" + person + "\"";
                       });
        auto str = ss.str();
        str.pop_back(); // the extra whitespace
        log << str;
    }
    const auto num_founders = get_founders(pedigree).size();
    const auto num_unobserved = count_unobserved(pedigree);
    stream(log) << num_founders << (num_founders == 1 ? " founder and " : " founders and ")
                << num_unobserved << (num_unobserved == 1 ? " person" : " people") << " with an unobserved trait";
    stream(log) << "Enumerating " << enumerator.num_hypotheses() << " configurations";
    if (enumerator.num_hypotheses() > hypothesis_warning_threshold) {
        logging::WarningLogger warn_log {};
        stream(warn_log) << "The number of configurations is very large, inference may take a long time";
    }
    auto sl = stream(log);
    sl << "Writing distributions to ";
    if (components.output().path()) {
        sl << *components.output().path();
    } else {
        sl << "stdout";
    }
}

void log_pedigree(const Pedigree& pedigree)
{
    auto debug_log = logging::get_debug_log();
    if (!debug_log) return;
    for (const auto& person : pedigree.members()) {
        auto ls = stream(*debug_log);
        ls << person;
        const auto parents = pedigree.parents_of(person);
        if (parents) {
            ls << " (mother " << parents->mother << ", father " << parents->father << ")";
        } else {
            ls << " (founder)";
        }
        const auto trait = pedigree.observed_trait(person);
        if (trait) {
            ls << " trait " << (*trait ? "observed" : "absent");
        } else {
            ls << " trait unknown";
        }
    }
}

void log_probability_tables(const ProbabilityTables& tables)
{
    auto debug_log = logging::get_debug_log();
    if (debug_log) stream(*debug_log) << "Probability tables: " << tables;
}

void log_configuration(const GeneAssignment& genes, const TraitAssignment& traits, const Probability probability,
                       const std::vector<PersonName>& people, logging::TraceLogger& trace_log)
{
    auto ls = stream(trace_log);
    for (const auto& person : people) {
        ls << person << '=' << genes.count_of(person) << (traits.has_trait(person) ? "+ " : "- ");
    }
    ls << "p=" << probability;
}

void log_finish_info(const InferenceComponents& components, const std::size_t num_configurations,
                     const utils::TimeInterval run_duration)
{
    logging::InfoLogger info_log {};
    stream(info_log) << "Finished evaluating " << num_configurations << " configurations, total runtime "
                     << run_duration;
    const auto& output_path = components.output().path();
    if (output_path) stream(info_log) << "Distributions have been written to " << *output_path;
}

auto compute_marginal_distributions(const Pedigree& pedigree, const ProbabilityTables& tables,
                                    const HypothesisEnumerator& enumerator, std::size_t& num_configurations)
{
    const PedigreeModel model {pedigree, tables};
    auto result = make_marginal_distributions(pedigree);
    auto trace_log = logging::get_trace_log();
    const auto people = pedigree.members();
    Probability evidence {0};
    num_configurations = enumerator.enumerate([&] (const GeneAssignment& genes, const TraitAssignment& traits) {
        const auto probability = model.evaluate(genes, traits);
        if (trace_log) log_configuration(genes, traits, probability, people, *trace_log);
        result.update(genes, traits, probability);
        evidence += probability;
    });
    if (!(evidence > 0)) throw ImpossibleEvidenceError {};
    result.normalise();
    return result;
}

} // namespace

MarginalDistributions compute_marginal_distributions(const Pedigree& pedigree, const ProbabilityTables& tables)
{
    const HypothesisEnumerator enumerator {pedigree};
    std::size_t num_configurations {};
    return compute_marginal_distributions(pedigree, tables, enumerator, num_configurations);
}

void run_heredity(InferenceComponents& components, UserCommandInfo info)
{
    auto debug_log = logging::get_debug_log();
    if (debug_log) {
        stream(*debug_log) << "Invoked with command: " << info.command;
        stream(*debug_log) << "Invoked with options: " << info.options;
    }
    const HypothesisEnumerator enumerator {components.pedigree()};
    log_startup_info(components, enumerator);
    log_pedigree(components.pedigree());
    log_probability_tables(components.probability_tables());
    const auto start = std::chrono::system_clock::now();
    std::size_t num_configurations {};
    const auto distributions = compute_marginal_distributions(components.pedigree(), components.probability_tables(),
                                                              enumerator, num_configurations);
    components.output().write(distributions);
    const auto end = std::chrono::system_clock::now();
    log_finish_info(components, num_configurations, {start, end});
}

} // namespace heredity
