#pragma once

#include "libkeyscore/metric_config.hpp"

#include <string>

namespace libkeyscore {

/**
 * Parses an evaluation configuration from YAML text.
 *
 * The document holds a `metrics` map (in evaluation order) and optional `ngrams` and
 * `ngram_mapper` sections. Disabled metrics are read no further than their `enabled` flag.
 * Any malformed or missing entry of an enabled metric raises std::invalid_argument naming
 * the metric and the offending parameter.
 */
[[nodiscard]] EvaluationConfig parse_evaluation_config(const std::string& yaml_text);

// Throws std::runtime_error if the file cannot be read.
[[nodiscard]] EvaluationConfig load_evaluation_config(const std::string& path);

}  // namespace libkeyscore
