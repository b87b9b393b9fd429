/**
 * Persisted vocabulary and embedding-model artifacts.
 *
 * Vocabulary: one JSON record
 *   {"params": {...}, "counter": {"dict": {token: freq}, "update_calls": n}}
 *
 * Model: newline-delimited JSON (gzip when the path ends in ".gz"); line 1 is
 * the vocabulary record, every following line is
 *   {"N": n, "coef": "<hex>", "intercept": b, "label": "<token>"}
 * where coef holds vocabulary-size little-endian floats whose width is
 * declared by the caller.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <boost/json.hpp>

#include "tokvec/text/vocabulary.hpp"
#include "tokvec/types.hpp"

namespace tokvec::io {

// =============================================================================
// Vocabulary
// =============================================================================

boost::json::object params_to_json(const text::TextModelParams& params);
text::TextModelParams params_from_json(const boost::json::object& obj);

boost::json::object vocabulary_to_json(const text::Vocabulary& vocabulary);

/**
 * Throws MalformedArtifactError when "params" or "counter" (with "dict" and
 * "update_calls") is missing.
 */
std::shared_ptr<text::Vocabulary> vocabulary_from_json(const boost::json::value& record,
                                                       int size_exponent = -1,
                                                       text::SymbolTable symbols = {});

void save_vocabulary(const text::Vocabulary& vocabulary, const std::string& path);
std::shared_ptr<text::Vocabulary> load_vocabulary(const std::string& path,
                                                  int size_exponent = -1,
                                                  text::SymbolTable symbols = {});

// JSON object {surface: canonical}
text::SymbolTable load_symbols(const std::string& path);

// =============================================================================
// Coefficient codec
// =============================================================================

std::string encode_coef(const Vector& coef, Precision precision);

// Throws MalformedArtifactError unless hex holds exactly `expected` values
Vector decode_coef(const std::string& hex, Precision precision, size_t expected);

boost::json::object artifact_to_json(const TrainedTokenArtifact& artifact, Precision precision);
TrainedTokenArtifact artifact_from_json(const boost::json::value& record,
                                        Precision precision, size_t dimension);

// =============================================================================
// Model
// =============================================================================

struct ModelArtifact {
    std::shared_ptr<const text::Vocabulary> vocabulary;
    std::vector<TrainedTokenArtifact> artifacts;
};

void save_model(const std::string& path, const text::Vocabulary& vocabulary,
                const std::vector<TrainedTokenArtifact>& artifacts, Precision precision);

ModelArtifact load_model(const std::string& path, Precision precision,
                         text::SymbolTable symbols = {});

/**
 * Rewrites a model with its coefficients re-encoded at another width.
 * Returns the number of token records converted.
 */
size_t convert_precision(const std::string& input, const std::string& output,
                         Precision from, Precision to);

} // namespace tokvec::io
