#include "tokvec/io/artifact_io.hpp"
#include "tokvec/error.hpp"
#include "tokvec/io/json_lines.hpp"
#include "tokvec/logging.hpp"

#include <cstring>

namespace tokvec::io {

namespace {

const boost::json::object& require_object(const boost::json::object& obj, const char* key,
                                          const char* what) {
    const auto* value = obj.if_contains(key);
    if (!value || !value->is_object()) {
        throw MalformedArtifactError(std::string(what) + " lacks object field '" + key + "'", __func__);
    }
    return value->as_object();
}

const boost::json::value& require_field(const boost::json::object& obj, const char* key,
                                        const char* what) {
    const auto* value = obj.if_contains(key);
    if (!value) {
        throw MalformedArtifactError(std::string(what) + " lacks field '" + key + "'", __func__);
    }
    return *value;
}

template<typename T>
T require_number(const boost::json::object& obj, const char* key, const char* what) {
    const auto& value = require_field(obj, key, what);
    if (!value.is_number()) {
        throw MalformedArtifactError(std::string(what) + " field '" + key + "' is not a number", __func__);
    }
    boost::system::error_code ec;
    T result = value.to_number<T>(ec);
    if (ec) {
        throw MalformedArtifactError(std::string(what) + " field '" + key + "': " + ec.message(), __func__);
    }
    return result;
}

std::string require_string(const boost::json::object& obj, const char* key, const char* what) {
    const auto& value = require_field(obj, key, what);
    if (!value.is_string()) {
        throw MalformedArtifactError(std::string(what) + " field '" + key + "' is not a string", __func__);
    }
    const auto& s = value.as_string();
    return std::string(s.data(), s.size());
}

bool optional_bool(const boost::json::object& obj, const char* key, bool fallback) {
    const auto* value = obj.if_contains(key);
    return value && value->is_bool() ? value->as_bool() : fallback;
}

std::string optional_string(const boost::json::object& obj, const char* key, const std::string& fallback) {
    const auto* value = obj.if_contains(key);
    if (!value || !value->is_string()) return fallback;
    const auto& s = value->as_string();
    return std::string(s.data(), s.size());
}

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Little-endian byte order regardless of the host
void append_hex(std::string& out, uint64_t bits, size_t width) {
    for (size_t b = 0; b < width; ++b) {
        const auto byte = static_cast<uint8_t>(bits >> (8 * b));
        out.push_back(HEX_DIGITS[byte >> 4]);
        out.push_back(HEX_DIGITS[byte & 0x0F]);
    }
}

uint64_t float_bits(float value, Precision precision) {
    switch (precision) {
        case Precision::Float16: {
            Eigen::half h(value);
            uint16_t bits;
            std::memcpy(&bits, &h, sizeof(bits));
            return bits;
        }
        case Precision::Float32: {
            uint32_t bits;
            std::memcpy(&bits, &value, sizeof(bits));
            return bits;
        }
        case Precision::Float64: {
            double wide = value;
            uint64_t bits;
            std::memcpy(&bits, &wide, sizeof(bits));
            return bits;
        }
    }
    return 0;
}

float bits_to_float(uint64_t bits, Precision precision) {
    switch (precision) {
        case Precision::Float16: {
            const auto narrow = static_cast<uint16_t>(bits);
            Eigen::half h;
            std::memcpy(&h, &narrow, sizeof(narrow));
            return static_cast<float>(h);
        }
        case Precision::Float32: {
            const auto narrow = static_cast<uint32_t>(bits);
            float value;
            std::memcpy(&value, &narrow, sizeof(value));
            return value;
        }
        case Precision::Float64: {
            double value;
            std::memcpy(&value, &bits, sizeof(value));
            return static_cast<float>(value);
        }
    }
    return 0.0f;
}

// Vocabulary size declared by a vocabulary record, without building it
size_t declared_dimension(const boost::json::value& record) {
    if (!record.is_object()) {
        throw MalformedArtifactError("Vocabulary record is not an object", __func__);
    }
    const auto& counter = require_object(record.as_object(), "counter", "Vocabulary");
    return require_object(counter, "dict", "Vocabulary counter").size();
}

} // namespace

// =============================================================================
// Vocabulary
// =============================================================================

boost::json::object params_to_json(const text::TextModelParams& params) {
    boost::json::object obj;
    obj["lang"] = params.lang;
    obj["lc"] = params.lc;
    obj["del_diac"] = params.del_diac;
    obj["del_punc"] = params.del_punc;
    obj["usr_option"] = params.usr_option;
    obj["url_option"] = params.url_option;
    boost::json::array token_list;
    for (int n : params.token_list) {
        token_list.push_back(n);
    }
    obj["token_list"] = std::move(token_list);
    return obj;
}

text::TextModelParams params_from_json(const boost::json::object& obj) {
    text::TextModelParams params =
        text::TextModelParams::for_language(optional_string(obj, "lang", "es"));
    params.lc = optional_bool(obj, "lc", params.lc);
    params.del_diac = optional_bool(obj, "del_diac", params.del_diac);
    params.del_punc = optional_bool(obj, "del_punc", params.del_punc);
    params.usr_option = optional_string(obj, "usr_option", params.usr_option);
    params.url_option = optional_string(obj, "url_option", params.url_option);

    if (const auto* list = obj.if_contains("token_list")) {
        if (!list->is_array()) {
            throw MalformedArtifactError("params.token_list is not an array", __func__);
        }
        params.token_list.clear();
        for (const auto& n : list->as_array()) {
            if (!n.is_int64()) {
                throw MalformedArtifactError("params.token_list holds a non-integer", __func__);
            }
            params.token_list.push_back(static_cast<int>(n.as_int64()));
        }
    }
    return params;
}

boost::json::object vocabulary_to_json(const text::Vocabulary& vocabulary) {
    boost::json::object dict;
    for (const auto& [token, count] : vocabulary.counter().items()) {
        dict[token] = count;
    }
    boost::json::object counter;
    counter["dict"] = std::move(dict);
    counter["update_calls"] = vocabulary.counter().update_calls();

    boost::json::object record;
    record["params"] = params_to_json(vocabulary.params());
    record["counter"] = std::move(counter);
    return record;
}

std::shared_ptr<text::Vocabulary> vocabulary_from_json(const boost::json::value& record,
                                                       int size_exponent,
                                                       text::SymbolTable symbols) {
    if (!record.is_object()) {
        throw MalformedArtifactError("Vocabulary record is not an object", __func__);
    }
    const auto& obj = record.as_object();
    const auto& params = require_object(obj, "params", "Vocabulary");
    const auto& counter = require_object(obj, "counter", "Vocabulary");
    const auto& dict = require_object(counter, "dict", "Vocabulary counter");
    const auto update_calls = require_number<uint64_t>(counter, "update_calls", "Vocabulary counter");

    std::vector<text::Counter::Entry> entries;
    entries.reserve(dict.size());
    for (const auto& item : dict) {
        boost::system::error_code ec;
        const int64_t frequency = item.value().is_number() ? item.value().to_number<int64_t>(ec) : 0;
        if (!item.value().is_number() || ec) {
            throw MalformedArtifactError("Frequency of '" + std::string(item.key()) + "' is not an integer",
                                         __func__);
        }
        entries.emplace_back(std::string(item.key()), frequency);
    }

    return std::make_shared<text::Vocabulary>(params_from_json(params),
                                              text::Counter(std::move(entries), update_calls),
                                              size_exponent, std::move(symbols));
}

void save_vocabulary(const text::Vocabulary& vocabulary, const std::string& path) {
    LineWriter writer(path);
    writer.write(boost::json::value(vocabulary_to_json(vocabulary)));
    writer.close();
    LOG_INFO("Saved vocabulary ", vocabulary.identifier(), " (", vocabulary.size(), " tokens) to ", path);
}

std::shared_ptr<text::Vocabulary> load_vocabulary(const std::string& path, int size_exponent,
                                                  text::SymbolTable symbols) {
    auto records = read_records(path, 1);
    if (records.empty()) {
        throw MalformedArtifactError("Empty vocabulary file: " + path, __func__);
    }
    return vocabulary_from_json(records.front(), size_exponent, std::move(symbols));
}

text::SymbolTable load_symbols(const std::string& path) {
    auto records = read_records(path, 1);
    if (records.empty() || !records.front().is_object()) {
        throw MalformedArtifactError("Symbol file must hold a JSON object: " + path, __func__);
    }
    text::SymbolTable symbols;
    for (const auto& item : records.front().as_object()) {
        if (!item.value().is_string()) {
            throw MalformedArtifactError("Symbol '" + std::string(item.key()) + "' maps to a non-string",
                                         __func__);
        }
        const auto& canonical = item.value().as_string();
        symbols.emplace_back(std::string(item.key()), std::string(canonical.data(), canonical.size()));
    }
    LOG_DEBUG("Loaded ", symbols.size(), " symbols from ", path);
    return symbols;
}

// =============================================================================
// Coefficient codec
// =============================================================================

std::string encode_coef(const Vector& coef, Precision precision) {
    const size_t width = precision_width(precision);
    std::string hex;
    hex.reserve(static_cast<size_t>(coef.size()) * width * 2);
    for (Eigen::Index i = 0; i < coef.size(); ++i) {
        append_hex(hex, float_bits(coef[i], precision), width);
    }
    return hex;
}

Vector decode_coef(const std::string& hex, Precision precision, size_t expected) {
    const size_t width = precision_width(precision);
    if (hex.size() != expected * width * 2) {
        throw MalformedArtifactError(
            "Coefficient buffer holds " + std::to_string(hex.size() / 2) + " bytes, expected " +
            std::to_string(expected) + " x " + std::to_string(width), __func__,
            "Check that the declared precision matches the file");
    }

    Vector coef(static_cast<Eigen::Index>(expected));
    size_t pos = 0;
    for (size_t i = 0; i < expected; ++i) {
        uint64_t bits = 0;
        for (size_t b = 0; b < width; ++b) {
            const int hi = hex_value(hex[pos++]);
            const int lo = hex_value(hex[pos++]);
            if (hi < 0 || lo < 0) {
                throw MalformedArtifactError("Invalid hex digit in coefficient buffer", __func__);
            }
            bits |= static_cast<uint64_t>((hi << 4) | lo) << (8 * b);
        }
        coef[static_cast<Eigen::Index>(i)] = bits_to_float(bits, precision);
    }
    return coef;
}

boost::json::object artifact_to_json(const TrainedTokenArtifact& artifact, Precision precision) {
    boost::json::object record;
    record["N"] = artifact.N;
    record["coef"] = encode_coef(artifact.coef, precision);
    record["intercept"] = static_cast<double>(artifact.intercept);
    record["label"] = artifact.label;
    return record;
}

TrainedTokenArtifact artifact_from_json(const boost::json::value& record,
                                        Precision precision, size_t dimension) {
    if (!record.is_object()) {
        throw MalformedArtifactError("Token record is not an object", __func__);
    }
    const auto& obj = record.as_object();

    TrainedTokenArtifact artifact;
    artifact.label = require_string(obj, "label", "Token record");
    artifact.N = require_number<size_t>(obj, "N", "Token record");
    artifact.intercept = static_cast<float>(require_number<double>(obj, "intercept", "Token record"));
    artifact.coef = decode_coef(require_string(obj, "coef", "Token record"), precision, dimension);
    return artifact;
}

// =============================================================================
// Model
// =============================================================================

void save_model(const std::string& path, const text::Vocabulary& vocabulary,
                const std::vector<TrainedTokenArtifact>& artifacts, Precision precision) {
    LineWriter writer(path);
    writer.write(boost::json::value(vocabulary_to_json(vocabulary)));
    for (const auto& artifact : artifacts) {
        if (static_cast<size_t>(artifact.coef.size()) != vocabulary.size()) {
            throw InvalidArgumentError("Artifact '" + artifact.label + "' has " +
                                       std::to_string(artifact.coef.size()) +
                                       " coefficients for a vocabulary of " +
                                       std::to_string(vocabulary.size()), __func__);
        }
        writer.write(boost::json::value(artifact_to_json(artifact, precision)));
    }
    writer.close();
    LOG_INFO("Saved model with ", artifacts.size(), " token classifiers to ", path,
             " (", precision_name(precision), ")");
}

ModelArtifact load_model(const std::string& path, Precision precision, text::SymbolTable symbols) {
    LineReader reader(path);
    std::string line;
    size_t line_no = 0;

    auto next_record = [&](boost::json::value& value) {
        while (reader.next(line)) {
            ++line_no;
            if (line.empty()) continue;
            boost::system::error_code ec;
            value = boost::json::parse(line, ec);
            if (ec) {
                throw MalformedArtifactError("Invalid JSON at " + path + ":" + std::to_string(line_no),
                                             __func__);
            }
            return true;
        }
        return false;
    };

    boost::json::value record;
    if (!next_record(record)) {
        throw MalformedArtifactError("Empty model file: " + path, __func__);
    }

    ModelArtifact model;
    auto vocabulary = vocabulary_from_json(record, -1, std::move(symbols));
    model.vocabulary = vocabulary;

    while (next_record(record)) {
        TrainedTokenArtifact artifact = artifact_from_json(record, precision, vocabulary->size());
        if (!vocabulary->contains(artifact.label)) {
            throw MalformedArtifactError("Token record '" + artifact.label + "' at line " +
                                         std::to_string(line_no) + " is not in the vocabulary",
                                         __func__);
        }
        model.artifacts.push_back(std::move(artifact));
    }

    LOG_INFO("Loaded model ", path, ": ", vocabulary->size(), " tokens, ",
             model.artifacts.size(), " token classifiers");
    return model;
}

size_t convert_precision(const std::string& input, const std::string& output,
                         Precision from, Precision to) {
    auto records = read_records(input);
    if (records.empty()) {
        throw MalformedArtifactError("Empty model file: " + input, __func__);
    }
    const size_t dimension = declared_dimension(records.front());

    LineWriter writer(output);
    writer.write(records.front());
    for (size_t i = 1; i < records.size(); ++i) {
        TrainedTokenArtifact artifact = artifact_from_json(records[i], from, dimension);
        writer.write(boost::json::value(artifact_to_json(artifact, to)));
    }
    writer.close();

    LOG_INFO("Converted ", records.size() - 1, " token records from ", precision_name(from),
             " to ", precision_name(to));
    return records.size() - 1;
}

} // namespace tokvec::io
