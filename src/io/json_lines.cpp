#include "tokvec/io/json_lines.hpp"
#include "tokvec/error.hpp"
#include "tokvec/logging.hpp"

#include <boost/iostreams/filter/gzip.hpp>

namespace tokvec::io {

bool is_gzip_path(const std::string& path) {
    return path.size() >= 3 && path.compare(path.size() - 3, 3, ".gz") == 0;
}

// =============================================================================
// LineReader
// =============================================================================

LineReader::LineReader(const std::string& path)
    : path_(path)
    , file_(path, std::ios::in | std::ios::binary) {
    if (!file_.is_open()) {
        throw IOError("Cannot open file for reading: " + path, __func__);
    }
    if (is_gzip_path(path)) {
        stream_.push(boost::iostreams::gzip_decompressor());
    }
    stream_.push(file_);
}

bool LineReader::next(std::string& line) {
    try {
        if (!std::getline(stream_, line)) return false;
    } catch (const boost::iostreams::gzip_error& e) {
        throw IOError("Corrupt gzip stream in " + path_ + ": " + e.what(), __func__);
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return true;
}

// =============================================================================
// LineWriter
// =============================================================================

LineWriter::LineWriter(const std::string& path)
    : path_(path)
    , file_(path, std::ios::out | std::ios::binary | std::ios::trunc) {
    if (!file_.is_open()) {
        throw TokvecException(ErrorCode::WRITE_FAILED, "Cannot open file for writing: " + path, __func__);
    }
    if (is_gzip_path(path)) {
        stream_.push(boost::iostreams::gzip_compressor());
    }
    stream_.push(file_);
}

LineWriter::~LineWriter() {
    if (closed_) return;
    try {
        close();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to finish ", path_, ": ", e.what());
    }
}

void LineWriter::write(const std::string& line) {
    stream_ << line << '\n';
    if (!stream_) {
        throw TokvecException(ErrorCode::WRITE_FAILED, "Write failed: " + path_, __func__);
    }
}

void LineWriter::write(const boost::json::value& record) {
    write(boost::json::serialize(record));
}

void LineWriter::close() {
    if (closed_) return;
    closed_ = true;
    stream_.reset();  // Flushes the compressor
    file_.close();
    if (file_.fail()) {
        throw TokvecException(ErrorCode::WRITE_FAILED, "Could not finish writing " + path_, __func__);
    }
}

// =============================================================================
// Record readers
// =============================================================================

std::vector<boost::json::value> read_records(const std::string& path, size_t limit) {
    LineReader reader(path);
    std::vector<boost::json::value> records;
    std::string line;
    size_t line_no = 0;
    while ((limit == 0 || records.size() < limit) && reader.next(line)) {
        ++line_no;
        if (line.empty()) continue;
        boost::system::error_code ec;
        boost::json::value value = boost::json::parse(line, ec);
        if (ec) {
            throw MalformedArtifactError("Invalid JSON at " + path + ":" + std::to_string(line_no) +
                                         ": " + ec.message(), __func__);
        }
        records.push_back(std::move(value));
    }
    return records;
}

std::vector<std::string> read_texts(const std::string& path, size_t limit, const std::string& field) {
    std::vector<std::string> texts;
    for (const auto& record : read_records(path, limit)) {
        if (record.is_string()) {
            const auto& text = record.as_string();
            texts.emplace_back(text.data(), text.size());
            continue;
        }
        const auto* obj = record.if_object();
        const auto* value = obj ? obj->if_contains(field) : nullptr;
        if (!value || !value->is_string()) {
            throw MalformedArtifactError("Record without a '" + field + "' string in " + path, __func__);
        }
        const auto& text = value->as_string();
        texts.emplace_back(text.data(), text.size());
    }
    LOG_INFO("Read ", texts.size(), " texts from ", path);
    return texts;
}

std::vector<int> read_labels(const std::string& path, size_t limit, const std::string& field) {
    std::vector<int> labels;
    for (const auto& record : read_records(path, limit)) {
        const auto* obj = record.if_object();
        const auto* value = obj ? obj->if_contains(field) : nullptr;
        if (!value || !value->is_number()) {
            throw MalformedArtifactError("Record without a numeric '" + field + "' in " + path, __func__);
        }
        boost::system::error_code ec;
        const int label = value->to_number<int>(ec);
        if (ec) {
            throw MalformedArtifactError("Label '" + field + "' is not an integer in " + path, __func__);
        }
        labels.push_back(label);
    }
    return labels;
}

} // namespace tokvec::io
