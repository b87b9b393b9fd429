#pragma once

#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include <boost/iostreams/filtering_stream.hpp>
#include <boost/json.hpp>

namespace tokvec::io {

// Files ending in ".gz" are read and written through gzip
bool is_gzip_path(const std::string& path);

/**
 * Line-oriented reader over a plain or gzip-compressed file.
 */
class LineReader {
public:
    explicit LineReader(const std::string& path);

    // False at end of input
    bool next(std::string& line);

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::ifstream file_;
    boost::iostreams::filtering_istream stream_;
};

/**
 * Line-oriented writer; the gzip trailer is written by close() or on
 * destruction.
 */
class LineWriter {
public:
    explicit LineWriter(const std::string& path);
    ~LineWriter();

    LineWriter(const LineWriter&) = delete;
    LineWriter& operator=(const LineWriter&) = delete;

    void write(const std::string& line);
    void write(const boost::json::value& record);
    void close();

private:
    std::string path_;
    std::ofstream file_;
    boost::iostreams::filtering_ostream stream_;
    bool closed_ = false;
};

// Parses every non-empty line as a JSON value
std::vector<boost::json::value> read_records(const std::string& path, size_t limit = 0);

/**
 * Text of each record: the `field` member of an object record, or the
 * record itself when it is a JSON string. limit == 0 reads everything.
 */
std::vector<std::string> read_texts(const std::string& path, size_t limit = 0,
                                    const std::string& field = "text");

// Integer "klass" labels of object records
std::vector<int> read_labels(const std::string& path, size_t limit = 0,
                             const std::string& field = "klass");

} // namespace tokvec::io
