#pragma once

#include <istream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace Fleetshard {

/**
 * Interface for whatever produces the identifier pool for a run.
 * The partition engine only ever sees the materialized result.
 */
class IIdSource {
public:
    virtual ~IIdSource() = default;

    // Returns unique decimal IDs in source order
    virtual std::vector<std::string> FetchIds() = 0;

    // Human-readable origin recorded in the output metadata
    virtual std::string Describe() const = 0;
};

/**
 * Reads IDs separated by newlines, commas or whitespace. '#' starts a
 * comment running to end of line. Repeated IDs are dropped with a warning.
 * Throws std::runtime_error on a token that is not a decimal ID.
 */
std::vector<std::string> ParseIdStream(std::istream& in, const std::string& origin);

class FileIdSource : public IIdSource {
public:
    explicit FileIdSource(std::string path) : path_(std::move(path)) {}

    // Throws std::runtime_error if the file cannot be opened
    std::vector<std::string> FetchIds() override;
    std::string Describe() const override { return "file:" + path_; }

private:
    std::string path_;
};

class StdinIdSource : public IIdSource {
public:
    std::vector<std::string> FetchIds() override;
    std::string Describe() const override { return "stdin"; }
};

/**
 * Creates the source named by source_type ("file" or "stdin").
 * Throws std::invalid_argument for any other type.
 */
std::unique_ptr<IIdSource> CreateIdSource(const std::string& source_type, const std::string& source_path);

} // namespace Fleetshard
