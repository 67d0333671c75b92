#include "id_source.h"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

#include <glog/logging.h>

#include "absl/container/flat_hash_set.h"
#include "../common/identifier.h"

namespace Fleetshard {

std::vector<std::string> ParseIdStream(std::istream& in, const std::string& origin) {
    std::vector<std::string> ids;
    absl::flat_hash_set<std::string> seen;
    size_t duplicates = 0;

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        size_t hash = line.find('#');
        if (hash != std::string::npos) {
            line.resize(hash);
        }

        size_t pos = 0;
        while (pos < line.size()) {
            size_t start = line.find_first_not_of(" \t\r,", pos);
            if (start == std::string::npos) {
                break;
            }
            size_t end = line.find_first_of(" \t\r,", start);
            if (end == std::string::npos) {
                end = line.size();
            }
            std::string token = line.substr(start, end - start);
            pos = end;

            if (!IsNumericId(token)) {
                throw std::runtime_error(origin + ":" + std::to_string(line_no) + ": \"" + token +
                                         "\" is not a numeric ID");
            }
            if (!seen.insert(token).second) {
                ++duplicates;
                VLOG(2) << origin << ":" << line_no << ": dropping repeated ID " << token;
                continue;
            }
            ids.push_back(std::move(token));
        }
    }

    if (in.bad()) {
        throw std::runtime_error("Failed reading IDs from " + origin);
    }
    if (duplicates > 0) {
        LOG(WARNING) << "Dropped " << duplicates << " repeated ID(s) from " << origin;
    }
    return ids;
}

std::vector<std::string> FileIdSource::FetchIds() {
    std::ifstream in(path_);
    if (!in.is_open()) {
        throw std::runtime_error("Failed to open ID source file: " + path_);
    }
    return ParseIdStream(in, path_);
}

std::vector<std::string> StdinIdSource::FetchIds() {
    return ParseIdStream(std::cin, "stdin");
}

std::unique_ptr<IIdSource> CreateIdSource(const std::string& source_type, const std::string& source_path) {
    if (source_type == "file") {
        return std::make_unique<FileIdSource>(source_path);
    }
    if (source_type == "stdin") {
        return std::make_unique<StdinIdSource>();
    }
    throw std::invalid_argument("unknown source_type: " + source_type);
}

} // namespace Fleetshard
