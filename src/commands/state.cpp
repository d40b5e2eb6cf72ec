#include "polyp/state.h"
#include "polyp/utils.h"

#include <stdexcept>

const std::string METADATA_FILENAME = "rebase-stack-metadata";

StateStore::StateStore(const std::string& git_dir)
    : path_((fs::path(git_dir) / METADATA_FILENAME).string()) {}

void StateStore::save(const OperationMetadata& metadata) const {
    write_file_atomic(path_, format_metadata_content(metadata));
}

std::optional<OperationMetadata> StateStore::load() const {
    if (!exists()) {
        return std::nullopt;
    }
    std::string content = read_file(path_);
    return parse_metadata_content(content);
}

bool StateStore::exists() const {
    return file_exists(path_);
}

void StateStore::remove() const {
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        throw std::runtime_error("Failed to delete metadata file " + path_ + ": " + ec.message());
    }
}
