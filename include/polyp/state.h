#ifndef POLYP_STATE_H
#define POLYP_STATE_H

#include "polyp/metadata.h"

#include <optional>
#include <string>

extern const std::string METADATA_FILENAME;

// Durable record of the in-flight rebase-stack operation for one repository.
// Its presence is the "operation in progress" flag.
class StateStore {
public:
    explicit StateStore(const std::string& git_dir);

    void save(const OperationMetadata& metadata) const;
    // std::nullopt when no operation is in progress. Throws MetadataError for
    // unreadable records and std::runtime_error for I/O failures.
    std::optional<OperationMetadata> load() const;
    bool exists() const;
    // Idempotent.
    void remove() const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

#endif
