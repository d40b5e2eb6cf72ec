#ifndef POLYP_METADATA_H
#define POLYP_METADATA_H

#include "polyp/stack.h"

#include <string>

struct OperationMetadata {
    std::string base_branch;
    std::string target_branch;
    std::string original_branch;
    std::string merge_base;
    Stack stack;
    std::string timestamp;
};

OperationMetadata make_metadata(const std::string& base_branch, const std::string& merge_base,
                                const std::string& target_branch, const Stack& stack,
                                const std::string& original_branch);

std::string format_metadata_content(const OperationMetadata& metadata);

// Throws MetadataError (InvalidStructure or MissingField).
OperationMetadata parse_metadata_content(const std::string& content);

#endif
