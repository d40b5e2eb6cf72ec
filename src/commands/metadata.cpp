#include "polyp/metadata.h"
#include "polyp/errors.h"
#include "polyp/utils.h"

#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <sstream>

namespace {

const std::string HEADER_LINE = "rebase-stack 1";

const std::vector<std::string> REQUIRED_FIELDS = {
    "base-branch", "merge-base", "target-branch", "stack", "original-branch"
};

const std::set<std::string> TOP_LEVEL_FIELDS = {
    "base-branch", "target-branch", "original-branch", "merge-base", "timestamp", "stack"
};

[[noreturn]] void invalid_structure(const std::string& what) {
    throw MetadataError(MetadataErrorKind::InvalidStructure, "Invalid metadata structure: " + what);
}

size_t parse_count(const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos || value.size() > 9) {
        invalid_structure("stack count '" + value + "' is not a number");
    }
    return static_cast<size_t>(std::stoul(value));
}

// An entry as read, before the message is decoded.
struct RawEntry {
    std::string commit;
    std::vector<std::string> branches;
    std::optional<std::string> message;
};

std::string decode_message(const std::string& stored, const std::string& commit) {
    std::optional<std::string> decoded = base64_decode(stored);
    if (!decoded) {
        std::cerr << "Warning: Could not decode stored message of " << short_sha(commit)
                  << "; using the stored text as is." << std::endl;
        return stored;
    }
    return *decoded;
}

}

OperationMetadata make_metadata(const std::string& base_branch, const std::string& merge_base,
                                const std::string& target_branch, const Stack& stack,
                                const std::string& original_branch) {
    OperationMetadata metadata;
    metadata.base_branch = base_branch;
    metadata.merge_base = merge_base;
    metadata.target_branch = target_branch;
    metadata.stack = stack;
    metadata.original_branch = original_branch;
    metadata.timestamp = get_current_timestamp_utc();
    return metadata;
}

std::string format_metadata_content(const OperationMetadata& metadata) {
    std::ostringstream oss;
    oss << HEADER_LINE << "\n";
    oss << "base-branch " << metadata.base_branch << "\n";
    oss << "target-branch " << metadata.target_branch << "\n";
    oss << "original-branch " << metadata.original_branch << "\n";
    oss << "merge-base " << metadata.merge_base << "\n";
    if (!metadata.timestamp.empty()) {
        oss << "timestamp " << metadata.timestamp << "\n";
    }
    oss << "stack " << metadata.stack.size() << "\n";
    for (const StackEntry& entry : metadata.stack) {
        oss << "commit " << entry.commit << "\n";
        for (const std::string& branch : entry.branches) {
            oss << "branch " << branch << "\n";
        }
        oss << "message " << base64_encode(entry.message) << "\n";
    }
    return oss.str();
}

OperationMetadata parse_metadata_content(const std::string& content) {
    std::istringstream iss(content);
    std::string line;

    if (!std::getline(iss, line)) {
        invalid_structure("record is empty");
    }
    if (line != HEADER_LINE) {
        invalid_structure("unrecognized header '" + line + "'");
    }

    std::map<std::string, std::string> fields;
    std::vector<RawEntry> entries;

    while (std::getline(iss, line)) {
        if (line.empty()) continue;

        // "original-branch " carries an empty value on a detached HEAD.
        size_t space_pos = line.find(' ');
        std::string key = line.substr(0, space_pos);
        std::string value = space_pos == std::string::npos ? "" : line.substr(space_pos + 1);

        if (TOP_LEVEL_FIELDS.count(key)) {
            if (!entries.empty()) {
                invalid_structure("field '" + key + "' after the first stack entry");
            }
            if (!fields.emplace(key, value).second) {
                invalid_structure("duplicate field '" + key + "'");
            }
        } else if (key == "commit") {
            if (value.empty()) {
                invalid_structure("stack entry without a commit id");
            }
            entries.push_back(RawEntry{value, {}, std::nullopt});
        } else if (key == "branch") {
            if (entries.empty()) invalid_structure("branch line before any commit");
            entries.back().branches.push_back(value);
        } else if (key == "message") {
            if (entries.empty()) invalid_structure("message line before any commit");
            if (entries.back().message) {
                invalid_structure("second message for commit " + entries.back().commit);
            }
            entries.back().message = value;
        } else {
            invalid_structure("unknown field '" + key + "'");
        }
    }

    std::vector<std::string> missing;
    for (const std::string& field : REQUIRED_FIELDS) {
        if (!fields.count(field)) missing.push_back(field);
    }
    for (size_t i = 0; i < entries.size(); ++i) {
        if (!entries[i].message) missing.push_back("stack[" + std::to_string(i) + "].message");
    }
    if (!missing.empty()) {
        std::string names;
        for (size_t i = 0; i < missing.size(); ++i) {
            if (i > 0) names += ", ";
            names += missing[i];
        }
        throw MetadataError(MetadataErrorKind::MissingField, "Missing required fields: " + names, missing);
    }

    size_t expected = parse_count(fields["stack"]);
    if (expected != entries.size()) {
        invalid_structure("stack declares " + std::to_string(expected) + " entries but " +
                          std::to_string(entries.size()) + " were found");
    }

    OperationMetadata metadata;
    metadata.base_branch = fields["base-branch"];
    metadata.target_branch = fields["target-branch"];
    metadata.original_branch = fields["original-branch"];
    metadata.merge_base = fields["merge-base"];
    auto timestamp = fields.find("timestamp");
    if (timestamp != fields.end()) metadata.timestamp = timestamp->second;

    for (RawEntry& raw : entries) {
        StackEntry entry;
        entry.commit = raw.commit;
        entry.branches = std::move(raw.branches);
        entry.message = decode_message(*raw.message, raw.commit);
        metadata.stack.push_back(std::move(entry));
    }
    return metadata;
}
