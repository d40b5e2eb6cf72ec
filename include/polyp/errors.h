#ifndef POLYP_ERRORS_H
#define POLYP_ERRORS_H

#include <stdexcept>
#include <string>
#include <vector>
#include <utility>

enum class ErrorKind {
    NotARepository,
    RefNotFound,
    OperationInProgress,
    ExternalRebaseInProgress,
    NoOperation,
    ConflictsPending,
    CorruptState,
    EmptyStack,
    Plumbing,
    Cancelled
};

class PolypError : public std::runtime_error {
public:
    PolypError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// A git invocation that exited non-zero, or could not be started (exit_code -1).
class GitCommandError : public std::runtime_error {
public:
    GitCommandError(std::vector<std::string> args, int exit_code, std::string output);

    const std::vector<std::string>& args() const { return args_; }
    int exit_code() const { return exit_code_; }
    const std::string& output() const { return output_; }

private:
    std::vector<std::string> args_;
    int exit_code_;
    std::string output_;
};

enum class MetadataErrorKind {
    InvalidStructure,
    MissingField
};

class MetadataError : public std::runtime_error {
public:
    MetadataError(MetadataErrorKind kind, const std::string& message,
                  std::vector<std::string> missing_fields = {})
        : std::runtime_error(message), kind_(kind), missing_fields_(std::move(missing_fields)) {}

    MetadataErrorKind kind() const { return kind_; }
    const std::vector<std::string>& missing_fields() const { return missing_fields_; }

private:
    MetadataErrorKind kind_;
    std::vector<std::string> missing_fields_;
};

const char* error_kind_name(ErrorKind kind);

#endif
