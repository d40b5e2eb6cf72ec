#include "polyp/errors.h"

namespace {

std::string describe_git_failure(const std::vector<std::string>& args, int exit_code, const std::string& output) {
    std::string command = "git";
    for (const std::string& arg : args) {
        command += " " + arg;
    }
    std::string message = "'" + command + "' ";
    if (exit_code < 0) {
        message += "could not be started";
    } else {
        message += "failed with exit code " + std::to_string(exit_code);
    }
    if (!output.empty()) {
        message += ": " + output;
    }
    return message;
}

}

GitCommandError::GitCommandError(std::vector<std::string> args, int exit_code, std::string output)
    : std::runtime_error(describe_git_failure(args, exit_code, output)),
      args_(std::move(args)), exit_code_(exit_code), output_(std::move(output)) {}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotARepository: return "not-a-repository";
        case ErrorKind::RefNotFound: return "ref-not-found";
        case ErrorKind::OperationInProgress: return "operation-in-progress";
        case ErrorKind::ExternalRebaseInProgress: return "external-rebase-in-progress";
        case ErrorKind::NoOperation: return "no-operation";
        case ErrorKind::ConflictsPending: return "conflicts-pending";
        case ErrorKind::CorruptState: return "corrupt-state";
        case ErrorKind::EmptyStack: return "empty-stack";
        case ErrorKind::Plumbing: return "plumbing";
        case ErrorKind::Cancelled: return "cancelled";
    }
    return "unknown";
}
