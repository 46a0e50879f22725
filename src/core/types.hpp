#pragma once

#include <string>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// What the process-runner hands over once a build or test process is gone.
// launch_error is set (and output/exit_code meaningless) when the process
// could not be started at all.
struct ProcessOutcome {
    int exit_code = -1;
    std::string output;             // combined stdout + stderr
    std::string launch_error;

    bool launched() const { return launch_error.empty(); }
    bool succeeded() const { return launched() && exit_code == 0; }

    static ProcessOutcome completed(int code, std::string text) {
        ProcessOutcome o;
        o.exit_code = code;
        o.output = std::move(text);
        return o;
    }

    static ProcessOutcome failed_to_launch(std::string error) {
        ProcessOutcome o;
        o.launch_error = std::move(error);
        return o;
    }
};
