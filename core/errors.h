// Copyright 2018 The Beam Team
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once
#include <stdexcept>
#include <string>

namespace wasmverify {

/// Error taxonomy of the verification pipeline
enum class ErrorCode {
    IOError,
    BuildError,
    CompressionError,
    MalformedCalldata,
    RpcError,
    NotFound,
    InvalidArgument
};

/// Pipeline stage an error escaped from
enum class Stage {
    None,
    ResolveFiles,
    HashProject,
    Compile,
    Compress,
    ConstructCalldata,
    FetchRemote,
    Compare
};

/// Returns short error string, e.g. "IOError"
const char* error_str(ErrorCode code);

/// Returns stage name, e.g. "FetchRemote"
const char* stage_str(Stage stage);

/// Base of all exceptions thrown by wasmverify
struct Exception : public std::runtime_error {
    ErrorCode code;
    Stage stage = Stage::None;

    Exception(ErrorCode _code, const std::string& msg) :
        std::runtime_error(msg),
        code(_code)
    {}

    /// Tags the exception once, the innermost stage wins
    void set_stage(Stage s) {
        if (stage == Stage::None) stage = s;
    }
};

struct IOError : public Exception {
    explicit IOError(const std::string& msg) : Exception(ErrorCode::IOError, msg) {}
};

struct BuildError : public Exception {
    /// captured compiler stdout/stderr
    std::string diagnostics;

    BuildError(const std::string& msg, std::string _diagnostics = std::string()) :
        Exception(ErrorCode::BuildError, msg),
        diagnostics(std::move(_diagnostics))
    {}
};

struct CompressionError : public Exception {
    explicit CompressionError(const std::string& msg) : Exception(ErrorCode::CompressionError, msg) {}
};

struct MalformedCalldataError : public Exception {
    explicit MalformedCalldataError(const std::string& msg) : Exception(ErrorCode::MalformedCalldata, msg) {}
};

struct RpcError : public Exception {
    explicit RpcError(const std::string& msg) : Exception(ErrorCode::RpcError, msg) {}
};

struct NotFoundError : public Exception {
    explicit NotFoundError(const std::string& msg) : Exception(ErrorCode::NotFound, msg) {}
};

struct InvalidArgumentError : public Exception {
    explicit InvalidArgumentError(const std::string& msg) : Exception(ErrorCode::InvalidArgument, msg) {}
};

/// "<stage>: <code>: <message>" for log output
std::string format_error(const Exception& e);

} //namespace
