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

#include "errors.h"

namespace wasmverify {

const char* error_str(ErrorCode code) {
    switch (code) {
#define XX(name) case ErrorCode::name: return #name;
        XX(IOError)
        XX(BuildError)
        XX(CompressionError)
        XX(MalformedCalldata)
        XX(RpcError)
        XX(NotFound)
        XX(InvalidArgument)
#undef XX
    }
    return "Unknown";
}

const char* stage_str(Stage stage) {
    switch (stage) {
#define XX(name) case Stage::name: return #name;
        XX(None)
        XX(ResolveFiles)
        XX(HashProject)
        XX(Compile)
        XX(Compress)
        XX(ConstructCalldata)
        XX(FetchRemote)
        XX(Compare)
#undef XX
    }
    return "Unknown";
}

std::string format_error(const Exception& e) {
    std::string res(stage_str(e.stage));
    res += ": ";
    res += error_str(e.code);
    res += ": ";
    res += e.what();
    return res;
}

} //namespace
