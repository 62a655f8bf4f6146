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

#include <iostream>
#include <string>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

#define WASMVERIFY_TEST_INIT \
namespace {\
int g_failureCount = 0;\
void PrintFailure(const char* expression, const char* file, int line){\
    std::cout << "\"" << expression << "\"" << " assertion failed. File: " << file << " at line: " << line << "\n";\
    ++g_failureCount;\
}}\

#define WASMVERIFY_CHECK(s) \
do {\
    if (!(s)) {\
        PrintFailure(#s, __FILE__, __LINE__);\
    }\
} while(false)\

#define WASMVERIFY_CHECK_NO_THROW(s) \
try { \
    s; \
} catch(const std::exception& e) { \
    std::cout << e.what() << "\n"; \
    PrintFailure(#s, __FILE__, __LINE__); \
} \

#define WASMVERIFY_CHECK_THROW(s) \
try { \
    s; \
    PrintFailure(#s, __FILE__, __LINE__); \
} catch(...) { } \

// passes only if the expression throws exactly the given exception type
#define WASMVERIFY_CHECK_THROW_AS(s, ExcType) \
try { \
    s; \
    PrintFailure(#s, __FILE__, __LINE__); \
} catch(const ExcType&) { \
} catch(...) { \
    PrintFailure(#s " threw unexpected type", __FILE__, __LINE__); \
} \

#define WASMVERIFY_CHECK_RESULT g_failureCount ? -1 : 0;

namespace wasmverify { namespace helpers {

/// Scratch directory removed on scope exit
class TempDir {
public:
    explicit TempDir(const char* szTag)
    {
        _path = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path(std::string("wasmverify-") + szTag + "-%%%%-%%%%");
        boost::filesystem::create_directories(_path);
    }

    ~TempDir()
    {
        boost::system::error_code ec;
        boost::filesystem::remove_all(_path, ec);
    }

    const boost::filesystem::path& path() const { return _path; }

    // writes a file relative to the directory, creating parents
    void write(const std::string& relPath, const std::string& content) const
    {
        auto full = _path / relPath;
        boost::filesystem::create_directories(full.parent_path());
        boost::filesystem::ofstream out(full, std::ios::binary | std::ios::trunc);
        out.write(content.data(), content.size());
    }

private:
    boost::filesystem::path _path;
};

}} //namespaces
