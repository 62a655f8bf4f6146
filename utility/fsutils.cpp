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

#include "fsutils.h"
#include <boost/filesystem/fstream.hpp>
#include <sstream>
#include <stdexcept>
#include <errno.h>
#include <string.h>

namespace wasmverify::fsutils
{
    std::vector<uint8_t> fread(const path& path)
    {
        boost::filesystem::ifstream file;

        auto checkerr = [&path, &file] () {
            if (file.fail())
            {
                std::ostringstream ss;
                ss << "fsutils::fread failed for file " << path.string() << ", code " << errno << ", msg " << strerror(errno);
                throw std::runtime_error(ss.str());
            }
        };

        file.open(path, std::ios::binary);
        checkerr();

        file.unsetf(std::ios::skipws);
        file.seekg(0, std::ios::end);
        const auto fileSize = file.tellg();
        file.seekg(0, std::ios::beg);
        checkerr();

        if (!fileSize)
        {
            return std::vector<uint8_t>();
        }

        std::vector<uint8_t> vec;
        vec.resize(static_cast<size_t>(fileSize));

        file.read(reinterpret_cast<char*>(&vec[0]), fileSize);
        checkerr();

        return vec;
    }
}
