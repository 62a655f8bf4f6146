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
#include "../utility/common.h"
#include <boost/filesystem/path.hpp>

namespace wasmverify {

	struct SourceFile
	{
		std::string m_Path; // relative to the project root, '/' separated
		ByteBuffer m_Content;
	};

	// Sorted by path (byte-wise), independent of the filesystem traversal order
	typedef std::vector<SourceFile> SourceFileSet;

	struct SourceFileResolver
	{
		// default build-defining patterns
		static bool IsSourceFile(const boost::filesystem::path&);
		static bool IsSkippedDir(const boost::filesystem::path&);

		// Enumerates and reads the project files.
		// If vPaths is empty - walks the project tree using the default patterns.
		// Otherwise reads exactly the listed files (relative to the root, or absolute under it), duplicates removed.
		// Throws IOError if the root is unreadable, a listed path is missing or lies outside the root.
		static SourceFileSet Resolve(const boost::filesystem::path& root, const std::vector<std::string>& vPaths);

		static void Sort(SourceFileSet&);
	};

} // namespace wasmverify
