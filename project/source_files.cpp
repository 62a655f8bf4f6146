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

#include "source_files.h"
#include "../core/errors.h"
#include "../utility/fsutils.h"
#include "../utility/logger.h"
#include <boost/filesystem.hpp>
#include <algorithm>
#include <set>

namespace wasmverify {

	namespace fs = boost::filesystem;

	namespace
	{
		// Path as hashed: relative to the root, '/' separated, independent of where the project is checked out
		std::string RelativeName(const fs::path& root, const fs::path& full)
		{
			fs::path rel = fs::absolute(full).lexically_normal().lexically_relative(fs::absolute(root).lexically_normal());
			if (rel.empty() || (rel == ".") || (*rel.begin() == ".."))
				throw IOError("source file outside the project root: " + full.string());

			return rel.generic_string();
		}

		void ReadInto(SourceFile& sf, const fs::path& full)
		{
			try
			{
				sf.m_Content = fsutils::fread(full);
			}
			catch (const std::runtime_error& e)
			{
				throw IOError(e.what());
			}
		}
	}

	bool SourceFileResolver::IsSourceFile(const fs::path& p)
	{
		auto sName = p.filename().string();
		return
			(p.extension() == ".rs") ||
			(sName == "Cargo.toml") ||
			(sName == "Cargo.lock");
	}

	bool SourceFileResolver::IsSkippedDir(const fs::path& p)
	{
		auto sName = p.filename().string();
		return
			(sName == "target") ||
			(!sName.empty() && ('.' == sName[0]));
	}

	void SourceFileResolver::Sort(SourceFileSet& v)
	{
		// std::string comparison is byte-wise, locale independent
		std::sort(v.begin(), v.end(), [](const SourceFile& a, const SourceFile& b) {
			return a.m_Path < b.m_Path;
		});
	}

	SourceFileSet SourceFileResolver::Resolve(const fs::path& root, const std::vector<std::string>& vPaths)
	{
		boost::system::error_code ec;
		if (!fs::is_directory(root, ec))
			throw IOError("project root is not a readable directory: " + root.string());

		SourceFileSet res;

		if (!vPaths.empty())
		{
			std::set<std::string> setSeen;
			for (const auto& sPath : vPaths)
			{
				fs::path p(sPath);
				fs::path full = p.is_absolute() ? p : (root / p);

				if (!fs::is_regular_file(full, ec))
					throw IOError("source file not found: " + full.string());

				auto sName = RelativeName(root, full);
				if (!setSeen.insert(sName).second)
					continue;

				auto& sf = res.emplace_back();
				sf.m_Path = std::move(sName);
				ReadInto(sf, full);
			}
		}
		else
		{
			fs::recursive_directory_iterator it(root, ec), itEnd;
			if (ec)
				throw IOError("cannot read project root " + root.string() + ": " + ec.message());

			for (; it != itEnd; it.increment(ec))
			{
				if (ec)
					throw IOError("project traversal failed: " + ec.message());

				const fs::path& p = it->path();

				if (fs::is_directory(it->status()))
				{
					if (IsSkippedDir(p))
						it.disable_recursion_pending();
					continue;
				}

				if (!fs::is_regular_file(it->status()) || !IsSourceFile(p))
					continue;

				auto& sf = res.emplace_back();
				sf.m_Path = RelativeName(root, p);
				ReadInto(sf, p);
			}

			if (ec)
				throw IOError("project traversal failed: " + ec.message());
		}

		Sort(res);

		LOG_DEBUG() << "Resolved " << res.size() << " source files under " << root.string();
		return res;
	}

} // namespace wasmverify
