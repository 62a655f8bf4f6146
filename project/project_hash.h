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
#include "build_config.h"
#include "source_files.h"

namespace wasmverify {

	typedef Hash32 ProjectHash;

	// keccak256 over the sorted file set followed by the serialized config:
	//	for each file: be64(len(path)) path be64(len(content)) content
	//	then: be64(len(cfg)) cfg
	// The set is expected to be sorted (see SourceFileResolver), it's sorted again if not.
	ProjectHash HashProject(const SourceFileSet&, const BuildConfig&);

} // namespace wasmverify
