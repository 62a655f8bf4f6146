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
#include <string>
#include <stdint.h>

namespace wasmverify {

// returns local timestamp in millisecond since the Epoch
uint64_t local_timestamp_msec();

// formatStr as for strftime (e.g. "%Y-%m-%d.%T"), if decimals==true, then .### milliseconds added
// returns bytes consumed
size_t format_timestamp(char* buffer, size_t bufferCap, const char* formatStr, uint64_t timestamp, bool formatMsec=true);

} //namespace
