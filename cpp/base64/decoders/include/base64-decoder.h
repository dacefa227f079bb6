/*

Wascap-CPP - WebAssembly capability claims, signed and embedded in C++
Copyright (c) 2025 Albert Blasczykowski (Aless Microsystems)

This program is licensed under the Aless Microsystems Source-Available License (Non-Commercial, No Military) v1.0 Available in the Root
Directory of the project as LICENSE in Text Format.
You may use, copy, modify, and distribute this program for Non-Commercial purposes only, subject to the terms of that license.
Use by or for military, intelligence, or defense entities or purposes is strictly prohibited.

If you distribute this program in object form or make it available to others over a network, you must provide the complete
corresponding source code for the provided functionality under this same license.

This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty
of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the License for details.

You should have received a copy of the License along with this program; if not, see the LICENSE file included with this source.

*/

#pragma once
#include <vector>
#include <string>
#include <string_view>
#include <cstdint>
#include "../../../global.h"

// Thread-local decode buffer
extern thread_local std::vector<uint8_t> decode_buffer;

// Function declarations
std::vector<uint8_t> base64_decode(std::string_view encoded_string);
std::vector<uint8_t> base64url_decode(std::string_view encoded_string);
