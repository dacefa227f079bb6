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
#include <optional>
#include <string>
#include <cstdint>
#include "../global.h"

// Source of "now" in Unix epoch seconds
class Clock {
public:
    virtual ~Clock() = default;
    virtual uint64_t now_seconds() const = 0;
};

class SystemClock : public Clock {
public:
    uint64_t now_seconds() const override;
};

// Clock pinned to a fixed instant
class FixedClock : public Clock {
public:
    explicit FixedClock(uint64_t seconds) : seconds_(seconds) {}
    uint64_t now_seconds() const override { return seconds_; }
    void advance(uint64_t seconds) { seconds_ += seconds; }

private:
    uint64_t seconds_;
};

const Clock& system_clock();

// Function declarations
std::optional<uint64_t> days_from_now_to_jwt_time(std::optional<uint64_t> days, const Clock& clock = system_clock());
std::string stamp_to_human(std::optional<uint64_t> stamp, const Clock& clock = system_clock());
