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

#include "clock.h"

#include <chrono>

uint64_t SystemClock::now_seconds() const {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count();
    if (secs < 0) {
        throw std::runtime_error("System clock is set before the Unix epoch");
    }
    return static_cast<uint64_t>(secs);
}

const Clock& system_clock() {
    static const SystemClock instance;
    return instance;
}

/**
 * Converts a day offset into an absolute JWT timestamp
 * @param days Days from now, or nullopt
 * @param clock Source of the current time
 * @return now + days * 86400, or nullopt when no offset was given
 * @throws std::overflow_error if the result does not fit in 64 bits
 */
std::optional<uint64_t> days_from_now_to_jwt_time(std::optional<uint64_t> days, const Clock& clock) {
    if (!days) {
        return std::nullopt;
    }
    uint64_t now = clock.now_seconds();
    if (*days > (UINT64_MAX - now) / SECS_PER_DAY) {
        throw std::overflow_error("Day offset " + std::to_string(*days) + " overflows a JWT timestamp");
    }
    return now + *days * SECS_PER_DAY;
}

static std::string humanize_span(uint64_t secs) {
    auto plural = [](uint64_t n, const char* unit) {
        return std::to_string(n) + " " + unit + (n == 1 ? "" : "s");
    };
    if (secs < 60) return plural(secs, "second");
    if (secs < 3600) return plural(secs / 60, "minute");
    if (secs < SECS_PER_DAY) return plural(secs / 3600, "hour");
    return plural(secs / SECS_PER_DAY, "day");
}

/**
 * Renders a JWT timestamp relative to now, e.g. "in 3 days" or "2 hours ago"
 * @param stamp Epoch seconds, or nullopt
 * @return "never" when unset
 */
std::string stamp_to_human(std::optional<uint64_t> stamp, const Clock& clock) {
    if (!stamp) {
        return "never";
    }
    uint64_t now = clock.now_seconds();
    if (*stamp == now) {
        return "now";
    }
    if (*stamp > now) {
        return "in " + humanize_span(*stamp - now);
    }
    return humanize_span(now - *stamp) + " ago";
}
