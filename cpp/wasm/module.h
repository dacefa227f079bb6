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
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include "../global.h"

// Section ids from the WebAssembly binary format
enum class SectionId : uint8_t {
    Custom = 0,
    Type = 1,
    Import = 2,
    Function = 3,
    Table = 4,
    Memory = 5,
    Global = 6,
    Export = 7,
    Start = 8,
    Element = 9,
    Code = 10,
    Data = 11,
    DataCount = 12,
    Tag = 13
};

static constexpr uint8_t WASM_MAGIC[4] = {0x00, 0x61, 0x73, 0x6D};
static constexpr uint32_t WASM_VERSION = 1;

struct WasmSection {
    uint8_t id = 0;
    std::string name;             // custom sections only
    std::vector<uint8_t> payload; // custom: bytes after the name

    bool is_custom() const { return id == static_cast<uint8_t>(SectionId::Custom); }
    bool operator==(const WasmSection& other) const = default;
};

/**
 * In-memory WebAssembly module: the header plus its ordered sections.
 *
 * Non-custom sections are kept as opaque payloads; only their ids and
 * ordering are checked. Serialization writes sections in stored order with
 * minimal-width LEB128 sizes, so two modules with equal sections always
 * serialize to identical bytes.
 */
class WasmModule {
public:
    static WasmModule parse(std::span<const uint8_t> bytes);
    std::vector<uint8_t> serialize() const;

    std::optional<std::vector<uint8_t>> custom_section(std::string_view name) const;
    void set_custom_section(std::string_view name, std::vector<uint8_t> payload);
    void clear_custom_section(std::string_view name);

    WasmModule with_custom_section(std::string_view name, std::vector<uint8_t> payload) const;
    WasmModule without_custom_section(std::string_view name) const;

    std::map<std::string, std::vector<uint8_t>> custom_sections() const;
    const std::vector<WasmSection>& sections() const { return sections_; }

    bool operator==(const WasmModule& other) const = default;

private:
    std::vector<WasmSection> sections_;
};

// LEB128 helpers
void write_varuint32(std::vector<uint8_t>& out, uint32_t value);
uint32_t read_varuint32(std::span<const uint8_t> data, size_t& pos);
size_t varuint32_size(uint32_t value);
