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

#include "module.h"

#include <algorithm>
#include <cstring>
#include <limits>

// Position of each known section id in the mandated module order
static int section_rank(uint8_t id) {
    switch (static_cast<SectionId>(id)) {
        case SectionId::Type: return 1;
        case SectionId::Import: return 2;
        case SectionId::Function: return 3;
        case SectionId::Table: return 4;
        case SectionId::Memory: return 5;
        case SectionId::Tag: return 6;
        case SectionId::Global: return 7;
        case SectionId::Export: return 8;
        case SectionId::Start: return 9;
        case SectionId::Element: return 10;
        case SectionId::DataCount: return 11;
        case SectionId::Code: return 12;
        case SectionId::Data: return 13;
        case SectionId::Custom: return 0;
    }
    return -1;
}

[[noreturn]] static void parse_fail(const std::string& what, size_t offset) {
    DEBUG_LOG("ERROR: wasm parse failed at offset " + std::to_string(offset) + ": " + what);
    throw WascapException(ErrorKind::ParseError, what + " at offset " + std::to_string(offset));
}

void write_varuint32(std::vector<uint8_t>& out, uint32_t value) {
    do {
        uint8_t byte = value & 0x7F;
        value >>= 7;
        if (value != 0) {
            byte |= 0x80;
        }
        out.push_back(byte);
    } while (value != 0);
}

size_t varuint32_size(uint32_t value) {
    size_t n = 1;
    while (value >>= 7) {
        n++;
    }
    return n;
}

/**
 * Reads an unsigned LEB128 value of at most 5 bytes; padded encodings are
 * accepted as long as the value fits in 32 bits
 * @param data Buffer to read from
 * @param pos Read offset, advanced past the value
 * @throws WascapException(ParseError) on truncation or overflow
 */
uint32_t read_varuint32(std::span<const uint8_t> data, size_t& pos) {
    uint32_t result = 0;
    for (int i = 0; i < 5; i++) {
        if (pos >= data.size()) {
            parse_fail("truncated LEB128 integer", pos);
        }
        uint8_t byte = data[pos++];
        if (i == 4 && (byte & 0xF0) != 0) {
            parse_fail("LEB128 integer exceeds 32 bits", pos - 1);
        }
        result |= static_cast<uint32_t>(byte & 0x7F) << (7 * i);
        if ((byte & 0x80) == 0) {
            return result;
        }
    }
    parse_fail("LEB128 integer too long", pos);
}

/**
 * Parses a WebAssembly binary into its sections
 *
 * Validates the header, every section header, section ordering and the
 * UTF-8 names of custom sections. Section bodies other than custom names
 * are not decoded.
 *
 * @param bytes Raw module bytes
 * @return Parsed module
 * @throws WascapException(ParseError) on any structural problem
 */
WasmModule WasmModule::parse(std::span<const uint8_t> bytes) {
    if (bytes.size() > MAX_MODULE_SIZE) {
        parse_fail("module exceeds maximum size", 0);
    }
    if (bytes.size() < 8) {
        parse_fail("module shorter than header", bytes.size());
    }
    if (std::memcmp(bytes.data(), WASM_MAGIC, sizeof(WASM_MAGIC)) != 0) {
        parse_fail("bad magic number", 0);
    }
    uint32_t version = static_cast<uint32_t>(bytes[4]) | (static_cast<uint32_t>(bytes[5]) << 8) |
                       (static_cast<uint32_t>(bytes[6]) << 16) | (static_cast<uint32_t>(bytes[7]) << 24);
    if (version != WASM_VERSION) {
        parse_fail("unsupported version " + std::to_string(version), 4);
    }

    WasmModule module;
    size_t pos = 8;
    int last_rank = 0;

    while (pos < bytes.size()) {
        size_t header_offset = pos;
        uint8_t id = bytes[pos++];
        int rank = section_rank(id);
        if (rank < 0) {
            parse_fail("unknown section id " + std::to_string(id), header_offset);
        }

        uint32_t size = read_varuint32(bytes, pos);
        if (size > bytes.size() - pos) {
            parse_fail("section size exceeds remaining bytes", header_offset);
        }
        std::span<const uint8_t> body = bytes.subspan(pos, size);
        pos += size;

        WasmSection section;
        section.id = id;

        if (rank == 0) {
            size_t name_pos = 0;
            uint32_t name_len = read_varuint32(body, name_pos);
            if (name_len > body.size() - name_pos) {
                parse_fail("custom section name exceeds section size", header_offset);
            }
            section.name.assign(reinterpret_cast<const char*>(body.data() + name_pos), name_len);
            if (!is_valid_utf8(section.name)) {
                parse_fail("custom section name is not valid UTF-8", header_offset);
            }
            name_pos += name_len;
            section.payload.assign(body.begin() + name_pos, body.end());
        } else {
            if (rank <= last_rank) {
                parse_fail("section id " + std::to_string(id) + " out of order or duplicated", header_offset);
            }
            last_rank = rank;
            section.payload.assign(body.begin(), body.end());
        }

        module.sections_.push_back(std::move(section));
    }

    DEBUG_LOG("Parsed wasm module: " + std::to_string(module.sections_.size()) + " sections, " +
              std::to_string(bytes.size()) + " bytes");
    return module;
}

/**
 * Serializes the module: header, then each section as id, size, body
 * @return Module bytes
 * @throws WascapException(SerializationError) if a section is too large to encode
 */
std::vector<uint8_t> WasmModule::serialize() const {
    std::vector<uint8_t> out(std::begin(WASM_MAGIC), std::end(WASM_MAGIC));
    out.push_back(static_cast<uint8_t>(WASM_VERSION & 0xFF));
    out.push_back(static_cast<uint8_t>((WASM_VERSION >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>((WASM_VERSION >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((WASM_VERSION >> 24) & 0xFF));

    constexpr uint64_t max_u32 = std::numeric_limits<uint32_t>::max();

    for (const auto& section : sections_) {
        uint64_t body_size = section.payload.size();
        if (section.is_custom()) {
            if (section.name.size() > max_u32) {
                throw WascapException(ErrorKind::SerializationError, "custom section name too long");
            }
            body_size += varuint32_size(static_cast<uint32_t>(section.name.size())) + section.name.size();
        }
        if (body_size > max_u32) {
            throw WascapException(ErrorKind::SerializationError,
                                  "section " + std::to_string(section.id) + " exceeds 4 GiB");
        }

        out.push_back(section.id);
        write_varuint32(out, static_cast<uint32_t>(body_size));
        if (section.is_custom()) {
            write_varuint32(out, static_cast<uint32_t>(section.name.size()));
            out.insert(out.end(), section.name.begin(), section.name.end());
        }
        out.insert(out.end(), section.payload.begin(), section.payload.end());
    }

    return out;
}

std::optional<std::vector<uint8_t>> WasmModule::custom_section(std::string_view name) const {
    for (const auto& section : sections_) {
        if (section.is_custom() && section.name == name) {
            return section.payload;
        }
    }
    return std::nullopt;
}

// Replaces every custom section of this name with one appended at the end
void WasmModule::set_custom_section(std::string_view name, std::vector<uint8_t> payload) {
    clear_custom_section(name);
    WasmSection section;
    section.id = static_cast<uint8_t>(SectionId::Custom);
    section.name = std::string(name);
    section.payload = std::move(payload);
    sections_.push_back(std::move(section));
}

void WasmModule::clear_custom_section(std::string_view name) {
    std::erase_if(sections_, [&](const WasmSection& s) {
        return s.is_custom() && s.name == name;
    });
}

WasmModule WasmModule::with_custom_section(std::string_view name, std::vector<uint8_t> payload) const {
    WasmModule copy = *this;
    copy.set_custom_section(name, std::move(payload));
    return copy;
}

WasmModule WasmModule::without_custom_section(std::string_view name) const {
    WasmModule copy = *this;
    copy.clear_custom_section(name);
    return copy;
}

// Name -> payload view; the first section of a repeated name wins
std::map<std::string, std::vector<uint8_t>> WasmModule::custom_sections() const {
    std::map<std::string, std::vector<uint8_t>> result;
    for (const auto& section : sections_) {
        if (section.is_custom()) {
            result.emplace(section.name, section.payload);
        }
    }
    return result;
}
