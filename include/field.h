/**
 * @file field.h
 * @brief Per-voxel fields, their bit widths and defaults
 *
 * Every voxel carries the same closed set of fields. Each field is stored in
 * its own bit-packed Section, so the bit width here is the whole storage cost
 * of the field per voxel once its Section is allocated.
 */

#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @brief Field identifiers, also the slot order inside a Subchunk and a chunk file
 */
enum class Field : uint8_t {
    Block = 0,
    SkyLight,
    BlockLight,
    Exposed
};

constexpr std::size_t FIELD_COUNT = 4;

/**
 * @brief Static description of one field
 */
struct FieldDescriptor {
    const char* name;      ///< Name used in logs and error messages
    int bits;              ///< Packed width, 1-8
    uint64_t defaultBits;  ///< Encoded default value
};

namespace FieldTable {
    inline constexpr FieldDescriptor DESCRIPTORS[FIELD_COUNT] = {
        { "block",       6, 0 },
        { "sky_light",   4, 0 },
        { "block_light", 4, 0 },
        { "exposed",     1, 0 }
    };
}

inline std::size_t fieldIndex(Field field) {
    return static_cast<std::size_t>(field);
}

inline const FieldDescriptor& fieldDescriptor(Field field) {
    return FieldTable::DESCRIPTORS[fieldIndex(field)];
}

/// Largest encoded value the field can store
inline uint64_t fieldMaxValue(Field field) {
    return (uint64_t(1) << fieldDescriptor(field).bits) - 1;
}

// ========== Typed field tags ==========
// A tag carries the natural value type of a field and the value <-> bits codec,
// so World/Chunk/Subchunk implement one generic path for every field.

template<Field F>
struct SmallIntField {
    using value_type = uint8_t;
    static constexpr Field id = F;

    static uint64_t toBits(value_type value) { return value; }
    static value_type fromBits(uint64_t bits) { return static_cast<value_type>(bits); }
};

struct BlockField : SmallIntField<Field::Block> {};
struct SkyLightField : SmallIntField<Field::SkyLight> {};
struct BlockLightField : SmallIntField<Field::BlockLight> {};

struct ExposedField {
    using value_type = bool;
    static constexpr Field id = Field::Exposed;

    static uint64_t toBits(value_type value) { return value ? 1 : 0; }
    static value_type fromBits(uint64_t bits) { return bits != 0; }
};
