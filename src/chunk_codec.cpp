/**
 * @file chunk_codec.cpp
 * @brief Chunk serialisation to and from a byte buffer
 */

#include "chunk_codec.h"
#include "terrain_errors.h"
#include <cstring>
#include <limits>
#include <string>

namespace {

class ByteWriter {
public:
    explicit ByteWriter(std::vector<uint8_t>& out) : m_out(out) {}

    template<typename T>
    void write(T value) {
        size_t offset = m_out.size();
        m_out.resize(offset + sizeof(T));
        std::memcpy(m_out.data() + offset, &value, sizeof(T));
    }

    void writeWords(const std::vector<uint64_t>& words) {
        size_t offset = m_out.size();
        size_t byteCount = words.size() * sizeof(uint64_t);
        m_out.resize(offset + byteCount);
        if (byteCount > 0) {
            std::memcpy(m_out.data() + offset, words.data(), byteCount);
        }
    }

private:
    std::vector<uint8_t>& m_out;
};

class ByteReader {
public:
    explicit ByteReader(const std::vector<uint8_t>& in) : m_in(in) {}

    template<typename T>
    T read(const char* what) {
        require(sizeof(T), what);
        T value;
        std::memcpy(&value, m_in.data() + m_offset, sizeof(T));
        m_offset += sizeof(T);
        return value;
    }

    std::vector<uint64_t> readWords(size_t count, const char* what) {
        if (count > remaining() / sizeof(uint64_t)) {
            throw ChunkDecodeError(std::string("truncated ") + what);
        }
        std::vector<uint64_t> words(count);
        if (count > 0) {
            std::memcpy(words.data(), m_in.data() + m_offset, count * sizeof(uint64_t));
        }
        m_offset += count * sizeof(uint64_t);
        return words;
    }

    /// Presence tag: exactly 0 or 1
    bool readFlag(const char* what) {
        uint8_t tag = read<uint8_t>(what);
        if (tag > 1) {
            throw ChunkDecodeError(std::string("invalid ") + what + " tag " + std::to_string(tag));
        }
        return tag == 1;
    }

    size_t remaining() const { return m_in.size() - m_offset; }

private:
    void require(size_t count, const char* what) const {
        if (remaining() < count) {
            throw ChunkDecodeError(std::string("truncated ") + what);
        }
    }

    const std::vector<uint8_t>& m_in;
    size_t m_offset = 0;
};

std::string formatChunk(int32_t x, int32_t y) {
    return "(" + std::to_string(x) + ", " + std::to_string(y) + ")";
}

} // namespace

std::vector<uint8_t> encodeChunk(const Chunk& chunk) {
    const ChunkDimensions& dims = chunk.dimensions();
    std::vector<uint8_t> bytes;
    bytes.reserve(ChunkFormat::HEADER_SIZE + static_cast<size_t>(dims.numSubchunks));
    ByteWriter writer(bytes);

    // Header
    writer.write<uint32_t>(ChunkFormat::MAGIC);
    writer.write<uint32_t>(ChunkFormat::VERSION);
    writer.write<int32_t>(chunk.position().x);
    writer.write<int32_t>(chunk.position().y);
    writer.write<uint32_t>(static_cast<uint32_t>(dims.width));
    writer.write<uint32_t>(static_cast<uint32_t>(dims.height));
    writer.write<uint32_t>(static_cast<uint32_t>(dims.subchunkDepth));
    writer.write<uint32_t>(static_cast<uint32_t>(dims.numSubchunks));

    // Subchunk slots
    for (int index = 0; index < dims.numSubchunks; index++) {
        const Subchunk* slab = chunk.subchunk(index);
        if (!slab) {
            writer.write<uint8_t>(0);
            continue;
        }
        writer.write<uint8_t>(1);

        for (size_t f = 0; f < FIELD_COUNT; f++) {
            Field field = static_cast<Field>(f);
            const Section* section = slab->section(field);
            if (!section) {
                writer.write<uint8_t>(0);
                continue;
            }

            if (section->bits() != fieldDescriptor(field).bits) {
                throw ChunkEncodeError(std::string("section for field '") + fieldDescriptor(field).name +
                                       "' has width " + std::to_string(section->bits()));
            }
            const std::vector<uint64_t>& words = section->words();
            if (words.size() > std::numeric_limits<uint32_t>::max()) {
                throw ChunkEncodeError("section word count exceeds u32");
            }

            writer.write<uint8_t>(1);
            writer.write<uint8_t>(static_cast<uint8_t>(section->bits()));
            writer.write<uint32_t>(static_cast<uint32_t>(words.size()));
            writer.writeWords(words);
        }
    }

    return bytes;
}

std::unique_ptr<Chunk> decodeChunk(const std::vector<uint8_t>& bytes,
                                   const ChunkPosition& expectedPosition,
                                   const ChunkDimensions& dims) {
    ByteReader reader(bytes);

    // Header
    uint32_t magic = reader.read<uint32_t>("header");
    if (magic != ChunkFormat::MAGIC) {
        throw ChunkDecodeError("bad magic number");
    }
    uint32_t version = reader.read<uint32_t>("header");
    if (version != ChunkFormat::VERSION) {
        throw ChunkDecodeError("unsupported version " + std::to_string(version));
    }

    int32_t x = reader.read<int32_t>("header");
    int32_t y = reader.read<int32_t>("header");
    if (x != expectedPosition.x || y != expectedPosition.y) {
        throw ChunkDecodeError("stream holds chunk " + formatChunk(x, y) + ", expected " +
                               formatChunk(expectedPosition.x, expectedPosition.y));
    }

    uint32_t width = reader.read<uint32_t>("header");
    uint32_t height = reader.read<uint32_t>("header");
    uint32_t subchunkDepth = reader.read<uint32_t>("header");
    uint32_t numSubchunks = reader.read<uint32_t>("header");
    if (width != static_cast<uint32_t>(dims.width) || height != static_cast<uint32_t>(dims.height) ||
        subchunkDepth != static_cast<uint32_t>(dims.subchunkDepth) ||
        numSubchunks != static_cast<uint32_t>(dims.numSubchunks)) {
        throw ChunkDecodeError("chunk dimensions do not match the world");
    }

    // Build into a detached chunk so a failure never leaks partial state
    auto chunk = std::make_unique<Chunk>(expectedPosition, dims);
    const glm::ivec3 extent = dims.subchunkExtent();
    const size_t expectedEntries = dims.subchunkVolume();

    for (int index = 0; index < dims.numSubchunks; index++) {
        if (!reader.readFlag("subchunk presence")) {
            continue;
        }

        auto slab = std::make_unique<Subchunk>(extent);
        for (size_t f = 0; f < FIELD_COUNT; f++) {
            Field field = static_cast<Field>(f);
            const FieldDescriptor& descriptor = fieldDescriptor(field);
            if (!reader.readFlag("section presence")) {
                continue;
            }

            uint8_t bits = reader.read<uint8_t>("section header");
            if (bits != descriptor.bits) {
                throw ChunkDecodeError(std::string("field '") + descriptor.name + "' stored with " +
                                       std::to_string(bits) + " bits, expected " +
                                       std::to_string(descriptor.bits));
            }
            uint32_t wordCount = reader.read<uint32_t>("section header");
            if (wordCount != Section::wordCountFor(descriptor.bits, expectedEntries)) {
                throw ChunkDecodeError(std::string("field '") + descriptor.name + "' has " +
                                       std::to_string(wordCount) + " words");
            }

            std::vector<uint64_t> words = reader.readWords(wordCount, "section data");
            std::unique_ptr<Section> section = Section::fromWords(descriptor.bits, extent, std::move(words));
            if (!section) {
                throw ChunkDecodeError(std::string("field '") + descriptor.name + "' has stray padding bits");
            }
            if (section->isEmpty()) {
                throw ChunkDecodeError(std::string("empty section stored for field '") + descriptor.name + "'");
            }
            slab->adoptSection(field, std::move(section));
        }

        if (slab->isEmpty()) {
            throw ChunkDecodeError("empty subchunk stored at slot " + std::to_string(index));
        }
        chunk->adoptSubchunk(index, std::move(slab));
    }

    if (reader.remaining() != 0) {
        throw ChunkDecodeError(std::to_string(reader.remaining()) + " trailing bytes");
    }

    return chunk;
}
