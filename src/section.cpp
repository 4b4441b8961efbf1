/**
 * @file section.cpp
 * @brief Bit-packed section storage
 */

#include "section.h"
#include "terrain_errors.h"
#include <stdexcept>
#include <string>

Section::Section(int bits, const glm::ivec3& extent)
    : m_bits(bits), m_entriesPerWord(0), m_mask(0), m_extent(extent), m_entryCount(0) {
    if (bits < MIN_BITS || bits > MAX_BITS) {
        throw std::invalid_argument("section bit width must be in [1, 8], got " + std::to_string(bits));
    }
    if (extent.x < 1 || extent.y < 1 || extent.z < 1) {
        throw std::invalid_argument("section extent must be positive");
    }

    m_entriesPerWord = 64 / bits;
    m_mask = (uint64_t(1) << bits) - 1;
    m_entryCount = static_cast<std::size_t>(extent.x) * static_cast<std::size_t>(extent.y) *
                   static_cast<std::size_t>(extent.z);
    m_words.assign(wordCountFor(bits, m_entryCount), 0);
}

std::unique_ptr<Section> Section::fromWords(int bits, const glm::ivec3& extent,
                                            std::vector<uint64_t> words) {
    auto section = std::make_unique<Section>(bits, extent);
    if (words.size() != section->m_words.size()) {
        return nullptr;
    }

    // Re-pack entry by entry; any difference means stray padding bits
    for (std::size_t i = 0; i < section->m_entryCount; i++) {
        std::size_t word = i / static_cast<std::size_t>(section->m_entriesPerWord);
        int shift = static_cast<int>(i % static_cast<std::size_t>(section->m_entriesPerWord)) * bits;
        uint64_t value = (words[word] >> shift) & section->m_mask;
        if (value != 0) {
            section->writeEntry(i, value);
            section->m_nonZeroCount++;
        }
    }
    if (section->m_words != words) {
        return nullptr;
    }
    return section;
}

std::size_t Section::wordCountFor(int bits, std::size_t entries) {
    std::size_t perWord = static_cast<std::size_t>(64 / bits);
    return (entries + perWord - 1) / perWord;
}

uint64_t Section::item(const glm::ivec3& pos) const {
    if (!contains(pos)) {
        throw BoundsError(pos, "outside section");
    }
    return readEntry(entryIndex(pos));
}

void Section::setItem(const glm::ivec3& pos, uint64_t value) {
    if (!contains(pos)) {
        throw BoundsError(pos, "outside section");
    }
    if (value > m_mask) {
        throw FieldOverflowError("section", value, m_bits);
    }

    std::size_t index = entryIndex(pos);
    uint64_t previous = readEntry(index);
    if (previous == value) {
        return;
    }

    writeEntry(index, value);
    if (previous == 0) {
        m_nonZeroCount++;
    } else if (value == 0) {
        m_nonZeroCount--;
    }
}

std::size_t Section::entryIndex(const glm::ivec3& pos) const {
    return static_cast<std::size_t>(pos.x) +
           static_cast<std::size_t>(pos.y) * static_cast<std::size_t>(m_extent.x) +
           static_cast<std::size_t>(pos.z) * static_cast<std::size_t>(m_extent.x) *
               static_cast<std::size_t>(m_extent.y);
}

uint64_t Section::readEntry(std::size_t index) const {
    std::size_t word = index / static_cast<std::size_t>(m_entriesPerWord);
    int shift = static_cast<int>(index % static_cast<std::size_t>(m_entriesPerWord)) * m_bits;
    return (m_words[word] >> shift) & m_mask;
}

void Section::writeEntry(std::size_t index, uint64_t value) {
    std::size_t word = index / static_cast<std::size_t>(m_entriesPerWord);
    int shift = static_cast<int>(index % static_cast<std::size_t>(m_entriesPerWord)) * m_bits;
    m_words[word] = (m_words[word] & ~(m_mask << shift)) | (value << shift);
}
