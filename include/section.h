/**
 * @file section.h
 * @brief Fixed-width bit-packed storage for one field over one subchunk
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>
#include <glm/glm.hpp>

/**
 * @brief Dense packed array of small unsigned values over a 3D box
 *
 * Storage layout:
 * - Entries are packed least-significant-first into 64-bit words
 * - 64 / bits entries per word; an entry never straddles two words
 * - Entry index = x + y * width + z * width * height
 *
 * A count of non-zero entries is maintained on every write, so isEmpty()
 * is O(1). Subchunk uses it to drop Sections that returned to all-zero.
 */
class Section {
public:
    static constexpr int MIN_BITS = 1;
    static constexpr int MAX_BITS = 8;

    /**
     * @brief Creates an all-zero section
     * @param bits Entry width in [1, 8]
     * @param extent Box size, every component >= 1
     * @throws std::invalid_argument for a bad width or extent
     */
    Section(int bits, const glm::ivec3& extent);

    /**
     * @brief Rebuilds a section from its packed words
     *
     * @return nullptr if the word count is wrong for (bits, extent) or any
     *         padding bit outside an entry is set
     */
    static std::unique_ptr<Section> fromWords(int bits, const glm::ivec3& extent,
                                              std::vector<uint64_t> words);

    /// Number of 64-bit words needed for the given width and entry count
    static std::size_t wordCountFor(int bits, std::size_t entries);

    /**
     * @throws BoundsError if pos lies outside the extent
     */
    uint64_t item(const glm::ivec3& pos) const;

    /**
     * @throws BoundsError if pos lies outside the extent
     * @throws FieldOverflowError if value needs more than bits() bits
     */
    void setItem(const glm::ivec3& pos, uint64_t value);

    bool isEmpty() const { return m_nonZeroCount == 0; }
    std::size_t nonZeroCount() const { return m_nonZeroCount; }

    int bits() const { return m_bits; }
    const glm::ivec3& extent() const { return m_extent; }
    std::size_t entryCount() const { return m_entryCount; }
    const std::vector<uint64_t>& words() const { return m_words; }

    bool contains(const glm::ivec3& pos) const {
        return pos.x >= 0 && pos.x < m_extent.x &&
               pos.y >= 0 && pos.y < m_extent.y &&
               pos.z >= 0 && pos.z < m_extent.z;
    }

private:
    std::size_t entryIndex(const glm::ivec3& pos) const;
    uint64_t readEntry(std::size_t index) const;
    void writeEntry(std::size_t index, uint64_t value);

    int m_bits;
    int m_entriesPerWord;
    uint64_t m_mask;
    glm::ivec3 m_extent;
    std::size_t m_entryCount;
    std::size_t m_nonZeroCount = 0;
    std::vector<uint64_t> m_words;
};
