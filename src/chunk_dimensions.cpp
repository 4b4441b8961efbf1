#include "chunk_dimensions.h"
#include "terrain_errors.h"
#include <string>

namespace {

void checkExtent(const char* name, int value) {
    if (value < 1 || value > ChunkDimensions::MAX_EXTENT) {
        throw ConfigError(std::string("chunk dimension '") + name + "' must be in [1, " +
                          std::to_string(ChunkDimensions::MAX_EXTENT) + "], got " +
                          std::to_string(value));
    }
}

} // namespace

void ChunkDimensions::validate() const {
    checkExtent("width", width);
    checkExtent("height", height);
    checkExtent("subchunk_depth", subchunkDepth);
    checkExtent("num_subchunks", numSubchunks);
}
