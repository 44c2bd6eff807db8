/**
 * @file PNGExporter.hpp
 * @brief PNG encoding of composited map canvases
 *
 * Encodes through the GDAL PNG driver. Output is written to an in-memory
 * /vsimem/ file and returned as bytes, so nothing touches the disk unless
 * write_file() is called.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include <gdal_priv.h>
#include <cstdint>
#include <string>
#include <vector>

namespace prefmap {

class PNGExporter {
public:
    PNGExporter() = default;

    /**
     * @brief Encode an RGBA dataset as PNG
     * @param source 4-band byte dataset
     * @param out Receives the PNG file contents
     * @return true if successful
     */
    bool encode(GDALDataset* source, std::vector<uint8_t>& out) const;

    /**
     * @brief Write encoded bytes to a file ("-" writes to stdout)
     * @return true if successful
     */
    static bool write_file(const std::vector<uint8_t>& bytes, const std::string& filename);

private:
    std::string next_memory_path() const;
};

} // namespace prefmap
