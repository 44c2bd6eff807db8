/**
 * @file PNGExporter.cpp
 * @brief Implementation of PNG encoding via GDAL
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "PNGExporter.hpp"
#include "../core/Logger.hpp"
#include <cpl_conv.h>
#include <cpl_vsi.h>
#include <atomic>
#include <fstream>
#include <iostream>

namespace prefmap {

std::string PNGExporter::next_memory_path() const {
    static std::atomic<unsigned long> counter{0};
    return "/vsimem/prefmap_" + std::to_string(counter.fetch_add(1)) + ".png";
}

bool PNGExporter::encode(GDALDataset* source, std::vector<uint8_t>& out) const {
    Logger logger("PNGExporter");

    if (!source) {
        logger.error("Null source dataset");
        return false;
    }

    GDALDriver* png_driver = GetGDALDriverManager()->GetDriverByName("PNG");
    if (!png_driver) {
        logger.error("PNG driver not available");
        return false;
    }

    std::string memory_path = next_memory_path();

    // No .aux.xml sidecar for an image that carries no georeferencing
    CPLSetThreadLocalConfigOption("GDAL_PAM_ENABLED", "NO");

    GDALDataset* png_dataset = png_driver->CreateCopy(
        memory_path.c_str(),
        source,
        FALSE,      // Not strict
        nullptr,    // Options
        nullptr,    // Progress function
        nullptr     // Progress data
    );

    CPLSetThreadLocalConfigOption("GDAL_PAM_ENABLED", nullptr);

    if (!png_dataset) {
        logger.error("PNG encoding failed: " + std::string(CPLGetLastErrorMsg()));
        VSIUnlink(memory_path.c_str());
        return false;
    }
    GDALClose(png_dataset);

    vsi_l_offset length = 0;
    GByte* buffer = VSIGetMemFileBuffer(memory_path.c_str(), &length, TRUE);
    if (!buffer) {
        logger.error("PNG encoding produced no output");
        return false;
    }

    out.assign(buffer, buffer + length);
    CPLFree(buffer);

    logger.debug("Encoded " + std::to_string(source->GetRasterXSize()) + "x" +
                 std::to_string(source->GetRasterYSize()) + " PNG (" +
                 std::to_string(out.size()) + " bytes)");
    return true;
}

bool PNGExporter::write_file(const std::vector<uint8_t>& bytes, const std::string& filename) {
    Logger logger("PNGExporter");

    if (filename == "-") {
        std::cout.write(reinterpret_cast<const char*>(bytes.data()),
                        static_cast<std::streamsize>(bytes.size()));
        std::cout.flush();
        return static_cast<bool>(std::cout);
    }

    std::ofstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        logger.error("Failed to open file for writing: " + filename);
        return false;
    }

    file.write(reinterpret_cast<const char*>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
    if (!file) {
        logger.error("Failed to write " + filename);
        return false;
    }

    logger.info("Wrote " + filename + " (" + std::to_string(bytes.size()) + " bytes)");
    return true;
}

} // namespace prefmap
