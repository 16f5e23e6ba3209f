#pragma once
#include <filesystem>
#include <vector>
#include "../interfaces/IDocumentAssembler.hpp"

namespace MangaHarvest {

// Builds a PDF with libharu: one page per image, sized to the image.
// Accepts JPEG and PNG files. A failed save leaves no output file behind.
class PdfAssembler : public IDocumentAssembler {
public:
    void Assemble(const std::vector<std::filesystem::path>& images, const std::filesystem::path& output) override;
};

}
