#pragma once
#include <filesystem>
#include <vector>

namespace MangaHarvest {

class IDocumentAssembler {
public:
    virtual ~IDocumentAssembler() = default;
    // Writes one document holding the images in the given order.
    // Throws AssemblyError if an input is unreadable or the output cannot be written.
    virtual void Assemble(const std::vector<std::filesystem::path>& images, const std::filesystem::path& output) = 0;
};

}
