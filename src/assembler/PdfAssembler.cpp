#include "PdfAssembler.hpp"
#include <hpdf.h>
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <memory>
#include <type_traits>
#include "../utils/Errors.hpp"
#include "../utils/Logger.hpp"

namespace MangaHarvest {

namespace {

// Largest page side libharu accepts, in points.
constexpr HPDF_REAL kMaxPageSide = 14400.0f;

struct HaruError {
    HPDF_STATUS error_no = HPDF_OK;
    HPDF_STATUS detail_no = 0;
};

void HPDF_STDCALL OnHaruError(HPDF_STATUS error_no, HPDF_STATUS detail_no, void* user_data) {
    auto* err = static_cast<HaruError*>(user_data);
    if (err->error_no == HPDF_OK) {
        err->error_no = error_no;
        err->detail_no = detail_no;
    }
}

std::string Describe(const HaruError& err) {
    char buf[48];
    std::snprintf(buf, sizeof(buf), "libharu error 0x%04lX (detail %lu)",
                  static_cast<unsigned long>(err.error_no), static_cast<unsigned long>(err.detail_no));
    return buf;
}

struct DocDeleter {
    void operator()(std::remove_pointer<HPDF_Doc>::type* doc) const { HPDF_Free(doc); }
};
using DocPtr = std::unique_ptr<std::remove_pointer<HPDF_Doc>::type, DocDeleter>;

enum class ImageKind { Jpeg, Png, Unknown };

ImageKind Sniff(const std::filesystem::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        throw AssemblyError("Cannot read image " + file.string());
    }
    unsigned char magic[8] = {0};
    in.read(reinterpret_cast<char*>(magic), sizeof(magic));
    if (in.gcount() >= 3 && magic[0] == 0xFF && magic[1] == 0xD8 && magic[2] == 0xFF) return ImageKind::Jpeg;
    static const unsigned char png_sig[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    if (in.gcount() == 8 && std::equal(magic, magic + 8, png_sig)) return ImageKind::Png;
    return ImageKind::Unknown;
}

} // anonymous namespace

void PdfAssembler::Assemble(const std::vector<std::filesystem::path>& images, const std::filesystem::path& output) {
    if (images.empty()) {
        throw AssemblyError("No images to assemble into " + output.string());
    }

    HaruError err;
    DocPtr pdf(HPDF_New(OnHaruError, &err));
    if (!pdf) {
        throw AssemblyError("Failed to create PDF document");
    }
    HPDF_SetCompressionMode(pdf.get(), HPDF_COMP_ALL);

    for (const auto& file : images) {
        ImageKind kind = Sniff(file);
        if (kind == ImageKind::Unknown) {
            throw AssemblyError("Unsupported image format (only JPEG and PNG): " + file.string());
        }

        const std::string path = file.string();
        HPDF_Image image = (kind == ImageKind::Jpeg) ? HPDF_LoadJpegImageFromFile(pdf.get(), path.c_str())
                                                     : HPDF_LoadPngImageFromFile(pdf.get(), path.c_str());
        if (!image || err.error_no != HPDF_OK) {
            throw AssemblyError("Cannot load image " + path + ": " + Describe(err));
        }

        HPDF_REAL width = static_cast<HPDF_REAL>(HPDF_Image_GetWidth(image));
        HPDF_REAL height = static_cast<HPDF_REAL>(HPDF_Image_GetHeight(image));
        // Long strips are scaled down to fit the page size limit.
        HPDF_REAL scale = std::min(1.0f, kMaxPageSide / std::max(width, height));
        width *= scale;
        height *= scale;

        HPDF_Page page = HPDF_AddPage(pdf.get());
        if (!page) {
            throw AssemblyError("Cannot add page for " + path + ": " + Describe(err));
        }
        HPDF_Page_SetWidth(page, width);
        HPDF_Page_SetHeight(page, height);
        HPDF_Page_DrawImage(page, image, 0, 0, width, height);
        if (err.error_no != HPDF_OK) {
            throw AssemblyError("Cannot place image " + path + ": " + Describe(err));
        }
    }

    if (HPDF_SaveToFile(pdf.get(), output.string().c_str()) != HPDF_OK || err.error_no != HPDF_OK) {
        std::error_code ec;
        std::filesystem::remove(output, ec);
        throw AssemblyError("Cannot write " + output.string() + ": " + Describe(err));
    }
    Logger::Log(LogLevel::Info, "Wrote " + output.string() + " (" + std::to_string(images.size()) + " pages)");
}

}
