#include "io/image_loader.hpp"

#include "io/file_manager.hpp"
#include "util/errors.hpp"

#include <dcmtk/config/osconfig.h>   // MUST be first with DCMTK on some platforms
#include <dcmtk/dcmdata/dctk.h>
#include <dcmtk/dcmdata/dcdeftag.h>
#include <dcmtk/dcmdata/dcxfer.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <istream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace satish {
namespace {

void skip_ws_and_comments(std::istream& is) {
    while (true) {
        int c = is.peek();
        if (c == '#') {
            std::string dummy;
            std::getline(is, dummy);
            continue;
        }
        if (c == EOF) return;
        if (std::isspace(static_cast<unsigned char>(c))) {
            is.get();
            continue;
        }
        return;
    }
}

std::string lower(std::string s) {
    for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return s;
}

void require(bool ok, const std::string& msg) {
    if (!ok) throw SatishError(msg);
}

// Linear map of [0, maxv] onto [0, 255], rounded.
uint8_t scale_to_u8(uint32_t v, uint32_t maxv) {
    if (maxv == 255) return static_cast<uint8_t>(v);
    if (v > maxv) v = maxv;
    return static_cast<uint8_t>((v * 255u + maxv / 2u) / maxv);
}

bool looks_like_pnm(const std::vector<uint8_t>& bytes) {
    return bytes.size() >= 2 && bytes[0] == 'P' && (bytes[1] == '5' || bytes[1] == '6');
}

OFCondition load_dataset(DcmFileFormat& file, const std::filesystem::path& path) {
    return file.loadFile(
        path.c_str(),
        EXS_Unknown,       // don't force transfer syntax
        EGL_noChange,      // keep group length encoding
        DCM_MaxReadLength  // read full value fields (incl. PixelData)
    );
}

SatishError dcmtk_error(const std::string& where, const OFCondition& cond) {
    return SatishError(where + ": " + cond.text());
}

// Grey samples (possibly signed, any stored depth) to 8 bit by min/max stretch.
void stretch_grey(const std::vector<int32_t>& grey, bool invert, RgbImage& im) {
    const auto [lo_it, hi_it] = std::minmax_element(grey.begin(), grey.end());
    const int64_t lo = *lo_it;
    const int64_t range = std::max<int64_t>(1, static_cast<int64_t>(*hi_it) - lo);
    im.pixels.resize(grey.size() * RgbImage::kChannels);
    for (size_t i = 0; i < grey.size(); ++i) {
        int64_t v = ((static_cast<int64_t>(grey[i]) - lo) * 255 + range / 2) / range;
        if (invert) v = 255 - v;
        const uint8_t g = static_cast<uint8_t>(v);
        im.pixels[3 * i + 0] = g;
        im.pixels[3 * i + 1] = g;
        im.pixels[3 * i + 2] = g;
    }
}

RgbImage load_dicom(const std::filesystem::path& path) {
    const std::string where = "load_dicom (" + path.string() + ")";
    DcmFileFormat file;
    OFCondition st = load_dataset(file, path);
    if (st.bad()) throw dcmtk_error(where + ": loadFile failed", st);

    DcmDataset* ds = file.getDataset();
    require(ds != nullptr, where + ": dataset is null");

    const DcmXfer xfer(ds->getOriginalXfer());
    require(!xfer.isEncapsulated(),
            where + ": compressed/encapsulated transfer syntax " + std::string(xfer.getXferName()) +
            " is not supported");

    Uint16 rows = 0, cols = 0, bitsAllocated = 0, pixelRep = 0, spp = 1;
    st = ds->findAndGetUint16(DCM_Rows, rows);
    if (st.bad()) throw dcmtk_error(where + ": missing/invalid Rows", st);
    st = ds->findAndGetUint16(DCM_Columns, cols);
    if (st.bad()) throw dcmtk_error(where + ": missing/invalid Columns", st);
    st = ds->findAndGetUint16(DCM_BitsAllocated, bitsAllocated);
    if (st.bad()) throw dcmtk_error(where + ": missing/invalid BitsAllocated", st);
    if (ds->findAndGetUint16(DCM_PixelRepresentation, pixelRep).bad()) pixelRep = 0;
    if (ds->findAndGetUint16(DCM_SamplesPerPixel, spp).bad()) spp = 1;

    Sint32 nFrames = 1;
    if (ds->findAndGetSint32(DCM_NumberOfFrames, nFrames).bad()) nFrames = 1;
    require(nFrames == 1, where + ": only single-frame DICOM is supported");

    OFString photo;
    if (ds->findAndGetOFString(DCM_PhotometricInterpretation, photo).bad()) {
        photo = (spp == 3) ? "RGB" : "MONOCHROME2";
    }

    RgbImage im;
    im.width = static_cast<int>(cols);
    im.height = static_cast<int>(rows);
    require(im.width > 0 && im.height > 0, where + ": empty image");
    const size_t N = im.pixel_count();

    if (spp == 3) {
        require(photo == "RGB", where + ": unsupported PhotometricInterpretation " + std::string(photo.c_str()));
        require(bitsAllocated == 8, where + ": RGB DICOM must have BitsAllocated=8");
        Uint16 planar = 0;
        if (ds->findAndGetUint16(DCM_PlanarConfiguration, planar).bad()) planar = 0;

        const Uint8* u8 = nullptr;
        unsigned long count = 0;
        st = ds->findAndGetUint8Array(DCM_PixelData, u8, &count);
        if (st.bad() || !u8) throw dcmtk_error(where + ": failed to read Uint8 PixelData", st);
        check_pixel_data_length(count, N, RgbImage::kChannels, where);

        im.pixels.resize(N * RgbImage::kChannels);
        if (planar == 0) {
            std::copy(u8, u8 + N * RgbImage::kChannels, im.pixels.begin());
        } else {
            // RRR...GGG...BBB...
            for (size_t i = 0; i < N; ++i) {
                im.pixels[3 * i + 0] = u8[i];
                im.pixels[3 * i + 1] = u8[N + i];
                im.pixels[3 * i + 2] = u8[2 * N + i];
            }
        }
        return im;
    }

    require(spp == 1, where + ": unsupported SamplesPerPixel=" + std::to_string(spp));
    require(photo == "MONOCHROME1" || photo == "MONOCHROME2",
            where + ": unsupported PhotometricInterpretation " + std::string(photo.c_str()));
    require(bitsAllocated == 8 || bitsAllocated == 16,
            where + ": only BitsAllocated=8 or 16 is supported");

    const bool is_signed = (pixelRep == 1);
    std::vector<int32_t> grey(N);
    if (bitsAllocated == 8) {
        const Uint8* u8 = nullptr;
        unsigned long count = 0;
        st = ds->findAndGetUint8Array(DCM_PixelData, u8, &count);
        if (st.bad() || !u8) throw dcmtk_error(where + ": failed to read Uint8 PixelData", st);
        check_pixel_data_length(count, N, 1, where);
        for (size_t i = 0; i < N; ++i) {
            grey[i] = is_signed ? static_cast<int32_t>(static_cast<int8_t>(u8[i])) : static_cast<int32_t>(u8[i]);
        }
    } else {
        // OW pixel data reads as Uint16 regardless of PixelRepresentation; keep the bit pattern.
        const Uint16* u16 = nullptr;
        unsigned long count = 0;
        st = ds->findAndGetUint16Array(DCM_PixelData, u16, &count);
        if (st.bad() || !u16) throw dcmtk_error(where + ": failed to read Uint16 PixelData", st);
        check_pixel_data_length(count, N, 1, where);
        for (size_t i = 0; i < N; ++i) {
            grey[i] = is_signed ? static_cast<int32_t>(static_cast<int16_t>(u16[i])) : static_cast<int32_t>(u16[i]);
        }
    }
    stretch_grey(grey, photo == "MONOCHROME1", im);
    return im;
}

} // namespace

void check_pixel_data_length(size_t available, size_t pixels, size_t samples_per_pixel,
                             const std::string& where) {
    require(samples_per_pixel != 0 && pixels <= SIZE_MAX / samples_per_pixel &&
                available >= pixels * samples_per_pixel,
            where + ": PixelData shorter than Rows*Columns*SamplesPerPixel (expected " +
                std::to_string(pixels * samples_per_pixel) + ", got " + std::to_string(available) + ")");
}

RgbImage decode_pnm(const std::vector<uint8_t>& bytes) {
    std::istringstream is(std::string(bytes.begin(), bytes.end()));

    std::string magic;
    is >> magic;
    require(magic == "P5" || magic == "P6", "decode_pnm: only binary PGM (P5) / PPM (P6) is supported");
    const int src_channels = (magic == "P6") ? 3 : 1;

    skip_ws_and_comments(is);
    int w = 0, h = 0;
    is >> w;
    skip_ws_and_comments(is);
    is >> h;
    require(is.good() && w > 0 && h > 0, "decode_pnm: invalid size");

    skip_ws_and_comments(is);
    int maxv = 0;
    is >> maxv;
    require(!is.fail() && maxv > 0 && maxv <= 65535, "decode_pnm: invalid maxval");

    // exactly one whitespace byte after maxval
    is.get();

    RgbImage im;
    im.width = w;
    im.height = h;
    const size_t samples = im.pixel_count() * static_cast<size_t>(src_channels);
    const size_t bytes_per_sample = (maxv <= 255) ? 1 : 2;
    const std::streamoff pos = is.tellg();
    require(pos > 0, "decode_pnm: payload too short");
    const size_t offset = static_cast<size_t>(pos);
    require(bytes.size() - std::min(bytes.size(), offset) >= samples * bytes_per_sample,
            "decode_pnm: payload too short");

    const uint8_t* data = bytes.data() + offset;
    im.pixels.resize(im.expected_bytes());
    for (size_t i = 0; i < im.pixel_count(); ++i) {
        for (int c = 0; c < RgbImage::kChannels; ++c) {
            const size_t s = i * static_cast<size_t>(src_channels) + static_cast<size_t>(src_channels == 3 ? c : 0);
            uint32_t v = 0;
            if (bytes_per_sample == 1) {
                v = data[s];
            } else {
                // 16-bit PNM is big-endian
                v = (static_cast<uint32_t>(data[2 * s]) << 8) | data[2 * s + 1];
            }
            im.pixels[i * RgbImage::kChannels + static_cast<size_t>(c)] = scale_to_u8(v, static_cast<uint32_t>(maxv));
        }
    }
    return im;
}

RgbImage load_source_image(const std::filesystem::path& path) {
    const std::string ext = lower(path.extension().string());
    if (ext == ".dcm" || ext == ".dicom") {
        if (!file_exists(path)) {
            throw FileOperationError("file does not exist: " + path.string(), path,
                                     std::make_error_code(std::errc::no_such_file_or_directory));
        }
        return load_dicom(path);
    }

    const std::vector<uint8_t> bytes = read_file_safely(path);
    if (ext == ".ppm" || ext == ".pgm" || ext == ".pnm" || looks_like_pnm(bytes)) {
        return decode_pnm(bytes);
    }

    // DICOM without extension is common
    try {
        return load_dicom(path);
    } catch (const SatishError& e) {
        throw SatishError(std::string("load failed (not a supported PNM/DICOM): ") + e.what());
    }
}

} // namespace satish
