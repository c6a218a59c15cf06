#include "shotmontage/compositor.h"
#include "shotmontage/error.h"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <limits>
#include <string>

namespace ShotMontage {

namespace {

constexpr int64_t kMaxMontageSide = std::numeric_limits<int>::max();

/// tile * count + offset * (count + 1), or InputError when it does not fit in an int.
int MontageSide(int tile, int64_t count, int offset, const char* axis) {
    const int64_t side =
        static_cast<int64_t>(tile) * count + static_cast<int64_t>(offset) * (count + 1);
    if (side > kMaxMontageSide) {
        throw InputError(std::string("Montage ") + axis + " is too large (" +
                         std::to_string(count) + " tile(s) of " + std::to_string(tile) +
                         " px, offset " + std::to_string(offset) + ")");
    }
    return static_cast<int>(side);
}

} // namespace

cv::Point MontageLayout::TileOrigin(size_t index) const {
    const int64_t col = static_cast<int64_t>(index % static_cast<size_t>(cols));
    const int64_t row = static_cast<int64_t>(index / static_cast<size_t>(cols));
    const int64_t x   = offset + col * (static_cast<int64_t>(tile_width) + offset);
    const int64_t y   = offset + row * (static_cast<int64_t>(tile_height) + offset);
    return cv::Point(static_cast<int>(x), static_cast<int>(y));
}

MontageLayout ComputeMontageLayout(const Rect& crop, int cols, int offset, size_t image_count) {
    if (image_count == 0) { throw InputError("Montage needs at least one image"); }
    if (cols < 1) { throw InputError("Columns must be a positive number."); }
    if (offset < 0) { throw InputError("Offset (px) cannot be negative."); }
    if (crop.Empty()) { throw InputError("Crop rectangle must have positive width and height"); }

    const size_t col_count = static_cast<size_t>(cols);
    const size_t row_count = (image_count + col_count - 1) / col_count;
    if (row_count > static_cast<size_t>(kMaxMontageSide)) {
        throw InputError("Montage height is too large (" + std::to_string(row_count) + " rows)");
    }
    const int rows = static_cast<int>(row_count);

    MontageLayout layout;
    layout.tile_width  = crop.width;
    layout.tile_height = crop.height;
    layout.cols        = cols;
    layout.rows        = rows;
    layout.offset      = offset;
    layout.width       = MontageSide(layout.tile_width, layout.cols, offset, "width");
    layout.height      = MontageSide(layout.tile_height, layout.rows, offset, "height");
    return layout;
}

void CompositeTile(Bitmap& bitmap, const ResolvedGeometry& geometry, const Color& background,
                   Surface& scratch) {
    const Rect& crop = geometry.crop;
    scratch.Resize(crop.width, crop.height);
    scratch.Fill(background);
    scratch.DrawRegion(bitmap.pixels(), crop, 0, 0);
    bitmap.Close();

    for (MaskSlotId id : {MaskSlotId::Enemy, MaskSlotId::Self}) {
        const std::optional<MaskFill>& mask = geometry.Mask(id);
        if (!mask) { continue; }
        scratch.FillRect(mask->rect.Translated(-crop.x, -crop.y), mask->color);
    }
}

MontageAssembler::MontageAssembler(const std::vector<ImageSource>& sources,
                                   const ResolvedGeometry& geometry, int cols, int offset,
                                   const Color& background, Surface& scratch, Surface& montage)
    : sources_(sources), geometry_(geometry), background_(background),
      layout_(ComputeMontageLayout(geometry.crop, cols, offset, sources.size())),
      scratch_(scratch), montage_(montage) {
    montage_.Resize(layout_.width, layout_.height);
    montage_.Fill(background_);
    spdlog::info("Montage: {}x{} ({} tile(s), {} col(s) x {} row(s), tile {}x{}, offset {})",
                 layout_.width, layout_.height, sources_.size(), layout_.cols, layout_.rows,
                 layout_.tile_width, layout_.tile_height, layout_.offset);
}

bool MontageAssembler::Step() {
    if (done()) { return false; }

    const size_t index = next_;
    {
        Bitmap bitmap = DecodeBitmap(sources_[index]);
        CompositeTile(bitmap, geometry_, background_, scratch_);
    }

    const cv::Point origin = layout_.TileOrigin(index);
    montage_.Blit(scratch_, origin.x, origin.y);
    spdlog::debug("Montage: tile {}/{} ({}) at ({},{})", index + 1, sources_.size(),
                  sources_[index].Label(), origin.x, origin.y);

    ++next_;
    return true;
}

} // namespace ShotMontage
