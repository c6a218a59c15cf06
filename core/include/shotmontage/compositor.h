/// \file compositor.h
/// \brief Per-image crop/mask/blit and the montage grid assembler.

#pragma once

#include "bitmap.h"
#include "color.h"
#include "geometry.h"
#include "region_resolver.h"
#include "surface.h"

#include <cstddef>
#include <vector>

namespace ShotMontage {

/// Grid geometry of a montage.
struct MontageLayout {
    int tile_width  = 0;
    int tile_height = 0;
    int cols        = 0;
    int rows        = 0;
    int offset      = 0;
    int width       = 0; ///< tile_width * cols + offset * (cols + 1)
    int height      = 0; ///< tile_height * rows + offset * (rows + 1)

    /// Top-left pixel of tile \p index (row-major).
    cv::Point TileOrigin(size_t index) const;
};

/// Computes the layout for \p image_count tiles of the crop size. Throws
/// InputError for empty input, cols < 1, offset < 0, an empty crop, or a
/// montage side that does not fit in an int.
MontageLayout ComputeMontageLayout(const Rect& crop, int cols, int offset, size_t image_count);

/// Draws one bitmap as a tile on \p scratch: resize to the crop size, fill with
/// \p background, copy the crop region (clipped to the bitmap), close the
/// bitmap, then paint the enabled masks translated into tile coordinates.
void CompositeTile(Bitmap& bitmap, const ResolvedGeometry& geometry, const Color& background,
                   Surface& scratch);

/// Builds a montage one tile at a time. Construction sizes and fills the
/// montage surface; each Step() decodes, composites and blits the next image.
class MontageAssembler {
public:
    MontageAssembler(const std::vector<ImageSource>& sources, const ResolvedGeometry& geometry,
                     int cols, int offset, const Color& background, Surface& scratch,
                     Surface& montage);

    /// Decodes, composites and blits the next tile. Returns false, doing
    /// nothing, once every tile is done.
    bool Step();

    size_t completed() const { return next_; }
    size_t total() const { return sources_.size(); }
    bool done() const { return next_ >= sources_.size(); }

    const MontageLayout& layout() const { return layout_; }

private:
    const std::vector<ImageSource>& sources_;
    ResolvedGeometry geometry_;
    Color background_;
    MontageLayout layout_;
    Surface& scratch_;
    Surface& montage_;
    size_t next_ = 0;
};

} // namespace ShotMontage
