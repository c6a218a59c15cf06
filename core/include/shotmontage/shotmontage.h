#pragma once

/// \file shotmontage.h
/// \brief Umbrella header — includes every public header in ShotMontage.

#include "export.h"
#include "error.h"
#include "common.h"
#include "geometry.h"
#include "color.h"
#include "settings.h"
#include "bitmap.h"
#include "surface.h"
#include "auto_crop.h"
#include "ocr.h"
#include "region_resolver.h"
#include "compositor.h"
#include "encoding.h"
#include "pipeline.h"
#include "logging.h"
