/** \file Emu.hpp
 *  DrawingML unit helpers.
 */
#pragma once
#include <QtGlobal>

namespace QtPptxTemplate { namespace util {

/** Font sizes in DrawingML run properties are hundredths of a point. */
inline int pointsToFontUnits(double pt) { return static_cast<int>(pt * 100.0 + 0.5); }

}} // namespace QtPptxTemplate::util
