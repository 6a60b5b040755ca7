#pragma once
// Colors.hpp - Fixed UI colours and Color <-> QColor conversion

#include <QColor>
#include "util/Types.hpp"

namespace babel::colors {

inline const QColor ORANGE_500{0xF9, 0x73, 0x16};
inline const QColor GRAY_500{0x6B, 0x72, 0x80};
inline const QColor GRAY_700{0x37, 0x41, 0x51};
inline const QColor BLUE_300{0x93, 0xC5, 0xFD};

inline QColor toQColor(const Color& c) {
    return QColor(c.r, c.g, c.b, c.a);
}

inline Color fromQColor(const QColor& c) {
    return Color{static_cast<u8>(c.red()),
                 static_cast<u8>(c.green()),
                 static_cast<u8>(c.blue()),
                 static_cast<u8>(c.alpha())};
}

} // namespace babel::colors
