#include "ColorNames.h"

namespace ColorNames {

// Light sources.
uint32_t warmTorch()
{
    return 0xFFCC66FF;
}
uint32_t coolMoonlight()
{
    return 0xC4D4FFFF;
}

// Primaries and neutrals.
uint32_t blue()
{
    return 0x0000FFFF;
}
uint32_t red()
{
    return 0xFF0000FF;
}
uint32_t white()
{
    return 0xFFFFFFFF;
}

} // namespace ColorNames
