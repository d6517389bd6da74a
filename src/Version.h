#pragma once

#include <compare>
#include <cstdint>

// Components come from project() in CMakeLists.txt; the fallbacks cover
// builds that compile the sources without it.
#ifndef TESSERA_VERSION_MAJOR
#define TESSERA_VERSION_MAJOR 1
#endif
#ifndef TESSERA_VERSION_MINOR
#define TESSERA_VERSION_MINOR 0
#endif
#ifndef TESSERA_VERSION_PATCH
#define TESSERA_VERSION_PATCH 0
#endif

#define TESSERA_VERSION_STR_(x) #x
/// Stringify after macro expansion, so components render as digits.
#define TESSERA_VERSION_STR(x) TESSERA_VERSION_STR_(x)

/// Version string, e.g. "1.0.0".
#define TESSERA_VERSION \
    TESSERA_VERSION_STR(TESSERA_VERSION_MAJOR) "." \
    TESSERA_VERSION_STR(TESSERA_VERSION_MINOR) "." \
    TESSERA_VERSION_STR(TESSERA_VERSION_PATCH)

/**
 * @struct TesseraVersion
 * @brief Library version as comparable components.
 * @ingroup Core
 */
struct TesseraVersion
{
    uint32_t major{0};
    uint32_t minor{0};
    uint32_t patch{0};

    /// Packed as 0xMMmmpppp for single-integer comparisons.
    constexpr uint32_t Packed() const
    {
        return (major << 24) | ((minor & 0xFFu) << 16) | (patch & 0xFFFFu);
    }

    auto operator<=>(const TesseraVersion &) const = default;
};

/// Version of the library this header was compiled against.
inline constexpr TesseraVersion kTesseraVersion{TESSERA_VERSION_MAJOR,
                                                TESSERA_VERSION_MINOR,
                                                TESSERA_VERSION_PATCH};
