/**
 * @file types.h
 * @brief Common C++ type aliases for tbrsa
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef TBRSA_CORE_TYPES_H
#define TBRSA_CORE_TYPES_H

#include <cstdint>
#include <vector>

namespace tbrsa {

using ByteVec = std::vector<uint8_t>;

/// Unicode scalar values decoded from UTF-8 text
using CodePoints = std::vector<char32_t>;

} // namespace tbrsa

#endif // TBRSA_CORE_TYPES_H
