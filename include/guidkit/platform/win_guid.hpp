/**
 * @file win_guid.hpp
 * @brief Conversion between Guid and the Windows ::GUID record.
 *
 * Only available when targeting Windows. ::GUID stores Data1..Data3 as
 * native integers and Data4 as 8 bytes, so the mapping is field-for-field
 * with Guid::data1()..data4() and is lossless in both directions.
 *
 * @copyright Copyright (c) 2024 guidkit Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)

#include "guidkit/core/export.hpp"
#include "guidkit/core/guid.hpp"

#include <guiddef.h>

namespace guidkit {
namespace platform {

GUIDKIT_CORE_API ::GUID toWinGuid(const core::Guid& guid) noexcept;

GUIDKIT_CORE_API core::Guid fromWinGuid(const ::GUID& guid) noexcept;

}  // namespace platform
}  // namespace guidkit

#endif
