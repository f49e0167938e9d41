/**
 * @file win_guid.cpp
 * @brief Windows ::GUID interop (compiled on Windows only).
 *
 * @copyright Copyright (c) 2024 guidkit Contributors
 * @license MIT License
 */

#include "guidkit/platform/win_guid.hpp"

namespace guidkit {
namespace platform {

::GUID toWinGuid(const core::Guid& guid) noexcept {
    ::GUID win{};
    win.Data1 = guid.data1();
    win.Data2 = guid.data2();
    win.Data3 = guid.data3();

    const auto data4 = guid.data4();
    for (size_t i = 0; i < data4.size(); ++i) {
        win.Data4[i] = data4[i];
    }
    return win;
}

core::Guid fromWinGuid(const ::GUID& guid) noexcept {
    core::Guid::Data4 data4{};
    for (size_t i = 0; i < data4.size(); ++i) {
        data4[i] = guid.Data4[i];
    }
    return core::Guid::fromComponents(guid.Data1, guid.Data2, guid.Data3, data4);
}

}  // namespace platform
}  // namespace guidkit
