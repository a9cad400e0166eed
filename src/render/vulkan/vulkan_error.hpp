#pragma once

#include <util/error.hpp>
#include <vulkan/vulkan.hpp>

namespace polarbear::render {

/// Device and surface loss make the backend unusable; everything else fails only the call.
[[nodiscard]] inline auto vk_error_code(vk::Result result, ErrorCode fallback) -> ErrorCode {
    if (result == vk::Result::eErrorDeviceLost || result == vk::Result::eErrorSurfaceLostKHR) {
        return ErrorCode::context_lost;
    }
    return fallback;
}

} // namespace polarbear::render

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

/// Early-return if vk::Result is not eSuccess. Device or surface loss becomes `context_lost`.
/// Usage: VK_TRY(cmd.begin(info), ErrorCode::render_failed, "Command buffer begin failed");
// NOLINTNEXTLINE(bugprone-macro-parentheses)
#define VK_TRY(call, code, msg)                                                                    \
    do {                                                                                           \
        if (auto _vk_result = (call); _vk_result != vk::Result::eSuccess)                          \
            return nonstd::make_unexpected(                                                        \
                polarbear::Error{polarbear::render::vk_error_code(_vk_result, code),               \
                                 std::string(msg) + ": " + vk::to_string(_vk_result)});            \
    } while (0)

// NOLINTEND(cppcoreguidelines-macro-usage)
