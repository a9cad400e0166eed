#pragma once

#include <render/render_backend.hpp>
#include <util/error.hpp>

#include <SDL3/SDL.h>
#include <vulkan/vulkan.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace polarbear::render {

/// @brief Vulkan compositor output on an SDL window.
///
/// Layers are uploaded through per-frame host-visible staging buffers and copied into the
/// swapchain image with `vkCmdCopyBufferToImage`, bottom to top. Guest buffers are
/// ARGB8888/XRGB8888, which matches B8G8R8A8 byte order, so no conversion pass is needed.
class VulkanBackend : public RenderBackend {
public:
    VulkanBackend() = default;
    ~VulkanBackend() override;

    VulkanBackend(const VulkanBackend&) = delete;
    VulkanBackend& operator=(const VulkanBackend&) = delete;
    VulkanBackend(VulkanBackend&&) = delete;
    VulkanBackend& operator=(VulkanBackend&&) = delete;

    /// @brief Creates a backend for a surface whose handle is an `SDL_Window*`.
    [[nodiscard]] static auto create(const compositor::NativeSurface& surface)
        -> ResultPtr<RenderBackend>;

    [[nodiscard]] auto resize(uint32_t width, uint32_t height) -> Result<void> override;
    [[nodiscard]] auto composite(const compositor::SceneSnapshot& snapshot)
        -> Result<FrameStats> override;
    [[nodiscard]] auto present() -> Result<void> override;

private:
    struct StagingBuffer {
        vk::Buffer buffer;
        vk::DeviceMemory memory;
        void* mapped = nullptr;
        vk::DeviceSize capacity = 0;
    };

    [[nodiscard]] auto init(SDL_Window* window, uint32_t width, uint32_t height) -> Result<void>;
    void shutdown();

    [[nodiscard]] auto create_instance() -> Result<void>;
    [[nodiscard]] auto create_surface(SDL_Window* window) -> Result<void>;
    [[nodiscard]] auto select_physical_device() -> Result<void>;
    [[nodiscard]] auto create_device() -> Result<void>;
    [[nodiscard]] auto create_swapchain(uint32_t width, uint32_t height) -> Result<void>;
    [[nodiscard]] auto recreate_swapchain() -> Result<void>;
    void cleanup_swapchain();
    [[nodiscard]] auto create_command_resources() -> Result<void>;
    [[nodiscard]] auto create_sync_objects() -> Result<void>;

    [[nodiscard]] auto ensure_staging(StagingBuffer& staging, vk::DeviceSize size) -> Result<void>;
    void destroy_staging(StagingBuffer& staging);
    [[nodiscard]] auto find_memory_type(uint32_t type_bits, vk::MemoryPropertyFlags flags) const
        -> std::optional<uint32_t>;

    [[nodiscard]] auto acquire_next_image() -> Result<uint32_t>;
    [[nodiscard]] auto record_composite_commands(vk::CommandBuffer cmd, uint32_t image_index,
                                                 const compositor::SceneSnapshot& snapshot,
                                                 FrameStats& stats) -> Result<void>;

    vk::UniqueInstance m_instance;
    vk::UniqueSurfaceKHR m_surface;
    vk::UniqueDevice m_device;
    vk::UniqueSwapchainKHR m_swapchain;
    vk::UniqueCommandPool m_command_pool;

    vk::PhysicalDevice m_physical_device;
    uint32_t m_graphics_queue_family = UINT32_MAX;
    vk::Queue m_graphics_queue;

    std::vector<vk::Image> m_swapchain_images;
    vk::Format m_swapchain_format = vk::Format::eUndefined;
    vk::Extent2D m_swapchain_extent{};
    uint32_t m_target_width = 0;
    uint32_t m_target_height = 0;

    static constexpr uint32_t MAX_FRAMES_IN_FLIGHT = 2;
    std::vector<vk::CommandBuffer> m_command_buffers;
    std::vector<vk::Fence> m_in_flight_fences;
    std::vector<vk::Semaphore> m_image_available_sems;
    std::vector<vk::Semaphore> m_render_finished_sems;
    std::vector<StagingBuffer> m_staging;
    uint32_t m_current_frame = 0;
    std::optional<uint32_t> m_pending_image;
    uint64_t m_frame_index = 0;

    bool m_initialized = false;
    bool m_needs_resize = false;
};

} // namespace polarbear::render
