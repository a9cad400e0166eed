#include "vulkan_backend.hpp"

#include "vulkan_error.hpp"

#include <util/logging.hpp>
#include <util/profiling.hpp>

#include <SDL3/SDL_vulkan.h>

#include <algorithm>
#include <array>
#include <cstring>

VULKAN_HPP_DEFAULT_DISPATCH_LOADER_DYNAMIC_STORAGE

namespace polarbear::render {

namespace {

constexpr std::array REQUIRED_DEVICE_EXTENSIONS = {
    VK_KHR_SWAPCHAIN_EXTENSION_NAME,
};

constexpr std::array PREFERRED_FORMATS = {
    vk::Format::eB8G8R8A8Unorm,
    vk::Format::eB8G8R8A8Srgb,
};

constexpr uint32_t BYTES_PER_PIXEL = 4;

/// Part of a layer that lands inside the swapchain extent.
struct CopyRegion {
    const compositor::CompositeLayer* layer = nullptr;
    uint32_t src_x = 0;
    uint32_t src_y = 0;
    int32_t dst_x = 0;
    int32_t dst_y = 0;
    uint32_t width = 0;
    uint32_t height = 0;
    vk::DeviceSize offset = 0;
};

auto clip_layers(const compositor::SceneSnapshot& snapshot, vk::Extent2D extent)
    -> std::vector<CopyRegion> {
    std::vector<CopyRegion> regions;
    regions.reserve(snapshot.layers.size());
    vk::DeviceSize offset = 0;
    for (const auto& layer : snapshot.layers) {
        const int64_t x0 = std::max<int64_t>(layer.x, 0);
        const int64_t y0 = std::max<int64_t>(layer.y, 0);
        const int64_t x1 =
            std::min<int64_t>(static_cast<int64_t>(layer.x) + layer.buffer.width, extent.width);
        const int64_t y1 =
            std::min<int64_t>(static_cast<int64_t>(layer.y) + layer.buffer.height, extent.height);
        if (x1 <= x0 || y1 <= y0) {
            continue;
        }
        CopyRegion region{
            .layer = &layer,
            .src_x = static_cast<uint32_t>(x0 - layer.x),
            .src_y = static_cast<uint32_t>(y0 - layer.y),
            .dst_x = static_cast<int32_t>(x0),
            .dst_y = static_cast<int32_t>(y0),
            .width = static_cast<uint32_t>(x1 - x0),
            .height = static_cast<uint32_t>(y1 - y0),
            .offset = offset,
        };
        offset += static_cast<vk::DeviceSize>(region.width) * region.height * BYTES_PER_PIXEL;
        regions.push_back(region);
    }
    return regions;
}

auto color_range() -> vk::ImageSubresourceRange {
    vk::ImageSubresourceRange range{};
    range.aspectMask = vk::ImageAspectFlagBits::eColor;
    range.baseMipLevel = 0;
    range.levelCount = 1;
    range.baseArrayLayer = 0;
    range.layerCount = 1;
    return range;
}

} // namespace

VulkanBackend::~VulkanBackend() {
    shutdown();
}

auto VulkanBackend::create(const compositor::NativeSurface& surface) -> ResultPtr<RenderBackend> {
    auto* window = static_cast<SDL_Window*>(surface.handle);
    if (window == nullptr) {
        return make_result_ptr_error<RenderBackend>(ErrorCode::no_compatible_config,
                                                    "Native surface has no window handle");
    }
    auto backend = std::make_unique<VulkanBackend>();
    POLARBEAR_TRY(backend->init(window, surface.width, surface.height));
    return make_result_ptr<RenderBackend>(std::move(backend));
}

auto VulkanBackend::init(SDL_Window* window, uint32_t width, uint32_t height) -> Result<void> {
    auto vk_get_instance_proc_addr =
        reinterpret_cast<PFN_vkGetInstanceProcAddr>(SDL_Vulkan_GetVkGetInstanceProcAddr());
    if (vk_get_instance_proc_addr == nullptr) {
        return make_error<void>(ErrorCode::no_compatible_config,
                                std::string("Vulkan loader unavailable: ") + SDL_GetError());
    }
    VULKAN_HPP_DEFAULT_DISPATCHER.init(vk_get_instance_proc_addr);

    m_target_width = width;
    m_target_height = height;

    POLARBEAR_TRY(create_instance());
    POLARBEAR_TRY(create_surface(window));
    POLARBEAR_TRY(select_physical_device());
    POLARBEAR_TRY(create_device());
    POLARBEAR_TRY(create_swapchain(width, height));
    POLARBEAR_TRY(create_command_resources());
    POLARBEAR_TRY(create_sync_objects());

    m_initialized = true;
    POLARBEAR_LOG_INFO("Vulkan backend initialized: {}x{} {}", m_swapchain_extent.width,
                       m_swapchain_extent.height, vk::to_string(m_swapchain_format));
    return {};
}

void VulkanBackend::shutdown() {
    if (m_device) {
        static_cast<void>(m_device->waitIdle());
        for (auto& staging : m_staging) {
            destroy_staging(staging);
        }
        for (auto fence : m_in_flight_fences) {
            m_device->destroyFence(fence);
        }
        for (auto sem : m_image_available_sems) {
            m_device->destroySemaphore(sem);
        }
        for (auto sem : m_render_finished_sems) {
            m_device->destroySemaphore(sem);
        }
    }
    m_staging.clear();
    m_in_flight_fences.clear();
    m_image_available_sems.clear();
    m_render_finished_sems.clear();
    m_command_buffers.clear();
    m_swapchain_images.clear();

    m_command_pool.reset();
    m_swapchain.reset();
    m_device.reset();
    m_surface.reset();
    m_instance.reset();

    if (m_initialized) {
        POLARBEAR_LOG_INFO("Vulkan backend shutdown after {} frame(s)", m_frame_index);
    }
    m_initialized = false;
}

auto VulkanBackend::create_instance() -> Result<void> {
    uint32_t sdl_ext_count = 0;
    const char* const* sdl_extensions = SDL_Vulkan_GetInstanceExtensions(&sdl_ext_count);
    if (sdl_extensions == nullptr) {
        return make_error<void>(ErrorCode::no_compatible_config,
                                std::string("SDL_Vulkan_GetInstanceExtensions failed: ") +
                                    SDL_GetError());
    }
    std::vector<const char*> extensions(sdl_extensions, sdl_extensions + sdl_ext_count);

    vk::ApplicationInfo app_info{};
    app_info.pApplicationName = "polarbear";
    app_info.applicationVersion = VK_MAKE_VERSION(0, 1, 0);
    app_info.pEngineName = "polarbear";
    app_info.engineVersion = VK_MAKE_VERSION(0, 1, 0);
    app_info.apiVersion = VK_API_VERSION_1_1;

    vk::InstanceCreateInfo create_info{};
    create_info.pApplicationInfo = &app_info;
    create_info.enabledExtensionCount = static_cast<uint32_t>(extensions.size());
    create_info.ppEnabledExtensionNames = extensions.data();

    auto [result, instance] = vk::createInstanceUnique(create_info);
    if (result != vk::Result::eSuccess) {
        return make_error<void>(ErrorCode::no_compatible_config,
                                "Failed to create Vulkan instance: " + vk::to_string(result));
    }

    m_instance = std::move(instance);
    VULKAN_HPP_DEFAULT_DISPATCHER.init(*m_instance);

    POLARBEAR_LOG_DEBUG("Vulkan instance created with {} extensions", extensions.size());
    return {};
}

auto VulkanBackend::create_surface(SDL_Window* window) -> Result<void> {
    VkSurfaceKHR raw_surface = VK_NULL_HANDLE;
    if (!SDL_Vulkan_CreateSurface(window, *m_instance, nullptr, &raw_surface)) {
        return make_error<void>(ErrorCode::no_compatible_config,
                                std::string("SDL_Vulkan_CreateSurface failed: ") + SDL_GetError());
    }

    m_surface = vk::UniqueSurfaceKHR(raw_surface, *m_instance);
    return {};
}

auto VulkanBackend::select_physical_device() -> Result<void> {
    auto [result, devices] = m_instance->enumeratePhysicalDevices();
    if (result != vk::Result::eSuccess || devices.empty()) {
        return make_error<void>(ErrorCode::no_compatible_config, "No Vulkan devices found");
    }

    for (const auto& device : devices) {
        auto queue_families = device.getQueueFamilyProperties();
        uint32_t graphics_family = UINT32_MAX;

        for (uint32_t i = 0; i < queue_families.size(); ++i) {
            if (queue_families[i].queueFlags & vk::QueueFlagBits::eGraphics) {
                auto [res, supported] = device.getSurfaceSupportKHR(i, *m_surface);
                if (res == vk::Result::eSuccess && supported) {
                    graphics_family = i;
                    break;
                }
            }
        }
        if (graphics_family == UINT32_MAX) {
            continue;
        }

        auto [ext_result, available_extensions] = device.enumerateDeviceExtensionProperties();
        if (ext_result != vk::Result::eSuccess) {
            continue;
        }
        const bool all_extensions_found =
            std::ranges::all_of(REQUIRED_DEVICE_EXTENSIONS, [&](const char* required) {
                return std::ranges::any_of(available_extensions, [&](const auto& ext) {
                    return std::strcmp(ext.extensionName, required) == 0;
                });
            });
        if (!all_extensions_found) {
            continue;
        }

        m_physical_device = device;
        m_graphics_queue_family = graphics_family;

        auto props = device.getProperties();
        POLARBEAR_LOG_INFO("Selected GPU: {}", props.deviceName.data());
        return {};
    }

    return make_error<void>(ErrorCode::no_compatible_config,
                            "No GPU can present to the host surface");
}

auto VulkanBackend::create_device() -> Result<void> {
    float queue_priority = 1.0F;
    vk::DeviceQueueCreateInfo queue_info{};
    queue_info.queueFamilyIndex = m_graphics_queue_family;
    queue_info.queueCount = 1;
    queue_info.pQueuePriorities = &queue_priority;

    vk::PhysicalDeviceFeatures features{};

    vk::DeviceCreateInfo create_info{};
    create_info.queueCreateInfoCount = 1;
    create_info.pQueueCreateInfos = &queue_info;
    create_info.enabledExtensionCount = static_cast<uint32_t>(REQUIRED_DEVICE_EXTENSIONS.size());
    create_info.ppEnabledExtensionNames = REQUIRED_DEVICE_EXTENSIONS.data();
    create_info.pEnabledFeatures = &features;

    auto [result, device] = m_physical_device.createDeviceUnique(create_info);
    if (result != vk::Result::eSuccess) {
        return make_error<void>(ErrorCode::no_compatible_config,
                                "Failed to create logical device: " + vk::to_string(result));
    }

    m_device = std::move(device);
    VULKAN_HPP_DEFAULT_DISPATCHER.init(*m_device);
    m_graphics_queue = m_device->getQueue(m_graphics_queue_family, 0);
    return {};
}

auto VulkanBackend::create_swapchain(uint32_t width, uint32_t height) -> Result<void> {
    auto [cap_result, capabilities] = m_physical_device.getSurfaceCapabilitiesKHR(*m_surface);
    if (cap_result != vk::Result::eSuccess) {
        return make_error<void>(vk_error_code(cap_result, ErrorCode::no_compatible_config),
                                "Failed to query surface capabilities: " +
                                    vk::to_string(cap_result));
    }
    if (!(capabilities.supportedUsageFlags & vk::ImageUsageFlagBits::eTransferDst)) {
        return make_error<void>(ErrorCode::no_compatible_config,
                                "Surface does not accept transfer writes");
    }

    auto [fmt_result, formats] = m_physical_device.getSurfaceFormatsKHR(*m_surface);
    if (fmt_result != vk::Result::eSuccess || formats.empty()) {
        return make_error<void>(vk_error_code(fmt_result, ErrorCode::no_compatible_config),
                                "Failed to query surface formats");
    }

    std::optional<vk::SurfaceFormatKHR> chosen_format;
    for (auto preferred : PREFERRED_FORMATS) {
        auto it = std::ranges::find_if(formats, [preferred](const auto& format) {
            return format.format == preferred &&
                   format.colorSpace == vk::ColorSpaceKHR::eSrgbNonlinear;
        });
        if (it != formats.end()) {
            chosen_format = *it;
            break;
        }
    }
    if (!chosen_format) {
        return make_error<void>(ErrorCode::no_compatible_config,
                                "Surface offers no B8G8R8A8 format");
    }

    vk::Extent2D extent;
    if (capabilities.currentExtent.width != UINT32_MAX) {
        extent = capabilities.currentExtent;
    } else {
        extent.width = std::clamp(width, capabilities.minImageExtent.width,
                                  capabilities.maxImageExtent.width);
        extent.height = std::clamp(height, capabilities.minImageExtent.height,
                                   capabilities.maxImageExtent.height);
    }

    uint32_t image_count = capabilities.minImageCount + 1;
    if (capabilities.maxImageCount > 0 && image_count > capabilities.maxImageCount) {
        image_count = capabilities.maxImageCount;
    }

    vk::SwapchainCreateInfoKHR create_info{};
    create_info.surface = *m_surface;
    create_info.minImageCount = image_count;
    create_info.imageFormat = chosen_format->format;
    create_info.imageColorSpace = chosen_format->colorSpace;
    create_info.imageExtent = extent;
    create_info.imageArrayLayers = 1;
    create_info.imageUsage = vk::ImageUsageFlagBits::eTransferDst;
    create_info.imageSharingMode = vk::SharingMode::eExclusive;
    create_info.preTransform = capabilities.currentTransform;
    create_info.compositeAlpha = vk::CompositeAlphaFlagBitsKHR::eOpaque;
    create_info.presentMode = vk::PresentModeKHR::eFifo;
    create_info.clipped = VK_TRUE;

    auto [result, swapchain] = m_device->createSwapchainKHRUnique(create_info);
    if (result != vk::Result::eSuccess) {
        return make_error<void>(vk_error_code(result, ErrorCode::no_compatible_config),
                                "Failed to create swapchain: " + vk::to_string(result));
    }

    m_swapchain = std::move(swapchain);
    m_swapchain_format = chosen_format->format;
    m_swapchain_extent = extent;

    auto [img_result, images] = m_device->getSwapchainImagesKHR(*m_swapchain);
    if (img_result != vk::Result::eSuccess) {
        return make_error<void>(vk_error_code(img_result, ErrorCode::render_failed),
                                "Failed to get swapchain images");
    }
    m_swapchain_images = std::move(images);

    POLARBEAR_LOG_DEBUG("Swapchain created: {}x{}, {} images", extent.width, extent.height,
                        m_swapchain_images.size());
    return {};
}

void VulkanBackend::cleanup_swapchain() {
    m_swapchain_images.clear();
    m_swapchain.reset();
}

auto VulkanBackend::recreate_swapchain() -> Result<void> {
    if (m_target_width == 0 || m_target_height == 0) {
        return {};
    }
    VK_TRY(m_device->waitIdle(), ErrorCode::render_failed, "waitIdle before swapchain rebuild");
    cleanup_swapchain();
    POLARBEAR_TRY(create_swapchain(m_target_width, m_target_height));
    m_needs_resize = false;
    POLARBEAR_LOG_INFO("Swapchain recreated: {}x{}", m_swapchain_extent.width,
                       m_swapchain_extent.height);
    return {};
}

auto VulkanBackend::create_command_resources() -> Result<void> {
    vk::CommandPoolCreateInfo pool_info{};
    pool_info.flags = vk::CommandPoolCreateFlagBits::eResetCommandBuffer;
    pool_info.queueFamilyIndex = m_graphics_queue_family;

    auto [pool_result, pool] = m_device->createCommandPoolUnique(pool_info);
    if (pool_result != vk::Result::eSuccess) {
        return make_error<void>(ErrorCode::render_failed, "Failed to create command pool");
    }
    m_command_pool = std::move(pool);

    vk::CommandBufferAllocateInfo alloc_info{};
    alloc_info.commandPool = *m_command_pool;
    alloc_info.level = vk::CommandBufferLevel::ePrimary;
    alloc_info.commandBufferCount = MAX_FRAMES_IN_FLIGHT;

    auto [alloc_result, buffers] = m_device->allocateCommandBuffers(alloc_info);
    if (alloc_result != vk::Result::eSuccess) {
        return make_error<void>(ErrorCode::render_failed, "Failed to allocate command buffers");
    }
    m_command_buffers = std::move(buffers);
    m_staging.resize(MAX_FRAMES_IN_FLIGHT);
    return {};
}

auto VulkanBackend::create_sync_objects() -> Result<void> {
    vk::FenceCreateInfo fence_info{};
    fence_info.flags = vk::FenceCreateFlagBits::eSignaled;
    vk::SemaphoreCreateInfo sem_info{};

    for (uint32_t i = 0; i < MAX_FRAMES_IN_FLIGHT; ++i) {
        auto [fence_result, fence] = m_device->createFence(fence_info);
        if (fence_result != vk::Result::eSuccess) {
            return make_error<void>(ErrorCode::render_failed, "Failed to create fence");
        }
        m_in_flight_fences.push_back(fence);

        auto [sem1_result, sem1] = m_device->createSemaphore(sem_info);
        if (sem1_result != vk::Result::eSuccess) {
            return make_error<void>(ErrorCode::render_failed, "Failed to create semaphore");
        }
        m_image_available_sems.push_back(sem1);

        auto [sem2_result, sem2] = m_device->createSemaphore(sem_info);
        if (sem2_result != vk::Result::eSuccess) {
            return make_error<void>(ErrorCode::render_failed, "Failed to create semaphore");
        }
        m_render_finished_sems.push_back(sem2);
    }
    return {};
}

auto VulkanBackend::find_memory_type(uint32_t type_bits, vk::MemoryPropertyFlags flags) const
    -> std::optional<uint32_t> {
    auto mem_props = m_physical_device.getMemoryProperties();
    for (uint32_t i = 0; i < mem_props.memoryTypeCount; ++i) {
        if ((type_bits & (1U << i)) != 0 &&
            (mem_props.memoryTypes[i].propertyFlags & flags) == flags) {
            return i;
        }
    }
    return std::nullopt;
}

auto VulkanBackend::ensure_staging(StagingBuffer& staging, vk::DeviceSize size) -> Result<void> {
    if (staging.capacity >= size) {
        return {};
    }
    destroy_staging(staging);

    // Grow geometrically so a slowly growing window does not reallocate every frame.
    const vk::DeviceSize capacity = std::max(size, staging.capacity * 2);

    vk::BufferCreateInfo buffer_info{};
    buffer_info.size = capacity;
    buffer_info.usage = vk::BufferUsageFlagBits::eTransferSrc;
    buffer_info.sharingMode = vk::SharingMode::eExclusive;

    auto [buf_result, buffer] = m_device->createBuffer(buffer_info);
    if (buf_result != vk::Result::eSuccess) {
        return make_error<void>(vk_error_code(buf_result, ErrorCode::render_failed),
                                "Failed to create staging buffer: " + vk::to_string(buf_result));
    }
    staging.buffer = buffer;

    auto mem_reqs = m_device->getBufferMemoryRequirements(staging.buffer);
    auto mem_type =
        find_memory_type(mem_reqs.memoryTypeBits, vk::MemoryPropertyFlagBits::eHostVisible |
                                                      vk::MemoryPropertyFlagBits::eHostCoherent);
    if (!mem_type) {
        destroy_staging(staging);
        return make_error<void>(ErrorCode::no_compatible_config,
                                "No host-visible coherent memory for staging");
    }

    vk::MemoryAllocateInfo alloc_info{};
    alloc_info.allocationSize = mem_reqs.size;
    alloc_info.memoryTypeIndex = *mem_type;

    auto [alloc_result, memory] = m_device->allocateMemory(alloc_info);
    if (alloc_result != vk::Result::eSuccess) {
        destroy_staging(staging);
        return make_error<void>(vk_error_code(alloc_result, ErrorCode::render_failed),
                                "Failed to allocate staging memory: " +
                                    vk::to_string(alloc_result));
    }
    staging.memory = memory;

    VK_TRY(m_device->bindBufferMemory(staging.buffer, staging.memory, 0), ErrorCode::render_failed,
           "Failed to bind staging memory");

    auto [map_result, mapped] = m_device->mapMemory(staging.memory, 0, capacity);
    if (map_result != vk::Result::eSuccess) {
        destroy_staging(staging);
        return make_error<void>(vk_error_code(map_result, ErrorCode::render_failed),
                                "Failed to map staging memory: " + vk::to_string(map_result));
    }
    staging.mapped = mapped;
    staging.capacity = capacity;
    return {};
}

void VulkanBackend::destroy_staging(StagingBuffer& staging) {
    if (!m_device) {
        return;
    }
    if (staging.mapped != nullptr) {
        m_device->unmapMemory(staging.memory);
        staging.mapped = nullptr;
    }
    if (staging.buffer) {
        m_device->destroyBuffer(staging.buffer);
        staging.buffer = nullptr;
    }
    if (staging.memory) {
        m_device->freeMemory(staging.memory);
        staging.memory = nullptr;
    }
    staging.capacity = 0;
}

auto VulkanBackend::acquire_next_image() -> Result<uint32_t> {
    for (int attempt = 0; attempt < 2; ++attempt) {
        auto [result, image_index] = m_device->acquireNextImageKHR(
            *m_swapchain, UINT64_MAX, m_image_available_sems[m_current_frame], nullptr);
        if (result == vk::Result::eSuccess) {
            return image_index;
        }
        if (result == vk::Result::eSuboptimalKHR) {
            m_needs_resize = true;
            return image_index;
        }
        if (result != vk::Result::eErrorOutOfDateKHR) {
            return make_error<uint32_t>(vk_error_code(result, ErrorCode::render_failed),
                                        "Failed to acquire swapchain image: " +
                                            vk::to_string(result));
        }
        POLARBEAR_TRY(recreate_swapchain());
    }
    return make_error<uint32_t>(ErrorCode::render_failed, "Swapchain stays out of date");
}

auto VulkanBackend::record_composite_commands(vk::CommandBuffer cmd, uint32_t image_index,
                                              const compositor::SceneSnapshot& snapshot,
                                              FrameStats& stats) -> Result<void> {
    auto& staging = m_staging[m_current_frame];
    auto regions = clip_layers(snapshot, m_swapchain_extent);

    vk::DeviceSize total = 0;
    if (!regions.empty()) {
        const auto& last = regions.back();
        total = last.offset +
                static_cast<vk::DeviceSize>(last.width) * last.height * BYTES_PER_PIXEL;
    }
    POLARBEAR_TRY(ensure_staging(staging, total));

    auto* dst_base = static_cast<uint8_t*>(staging.mapped);
    for (const auto& region : regions) {
        const auto& buffer = region.layer->buffer;
        const size_t row_bytes = static_cast<size_t>(region.width) * BYTES_PER_PIXEL;
        const uint8_t* src = buffer.pixels->data() +
                             static_cast<size_t>(region.src_y) * buffer.stride +
                             static_cast<size_t>(region.src_x) * BYTES_PER_PIXEL;
        uint8_t* dst = dst_base + region.offset;
        for (uint32_t row = 0; row < region.height; ++row) {
            std::memcpy(dst, src, row_bytes);
            src += buffer.stride;
            dst += row_bytes;
        }
    }

    VK_TRY(cmd.reset(), ErrorCode::render_failed, "Command buffer reset failed");
    vk::CommandBufferBeginInfo begin_info{};
    begin_info.flags = vk::CommandBufferUsageFlagBits::eOneTimeSubmit;
    VK_TRY(cmd.begin(begin_info), ErrorCode::render_failed, "Command buffer begin failed");

    vk::ImageMemoryBarrier barrier{};
    barrier.srcAccessMask = vk::AccessFlagBits::eNone;
    barrier.dstAccessMask = vk::AccessFlagBits::eTransferWrite;
    barrier.oldLayout = vk::ImageLayout::eUndefined;
    barrier.newLayout = vk::ImageLayout::eTransferDstOptimal;
    barrier.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    barrier.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    barrier.image = m_swapchain_images[image_index];
    barrier.subresourceRange = color_range();

    cmd.pipelineBarrier(vk::PipelineStageFlagBits::eTopOfPipe,
                        vk::PipelineStageFlagBits::eTransfer, {}, {}, {}, barrier);

    vk::ClearColorValue clear_color{std::array{0.0F, 0.0F, 0.0F, 1.0F}};
    cmd.clearColorImage(m_swapchain_images[image_index], vk::ImageLayout::eTransferDstOptimal,
                        clear_color, color_range());

    if (!regions.empty()) {
        // Clear and copies both write the image; copies must land after the clear.
        vk::MemoryBarrier clear_done{};
        clear_done.srcAccessMask = vk::AccessFlagBits::eTransferWrite;
        clear_done.dstAccessMask = vk::AccessFlagBits::eTransferWrite;
        cmd.pipelineBarrier(vk::PipelineStageFlagBits::eTransfer,
                            vk::PipelineStageFlagBits::eTransfer, {}, clear_done, {}, {});
    }

    for (const auto& region : regions) {
        vk::BufferImageCopy copy{};
        copy.bufferOffset = region.offset;
        copy.bufferRowLength = region.width;
        copy.bufferImageHeight = region.height;
        copy.imageSubresource.aspectMask = vk::ImageAspectFlagBits::eColor;
        copy.imageSubresource.mipLevel = 0;
        copy.imageSubresource.baseArrayLayer = 0;
        copy.imageSubresource.layerCount = 1;
        copy.imageOffset = vk::Offset3D{region.dst_x, region.dst_y, 0};
        copy.imageExtent = vk::Extent3D{region.width, region.height, 1};
        cmd.copyBufferToImage(staging.buffer, m_swapchain_images[image_index],
                              vk::ImageLayout::eTransferDstOptimal, copy);
        ++stats.layers_drawn;
        stats.bytes_uploaded +=
            static_cast<uint64_t>(region.width) * region.height * BYTES_PER_PIXEL;
    }

    barrier.srcAccessMask = vk::AccessFlagBits::eTransferWrite;
    barrier.dstAccessMask = vk::AccessFlagBits::eNone;
    barrier.oldLayout = vk::ImageLayout::eTransferDstOptimal;
    barrier.newLayout = vk::ImageLayout::ePresentSrcKHR;

    cmd.pipelineBarrier(vk::PipelineStageFlagBits::eTransfer,
                        vk::PipelineStageFlagBits::eBottomOfPipe, {}, {}, {}, barrier);

    VK_TRY(cmd.end(), ErrorCode::render_failed, "Command buffer end failed");
    return {};
}

auto VulkanBackend::resize(uint32_t width, uint32_t height) -> Result<void> {
    if (!m_initialized) {
        return make_error<void>(ErrorCode::invalid_state, "Backend not initialized");
    }
    m_target_width = width;
    m_target_height = height;
    if (m_swapchain_extent.width == width && m_swapchain_extent.height == height &&
        !m_needs_resize) {
        return {};
    }
    return recreate_swapchain();
}

auto VulkanBackend::composite(const compositor::SceneSnapshot& snapshot) -> Result<FrameStats> {
    POLARBEAR_PROFILE_SCOPE("VulkanComposite");
    if (!m_initialized) {
        return make_error<FrameStats>(ErrorCode::invalid_state, "Backend not initialized");
    }
    if (m_pending_image) {
        return make_error<FrameStats>(ErrorCode::invalid_state,
                                      "Previous frame was composited but never presented");
    }
    if (m_needs_resize) {
        POLARBEAR_TRY(recreate_swapchain());
    }

    VK_TRY(m_device->waitForFences(m_in_flight_fences[m_current_frame], VK_TRUE, UINT64_MAX),
           ErrorCode::render_failed, "Fence wait failed");

    const uint32_t image_index = POLARBEAR_TRY(acquire_next_image());

    FrameStats stats{.frame_index = m_frame_index};
    auto& cmd = m_command_buffers[m_current_frame];
    if (auto recorded = record_composite_commands(cmd, image_index, snapshot, stats); !recorded) {
        // The acquired image and its semaphore cannot be handed back; only a rebuild recovers.
        return make_error<FrameStats>(ErrorCode::context_lost,
                                      "Frame abandoned after acquire: " + recorded.error().message);
    }
    VK_TRY(m_device->resetFences(m_in_flight_fences[m_current_frame]), ErrorCode::render_failed,
           "Fence reset failed");

    vk::PipelineStageFlags wait_stage = vk::PipelineStageFlagBits::eTransfer;
    vk::SubmitInfo submit_info{};
    submit_info.waitSemaphoreCount = 1;
    submit_info.pWaitSemaphores = &m_image_available_sems[m_current_frame];
    submit_info.pWaitDstStageMask = &wait_stage;
    submit_info.commandBufferCount = 1;
    submit_info.pCommandBuffers = &cmd;
    submit_info.signalSemaphoreCount = 1;
    submit_info.pSignalSemaphores = &m_render_finished_sems[m_current_frame];

    VK_TRY(m_graphics_queue.submit(submit_info, m_in_flight_fences[m_current_frame]),
           ErrorCode::render_failed, "Queue submit failed");

    m_pending_image = image_index;
    return stats;
}

auto VulkanBackend::present() -> Result<void> {
    if (!m_pending_image) {
        return {};
    }
    const uint32_t image_index = *m_pending_image;
    m_pending_image.reset();

    vk::PresentInfoKHR present_info{};
    present_info.waitSemaphoreCount = 1;
    present_info.pWaitSemaphores = &m_render_finished_sems[m_current_frame];
    present_info.swapchainCount = 1;
    present_info.pSwapchains = &*m_swapchain;
    present_info.pImageIndices = &image_index;

    auto present_result = m_graphics_queue.presentKHR(present_info);
    m_current_frame = (m_current_frame + 1) % MAX_FRAMES_IN_FLIGHT;
    ++m_frame_index;

    if (present_result == vk::Result::eErrorOutOfDateKHR ||
        present_result == vk::Result::eSuboptimalKHR) {
        m_needs_resize = true;
        return {};
    }
    VK_TRY(present_result, ErrorCode::render_failed, "Present failed");
    return {};
}

} // namespace polarbear::render
