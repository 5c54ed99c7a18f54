#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: vk_window_compositor.hpp
    MODULE: rhi/vulkan
    PURPOSE: Desktop stand-in for a headset compositor. Owns the SDL window surface,
            the Vulkan instance/device/swapchain and per-frame offscreen eye targets.
            Eyes are rendered with the configured layout and blitted side by side
            into the swapchain image on present.
*/


#include <algorithm>
#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <vulkan/vulkan.h>

#include "mxr/core/config.hpp"
#include "mxr/core/result.hpp"
#include "mxr/math/transform.hpp"
#include "mxr/render/render_loop.hpp"
#include "mxr/rhi/vulkan/vk_frame_ring.hpp"
#include "mxr/rhi/vulkan/vk_gpu_device.hpp"
#include "mxr/scene/camera.hpp"
#include "mxr/scene/spatial_event.hpp"

struct SDL_Window;

namespace mxr
{
    class VulkanWindowCompositor final : public ICompositor
    {
    public:
        struct InitDesc
        {
            SDL_Window* window = nullptr;
            int width = 0;
            int height = 0;
            bool enable_validation = false;
            PresentModePreference present_mode = PresentModePreference::Fifo;
            RenderLayout layout = RenderLayout::Dedicated;
            const char* app_name = "mxr-preview";
        };

        static constexpr float kInterpupillaryDistance = 0.064f;
        static constexpr uint32_t kEyeCount = 2;

        VulkanWindowCompositor() = default;
        ~VulkanWindowCompositor() override;

        VulkanWindowCompositor(const VulkanWindowCompositor&) = delete;
        VulkanWindowCompositor& operator=(const VulkanWindowCompositor&) = delete;

        Result<bool> init_sdl(const InitDesc& desc);
        void shutdown();

        // Valid after a successful init_sdl().
        VulkanGpuDevice& device() { return *device_; }

        RenderLayout layout() const override { return layout_; }
        CompositorState state() const override { return state_.load(); }
        std::optional<CompositorFrame> next_frame() override;
        void present(CompositorFrame& frame) override;

        // Main-thread controls.
        void set_paused(bool paused);
        void invalidate() { state_.store(CompositorState::Invalidated); }
        void request_resize(int w, int h);
        void set_head_pose(const Transform& head);
        Transform head_pose() const;

        // World-space ray through a window pixel of whichever eye covers it.
        Ray ray_from_window_point(float x, float y) const;

    private:
        struct QueueFamilies
        {
            std::optional<uint32_t> graphics{};
            std::optional<uint32_t> present{};
            bool ok() const { return graphics.has_value() && present.has_value(); }
        };

        struct SwapchainSupport
        {
            VkSurfaceCapabilitiesKHR caps{};
            std::vector<VkSurfaceFormatKHR> formats{};
            std::vector<VkPresentModeKHR> modes{};
        };

        struct FrameSlot
        {
            VkCommandBuffer cmd = VK_NULL_HANDLE;
            VkSemaphore image_available = VK_NULL_HANDLE;
            VkSemaphore render_finished = VK_NULL_HANDLE;
            VkFence in_flight = VK_NULL_HANDLE;
            std::vector<std::shared_ptr<IGpuImage>> color_targets{};
            std::vector<std::shared_ptr<IGpuImage>> depth_targets{};
        };

        static VKAPI_ATTR VkBool32 VKAPI_CALL debug_callback(
            VkDebugUtilsMessageSeverityFlagBitsEXT severity,
            VkDebugUtilsMessageTypeFlagsEXT type,
            const VkDebugUtilsMessengerCallbackDataEXT* data,
            void* user);
        static bool layer_supported(const char* name);
        static bool extension_supported(const char* name);

        Result<bool> ensure_initialized();
        bool create_instance();
        QueueFamilies find_queue_families(VkPhysicalDevice gpu) const;
        SwapchainSupport query_swapchain_support(VkPhysicalDevice gpu) const;
        bool device_extension_supported(VkPhysicalDevice gpu, const char* name) const;
        bool pick_physical_device();
        bool create_device_and_queues();
        void resolve_layout();
        VkSurfaceFormatKHR choose_surface_format(const std::vector<VkSurfaceFormatKHR>& formats) const;
        VkPresentModeKHR choose_present_mode(const std::vector<VkPresentModeKHR>& modes) const;
        VkExtent2D choose_extent(const VkSurfaceCapabilitiesKHR& caps) const;
        bool create_swapchain();
        bool create_frame_slots();
        void create_eye_targets();
        void destroy_swapchain_objects();
        bool recreate_swapchain();

        uint32_t eye_width() const { return std::max(1u, extent_.width / kEyeCount); }
        static Transform eye_pose(const Transform& head, uint32_t eye);
        FrameViews build_views() const;
        void record_blit(VkCommandBuffer cmd, const FrameSlot& slot, VkImage swapchain_image) const;

        InitDesc desc_{};
        std::vector<const char*> layers_{};
        RenderLayout layout_ = RenderLayout::Dedicated;
        std::atomic<CompositorState> state_{CompositorState::Paused};
        std::atomic<bool> resize_pending_{false};
        std::atomic<int> requested_width_{0};
        std::atomic<int> requested_height_{0};
        bool swapchain_needs_rebuild_ = false;

        mutable std::mutex head_mutex_{};
        Transform head_{};
        PerspectiveCamera camera_{};

        VkInstance instance_ = VK_NULL_HANDLE;
        VkDebugUtilsMessengerEXT debug_messenger_ = VK_NULL_HANDLE;
        VkSurfaceKHR surface_ = VK_NULL_HANDLE;
        VkPhysicalDevice gpu_ = VK_NULL_HANDLE;
        QueueFamilies qf_{};
        VkDevice vk_device_ = VK_NULL_HANDLE;
        VkQueue graphics_q_ = VK_NULL_HANDLE;
        VkQueue present_q_ = VK_NULL_HANDLE;
        VulkanDeviceHandles handles_{};
        std::unique_ptr<VulkanGpuDevice> device_{};

        VkSwapchainKHR swapchain_ = VK_NULL_HANDLE;
        VkFormat swapchain_format_ = VK_FORMAT_UNDEFINED;
        RHIFormat target_format_ = RHIFormat::BGRA8_UNorm;
        VkExtent2D extent_{};
        std::vector<VkImage> images_{};

        VkCommandPool cmd_pool_ = VK_NULL_HANDLE;
        VkFrameRing<FrameSlot> slots_{};
        uint64_t frame_index_ = 0;
        uint32_t acquired_image_ = 0;
        uint64_t perf_origin_ = 0;
    };
}
