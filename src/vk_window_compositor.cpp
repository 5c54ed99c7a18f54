#include "mxr/rhi/vulkan/vk_window_compositor.hpp"

#include <cstring>

#include <SDL2/SDL.h>
#include <SDL2/SDL_vulkan.h>

#include "mxr/core/log.hpp"
#include "mxr/rhi/vulkan/vk_cmd_utils.hpp"

namespace mxr
{
    namespace
    {
        // Acquire-to-photon estimate for a desktop swapchain.
        constexpr double kPredictedLatencySeconds = 1.0 / 60.0;
    }

    VulkanWindowCompositor::~VulkanWindowCompositor()
    {
        shutdown();
    }

    VKAPI_ATTR VkBool32 VKAPI_CALL VulkanWindowCompositor::debug_callback(
        VkDebugUtilsMessageSeverityFlagBitsEXT severity,
        VkDebugUtilsMessageTypeFlagsEXT type,
        const VkDebugUtilsMessengerCallbackDataEXT* data,
        void* user)
    {
        (void)type;
        (void)user;
        if (data && data->pMessage && severity >= VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT)
        {
            log_validation(data->pMessage);
        }
        return VK_FALSE;
    }

    bool VulkanWindowCompositor::layer_supported(const char* name)
    {
        uint32_t count = 0;
        vkEnumerateInstanceLayerProperties(&count, nullptr);
        std::vector<VkLayerProperties> layers(count);
        vkEnumerateInstanceLayerProperties(&count, layers.data());
        for (const auto& l : layers)
        {
            if (std::strcmp(l.layerName, name) == 0) return true;
        }
        return false;
    }

    bool VulkanWindowCompositor::extension_supported(const char* name)
    {
        uint32_t count = 0;
        vkEnumerateInstanceExtensionProperties(nullptr, &count, nullptr);
        std::vector<VkExtensionProperties> exts(count);
        vkEnumerateInstanceExtensionProperties(nullptr, &count, exts.data());
        for (const auto& e : exts)
        {
            if (std::strcmp(e.extensionName, name) == 0) return true;
        }
        return false;
    }

    Result<bool> VulkanWindowCompositor::init_sdl(const InitDesc& desc)
    {
        shutdown();
        if (!desc.window) return Result<bool>::failure("no SDL window");
        desc_ = desc;
        layout_ = desc.layout;
        requested_width_.store(desc.width);
        requested_height_.store(desc.height);
        resize_pending_.store(false);
        swapchain_needs_rebuild_ = false;
        frame_index_ = 0;
        perf_origin_ = SDL_GetPerformanceCounter();

        Result<bool> res = ensure_initialized();
        if (!res)
        {
            log_error("VulkanWindowCompositor: " + res.error);
            shutdown();
            return res;
        }
        state_.store(CompositorState::Running);
        return res;
    }

    Result<bool> VulkanWindowCompositor::ensure_initialized()
    {
        if (!create_instance()) return Result<bool>::failure("vkCreateInstance failed");
        if (!SDL_Vulkan_CreateSurface(desc_.window, instance_, &surface_))
        {
            return Result<bool>::failure(std::string("SDL_Vulkan_CreateSurface failed: ") + SDL_GetError());
        }
        if (!pick_physical_device()) return Result<bool>::failure("no Vulkan 1.3 device with swapchain and vertex stores");
        if (!create_device_and_queues()) return Result<bool>::failure("vkCreateDevice failed");

        try
        {
            device_ = std::make_unique<VulkanGpuDevice>(handles_);
        }
        catch (const GpuResourceError& e)
        {
            return Result<bool>::failure(e.what());
        }

        resolve_layout();
        if (!create_swapchain()) return Result<bool>::failure("swapchain creation failed");
        if (!create_frame_slots()) return Result<bool>::failure("frame sync objects failed");
        create_eye_targets();

        log_info("VulkanWindowCompositor: " + std::to_string(extent_.width) + "x" + std::to_string(extent_.height) +
                 ", layout " + render_layout_name(layout_));
        return Result<bool>::success(true);
    }

    bool VulkanWindowCompositor::create_instance()
    {
        unsigned int ext_count = 0;
        if (!SDL_Vulkan_GetInstanceExtensions(desc_.window, &ext_count, nullptr)) return false;
        std::vector<const char*> exts(ext_count);
        if (!SDL_Vulkan_GetInstanceExtensions(desc_.window, &ext_count, exts.data())) return false;

        auto add_instance_ext_if_supported = [&](const char* ext_name) {
            for (const char* existing : exts)
            {
                if (existing && std::strcmp(existing, ext_name) == 0) return true;
            }
            if (!extension_supported(ext_name)) return false;
            exts.push_back(ext_name);
            return true;
        };

        const char* validation_layer = "VK_LAYER_KHRONOS_validation";
        if (desc_.enable_validation && layer_supported(validation_layer))
        {
            layers_.push_back(validation_layer);
        }
        bool debug_utils = false;
        if (desc_.enable_validation)
        {
            debug_utils = add_instance_ext_if_supported(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
        }

        VkApplicationInfo app{};
        app.sType = VK_STRUCTURE_TYPE_APPLICATION_INFO;
        app.pApplicationName = desc_.app_name ? desc_.app_name : "mxr-preview";
        app.applicationVersion = VK_MAKE_VERSION(0, 1, 0);
        app.pEngineName = "mxr";
        app.engineVersion = VK_MAKE_VERSION(0, 1, 0);
        app.apiVersion = VK_API_VERSION_1_3;

        VkInstanceCreateInfo ci{};
        ci.sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
        ci.pApplicationInfo = &app;
        ci.enabledLayerCount = static_cast<uint32_t>(layers_.size());
        ci.ppEnabledLayerNames = layers_.empty() ? nullptr : layers_.data();
        // Portability drivers require both the extension and the enumerate flag.
        if (add_instance_ext_if_supported(VK_KHR_PORTABILITY_ENUMERATION_EXTENSION_NAME))
        {
            ci.flags |= VK_INSTANCE_CREATE_ENUMERATE_PORTABILITY_BIT_KHR;
        }
        ci.enabledExtensionCount = static_cast<uint32_t>(exts.size());
        ci.ppEnabledExtensionNames = exts.empty() ? nullptr : exts.data();

        VkDebugUtilsMessengerCreateInfoEXT dbg{};
        dbg.sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
        dbg.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT | VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
        dbg.messageType = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT | VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT |
                          VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT;
        dbg.pfnUserCallback = debug_callback;
        if (debug_utils && !layers_.empty()) ci.pNext = &dbg;

        if (vkCreateInstance(&ci, nullptr, &instance_) != VK_SUCCESS) return false;

        if (debug_utils)
        {
            auto create_fn = (PFN_vkCreateDebugUtilsMessengerEXT)vkGetInstanceProcAddr(instance_, "vkCreateDebugUtilsMessengerEXT");
            if (create_fn && create_fn(instance_, &dbg, nullptr, &debug_messenger_) != VK_SUCCESS)
            {
                log_warn("VulkanWindowCompositor: debug messenger unavailable");
            }
        }
        handles_.instance = instance_;
        handles_.debug_utils = debug_utils;
        return true;
    }

    VulkanWindowCompositor::QueueFamilies VulkanWindowCompositor::find_queue_families(VkPhysicalDevice gpu) const
    {
        QueueFamilies out{};
        uint32_t n = 0;
        vkGetPhysicalDeviceQueueFamilyProperties(gpu, &n, nullptr);
        std::vector<VkQueueFamilyProperties> props(n);
        vkGetPhysicalDeviceQueueFamilyProperties(gpu, &n, props.data());
        for (uint32_t i = 0; i < n; ++i)
        {
            if (props[i].queueFlags & VK_QUEUE_GRAPHICS_BIT) out.graphics = i;
            VkBool32 present = VK_FALSE;
            vkGetPhysicalDeviceSurfaceSupportKHR(gpu, i, surface_, &present);
            if (present) out.present = i;
            if (out.ok()) break;
        }
        return out;
    }

    VulkanWindowCompositor::SwapchainSupport VulkanWindowCompositor::query_swapchain_support(VkPhysicalDevice gpu) const
    {
        SwapchainSupport out{};
        vkGetPhysicalDeviceSurfaceCapabilitiesKHR(gpu, surface_, &out.caps);
        uint32_t nf = 0;
        vkGetPhysicalDeviceSurfaceFormatsKHR(gpu, surface_, &nf, nullptr);
        if (nf)
        {
            out.formats.resize(nf);
            vkGetPhysicalDeviceSurfaceFormatsKHR(gpu, surface_, &nf, out.formats.data());
        }
        uint32_t nm = 0;
        vkGetPhysicalDeviceSurfacePresentModesKHR(gpu, surface_, &nm, nullptr);
        if (nm)
        {
            out.modes.resize(nm);
            vkGetPhysicalDeviceSurfacePresentModesKHR(gpu, surface_, &nm, out.modes.data());
        }
        return out;
    }

    bool VulkanWindowCompositor::device_extension_supported(VkPhysicalDevice gpu, const char* name) const
    {
        uint32_t count = 0;
        vkEnumerateDeviceExtensionProperties(gpu, nullptr, &count, nullptr);
        std::vector<VkExtensionProperties> exts(count);
        vkEnumerateDeviceExtensionProperties(gpu, nullptr, &count, exts.data());
        for (const auto& e : exts)
        {
            if (std::strcmp(e.extensionName, name) == 0) return true;
        }
        return false;
    }

    bool VulkanWindowCompositor::pick_physical_device()
    {
        uint32_t gpu_count = 0;
        vkEnumeratePhysicalDevices(instance_, &gpu_count, nullptr);
        if (gpu_count == 0) return false;
        std::vector<VkPhysicalDevice> gpus(gpu_count);
        vkEnumeratePhysicalDevices(instance_, &gpu_count, gpus.data());
        for (VkPhysicalDevice gpu : gpus)
        {
            VkPhysicalDeviceProperties props{};
            vkGetPhysicalDeviceProperties(gpu, &props);
            if (props.apiVersion < VK_API_VERSION_1_3) continue;

            VkPhysicalDeviceFeatures features{};
            vkGetPhysicalDeviceFeatures(gpu, &features);
            if (!features.vertexPipelineStoresAndAtomics) continue;

            QueueFamilies qf = find_queue_families(gpu);
            SwapchainSupport sc = query_swapchain_support(gpu);
            if (!qf.ok() || sc.formats.empty() || sc.modes.empty()) continue;
            if ((sc.caps.supportedUsageFlags & VK_IMAGE_USAGE_TRANSFER_DST_BIT) == 0) continue;
            if (!device_extension_supported(gpu, VK_KHR_SWAPCHAIN_EXTENSION_NAME)) continue;
            gpu_ = gpu;
            qf_ = qf;
            log_info(std::string("VulkanWindowCompositor: using ") + props.deviceName);
            return true;
        }
        return false;
    }

    bool VulkanWindowCompositor::create_device_and_queues()
    {
        float qprio = 1.0f;
        std::vector<uint32_t> fams{*qf_.graphics};
        if (*qf_.present != *qf_.graphics) fams.push_back(*qf_.present);
        std::vector<VkDeviceQueueCreateInfo> qcis{};
        for (uint32_t fam : fams)
        {
            VkDeviceQueueCreateInfo qci{};
            qci.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
            qci.queueFamilyIndex = fam;
            qci.queueCount = 1;
            qci.pQueuePriorities = &qprio;
            qcis.push_back(qci);
        }

        std::vector<const char*> device_exts{VK_KHR_SWAPCHAIN_EXTENSION_NAME};
        constexpr const char* kPortabilitySubsetExt = "VK_KHR_portability_subset";
        if (device_extension_supported(gpu_, kPortabilitySubsetExt))
        {
            device_exts.push_back(kPortabilitySubsetExt);
        }

        VkPhysicalDeviceVulkan12Features supported12{};
        supported12.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_2_FEATURES;
        VkPhysicalDeviceFeatures2 supported{};
        supported.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2;
        supported.pNext = &supported12;
        vkGetPhysicalDeviceFeatures2(gpu_, &supported);

        VkPhysicalDeviceVulkan12Features enabled12{};
        enabled12.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_2_FEATURES;
        enabled12.shaderOutputLayer = supported12.shaderOutputLayer;
        enabled12.shaderOutputViewportIndex = supported12.shaderOutputViewportIndex;
        VkPhysicalDeviceFeatures2 enabled{};
        enabled.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2;
        enabled.pNext = &enabled12;
        enabled.features.vertexPipelineStoresAndAtomics = VK_TRUE;
        enabled.features.multiViewport = supported.features.multiViewport;

        VkDeviceCreateInfo dci{};
        dci.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
        dci.pNext = &enabled;
        dci.queueCreateInfoCount = static_cast<uint32_t>(qcis.size());
        dci.pQueueCreateInfos = qcis.data();
        dci.enabledExtensionCount = static_cast<uint32_t>(device_exts.size());
        dci.ppEnabledExtensionNames = device_exts.data();
        dci.enabledLayerCount = static_cast<uint32_t>(layers_.size());
        dci.ppEnabledLayerNames = layers_.empty() ? nullptr : layers_.data();

        if (vkCreateDevice(gpu_, &dci, nullptr, &vk_device_) != VK_SUCCESS) return false;
        vkGetDeviceQueue(vk_device_, *qf_.graphics, 0, &graphics_q_);
        vkGetDeviceQueue(vk_device_, *qf_.present, 0, &present_q_);

        handles_.physical_device = gpu_;
        handles_.device = vk_device_;
        handles_.graphics_queue = graphics_q_;
        handles_.graphics_queue_family = *qf_.graphics;
        handles_.shader_output_layer = enabled12.shaderOutputLayer == VK_TRUE;
        handles_.shader_output_viewport_index = enabled12.shaderOutputViewportIndex == VK_TRUE;
        handles_.multi_viewport = enabled.features.multiViewport == VK_TRUE;
        return true;
    }

    void VulkanWindowCompositor::resolve_layout()
    {
        const RHIDeviceCaps& caps = device_->capabilities();
        if (layout_ == RenderLayout::Shared && !caps.supports_viewport_index_output)
        {
            log_warn("VulkanWindowCompositor: viewport index output unsupported, using dedicated layout");
            layout_ = RenderLayout::Dedicated;
        }
        if (layout_ == RenderLayout::Layered && !caps.supports_layered_rendering)
        {
            log_warn("VulkanWindowCompositor: layered rendering unsupported, using dedicated layout");
            layout_ = RenderLayout::Dedicated;
        }
    }

    VkSurfaceFormatKHR VulkanWindowCompositor::choose_surface_format(const std::vector<VkSurfaceFormatKHR>& formats) const
    {
        for (const auto& f : formats)
        {
            if (f.format == VK_FORMAT_B8G8R8A8_SRGB && f.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR) return f;
        }
        for (const auto& f : formats)
        {
            if (f.format == VK_FORMAT_B8G8R8A8_UNORM && f.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR) return f;
        }
        return formats.empty() ? VkSurfaceFormatKHR{} : formats[0];
    }

    VkPresentModeKHR VulkanWindowCompositor::choose_present_mode(const std::vector<VkPresentModeKHR>& modes) const
    {
        VkPresentModeKHR wanted = VK_PRESENT_MODE_FIFO_KHR;
        if (desc_.present_mode == PresentModePreference::Mailbox) wanted = VK_PRESENT_MODE_MAILBOX_KHR;
        if (desc_.present_mode == PresentModePreference::Immediate) wanted = VK_PRESENT_MODE_IMMEDIATE_KHR;
        for (const auto& m : modes)
        {
            if (m == wanted) return m;
        }
        return VK_PRESENT_MODE_FIFO_KHR;
    }

    VkExtent2D VulkanWindowCompositor::choose_extent(const VkSurfaceCapabilitiesKHR& caps) const
    {
        if (caps.currentExtent.width != UINT32_MAX) return caps.currentExtent;

        const int w = requested_width_.load();
        const int h = requested_height_.load();
        VkExtent2D out{};
        out.width = std::clamp((uint32_t)std::max(w, 1), caps.minImageExtent.width, caps.maxImageExtent.width);
        out.height = std::clamp((uint32_t)std::max(h, 1), caps.minImageExtent.height, caps.maxImageExtent.height);
        return out;
    }

    bool VulkanWindowCompositor::create_swapchain()
    {
        SwapchainSupport sc = query_swapchain_support(gpu_);
        if (sc.formats.empty() || sc.modes.empty()) return false;
        const VkSurfaceFormatKHR sf = choose_surface_format(sc.formats);
        const VkPresentModeKHR pm = choose_present_mode(sc.modes);
        const VkExtent2D extent = choose_extent(sc.caps);
        if (extent.width == 0 || extent.height == 0) return false;

        uint32_t img_count = sc.caps.minImageCount + 1;
        if (sc.caps.maxImageCount > 0 && img_count > sc.caps.maxImageCount) img_count = sc.caps.maxImageCount;

        const uint32_t qidx[] = {*qf_.graphics, *qf_.present};
        VkSwapchainCreateInfoKHR sci{};
        sci.sType = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR;
        sci.surface = surface_;
        sci.minImageCount = img_count;
        sci.imageFormat = sf.format;
        sci.imageColorSpace = sf.colorSpace;
        sci.imageExtent = extent;
        sci.imageArrayLayers = 1;
        // Eyes are blitted in; nothing renders into the swapchain directly.
        sci.imageUsage = VK_IMAGE_USAGE_TRANSFER_DST_BIT;
        if (*qf_.graphics != *qf_.present)
        {
            sci.imageSharingMode = VK_SHARING_MODE_CONCURRENT;
            sci.queueFamilyIndexCount = 2;
            sci.pQueueFamilyIndices = qidx;
        }
        else
        {
            sci.imageSharingMode = VK_SHARING_MODE_EXCLUSIVE;
        }
        sci.preTransform = sc.caps.currentTransform;
        sci.compositeAlpha = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
        sci.presentMode = pm;
        sci.clipped = VK_TRUE;
        sci.oldSwapchain = VK_NULL_HANDLE;
        if (vkCreateSwapchainKHR(vk_device_, &sci, nullptr, &swapchain_) != VK_SUCCESS) return false;

        extent_ = extent;
        swapchain_format_ = sf.format;
        target_format_ = rhi_format_from_vk(sf.format);
        if (target_format_ == RHIFormat::Unknown) target_format_ = RHIFormat::BGRA8_UNorm;

        uint32_t nimg = 0;
        if (vkGetSwapchainImagesKHR(vk_device_, swapchain_, &nimg, nullptr) != VK_SUCCESS || nimg == 0) return false;
        images_.resize(nimg);
        return vkGetSwapchainImagesKHR(vk_device_, swapchain_, &nimg, images_.data()) == VK_SUCCESS;
    }

    bool VulkanWindowCompositor::create_frame_slots()
    {
        VkCommandPoolCreateInfo cp{};
        cp.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
        cp.flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
        cp.queueFamilyIndex = *qf_.graphics;
        if (vkCreateCommandPool(vk_device_, &cp, nullptr, &cmd_pool_) != VK_SUCCESS) return false;

        VkSemaphoreCreateInfo sem{};
        sem.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;
        VkFenceCreateInfo fe{};
        fe.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
        fe.flags = VK_FENCE_CREATE_SIGNALED_BIT;

        for (FrameSlot& slot : slots_)
        {
            VkCommandBufferAllocateInfo cba{};
            cba.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
            cba.commandPool = cmd_pool_;
            cba.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
            cba.commandBufferCount = 1;
            if (vkAllocateCommandBuffers(vk_device_, &cba, &slot.cmd) != VK_SUCCESS) return false;
            if (vkCreateSemaphore(vk_device_, &sem, nullptr, &slot.image_available) != VK_SUCCESS) return false;
            if (vkCreateSemaphore(vk_device_, &sem, nullptr, &slot.render_finished) != VK_SUCCESS) return false;
            if (vkCreateFence(vk_device_, &fe, nullptr, &slot.in_flight) != VK_SUCCESS) return false;
        }
        return true;
    }

    void VulkanWindowCompositor::create_eye_targets()
    {
        const uint32_t w = eye_width();
        const uint32_t h = std::max(1u, extent_.height);

        RHIImageDesc color{};
        color.format = target_format_;
        color.usage = RHIImageUsage_ColorAttachment;
        RHIImageDesc depth{};
        depth.format = RHIFormat::D32F;
        depth.usage = RHIImageUsage_DepthStencilAttachment;

        uint32_t pass_count = 1;
        switch (layout_)
        {
            case RenderLayout::Dedicated:
                color.width = w;
                color.height = h;
                pass_count = kEyeCount;
                break;
            case RenderLayout::Shared:
                color.width = w * kEyeCount;
                color.height = h;
                break;
            case RenderLayout::Layered:
                color.width = w;
                color.height = h;
                color.array_length = kEyeCount;
                break;
        }
        depth.width = color.width;
        depth.height = color.height;
        depth.array_length = color.array_length;

        for (uint32_t s = 0; s < kMaxFramesInFlight; ++s)
        {
            FrameSlot& slot = slots_[s];
            slot.color_targets.clear();
            slot.depth_targets.clear();
            for (uint32_t i = 0; i < pass_count; ++i)
            {
                color.label = "Eye Color Target " + std::to_string(s) + "." + std::to_string(i);
                depth.label = "Eye Depth Target " + std::to_string(s) + "." + std::to_string(i);
                slot.color_targets.push_back(device_->create_image(color));
                slot.depth_targets.push_back(device_->create_image(depth));
            }
        }
    }

    void VulkanWindowCompositor::destroy_swapchain_objects()
    {
        for (FrameSlot& slot : slots_)
        {
            slot.color_targets.clear();
            slot.depth_targets.clear();
        }
        images_.clear();
        if (swapchain_ != VK_NULL_HANDLE)
        {
            vkDestroySwapchainKHR(vk_device_, swapchain_, nullptr);
            swapchain_ = VK_NULL_HANDLE;
        }
    }

    bool VulkanWindowCompositor::recreate_swapchain()
    {
        if (vk_device_ == VK_NULL_HANDLE) return false;
        if (requested_width_.load() <= 0 || requested_height_.load() <= 0) return false;
        device_->wait_idle();
        destroy_swapchain_objects();
        if (!create_swapchain()) return false;
        create_eye_targets();
        resize_pending_.store(false);
        swapchain_needs_rebuild_ = false;
        return true;
    }

    void VulkanWindowCompositor::shutdown()
    {
        state_.store(CompositorState::Invalidated);
        if (device_)
        {
            device_->wait_idle();
            destroy_swapchain_objects();
            device_.reset();
        }
        if (vk_device_ != VK_NULL_HANDLE)
        {
            vkDeviceWaitIdle(vk_device_);
            destroy_swapchain_objects();
            for (FrameSlot& slot : slots_)
            {
                if (slot.image_available != VK_NULL_HANDLE) vkDestroySemaphore(vk_device_, slot.image_available, nullptr);
                if (slot.render_finished != VK_NULL_HANDLE) vkDestroySemaphore(vk_device_, slot.render_finished, nullptr);
                if (slot.in_flight != VK_NULL_HANDLE) vkDestroyFence(vk_device_, slot.in_flight, nullptr);
                slot = FrameSlot{};
            }
            if (cmd_pool_ != VK_NULL_HANDLE)
            {
                vkDestroyCommandPool(vk_device_, cmd_pool_, nullptr);
                cmd_pool_ = VK_NULL_HANDLE;
            }
            vkDestroyDevice(vk_device_, nullptr);
            vk_device_ = VK_NULL_HANDLE;
        }
        if (surface_ != VK_NULL_HANDLE)
        {
            vkDestroySurfaceKHR(instance_, surface_, nullptr);
            surface_ = VK_NULL_HANDLE;
        }
        if (debug_messenger_ != VK_NULL_HANDLE)
        {
            auto destroy_fn = (PFN_vkDestroyDebugUtilsMessengerEXT)vkGetInstanceProcAddr(instance_, "vkDestroyDebugUtilsMessengerEXT");
            if (destroy_fn) destroy_fn(instance_, debug_messenger_, nullptr);
            debug_messenger_ = VK_NULL_HANDLE;
        }
        if (instance_ != VK_NULL_HANDLE)
        {
            vkDestroyInstance(instance_, nullptr);
            instance_ = VK_NULL_HANDLE;
        }
        qf_ = QueueFamilies{};
        gpu_ = VK_NULL_HANDLE;
        graphics_q_ = VK_NULL_HANDLE;
        present_q_ = VK_NULL_HANDLE;
        handles_ = VulkanDeviceHandles{};
        layers_.clear();
    }

    void VulkanWindowCompositor::set_paused(bool paused)
    {
        CompositorState expected = paused ? CompositorState::Running : CompositorState::Paused;
        state_.compare_exchange_strong(expected, paused ? CompositorState::Paused : CompositorState::Running);
    }

    void VulkanWindowCompositor::request_resize(int w, int h)
    {
        if (w > 0 && h > 0)
        {
            requested_width_.store(w);
            requested_height_.store(h);
        }
        resize_pending_.store(true);
    }

    void VulkanWindowCompositor::set_head_pose(const Transform& head)
    {
        std::lock_guard<std::mutex> lock(head_mutex_);
        head_ = head;
    }

    Transform VulkanWindowCompositor::head_pose() const
    {
        std::lock_guard<std::mutex> lock(head_mutex_);
        return head_;
    }

    Transform VulkanWindowCompositor::eye_pose(const Transform& head, uint32_t eye)
    {
        const float side = eye == 0 ? -0.5f : 0.5f;
        Transform out = head;
        out.position = head.position + head.right() * (side * kInterpupillaryDistance);
        return out;
    }

    FrameViews VulkanWindowCompositor::build_views() const
    {
        const Transform head = head_pose();
        const float w = (float)eye_width();
        const float h = (float)std::max(1u, extent_.height);

        FrameViews views{};
        for (uint32_t eye = 0; eye < kEyeCount; ++eye)
        {
            const Transform pose = eye_pose(head, eye);
            views.view_matrices.push_back(view_matrix_from(pose));
            views.projection_matrices.push_back(camera_.projection(w / h));
            views.camera_positions.push_back(pose.position);

            RHIViewport vp{};
            vp.x = layout_ == RenderLayout::Shared ? w * (float)eye : 0.0f;
            vp.width = w;
            vp.height = h;
            views.viewports.push_back(vp);
        }
        return views;
    }

    Ray VulkanWindowCompositor::ray_from_window_point(float x, float y) const
    {
        const float win_w = (float)std::max(1, requested_width_.load());
        const float win_h = (float)std::max(1, requested_height_.load());
        const float half = win_w * 0.5f;
        const uint32_t eye = x < half ? 0u : 1u;
        const float local_x = eye == 0 ? x : x - half;

        const glm::vec2 ndc(2.0f * (local_x / half) - 1.0f, 1.0f - 2.0f * (y / win_h));
        const Transform pose = eye_pose(head_pose(), eye);
        const glm::mat4 inv = glm::inverse(camera_.projection(half / win_h) * view_matrix_from(pose));

        // Reversed-Z: ndc depth 1 is the near plane, smaller values lie farther away.
        glm::vec4 near_p = inv * glm::vec4(ndc, 1.0f, 1.0f);
        glm::vec4 far_p = inv * glm::vec4(ndc, 0.5f, 1.0f);
        near_p /= near_p.w;
        far_p /= far_p.w;

        Ray ray{};
        ray.origin = pose.position;
        ray.direction = glm::normalize(glm::vec3(far_p) - glm::vec3(near_p));
        return ray;
    }

    std::optional<CompositorFrame> VulkanWindowCompositor::next_frame()
    {
        if (!device_ || state_.load() != CompositorState::Running) return std::nullopt;
        if (resize_pending_.load() || swapchain_needs_rebuild_)
        {
            if (!recreate_swapchain()) return std::nullopt;
        }
        if (swapchain_ == VK_NULL_HANDLE) return std::nullopt;

        FrameSlot& slot = slots_.at_frame(frame_index_);
        const VkResult wait_res = vkWaitForFences(vk_device_, 1, &slot.in_flight, VK_TRUE, UINT64_MAX);
        if (wait_res != VK_SUCCESS)
        {
            throw GpuResourceError(ResourceError::InvalidState, "vkWaitForFences returned " + std::to_string((int)wait_res));
        }

        uint32_t image_index = 0;
        const VkResult res = vkAcquireNextImageKHR(vk_device_, swapchain_, UINT64_MAX, slot.image_available, VK_NULL_HANDLE, &image_index);
        if (res == VK_ERROR_OUT_OF_DATE_KHR || res == VK_ERROR_SURFACE_LOST_KHR)
        {
            swapchain_needs_rebuild_ = true;
            return std::nullopt;
        }
        if (res == VK_SUBOPTIMAL_KHR)
        {
            swapchain_needs_rebuild_ = true;
        }
        else if (res != VK_SUCCESS)
        {
            throw GpuResourceError(ResourceError::InvalidState, "vkAcquireNextImageKHR returned " + std::to_string((int)res));
        }
        acquired_image_ = image_index;

        if (vkResetFences(vk_device_, 1, &slot.in_flight) != VK_SUCCESS ||
            vkResetCommandBuffer(slot.cmd, 0) != VK_SUCCESS)
        {
            throw GpuResourceError(ResourceError::InvalidState, "frame slot reset failed");
        }
        VkCommandBufferBeginInfo bi{};
        bi.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
        bi.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
        if (vkBeginCommandBuffer(slot.cmd, &bi) != VK_SUCCESS)
        {
            throw GpuResourceError(ResourceError::InvalidState, "vkBeginCommandBuffer failed");
        }

        device_->begin_frame(frame_index_);

        CompositorFrame frame{};
        frame.index = frame_index_;
        frame.predicted_presentation_time =
            (double)(SDL_GetPerformanceCounter() - perf_origin_) / (double)SDL_GetPerformanceFrequency() + kPredictedLatencySeconds;
        frame.views = build_views();
        frame.targets.color_textures = slot.color_targets;
        frame.targets.depth_textures = slot.depth_targets;
        frame.targets.store_depth = false;

        const VkSemaphore wait_sem = slot.image_available;
        const VkSemaphore signal_sem = slot.render_finished;
        const VkFence fence = slot.in_flight;
        VulkanGpuDevice* device = device_.get();
        frame.command_buffer = device_->wrap_command_buffer(slot.cmd, [device, wait_sem, signal_sem, fence](VkCommandBuffer cmd) {
            const VkPipelineStageFlags wait_stage = VK_PIPELINE_STAGE_TRANSFER_BIT;
            VkSubmitInfo si{};
            si.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
            si.waitSemaphoreCount = 1;
            si.pWaitSemaphores = &wait_sem;
            si.pWaitDstStageMask = &wait_stage;
            si.commandBufferCount = 1;
            si.pCommandBuffers = &cmd;
            si.signalSemaphoreCount = 1;
            si.pSignalSemaphores = &signal_sem;
            const VkResult submit_res = device->queue_submit(si, fence);
            if (submit_res != VK_SUCCESS)
            {
                throw GpuResourceError(ResourceError::InvalidState, "vkQueueSubmit returned " + std::to_string((int)submit_res));
            }
        });
        return frame;
    }

    void VulkanWindowCompositor::record_blit(VkCommandBuffer cmd, const FrameSlot& slot, VkImage swapchain_image) const
    {
        const int32_t w = (int32_t)eye_width();
        const int32_t h = (int32_t)extent_.height;

        for (const auto& target : slot.color_targets)
        {
            vk_cmd_image_barrier(
                cmd,
                static_cast<const VulkanImage*>(target.get())->handle(),
                VK_IMAGE_ASPECT_COLOR_BIT,
                target->array_length(),
                VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL,
                VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL,
                VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT,
                VK_ACCESS_TRANSFER_READ_BIT,
                VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT,
                VK_PIPELINE_STAGE_TRANSFER_BIT);
        }
        vk_cmd_image_barrier(
            cmd,
            swapchain_image,
            VK_IMAGE_ASPECT_COLOR_BIT,
            1,
            VK_IMAGE_LAYOUT_UNDEFINED,
            VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
            0,
            VK_ACCESS_TRANSFER_WRITE_BIT,
            VK_PIPELINE_STAGE_TRANSFER_BIT,
            VK_PIPELINE_STAGE_TRANSFER_BIT);

        for (uint32_t eye = 0; eye < kEyeCount; ++eye)
        {
            const size_t target_index = layout_ == RenderLayout::Dedicated ? eye : 0;
            if (target_index >= slot.color_targets.size()) break;
            const auto* src = static_cast<const VulkanImage*>(slot.color_targets[target_index].get());

            VkImageBlit region{};
            region.srcSubresource.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
            region.srcSubresource.layerCount = 1;
            region.srcSubresource.baseArrayLayer = layout_ == RenderLayout::Layered ? eye : 0;
            const int32_t src_x = layout_ == RenderLayout::Shared ? w * (int32_t)eye : 0;
            region.srcOffsets[0] = {src_x, 0, 0};
            region.srcOffsets[1] = {src_x + w, h, 1};
            region.dstSubresource.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
            region.dstSubresource.layerCount = 1;
            region.dstOffsets[0] = {w * (int32_t)eye, 0, 0};
            region.dstOffsets[1] = {w * (int32_t)(eye + 1), h, 1};
            vkCmdBlitImage(
                cmd,
                src->handle(),
                VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL,
                swapchain_image,
                VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
                1,
                &region,
                VK_FILTER_NEAREST);
        }

        vk_cmd_image_barrier(
            cmd,
            swapchain_image,
            VK_IMAGE_ASPECT_COLOR_BIT,
            1,
            VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
            VK_IMAGE_LAYOUT_PRESENT_SRC_KHR,
            VK_ACCESS_TRANSFER_WRITE_BIT,
            0,
            VK_PIPELINE_STAGE_TRANSFER_BIT,
            VK_PIPELINE_STAGE_BOTTOM_OF_PIPE_BIT);
    }

    void VulkanWindowCompositor::present(CompositorFrame& frame)
    {
        if (!frame.command_buffer || acquired_image_ >= images_.size()) return;
        FrameSlot& slot = slots_.at_frame(frame.index);

        record_blit(slot.cmd, slot, images_[acquired_image_]);
        frame.command_buffer->commit();
        frame.command_buffer.reset();

        VkPresentInfoKHR pi{};
        pi.sType = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
        pi.waitSemaphoreCount = 1;
        pi.pWaitSemaphores = &slot.render_finished;
        pi.swapchainCount = 1;
        pi.pSwapchains = &swapchain_;
        pi.pImageIndices = &acquired_image_;

        VkResult pres = VK_SUCCESS;
        {
            std::lock_guard<std::mutex> lock(device_->queue_mutex());
            pres = vkQueuePresentKHR(present_q_, &pi);
        }
        ++frame_index_;
        if (pres == VK_ERROR_OUT_OF_DATE_KHR || pres == VK_SUBOPTIMAL_KHR || pres == VK_ERROR_SURFACE_LOST_KHR)
        {
            swapchain_needs_rebuild_ = true;
        }
        else if (pres != VK_SUCCESS)
        {
            throw GpuResourceError(ResourceError::InvalidState, "vkQueuePresentKHR returned " + std::to_string((int)pres));
        }
    }
}
