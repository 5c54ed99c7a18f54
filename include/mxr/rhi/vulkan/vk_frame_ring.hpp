#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: vk_frame_ring.hpp
    MODULE: rhi/vulkan
    PURPOSE: Frame-slot ownership ring. Per-slot state is reused once the slot's fence
            has been waited on, kMaxFramesInFlight frames later.
*/


#include <array>
#include <cstddef>
#include <cstdint>

namespace mxr
{
    inline constexpr uint32_t kMaxFramesInFlight = 2;

    inline uint32_t vk_frame_slot(uint64_t frame_index, uint32_t slot_count)
    {
        if (slot_count == 0u) return 0u;
        return static_cast<uint32_t>(frame_index % static_cast<uint64_t>(slot_count));
    }

    template <typename T, size_t SlotCount = kMaxFramesInFlight>
    class VkFrameRing final
    {
        static_assert(SlotCount > 0, "VkFrameRing requires SlotCount > 0");

    public:
        uint32_t slot_index(uint64_t frame_index) const
        {
            return vk_frame_slot(frame_index, static_cast<uint32_t>(SlotCount));
        }

        T& at_frame(uint64_t frame_index) { return slots_[slot_index(frame_index)]; }
        const T& at_frame(uint64_t frame_index) const { return slots_[slot_index(frame_index)]; }

        T& operator[](size_t idx) { return slots_[idx]; }
        const T& operator[](size_t idx) const { return slots_[idx]; }

        auto begin() noexcept { return slots_.begin(); }
        auto end() noexcept { return slots_.end(); }

    private:
        std::array<T, SlotCount> slots_{};
    };
}
