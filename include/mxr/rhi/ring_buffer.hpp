#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: ring_buffer.hpp
    MODULE: rhi
    PURPOSE: Ring-allocated scratch buffer for per-frame transient GPU data.
            Allocation wraps to offset zero when the tail cannot fit the request;
            data written earlier is treated as dead once the ring passes over it.
*/


#include <algorithm>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include "mxr/rhi/gpu_device.hpp"

namespace mxr
{
    inline uint64_t align_up(uint64_t value, uint64_t alignment)
    {
        if (alignment <= 1) return value;
        return ((value + alignment - 1) / alignment) * alignment;
    }

    class RingBuffer
    {
    public:
        RingBuffer(IGpuDevice& device, uint64_t length, const std::string& label, uint64_t min_alignment = 16)
            : length_(length)
            , min_alignment_(std::max<uint64_t>(1, min_alignment))
        {
            RHIBufferDesc desc{};
            desc.size_bytes = length;
            desc.usage = RHIBufferUsage_Storage;
            desc.memory = RHIMemoryClass::CPUVisible;
            desc.label = label;
            buffer_ = device.create_buffer(desc);
            if (!buffer_ || !buffer_->contents())
            {
                throw GpuResourceError(ResourceError::AllocationFailure, "ring buffer '" + label + "' is not host visible");
            }
        }

        // Returns the offset of a `length` byte region aligned to max(min_alignment, alignment).
        uint64_t alloc(uint64_t length, uint64_t alignment = 16)
        {
            if (length > length_)
            {
                throw GpuResourceError(
                    ResourceError::InvalidState,
                    "ring buffer '" + buffer_->label() + "' request of " + std::to_string(length) +
                    " bytes exceeds capacity " + std::to_string(length_));
            }
            const uint64_t align = std::max(min_alignment_, alignment);
            uint64_t offset = align_up(next_offset_, align);
            if (offset > length_ || length > length_ - offset)
            {
                offset = 0;
            }
            next_offset_ = offset + length;
            return offset;
        }

        uint64_t copy_bytes(const void* data, uint64_t length, uint64_t alignment = 16)
        {
            const uint64_t offset = alloc(length, alignment);
            std::memcpy(static_cast<uint8_t*>(buffer_->contents()) + offset, data, (size_t)length);
            return offset;
        }

        template<typename T>
        uint64_t copy(const T& value)
        {
            return copy_bytes(&value, sizeof(T), alignof(T) > 16 ? alignof(T) : 16);
        }

        // Copies the elements contiguously. An empty array allocates nothing and returns 0.
        template<typename T>
        uint64_t copy(const std::vector<T>& values)
        {
            if (values.empty()) return 0;
            return copy_bytes(values.data(), (uint64_t)(values.size() * sizeof(T)), alignof(T) > 16 ? alignof(T) : 16);
        }

        IGpuBuffer& buffer() { return *buffer_; }
        const IGpuBuffer& buffer() const { return *buffer_; }
        uint64_t length() const { return length_; }
        uint64_t next_offset() const { return next_offset_; }
        uint64_t min_alignment() const { return min_alignment_; }

    private:
        std::shared_ptr<IGpuBuffer> buffer_{};
        uint64_t length_ = 0;
        uint64_t min_alignment_ = 16;
        uint64_t next_offset_ = 0;
    };
}
