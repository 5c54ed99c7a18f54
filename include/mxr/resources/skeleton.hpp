#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: skeleton.hpp
    MODULE: resources
    PURPOSE: Skeleton (joint paths, inverse-bind and rest poses) and the Skinner
            binding a base mesh to the current joint poses.
*/


#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

#include "mxr/core/log.hpp"

namespace mxr
{
    class Mesh;

    struct Skeleton
    {
        std::string name{};
        std::vector<std::string> joint_paths{};
        std::vector<glm::mat4> inverse_bind_transforms{};
        std::vector<glm::mat4> rest_transforms{};

        size_t joint_count() const { return joint_paths.size(); }
    };

    class Skinner
    {
    public:
        Skinner(std::shared_ptr<const Skeleton> skeleton, std::shared_ptr<const Mesh> base_mesh)
            : skeleton_(std::move(skeleton))
            , base_mesh_(std::move(base_mesh))
        {
            if (skeleton_) joint_transforms_ = skeleton_->rest_transforms;
        }

        const Skeleton& skeleton() const { return *skeleton_; }
        const std::shared_ptr<const Mesh>& base_mesh() const { return base_mesh_; }
        const std::vector<glm::mat4>& joint_transforms() const { return joint_transforms_; }

        // Rejects pose arrays whose length differs from the joint count.
        bool set_joint_transforms(std::vector<glm::mat4> transforms)
        {
            if (transforms.size() != skeleton_->joint_count())
            {
                log_warn("Skinner '" + skeleton_->name + "' expected " + std::to_string(skeleton_->joint_count()) +
                         " joint transforms, got " + std::to_string(transforms.size()));
                return false;
            }
            joint_transforms_ = std::move(transforms);
            dirty_ = true;
            return true;
        }

        // Joint pose times inverse bind, one matrix per joint.
        std::vector<glm::mat4> skinning_matrices() const
        {
            std::vector<glm::mat4> out(joint_transforms_.size(), glm::mat4(1.0f));
            for (size_t i = 0; i < joint_transforms_.size(); ++i)
            {
                const glm::mat4 inverse_bind = i < skeleton_->inverse_bind_transforms.size()
                    ? skeleton_->inverse_bind_transforms[i]
                    : glm::mat4(1.0f);
                out[i] = joint_transforms_[i] * inverse_bind;
            }
            return out;
        }

        bool dirty() const { return dirty_; }
        void clear_dirty() { dirty_ = false; }
        void mark_dirty() { dirty_ = true; }

    private:
        std::shared_ptr<const Skeleton> skeleton_{};
        std::shared_ptr<const Mesh> base_mesh_{};
        std::vector<glm::mat4> joint_transforms_{};
        bool dirty_ = true;
    };
}
