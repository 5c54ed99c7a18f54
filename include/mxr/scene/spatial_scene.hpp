#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: spatial_scene.hpp
    MODULE: scene
    PURPOSE: Scene orchestrator. Drains the event queue each tick, applies anchor add/update/remove
            policy per anchor kind, runs node behaviors and the physics step, and owns the
            one-way placement state machine (SelectingPlacement -> Playing) that builds the block tower.
*/


#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "mxr/core/context.hpp"
#include "mxr/core/event_queue.hpp"
#include "mxr/logic/state_machine.hpp"
#include "mxr/physics/physics_bridge.hpp"
#include "mxr/physics/physics_world.hpp"
#include "mxr/resources/material.hpp"
#include "mxr/scene/hand_rig.hpp"
#include "mxr/scene/scene_content.hpp"
#include "mxr/scene/spatial_event.hpp"
#include "mxr/scene/spatial_session.hpp"

namespace mxr
{
    enum class ScenePhase : uint8_t
    {
        SelectingPlacement = 0,
        Playing
    };

    inline const char* scene_phase_name(ScenePhase p)
    {
        return p == ScenePhase::SelectingPlacement ? "selecting-placement" : "playing";
    }

    // Slow spin applied to placement reticles.
    class SpinBehavior final : public IEntityBehavior
    {
    public:
        explicit SpinBehavior(float radians_per_second)
            : rate_(radians_per_second)
        {}

        void update(EntityGraph& graph, EntityId self, double dt) override;

    private:
        float rate_ = 0.0f;
    };

    class SpatialScene final : public ISceneContent, public ISpatialEventSink, private IGraphObserver
    {
    public:
        SpatialScene(Context& ctx, IPhysicsWorld& physics_world, ISpatialSession& session);
        ~SpatialScene() override;

        SpatialScene(const SpatialScene&) = delete;
        SpatialScene& operator=(const SpatialScene&) = delete;

        void enqueue_event(SpatialEvent event) override;
        void enqueue_events(std::vector<SpatialEvent> events) override;

        // One tick: drain events, run behaviors, step physics.
        void update(double dt);

        const EntityGraph& graph() const override { return graph_; }
        EntityGraph& graph() { return graph_; }
        std::vector<EntityId> entities() const override;
        const std::vector<Light>& lights() const override { return lights_; }
        const std::optional<EnvironmentLight>& environment_light() const override { return environment_light_; }

        ScenePhase phase() const;
        PhysicsBridge& physics() { return bridge_; }
        const PhysicsBridge& physics() const { return bridge_; }

        // Detached prototype nodes cloned into the tower. Replaces the generated defaults.
        void set_block_prototypes(std::vector<EntityId> prototypes);
        const std::vector<EntityId>& block_prototypes() const { return block_prototypes_; }
        // Detached node cloned (non-recursively) onto each candidate surface.
        void set_reticle_prototype(EntityId reticle);

        HandRig* hand(Handedness handedness);

        std::optional<EntityId> world_anchor_entity(AnchorId id) const;
        std::optional<EntityId> plane_entity(AnchorId id) const;
        std::optional<EntityId> mesh_entity(AnchorId id) const;
        bool is_candidate_surface(EntityId entity) const;
        size_t candidate_surface_count() const { return candidate_surfaces_.size(); }
        std::optional<EntityId> selected_surface() const;
        std::optional<EntityId> anchored_content_root() const;
        std::vector<EntityId> tower_blocks() const;
        size_t pending_event_count() const { return events_.size(); }

    private:
        void did_attach(EntityGraph& graph, EntityId subtree_root) override;
        void did_detach(EntityGraph& graph, EntityId subtree_root) override;

        void make_scene();
        void make_default_block_prototypes();
        void make_default_reticle();

        void dispatch(const SpatialEvent& event);
        void handle_world_anchor(const WorldAnchorEvent& e);
        void handle_plane_anchor(const PlaneAnchorEvent& e);
        void handle_mesh_anchor(const MeshAnchorEvent& e);
        void handle_hand_anchor(const HandAnchorEvent& e);
        void handle_environment_light(const EnvironmentLightEvent& e);
        void handle_spatial_input(const SpatialInputEvent& e);

        EntityId make_environment_node(const std::string& name, const glm::mat4& origin_from_anchor, const std::shared_ptr<Mesh>& mesh);
        void update_physics_shape_for_static_entity(EntityId entity);
        void add_candidate_marker(EntityId surface);
        void clear_candidate_markers();
        void select_surface_for_placement(EntityId surface, const Transform& pose);
        void build_tower(const Transform& pose);

        Context& ctx_;
        ISpatialSession& session_;
        EntityGraph graph_{};
        PhysicsBridge bridge_;
        LockingQueue<SpatialEvent> events_{};
        StateMachine<ScenePhase, SpatialScene> phases_{};

        std::vector<Light> lights_{};
        std::optional<EnvironmentLight> environment_light_{};
        std::shared_ptr<Material> environment_material_{};

        std::unordered_map<AnchorId, EntityId> world_anchor_entities_{};
        std::unordered_map<AnchorId, EntityId> plane_entities_{};
        std::unordered_map<AnchorId, EntityId> mesh_entities_{};
        std::unordered_set<EntityId> candidate_surfaces_{};
        // Candidate surface -> its reticle pivot.
        std::unordered_map<EntityId, EntityId> candidate_markers_{};
        std::vector<std::unique_ptr<HandRig>> hands_{};

        std::vector<EntityId> block_prototypes_{};
        EntityId reticle_prototype_{};
        EntityId selected_surface_{};
        EntityId content_root_{};
        Transform pending_placement_{};
        std::minstd_rand prototype_rng_{};
    };
}
