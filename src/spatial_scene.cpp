#include "mxr/scene/spatial_scene.hpp"

#include <algorithm>
#include <string>

#include <glm/gtc/constants.hpp>
#include <glm/gtc/quaternion.hpp>

#include "mxr/core/log.hpp"
#include "mxr/resources/mesh.hpp"

namespace mxr
{
    namespace
    {
        PhysicsBody static_concave_body(const std::shared_ptr<Mesh>& mesh)
        {
            PhysicsBody body{};
            body.mode = BodyMode::Static;
            body.shape = ConcaveMeshShape{mesh};
            body.filter.group = CollisionGroupSceneUnderstanding;
            return body;
        }

        std::string anchor_name(const char* prefix, AnchorId id)
        {
            return std::string(prefix) + " " + std::to_string(id);
        }
    }

    void SpinBehavior::update(EntityGraph& graph, EntityId self, double dt)
    {
        EntityNode* n = graph.get(self);
        if (!n) return;
        const glm::quat step = glm::angleAxis(rate_ * (float)dt, glm::vec3(0.0f, 1.0f, 0.0f));
        n->model_transform.rotation = glm::normalize(step * n->model_transform.rotation);
    }

    SpatialScene::SpatialScene(Context& ctx, IPhysicsWorld& physics_world, ISpatialSession& session)
        : ctx_(ctx)
        , session_(session)
        , bridge_(physics_world)
        , prototype_rng_(ctx.config.scene.block_seed)
    {
        graph_.set_observer(this);

        StateMachine<ScenePhase, SpatialScene>::StateCallbacks playing{};
        playing.on_enter = [](SpatialScene& scene, ScenePhase) {
            const EntityNode* surface = scene.graph_.get(scene.selected_surface_);
            log_info("SpatialScene: transitioned to playing with selected surface '" +
                     (surface ? surface->name : std::string("<none>")) + "'");
            scene.clear_candidate_markers();
            scene.build_tower(scene.pending_placement_);
        };
        phases_.add_state(ScenePhase::SelectingPlacement);
        phases_.add_state(ScenePhase::Playing, std::move(playing));
        phases_.add_edge(ScenePhase::SelectingPlacement, ScenePhase::Playing);
        phases_.start(ScenePhase::SelectingPlacement, *this);

        make_scene();
    }

    SpatialScene::~SpatialScene()
    {
        graph_.set_observer(nullptr);
    }

    void SpatialScene::make_scene()
    {
        const SceneConfig& cfg = ctx_.config.scene;

        environment_material_ = Material::make_occlusion();

        Light sun(LightType::Directional, glm::vec3(1.0f), 1.0f);
        sun.transform.look(glm::vec3(0.0f), glm::vec3(0.1f, 1.0f, 0.1f), glm::vec3(0.0f, 1.0f, 0.0f));
        lights_.push_back(sun);

        for (Handedness h : {Handedness::Left, Handedness::Right})
        {
            auto rig = std::make_unique<HandRig>(graph_, ctx_.gpu(), h);
            const float side = h == Handedness::Right ? 0.15f : -0.15f;
            graph_.node(rig->node()).model_transform.position = glm::vec3(side, cfg.floor_level + 0.8f, -0.15f);
            // Untracked until the first hand event arrives.
            graph_.node(rig->node()).hidden = true;
            graph_.add_child(graph_.root(), rig->node());
            hands_.push_back(std::move(rig));
        }

        make_default_reticle();
        make_default_block_prototypes();

        if (cfg.create_ground_plane)
        {
            // Keeps blocks from falling forever when no surface has been reconstructed.
            const glm::vec3 floor_extents(10.0f, 0.02f, 10.0f);
            const EntityId ground = graph_.create("Ground Plane");
            EntityNode& n = graph_.node(ground);
            n.hidden = true;
            n.model_transform.position = glm::vec3(0.0f, cfg.floor_level - floor_extents.y * 0.5f, 0.0f);
            PhysicsBody body{};
            body.mode = BodyMode::Static;
            body.shape = BoxShape{floor_extents};
            n.physics_body = body;
            graph_.add_child(graph_.root(), ground);
        }
    }

    void SpatialScene::make_default_block_prototypes()
    {
        const glm::vec4 colors[3] = {
            {0.76f, 0.60f, 0.42f, 1.0f},
            {0.68f, 0.52f, 0.36f, 1.0f},
            {0.82f, 0.68f, 0.50f, 1.0f},
        };
        std::vector<EntityId> prototypes{};
        for (int i = 0; i < 3; ++i)
        {
            auto mesh = Mesh::generate_box(ctx_.gpu(), ctx_.config.scene.block_extents);
            mesh->materials = {Material::make_pbr(colors[i], 0.7f, false)};
            const EntityId proto = graph_.create("Block Prototype " + std::to_string(i));
            graph_.node(proto).mesh = mesh;
            prototypes.push_back(proto);
        }
        set_block_prototypes(std::move(prototypes));
    }

    void SpatialScene::make_default_reticle()
    {
        auto mesh = Mesh::generate_box(ctx_.gpu(), glm::vec3(0.12f, 0.002f, 0.12f));
        auto material = Material::make_pbr(glm::vec4(0.45f, 0.45f, 0.45f, 0.5f), 0.5f, false);
        material->name = "Reticle";
        material->blend_mode = RHIBlendMode::SourceOverPremultiplied;
        material->writes_depth = false;
        mesh->materials = {material};
        const EntityId reticle = graph_.create("Placement Reticle");
        graph_.node(reticle).mesh = mesh;
        set_reticle_prototype(reticle);
    }

    void SpatialScene::set_block_prototypes(std::vector<EntityId> prototypes)
    {
        for (EntityId old : block_prototypes_)
        {
            if (std::find(prototypes.begin(), prototypes.end(), old) == prototypes.end()) graph_.destroy(old);
        }
        block_prototypes_ = std::move(prototypes);
    }

    void SpatialScene::set_reticle_prototype(EntityId reticle)
    {
        if (reticle_prototype_.valid() && reticle_prototype_ != reticle) graph_.destroy(reticle_prototype_);
        reticle_prototype_ = reticle;
    }

    void SpatialScene::enqueue_event(SpatialEvent event)
    {
        events_.enqueue(std::move(event));
    }

    void SpatialScene::enqueue_events(std::vector<SpatialEvent> events)
    {
        events_.enqueue(std::move(events));
    }

    void SpatialScene::update(double dt)
    {
        for (const SpatialEvent& event : events_.drain_all())
        {
            dispatch(event);
        }

        for (EntityId e : entities())
        {
            const EntityNode* n = graph_.get(e);
            if (!n || !n->behavior) continue;
            const std::shared_ptr<IEntityBehavior> behavior = n->behavior;
            behavior->update(graph_, e, dt);
        }

        phases_.tick(*this, dt);

        bridge_.update(graph_, entities(), dt);
    }

    std::vector<EntityId> SpatialScene::entities() const
    {
        std::vector<EntityId> out = graph_.flattened(graph_.root());
        if (!out.empty()) out.erase(out.begin());
        return out;
    }

    ScenePhase SpatialScene::phase() const
    {
        return phases_.current_state().value_or(ScenePhase::SelectingPlacement);
    }

    HandRig* SpatialScene::hand(Handedness handedness)
    {
        for (auto& rig : hands_)
        {
            if (rig->handedness() == handedness) return rig.get();
        }
        return nullptr;
    }

    std::optional<EntityId> SpatialScene::world_anchor_entity(AnchorId id) const
    {
        auto it = world_anchor_entities_.find(id);
        if (it == world_anchor_entities_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<EntityId> SpatialScene::plane_entity(AnchorId id) const
    {
        auto it = plane_entities_.find(id);
        if (it == plane_entities_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<EntityId> SpatialScene::mesh_entity(AnchorId id) const
    {
        auto it = mesh_entities_.find(id);
        if (it == mesh_entities_.end()) return std::nullopt;
        return it->second;
    }

    bool SpatialScene::is_candidate_surface(EntityId entity) const
    {
        return candidate_surfaces_.count(entity) != 0;
    }

    std::optional<EntityId> SpatialScene::selected_surface() const
    {
        if (!selected_surface_.valid()) return std::nullopt;
        return selected_surface_;
    }

    std::optional<EntityId> SpatialScene::anchored_content_root() const
    {
        if (!graph_.alive(content_root_)) return std::nullopt;
        return content_root_;
    }

    std::vector<EntityId> SpatialScene::tower_blocks() const
    {
        if (!graph_.alive(content_root_)) return {};
        return graph_.collect_matching(content_root_, [](const EntityNode& n) {
            return n.name.rfind("Block ", 0) == 0;
        });
    }

    void SpatialScene::did_attach(EntityGraph& graph, EntityId subtree_root)
    {
        for (EntityId e : graph.flattened(subtree_root))
        {
            bridge_.add_entity(graph, e);
        }
    }

    void SpatialScene::did_detach(EntityGraph& graph, EntityId subtree_root)
    {
        for (EntityId e : graph.flattened(subtree_root))
        {
            bridge_.remove_entity(e);
        }
    }

    void SpatialScene::dispatch(const SpatialEvent& event)
    {
        std::visit(overloaded{
            [this](const WorldAnchorEvent& e) { handle_world_anchor(e); },
            [this](const PlaneAnchorEvent& e) { handle_plane_anchor(e); },
            [this](const MeshAnchorEvent& e) { handle_mesh_anchor(e); },
            [this](const HandAnchorEvent& e) { handle_hand_anchor(e); },
            [this](const EnvironmentLightEvent& e) { handle_environment_light(e); },
            [this](const SpatialInputEvent& e) { handle_spatial_input(e); }
        }, event);
    }

    void SpatialScene::handle_world_anchor(const WorldAnchorEvent& e)
    {
        auto it = world_anchor_entities_.find(e.anchor.id);
        switch (e.event)
        {
            case AnchorEvent::Added:
                if (it != world_anchor_entities_.end())
                {
                    graph_.set_world_transform(it->second, Transform(e.anchor.origin_from_anchor));
                }
                else
                {
                    const EntityId node = graph_.create(anchor_name("Anchor", e.anchor.id), Transform(e.anchor.origin_from_anchor));
                    world_anchor_entities_[e.anchor.id] = node;
                    graph_.add_child(graph_.root(), node);
                }
                break;
            case AnchorEvent::Updated:
                if (it != world_anchor_entities_.end())
                {
                    graph_.set_world_transform(it->second, Transform(e.anchor.origin_from_anchor));
                }
                break;
            case AnchorEvent::Removed:
                if (it != world_anchor_entities_.end())
                {
                    const EntityId node = it->second;
                    world_anchor_entities_.erase(it);
                    graph_.destroy(node);
                }
                break;
        }
    }

    EntityId SpatialScene::make_environment_node(
        const std::string& name,
        const glm::mat4& origin_from_anchor,
        const std::shared_ptr<Mesh>& mesh)
    {
        const EntityId node = graph_.create(name, Transform(origin_from_anchor));
        EntityNode& n = graph_.node(node);
        n.mesh = mesh;
        if (mesh)
        {
            mesh->materials = {environment_material_};
            n.physics_body = static_concave_body(mesh);
        }
        return node;
    }

    void SpatialScene::update_physics_shape_for_static_entity(EntityId entity)
    {
        bridge_.remove_entity(entity);
        EntityNode& n = graph_.node(entity);
        if (n.mesh)
        {
            n.physics_body = static_concave_body(n.mesh);
        }
        else
        {
            n.physics_body.reset();
        }
        if (graph_.is_attached(entity)) bridge_.add_entity(graph_, entity);
    }

    void SpatialScene::handle_plane_anchor(const PlaneAnchorEvent& e)
    {
        const PlaneAnchor& anchor = e.anchor;
        auto it = plane_entities_.find(anchor.id);
        const bool is_update = e.event == AnchorEvent::Updated || (e.event == AnchorEvent::Added && it != plane_entities_.end());

        if (e.event == AnchorEvent::Removed)
        {
            if (it == plane_entities_.end()) return;
            const EntityId node = it->second;
            plane_entities_.erase(it);
            candidate_surfaces_.erase(node);
            candidate_markers_.erase(node);
            graph_.destroy(node);
            return;
        }

        if (is_update)
        {
            if (it == plane_entities_.end()) return;
            const EntityId node = it->second;
            graph_.set_world_transform(node, Transform(anchor.origin_from_anchor));
            graph_.node(node).mesh = anchor.mesh;
            if (anchor.mesh) anchor.mesh->materials = {environment_material_};
            update_physics_shape_for_static_entity(node);
            return;
        }

        const EntityId node = make_environment_node(anchor_name("Plane", anchor.id), anchor.origin_from_anchor, anchor.mesh);
        plane_entities_[anchor.id] = node;
        if (phases_.in_state(ScenePhase::SelectingPlacement) &&
            anchor.classification == PlaneClassification::Table &&
            anchor.alignment == PlaneAlignment::Horizontal)
        {
            candidate_surfaces_.insert(node);
            add_candidate_marker(node);
        }
        graph_.add_child(graph_.root(), node);
    }

    void SpatialScene::handle_mesh_anchor(const MeshAnchorEvent& e)
    {
        const MeshAnchor& anchor = e.anchor;
        auto it = mesh_entities_.find(anchor.id);

        if (e.event == AnchorEvent::Removed)
        {
            if (it == mesh_entities_.end()) return;
            const EntityId node = it->second;
            mesh_entities_.erase(it);
            graph_.destroy(node);
            return;
        }

        if (e.event == AnchorEvent::Updated || it != mesh_entities_.end())
        {
            if (it == mesh_entities_.end()) return;
            const EntityId node = it->second;
            graph_.set_world_transform(node, Transform(anchor.origin_from_anchor));
            graph_.node(node).mesh = anchor.mesh;
            if (anchor.mesh) anchor.mesh->materials = {environment_material_};
            update_physics_shape_for_static_entity(node);
            return;
        }

        const EntityId node = make_environment_node(anchor_name("World Mesh", anchor.id), anchor.origin_from_anchor, anchor.mesh);
        mesh_entities_[anchor.id] = node;
        graph_.add_child(graph_.root(), node);
    }

    void SpatialScene::handle_hand_anchor(const HandAnchorEvent& e)
    {
        HandRig* rig = hand(e.anchor.handedness);
        if (!rig) return;

        switch (e.event)
        {
            case AnchorEvent::Added:
            case AnchorEvent::Updated:
                graph_.node(rig->node()).hidden = false;
                rig->update_pose(graph_, e.anchor);
                break;
            case AnchorEvent::Removed:
                graph_.node(rig->node()).hidden = true;
                break;
        }
    }

    void SpatialScene::handle_environment_light(const EnvironmentLightEvent& e)
    {
        switch (e.event)
        {
            case AnchorEvent::Added:
            case AnchorEvent::Updated:
                // Estimates without a cube map carry nothing worth switching to.
                if (e.anchor.light.texture) environment_light_ = e.anchor.light;
                break;
            case AnchorEvent::Removed:
                // Probes come and go as the device moves; stale lighting beats none.
                break;
        }
    }

    void SpatialScene::handle_spatial_input(const SpatialInputEvent& e)
    {
        switch (e.phase)
        {
            case InputPhase::Active:
            case InputPhase::Cancelled:
                return;
            case InputPhase::Ended:
                break;
        }
        if (!e.selection_ray) return;
        if (!phases_.in_state(ScenePhase::SelectingPlacement)) return;

        const glm::vec3 origin = e.selection_ray->origin;
        glm::vec3 direction = e.selection_ray->direction;
        const float len = glm::length(direction);
        if (len <= 1e-6f) return;
        direction /= len;

        // Blocks, hands and the ground never occlude a detected surface.
        std::vector<EntityHit> hits = bridge_.hit_test_with_segment(
            origin,
            origin + direction * ctx_.config.scene.hit_test_segment_length,
            CollisionGroupSceneUnderstanding);
        std::stable_sort(hits.begin(), hits.end(), [&origin](const EntityHit& a, const EntityHit& b) {
            return glm::length(a.world_position - origin) < glm::length(b.world_position - origin);
        });

        for (const EntityHit& hit : hits)
        {
            if (!hit.entity.valid() || !is_candidate_surface(hit.entity)) continue;
            select_surface_for_placement(hit.entity, Transform(hit.world_position, glm::quat(1.0f, 0.0f, 0.0f, 0.0f)));
            break;
        }
    }

    void SpatialScene::add_candidate_marker(EntityId surface)
    {
        if (!graph_.alive(reticle_prototype_)) return;
        const EntityId pivot = graph_.create("Reticle Pivot", Transform(glm::vec3(0.0f, 0.005f, 0.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f)));
        const EntityId reticle = graph_.clone_subtree(reticle_prototype_, false);
        graph_.node(reticle).behavior = std::make_shared<SpinBehavior>(0.5f);
        graph_.add_child(pivot, reticle);
        graph_.add_child(surface, pivot);
        candidate_markers_[surface] = pivot;
    }

    void SpatialScene::clear_candidate_markers()
    {
        for (const auto& [surface, pivot] : candidate_markers_)
        {
            graph_.destroy(pivot);
        }
        candidate_markers_.clear();
    }

    void SpatialScene::select_surface_for_placement(EntityId surface, const Transform& pose)
    {
        selected_surface_ = surface;
        pending_placement_ = pose;
        phases_.transition_to(ScenePhase::Playing, *this);
    }

    void SpatialScene::build_tower(const Transform& pose)
    {
        const SceneConfig& cfg = ctx_.config.scene;

        const EntityNode* first = block_prototypes_.empty() ? nullptr : graph_.get(block_prototypes_.front());
        if (!first || !first->mesh)
        {
            log_error("SpatialScene: no block prototypes; cannot construct tower");
            return;
        }
        const glm::vec3 block_size = first->mesh->bounds().size();

        session_.remove_all_world_anchors();
        EntityId tower{};
        auto anchor = session_.add_world_anchor(pose.matrix());
        if (anchor)
        {
            tower = graph_.create("Tower Anchor", pose);
            world_anchor_entities_[anchor.value] = tower;
        }
        else
        {
            log_warn("SpatialScene: could not create world anchor to place tower (" + anchor.error + "); using default placement");
            tower = graph_.create("Tower Anchor", Transform(cfg.fallback_anchor_position, glm::quat(1.0f, 0.0f, 0.0f, 0.0f)));
        }
        graph_.add_child(graph_.root(), tower);
        content_root_ = tower;

        const float width = block_size.x;
        const float height = block_size.y;
        const float depth = block_size.z;
        const Transform layer_rotation(glm::vec3(0.0f), glm::angleAxis(glm::half_pi<float>(), glm::vec3(0.0f, 1.0f, 0.0f)));
        std::uniform_int_distribution<size_t> pick(0, block_prototypes_.size() - 1);

        bool rotated = false;
        float y = height * 0.5f;
        uint32_t block_number = 0;
        for (uint32_t layer = 0; layer < cfg.tower_layers; ++layer)
        {
            const glm::vec3 positions[3] = {
                {0.0f, y, 0.0f},
                {0.0f, y, -depth - cfg.lateral_margin},
                {0.0f, y, depth + cfg.lateral_margin},
            };
            for (const glm::vec3& p : positions)
            {
                const EntityId block = graph_.clone_subtree(block_prototypes_[pick(prototype_rng_)], false);
                EntityNode& n = graph_.node(block);
                n.name = "Block " + std::to_string(block_number++);
                n.model_transform = Transform(p, glm::quat(1.0f, 0.0f, 0.0f, 0.0f));
                if (rotated) n.model_transform = layer_rotation * n.model_transform;
                PhysicsBody body{};
                body.mode = BodyMode::Dynamic;
                body.shape = BoxShape{glm::vec3(width, height, depth)};
                n.physics_body = body;
                graph_.add_child(tower, block);
            }
            y += height + cfg.vertical_margin;
            rotated = !rotated;
        }
        log_info("SpatialScene: built tower of " + std::to_string(block_number) + " blocks");
    }
}
