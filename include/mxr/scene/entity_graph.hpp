#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: entity_graph.hpp
    MODULE: scene
    PURPOSE: Arena-backed entity tree. Nodes are addressed by generation-checked handles;
            children are owned index lists and the parent is a non-owning back-index.
            World transforms are folded top-down on every read, never cached.
*/


#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mxr/math/transform.hpp"
#include "mxr/physics/physics_body.hpp"

namespace mxr
{
    class Mesh;
    class Skinner;
    class EntityGraph;

    struct EntityId
    {
        uint32_t index = 0xffffffffu;
        uint32_t generation = 0;

        bool valid() const { return index != 0xffffffffu; }
        bool operator==(const EntityId&) const = default;
    };

    inline constexpr EntityId kNullEntity{};

    // Per-node hook run once per scene tick.
    class IEntityBehavior
    {
    public:
        virtual ~IEntityBehavior() = default;
        virtual void update(EntityGraph& graph, EntityId self, double dt) = 0;
    };

    // Told about subtrees entering or leaving the part of the tree reachable from the root.
    class IGraphObserver
    {
    public:
        virtual ~IGraphObserver() = default;
        virtual void did_attach(EntityGraph& graph, EntityId subtree_root) = 0;
        virtual void did_detach(EntityGraph& graph, EntityId subtree_root) = 0;
    };

    struct EntityNode
    {
        std::string name{};
        Transform model_transform{};
        EntityId parent{};
        std::vector<EntityId> children{};
        std::shared_ptr<Mesh> mesh{};
        // Shared between clones, like the mesh.
        std::shared_ptr<Skinner> skinner{};
        std::optional<PhysicsBody> physics_body{};
        bool hidden = false;
        std::shared_ptr<IEntityBehavior> behavior{};
    };

    class EntityGraph
    {
    public:
        EntityGraph();

        EntityGraph(const EntityGraph&) = delete;
        EntityGraph& operator=(const EntityGraph&) = delete;

        EntityId root() const { return root_; }

        // New detached node.
        EntityId create(const std::string& name = {}, const Transform& transform = {});
        bool alive(EntityId id) const;
        size_t size() const { return live_count_; }

        EntityNode* get(EntityId id);
        const EntityNode* get(EntityId id) const;
        // Throws std::out_of_range for dead or null handles.
        EntityNode& node(EntityId id);
        const EntityNode& node(EntityId id) const;

        // Moves `child` under `parent`, detaching it from any previous parent first.
        // Rejects dead handles, the root, self-parenting and cycles.
        bool add_child(EntityId parent, EntityId child);
        void remove_from_parent(EntityId child);
        // Detaches and frees the node and its whole subtree.
        void destroy(EntityId id);

        // New identities for the copied nodes; physics bodies are never copied.
        EntityId clone_subtree(EntityId id, bool recursive = true);

        void visit_breadth_first(EntityId start, const std::function<void(EntityId)>& fn) const;
        std::vector<EntityId> flattened(EntityId start) const;
        // Breadth-first, skipping hidden nodes together with their descendants.
        std::vector<EntityId> visible_flattened(EntityId start) const;

        // Immediate children first, then (optionally) deeper levels.
        std::optional<EntityId> find_child_by_name(EntityId start, const std::string& name, bool recursive = true) const;
        // Descendants matching the predicate, excluding `start` itself.
        std::vector<EntityId> collect_matching(EntityId start, const std::function<bool(const EntityNode&)>& predicate) const;

        bool is_attached(EntityId id) const;
        bool is_ancestor(EntityId ancestor, EntityId id) const;
        bool is_visible(EntityId id) const;

        Transform world_transform(EntityId id) const;
        glm::mat4 world_matrix(EntityId id) const;
        // Back-solves the local transform against the current parent chain.
        void set_world_transform(EntityId id, const Transform& world);

        // Convex-hull bodies from each node's mesh.
        void generate_collision_shapes(EntityId start, bool recursive, BodyMode mode);

        void set_observer(IGraphObserver* observer) { observer_ = observer; }

    private:
        struct Slot
        {
            EntityNode node{};
            uint32_t generation = 0;
            bool alive = false;
        };

        void free_subtree(EntityId id);

        std::vector<Slot> slots_{};
        std::vector<uint32_t> free_list_{};
        size_t live_count_ = 0;
        EntityId root_{};
        IGraphObserver* observer_ = nullptr;
    };
}

template<>
struct std::hash<mxr::EntityId>
{
    size_t operator()(const mxr::EntityId& id) const noexcept
    {
        return (size_t)(((uint64_t)id.generation << 32) | id.index);
    }
};
