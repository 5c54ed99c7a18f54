#include "mxr/scene/entity_graph.hpp"

#include <algorithm>
#include <deque>
#include <stdexcept>

#include "mxr/resources/mesh.hpp"

namespace mxr
{
    EntityGraph::EntityGraph()
    {
        root_ = create("Root");
    }

    EntityId EntityGraph::create(const std::string& name, const Transform& transform)
    {
        uint32_t index = 0;
        if (!free_list_.empty())
        {
            index = free_list_.back();
            free_list_.pop_back();
        }
        else
        {
            index = (uint32_t)slots_.size();
            slots_.push_back(Slot{});
        }

        Slot& slot = slots_[index];
        slot.node = EntityNode{};
        slot.node.name = name;
        slot.node.model_transform = transform;
        slot.alive = true;
        ++live_count_;
        return EntityId{index, slot.generation};
    }

    bool EntityGraph::alive(EntityId id) const
    {
        if (!id.valid() || id.index >= slots_.size()) return false;
        const Slot& slot = slots_[id.index];
        return slot.alive && slot.generation == id.generation;
    }

    EntityNode* EntityGraph::get(EntityId id)
    {
        return alive(id) ? &slots_[id.index].node : nullptr;
    }

    const EntityNode* EntityGraph::get(EntityId id) const
    {
        return alive(id) ? &slots_[id.index].node : nullptr;
    }

    EntityNode& EntityGraph::node(EntityId id)
    {
        EntityNode* n = get(id);
        if (!n) throw std::out_of_range("EntityGraph: stale or null entity handle");
        return *n;
    }

    const EntityNode& EntityGraph::node(EntityId id) const
    {
        const EntityNode* n = get(id);
        if (!n) throw std::out_of_range("EntityGraph: stale or null entity handle");
        return *n;
    }

    bool EntityGraph::is_ancestor(EntityId ancestor, EntityId id) const
    {
        const EntityNode* n = get(id);
        while (n && n->parent.valid())
        {
            if (n->parent == ancestor) return true;
            n = get(n->parent);
        }
        return false;
    }

    bool EntityGraph::is_attached(EntityId id) const
    {
        return id == root_ ? alive(id) : is_ancestor(root_, id);
    }

    bool EntityGraph::is_visible(EntityId id) const
    {
        const EntityNode* n = get(id);
        while (n)
        {
            if (n->hidden) return false;
            n = n->parent.valid() ? get(n->parent) : nullptr;
        }
        return alive(id);
    }

    bool EntityGraph::add_child(EntityId parent, EntityId child)
    {
        if (!alive(parent) || !alive(child)) return false;
        if (parent == child || child == root_) return false;
        if (is_ancestor(child, parent)) return false;

        remove_from_parent(child);

        node(child).parent = parent;
        node(parent).children.push_back(child);

        if (observer_ && is_attached(parent))
        {
            observer_->did_attach(*this, child);
        }
        return true;
    }

    void EntityGraph::remove_from_parent(EntityId child)
    {
        EntityNode* n = get(child);
        if (!n || !n->parent.valid()) return;

        const EntityId parent = n->parent;
        const bool was_attached = is_attached(parent);

        if (EntityNode* p = get(parent))
        {
            auto& siblings = p->children;
            siblings.erase(std::remove(siblings.begin(), siblings.end(), child), siblings.end());
        }
        n->parent = kNullEntity;

        if (observer_ && was_attached)
        {
            observer_->did_detach(*this, child);
        }
    }

    void EntityGraph::destroy(EntityId id)
    {
        if (!alive(id) || id == root_) return;
        remove_from_parent(id);
        free_subtree(id);
    }

    void EntityGraph::free_subtree(EntityId id)
    {
        const std::vector<EntityId> doomed = flattened(id);
        for (EntityId e : doomed)
        {
            Slot& slot = slots_[e.index];
            slot.node = EntityNode{};
            slot.alive = false;
            ++slot.generation;
            free_list_.push_back(e.index);
            --live_count_;
        }
    }

    EntityId EntityGraph::clone_subtree(EntityId id, bool recursive)
    {
        const EntityNode* src = get(id);
        if (!src) return kNullEntity;

        // Copy before create(): the slot array may grow.
        const std::string name = src->name;
        const Transform model = src->model_transform;
        const std::shared_ptr<Mesh> mesh = src->mesh;
        const std::shared_ptr<Skinner> skinner = src->skinner;
        const bool hidden = src->hidden;
        const std::vector<EntityId> children = src->children;

        const EntityId copy = create(name, model);
        EntityNode& dst = node(copy);
        dst.mesh = mesh;
        dst.skinner = skinner;
        dst.hidden = hidden;

        if (recursive)
        {
            for (EntityId c : children)
            {
                const EntityId child_copy = clone_subtree(c, true);
                if (child_copy.valid()) add_child(copy, child_copy);
            }
        }
        return copy;
    }

    void EntityGraph::visit_breadth_first(EntityId start, const std::function<void(EntityId)>& fn) const
    {
        if (!alive(start)) return;
        std::deque<EntityId> queue{start};
        while (!queue.empty())
        {
            const EntityId current = queue.front();
            queue.pop_front();
            fn(current);
            for (EntityId c : node(current).children)
            {
                queue.push_back(c);
            }
        }
    }

    std::vector<EntityId> EntityGraph::flattened(EntityId start) const
    {
        std::vector<EntityId> out{};
        visit_breadth_first(start, [&out](EntityId e) { out.push_back(e); });
        return out;
    }

    std::vector<EntityId> EntityGraph::visible_flattened(EntityId start) const
    {
        std::vector<EntityId> out{};
        if (!is_visible(start)) return out;
        std::deque<EntityId> queue{start};
        while (!queue.empty())
        {
            const EntityId current = queue.front();
            queue.pop_front();
            out.push_back(current);
            for (EntityId c : node(current).children)
            {
                if (!node(c).hidden) queue.push_back(c);
            }
        }
        return out;
    }

    std::optional<EntityId> EntityGraph::find_child_by_name(EntityId start, const std::string& name, bool recursive) const
    {
        const EntityNode* n = get(start);
        if (!n) return std::nullopt;

        for (EntityId c : n->children)
        {
            if (node(c).name == name) return c;
        }
        if (recursive)
        {
            for (EntityId c : n->children)
            {
                if (auto match = find_child_by_name(c, name, true)) return match;
            }
        }
        return std::nullopt;
    }

    std::vector<EntityId> EntityGraph::collect_matching(
        EntityId start,
        const std::function<bool(const EntityNode&)>& predicate) const
    {
        std::vector<EntityId> matches{};
        visit_breadth_first(start, [&](EntityId e) {
            if (e != start && predicate(node(e))) matches.push_back(e);
        });
        return matches;
    }

    Transform EntityGraph::world_transform(EntityId id) const
    {
        const EntityNode& n = node(id);
        if (!n.parent.valid()) return n.model_transform;
        return Transform(world_matrix(id));
    }

    glm::mat4 EntityGraph::world_matrix(EntityId id) const
    {
        const EntityNode& n = node(id);
        if (!n.parent.valid()) return n.model_transform.matrix();
        return world_matrix(n.parent) * n.model_transform.matrix();
    }

    void EntityGraph::set_world_transform(EntityId id, const Transform& world)
    {
        EntityNode& n = node(id);
        if (!n.parent.valid())
        {
            n.model_transform = world;
            return;
        }
        n.model_transform = Transform(glm::inverse(world_matrix(n.parent)) * world.matrix());
    }

    void EntityGraph::generate_collision_shapes(EntityId start, bool recursive, BodyMode mode)
    {
        EntityNode& n = node(start);
        if (n.mesh)
        {
            PhysicsBody body{};
            body.mode = mode;
            body.shape = ConvexHullShape{n.mesh};
            n.physics_body = body;
        }
        if (recursive)
        {
            const std::vector<EntityId> children = n.children;
            for (EntityId c : children)
            {
                generate_collision_shapes(c, true, mode);
            }
        }
    }
}
