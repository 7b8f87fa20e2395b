// uyd_editor.hpp - Unity YAML Document (uyd) - Structural Editor
// Version 0.1.0
// Copyright 2025 The uyd authors
// Licenced as-is under the MIT licence.

#ifndef UYD_EDITOR_HPP
#define UYD_EDITOR_HPP

#include "uyd_core.hpp"
#include "uyd_document.hpp"
#include "uyd_fields.hpp"
#include "uyd_hierarchy.hpp"
#include "uyd_overrides.hpp"
#include "uyd_guid_resolver.hpp"
#include "uyd_log.hpp"

#include <algorithm>
#include <filesystem>
#include <unordered_map>
#include <unordered_set>

namespace uyd
{
    struct editor_options
    {
        std::optional<std::uint64_t> seed;                         // fixed id sequence
        bool                         maintain_root_order = true;   // rewrite m_RootOrder where present
    };

    struct created_object
    {
        file_id game_object;
        file_id transform;
    };

    struct delete_info
    {
        std::vector<file_id> removed;
    };

    struct reparent_info
    {
        file_id child;
        file_id old_parent;
        file_id new_parent;
    };

    struct clone_info
    {
        file_id                                       game_object;
        file_id                                       transform;
        size_t                                        total = 0;
        std::vector<std::pair<file_id, std::string>>  game_objects;   // copied GameObjects and names
    };

    struct unpack_info
    {
        file_id               root_game_object;
        file_id               root_transform;
        size_t                unpacked = 0;
        size_t                skipped_modifications = 0;
        std::filesystem::path source;
    };

    enum class array_action
    {
        insert,
        append,
        remove
    };

    inline std::optional<array_action> array_action_from_name(std::string_view name)
    {
        auto n = detail::to_lower(detail::trim_sv(name));
        if (n == "insert") return array_action::insert;
        if (n == "append") return array_action::append;
        if (n == "remove") return array_action::remove;
        return std::nullopt;
    }

    // One field write of a batch. `target` is a file ID or a unique
    // GameObject name; `property` may leave out the `m_` prefix.
    struct field_edit
    {
        std::string target;
        std::string property;
        std::string value;
    };

    // In-memory structural edits. Every operation checks its preconditions
    // before the first write, so a failed call leaves the document as it was.
    // Object arguments are ids or unique GameObject names; numeric text is
    // always taken as an id.
    class editor
    {
    public:
        explicit editor(document & doc, editor_options opts = {})
            : doc_(doc)
            , opts_(opts)
        {
            if (opts_.seed)
                doc_.seed(*opts_.seed);
        }

    //============================================================
    // GameObjects
    //============================================================

        result<created_object> add_game_object(std::string_view name,
                                               std::optional<std::string_view> parent = std::nullopt,
                                               bool by_id = false);

        result<file_id> add_component(std::string_view game_object, class_id cls, bool by_id = false);

        // Refused with invariant_violation when the object has children
        // and cascade is off.
        result<delete_info> delete_object(std::string_view ident, bool cascade = true, bool by_id = false);

        // Non-Transform component; returns its class.
        result<class_id> remove_component(std::string_view component);

        // Copy of a component attached to another (or the same) GameObject.
        result<file_id> copy_component(std::string_view component, std::string_view target_game_object,
                                       bool by_id = false);

    //============================================================
    // Hierarchy
    //============================================================

        // new_parent "root" (any case) detaches to the scene root.
        result<reparent_info> reparent(std::string_view child, std::string_view new_parent, bool by_id = false);

        result<clone_info> clone(std::string_view ident,
                                 std::optional<std::string_view> new_name = std::nullopt,
                                 bool by_id = false);

    //============================================================
    // Prefab instances
    //============================================================

        result<delete_info> delete_prefab_instance(std::string_view instance);

        result<unpack_info> unpack_instance(std::string_view instance, guid_resolver & resolver);

    //============================================================
    // Lists and batches
    //============================================================

        // Insert defaults to index 0, remove to the first element. Returns
        // the new length.
        result<size_t> edit_array(std::string_view block_id, std::string_view array_path, array_action action,
                                  std::optional<std::string_view> value = std::nullopt,
                                  std::optional<size_t> index = std::nullopt);

        // Runs `edits`, a callable returning result<void>. A failure rolls
        // back every change made since the call.
        template <typename Fn>
        result<void> transaction(Fn && edits);

        // All writes or none; returns how many were applied.
        result<size_t> set_fields(std::vector<field_edit> const & edits, bool by_id = false);

    private:

        document &     doc_;
        editor_options opts_;

    //========================================================
    // Internal helpers; not exposed for clients
    //========================================================

        struct node
        {
            file_id                game_object;
            std::optional<file_id> transform;
        };

        result<node> resolve_node(std::string_view ident, bool by_id) const;

        // Any block by id, else a GameObject by name.
        result<file_id> resolve_block(std::string_view ident, bool by_id) const;

        file_id mint(std::unordered_set<file_id> & taken);

        result<void> require_children(file_id parent) const;
        result<void> add_child(file_id parent, file_id child);
        result<void> remove_child(file_id parent, file_id child);

        size_t root_order_for(file_id parent, file_id excluding) const;
        void   write_root_order(file_id transform, size_t order);

        void collect_instance(file_id instance, std::unordered_set<file_id> & out) const;

        // `parent.key` where parent holds an inline `{...}` mapping.
        static bool is_flow_entry(block const & b, std::string_view path);

        block make_block(class_id cls, file_id id, std::vector<std::string> body) const;
        void  match_ending(block & b) const;
        static std::vector<std::string> component_defaults(class_id cls);
    };

//========================================================================
// Helpers
//========================================================================

    inline block editor::make_block(class_id cls, file_id id, std::vector<std::string> body) const
    {
        block_header h{ cls, id, false };
        block b(h, make_header_line(h), std::move(body));
        match_ending(b);
        return b;
    }

    // Lines written into the document follow its line break convention.
    inline void editor::match_ending(block & b) const
    {
        bool cr = doc_.ending() == line_ending::crlf;

        std::string header = b.header_line();
        detail::set_cr(header, cr);
        std::vector<std::string> body = b.lines();
        for (auto & l : body)
            detail::set_cr(l, cr);

        b = block(block_header{ b.cls(), b.id(), b.is_stripped() }, std::move(header), std::move(body));
    }

    inline std::vector<std::string> editor::component_defaults(class_id cls)
    {
        switch (cls)
        {
            case classes::camera:
                return { "  serializedVersion: 2", "  m_ClearFlags: 1",
                         "  m_BackGroundColor: {r: 0.19215687, g: 0.3019608, b: 0.4745098, a: 0}",
                         "  m_projectionMatrixMode: 1", "  near clip plane: 0.3", "  far clip plane: 1000",
                         "  field of view: 60", "  orthographic: 0", "  orthographic size: 5", "  m_Depth: -1" };
            case classes::mesh_renderer:
                return { "  m_CastShadows: 1", "  m_ReceiveShadows: 1", "  m_Materials:", "  - {fileID: 0}" };
            case classes::mesh_filter:
                return { "  m_Mesh: {fileID: 0}" };
            case classes::rigidbody:
                return { "  m_Mass: 1", "  m_Drag: 0", "  m_AngularDrag: 0.05", "  m_UseGravity: 1", "  m_IsKinematic: 0" };
            case classes::box_collider:
                return { "  m_IsTrigger: 0", "  m_Material: {fileID: 0}",
                         "  m_Center: {x: 0, y: 0, z: 0}", "  m_Size: {x: 1, y: 1, z: 1}" };
            case classes::audio_source:
                return { "  m_PlayOnAwake: 1", "  m_Volume: 1", "  m_Pitch: 1", "  m_Loop: 0", "  m_Mute: 0", "  m_Priority: 128" };
            case classes::light:
                return { "  m_LightType: 1", "  m_Color: {r: 1, g: 0.95686275, b: 0.8392157, a: 1}",
                         "  m_Intensity: 1", "  m_Range: 10", "  m_SpotAngle: 30", "  m_Shadows: 2" };
            default:
                return {};
        }
    }

    inline file_id editor::mint(std::unordered_set<file_id> & taken)
    {
        file_id id;
        do
        {
            id = doc_.generate_id();
        }
        while (taken.contains(id));

        taken.insert(id);
        return id;
    }

    inline result<editor::node> editor::resolve_node(std::string_view ident, bool by_id) const
    {
        auto trimmed = detail::trim_sv(ident);
        if (by_id || detail::is_digits(trimmed))
        {
            // A Transform id stands for its GameObject.
            if (auto v = detail::parse_int(trimmed))
            {
                auto const * b = doc_.find_by_id(file_id{ *v });
                if (b && is_spatial(b->cls()) && !b->is_stripped())
                {
                    auto go = game_object_of(doc_, b->id());
                    if (!go)
                        return make_error(error_kind::malformed, "Transform " + to_string(b->id()) + " has no GameObject");
                    return node{ *go, b->id() };
                }
            }
        }

        auto go = resolve_game_object(doc_, ident, by_id);
        if (!go)
            return go.err();
        return node{ *go, transform_of(doc_, *go) };
    }

    inline result<file_id> editor::resolve_block(std::string_view ident, bool by_id) const
    {
        auto trimmed = detail::trim_sv(ident);
        if (by_id || detail::is_digits(trimmed) || trimmed.starts_with('-'))
        {
            if (auto v = detail::parse_int(trimmed); v && doc_.contains(file_id{ *v }))
                return file_id{ *v };
        }
        return resolve_game_object(doc_, ident, by_id);
    }

    inline result<void> editor::require_children(file_id parent) const
    {
        auto const * p = doc_.find_by_id(parent);
        if (!p)
            return make_error(error_kind::not_found, "Transform " + to_string(parent) + " not found");
        if (!array_length(*p, "m_Children"))
            return make_error(error_kind::malformed, "Transform " + to_string(parent) + " has no m_Children list");
        return {};
    }

    inline result<void> editor::add_child(file_id parent, file_id child)
    {
        auto * p = doc_.find_by_id(parent);
        if (!p)
            return make_error(error_kind::not_found, "Transform " + to_string(parent) + " not found");

        if (find_array_reference(*p, "m_Children", child))
            return {};
        return insert_array_element(*p, "m_Children", detail::reference_to(child));
    }

    inline result<void> editor::remove_child(file_id parent, file_id child)
    {
        auto * p = doc_.find_by_id(parent);
        if (!p)
            return make_error(error_kind::not_found, "Transform " + to_string(parent) + " not found");

        auto idx = find_array_reference(*p, "m_Children", child);
        if (!idx)
            return {};
        return remove_array_element(*p, "m_Children", *idx);
    }

    inline size_t editor::root_order_for(file_id parent, file_id excluding) const
    {
        auto siblings = is_null(parent) ? root_transforms(doc_) : children_of(doc_, parent);
        return static_cast<size_t>(std::ranges::count_if(siblings, [&](file_id s) { return s != excluding; }));
    }

    inline void editor::write_root_order(file_id transform, size_t order)
    {
        if (!opts_.maintain_root_order)
            return;

        auto * t = doc_.find_by_id(transform);
        if (t && has_field(*t, "m_RootOrder"))
        {
            auto r = set_field(*t, "m_RootOrder", std::to_string(order));
            if (!r)
                log::warn("m_RootOrder of " + to_string(transform) + ": " + r.err().message);
        }
    }

    inline bool editor::is_flow_entry(block const & b, std::string_view path)
    {
        auto fp = parse_path(path);
        if (!fp || fp->is_array_element() || fp->segments.size() < 2)
            return false;

        std::vector<std::string> parent(fp->segments.begin(), fp->segments.end() - 1);
        auto v = get_field(b, detail::join(parent, "."));
        return v && v->starts_with('{');
    }

    // The instance, its stripped stand-ins and everything added to it.
    inline void editor::collect_instance(file_id instance, std::unordered_set<file_id> & out) const
    {
        auto const * pi = doc_.find_by_id(instance);
        if (!pi || !out.insert(instance).second)
            return;

        for (auto s : stripped_blocks_of(doc_, instance))
            out.insert(s);

        for (auto go : added_game_objects(*pi))
        {
            out.insert(go);
            for (auto c : components_of(doc_, go))
                out.insert(c);
            if (auto t = transform_of(doc_, go))
                for (auto d : collect_descendants(doc_, *t))
                    out.insert(d);
        }

        for (auto c : added_components(*pi))
            out.insert(c);
    }

//========================================================================
// GameObjects
//========================================================================

    inline result<created_object> editor::add_game_object(std::string_view name,
                                                          std::optional<std::string_view> parent,
                                                          bool by_id)
    {
        if (auto v = validate_name(name, "GameObject name"); !v)
            return v.err();

        file_id parent_t{};
        std::string layer = "0";
        if (parent)
        {
            auto p = resolve_transform(doc_, *parent, by_id);
            if (!p)
                return p.err();
            parent_t = *p;

            if (auto r = require_children(parent_t); !r)
                return r.err();

            if (auto pgo = game_object_of(doc_, parent_t))
                if (auto const * gb = doc_.find_by_id(*pgo))
                    if (auto l = get_field(*gb, "m_Layer"))
                        layer = *l;
        }

        auto taken = doc_.all_ids();
        file_id go = mint(taken);
        file_id t  = mint(taken);
        size_t order = root_order_for(parent_t, t);

        doc_.append(make_block(classes::game_object, go, {
            "GameObject:",
            "  m_ObjectHideFlags: 0",
            "  m_CorrespondingSourceObject: {fileID: 0}",
            "  m_PrefabInstance: {fileID: 0}",
            "  m_PrefabAsset: {fileID: 0}",
            "  serializedVersion: 6",
            "  m_Component:",
            "  - component: " + detail::reference_to(t),
            "  m_Layer: " + layer,
            "  m_Name: " + std::string(name),
            "  m_TagString: Untagged",
            "  m_Icon: {fileID: 0}",
            "  m_NavMeshLayer: 0",
            "  m_StaticEditorFlags: 0",
            "  m_IsActive: 1",
        }));

        doc_.append(make_block(classes::transform, t, {
            "Transform:",
            "  m_ObjectHideFlags: 0",
            "  m_CorrespondingSourceObject: {fileID: 0}",
            "  m_PrefabInstance: {fileID: 0}",
            "  m_PrefabAsset: {fileID: 0}",
            "  m_GameObject: " + detail::reference_to(go),
            "  serializedVersion: 2",
            "  m_LocalRotation: {x: 0, y: 0, z: 0, w: 1}",
            "  m_LocalPosition: {x: 0, y: 0, z: 0}",
            "  m_LocalScale: {x: 1, y: 1, z: 1}",
            "  m_ConstrainProportionsScale: 0",
            "  m_Children: []",
            "  m_Father: " + detail::reference_to(parent_t),
            "  m_RootOrder: " + std::to_string(order),
            "  m_LocalEulerAnglesHint: {x: 0, y: 0, z: 0}",
        }));

        if (!is_null(parent_t))
        {
            if (auto r = add_child(parent_t, t); !r)
                return r.err();
        }

        log::debug("added GameObject " + std::string(name) + " (" + to_string(go) + ", transform " + to_string(t) + ")");
        return created_object{ go, t };
    }

    inline result<file_id> editor::add_component(std::string_view game_object, class_id cls, bool by_id)
    {
        if (cls == classes::game_object || is_spatial(cls) || cls == classes::prefab_instance)
            return make_error(error_kind::validation_failure, type_name(cls) + " cannot be added as a component");
        if (cls == classes::mono_behaviour)
            return make_error(error_kind::validation_failure, "MonoBehaviour components need a script reference");
        if (type_name(cls).starts_with("Unknown_"))
            return make_error(error_kind::validation_failure, "Unknown component class " + std::to_string(cls));

        auto go = resolve_game_object(doc_, game_object, by_id);
        if (!go)
            return go.err();

        auto * gb = doc_.find_by_id(*go);
        auto comps = array_length(*gb, "m_Component");
        if (!comps)
            return comps.err();

        for (auto c : components_of(doc_, *go))
        {
            auto const * cb = doc_.find_by_id(c);
            if (cb && cb->cls() == cls)
                log::info("GameObject " + to_string(*go) + " already has a " + type_name(cls) + " (" + to_string(c) + "), adding another");
        }

        auto taken = doc_.all_ids();
        file_id id = mint(taken);

        std::vector<std::string> body{
            type_name(cls) + ":",
            "  m_ObjectHideFlags: 0",
            "  m_CorrespondingSourceObject: {fileID: 0}",
            "  m_PrefabInstance: {fileID: 0}",
            "  m_PrefabAsset: {fileID: 0}",
            "  m_GameObject: " + detail::reference_to(*go),
            "  m_Enabled: 1",
        };
        for (auto & l : component_defaults(cls))
            body.push_back(std::move(l));

        if (auto r = insert_array_element(*gb, "m_Component", "component: " + detail::reference_to(id)); !r)
            return r.err();

        doc_.append(make_block(cls, id, std::move(body)));

        log::debug("added " + type_name(cls) + " " + to_string(id) + " to " + to_string(*go));
        return id;
    }

    inline result<delete_info> editor::delete_object(std::string_view ident, bool cascade, bool by_id)
    {
        auto n = resolve_node(ident, by_id);
        if (!n)
            return n.err();

        std::unordered_set<file_id> doomed{ n->game_object };
        for (auto c : components_of(doc_, n->game_object))
            doomed.insert(c);

        file_id father{};
        if (n->transform)
        {
            doomed.insert(*n->transform);
            father = parent_of(doc_, *n->transform);

            auto kids = children_of(doc_, *n->transform);
            if (!kids.empty() && !cascade)
                return make_error(error_kind::invariant_violation,
                    "GameObject " + to_string(n->game_object) + " has " + std::to_string(kids.size())
                    + " children; delete them first or enable cascade");

            for (auto d : collect_descendants(doc_, *n->transform))
                doomed.insert(d);

            // Nested prefab instances under the removed subtree go too.
            std::vector<file_id> instances;
            for (auto id : doomed)
            {
                auto const * b = doc_.find_by_id(id);
                if (b && b->is_stripped())
                    if (auto v = get_field(*b, "m_PrefabInstance"))
                        if (auto pi = parse_reference(*v); pi && !is_null(*pi))
                            instances.push_back(*pi);
            }
            for (auto const * pi : doc_.find_by_class(classes::prefab_instance))
                if (doomed.contains(transform_parent(*pi)))
                    instances.push_back(pi->id());

            for (auto pi : instances)
                collect_instance(pi, doomed);
        }

        // A dangling m_Father has no child list to detach from.
        if (!is_null(father) && !doomed.contains(father) && doc_.contains(father))
        {
            if (auto r = remove_child(father, *n->transform); !r)
                return r.err();
        }

        delete_info info;
        for (auto const & b : doc_.blocks())
            if (doomed.contains(b.id()))
                info.removed.push_back(b.id());

        doc_.remove(doomed);
        log::debug("deleted " + std::to_string(info.removed.size()) + " blocks under GameObject " + to_string(n->game_object));
        return info;
    }

    inline result<class_id> editor::remove_component(std::string_view component)
    {
        auto v = detail::parse_int(component);
        if (!v)
            return make_error(error_kind::not_found, "Invalid component fileID: " + std::string(component));

        file_id id{ *v };
        auto const * b = doc_.find_by_id(id);
        if (!b)
            return make_error(error_kind::not_found, "Component with fileID " + to_string(id) + " not found");

        class_id cls = b->cls();
        if (cls == classes::game_object)
            return make_error(error_kind::validation_failure, "Cannot remove a GameObject with remove-component. Use delete instead.");
        if (is_spatial(cls))
            return make_error(error_kind::validation_failure,
                "Cannot remove a " + type_name(cls) + " with remove-component. Use delete to remove the entire GameObject.");
        if (cls == classes::prefab_instance)
            return make_error(error_kind::validation_failure, "Cannot remove a PrefabInstance with remove-component.");

        if (auto go = game_object_of(doc_, id))
        {
            if (auto * gb = doc_.find_by_id(*go))
            {
                if (auto idx = find_array_reference(*gb, "m_Component", id))
                {
                    if (auto r = remove_array_element(*gb, "m_Component", *idx); !r)
                        return r.err();
                }
            }
        }

        doc_.remove({ id });
        log::debug("removed " + type_name(cls) + " " + to_string(id));
        return cls;
    }

    inline result<file_id> editor::copy_component(std::string_view component, std::string_view target_game_object,
                                                  bool by_id)
    {
        auto v = detail::parse_int(component);
        if (!v)
            return make_error(error_kind::not_found, "Invalid component fileID: " + std::string(component));

        file_id source{ *v };
        auto const * sb = doc_.find_by_id(source);
        if (!sb)
            return make_error(error_kind::not_found, "Component with fileID " + to_string(source) + " not found");

        class_id cls = sb->cls();
        if (cls == classes::game_object)
            return make_error(error_kind::validation_failure, "Cannot copy a GameObject. Use clone instead.");
        if (is_spatial(cls))
            return make_error(error_kind::validation_failure, "Cannot copy a " + type_name(cls) + " component.");
        if (cls == classes::prefab_instance || sb->is_stripped())
            return make_error(error_kind::validation_failure, "Cannot copy a prefab stand-in or PrefabInstance.");

        auto go = resolve_game_object(doc_, target_game_object, by_id);
        if (!go)
            return go.err();

        auto * gb = doc_.find_by_id(*go);
        if (auto comps = array_length(*gb, "m_Component"); !comps)
            return comps.err();

        auto taken = doc_.all_ids();
        file_id id = mint(taken);

        block copy = *sb;
        copy.set_id(id);
        if (has_field(copy, "m_GameObject"))
            if (auto r = set_field(copy, "m_GameObject", detail::reference_to(*go)); !r)
                return r.err();

        if (auto r = insert_array_element(*gb, "m_Component", "component: " + detail::reference_to(id)); !r)
            return r.err();

        doc_.append(std::move(copy));

        log::debug("copied " + type_name(cls) + " " + to_string(source) + " to " + to_string(*go) + " as " + to_string(id));
        return id;
    }

//========================================================================
// Hierarchy
//========================================================================

    inline result<reparent_info> editor::reparent(std::string_view child, std::string_view new_parent, bool by_id)
    {
        auto child_t = resolve_transform(doc_, child, by_id);
        if (!child_t)
            return child_t.err();

        auto * cb = doc_.find_by_id(*child_t);
        if (!cb || !has_field(*cb, "m_Father"))
            return make_error(error_kind::malformed, "Transform " + to_string(*child_t) + " has no m_Father");

        file_id old_parent = parent_of(doc_, *child_t);
        file_id parent_t{};

        if (detail::to_lower(detail::trim_sv(new_parent)) != "root")
        {
            auto p = resolve_transform(doc_, new_parent, by_id);
            if (!p)
                return make_error(p.err().kind, "Parent not found: " + p.err().message);
            parent_t = *p;

            if (parent_t == *child_t)
                return make_error(error_kind::invariant_violation, "Cannot reparent a GameObject under itself");
            if (is_descendant(doc_, parent_t, *child_t))
                return make_error(error_kind::invariant_violation, "Cannot reparent: would create circular hierarchy");

            if (auto r = require_children(parent_t); !r)
                return r.err();
        }

        if (!is_null(old_parent))
        {
            if (auto r = remove_child(old_parent, *child_t); !r)
                return r.err();
        }

        if (auto r = set_field(*doc_.find_by_id(*child_t), "m_Father", detail::reference_to(parent_t)); !r)
            return r.err();

        write_root_order(*child_t, root_order_for(parent_t, *child_t));

        if (!is_null(parent_t))
        {
            if (auto r = add_child(parent_t, *child_t); !r)
                return r.err();
        }

        log::debug("reparented " + to_string(*child_t) + ": " + to_string(old_parent) + " -> " + to_string(parent_t));
        return reparent_info{ *child_t, old_parent, parent_t };
    }

    inline result<clone_info> editor::clone(std::string_view ident, std::optional<std::string_view> new_name, bool by_id)
    {
        if (new_name)
            if (auto v = validate_name(*new_name, "GameObject name"); !v)
                return v.err();

        auto n = resolve_node(ident, by_id);
        if (!n)
            return n.err();

        std::unordered_set<file_id> originals{ n->game_object };
        for (auto c : components_of(doc_, n->game_object))
            originals.insert(c);

        file_id father{};
        if (n->transform)
        {
            originals.insert(*n->transform);
            father = parent_of(doc_, *n->transform);
            for (auto d : collect_descendants(doc_, *n->transform))
                originals.insert(d);

            if (!is_null(father))
                if (auto r = require_children(father); !r)
                    return r.err();
        }

        auto taken = doc_.all_ids();
        std::unordered_map<file_id, file_id> id_map;
        std::vector<block> copies;
        for (auto const & b : doc_.blocks())
        {
            if (!originals.contains(b.id()) || id_map.contains(b.id()))
                continue;
            id_map.emplace(b.id(), mint(taken));
            copies.push_back(b);
        }

        // The copy goes after every existing sibling, the original included.
        size_t order = n->transform ? root_order_for(father, null_id<block_tag>()) : 0;

        std::string source_name = name_of(doc_, n->game_object).value_or(std::string(ident));
        std::string final_name = new_name ? std::string(*new_name) : source_name + " (1)";

        clone_info info;
        info.game_object = id_map.at(n->game_object);
        info.transform   = n->transform ? id_map.at(*n->transform) : file_id{};
        info.total       = copies.size();

        for (auto & c : copies)
        {
            remap_ids(c, id_map);
            if (c.id() == info.game_object)
            {
                if (auto r = set_field(c, "m_Name", final_name); !r)
                    return r.err();
            }
            if (c.cls() == classes::game_object)
            {
                auto name = get_field(c, "m_Name");
                info.game_objects.emplace_back(c.id(), name ? *name : std::string{});
            }
        }

        for (auto & c : copies)
            doc_.append(std::move(c));

        if (n->transform)
        {
            write_root_order(info.transform, order);
            if (!is_null(father))
            {
                if (auto r = add_child(father, info.transform); !r)
                    return r.err();
            }
        }

        log::debug("cloned " + to_string(n->game_object) + " as " + to_string(info.game_object)
            + " (" + std::to_string(info.total) + " blocks)");
        return info;
    }

//========================================================================
// Prefab instances
//========================================================================

    inline result<delete_info> editor::delete_prefab_instance(std::string_view instance)
    {
        auto pi_id = resolve_prefab_instance(doc_, instance);
        if (!pi_id)
            return pi_id.err();

        std::unordered_set<file_id> doomed;
        collect_instance(*pi_id, doomed);

        file_id parent = transform_parent(*doc_.find_by_id(*pi_id));
        if (!is_null(parent) && !doomed.contains(parent))
        {
            for (auto s : stripped_blocks_of(doc_, *pi_id))
            {
                auto const * sb = doc_.find_by_id(s);
                if (sb && is_spatial(sb->cls()))
                    if (auto r = remove_child(parent, s); !r)
                        return r.err();
            }
        }

        delete_info info;
        for (auto const & b : doc_.blocks())
            if (doomed.contains(b.id()))
                info.removed.push_back(b.id());

        doc_.remove(doomed);
        log::debug("deleted PrefabInstance " + to_string(*pi_id) + " (" + std::to_string(info.removed.size()) + " blocks)");
        return info;
    }

    inline result<unpack_info> editor::unpack_instance(std::string_view instance, guid_resolver & resolver)
    {
        auto pi_id = resolve_prefab_instance(doc_, instance);
        if (!pi_id)
            return pi_id.err();

        // Valid until the removal below.
        block const & pi = *doc_.find_by_id(*pi_id);

        auto guid = source_prefab_guid(pi);
        if (!guid)
            return make_error(error_kind::malformed,
                "Could not find m_SourcePrefab GUID in PrefabInstance block (fileID: " + to_string(*pi_id) + ")");

        auto source = resolver.resolve(*guid);
        if (!source)
            return make_error(error_kind::template_unresolved,
                "Could not resolve source prefab with GUID " + *guid + " under " + resolver.root().string());

        auto tmpl = document::load(*source);
        if (!tmpl)
            return make_error(error_kind::template_unresolved,
                "Failed to read source prefab: " + tmpl.err().message);

        std::unordered_set<file_id> removed;
        if (auto rc = removed_components(pi))
            for (auto const & r : *rc)
                if (auto ref = parse_reference(r))
                    removed.insert(*ref);

        auto mods = modifications(pi);
        if (!mods)
            return mods.err();

        file_id parent = transform_parent(pi);
        if (!is_null(parent))
            if (auto r = require_children(parent); !r)
                return r.err();

        auto stripped = stripped_blocks_of(doc_, *pi_id);
        auto added = added_game_objects(pi);

        // Fresh ids for the whole template.
        auto taken = doc_.all_ids();
        std::unordered_map<file_id, file_id> id_map;
        for (auto const & b : tmpl->blocks())
            if (!id_map.contains(b.id()))
                id_map.emplace(b.id(), mint(taken));

        file_id tmpl_root_t{};
        for (auto t : root_transforms(*tmpl))
        {
            tmpl_root_t = t;
            break;
        }
        auto tmpl_root_go = game_object_of(*tmpl, tmpl_root_t);

        std::vector<block> copies;
        for (auto const & b : tmpl->blocks())
        {
            if (removed.contains(b.id()))
                continue;

            block c = b;
            remap_ids(c, id_map);
            match_ending(c);

            for (auto field : { "m_CorrespondingSourceObject", "m_PrefabInstance", "m_PrefabAsset" })
            {
                if (!has_field(c, field))
                    continue;
                if (auto r = set_field(c, field, detail::NULL_REFERENCE); !r)
                    return r.err();
            }

            if (c.cls() == classes::game_object)
            {
                for (auto rid : removed)
                {
                    auto it = id_map.find(rid);
                    if (it == id_map.end())
                        continue;
                    if (auto idx = find_array_reference(c, "m_Component", it->second))
                        if (auto r = remove_array_element(c, "m_Component", *idx); !r)
                            return r.err();
                }
            }
            copies.push_back(std::move(c));
        }

        unpack_info info;
        info.source = *source;

        for (auto const & m : *mods)
        {
            auto target = id_map.find(m.target_id);
            if (target == id_map.end())
            {
                ++info.skipped_modifications;
                continue;
            }

            auto it = std::ranges::find_if(copies, [&](block const & c) { return c.id() == target->second; });
            if (it == copies.end())
            {
                ++info.skipped_modifications;
                continue;
            }

            std::string value = m.value;
            if (m.object_reference != detail::NULL_REFERENCE && !detail::trim_sv(m.object_reference).empty()
                && !is_flow_entry(*it, m.property_path))
                value = detail::remap_line(m.object_reference, id_map).value_or(m.object_reference);

            if (auto r = set_field(*it, m.property_path, value); !r)
            {
                log::debug("modification " + m.property_path + " on " + to_string(target->second) + " skipped: " + r.err().message);
                ++info.skipped_modifications;
            }
        }

        if (!is_null(tmpl_root_t))
        {
            info.root_transform = id_map.at(tmpl_root_t);
            if (tmpl_root_go)
                info.root_game_object = id_map.at(*tmpl_root_go);

            auto it = std::ranges::find_if(copies, [&](block const & c) { return c.id() == info.root_transform; });
            if (it != copies.end())
                if (auto r = set_field(*it, "m_Father", detail::reference_to(parent)); !r)
                    return r.err();
        }

        // Scene references to the stripped stand-ins now point at the copies.
        std::unordered_map<file_id, file_id> scene_map;
        for (auto s : stripped)
        {
            auto const * sb = doc_.find_by_id(s);
            if (!sb)
                continue;
            auto src = get_field(*sb, "m_CorrespondingSourceObject");
            if (!src)
                continue;
            if (auto ref = parse_reference(*src); ref && id_map.contains(*ref))
                scene_map.emplace(s, id_map.at(*ref));
        }

        // Objects added to the instance must find a child list on their new father.
        for (auto go : added)
        {
            auto t = transform_of(doc_, go);
            if (!t)
                continue;
            file_id father = parent_of(doc_, *t);
            if (auto m = scene_map.find(father); m != scene_map.end())
            {
                auto c = std::ranges::find_if(copies, [&](block const & cb) { return cb.id() == m->second; });
                if (c != copies.end() && !array_length(*c, "m_Children"))
                    return make_error(error_kind::malformed, "Transform " + to_string(c->id()) + " has no m_Children list");
            }
            else if (!is_null(father) && doc_.contains(father) && std::ranges::find(stripped, father) == stripped.end())
            {
                if (auto r = require_children(father); !r)
                    return r.err();
            }
        }

        std::unordered_set<file_id> doomed{ *pi_id };
        doomed.insert(stripped.begin(), stripped.end());
        doc_.remove(doomed);

        if (!scene_map.empty())
        {
            // Only bodies; no header anchor is in the map after the removal.
            std::vector<file_id> touched;
            for (auto const & b : doc_.blocks())
                if (std::ranges::any_of(extract_refs(b), [&](file_id r) { return scene_map.contains(r); }))
                    touched.push_back(b.id());

            for (auto id : touched)
                remap_ids(*doc_.find_by_id(id), scene_map);
        }

        info.unpacked = copies.size();
        for (auto & c : copies)
            doc_.append(std::move(c));

        if (!is_null(parent) && !is_null(info.root_transform))
        {
            if (auto r = add_child(parent, info.root_transform); !r)
                return r.err();
        }

        // Objects added to the instance in the scene hang under the copies now.
        for (auto go : added)
        {
            auto t = transform_of(doc_, go);
            if (!t)
                continue;
            file_id father = parent_of(doc_, *t);
            if (!is_null(father) && doc_.contains(father))
                if (auto r = add_child(father, *t); !r)
                    return r.err();
        }

        log::debug("unpacked PrefabInstance " + to_string(*pi_id) + " from " + source->string()
            + " (" + std::to_string(info.unpacked) + " blocks)");
        return info;
    }

//========================================================================
// Lists and batches
//========================================================================

    inline result<size_t> editor::edit_array(std::string_view block_id, std::string_view array_path, array_action action,
                                             std::optional<std::string_view> value, std::optional<size_t> index)
    {
        auto v = detail::parse_int(block_id);
        if (!v)
            return make_error(error_kind::not_found, "Invalid fileID: " + std::string(block_id));

        auto * b = doc_.find_by_id(file_id{ *v });
        if (!b)
            return make_error(error_kind::not_found, "Block with fileID " + std::string(detail::trim_sv(block_id)) + " not found");

        if (action != array_action::remove)
        {
            if (!value)
                return make_error(error_kind::validation_failure, "A value is required to insert or append");
            if (value->find('\n') != std::string_view::npos || value->find('\r') != std::string_view::npos)
                return make_error(error_kind::validation_failure, "Value cannot contain newlines");
        }

        switch (action)
        {
            case array_action::insert:
                if (auto r = insert_array_element(*b, array_path, *value, index.value_or(0)); !r)
                    return r.err();
                break;
            case array_action::append:
                if (auto r = insert_array_element(*b, array_path, *value); !r)
                    return r.err();
                break;
            case array_action::remove:
                if (auto r = remove_array_element(*b, array_path, index.value_or(0)); !r)
                    return r.err();
                break;
        }

        return array_length(*b, array_path);
    }

    template <typename Fn>
    inline result<void> editor::transaction(Fn && edits)
    {
        document snapshot = doc_;

        result<void> r = std::forward<Fn>(edits)();
        if (!r)
        {
            doc_ = std::move(snapshot);
            log::debug("batch rolled back: " + r.err().message);
        }
        return r;
    }

    inline result<size_t> editor::set_fields(std::vector<field_edit> const & edits, bool by_id)
    {
        size_t applied = 0;

        auto r = transaction([&]() -> result<void>
        {
            for (auto const & e : edits)
            {
                auto n = resolve_block(e.target, by_id);
                if (!n)
                    return make_error(n.err().kind, "Failed to edit " + e.target + "." + e.property + ": " + n.err().message);

                block & b = *doc_.find_by_id(*n);
                std::string path = e.property;
                if (!has_field(b, path) && !path.starts_with("m_") && has_field(b, "m_" + path))
                    path = "m_" + path;

                if (auto w = set_field(b, path, e.value); !w)
                    return make_error(w.err().kind, "Failed to edit " + e.target + "." + e.property + ": " + w.err().message);
                ++applied;
            }
            return {};
        });

        if (!r)
            return r.err();
        return applied;
    }

} // namespace uyd

#endif // UYD_EDITOR_HPP
