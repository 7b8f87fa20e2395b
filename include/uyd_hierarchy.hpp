// uyd_hierarchy.hpp - Unity YAML Document (uyd) - Scene hierarchy relations
// Version 0.1.0
// Copyright 2025 The uyd authors
// Licenced as-is under the MIT licence.

#ifndef UYD_HIERARCHY_HPP
#define UYD_HIERARCHY_HPP

#include "uyd_core.hpp"
#include "uyd_document.hpp"
#include "uyd_fields.hpp"

namespace uyd
{
//========================================================================
// HIERARCHY API
//========================================================================

    // All relations are read from the live blocks on every call; nothing
    // is cached beyond the document's id index.

    std::optional<std::string> name_of(document const & doc, file_id game_object);

    // `m_Component` entries of a GameObject, in order.
    std::vector<file_id> components_of(document const & doc, file_id game_object);

    // The spatial component of a GameObject.
    std::optional<file_id> transform_of(document const & doc, file_id game_object);

    // `m_GameObject` of a component.
    std::optional<file_id> game_object_of(document const & doc, file_id component);

    // `m_Father` of a Transform; null for a root.
    file_id parent_of(document const & doc, file_id transform);

    // `m_Children` of a Transform.
    std::vector<file_id> children_of(document const & doc, file_id transform);

    // Transforms whose `m_Father` is null, in document order.
    std::vector<file_id> root_transforms(document const & doc);

    // True if `node` lies strictly below `ancestor`.
    bool is_descendant(document const & doc, file_id node, file_id ancestor);

    // Every Transform, GameObject and component below `transform` (the
    // transform itself excluded).
    std::vector<file_id> collect_descendants(document const & doc, file_id transform);

    // Numeric argument is taken as an id; anything else as an exact
    // GameObject name that must be unique.
    result<file_id> resolve_game_object(document const & doc, std::string_view ident, bool by_id = false);

    // GameObject (or Transform) id or name to its Transform.
    result<file_id> resolve_transform(document const & doc, std::string_view ident, bool by_id = false);

//========================================================================
// Implementation
//========================================================================

    inline std::optional<std::string> name_of(document const & doc, file_id game_object)
    {
        auto const * b = doc.find_by_id(game_object);
        if (!b)
            return std::nullopt;

        auto name = get_field(*b, "m_Name");
        if (!name)
            return std::nullopt;
        return *name;
    }

    inline std::vector<file_id> components_of(document const & doc, file_id game_object)
    {
        std::vector<file_id> out;
        auto const * b = doc.find_by_id(game_object);
        if (!b || b->cls() != classes::game_object)
            return out;

        auto items = array_items(*b, "m_Component");
        if (!items)
            return out;

        for (auto const & item : *items)
            if (auto ref = parse_reference(item); ref && !is_null(*ref))
                out.push_back(*ref);
        return out;
    }

    inline std::optional<file_id> transform_of(document const & doc, file_id game_object)
    {
        for (auto c : components_of(doc, game_object))
        {
            auto const * b = doc.find_by_id(c);
            if (b && is_spatial(b->cls()))
                return c;
        }
        return std::nullopt;
    }

    inline std::optional<file_id> game_object_of(document const & doc, file_id component)
    {
        auto const * b = doc.find_by_id(component);
        if (!b)
            return std::nullopt;

        auto v = get_field(*b, "m_GameObject");
        if (!v)
            return std::nullopt;

        auto ref = parse_reference(*v);
        if (!ref || is_null(*ref))
            return std::nullopt;
        return ref;
    }

    inline file_id parent_of(document const & doc, file_id transform)
    {
        auto const * b = doc.find_by_id(transform);
        if (!b)
            return null_id<block_tag>();

        auto v = get_field(*b, "m_Father");
        if (!v)
            return null_id<block_tag>();

        return parse_reference(*v).value_or(null_id<block_tag>());
    }

    inline std::vector<file_id> children_of(document const & doc, file_id transform)
    {
        std::vector<file_id> out;
        auto const * b = doc.find_by_id(transform);
        if (!b)
            return out;

        auto items = array_items(*b, "m_Children");
        if (!items)
            return out;

        for (auto const & item : *items)
            if (auto ref = parse_reference(item); ref && !is_null(*ref))
                out.push_back(*ref);
        return out;
    }

    inline std::vector<file_id> root_transforms(document const & doc)
    {
        std::vector<file_id> out;
        for (auto const & b : doc.blocks())
        {
            if (!is_spatial(b.cls()) || b.is_stripped())
                continue;

            auto v = get_field(b, "m_Father");
            if (!v)
                continue;

            auto ref = parse_reference(*v);
            if (ref && is_null(*ref))
                out.push_back(b.id());
        }
        return out;
    }

    inline bool is_descendant(document const & doc, file_id node, file_id ancestor)
    {
        // Walk upwards; the step bound stops malformed cyclic input.
        file_id cur = parent_of(doc, node);
        for (size_t steps = 0; !is_null(cur) && steps <= doc.block_count(); ++steps)
        {
            if (cur == ancestor)
                return true;
            cur = parent_of(doc, cur);
        }
        return false;
    }

    inline std::vector<file_id> collect_descendants(document const & doc, file_id transform)
    {
        std::vector<file_id> out;
        std::unordered_set<file_id> seen{ transform };
        std::vector<file_id> pending = children_of(doc, transform);

        auto add = [&](file_id id)
        {
            if (seen.insert(id).second)
                out.push_back(id);
        };

        while (!pending.empty())
        {
            file_id t = pending.back();
            pending.pop_back();
            if (seen.contains(t))
                continue;
            add(t);

            if (auto go = game_object_of(doc, t))
            {
                add(*go);
                for (auto c : components_of(doc, *go))
                    add(c);
            }

            for (auto c : children_of(doc, t))
                pending.push_back(c);
        }
        return out;
    }

//------------------------------------------------------------------------

    inline result<file_id> resolve_game_object(document const & doc, std::string_view ident, bool by_id)
    {
        auto trimmed = detail::trim_sv(ident);
        bool numeric = detail::is_digits(trimmed) || (trimmed.starts_with('-') && detail::is_digits(trimmed.substr(1)));

        if (by_id || numeric)
        {
            auto v = detail::parse_int(trimmed);
            if (!v)
                return make_error(error_kind::not_found, "Invalid fileID: " + std::string(ident));

            file_id id{ *v };
            auto const * b = doc.find_by_id(id);
            if (!b)
                return make_error(error_kind::not_found, "GameObject with fileID " + to_string(id) + " not found");
            if (b->cls() != classes::game_object)
                return make_error(error_kind::not_found,
                    "fileID " + to_string(id) + " is not a GameObject (class " + std::to_string(b->cls()) + ")");
            return id;
        }

        std::vector<std::string> ids;
        file_id found{};
        for (auto const * b : doc.find_by_class(classes::game_object))
        {
            auto name = get_field(*b, "m_Name");
            if (name && *name == trimmed)
            {
                found = b->id();
                ids.push_back(to_string(b->id()));
            }
        }

        if (ids.empty())
            return make_error(error_kind::not_found, "GameObject \"" + std::string(trimmed) + "\" not found");
        if (ids.size() > 1)
            return make_error(error_kind::ambiguous_match,
                "Multiple GameObjects named \"" + std::string(trimmed) + "\" found (fileIDs: "
                + detail::join(ids, ", ") + "). Use numeric fileID to specify which one.");
        return found;
    }

    inline result<file_id> resolve_transform(document const & doc, std::string_view ident, bool by_id)
    {
        auto trimmed = detail::trim_sv(ident);
        if (by_id || detail::is_digits(trimmed))
        {
            // A Transform id is accepted as is.
            if (auto v = detail::parse_int(trimmed))
            {
                auto const * b = doc.find_by_id(file_id{ *v });
                if (b && is_spatial(b->cls()))
                    return b->id();
            }
        }

        auto go = resolve_game_object(doc, ident, by_id);
        if (!go)
            return go.err();

        auto t = transform_of(doc, *go);
        if (!t)
            return make_error(error_kind::malformed, "GameObject " + to_string(*go) + " has no Transform");
        return *t;
    }

} // namespace uyd

#endif // UYD_HIERARCHY_HPP
