// uyd_query.hpp - Unity YAML Document (uyd) - Query Interface
// Version 0.1.0
// Copyright 2025 The uyd authors
// Licenced as-is under the MIT licence.

#ifndef UYD_QUERY_HPP
#define UYD_QUERY_HPP

#include "uyd_core.hpp"
#include "uyd_document.hpp"
#include "uyd_fields.hpp"
#include "uyd_hierarchy.hpp"
#include "uyd_overrides.hpp"

#include <algorithm>
#include <variant>

namespace uyd
{
    //========================================================================
    // RESULT TYPES
    //========================================================================

    struct name_match
    {
        file_id     id;
        std::string name;
        double      score = 0.0;
        bool        active = true;
    };

    // One row of a listing: a GameObject or a PrefabInstance.
    struct object_summary
    {
        file_id     id;
        class_id    cls = 0;
        std::string name;
        bool        active = true;
    };

    struct listing_options
    {
        size_t max_page_size = 1000;
    };

    struct page
    {
        std::vector<object_summary> items;
        size_t                      total = 0;
        size_t                      cursor = 0;
        size_t                      page_size = 0;
        std::optional<size_t>       next_cursor;    // empty on the last page
    };

    struct component_summary
    {
        file_id     id;
        class_id    cls = 0;
        std::string type;
    };

    struct game_object_detail
    {
        file_id                        id;
        std::string                    name;
        bool                           active = true;
        std::string                    tag;
        std::int64_t                   layer = 0;
        std::vector<component_summary> components;
        std::optional<file_id>         transform;
        file_id                        parent;
        std::vector<file_id>           children;
    };

    struct prefab_instance_detail
    {
        file_id                    id;
        std::optional<std::string> name;
        std::optional<std::string> source_guid;
        file_id                    transform_parent;
        std::vector<modification>  modifications;
        std::vector<std::string>   removed_components;
        std::vector<std::string>   removed_game_objects;
        std::vector<file_id>       stripped;
    };

    // Any other block; `fields` holds the top-level keys in body order.
    struct component_detail
    {
        file_id                                          id;
        class_id                                         cls = 0;
        std::string                                      type;
        bool                                             stripped = false;
        std::optional<file_id>                           game_object;
        std::vector<std::pair<std::string, std::string>> fields;
    };

    using block_detail = std::variant<game_object_detail, prefab_instance_detail, component_detail>;

    //========================================================================
    // QUERY API
    //========================================================================

    // GameObjects by `m_Name`. Exact mode is case-sensitive equality;
    // fuzzy mode scores case-insensitively and drops anything under 0.4.
    // Sorted by score, best first, ties in document order.
    std::vector<name_match> find_by_name(document const & doc, std::string_view pattern, bool fuzzy);

    // GameObjects and PrefabInstances in document order, `page_size`
    // capped at `opts.max_page_size`.
    result<page> list_objects(document const & doc, size_t page_size, size_t cursor,
                              listing_options const & opts = {});

    block_detail describe(document const & doc, block const & b);

    //========================================================================
    // QUERY IMPLEMENTATION
    //========================================================================

    namespace detail
    {
        constexpr double FUZZY_CUTOFF = 0.4;

        inline size_t levenshtein(std::string_view a, std::string_view b)
        {
            std::vector<size_t> row(b.size() + 1);
            for (size_t j = 0; j <= b.size(); ++j)
                row[j] = j;

            for (size_t i = 1; i <= a.size(); ++i)
            {
                size_t diag = row[0];
                row[0] = i;
                for (size_t j = 1; j <= b.size(); ++j)
                {
                    size_t up = row[j];
                    size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
                    row[j] = std::min({ row[j] + 1, row[j - 1] + 1, diag + cost });
                    diag = up;
                }
            }
            return row[b.size()];
        }

        inline double fuzzy_score(std::string_view pattern, std::string_view name)
        {
            auto p = to_lower(pattern);
            auto n = to_lower(name);

            if (p == n)                            return 1.0;
            if (n.starts_with(p))                  return 0.9;
            if (n.find(p) != std::string::npos)    return 0.75;

            size_t longest = std::max(p.size(), n.size());
            if (longest == 0)
                return 0.0;
            return 1.0 - static_cast<double>(levenshtein(p, n)) / static_cast<double>(longest);
        }

        inline bool is_active(block const & b)
        {
            auto v = get_field(b, "m_IsActive");
            return !v || *v != "0";
        }

        inline object_summary summarize(block const & b)
        {
            object_summary s{ b.id(), b.cls() };
            if (b.cls() == classes::prefab_instance)
            {
                s.name = instance_name(b).value_or("");
                return s;
            }

            if (auto n = get_field(b, "m_Name"))
                s.name = *n;
            s.active = is_active(b);
            return s;
        }

        // Top-level `key: value` pairs; nested lines are skipped.
        inline std::vector<std::pair<std::string, std::string>> top_level_fields(block const & b)
        {
            std::vector<std::pair<std::string, std::string>> out;
            auto const & lines = b.lines();

            size_t base = std::string::npos;
            for (size_t i = 1; i < lines.size(); ++i)
            {
                if (is_blank(lines[i]))
                    continue;

                auto k = parse_key_line(lines[i]);
                if (!k || k->list_item)
                    continue;

                if (base == std::string::npos)
                    base = k->indent;
                if (k->indent != base)
                    continue;

                out.emplace_back(std::string(k->key), std::string(value_of(lines[i], *k)));
            }
            return out;
        }
    }

    inline std::vector<name_match> find_by_name(document const & doc, std::string_view pattern, bool fuzzy)
    {
        std::vector<name_match> out;
        for (auto const * b : doc.find_by_class(classes::game_object))
        {
            auto name = get_field(*b, "m_Name");
            if (!name)
                continue;

            double score = 0.0;
            if (!fuzzy)
            {
                if (*name != pattern)
                    continue;
                score = 1.0;
            }
            else
            {
                score = detail::fuzzy_score(pattern, *name);
                if (score < detail::FUZZY_CUTOFF)
                    continue;
            }

            out.push_back(name_match{ b->id(), *name, score, detail::is_active(*b) });
        }

        std::stable_sort(out.begin(), out.end(),
            [](name_match const & a, name_match const & b) { return a.score > b.score; });
        return out;
    }

    inline result<page> list_objects(document const & doc, size_t page_size, size_t cursor,
                                     listing_options const & opts)
    {
        if (page_size == 0)
            return make_error(error_kind::validation_failure, "page size must be a positive integer");

        page p;
        p.cursor = cursor;
        p.page_size = std::min(page_size, opts.max_page_size);

        std::vector<block const *> objects;
        for (auto const & b : doc.blocks())
            if ((b.cls() == classes::game_object || b.cls() == classes::prefab_instance) && !b.is_stripped())
                objects.push_back(&b);

        p.total = objects.size();
        if (cursor >= p.total)
            return p;

        size_t end = std::min(p.total, cursor + p.page_size);
        for (size_t i = cursor; i < end; ++i)
            p.items.push_back(detail::summarize(*objects[i]));

        if (end < p.total)
            p.next_cursor = end;
        return p;
    }

    inline block_detail describe(document const & doc, block const & b)
    {
        if (b.cls() == classes::game_object && !b.is_stripped())
        {
            game_object_detail d;
            d.id = b.id();
            if (auto name = get_field(b, "m_Name"))
                d.name = *name;
            d.active = detail::is_active(b);
            if (auto tag = get_field(b, "m_TagString"))
                d.tag = *tag;
            if (auto layer = get_field(b, "m_Layer"))
                d.layer = detail::parse_int(*layer).value_or(0);

            for (auto c : components_of(doc, b.id()))
            {
                auto const * cb = doc.find_by_id(c);
                class_id cls = cb ? cb->cls() : 0;
                d.components.push_back(component_summary{ c, cls, cb ? cb->type() : std::string("Missing") });
            }

            d.transform = transform_of(doc, b.id());
            if (d.transform)
            {
                d.parent = parent_of(doc, *d.transform);
                d.children = children_of(doc, *d.transform);
            }
            return d;
        }

        if (b.cls() == classes::prefab_instance)
        {
            prefab_instance_detail d;
            d.id = b.id();
            d.name = instance_name(b);
            d.source_guid = source_prefab_guid(b);
            d.transform_parent = transform_parent(b);
            if (auto mods = modifications(b))
                d.modifications = std::move(*mods);
            if (auto rc = removed_components(b))
                d.removed_components = std::move(*rc);
            if (auto rg = removed_game_objects(b))
                d.removed_game_objects = std::move(*rg);
            d.stripped = stripped_blocks_of(doc, b.id());
            return d;
        }

        component_detail d;
        d.id = b.id();
        d.cls = b.cls();
        d.type = b.type();
        d.stripped = b.is_stripped();
        d.game_object = game_object_of(doc, b.id());
        d.fields = detail::top_level_fields(b);
        return d;
    }

} // namespace uyd

#endif // UYD_QUERY_HPP
