// uyd_overrides.hpp - Unity YAML Document (uyd) - PrefabInstance override lists
// Version 0.1.0
// Copyright 2025 The uyd authors
// Licenced as-is under the MIT licence.

#ifndef UYD_OVERRIDES_HPP
#define UYD_OVERRIDES_HPP

#include "uyd_core.hpp"
#include "uyd_document.hpp"
#include "uyd_fields.hpp"
#include "uyd_log.hpp"

namespace uyd
{
//========================================================================
// Types
//========================================================================

    // One `m_Modifications` entry.
    struct modification
    {
        std::string target;            // full reference text
        file_id     target_id;
        std::string property_path;
        std::string value;
        std::string object_reference;
    };

    enum class upsert_action
    {
        updated,
        added
    };

    inline std::string_view to_string(upsert_action a)
    {
        return a == upsert_action::updated ? "updated" : "added";
    }

//========================================================================
// OVERRIDES API
//========================================================================

    // Every operation takes the PrefabInstance block and fails with
    // not_found for any other class.

    result<std::vector<modification>> modifications(block const & instance);

    result<upsert_action> upsert_override(block & instance, file_id target, std::string_view property_path,
                                          std::string_view value,
                                          std::optional<std::string_view> object_reference = std::nullopt,
                                          std::optional<std::string_view> target_descriptor = std::nullopt);

    result<void> remove_override(block & instance, file_id target, std::string_view property_path);

    // Adding a reference already listed succeeds without a change.
    result<void> add_removed_component(block & instance, std::string_view reference);
    result<void> remove_removed_component(block & instance, std::string_view reference);
    result<void> add_removed_game_object(block & instance, std::string_view reference);
    result<void> remove_removed_game_object(block & instance, std::string_view reference);

    // Read helpers

    result<std::vector<std::string>> removed_components(block const & instance);
    result<std::vector<std::string>> removed_game_objects(block const & instance);
    std::vector<file_id> added_game_objects(block const & instance);
    std::vector<file_id> added_components(block const & instance);

    file_id                    transform_parent(block const & instance);
    std::optional<std::string> source_prefab_guid(block const & instance);

    // Display name: the value of an `m_Name` modification, if any.
    std::optional<std::string> instance_name(block const & instance);

    // Stripped blocks standing in for objects of the instance.
    std::vector<file_id> stripped_blocks_of(document const & doc, file_id instance);

    // Numeric id of a PrefabInstance, or its display name.
    result<file_id> resolve_prefab_instance(document const & doc, std::string_view ident);

//========================================================================
// Implementation details
//========================================================================

    namespace detail
    {
        inline result<void> require_instance(block const & b)
        {
            if (b.cls() != classes::prefab_instance)
                return make_error(error_kind::not_found,
                    "fileID " + to_string(b.id()) + " is not a PrefabInstance (class " + std::to_string(b.cls()) + ")");
            return {};
        }

        // Key/value lines of one multi-line sequence item.
        struct item_field
        {
            size_t      line;
            std::string key;
            std::string value;
        };

        inline std::vector<item_field> item_fields(std::vector<std::string> const & lines, array_section const & a, size_t i)
        {
            std::vector<item_field> out;
            for (size_t l = a.items[i]; l < item_end(a, i); ++l)
            {
                if (auto k = parse_key_line(lines[l]))
                    out.push_back({ l, std::string(k->key), std::string(value_of(lines[l], *k)) });
            }
            return out;
        }

        inline std::string const * find_item_field(std::vector<item_field> const & fields, std::string_view key)
        {
            for (auto const & f : fields)
                if (f.key == key)
                    return &f.value;
            return nullptr;
        }

        // Reference texts compared without whitespace.
        inline std::string squeeze(std::string_view s)
        {
            std::string out;
            for (char c : s)
                if (c != ' ' && c != '\t')
                    out += c;
            return out;
        }

        inline result<void> add_reference(block & instance, std::string_view list, std::string_view reference)
        {
            if (auto ok = require_instance(instance); !ok)
                return ok;

            auto ref = trim_sv(reference);
            if (ref.empty())
                return make_error(error_kind::validation_failure, "Reference cannot be empty");

            auto a = locate_array(instance.lines(), { std::string(list) });
            if (!a)
                return make_error(error_kind::malformed,
                    std::string(list) + " property not found in PrefabInstance " + to_string(instance.id()));

            auto key = squeeze(ref);
            for (size_t i = 0; i < a->items.size(); ++i)
            {
                auto span = item_value(instance.lines(), a->items[i]);
                auto text = std::string_view(instance.lines()[span.line]).substr(span.begin, span.end - span.begin);
                if (squeeze(text) == key)
                {
                    log::debug(std::string(list) + " already holds " + std::string(ref));
                    return {};
                }
            }

            insert_item(instance.edit_lines(), *a, { std::string(ref) }, std::nullopt);
            return {};
        }

        inline result<void> remove_reference(block & instance, std::string_view list, std::string_view reference)
        {
            if (auto ok = require_instance(instance); !ok)
                return ok;

            auto a = locate_array(instance.lines(), { std::string(list) });
            if (!a)
                return make_error(error_kind::malformed,
                    std::string(list) + " property not found in PrefabInstance " + to_string(instance.id()));

            auto key = squeeze(trim_sv(reference));
            for (size_t i = 0; i < a->items.size(); ++i)
            {
                auto span = item_value(instance.lines(), a->items[i]);
                auto text = std::string_view(instance.lines()[span.line]).substr(span.begin, span.end - span.begin);
                if (squeeze(text) == key)
                {
                    remove_item(instance.edit_lines(), *a, i);
                    return {};
                }
            }

            return make_error(error_kind::not_found,
                "Reference \"" + std::string(trim_sv(reference)) + "\" not found in " + std::string(list));
        }

        inline result<std::vector<std::string>> list_references(block const & instance, std::string_view list)
        {
            if (auto ok = require_instance(instance); !ok)
                return ok.err();
            return array_items(instance, list);
        }

        // `addedObject` of each item, or the item's first reference.
        inline std::vector<file_id> added_objects(block const & instance, std::string_view list)
        {
            std::vector<file_id> out;
            auto const & lines = instance.lines();
            auto a = locate_array(lines, { std::string(list) });
            if (!a)
                return out;

            for (size_t i = 0; i < a->items.size(); ++i)
            {
                auto fields = item_fields(lines, *a, i);
                std::optional<file_id> ref;
                if (auto const * v = find_item_field(fields, "addedObject"))
                    ref = parse_reference(*v);
                else
                {
                    auto span = item_value(lines, a->items[i]);
                    ref = parse_reference(std::string_view(lines[span.line]).substr(span.begin));
                }
                if (ref && !is_null(*ref))
                    out.push_back(*ref);
            }
            return out;
        }

    } // namespace detail

//========================================================================
// API implementation
//========================================================================

    inline result<std::vector<modification>> modifications(block const & instance)
    {
        if (auto ok = detail::require_instance(instance); !ok)
            return ok.err();

        auto const & lines = instance.lines();
        auto a = detail::locate_array(lines, { "m_Modifications" });
        if (!a)
            return a.err();

        std::vector<modification> out;
        for (size_t i = 0; i < a->items.size(); ++i)
        {
            auto fields = detail::item_fields(lines, *a, i);

            modification m;
            if (auto const * t = detail::find_item_field(fields, "target"))
            {
                m.target = *t;
                m.target_id = parse_reference(*t).value_or(file_id{});
            }
            if (auto const * p = detail::find_item_field(fields, "propertyPath"))
                m.property_path = *p;
            if (auto const * v = detail::find_item_field(fields, "value"))
                m.value = *v;
            if (auto const * r = detail::find_item_field(fields, "objectReference"))
                m.object_reference = *r;
            else
                m.object_reference = std::string(detail::NULL_REFERENCE);

            out.push_back(std::move(m));
        }
        return out;
    }

    inline result<upsert_action> upsert_override(block & instance, file_id target, std::string_view property_path,
                                                 std::string_view value,
                                                 std::optional<std::string_view> object_reference,
                                                 std::optional<std::string_view> target_descriptor)
    {
        if (auto ok = detail::require_instance(instance); !ok)
            return ok.err();

        if (detail::trim_sv(property_path).empty())
            return make_error(error_kind::validation_failure, "Property path cannot be empty");
        if (value.find('\n') != std::string_view::npos)
            return make_error(error_kind::validation_failure, "Value cannot contain newlines");

        std::string obj_ref = object_reference ? std::string(detail::trim_sv(*object_reference))
                                               : std::string(detail::NULL_REFERENCE);
        if (obj_ref.empty())
            obj_ref = std::string(detail::NULL_REFERENCE);

        auto a = detail::locate_array(instance.lines(), { "m_Modifications" });
        if (!a)
            return a.err();

        std::optional<std::string> sibling_target;
        for (size_t i = 0; i < a->items.size(); ++i)
        {
            auto fields = detail::item_fields(instance.lines(), *a, i);
            auto const * t = detail::find_item_field(fields, "target");
            auto const * p = detail::find_item_field(fields, "propertyPath");
            if (!t || parse_reference(*t) != std::optional<file_id>{ target })
                continue;

            if (!sibling_target)
                sibling_target = *t;

            if (!p || *p != detail::trim_sv(property_path))
                continue;

            // Matching entry: rewrite value and objectReference in place.
            auto & lines = instance.edit_lines();
            for (auto const & f : fields)
            {
                if (f.key != "value" && f.key != "objectReference")
                    continue;

                auto k = detail::parse_key_line(lines[f.line]);
                detail::replace_span(lines[f.line], k->value_begin, k->value_end,
                                     f.key == "value" ? value : std::string_view(obj_ref));
            }
            return upsert_action::updated;
        }

        std::string descriptor;
        if (sibling_target)
            descriptor = *sibling_target;
        else if (target_descriptor && !detail::trim_sv(*target_descriptor).empty())
            descriptor = std::string(detail::trim_sv(*target_descriptor));
        else
            return make_error(error_kind::not_found,
                "Cannot infer target for new override \"" + std::string(property_path)
                + "\". Provide a target descriptor (e.g. \"{fileID: " + to_string(target) + ", guid: ..., type: 3}\").");

        std::vector<std::string> item{
            "target: " + descriptor,
            "propertyPath: " + std::string(detail::trim_sv(property_path)),
            "value: " + std::string(value),
            "objectReference: " + obj_ref,
        };

        detail::insert_item(instance.edit_lines(), *a, item, std::nullopt);
        return upsert_action::added;
    }

    inline result<void> remove_override(block & instance, file_id target, std::string_view property_path)
    {
        if (auto ok = detail::require_instance(instance); !ok)
            return ok;

        auto a = detail::locate_array(instance.lines(), { "m_Modifications" });
        if (!a)
            return a.err();

        for (size_t i = 0; i < a->items.size(); ++i)
        {
            auto fields = detail::item_fields(instance.lines(), *a, i);
            auto const * t = detail::find_item_field(fields, "target");
            auto const * p = detail::find_item_field(fields, "propertyPath");
            if (t && p && parse_reference(*t) == std::optional<file_id>{ target } && *p == detail::trim_sv(property_path))
            {
                detail::remove_item(instance.edit_lines(), *a, i);
                return {};
            }
        }

        return make_error(error_kind::not_found,
            "Modification entry for property \"" + std::string(property_path)
            + "\" with target " + to_string(target) + " not found");
    }

//------------------------------------------------------------------------

    inline result<void> add_removed_component(block & instance, std::string_view reference)
    {
        return detail::add_reference(instance, "m_RemovedComponents", reference);
    }

    inline result<void> remove_removed_component(block & instance, std::string_view reference)
    {
        return detail::remove_reference(instance, "m_RemovedComponents", reference);
    }

    inline result<void> add_removed_game_object(block & instance, std::string_view reference)
    {
        return detail::add_reference(instance, "m_RemovedGameObjects", reference);
    }

    inline result<void> remove_removed_game_object(block & instance, std::string_view reference)
    {
        return detail::remove_reference(instance, "m_RemovedGameObjects", reference);
    }

    inline result<std::vector<std::string>> removed_components(block const & instance)
    {
        return detail::list_references(instance, "m_RemovedComponents");
    }

    inline result<std::vector<std::string>> removed_game_objects(block const & instance)
    {
        return detail::list_references(instance, "m_RemovedGameObjects");
    }

    inline std::vector<file_id> added_game_objects(block const & instance)
    {
        return detail::added_objects(instance, "m_AddedGameObjects");
    }

    inline std::vector<file_id> added_components(block const & instance)
    {
        return detail::added_objects(instance, "m_AddedComponents");
    }

//------------------------------------------------------------------------

    inline file_id transform_parent(block const & instance)
    {
        auto v = get_field(instance, "m_TransformParent");
        if (!v)
            return null_id<block_tag>();
        return parse_reference(*v).value_or(null_id<block_tag>());
    }

    inline std::optional<std::string> source_prefab_guid(block const & instance)
    {
        auto v = get_field(instance, "m_SourcePrefab.guid");
        if (!v || v->empty())
            return std::nullopt;
        return *v;
    }

    inline std::optional<std::string> instance_name(block const & instance)
    {
        auto mods = modifications(instance);
        if (!mods)
            return std::nullopt;

        for (auto const & m : *mods)
            if (m.property_path == "m_Name")
                return m.value;
        return std::nullopt;
    }

    inline std::vector<file_id> stripped_blocks_of(document const & doc, file_id instance)
    {
        std::vector<file_id> out;
        for (auto const & b : doc.blocks())
        {
            if (!b.is_stripped())
                continue;

            auto v = get_field(b, "m_PrefabInstance");
            if (v && parse_reference(*v) == std::optional<file_id>{ instance })
                out.push_back(b.id());
        }
        return out;
    }

    inline result<file_id> resolve_prefab_instance(document const & doc, std::string_view ident)
    {
        auto trimmed = detail::trim_sv(ident);
        if (auto v = detail::parse_int(trimmed))
        {
            auto const * b = doc.find_by_id(file_id{ *v });
            if (b && b->cls() == classes::prefab_instance)
                return b->id();
        }

        std::vector<std::string> ids;
        file_id found{};
        for (auto const * b : doc.find_by_class(classes::prefab_instance))
        {
            if (instance_name(*b) == std::optional<std::string>{ std::string(trimmed) })
            {
                found = b->id();
                ids.push_back(to_string(b->id()));
            }
        }

        if (ids.empty())
            return make_error(error_kind::not_found, "PrefabInstance \"" + std::string(trimmed) + "\" not found");
        if (ids.size() > 1)
            return make_error(error_kind::ambiguous_match,
                "Multiple PrefabInstances named \"" + std::string(trimmed) + "\" found (fileIDs: "
                + detail::join(ids, ", ") + "). Use numeric fileID to specify which one.");
        return found;
    }

} // namespace uyd

#endif // UYD_OVERRIDES_HPP
