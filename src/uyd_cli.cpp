// uyd_cli.cpp - Unity YAML Document (uyd) - Command line front end
// Version 0.1.0
// Copyright 2025 The uyd authors
// Licenced as-is under the MIT licence.

#include "uyd.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <map>
#include <set>

using json = nlohmann::json;

namespace
{
    using namespace uyd;

    constexpr size_t DEFAULT_PAGE_SIZE = 200;
    constexpr size_t DEFAULT_TRACE_DEPTH = 3;

    char const * USAGE = R"(usage: uyd <command> <file> [args] [options]

read
  list <file>                         [--page-size N] [--cursor N]
  get <file> <object> [field.path]
  find <file> <pattern>               [--fuzzy]
  trace <file> <fileID>               [--direction outgoing|incoming|both] [--depth N]
  validate <file>

edit
  set <file> <object> <field.path> <value>
  array <file> <fileID> <array.path> insert|append|remove [value] [--index N]
  batch <file> <edits JSON>           all edits or none, one save
  add <file> <name>                   [--parent <object>]
  add-component <file> <object> <Type>
  remove-component <file> <fileID>
  copy-component <file> <fileID> <object>
  delete <file> <object>              [--cascade]
  delete-instance <file> <instance>
  reparent <file> <object> <parent|root>
  clone <file> <object>               [--name <name>]
  unpack <file> <instance>            [--project <dir>]

prefab overrides
  override-set <file> <instance> <target fileID> <path> <value> [--object-ref R] [--target T]
  override-remove <file> <instance> <target fileID> <path>
  removed-component-add|removed-component-remove <file> <instance> <reference>
  removed-object-add|removed-object-remove <file> <instance> <reference>

options
  --by-id            treat object arguments as file IDs
  --format json|text
  --verbose          debug logging to stderr

batch edits
  [{"op": "set", "target": "Player", "property": "m_Layer", "value": "5"},
   {"op": "append", "target": "101", "array": "m_Children", "value": "{fileID: 301}"},
   {"op": "reparent", "target": "Enemy", "parent": "root"}]
  op is set (default), insert, append, remove, reparent, delete or copy-component.
)";

//========================================================================
// Arguments
//========================================================================

    struct arguments
    {
        std::string                        command;
        std::vector<std::string>           positional;
        std::map<std::string, std::string> options;
        std::set<std::string>              switches;

        bool has(std::string const & s) const { return switches.contains(s); }

        std::optional<std::string> option(std::string const & name) const
        {
            auto it = options.find(name);
            if (it == options.end())
                return std::nullopt;
            return it->second;
        }
    };

    // Thrown for malformed command lines.
    struct usage_error : std::runtime_error
    {
        using std::runtime_error::runtime_error;
    };

    // Carries a library error out of a command.
    struct command_failure : std::runtime_error
    {
        explicit command_failure(error e)
            : std::runtime_error(e.message)
            , err(std::move(e))
        {}

        error err;
    };

    [[noreturn]] void fail(error e)
    {
        throw command_failure(std::move(e));
    }

    arguments parse_arguments(int argc, char ** argv)
    {
        static std::set<std::string> const switch_names{ "--verbose", "--cascade", "--by-id", "--fuzzy", "--help" };
        static std::set<std::string> const value_names{
            "--page-size", "--cursor", "--depth", "--direction", "--format", "--project",
            "--parent", "--name", "--object-ref", "--target", "--index"
        };

        arguments args;
        for (int i = 1; i < argc; ++i)
        {
            std::string a = argv[i];
            if (a.starts_with("--"))
            {
                std::string value;
                if (auto eq = a.find('='); eq != std::string::npos)
                {
                    value = a.substr(eq + 1);
                    a = a.substr(0, eq);
                    if (!value_names.contains(a))
                        throw usage_error("Unknown option " + a);
                    args.options[a] = value;
                    continue;
                }

                if (switch_names.contains(a))
                    args.switches.insert(a);
                else if (value_names.contains(a))
                {
                    if (i + 1 >= argc)
                        throw usage_error("Option " + a + " needs a value");
                    args.options[a] = argv[++i];
                }
                else
                    throw usage_error("Unknown option " + a);
            }
            else if (args.command.empty())
                args.command = a;
            else
                args.positional.push_back(a);
        }
        return args;
    }

    size_t parse_count(std::optional<std::string> const & text, size_t fallback, std::string const & flag, bool allow_zero)
    {
        if (!text)
            return fallback;

        auto v = detail::parse_int(*text);
        if (!v || *v < 0 || (*v == 0 && !allow_zero))
            throw usage_error(flag + (allow_zero ? " must be a non-negative integer" : " must be a positive integer"));
        return static_cast<size_t>(*v);
    }

    void require_positional(arguments const & args, size_t n)
    {
        if (args.positional.size() < n)
            throw usage_error("'" + args.command + "' needs " + std::to_string(n) + " arguments");
    }

//========================================================================
// JSON rendering
//========================================================================

    json id_json(file_id id)
    {
        return to_string(id);
    }

    json error_json(error const & e)
    {
        return json{ { "error", e.message }, { "kind", std::string(to_string(e.kind)) } };
    }

    json summary_json(object_summary const & s)
    {
        return json{
            { "file_id", id_json(s.id) },
            { "type", type_name(s.cls) },
            { "name", s.name },
            { "active", s.active },
        };
    }

    json modification_json(modification const & m)
    {
        return json{
            { "target", m.target },
            { "target_file_id", id_json(m.target_id) },
            { "property_path", m.property_path },
            { "value", m.value },
            { "object_reference", m.object_reference },
        };
    }

    json ids_json(std::vector<file_id> const & ids)
    {
        json out = json::array();
        for (auto id : ids)
            out.push_back(id_json(id));
        return out;
    }

    json detail_json(block_detail const & d)
    {
        if (auto const * go = std::get_if<game_object_detail>(&d))
        {
            json comps = json::array();
            for (auto const & c : go->components)
                comps.push_back(json{ { "file_id", id_json(c.id) }, { "type", c.type }, { "class_id", c.cls } });

            json out{
                { "file_id", id_json(go->id) },
                { "type", "GameObject" },
                { "name", go->name },
                { "active", go->active },
                { "tag", go->tag },
                { "layer", go->layer },
                { "components", comps },
                { "children", ids_json(go->children) },
            };
            if (go->transform)
            {
                out["transform"] = id_json(*go->transform);
                out["parent_transform"] = id_json(go->parent);
            }
            return out;
        }

        if (auto const * pi = std::get_if<prefab_instance_detail>(&d))
        {
            json mods = json::array();
            for (auto const & m : pi->modifications)
                mods.push_back(modification_json(m));

            return json{
                { "file_id", id_json(pi->id) },
                { "type", "PrefabInstance" },
                { "name", pi->name ? json(*pi->name) : json(nullptr) },
                { "source_guid", pi->source_guid ? json(*pi->source_guid) : json(nullptr) },
                { "transform_parent", id_json(pi->transform_parent) },
                { "modifications", mods },
                { "removed_components", pi->removed_components },
                { "removed_game_objects", pi->removed_game_objects },
                { "stripped", ids_json(pi->stripped) },
            };
        }

        auto const & c = std::get<component_detail>(d);
        json fields = json::object();
        for (auto const & [k, v] : c.fields)
            if (!fields.contains(k))
                fields[k] = v;

        json out{
            { "file_id", id_json(c.id) },
            { "type", c.type },
            { "class_id", c.cls },
            { "stripped", c.stripped },
            { "fields", fields },
        };
        if (c.game_object)
            out["game_object"] = id_json(*c.game_object);
        return out;
    }

    // `key: value` lines for --format text; nested values stay JSON.
    void print_text(json const & j, std::ostream & os)
    {
        if (!j.is_object())
        {
            os << (j.is_string() ? j.get<std::string>() : j.dump()) << '\n';
            return;
        }

        for (auto it = j.begin(); it != j.end(); ++it)
            os << it.key() << ": " << (it->is_string() ? it->get<std::string>() : it->dump()) << '\n';
    }

//========================================================================
// Commands
//========================================================================

    class command_runner
    {
    public:
        explicit command_runner(arguments const & args)
            : args_(args)
            , by_id_(args.has("--by-id"))
        {}

        json run()
        {
            auto const & c = args_.command;

            if (c == "list")                      return list();
            if (c == "get")                       return get();
            if (c == "find")                      return find();
            if (c == "trace")                     return trace_refs();
            if (c == "validate")                  return validate_file();
            if (c == "set")                       return set();
            if (c == "array")                     return array();
            if (c == "batch")                     return batch();
            if (c == "add")                       return add();
            if (c == "add-component")             return add_component();
            if (c == "remove-component")          return remove_component();
            if (c == "copy-component")            return copy_component();
            if (c == "delete")                    return remove();
            if (c == "delete-instance")           return remove_instance();
            if (c == "reparent")                  return reparent();
            if (c == "clone")                     return clone();
            if (c == "unpack")                    return unpack();
            if (c == "override-set")              return override_set();
            if (c == "override-remove")           return override_remove();
            if (c == "removed-component-add")     return removed_list(&add_removed_component, "added");
            if (c == "removed-component-remove")  return removed_list(&remove_removed_component, "removed");
            if (c == "removed-object-add")        return removed_list(&add_removed_game_object, "added");
            if (c == "removed-object-remove")     return removed_list(&remove_removed_game_object, "removed");

            throw usage_error("Unknown command '" + c + "'");
        }

    private:
        arguments const & args_;
        bool              by_id_;
        document          doc_;

        std::string const & arg(size_t i) const { return args_.positional[i]; }

        // Loads positional[0]; every command starts here.
        void open(size_t needed)
        {
            require_positional(args_, needed);
            auto loaded = document::load(arg(0));
            if (!loaded)
                fail(loaded.err());
            doc_ = std::move(*loaded);
        }

        template <typename T>
        T take(result<T> r)
        {
            if (!r)
                fail(r.err());
            return std::move(*r);
        }

        void take(result<void> r)
        {
            if (!r)
                fail(r.err());
        }

        json commit(json out)
        {
            auto written = take(save(doc_));
            out["success"] = true;
            out["file"] = doc_.path().string();
            out["bytes_written"] = written;
            return out;
        }

        block & block_for(std::string const & ident)
        {
            auto trimmed = detail::trim_sv(ident);
            if (by_id_ || detail::is_digits(trimmed) || trimmed.starts_with('-'))
            {
                if (auto v = detail::parse_int(trimmed))
                    if (auto * b = doc_.find_by_id(file_id{ *v }))
                        return *b;
            }

            auto go = take(resolve_game_object(doc_, ident, by_id_));
            return *doc_.find_by_id(go);
        }

        block & instance_for(std::string const & ident)
        {
            auto id = take(resolve_prefab_instance(doc_, ident));
            return *doc_.find_by_id(id);
        }

        file_id target_id(std::string const & text) const
        {
            auto v = detail::parse_int(text);
            if (!v)
                throw usage_error("Invalid target fileID: " + text);
            return file_id{ *v };
        }

    //--------------------------------------------------------------------
    // read
    //--------------------------------------------------------------------

        json list()
        {
            open(1);
            auto page_size = parse_count(args_.option("--page-size"), DEFAULT_PAGE_SIZE, "--page-size", false);
            auto cursor = parse_count(args_.option("--cursor"), 0, "--cursor", true);

            auto p = take(list_objects(doc_, page_size, cursor));

            json items = json::array();
            for (auto const & s : p.items)
                items.push_back(summary_json(s));

            return json{
                { "file", arg(0) },
                { "total", p.total },
                { "cursor", p.cursor },
                { "page_size", p.page_size },
                { "next_cursor", p.next_cursor ? json(*p.next_cursor) : json(nullptr) },
                { "truncated", p.next_cursor.has_value() },
                { "objects", items },
            };
        }

        json get()
        {
            open(2);
            block & b = block_for(arg(1));

            if (args_.positional.size() > 2)
            {
                auto value = take(get_field(b, arg(2)));
                return json{ { "file_id", id_json(b.id()) }, { "path", arg(2) }, { "value", value } };
            }
            return detail_json(describe(doc_, b));
        }

        json find()
        {
            open(2);
            bool fuzzy = args_.has("--fuzzy");

            json matches = json::array();
            for (auto const & m : find_by_name(doc_, arg(1), fuzzy))
            {
                json j{ { "file_id", id_json(m.id) }, { "name", m.name }, { "active", m.active } };
                if (fuzzy)
                    j["match_score"] = m.score;
                matches.push_back(j);
            }
            return json{ { "pattern", arg(1) }, { "fuzzy", fuzzy }, { "count", matches.size() }, { "matches", matches } };
        }

        json trace_refs()
        {
            open(2);
            auto dir_text = args_.option("--direction").value_or("both");
            auto dir = direction_from_name(dir_text);
            if (!dir)
                throw usage_error("--direction must be outgoing, incoming or both");
            auto depth = parse_count(args_.option("--depth"), DEFAULT_TRACE_DEPTH, "--depth", true);

            auto start = block_for(arg(1)).id();
            auto edges = take(trace(doc_, start, *dir, depth));

            json out = json::array();
            for (auto const & e : edges)
                out.push_back(json{
                    { "source", id_json(e.source) },
                    { "target", id_json(e.target) },
                    { "depth", e.depth },
                    { "source_type", type_name(e.source_class) },
                    { "target_type", type_name(e.target_class) },
                });

            return json{
                { "start", id_json(start) },
                { "direction", std::string(to_string(*dir)) },
                { "max_depth", depth },
                { "edges", out },
            };
        }

        json validate_file()
        {
            open(1);
            auto report = validate(doc_);
            return json{ { "file", arg(0) }, { "valid", report.valid }, { "problems", report.problems } };
        }

    //--------------------------------------------------------------------
    // edit
    //--------------------------------------------------------------------

        json set()
        {
            open(4);
            block & b = block_for(arg(1));
            take(set_field(b, arg(2), arg(3)));
            return commit(json{ { "file_id", id_json(b.id()) }, { "path", arg(2) }, { "value", arg(3) } });
        }

        json array()
        {
            open(4);
            auto action = array_action_from_name(arg(3));
            if (!action)
                throw usage_error("Action must be insert, append or remove");
            if (*action != array_action::remove && args_.positional.size() < 5)
                throw usage_error("A value is required for " + arg(3));

            std::optional<size_t> index;
            if (auto i = args_.option("--index"))
                index = parse_count(i, 0, "--index", true);

            editor ed(doc_);
            auto value = args_.positional.size() > 4 ? std::optional<std::string_view>(arg(4)) : std::nullopt;
            auto length = take(ed.edit_array(arg(1), arg(2), *action, value, index));

            return commit(json{
                { "file_id", arg(1) },
                { "array", arg(2) },
                { "action", arg(3) },
                { "new_length", length },
            });
        }

        json batch()
        {
            open(2);

            json edits;
            try
            {
                edits = json::parse(arg(1));
            }
            catch (json::parse_error const & e)
            {
                throw usage_error(std::string("Invalid JSON for edits: ") + e.what());
            }
            if (!edits.is_array() || edits.empty())
                throw usage_error("Batch edits must be a non-empty JSON array");

            editor ed(doc_);
            json applied = json::array();

            take(ed.transaction([&]() -> result<void>
            {
                for (size_t i = 0; i < edits.size(); ++i)
                {
                    auto r = apply_edit(ed, edits[i]);
                    if (!r)
                        return make_error(r.err().kind, "Edit " + std::to_string(i) + ": " + r.err().message);
                    applied.push_back(std::move(*r));
                }
                return {};
            }));

            return commit(json{ { "applied", applied.size() }, { "edits", applied } });
        }

        // First of `keys` present in `e`, as text.
        static std::optional<std::string> text_of(json const & e, std::initializer_list<char const *> keys)
        {
            for (auto const * k : keys)
            {
                auto it = e.find(k);
                if (it == e.end() || it->is_null())
                    continue;
                return it->is_string() ? it->get<std::string>() : it->dump();
            }
            return std::nullopt;
        }

        result<json> apply_edit(editor & ed, json const & e)
        {
            if (!e.is_object())
                return make_error(error_kind::validation_failure, "Each edit must be a JSON object");

            auto op = text_of(e, { "op" }).value_or("set");
            auto target = text_of(e, { "target", "object_name", "file_id" });
            if (!target)
                return make_error(error_kind::validation_failure, "Edit needs a \"target\"");

            json out{ { "op", op }, { "target", *target } };

            if (op == "set")
            {
                auto property = text_of(e, { "property", "path" });
                auto value = text_of(e, { "value", "new_value" });
                if (!property || !value)
                    return make_error(error_kind::validation_failure, "set needs \"property\" and \"value\"");

                auto r = ed.set_fields({ field_edit{ *target, *property, *value } }, by_id_);
                if (!r)
                    return r.err();
                out["property"] = *property;
                out["value"] = *value;
                return out;
            }

            if (auto action = array_action_from_name(op))
            {
                auto path = text_of(e, { "array", "property" });
                if (!path)
                    return make_error(error_kind::validation_failure, op + " needs \"array\"");

                auto value = text_of(e, { "value" });
                std::optional<size_t> index;
                if (auto i = e.find("index"); i != e.end() && i->is_number_unsigned())
                    index = i->get<size_t>();

                auto r = ed.edit_array(*target, *path, *action,
                    value ? std::optional<std::string_view>(*value) : std::nullopt, index);
                if (!r)
                    return r.err();
                out["array"] = *path;
                out["new_length"] = *r;
                return out;
            }

            if (op == "reparent")
            {
                auto parent = text_of(e, { "parent" });
                if (!parent)
                    return make_error(error_kind::validation_failure, "reparent needs \"parent\"");

                auto r = ed.reparent(*target, *parent, by_id_);
                if (!r)
                    return r.err();
                out["old_parent"] = id_json(r->old_parent);
                out["new_parent"] = id_json(r->new_parent);
                return out;
            }

            if (op == "delete")
            {
                bool cascade = e.value("cascade", false);
                auto r = ed.delete_object(*target, cascade, by_id_);
                if (!r)
                    return r.err();
                out["removed"] = ids_json(r->removed);
                return out;
            }

            if (op == "copy-component")
            {
                auto to = text_of(e, { "to", "game_object" });
                if (!to)
                    return make_error(error_kind::validation_failure, "copy-component needs \"to\"");

                auto r = ed.copy_component(*target, *to, by_id_);
                if (!r)
                    return r.err();
                out["component_id"] = id_json(*r);
                return out;
            }

            return make_error(error_kind::validation_failure, "Unknown batch op \"" + op + "\"");
        }

        json add()
        {
            open(2);
            editor ed(doc_);
            auto parent = args_.option("--parent");

            auto created = parent
                ? take(ed.add_game_object(arg(1), std::string_view(*parent), by_id_))
                : take(ed.add_game_object(arg(1)));

            return commit(json{
                { "name", arg(1) },
                { "game_object_id", id_json(created.game_object) },
                { "transform_id", id_json(created.transform) },
            });
        }

        json add_component()
        {
            open(3);
            auto cls = class_from_name(arg(2));
            if (!cls)
            {
                auto v = detail::parse_int(arg(2));
                if (!v)
                    fail(make_error(error_kind::validation_failure, "Unknown component type: " + arg(2)));
                cls = static_cast<class_id>(*v);
            }

            editor ed(doc_);
            auto id = take(ed.add_component(arg(1), *cls, by_id_));
            return commit(json{ { "component_id", id_json(id) }, { "type", type_name(*cls) } });
        }

        json remove_component()
        {
            open(2);
            editor ed(doc_);
            auto cls = take(ed.remove_component(arg(1)));
            return commit(json{ { "removed", arg(1) }, { "type", type_name(cls) } });
        }

        json copy_component()
        {
            open(3);
            editor ed(doc_);
            auto id = take(ed.copy_component(arg(1), arg(2), by_id_));
            return commit(json{ { "source", arg(1) }, { "target_game_object", arg(2) }, { "component_id", id_json(id) } });
        }

        json remove()
        {
            open(2);
            editor ed(doc_);
            auto info = take(ed.delete_object(arg(1), args_.has("--cascade"), by_id_));
            return commit(json{ { "deleted", arg(1) }, { "removed_count", info.removed.size() }, { "removed", ids_json(info.removed) } });
        }

        json remove_instance()
        {
            open(2);
            editor ed(doc_);
            auto info = take(ed.delete_prefab_instance(arg(1)));
            return commit(json{ { "deleted", arg(1) }, { "removed_count", info.removed.size() }, { "removed", ids_json(info.removed) } });
        }

        json reparent()
        {
            open(3);
            editor ed(doc_);
            auto info = take(ed.reparent(arg(1), arg(2), by_id_));
            return commit(json{
                { "child_transform", id_json(info.child) },
                { "old_parent", id_json(info.old_parent) },
                { "new_parent", id_json(info.new_parent) },
            });
        }

        json clone()
        {
            open(2);
            editor ed(doc_);
            auto name = args_.option("--name");

            auto info = name
                ? take(ed.clone(arg(1), std::string_view(*name), by_id_))
                : take(ed.clone(arg(1), std::nullopt, by_id_));

            json cloned = json::array();
            for (auto const & [id, n] : info.game_objects)
                cloned.push_back(json{ { "file_id", id_json(id) }, { "name", n } });

            return commit(json{
                { "game_object_id", id_json(info.game_object) },
                { "transform_id", id_json(info.transform) },
                { "total_duplicated", info.total },
                { "cloned_objects", cloned },
            });
        }

        json unpack()
        {
            open(2);

            std::filesystem::path root;
            if (auto p = args_.option("--project"))
                root = *p;
            else if (auto found = guid_resolver::find_project_root(doc_.path()))
                root = *found;
            else
                fail(make_error(error_kind::template_unresolved,
                    "Could not find a Unity project (no Assets folder above " + doc_.path().string() + "); use --project"));

            guid_resolver resolver(root);
            editor ed(doc_);
            auto info = take(ed.unpack_instance(arg(1), resolver));

            return commit(json{
                { "source", info.source.string() },
                { "root_game_object", id_json(info.root_game_object) },
                { "root_transform", id_json(info.root_transform) },
                { "unpacked_count", info.unpacked },
                { "skipped_modifications", info.skipped_modifications },
            });
        }

    //--------------------------------------------------------------------
    // prefab overrides
    //--------------------------------------------------------------------

        json override_set()
        {
            open(5);
            block & pi = instance_for(arg(1));

            auto obj_ref = args_.option("--object-ref");
            auto descriptor = args_.option("--target");
            auto action = take(upsert_override(pi, target_id(arg(2)), arg(3), arg(4),
                obj_ref ? std::optional<std::string_view>(*obj_ref) : std::nullopt,
                descriptor ? std::optional<std::string_view>(*descriptor) : std::nullopt));

            return commit(json{
                { "prefab_instance", id_json(pi.id()) },
                { "property_path", arg(3) },
                { "value", arg(4) },
                { "action", std::string(to_string(action)) },
            });
        }

        json override_remove()
        {
            open(4);
            block & pi = instance_for(arg(1));
            take(remove_override(pi, target_id(arg(2)), arg(3)));
            return commit(json{ { "prefab_instance", id_json(pi.id()) }, { "property_path", arg(3) }, { "removed", true } });
        }

        json removed_list(result<void> (*op)(block &, std::string_view), char const * verb)
        {
            open(3);
            block & pi = instance_for(arg(1));
            take(op(pi, arg(2)));
            return commit(json{ { "prefab_instance", id_json(pi.id()) }, { "reference", arg(2) }, { verb, true } });
        }
    };

} // namespace

int main(int argc, char ** argv)
{
    bool text = false;
    try
    {
        auto args = parse_arguments(argc, argv);

        if (args.has("--help") || args.command.empty())
        {
            std::cout << USAGE;
            return args.command.empty() && !args.has("--help") ? 2 : 0;
        }

        if (args.has("--verbose"))
            uyd::log::set_level(uyd::log::level::debug);

        auto format = args.option("--format").value_or("json");
        if (format != "json" && format != "text")
            throw usage_error("--format must be json or text");
        text = format == "text";

        command_runner runner(args);
        auto out = runner.run();

        if (text)
            print_text(out, std::cout);
        else
            std::cout << out.dump(2) << '\n';
        return 0;
    }
    catch (command_failure const & e)
    {
        uyd::log::debug(std::string(uyd::to_string(e.err.kind)) + ": " + e.err.message);
        auto out = error_json(e.err);
        if (text)
            print_text(out, std::cout);
        else
            std::cout << out.dump(2) << '\n';
        return 1;
    }
    catch (usage_error const & e)
    {
        std::cout << json{ { "error", e.what() } }.dump(2) << '\n';
        std::cerr << USAGE;
        return 2;
    }
    catch (std::exception const & e)
    {
        uyd::log::error(std::string("unexpected failure: ") + e.what());
        std::cout << json{ { "error", e.what() } }.dump(2) << '\n';
        return 1;
    }
}
