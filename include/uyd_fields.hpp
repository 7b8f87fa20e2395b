// uyd_fields.hpp - Unity YAML Document (uyd) - Field access and mutation
// Version 0.1.0
// Copyright 2025 The uyd authors
// Licenced as-is under the MIT licence.
//
// Line-oriented access to the body of a block. Nothing here builds a YAML
// tree: keys are located by indentation and only the value substring of
// the addressed line is ever rewritten.

#ifndef UYD_FIELDS_HPP
#define UYD_FIELDS_HPP

#include "uyd_core.hpp"
#include "uyd_document.hpp"

#include <unordered_map>

namespace uyd
{
//========================================================================
// Paths
//========================================================================

    // `a.b.c` or `a.b.Array.data[N]`
    struct field_path
    {
        std::vector<std::string> segments;    // for arrays: the path to the array
        std::optional<size_t>    index;

        bool is_array_element() const noexcept { return index.has_value(); }
    };

    result<field_path> parse_path(std::string_view path);

//========================================================================
// FIELD API
//========================================================================

    result<std::string> get_field(block const & b, std::string_view path);
    result<void>        set_field(block & b, std::string_view path, std::string_view value);
    bool                has_field(block const & b, std::string_view path);

    // Arrays, block form (`- item` lines) or the empty `[]`.
    result<size_t>                   array_length(block const & b, std::string_view array_path);
    result<std::vector<std::string>> array_items(block const & b, std::string_view array_path);

    // Appends when index is empty or past the end.
    result<void> insert_array_element(block & b, std::string_view array_path, std::string_view value,
                                      std::optional<size_t> index = std::nullopt);
    result<void> remove_array_element(block & b, std::string_view array_path, size_t index);

    // Index of the first item whose value references id.
    std::optional<size_t> find_array_reference(block const & b, std::string_view array_path, file_id id);

    // First fileID of a `{fileID: N, ...}` value.
    std::optional<file_id> parse_reference(std::string_view value);

    // Non-null fileIDs referenced from the body, in order of appearance.
    std::vector<file_id> extract_refs(block const & b);

    // Rewrites the header anchor and every body reference found in the map.
    void remap_ids(block & b, std::unordered_map<file_id, file_id> const & map);

//========================================================================
// Implementation details
//========================================================================

    namespace detail
    {
        struct key_line
        {
            size_t           indent;
            bool             list_item;
            std::string_view key;
            size_t           colon;
            size_t           value_begin;
            size_t           value_end;
        };

        struct value_span
        {
            size_t line;
            size_t begin;
            size_t end;
        };

        struct array_section
        {
            size_t              marker;
            size_t              indent;     // indentation of the marker line
            size_t              item_indent;
            bool                inline_empty;
            std::vector<size_t> items;      // first line of each item
            size_t              end;        // one past the last item line
        };

//---------------------------------------------------------------------------

        // End of the value on a line: before a ` #` comment outside quotes,
        // trailing whitespace excluded.
        inline size_t value_end_of(std::string_view line, size_t from)
        {
            char quote = 0;
            size_t end = line.size();
            for (size_t i = from; i < line.size(); ++i)
            {
                char c = line[i];
                if (quote)
                {
                    if (c == quote) quote = 0;
                    continue;
                }
                if (c == '\'' || c == '"')
                    quote = c;
                else if (c == '#' && (i == from || line[i - 1] == ' ' || line[i - 1] == '\t'))
                {
                    end = i;
                    break;
                }
            }

            while (end > from && (line[end - 1] == ' ' || line[end - 1] == '\t' || line[end - 1] == '\r'))
                --end;
            return end;
        }

        inline std::optional<key_line> parse_key_line(std::string_view line)
        {
            line = strip_cr(line);

            key_line k{};
            k.indent = indent_of(line);

            size_t p = k.indent;
            if (p < line.size() && line[p] == '-' && (p + 1 == line.size() || line[p + 1] == ' '))
            {
                k.list_item = true;
                ++p;
                while (p < line.size() && line[p] == ' ')
                    ++p;
            }

            if (p >= line.size() || line[p] == '{' || line[p] == '[' || line[p] == '#')
                return std::nullopt;

            size_t colon = line.find(':', p);
            while (colon != std::string_view::npos && colon + 1 < line.size() && line[colon + 1] != ' ')
                colon = line.find(':', colon + 1);
            if (colon == std::string_view::npos || colon == p)
                return std::nullopt;

            k.key = trim_sv(line.substr(p, colon - p));
            k.colon = colon;

            size_t v = colon + 1;
            while (v < line.size() && line[v] == ' ')
                ++v;
            k.value_begin = v;
            k.value_end = value_end_of(line, v);
            if (k.value_end < k.value_begin)
                k.value_end = k.value_begin;
            return k;
        }

        inline std::string_view value_of(std::string_view line, key_line const & k)
        {
            return line.substr(k.value_begin, k.value_end - k.value_begin);
        }

        inline bool is_item_line(std::string_view line)
        {
            auto t = trim_sv(line);
            return t == "-" || t.starts_with("- ");
        }

//---------------------------------------------------------------------------

        inline std::optional<size_t> find_key(std::vector<std::string> const & lines,
                                              size_t begin, size_t end, std::string_view key)
        {
            for (size_t i = begin; i < end; ++i)
            {
                auto k = parse_key_line(lines[i]);
                if (k && k->key == key)
                    return i;
            }
            return std::nullopt;
        }

        // Lines nested under `parent`: deeper indentation, or list items at
        // the parent's own indentation (Unity writes sequences that way).
        inline size_t section_end(std::vector<std::string> const & lines, size_t parent, size_t limit)
        {
            size_t pi = indent_of(lines[parent]);
            size_t last = parent + 1;

            for (size_t i = parent + 1; i < limit; ++i)
            {
                if (is_blank(lines[i]))
                    continue;

                size_t ind = indent_of(lines[i]);
                if (ind > pi || (ind == pi && is_item_line(lines[i])))
                    last = i + 1;
                else
                    break;
            }
            return last;
        }

        // `{x: 1, y: 2}` starting at `open`: span of the value for key.
        inline std::optional<std::pair<size_t, size_t>> find_flow_entry(std::string_view line, size_t open, std::string_view key)
        {
            if (open >= line.size() || line[open] != '{')
                return std::nullopt;

            size_t close = line.find('}', open);
            if (close == std::string_view::npos)
                return std::nullopt;

            size_t pos = open + 1;
            while (pos < close)
            {
                size_t comma = line.find(',', pos);
                if (comma == std::string_view::npos || comma > close)
                    comma = close;

                std::string_view entry = line.substr(pos, comma - pos);
                size_t colon = entry.find(':');
                if (colon != std::string_view::npos && trim_sv(entry.substr(0, colon)) == key)
                {
                    size_t vb = pos + colon + 1;
                    while (vb < comma && line[vb] == ' ')
                        ++vb;
                    size_t ve = comma;
                    while (ve > vb && line[ve - 1] == ' ')
                        --ve;
                    return std::pair{ vb, ve };
                }
                pos = comma + 1;
            }
            return std::nullopt;
        }

//---------------------------------------------------------------------------

        // Line of the key addressed by segments, narrowing section by section.
        inline result<size_t> locate_key(std::vector<std::string> const & lines,
                                         std::vector<std::string> const & segments)
        {
            size_t begin = 0;
            size_t end = lines.size();

            for (size_t s = 0; s < segments.size(); ++s)
            {
                auto at = find_key(lines, begin, end, segments[s]);
                if (!at)
                    return make_error(error_kind::not_found, "Property not found: " + join(segments, "."));

                if (s + 1 == segments.size())
                    return *at;

                begin = *at + 1;
                end = section_end(lines, *at, end);
            }
            return make_error(error_kind::not_found, "Empty property path");
        }

        inline result<value_span> locate_value(std::vector<std::string> const & lines,
                                               std::vector<std::string> const & segments)
        {
            if (segments.empty())
                return make_error(error_kind::not_found, "Empty property path");

            // `parent.key` where parent holds a flow mapping.
            if (segments.size() >= 2)
            {
                std::vector<std::string> parent(segments.begin(), segments.end() - 1);
                auto pl = locate_key(lines, parent);
                if (pl)
                {
                    auto k = parse_key_line(lines[*pl]);
                    if (k && k->value_begin < lines[*pl].size() && lines[*pl][k->value_begin] == '{')
                    {
                        if (auto span = find_flow_entry(lines[*pl], k->value_begin, segments.back()))
                            return value_span{ *pl, span->first, span->second };
                    }
                }
            }

            auto at = locate_key(lines, segments);
            if (!at)
                return at.err();

            auto k = parse_key_line(lines[*at]);
            return value_span{ *at, k->value_begin, k->value_end };
        }

//---------------------------------------------------------------------------

        inline result<array_section> locate_array(std::vector<std::string> const & lines,
                                                  std::vector<std::string> const & segments)
        {
            auto at = locate_key(lines, segments);
            if (!at)
                return make_error(error_kind::malformed, "Array not found: " + join(segments, "."));

            auto k = parse_key_line(lines[*at]);
            auto v = value_of(lines[*at], *k);

            array_section a{};
            a.marker = *at;
            a.indent = indent_of(lines[*at]);
            a.item_indent = a.indent;
            a.end = *at + 1;

            if (trim_sv(v) == "[]")
            {
                a.inline_empty = true;
                return a;
            }
            if (!v.empty())
                return make_error(error_kind::malformed, join(segments, ".") + " is not a block sequence");

            a.end = section_end(lines, *at, lines.size());

            bool first = true;
            for (size_t i = *at + 1; i < a.end; ++i)
            {
                if (is_blank(lines[i]) || !is_item_line(lines[i]))
                    continue;

                size_t ind = indent_of(lines[i]);
                if (first)
                {
                    a.item_indent = ind;
                    first = false;
                }
                if (ind == a.item_indent)
                    a.items.push_back(i);
            }
            return a;
        }

        // Value span after the `- ` marker of an item line.
        inline value_span item_value(std::vector<std::string> const & lines, size_t line)
        {
            std::string_view l = lines[line];
            size_t p = indent_of(l) + 1;
            while (p < l.size() && l[p] == ' ')
                ++p;
            return value_span{ line, p, std::max(p, value_end_of(l, p)) };
        }

        inline size_t item_end(array_section const & a, size_t i)
        {
            return i + 1 < a.items.size() ? a.items[i + 1] : a.end;
        }

        // Inserts a (possibly multi-line) item. First entry is the text after
        // `- `; the rest are continuation lines relative to the item.
        inline void insert_item(std::vector<std::string> & lines, array_section const & a,
                                std::vector<std::string> const & item, std::optional<size_t> index)
        {
            // New lines take the break of the list they join.
            bool cr = has_cr(lines[a.marker]);
            std::string pad(a.item_indent, ' ');
            std::vector<std::string> out;
            for (size_t i = 0; i < item.size(); ++i)
            {
                out.push_back(pad + (i == 0 ? "- " : "  ") + item[i]);
                set_cr(out.back(), cr);
            }

            size_t at;
            if (a.inline_empty)
            {
                auto & marker = lines[a.marker];
                auto k = parse_key_line(marker);
                marker = marker.substr(0, k->colon + 1) + marker.substr(k->value_end);
                at = a.marker + 1;
            }
            else if (index && *index < a.items.size())
                at = a.items[*index];
            else
            {
                at = a.end;
                while (at > a.marker + 1 && is_blank(lines[at - 1]))
                    --at;
            }

            lines.insert(lines.begin() + at, out.begin(), out.end());
        }

        inline void remove_item(std::vector<std::string> & lines, array_section const & a, size_t index)
        {
            lines.erase(lines.begin() + a.items[index], lines.begin() + item_end(a, index));

            if (a.items.size() == 1)
            {
                auto & marker = lines[a.marker];
                auto k = parse_key_line(marker);
                marker = marker.substr(0, k->colon + 1) + " []" + marker.substr(k->value_end);
            }
        }

        inline void replace_span(std::string & line, size_t begin, size_t end, std::string_view value)
        {
            if (begin >= strip_cr(line).size() || begin == end)
            {
                // `key:` with nothing after it
                bool cr = has_cr(line);
                if (cr)
                    line.pop_back();

                std::string rest = line.substr(std::min(begin, line.size()));
                std::string head = line.substr(0, std::min(begin, line.size()));
                while (!head.empty() && head.back() == ' ')
                    head.pop_back();
                std::string tail = detail::trim_sv(rest).empty() ? std::string{} : " " + std::string(trim_sv(rest));
                line = head + " " + std::string(value) + tail;
                set_cr(line, cr);
                return;
            }
            line.replace(begin, end - begin, value);
        }

        inline std::optional<std::string> remap_line(std::string_view line,
                                                     std::unordered_map<file_id, file_id> const & map)
        {
            constexpr std::string_view key = "fileID:";
            std::string out;
            bool changed = false;

            size_t copied = 0;
            size_t pos = 0;
            while ((pos = line.find(key, pos)) != std::string_view::npos)
            {
                pos += key.size();
                while (pos < line.size() && line[pos] == ' ')
                    ++pos;

                size_t start = pos;
                if (pos < line.size() && line[pos] == '-')
                    ++pos;
                while (pos < line.size() && std::isdigit(static_cast<unsigned char>(line[pos])))
                    ++pos;

                auto v = parse_int(line.substr(start, pos - start));
                if (!v || *v == 0)
                    continue;

                auto it = map.find(file_id{ *v });
                if (it == map.end())
                    continue;

                out.append(line.substr(copied, start - copied));
                out += to_string(it->second);
                copied = pos;
                changed = true;
            }

            if (!changed)
                return std::nullopt;

            out.append(line.substr(copied));
            return out;
        }

    } // namespace detail

//========================================================================
// API implementation
//========================================================================

    inline result<field_path> parse_path(std::string_view path)
    {
        field_path fp;
        path = detail::trim_sv(path);
        if (path.empty())
            return make_error(error_kind::not_found, "Empty property path");

        constexpr std::string_view array_marker = ".Array.data[";
        auto am = path.find(array_marker);
        if (am != std::string_view::npos)
        {
            auto idx_text = path.substr(am + array_marker.size());
            if (!idx_text.ends_with("]"))
                return make_error(error_kind::malformed, "Invalid array path: " + std::string(path));

            idx_text.remove_suffix(1);
            auto idx = detail::parse_int(idx_text);
            if (!detail::is_digits(idx_text) || !idx)
                return make_error(error_kind::malformed, "Invalid array index in path: " + std::string(path));

            fp.index = static_cast<size_t>(*idx);
            path = path.substr(0, am);
        }

        size_t start = 0;
        while (start <= path.size())
        {
            size_t dot = path.find('.', start);
            if (dot == std::string_view::npos)
                dot = path.size();

            auto seg = path.substr(start, dot - start);
            if (seg.empty())
                return make_error(error_kind::malformed, "Empty segment in path: " + std::string(path));

            fp.segments.emplace_back(seg);
            start = dot + 1;
        }
        return fp;
    }

//------------------------------------------------------------------------

    inline result<std::string> get_field(block const & b, std::string_view path)
    {
        auto fp = parse_path(path);
        if (!fp)
            return fp.err();

        auto const & lines = b.lines();

        if (fp->is_array_element())
        {
            auto a = detail::locate_array(lines, fp->segments);
            if (!a)
                return a.err();
            if (*fp->index >= a->items.size())
                return make_error(error_kind::not_found, "Index out of range: " + std::string(path));

            auto span = detail::item_value(lines, a->items[*fp->index]);
            return std::string(lines[span.line].substr(span.begin, span.end - span.begin));
        }

        auto span = detail::locate_value(lines, fp->segments);
        if (!span)
            return span.err();

        return std::string(lines[span->line].substr(span->begin, span->end - span->begin));
    }

    inline bool has_field(block const & b, std::string_view path)
    {
        return get_field(b, path).ok();
    }

    inline result<void> set_field(block & b, std::string_view path, std::string_view value)
    {
        auto fp = parse_path(path);
        if (!fp)
            return fp.err();

        if (value.find('\n') != std::string_view::npos || value.find('\r') != std::string_view::npos)
            return make_error(error_kind::validation_failure, "Value cannot contain newlines");

        detail::value_span span{};
        if (fp->is_array_element())
        {
            auto a = detail::locate_array(b.lines(), fp->segments);
            if (!a)
                return a.err();
            if (*fp->index >= a->items.size())
                return make_error(error_kind::not_found, "Index out of range: " + std::string(path));
            span = detail::item_value(b.lines(), a->items[*fp->index]);
        }
        else
        {
            auto s = detail::locate_value(b.lines(), fp->segments);
            if (!s)
                return s.err();
            span = *s;
        }

        auto & lines = b.edit_lines();
        detail::replace_span(lines[span.line], span.begin, span.end, value);
        return {};
    }

//------------------------------------------------------------------------

    inline result<size_t> array_length(block const & b, std::string_view array_path)
    {
        auto fp = parse_path(array_path);
        if (!fp)
            return fp.err();

        auto a = detail::locate_array(b.lines(), fp->segments);
        if (!a)
            return a.err();
        return a->items.size();
    }

    inline result<std::vector<std::string>> array_items(block const & b, std::string_view array_path)
    {
        auto fp = parse_path(array_path);
        if (!fp)
            return fp.err();

        auto const & lines = b.lines();
        auto a = detail::locate_array(lines, fp->segments);
        if (!a)
            return a.err();

        std::vector<std::string> out;
        for (auto i : a->items)
        {
            auto span = detail::item_value(lines, i);
            out.emplace_back(lines[i].substr(span.begin, span.end - span.begin));
        }
        return out;
    }

    inline result<void> insert_array_element(block & b, std::string_view array_path, std::string_view value,
                                             std::optional<size_t> index)
    {
        auto fp = parse_path(array_path);
        if (!fp)
            return fp.err();

        auto a = detail::locate_array(b.lines(), fp->segments);
        if (!a)
            return a.err();

        detail::insert_item(b.edit_lines(), *a, { std::string(value) }, index);
        return {};
    }

    inline result<void> remove_array_element(block & b, std::string_view array_path, size_t index)
    {
        auto fp = parse_path(array_path);
        if (!fp)
            return fp.err();

        auto a = detail::locate_array(b.lines(), fp->segments);
        if (!a)
            return a.err();
        if (index >= a->items.size())
            return make_error(error_kind::not_found,
                "Index " + std::to_string(index) + " out of range for " + std::string(array_path));

        detail::remove_item(b.edit_lines(), *a, index);
        return {};
    }

    inline std::optional<size_t> find_array_reference(block const & b, std::string_view array_path, file_id id)
    {
        auto items = array_items(b, array_path);
        if (!items)
            return std::nullopt;

        for (size_t i = 0; i < items->size(); ++i)
        {
            auto refs = detail::scan_file_ids((*items)[i]);
            if (std::ranges::find(refs, id) != refs.end())
                return i;
        }
        return std::nullopt;
    }

//------------------------------------------------------------------------

    inline std::optional<file_id> parse_reference(std::string_view value)
    {
        auto refs = detail::scan_file_ids(value);
        if (refs.empty())
            return std::nullopt;
        return refs.front();
    }

    inline std::vector<file_id> extract_refs(block const & b)
    {
        std::vector<file_id> out;
        for (auto const & l : b.lines())
            for (auto id : detail::scan_file_ids(l))
                if (!is_null(id))
                    out.push_back(id);
        return out;
    }

    inline void remap_ids(block & b, std::unordered_map<file_id, file_id> const & map)
    {
        if (auto it = map.find(b.id()); it != map.end())
            b.set_id(it->second);

        auto const & lines = b.lines();
        for (size_t i = 0; i < lines.size(); ++i)
        {
            if (auto updated = detail::remap_line(lines[i], map))
                b.edit_lines()[i] = std::move(*updated);
        }
    }

} // namespace uyd

#endif // UYD_FIELDS_HPP
