// uyd_trace.hpp - Unity YAML Document (uyd) - Reference Tracer
// Version 0.1.0
// Copyright 2025 The uyd authors
// Licenced as-is under the MIT licence.

#ifndef UYD_TRACE_HPP
#define UYD_TRACE_HPP

#include "uyd_core.hpp"
#include "uyd_document.hpp"
#include "uyd_fields.hpp"
#include "uyd_log.hpp"

#include <set>
#include <unordered_map>
#include <unordered_set>

namespace uyd
{
    enum class direction
    {
        outgoing,
        incoming,
        both
    };

    inline std::string_view to_string(direction d)
    {
        switch (d)
        {
            case direction::outgoing: return "outgoing";
            case direction::incoming: return "incoming";
            case direction::both:     return "both";
        }
        return "unknown";
    }

    inline std::optional<direction> direction_from_name(std::string_view name)
    {
        auto n = detail::to_lower(detail::trim_sv(name));
        if (n == "outgoing" || n == "out") return direction::outgoing;
        if (n == "incoming" || n == "in")  return direction::incoming;
        if (n == "both")                   return direction::both;
        return std::nullopt;
    }

    // `source` holds a {fileID: target} reference. `depth` is the BFS level
    // the edge was first found at, starting from 1.
    struct edge
    {
        file_id  source;
        file_id  target;
        size_t   depth = 0;
        class_id source_class = 0;
        class_id target_class = 0;
    };

    //========================================================================
    // TRACE API
    //========================================================================

    // Breadth-first walk of the reference graph from `start`. Each id is
    // expanded once whichever direction reached it. References to ids
    // outside the document are not followed.
    result<std::vector<edge>> trace(document const & doc, file_id start, direction dir, size_t max_depth);

    //========================================================================
    // TRACE IMPLEMENTATION
    //========================================================================

    namespace detail
    {
        class tracer_impl
        {
        public:
            explicit tracer_impl(document const & doc)
                : doc_(doc)
            {}

            std::vector<edge> run(file_id start, direction dir, size_t max_depth)
            {
                bool want_out = dir != direction::incoming;
                bool want_in  = dir != direction::outgoing;

                if (want_in)
                    build_reverse_index();

                std::vector<file_id> frontier{ start };
                visited_.insert(start);

                for (size_t depth = 1; depth <= max_depth && !frontier.empty(); ++depth)
                {
                    std::vector<file_id> next;

                    for (auto node : frontier)
                    {
                        if (want_out)
                        {
                            for (auto target : outgoing(node))
                            {
                                record(node, target, depth);
                                if (visited_.insert(target).second)
                                    next.push_back(target);
                            }
                        }

                        if (want_in)
                        {
                            auto it = reverse_.find(node);
                            if (it == reverse_.end())
                                continue;

                            for (auto source : it->second)
                            {
                                record(source, node, depth);
                                if (visited_.insert(source).second)
                                    next.push_back(source);
                            }
                        }
                    }

                    frontier = std::move(next);
                }

                return std::move(edges_);
            }

        private:
            document const &                                   doc_;
            std::unordered_map<file_id, std::vector<file_id>>  reverse_;
            std::unordered_set<file_id>                        visited_;
            std::set<std::pair<file_id, file_id>>              seen_edges_;
            std::vector<edge>                                  edges_;

            // Distinct in-document targets of a block, in order of appearance.
            std::vector<file_id> outgoing(file_id node) const
            {
                std::vector<file_id> out;
                auto const * b = doc_.find_by_id(node);
                if (!b)
                    return out;

                for (auto id : extract_refs(*b))
                    if (id != node && doc_.contains(id))
                        push_unique(out, id);
                return out;
            }

            void build_reverse_index()
            {
                for (auto const & b : doc_.blocks())
                {
                    std::vector<file_id> targets;
                    for (auto id : extract_refs(b))
                        if (id != b.id())
                            push_unique(targets, id);

                    for (auto t : targets)
                        reverse_[t].push_back(b.id());
                }
            }

            // An edge is reported once, at the level it is first reached.
            void record(file_id source, file_id target, size_t depth)
            {
                if (!seen_edges_.insert({ source, target }).second)
                    return;

                edge e{ source, target, depth };
                if (auto const * s = doc_.find_by_id(source)) e.source_class = s->cls();
                if (auto const * t = doc_.find_by_id(target)) e.target_class = t->cls();
                edges_.push_back(e);
            }

            static void push_unique(std::vector<file_id> & v, file_id id)
            {
                if (std::find(v.begin(), v.end(), id) == v.end())
                    v.push_back(id);
            }
        };

    } // namespace detail

    inline result<std::vector<edge>> trace(document const & doc, file_id start, direction dir, size_t max_depth)
    {
        if (!doc.contains(start))
            return make_error(error_kind::not_found, "fileID " + to_string(start) + " not found");

        detail::tracer_impl t(doc);
        auto edges = t.run(start, dir, max_depth);

        log::debug("trace from " + to_string(start) + " (" + std::string(to_string(dir)) + ", depth "
            + std::to_string(max_depth) + "): " + std::to_string(edges.size()) + " edges");
        return edges;
    }

} // namespace uyd

#endif // UYD_TRACE_HPP
