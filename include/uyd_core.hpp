// uyd_core.hpp - Unity YAML Document (uyd) - Core Data Structures
// Version 0.1.0
// Copyright 2025 The uyd authors
// Licenced as-is under the MIT licence.

#ifndef UYD_CORE_HPP
#define UYD_CORE_HPP

#include <string>
#include <string_view>
#include <compare>
#include <vector>
#include <variant>
#include <optional>
#include <algorithm>
#include <stdexcept>
#include <cstdint>
#include <cstdlib>
#include <cctype>
#include <cerrno>
#include <functional>

namespace uyd
{
//========================================================================
// IDs
//========================================================================

    template <typename Tag>
    struct id
    {
        std::int64_t val;

        constexpr id() : val(0) {}
        constexpr explicit id(std::int64_t v) : val(v) {}
        auto operator<=>(id const &) const = default;
    };

    struct block_tag;

    // A Unity fileID. 0 is the null reference and the hierarchy root.
    using file_id = id<block_tag>;

    template <typename Tag>
    constexpr id<Tag> null_id()
    {
        return id<Tag>{ 0 };
    }

    template <typename Tag>
    constexpr bool is_null(id<Tag> i)
    {
        return i.val == 0;
    }

    inline std::string to_string(file_id i)
    {
        return std::to_string(i.val);
    }

//========================================================================
// Class IDs
//========================================================================

    using class_id = int;

    namespace classes
    {
        constexpr class_id game_object     = 1;
        constexpr class_id transform       = 4;
        constexpr class_id camera          = 20;
        constexpr class_id mesh_renderer   = 23;
        constexpr class_id mesh_filter     = 33;
        constexpr class_id rigidbody       = 54;
        constexpr class_id box_collider    = 65;
        constexpr class_id audio_listener  = 81;
        constexpr class_id audio_source    = 82;
        constexpr class_id light           = 108;
        constexpr class_id mono_behaviour  = 114;
        constexpr class_id rect_transform  = 224;
        constexpr class_id prefab_instance = 1001;
    }

    inline std::string type_name(class_id cls)
    {
        switch (cls)
        {
            case classes::game_object:     return "GameObject";
            case classes::transform:       return "Transform";
            case classes::camera:          return "Camera";
            case classes::mesh_renderer:   return "MeshRenderer";
            case classes::mesh_filter:     return "MeshFilter";
            case classes::rigidbody:       return "Rigidbody";
            case classes::box_collider:    return "BoxCollider";
            case classes::audio_listener:  return "AudioListener";
            case classes::audio_source:    return "AudioSource";
            case classes::light:           return "Light";
            case classes::mono_behaviour:  return "MonoBehaviour";
            case classes::rect_transform:  return "RectTransform";
            case classes::prefab_instance: return "PrefabInstance";
            default: return "Unknown_" + std::to_string(cls);
        }
    }

    inline std::optional<class_id> class_from_name(std::string_view name)
    {
        static constexpr class_id known[] = {
            classes::game_object, classes::transform, classes::camera,
            classes::mesh_renderer, classes::mesh_filter, classes::rigidbody,
            classes::box_collider, classes::audio_listener, classes::audio_source,
            classes::light, classes::mono_behaviour, classes::rect_transform,
            classes::prefab_instance
        };

        for (auto cls : known)
            if (type_name(cls) == name)
                return cls;
        return std::nullopt;
    }

    // Transform-like blocks carry m_Father / m_Children.
    inline bool is_spatial(class_id cls)
    {
        return cls == classes::transform || cls == classes::rect_transform;
    }

//========================================================================
// Errors
//========================================================================

    enum class error_kind
    {
        not_found,
        ambiguous_match,
        not_recognized,
        malformed,
        template_unresolved,
        io_failure,
        validation_failure,
        invariant_violation,
    };

    inline std::string_view to_string(error_kind k)
    {
        switch (k)
        {
            case error_kind::not_found:           return "not_found";
            case error_kind::ambiguous_match:     return "ambiguous_match";
            case error_kind::not_recognized:      return "not_recognized";
            case error_kind::malformed:           return "malformed";
            case error_kind::template_unresolved: return "template_unresolved";
            case error_kind::io_failure:          return "io_failure";
            case error_kind::validation_failure:  return "validation_failure";
            case error_kind::invariant_violation: return "invariant_violation";
        }
        return "unknown";
    }

    struct error
    {
        error_kind  kind;
        std::string message;
    };

    // Either a value or an error. Expected failures travel through here;
    // reading the wrong alternative is a contract violation and throws.
    template <typename T>
    class result
    {
    public:
        result(T v) : state_(std::move(v)) {}
        result(error e) : state_(std::move(e)) {}

        bool ok() const noexcept { return std::holds_alternative<T>(state_); }
        explicit operator bool() const noexcept { return ok(); }

        T & value()
        {
            if (!ok()) throw std::logic_error("uyd::result: value() on error: " + err().message);
            return std::get<T>(state_);
        }

        T const & value() const
        {
            if (!ok()) throw std::logic_error("uyd::result: value() on error: " + err().message);
            return std::get<T>(state_);
        }

        T * operator->() { return &value(); }
        T const * operator->() const { return &value(); }
        T & operator*() { return value(); }
        T const & operator*() const { return value(); }

        error const & err() const
        {
            if (ok()) throw std::logic_error("uyd::result: err() on success");
            return std::get<error>(state_);
        }

    private:
        std::variant<T, error> state_;
    };

    template <>
    class result<void>
    {
    public:
        result() = default;
        result(error e) : err_(std::move(e)) {}

        bool ok() const noexcept { return !err_.has_value(); }
        explicit operator bool() const noexcept { return ok(); }

        error const & err() const
        {
            if (ok()) throw std::logic_error("uyd::result: err() on success");
            return *err_;
        }

    private:
        std::optional<error> err_;
    };

    inline error make_error(error_kind kind, std::string message)
    {
        return error{ kind, std::move(message) };
    }

//========================================================================
// Document generation context
//========================================================================

    template <typename T, typename Error>
    struct context
    {
        T result;
        std::vector<Error> errors;

        bool has_errors() const { return !errors.empty(); }
    };

//========================================================================
// UTILITY FUNCTIONS
//========================================================================

    namespace detail
    {
        constexpr std::string_view ANCHOR_PREFIX  = "--- !u!";
        constexpr std::string_view YAML_SIGNATURE = "%YAML";
        constexpr std::string_view NULL_REFERENCE = "{fileID: 0}";

        inline std::string_view trim_sv(std::string_view s)
        {
            size_t start = s.find_first_not_of(" \t\r\n");
            if (start == std::string_view::npos) return {};
            size_t end = s.find_last_not_of(" \t\r\n");
            return s.substr(start, end - start + 1);
        }

        inline std::string to_lower(std::string_view s)
        {
            std::string result(s);
            std::transform(result.begin(), result.end(), result.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return result;
        }

        inline size_t indent_of(std::string_view line)
        {
            size_t n = 0;
            while (n < line.size() && (line[n] == ' ' || line[n] == '\t'))
                ++n;
            return n;
        }

        inline bool is_blank(std::string_view line)
        {
            return trim_sv(line).empty();
        }

        // Lines keep the carriage return of a CRLF break in their text.
        inline bool has_cr(std::string_view line)
        {
            return !line.empty() && line.back() == '\r';
        }

        inline std::string_view strip_cr(std::string_view line)
        {
            return has_cr(line) ? line.substr(0, line.size() - 1) : line;
        }

        inline void set_cr(std::string & line, bool cr)
        {
            if (has_cr(line) != cr)
            {
                if (cr) line += '\r';
                else    line.pop_back();
            }
        }

        inline bool is_digits(std::string_view s)
        {
            if (s.empty()) return false;
            return std::all_of(s.begin(), s.end(),
                [](unsigned char c) { return std::isdigit(c) != 0; });
        }

        inline std::optional<std::int64_t> parse_int(std::string_view s)
        {
            s = trim_sv(s);
            if (s.empty()) return std::nullopt;

            std::string tmp(s);
            char* end = nullptr;
            errno = 0;
            long long v = std::strtoll(tmp.c_str(), &end, 10);
            if (end != tmp.c_str() + tmp.size() || errno == ERANGE)
                return std::nullopt;
            return static_cast<std::int64_t>(v);
        }

        inline std::string join(std::vector<std::string> const & parts, std::string_view sep)
        {
            std::string out;
            for (size_t i = 0; i < parts.size(); ++i)
            {
                if (i > 0) out += sep;
                out += parts[i];
            }
            return out;
        }

        inline std::string reference_to(file_id id)
        {
            return "{fileID: " + to_string(id) + "}";
        }

        // Every {fileID: N} in a line, in order. Null references included.
        inline std::vector<file_id> scan_file_ids(std::string_view line)
        {
            constexpr std::string_view key = "fileID:";
            std::vector<file_id> out;

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

                if (auto v = parse_int(line.substr(start, pos - start)))
                    out.push_back(file_id{ *v });
            }
            return out;
        }
    }

//========================================================================
// Name validation
//========================================================================

    // Names end up as raw text inside the format; reject what would
    // corrupt it.
    inline result<void> validate_name(std::string_view name, std::string_view label)
    {
        auto fail = [&](std::string_view what)
        {
            return make_error(error_kind::validation_failure,
                std::string(label) + " cannot contain " + std::string(what));
        };

        if (name.empty())
            return make_error(error_kind::validation_failure, std::string(label) + " cannot be empty");
        if (name.find('/') != std::string_view::npos)
            return fail("forward slashes (/)");
        if (name.find('\\') != std::string_view::npos)
            return fail("backslashes (\\)");
        if (name.find('\n') != std::string_view::npos || name.find('\r') != std::string_view::npos)
            return fail("newlines");
        if (name.find('\t') != std::string_view::npos)
            return fail("tab characters");
        if (name.find('\0') != std::string_view::npos)
            return fail("null bytes");
        return {};
    }

} // namespace uyd

namespace std
{
    template <typename Tag>
    struct hash<uyd::id<Tag>>
    {
        size_t operator()(uyd::id<Tag> const & i) const noexcept
        {
            return std::hash<std::int64_t>{}(i.val);
        }
    };
}

#endif // UYD_CORE_HPP
