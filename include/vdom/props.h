// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file props.h
/// @brief Property values, property maps and hooks.
///
/// An element's properties map names to one of:
/// - Primitive types: bool, int64_t, double, string
/// - PropDict: a string dictionary (the "attributes" and "style" entries are
///   applied entry by entry, any other dictionary is assigned wholesale)
/// - Hook: an opaque object invoked when the property is applied, optionally
///   with a teardown ("unhook") capability
///
/// Property deltas produced by diff_props() reuse the same types: an Unset
/// value removes the property, a nullopt dictionary entry removes that entry.

#pragma once

#include <vdom/vdom_config.h>
#include <vdom/api.h>
#include <vdom/tree_fwd.h>

#include <immer/map.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>

namespace vdom {

/// Marker for a removed property inside a delta
using Unset = std::monostate;

/// String dictionary; nullopt entries only appear inside deltas
using PropDict = immer::map<std::string, std::optional<std::string>>;

inline constexpr const char* ATTRIBUTES = "attributes";
inline constexpr const char* STYLE      = "style";

struct PropValue
{
    std::variant<Unset, bool, int64_t, double, std::string, PropDict, HookPtr> data;

    PropValue() noexcept : data(Unset{}) {}
    PropValue(bool v) noexcept : data(v) {}
    PropValue(int v) noexcept : data(static_cast<int64_t>(v)) {}
    PropValue(int64_t v) noexcept : data(v) {}
    PropValue(double v) noexcept : data(v) {}
    PropValue(const std::string& v) : data(v) {}
    PropValue(std::string&& v) noexcept : data(std::move(v)) {}
    PropValue(const char* v) : data(std::in_place_type<std::string>, v) {}
    PropValue(PropDict v) : data(std::move(v)) {}
    PropValue(HookPtr v) : data(std::move(v)) {}

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] bool is_unset() const noexcept { return is<Unset>(); }
    [[nodiscard]] bool is_dict() const noexcept { return is<PropDict>(); }
    [[nodiscard]] bool is_hook() const noexcept { return is<HookPtr>(); }

    /// The hook held by this value, or nullptr
    [[nodiscard]] const Hook* hook() const noexcept {
        auto* h = get_if<HookPtr>();
        return h ? h->get() : nullptr;
    }

    /// Hooks compare by identity, everything else by value
    bool operator==(const PropValue& other) const { return data == other.data; }
    bool operator!=(const PropValue& other) const { return !(*this == other); }
};

using Props = immer::map<std::string, PropValue>;

/// Build a dictionary from literal entries
[[nodiscard]] VDOM_API PropDict dict(std::initializer_list<std::pair<std::string, std::string>> init);

/// Build a property map from literal entries
[[nodiscard]] VDOM_API Props props(std::initializer_list<std::pair<std::string, PropValue>> init);

/// Human readable rendering of a property value (for markup dumps and logs)
[[nodiscard]] VDOM_API std::string to_string(const PropValue& value);

// ============================================================
// Hook
//
// A property value with explicit attach/detach capability. The teardown
// discriminant is fixed at construction: Teardown::Unhook hooks are recorded
// in Element::hooks and receive unhook() when their element is discarded or
// the property goes away.
// ============================================================

class VDOM_API Hook {
public:
    enum class Teardown { None, Unhook };

    explicit Hook(Teardown teardown) noexcept : teardown_(teardown) {}
    virtual ~Hook() = default;

    Hook(const Hook&) = delete;
    Hook& operator=(const Hook&) = delete;

    [[nodiscard]] Teardown teardown() const noexcept { return teardown_; }
    [[nodiscard]] bool must_unhook() const noexcept { return teardown_ == Teardown::Unhook; }

    /// Called when the property is applied to a live node
    virtual void hook(LiveNode& node, const std::string& name, const PropValue& previous) const = 0;

    /// Called when the property is removed; only for Teardown::Unhook
    virtual void unhook(LiveNode& node, const std::string& name, const PropValue& next) const;

private:
    Teardown teardown_;
};

using HookFn = std::function<void(LiveNode& node, const std::string& name, const PropValue& value)>;

/// Hook without teardown
[[nodiscard]] VDOM_API HookPtr make_hook(HookFn on_hook);

/// Hook with teardown
[[nodiscard]] VDOM_API HookPtr make_hook(HookFn on_hook, HookFn on_unhook);

} // namespace vdom
