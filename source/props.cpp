// props.cpp - Property values and hooks

#include <vdom/props.h>

#include <immer/map_transient.hpp>

#include <sstream>

namespace vdom {

PropDict dict(std::initializer_list<std::pair<std::string, std::string>> init)
{
    auto t = PropDict{}.transient();
    for (const auto& [name, value] : init) {
        t.set(name, value);
    }
    return t.persistent();
}

Props props(std::initializer_list<std::pair<std::string, PropValue>> init)
{
    auto t = Props{}.transient();
    for (const auto& [name, value] : init) {
        t.set(name, value);
    }
    return t.persistent();
}

std::string to_string(const PropValue& value)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, Unset>) {
            return "<unset>";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << arg;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return arg;
        } else if constexpr (std::is_same_v<T, PropDict>) {
            std::ostringstream oss;
            oss << "{";
            bool first = true;
            for (const auto& [k, v] : arg) {
                if (!first) oss << ", ";
                first = false;
                oss << k << ": " << (v ? *v : std::string{"<unset>"});
            }
            oss << "}";
            return oss.str();
        } else {
            return "<hook>";
        }
    }, value.data);
}

// ============================================================
// Hook
// ============================================================

void Hook::unhook(LiveNode&, const std::string&, const PropValue&) const {}

namespace {

class FunctionHook final : public Hook {
public:
    explicit FunctionHook(HookFn on_hook)
        : Hook(Teardown::None), on_hook_(std::move(on_hook)) {}

    FunctionHook(HookFn on_hook, HookFn on_unhook)
        : Hook(Teardown::Unhook), on_hook_(std::move(on_hook)), on_unhook_(std::move(on_unhook)) {}

    void hook(LiveNode& node, const std::string& name, const PropValue& previous) const override {
        on_hook_(node, name, previous);
    }

    void unhook(LiveNode& node, const std::string& name, const PropValue& next) const override {
        if (must_unhook()) {
            on_unhook_(node, name, next);
        }
    }

private:
    HookFn on_hook_;
    HookFn on_unhook_;
};

} // anonymous namespace

HookPtr make_hook(HookFn on_hook)
{
    return std::make_shared<FunctionHook>(std::move(on_hook));
}

HookPtr make_hook(HookFn on_hook, HookFn on_unhook)
{
    return std::make_shared<FunctionHook>(std::move(on_hook), std::move(on_unhook));
}

} // namespace vdom
