// apply_props.cpp - Default property applier

#include <vdom/apply_props.h>
#include <vdom/live_node.h>

namespace vdom {

namespace {

const PropValue* previous_value(const Props* previous, const std::string& name)
{
    return previous ? previous->find(name) : nullptr;
}

/// Take away whatever `previous` put on the node under `name`
void remove_property(LiveNode& node, const std::string& name, const PropValue& next, const Props* previous)
{
    const PropValue* old = previous_value(previous, name);
    if (!old) {
        if (!next.is_hook()) {
            node.remove_property(name);
        }
        return;
    }

    if (const Hook* hook = old->hook()) {
        if (hook->must_unhook()) {
            hook->unhook(node, name, next);
        }
        return;
    }

    if (const PropDict* entries = old->get_if<PropDict>()) {
        if (name == ATTRIBUTES) {
            for (const auto& [attr, _] : *entries) {
                node.remove_attribute(attr);
            }
            return;
        }
        if (name == STYLE) {
            for (const auto& [style, _] : *entries) {
                node.remove_style(style);
            }
            return;
        }
    }

    node.remove_property(name);
}

/// Per-entry update of "attributes" and "style"; other dictionaries are
/// assigned whole
void patch_object(LiveNode& node, const std::string& name, const PropDict& entries)
{
    if (name == ATTRIBUTES) {
        for (const auto& [attr, value] : entries) {
            if (value) {
                node.set_attribute(attr, *value);
            } else {
                node.remove_attribute(attr);
            }
        }
    } else if (name == STYLE) {
        for (const auto& [style, value] : entries) {
            if (value) {
                node.set_style(style, *value);
            } else {
                node.remove_style(style);
            }
        }
    } else {
        node.set_property(name, PropValue{entries});
    }
}

} // anonymous namespace

void apply_properties(LiveNode& node, const Props& delta, const Props* previous)
{
    for (const auto& [name, value] : delta) {
        if (value.is_unset()) {
            remove_property(node, name, value, previous);
        } else if (const Hook* hook = value.hook()) {
            remove_property(node, name, value, previous);
            const PropValue* old = previous_value(previous, name);
            hook->hook(node, name, old ? *old : PropValue{});
        } else if (const PropDict* entries = value.get_if<PropDict>()) {
            patch_object(node, name, *entries);
        } else {
            node.set_property(name, value);
        }
    }
}

} // namespace vdom
