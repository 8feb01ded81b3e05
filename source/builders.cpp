// builders.cpp - Tree construction helpers

#include <vdom/builders.h>

namespace vdom {

ElementBuilder::ElementBuilder(std::string tag)
    : tag_(std::move(tag))
    , props_(Props{}.transient())
    , attributes_(PropDict{}.transient())
    , styles_(PropDict{}.transient())
    , children_(Children{}.transient())
{
}

ElementBuilder& ElementBuilder::key(std::string key)
{
    key_ = std::move(key);
    return *this;
}

ElementBuilder& ElementBuilder::prop(const std::string& name, PropValue value)
{
    props_.set(name, std::move(value));
    return *this;
}

ElementBuilder& ElementBuilder::attr(const std::string& name, std::string value)
{
    attributes_.set(name, std::move(value));
    return *this;
}

ElementBuilder& ElementBuilder::style(const std::string& name, std::string value)
{
    styles_.set(name, std::move(value));
    return *this;
}

ElementBuilder& ElementBuilder::hook(const std::string& name, HookPtr hook)
{
    props_.set(name, PropValue{std::move(hook)});
    return *this;
}

ElementBuilder& ElementBuilder::child(Tree child)
{
    children_.push_back(std::move(child));
    return *this;
}

ElementBuilder& ElementBuilder::text(std::string value)
{
    children_.push_back(Tree::text(std::move(value)));
    return *this;
}

Tree ElementBuilder::finish()
{
    if (!attributes_.empty()) {
        props_.set(ATTRIBUTES, PropValue{attributes_.persistent()});
    }
    if (!styles_.empty()) {
        props_.set(STYLE, PropValue{styles_.persistent()});
    }
    return Tree::element(std::move(tag_), props_.persistent(), children_.persistent(), std::move(key_));
}

Tree h(std::string tag, Props properties, std::vector<Tree> children, Key key)
{
    auto t = Children{}.transient();
    for (auto& c : children) {
        t.push_back(std::move(c));
    }
    return Tree::element(std::move(tag), std::move(properties), t.persistent(), std::move(key));
}

Tree text(std::string value, Key key)
{
    return Tree::text(std::move(value), std::move(key));
}

} // namespace vdom
