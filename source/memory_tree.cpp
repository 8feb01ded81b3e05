// memory_tree.cpp - In-memory live tree backend

#include <vdom/memory_tree.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace vdom {

// ============================================================
// MemoryNode
// ============================================================

std::shared_ptr<MemoryNode> MemoryNode::make_element(std::string tag)
{
    return std::make_shared<MemoryNode>(Kind::Element, std::move(tag));
}

std::shared_ptr<MemoryNode> MemoryNode::make_text(std::string text)
{
    return std::make_shared<MemoryNode>(Kind::Text, std::move(text));
}

MemoryNode::MemoryNode(Kind kind, std::string name_or_text)
    : kind_(kind)
{
    if (kind_ == Kind::Text) {
        text_ = std::move(name_or_text);
    } else {
        tag_ = std::move(name_or_text);
    }
}

MemoryNode::~MemoryNode()
{
    // Children may outlive their parent through other owners
    for (auto& child : children_) {
        if (auto* node = dynamic_cast<MemoryNode*>(child.get())) {
            node->parent_ = nullptr;
        }
    }
}

const PropValue* MemoryNode::property(std::string_view name) const
{
    auto it = properties_.find(name);
    return it == properties_.end() ? nullptr : &it->second;
}

const std::string* MemoryNode::attribute(std::string_view name) const
{
    auto it = attributes_.find(name);
    return it == attributes_.end() ? nullptr : &it->second;
}

const std::string* MemoryNode::style(std::string_view name) const
{
    auto it = styles_.find(name);
    return it == styles_.end() ? nullptr : &it->second;
}

void MemoryNode::set_text(std::string_view text)
{
    if (kind_ != Kind::Text) {
        throw std::logic_error("MemoryNode::set_text: <" + tag_ + "> is not a text node");
    }
    text_.assign(text);
}

LiveNodePtr MemoryNode::child_at(std::size_t index) const
{
    return index < children_.size() ? children_[index] : nullptr;
}

std::vector<LiveNodePtr>::iterator MemoryNode::find_child(const LiveNode& child)
{
    return std::find_if(children_.begin(), children_.end(),
                        [&](const LiveNodePtr& c) { return c.get() == &child; });
}

MemoryNode& MemoryNode::adopt(const LiveNodePtr& child)
{
    auto* node = dynamic_cast<MemoryNode*>(child.get());
    if (!node) {
        throw std::invalid_argument("MemoryNode: cannot adopt a foreign node");
    }
    if (node == this) {
        throw std::invalid_argument("MemoryNode: a node cannot be its own child");
    }
    if (node->parent_) {
        node->parent_->remove_child(*node);
    }
    node->parent_ = this;
    return *node;
}

void MemoryNode::append_child(LiveNodePtr child)
{
    adopt(child);
    children_.push_back(std::move(child));
}

void MemoryNode::insert_before(LiveNodePtr child, const LiveNode* reference)
{
    if (!reference) {
        append_child(std::move(child));
        return;
    }
    if (child.get() == reference) {
        return;
    }

    adopt(child);
    auto it = find_child(*reference);
    if (it == children_.end()) {
        static_cast<MemoryNode*>(child.get())->parent_ = nullptr;
        throw std::invalid_argument("MemoryNode::insert_before: reference is not a child");
    }
    children_.insert(it, std::move(child));
}

LiveNodePtr MemoryNode::remove_child(const LiveNode& child)
{
    auto it = find_child(child);
    if (it == children_.end()) {
        throw std::invalid_argument("MemoryNode::remove_child: not a child");
    }
    LiveNodePtr removed = std::move(*it);
    children_.erase(it);
    static_cast<MemoryNode*>(removed.get())->parent_ = nullptr;
    return removed;
}

void MemoryNode::replace_child(LiveNodePtr replacement, const LiveNode& old)
{
    if (replacement.get() == &old) {
        return;
    }
    if (find_child(old) == children_.end()) {
        throw std::invalid_argument("MemoryNode::replace_child: not a child");
    }

    // Adopting may detach the replacement from this node and shift `old`
    adopt(replacement);
    auto it = find_child(old);
    static_cast<MemoryNode*>(it->get())->parent_ = nullptr;
    *it = std::move(replacement);
}

void MemoryNode::set_property(const std::string& name, const PropValue& value)
{
    properties_.insert_or_assign(name, value);
}

void MemoryNode::remove_property(const std::string& name)
{
    properties_.erase(name);
}

void MemoryNode::set_attribute(const std::string& name, const std::string& value)
{
    attributes_.insert_or_assign(name, value);
}

void MemoryNode::remove_attribute(const std::string& name)
{
    attributes_.erase(name);
}

void MemoryNode::set_style(const std::string& name, const std::string& value)
{
    styles_.insert_or_assign(name, value);
}

void MemoryNode::remove_style(const std::string& name)
{
    styles_.erase(name);
}

// ============================================================
// MemoryDocument
// ============================================================

LiveNodePtr MemoryDocument::create_element(const std::string& tag)
{
    ++elements_created_;
    return MemoryNode::make_element(tag);
}

LiveNodePtr MemoryDocument::create_text(const std::string& text)
{
    ++texts_created_;
    return MemoryNode::make_text(text);
}

// ============================================================
// Markup
// ============================================================

namespace {

void escape(std::string& out, std::string_view text)
{
    for (char c : text) {
        switch (c) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&quot;"; break;
        default:  out += c; break;
        }
    }
}

template <typename Table>
std::vector<std::pair<std::string_view, const typename Table::mapped_type*>> sorted(const Table& table)
{
    std::vector<std::pair<std::string_view, const typename Table::mapped_type*>> entries;
    entries.reserve(table.size());
    for (auto it = table.begin(); it != table.end(); ++it) {
        entries.emplace_back(it->first, &it->second);
    }
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    return entries;
}

void write(std::string& out, const LiveNode& live)
{
    const auto* node = dynamic_cast<const MemoryNode*>(&live);
    if (!node) {
        throw std::invalid_argument("to_markup: not a MemoryNode");
    }

    if (node->is_text()) {
        escape(out, node->text());
        return;
    }

    out += "<";
    out += node->tag();

    for (const auto& [name, value] : sorted(node->attributes())) {
        out += " ";
        out += name;
        out += "=\"";
        escape(out, *value);
        out += "\"";
    }

    if (!node->styles().empty()) {
        out += " style=\"";
        for (const auto& [name, value] : sorted(node->styles())) {
            out += name;
            out += ":";
            escape(out, *value);
            out += ";";
        }
        out += "\"";
    }

    for (const auto& [name, value] : sorted(node->properties())) {
        out += " .";
        out += name;
        out += "=\"";
        escape(out, to_string(*value));
        out += "\"";
    }

    out += ">";
    for (const auto& child : node->children()) {
        write(out, *child);
    }
    out += "</";
    out += node->tag();
    out += ">";
}

} // anonymous namespace

std::string to_markup(const LiveNode& node)
{
    std::string out;
    write(out, node);
    return out;
}

} // namespace vdom
