// patch.cpp - PatchSet accessors and printing

#include <vdom/patch.h>

#include <ostream>
#include <sstream>

namespace vdom {

namespace {

std::string describe(const Tree& tree)
{
    return tree.visit([](const auto& node) -> std::string {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, Element>) {
            std::string out = "<" + node.tag;
            if (node.key) {
                out += " key=" + *node.key;
            }
            return out + ">";
        } else if constexpr (std::is_same_v<T, Text>) {
            return "\"" + node.text + "\"";
        } else if constexpr (std::is_same_v<T, WidgetPtr>) {
            return node->key() ? "widget(" + *node->key() + ")" : std::string{"widget"};
        } else {
            return "thunk";
        }
    });
}

std::string describe(const Props& delta)
{
    std::string out = "{";
    bool first = true;
    for (const auto& [name, value] : delta) {
        if (!first) out += ", ";
        first = false;
        out += name + ": " + to_string(value);
    }
    return out + "}";
}

std::string describe(const Moves& moves)
{
    std::ostringstream os;
    os << "removes [";
    for (std::size_t i = 0; i < moves.removes.size(); ++i) {
        const auto& r = moves.removes[i];
        os << (i ? ", " : "") << r.from;
        if (r.key) os << ":" << *r.key;
    }
    os << "] inserts [";
    for (std::size_t i = 0; i < moves.inserts.size(); ++i) {
        const auto& ins = moves.inserts[i];
        os << (i ? ", " : "") << ins.to << ":" << ins.key;
    }
    os << "]";
    return os.str();
}

} // anonymous namespace

std::vector<std::size_t> PatchSet::positions() const
{
    std::vector<std::size_t> result;
    result.reserve(patches.size());
    for (const auto& [position, _] : patches) {
        result.push_back(position);
    }
    return result;
}

const PatchList* PatchSet::at(std::size_t position) const
{
    auto it = patches.find(position);
    return it == patches.end() ? nullptr : &it->second;
}

void PatchSet::print(std::ostream& os) const
{
    for (const auto& [position, list] : patches) {
        for (const auto& p : list) {
            os << position << ": " << to_string(p) << "\n";
        }
    }
}

const char* patch_name(const Patch& p) noexcept
{
    return std::visit([](const auto& op) -> const char* {
        using T = std::decay_t<decltype(op)>;
        if constexpr (std::is_same_v<T, op::Remove>)            return "REMOVE";
        else if constexpr (std::is_same_v<T, op::Insert>)       return "INSERT";
        else if constexpr (std::is_same_v<T, op::ReplaceText>)  return "VTEXT";
        else if constexpr (std::is_same_v<T, op::ReplaceNode>)  return "VNODE";
        else if constexpr (std::is_same_v<T, op::UpdateWidget>) return "WIDGET";
        else if constexpr (std::is_same_v<T, op::UpdateProps>)  return "PROPS";
        else if constexpr (std::is_same_v<T, op::Reorder>)      return "ORDER";
        else                                                       return "THUNK";
    }, p);
}

std::string to_string(const Patch& p)
{
    std::string out = patch_name(p);
    out += " ";
    out += std::visit([](const auto& op) -> std::string {
        using T = std::decay_t<decltype(op)>;
        if constexpr (std::is_same_v<T, op::Remove>) {
            return describe(op.node);
        } else if constexpr (std::is_same_v<T, op::Insert>) {
            return describe(op.next);
        } else if constexpr (std::is_same_v<T, op::ReplaceText> || std::is_same_v<T, op::ReplaceNode>) {
            return describe(op.node) + " -> " + describe(op.next);
        } else if constexpr (std::is_same_v<T, op::UpdateWidget>) {
            return (op.node ? describe(*op.node) : std::string{"(none)"}) + " -> " + describe(op.next);
        } else if constexpr (std::is_same_v<T, op::UpdateProps>) {
            return describe(op.delta);
        } else if constexpr (std::is_same_v<T, op::Reorder>) {
            return describe(op.moves);
        } else {
            return describe(op.node) + " (" + std::to_string(op.patches ? op.patches->size() : 0)
                + " nested position(s))";
        }
    }, p);
    return out;
}

} // namespace vdom
