// main.cpp
// Todo list example - a lager store driving diff/patch on an in-memory tree
//
// Every dispatched action produces a new model. The watcher renders the model
// to a tree value, diffs it against the previous one, prints the patch set and
// applies it to the live MemoryNode tree. Each row is a StateThunk keyed by
// the todo id, so unchanged rows are neither re-rendered nor re-diffed.

#include <vdom/builders.h>
#include <vdom/diff.h>
#include <vdom/memory_tree.h>
#include <vdom/patch_apply.h>

#include <lager/store.hpp>
#include <lager/event_loop/manual.hpp>

#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <algorithm>
#include <iostream>
#include <sstream>
#include <string>
#include <variant>

using namespace vdom;

// ============================================================
// Model and Actions
// ============================================================

struct Todo
{
    int id = 0;
    std::string text;
    bool done = false;

    bool operator==(const Todo&) const = default;
};

struct TodoModel
{
    immer::vector<Todo> items;
    int next_id = 1;
};

struct AddTodo
{
    std::string text;
};

struct ToggleTodo
{
    int id;
};

struct RemoveTodo
{
    int id;
};

struct MoveToTop
{
    int id;
};

using Action = std::variant<AddTodo, ToggleTodo, RemoveTodo, MoveToTop>;

// ============================================================
// Reducer
// ============================================================

namespace {

immer::vector<Todo> without(const immer::vector<Todo>& items, int id)
{
    auto t = immer::vector<Todo>{}.transient();
    for (const auto& item : items) {
        if (item.id != id) {
            t.push_back(item);
        }
    }
    return t.persistent();
}

const Todo* find_todo(const immer::vector<Todo>& items, int id)
{
    auto it = std::find_if(items.begin(), items.end(), [id](const Todo& t) { return t.id == id; });
    return it == items.end() ? nullptr : &*it;
}

} // anonymous namespace

TodoModel update(TodoModel model, Action action)
{
    return std::visit(
        [&](auto&& act) -> TodoModel {
            using T = std::decay_t<decltype(act)>;

            if constexpr (std::is_same_v<T, AddTodo>) {
                model.items = model.items.push_back(Todo{model.next_id++, act.text, false});
            } else if constexpr (std::is_same_v<T, ToggleTodo>) {
                for (std::size_t i = 0; i < model.items.size(); ++i) {
                    if (model.items[i].id == act.id) {
                        model.items = model.items.update(i, [](Todo t) {
                            t.done = !t.done;
                            return t;
                        });
                    }
                }
            } else if constexpr (std::is_same_v<T, RemoveTodo>) {
                model.items = without(model.items, act.id);
            } else if constexpr (std::is_same_v<T, MoveToTop>) {
                if (const Todo* todo = find_todo(model.items, act.id)) {
                    auto t = immer::vector<Todo>{}.transient();
                    t.push_back(*todo);
                    for (const auto& item : without(model.items, act.id)) {
                        t.push_back(item);
                    }
                    model.items = t.persistent();
                }
            }
            return model;
        },
        action);
}

// ============================================================
// View
// ============================================================

Tree view_row(const Todo& todo)
{
    return ElementBuilder("li")
        .key(std::to_string(todo.id))
        .attr("data-id", std::to_string(todo.id))
        .prop("className", todo.done ? "done" : "open")
        .style("text-decoration", todo.done ? "line-through" : "none")
        .text(todo.text)
        .finish();
}

Tree view(const TodoModel& model)
{
    auto rows = Children{}.transient();
    for (const auto& todo : model.items) {
        rows.push_back(make_state_thunk<Todo>(view_row, todo));
    }

    const auto open = std::count_if(model.items.begin(), model.items.end(),
                                    [](const Todo& t) { return !t.done; });

    return h("section", props({{"className", "todoapp"}}), {
        h("h1", {}, {text("todos")}),
        Tree::element("ul", props({{"className", "todo-list"}}), rows.persistent()),
        h("footer", {}, {text(std::to_string(open) + " item(s) left")}),
    });
}

// ============================================================
// Main Application
// ============================================================

int main()
{
    MemoryDocument doc;

    auto loop  = lager::with_manual_event_loop{};
    auto store = lager::make_store<Action>(TodoModel{}, loop, lager::with_reducer(update));

    Tree current = view(store.get());
    LiveNodePtr root = render(current, {.document = &doc});

    store.watch([&](const TodoModel& model) {
        Tree next = view(model);
        PatchSet patches = diff(current, next);

        std::cout << "--- " << patches.size() << " patched position(s)\n";
        patches.print(std::cout);

        root = patch(root, patches, {.document = &doc});
        current = next;
        std::cout << to_markup(*root) << "\n";
    });

    std::cout << "=== Todo Example ===\n";
    std::cout << to_markup(*root) << "\n";
    std::cout << "\nCommands: a <text> | t <id> | r <id> | m <id> | q\n";

    std::string line;
    while (std::cout << "> " && std::getline(std::cin, line)) {
        std::istringstream in(line);
        char command = 0;
        in >> command;

        switch (command) {
        case 'a': {
            std::string text_value;
            std::getline(in >> std::ws, text_value);
            store.dispatch(AddTodo{text_value});
            break;
        }
        case 't':
        case 'r':
        case 'm': {
            int id = 0;
            if (!(in >> id)) {
                std::cout << "expected an id\n";
                break;
            }
            if (command == 't') store.dispatch(ToggleTodo{id});
            if (command == 'r') store.dispatch(RemoveTodo{id});
            if (command == 'm') store.dispatch(MoveToTop{id});
            break;
        }
        case 'q':
            return 0;
        default:
            std::cout << "unknown command\n";
            break;
        }
    }

    return 0;
}
