// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file tree_fwd.h
/// @brief Forward declarations for tree values, live nodes and patches
///
/// Allows headers to name these types without pulling in immer.

#pragma once

#include <memory>
#include <optional>
#include <string>

namespace vdom {

struct Element;
struct Text;
struct TreeNode;
class Tree;

class Widget;
class Thunk;
class Hook;

using WidgetPtr = std::shared_ptr<const Widget>;
using ThunkPtr  = std::shared_ptr<Thunk>;
using HookPtr   = std::shared_ptr<const Hook>;

/// Reconciliation key, unique among siblings
using Key = std::optional<std::string>;

class LiveNode;
class Document;
using LiveNodePtr = std::shared_ptr<LiveNode>;

struct RenderOptions;
struct PatchSet;
struct PatchConfig;

} // namespace vdom
