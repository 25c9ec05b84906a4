/*
 * KTreeDiff - Syntax Tree Diff Core
 *
 * SPDX-FileCopyrightText: 2026 The KTreeDiff authors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#ifndef TREEDIFF_H
#define TREEDIFF_H

#include "combiners.h"
#include "EditScript.h"
#include "NodeMapping.h"
#include "SyntaxTree.h"
#include "TreeIndex.h"

#include <optional>

#include <boost/signals2.hpp>

#include <QSharedPointer>

class Options;

/*
    Outcome of one comparison. The refs in script and mapping point into oldTree and
    newTree, which in turn point into the caller's syntax trees.
*/
class TreeDiffResult
{
  public:
    TreeDiffResult(TreeIndex&& oldTree, TreeIndex&& newTree, EditScript&& script, std::optional<NodeMapping>&& mapping):
        mOldTree(std::move(oldTree)), mNewTree(std::move(newTree)), mScript(std::move(script)), mMapping(std::move(mapping))
    {
    }

    [[nodiscard]] inline const TreeIndex& oldTree() const { return mOldTree; }
    [[nodiscard]] inline const TreeIndex& newTree() const { return mNewTree; }
    [[nodiscard]] inline const EditScript& script() const { return mScript; }
    // Only kept when Options::m_bKeepMapping is set.
    [[nodiscard]] inline const std::optional<NodeMapping>& mapping() const { return mMapping; }

  private:
    TreeIndex mOldTree;
    TreeIndex mNewTree;
    EditScript mScript;
    std::optional<NodeMapping> mMapping;
};

class TreeDiff
{
  public:
    // Throws std::system_error if the gram sizes or the dimension are not positive.
    explicit TreeDiff(const QSharedPointer<Options>& options);

    /*
        Reads the options current at the time of the call, so changes made between runs
        take effect. Throws std::system_error like the constructor if they became invalid.
        Both trees must stay alive and unmodified while the result is used.
    */
    [[nodiscard]] std::optional<TreeDiffResult> run(const SyntaxNode& oldRoot, const SyntaxNode& newRoot);

    boost::signals2::signal<bool(), find> wasCancelled;

  private:
    static void checkOptions(const Options& options);

    QSharedPointer<Options> mOptions;
};

#endif // !TREEDIFF_H
