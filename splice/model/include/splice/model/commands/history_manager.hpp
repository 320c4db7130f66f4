/**
 * @file history_manager.hpp
 * @brief Undo/redo history over timeline commands
 */

#pragma once

#include <splice/core/result.hpp>
#include <splice/core/signals.hpp>
#include <splice/model/commands/edit_command.hpp>

#include <optional>
#include <string>
#include <vector>

namespace spl::model {

/**
 * @brief One undoable step (a single command or a committed transaction)
 */
struct HistoryEntry {
    std::string description;
    std::vector<EditCommand> commands;   ///< Applied in order on redo
    std::vector<EditCommand> inverses;   ///< Applied in reverse order on undo
};

/**
 * @brief Linear undo history with a cursor
 *
 * Entries [0, index) are applied, entries [index, count) form the redo
 * tail. Executing a new command drops the redo tail.
 *
 * Usage:
 * @code
 *   HistoryManager history(timeline);
 *   history.execute(cmd::MoveElement{id, 5 * kTicksPerSecond});
 *
 *   history.beginTransaction("Drag");
 *   history.execute(cmd::MoveElement{id, 6 * kTicksPerSecond});
 *   history.execute(cmd::TrimElement{id, 0, kTicksPerSecond});
 *   history.commitTransaction();   // one undo step
 *
 *   history.undo();
 * @endcode
 */
class HistoryManager {
public:
    /// @param undoLimit maximum undo steps kept, 0 = unbounded
    explicit HistoryManager(Timeline& timeline, size_t undoLimit = 100);

    HistoryManager(const HistoryManager&) = delete;
    HistoryManager& operator=(const HistoryManager&) = delete;

    // ========== Command Execution ==========

    /**
     * @brief Apply a command and record it
     *
     * On failure nothing changes. Inside a transaction the command joins
     * the open transaction instead of creating an entry.
     */
    Result<void> execute(const EditCommand& command, std::string description = {});

    /// All-or-nothing batch recorded as one entry
    Result<void> executeBatch(std::string description, const std::vector<EditCommand>& commands);

    // ========== Undo/Redo ==========

    /// Revert entry index-1; false (no-op) at the start or inside a transaction
    bool undo();

    /// Re-apply entry index; false (no-op) at the end or inside a transaction
    bool redo();

    [[nodiscard]] bool canUndo() const;
    [[nodiscard]] bool canRedo() const;
    [[nodiscard]] std::string undoText() const;
    [[nodiscard]] std::string redoText() const;

    // ========== Transactions ==========

    /**
     * @brief Start batching sub-edits into one entry
     *
     * Nested begin/commit pairs fold into the outermost transaction.
     */
    void beginTransaction(std::string description);

    /// Close the transaction; InvalidState if none is open
    Result<void> commitTransaction();

    /// Revert every sub-edit of the open transaction (all nesting levels)
    Result<void> abortTransaction();

    [[nodiscard]] bool inTransaction() const { return m_transactionDepth > 0; }

    // ========== Stack Management ==========

    void clear();

    /// Number of applied entries (the cursor)
    [[nodiscard]] size_t index() const { return m_index; }

    /// Applied plus redoable entries
    [[nodiscard]] size_t count() const { return m_entries.size(); }

    [[nodiscard]] const HistoryEntry* entry(size_t i) const {
        return i < m_entries.size() ? &m_entries[i] : nullptr;
    }

    // ========== Clean State ==========

    /// Mark the current state as saved
    void setClean();
    [[nodiscard]] bool isClean() const;

    // ========== Configuration ==========

    void setUndoLimit(size_t limit);
    [[nodiscard]] size_t undoLimit() const { return m_undoLimit; }

    [[nodiscard]] Timeline& timeline() { return m_timeline; }
    [[nodiscard]] const Timeline& timeline() const { return m_timeline; }

    // ========== Signals ==========

    /// Emitted when the cursor or entry list changes
    VoidSignal indexChanged;

    /// Emitted when isClean() flips
    Signal<bool> cleanChanged;

private:
    struct Transaction {
        std::string description;
        std::vector<EditCommand> commands;
        std::vector<EditCommand> inverses;
    };

    void push(HistoryEntry entry);
    void enforceLimit();

    /**
     * @brief Apply commands in order, rolling back on failure
     * @param forwards receives each applied command with resolved ids
     * @param inverses receives the inverse of each applied command
     */
    Result<void> applyAll(const std::vector<EditCommand>& commands,
                          std::vector<EditCommand>* forwards,
                          std::vector<EditCommand>* inverses);

    /// Undo already applied commands given their inverses (in apply order)
    bool rollback(const std::vector<EditCommand>& inverses);

    void notify(bool wasClean);

    Timeline& m_timeline;
    std::vector<HistoryEntry> m_entries;
    size_t m_index = 0;
    size_t m_undoLimit;
    std::optional<size_t> m_cleanIndex = size_t{0};

    std::optional<Transaction> m_transaction;
    int m_transactionDepth = 0;
};

} // namespace spl::model
